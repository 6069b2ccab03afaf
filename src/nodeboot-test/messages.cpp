#include <nodeboot-test/util.h>

#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/messages.h>

#include <set>
#include <string>

using namespace nodeboot;

TEST_CASE ("append raw", "[LocalizedString]")
{
    CHECK(LocalizedString().empty());
    CHECK(LocalizedString::from_raw("").empty());
    CHECK(LocalizedString::from_raw("a").append_raw('b').append_raw("cd") == LocalizedString::from_raw("abcd"));
    CHECK(LocalizedString::from_raw("first").append_raw('\n').append(LocalizedString::from_raw("second")).data() ==
          "first\nsecond");

    auto s = LocalizedString::from_raw("x");
    s.clear();
    CHECK(s.empty());
}

TEST_CASE ("append indent", "[LocalizedString]")
{
    CHECK(LocalizedString().append_indent().data() == "  ");
    CHECK(LocalizedString::from_raw("a").append_indent(2).append_raw('b').data() == "a    b");
}

TEST_CASE ("every message has English text", "[messages]")
{
    const auto messages = msg::get_sorted_english_messages();
    REQUIRE(!messages.empty());
    std::set<std::string> names;
    for (auto&& message : messages)
    {
        INFO(message.name.to_string());
        CHECK(!message.value.empty());
        CHECK(names.insert(message.name.to_string()).second);
    }

    for (size_t idx = 1; idx < messages.size(); ++idx)
    {
        CHECK(messages[idx - 1].name < messages[idx].name);
    }
}

TEST_CASE ("format messages", "[messages]")
{
    CHECK(msg::format(msgLauncherNotFound, msg::tool_name = "npx").data() ==
          "could not find npx; please install Node.js manually");
    CHECK(msg::format(msgRuntimeNotFoundInstalling, msg::version = "20.11.0").data() ==
          "Node.js not found. Installing Node.js v20.11.0...");
    CHECK(msg::format(msgInstalledRuntime, msg::version = "20.11.0", msg::path = "/home/u/.claude-ssh-mcp/node")
              .data() == "Node.js v20.11.0 installed to /home/u/.claude-ssh-mcp/node");
    CHECK(msg::format(msgDownloadFailedStatusCode, msg::url = "https://example.com/a.tar.xz", msg::value = 404)
              .data() == "https://example.com/a.tar.xz: failed: status code 404");
    CHECK(msg::format(msgExtractionFailed, msg::path = "node.zip", msg::exit_code = 9).data() ==
          "failed to extract node.zip: the extraction tool exited with code 9");
}

TEST_CASE ("append message", "[messages]")
{
    auto s = LocalizedString::from_raw("note: ");
    s.append(msgExtractingRuntime, msg::path = "node-v20.11.0-linux-x64.tar.xz");
    CHECK(s.data() == "note: Extracting node-v20.11.0-linux-x64.tar.xz...");
}

TEST_CASE ("format environment variable", "[messages]")
{
#if defined(_WIN32)
    CHECK(format_environment_variable("HOME").data() == "%HOME%");
#else
    CHECK(format_environment_variable("HOME").data() == "$HOME");
#endif
}

TEST_CASE ("diagnostic line prefixes", "[diagnostics]")
{
    CHECK(DiagnosticLine{DiagKind::None, LocalizedString::from_raw("plain")}.to_string() == "plain");
    CHECK(DiagnosticLine{DiagKind::Error, LocalizedString::from_raw("boom")}.to_string() == "error: boom");
    CHECK(DiagnosticLine{DiagKind::Warning, LocalizedString::from_raw("hmm")}.to_string() == "warning: hmm");
    CHECK(DiagnosticLine{DiagKind::Note, LocalizedString::from_raw("fyi")}.to_string() == "note: fyi");
    CHECK(DiagnosticLine{DiagKind::Error, "nodeboot", LocalizedString::from_raw("boom")}.to_string() ==
          "nodeboot: error: boom");
}

TEST_CASE ("buffered diagnostic context", "[diagnostics]")
{
    BufferedDiagnosticContext bdc{null_sink};
    CHECK(bdc.empty());
    CHECK(!bdc.any_errors());
    CHECK(bdc.to_string() == "");

    bdc.report(DiagnosticLine{DiagKind::Warning, LocalizedString::from_raw("first")});
    CHECK(!bdc.empty());
    CHECK(!bdc.any_errors());

    bdc.report_error(msgLauncherNotFound, msg::tool_name = "npx");
    CHECK(bdc.any_errors());
    CHECK(bdc.to_string() == "warning: first\nerror: could not find npx; please install Node.js manually");

    // status lines are passed through and never buffered
    bdc.statusln(LocalizedString::from_raw("progress"));
    CHECK(bdc.lines.size() == 2);
}

TEST_CASE ("system error message", "[diagnostics]")
{
    BufferedDiagnosticContext bdc{null_sink};
    bdc.report_system_error("open", 2);
    REQUIRE(bdc.lines.size() == 1);
    CHECK(bdc.lines[0].kind() == DiagKind::Error);
    CHECK(StringView(bdc.to_string()).starts_with("error: calling open failed with 2 ("));
}
