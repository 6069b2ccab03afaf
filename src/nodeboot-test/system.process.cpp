#include <nodeboot-test/util.h>

#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/system.process.h>

using namespace nodeboot;

TEST_CASE ("cmdlinebuilder", "[system.process]")
{
    Command cmd;
    cmd.string_arg("relative/path.exe");
    cmd.string_arg("abc");
    cmd.string_arg("hello world!");
    cmd.string_arg("|");
    cmd.string_arg(";");
    REQUIRE(cmd.command_line() == "relative/path.exe abc \"hello world!\" \"|\" \";\"");

    cmd.clear();
    CHECK(cmd.empty());

    cmd.string_arg("trailing\\slash\\");
    cmd.string_arg("inner\"quotes");
#ifdef _WIN32
    REQUIRE(cmd.command_line() == "\"trailing\\slash\\\\\" \"inner\\\"quotes\"");
#else
    REQUIRE(cmd.command_line() == "\"trailing\\\\slash\\\\\" \"inner\\\"quotes\"");
#endif

    cmd.clear();
    cmd.string_arg("");
    cmd.raw_arg("&&");
    CHECK(cmd.command_line() == "\"\" &&");
}

TEST_CASE ("forwarded_args", "[system.process]")
{
    const std::vector<std::string> args{"-y", "claude-ssh-mcp"};
    CHECK(Command{"npx"}.forwarded_args(args).command_line() == "npx -y claude-ssh-mcp");
    CHECK(Command{"npx"}.forwarded_args({}).command_line() == "npx");
#if !defined(_WIN32)
    CHECK(Command{"npx"}.forwarded_args({"$HOME", "`id`"}).command_line() == "npx \"\\$HOME\" \"\\`id\\`\"");
#endif // ^^^ !_WIN32
}

#if !defined(_WIN32)
TEST_CASE ("cmd_execute propagates exit codes", "[system.process]")
{
    BufferedDiagnosticContext bdc{null_sink};
    CHECK(cmd_execute(bdc, Command{}.raw_arg("exit 0")) == Optional<int>(0));
    CHECK(cmd_execute(bdc, Command{}.raw_arg("exit 7")) == Optional<int>(7));
    CHECK(cmd_execute(bdc, Command{}.raw_arg("exit 255")) == Optional<int>(255));
    // a child killed by a signal reports 128 + the signal number
    CHECK(cmd_execute(bdc, Command{}.raw_arg("kill -9 $$")) == Optional<int>(128 + 9));
    // the shell reports commands it cannot find as 127
    CHECK(cmd_execute(bdc, Command{"/nonexistent/nodeboot-test-program"}) == Optional<int>(127));
    CHECK(bdc.empty());
}

TEST_CASE ("cmd_execute honors the working directory", "[system.process]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "process-working-directory");
    const auto work = root / "with space";
    fs.create_directories(work, NODEBOOT_LINE_INFO);

    ProcessLaunchSettings settings;
    settings.working_directory = work;
    BufferedDiagnosticContext bdc{null_sink};
    CHECK(cmd_execute(bdc, Command{}.raw_arg("pwd > marker.txt"), settings) == Optional<int>(0));
    CHECK(bdc.empty());
    CHECK(fs.is_regular_file(work / "marker.txt"));
}
#endif // ^^^ !_WIN32
