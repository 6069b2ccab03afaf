#include <nodeboot-test/util.h>

#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/system.process.h>

#include <nodeboot/archives.h>

#include <initializer_list>

using namespace nodeboot;

TEST_CASE ("extraction commands", "[archives]")
{
    CHECK(make_extraction_command("/tmp/node.tar.xz", ArchiveKind::TarXz).command_line() ==
          "tar -xJf /tmp/node.tar.xz");
    CHECK(make_extraction_command("/tmp/node.tar.gz", ArchiveKind::TarGz).command_line() ==
          "tar -xzf /tmp/node.tar.gz");
#if defined(_WIN32)
    CHECK(make_extraction_command("C:/tmp/node.zip", ArchiveKind::Zip).command_line() == "tar.exe -xf C:/tmp/node.zip");
#else
    CHECK(make_extraction_command("/tmp/node.zip", ArchiveKind::Zip).command_line() == "unzip -qqo /tmp/node.zip");
#endif
}

#if !defined(_WIN32)
namespace
{
    bool have_tool(StringLiteral tool_name)
    {
        BufferedDiagnosticContext bdc{null_sink};
        const auto maybe_code =
            cmd_execute(bdc, Command{}.raw_arg(Strings::concat("command -v ", tool_name, " > /dev/null 2>&1")));
        const auto code = maybe_code.get();
        return code && *code == 0;
    }

    void check_round_trip(ArchiveKind kind, std::initializer_list<StringLiteral> tool_names)
    {
        for (auto&& tool_name : tool_names)
        {
            if (!have_tool(tool_name))
            {
                WARN("skipping: " << tool_name.to_string() << " is not available");
                return;
            }
        }

        auto& fs = real_filesystem;
        const auto root = Test::make_fresh_directory(fs, Strings::concat("archives-", to_string_literal(kind)));
        const auto staging = root / "staging";
        Test::write_fake_distribution(fs, staging, "node-v20.11.0-test", 0);
        const auto archive = root / Strings::concat("node.", to_string_literal(kind));
        REQUIRE(Test::pack_archive(staging, kind, archive));

        const auto out = root / "out";
        BufferedDiagnosticContext bdc{null_sink};
        REQUIRE(extract_runtime_archive(bdc, fs, archive, kind, out));
        CHECK_FALSE(bdc.any_errors());
        CHECK(Test::list_tree(fs, out) == Test::list_tree(fs, staging));
        CHECK(fs.read_contents(out / "node-v20.11.0-test" / "README.md", NODEBOOT_LINE_INFO) ==
              "fake runtime distribution\n");
    }
}

TEST_CASE ("extract tar.gz", "[archives]") { check_round_trip(ArchiveKind::TarGz, {"tar", "gzip"}); }

TEST_CASE ("extract tar.xz", "[archives]") { check_round_trip(ArchiveKind::TarXz, {"tar", "xz"}); }

TEST_CASE ("extract zip", "[archives]") { check_round_trip(ArchiveKind::Zip, {"zip", "unzip"}); }

TEST_CASE ("extracting a corrupt archive fails", "[archives]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "archives-corrupt");
    const auto archive = root / "node.tar.gz";
    fs.write_contents(archive, "this is not a gzip stream", NODEBOOT_LINE_INFO);

    BufferedDiagnosticContext bdc{null_sink};
    CHECK_FALSE(extract_runtime_archive(bdc, fs, archive, ArchiveKind::TarGz, root / "out"));
    REQUIRE(bdc.any_errors());
    CHECK(bdc.to_string().find("failed to extract") != std::string::npos);
}
#endif // ^^^ !_WIN32
