#include <nodeboot-test/util.h>

#include <nodeboot/base/diagnostics.h>

#include <nodeboot/installer.h>

using namespace nodeboot;

TEST_CASE ("installed_runtime_path", "[installer]")
{
    CHECK(installed_runtime_path("/home/a/.claude-ssh-mcp/node", OsToken::Linux) ==
          Path("/home/a/.claude-ssh-mcp/node/bin/node"));
    CHECK(installed_runtime_path("/Users/a/.claude-ssh-mcp/node", OsToken::Darwin) ==
          Path("/Users/a/.claude-ssh-mcp/node/bin/node"));
    CHECK(installed_runtime_path("C:/Users/a/.claude-ssh-mcp/node", OsToken::Windows) ==
          Path("C:/Users/a/.claude-ssh-mcp/node") / "node.exe");
}

TEST_CASE ("find_extracted_distribution", "[installer]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "installer-find");
    BufferedDiagnosticContext bdc{null_sink};

    SECTION ("nothing matches")
    {
        fs.create_directories(root / "runtime-v20.11.0-linux-x64", NODEBOOT_LINE_INFO);
        fs.write_contents(root / "node-v20.11.0-linux-x64.txt", "a file, not a directory", NODEBOOT_LINE_INFO);
        CHECK_FALSE(find_extracted_distribution(bdc, fs, root).has_value());
        REQUIRE(bdc.lines.size() == 1);
        CHECK(bdc.lines[0].to_string() ==
              fmt::format("error: could not find an extracted directory starting with 'node-' in {}", root));
    }

    SECTION ("the first match by name wins")
    {
        fs.create_directories(root / "other", NODEBOOT_LINE_INFO);
        fs.create_directories(root / "node-v20.11.0-linux-x64", NODEBOOT_LINE_INFO);
        fs.create_directories(root / "node-v18.0.0-linux-x64", NODEBOOT_LINE_INFO);
        auto found = find_extracted_distribution(bdc, fs, root);
        REQUIRE(found.has_value());
        CHECK(*found.get() == root / "node-v18.0.0-linux-x64");
        CHECK(bdc.empty());
    }

    SECTION ("a missing directory is an error")
    {
        CHECK_FALSE(find_extracted_distribution(bdc, fs, root / "does-not-exist").has_value());
        CHECK(bdc.any_errors());
    }
}

#if !defined(_WIN32)
namespace
{
    struct InstallFixture
    {
        const Filesystem& fs = real_filesystem;
        Path root;
        BootstrapSettings settings;

        explicit InstallFixture(StringView name)
            : root(Test::make_fresh_directory(real_filesystem, name)), settings(Test::make_test_settings(root / "home"))
        {
        }

        // Packs a distribution named `dir_name` and returns the archive.
        Path make_archive(StringView dir_name, bool with_runtime = true)
        {
            const auto staging = root / Strings::concat("staging-", dir_name);
            fs.remove_all(staging, NODEBOOT_LINE_INFO);
            const auto dist = Test::write_fake_distribution(fs, staging, dir_name, 0);
            if (!with_runtime)
            {
                fs.remove(dist / "bin" / "node", NODEBOOT_LINE_INFO);
            }

            const auto archive =
                root / Strings::concat(dir_name, '.', to_string_literal(settings.platform.archive_kind));
            REQUIRE(Test::pack_archive(staging, settings.platform.archive_kind, archive));
            return archive;
        }

        bool install(BufferedDiagnosticContext& bdc, const Path& archive)
        {
            const auto scratch = settings.scratch_dir(1);
            fs.create_directories(scratch, NODEBOOT_LINE_INFO);
            TempDirectoryDeleter scratch_deleter{fs, scratch};
            return install_runtime_archive(bdc, fs, settings, archive, scratch);
        }
    };
}

TEST_CASE ("install_runtime_archive into an empty home", "[installer]")
{
    InstallFixture fixture("installer-fresh");
    const auto archive = fixture.make_archive("node-v20.11.0-test");
    BufferedDiagnosticContext bdc{null_sink};
    REQUIRE(fixture.install(bdc, archive));
    CHECK(bdc.empty());

    const auto install_dir = fixture.settings.install_dir();
    CHECK(fixture.fs.is_regular_file(install_dir / "bin" / "node"));
    CHECK(fixture.fs.is_regular_file(install_dir / "bin" / "npx"));
    CHECK(Test::list_tree(fixture.fs, install_dir) ==
          Test::list_tree(fixture.fs, fixture.root / "staging-node-v20.11.0-test" / "node-v20.11.0-test"));
    CHECK_FALSE(fixture.fs.exists(fixture.settings.scratch_dir(1), IgnoreErrors{}));
}

TEST_CASE ("reinstalling replaces stale entries", "[installer]")
{
    InstallFixture fixture("installer-reinstall");
    const auto archive = fixture.make_archive("node-v20.11.0-test");
    const auto install_dir = fixture.settings.install_dir();
    BufferedDiagnosticContext bdc{null_sink};
    REQUIRE(fixture.install(bdc, archive));
    const auto once = Test::list_tree(fixture.fs, install_dir);

    fixture.fs.write_contents(install_dir / "stale.txt", "left over", NODEBOOT_LINE_INFO);
    fixture.fs.write_contents(install_dir / "bin" / "old-tool", "left over", NODEBOOT_LINE_INFO);
    fixture.fs.write_contents(install_dir / "README.md", "modified", NODEBOOT_LINE_INFO);
    fixture.fs.create_directories(install_dir / "include" / "node", NODEBOOT_LINE_INFO);

    REQUIRE(fixture.install(bdc, archive));
    CHECK(bdc.empty());
    CHECK(Test::list_tree(fixture.fs, install_dir) == once);
    CHECK(fixture.fs.read_contents(install_dir / "README.md", NODEBOOT_LINE_INFO) == "fake runtime distribution\n");
}

TEST_CASE ("an archive without the expected top-level directory installs nothing", "[installer]")
{
    InstallFixture fixture("installer-wrong-name");
    const auto archive = fixture.make_archive("runtime-v20.11.0-test");
    BufferedDiagnosticContext bdc{null_sink};
    CHECK_FALSE(fixture.install(bdc, archive));
    REQUIRE(bdc.any_errors());
    CHECK(bdc.to_string().find("could not find an extracted directory starting with 'node-'") != std::string::npos);
    CHECK_FALSE(fixture.fs.exists(fixture.settings.install_dir(), IgnoreErrors{}));
}

TEST_CASE ("an archive without the runtime fails verification", "[installer]")
{
    InstallFixture fixture("installer-no-runtime");
    const auto archive = fixture.make_archive("node-v20.11.0-test", false);
    BufferedDiagnosticContext bdc{null_sink};
    CHECK_FALSE(fixture.install(bdc, archive));
    REQUIRE(bdc.lines.size() == 1);
    CHECK(bdc.lines[0].to_string() ==
          fmt::format("error: Node.js installation failed: expected {} to exist after installing",
                      fixture.settings.install_dir() / "bin" / "node"));
    CHECK_FALSE(fixture.fs.exists(fixture.settings.install_dir(), IgnoreErrors{}));
    CHECK_FALSE(fixture.fs.exists(fixture.settings.scratch_dir(1), IgnoreErrors{}));
}

TEST_CASE ("a failed verification keeps the previous installation", "[installer]")
{
    InstallFixture fixture("installer-keep-previous");
    const auto install_dir = fixture.settings.install_dir();
    BufferedDiagnosticContext bdc{null_sink};
    REQUIRE(fixture.install(bdc, fixture.make_archive("node-v20.11.0-test")));
    fixture.fs.write_contents(install_dir / "marker.txt", "previous", NODEBOOT_LINE_INFO);
    const auto before = Test::list_tree(fixture.fs, install_dir);

    const auto broken = fixture.make_archive("node-v20.11.0-test", false);
    CHECK_FALSE(fixture.install(bdc, broken));
    CHECK(bdc.any_errors());
    CHECK(fixture.fs.is_regular_file(installed_runtime_path(install_dir, fixture.settings.platform.os)));
    CHECK(fixture.fs.read_contents(install_dir / "marker.txt", NODEBOOT_LINE_INFO) == "previous");
    CHECK(Test::list_tree(fixture.fs, install_dir) == before);
    CHECK_FALSE(fixture.fs.exists(fixture.settings.scratch_dir(1), IgnoreErrors{}));
}
#endif // ^^^ !_WIN32
