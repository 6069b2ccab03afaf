#include <nodeboot-test/util.h>

#include <nodeboot/installer.h>
#include <nodeboot/locator.h>

using namespace nodeboot;

namespace
{
    void touch(const Filesystem& fs, const Path& file)
    {
        fs.create_directories(Path(file.parent_path()), NODEBOOT_LINE_INFO);
        fs.write_contents(file, "", NODEBOOT_LINE_INFO);
    }

    BootstrapSettings windows_settings(const Path& home)
    {
        auto settings = Test::make_test_settings(home);
        settings.platform = identify_platform("windows", "AMD64");
        settings.program_files = "C:\\Program Files";
        settings.local_app_data = "C:\\Users\\example\\AppData\\Local";
        return settings;
    }
}

TEST_CASE ("executable_filename", "[locator]")
{
    CHECK(executable_filename("node", ExecutableKind::Runtime, OsToken::Windows) == "node.exe");
    CHECK(executable_filename("npx", ExecutableKind::Launcher, OsToken::Windows) == "npx.cmd");
    CHECK(executable_filename("node", ExecutableKind::Runtime, OsToken::Linux) == "node");
    CHECK(executable_filename("npx", ExecutableKind::Launcher, OsToken::Darwin) == "npx");
}

TEST_CASE ("candidate directories on unix", "[locator]")
{
    auto settings = Test::make_test_settings("/home/example");
    settings.platform = identify_platform("linux", "x86_64");
    ExecutableLocator locator(real_filesystem, settings);
    CHECK(locator.candidate_directories() == std::vector<Path>{
                                                 "/home/example/.claude-ssh-mcp/node",
                                                 "/home/example/.claude-ssh-mcp/node/bin",
                                                 "/home/example/.local/bin",
                                                 "/home/example/.nvm/versions/node/v20.11.0/bin",
                                             });

    SECTION ("system directories follow the private install")
    {
        settings.system_directories = BootstrapSettings{}.system_directories;
        const std::vector<Path> expected{
            "/home/example/.claude-ssh-mcp/node",
            "/home/example/.claude-ssh-mcp/node/bin",
            "/usr/local/bin",
            "/usr/bin",
            "/home/example/.local/bin",
            "/home/example/.nvm/versions/node/v20.11.0/bin",
        };
        CHECK(locator.candidate_directories() == expected);
    }
}

TEST_CASE ("settings search the usual system directories by default", "[locator]")
{
    CHECK(BootstrapSettings{}.system_directories == std::vector<Path>{"/usr/local/bin", "/usr/bin"});
}

TEST_CASE ("candidate directories on windows", "[locator]")
{
    auto settings = windows_settings("/home/example");
    settings.system_directories = BootstrapSettings{}.system_directories;
    ExecutableLocator locator(real_filesystem, settings);
    auto candidates = locator.candidate_directories();
    REQUIRE(candidates.size() == 3);
    CHECK(candidates[0] == settings.install_dir());
    CHECK(candidates[1] == Path("C:\\Program Files") / "nodejs");
    CHECK(candidates[2] == Path("C:\\Users\\example\\AppData\\Local") / "Programs" / "node");

    SECTION ("an unset LOCALAPPDATA is skipped")
    {
        settings.local_app_data.clear();
        CHECK(locator.candidate_directories().size() == 2);
    }
}

#if !defined(_WIN32)
TEST_CASE ("locate searches the search path before candidate directories", "[locator]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "locator-order");
    const auto home = root / "home";
    const auto first = root / "first";
    const auto second = root / "second";
    touch(fs, second / "node");

    auto settings = Test::make_test_settings(home, Strings::concat(first, ':', second));
    ExecutableLocator locator(fs, settings);

    auto found = locator.locate_runtime();
    REQUIRE(found.has_value());
    CHECK(*found.get() == second / "node");

    touch(fs, first / "node");
    found = locator.locate_runtime();
    REQUIRE(found.has_value());
    CHECK(*found.get() == first / "node");

    SECTION ("directories are not mistaken for executables")
    {
        fs.remove_all(first, NODEBOOT_LINE_INFO);
        fs.create_directories(first / "node", NODEBOOT_LINE_INFO);
        found = locator.locate_runtime();
        REQUIRE(found.has_value());
        CHECK(*found.get() == second / "node");
    }
}

TEST_CASE ("locate finds a private installation", "[locator]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "locator-private");
    auto settings = Test::make_test_settings(root / "home", (root / "empty-path").native());
    ExecutableLocator locator(fs, settings);
    const auto runtime = installed_runtime_path(settings.install_dir(), settings.platform.os);
    touch(fs, runtime);

    auto found = locator.locate_runtime();
    REQUIRE(found.has_value());
    CHECK(*found.get() == runtime);

    SECTION ("ahead of a system-wide runtime")
    {
        const auto system_dir = root / "usr-bin";
        touch(fs, system_dir / "node");
        settings.system_directories = {system_dir};
        found = locator.locate_runtime();
        REQUIRE(found.has_value());
        CHECK(*found.get() == runtime);

        fs.remove_all(settings.install_dir(), NODEBOOT_LINE_INFO);
        found = locator.locate_runtime();
        REQUIRE(found.has_value());
        CHECK(*found.get() == system_dir / "node");
    }
}

TEST_CASE ("locate_launcher falls back to the runtime's directory", "[locator]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "locator-sibling");
    const auto runtime_dir = root / "elsewhere" / "bin";
    touch(fs, runtime_dir / "node");
    auto settings = Test::make_test_settings(root / "home", (root / "empty-path").native());
    ExecutableLocator locator(fs, settings);

    const Optional<Path> runtime = runtime_dir / "node";
    CHECK(locator.launcher_beside(runtime_dir / "node") == runtime_dir / "npx");
    CHECK_FALSE(locator.locate_launcher(runtime).has_value());
    touch(fs, runtime_dir / "npx");
    auto launcher = locator.locate_launcher(runtime);
    REQUIRE(launcher.has_value());
    CHECK(*launcher.get() == runtime_dir / "npx");
    CHECK_FALSE(locator.locate_launcher(nullopt).has_value());
}

TEST_CASE ("locate is idempotent and read-only", "[locator]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "locator-idempotent");
    touch(fs, root / "path" / "node");
    auto settings = Test::make_test_settings(root / "home", (root / "path").native());
    ExecutableLocator locator(fs, settings);

    const auto before = Test::list_tree(fs, root);
    const auto first = locator.locate_runtime();
    const auto second = locator.locate_runtime();
    CHECK(first == second);
    CHECK(first == Optional<Path>(root / "path" / "node"));
    CHECK(Test::list_tree(fs, root) == before);
    CHECK_FALSE(fs.exists(root / "home", IgnoreErrors{}));
}
#endif // ^^^ !_WIN32
