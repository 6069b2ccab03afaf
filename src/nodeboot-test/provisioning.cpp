#include <nodeboot-test/util.h>

#include <nodeboot/base/contractual-constants.h>
#include <nodeboot/base/diagnostics.h>

#include <nodeboot/bootstrap.h>
#include <nodeboot/delegate.h>
#include <nodeboot/fetcher.h>
#include <nodeboot/installer.h>
#include <nodeboot/provisioning.h>

using namespace nodeboot;

#if !defined(_WIN32)
namespace
{
    // Nothing listens on the discard port locally; a connection attempt fails at once.
    constexpr StringLiteral UnreachableMirror = "http://127.0.0.1:9/dist";

    struct ProvisioningFixture
    {
        const Filesystem& fs = real_filesystem;
        Path root;
        BootstrapSettings settings;

        explicit ProvisioningFixture(StringView name)
            : root(Test::make_fresh_directory(real_filesystem, name))
            , settings(Test::make_test_settings(root / "home", (root / "search-path").native()))
        {
            settings.mirror_url = UnreachableMirror.to_string();
        }

        // Serves a fake distribution named `dir_name` from a file:// mirror; the fake launcher exits with
        // `launcher_exit_code`.
        void serve_distribution(StringView dir_name, int launcher_exit_code = 0)
        {
            const auto staging = root / "staging";
            Test::write_fake_distribution(fs, staging, dir_name, launcher_exit_code);
            settings.mirror_url = Test::make_file_mirror(fs, settings, staging, root / "mirror");
        }

        std::vector<std::string> scratch_directories() const
        {
            std::vector<std::string> result;
            for (auto&& dir : fs.get_directories_non_recursive(settings.product_dir(), IgnoreErrors{}))
            {
                if (dir.filename().starts_with(ScratchDirectoryPrefix))
                {
                    result.push_back(dir.native());
                }
            }

            return result;
        }
    };
}

TEST_CASE ("ensure_runtime with a runtime on the search path", "[provisioning]")
{
    ProvisioningFixture fixture("provisioning-present");
    const auto runtime = fixture.root / "search-path" / "node";
    fixture.fs.create_directories(fixture.root / "search-path", NODEBOOT_LINE_INFO);
    fixture.fs.write_contents(runtime, "", NODEBOOT_LINE_INFO);
    const auto before = Test::list_tree(fixture.fs, fixture.root);

    BufferedDiagnosticContext bdc{null_sink};
    const RuntimeProvisioner provisioner(fixture.fs, fixture.settings);
    auto found = provisioner.ensure_runtime(bdc);
    REQUIRE(found.has_value());
    CHECK(*found.get() == runtime);
    CHECK(bdc.empty());
    // neither the product directory nor the lock file were created, and the unreachable mirror was not contacted
    CHECK(Test::list_tree(fixture.fs, fixture.root) == before);
    CHECK_FALSE(fixture.fs.exists(fixture.settings.product_dir(), IgnoreErrors{}));
}

TEST_CASE ("ensure_runtime installs from the mirror", "[provisioning]")
{
    ProvisioningFixture fixture("provisioning-install");
    fixture.serve_distribution("node-v20.11.0-test");

    BufferedDiagnosticContext bdc{null_sink};
    const RuntimeProvisioner provisioner(fixture.fs, fixture.settings);
    auto installed = provisioner.ensure_runtime(bdc);
    REQUIRE(installed.has_value());
    CHECK(bdc.empty());
    CHECK(*installed.get() == fixture.settings.install_dir() / "bin" / "node");
    CHECK(fixture.fs.is_regular_file(*installed.get()));
    CHECK(fixture.fs.is_regular_file(fixture.settings.install_lock_file()));
    CHECK(fixture.scratch_directories().empty());

    SECTION ("a second call finds the installation without downloading")
    {
        fixture.settings.mirror_url = UnreachableMirror.to_string();
        auto again = provisioner.ensure_runtime(bdc);
        REQUIRE(again.has_value());
        CHECK(*again.get() == *installed.get());
        CHECK(bdc.empty());
    }
}

TEST_CASE ("ensure_runtime reports download failures", "[provisioning]")
{
    ProvisioningFixture fixture("provisioning-download-failure");

    SECTION ("missing archive")
    {
        fixture.settings.mirror_url = Test::file_url(fixture.root / "empty-mirror");
    }

    SECTION ("unreachable host") { }

    BufferedDiagnosticContext bdc{null_sink};
    const RuntimeProvisioner provisioner(fixture.fs, fixture.settings);
    CHECK_FALSE(provisioner.ensure_runtime(bdc).has_value());
    REQUIRE(bdc.any_errors());
    CHECK(bdc.to_string().find(make_fetch_request(fixture.settings).url) != std::string::npos);
    CHECK_FALSE(fixture.fs.exists(fixture.settings.install_dir(), IgnoreErrors{}));
    CHECK(fixture.scratch_directories().empty());
}

TEST_CASE ("scenario A: an empty environment is provisioned and the launcher runs", "[provisioning][scenario]")
{
    ProvisioningFixture fixture("scenario-a");
    fixture.serve_distribution("node-v20.11.0-test", 7);

    BufferedDiagnosticContext bdc{null_sink};
    const auto exit_code = provision_and_delegate(bdc, fixture.fs, fixture.settings);
    CHECK(bdc.empty());
    CHECK(exit_code == Optional<int>(7));

    const auto install_dir = fixture.settings.install_dir();
    CHECK(fixture.fs.is_regular_file(installed_runtime_path(install_dir, fixture.settings.platform.os)));
    CHECK(fixture.fs.read_contents(install_dir / "npx-args.txt", NODEBOOT_LINE_INFO) == "-y\nclaude-ssh-mcp\n");
    CHECK(fixture.scratch_directories().empty());
}

TEST_CASE ("scenario B: a partial previous install is replaced", "[provisioning][scenario]")
{
    ProvisioningFixture fixture("scenario-b");
    fixture.serve_distribution("node-v20.11.0-test");

    const auto install_dir = fixture.settings.install_dir();
    fixture.fs.create_directories(install_dir / "bin", NODEBOOT_LINE_INFO);
    fixture.fs.create_directories(install_dir / "lib" / "node_modules" / "left-over", NODEBOOT_LINE_INFO);
    fixture.fs.write_contents(install_dir / "bin" / "corepack", "stale", NODEBOOT_LINE_INFO);
    fixture.fs.write_contents(install_dir / "CHANGELOG.md", "stale", NODEBOOT_LINE_INFO);

    BufferedDiagnosticContext bdc{null_sink};
    const RuntimeProvisioner provisioner(fixture.fs, fixture.settings);
    auto installed = provisioner.ensure_runtime(bdc);
    REQUIRE(installed.has_value());
    CHECK(bdc.empty());
    CHECK(fixture.fs.is_regular_file(*installed.get()));
    CHECK(Test::list_tree(fixture.fs, install_dir) ==
          Test::list_tree(fixture.fs, fixture.root / "staging" / "node-v20.11.0-test"));
}

TEST_CASE ("scenario C: a misnamed distribution fails extraction", "[provisioning][scenario]")
{
    ProvisioningFixture fixture("scenario-c");
    fixture.serve_distribution("nodejs-20.11.0");

    BufferedDiagnosticContext bdc{null_sink};
    const RuntimeProvisioner provisioner(fixture.fs, fixture.settings);
    CHECK_FALSE(provisioner.ensure_runtime(bdc).has_value());
    REQUIRE(bdc.lines.size() == 1);
    CHECK(bdc.lines[0].to_string().find("could not find an extracted directory starting with 'node-'") !=
          std::string::npos);
    CHECK_FALSE(fixture.fs.exists(fixture.settings.install_dir(), IgnoreErrors{}));
    CHECK(fixture.scratch_directories().empty());
}

TEST_CASE ("scenario D: no launcher and no way to provision", "[provisioning][scenario]")
{
    ProvisioningFixture fixture("scenario-d");

    BufferedDiagnosticContext bdc{null_sink};
    SECTION ("through the entry point flow")
    {
        CHECK_FALSE(provision_and_delegate(bdc, fixture.fs, fixture.settings).has_value());
    }

    SECTION ("through the delegator alone")
    {
        const RuntimeProvisioner provisioner(fixture.fs, fixture.settings);
        CHECK_FALSE(run_launcher(bdc, provisioner, default_launcher_arguments()).has_value());
    }

    REQUIRE(bdc.any_errors());
    CHECK(bdc.to_string().find(make_fetch_request(fixture.settings).url) != std::string::npos);
    CHECK_FALSE(fixture.fs.exists(fixture.settings.install_dir(), IgnoreErrors{}));
}

TEST_CASE ("a runtime without a launcher is a delegation failure", "[provisioning][delegate]")
{
    ProvisioningFixture fixture("delegate-no-launcher");
    fixture.fs.create_directories(fixture.root / "search-path", NODEBOOT_LINE_INFO);
    fixture.fs.write_contents(fixture.root / "search-path" / "node", "", NODEBOOT_LINE_INFO);

    BufferedDiagnosticContext bdc{null_sink};
    const RuntimeProvisioner provisioner(fixture.fs, fixture.settings);
    CHECK_FALSE(run_launcher(bdc, provisioner, default_launcher_arguments()).has_value());
    REQUIRE(bdc.lines.size() == 1);
    CHECK(bdc.lines[0].to_string() == "error: could not find npx; please install Node.js manually");
    CHECK_FALSE(fixture.fs.exists(fixture.settings.product_dir(), IgnoreErrors{}));
}

TEST_CASE ("run_launcher forwards arguments and the exit code", "[provisioning][delegate]")
{
    ProvisioningFixture fixture("delegate-forward");
    const auto dist = Test::write_fake_distribution(fixture.fs, fixture.root / "tools", "node-v20.11.0-test", 42);
    fixture.settings.search_path = (dist / "bin").native();

    BufferedDiagnosticContext bdc{null_sink};
    const RuntimeProvisioner provisioner(fixture.fs, fixture.settings);
    const std::vector<std::string> args{"-y", "claude-ssh-mcp", "with space", "$HOME"};
    CHECK(run_launcher(bdc, provisioner, args) == Optional<int>(42));
    CHECK(bdc.empty());
    CHECK(fixture.fs.read_contents(dist / "npx-args.txt", NODEBOOT_LINE_INFO) ==
          "-y\nclaude-ssh-mcp\nwith space\n$HOME\n");
}
#endif // ^^^ !_WIN32

TEST_CASE ("default launcher arguments", "[delegate]")
{
    CHECK(default_launcher_arguments() == std::vector<std::string>{"-y", "claude-ssh-mcp"});
    CHECK(make_launcher_command("/opt/node/bin/npx", default_launcher_arguments()).command_line() ==
          "/opt/node/bin/npx -y claude-ssh-mcp");
}
