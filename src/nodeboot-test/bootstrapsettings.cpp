#include <nodeboot-test/util.h>

#include <nodeboot/base/contractual-constants.h>
#include <nodeboot/base/diagnostics.h>

#include <nodeboot/bootstrapsettings.h>

using namespace nodeboot;

TEST_CASE ("parse_timeout_seconds", "[settings]")
{
    CHECK(parse_timeout_seconds("30") == Optional<long>(30));
    CHECK(parse_timeout_seconds(" 45 ") == Optional<long>(45));
    CHECK(parse_timeout_seconds("1") == Optional<long>(1));
    CHECK_FALSE(parse_timeout_seconds("0").has_value());
    CHECK_FALSE(parse_timeout_seconds("-5").has_value());
    CHECK_FALSE(parse_timeout_seconds("").has_value());
    CHECK_FALSE(parse_timeout_seconds("ten").has_value());
    CHECK_FALSE(parse_timeout_seconds("10s").has_value());
}

TEST_CASE ("settings layout under the home directory", "[settings]")
{
    BootstrapSettings settings;
    settings.home_dir = "/home/example";
    CHECK(settings.product_dir() == Path("/home/example/.claude-ssh-mcp"));
    CHECK(settings.install_dir() == Path("/home/example/.claude-ssh-mcp/node"));
    CHECK(settings.install_lock_file() == Path("/home/example/.claude-ssh-mcp/install.lock"));
    CHECK(settings.scratch_dir(1234) == Path("/home/example/.claude-ssh-mcp/tmp-1234"));
    CHECK(settings.runtime_version == "20.11.0");
    CHECK(settings.mirror_url == "https://nodejs.org/dist");
    CHECK(settings.timeouts.connect_timeout_seconds == DefaultConnectTimeoutSeconds);
    CHECK(settings.timeouts.stall_timeout_seconds == DefaultStallTimeoutSeconds);
}

TEST_CASE ("settings from the environment", "[settings]")
{
    BufferedDiagnosticContext bdc{null_sink};

    SECTION ("defaults")
    {
        Test::ScopedEnvironmentVariable connect(EnvironmentVariableConnectTimeout, nullopt);
        Test::ScopedEnvironmentVariable stall(EnvironmentVariableStallTimeout, nullopt);
        Test::ScopedEnvironmentVariable path(EnvironmentVariablePath, ZStringView("/opt/a:/opt/b"));
        auto maybe_settings = BootstrapSettings::from_environment(bdc);
        auto settings = maybe_settings.get();
        REQUIRE(settings);
        CHECK(bdc.empty());
        CHECK(settings->mirror_url == "https://nodejs.org/dist");
        CHECK(settings->search_path == "/opt/a:/opt/b");
        CHECK(settings->home_dir.is_absolute());
        CHECK(settings->timeouts.connect_timeout_seconds == 30);
        CHECK(settings->timeouts.stall_timeout_seconds == 60);
        CHECK(settings->system_directories == std::vector<Path>{"/usr/local/bin", "/usr/bin"});
    }

    SECTION ("mirror overrides")
    {
        {
            Test::ScopedEnvironmentVariable mirror(EnvironmentVariableNodeJsOrgMirror,
                                                   ZStringView("https://npmmirror.example/node/"));
            auto maybe_settings = BootstrapSettings::from_environment(bdc);
            REQUIRE(maybe_settings.get());
            CHECK(maybe_settings.get()->mirror_url == "https://npmmirror.example/node");
        }

        {
            Test::ScopedEnvironmentVariable mirror(EnvironmentVariableNodeJsOrgMirror,
                                                   ZStringView("https://npmmirror.example/node"));
            Test::ScopedEnvironmentVariable ours(EnvironmentVariableNodeMirror, ZStringView("file:///srv/node"));
            auto maybe_settings = BootstrapSettings::from_environment(bdc);
            REQUIRE(maybe_settings.get());
            CHECK(maybe_settings.get()->mirror_url == "file:///srv/node");
        }

        CHECK(bdc.empty());
    }

    SECTION ("timeout overrides")
    {
        Test::ScopedEnvironmentVariable connect(EnvironmentVariableConnectTimeout, ZStringView("5"));
        Test::ScopedEnvironmentVariable stall(EnvironmentVariableStallTimeout, ZStringView("15"));
        auto maybe_settings = BootstrapSettings::from_environment(bdc);
        REQUIRE(maybe_settings.get());
        CHECK(maybe_settings.get()->timeouts.connect_timeout_seconds == 5);
        CHECK(maybe_settings.get()->timeouts.stall_timeout_seconds == 15);
        CHECK(bdc.empty());
    }

    SECTION ("invalid timeouts warn and keep the defaults")
    {
        Test::ScopedEnvironmentVariable connect(EnvironmentVariableConnectTimeout, ZStringView("soon"));
        Test::ScopedEnvironmentVariable stall(EnvironmentVariableStallTimeout, ZStringView("-1"));
        auto maybe_settings = BootstrapSettings::from_environment(bdc);
        REQUIRE(maybe_settings.get());
        CHECK(maybe_settings.get()->timeouts.connect_timeout_seconds == 30);
        CHECK(maybe_settings.get()->timeouts.stall_timeout_seconds == 60);
        REQUIRE(bdc.lines.size() == 2);
        CHECK(bdc.lines[0].kind() == DiagKind::Warning);
        CHECK(bdc.lines[0].to_string() ==
              fmt::format("warning: ignoring {}=soon: expected a positive integer",
                          format_environment_variable(EnvironmentVariableConnectTimeout).data()));
        CHECK_FALSE(bdc.any_errors());
    }
}
