#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/strings.h>
#include <nodeboot/base/system.debug.h>
#include <nodeboot/base/system.h>

#include <nodeboot/bootstrapsettings.h>

#include <initializer_list>

namespace
{
    using namespace nodeboot;

    void apply_timeout_override(DiagnosticContext& context, StringLiteral env_var, long& target)
    {
        auto maybe_value = get_environment_variable(env_var);
        auto value = maybe_value.get();
        if (!value || value->empty())
        {
            return;
        }

        const auto maybe_seconds = parse_timeout_seconds(*value);
        if (auto seconds = maybe_seconds.get())
        {
            target = *seconds;
            return;
        }

        context.report(DiagnosticLine{
            DiagKind::Warning,
            msg::format(msgEnvIntegerInvalid, msg::env_var = format_environment_variable(env_var), msg::value = *value)});
    }

    std::string first_nonempty_environment_variable(std::initializer_list<StringLiteral> names, StringLiteral fallback)
    {
        for (auto&& name : names)
        {
            auto maybe_value = get_environment_variable(name);
            if (auto value = maybe_value.get())
            {
                if (!value->empty())
                {
                    return std::move(*value);
                }
            }
        }

        return fallback.to_string();
    }
}

namespace nodeboot
{
    Optional<long> parse_timeout_seconds(StringView text)
    {
        auto maybe_seconds = Strings::strto<long>(Strings::trim(text));
        if (auto seconds = maybe_seconds.get())
        {
            if (*seconds > 0)
            {
                return *seconds;
            }
        }

        return nullopt;
    }

    Optional<BootstrapSettings> BootstrapSettings::from_environment(DiagnosticContext& context)
    {
        const auto& maybe_home = get_home_dir();
        const auto home = maybe_home.get();
        if (!home)
        {
            context.report_error(maybe_home.error());
            return nullopt;
        }

        BootstrapSettings settings;
        settings.home_dir = *home;
        settings.mirror_url = first_nonempty_environment_variable(
            {EnvironmentVariableNodeMirror, EnvironmentVariableNodeJsOrgMirror}, DefaultRuntimeMirror);
        while (!settings.mirror_url.empty() && settings.mirror_url.back() == '/')
        {
            settings.mirror_url.pop_back();
        }

        settings.search_path = get_environment_variable(EnvironmentVariablePath).value_or(std::string());
        settings.program_files = first_nonempty_environment_variable({EnvironmentVariableProgramFiles}, DefaultProgramFiles);
        settings.local_app_data = get_environment_variable(EnvironmentVariableLocalAppData).value_or(std::string());
        apply_timeout_override(
            context, EnvironmentVariableConnectTimeout, settings.timeouts.connect_timeout_seconds);
        apply_timeout_override(context, EnvironmentVariableStallTimeout, settings.timeouts.stall_timeout_seconds);

        Debug::println("Runtime mirror: ", settings.mirror_url);
        Debug::println("Home directory: ", settings.home_dir);
        return settings;
    }

    Path BootstrapSettings::product_dir() const { return home_dir / ProductDirectoryName; }

    Path BootstrapSettings::install_dir() const { return product_dir() / RuntimeDirectoryName; }

    Path BootstrapSettings::install_lock_file() const { return product_dir() / FileInstallLock; }

    Path BootstrapSettings::scratch_dir(long process_id) const
    {
        return product_dir() / Strings::concat(ScratchDirectoryPrefix, process_id);
    }
}
