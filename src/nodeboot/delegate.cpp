#include <nodeboot/base/contractual-constants.h>
#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/files.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/system.debug.h>

#include <nodeboot/bootstrapsettings.h>
#include <nodeboot/delegate.h>
#include <nodeboot/provisioning.h>

namespace nodeboot
{
    Command make_launcher_command(const Path& launcher, const std::vector<std::string>& extra_args)
    {
        return Command{launcher}.forwarded_args(extra_args);
    }

    std::vector<std::string> default_launcher_arguments()
    {
        return {LauncherAutoConfirmArgument.to_string(), ProductName.to_string()};
    }

    Optional<int> run_launcher(DiagnosticContext& context,
                               const RuntimeProvisioner& provisioner,
                               const std::vector<std::string>& extra_args)
    {
        const auto& locator = provisioner.locator();
        auto launcher = locator.locate_launcher(locator.locate_runtime());
        if (!launcher)
        {
            const auto maybe_runtime = provisioner.ensure_runtime(context);
            const auto runtime = maybe_runtime.get();
            if (!runtime)
            {
                return nullopt;
            }

            auto sibling = locator.launcher_beside(*runtime);
            if (!provisioner.filesystem().is_regular_file(sibling))
            {
                context.report_error(msg::format(msgLauncherNotFound, msg::tool_name = LauncherBaseName));
                return nullopt;
            }

            launcher = std::move(sibling);
        }

        const auto& launcher_path = *launcher.get();
        const auto cmd = make_launcher_command(launcher_path, extra_args);
        Debug::println("Delegating to ", cmd.command_line());
        const auto maybe_exit_code = cmd_execute(context, cmd);
        if (const auto exit_code = maybe_exit_code.get())
        {
            Debug::println("Launcher exited with ", *exit_code);
            return *exit_code;
        }

        context.report_error(msg::format(msgLaunchingProgramFailed, msg::tool_name = launcher_path.filename()));
        return nullopt;
    }
}
