#include <nodeboot/base/system-headers.h>

#include <nodeboot/base/checks.h>
#include <nodeboot/base/contractual-constants.h>
#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/system.debug.h>
#include <nodeboot/base/system.h>

#include <nodeboot/bootstrap.h>
#include <nodeboot/bootstrapsettings.h>
#include <nodeboot/delegate.h>
#include <nodeboot/provisioning.h>

namespace nodeboot
{
    Optional<int> provision_and_delegate(DiagnosticContext& context,
                                         const Filesystem& fs,
                                         const BootstrapSettings& settings)
    {
        const RuntimeProvisioner provisioner(fs, settings);
        if (!provisioner.ensure_runtime(context))
        {
            return nullopt;
        }

        return run_launcher(context, provisioner, default_launcher_arguments());
    }

    void bootstrap_main(const Filesystem& fs)
    {
        if (get_environment_variable(EnvironmentVariableDebug).value_or(std::string()) == "1")
        {
            Debug::g_debugging = true;
        }

#if defined(_WIN32)
        ::SetConsoleOutputCP(CP_UTF8);
#endif

        const auto maybe_settings = BootstrapSettings::from_environment(console_diagnostic_context);
        const auto settings = maybe_settings.get();
        if (!settings)
        {
            Checks::exit_fail(NODEBOOT_LINE_INFO);
        }

        const auto maybe_exit_code = provision_and_delegate(console_diagnostic_context, fs, *settings);
        if (const auto exit_code = maybe_exit_code.get())
        {
            Checks::exit_with_code(NODEBOOT_LINE_INFO, *exit_code);
        }

        Checks::exit_fail(NODEBOOT_LINE_INFO);
    }
}
