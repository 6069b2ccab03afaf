#pragma once

#include <nodeboot/base/fwd/diagnostics.h>

#include <nodeboot/base/optional.h>
#include <nodeboot/base/system.process.h>

#include <string>
#include <vector>

namespace nodeboot
{
    struct RuntimeProvisioner;

    // Finds the launcher, provisioning the runtime first if the launcher cannot be found, then runs it with
    // `extra_args` and the standard streams inherited. Returns the launcher's exit code, or nullopt after reporting to
    // `context` if it could not be found or started.
    Optional<int> run_launcher(DiagnosticContext& context,
                               const RuntimeProvisioner& provisioner,
                               const std::vector<std::string>& extra_args);

    // The command that run_launcher() spawns.
    Command make_launcher_command(const Path& launcher, const std::vector<std::string>& extra_args);

    // The fixed argument vector both entry points hand to the launcher: auto-confirm, then the package name.
    std::vector<std::string> default_launcher_arguments();
}
