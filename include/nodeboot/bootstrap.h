#pragma once

#include <nodeboot/base/fwd/diagnostics.h>
#include <nodeboot/base/fwd/files.h>

#include <nodeboot/base/optional.h>

namespace nodeboot
{
    struct BootstrapSettings;

    // Ensures the runtime is provisioned, then runs the launcher with the default arguments. Returns the launcher's
    // exit code, or nullopt after reporting to `context` if provisioning or delegation failed; in that case no child
    // process was started.
    Optional<int> provision_and_delegate(DiagnosticContext& context,
                                         const Filesystem& fs,
                                         const BootstrapSettings& settings);

    // The body shared by both executables: reads the environment, provisions, delegates, and exits with the
    // launcher's exit code.
    [[noreturn]] void bootstrap_main(const Filesystem& fs);
}
