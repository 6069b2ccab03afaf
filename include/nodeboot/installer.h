#pragma once

#include <nodeboot/base/fwd/diagnostics.h>
#include <nodeboot/base/fwd/files.h>

#include <nodeboot/base/optional.h>
#include <nodeboot/base/path.h>

#include <nodeboot/platform.h>

namespace nodeboot
{
    struct BootstrapSettings;

    // Where the runtime executable lives inside an unpacked distribution rooted at `install_dir`.
    Path installed_runtime_path(const Path& install_dir, OsToken os);

    // Returns the first directory (by name) directly inside `dir` whose name starts with "node-", or nullopt after
    // reporting to `context`.
    Optional<Path> find_extracted_distribution(DiagnosticContext& context, const Filesystem& fs, const Path& dir);

    // Unpacks `archive` under `scratch_dir` and moves the distribution's contents into settings.install_dir(),
    // replacing whatever was there. The previous installation is parked in `scratch_dir` until the new one is in
    // place, and is put back if the move fails. Returns false after reporting to `context`.
    bool install_runtime_archive(DiagnosticContext& context,
                                 const Filesystem& fs,
                                 const BootstrapSettings& settings,
                                 const Path& archive,
                                 const Path& scratch_dir);
}
