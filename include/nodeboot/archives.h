#pragma once

#include <nodeboot/base/fwd/diagnostics.h>
#include <nodeboot/base/fwd/files.h>

#include <nodeboot/base/system.process.h>

#include <nodeboot/platform.h>

namespace nodeboot
{
    // The command that unpacks `archive` into the current directory.
    Command make_extraction_command(const Path& archive, ArchiveKind kind);

    // Unpacks `archive` into `to_path`, creating it if needed, with the system tar (or unzip for zip archives
    // outside Windows). Returns false after reporting to `context` if the tool could not be run or failed.
    bool extract_runtime_archive(DiagnosticContext& context,
                                 const Filesystem& fs,
                                 const Path& archive,
                                 ArchiveKind kind,
                                 const Path& to_path);
}
