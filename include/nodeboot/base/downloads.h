#pragma once

#include <nodeboot/base/fwd/diagnostics.h>
#include <nodeboot/base/fwd/files.h>

#include <nodeboot/base/contractual-constants.h>
#include <nodeboot/base/stringview.h>

namespace nodeboot
{
    struct DownloadTimeouts
    {
        // Abort if no connection is established within this many seconds.
        long connect_timeout_seconds = DefaultConnectTimeoutSeconds;
        // Abort if fewer than one byte per second arrives for this many seconds.
        long stall_timeout_seconds = DefaultStallTimeoutSeconds;
    };

    // Downloads `url` to `download_path` with a single GET, following redirects. The body is written to a sibling
    // ".part" file which is renamed into place only on success. Accepts http(s) and file URLs.
    // Returns false after reporting to `context` on any network, protocol or filesystem failure.
    bool download_file(DiagnosticContext& context,
                       const Filesystem& fs,
                       StringView url,
                       const Path& download_path,
                       const DownloadTimeouts& timeouts);
}
