#pragma once

#include <nodeboot/base/fwd/diagnostics.h>
#include <nodeboot/base/fwd/files.h>

#include <nodeboot/base/downloads.h>
#include <nodeboot/base/optional.h>
#include <nodeboot/base/path.h>
#include <nodeboot/base/stringview.h>

#include <nodeboot/platform.h>

#include <string>

namespace nodeboot
{
    struct BootstrapSettings;

    // {mirror}/v{version}/node-v{version}-{os}-{arch}.{ext}
    std::string make_runtime_download_url(StringView mirror, StringView version, const PlatformTokens& platform);

    struct FetchRequest
    {
        std::string url;
        ArchiveKind archive_kind;
        DownloadTimeouts timeouts;
    };

    FetchRequest make_fetch_request(const BootstrapSettings& settings);

    // Downloads the distribution archive to <scratch_dir>/node.<ext>. Returns the archive's path, or nullopt after
    // reporting a download failure to `context`. Makes exactly one attempt.
    Optional<Path> fetch_runtime_archive(DiagnosticContext& context,
                                         const Filesystem& fs,
                                         const FetchRequest& request,
                                         const Path& scratch_dir);
}
