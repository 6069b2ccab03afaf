#include <nodeboot/base/contractual-constants.h>
#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/files.h>
#include <nodeboot/base/strings.h>

#include <nodeboot/bootstrapsettings.h>
#include <nodeboot/fetcher.h>

namespace nodeboot
{
    std::string make_runtime_download_url(StringView mirror, StringView version, const PlatformTokens& platform)
    {
        return fmt::format("{}/v{}/{}v{}-{}-{}.{}",
                           mirror,
                           version,
                           DistributionDirectoryPrefix,
                           version,
                           platform.os,
                           platform.arch,
                           platform.archive_kind);
    }

    FetchRequest make_fetch_request(const BootstrapSettings& settings)
    {
        return FetchRequest{
            make_runtime_download_url(settings.mirror_url, settings.runtime_version, settings.platform),
            settings.platform.archive_kind,
            settings.timeouts,
        };
    }

    Optional<Path> fetch_runtime_archive(DiagnosticContext& context,
                                         const Filesystem& fs,
                                         const FetchRequest& request,
                                         const Path& scratch_dir)
    {
        auto archive_path = scratch_dir / Strings::concat(RuntimeBaseName, '.', to_string_literal(request.archive_kind));
        context.statusln(msg::format(msgDownloadingRuntime, msg::url = request.url));
        if (!download_file(context, fs, request.url, archive_path, request.timeouts))
        {
            return nullopt;
        }

        return archive_path;
    }
}
