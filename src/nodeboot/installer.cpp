#include <nodeboot/base/contractual-constants.h>
#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/files.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/strings.h>
#include <nodeboot/base/system.debug.h>

#include <nodeboot/archives.h>
#include <nodeboot/bootstrapsettings.h>
#include <nodeboot/installer.h>
#include <nodeboot/locator.h>

namespace
{
    using namespace nodeboot;

    bool rename_reporting(DiagnosticContext& context, const Filesystem& fs, const Path& from, const Path& to)
    {
        std::error_code ec;
        fs.rename(from, to, ec);
        if (ec)
        {
            context.report_error(format_filesystem_call_error(ec, "rename", {from, to}));
            return false;
        }

        return true;
    }
}

namespace nodeboot
{
    Path installed_runtime_path(const Path& install_dir, OsToken os)
    {
        const auto filename = executable_filename(RuntimeBaseName, ExecutableKind::Runtime, os);
        switch (os)
        {
            case OsToken::Windows: return install_dir / filename;
            case OsToken::Darwin:
            case OsToken::Linux: return install_dir / "bin" / filename;
        }

        Checks::unreachable(NODEBOOT_LINE_INFO);
    }

    Optional<Path> find_extracted_distribution(DiagnosticContext& context, const Filesystem& fs, const Path& dir)
    {
        std::error_code ec;
        const auto directories = fs.get_directories_non_recursive(dir, ec);
        if (ec)
        {
            context.report_error(format_filesystem_call_error(ec, "get_directories_non_recursive", {dir}));
            return nullopt;
        }

        for (auto&& directory : directories)
        {
            if (directory.filename().starts_with(DistributionDirectoryPrefix))
            {
                return directory;
            }
        }

        context.report_error(
            msg::format(msgExtractedDirectoryNotFound, msg::path = dir, msg::value = DistributionDirectoryPrefix));
        return nullopt;
    }

    bool install_runtime_archive(DiagnosticContext& context,
                                 const Filesystem& fs,
                                 const BootstrapSettings& settings,
                                 const Path& archive,
                                 const Path& scratch_dir)
    {
        const auto extract_dir = scratch_dir / ExtractDirectoryName;
        if (!extract_runtime_archive(context, fs, archive, settings.platform.archive_kind, extract_dir))
        {
            return false;
        }

        const auto maybe_distribution = find_extracted_distribution(context, fs, extract_dir);
        const auto distribution = maybe_distribution.get();
        if (!distribution)
        {
            return false;
        }

        const auto install_dir = settings.install_dir();
        if (!fs.create_directories(context, Path(install_dir.parent_path())))
        {
            return false;
        }

        const auto previous_dir = scratch_dir / PreviousInstallDirectoryName;
        bool has_previous = false;
        if (fs.exists(install_dir, IgnoreErrors{}))
        {
            Debug::println("Moving aside the existing installation at ", install_dir);
            if (!rename_reporting(context, fs, install_dir, previous_dir))
            {
                return false;
            }

            has_previous = true;
        }

        const auto restore_previous = [&]() {
            if (has_previous)
            {
                context.statusln(msg::format(msgRestoringPreviousInstall, msg::path = install_dir));
                rename_reporting(context, fs, previous_dir, install_dir);
            }
        };

        if (!rename_reporting(context, fs, *distribution, install_dir))
        {
            restore_previous();
            return false;
        }

        const auto runtime = installed_runtime_path(install_dir, settings.platform.os);
        if (!fs.is_regular_file(runtime))
        {
            context.report_error(msg::format(msgInstallVerificationFailed, msg::path = runtime));
            // the rejected tree stays in scratch so that it is removed with it
            if (rename_reporting(context, fs, install_dir, scratch_dir / RejectedInstallDirectoryName))
            {
                restore_previous();
            }

            return false;
        }

        context.statusln(
            msg::format(msgInstalledRuntime, msg::version = settings.runtime_version, msg::path = install_dir));
        return true;
    }
}
