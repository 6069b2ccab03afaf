#include <nodeboot/base/checks.h>
#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/files.h>
#include <nodeboot/base/messages.h>

#include <nodeboot/archives.h>

namespace nodeboot
{
    Command make_extraction_command(const Path& archive, ArchiveKind kind)
    {
        switch (kind)
        {
            case ArchiveKind::Zip:
#if defined(_WIN32)
                // bsdtar, shipped with Windows 10 and later, reads zip archives
                return Command{"tar.exe"}.string_arg("-xf").string_arg(archive);
#else
                return Command{"unzip"}.string_arg("-qqo").string_arg(archive);
#endif
            case ArchiveKind::TarGz: return Command{"tar"}.string_arg("-xzf").string_arg(archive);
            case ArchiveKind::TarXz: return Command{"tar"}.string_arg("-xJf").string_arg(archive);
        }

        Checks::unreachable(NODEBOOT_LINE_INFO);
    }

    bool extract_runtime_archive(DiagnosticContext& context,
                                 const Filesystem& fs,
                                 const Path& archive,
                                 ArchiveKind kind,
                                 const Path& to_path)
    {
        if (!fs.create_directories(context, to_path))
        {
            return false;
        }

        context.statusln(msg::format(msgExtractingRuntime, msg::path = archive.filename()));
        ProcessLaunchSettings settings;
        settings.working_directory = to_path;
        const auto maybe_code = cmd_execute(context, make_extraction_command(archive, kind), settings);
        const auto code = maybe_code.get();
        if (!code)
        {
            return false;
        }

        if (*code != 0)
        {
            context.report_error(msgExtractionFailed, msg::path = archive, msg::exit_code = *code);
            return false;
        }

        return true;
    }
}
