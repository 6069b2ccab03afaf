#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/files.h>
#include <nodeboot/base/message_sinks.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/system.debug.h>
#include <nodeboot/base/system.h>

#include <nodeboot/bootstrapsettings.h>
#include <nodeboot/fetcher.h>
#include <nodeboot/installer.h>
#include <nodeboot/provisioning.h>

namespace nodeboot
{
    Optional<Path> RuntimeProvisioner::ensure_runtime(DiagnosticContext& context) const
    {
        auto found = m_locator.locate_runtime();
        if (found)
        {
            return found;
        }

        context.statusln(msg::format(msgRuntimeNotFoundInstalling, msg::version = m_settings.runtime_version));
        if (!m_fs.create_directories(context, m_settings.product_dir()))
        {
            return nullopt;
        }

        const auto lock_path = m_settings.install_lock_file();
        std::error_code ec;
        auto lock = m_fs.take_exclusive_file_lock(lock_path, out_sink, ec);
        if (ec)
        {
            context.report_error(msg::format(msgFailedToTakeFileSystemLock, msg::path = lock_path)
                                     .append_raw('\n')
                                     .append(format_filesystem_call_error(ec, "take_exclusive_file_lock", {lock_path})));
            return nullopt;
        }

        // another bootstrapper may have finished installing while we waited for the lock
        found = m_locator.locate_runtime();
        if (found)
        {
            Debug::println("Runtime appeared while waiting for the install lock");
            return found;
        }

        const auto scratch_path = m_settings.scratch_dir(get_process_id());
        m_fs.remove_all(scratch_path, IgnoreErrors{});
        if (!m_fs.create_directories(context, scratch_path))
        {
            return nullopt;
        }

        TempDirectoryDeleter scratch{m_fs, scratch_path};
        const auto maybe_archive = fetch_runtime_archive(context, m_fs, make_fetch_request(m_settings), scratch.path);
        const auto archive = maybe_archive.get();
        if (!archive)
        {
            return nullopt;
        }

        if (!install_runtime_archive(context, m_fs, m_settings, *archive, scratch.path))
        {
            return nullopt;
        }

        return installed_runtime_path(m_settings.install_dir(), m_settings.platform.os);
    }
}
