#include <nodeboot/base/checks.h>
#include <nodeboot/base/contractual-constants.h>
#include <nodeboot/base/files.h>
#include <nodeboot/base/strings.h>
#include <nodeboot/base/system.debug.h>

#include <nodeboot/bootstrapsettings.h>
#include <nodeboot/locator.h>

namespace nodeboot
{
    std::string executable_filename(StringView base_name, ExecutableKind kind, OsToken os)
    {
        switch (os)
        {
            case OsToken::Windows:
                switch (kind)
                {
                    case ExecutableKind::Runtime: return Strings::concat(base_name, ".exe");
                    case ExecutableKind::Launcher: return Strings::concat(base_name, ".cmd");
                }

                Checks::unreachable(NODEBOOT_LINE_INFO);
            case OsToken::Darwin:
            case OsToken::Linux: return base_name.to_string();
        }

        Checks::unreachable(NODEBOOT_LINE_INFO);
    }

    std::vector<Path> ExecutableLocator::candidate_directories() const
    {
        std::vector<Path> result;
        const auto install_dir = m_settings.install_dir();
        switch (m_settings.platform.os)
        {
            case OsToken::Windows:
                result.push_back(install_dir);
                result.push_back(Path(m_settings.program_files) / "nodejs");
                if (!m_settings.local_app_data.empty())
                {
                    result.push_back(Path(m_settings.local_app_data) / "Programs" / "node");
                }

                break;
            case OsToken::Darwin:
            case OsToken::Linux:
                result.push_back(install_dir);
                // a completed private install keeps its executables in bin
                result.push_back(install_dir / "bin");
                result.insert(
                    result.end(), m_settings.system_directories.begin(), m_settings.system_directories.end());
                result.push_back(m_settings.home_dir / ".local" / "bin");
                result.push_back(m_settings.home_dir / ".nvm" / "versions" / "node" /
                                 Strings::concat('v', m_settings.runtime_version) / "bin");
                break;
        }

        return result;
    }

    Optional<Path> ExecutableLocator::locate(StringView base_name, ExecutableKind kind) const
    {
        const auto filename = executable_filename(base_name, kind, m_settings.platform.os);
        for (auto&& entry : Strings::split_paths(m_settings.search_path))
        {
            auto candidate = Path(entry) / filename;
            if (m_fs.is_regular_file(candidate))
            {
                Debug::println("Found ", filename, " on the search path: ", candidate);
                return candidate;
            }
        }

        for (auto&& directory : candidate_directories())
        {
            auto candidate = directory / filename;
            if (m_fs.is_regular_file(candidate))
            {
                Debug::println("Found ", filename, " in a candidate directory: ", candidate);
                return candidate;
            }
        }

        Debug::println("Did not find ", filename);
        return nullopt;
    }

    Optional<Path> ExecutableLocator::locate_runtime() const { return locate(RuntimeBaseName, ExecutableKind::Runtime); }

    Optional<Path> ExecutableLocator::locate_launcher(const Optional<Path>& runtime) const
    {
        auto launcher = locate(LauncherBaseName, ExecutableKind::Launcher);
        if (launcher)
        {
            return launcher;
        }

        if (auto runtime_path = runtime.get())
        {
            auto sibling = launcher_beside(*runtime_path);
            if (m_fs.is_regular_file(sibling))
            {
                Debug::println("Found launcher beside the runtime: ", sibling);
                return sibling;
            }
        }

        return nullopt;
    }

    Path ExecutableLocator::launcher_beside(const Path& runtime) const
    {
        return Path(runtime.parent_path()) /
               executable_filename(LauncherBaseName, ExecutableKind::Launcher, m_settings.platform.os);
    }
}
