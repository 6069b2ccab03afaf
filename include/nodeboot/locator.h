#pragma once

#include <nodeboot/base/fwd/files.h>

#include <nodeboot/base/optional.h>
#include <nodeboot/base/path.h>
#include <nodeboot/base/stringview.h>

#include <nodeboot/platform.h>

#include <string>
#include <vector>

namespace nodeboot
{
    struct BootstrapSettings;

    enum class ExecutableKind
    {
        // node: node.exe on Windows
        Runtime,
        // npx: npx.cmd on Windows
        Launcher,
    };

    std::string executable_filename(StringView base_name, ExecutableKind kind, OsToken os);

    // Read-only search for the runtime and its launcher. Never touches the network or writes to disk; the answer is
    // recomputed on every call.
    struct ExecutableLocator
    {
        ExecutableLocator(const Filesystem& fs, const BootstrapSettings& settings) : m_fs(fs), m_settings(settings) { }

        // The well-known directories searched after the search path, most preferred first.
        std::vector<Path> candidate_directories() const;

        // Searches each search path entry, then each candidate directory, for the platform's spelling of
        // `base_name`. Returns the first existing file.
        Optional<Path> locate(StringView base_name, ExecutableKind kind) const;

        Optional<Path> locate_runtime() const;

        // Like locate(), but when the launcher is not found directly also tries the directory containing `runtime`.
        Optional<Path> locate_launcher(const Optional<Path>& runtime) const;

        // Where the launcher lives if it was shipped beside `runtime`.
        Path launcher_beside(const Path& runtime) const;

    private:
        const Filesystem& m_fs;
        const BootstrapSettings& m_settings;
    };
}
