#pragma once

#include <nodeboot/base/fwd/diagnostics.h>
#include <nodeboot/base/fwd/files.h>

#include <nodeboot/base/optional.h>
#include <nodeboot/base/path.h>

#include <nodeboot/locator.h>

namespace nodeboot
{
    struct BootstrapSettings;

    // Makes sure a runtime is available, installing the pinned version into the private install directory when none
    // can be found.
    struct RuntimeProvisioner
    {
        RuntimeProvisioner(const Filesystem& fs, const BootstrapSettings& settings)
            : m_fs(fs), m_settings(settings), m_locator(fs, settings)
        {
        }

        const Filesystem& filesystem() const noexcept { return m_fs; }
        const BootstrapSettings& settings() const noexcept { return m_settings; }
        const ExecutableLocator& locator() const noexcept { return m_locator; }

        // Returns the path to a usable runtime. If one is already present, nothing is downloaded or written.
        // Otherwise downloads, unpacks, and installs the pinned distribution while holding the install lock, and
        // returns the installed runtime. Returns nullopt after reporting to `context` on failure.
        Optional<Path> ensure_runtime(DiagnosticContext& context) const;

    private:
        const Filesystem& m_fs;
        const BootstrapSettings& m_settings;
        ExecutableLocator m_locator;
    };
}
