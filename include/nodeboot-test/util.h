#pragma once

#include <nodeboot/base/system-headers.h>

#include <catch2/catch.hpp>

#include <nodeboot/base/fwd/files.h>

#include <nodeboot/base/files.h>
#include <nodeboot/base/fmt.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/optional.h>
#include <nodeboot/base/path.h>
#include <nodeboot/base/strings.h>

#include <nodeboot/bootstrapsettings.h>
#include <nodeboot/platform.h>

#include <iomanip>
#include <string>
#include <vector>

#define CHECK_EC(ec)                                                                                                   \
    do                                                                                                                 \
    {                                                                                                                  \
        if (ec)                                                                                                        \
        {                                                                                                              \
            FAIL(ec.message());                                                                                        \
        }                                                                                                              \
    } while (0)

namespace Catch
{
    template<>
    struct StringMaker<nodeboot::LocalizedString>
    {
        static const std::string convert(const nodeboot::LocalizedString& value) { return "LL\"" + value.data() + "\""; }
    };

    template<>
    struct StringMaker<nodeboot::Path>
    {
        static const std::string convert(const nodeboot::Path& value) { return "\"" + value.native() + "\""; }
    };

    template<>
    struct StringMaker<nodeboot::PlatformTokens>
    {
        static std::string convert(const nodeboot::PlatformTokens& value)
        {
            return fmt::format("{{{}, {}, {}}}", value.os, value.arch, value.archive_kind);
        }
    };
}

namespace nodeboot
{
    inline std::ostream& operator<<(std::ostream& os, const LocalizedString& value)
    {
        return os << "LL" << std::quoted(value.data());
    }

    inline std::ostream& operator<<(std::ostream& os, const Path& value) { return os << value.native(); }

    template<class T>
    inline auto operator<<(std::ostream& os, const Optional<T>& value) -> decltype(os << *(value.get()))
    {
        if (auto v = value.get())
        {
            return os << *v;
        }
        else
        {
            return os << "nullopt";
        }
    }
}

namespace nodeboot::Test
{
    const Path& base_temporary_directory() noexcept;

    // Removes and recreates base_temporary_directory() / name.
    Path make_fresh_directory(const Filesystem& fs, StringView name);

    // Sets an environment variable for the lifetime of this object, restoring the previous value afterwards.
    struct ScopedEnvironmentVariable
    {
        ScopedEnvironmentVariable(ZStringView name, Optional<ZStringView> value);
        ScopedEnvironmentVariable(const ScopedEnvironmentVariable&) = delete;
        ScopedEnvironmentVariable& operator=(const ScopedEnvironmentVariable&) = delete;
        ~ScopedEnvironmentVariable();

    private:
        std::string m_name;
        Optional<std::string> m_previous;
    };

    // Settings for a host whose home directory is `home` and whose search path is `search_path`, with nothing else
    // from the real environment and no system-wide directories. Outside Windows the archive kind is tar.gz.
    BootstrapSettings make_test_settings(const Path& home, std::string search_path = std::string());

    // Writes a fake runtime distribution named `dir_name` under `root`: bin/node and bin/npx shell scripts plus a
    // few data files. The fake npx writes its arguments, one per line, to npx-args.txt beside the distribution root
    // and exits with `launcher_exit_code`.
    Path write_fake_distribution(const Filesystem& fs, const Path& root, StringView dir_name, int launcher_exit_code);

    // Packs every entry of `staging` into `archive` using the system archivers. Returns false if the archiver failed.
    bool pack_archive(const Path& staging, ArchiveKind kind, const Path& archive);

    // The file:// URL that names the local directory `dir`.
    std::string file_url(const Path& dir);

    // Lays out `<mirror_root>/v<version>/node-v<version>-<os>-<arch>.<ext>` for `settings` from `staging` and returns
    // the mirror's URL.
    std::string make_file_mirror(const Filesystem& fs,
                                 const BootstrapSettings& settings,
                                 const Path& staging,
                                 const Path& mirror_root);

    // Every path under `dir`, relative to it, sorted.
    std::vector<std::string> list_tree(const Filesystem& fs, const Path& dir);
}
