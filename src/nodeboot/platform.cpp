#include <nodeboot/base/checks.h>
#include <nodeboot/base/strings.h>
#include <nodeboot/base/system.debug.h>
#include <nodeboot/base/system.h>

#include <nodeboot/platform.h>

namespace
{
    using namespace nodeboot;

    struct ArchitectureEntry
    {
        StringLiteral name;
        ArchToken arch;
    };

    constexpr ArchitectureEntry architecture_table[] = {
        {"x86_64", ArchToken::X64},
        {"amd64", ArchToken::X64},
        {"arm64", ArchToken::Arm64},
        {"aarch64", ArchToken::Arm64},
        {"i386", ArchToken::X86},
        {"i686", ArchToken::X86},
        {"x86", ArchToken::X86},
    };

    OsToken to_os_token(StringView os_name) noexcept
    {
        if (Strings::case_insensitive_ascii_equals(os_name, "windows"))
        {
            return OsToken::Windows;
        }

        if (Strings::case_insensitive_ascii_equals(os_name, "darwin"))
        {
            return OsToken::Darwin;
        }

        return OsToken::Linux;
    }

    ArchToken to_arch_token(StringView machine) noexcept
    {
        for (auto&& entry : architecture_table)
        {
            if (Strings::case_insensitive_ascii_equals(machine, entry.name))
            {
                return entry.arch;
            }
        }

        return ArchToken::X64;
    }

    ArchiveKind archive_kind_for(OsToken os) noexcept
    {
        switch (os)
        {
            case OsToken::Windows: return ArchiveKind::Zip;
            case OsToken::Darwin: return ArchiveKind::TarGz;
            case OsToken::Linux: return ArchiveKind::TarXz;
        }

        Checks::unreachable(NODEBOOT_LINE_INFO);
    }
}

namespace nodeboot
{
    StringLiteral to_string_literal(OsToken os) noexcept
    {
        switch (os)
        {
            case OsToken::Windows: return "win";
            case OsToken::Darwin: return "darwin";
            case OsToken::Linux: return "linux";
        }

        Checks::unreachable(NODEBOOT_LINE_INFO);
    }

    StringLiteral to_string_literal(ArchToken arch) noexcept
    {
        switch (arch)
        {
            case ArchToken::X64: return "x64";
            case ArchToken::Arm64: return "arm64";
            case ArchToken::X86: return "x86";
        }

        Checks::unreachable(NODEBOOT_LINE_INFO);
    }

    StringLiteral to_string_literal(ArchiveKind kind) noexcept
    {
        switch (kind)
        {
            case ArchiveKind::Zip: return "zip";
            case ArchiveKind::TarGz: return "tar.gz";
            case ArchiveKind::TarXz: return "tar.xz";
        }

        Checks::unreachable(NODEBOOT_LINE_INFO);
    }

    PlatformTokens identify_platform(StringView os_name, StringView machine) noexcept
    {
        const auto os = to_os_token(os_name);
        return PlatformTokens{os, to_arch_token(machine), archive_kind_for(os)};
    }

    const PlatformTokens& get_host_platform_tokens()
    {
        static const PlatformTokens host_tokens = []() {
            const auto os_name = get_host_os_name();
            const auto machine = get_host_machine_name();
            auto tokens = identify_platform(os_name, machine);
            Debug::println("Host platform: ",
                           os_name,
                           '/',
                           machine,
                           " -> ",
                           fmt::format("{}-{}.{}", tokens.os, tokens.arch, tokens.archive_kind));
            return tokens;
        }();

        return host_tokens;
    }
}
