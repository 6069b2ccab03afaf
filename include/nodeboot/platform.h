#pragma once

#include <nodeboot/base/fmt.h>
#include <nodeboot/base/stringview.h>

namespace nodeboot
{
    enum class OsToken
    {
        Windows,
        Darwin,
        Linux,
    };

    enum class ArchToken
    {
        X64,
        Arm64,
        X86,
    };

    enum class ArchiveKind
    {
        Zip,
        TarGz,
        TarXz,
    };

    // The spellings the runtime vendor uses in distribution file names: "win", "x64", "tar.xz", and so on.
    StringLiteral to_string_literal(OsToken os) noexcept;
    StringLiteral to_string_literal(ArchToken arch) noexcept;
    StringLiteral to_string_literal(ArchiveKind kind) noexcept;

    struct PlatformTokens
    {
        OsToken os;
        ArchToken arch;
        ArchiveKind archive_kind;

        friend bool operator==(const PlatformTokens& lhs, const PlatformTokens& rhs) noexcept
        {
            return lhs.os == rhs.os && lhs.arch == rhs.arch && lhs.archive_kind == rhs.archive_kind;
        }

        friend bool operator!=(const PlatformTokens& lhs, const PlatformTokens& rhs) noexcept { return !(lhs == rhs); }
    };

    // Maps an OS name ("windows", "darwin", "linux", ...) and a machine name ("x86_64", "aarch64", "AMD64", ...) to
    // the vendor's tokens. Comparisons ignore ASCII case. Unrecognized operating systems are treated as Linux and
    // unrecognized machines as x64; neither is an error.
    PlatformTokens identify_platform(StringView os_name, StringView machine) noexcept;

    // identify_platform() applied to this host, computed on first use.
    const PlatformTokens& get_host_platform_tokens();
}

NODEBOOT_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(nodeboot::OsToken);
NODEBOOT_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(nodeboot::ArchToken);
NODEBOOT_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(nodeboot::ArchiveKind);
