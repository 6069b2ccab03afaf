#include <nodeboot-test/util.h>

#include <nodeboot/fetcher.h>
#include <nodeboot/platform.h>

using namespace nodeboot;

TEST_CASE ("identify_platform maps operating systems", "[platform]")
{
    CHECK(identify_platform("windows", "x86_64") ==
          PlatformTokens{OsToken::Windows, ArchToken::X64, ArchiveKind::Zip});
    CHECK(identify_platform("darwin", "arm64") ==
          PlatformTokens{OsToken::Darwin, ArchToken::Arm64, ArchiveKind::TarGz});
    CHECK(identify_platform("linux", "aarch64") ==
          PlatformTokens{OsToken::Linux, ArchToken::Arm64, ArchiveKind::TarXz});
    CHECK(identify_platform("Windows", "AMD64").os == OsToken::Windows);
    CHECK(identify_platform("DARWIN", "x86_64").os == OsToken::Darwin);

    // anything else is treated as linux
    CHECK(identify_platform("freebsd", "amd64") ==
          PlatformTokens{OsToken::Linux, ArchToken::X64, ArchiveKind::TarXz});
    CHECK(identify_platform("", "") == PlatformTokens{OsToken::Linux, ArchToken::X64, ArchiveKind::TarXz});
}

TEST_CASE ("identify_platform maps architectures", "[platform]")
{
    CHECK(identify_platform("linux", "x86_64").arch == ArchToken::X64);
    CHECK(identify_platform("linux", "amd64").arch == ArchToken::X64);
    CHECK(identify_platform("windows", "AMD64").arch == ArchToken::X64);
    CHECK(identify_platform("linux", "arm64").arch == ArchToken::Arm64);
    CHECK(identify_platform("windows", "ARM64").arch == ArchToken::Arm64);
    CHECK(identify_platform("linux", "aarch64").arch == ArchToken::Arm64);
    CHECK(identify_platform("linux", "i386").arch == ArchToken::X86);
    CHECK(identify_platform("linux", "i686").arch == ArchToken::X86);
    CHECK(identify_platform("windows", "x86").arch == ArchToken::X86);

    SECTION ("unknown machines fall back to x64")
    {
        CHECK(identify_platform("linux", "riscv64").arch == ArchToken::X64);
        CHECK(identify_platform("linux", "ppc64le").arch == ArchToken::X64);
        CHECK(identify_platform("darwin", "").arch == ArchToken::X64);
    }
}

TEST_CASE ("platform tokens use the vendor spellings", "[platform]")
{
    CHECK(to_string_literal(OsToken::Windows) == "win");
    CHECK(to_string_literal(OsToken::Darwin) == "darwin");
    CHECK(to_string_literal(OsToken::Linux) == "linux");
    CHECK(to_string_literal(ArchToken::X64) == "x64");
    CHECK(to_string_literal(ArchToken::Arm64) == "arm64");
    CHECK(to_string_literal(ArchToken::X86) == "x86");
    CHECK(to_string_literal(ArchiveKind::Zip) == "zip");
    CHECK(to_string_literal(ArchiveKind::TarGz) == "tar.gz");
    CHECK(to_string_literal(ArchiveKind::TarXz) == "tar.xz");
    CHECK(fmt::format("{}-{}", OsToken::Windows, ArchToken::Arm64) == "win-arm64");
}

TEST_CASE ("host platform tokens are stable", "[platform]")
{
    const auto& first = get_host_platform_tokens();
    const auto& second = get_host_platform_tokens();
    CHECK(&first == &second);
#if defined(_WIN32)
    CHECK(first.os == OsToken::Windows);
    CHECK(first.archive_kind == ArchiveKind::Zip);
#elif defined(__APPLE__)
    CHECK(first.os == OsToken::Darwin);
    CHECK(first.archive_kind == ArchiveKind::TarGz);
#elif defined(__linux__)
    CHECK(first.os == OsToken::Linux);
    CHECK(first.archive_kind == ArchiveKind::TarXz);
#endif
}

TEST_CASE ("make_runtime_download_url", "[platform][fetcher]")
{
    CHECK(make_runtime_download_url("https://nodejs.org/dist",
                                    "20.11.0",
                                    PlatformTokens{OsToken::Linux, ArchToken::X64, ArchiveKind::TarXz}) ==
          "https://nodejs.org/dist/v20.11.0/node-v20.11.0-linux-x64.tar.xz");
    CHECK(make_runtime_download_url("https://nodejs.org/dist",
                                    "20.11.0",
                                    PlatformTokens{OsToken::Windows, ArchToken::X86, ArchiveKind::Zip}) ==
          "https://nodejs.org/dist/v20.11.0/node-v20.11.0-win-x86.zip");
    CHECK(make_runtime_download_url("https://mirror.example/node",
                                    "18.0.1",
                                    PlatformTokens{OsToken::Darwin, ArchToken::Arm64, ArchiveKind::TarGz}) ==
          "https://mirror.example/node/v18.0.1/node-v18.0.1-darwin-arm64.tar.gz");
}
