#include <nodeboot-test/util.h>

#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/downloads.h>

using namespace nodeboot;

TEST_CASE ("download_file from a file URL", "[downloads]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "downloads-file-url");
    fs.write_contents(root / "source.bin", "archive bytes", NODEBOOT_LINE_INFO);
    const auto target = root / "target.bin";
    DownloadTimeouts timeouts;
    timeouts.connect_timeout_seconds = 5;
    timeouts.stall_timeout_seconds = 5;

    BufferedDiagnosticContext bdc{null_sink};
    REQUIRE(download_file(bdc, fs, Test::file_url(root / "source.bin"), target, timeouts));
    CHECK(bdc.empty());
    CHECK(fs.read_contents(target, NODEBOOT_LINE_INFO) == "archive bytes");

    // only the source and the completed download remain; the partial file was renamed into place
    const std::vector<Path> expected{root / "source.bin", target};
    CHECK(fs.get_files_non_recursive(root, NODEBOOT_LINE_INFO) == expected);
}

TEST_CASE ("download_file failures leave nothing behind", "[downloads]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "downloads-failure");
    const auto target = root / "target.bin";
    DownloadTimeouts timeouts;
    timeouts.connect_timeout_seconds = 5;
    timeouts.stall_timeout_seconds = 5;

    std::string url;
    SECTION ("missing file") { url = Test::file_url(root / "missing.bin"); }
    SECTION ("refused connection") { url = "http://127.0.0.1:9/missing.bin"; }

    BufferedDiagnosticContext bdc{null_sink};
    CHECK_FALSE(download_file(bdc, fs, url, target, timeouts));
    REQUIRE(bdc.lines.size() == 1);
    CHECK(bdc.lines[0].kind() == DiagKind::Error);
    CHECK(bdc.lines[0].to_string().find(url) != std::string::npos);
    CHECK(fs.get_files_non_recursive(root, NODEBOOT_LINE_INFO).empty());
}
