#include <nodeboot-test/util.h>

#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/files.h>

#include <string.h>

#if !defined(_WIN32)
#include <sys/stat.h>
#endif

#include <utility>

using namespace nodeboot;
using Test::base_temporary_directory;

TEST_CASE ("Path regular operations", "[filesystem][files]")
{
    CHECK(Path().native().empty());
    CHECK(Path().empty());
    Path p("hello");
    CHECK(p == "hello");
    Path copy_constructed(p);
    CHECK(copy_constructed.native() == "hello");
    Path move_constructed(std::move(p));
    CHECK(move_constructed.native() == "hello");

    std::string str("some string");
    CHECK(Path(str).native() == "some string");
    CHECK(Path(str.data(), 4).native() == "some");
    CHECK(Path(StringView("a view")).native() == "a view");

    Path converted("convert from");
    StringView conv_sv = converted;
    CHECK(conv_sv == "convert from");
    CHECK(strcmp(converted.c_str(), "convert from") == 0);
}

static void test_op_slash(StringView base, StringView append, StringView expected)
{
    Path an_lvalue(base);
    CHECK((an_lvalue / append).native() == expected);
    CHECK((Path(base) / append).native() == expected);
    an_lvalue /= append;
    CHECK(an_lvalue.native() == expected);
}

TEST_CASE ("Path::operator/", "[filesystem][files]")
{
    test_op_slash("/a/b", "c", "/a/b" NODEBOOT_PREFERRED_SEPARATOR "c");
    test_op_slash("a/b/", "c", "a/b/c");
    test_op_slash("", "c", "c");
#if defined(_WIN32)
    test_op_slash("C:", "a", "C:a");
    test_op_slash("C:/a", "D:/b", "D:/b");
#else  // ^^^ _WIN32 // !_WIN32 vvv
    test_op_slash("/a/b", "/c", "/c");
#endif // ^^^ !_WIN32
}

TEST_CASE ("Path::operator+=", "[filesystem][files]")
{
    Path p("/tmp/node.tar.xz");
    p += ".1234.part";
    CHECK(p.native() == "/tmp/node.tar.xz.1234.part");
}

TEST_CASE ("Path decomposition", "[filesystem][files]")
{
    CHECK(Path("a/b").filename() == "b");
    CHECK(Path("a/b/").filename() == "");
    CHECK(Path("node-v20.11.0-linux-x64").filename() == "node-v20.11.0-linux-x64");
    CHECK(Path("/home/me/.claude-ssh-mcp/node/bin/node").parent_path() == "/home/me/.claude-ssh-mcp/node/bin");
    CHECK(Path("a/b//c").parent_path() == "a/b");
    CHECK(Path("/tmp").parent_path() == "/");
    CHECK(Path("relative").parent_path() == "");
#if defined(_WIN32)
    CHECK(Path("C:/a").is_absolute());
    CHECK(Path("C:\\a").is_absolute());
    CHECK_FALSE(Path("C:a").is_absolute());
    CHECK_FALSE(Path("/a").is_absolute());
    CHECK(Path("//server/share").is_absolute());
    CHECK(Path("C:\\Users\\me\\node.exe").filename() == "node.exe");
#else  // ^^^ _WIN32 // !_WIN32 vvv
    CHECK(Path("/a").is_absolute());
    CHECK_FALSE(Path("a/b").is_absolute());
    CHECK_FALSE(Path("C:/a").is_absolute());
#endif // ^^^ !_WIN32
}

TEST_CASE ("create_directories and remove_all", "[files]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "files-create-remove");
    const auto deep = root / "a" / "b" / "c";

    std::error_code ec;
    CHECK(fs.create_directories(deep, ec));
    CHECK_EC(ec);
    CHECK(fs.is_directory(deep));
    // already existing is not an error, but nothing was created
    CHECK_FALSE(fs.create_directories(deep, ec));
    CHECK_EC(ec);

    fs.write_contents(deep / "file.txt", "contents", NODEBOOT_LINE_INFO);
    fs.write_contents(root / "a" / "top.txt", "contents", NODEBOOT_LINE_INFO);
    CHECK(fs.read_contents(deep / "file.txt", NODEBOOT_LINE_INFO) == "contents");

    SECTION ("creating a directory over a file fails")
    {
        BufferedDiagnosticContext bdc{null_sink};
        CHECK_FALSE(fs.create_directories(bdc, root / "a" / "top.txt" / "child"));
        CHECK(bdc.any_errors());
    }

    fs.remove_all(root / "a", ec);
    CHECK_EC(ec);
    CHECK_FALSE(fs.exists(root / "a", IgnoreErrors{}));

    // removing something that does not exist succeeds
    fs.remove_all(root / "a", ec);
    CHECK_EC(ec);
}

#if !defined(_WIN32)
TEST_CASE ("remove_all removes read-only directories", "[files]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "files-remove-readonly");
    const auto locked = root / "locked";
    fs.create_directories(locked, NODEBOOT_LINE_INFO);
    fs.write_contents(locked / "file", "", NODEBOOT_LINE_INFO);
    REQUIRE(::chmod(locked.c_str(), 0555) == 0);

    std::error_code ec;
    fs.remove_all(locked, ec);
    CHECK_EC(ec);
    CHECK_FALSE(fs.exists(locked, IgnoreErrors{}));
}
#endif // ^^^ !_WIN32

TEST_CASE ("directory listings are sorted and typed", "[files]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "files-listing");
    fs.create_directories(root / "zeta", NODEBOOT_LINE_INFO);
    fs.create_directories(root / "alpha", NODEBOOT_LINE_INFO);
    fs.write_contents(root / "middle.txt", "", NODEBOOT_LINE_INFO);

    const std::vector<Path> expected_directories{root / "alpha", root / "zeta"};
    CHECK(fs.get_directories_non_recursive(root, NODEBOOT_LINE_INFO) == expected_directories);
    const std::vector<Path> expected_files{root / "middle.txt"};
    CHECK(fs.get_files_non_recursive(root, NODEBOOT_LINE_INFO) == expected_files);

    std::error_code ec;
    CHECK(fs.get_directories_non_recursive(root / "missing", ec).empty());
    CHECK(ec);
}

TEST_CASE ("rename", "[files]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "files-rename");
    fs.create_directories(root / "from" / "bin", NODEBOOT_LINE_INFO);
    fs.write_contents(root / "from" / "bin" / "node", "runtime", NODEBOOT_LINE_INFO);

    std::error_code ec;
    fs.rename(root / "from", root / "to", ec);
    CHECK_EC(ec);
    CHECK_FALSE(fs.exists(root / "from", IgnoreErrors{}));
    CHECK(fs.read_contents(root / "to" / "bin" / "node", NODEBOOT_LINE_INFO) == "runtime");

    fs.rename(root / "missing", root / "elsewhere", ec);
    CHECK(ec);
    CHECK(format_filesystem_call_error(ec, "rename", {root / "missing", root / "elsewhere"})
              .data()
              .find("rename") != std::string::npos);
}

TEST_CASE ("status", "[files]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "files-status");
    fs.write_contents(root / "file", "", NODEBOOT_LINE_INFO);

    CHECK(fs.status(root, NODEBOOT_LINE_INFO) == FileType::directory);
    CHECK(fs.status(root / "file", NODEBOOT_LINE_INFO) == FileType::regular);
    CHECK(fs.status(root / "missing", NODEBOOT_LINE_INFO) == FileType::not_found);
    CHECK(fs.is_regular_file(root / "file"));
    CHECK_FALSE(fs.is_regular_file(root));
    CHECK(fs.is_directory(root));
    CHECK_FALSE(fs.exists(root / "missing", IgnoreErrors{}));
}

TEST_CASE ("TempDirectoryDeleter", "[files]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "files-temp-deleter");
    const auto scratch = root / "tmp-1";
    {
        TempDirectoryDeleter deleter{fs, scratch};
        fs.create_directories(scratch / "extract" / "node-v20.11.0", NODEBOOT_LINE_INFO);
        fs.write_contents(scratch / "node.tar.xz", "archive", NODEBOOT_LINE_INFO);
        CHECK(deleter.path == scratch);
    }

    CHECK_FALSE(fs.exists(scratch, IgnoreErrors{}));
    CHECK(fs.is_directory(root));
}

TEST_CASE ("exclusive file lock", "[files]")
{
    auto& fs = real_filesystem;
    const auto root = Test::make_fresh_directory(fs, "files-lock");
    const auto lockfile = root / "install.lock";

    std::error_code ec;
    auto lock = fs.take_exclusive_file_lock(lockfile, null_sink, ec);
    CHECK_EC(ec);
    REQUIRE(lock);
    CHECK(fs.exists(lockfile, IgnoreErrors{}));
    lock.reset();

    // released locks can be taken again without waiting
    auto again = fs.take_exclusive_file_lock(lockfile, null_sink, ec);
    CHECK_EC(ec);
    CHECK(again);
}
