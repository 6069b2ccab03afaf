#include <nodeboot-test/util.h>

#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/system.h>
#include <nodeboot/base/system.process.h>

#include <nodeboot/fetcher.h>

#include <algorithm>

namespace nodeboot::Test
{
    static Path internal_base_temporary_directory()
    {
#if defined(_WIN32)
        return Path(nodeboot::get_environment_variable("TEMP").value_or_exit(NODEBOOT_LINE_INFO)) / "nodeboot-test";
#else
        return "/tmp/nodeboot-test";
#endif
    }

    const Path& base_temporary_directory() noexcept
    {
        const static Path BASE_TEMPORARY_DIRECTORY = internal_base_temporary_directory();
        return BASE_TEMPORARY_DIRECTORY;
    }

    Path make_fresh_directory(const Filesystem& fs, StringView name)
    {
        auto dir = base_temporary_directory() / name;
        fs.remove_all(dir, NODEBOOT_LINE_INFO);
        fs.create_directories(dir, NODEBOOT_LINE_INFO);
        return dir;
    }

    ScopedEnvironmentVariable::ScopedEnvironmentVariable(ZStringView name, Optional<ZStringView> value)
        : m_name(name.to_string()), m_previous(get_environment_variable(name))
    {
        set_environment_variable(name, value);
    }

    ScopedEnvironmentVariable::~ScopedEnvironmentVariable()
    {
        if (auto previous = m_previous.get())
        {
            set_environment_variable(m_name, ZStringView(*previous));
        }
        else
        {
            set_environment_variable(m_name, nullopt);
        }
    }

    BootstrapSettings make_test_settings(const Path& home, std::string search_path)
    {
        BootstrapSettings settings;
        settings.home_dir = home;
        settings.search_path = std::move(search_path);
        settings.timeouts.connect_timeout_seconds = 5;
        settings.timeouts.stall_timeout_seconds = 5;
        // a node or npx installed on the machine running the tests must not be found
        settings.system_directories.clear();
#if !defined(_WIN32)
        // xz is not installed everywhere the tests run; gzip is
        settings.platform.archive_kind = ArchiveKind::TarGz;
#endif
        return settings;
    }

    Path write_fake_distribution(const Filesystem& fs, const Path& root, StringView dir_name, int launcher_exit_code)
    {
        const auto dist = root / dir_name;
        const auto bin = dist / "bin";
        fs.create_directories(bin, NODEBOOT_LINE_INFO);
        fs.create_directories(dist / "lib" / "node_modules" / "npm", NODEBOOT_LINE_INFO);
        fs.write_contents(dist / "README.md", "fake runtime distribution\n", NODEBOOT_LINE_INFO);
        fs.write_contents(dist / "lib" / "node_modules" / "npm" / "package.json", "{}\n", NODEBOOT_LINE_INFO);

        fs.write_contents(bin / "node", "#!/bin/sh\necho v20.11.0\n", NODEBOOT_LINE_INFO);
        fs.write_contents(bin / "npx",
                          fmt::format("#!/bin/sh\n"
                                      "printf '%s\\n' \"$@\" > \"$(dirname \"$0\")/../npx-args.txt\"\n"
                                      "exit {}\n",
                                      launcher_exit_code),
                          NODEBOOT_LINE_INFO);
        std::error_code ec;
        fs.set_executable(bin / "node", ec);
        CHECK_EC(ec);
        fs.set_executable(bin / "npx", ec);
        CHECK_EC(ec);
        return dist;
    }

    bool pack_archive(const Path& staging, ArchiveKind kind, const Path& archive)
    {
        Command cmd;
        switch (kind)
        {
            case ArchiveKind::Zip: cmd.string_arg("zip").string_arg("-qr").string_arg(archive).string_arg("."); break;
            case ArchiveKind::TarGz: cmd.string_arg("tar").string_arg("-czf").string_arg(archive).string_arg("."); break;
            case ArchiveKind::TarXz: cmd.string_arg("tar").string_arg("-cJf").string_arg(archive).string_arg("."); break;
        }

        ProcessLaunchSettings settings;
        settings.working_directory = staging;
        BufferedDiagnosticContext bdc{null_sink};
        const auto maybe_code = cmd_execute(bdc, cmd, settings);
        if (const auto code = maybe_code.get())
        {
            return *code == 0;
        }

        FAIL(bdc.to_string());
        return false;
    }

    std::string file_url(const Path& dir) { return Strings::concat("file://", dir.native()); }

    std::string make_file_mirror(const Filesystem& fs,
                                 const BootstrapSettings& settings,
                                 const Path& staging,
                                 const Path& mirror_root)
    {
        const auto mirror = file_url(mirror_root);
        const auto url = make_runtime_download_url(mirror, settings.runtime_version, settings.platform);
        const Path url_path = url;
        const auto version_dir = mirror_root / Strings::concat('v', settings.runtime_version);
        const auto archive = version_dir / url_path.filename();
        fs.create_directories(version_dir, NODEBOOT_LINE_INFO);
        REQUIRE(pack_archive(staging, settings.platform.archive_kind, archive));
        return mirror;
    }

    static void list_tree_impl(const Filesystem& fs,
                               const Path& dir,
                               const std::string& prefix,
                               std::vector<std::string>& out)
    {
        for (auto&& file : fs.get_files_non_recursive(dir, NODEBOOT_LINE_INFO))
        {
            out.push_back(Strings::concat(prefix, file.filename()));
        }

        for (auto&& subdirectory : fs.get_directories_non_recursive(dir, NODEBOOT_LINE_INFO))
        {
            auto name = Strings::concat(prefix, subdirectory.filename(), '/');
            out.push_back(name);
            list_tree_impl(fs, subdirectory, name, out);
        }
    }

    std::vector<std::string> list_tree(const Filesystem& fs, const Path& dir)
    {
        std::vector<std::string> result;
        list_tree_impl(fs, dir, std::string(), result);
        std::sort(result.begin(), result.end());
        return result;
    }
}
