#include <nodeboot/base/system-headers.h>

#include <nodeboot/base/checks.h>
#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/files.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/strings.h>
#include <nodeboot/base/system.debug.h>

#include <errno.h>

#include <algorithm>
#include <chrono>
#include <thread>

#if !defined(_WIN32)
#include <dirent.h>
#include <fcntl.h>

#include <sys/file.h>
#include <sys/stat.h>
#endif // ^^^ !_WIN32

#if defined(_WIN32)
#include <filesystem>
namespace stdfs = std::filesystem;
#endif // _WIN32

namespace
{
    using namespace nodeboot;

    constexpr IsSlash is_slash;
    constexpr char preferred_separator = NODEBOOT_PREFERRED_SEPARATOR[0];

#if defined(_WIN32)
    bool has_drive_letter_prefix(const char* const first, const char* const last) noexcept
    {
        if (last - first < 2 || first[1] != ':')
        {
            return false;
        }

        const char drive = static_cast<char>(first[0] & ~0x20);
        return drive >= 'A' && drive <= 'Z';
    }
#endif // _WIN32

    const char* find_root_name_end(const char* const first, const char* const last) noexcept
    {
#if defined(_WIN32)
        // X: is a root-name; so is \\server, with the following \ being the root-directory
        if (has_drive_letter_prefix(first, last))
        {
            return first + 2;
        }

        if (last - first >= 3 && is_slash(first[0]) && is_slash(first[1]) && !is_slash(first[2]))
        {
            return std::find_if(first + 3, last, is_slash);
        }

        return first;
#else  // ^^^ _WIN32 / !_WIN32 vvv
        (void)last;
        return first;
#endif // _WIN32
    }

    const char* find_relative_path(const char* const first, const char* const last) noexcept
    {
        return std::find_if_not(find_root_name_end(first, last), last, is_slash);
    }

    const char* find_filename(const char* const first, const char* last) noexcept
    {
        const auto relative_path = find_relative_path(first, last);
        while (relative_path != last && !is_slash(last[-1]))
        {
            --last;
        }

        return last;
    }

    StringView parse_parent_path(const StringView str) noexcept
    {
        const auto first = str.data();
        auto last = first + str.size();
        const auto relative_path = find_relative_path(first, last);
        while (relative_path != last && !is_slash(last[-1]))
        {
            --last;
        }

        while (relative_path != last && is_slash(last[-1]))
        {
            --last;
        }

        return StringView(first, last);
    }

    bool is_absolute_path(const StringView str) noexcept
    {
#if defined(_WIN32)
        const auto first = str.data();
        const auto last = first + str.size();
        if (has_drive_letter_prefix(first, last))
        {
            return last - first >= 3 && is_slash(first[2]);
        }

        return first != find_root_name_end(first, last);
#else  // ^^^ _WIN32 / !_WIN32 vvv
        return !str.empty() && str[0] == '/';
#endif // ^^^ !_WIN32
    }

    FILE* open_file(const Path& path, const char* mode, std::error_code& ec) noexcept
    {
        FILE* result = nullptr;
#if defined(_WIN32)
        const auto wide_mode = Strings::to_utf16(mode);
        ec.assign(::_wfopen_s(&result, Strings::to_utf16(path).c_str(), wide_mode.c_str()), std::generic_category());
#else  // ^^^ _WIN32 / !_WIN32 vvv
        result = ::fopen(path.c_str(), mode);
        if (result)
        {
            ec.clear();
        }
        else
        {
            ec.assign(errno, std::generic_category());
        }
#endif // ^^^ !_WIN32
        return result;
    }

#if defined(_WIN32)
    stdfs::path to_stdfs_path(const Path& utfpath) { return stdfs::path(Strings::to_utf16(utfpath.native())); }

    Path from_stdfs_path(const stdfs::path& stdpath) { return Strings::to_utf8(stdpath.native()); }

    FileType convert_file_type(stdfs::file_type type) noexcept
    {
        switch (type)
        {
            case stdfs::file_type::none: return FileType::none;
            case stdfs::file_type::not_found: return FileType::not_found;
            case stdfs::file_type::regular: return FileType::regular;
            case stdfs::file_type::directory: return FileType::directory;
            case stdfs::file_type::symlink: return FileType::symlink;
            case stdfs::file_type::block: return FileType::block;
            case stdfs::file_type::character: return FileType::character;
            case stdfs::file_type::fifo: return FileType::fifo;
            case stdfs::file_type::socket: return FileType::socket;
            case stdfs::file_type::unknown: return FileType::unknown;
#if !defined(__MINGW32__)
            case stdfs::file_type::junction: return FileType::junction;
#endif
            default: Checks::unreachable(NODEBOOT_LINE_INFO);
        }
    }

    template<class Predicate>
    std::vector<Path> get_entries_non_recursive(const Path& dir, std::error_code& ec, Predicate predicate)
    {
        std::vector<Path> result;
        stdfs::directory_iterator first(to_stdfs_path(dir), ec);
        if (ec)
        {
            return result;
        }

        for (const stdfs::directory_iterator last; first != last; first.increment(ec))
        {
            if (ec)
            {
                result.clear();
                return result;
            }

            if (predicate(convert_file_type(first->status(ec).type())))
            {
                result.push_back(from_stdfs_path(first->path()));
            }
        }

        std::sort(result.begin(), result.end(), [](const Path& lhs, const Path& rhs) {
            return lhs.native() < rhs.native();
        });
        return result;
    }
#else // ^^^ _WIN32 / !_WIN32 vvv
    FileType posix_translate_stat_mode_to_file_type(mode_t mode) noexcept
    {
        if (S_ISBLK(mode)) return FileType::block;
        if (S_ISCHR(mode)) return FileType::character;
        if (S_ISDIR(mode)) return FileType::directory;
        if (S_ISFIFO(mode)) return FileType::fifo;
        if (S_ISREG(mode)) return FileType::regular;
        if (S_ISLNK(mode)) return FileType::symlink;
        if (S_ISSOCK(mode)) return FileType::socket;
        return FileType::unknown;
    }

    bool is_dot_or_dot_dot(const char* ntbs)
    {
        return ntbs[0] == '.' && (ntbs[1] == '\0' || (ntbs[1] == '.' && ntbs[2] == '\0'));
    }

    bool is_not_found_errno_code(int err) { return err == ENOENT || err == ENOTDIR || err == ELOOP; }

    struct PosixFd
    {
        PosixFd(const char* path, int oflag, mode_t mode, std::error_code& ec) noexcept : fd(::open(path, oflag, mode))
        {
            if (fd >= 0)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }
        }

        PosixFd(const PosixFd&) = delete;
        PosixFd& operator=(const PosixFd&) = delete;

        int flock(int operation) const noexcept { return ::flock(fd, operation); }

        explicit operator bool() const noexcept { return fd >= 0; }

        ~PosixFd()
        {
            if (fd >= 0)
            {
                Checks::check_exit(NODEBOOT_LINE_INFO, ::close(fd) == 0);
            }
        }

    private:
        int fd;
    };

    struct ReadDirOp
    {
        DIR* dirp;

        ReadDirOp(const Path& base, std::error_code& ec) : dirp(opendir(base.c_str()))
        {
            if (dirp)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }
        }

        ReadDirOp(const ReadDirOp&) = delete;
        ReadDirOp& operator=(const ReadDirOp&) = delete;

        const dirent* read(std::error_code& ec) const
        {
            errno = 0;
            const dirent* result = readdir(dirp);
            if (result || errno == 0)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }

            return result;
        }

        ~ReadDirOp()
        {
            if (dirp)
            {
                Checks::check_exit(NODEBOOT_LINE_INFO, closedir(dirp) == 0);
            }
        }
    };

    template<class Predicate>
    std::vector<Path> get_entries_non_recursive(const Path& dir, std::error_code& ec, Predicate predicate)
    {
        std::vector<Path> result;
        ReadDirOp op{dir, ec};
        if (ec)
        {
            return result;
        }

        for (;;)
        {
            const dirent* entry = op.read(ec);
            if (ec)
            {
                result.clear();
                return result;
            }

            if (!entry)
            {
                break;
            }

            if (is_dot_or_dot_dot(entry->d_name))
            {
                continue;
            }

            auto full = dir / entry->d_name;
            struct stat s;
            // follows symlinks, so a link to a directory is reported as one
            if (::stat(full.c_str(), &s) == 0 && predicate(posix_translate_stat_mode_to_file_type(s.st_mode)))
            {
                result.push_back(std::move(full));
            }
        }

        std::sort(result.begin(), result.end(), [](const Path& lhs, const Path& rhs) {
            return lhs.native() < rhs.native();
        });
        return result;
    }

    void mark_recursive_error(const Path& base, std::error_code& ec, Path& failure_point)
    {
        failure_point = base;
        ec.assign(errno, std::generic_category());
    }

    void nodeboot_remove_all(const Path& base, std::error_code& ec, Path& failure_point)
    {
        struct stat s;
        // lstat so that a symbolic link is removed rather than followed
        if (::lstat(base.c_str(), &s) != 0)
        {
            if (is_not_found_errno_code(errno))
            {
                ec.clear();
                return;
            }

            mark_recursive_error(base, ec, failure_point);
            return;
        }

        if (!S_ISDIR(s.st_mode))
        {
            if (::unlink(base.c_str()) != 0)
            {
                mark_recursive_error(base, ec, failure_point);
            }
            else
            {
                ec.clear();
            }

            return;
        }

        // the execute bit on directories is needed to remove the entries inside
        if ((s.st_mode & (S_IRUSR | S_IWUSR | S_IXUSR)) != (S_IRUSR | S_IWUSR | S_IXUSR))
        {
            if (::chmod(base.c_str(), s.st_mode | S_IRUSR | S_IWUSR | S_IXUSR) != 0)
            {
                mark_recursive_error(base, ec, failure_point);
                return;
            }
        }

        {
            ReadDirOp op{base, ec};
            if (ec)
            {
                failure_point = base;
                return;
            }

            for (;;)
            {
                const auto entry = op.read(ec);
                if (ec)
                {
                    failure_point = base;
                    return;
                }

                if (!entry)
                {
                    break;
                }

                if (is_dot_or_dot_dot(entry->d_name))
                {
                    continue;
                }

                nodeboot_remove_all(base / entry->d_name, ec, failure_point);
                if (ec)
                {
                    return;
                }
            }
        }

        if (::rmdir(base.c_str()) != 0)
        {
            mark_recursive_error(base, ec, failure_point);
        }
        else
        {
            ec.clear();
        }
    }
#endif // ^^^ !_WIN32
}

namespace nodeboot
{
    LocalizedString format_filesystem_call_error(const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args)
    {
        auto arguments = args.size() == 0 ? "()" : "(\"" + Strings::join("\", \"", args) + "\")";
        return LocalizedString::from_raw(Strings::concat(call_name, arguments, ": ", ec.message()));
    }

    [[noreturn]] void exit_filesystem_call_error(LineInfo li,
                                                 const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args)
    {
        Checks::msg_exit_with_message(li, format_filesystem_call_error(ec, call_name, args));
    }

    IgnoreErrors::operator std::error_code&() { return ec; }

    Path::Path(const StringView sv) : m_str(sv.to_string()) { }
    Path::Path(const std::string& s) : m_str(s) { }
    Path::Path(std::string&& s) : m_str(std::move(s)) { }
    Path::Path(const char* s) : m_str(s) { }
    Path::Path(const char* first, size_t size) : m_str(first, size) { }

    const std::string& Path::native() const& noexcept { return m_str; }
    Path::operator StringView() const noexcept { return m_str; }

    const char* Path::c_str() const noexcept { return m_str.c_str(); }

    bool Path::empty() const noexcept { return m_str.empty(); }

    Path Path::operator/(StringView sv) const&
    {
        Path result = *this;
        result /= sv;
        return result;
    }

    Path Path::operator/(StringView sv) &&
    {
        *this /= sv;
        return std::move(*this);
    }

    Path& Path::operator/=(StringView sv)
    {
        // an absolute right hand side replaces *this entirely
        if (is_absolute_path(sv))
        {
            m_str.assign(sv.data(), sv.size());
            return *this;
        }

        const char* my_first = m_str.data();
        const auto my_last = my_first + m_str.size();
        const auto my_root_name_end = find_root_name_end(my_first, my_last);
        // "C:" / "x" is "C:x"; "" / "x" is "x"
        if (my_root_name_end != my_last && !is_slash(my_last[-1]))
        {
            m_str.push_back(preferred_separator);
        }

        m_str.append(sv.data(), sv.size());
        return *this;
    }

    Path& Path::operator+=(StringView sv)
    {
        m_str.append(sv.data(), sv.size());
        return *this;
    }

    StringView Path::parent_path() const { return parse_parent_path(m_str); }

    StringView Path::filename() const
    {
        const auto first = m_str.data();
        const auto last = first + m_str.size();
        return StringView(find_filename(first, last), last);
    }

    bool Path::is_absolute() const { return is_absolute_path(m_str); }

    bool is_regular_file(FileType s) { return s == FileType::regular; }
    bool is_directory(FileType s) { return s == FileType::directory; }
    bool exists(FileType s) { return s != FileType::not_found && s != FileType::none; }

    FilePointer::FilePointer() noexcept : m_fs(nullptr) { }

    FilePointer::FilePointer(FilePointer&& other) noexcept : m_fs(other.m_fs) { other.m_fs = nullptr; }

    FilePointer::operator bool() const noexcept { return m_fs != nullptr; }

    std::error_code FilePointer::error() const noexcept
    {
        return std::error_code(::ferror(m_fs), std::generic_category());
    }

    void FilePointer::close() noexcept
    {
        if (m_fs)
        {
            Checks::check_exit(NODEBOOT_LINE_INFO, ::fclose(m_fs) == 0);
            m_fs = nullptr;
        }
    }

    FilePointer::~FilePointer() { this->close(); }

    WriteFilePointer::WriteFilePointer() noexcept = default;

    WriteFilePointer::WriteFilePointer(WriteFilePointer&&) noexcept = default;

    WriteFilePointer::WriteFilePointer(const Path& file_path, std::error_code& ec)
    {
        m_fs = open_file(file_path, "wb", ec);
        if (ec)
        {
            m_fs = nullptr;
        }
    }

    WriteFilePointer& WriteFilePointer::operator=(WriteFilePointer&& other) noexcept
    {
        close();
        m_fs = other.m_fs;
        other.m_fs = nullptr;
        return *this;
    }

    size_t WriteFilePointer::write(const void* buffer, size_t element_size, size_t element_count) const noexcept
    {
        return ::fwrite(buffer, element_size, element_count, m_fs);
    }

    FileType Filesystem::status(const Path& target, LineInfo li) const noexcept
    {
        std::error_code ec;
        auto result = this->status(target, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {target});
        }

        return result;
    }

    bool Filesystem::exists(const Path& target, std::error_code& ec) const
    {
        return nodeboot::exists(this->status(target, ec));
    }

    bool Filesystem::is_directory(const Path& target) const
    {
        return nodeboot::is_directory(this->status(target, IgnoreErrors{}));
    }

    bool Filesystem::is_regular_file(const Path& target) const
    {
        return nodeboot::is_regular_file(this->status(target, IgnoreErrors{}));
    }

    std::string Filesystem::read_contents(const Path& file_path, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->read_contents(file_path, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {file_path});
        }

        return result;
    }

    std::vector<Path> Filesystem::get_directories_non_recursive(const Path& dir, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->get_directories_non_recursive(dir, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {dir});
        }

        return result;
    }

    std::vector<Path> Filesystem::get_files_non_recursive(const Path& dir, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->get_files_non_recursive(dir, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {dir});
        }

        return result;
    }

    void Filesystem::write_contents(const Path& file_path, StringView data, LineInfo li) const
    {
        std::error_code ec;
        this->write_contents(file_path, data, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {file_path});
        }
    }

    bool Filesystem::remove(const Path& target, LineInfo li) const
    {
        std::error_code ec;
        auto r = this->remove(target, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {target});
        }

        return r;
    }

    void Filesystem::remove_all(const Path& base, std::error_code& ec) const
    {
        Path failure_point;
        this->remove_all(base, ec, failure_point);
    }

    void Filesystem::remove_all(const Path& base, LineInfo li) const
    {
        std::error_code ec;
        Path failure_point;

        this->remove_all(base, ec, failure_point);

        if (ec)
        {
            Checks::msg_exit_with_error(li,
                                        format_filesystem_call_error(ec, __func__, {base})
                                            .append_raw('\n')
                                            .append_raw(failure_point.native()));
        }
    }

    bool Filesystem::create_directories(const Path& new_directory, LineInfo li) const
    {
        std::error_code ec;
        bool result = this->create_directories(new_directory, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {new_directory});
        }

        return result;
    }

    bool Filesystem::create_directories(DiagnosticContext& context, const Path& new_directory) const
    {
        std::error_code ec;
        this->create_directories(new_directory, ec);
        if (ec)
        {
            context.report_error(format_filesystem_call_error(ec, __func__, {new_directory}));
            return false;
        }

        return true;
    }

    struct RealFilesystem final : Filesystem
    {
        virtual FileType status(const Path& target, std::error_code& ec) const override
        {
#if defined(_WIN32)
            auto result = convert_file_type(stdfs::status(to_stdfs_path(target), ec).type());
            if (result == FileType::not_found)
            {
                ec.clear();
            }

            return result;
#else  // ^^^ _WIN32 // !_WIN32 vvv
            struct stat s;
            if (::stat(target.c_str(), &s) == 0)
            {
                ec.clear();
                return posix_translate_stat_mode_to_file_type(s.st_mode);
            }

            if (is_not_found_errno_code(errno))
            {
                ec.clear();
                return FileType::not_found;
            }

            ec.assign(errno, std::generic_category());
            return FileType::unknown;
#endif // ^^^ !_WIN32
        }

        virtual std::string read_contents(const Path& file_path, std::error_code& ec) const override
        {
            std::string output;
            FILE* f = open_file(file_path, "rb", ec);
            if (ec)
            {
                return output;
            }

            char buffer[4096];
            for (;;)
            {
                const auto read_size = ::fread(buffer, 1, sizeof(buffer), f);
                output.append(buffer, read_size);
                if (read_size != sizeof(buffer))
                {
                    break;
                }
            }

            if (::ferror(f))
            {
                ec.assign(EIO, std::generic_category());
                output.clear();
            }

            Checks::check_exit(NODEBOOT_LINE_INFO, ::fclose(f) == 0);
            return output;
        }

        virtual std::vector<Path> get_directories_non_recursive(const Path& dir, std::error_code& ec) const override
        {
            return get_entries_non_recursive(
                dir, ec, [](FileType type) { return nodeboot::is_directory(type); });
        }

        virtual std::vector<Path> get_files_non_recursive(const Path& dir, std::error_code& ec) const override
        {
            return get_entries_non_recursive(
                dir, ec, [](FileType type) { return nodeboot::is_regular_file(type); });
        }

        virtual void write_contents(const Path& file_path, StringView data, std::error_code& ec) const override
        {
            auto f = open_for_write(file_path, ec);
            if (ec)
            {
                return;
            }

            if (f.write(data.data(), 1, data.size()) != data.size())
            {
                ec = f.error();
                if (!ec)
                {
                    ec.assign(EIO, std::generic_category());
                }
            }
        }

        virtual void rename(const Path& old_path, const Path& new_path, std::error_code& ec) const override
        {
#if defined(_WIN32)
            stdfs::rename(to_stdfs_path(old_path), to_stdfs_path(new_path), ec);
#else  // ^^^ _WIN32 // !_WIN32 vvv
            if (::rename(old_path.c_str(), new_path.c_str()) == 0)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }
#endif // ^^^ !_WIN32
        }

        virtual bool remove(const Path& target, std::error_code& ec) const override
        {
#if defined(_WIN32)
            return stdfs::remove(to_stdfs_path(target), ec);
#else  // ^^^ _WIN32 // !_WIN32 vvv
            if (::unlink(target.c_str()) == 0)
            {
                ec.clear();
                return true;
            }

            if (errno == ENOENT)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }

            return false;
#endif // ^^^ !_WIN32
        }

        virtual void remove_all(const Path& base, std::error_code& ec, Path& failure_point) const override
        {
#if defined(_WIN32)
            stdfs::remove_all(to_stdfs_path(base), ec);
            if (ec)
            {
                failure_point = base;
            }
#else  // ^^^ _WIN32 // !_WIN32 vvv
            nodeboot_remove_all(base, ec, failure_point);
#endif // ^^^ !_WIN32
        }

        virtual bool create_directories(const Path& new_directory, std::error_code& ec) const override
        {
#if defined(_WIN32)
            return stdfs::create_directories(to_stdfs_path(new_directory), ec);
#else  // ^^^ _WIN32 // !_WIN32 vvv
            if (new_directory.empty())
            {
                ec.clear();
                return false;
            }

            const auto type = this->status(new_directory, ec);
            if (ec)
            {
                return false;
            }

            if (type == FileType::directory)
            {
                return false;
            }

            const auto parent = new_directory.parent_path();
            if (!parent.empty() && parent.size() < new_directory.native().size())
            {
                this->create_directories(Path(parent), ec);
                if (ec)
                {
                    return false;
                }
            }

            if (::mkdir(new_directory.c_str(), 0777) == 0)
            {
                ec.clear();
                return true;
            }

            if (errno == EEXIST && nodeboot::is_directory(this->status(new_directory, IgnoreErrors{})))
            {
                // another process got there first
                ec.clear();
                return false;
            }

            ec.assign(errno, std::generic_category());
            return false;
#endif // ^^^ !_WIN32
        }

        virtual void set_executable(const Path& target, std::error_code& ec) const override
        {
#if defined(_WIN32)
            (void)target;
            ec.clear();
#else  // ^^^ _WIN32 // !_WIN32 vvv
            struct stat s;
            if (::stat(target.c_str(), &s) != 0 || ::chmod(target.c_str(), s.st_mode | S_IXUSR | S_IXGRP | S_IXOTH) != 0)
            {
                ec.assign(errno, std::generic_category());
                return;
            }

            ec.clear();
#endif // ^^^ !_WIN32
        }

        virtual WriteFilePointer open_for_write(const Path& file_path, std::error_code& ec) const override
        {
            return WriteFilePointer{file_path, ec};
        }

        struct ExclusiveFileLock : IExclusiveFileLock
        {
#if defined(_WIN32)
            HANDLE handle = INVALID_HANDLE_VALUE;
            stdfs::path native;
            ExclusiveFileLock(const Path& path, std::error_code& ec) : native(to_stdfs_path(path)) { ec.clear(); }

            bool lock_attempt(std::error_code& ec)
            {
                Checks::check_exit(NODEBOOT_LINE_INFO, handle == INVALID_HANDLE_VALUE);
                handle = CreateFileW(native.c_str(),
                                     GENERIC_READ,
                                     0 /* no sharing */,
                                     nullptr /* no security attributes */,
                                     OPEN_ALWAYS,
                                     FILE_ATTRIBUTE_NORMAL,
                                     nullptr /* no template file */);
                if (handle != INVALID_HANDLE_VALUE)
                {
                    ec.clear();
                    return true;
                }

                const auto err = GetLastError();
                if (err == ERROR_SHARING_VIOLATION)
                {
                    ec.clear();
                    return false;
                }

                ec.assign(err, std::system_category());
                return false;
            }

            ~ExclusiveFileLock() override
            {
                if (handle != INVALID_HANDLE_VALUE)
                {
                    const auto chresult = CloseHandle(handle);
                    Checks::check_exit(NODEBOOT_LINE_INFO, chresult != 0);
                }
            }
#else // ^^^ _WIN32 / !_WIN32 vvv
            PosixFd fd;
            bool locked = false;
            ExclusiveFileLock(const Path& path, std::error_code& ec)
                : fd(path.c_str(), O_RDWR | O_CREAT, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH, ec)
            {
            }

            bool lock_attempt(std::error_code& ec)
            {
                if (fd.flock(LOCK_EX | LOCK_NB) == 0)
                {
                    ec.clear();
                    locked = true;
                    return true;
                }

                if (errno == EWOULDBLOCK)
                {
                    ec.clear();
                    return false;
                }

                ec.assign(errno, std::generic_category());
                return false;
            }

            ~ExclusiveFileLock() override
            {
                if (locked)
                {
                    Checks::check_exit(NODEBOOT_LINE_INFO, fd && fd.flock(LOCK_UN) == 0);
                }
            }
#endif
        };

        virtual std::unique_ptr<IExclusiveFileLock> take_exclusive_file_lock(const Path& lockfile,
                                                                             MessageSink& status_sink,
                                                                             std::error_code& ec) const override
        {
            auto result = std::make_unique<ExclusiveFileLock>(lockfile, ec);
            if (!ec && !result->lock_attempt(ec) && !ec)
            {
                status_sink.println(msgWaitingToTakeFilesystemLock, msg::path = lockfile);
                do
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
                } while (!result->lock_attempt(ec) && !ec);
            }

            Debug::println("Took filesystem lock on ", lockfile);
            return std::move(result);
        }
    };

    static constexpr RealFilesystem real_filesystem_instance;
    const Filesystem& real_filesystem = real_filesystem_instance;

    TempDirectoryDeleter::TempDirectoryDeleter(const Filesystem& fs, const Path& path) : path(path), m_fs(fs) { }

    TempDirectoryDeleter::~TempDirectoryDeleter()
    {
        Debug::println("Removing ", path);
        m_fs.remove_all(path, IgnoreErrors{});
    }
}
