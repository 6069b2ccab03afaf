#pragma once

#include <nodeboot/base/fwd/diagnostics.h>
#include <nodeboot/base/fwd/files.h>

#include <nodeboot/base/checks.h>
#include <nodeboot/base/expected.h>
#include <nodeboot/base/lineinfo.h>
#include <nodeboot/base/message_sinks.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/path.h>
#include <nodeboot/base/stringview.h>

#include <stdio.h>

#include <initializer_list>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace nodeboot
{
    LocalizedString format_filesystem_call_error(const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args);
    [[noreturn]] void exit_filesystem_call_error(LineInfo li,
                                                 const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args);
    struct IgnoreErrors
    {
        operator std::error_code&();

    private:
        std::error_code ec;
    };

    struct IsSlash
    {
        bool operator()(const char c) const noexcept
        {
            return c == '/'
#if defined(_WIN32)
                   || c == '\\'
#endif // _WIN32
                ;
        }
    };

    bool is_regular_file(FileType s);
    bool is_directory(FileType s);
    bool exists(FileType s);

    struct FilePointer
    {
    protected:
        FILE* m_fs;

    public:
        FilePointer() noexcept;

        FilePointer(const FilePointer&) = delete;
        FilePointer(FilePointer&& other) noexcept;
        FilePointer& operator=(const FilePointer&) = delete;
        explicit operator bool() const noexcept;

        std::error_code error() const noexcept;

        void close() noexcept;

        ~FilePointer();
    };

    struct WriteFilePointer : FilePointer
    {
        WriteFilePointer() noexcept;
        WriteFilePointer(WriteFilePointer&&) noexcept;
        explicit WriteFilePointer(const Path& file_path, std::error_code& ec);
        WriteFilePointer& operator=(WriteFilePointer&& other) noexcept;
        size_t write(const void* buffer, size_t element_size, size_t element_count) const noexcept;
    };

    struct IExclusiveFileLock
    {
        virtual ~IExclusiveFileLock() = default;
    };

    struct Filesystem
    {
        virtual FileType status(const Path& target, std::error_code& ec) const = 0;
        FileType status(const Path& target, LineInfo li) const noexcept;

        bool exists(const Path& target, std::error_code& ec) const;
        bool is_directory(const Path& target) const;
        bool is_regular_file(const Path& target) const;

        virtual std::string read_contents(const Path& file_path, std::error_code& ec) const = 0;
        std::string read_contents(const Path& file_path, LineInfo li) const;

        // Returns the directories directly inside `dir`, sorted by name.
        virtual std::vector<Path> get_directories_non_recursive(const Path& dir, std::error_code& ec) const = 0;
        std::vector<Path> get_directories_non_recursive(const Path& dir, LineInfo li) const;

        virtual std::vector<Path> get_files_non_recursive(const Path& dir, std::error_code& ec) const = 0;
        std::vector<Path> get_files_non_recursive(const Path& dir, LineInfo li) const;

        virtual void write_contents(const Path& file_path, StringView data, std::error_code& ec) const = 0;
        void write_contents(const Path& file_path, StringView data, LineInfo li) const;

        virtual void rename(const Path& old_path, const Path& new_path, std::error_code& ec) const = 0;

        virtual bool remove(const Path& target, std::error_code& ec) const = 0;
        bool remove(const Path& target, LineInfo li) const;

        virtual void remove_all(const Path& base, std::error_code& ec, Path& failure_point) const = 0;
        void remove_all(const Path& base, std::error_code& ec) const;
        void remove_all(const Path& base, LineInfo li) const;

        // Creates `new_directory` and any missing parents; returns whether the leaf was created.
        virtual bool create_directories(const Path& new_directory, std::error_code& ec) const = 0;
        bool create_directories(const Path& new_directory, LineInfo li) const;

        // Returns false and reports to `context` on failure.
        bool create_directories(DiagnosticContext& context, const Path& new_directory) const;

        virtual void set_executable(const Path& target, std::error_code& ec) const = 0;

        virtual WriteFilePointer open_for_write(const Path& file_path, std::error_code& ec) const = 0;

        // Blocks until the advisory lock on `lockfile` is held, printing a waiting notice to `status_sink` once.
        virtual std::unique_ptr<IExclusiveFileLock> take_exclusive_file_lock(const Path& lockfile,
                                                                             MessageSink& status_sink,
                                                                             std::error_code& ec) const = 0;

    protected:
        ~Filesystem() = default;
    };

    extern const Filesystem& real_filesystem;

    // Removes `path` and everything under it when destroyed.
    struct TempDirectoryDeleter
    {
        TempDirectoryDeleter(const Filesystem& fs, const Path& path);
        TempDirectoryDeleter(const TempDirectoryDeleter&) = delete;
        TempDirectoryDeleter& operator=(const TempDirectoryDeleter&) = delete;
        ~TempDirectoryDeleter();

        const Path path;

    private:
        const Filesystem& m_fs;
    };
}
