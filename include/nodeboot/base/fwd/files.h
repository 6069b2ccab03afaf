#pragma once

#if defined(_WIN32)
#define NODEBOOT_PREFERRED_SEPARATOR "\\"
#else // ^^^ _WIN32 / !_WIN32 vvv
#define NODEBOOT_PREFERRED_SEPARATOR "/"
#endif // _WIN32

namespace nodeboot
{
    enum class FileType
    {
        none,
        not_found,
        regular,
        directory,
        symlink,

        block,
        character,

        fifo,
        socket,
        unknown,

        junction // implementation-defined value indicating an NT junction
    };

    struct IgnoreErrors;
    struct Path;
    struct FilePointer;
    struct WriteFilePointer;
    struct IExclusiveFileLock;
    struct Filesystem;
    struct TempDirectoryDeleter;
}
