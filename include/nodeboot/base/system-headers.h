#pragma once

#if defined(_WIN32)

#ifndef NOMINMAX
#define NOMINMAX
#endif

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif

#include <windows.h>

#else // ^^^^ Windows / Unix vvvv

#include <unistd.h>

#include <sys/types.h>
// glibc defines major and minor in sys/types.h, and should not
#undef major
#undef minor
#endif // ^^^ Unix
