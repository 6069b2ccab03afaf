#pragma once

#if defined(_MSC_VER)
#include <sal.h>
#endif

#define Z_NODEBOOT_PRAGMA(PRAGMA) _Pragma(#PRAGMA)

#if defined(_MSC_VER)
#define NODEBOOT_SAL_ANNOTATION(...) __VA_ARGS__
#else
#define NODEBOOT_SAL_ANNOTATION(...)
#endif

#if defined(__clang__)
// check clang first because it may define _MSC_VER
#define NODEBOOT_MSVC_WARNING(...)
#define NODEBOOT_GCC_DIAGNOSTIC(...)
#define NODEBOOT_CLANG_DIAGNOSTIC(DIAGNOSTIC) Z_NODEBOOT_PRAGMA(clang diagnostic DIAGNOSTIC)
#elif defined(_MSC_VER)
#define NODEBOOT_MSVC_WARNING(...) Z_NODEBOOT_PRAGMA(warning(__VA_ARGS__))
#define NODEBOOT_GCC_DIAGNOSTIC(...)
#define NODEBOOT_CLANG_DIAGNOSTIC(...)
#else
// gcc
#define NODEBOOT_MSVC_WARNING(...)
#define NODEBOOT_GCC_DIAGNOSTIC(DIAGNOSTIC) Z_NODEBOOT_PRAGMA(GCC diagnostic DIAGNOSTIC)
#define NODEBOOT_CLANG_DIAGNOSTIC(DIAGNOSTIC)
#endif
