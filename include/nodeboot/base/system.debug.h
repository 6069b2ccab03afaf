#pragma once

#include <nodeboot/base/fwd/messages.h>

#include <nodeboot/base/lineinfo.h>
#include <nodeboot/base/strings.h>

#include <atomic>

namespace nodeboot::Debug
{
    extern std::atomic<bool> g_debugging;

    template<class... Args>
    void print(const Args&... args)
    {
        if (g_debugging) msg::write_unlocalized_text(Color::none, Strings::concat("[DEBUG] ", args...));
    }
    template<class... Args>
    void println(const Args&... args)
    {
        if (g_debugging) msg::write_unlocalized_text(Color::none, Strings::concat("[DEBUG] ", args..., '\n'));
    }
}
