#include <nodeboot/base/system-headers.h>

#include <nodeboot/base/checks.h>
#include <nodeboot/base/contractual-constants.h>
#include <nodeboot/base/expected.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/optional.h>
#include <nodeboot/base/strings.h>
#include <nodeboot/base/system.debug.h>
#include <nodeboot/base/system.h>

#include <stdlib.h>

#if defined(_WIN32)
#include <process.h>
#else
#include <sys/utsname.h>
#endif

namespace nodeboot
{
    Optional<std::string> get_environment_variable(ZStringView varname) noexcept
    {
#if defined(_WIN32)
        const auto w_varname = Strings::to_utf16(varname);
        const auto sz = GetEnvironmentVariableW(w_varname.c_str(), nullptr, 0);
        if (sz == 0) return nullopt;

        std::wstring ret(sz, L'\0');

        Checks::check_exit(NODEBOOT_LINE_INFO, MAXDWORD >= ret.size());
        const auto sz2 = GetEnvironmentVariableW(w_varname.c_str(), ret.data(), static_cast<DWORD>(ret.size()));
        Checks::check_exit(NODEBOOT_LINE_INFO, sz2 + 1 == sz);
        ret.pop_back();
        return Strings::to_utf8(ret.c_str());
#else
        auto v = getenv(varname.c_str());
        if (!v) return nullopt;
        return std::string(v);
#endif
    }

    void set_environment_variable(ZStringView varname, Optional<ZStringView> value) noexcept
    {
#if defined(_WIN32)
        const auto w_varname = Strings::to_utf16(varname);
        const auto w_varcstr = w_varname.c_str();
        BOOL exit_code;
        if (auto v = value.get())
        {
            exit_code = SetEnvironmentVariableW(w_varcstr, Strings::to_utf16(*v).c_str());
        }
        else
        {
            exit_code = SetEnvironmentVariableW(w_varcstr, nullptr);
        }

        Checks::check_exit(NODEBOOT_LINE_INFO, exit_code != 0);
#else  // ^^^ defined(_WIN32) / !defined(_WIN32) vvv
        if (auto v = value.get())
        {
            Checks::check_exit(NODEBOOT_LINE_INFO, setenv(varname.c_str(), v->c_str(), 1) == 0);
        }
        else
        {
            Checks::check_exit(NODEBOOT_LINE_INFO, unsetenv(varname.c_str()) == 0);
        }
#endif // defined(_WIN32)
    }

    const ExpectedL<Path>& get_home_dir() noexcept
    {
        static ExpectedL<Path> s_home = []() -> ExpectedL<Path> {
#ifdef _WIN32
            constexpr StringLiteral HOMEVAR = EnvironmentVariableUserprofile;
#else  // ^^^ _WIN32 // !_WIN32 vvv
            constexpr StringLiteral HOMEVAR = EnvironmentVariableHome;
#endif // ^^^ !_WIN32

            auto maybe_home = get_environment_variable(HOMEVAR);
            if (!maybe_home.has_value() || maybe_home.get()->empty())
            {
                return msg::format(msgHomeDirectoryNotFound, msg::env_var = format_environment_variable(HOMEVAR));
            }

            Path p = std::move(*maybe_home.get());
            if (!p.is_absolute())
            {
                return msg::format(
                    msgEnvVarMustBeAbsolutePath, msg::path = p, msg::env_var = format_environment_variable(HOMEVAR));
            }

            return p;
        }();

        return s_home;
    }

    long get_process_id()
    {
#ifdef _WIN32
        return ::_getpid();
#else
        return ::getpid();
#endif // ^^^ !_WIN32
    }

    std::string get_host_os_name()
    {
#if defined(_WIN32)
        return "windows";
#elif defined(__APPLE__)
        return "darwin";
#elif defined(__linux__)
        return "linux";
#else
        struct utsname name;
        if (::uname(&name) != 0)
        {
            return "unknown";
        }

        return Strings::ascii_to_lowercase(name.sysname);
#endif
    }

    std::string get_host_machine_name()
    {
#if defined(_WIN32)
        // a 32-bit process on 64-bit Windows sees the emulated architecture in PROCESSOR_ARCHITECTURE
        auto maybe_arch = get_environment_variable(EnvironmentVariableProcessorArchiteW6432);
        if (!maybe_arch.has_value())
        {
            maybe_arch = get_environment_variable(EnvironmentVariableProcessorArchitecture);
        }

        return std::move(maybe_arch).value_or(std::string());
#else  // ^^^ _WIN32 // !_WIN32 vvv
        struct utsname name;
        if (::uname(&name) != 0)
        {
            Debug::println("uname() failed; assuming x86_64");
            return "x86_64";
        }

        return name.machine;
#endif // ^^^ !_WIN32
    }
}

namespace nodeboot::Debug
{
    std::atomic<bool> g_debugging(false);
}
