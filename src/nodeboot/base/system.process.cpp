#include <nodeboot/base/system-headers.h>

#include <nodeboot/base/checks.h>
#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/strings.h>
#include <nodeboot/base/system.debug.h>
#include <nodeboot/base/system.process.h>

#include <errno.h>
#include <stdio.h>
#include <string.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <utility>

#if !defined(_WIN32)
#include <spawn.h>

#include <sys/wait.h>

extern char** environ;
#endif

namespace
{
    using namespace nodeboot;

    std::atomic<int32_t> debug_id_counter{1000};

#if defined(_WIN32)
    void close_handle_mark_invalid(HANDLE& target) noexcept
    {
        auto to_close = std::exchange(target, INVALID_HANDLE_VALUE);
        if (to_close != INVALID_HANDLE_VALUE && to_close)
        {
            Checks::check_exit(NODEBOOT_LINE_INFO, CloseHandle(to_close));
        }
    }

    struct ProcessInfo : PROCESS_INFORMATION
    {
        ProcessInfo() noexcept : PROCESS_INFORMATION{INVALID_HANDLE_VALUE, INVALID_HANDLE_VALUE, 0, 0} { }
        ProcessInfo(const ProcessInfo&) = delete;
        ProcessInfo& operator=(const ProcessInfo&) = delete;
        ~ProcessInfo()
        {
            close_handle_mark_invalid(hThread);
            close_handle_mark_invalid(hProcess);
        }

        Optional<int> wait(DiagnosticContext& context)
        {
            close_handle_mark_invalid(hThread);
            if (WaitForSingleObject(hProcess, INFINITE) == WAIT_FAILED)
            {
                context.report_system_error("WaitForSingleObject", static_cast<int>(GetLastError()));
                return nullopt;
            }

            DWORD exit_code = 0;
            if (!GetExitCodeProcess(hProcess, &exit_code))
            {
                context.report_system_error("GetExitCodeProcess", static_cast<int>(GetLastError()));
                return nullopt;
            }

            close_handle_mark_invalid(hProcess);
            return static_cast<int>(exit_code);
        }
    };
#else  // ^^^ _WIN32 // !_WIN32 vvv
    struct PosixPid
    {
        pid_t pid;

        PosixPid() : pid{-1} { }

        Optional<int> wait_for_termination(DiagnosticContext& context)
        {
            int exit_code = -1;
            if (pid != -1)
            {
                int status;
                pid_t child;
                do
                {
                    child = waitpid(pid, &status, 0);
                } while (child == -1 && errno == EINTR);
                if (child != pid)
                {
                    context.report_system_error("waitpid", errno);
                    return nullopt;
                }

                if (WIFEXITED(status))
                {
                    exit_code = WEXITSTATUS(status);
                }
                else if (WIFSIGNALED(status))
                {
                    // shell convention
                    exit_code = 128 + WTERMSIG(status);
                }

                pid = -1;
            }

            return exit_code;
        }

        PosixPid(const PosixPid&) = delete;
        PosixPid& operator=(const PosixPid&) = delete;
    };
#endif // ^^^ !_WIN32

    Optional<int> cmd_execute_impl(DiagnosticContext& context,
                                   const Command& cmd,
                                   const ProcessLaunchSettings& settings,
                                   const int32_t debug_id)
    {
#if defined(_WIN32)
        Debug::print(fmt::format("{}: CreateProcessW({})\n", debug_id, cmd.command_line()));

        // Flush stdout before launching external process
        fflush(nullptr);

        Optional<std::wstring> working_directory_wide =
            settings.working_directory.map([](const Path& wd) { return Strings::to_utf16(wd); });
        LPCWSTR working_directory_arg = nullptr;
        if (auto wd = working_directory_wide.get())
        {
            working_directory_arg = wd->c_str();
        }

        STARTUPINFOW startup_info;
        memset(&startup_info, 0, sizeof(STARTUPINFOW));
        startup_info.cb = sizeof(STARTUPINFOW);

        ProcessInfo process_info;
        auto command_line = Strings::to_utf16(cmd.command_line());
        if (!CreateProcessW(nullptr,
                            command_line.data(),
                            nullptr,
                            nullptr,
                            TRUE,
                            CREATE_UNICODE_ENVIRONMENT,
                            nullptr,
                            working_directory_arg,
                            &startup_info,
                            &process_info))
        {
            context.report_system_error("CreateProcessW", static_cast<int>(GetLastError()));
            return nullopt;
        }

        return process_info.wait(context);
#else  // ^^^ _WIN32 // !_WIN32 vvv
        Command real_command_line_builder;
        if (const auto wd = settings.working_directory.get())
        {
            real_command_line_builder.string_arg("cd");
            real_command_line_builder.string_arg(*wd);
            real_command_line_builder.raw_arg("&&");
        }

        real_command_line_builder.raw_arg(cmd.command_line());

        std::string real_command_line = std::move(real_command_line_builder).extract();
        Debug::print(fmt::format("{}: posix_spawn(/bin/sh -c {})\n", debug_id, real_command_line));
        fflush(nullptr);

        std::string arg0 = "/bin/sh";
        std::string arg1 = "-c";
        char* argv[] = {arg0.data(), arg1.data(), real_command_line.data(), nullptr};

        PosixPid pid;
        const int error = posix_spawn(&pid.pid, "/bin/sh", nullptr /*file_actions*/, nullptr /*attrp*/, argv, environ);
        if (error)
        {
            context.report_system_error("posix_spawn", error);
            return nullopt;
        }

        return pid.wait_for_termination(context);
#endif // ^^^ !_WIN32
    }
}

namespace nodeboot
{
    void append_shell_escaped(std::string& target, StringView content)
    {
        static constexpr StringLiteral special_characters = " \t\n\r\"\\`$,;&^|'()<>*?";
        if (content.empty())
        {
            target.append("\"\"");
        }
        else if (std::find_first_of(content.begin(),
                                    content.end(),
                                    special_characters.begin(),
                                    special_characters.end()) != content.end())
        {
#if _WIN32
            // On Windows, `\`s before a double-quote must be doubled. Inner double-quotes must be escaped.
            target.push_back('"');
            size_t n_slashes = 0;
            for (auto ch : content)
            {
                if (ch == '\\')
                {
                    ++n_slashes;
                }
                else if (ch == '"')
                {
                    target.append(n_slashes + 1, '\\');
                    n_slashes = 0;
                }
                else
                {
                    n_slashes = 0;
                }
                target.push_back(ch);
            }
            target.append(n_slashes, '\\');
            target.push_back('"');
#else
            // On non-Windows, `\` is the escape character and always requires doubling. Inner double-quotes must be
            // escaped. Additionally, '`' and '$' must be escaped or they will retain their special meaning in the
            // shell.
            target.push_back('"');
            for (auto ch : content)
            {
                if (ch == '\\' || ch == '"' || ch == '`' || ch == '$') target.push_back('\\');
                target.push_back(ch);
            }
            target.push_back('"');
#endif
        }
        else
        {
            target.append(content.data(), content.size());
        }
    }

    Command& Command::string_arg(StringView s) &
    {
        if (!buf.empty()) buf.push_back(' ');
        append_shell_escaped(buf, s);
        return *this;
    }

    Command& Command::raw_arg(StringView s) &
    {
        if (!buf.empty())
        {
            buf.push_back(' ');
        }

        buf.append(s.data(), s.size());
        return *this;
    }

    Command& Command::forwarded_args(const std::vector<std::string>& args) &
    {
        for (auto&& arg : args)
        {
            string_arg(arg);
        }

        return *this;
    }

    Optional<int> cmd_execute(DiagnosticContext& context, const Command& cmd)
    {
        ProcessLaunchSettings default_process_launch_settings;
        return cmd_execute(context, cmd, default_process_launch_settings);
    }

    Optional<int> cmd_execute(DiagnosticContext& context, const Command& cmd, const ProcessLaunchSettings& settings)
    {
        const auto debug_id = debug_id_counter.fetch_add(1, std::memory_order_relaxed);
        auto maybe_exit_code = cmd_execute_impl(context, cmd, settings, debug_id);
        if (auto exit_code = maybe_exit_code.get())
        {
            Debug::print(fmt::format("{}: child process returned {}\n", debug_id, *exit_code));
        }
        else
        {
            Debug::print(fmt::format("{}: cmd_execute() failed to launch child process\n", debug_id));
        }

        return maybe_exit_code;
    }
}
