#pragma once

#include <nodeboot/base/fwd/diagnostics.h>

#include <nodeboot/base/optional.h>
#include <nodeboot/base/path.h>
#include <nodeboot/base/stringview.h>

#include <string>
#include <vector>

namespace nodeboot
{
    void append_shell_escaped(std::string& target, StringView content);

    struct Command
    {
        Command() = default;
        explicit Command(StringView s) { string_arg(s); }

        Command& string_arg(StringView s) &;
        Command& raw_arg(StringView s) &;
        Command& forwarded_args(const std::vector<std::string>& args) &;
        Command&& string_arg(StringView s) && { return std::move(string_arg(s)); };
        Command&& raw_arg(StringView s) && { return std::move(raw_arg(s)); }
        Command&& forwarded_args(const std::vector<std::string>& args) &&
        {
            return std::move(forwarded_args(args));
        }

        std::string&& extract() && { return std::move(buf); }
        StringView command_line() const { return buf; }

        void clear() { buf.clear(); }
        bool empty() const { return buf.empty(); }

    private:
        std::string buf;
    };

    struct ProcessLaunchSettings
    {
        Optional<Path> working_directory;
    };

    // Runs `cmd` with the standard streams inherited and waits for it to exit. Returns the child's exit code; a child
    // terminated by a signal reports 128 + the signal number. Returns nullopt, after reporting to `context`, if the
    // child could not be launched or waited for.
    Optional<int> cmd_execute(DiagnosticContext& context, const Command& cmd);
    Optional<int> cmd_execute(DiagnosticContext& context, const Command& cmd, const ProcessLaunchSettings& settings);
}
