#include <nodeboot/base/system-headers.h>

#include <nodeboot/base/checks.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/stringview.h>
#include <nodeboot/base/system.debug.h>

#include <stdio.h>
#include <stdlib.h>

#include <atomic>

namespace
{
    using namespace nodeboot;

    LocalizedString locale_invariant_lineinfo(const LineInfo& line_info)
    {
        return LocalizedString::from_raw(fmt::format("{}: ", line_info));
    }
}

std::string nodeboot::LineInfo::to_string() const { return fmt::format("{}({})", file_name, line_number); }

namespace nodeboot
{
    [[noreturn]] void Checks::final_cleanup_and_exit(const int exit_code)
    {
        static std::atomic<bool> have_entered{false};
        if (have_entered.exchange(true))
        {
#if defined(_WIN32)
            ::TerminateProcess(::GetCurrentProcess(), exit_code);
#else
            std::abort();
#endif
        }

        fflush(nullptr);

#if defined(_WIN32)
        ::TerminateProcess(::GetCurrentProcess(), exit_code);
#endif
        std::exit(exit_code);
    }

    [[noreturn]] void Checks::unreachable(const LineInfo& line_info)
    {
        msg::write_unlocalized_text_to_stderr(
            Color::error, locale_invariant_lineinfo(line_info).append(msgChecksUnreachableCode).append_raw('\n'));
#ifndef NDEBUG
        std::abort();
#else
        final_cleanup_and_exit(EXIT_FAILURE);
#endif
    }

    [[noreturn]] void Checks::unreachable(const LineInfo& line_info, StringView message)
    {
        msg::write_unlocalized_text_to_stderr(
            Color::error, locale_invariant_lineinfo(line_info).append_raw(message).append_raw('\n'));
#ifndef NDEBUG
        std::abort();
#else
        final_cleanup_and_exit(EXIT_FAILURE);
#endif
    }

    [[noreturn]] void Checks::exit_with_code(const LineInfo& line_info, const int exit_code)
    {
        Debug::println(locale_invariant_lineinfo(line_info), "exiting with code ", exit_code);
        final_cleanup_and_exit(exit_code);
    }

    [[noreturn]] void Checks::exit_fail(const LineInfo& line_info) { exit_with_code(line_info, EXIT_FAILURE); }

    [[noreturn]] void Checks::msg_exit_with_message(const LineInfo& line_info, const LocalizedString& error_message)
    {
        msg::println(Color::error, error_message);
        exit_fail(line_info);
    }

    void Checks::check_exit(const LineInfo& line_info, bool expression)
    {
        if (!expression)
        {
            msg::write_unlocalized_text_to_stderr(Color::error,
                                                  internal_error_prefix()
                                                      .append(locale_invariant_lineinfo(line_info))
                                                      .append(msgChecksFailedCheck)
                                                      .append_raw('\n'));
            exit_fail(line_info);
        }
    }

    void Checks::check_exit(const LineInfo& line_info, bool expression, StringView error_message)
    {
        if (!expression)
        {
            msg::write_unlocalized_text_to_stderr(Color::error,
                                                  internal_error_prefix()
                                                      .append(locale_invariant_lineinfo(line_info))
                                                      .append_raw(error_message)
                                                      .append_raw('\n'));
            exit_fail(line_info);
        }
    }
}
