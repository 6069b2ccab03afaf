#include <nodeboot/base/system-headers.h>

#include <nodeboot/base/checks.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/strings.h>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>
#include <vector>

using namespace nodeboot;

namespace nodeboot
{
    LocalizedString::operator StringView() const noexcept { return m_data; }
    const std::string& LocalizedString::data() const noexcept { return m_data; }
    const std::string& LocalizedString::to_string() const noexcept { return m_data; }

    template<class T, std::enable_if_t<std::is_same<char, T>::value, int>>
    LocalizedString LocalizedString::from_raw(std::basic_string<T>&& s) noexcept
    {
        return LocalizedString(std::move(s));
    }
    template LocalizedString LocalizedString::from_raw<char>(std::basic_string<char>&& s) noexcept;
    LocalizedString LocalizedString::from_raw(StringView s) { return LocalizedString(s); }

    LocalizedString& LocalizedString::append_raw(char c) &
    {
        m_data.push_back(c);
        return *this;
    }

    LocalizedString&& LocalizedString::append_raw(char c) && { return std::move(append_raw(c)); }

    LocalizedString& LocalizedString::append_raw(StringView s) &
    {
        m_data.append(s.begin(), s.size());
        return *this;
    }

    LocalizedString&& LocalizedString::append_raw(StringView s) && { return std::move(append_raw(s)); }

    LocalizedString& LocalizedString::append(const LocalizedString& s) &
    {
        m_data.append(s.m_data);
        return *this;
    }

    LocalizedString&& LocalizedString::append(const LocalizedString& s) && { return std::move(append(s)); }

    LocalizedString& LocalizedString::append_indent(size_t indent) &
    {
        m_data.append(indent * 2, ' ');
        return *this;
    }

    LocalizedString&& LocalizedString::append_indent(size_t indent) && { return std::move(append_indent(indent)); }

    bool operator==(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
    {
        return lhs.data() == rhs.data();
    }

    bool operator!=(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
    {
        return lhs.data() != rhs.data();
    }

    bool LocalizedString::empty() const noexcept { return m_data.empty(); }
    void LocalizedString::clear() noexcept { m_data.clear(); }

    LocalizedString::LocalizedString(StringView data) : m_data(data.data(), data.size()) { }
    LocalizedString::LocalizedString(std::string&& data) noexcept : m_data(std::move(data)) { }

    LocalizedString format_environment_variable(StringView variable_name)
    {
#if defined(_WIN32)
        return LocalizedString::from_raw(fmt::format("%{}%", variable_name));
#else  // ^^^ _WIN32 / !_WIN32 vvv
        return LocalizedString::from_raw(fmt::format("${}", variable_name));
#endif // ^^^ !_WIN32
    }

    LocalizedString error_prefix() { return LocalizedString::from_raw(ErrorPrefix); }
    LocalizedString internal_error_prefix() { return LocalizedString::from_raw(InternalErrorPrefix); }
}

#define DECLARE_MSG_ARG(NAME, EXAMPLE) const StringLiteral nodeboot::msg::NAME##_t::name = #NAME;
#include <nodeboot/base/message-args.inc.h>
#undef DECLARE_MSG_ARG

namespace nodeboot
{
    namespace
    {
        struct MessageData
        {
            StringLiteral name;
            const char* comment;
            StringLiteral builtin_message;
        };

        constexpr MessageData message_data[] = {
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...) {#NAME, COMMENT, __VA_ARGS__},
#include <nodeboot/base/message-data.inc.h>
#undef DECLARE_MESSAGE
        };

        enum class message_index
        {
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...) NAME,
#include <nodeboot/base/message-data.inc.h>
#undef DECLARE_MESSAGE
        };
    }

    namespace msg::detail
    {
        static constexpr const size_t number_of_messages = std::size(message_data);
    }

    namespace msg
    {
        std::vector<RawMessage> get_sorted_english_messages()
        {
            std::vector<RawMessage> messages;
            messages.reserve(detail::number_of_messages);
            for (auto&& data : message_data)
            {
                messages.push_back(RawMessage{data.name, data.builtin_message});
            }

            std::sort(messages.begin(), messages.end(), [](const RawMessage& lhs, const RawMessage& rhs) {
                return lhs.name < rhs.name;
            });
            return messages;
        }

        void detail::format_message_by_index_to(LocalizedString& s, size_t index, fmt::format_args args)
        {
            if (index >= detail::number_of_messages) Checks::unreachable(NODEBOOT_LINE_INFO);
            const auto default_format_string = message_data[index].builtin_message;
            try
            {
                fmt::vformat_to(
                    std::back_inserter(s.m_data), {default_format_string.data(), default_format_string.size()}, args);
                return;
            }
            catch (const fmt::format_error&)
            {
            }
            msg::write_unlocalized_text_to_stderr(
                Color::error,
                fmt::format("INTERNAL ERROR: failed to format default format string for index {}\nformat string: {}\n",
                            index,
                            default_format_string));
            Checks::exit_fail(NODEBOOT_LINE_INFO);
        }

        LocalizedString detail::format_message_by_index(size_t index, fmt::format_args args)
        {
            LocalizedString s;
            format_message_by_index_to(s, index, args);
            return s;
        }
    }

#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...)                                                                      \
    const decltype(::nodeboot::msg::detail::make_message_base ARGS) msg##NAME{static_cast<size_t>(message_index::NAME)};

#include <nodeboot/base/message-data.inc.h>
#undef DECLARE_MESSAGE
}

namespace nodeboot::msg
{
#if defined(_WIN32)
    static bool is_console(HANDLE h)
    {
        DWORD mode = 0;
        // GetConsoleMode succeeds iff `h` is a console
        // we do not actually care about the mode of the console
        return GetConsoleMode(h, &mode);
    }

    static void check_write(BOOL success)
    {
        if (!success)
        {
            ::fwprintf(stderr, L"[DEBUG] Failed to write to console: %lu\n", GetLastError());
            std::abort();
        }
    }
    static DWORD size_to_write(::size_t size) { return size > MAXDWORD ? MAXDWORD : static_cast<DWORD>(size); }

    static void write_unlocalized_text_impl(Color c, StringView sv, HANDLE the_handle, bool is_console)
    {
        if (sv.empty()) return;

        if (is_console)
        {
            WORD original_color = 0;
            if (c != Color::none)
            {
                CONSOLE_SCREEN_BUFFER_INFO console_screen_buffer_info{};
                ::GetConsoleScreenBufferInfo(the_handle, &console_screen_buffer_info);
                original_color = console_screen_buffer_info.wAttributes;
                ::SetConsoleTextAttribute(the_handle, static_cast<WORD>(c) | (original_color & 0xF0));
            }

            auto as_wstr = Strings::to_utf16(sv);

            const wchar_t* pointer = as_wstr.data();
            ::size_t size = as_wstr.size();

            while (size != 0)
            {
                DWORD written = 0;
                check_write(::WriteConsoleW(the_handle, pointer, size_to_write(size), &written, nullptr));
                pointer += written;
                size -= written;
            }

            if (c != Color::none)
            {
                ::SetConsoleTextAttribute(the_handle, original_color);
            }
        }
        else
        {
            const char* pointer = sv.data();
            ::size_t size = sv.size();

            while (size != 0)
            {
                DWORD written = 0;
                check_write(::WriteFile(the_handle, pointer, size_to_write(size), &written, nullptr));
                pointer += written;
                size -= written;
            }
        }
    }

    void write_unlocalized_text_to_stderr(Color c, StringView sv)
    {
        static const HANDLE stderr_handle = ::GetStdHandle(STD_ERROR_HANDLE);
        static const bool stderr_is_console = is_console(stderr_handle);
        return write_unlocalized_text_impl(c, sv, stderr_handle, stderr_is_console);
    }
#else
    static void write_all(const char* ptr, size_t to_write, int fd)
    {
        while (to_write != 0)
        {
            auto written = ::write(fd, ptr, to_write);
            if (written == -1)
            {
                if (errno == EINTR) continue;
                ::fprintf(stderr, "[DEBUG] Failed to write to fd %d: %d\n", fd, errno);
                std::abort();
            }
            ptr += written;
            to_write -= written;
        }
    }

    static void write_unlocalized_text_impl(Color c, StringView sv, int fd, bool is_a_tty)
    {
        static constexpr char reset_color_sequence[] = {'\033', '[', '0', 'm'};

        if (sv.empty()) return;

        bool reset_color = false;
        if (is_a_tty && c != Color::none)
        {
            reset_color = true;

            const char set_color_sequence[] = {'\033', '[', '9', static_cast<char>(c), 'm'};
            write_all(set_color_sequence, sizeof(set_color_sequence), fd);
        }

        write_all(sv.data(), sv.size(), fd);

        if (reset_color)
        {
            write_all(reset_color_sequence, sizeof(reset_color_sequence), fd);
        }
    }

    void write_unlocalized_text_to_stderr(Color c, StringView sv)
    {
        static bool is_a_tty = ::isatty(STDERR_FILENO);
        return write_unlocalized_text_impl(c, sv, STDERR_FILENO, is_a_tty);
    }
#endif

    void write_unlocalized_text(Color c, StringView sv) { write_unlocalized_text_to_stderr(c, sv); }
}
