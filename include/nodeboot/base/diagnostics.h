#pragma once

#include <nodeboot/base/fwd/diagnostics.h>

#include <nodeboot/base/expected.h>
#include <nodeboot/base/message_sinks.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/optional.h>

#include <string>
#include <type_traits>
#include <vector>

namespace nodeboot
{
    struct DiagnosticLine
    {
        template<class MessageLike, std::enable_if_t<std::is_convertible_v<MessageLike, LocalizedString>, int> = 0>
        DiagnosticLine(DiagKind kind, MessageLike&& message)
            : m_kind(kind), m_origin(), m_message(std::forward<MessageLike>(message))
        {
        }

        template<class MessageLike, std::enable_if_t<std::is_convertible_v<MessageLike, LocalizedString>, int> = 0>
        DiagnosticLine(DiagKind kind, StringView origin, MessageLike&& message)
            : m_kind(kind), m_origin(origin.to_string()), m_message(std::forward<MessageLike>(message))
        {
            if (origin.empty())
            {
                Checks::unreachable(NODEBOOT_LINE_INFO, "origin must not be empty");
            }
        }

        // Prints this diagnostic to the supplied sink.
        void print_to(MessageSink& sink) const;
        // Converts this message into a string
        // Prefer print() if possible because it applies color
        std::string to_string() const;
        void to_string(std::string& target) const;

        DiagKind kind() const noexcept { return m_kind; }

    private:
        DiagKind m_kind;
        Optional<std::string> m_origin;
        LocalizedString m_message;
    };

    struct DiagnosticContext
    {
        // The `report` family are used to report errors or warnings that may result in a function failing
        // to do what it is intended to do. Data sent to the `report` family is expected to not be printed
        // to the console if a caller decides to handle an error.
        virtual void report(const DiagnosticLine& line) = 0;
        virtual void report(DiagnosticLine&& line);

        void report_error(const LocalizedString& message) { report(DiagnosticLine{DiagKind::Error, message}); }
        void report_error(LocalizedString&& message) { report(DiagnosticLine{DiagKind::Error, std::move(message)}); }
        template<NODEBOOT_DECL_MSG_TEMPLATE>
        void report_error(NODEBOOT_DECL_MSG_ARGS)
        {
            LocalizedString message;
            msg::format_to(message, NODEBOOT_EXPAND_MSG_ARGS);
            this->report_error(std::move(message));
        }

        void report_system_error(StringLiteral system_api_name, int error_value);

        // The `status` family are used to report status or progress information that callers are expected
        // to show on the console, even if it would decide to handle errors or warnings itself.
        // Examples:
        //  * "Downloading Node.js from https://..."
        //  * "Extracting node.tar.xz..."
        virtual void statusln(const LocalizedString& message) = 0;
        virtual void statusln(LocalizedString&& message) = 0;

    protected:
        ~DiagnosticContext() = default;
    };

    struct PrintingDiagnosticContext final : DiagnosticContext
    {
        PrintingDiagnosticContext(MessageSink& sink) : sink(sink) { }

        virtual void report(const DiagnosticLine& line) override;

        virtual void statusln(const LocalizedString& message) override;
        virtual void statusln(LocalizedString&& message) override;

    private:
        MessageSink& sink;
    };

    // Stores all diagnostics into a vector, while passing through status lines to an underlying MessageSink.
    struct BufferedDiagnosticContext final : DiagnosticContext
    {
        BufferedDiagnosticContext(MessageSink& status_sink) : status_sink(status_sink) { }

        virtual void report(const DiagnosticLine& line) override;
        virtual void report(DiagnosticLine&& line) override;

        virtual void statusln(const LocalizedString& message) override;
        virtual void statusln(LocalizedString&& message) override;

        MessageSink& status_sink;
        std::vector<DiagnosticLine> lines;

        // Converts this message into a string
        std::string to_string() const;
        void to_string(std::string& target) const;

        bool any_errors() const noexcept;
        bool empty() const noexcept;
    };
}
