#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/fmt.h>
#include <nodeboot/base/message_sinks.h>

#include <iterator>
#include <system_error>

using namespace nodeboot;

namespace
{
    static constexpr StringLiteral ColonSpace{": "};

    void append_origin_prefix(std::string& target, const Optional<std::string>& maybe_origin)
    {
        // origin: kind: message
        if (auto origin = maybe_origin.get())
        {
            target.append(*origin);
            target.append(ColonSpace.data(), ColonSpace.size());
        }
    }

    void append_kind_prefix(std::string& target, DiagKind kind)
    {
        static constexpr StringLiteral Empty{""};
        static constexpr const StringLiteral* prefixes[] = {&Empty, &ErrorPrefix, &WarningPrefix, &NotePrefix};
        static_assert(std::size(prefixes) == static_cast<unsigned int>(DiagKind::COUNT), "");

        const auto diag_index = static_cast<unsigned int>(kind);
        if (diag_index >= static_cast<unsigned int>(DiagKind::COUNT))
        {
            Checks::unreachable(NODEBOOT_LINE_INFO);
        }

        const auto prefix = prefixes[diag_index];
        target.append(prefix->data(), prefix->size());
    }
}

namespace nodeboot
{
    void DiagnosticContext::report(DiagnosticLine&& line) { report(line); }

    void DiagnosticContext::report_system_error(StringLiteral system_api_name, int error_value)
    {
        report_error(msgSystemApiErrorMessage,
                     msg::system_api = system_api_name,
                     msg::exit_code = error_value,
                     msg::error_msg = std::system_category().message(error_value));
    }

    void DiagnosticLine::print_to(MessageSink& sink) const
    {
        std::string origin_prefix;
        append_origin_prefix(origin_prefix, m_origin);
        switch (m_kind)
        {
            case DiagKind::None: sink.println(LocalizedString::from_raw(origin_prefix).append(m_message)); break;
            case DiagKind::Error:
                sink.println(Color::error,
                             LocalizedString::from_raw(origin_prefix).append_raw(ErrorPrefix).append(m_message));
                break;
            case DiagKind::Warning:
                sink.println(Color::warning,
                             LocalizedString::from_raw(origin_prefix).append_raw(WarningPrefix).append(m_message));
                break;
            case DiagKind::Note:
                sink.println(LocalizedString::from_raw(origin_prefix).append_raw(NotePrefix).append(m_message));
                break;
            default: Checks::unreachable(NODEBOOT_LINE_INFO);
        }
    }

    std::string DiagnosticLine::to_string() const
    {
        std::string result;
        this->to_string(result);
        return result;
    }

    void DiagnosticLine::to_string(std::string& target) const
    {
        append_origin_prefix(target, m_origin);
        append_kind_prefix(target, m_kind);
        target.append(m_message.data());
    }

    void PrintingDiagnosticContext::report(const DiagnosticLine& line) { line.print_to(sink); }

    void PrintingDiagnosticContext::statusln(const LocalizedString& message) { sink.println(message); }
    void PrintingDiagnosticContext::statusln(LocalizedString&& message) { sink.println(message); }

    void BufferedDiagnosticContext::report(const DiagnosticLine& line) { lines.push_back(line); }
    void BufferedDiagnosticContext::report(DiagnosticLine&& line) { lines.push_back(std::move(line)); }

    void BufferedDiagnosticContext::statusln(const LocalizedString& message) { status_sink.println(message); }
    void BufferedDiagnosticContext::statusln(LocalizedString&& message) { status_sink.println(message); }

    // Converts this message into a string
    // Prefer print() if possible because it applies color
    std::string BufferedDiagnosticContext::to_string() const { return adapt_to_string(*this); }
    void BufferedDiagnosticContext::to_string(std::string& target) const
    {
        auto first = lines.begin();
        const auto last = lines.end();
        if (first == last)
        {
            return;
        }

        for (;;)
        {
            first->to_string(target);
            if (++first == last)
            {
                return;
            }

            target.push_back('\n');
        }
    }

    bool BufferedDiagnosticContext::any_errors() const noexcept
    {
        for (auto&& line : lines)
        {
            if (line.kind() == DiagKind::Error)
            {
                return true;
            }
        }

        return false;
    }

    bool BufferedDiagnosticContext::empty() const noexcept { return lines.empty(); }
}

namespace
{
    PrintingDiagnosticContext console_diagnostic_context_instance{out_sink};
}

namespace nodeboot
{
    DiagnosticContext& console_diagnostic_context = console_diagnostic_context_instance;
}
