#pragma once

namespace nodeboot
{
    enum class DiagKind
    {
        None,    // foo.h: localized
        Error,   // foo.h: error: localized
        Warning, // foo.h: warning: localized
        Note,    // foo.h: note: localized
        COUNT
    };

    struct DiagnosticLine;
    struct DiagnosticContext;
    struct PrintingDiagnosticContext;
    struct BufferedDiagnosticContext;

    extern DiagnosticContext& console_diagnostic_context;
}
