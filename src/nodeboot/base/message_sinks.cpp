#include <nodeboot/base/message_sinks.h>

namespace
{
    using namespace nodeboot;
    struct NullMessageSink final : MessageSink
    {
        virtual void println(const LocalizedString&) override { }
        virtual void println(Color, const LocalizedString&) override { }
    };

    NullMessageSink null_sink_instance;

    struct OutMessageSink final : MessageSink
    {
        virtual void println(const LocalizedString& text) override
        {
            msg::write_unlocalized_text(Color::none, text);
            msg::write_unlocalized_text(Color::none, "\n");
        }
        virtual void println(Color color, const LocalizedString& text) override
        {
            msg::write_unlocalized_text(color, text);
            msg::write_unlocalized_text(Color::none, "\n");
        }
    };

    OutMessageSink out_sink_instance;
}

namespace nodeboot
{
    MessageSink& null_sink = null_sink_instance;
    MessageSink& out_sink = out_sink_instance;
}
