#pragma once

#include <nodeboot/base/messages.h>

namespace nodeboot
{
    struct MessageSink
    {
        virtual void println(const LocalizedString& s) = 0;
        virtual void println(Color c, const LocalizedString& s) = 0;

        template<NODEBOOT_DECL_MSG_TEMPLATE>
        void println(NODEBOOT_DECL_MSG_ARGS)
        {
            this->println(msg::format(NODEBOOT_EXPAND_MSG_ARGS));
        }

        template<NODEBOOT_DECL_MSG_TEMPLATE>
        void println(Color c, NODEBOOT_DECL_MSG_ARGS)
        {
            this->println(c, msg::format(NODEBOOT_EXPAND_MSG_ARGS));
        }

        MessageSink(const MessageSink&) = delete;
        MessageSink& operator=(const MessageSink&) = delete;

    protected:
        MessageSink() = default;
        ~MessageSink() = default;
    };

    extern MessageSink& null_sink;
    // Status output. Written to stderr because stdout belongs to the launched program.
    extern MessageSink& out_sink;
}
