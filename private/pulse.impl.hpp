#pragma once

#include "pulse.hpp"

#include <memory>
#include <string_view>

#include <pulse/pulseaudio.h>

namespace switcher
{
    struct mainloop_deleter
    {
        void operator()(pa_mainloop *loop) const
        {
            pa_mainloop_free(loop);
        }
    };

    struct context_deleter
    {
        void operator()(pa_context *context) const
        {
            pa_context_disconnect(context);
            pa_context_unref(context);
        }
    };

    [[nodiscard]] inline std::string_view server_label(const char *server)
    {
        return server ? server : "unknown";
    }

    struct pulse::impl
    {
        /**
         * ╔════════════════╗
         * ║ Server related ║
         * ╚════════════════╝
         *
         * 1. The @see loop is only ever iterated from the calling thread, there is no background thread
         * 2. @see context is connected once in the constructor and torn down before the loop
         */

        std::unique_ptr<pa_mainloop, mainloop_deleter> loop;
        std::unique_ptr<pa_context, context_deleter> context;

      public:
        impl();

      public:
        void wait(pa_operation *, std::string_view what);

      public:
        [[noreturn]] void fail(std::string_view what) const;
    };
} // namespace switcher
