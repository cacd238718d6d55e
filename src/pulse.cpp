#include "pulse.impl.hpp"
#include "logger.hpp"

#include <string>

namespace switcher
{
    static device to_device(const pa_sink_info &info)
    {
        auto name        = info.name ? std::string{info.name} : fmt::format("[unknown name {}]", info.index);
        auto description = info.description ? std::string{info.description}
                                            : fmt::format("[unknown description {}]", info.index);

        return {info.index, std::move(name), std::move(description)};
    }

    pulse::impl::impl() : loop(pa_mainloop_new())
    {
        if (!loop)
        {
            throw pulse_error("failed to create pulse main loop");
        }

        context.reset(pa_context_new(pa_mainloop_get_api(loop.get()), "pulse-switcher"));

        if (!context)
        {
            throw pulse_error("failed to create pulse context");
        }

        if (pa_context_connect(context.get(), nullptr, PA_CONTEXT_NOFLAGS, nullptr) < 0)
        {
            fail("failed to connect pulse context");
        }

        while (true)
        {
            auto state = pa_context_get_state(context.get());

            if (state == PA_CONTEXT_READY)
            {
                break;
            }

            if (!PA_CONTEXT_IS_GOOD(state))
            {
                fail("failed to connect pulse context");
            }

            if (pa_mainloop_iterate(loop.get(), 1, nullptr) < 0)
            {
                fail("pulse main loop quit while connecting");
            }
        }

        const auto *server = pa_context_get_server(context.get());
        logger::get()->debug(R"([pulse] (init) connected to "{}")", server_label(server));
    }

    void pulse::impl::wait(pa_operation *operation, std::string_view what)
    {
        if (!operation)
        {
            fail(what);
        }

        while (pa_operation_get_state(operation) == PA_OPERATION_RUNNING)
        {
            if (pa_mainloop_iterate(loop.get(), 1, nullptr) >= 0)
            {
                continue;
            }

            pa_operation_cancel(operation);
            pa_operation_unref(operation);

            fail(what);
        }

        pa_operation_unref(operation);

        if (pa_context_get_state(context.get()) != PA_CONTEXT_READY)
        {
            fail(what);
        }
    }

    void pulse::impl::fail(std::string_view what) const
    {
        throw pulse_error(fmt::format("{}: {}", what, pa_strerror(pa_context_errno(context.get()))));
    }

    pulse::~pulse() = default;

    pulse::pulse() : m_impl(std::make_unique<impl>()) {}

    std::vector<device> pulse::list()
    {
        struct state
        {
            std::vector<device> devices;
            bool failed{false};
        };

        static auto info = [](pa_context *, const pa_sink_info *info, int eol, void *data)
        {
            auto &[devices, failed] = *reinterpret_cast<state *>(data);

            if (eol < 0)
            {
                failed = true;
                return;
            }

            if (eol > 0 || !info)
            {
                return;
            }

            devices.emplace_back(to_device(*info));
        };

        state state;
        m_impl->wait(pa_context_get_sink_info_list(m_impl->context.get(), info, &state), "failed to list devices");

        if (state.failed)
        {
            m_impl->fail("failed to list devices");
        }

        logger::get()->debug("[pulse] (list) found {} device(s)", state.devices.size());

        return std::move(state.devices);
    }

    std::optional<device> pulse::default_device()
    {
        static auto server = [](pa_context *, const pa_server_info *info, void *data)
        {
            auto &name = *reinterpret_cast<std::optional<std::string> *>(data);

            if (info && info->default_sink_name)
            {
                name.emplace(info->default_sink_name);
            }
        };

        std::optional<std::string> name;
        m_impl->wait(pa_context_get_server_info(m_impl->context.get(), server, &name),
                     "failed to get default device");

        if (!name)
        {
            logger::get()->debug("[pulse] (default_device) no default sink is set");
            return std::nullopt;
        }

        struct state
        {
            std::optional<device> result;
            bool failed{false};
        };

        static auto info = [](pa_context *, const pa_sink_info *info, int eol, void *data)
        {
            auto &[result, failed] = *reinterpret_cast<state *>(data);

            if (eol < 0)
            {
                failed = true;
                return;
            }

            if (eol > 0 || !info)
            {
                return;
            }

            result.emplace(to_device(*info));
        };

        state state;
        m_impl->wait(pa_context_get_sink_info_by_name(m_impl->context.get(), name->c_str(), info, &state),
                     "failed to get default device");

        if (state.failed)
        {
            logger::get()->warn(R"([pulse] (default_device) default sink "{}" is not available: {})", name.value(),
                                pa_strerror(pa_context_errno(m_impl->context.get())));

            return std::nullopt;
        }

        return state.result;
    }

    void pulse::set_default(const device &device)
    {
        static auto done = [](pa_context *, int success, void *data)
        {
            *reinterpret_cast<bool *>(data) = success != 0;
        };

        logger::get()->trace(R"([pulse] (set_default) requesting "{}")", device.name);

        bool success{false};
        m_impl->wait(pa_context_set_default_sink(m_impl->context.get(), device.name.c_str(), done, &success),
                     "failed setting default device");

        if (!success)
        {
            m_impl->fail("failed setting default device");
        }

        logger::get()->debug("[pulse] (set_default) default device is now {}", device.id);
    }
} // namespace switcher
