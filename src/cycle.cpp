#include "cycle.hpp"
#include "logger.hpp"

namespace switcher
{
    snapshot take_snapshot(backend &backend, const device_filter &filter)
    {
        snapshot rtn;

        rtn.devices  = backend.list();
        rtn.current  = backend.default_device();
        rtn.matching = eligible(rtn.devices, filter);

        return rtn;
    }

    tl::expected<device, select_error> cycle(backend &backend, const device_filter &filter)
    {
        const auto devices = backend.list();
        const auto current = backend.default_device();

        if (current)
        {
            logger::get()->debug("[cycle] (cycle) current default: {}", current.value());
        }

        auto current_id = current ? std::optional{current->id} : std::nullopt;
        auto selected   = select_next(devices, current_id, filter);

        if (!selected)
        {
            return selected;
        }

        logger::get()->info("[cycle] (cycle) setting {} as the default sink", selected.value());
        backend.set_default(selected.value());

        return selected;
    }
} // namespace switcher
