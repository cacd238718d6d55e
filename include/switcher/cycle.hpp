#pragma once

#include "backend.hpp"
#include "selector.hpp"

namespace switcher
{
    struct snapshot
    {
        std::vector<device> devices;
        std::vector<device> matching;

      public:
        std::optional<device> current;
    };

    [[nodiscard]] snapshot take_snapshot(backend &, const device_filter &);

    /**
     * Enumerates the devices, selects the next eligible one and makes it the default.
     * The backend is left untouched when no device is eligible.
     */
    [[nodiscard]] tl::expected<device, select_error> cycle(backend &, const device_filter &);
} // namespace switcher
