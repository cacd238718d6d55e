#pragma once

#include "device.hpp"
#include "filter.hpp"

#include <vector>
#include <optional>
#include <string_view>

#include <tl/expected.hpp>

namespace switcher
{
    enum class select_error
    {
        no_eligible_device,
    };

    [[nodiscard]] std::string_view describe(select_error);

    /**
     * The devices that pass the filter, in the order they were enumerated.
     */
    [[nodiscard]] std::vector<device> eligible(const std::vector<device> &devices, const device_filter &filter);

    /**
     * Picks the device that should become the new default.
     *
     * The eligible device following the current default is chosen, wrapping around after the last one.
     * If there is no current default, or it is not eligible, the first eligible device is chosen.
     */
    [[nodiscard]] tl::expected<device, select_error> select_next(const std::vector<device> &devices,
                                                                 std::optional<std::uint32_t> current,
                                                                 const device_filter &filter);

    /**
     * @throws config_error if any pattern fails to compile, before a device is evaluated
     */
    [[nodiscard]] tl::expected<device, select_error> select_next(const std::vector<device> &devices,
                                                                 std::optional<std::uint32_t> current,
                                                                 const pattern_set &patterns,
                                                                 const pattern_engine & = regex_engine::get());
} // namespace switcher
