#pragma once

#include <string>
#include <cstdint>

#include <spdlog/fmt/fmt.h>

namespace switcher
{
    struct device
    {
        std::uint32_t id;
        std::string name;
        std::string description;
    };
} // namespace switcher

template <>
struct fmt::formatter<switcher::device>
{
    constexpr auto parse(fmt::format_parse_context &ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const switcher::device &device, FormatContext &ctx) const
    {
        return fmt::format_to(ctx.out(), "{} ({}, {})", device.description, device.id, device.name);
    }
};
