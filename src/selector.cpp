#include "selector.hpp"

#include <iterator>

#include <range/v3/view.hpp>
#include <range/v3/range.hpp>
#include <range/v3/algorithm.hpp>

namespace switcher
{
    std::string_view describe(select_error error)
    {
        switch (error)
        {
        case select_error::no_eligible_device:
            return "no matching devices found";
        }

        return "unknown selection error";
    }

    std::vector<device> eligible(const std::vector<device> &devices, const device_filter &filter)
    {
        auto is_eligible = [&filter](const auto &item)
        {
            return filter.eligible(item);
        };

        return devices | ranges::views::filter(is_eligible) | ranges::to<std::vector>;
    }

    tl::expected<device, select_error> select_next(const std::vector<device> &devices,
                                                   std::optional<std::uint32_t> current, const device_filter &filter)
    {
        const auto candidates = eligible(devices, filter);

        if (candidates.empty())
        {
            return tl::make_unexpected(select_error::no_eligible_device);
        }

        if (!current)
        {
            return candidates.front();
        }

        auto is_current = [id = current.value()](const auto &item)
        {
            return item.id == id;
        };

        const auto it = ranges::find_if(candidates, is_current);

        if (it == candidates.end())
        {
            return candidates.front();
        }

        const auto position = static_cast<std::size_t>(std::distance(candidates.begin(), it));

        return candidates[(position + 1) % candidates.size()];
    }

    tl::expected<device, select_error> select_next(const std::vector<device> &devices,
                                                   std::optional<std::uint32_t> current, const pattern_set &patterns,
                                                   const pattern_engine &engine)
    {
        return select_next(devices, current, device_filter::compile(patterns, engine));
    }
} // namespace switcher
