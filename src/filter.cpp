#include "filter.hpp"

#include <range/v3/algorithm.hpp>

namespace switcher
{
    using matchers = std::vector<std::unique_ptr<matcher>>;

    static matchers compile_all(std::string_view list, const std::vector<std::string> &patterns,
                                const pattern_engine &engine)
    {
        matchers rtn;
        rtn.reserve(patterns.size());

        for (const auto &pattern : patterns)
        {
            try
            {
                rtn.emplace_back(engine.compile(pattern));
            }
            catch (const config_error &ex)
            {
                throw config_error(fmt::format("{}: {}", list, ex.what()));
            }
        }

        return rtn;
    }

    static bool any_match(const matchers &list, std::string_view text)
    {
        return ranges::any_of(list, [text](const auto &item) { return item->matches(text); });
    }

    device_filter::device_filter() = default;

    bool device_filter::eligible(const device &device) const
    {
        const auto unfiltered = include_names.empty() && include_descriptions.empty();
        const auto included   = unfiltered || any_match(include_names, device.name) ||
                              any_match(include_descriptions, device.description);

        if (!included)
        {
            return false;
        }

        const auto excluded = any_match(exclude_names, device.name) || //
                              any_match(exclude_descriptions, device.description);

        return !excluded;
    }

    device_filter device_filter::compile(const pattern_set &patterns, const pattern_engine &engine)
    {
        device_filter rtn;

        rtn.include_names        = compile_all("include_names", patterns.include_names, engine);
        rtn.include_descriptions = compile_all("include_descriptions", patterns.include_descriptions, engine);
        rtn.exclude_names        = compile_all("exclude_names", patterns.exclude_names, engine);
        rtn.exclude_descriptions = compile_all("exclude_descriptions", patterns.exclude_descriptions, engine);

        return rtn;
    }

    bool is_eligible(const device &device, const pattern_set &patterns, const pattern_engine &engine)
    {
        return device_filter::compile(patterns, engine).eligible(device);
    }
} // namespace switcher
