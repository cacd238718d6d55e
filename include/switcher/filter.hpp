#pragma once

#include "device.hpp"
#include "pattern.hpp"

#include <memory>
#include <string>
#include <vector>

namespace switcher
{
    struct pattern_set
    {
        std::vector<std::string> include_names;
        std::vector<std::string> include_descriptions;

      public:
        std::vector<std::string> exclude_names;
        std::vector<std::string> exclude_descriptions;
    };

    class device_filter
    {
        using matchers = std::vector<std::unique_ptr<matcher>>;

      private:
        matchers include_names;
        matchers include_descriptions;

      private:
        matchers exclude_names;
        matchers exclude_descriptions;

      public:
        device_filter(); // Lets every device through

      public:
        [[nodiscard]] bool eligible(const device &) const;

      public:
        /**
         * Compiles every pattern up front, so that a bad pattern is reported before any device is looked at.
         * @throws config_error naming the list and pattern that failed to compile
         */
        [[nodiscard]] static device_filter compile(const pattern_set &, const pattern_engine & = regex_engine::get());
    };

    [[nodiscard]] bool is_eligible(const device &, const pattern_set &, const pattern_engine & = regex_engine::get());
} // namespace switcher
