#pragma once

#include <memory>
#include <string>
#include <stdexcept>
#include <string_view>

namespace switcher
{
    class config_error : public std::runtime_error
    {
      public:
        using std::runtime_error::runtime_error;
    };

    class matcher
    {
      public:
        virtual ~matcher() = default;

      public:
        [[nodiscard]] virtual bool matches(std::string_view text) const = 0;
    };

    class pattern_engine
    {
      public:
        virtual ~pattern_engine() = default;

      public:
        /**
         * @throws config_error if the pattern is not valid for this engine
         */
        [[nodiscard]] virtual std::unique_ptr<matcher> compile(const std::string &pattern) const = 0;
    };

    /**
     * ECMAScript regular expressions (std::regex), searched anywhere in the text.
     * A leading "(?i)" makes the remainder of the pattern case-insensitive.
     */
    class regex_engine : public pattern_engine
    {
      public:
        [[nodiscard]] std::unique_ptr<matcher> compile(const std::string &pattern) const override;

      public:
        [[nodiscard]] static const regex_engine &get();
    };
} // namespace switcher
