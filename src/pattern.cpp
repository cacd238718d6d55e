#include "pattern.hpp"

#include <regex>
#include <spdlog/fmt/fmt.h>

namespace switcher
{
    static constexpr std::string_view icase_flag = "(?i)";

    class regex_matcher : public matcher
    {
        std::regex m_regex;

      public:
        explicit regex_matcher(std::regex regex) : m_regex(std::move(regex)) {}

      public:
        [[nodiscard]] bool matches(std::string_view text) const override
        {
            return std::regex_search(text.begin(), text.end(), m_regex);
        }
    };

    std::unique_ptr<matcher> regex_engine::compile(const std::string &pattern) const
    {
        auto flags      = std::regex::ECMAScript;
        auto expression = std::string_view{pattern};

        if (expression.starts_with(icase_flag))
        {
            flags |= std::regex::icase;
            expression.remove_prefix(icase_flag.size());
        }

        try
        {
            return std::make_unique<regex_matcher>(std::regex(expression.begin(), expression.end(), flags));
        }
        catch (const std::regex_error &ex)
        {
            throw config_error(fmt::format(R"(invalid pattern "{}": {})", pattern, ex.what()));
        }
    }

    const regex_engine &regex_engine::get()
    {
        static const regex_engine instance;
        return instance;
    }
} // namespace switcher
