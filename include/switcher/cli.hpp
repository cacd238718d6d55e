#pragma once

#include "cycle.hpp"

#include <iosfwd>
#include <optional>
#include <filesystem>
#include <string_view>

namespace switcher
{
    enum class command
    {
        list,
        next,
    };

    struct arguments
    {
        int verbose{0};
        int quiet{0};

      public:
        bool help{false};
        bool version{false};

      public:
        std::optional<std::filesystem::path> config;
        command cmd{command::list};
    };

    extern const std::string_view usage;
    extern const std::string_view help;

    /**
     * Parses `argv`, logging the reason and returning nothing on a usage error
     */
    [[nodiscard]] std::optional<arguments> parse_arguments(int argc, const char *const *args);

    void print_list(std::ostream &, const snapshot &);
} // namespace switcher
