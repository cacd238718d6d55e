#pragma once

#include "filter.hpp"

#include <optional>
#include <filesystem>

namespace switcher
{
    namespace fs = std::filesystem;

    /**
     * @throws config_error if the file can't be read or doesn't describe a pattern set
     */
    [[nodiscard]] pattern_set load_config(const fs::path &file);

    /**
     * `$XDG_CONFIG_HOME/pulse-switcher/config.json`, or the equivalent under `$HOME/.config`
     */
    [[nodiscard]] std::optional<fs::path> default_config_path();

    /**
     * Loads the default config file if it exists, an empty pattern set otherwise.
     * @throws config_error if the file exists but can't be loaded
     */
    [[nodiscard]] pattern_set load_default_config();
} // namespace switcher
