#include "config.hpp"
#include "logger.hpp"
#include "meta.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace switcher
{
    pattern_set load_config(const fs::path &file)
    {
        logger::get()->debug(R"([config] (load) loading "{}")", file.string());

        std::ifstream stream{file};

        if (!stream)
        {
            throw config_error(fmt::format(R"(failed to load "{}": read failed)", file.string()));
        }

        const std::string buffer{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};

        pattern_set rtn;
        const auto error = glz::read_json(rtn, buffer);

        if (error)
        {
            throw config_error(fmt::format(R"(failed to load "{}": parse failed (config files are JSON): {})",
                                           file.string(), glz::format_error(error, buffer)));
        }

        logger::get()->trace("[config] (load) patterns: {}", glz::write_json(rtn));

        return rtn;
    }

    std::optional<fs::path> default_config_path()
    {
        std::optional<fs::path> directory;

        // NOLINTNEXTLINE(*-mt-unsafe)
        if (auto *home = std::getenv("HOME"))
        {
            directory = fs::path{home} / ".config";
        }

        // NOLINTNEXTLINE(*-mt-unsafe)
        if (auto *config_home = std::getenv("XDG_CONFIG_HOME"); config_home && *config_home)
        {
            directory = config_home;
        }

        if (!directory)
        {
            return std::nullopt;
        }

        return directory.value() / "pulse-switcher" / "config.json";
    }

    pattern_set load_default_config()
    {
        auto file = default_config_path();

        if (!file)
        {
            logger::get()->warn("[config] (load_default) failed to get XDG_CONFIG_HOME, using default config");
            return {};
        }

        std::error_code ec;

        if (!fs::is_regular_file(file.value(), ec))
        {
            logger::get()->debug(R"([config] (load_default) "{}" not found, using default config)", file->string());
            return {};
        }

        return load_config(file.value());
    }
} // namespace switcher
