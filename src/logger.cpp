#include "logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace switcher
{
    namespace fs = std::filesystem;

    struct logger::impl
    {
        std::unique_ptr<spdlog::logger> logger;
        std::shared_ptr<spdlog::sinks::ansicolor_stderr_sink_mt> console;

      public:
        bool file_enabled{false};
    };

    static fs::path log_directory()
    {
        auto rtn = fs::temp_directory_path();

        // NOLINTNEXTLINE(*-mt-unsafe)
        if (auto *home = std::getenv("HOME"))
        {
            rtn = fs::path{home} / ".local" / "state";
        }

        // NOLINTNEXTLINE(*-mt-unsafe)
        if (auto *state_home = std::getenv("XDG_STATE_HOME"))
        {
            rtn = state_home;
        }

        return rtn / "pulse-switcher";
    }

    logger::~logger() = default;

    logger::logger() : m_impl(std::make_unique<impl>())
    {
        namespace sinks = spdlog::sinks;

        m_impl->logger = std::make_unique<spdlog::logger>("pulse-switcher");
        m_impl->logger->set_level(spdlog::level::trace);
        m_impl->logger->flush_on(spdlog::level::trace);

        m_impl->console = std::make_shared<sinks::ansicolor_stderr_sink_mt>();
        m_impl->console->set_level(spdlog::level::info);
        m_impl->console->set_pattern("%^[%l]%$ %v");

        m_impl->logger->sinks().emplace_back(m_impl->console);

        // NOLINTNEXTLINE(*-mt-unsafe)
        if (!std::getenv("SWITCHER_ENABLE_LOG"))
        {
            return;
        }

        auto directory = log_directory();

        if (!fs::exists(directory))
        {
            [[maybe_unused]] std::error_code ec;
            fs::create_directories(directory, ec);
        }

        auto file_sink = std::make_shared<sinks::basic_file_sink_mt>((directory / "pulse-switcher.log").string());

        file_sink->set_level(spdlog::level::trace);

        m_impl->logger->sinks().emplace_back(file_sink);
        m_impl->file_enabled = true;
    }

    spdlog::logger *logger::operator->() const
    {
        return m_impl->logger.get();
    }

    void logger::verbosity(int level)
    {
        using spdlog::level::level_enum;

        auto target = level_enum::info;

        if (level >= 2)
        {
            target = level_enum::trace;
        }
        else if (level == 1)
        {
            target = level_enum::debug;
        }
        else if (level == -1)
        {
            target = level_enum::warn;
        }
        else if (level == -2)
        {
            target = level_enum::err;
        }
        else if (level <= -3)
        {
            target = level_enum::off;
        }

        // The log file always records everything, only the console follows the verbosity
        m_impl->console->set_level(target);

        m_impl->logger->trace("[logger] (verbosity) console level set to {} (file: {})",
                              spdlog::level::to_string_view(target), m_impl->file_enabled);
    }

    spdlog::level::level_enum logger::console_level() const
    {
        return m_impl->console->level();
    }

    logger &logger::get()
    {
        static std::unique_ptr<logger> instance;

        if (!instance)
        {
            instance = std::unique_ptr<logger>(new logger);
        }

        return *instance;
    }
} // namespace switcher
