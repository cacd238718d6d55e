#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace switcher
{
    class logger
    {
        struct impl;

      private:
        std::unique_ptr<impl> m_impl;

      private:
        logger();

      public:
        ~logger();

      public:
        spdlog::logger *operator->() const;

      public:
        /**
         * Adjusts the console sink. Positive values add debug (1) and trace (2) output,
         * negative values restrict it to warnings (-1), errors (-2) or nothing (-3).
         */
        void verbosity(int level);
        [[nodiscard]] spdlog::level::level_enum console_level() const;

      public:
        [[nodiscard]] static logger &get();
    };
} // namespace switcher
