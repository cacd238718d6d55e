#pragma once

#include "backend.hpp"

#include <memory>
#include <stdexcept>

namespace switcher
{
    class pulse_error : public std::runtime_error
    {
      public:
        using std::runtime_error::runtime_error;
    };

    class pulse : public backend
    {
        struct impl;

      private:
        std::unique_ptr<impl> m_impl;

      public:
        ~pulse() override;

      public:
        /**
         * Connects to the sound server
         * @throws pulse_error if the connection can't be established
         */
        pulse();

      public:
        [[nodiscard]] std::vector<device> list() override;
        [[nodiscard]] std::optional<device> default_device() override;

      public:
        void set_default(const device &) override;
    };
} // namespace switcher
