#pragma once

#include "device.hpp"

#include <vector>
#include <optional>

namespace switcher
{
    class backend
    {
      public:
        virtual ~backend() = default;

      public:
        [[nodiscard]] virtual std::vector<device> list() = 0;
        [[nodiscard]] virtual std::optional<device> default_device() = 0;

      public:
        virtual void set_default(const device &) = 0;
    };
} // namespace switcher
