#pragma once

#include <switcher/backend.hpp>
#include <switcher/pattern.hpp>

#include <memory>
#include <string>
#include <vector>

namespace switcher::testing
{
    /**
     * Plain substring search. Patterns starting with '!' fail to compile.
     */
    class fake_engine : public pattern_engine
    {
        struct state
        {
            std::vector<std::string> compiled;
            std::size_t evaluations{0};
        };

      private:
        std::shared_ptr<state> m_state = std::make_shared<state>();

      public:
        class fake_matcher : public matcher
        {
            std::string m_needle;
            std::shared_ptr<state> m_state;

          public:
            fake_matcher(std::string needle, std::shared_ptr<state> state)
                : m_needle(std::move(needle)), m_state(std::move(state))
            {
            }

          public:
            [[nodiscard]] bool matches(std::string_view text) const override
            {
                m_state->evaluations++;
                return text.find(m_needle) != std::string_view::npos;
            }
        };

      public:
        [[nodiscard]] std::unique_ptr<matcher> compile(const std::string &pattern) const override
        {
            if (pattern.starts_with('!'))
            {
                throw config_error("bad pattern: " + pattern);
            }

            m_state->compiled.emplace_back(pattern);
            return std::make_unique<fake_matcher>(pattern, m_state);
        }

      public:
        [[nodiscard]] const std::vector<std::string> &compiled() const
        {
            return m_state->compiled;
        }

        [[nodiscard]] std::size_t evaluations() const
        {
            return m_state->evaluations;
        }
    };

    class fake_backend : public backend
    {
      public:
        std::vector<device> devices;
        std::optional<device> current;

      public:
        std::vector<device> defaults_set;
        std::size_t list_calls{0};

      public:
        std::vector<device> list() override
        {
            list_calls++;
            return devices;
        }

        std::optional<device> default_device() override
        {
            return current;
        }

        void set_default(const device &device) override
        {
            defaults_set.emplace_back(device);
            current = device;
        }
    };
} // namespace switcher::testing
