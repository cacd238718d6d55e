#include "fakes.hpp"

#include <switcher/cycle.hpp>

#include <gtest/gtest.h>

using switcher::device_filter;
using switcher::select_error;
using switcher::testing::fake_backend;

class CycleTest : public ::testing::Test
{
  protected:
    fake_backend backend;

  protected:
    void SetUp() override
    {
        backend.devices = {
            {5, "alsa_output.usb-dac", "USB DAC"},
            {2, "alsa_output.hdmi", "HDMI Monitor"},
            {8, "bluez_output.headphones", "Headphones"},
        };
    }
};

TEST_F(CycleTest, SetsNextDeviceOnce)
{
    backend.current = backend.devices[0];

    auto selected = switcher::cycle(backend, device_filter{});

    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected->id, 2u);

    ASSERT_EQ(backend.defaults_set.size(), 1u);
    EXPECT_EQ(backend.defaults_set.front().name, "alsa_output.hdmi");
}

TEST_F(CycleTest, NoDefaultSelectsFirstMatch)
{
    auto filter   = device_filter::compile({.exclude_names = {"usb"}});
    auto selected = switcher::cycle(backend, filter);

    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected->id, 2u);
    ASSERT_EQ(backend.defaults_set.size(), 1u);
}

TEST_F(CycleTest, NothingIsSetWithoutEligibleDevice)
{
    backend.current = backend.devices[1];

    auto filter   = device_filter::compile({.include_descriptions = {"Speakers"}});
    auto selected = switcher::cycle(backend, filter);

    ASSERT_FALSE(selected.has_value());
    EXPECT_EQ(selected.error(), select_error::no_eligible_device);
    EXPECT_TRUE(backend.defaults_set.empty());
}

TEST_F(CycleTest, RepeatedInvocationsWalkTheCycle)
{
    backend.current = backend.devices[2];

    for (auto expected : {5u, 2u, 8u, 5u})
    {
        auto selected = switcher::cycle(backend, device_filter{});

        ASSERT_TRUE(selected.has_value());
        EXPECT_EQ(selected->id, expected);
    }

    EXPECT_EQ(backend.defaults_set.size(), 4u);
    EXPECT_EQ(backend.list_calls, 4u);
}

TEST_F(CycleTest, SnapshotReportsAllMatchingAndCurrent)
{
    backend.current = backend.devices[1];

    auto filter = device_filter::compile({.include_names = {"^alsa_output"}});
    auto [devices, matching, current] = switcher::take_snapshot(backend, filter);

    EXPECT_EQ(devices.size(), 3u);

    ASSERT_EQ(matching.size(), 2u);
    EXPECT_EQ(matching[0].id, 5u);
    EXPECT_EQ(matching[1].id, 2u);

    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->id, 2u);

    EXPECT_TRUE(backend.defaults_set.empty());
}

TEST(DeviceFormatTest, ShowsDescriptionIdAndName)
{
    const switcher::device device{12, "alsa_output.usb-dac", "USB DAC"};

    EXPECT_EQ(fmt::format("{}", device), "USB DAC (12, alsa_output.usb-dac)");
}
