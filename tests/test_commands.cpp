// tests/test_commands.cpp
#include <gtest/gtest.h>
#include <set>
#include <string>

#include "proto/commands.hpp"

using namespace proto;

TEST(Commands, SettingsLayout)
{
    Settings s;
    s.wrist     = Orientation::Right;
    s.button    = Orientation::Left;
    s.intensity = Intensity::High;
    auto buf    = encode_settings(s);
    EXPECT_EQ(buf, (std::vector<std::uint8_t>{1, 0, 2}));

    Settings back;
    ASSERT_TRUE(parse_settings(buf.data(), buf.size(), back));
    EXPECT_EQ(back.wrist, Orientation::Right);
    EXPECT_EQ(back.button, Orientation::Left);
    EXPECT_EQ(back.intensity, Intensity::High);
}

TEST(Commands, SettingsRejectsOutOfRange)
{
    Settings           out;
    const std::uint8_t bad_wrist[]     = {2, 0, 0};
    const std::uint8_t bad_intensity[] = {0, 1, 3};
    const std::uint8_t short_buf[]     = {0, 1};
    EXPECT_FALSE(parse_settings(bad_wrist, sizeof(bad_wrist), out));
    EXPECT_FALSE(parse_settings(bad_intensity, sizeof(bad_intensity), out));
    EXPECT_FALSE(parse_settings(short_buf, sizeof(short_buf), out));
}

TEST(Commands, ActuatorDurationIsLittleEndian)
{
    ActuatorFrame a;
    a.duration_ms  = 0xABCD;
    a.top_left     = 1;
    a.top_right    = 2;
    a.bottom_left  = 3;
    a.bottom_right = 100;
    auto buf       = encode_actuators(a);
    ASSERT_EQ(buf.size(), ACTUATOR_SIZE);
    EXPECT_EQ(buf, (std::vector<std::uint8_t>{0xCD, 0xAB, 1, 2, 3, 100}));

    ActuatorFrame back;
    ASSERT_TRUE(parse_actuators(buf.data(), buf.size(), back));
    EXPECT_EQ(back.duration_ms, 0xABCD);
    EXPECT_EQ(back.bottom_right, 100);
    EXPECT_FALSE(parse_actuators(buf.data(), 5, back));
}

TEST(Commands, TriggerIsOneByte)
{
    EXPECT_EQ(encode_trigger(Trigger::Confetti), (std::vector<std::uint8_t>{'p'}));
    EXPECT_EQ(encode_trigger(Trigger::Laughing), (std::vector<std::uint8_t>{'k'}));
}

TEST(Commands, TriggerNamesAreUnique)
{
    std::set<std::string_view> names;
    std::set<char>             bytes;
    for (const auto &t : TRIGGER_NAMES)
    {
        names.insert(t.name);
        bytes.insert(static_cast<char>(t.trigger));
        auto parsed = parse_trigger(t.name);
        ASSERT_TRUE(parsed.has_value()) << t.name;
        EXPECT_EQ(*parsed, t.trigger);
    }
    EXPECT_EQ(names.size(), TRIGGER_NAMES.size());
    EXPECT_EQ(bytes.size(), TRIGGER_NAMES.size());
}

TEST(Commands, ParseWords)
{
    EXPECT_EQ(parse_trigger("point-left"), Trigger::PointLeft);
    EXPECT_FALSE(parse_trigger("Confetti").has_value());
    EXPECT_FALSE(parse_trigger("").has_value());

    EXPECT_EQ(parse_orientation("right"), Orientation::Right);
    EXPECT_FALSE(parse_orientation("up").has_value());

    EXPECT_EQ(parse_intensity("low"), Intensity::Low);
    EXPECT_EQ(parse_intensity("medium"), Intensity::Medium);
    EXPECT_FALSE(parse_intensity("max").has_value());
}
