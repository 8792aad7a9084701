#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace proto
{

enum class Orientation : std::uint8_t
{
    Left  = 0,
    Right = 1
};

enum class Intensity : std::uint8_t
{
    Low    = 0,
    Medium = 1,
    High   = 2
};

// Pre-loaded patterns, value is the byte written to the trigger characteristic
enum class Trigger : char
{
    Confetti    = 'p',
    PointLeft   = 'l',
    PointRight  = 'r',
    LeftFist    = 's',
    RightFist   = 't',
    HandsRaised = 'u',
    Wave        = 'a',
    Hushed      = 'q',
    Flushed     = 'w',
    Grimacing   = 'f',
    Smiling     = 'd',
    Grinning    = 'm',
    Laughing    = 'k'
};

constexpr std::size_t SETTINGS_SIZE  = 3;
constexpr std::size_t ACTUATOR_SIZE  = 6;
constexpr std::uint8_t MAX_INTENSITY = 100;

struct Settings
{
    Orientation wrist{Orientation::Left};
    Orientation button{Orientation::Left};
    Intensity   intensity{Intensity::Medium};
};

struct ActuatorFrame
{
    std::uint16_t duration_ms{0};
    std::uint8_t  top_left{0};
    std::uint8_t  top_right{0};
    std::uint8_t  bottom_left{0};
    std::uint8_t  bottom_right{0};
};

// [wrist][button][intensity]
inline std::vector<std::uint8_t> encode_settings(const Settings &s)
{
    return {static_cast<std::uint8_t>(s.wrist), static_cast<std::uint8_t>(s.button),
            static_cast<std::uint8_t>(s.intensity)};
}

inline bool parse_settings(const std::uint8_t *buf, std::size_t len, Settings &out)
{
    if (len != SETTINGS_SIZE || buf[0] > 1 || buf[1] > 1 || buf[2] > 2)
        return false;
    out.wrist     = static_cast<Orientation>(buf[0]);
    out.button    = static_cast<Orientation>(buf[1]);
    out.intensity = static_cast<Intensity>(buf[2]);
    return true;
}

// [dur_lo][dur_hi][tl][tr][bl][br]
inline std::vector<std::uint8_t> encode_actuators(const ActuatorFrame &a)
{
    std::vector<std::uint8_t> out;
    out.reserve(ACTUATOR_SIZE);
    // explicit little-endian
    out.push_back(static_cast<std::uint8_t>(a.duration_ms & 0xFF));
    out.push_back(static_cast<std::uint8_t>((a.duration_ms >> 8) & 0xFF));
    out.push_back(a.top_left);
    out.push_back(a.top_right);
    out.push_back(a.bottom_left);
    out.push_back(a.bottom_right);
    return out;
}

inline bool parse_actuators(const std::uint8_t *buf, std::size_t len, ActuatorFrame &out)
{
    if (len != ACTUATOR_SIZE)
        return false;
    out.duration_ms  = static_cast<std::uint16_t>(buf[0] | (buf[1] << 8));
    out.top_left     = buf[2];
    out.top_right    = buf[3];
    out.bottom_left  = buf[4];
    out.bottom_right = buf[5];
    return true;
}

inline std::vector<std::uint8_t> encode_trigger(Trigger t)
{
    return {static_cast<std::uint8_t>(t)};
}

struct TriggerName
{
    std::string_view name;
    Trigger          trigger;
};

inline constexpr std::array<TriggerName, 13> TRIGGER_NAMES = {{
    {"confetti", Trigger::Confetti},
    {"point-left", Trigger::PointLeft},
    {"point-right", Trigger::PointRight},
    {"left-fist", Trigger::LeftFist},
    {"right-fist", Trigger::RightFist},
    {"hands-raised", Trigger::HandsRaised},
    {"wave", Trigger::Wave},
    {"hushed", Trigger::Hushed},
    {"flushed", Trigger::Flushed},
    {"grimacing", Trigger::Grimacing},
    {"smiling", Trigger::Smiling},
    {"grinning", Trigger::Grinning},
    {"laughing", Trigger::Laughing},
}};

inline std::optional<Trigger> parse_trigger(std::string_view name)
{
    for (const auto &t : TRIGGER_NAMES)
    {
        if (t.name == name)
            return t.trigger;
    }
    return std::nullopt;
}

inline std::optional<Orientation> parse_orientation(std::string_view s)
{
    if (s == "left")
        return Orientation::Left;
    if (s == "right")
        return Orientation::Right;
    return std::nullopt;
}

inline std::optional<Intensity> parse_intensity(std::string_view s)
{
    if (s == "low")
        return Intensity::Low;
    if (s == "medium")
        return Intensity::Medium;
    if (s == "high")
        return Intensity::High;
    return std::nullopt;
}

}  // namespace proto
