#pragma once
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// Name every Moment device advertises
inline constexpr std::string_view DEVICE_NAME = "Moment";

inline constexpr std::chrono::milliseconds SCAN_TIMEOUT{5000};
inline constexpr std::chrono::milliseconds CONNECT_TIMEOUT{3000};

// Haptic timeline service (advertised) and its control characteristics
inline constexpr std::string_view HAPTIC_SVC_UUID = "a28e9217-e9b5-4c0a-9217-1c64d051d762";
inline constexpr std::string_view SETTINGS_UUID   = "a28efc07-e9b5-4c0a-9217-1c64d051d762";
inline constexpr std::string_view ACTUATOR_UUID   = "a28efc05-e9b5-4c0a-9217-1c64d051d762";
inline constexpr std::string_view TRIGGER_UUID    = "a28efc08-e9b5-4c0a-9217-1c64d051d762";

// Nordic UART service, bytecode goes to RX (write w/ response)
inline constexpr std::string_view UART_SVC_UUID = "6e400001-b5a3-f393-e0a9-e50e24dcca9e";
inline constexpr std::string_view UART_RX_UUID  = "6e400002-b5a3-f393-e0a9-e50e24dcca9e";
inline constexpr std::string_view UART_TX_UUID  = "6e400003-b5a3-f393-e0a9-e50e24dcca9e";

// Device Information service (0x180A), firmware revision (0x2A26), serial (0x2A25)
inline constexpr std::string_view DEVINFO_SVC_UUID   = "0000180a-0000-1000-8000-00805f9b34fb";
inline constexpr std::string_view FW_REVISION_UUID   = "00002a26-0000-1000-8000-00805f9b34fb";
inline constexpr std::string_view SERIAL_NUMBER_UUID = "00002a25-0000-1000-8000-00805f9b34fb";

inline constexpr std::string_view COMPILER_URL = "https://firmware.wearmoment.com/compile";

// Key of the persisted device identity
inline constexpr std::string_view IDENTITY_KEY = "moment-peripheral";

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("MOMENT_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    // fallback to default
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/momentlink/ctl.sock";
    LOG_SYSTEM("Listening on %s", sock_path.c_str());
    return sock_path;
}

// Identity store file
[[maybe_unused]] static std::string state_file_path()
{
    if (const char *p = std::getenv("MOMENT_STATE_FILE"); p && *p)
    {
        return std::string(p);
    }
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    return base + "/.config/momentlink/state";
}

}  // namespace constants
