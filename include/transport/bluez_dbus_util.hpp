// include/transport/bluez_dbus_util.hpp
#pragma once
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

#include <systemd/sd-bus.h>

namespace transport
{

static inline bool ieq(std::string a, std::string b)
{
    auto norm = [](std::string s) {
        for (auto &c : s)
            c = (char)std::tolower((unsigned char)c);
        return s;
    };
    return norm(std::move(a)) == norm(std::move(b));
}

static inline bool mac_eq(std::string a, std::string b)
{
    auto norm = [](std::string s) {
        for (auto &c : s)
            c = (char)std::toupper((unsigned char)c);
        return s;
    };
    return norm(std::move(a)) == norm(std::move(b));
}

// DBus path "/org/bluez/hci0/dev_XX_YY_ZZ" -> "XX:YY:ZZ", "" when not a device path
[[maybe_unused]] static inline std::string path_to_mac(const std::string &obj_path)
{
    auto pos = obj_path.rfind("/dev_");
    if (pos == std::string::npos)
        return std::string();
    std::string tail = obj_path.substr(pos + 5);
    if (tail.find('/') != std::string::npos)
        return std::string();
    for (auto &c : tail)
        if (c == '_')
            c = ':';
    return tail;
}

// "XX:YY:ZZ" -> "/org/bluez/<adapter>/dev_XX_YY_ZZ"
[[maybe_unused]] static inline std::string mac_to_path(const std::string &adapter_path,
                                                       std::string        mac)
{
    for (auto &c : mac)
        c = (c == ':') ? '_' : (char)std::toupper((unsigned char)c);
    return adapter_path + "/dev_" + mac;
}

[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, std::string &out)
{
    // read variant "s" (or "o")
    const char *contents = nullptr;
    int         r        = sd_bus_message_peek_type(m, nullptr, &contents);
    if (r < 0)
        return r;
    const char *sig = (contents && contents[0] == 'o') ? "o" : "s";
    r               = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, sig);
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, sig, &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    // read variant "n" (int16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    // read variant "b"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b  = 0;
    r      = sd_bus_message_read(m, "b", &b);
    out    = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_as(sd_bus_message *m, std::vector<std::string> &out)
{
    // read variant "as"
    out.clear();
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    while (true)
    {
        const char *u  = nullptr;
        int         rr = sd_bus_message_read_basic(m, 's', &u);
        if (rr < 0)
            return rr;
        if (rr == 0)
            break;
        if (u)
            out.emplace_back(u);
    }
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r1 < 0 || r2 < 0) ? -1 : 0;
}

[[maybe_unused]] static inline bool has_any_uuid(const std::vector<std::string> &have,
                                                 const std::vector<std::string> &want)
{
    for (const auto &w : want)
        for (const auto &h : have)
            if (ieq(h, w))
                return true;
    return false;
}

}  // namespace transport
