/* ======================================================================
 * BlueZ Central
 *
 *  App thread                       Bus thread                 BlueZ/DBus
 *  ----------                       -----------                -----------
 *  start()
 *    └─ subscribe signals ────────────────────────────────────▶  InterfacesAdded/Removed, PropertiesChanged
 *    └─ refresh device table ─────────────────────────────────▶  ObjectManager.GetManagedObjects
 *    └─ spawn bus loop
 *
 *  scan(uuids, timeout)
 *    └─ set_discovery_filter ─────────────────────────────────▶  Adapter1.SetDiscoveryFilter
 *    └─ start_discovery ──────────────────────────────────────▶  Adapter1.StartDiscovery
 *                                     ◀── InterfacesAdded / RSSI change: Result
 *                                     pump: deadline → StopDiscovery, Stopped
 *
 *  peripheral.connect(timeout)
 *    └─ Connect (async) ──────────────────────────────────────▶  Device1.Connect
 *                                     ◀── on_connect_reply
 *                                     ◀── PropertiesChanged: ServicesResolved=true → done
 *                                     pump: deadline → Disconnect, "connection timed out"
 *
 *  peripheral.write_value / read_value
 *    └─ resolve characteristic path (cache, else GetManagedObjects)
 *    └─ WriteValue / ReadValue (async) ───────────────────────▶  GattCharacteristic1
 *                                     ◀── on_write_reply / on_read_reply → done
 *
 *  Notes
 *    └─ DBus calls on the app thread are made under impl_->bus_mu
 *    └─ sd-bus callbacks run on the bus thread with bus_mu held; user
 *       callbacks are queued to impl_->ready and run after unlocking
 * ====================================================================== */

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

// clang-format off
#include "transport/bluez_central.hpp"
#include "transport/bluez_central_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"
// clang-format on

namespace transport
{
namespace
{

static uint64_t now_ms()
{
    using namespace std::chrono;
    return (uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

static void unref_slot(sd_bus_slot *&slot)
{
    if (slot)
    {
        sd_bus_slot_unref(slot);
        slot = nullptr;
    }
}

static std::string error_text(const sd_bus_error *e, int r)
{
    if (e && e->message && *e->message)
        return e->message;
    if (e && e->name && *e->name)
        return e->name;
    return strerror(r < 0 ? -r : r);
}

static std::string char_key(const GattRef &ref)
{
    return ref.service + "/" + ref.characteristic;
}

// Userdata of one async Device1.Connect call
struct ConnectOp
{
    BluezCentral::Impl *impl;
    std::string         path;
    uint64_t            gen;
};

// Userdata of one async WriteValue / ReadValue call
struct GattOp
{
    BluezCentral::Impl *impl;
    std::string         char_path;
    OnDone              on_write;
    OnRead              on_read;
};

template <typename Op> static void release_op(void *userdata)
{
    std::unique_ptr<Op> op(static_cast<Op *>(userdata));
}

// ======================================================================
// Function: call_async_floating
// - In: bus_mu locked, sealed-or-not method call, reply handler, userdata
// - Out: sd-bus result. On success the slot owns `op` and frees it from its
//        destroy callback, on failure `op` is left with the caller.
// ======================================================================
template <typename Op>
static int call_async_floating(sd_bus *bus, sd_bus_message *msg, sd_bus_message_handler_t cb,
                               std::unique_ptr<Op> &op, uint64_t usec = 0)
{
    sd_bus_slot *slot = nullptr;
    int          r    = sd_bus_call_async(bus, &slot, msg, cb, op.get(), usec);
    if (r < 0)
        return r;
    op.release();
    sd_bus_slot_set_destroy_callback(slot, &release_op<Op>);
    sd_bus_slot_set_floating(slot, 1);
    sd_bus_slot_unref(slot);
    return r;
}

// ======================================================================
// Function: append_write_options
// - In: message positioned after the value
// - Out: appends a{sv} {type: "request", offset: 0}
// - Note: Write Request, the device acknowledges each chunk
// ======================================================================
static int append_write_options(sd_bus_message *msg)
{
    int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    // dict entry: "type" -> variant "s" = "request"
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        return r;
    r = sd_bus_message_append(msg, "s", "type");
    if (r < 0)
        return r;
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    r = sd_bus_message_append(msg, "s", "request");
    if (r < 0)
        return r;
    r = sd_bus_message_close_container(msg);  // variant
    if (r < 0)
        return r;
    r = sd_bus_message_close_container(msg);  // dict-entry
    if (r < 0)
        return r;
    // dict entry: "offset" -> variant "q" = 0
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        return r;
    r = sd_bus_message_append(msg, "s", "offset");
    if (r < 0)
        return r;
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "q");
    if (r < 0)
        return r;
    r = sd_bus_message_append(msg, "q", (uint16_t)0);
    if (r < 0)
        return r;
    r = sd_bus_message_close_container(msg);  // variant
    if (r < 0)
        return r;
    r = sd_bus_message_close_container(msg);  // dict-entry
    if (r < 0)
        return r;
    return sd_bus_message_close_container(msg);  // a{sv}
}

}  // namespace

// ======================================================================
// Impl: adapter control
// ======================================================================

// ======================================================================
// Function: Impl::set_discovery_filter_locked
// - In: bus_mu locked, service UUIDs to filter on (may be empty)
// - Out: true on success
// - Note: Transport=le, DuplicateData=false, UUIDs=<uuids>
// ======================================================================
bool BluezCentral::Impl::set_discovery_filter_locked(const std::vector<std::string> &uuids)
{
    if (!bus)
        return false;

    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_message_new_method_call(bus, &msg, "org.bluez", adapter_path.c_str(),
                                           "org.bluez.Adapter1", "SetDiscoveryFilter");
    if (r < 0)
        goto out;

    // a{sv}
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        goto out;
    // Transport="le"
    r = sd_bus_message_append(msg, "{sv}", "Transport", "s", "le");
    if (r < 0)
        goto out;
    // DuplicateData=false
    r = sd_bus_message_append(msg, "{sv}", "DuplicateData", "b", 0);
    if (r < 0)
        goto out;
    // UUIDs=[...]
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "s", "UUIDs");
    if (r < 0)
        goto out;
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        goto out;
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        goto out;
    for (const auto &u : uuids)
    {
        r = sd_bus_message_append(msg, "s", u.c_str());
        if (r < 0)
            goto out;
    }
    r = sd_bus_message_close_container(msg);  // array
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // variant
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // dict
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // a{sv}
    if (r < 0)
        goto out;

    r = sd_bus_call(bus, msg, 0, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);

    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] SetDiscoveryFilter failed: %s", error_text(&err, r).c_str());
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ][central] SetDiscoveryFilter OK (Transport=le, %zu UUID(s))", uuids.size());
    return true;
}

// ======================================================================
// Function: Impl::start_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true if discovery is on afterwards
// - Note: InProgress counts as success
// ======================================================================
bool BluezCentral::Impl::start_discovery_locked()
{
    if (!bus)
        return false;
    if (discovery_on)
        return true;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StartDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (err.name && std::strcmp(err.name, "org.bluez.Error.InProgress") == 0)
        {
            discovery_on = true;
            LOG_INFO("[BLUEZ][central] StartDiscovery already in progress on %s",
                     adapter_path.c_str());
            sd_bus_error_free(&err);
            return true;
        }
        LOG_WARN("[BLUEZ][central] StartDiscovery failed: %s", error_text(&err, r).c_str());
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    discovery_on = true;
    LOG_SYSTEM("[BLUEZ][central] StartDiscovery OK on %s", adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: Impl::stop_discovery_locked
// - In: bus_mu locked
// - Out: discovery_on is false afterwards, even if StopDiscovery fails
// ======================================================================
void BluezCentral::Impl::stop_discovery_locked()
{
    if (!bus || !discovery_on)
        return;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
        LOG_WARN("[BLUEZ][central] StopDiscovery failed (treat as off): %s",
                 error_text(&err, r).c_str());
    else
        LOG_SYSTEM("[BLUEZ][central] StopDiscovery OK");
    sd_bus_error_free(&err);
    discovery_on = false;
}

// ======================================================================
// Function: Impl::send_no_reply_locked
// - In: bus_mu locked, object path, interface and no-argument method
// - Out: message queued, no reply expected
// - Note: used for best-effort Disconnect
// ======================================================================
void BluezCentral::Impl::send_no_reply_locked(const std::string &path, const char *iface,
                                              const char *method)
{
    if (!bus)
        return;
    sd_bus_message *msg = nullptr;
    int r = sd_bus_message_new_method_call(bus, &msg, "org.bluez", path.c_str(), iface, method);
    if (r >= 0)
        r = sd_bus_message_set_expect_reply(msg, 0);
    if (r >= 0)
        r = sd_bus_send(bus, msg, nullptr);
    if (msg)
        sd_bus_message_unref(msg);
    if (r < 0)
        LOG_WARN("[BLUEZ][central] %s.%s on %s failed: %s", iface, method, path.c_str(),
                 strerror(-r));
}

// ======================================================================
// Impl: device table
// ======================================================================

bool BluezCentral::Impl::is_device_path(const std::string &path) const
{
    const std::string prefix = adapter_path + "/dev_";
    return path.rfind(prefix, 0) == 0 && path.find('/', prefix.size()) == std::string::npos;
}

DeviceInfo &BluezCentral::Impl::device_locked(const std::string &path)
{
    auto it = devices.find(path);
    if (it == devices.end())
    {
        DeviceInfo d;
        d.path    = path;
        d.address = path_to_mac(path);
        it        = devices.emplace(path, std::move(d)).first;
    }
    return it->second;
}

// ======================================================================
// Function: Impl::read_device_props
// - In: message positioned at a Device1 a{sv}
// - Out: bitmask of DeviceProp fields updated in `d`, r < 0 on parse error
// ======================================================================
unsigned BluezCentral::Impl::read_device_props(sd_bus_message *m, DeviceInfo &d, int &r)
{
    unsigned seen = 0;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
        return seen;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return seen;

        if (key && std::strcmp(key, "Address") == 0)
        {
            if ((r = read_var_s(m, d.address)) < 0)
                return seen;
            seen |= PROP_ADDRESS;
        }
        else if (key && std::strcmp(key, "Name") == 0)
        {
            if ((r = read_var_s(m, d.name)) < 0)
                return seen;
            seen |= PROP_NAME;
        }
        else if (key && std::strcmp(key, "UUIDs") == 0)
        {
            if ((r = read_var_as(m, d.uuids)) < 0)
                return seen;
            seen |= PROP_UUIDS;
        }
        else if (key && std::strcmp(key, "RSSI") == 0)
        {
            if ((r = read_var_i16(m, d.rssi)) < 0)
                return seen;
            d.have_rssi = true;
            seen |= PROP_RSSI;
        }
        else if (key && std::strcmp(key, "Connected") == 0)
        {
            if ((r = read_var_b(m, d.connected)) < 0)
                return seen;
            seen |= PROP_CONNECTED;
        }
        else if (key && std::strcmp(key, "ServicesResolved") == 0)
        {
            if ((r = read_var_b(m, d.services_resolved)) < 0)
                return seen;
            seen |= PROP_RESOLVED;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "v")) < 0)
                return seen;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return seen;  // dict-entry
    }
    if (r < 0)
        return seen;
    r = sd_bus_message_exit_container(m);  // a{sv}
    return seen;
}

// ======================================================================
// Function: Impl::refresh_devices_locked
// - In: bus_mu locked
// - Out: device table rebuilt from ObjectManager.GetManagedObjects
// - Note: does not start discovery
// ======================================================================
bool BluezCentral::Impl::refresh_devices_locked()
{
    if (!bus)
        return false;

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] GetManagedObjects failed: %s", error_text(&err, r).c_str());
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }

    std::map<std::string, DeviceInfo> found;

    // Walk a{oa{sa{sv}}}
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto out;
    // =========================
    // Hierarchy:
    // Object path (o)
    // |- Interfaces (a{sa{sv}})
    //     |- Properties ({sv})
    // =========================
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            goto out;
        if (!obj)
        {
            r = -EINVAL;
            goto out;
        }

        std::string path(obj);
        if (!is_device_path(path))
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;
            continue;
        }

        DeviceInfo d;
        d.path    = path;
        d.address = path_to_mac(path);
        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            goto out;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                goto out;
            if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
            {
                (void)read_device_props(reply, d, r);
                if (r < 0)
                    goto out;
            }
            else
            {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    goto out;
            }
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;  // {sa{sv}}
        }
        if (r < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // {oa{sa{sv}}}

        found.emplace(path, std::move(d));
    }
    if (r < 0)
        goto out;

    devices.swap(found);
    LOG_DEBUG("[BLUEZ][central] device table: %zu device(s)", devices.size());

out:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    if (r < 0)
        LOG_WARN("[BLUEZ][central] GetManagedObjects parse failed: %s", strerror(-r));
    return r >= 0;
}

std::shared_ptr<BluezPeripheral> BluezCentral::Impl::find_peripheral_locked(const std::string &path)
{
    auto it = peripherals.find(path);
    if (it == peripherals.end())
        return nullptr;
    auto p = it->second.lock();
    if (!p)
        peripherals.erase(it);
    return p;
}

std::shared_ptr<BluezPeripheral> BluezCentral::Impl::peripheral_for_locked(const DeviceInfo &d)
{
    if (auto p = find_peripheral_locked(d.path))
        return p;
    std::string addr = d.address.empty() ? path_to_mac(d.path) : d.address;
    auto        p    = std::make_shared<BluezPeripheral>(shared_from_this(), addr, d.path);
    peripherals[d.path] = p;
    return p;
}

// ======================================================================
// Function: Impl::resolve_char_locked
// - In: bus_mu locked, connected peripheral, service/characteristic UUIDs
// - Out: object path of the characteristic, "" when not exported
// - Note: walks GetManagedObjects under the device path, caches the hit
// ======================================================================
std::string BluezCentral::Impl::resolve_char_locked(BluezPeripheral &p, const GattRef &ref)
{
    auto cached = p.char_paths_.find(char_key(ref));
    if (cached != p.char_paths_.end())
        return cached->second;
    if (!bus)
        return std::string();

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] GetManagedObjects failed: %s", error_text(&err, r).c_str());
        if (reply)
            sd_bus_message_unref(reply);
        sd_bus_error_free(&err);
        return std::string();
    }

    struct CharObj
    {
        std::string path, uuid, service;
    };
    std::set<std::string> svc_paths;
    std::vector<CharObj>  chars;
    const std::string     dev_prefix = p.path() + "/";
    std::string           result;

    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto done_scan;
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            break;
        if (!obj)
        {
            r = -EINVAL;
            break;
        }

        std::string path(obj);
        // Only consider objects under our device path
        if (path.rfind(dev_prefix, 0) != 0)
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                break;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                break;
            continue;
        }

        // --- Interfaces
        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            break;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                break;
            const bool is_svc  = iface && std::strcmp(iface, "org.bluez.GattService1") == 0;
            const bool is_char = iface && std::strcmp(iface, "org.bluez.GattCharacteristic1") == 0;
            if (is_svc || is_char)
            {
                // --- Properties: UUID (s), Service (o, characteristics only)
                std::string uuid, service;
                if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
                    break;
                while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sv")) >
                       0)
                {
                    const char *key = nullptr;
                    if ((r = sd_bus_message_read(reply, "s", &key)) < 0)
                        break;
                    if (key && std::strcmp(key, "UUID") == 0)
                    {
                        if ((r = read_var_s(reply, uuid)) < 0)
                            break;
                    }
                    else if (key && is_char && std::strcmp(key, "Service") == 0)
                    {
                        if ((r = read_var_s(reply, service)) < 0)
                            break;
                    }
                    else
                    {
                        if ((r = sd_bus_message_skip(reply, "v")) < 0)
                            break;
                    }
                    if ((r = sd_bus_message_exit_container(reply)) < 0)
                        break;
                }
                if (r < 0)
                    break;
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    break;  // exit a{sv}

                if (is_svc && ieq(uuid, ref.service))
                    svc_paths.insert(path);
                else if (is_char && ieq(uuid, ref.characteristic))
                    chars.push_back(CharObj{path, uuid, service});
            }
            else
            {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    break;
            }
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                break;  // {sa{sv}} dict-entry
        }
        if (r < 0)
            break;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            break;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            break;  // {oa{sa{sv}}}
    }

done_scan:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] GATT walk failed: %s", strerror(-r));
        return std::string();
    }

    for (const auto &c : chars)
    {
        if (svc_paths.count(c.service))
        {
            result = c.path;
            break;
        }
    }
    if (!result.empty())
    {
        p.char_paths_[char_key(ref)] = result;
        LOG_INFO("[BLUEZ][central] GATT %s -> %s", ref.characteristic.c_str(), result.c_str());
    }
    return result;
}

// ======================================================================
// Impl: scan / connect state
// ======================================================================

// ======================================================================
// Function: Impl::note_scan_hit_locked
// - In: bus_mu locked, a device that was just added or re-advertised
// - Out: queues one Result per device per scan when it carries a wanted service
// ======================================================================
void BluezCentral::Impl::note_scan_hit_locked(const DeviceInfo &d)
{
    if (!scanning || !on_scan)
        return;
    if (!scan_uuids.empty() && !has_any_uuid(d.uuids, scan_uuids))
        return;
    if (!reported.insert(d.path).second)
        return;

    auto p  = peripheral_for_locked(d);
    auto cb = on_scan;
    if (d.have_rssi)
        LOG_SYSTEM("[BLUEZ][central] found %s addr=%s name=%s rssi=%d", d.path.c_str(),
                   d.address.c_str(), d.name.c_str(), (int)d.rssi);
    else
        LOG_SYSTEM("[BLUEZ][central] found %s addr=%s name=%s", d.path.c_str(),
                   d.address.c_str(), d.name.c_str());
    ready.emplace_back([cb, p] { cb(ScanEvent::Result, p, std::nullopt); });
}

void BluezCentral::Impl::end_scan_locked(const Status &st)
{
    if (!scanning)
        return;
    scanning = false;
    stop_discovery_locked();
    OnScan cb;
    cb.swap(on_scan);
    reported.clear();
    if (cb)
        ready.emplace_back([cb, st] { cb(ScanEvent::Stopped, nullptr, st); });
}

void BluezCentral::Impl::finish_connect_locked(BluezPeripheral &p, const Status &st)
{
    OnDone done;
    done.swap(p.connect_done_);
    p.connect_replied_     = false;
    p.connect_deadline_ms_ = 0;
    if (!st)
    {
        p.link_up_ = true;
        LOG_SYSTEM("[BLUEZ][central] %s ready", p.path().c_str());
    }
    else
    {
        LOG_WARN("[BLUEZ][central] connect %s failed: %s", p.path().c_str(), st->c_str());
    }
    if (done)
        ready.emplace_back([done, st] { done(st); });
}

void BluezCentral::Impl::maybe_finish_connect_locked(const std::string &path)
{
    auto p = find_peripheral_locked(path);
    if (!p || !p->connect_done_ || !p->connect_replied_)
        return;
    const DeviceInfo &d = device_locked(path);
    if (d.connected && d.services_resolved)
        finish_connect_locked(*p, std::nullopt);
}

void BluezCentral::Impl::fail_connects_locked(const std::string &why)
{
    for (auto &kv : peripherals)
    {
        if (auto p = kv.second.lock(); p && p->connect_done_)
            finish_connect_locked(*p, why);
    }
}

// ======================================================================
// Function: Impl::link_down_locked
// - In: bus_mu locked, device path whose Connected went false (or vanished)
// - Out: pending connect fails, or the disconnect callback is queued when
//        an established link dropped without a local disconnect()
// ======================================================================
void BluezCentral::Impl::link_down_locked(const std::string &path)
{
    auto p = find_peripheral_locked(path);
    if (!p)
        return;
    p->char_paths_.clear();
    if (p->connect_done_)
    {
        finish_connect_locked(*p, std::string("link lost while connecting"));
        return;
    }
    const bool fire = p->link_up_ && !p->local_disconnect_;
    p->link_up_     = false;
    if (fire && p->on_disconnect_)
    {
        LOG_SYSTEM("[BLUEZ][central] Disconnected (%s)", path.c_str());
        auto cb = p->on_disconnect_;
        ready.emplace_back([cb] { cb(); });
    }
}

// ======================================================================
// Function: Impl::pump_locked
// - In: bus_mu locked
// - Out: expires the scan and any connect attempt past its deadline
// ======================================================================
void BluezCentral::Impl::pump_locked(uint64_t now)
{
    if (scanning && now >= scan_deadline_ms)
    {
        LOG_DEBUG("[BLUEZ][central] scan timed out");
        end_scan_locked(std::nullopt);
    }

    for (auto it = peripherals.begin(); it != peripherals.end();)
    {
        auto p = it->second.lock();
        if (!p)
        {
            it = peripherals.erase(it);
            continue;
        }
        ++it;
        if (p->connect_done_ && now >= p->connect_deadline_ms_)
        {
            p->local_disconnect_ = true;
            send_no_reply_locked(p->path(), "org.bluez.Device1", "Disconnect");
            finish_connect_locked(*p, std::string("connection timed out"));
        }
    }
}

// ======================================================================
// Impl: sd-bus callbacks
// ======================================================================

int BluezCentral::Impl::on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<BluezCentral::Impl *>(userdata);

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    const std::string path(obj);
    if (!self->is_device_path(path))
        return 0;

    DeviceInfo &d   = self->device_locked(path);
    bool        hit = false;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;
        if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
        {
            (void)read_device_props(m, d, r);
            if (r < 0)
                return r;
            hit = true;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "a{sv}")) < 0)
                return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;

    if (hit)
    {
        LOG_DEBUG("[BLUEZ][central] InterfacesAdded %s name=%s", obj, d.name.c_str());
        self->note_scan_hit_locked(d);
    }
    return 0;
}

int BluezCentral::Impl::on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<BluezCentral::Impl *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    const std::string path(obj);
    if (self->is_device_path(path))
    {
        // only react when Device1 itself went away
        char **ifaces      = nullptr;
        bool   device_gone = false;
        r                  = sd_bus_message_read_strv(m, &ifaces);
        if (r < 0)
            return r;
        for (char **i = ifaces; i && *i; ++i)
        {
            if (std::strcmp(*i, "org.bluez.Device1") == 0)
                device_gone = true;
            std::free(*i);
        }
        std::free(ifaces);
        if (device_gone && self->devices.count(path))
        {
            self->link_down_locked(path);
            self->devices.erase(path);
            LOG_DEBUG("[BLUEZ][central] InterfacesRemoved -> dropped device %s", obj);
        }
        return 0;
    }

    // a GATT object under a device: drop that device's characteristic cache
    auto pos = path.find("/service");
    if (pos != std::string::npos)
    {
        if (auto p = self->find_peripheral_locked(path.substr(0, pos)))
            p->char_paths_.clear();
    }
    return 0;
}

int BluezCentral::Impl::on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self  = static_cast<BluezCentral::Impl *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;
    if (!iface || std::strcmp(iface, "org.bluez.Device1") != 0)
        return 0;

    const char *path = sd_bus_message_get_path(m);
    if (!path || !self->is_device_path(path))
        return 0;

    DeviceInfo    &d             = self->device_locked(path);
    const bool     was_connected = d.connected;
    const unsigned seen          = read_device_props(m, d, r);
    if (r < 0)
        return r;

    if ((seen & PROP_CONNECTED) && was_connected != d.connected)
    {
        LOG_SYSTEM("[BLUEZ][central] Connected=%s (%s)", d.connected ? "true" : "false", path);
        if (!d.connected)
        {
            d.services_resolved = false;
            self->link_down_locked(path);
        }
    }
    if (seen & PROP_RESOLVED)
    {
        LOG_INFO("[BLUEZ][central] ServicesResolved=%s on %s",
                 d.services_resolved ? "true" : "false", path);
    }
    if (seen & (PROP_CONNECTED | PROP_RESOLVED))
        self->maybe_finish_connect_locked(path);
    if (seen & (PROP_RSSI | PROP_UUIDS | PROP_NAME))
        self->note_scan_hit_locked(d);
    return 0;
}

int BluezCentral::Impl::on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *op   = static_cast<ConnectOp *>(userdata);
    auto *self = op->impl;
    auto  p    = self->find_peripheral_locked(op->path);

    const bool          failed = sd_bus_message_is_method_error(m, nullptr) > 0;
    const sd_bus_error *e      = failed ? sd_bus_message_get_error(m) : nullptr;

    if (!p || p->connect_gen_ != op->gen || !p->connect_done_)
    {
        // reply to an attempt that already timed out or was cancelled
        if (!failed && (!p || !p->link_up_))
        {
            LOG_DEBUG("[BLUEZ][central] late Connect reply for %s, disconnecting",
                      op->path.c_str());
            self->send_no_reply_locked(op->path, "org.bluez.Device1", "Disconnect");
        }
        return 1;
    }

    if (failed)
    {
        const char *ename = (e && e->name) ? e->name : "unknown";
        const char *emsg  = (e && e->message) ? e->message : "no message";
        LOG_ERROR("[BLUEZ][central] Device1.Connect failed: %s: %s", ename, emsg);
        self->finish_connect_locked(*p, std::string(emsg));
        return 1;
    }

    p->connect_replied_ = true;
    self->device_locked(op->path).connected = true;
    LOG_SYSTEM("[BLUEZ][central] Device connected: %s", op->path.c_str());
    self->maybe_finish_connect_locked(op->path);
    return 1;
}

int BluezCentral::Impl::on_write_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto  *op = static_cast<GattOp *>(userdata);
    Status st;
    if (sd_bus_message_is_method_error(m, nullptr) > 0)
    {
        const sd_bus_error *e = sd_bus_message_get_error(m);
        st                    = error_text(e, sd_bus_message_get_errno(m));
        LOG_WARN("[BLUEZ][central] WriteValue %s failed: %s", op->char_path.c_str(), st->c_str());
    }
    else
    {
        LOG_DEBUG("[BLUEZ][central] WriteValue OK (%s)", op->char_path.c_str());
    }
    if (op->on_write)
    {
        OnDone done;
        done.swap(op->on_write);
        op->impl->ready.emplace_back([done, st] { done(st); });
    }
    return 1;
}

int BluezCentral::Impl::on_read_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto  *op = static_cast<GattOp *>(userdata);
    Status st;
    Bytes  value;
    if (sd_bus_message_is_method_error(m, nullptr) > 0)
    {
        const sd_bus_error *e = sd_bus_message_get_error(m);
        st                    = error_text(e, sd_bus_message_get_errno(m));
        LOG_WARN("[BLUEZ][central] ReadValue %s failed: %s", op->char_path.c_str(), st->c_str());
    }
    else
    {
        const void *buf = nullptr;
        size_t      len = 0;
        int         r   = sd_bus_message_read_array(m, 'y', &buf, &len);
        if (r < 0)
            st = std::string("bad ReadValue reply: ") + strerror(-r);
        else if (buf && len)
            value.assign(static_cast<const uint8_t *>(buf),
                         static_cast<const uint8_t *>(buf) + len);
        LOG_DEBUG("[BLUEZ][central] ReadValue %s len=%zu", op->char_path.c_str(), value.size());
    }
    if (op->on_read)
    {
        OnRead done;
        done.swap(op->on_read);
        op->impl->ready.emplace_back([done, st, value] { done(st, value); });
    }
    return 1;
}

// ======================================================================
// BluezPeripheral
// ======================================================================

BluezPeripheral::BluezPeripheral(std::shared_ptr<BluezCentral::Impl> impl, std::string address,
                                 std::string path)
    : impl_(std::move(impl)), address_(std::move(address)), path_(std::move(path))
{
}

std::string BluezPeripheral::name() const
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto                        it = impl_->devices.find(path_);
    return it == impl_->devices.end() ? std::string() : it->second.name;
}

bool BluezPeripheral::is_connected() const
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto                        it = impl_->devices.find(path_);
    return it != impl_->devices.end() && it->second.connected;
}

void BluezPeripheral::set_on_disconnect(std::function<void()> cb)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    on_disconnect_ = std::move(cb);
}

// ======================================================================
// Function: BluezPeripheral::connect
// - In: timeout covering Connect and service resolution
// - Out: `done` once, nullopt when the link is up and GATT is exported
// - Note: completes inline when already connected and resolved
// ======================================================================
void BluezPeripheral::connect(std::chrono::milliseconds timeout, OnDone done)
{
    Status err;
    bool   ready_now = false;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (!impl_->bus || !impl_->running.load())
        {
            err = std::string("bluetooth central is not running");
        }
        else if (connect_done_)
        {
            err = std::string("connect already in progress");
        }
        else
        {
            local_disconnect_ = false;
            const DeviceInfo &d = impl_->device_locked(path_);
            if (d.connected && d.services_resolved)
            {
                link_up_  = true;
                ready_now = true;
            }
            else
            {
                // scanning while connecting makes some controllers abort the connection
                if (!impl_->scanning)
                    impl_->stop_discovery_locked();

                auto op = std::make_unique<ConnectOp>(
                    ConnectOp{impl_.get(), path_, ++connect_gen_});
                sd_bus_message *msg = nullptr;
                int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", path_.c_str(),
                                                       "org.bluez.Device1", "Connect");
                if (r >= 0)
                    r = call_async_floating(impl_->bus, msg, &BluezCentral::Impl::on_connect_reply,
                                            op, (uint64_t)timeout.count() * 1000);
                if (msg)
                    sd_bus_message_unref(msg);
                if (r < 0)
                {
                    LOG_ERROR("[BLUEZ][central] submit Connect() failed: %s", strerror(-r));
                    err = std::string("submit Connect() failed: ") + strerror(-r);
                }
                else
                {
                    connect_done_        = std::move(done);
                    connect_replied_     = false;
                    connect_deadline_ms_ = now_ms() + (uint64_t)timeout.count();
                    LOG_DEBUG("[BLUEZ][central] Connect() submitted for %s", path_.c_str());
                    return;
                }
            }
        }
    }
    if (ready_now)
        LOG_INFO("[BLUEZ][central] %s already connected", path_.c_str());
    if (done)
        done(err);
}

// ======================================================================
// Function: BluezPeripheral::disconnect
// - In: any state
// - Out: Device1.Disconnect sent; the disconnect callback is not fired
// ======================================================================
void BluezPeripheral::disconnect()
{
    OnDone pending;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        local_disconnect_ = true;
        link_up_          = false;
        char_paths_.clear();
        pending.swap(connect_done_);
        connect_replied_ = false;
        impl_->send_no_reply_locked(path_, "org.bluez.Device1", "Disconnect");
    }
    LOG_INFO("[BLUEZ][central] disconnect %s", path_.c_str());
    if (pending)
        pending(std::string("disconnected"));
}

// ======================================================================
// Function: BluezPeripheral::write_value
// - In: characteristic reference, one packet
// - Out: `done` once, from the bus thread after the ATT write response
// ======================================================================
void BluezPeripheral::write_value(const GattRef &ref, const Bytes &value, OnDone done)
{
    Status err;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        std::string cpath;
        if (!impl_->bus)
            err = std::string("bluetooth central is not running");
        else if ((cpath = impl_->resolve_char_locked(*this, ref)).empty())
            err = "characteristic " + ref.characteristic + " not found";

        sd_bus_message *msg = nullptr;
        int             r   = 0;
        if (!err)
        {
            r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", cpath.c_str(),
                                               "org.bluez.GattCharacteristic1", "WriteValue");
            if (r >= 0)
                r = sd_bus_message_append_array(msg, 'y', value.data(), value.size());
            if (r >= 0)
                r = append_write_options(msg);
            if (r >= 0)
            {
                auto op = std::make_unique<GattOp>(
                    GattOp{impl_.get(), cpath, std::move(done), nullptr});
                r = call_async_floating(impl_->bus, msg, &BluezCentral::Impl::on_write_reply, op);
                if (r < 0)
                    done = std::move(op->on_write);
            }
            if (msg)
                sd_bus_message_unref(msg);
            if (r < 0)
                err = std::string("WriteValue failed: ") + strerror(-r);
        }
    }
    if (err)
    {
        LOG_WARN("[BLUEZ][central] write %s: %s", ref.characteristic.c_str(), err->c_str());
        if (done)
            done(err);
    }
}

void BluezPeripheral::read_value(const GattRef &ref, OnRead done)
{
    Status err;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        std::string cpath;
        if (!impl_->bus)
            err = std::string("bluetooth central is not running");
        else if ((cpath = impl_->resolve_char_locked(*this, ref)).empty())
            err = "characteristic " + ref.characteristic + " not found";

        if (!err)
        {
            sd_bus_message *msg = nullptr;
            int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", cpath.c_str(),
                                                   "org.bluez.GattCharacteristic1", "ReadValue");
            if (r >= 0)
                r = sd_bus_message_append(msg, "a{sv}", 0);  // no options
            if (r >= 0)
            {
                auto op = std::make_unique<GattOp>(
                    GattOp{impl_.get(), cpath, nullptr, std::move(done)});
                r = call_async_floating(impl_->bus, msg, &BluezCentral::Impl::on_read_reply, op);
                if (r < 0)
                    done = std::move(op->on_read);
            }
            if (msg)
                sd_bus_message_unref(msg);
            if (r < 0)
                err = std::string("ReadValue failed: ") + strerror(-r);
        }
    }
    if (err)
    {
        LOG_WARN("[BLUEZ][central] read %s: %s", ref.characteristic.c_str(), err->c_str());
        if (done)
            done(err, Bytes{});
    }
}

// ======================================================================
// BluezCentral
// ======================================================================

BluezCentral::BluezCentral(BluezConfig cfg)
    : cfg_(std::move(cfg)), impl_(std::make_shared<Impl>(cfg_.adapter))
{
}

BluezCentral::~BluezCentral()
{
    stop();
}

// ======================================================================
// Function: BluezCentral::start
// - In: adapter name in config
// - Out: signals subscribed, device table loaded, bus loop running
// ======================================================================
bool BluezCentral::start()
{
    if (impl_->running.load())
        return true;

    // connect system bus
    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ][central] failed to connect system bus: %s", strerror(-r));
        impl_->bus = nullptr;
        return false;
    }
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;

    r = sd_bus_match_signal(impl_->bus, &impl_->added_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                            &Impl::on_iface_added, impl_.get());
    if (r >= 0)
        r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                                "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                                &Impl::on_iface_removed, impl_.get());
    // PropertiesChanged (Device1.Connected / ServicesResolved / RSSI ...)
    if (r >= 0)
        r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                                "org.freedesktop.DBus.Properties", "PropertiesChanged",
                                &Impl::on_props_changed, impl_.get());
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] signal subscription failed: %s", strerror(-r));
        unref_slot(impl_->added_slot);
        unref_slot(impl_->removed_slot);
        unref_slot(impl_->props_slot);
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (!impl_->refresh_devices_locked())
            LOG_WARN("[BLUEZ][central] initial device table unavailable (is bluetoothd running?)");
    }
    LOG_INFO("[BLUEZ][central] started on %s", impl_->adapter_path.c_str());

    impl_->running.store(true, std::memory_order_relaxed);
    std::shared_ptr<Impl> impl = impl_;
    impl_->loop = std::thread([impl] {
        while (impl->running.load(std::memory_order_relaxed))
        {
            std::vector<std::function<void()>> ready;
            int                                pr = 0;
            {
                std::lock_guard<std::mutex> lk(impl->bus_mu);
                while ((pr = sd_bus_process(impl->bus, nullptr)) > 0)
                {
                }
                impl->pump_locked(now_ms());
                ready.swap(impl->ready);
            }
            // completions run without bus_mu, they may call back into the central
            for (auto &f : ready)
                f();

            // do not hold the lock while waiting
            const uint64_t WAIT_USEC = 100000;  // 100ms
            if (pr < 0 || sd_bus_wait(impl->bus, WAIT_USEC) < 0)
                std::this_thread::sleep_for(std::chrono::microseconds(WAIT_USEC));
        }
    });
    return true;
}

// ======================================================================
// Function: BluezCentral::stop
// - In: may be called anytime
// - Out: discovery off, pending connects failed, bus thread joined
// - Note: joins the bus loop thread outside of bus_mu
// ======================================================================
void BluezCentral::stop()
{
    if (!impl_->bus)
        return;

    std::vector<std::function<void()>> ready;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        impl_->end_scan_locked(std::string("bluetooth central stopped"));
        impl_->fail_connects_locked("bluetooth central stopped");
        impl_->stop_discovery_locked();
        impl_->running.store(false, std::memory_order_relaxed);
        // wake the loop thread if it's in sd_bus_wait()
        sd_bus_close(impl_->bus);
    }

    if (impl_->loop.joinable())
        impl_->loop.join();

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        ready.swap(impl_->ready);
        unref_slot(impl_->added_slot);
        unref_slot(impl_->removed_slot);
        unref_slot(impl_->props_slot);
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
        impl_->devices.clear();
    }
    for (auto &f : ready)
        f();
    LOG_INFO("[BLUEZ][central] stopped");
}

std::vector<std::shared_ptr<IPeripheral>>
BluezCentral::retrieve_peripherals(const std::vector<std::string> &ids)
{
    std::vector<std::shared_ptr<IPeripheral>> out;
    std::lock_guard<std::mutex>               lk(impl_->bus_mu);
    if (!impl_->refresh_devices_locked())
        return out;
    for (const auto &id : ids)
    {
        for (const auto &kv : impl_->devices)
        {
            if (mac_eq(kv.second.address, id))
            {
                out.push_back(impl_->peripheral_for_locked(kv.second));
                break;
            }
        }
    }
    LOG_DEBUG("[BLUEZ][central] retrieve_peripherals: %zu of %zu known", out.size(), ids.size());
    return out;
}

std::vector<std::shared_ptr<IPeripheral>>
BluezCentral::retrieve_connected(const std::vector<std::string> &service_uuids)
{
    std::vector<std::shared_ptr<IPeripheral>> out;
    std::lock_guard<std::mutex>               lk(impl_->bus_mu);
    if (!impl_->refresh_devices_locked())
        return out;
    for (const auto &kv : impl_->devices)
    {
        const DeviceInfo &d = kv.second;
        if (d.connected && has_any_uuid(d.uuids, service_uuids))
            out.push_back(impl_->peripheral_for_locked(d));
    }
    LOG_DEBUG("[BLUEZ][central] retrieve_connected: %zu", out.size());
    return out;
}

// ======================================================================
// Function: BluezCentral::scan
// - In: service UUIDs, timeout
// - Out: false when not started or a scan is running; otherwise events
//        Started, Result..., Stopped are delivered from the bus thread
// ======================================================================
bool BluezCentral::scan(const std::vector<std::string> &service_uuids,
                        std::chrono::milliseconds timeout, OnScan on_event)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus || !impl_->running.load())
    {
        LOG_WARN("[BLUEZ][central] scan requested before start()");
        return false;
    }
    if (impl_->scanning)
    {
        LOG_WARN("[BLUEZ][central] scan already running");
        return false;
    }

    (void)impl_->set_discovery_filter_locked(service_uuids);
    if (!impl_->start_discovery_locked())
    {
        impl_->ready.emplace_back([on_event] {
            on_event(ScanEvent::Stopped, nullptr, std::string("StartDiscovery failed"));
        });
        return true;
    }

    impl_->scanning         = true;
    impl_->scan_deadline_ms = now_ms() + (uint64_t)timeout.count();
    impl_->scan_uuids       = service_uuids;
    impl_->on_scan          = on_event;
    impl_->reported.clear();
    impl_->ready.emplace_back([on_event] { on_event(ScanEvent::Started, nullptr, std::nullopt); });
    LOG_DEBUG("[BLUEZ][central] scan started (timeout %lld ms)", (long long)timeout.count());
    return true;
}

void BluezCentral::stop_scan()
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    impl_->end_scan_locked(std::nullopt);
}

}  // namespace transport
