#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <systemd/sd-bus.h>

#include "transport/bluez_central.hpp"

namespace transport
{

// Device1 properties we track, one entry per /org/bluez/<adapter>/dev_* object
struct DeviceInfo
{
    std::string              path;
    std::string              address;
    std::string              name;
    std::vector<std::string> uuids;
    int16_t                  rssi              = 0;
    bool                     have_rssi         = false;
    bool                     connected         = false;
    bool                     services_resolved = false;
};

// Bits returned by BluezCentral::Impl::read_device_props
enum DeviceProp : unsigned
{
    PROP_ADDRESS   = 1u << 0,
    PROP_NAME      = 1u << 1,
    PROP_UUIDS     = 1u << 2,
    PROP_RSSI      = 1u << 3,
    PROP_CONNECTED = 1u << 4,
    PROP_RESOLVED  = 1u << 5,
};

class BluezPeripheral final : public IPeripheral
{
  public:
    BluezPeripheral(std::shared_ptr<BluezCentral::Impl> impl, std::string address,
                    std::string path);

    std::string identifier() const override { return address_; }
    std::string name() const override;
    bool        is_connected() const override;

    void connect(std::chrono::milliseconds timeout, OnDone done) override;
    void disconnect() override;
    void write_value(const GattRef &ref, const Bytes &value, OnDone done) override;
    void read_value(const GattRef &ref, OnRead done) override;
    void set_on_disconnect(std::function<void()> cb) override;

    const std::string &path() const noexcept { return path_; }

  private:
    friend struct BluezCentral::Impl;

    std::shared_ptr<BluezCentral::Impl> impl_;
    const std::string                   address_;
    const std::string                   path_;

    // guarded by impl_->bus_mu
    OnDone                             connect_done_;
    uint64_t                           connect_deadline_ms_ = 0;
    uint64_t                           connect_gen_         = 0;
    bool                               connect_replied_     = false;
    bool                               link_up_             = false;
    bool                               local_disconnect_    = false;
    std::function<void()>              on_disconnect_;
    std::map<std::string, std::string> char_paths_;  // "svc/char" -> object path
};

struct BluezCentral::Impl : std::enable_shared_from_this<BluezCentral::Impl>
{
    explicit Impl(std::string adapter) : adapter(std::move(adapter)) {}

    const std::string adapter;
    std::string       adapter_path;

    sd_bus      *bus          = nullptr;
    sd_bus_slot *added_slot   = nullptr;
    sd_bus_slot *removed_slot = nullptr;
    sd_bus_slot *props_slot   = nullptr;

    std::mutex       bus_mu;
    std::thread      loop;
    std::atomic_bool running{false};

    // ---- everything below is guarded by bus_mu ----
    bool                                                  discovery_on = false;
    std::map<std::string, DeviceInfo>                     devices;      // by object path
    std::map<std::string, std::weak_ptr<BluezPeripheral>> peripherals;  // by object path

    bool                     scanning         = false;
    uint64_t                 scan_deadline_ms = 0;
    std::vector<std::string> scan_uuids;
    OnScan                   on_scan;
    std::set<std::string>    reported;

    // completions produced while bus_mu is held, run by the bus thread after unlocking
    std::vector<std::function<void()>> ready;

    // ---- bus_mu held ----
    bool set_discovery_filter_locked(const std::vector<std::string> &uuids);
    bool start_discovery_locked();
    void stop_discovery_locked();
    bool refresh_devices_locked();
    void send_no_reply_locked(const std::string &path, const char *iface, const char *method);

    bool        is_device_path(const std::string &path) const;
    DeviceInfo &device_locked(const std::string &path);

    std::shared_ptr<BluezPeripheral> peripheral_for_locked(const DeviceInfo &d);
    std::shared_ptr<BluezPeripheral> find_peripheral_locked(const std::string &path);
    std::string resolve_char_locked(BluezPeripheral &p, const GattRef &ref);

    void note_scan_hit_locked(const DeviceInfo &d);
    void end_scan_locked(const Status &st);
    void maybe_finish_connect_locked(const std::string &path);
    void finish_connect_locked(BluezPeripheral &p, const Status &st);
    void fail_connects_locked(const std::string &why);
    void link_down_locked(const std::string &path);
    void pump_locked(uint64_t now_ms);

    // ---- sd-bus callbacks, run on the bus thread with bus_mu held ----
    static unsigned read_device_props(sd_bus_message *m, DeviceInfo &d, int &r);
    static int      on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error *ret);
    static int      on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret);
    static int      on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret);
    static int      on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret);
    static int      on_write_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret);
    static int      on_read_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret);
};

}  // namespace transport
