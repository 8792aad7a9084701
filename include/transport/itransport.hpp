#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace transport
{

using Bytes = std::vector<std::uint8_t>;

// nullopt == success, otherwise a human readable reason
using Status = std::optional<std::string>;
using OnDone = std::function<void(const Status &)>;
using OnRead = std::function<void(const Status &, const Bytes &)>;

struct GattRef
{
    std::string service;         // lowercase 128-bit UUID
    std::string characteristic;  // lowercase 128-bit UUID
};

// One remote device. Every async operation completes exactly once, on the transport's own
// thread (or inline). Only one write/read is expected in flight per peripheral.
struct IPeripheral
{
    virtual std::string identifier() const   = 0;  // stable id (BlueZ: MAC address)
    virtual std::string name() const         = 0;  // advertised name, may be empty
    virtual bool        is_connected() const = 0;

    virtual void connect(std::chrono::milliseconds timeout, OnDone done) = 0;
    virtual void disconnect()                                            = 0;

    virtual void write_value(const GattRef &ref, const Bytes &value, OnDone done) = 0;
    virtual void read_value(const GattRef &ref, OnRead done)                      = 0;

    // Fired when an established link drops. Not fired for a failed connect or disconnect().
    virtual void set_on_disconnect(std::function<void()> cb) = 0;

    virtual ~IPeripheral() = default;
};

enum class ScanEvent
{
    Started,
    Result,   // peripheral is set
    Stopped   // status carries the scan error, nullopt on timeout/stop_scan()
};

using OnScan =
    std::function<void(ScanEvent, const std::shared_ptr<IPeripheral> &, const Status &)>;

struct ICentral
{
    virtual bool        start()      = 0;
    virtual void        stop()       = 0;
    virtual std::string name() const { return ""; }

    // Known peripherals by identifier, unknown ids are skipped.
    virtual std::vector<std::shared_ptr<IPeripheral>>
    retrieve_peripherals(const std::vector<std::string> &ids) = 0;

    // Peripherals already connected to this host that expose one of the services.
    virtual std::vector<std::shared_ptr<IPeripheral>>
    retrieve_connected(const std::vector<std::string> &service_uuids) = 0;

    // Reports Started, zero or more Result events, then exactly one Stopped. A single scan
    // runs at a time.
    virtual bool scan(const std::vector<std::string> &service_uuids,
                      std::chrono::milliseconds timeout, OnScan on_event) = 0;
    virtual void stop_scan()                                               = 0;

    virtual ~ICentral() = default;
};

}  // namespace transport
