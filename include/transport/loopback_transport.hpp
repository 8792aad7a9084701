#pragma once
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "proto/framing.hpp"
#include "transport/itransport.hpp"

namespace transport
{

// In-process Moment device. Records every write, reassembles UART RX packets the way the
// device firmware does, and serves reads from a table. Tests use the knobs below to defer
// completions or inject failures.
class LoopbackPeripheral final : public IPeripheral
{
  public:
    struct Write
    {
        GattRef ref;
        Bytes   value;
    };

    LoopbackPeripheral(std::string id, std::string name);

    std::string identifier() const override { return id_; }
    std::string name() const override;
    bool        is_connected() const override;

    void connect(std::chrono::milliseconds timeout, OnDone done) override;
    void disconnect() override;  // local, does not fire the disconnect callback
    void write_value(const GattRef &ref, const Bytes &value, OnDone done) override;
    void read_value(const GattRef &ref, OnRead done) override;
    void set_on_disconnect(std::function<void()> cb) override;

    // --- device emulation knobs ---
    void set_name(std::string name);
    void set_connected(bool connected);  // pre-existing link, no callback
    void set_connect_error(std::optional<std::string> err);
    void set_read(const std::string &characteristic, Bytes value);
    // Write number `index` (0-based, counting every write_value call) fails with `reason`
    void fail_write_at(std::size_t index, std::string reason);
    // Hold completions until complete_next() instead of completing inline
    void        set_deferred(bool deferred);
    bool        complete_next(const Status &st = std::nullopt);
    std::size_t deferred_count() const;
    // Remote side drops the link, fires the disconnect callback
    void drop_link();

    // --- observation ---
    std::vector<Write> writes() const;
    std::vector<Bytes> writes_to(const std::string &characteristic) const;
    std::vector<Bytes> payloads() const;  // deframed UART RX messages
    std::size_t        resets() const;    // [0x00] signals seen
    std::size_t        malformed() const;

  private:
    struct Deferred
    {
        Write  w;
        OnDone done;
    };

    void accept_locked(const Write &w);

    mutable std::mutex mu_;
    std::string        id_;
    std::string        name_;
    bool               connected_ = false;

    std::optional<std::string>   connect_error_;
    std::map<std::string, Bytes> reads_;
    std::optional<std::size_t>   fail_index_;
    std::string                  fail_reason_;
    bool                         deferred_ = false;
    std::deque<Deferred>         pending_;
    std::function<void()>        on_disconnect_;

    std::vector<Write> writes_;
    proto::Deframer    deframer_;
    std::vector<Bytes> payloads_;
    std::size_t        resets_    = 0;
    std::size_t        malformed_ = 0;
};

// Fake central for testing the pipeline (CLI -> daemon -> session) without BLE.
class LoopbackCentral final : public ICentral
{
  public:
    bool        start() override;
    void        stop() override;
    std::string name() const override { return "loopback"; }

    std::vector<std::shared_ptr<IPeripheral>>
    retrieve_peripherals(const std::vector<std::string> &ids) override;
    std::vector<std::shared_ptr<IPeripheral>>
         retrieve_connected(const std::vector<std::string> &service_uuids) override;
    bool scan(const std::vector<std::string> &service_uuids, std::chrono::milliseconds timeout,
              OnScan on_event) override;
    void stop_scan() override;

    // Known to the host. Advertising peripherals show up in scans.
    void add(const std::shared_ptr<LoopbackPeripheral> &p, bool advertising = true);
    // Next scan fails immediately with `err`
    void set_scan_error(std::optional<std::string> err);
    // false: a scan keeps running until stop_scan() instead of timing out right away
    void set_scan_times_out(bool v);

    bool        scanning() const;
    std::size_t scans_started() const;

  private:
    struct Entry
    {
        std::shared_ptr<LoopbackPeripheral> p;
        bool                                advertising;
    };

    mutable std::mutex         mu_;
    bool                       started_ = false;
    std::vector<Entry>         known_;
    std::optional<std::string> scan_error_;
    bool                       scan_times_out_ = true;
    bool                       scanning_       = false;
    std::size_t                scans_          = 0;
    OnScan                     on_scan_;
};

}  // namespace transport
