#include <utility>

#include "transport/loopback_transport.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace transport
{

// ======================================================================
// LoopbackPeripheral
// - Completions run inline on the caller's thread unless deferred.
// - Callbacks are never invoked while mu_ is held.
// ======================================================================
LoopbackPeripheral::LoopbackPeripheral(std::string id, std::string name)
    : id_(std::move(id)), name_(std::move(name))
{
}

std::string LoopbackPeripheral::name() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return name_;
}

bool LoopbackPeripheral::is_connected() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return connected_;
}

void LoopbackPeripheral::connect(std::chrono::milliseconds timeout, OnDone done)
{
    Status st;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (connect_error_)
            st = connect_error_;
        else
            connected_ = true;
    }
    if (st)
        LOG_WARN("[LOOPBACK] connect %s failed: %s", id_.c_str(), st->c_str());
    else
        LOG_DEBUG("[LOOPBACK] connected %s (timeout %lld ms)", id_.c_str(),
                  (long long)timeout.count());
    if (done)
        done(st);
}

void LoopbackPeripheral::disconnect()
{
    std::lock_guard<std::mutex> lk(mu_);
    connected_ = false;
    deframer_.clear();
}

void LoopbackPeripheral::accept_locked(const Write &w)
{
    if (w.ref.characteristic != constants::UART_RX_UUID)
        return;

    switch (deframer_.feed(w.value))
    {
        case proto::Deframer::Event::Payload:
            payloads_.push_back(deframer_.payload());
            LOG_INFO("[LOOPBACK] payload received (%zu bytes)", deframer_.payload().size());
            break;
        case proto::Deframer::Event::Reset:
            resets_++;
            LOG_INFO("[LOOPBACK] VM reset");
            break;
        case proto::Deframer::Event::Malformed:
            malformed_++;
            break;
        case proto::Deframer::Event::None:
            break;
    }
}

void LoopbackPeripheral::write_value(const GattRef &ref, const Bytes &value, OnDone done)
{
    Status st;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connected_)
        {
            st = "not connected";
        }
        else
        {
            const std::size_t idx = writes_.size();
            writes_.push_back(Write{ref, value});
            if (fail_index_ && *fail_index_ == idx)
            {
                st = fail_reason_;
            }
            else if (deferred_)
            {
                pending_.push_back(Deferred{writes_.back(), std::move(done)});
                return;
            }
            else
            {
                accept_locked(writes_.back());
            }
        }
    }
    if (st)
        LOG_WARN("[LOOPBACK] write to %s failed: %s", ref.characteristic.c_str(), st->c_str());
    if (done)
        done(st);
}

void LoopbackPeripheral::read_value(const GattRef &ref, OnRead done)
{
    Status st;
    Bytes  value;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connected_)
        {
            st = "not connected";
        }
        else if (auto it = reads_.find(ref.characteristic); it != reads_.end())
        {
            value = it->second;
        }
        else
        {
            st = "read not permitted: " + ref.characteristic;
        }
    }
    if (done)
        done(st, value);
}

void LoopbackPeripheral::set_on_disconnect(std::function<void()> cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_disconnect_ = std::move(cb);
}

void LoopbackPeripheral::set_name(std::string name)
{
    std::lock_guard<std::mutex> lk(mu_);
    name_ = std::move(name);
}

void LoopbackPeripheral::set_connected(bool connected)
{
    std::lock_guard<std::mutex> lk(mu_);
    connected_ = connected;
}

void LoopbackPeripheral::set_connect_error(std::optional<std::string> err)
{
    std::lock_guard<std::mutex> lk(mu_);
    connect_error_ = std::move(err);
}

void LoopbackPeripheral::set_read(const std::string &characteristic, Bytes value)
{
    std::lock_guard<std::mutex> lk(mu_);
    reads_[characteristic] = std::move(value);
}

void LoopbackPeripheral::fail_write_at(std::size_t index, std::string reason)
{
    std::lock_guard<std::mutex> lk(mu_);
    fail_index_  = index;
    fail_reason_ = std::move(reason);
}

void LoopbackPeripheral::set_deferred(bool deferred)
{
    std::lock_guard<std::mutex> lk(mu_);
    deferred_ = deferred;
}

bool LoopbackPeripheral::complete_next(const Status &st)
{
    Deferred d;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (pending_.empty())
            return false;
        d = std::move(pending_.front());
        pending_.pop_front();
        if (!st)
            accept_locked(d.w);
    }
    if (d.done)
        d.done(st);
    return true;
}

std::size_t LoopbackPeripheral::deferred_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.size();
}

void LoopbackPeripheral::drop_link()
{
    std::function<void()> cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connected_)
            return;
        connected_ = false;
        deframer_.clear();
        cb = on_disconnect_;
    }
    LOG_INFO("[LOOPBACK] link to %s dropped", id_.c_str());
    if (cb)
        cb();
}

std::vector<LoopbackPeripheral::Write> LoopbackPeripheral::writes() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return writes_;
}

std::vector<Bytes> LoopbackPeripheral::writes_to(const std::string &characteristic) const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Bytes> out;
    for (const auto &w : writes_)
    {
        if (w.ref.characteristic == characteristic)
            out.push_back(w.value);
    }
    return out;
}

std::vector<Bytes> LoopbackPeripheral::payloads() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return payloads_;
}

std::size_t LoopbackPeripheral::resets() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return resets_;
}

std::size_t LoopbackPeripheral::malformed() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return malformed_;
}

// ======================================================================
// LoopbackCentral
// - scan() reports synchronously: Started, one Result per advertising
//   peripheral, then Stopped unless set_scan_times_out(false).
// ======================================================================
bool LoopbackCentral::start()
{
    std::lock_guard<std::mutex> lk(mu_);
    started_ = true;
    return true;
}

void LoopbackCentral::stop()
{
    stop_scan();
    std::lock_guard<std::mutex> lk(mu_);
    started_ = false;
}

std::vector<std::shared_ptr<IPeripheral>>
LoopbackCentral::retrieve_peripherals(const std::vector<std::string> &ids)
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::shared_ptr<IPeripheral>> out;
    for (const auto &id : ids)
    {
        for (const auto &e : known_)
        {
            if (e.p->identifier() == id)
            {
                out.push_back(e.p);
                break;
            }
        }
    }
    return out;
}

std::vector<std::shared_ptr<IPeripheral>>
LoopbackCentral::retrieve_connected(const std::vector<std::string> &service_uuids)
{
    (void)service_uuids;  // every emulated device exposes the Moment services
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::shared_ptr<IPeripheral>> out;
    for (const auto &e : known_)
    {
        if (e.p->is_connected())
            out.push_back(e.p);
    }
    return out;
}

bool LoopbackCentral::scan(const std::vector<std::string> &service_uuids,
                           std::chrono::milliseconds timeout, OnScan on_event)
{
    (void)service_uuids;
    std::vector<std::shared_ptr<IPeripheral>> found;
    Status                                    err;
    bool                                      finish = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
        {
            LOG_WARN("[LOOPBACK] scan requested before start()");
            return false;
        }
        if (scanning_)
        {
            LOG_WARN("[LOOPBACK] scan already running");
            return false;
        }
        scans_++;
        err = scan_error_;
        if (!err)
        {
            for (const auto &e : known_)
            {
                if (e.advertising)
                    found.push_back(e.p);
            }
            scanning_ = !scan_times_out_;
            if (scanning_)
                on_scan_ = on_event;
            finish = scan_times_out_;
        }
    }

    if (err)
    {
        LOG_WARN("[LOOPBACK] scan failed: %s", err->c_str());
        on_event(ScanEvent::Stopped, nullptr, err);
        return true;
    }

    LOG_DEBUG("[LOOPBACK] scan started (timeout %lld ms, %zu advertiser(s))",
              (long long)timeout.count(), found.size());
    on_event(ScanEvent::Started, nullptr, std::nullopt);
    for (const auto &p : found)
        on_event(ScanEvent::Result, p, std::nullopt);
    if (finish)
        on_event(ScanEvent::Stopped, nullptr, std::nullopt);
    return true;
}

void LoopbackCentral::stop_scan()
{
    OnScan cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!scanning_)
            return;
        scanning_ = false;
        cb.swap(on_scan_);
    }
    if (cb)
        cb(ScanEvent::Stopped, nullptr, std::nullopt);
}

void LoopbackCentral::add(const std::shared_ptr<LoopbackPeripheral> &p, bool advertising)
{
    std::lock_guard<std::mutex> lk(mu_);
    known_.push_back(Entry{p, advertising});
}

void LoopbackCentral::set_scan_error(std::optional<std::string> err)
{
    std::lock_guard<std::mutex> lk(mu_);
    scan_error_ = std::move(err);
}

void LoopbackCentral::set_scan_times_out(bool v)
{
    std::lock_guard<std::mutex> lk(mu_);
    scan_times_out_ = v;
}

bool LoopbackCentral::scanning() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return scanning_;
}

std::size_t LoopbackCentral::scans_started() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return scans_;
}

}  // namespace transport
