#include <utility>

#include "app/connection_manager.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

ConnectionManager::ConnectionManager(transport::ICentral &central,
                                     IdentityStore       &store,
                                     util::EventLoop     &loop)
    : central_(central), store_(store), loop_(loop)
{
}

bool ConnectionManager::is_moment(const std::shared_ptr<transport::IPeripheral> &p)
{
    return p && p->name() == constants::DEVICE_NAME;
}

std::vector<std::string> ConnectionManager::advertised_services()
{
    return {std::string(constants::HAPTIC_SVC_UUID)};
}

void ConnectionManager::fail(ConnectCallback &done, Errc code, const std::string &msg)
{
    connecting_ = false;
    LOG_WARN("[CONN] %s: %s", errc_name(code), msg.c_str());
    if (done)
        done(Error{code, msg}, nullptr);
}

// ======================================================================
// Function: ConnectionManager::connect
// - Out: done(nullopt, session) once bound, done(error, nullptr) otherwise
// - Note: an already bound and connected session is returned as is
// ======================================================================
void ConnectionManager::connect(ConnectCallback done)
{
    if (session_ && session_->state() == DeviceSession::State::Connected)
    {
        auto s = session_;
        loop_.post([done, s] {
            if (done)
                done(std::nullopt, s);
        });
        return;
    }
    if (connecting_)
    {
        loop_.post([done] {
            if (done)
                done(Error{Errc::InvalidArgument, "connect already in progress"}, nullptr);
        });
        return;
    }
    connecting_ = true;

    // 1. stored identity
    if (auto id = store_.load())
    {
        auto known = central_.retrieve_peripherals({*id});
        if (!known.empty())
        {
            LOG_INFO("[CONN] reconnecting to stored device %s", id->c_str());
            dial(known.front(), /*persist=*/false, std::move(done));
            return;
        }
        LOG_INFO("[CONN] stored device %s unknown to %s", id->c_str(), central_.name().c_str());
    }

    // 2. already connected to the host
    for (const auto &p : central_.retrieve_connected(advertised_services()))
    {
        if (is_moment(p))
        {
            LOG_INFO("[CONN] using device %s already connected to the host",
                     p->identifier().c_str());
            dial(p, /*persist=*/true, std::move(done));
            return;
        }
    }

    // 3. discovery
    discover(std::move(done));
}

void ConnectionManager::dial(const std::shared_ptr<transport::IPeripheral> &p,
                             bool                                           persist,
                             ConnectCallback                                done)
{
    auto s = std::make_shared<DeviceSession>(p, loop_);
    s->connect(constants::CONNECT_TIMEOUT,
               [this, s, persist, done](const std::optional<Error> &err) mutable {
                   if (err)
                   {
                       fail(done, err->code, err->message);
                       return;
                   }
                   if (s->name() != constants::DEVICE_NAME)
                   {
                       const std::string n = s->name().empty() ? "Unknown" : s->name();
                       s->disconnect();
                       fail(done, Errc::UnexpectedIdentity, "unexpectedly connected to " + n);
                       return;
                   }
                   if (persist && !store_.save(s->identifier()))
                       LOG_WARN("[CONN] identity of %s not persisted", s->identifier().c_str());
                   connecting_ = false;
                   bind(s);
                   if (done)
                       done(std::nullopt, s);
               });
}

void ConnectionManager::discover(ConnectCallback done)
{
    auto d  = std::make_shared<Discovery>();
    d->done = std::move(done);

    LOG_INFO("[CONN] scanning for %.*s (%lld ms)", (int)constants::DEVICE_NAME.size(),
             constants::DEVICE_NAME.data(), (long long)constants::SCAN_TIMEOUT.count());
    const bool started = central_.scan(
        advertised_services(), constants::SCAN_TIMEOUT,
        [this, d](transport::ScanEvent ev, const std::shared_ptr<transport::IPeripheral> &p,
                  const transport::Status &st) {
            // transport thread: hop onto the loop
            loop_.post([this, d, ev, p, st] { on_discovery_event(d, ev, p, st); });
        });
    if (!started)
    {
        d->matched = true;
        fail(d->done, Errc::DiscoveryFailure, "scan could not be started");
    }
}

void ConnectionManager::on_discovery_event(const std::shared_ptr<Discovery>             &d,
                                           transport::ScanEvent                           ev,
                                           const std::shared_ptr<transport::IPeripheral> &p,
                                           const transport::Status                       &st)
{
    if (d->matched)
        return;

    switch (ev)
    {
        case transport::ScanEvent::Started:
            LOG_DEBUG("[CONN] scan started");
            break;
        case transport::ScanEvent::Result:
            if (!is_moment(p))
                break;
            d->matched = true;
            central_.stop_scan();
            LOG_INFO("[CONN] discovered %s", p->identifier().c_str());
            if (!store_.save(p->identifier()))
                LOG_WARN("[CONN] identity of %s not persisted", p->identifier().c_str());
            dial(p, /*persist=*/false, std::move(d->done));
            break;
        case transport::ScanEvent::Stopped:
            d->matched = true;
            if (st)
                fail(d->done, Errc::DiscoveryFailure, "scan failed: " + *st);
            else
                fail(d->done, Errc::DiscoveryFailure, "failed to discover a Moment device");
            break;
    }
}

// ======================================================================
// Function: ConnectionManager::retrieve_available_devices
// - Out: connected Moments first, then advertisers in discovery order
// - Note: a device matching the bound session reuses that session
// ======================================================================
void ConnectionManager::retrieve_available_devices(DevicesCallback done)
{
    auto e  = std::make_shared<Enumeration>();
    e->done = std::move(done);

    for (const auto &p : central_.retrieve_connected(advertised_services()))
    {
        if (is_moment(p))
            e->found.push_back(p);
    }

    const bool started = central_.scan(
        advertised_services(), constants::SCAN_TIMEOUT,
        [this, e](transport::ScanEvent ev, const std::shared_ptr<transport::IPeripheral> &p,
                  const transport::Status &st) {
            loop_.post([this, e, ev, p, st] { on_enumeration_event(e, ev, p, st); });
        });
    if (!started)
    {
        loop_.post([e] {
            if (e->done)
                e->done(Error{Errc::DiscoveryFailure, "scan could not be started"}, {});
        });
    }
}

void ConnectionManager::on_enumeration_event(const std::shared_ptr<Enumeration>             &e,
                                             transport::ScanEvent                           ev,
                                             const std::shared_ptr<transport::IPeripheral> &p,
                                             const transport::Status                       &st)
{
    if (ev == transport::ScanEvent::Result)
    {
        if (!is_moment(p))
            return;
        for (const auto &f : e->found)
        {
            if (f->identifier() == p->identifier())
                return;
        }
        e->found.push_back(p);
        return;
    }
    if (ev != transport::ScanEvent::Stopped)
        return;

    if (st)
    {
        LOG_WARN("[CONN] enumeration scan failed: %s", st->c_str());
        if (e->done)
            e->done(Error{Errc::DiscoveryFailure, "scan failed: " + *st}, {});
        return;
    }

    std::vector<std::shared_ptr<DeviceSession>> sessions;
    for (const auto &p2 : e->found)
    {
        if (session_ && session_->identifier() == p2->identifier())
            sessions.push_back(session_);
        else
            sessions.push_back(std::make_shared<DeviceSession>(p2, loop_));
    }
    LOG_INFO("[CONN] %zu Moment device(s) available", sessions.size());
    if (e->done)
        e->done(std::nullopt, sessions);
}

void ConnectionManager::bind(const std::shared_ptr<DeviceSession> &s)
{
    if (session_ && session_ != s)
        session_->disconnect();
    session_ = s;
    std::weak_ptr<DeviceSession> weak = s;
    s->set_on_link_lost([this, weak] {
        auto lost = weak.lock();
        if (lost && lost == session_)
        {
            LOG_INFO("[CONN] releasing session %s", lost->identifier().c_str());
            session_.reset();
        }
    });
}

void ConnectionManager::disconnect()
{
    if (!session_)
        return;
    session_->disconnect();
    session_.reset();
}

bool ConnectionManager::forget()
{
    disconnect();
    LOG_INFO("[CONN] forgetting stored device");
    return store_.clear();
}

}  // namespace app
