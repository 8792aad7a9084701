#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "app/device_session.hpp"
#include "app/errors.hpp"
#include "app/identity_store.hpp"
#include "transport/itransport.hpp"
#include "util/event_loop.hpp"

namespace app
{

// Resolves the Moment device and binds it to a DeviceSession:
//   1. stored identity -> direct reconnect
//   2. peripherals already connected to the host -> first one named Moment
//   3. discovery scan -> first advertiser named Moment (stored before dialling)
// Explicitly owned by the caller. Call on the loop thread, callbacks fire there too.
class ConnectionManager
{
  public:
    using ConnectCallback =
        std::function<void(const std::optional<Error> &, const std::shared_ptr<DeviceSession> &)>;
    using DevicesCallback = std::function<void(const std::optional<Error> &,
                                               const std::vector<std::shared_ptr<DeviceSession>> &)>;

    ConnectionManager(transport::ICentral &central, IdentityStore &store, util::EventLoop &loop);

    ConnectionManager(const ConnectionManager &)            = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    void connect(ConnectCallback done);

    // Every connected or advertising Moment, deduplicated, each as an independent
    // (not yet connected) session.
    void retrieve_available_devices(DevicesCallback done);

    void disconnect();
    bool forget();  // disconnects and drops the stored identity

    std::shared_ptr<DeviceSession> session() const { return session_; }
    bool                           connecting() const { return connecting_; }

  private:
    struct Discovery
    {
        bool            matched = false;
        ConnectCallback done;
    };
    struct Enumeration
    {
        std::vector<std::shared_ptr<transport::IPeripheral>> found;
        DevicesCallback                                      done;
    };

    void dial(const std::shared_ptr<transport::IPeripheral> &p, bool persist, ConnectCallback done);
    void discover(ConnectCallback done);
    void on_discovery_event(const std::shared_ptr<Discovery>             &d,
                            transport::ScanEvent                           ev,
                            const std::shared_ptr<transport::IPeripheral> &p,
                            const transport::Status                       &st);
    void on_enumeration_event(const std::shared_ptr<Enumeration>             &e,
                              transport::ScanEvent                           ev,
                              const std::shared_ptr<transport::IPeripheral> &p,
                              const transport::Status                       &st);
    void bind(const std::shared_ptr<DeviceSession> &s);
    void fail(ConnectCallback &done, Errc code, const std::string &msg);

    static bool                     is_moment(const std::shared_ptr<transport::IPeripheral> &p);
    static std::vector<std::string> advertised_services();

    transport::ICentral           &central_;
    IdentityStore                 &store_;
    util::EventLoop               &loop_;
    std::shared_ptr<DeviceSession> session_;
    bool                           connecting_ = false;
};

}  // namespace app
