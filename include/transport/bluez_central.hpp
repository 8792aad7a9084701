#pragma once
#include <memory>
#include <string>
#include <vector>

#include "transport/itransport.hpp"

namespace transport
{

struct BluezConfig
{
    std::string adapter = "hci0";
};

// ICentral over BlueZ (org.bluez on the system bus, via sd-bus).
//
// Peripherals are identified by their MAC address. A bus thread processes
// signals and method replies; completions are delivered from that thread
// after bus_mu is released.
class BluezCentral final : public ICentral
{
  public:
    struct Impl;

    explicit BluezCentral(BluezConfig cfg);
    ~BluezCentral() override;

    BluezCentral(const BluezCentral &)            = delete;
    BluezCentral &operator=(const BluezCentral &) = delete;

    bool        start() override;
    void        stop() override;
    std::string name() const override { return "bluez"; }

    std::vector<std::shared_ptr<IPeripheral>>
    retrieve_peripherals(const std::vector<std::string> &ids) override;
    std::vector<std::shared_ptr<IPeripheral>>
         retrieve_connected(const std::vector<std::string> &service_uuids) override;
    bool scan(const std::vector<std::string> &service_uuids, std::chrono::milliseconds timeout,
              OnScan on_event) override;
    void stop_scan() override;

    const BluezConfig &config() const noexcept { return cfg_; }

  private:
    BluezConfig           cfg_;
    std::shared_ptr<Impl> impl_;
};

}  // namespace transport
