// tests/test_loopback.cpp
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "proto/framing.hpp"
#include "transport/loopback_transport.hpp"
#include "util/constants.hpp"

using namespace transport;

namespace
{
GattRef uart_rx()
{
    return GattRef{std::string(constants::UART_SVC_UUID), std::string(constants::UART_RX_UUID)};
}

struct ScanLog
{
    std::vector<ScanEvent>   events;
    std::vector<std::string> ids;
    Status                   stop_status;

    OnScan cb()
    {
        return [this](ScanEvent ev, const std::shared_ptr<IPeripheral> &p, const Status &st) {
            events.push_back(ev);
            if (ev == ScanEvent::Result)
                ids.push_back(p->identifier());
            if (ev == ScanEvent::Stopped)
                stop_status = st;
        };
    }
};
}  // namespace

TEST(LoopbackPeripheral, ReassemblesUartMessages)
{
    LoopbackPeripheral dev("AA:BB:CC:DD:EE:01", "Moment");
    dev.set_connected(true);

    std::vector<std::uint8_t> payload(33, 0x5A);
    for (const auto &pkt : proto::make_packets(payload))
        dev.write_value(uart_rx(), pkt, nullptr);
    dev.write_value(uart_rx(), proto::make_packets({})[0], nullptr);

    ASSERT_EQ(dev.payloads().size(), 1u);
    EXPECT_EQ(dev.payloads()[0], payload);
    EXPECT_EQ(dev.resets(), 1u);
    EXPECT_EQ(dev.malformed(), 0u);
    EXPECT_EQ(dev.writes().size(), 3u);
}

TEST(LoopbackPeripheral, OtherCharacteristicsAreNotDeframed)
{
    LoopbackPeripheral dev("AA:BB:CC:DD:EE:01", "Moment");
    dev.set_connected(true);
    GattRef trig{std::string(constants::HAPTIC_SVC_UUID), std::string(constants::TRIGGER_UUID)};
    dev.write_value(trig, {'p'}, nullptr);

    EXPECT_EQ(dev.writes_to(std::string(constants::TRIGGER_UUID)), (std::vector<Bytes>{{'p'}}));
    EXPECT_TRUE(dev.payloads().empty());
    EXPECT_EQ(dev.malformed(), 0u);
}

TEST(LoopbackPeripheral, WriteWhileDisconnectedFails)
{
    LoopbackPeripheral dev("AA:BB:CC:DD:EE:01", "Moment");
    Status             got;
    dev.write_value(uart_rx(), {0x00}, [&](const Status &st) { got = st; });
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, "not connected");
    EXPECT_TRUE(dev.writes().empty());
}

TEST(LoopbackPeripheral, InjectedFailureAndDeferral)
{
    LoopbackPeripheral dev("AA:BB:CC:DD:EE:01", "Moment");
    dev.set_connected(true);
    dev.fail_write_at(1, "ATT error");
    dev.set_deferred(true);

    std::vector<Status> done;
    auto                record = [&](const Status &st) { done.push_back(st); };
    dev.write_value(uart_rx(), {0x00}, record);  // deferred
    dev.write_value(uart_rx(), {0x00}, record);  // fails inline
    ASSERT_EQ(done.size(), 1u);
    EXPECT_EQ(done[0], Status("ATT error"));
    EXPECT_EQ(dev.deferred_count(), 1u);
    EXPECT_EQ(dev.resets(), 0u);

    EXPECT_TRUE(dev.complete_next());
    ASSERT_EQ(done.size(), 2u);
    EXPECT_FALSE(done[1].has_value());
    EXPECT_EQ(dev.resets(), 1u);
    EXPECT_FALSE(dev.complete_next());
}

TEST(LoopbackPeripheral, DropLinkFiresOnce)
{
    LoopbackPeripheral dev("AA:BB:CC:DD:EE:01", "Moment");
    int                dropped = 0;
    dev.set_on_disconnect([&] { dropped++; });

    Status st = std::string("unset");
    dev.connect(constants::CONNECT_TIMEOUT, [&](const Status &s) { st = s; });
    EXPECT_FALSE(st.has_value());
    EXPECT_TRUE(dev.is_connected());

    dev.drop_link();
    dev.drop_link();
    EXPECT_EQ(dropped, 1);
    EXPECT_FALSE(dev.is_connected());

    // local disconnect is silent
    dev.set_connected(true);
    dev.disconnect();
    EXPECT_EQ(dropped, 1);
}

TEST(LoopbackCentral, ScanReportsAdvertisers)
{
    LoopbackCentral central;
    auto            a = std::make_shared<LoopbackPeripheral>("AA:BB:CC:DD:EE:01", "Moment");
    auto            b = std::make_shared<LoopbackPeripheral>("AA:BB:CC:DD:EE:02", "Moment");
    central.add(a);
    central.add(b, /*advertising=*/false);

    ScanLog log;
    EXPECT_FALSE(central.scan({}, constants::SCAN_TIMEOUT, log.cb()));  // not started
    ASSERT_TRUE(central.start());
    ASSERT_TRUE(central.scan({}, constants::SCAN_TIMEOUT, log.cb()));

    EXPECT_EQ(log.events,
              (std::vector<ScanEvent>{ScanEvent::Started, ScanEvent::Result, ScanEvent::Stopped}));
    EXPECT_EQ(log.ids, (std::vector<std::string>{"AA:BB:CC:DD:EE:01"}));
    EXPECT_FALSE(log.stop_status.has_value());
    EXPECT_EQ(central.scans_started(), 1u);
}

TEST(LoopbackCentral, ScanRunsUntilStopped)
{
    LoopbackCentral central;
    central.start();
    central.set_scan_times_out(false);

    ScanLog log;
    ASSERT_TRUE(central.scan({}, constants::SCAN_TIMEOUT, log.cb()));
    EXPECT_TRUE(central.scanning());
    ScanLog second;
    EXPECT_FALSE(central.scan({}, constants::SCAN_TIMEOUT, second.cb()));

    central.stop_scan();
    EXPECT_FALSE(central.scanning());
    ASSERT_FALSE(log.events.empty());
    EXPECT_EQ(log.events.back(), ScanEvent::Stopped);
    EXPECT_TRUE(second.events.empty());
}

TEST(LoopbackCentral, ScanError)
{
    LoopbackCentral central;
    central.start();
    central.set_scan_error(std::string("org.bluez.Error.NotReady"));

    ScanLog log;
    ASSERT_TRUE(central.scan({}, constants::SCAN_TIMEOUT, log.cb()));
    EXPECT_EQ(log.events, (std::vector<ScanEvent>{ScanEvent::Stopped}));
    EXPECT_EQ(log.stop_status, Status("org.bluez.Error.NotReady"));
}

TEST(LoopbackCentral, RetrieveByIdAndConnected)
{
    LoopbackCentral central;
    auto            a = std::make_shared<LoopbackPeripheral>("AA:BB:CC:DD:EE:01", "Moment");
    auto            b = std::make_shared<LoopbackPeripheral>("AA:BB:CC:DD:EE:02", "Moment");
    b->set_connected(true);
    central.add(a);
    central.add(b);

    auto byid = central.retrieve_peripherals({"AA:BB:CC:DD:EE:02", "FF:FF:FF:FF:FF:FF"});
    ASSERT_EQ(byid.size(), 1u);
    EXPECT_EQ(byid[0]->identifier(), "AA:BB:CC:DD:EE:02");

    auto up = central.retrieve_connected({std::string(constants::HAPTIC_SVC_UUID)});
    ASSERT_EQ(up.size(), 1u);
    EXPECT_EQ(up[0].get(), b.get());
}
