// tests/test_chunked_writer.cpp
#include <chrono>
#include <condition_variable>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "app/chunked_writer.hpp"
#include "transport/loopback_transport.hpp"
#include "util/constants.hpp"

using namespace app;
using transport::LoopbackPeripheral;

namespace
{
std::vector<std::uint8_t> gen_bytes(std::size_t n, std::uint8_t seed = 1)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>(seed + i);
    return v;
}

const std::string RX(constants::UART_RX_UUID);

struct Rig
{
    util::EventLoop                     loop;
    std::shared_ptr<LoopbackPeripheral> dev;
    std::shared_ptr<ChunkedWriter>      writer;

    Rig()
    {
        dev = std::make_shared<LoopbackPeripheral>("AA:BB:CC:DD:EE:01", "Moment");
        dev->set_connected(true);
        writer = std::make_shared<ChunkedWriter>(
            dev,
            transport::GattRef{std::string(constants::UART_SVC_UUID), RX},
            loop);
    }
};

// Records completions as they fire
struct Results
{
    std::vector<int>                  order;
    std::vector<std::optional<Error>> errors;

    WriteCallback make(int tag)
    {
        return [this, tag](const std::optional<Error> &e) {
            order.push_back(tag);
            errors.push_back(e);
        };
    }
};
}  // namespace

TEST(ChunkedWriter, WritesFramedPacketsAndCompletesOnce)
{
    for (std::size_t len : {0u, 1u, 19u, 20u, 21u, 39u, 40u, 400u})
    {
        SCOPED_TRACE(len);
        Rig     rig;
        Results res;
        auto    payload = gen_bytes(len);

        rig.writer->write(payload, res.make(1));
        rig.loop.poll();

        ASSERT_EQ(res.order.size(), 1u);
        EXPECT_FALSE(res.errors[0].has_value());
        EXPECT_EQ(rig.dev->writes_to(RX), proto::make_packets(payload));
        if (len == 0)
        {
            EXPECT_EQ(rig.dev->resets(), 1u);
            EXPECT_TRUE(rig.dev->payloads().empty());
        }
        else
        {
            ASSERT_EQ(rig.dev->payloads().size(), 1u);
            EXPECT_EQ(rig.dev->payloads()[0], payload);
        }
        EXPECT_TRUE(rig.writer->queue().is_empty());
        EXPECT_EQ(rig.writer->queue().pending_sets(), 0u);
        EXPECT_FALSE(rig.writer->busy());
    }
}

TEST(ChunkedWriter, QueuesPacketsBeforeDraining)
{
    Rig     rig;
    Results res;
    rig.writer->write(gen_bytes(45), res.make(1));

    // nothing runs until the loop does
    EXPECT_EQ(rig.writer->queue().count(), 3u);
    EXPECT_EQ(rig.writer->queue().pending_sets(), 1u);
    EXPECT_TRUE(rig.writer->busy());
    EXPECT_TRUE(rig.dev->writes().empty());

    rig.loop.poll();
    EXPECT_EQ(res.order.size(), 1u);
    EXPECT_EQ(rig.dev->writes().size(), 3u);
}

TEST(ChunkedWriter, CompletesSetsInSubmissionOrder)
{
    Rig     rig;
    Results res;
    auto    a = gen_bytes(30, 0x10);
    auto    b = gen_bytes(5, 0x40);
    auto    c = gen_bytes(61, 0x80);

    rig.writer->write(a, res.make(1));
    rig.writer->write(b, res.make(2));
    rig.writer->write(c, res.make(3));
    rig.loop.poll();

    EXPECT_EQ(res.order, (std::vector<int>{1, 2, 3}));
    for (const auto &e : res.errors)
        EXPECT_FALSE(e.has_value());

    auto got = rig.dev->payloads();
    ASSERT_EQ(got.size(), 3u);
    EXPECT_EQ(got[0], a);
    EXPECT_EQ(got[1], b);
    EXPECT_EQ(got[2], c);
}

TEST(ChunkedWriter, OneWriteInFlight)
{
    Rig     rig;
    Results res;
    rig.dev->set_deferred(true);

    rig.writer->write(gen_bytes(45), res.make(1));
    rig.loop.poll();

    for (int chunk = 0; chunk < 3; ++chunk)
    {
        EXPECT_EQ(rig.dev->deferred_count(), 1u) << "chunk " << chunk;
        EXPECT_EQ(rig.dev->writes().size(), static_cast<std::size_t>(chunk + 1));
        EXPECT_TRUE(res.order.empty());
        ASSERT_TRUE(rig.dev->complete_next());
        rig.loop.poll();
    }
    EXPECT_EQ(rig.dev->deferred_count(), 0u);
    ASSERT_EQ(res.order.size(), 1u);
    EXPECT_FALSE(res.errors[0].has_value());
}

TEST(ChunkedWriter, BackToBackSetWhileDraining)
{
    Rig     rig;
    Results res;
    rig.dev->set_deferred(true);
    auto first  = gen_bytes(45, 0x01);
    auto second = gen_bytes(25, 0x90);

    rig.writer->write(first, res.make(1));
    rig.loop.poll();
    ASSERT_TRUE(rig.dev->complete_next());
    rig.loop.poll();

    // second set arrives with the first half-sent
    rig.writer->write(second, res.make(2));
    rig.loop.poll();
    EXPECT_EQ(rig.dev->deferred_count(), 1u);

    while (rig.dev->complete_next())
        rig.loop.poll();

    EXPECT_EQ(res.order, (std::vector<int>{1, 2}));
    auto got = rig.dev->payloads();
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0], first);
    EXPECT_EQ(got[1], second);
    EXPECT_EQ(rig.dev->malformed(), 0u);
}

TEST(ChunkedWriter, FailureHaltsAndReportsPerSet)
{
    Rig     rig;
    Results res;

    // write #0 is set 1, writes #1.. are set 2, the failure hits set 2's second chunk
    rig.dev->fail_write_at(2, "ATT error: 0x0e");
    rig.writer->write(gen_bytes(10), res.make(1));
    rig.writer->write(gen_bytes(100), res.make(2));
    rig.writer->write(gen_bytes(10), res.make(3));
    rig.loop.poll();

    ASSERT_EQ(res.order, (std::vector<int>{1, 2, 3}));
    EXPECT_FALSE(res.errors[0].has_value());
    ASSERT_TRUE(res.errors[1].has_value());
    EXPECT_EQ(res.errors[1]->code, Errc::TransportWrite);
    EXPECT_EQ(res.errors[1]->message, "ATT error: 0x0e");
    ASSERT_TRUE(res.errors[2].has_value());
    EXPECT_EQ(res.errors[2]->code, Errc::TransportWrite);

    // no write after the failed one
    EXPECT_EQ(rig.dev->writes().size(), 3u);
    EXPECT_TRUE(rig.writer->queue().is_empty());
    EXPECT_EQ(rig.writer->queue().pending_sets(), 0u);
    EXPECT_FALSE(rig.writer->busy());
}

TEST(ChunkedWriter, UsableAfterFailure)
{
    Rig     rig;
    Results res;
    rig.dev->fail_write_at(0, "gatt busy");
    rig.writer->write(gen_bytes(5), res.make(1));
    rig.loop.poll();
    ASSERT_TRUE(res.errors[0].has_value());

    auto next = gen_bytes(5, 0x33);
    rig.writer->write(next, res.make(2));
    rig.loop.poll();
    ASSERT_EQ(res.order.size(), 2u);
    EXPECT_FALSE(res.errors[1].has_value());
    ASSERT_FALSE(rig.dev->payloads().empty());
    EXPECT_EQ(rig.dev->payloads().back(), next);
}

TEST(ChunkedWriter, AbortFailsPendingAndIgnoresInflight)
{
    Rig     rig;
    Results res;
    rig.dev->set_deferred(true);
    rig.writer->write(gen_bytes(45), res.make(1));
    rig.writer->write(gen_bytes(3), res.make(2));
    rig.loop.poll();
    ASSERT_EQ(rig.dev->deferred_count(), 1u);

    rig.writer->abort(Error{Errc::NotConnected, "link lost"});
    ASSERT_EQ(res.order, (std::vector<int>{1, 2}));
    for (const auto &e : res.errors)
    {
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->code, Errc::NotConnected);
        EXPECT_EQ(e->message, "link lost");
    }
    EXPECT_TRUE(rig.writer->queue().is_empty());

    // the stale chunk completes late: no further writes, no second completion
    ASSERT_TRUE(rig.dev->complete_next());
    rig.loop.poll();
    EXPECT_EQ(rig.dev->writes().size(), 1u);
    EXPECT_EQ(res.order.size(), 2u);
}

TEST(ChunkedWriter, OversizedPayloadIsInvalidArgument)
{
    Rig     rig;
    Results res;
    rig.writer->write(gen_bytes(proto::MAX_PAYLOAD + 1), res.make(1));
    rig.loop.poll();

    ASSERT_EQ(res.order.size(), 1u);
    ASSERT_TRUE(res.errors[0].has_value());
    EXPECT_EQ(res.errors[0]->code, Errc::InvalidArgument);
    EXPECT_TRUE(rig.dev->writes().empty());
    EXPECT_FALSE(rig.writer->busy());
}

TEST(ChunkedWriter, WriteFromAnotherThread)
{
    Rig     rig;
    Results res;
    auto    payload = gen_bytes(50);

    std::thread th([&] { rig.writer->write(payload, res.make(7)); });
    th.join();
    rig.loop.poll();

    ASSERT_EQ(res.order, (std::vector<int>{7}));
    ASSERT_EQ(rig.dev->payloads().size(), 1u);
    EXPECT_EQ(rig.dev->payloads()[0], payload);
}

TEST(ChunkedWriter, ProducersWhileLoopThreadDrains)
{
    constexpr int kProducers = 4;
    constexpr int kSets      = 25;

    Rig rig;
    ASSERT_TRUE(rig.loop.start());

    std::mutex              mu;
    std::condition_variable cv;
    int                     completed = 0;
    int                     failed    = 0;

    auto payload_for = [](int producer, int set) {
        auto v = gen_bytes(2 + (set * 7) % 61, static_cast<std::uint8_t>(set));
        v[0]   = static_cast<std::uint8_t>(producer);
        v[1]   = static_cast<std::uint8_t>(set);
        return v;
    };

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p)
    {
        producers.emplace_back([&, p] {
            for (int k = 0; k < kSets; ++k)
            {
                rig.writer->write(payload_for(p, k), [&](const std::optional<Error> &e) {
                    std::lock_guard<std::mutex> lk(mu);
                    completed++;
                    if (e)
                        failed++;
                    cv.notify_all();
                });
                (void)rig.writer->queue().count();
            }
        });
    }
    for (auto &t : producers)
        t.join();

    {
        std::unique_lock<std::mutex> lk(mu);
        ASSERT_TRUE(cv.wait_for(lk, std::chrono::seconds(5),
                                [&] { return completed == kProducers * kSets; }));
    }
    rig.loop.stop();

    EXPECT_EQ(failed, 0);
    EXPECT_EQ(rig.writer->queue().pending_sets(), 0u);
    EXPECT_TRUE(rig.writer->queue().is_empty());
    EXPECT_EQ(rig.dev->malformed(), 0u);

    // every set arrives whole, each producer's sets in the order it wrote them
    auto got = rig.dev->payloads();
    ASSERT_EQ(got.size(), static_cast<std::size_t>(kProducers * kSets));
    std::map<int, int> next_set;
    for (const auto &payload : got)
    {
        ASSERT_GE(payload.size(), 2u);
        const int p = payload[0];
        const int k = payload[1];
        EXPECT_EQ(k, next_set[p]) << "producer " << p;
        next_set[p] = k + 1;
        EXPECT_EQ(payload, payload_for(p, k));
    }
}

TEST(ChunkedWriter, DirectOperationsShareTheInFlightSlot)
{
    Rig rig;
    rig.dev->set_deferred(true);
    rig.dev->set_read(std::string(constants::SERIAL_NUMBER_UUID), {'M', '1'});
    const transport::GattRef trig{std::string(constants::HAPTIC_SVC_UUID),
                                  std::string(constants::TRIGGER_UUID)};
    const transport::GattRef serial{std::string(constants::DEVINFO_SVC_UUID),
                                    std::string(constants::SERIAL_NUMBER_UUID)};

    Results          res;
    std::vector<int> ops;
    transport::Bytes read_back;
    rig.writer->write(gen_bytes(30), res.make(1));
    rig.writer->write_direct(trig, {'w'},
                             [&](const std::optional<Error> &e, const transport::Bytes &) {
                                 EXPECT_FALSE(e.has_value());
                                 ops.push_back(1);
                             });
    rig.writer->read(serial, [&](const std::optional<Error> &e, const transport::Bytes &v) {
        EXPECT_FALSE(e.has_value());
        ops.push_back(2);
        read_back = v;
    });
    rig.loop.poll();
    EXPECT_TRUE(rig.writer->busy());

    // queued operations go out before the first chunk
    ASSERT_EQ(rig.dev->writes().size(), 1u);
    EXPECT_EQ(rig.dev->writes()[0].ref.characteristic, constants::TRIGGER_UUID);
    EXPECT_EQ(rig.dev->deferred_count(), 1u);

    while (rig.dev->complete_next())
    {
        rig.loop.poll();
        EXPECT_LE(rig.dev->deferred_count(), 1u);
    }
    EXPECT_EQ(ops, (std::vector<int>{1, 2}));
    EXPECT_EQ(read_back, (transport::Bytes{'M', '1'}));
    ASSERT_EQ(res.order.size(), 1u);
    EXPECT_FALSE(res.errors[0].has_value());
    EXPECT_EQ(rig.dev->writes_to(RX).size(), 2u);
    EXPECT_FALSE(rig.writer->busy());
}

TEST(ChunkedWriter, DirectWriteFailureLeavesSetsAlone)
{
    Rig rig;
    rig.dev->fail_write_at(0, "ATT error: 0x03");
    const transport::GattRef trig{std::string(constants::HAPTIC_SVC_UUID),
                                  std::string(constants::TRIGGER_UUID)};

    Results              res;
    std::optional<Error> op_err;
    rig.writer->write_direct(trig, {'p'},
                             [&](const std::optional<Error> &e, const transport::Bytes &) {
                                 op_err = e;
                             });
    rig.writer->write(gen_bytes(12), res.make(1));
    rig.loop.poll();

    ASSERT_TRUE(op_err.has_value());
    EXPECT_EQ(op_err->code, Errc::TransportWrite);
    EXPECT_EQ(op_err->message, "ATT error: 0x03");
    ASSERT_EQ(res.order.size(), 1u);
    EXPECT_FALSE(res.errors[0].has_value());
    ASSERT_EQ(rig.dev->payloads().size(), 1u);
}

TEST(ChunkedWriter, AbortFailsQueuedAndInflightOperations)
{
    Rig rig;
    rig.dev->set_deferred(true);
    const transport::GattRef trig{std::string(constants::HAPTIC_SVC_UUID),
                                  std::string(constants::TRIGGER_UUID)};

    std::vector<std::optional<Error>> errs;
    auto record = [&](const std::optional<Error> &e, const transport::Bytes &) {
        errs.push_back(e);
    };
    rig.writer->write_direct(trig, {'p'}, record);
    rig.writer->write_direct(trig, {'k'}, record);
    rig.loop.poll();
    ASSERT_EQ(rig.dev->deferred_count(), 1u);

    rig.writer->abort(Error{Errc::NotConnected, "link lost"});
    ASSERT_EQ(errs.size(), 2u);
    for (const auto &e : errs)
    {
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->message, "link lost");
    }
    EXPECT_FALSE(rig.writer->busy());

    ASSERT_TRUE(rig.dev->complete_next());
    rig.loop.poll();
    EXPECT_EQ(errs.size(), 2u);
    EXPECT_EQ(rig.dev->writes().size(), 1u);
}
