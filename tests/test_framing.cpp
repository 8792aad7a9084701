// tests/test_framing.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

#include "proto/framing.hpp"

using namespace proto;

static std::vector<std::uint8_t> gen_bytes(std::size_t n)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i * 7 + 1) & 0xFF);
    return v;
}

TEST(Framing, EmptyPayloadIsResetSignal)
{
    auto pkts = make_packets({});
    ASSERT_EQ(pkts.size(), 1u);
    EXPECT_EQ(pkts[0], Packet{RESET_SIGNAL});
}

TEST(Framing, PacketCountAndLayout)
{
    // {length, expected packets}
    const std::pair<std::size_t, std::size_t> grid[] = {{1, 1},  {19, 1}, {20, 2}, {21, 2},
                                                        {39, 2}, {40, 3}, {400, 21}};
    for (const auto &g : grid)
    {
        SCOPED_TRACE(g.first);
        auto payload = gen_bytes(g.first);
        auto pkts    = make_packets(payload);
        ASSERT_EQ(pkts.size(), g.second);
        EXPECT_EQ(packet_count(g.first), g.second);

        // header is the packet count
        EXPECT_EQ(pkts[0][0], static_cast<std::uint8_t>(g.second));

        // every packet but the last is full, none is larger
        for (std::size_t i = 0; i < pkts.size(); ++i)
        {
            EXPECT_LE(pkts[i].size(), PACKET_SIZE);
            EXPECT_FALSE(pkts[i].empty());
            if (i + 1 < pkts.size())
                EXPECT_EQ(pkts[i].size(), PACKET_SIZE);
        }

        // concatenation minus the header is the payload
        std::vector<std::uint8_t> joined;
        for (const auto &p : pkts)
            joined.insert(joined.end(), p.begin(), p.end());
        ASSERT_EQ(joined.size(), g.first + 1);
        EXPECT_EQ(std::vector<std::uint8_t>(joined.begin() + 1, joined.end()), payload);
    }
}

TEST(Framing, NineteenBytesFitOnePacket)
{
    auto pkts = make_packets(gen_bytes(19));
    ASSERT_EQ(pkts.size(), 1u);
    EXPECT_EQ(pkts[0].size(), 20u);
    EXPECT_EQ(pkts[0][0], 1);
}

TEST(Framing, LargestPayloadFitsCountByte)
{
    auto pkts = make_packets(gen_bytes(MAX_PAYLOAD));
    ASSERT_EQ(pkts.size(), MAX_PACKETS);
    EXPECT_EQ(pkts[0][0], 0xFF);
}

TEST(Framing, OversizedPayloadRejected)
{
    EXPECT_TRUE(make_packets(gen_bytes(MAX_PAYLOAD + 1)).empty());
}

TEST(Deframer, RebuildsPayload)
{
    auto     payload = gen_bytes(45);
    Deframer d;
    auto     pkts = make_packets(payload);
    ASSERT_EQ(pkts.size(), 3u);

    EXPECT_EQ(d.feed(pkts[0]), Deframer::Event::None);
    EXPECT_EQ(d.feed(pkts[1]), Deframer::Event::None);
    EXPECT_EQ(d.feed(pkts[2]), Deframer::Event::Payload);
    EXPECT_EQ(d.payload(), payload);

    // next message starts cleanly
    auto small = gen_bytes(5);
    EXPECT_EQ(d.feed(make_packets(small)[0]), Deframer::Event::Payload);
    EXPECT_EQ(d.payload(), small);
}

TEST(Deframer, ResetSignal)
{
    Deframer d;
    EXPECT_EQ(d.feed(Packet{RESET_SIGNAL}), Deframer::Event::Reset);
    EXPECT_TRUE(d.payload().empty());
}

TEST(Deframer, ResetWithTrailingBytesIsMalformed)
{
    Deframer d;
    EXPECT_EQ(d.feed(Packet{RESET_SIGNAL, 0x01}), Deframer::Event::Malformed);
}

TEST(Deframer, ShortPacketMidMessageIsMalformed)
{
    Deframer d;
    auto     pkts = make_packets(gen_bytes(45));
    EXPECT_EQ(d.feed(pkts[0]), Deframer::Event::None);
    EXPECT_EQ(d.feed(Packet{1, 2, 3}), Deframer::Event::Malformed);

    // state was dropped, a fresh message decodes
    auto again = make_packets(gen_bytes(10));
    EXPECT_EQ(d.feed(again[0]), Deframer::Event::Payload);
}

TEST(Deframer, RejectsOversizedPacket)
{
    Deframer d;
    EXPECT_EQ(d.feed(Packet(PACKET_SIZE + 1, 0x01)), Deframer::Event::Malformed);
    EXPECT_EQ(d.feed(Packet{}), Deframer::Event::Malformed);
}
