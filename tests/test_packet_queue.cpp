#include <gtest/gtest.h>

#include "app/packet_queue.hpp"

using app::PacketQueue;

TEST(PacketQueue, FifoOrder)
{
    PacketQueue q;
    EXPECT_TRUE(q.is_empty());
    q.enqueue({1});
    q.enqueue({2, 2});
    q.enqueue({3, 3, 3});
    EXPECT_EQ(q.count(), 3u);

    EXPECT_EQ(*q.dequeue(), proto::Packet({1}));
    EXPECT_EQ(*q.dequeue(), proto::Packet({2, 2}));
    EXPECT_EQ(*q.dequeue(), proto::Packet({3, 3, 3}));
    EXPECT_FALSE(q.dequeue().has_value());
    EXPECT_TRUE(q.is_empty());
}

TEST(PacketQueue, PendingSetsNeverNegative)
{
    PacketQueue q;
    q.decrement_pending_sets();
    EXPECT_EQ(q.pending_sets(), 0u);

    q.increment_pending_sets();
    q.increment_pending_sets();
    EXPECT_EQ(q.pending_sets(), 2u);
    q.decrement_pending_sets();
    EXPECT_EQ(q.pending_sets(), 1u);
}

TEST(PacketQueue, ClearDropsEverything)
{
    PacketQueue q;
    q.enqueue({1});
    q.enqueue({2});
    q.increment_pending_sets();

    EXPECT_EQ(q.clear(), 2u);
    EXPECT_TRUE(q.is_empty());
    EXPECT_EQ(q.pending_sets(), 0u);
    EXPECT_EQ(q.clear(), 0u);
}
