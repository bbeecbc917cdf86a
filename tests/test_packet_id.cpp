#include <gtest/gtest.h>

#include <simq/mqtt/packet_id.hpp>

using namespace simq::mqtt;

TEST(PacketIdAllocatorTest, StartsAtOne) {
    PacketIdAllocator ids;
    EXPECT_EQ(ids.last(), 0);
    EXPECT_EQ(ids.next(), 1);
    EXPECT_EQ(ids.next(), 2);
    EXPECT_EQ(ids.last(), 2);
}

TEST(PacketIdAllocatorTest, WrapsToOneAndNeverIssuesZero) {
    PacketIdAllocator ids;
    for (uint32_t expected = 1; expected <= 65535; ++expected) {
        uint16_t id = ids.next();
        ASSERT_EQ(id, expected);
    }
    EXPECT_EQ(ids.next(), 1);
}

TEST(PacketIdAllocatorTest, ResetRestartsSequence) {
    PacketIdAllocator ids;
    ids.next();
    ids.next();
    ids.reset();
    EXPECT_EQ(ids.next(), 1);
}
