#include <gtest/gtest.h>
#include "server/session_registry.h"
#include <algorithm>
#include <chrono>

using namespace RDSH::Net;
using std::chrono::milliseconds;
using std::chrono::seconds;

class SessionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        now = Clock::now();
    }

    void TearDown() override {}

    SessionRegistry registry;
    Timestamp now;
};

TEST_F(SessionRegistryTest, Create_GeneratesMd5Id) {
    auto session = registry.Create("127.0.0.1", 50000, "", now);
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->id.size(), 32u);
    EXPECT_EQ(session->endpoint, "127.0.0.1");
    EXPECT_EQ(session->port, 50000);
    EXPECT_EQ(session->last_activity, now);
    EXPECT_FALSE(session->closed);
    EXPECT_EQ(registry.Size(), 1u);
}

TEST_F(SessionRegistryTest, Create_SamePeerSameInstantGivesDistinctIds) {
    auto a = registry.Create("127.0.0.1", 50000, "", now);
    auto b = registry.Create("127.0.0.1", 50000, "", now);
    EXPECT_NE(a->id, b->id);
    EXPECT_EQ(registry.Size(), 2u);
}

TEST_F(SessionRegistryTest, Create_HonorsRequestedId) {
    auto session = registry.Create("10.0.0.2", 4000, "my-session", now);
    EXPECT_EQ(session->id, "my-session");

    // Already taken: a fresh id is generated instead.
    auto other = registry.Create("10.0.0.3", 4000, "my-session", now);
    EXPECT_NE(other->id, "my-session");
}

TEST_F(SessionRegistryTest, GenerateId_DependsOnInputs) {
    auto a = SessionRegistry::GenerateId("127.0.0.1", 1, now, 7);
    EXPECT_EQ(a, SessionRegistry::GenerateId("127.0.0.1", 1, now, 7));
    EXPECT_NE(a, SessionRegistry::GenerateId("127.0.0.1", 2, now, 7));
    EXPECT_NE(a, SessionRegistry::GenerateId("127.0.0.1", 1, now, 8));
    EXPECT_NE(a, SessionRegistry::GenerateId("127.0.0.1", 1, now + milliseconds(1), 7));
}

TEST_F(SessionRegistryTest, Find_UnknownReturnsNull) {
    EXPECT_EQ(registry.Find("nope"), nullptr);
    auto session = registry.Create("127.0.0.1", 1, "", now);
    EXPECT_EQ(registry.Find(session->id), session);
}

TEST_F(SessionRegistryTest, Touch_RefreshesActivity) {
    auto session = registry.Create("127.0.0.1", 1, "", now);
    EXPECT_TRUE(registry.Touch(session->id, now + seconds(5)));
    EXPECT_EQ(session->last_activity, now + seconds(5));

    // Never moves backwards.
    EXPECT_TRUE(registry.Touch(session->id, now + seconds(1)));
    EXPECT_EQ(session->last_activity, now + seconds(5));

    EXPECT_FALSE(registry.Touch("unknown", now));
}

TEST_F(SessionRegistryTest, Remove_ClosesSession) {
    auto session = registry.Create("127.0.0.1", 1, "", now);
    session->inbox.Push(RDSH::Net::InboundChunk{0, PacketLast, "ls\n"});

    auto removed = registry.Remove(session->id);
    EXPECT_EQ(removed, session);
    EXPECT_TRUE(session->closed);
    EXPECT_TRUE(session->inbox.Closed());
    EXPECT_TRUE(session->acks.Closed());
    EXPECT_EQ(session->inbox.Size(), 0u);
    EXPECT_EQ(registry.Find(session->id), nullptr);
    EXPECT_EQ(registry.Size(), 0u);

    EXPECT_EQ(registry.Remove(session->id), nullptr);
}

TEST_F(SessionRegistryTest, ExpireIdle_RemovesOnlyIdleSessions) {
    auto stale = registry.Create("127.0.0.1", 1, "", now);
    auto fresh = registry.Create("127.0.0.1", 2, "", now);
    registry.Touch(fresh->id, now + seconds(50));

    auto expired = registry.ExpireIdle(now + seconds(61), seconds(60));

    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0], stale->id);
    EXPECT_TRUE(stale->closed);
    EXPECT_FALSE(fresh->closed);
    EXPECT_EQ(registry.Size(), 1u);
    EXPECT_NE(registry.Find(fresh->id), nullptr);
}

TEST_F(SessionRegistryTest, ExpireIdle_BoundaryIsExclusive) {
    auto session = registry.Create("127.0.0.1", 1, "", now);
    EXPECT_TRUE(registry.ExpireIdle(now + seconds(60), seconds(60)).empty());
    EXPECT_EQ(registry.ExpireIdle(now + seconds(60) + milliseconds(1), seconds(60)).size(), 1u);
    EXPECT_TRUE(session->closed);
}

TEST_F(SessionRegistryTest, Ids_ListsActiveSessions) {
    auto a = registry.Create("127.0.0.1", 1, "", now);
    auto b = registry.Create("127.0.0.1", 2, "", now);
    registry.Remove(a->id);

    auto ids = registry.Ids();
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], b->id);
}
