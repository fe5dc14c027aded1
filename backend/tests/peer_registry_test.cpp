#include "network/peer_registry.h"

#include "test_support.h"

#include <gtest/gtest.h>

namespace {

PeerPtr make_peer(const std::string& name) {
    return std::make_shared<Peer>(Peer{std::make_shared<FakeConnection>(), "10.0.0.1", name});
}

} // namespace

TEST(PeerRegistry, AddKeepsInsertionOrder) {
    PeerRegistry registry;
    auto a = make_peer("a");
    auto b = make_peer("b");
    EXPECT_TRUE(registry.empty());
    EXPECT_TRUE(registry.add(a));
    EXPECT_TRUE(registry.add(b));

    auto snap = registry.snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap[0]->username, "a");
    EXPECT_EQ(snap[1]->username, "b");
}

TEST(PeerRegistry, SameConnectionIsRegisteredOnce) {
    PeerRegistry registry;
    auto a = make_peer("a");
    EXPECT_TRUE(registry.add(a));
    EXPECT_FALSE(registry.add(std::make_shared<Peer>(Peer{a->connection, "10.0.0.2", "again"})));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(PeerRegistry, DuplicateUsernamesAreAllowed) {
    PeerRegistry registry;
    EXPECT_TRUE(registry.add(make_peer("same")));
    EXPECT_TRUE(registry.add(make_peer("same")));
    EXPECT_EQ(registry.size(), 2u);
}

TEST(PeerRegistry, RemoveReportsOnlyTheFirstRemoval) {
    PeerRegistry registry;
    auto a = make_peer("a");
    registry.add(a);

    EXPECT_EQ(registry.find(a->connection.get()), a);
    EXPECT_TRUE(registry.remove(a->connection.get()));
    EXPECT_FALSE(registry.remove(a->connection.get()));
    EXPECT_EQ(registry.find(a->connection.get()), nullptr);
    EXPECT_TRUE(registry.empty());
}

TEST(PeerRegistry, SnapshotIsUnaffectedByLaterChanges) {
    PeerRegistry registry;
    auto a = make_peer("a");
    registry.add(a);
    auto snap = registry.snapshot();
    registry.remove(a->connection.get());
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0]->username, "a");
}

TEST(PeerRegistry, CloseAllClosesAndForgets) {
    PeerRegistry registry;
    auto a = make_peer("a");
    auto b = make_peer("b");
    registry.add(a);
    registry.add(b);

    registry.close_all();

    EXPECT_TRUE(registry.empty());
    EXPECT_TRUE(static_cast<FakeConnection&>(*a->connection).closed());
    EXPECT_TRUE(static_cast<FakeConnection&>(*b->connection).closed());
}
