#include <gtest/gtest.h>
#include <memory>

#include "app/peer_registry.hpp"
#include "transport/loopback_transport.hpp"

using namespace app;
using transport::LoopbackConnection;

TEST(PeerRegistry, IdsStartAtOneAndAreNeverReused)
{
    PeerRegistry r;
    auto         a = std::make_shared<LoopbackConnection>(10);
    auto         b = std::make_shared<LoopbackConnection>(11);
    auto         c = std::make_shared<LoopbackConnection>(12);

    auto ia = r.register_peer(a, "a");
    auto ib = r.register_peer(b);
    ASSERT_TRUE(ia && ib);
    EXPECT_EQ(*ia, 1);
    EXPECT_EQ(*ib, 2);

    r.unregister(*ia);
    auto ic = r.register_peer(c);
    ASSERT_TRUE(ic);
    EXPECT_EQ(*ic, 3);
    EXPECT_FALSE(r.contains(1));
    EXPECT_EQ(r.size(), 2u);
}

TEST(PeerRegistry, LookupByConnection)
{
    PeerRegistry r;
    auto         a  = std::make_shared<LoopbackConnection>(5);
    auto         id = r.register_peer(a, "nick");
    ASSERT_TRUE(id);
    EXPECT_EQ(r.find_by_conn(5), id);
    EXPECT_FALSE(r.find_by_conn(6).has_value());
    EXPECT_EQ(r.connection(*id), a.get());
    ASSERT_NE(r.nickname(*id), nullptr);
    EXPECT_EQ(*r.nickname(*id), "nick");

    r.unregister(*id);
    EXPECT_FALSE(r.find_by_conn(5).has_value());
    EXPECT_EQ(r.connection(*id), nullptr);
}

TEST(PeerRegistry, UnregisterReturnsLoans)
{
    PeerRegistry r;
    auto         id = r.register_peer(std::make_shared<LoopbackConnection>(1));
    ASSERT_TRUE(id);
    r.record_loan(*id, 4);
    r.record_loan(*id, 9);
    r.record_loan(*id, 7);
    r.release_loan(*id, 9);

    ASSERT_NE(r.loans(*id), nullptr);
    EXPECT_EQ(r.loans(*id)->size(), 2u);

    auto loans = r.unregister(*id);
    EXPECT_EQ(loans, (std::set<TaskId>{4, 7}));
    EXPECT_EQ(r.loans(*id), nullptr);
    EXPECT_TRUE(r.unregister(*id).empty());
}

TEST(PeerRegistry, LoansOnUnknownPeerIgnored)
{
    PeerRegistry r;
    r.record_loan(3, 1);
    r.release_loan(3, 1);
    EXPECT_EQ(r.size(), 0u);
}

TEST(PeerRegistry, BroadcastSkipsClosed)
{
    PeerRegistry r;
    auto         a = std::make_shared<LoopbackConnection>(1);
    auto         b = std::make_shared<LoopbackConnection>(2);
    auto         c = std::make_shared<LoopbackConnection>(3);
    r.register_peer(a);
    r.register_peer(b);
    r.register_peer(c);
    b->close();

    EXPECT_EQ(r.broadcast(transport::Frame{1, 2, 3}), 2u);
    EXPECT_EQ(a->sent_count(), 1u);
    EXPECT_EQ(b->sent_count(), 0u);
    EXPECT_EQ(c->sent_count(), 1u);
}

TEST(PeerRegistry, ForEachOpenPeerInIdOrderAndStops)
{
    PeerRegistry r;
    auto         a = std::make_shared<LoopbackConnection>(1);
    auto         b = std::make_shared<LoopbackConnection>(2);
    auto         c = std::make_shared<LoopbackConnection>(3);
    r.register_peer(a);
    r.register_peer(b);
    r.register_peer(c);
    a->close();

    std::vector<PeerId> seen;
    r.for_each_open_peer([&](PeerId id, transport::IConnection &) {
        seen.push_back(id);
        return true;
    });
    EXPECT_EQ(seen, (std::vector<PeerId>{2, 3}));

    seen.clear();
    r.for_each_open_peer([&](PeerId id, transport::IConnection &) {
        seen.push_back(id);
        return false;
    });
    EXPECT_EQ(seen, (std::vector<PeerId>{2}));
}

TEST(PeerRegistry, NullConnectionRefused)
{
    PeerRegistry r;
    EXPECT_FALSE(r.register_peer(nullptr).has_value());
}
