#include "mvr/ws/PendingRequests.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace mvr::ws;

TEST(PendingRequestsTest, ResolveSendsOnce) {
    PendingRequests p;
    std::vector<std::string> sent;
    auto t = p.add("r1", [&sent](const std::string& s){ sent.push_back(s); });
    EXPECT_TRUE(p.contains(t));
    EXPECT_EQ(p.size(), 1u);

    EXPECT_TRUE(p.resolve(t, "reply"));
    EXPECT_FALSE(p.resolve(t, "again"));
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0], "reply");
    EXPECT_FALSE(p.contains(t));
}

TEST(PendingRequestsTest, TicketsAreDistinctForSameRequestId) {
    PendingRequests p;
    auto a = p.add("same", nullptr);
    auto b = p.add("same", nullptr);
    EXPECT_NE(a, b);
    EXPECT_EQ(p.size(), 2u);
}

TEST(PendingRequestsTest, ClearDropsWithoutSending) {
    PendingRequests p;
    int sends = 0;
    auto t1 = p.add("a", [&sends](const std::string&){ ++sends; });
    p.add("b", [&sends](const std::string&){ ++sends; });

    EXPECT_EQ(p.clear(), 2u);
    EXPECT_EQ(p.size(), 0u);
    EXPECT_FALSE(p.resolve(t1, "late"));
    EXPECT_EQ(sends, 0);
}

TEST(PendingRequestsTest, SendMayReenter) {
    PendingRequests p;
    PendingRequests::Ticket second = 0;
    auto first = p.add("1", [&](const std::string&){
        second = p.add("2", nullptr);
    });
    EXPECT_TRUE(p.resolve(first, "x"));
    EXPECT_TRUE(p.contains(second));
}

TEST(PendingRequestsTest, ResolveRacesClear) {
    for (int round = 0; round < 50; ++round) {
        PendingRequests p;
        std::atomic<int> sends{0};
        std::vector<PendingRequests::Ticket> tickets;
        for (int i = 0; i < 100; ++i) {
            tickets.push_back(p.add(std::to_string(i), [&sends](const std::string&){ sends++; }));
        }

        std::atomic<int> resolved{0};
        std::thread resolver([&]{
            for (auto t : tickets) {
                if (p.resolve(t, "x")) resolved++;
            }
        });
        const std::size_t cleared = p.clear();
        resolver.join();

        EXPECT_EQ(static_cast<std::size_t>(resolved.load()) + cleared, tickets.size());
        EXPECT_EQ(sends.load(), resolved.load());
    }
}
