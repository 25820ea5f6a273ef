#include <string>
#include <variant>
#include <gtest/gtest.h>
#include "runtime/turn_scope.hpp"

namespace {

using namespace turnloom::protocol;
using turnloom::runtime::contains_attempt_fraction;
using turnloom::runtime::is_transient_reconnect_notice;
using turnloom::runtime::qualify_event;
using turnloom::runtime::qualify_item;

TEST(TurnScopeTest, QualifiesRawItemIds) {
    const AgentItem item = qualify_item("turn-a", ReasoningItem{"item_0", "..."});
    EXPECT_EQ(item_id(item), "turn-a/item_0");
}

TEST(TurnScopeTest, QualifyingIsAFixedPoint) {
    const AgentItem once = qualify_item("turn-a", AgentMessageItem{"item_0", "hi"});
    const AgentItem twice = qualify_item("turn-a", once);
    EXPECT_EQ(item_id(twice), "turn-a/item_0");
}

TEST(TurnScopeTest, IdThatOnlyStartsWithScopeTextIsQualified) {
    const AgentItem item = qualify_item("turn-a", AgentMessageItem{"turn-a_item_0", "hi"});
    EXPECT_EQ(item_id(item), "turn-a/turn-a_item_0");
}

TEST(TurnScopeTest, SameRawIdInTwoTurnsStaysDistinct) {
    const AgentItem first = qualify_item("turn-a", ErrorItem{"item_0", "x"});
    const AgentItem second = qualify_item("turn-b", ErrorItem{"item_0", "x"});
    EXPECT_NE(item_id(first), item_id(second));
}

TEST(TurnScopeTest, OnlyItemEventsAreRewritten) {
    const ThreadEvent started = qualify_event("turn-a", ThreadStarted{"th_1"});
    EXPECT_EQ(std::get<ThreadStarted>(started).thread_id, "th_1");

    const ThreadEvent updated =
        qualify_event("turn-a", ItemUpdated{WebSearchItem{"ws", "cmake docs"}});
    EXPECT_EQ(item_id(std::get<ItemUpdated>(updated).item), "turn-a/ws");
}

TEST(TurnScopeTest, DetectsAttemptFractions) {
    EXPECT_TRUE(contains_attempt_fraction("attempt 2/5"));
    EXPECT_TRUE(contains_attempt_fraction("(10/10)"));
    EXPECT_FALSE(contains_attempt_fraction("2/ retries"));
    EXPECT_FALSE(contains_attempt_fraction("/5"));
    EXPECT_FALSE(contains_attempt_fraction("no digits"));
}

TEST(TurnScopeTest, ClassifiesReconnectNotices) {
    EXPECT_TRUE(is_transient_reconnect_notice("Reconnecting... 1/5"));
    EXPECT_TRUE(is_transient_reconnect_notice("  stream dropped, RECONNECTING (attempt 3/5)"));
    EXPECT_FALSE(is_transient_reconnect_notice("Reconnecting soon"));
    EXPECT_FALSE(is_transient_reconnect_notice("rate limited 1/5"));
    EXPECT_FALSE(is_transient_reconnect_notice("   "));
}

}  // namespace
