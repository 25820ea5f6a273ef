#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include "session/thread_state_machine.hpp"

namespace {

using turnloom::core::errors::get_error;
using turnloom::core::errors::get_value;
using turnloom::core::errors::is_error;
using namespace turnloom::protocol;
using namespace turnloom::session;

const ThreadKey kKey{"proj", "main", 1};

std::optional<StartTurn> started(const Effects& effects) {
    for (const auto& effect : effects) {
        if (const auto* start = std::get_if<StartTurn>(&effect)) {
            return *start;
        }
    }
    return std::nullopt;
}

bool has_persist(const Effects& effects) {
    for (const auto& effect : effects) {
        if (std::holds_alternative<PersistQueue>(effect)) {
            return true;
        }
    }
    return false;
}

Effects submit(ThreadStateMachine& machine, const std::string& text) {
    return machine.submit(text, {}, AgentRunConfig{});
}

ConversationEntry message(const std::string& id, const std::string& text) {
    ConversationEntry entry = make_item_entry(AgentMessageItem{id, text});
    return entry;
}

TEST(ThreadStateMachineTest, SubmitOnIdleStartsImmediately) {
    ThreadStateMachine machine(kKey);
    const Effects effects = submit(machine, "A");
    const auto start = started(effects);
    ASSERT_TRUE(start.has_value());
    EXPECT_EQ(start->prompt.text, "A");
    EXPECT_EQ(start->prompt.id, 1u);
    EXPECT_TRUE(has_persist(effects));
    EXPECT_EQ(machine.phase(), ThreadPhase::Running);
    EXPECT_EQ(machine.active_run_id().value_or(0), start->run_id);
    // The prompt is echoed into the local log.
    ASSERT_EQ(machine.entries().size(), 1u);
    EXPECT_TRUE(std::holds_alternative<UserEntry>(machine.entries()[0]));
}

TEST(ThreadStateMachineTest, RunsQueuedPromptsInOrder) {
    ThreadStateMachine machine(kKey);
    std::vector<std::string> order;

    auto first = started(submit(machine, "A"));
    ASSERT_TRUE(first.has_value());
    order.push_back(first->prompt.text);

    EXPECT_FALSE(started(submit(machine, "B")).has_value());
    EXPECT_FALSE(started(submit(machine, "C")).has_value());
    EXPECT_EQ(machine.queue().size(), 2u);

    std::uint64_t run_id = first->run_id;
    for (int i = 0; i < 2; ++i) {
        auto next = started(machine.finish(run_id, TurnFinish{FinishKind::Completed, ""}));
        ASSERT_TRUE(next.has_value());
        EXPECT_GT(next->run_id, run_id);
        order.push_back(next->prompt.text);
        run_id = next->run_id;
    }
    const Effects last = machine.finish(run_id, TurnFinish{FinishKind::Completed, ""});
    EXPECT_FALSE(started(last).has_value());
    EXPECT_TRUE(has_persist(last));

    EXPECT_EQ(order, (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(machine.phase(), ThreadPhase::Idle);
    EXPECT_TRUE(machine.queue().empty());
}

TEST(ThreadStateMachineTest, StaleEventsAndFinishesAreDropped) {
    ThreadStateMachine machine(kKey);
    auto first = started(submit(machine, "A"));
    ASSERT_TRUE(first.has_value());
    const std::uint64_t stale = first->run_id;

    ASSERT_FALSE(machine.cancel(stale).empty());
    auto second = started(machine.resume());
    EXPECT_FALSE(second.has_value());
    second = started(submit(machine, "B"));
    ASSERT_TRUE(second.has_value());

    const std::size_t before = machine.entries().size();
    EXPECT_TRUE(machine.apply_event(stale, ItemCompleted{AgentMessageItem{"x", "late"}}).empty());
    EXPECT_TRUE(machine.apply_event(stale, TurnFailed{"late failure"}).empty());
    EXPECT_TRUE(machine.finish(stale, TurnFinish{FinishKind::Completed, ""}).empty());
    EXPECT_EQ(machine.entries().size(), before);
    EXPECT_EQ(machine.phase(), ThreadPhase::Running);
    EXPECT_EQ(machine.active_run_id().value_or(0), second->run_id);
}

TEST(ThreadStateMachineTest, FailurePausesQueueUntilResume) {
    ThreadStateMachine machine(kKey);
    auto first = started(submit(machine, "A"));
    ASSERT_TRUE(first.has_value());
    submit(machine, "B");

    const Effects failed = machine.apply_event(first->run_id, TurnFailed{"boom"});
    EXPECT_TRUE(has_persist(failed));
    EXPECT_FALSE(started(failed).has_value());
    EXPECT_EQ(machine.phase(), ThreadPhase::QueuePaused);
    const auto& last = std::get<AgentEntry>(machine.entries().back());
    EXPECT_EQ(std::get<TurnErrorRecord>(last.event).message, "boom");

    // The late finish signal of the failed run changes nothing.
    EXPECT_TRUE(machine.finish(first->run_id, TurnFinish{FinishKind::Completed, ""}).empty());
    EXPECT_EQ(machine.phase(), ThreadPhase::QueuePaused);
    EXPECT_EQ(machine.queue().size(), 1u);

    auto resumed = started(machine.resume());
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed->prompt.text, "B");
    EXPECT_EQ(machine.phase(), ThreadPhase::Running);
}

TEST(ThreadStateMachineTest, FailedFinishAlsoPauses) {
    ThreadStateMachine machine(kKey);
    auto first = started(submit(machine, "A"));
    ASSERT_TRUE(first.has_value());
    machine.finish(first->run_id, TurnFinish{FinishKind::Failed, "turn timed out"});
    EXPECT_EQ(machine.phase(), ThreadPhase::QueuePaused);
    EXPECT_TRUE(machine.is_paused());
}

TEST(ThreadStateMachineTest, SubmitToPausedQueueJoinsTail) {
    ThreadStateMachine machine(kKey);
    auto first = started(submit(machine, "A"));
    submit(machine, "B");
    machine.apply_event(first->run_id, StreamError{"disconnected"});

    const Effects effects = submit(machine, "C");
    EXPECT_FALSE(started(effects).has_value());
    ASSERT_EQ(machine.queue().size(), 2u);
    EXPECT_EQ(machine.queue()[0].text, "B");
    EXPECT_EQ(machine.queue()[1].text, "C");
}

TEST(ThreadStateMachineTest, SubmitWithEmptyQueueClearsPause) {
    ThreadStateMachine machine(kKey);
    auto first = started(submit(machine, "A"));
    machine.apply_event(first->run_id, TurnFailed{"boom"});
    ASSERT_TRUE(machine.is_paused());

    auto next = started(submit(machine, "retry"));
    ASSERT_TRUE(next.has_value());
    EXPECT_FALSE(machine.is_paused());
}

TEST(ThreadStateMachineTest, CancelRequiresMatchingRunId) {
    ThreadStateMachine machine(kKey);
    auto first = started(submit(machine, "A"));
    ASSERT_TRUE(first.has_value());

    EXPECT_TRUE(machine.cancel(first->run_id + 7).empty());
    EXPECT_EQ(machine.phase(), ThreadPhase::Running);

    const Effects effects = machine.cancel(first->run_id);
    ASSERT_FALSE(effects.empty());
    const auto* cancel = std::get_if<CancelTurn>(&effects.front());
    ASSERT_NE(cancel, nullptr);
    EXPECT_EQ(cancel->run_id, first->run_id);
    EXPECT_TRUE(has_persist(effects));
    EXPECT_TRUE(machine.is_paused());
    EXPECT_FALSE(machine.is_running());

    const auto& last = std::get<AgentEntry>(machine.entries().back());
    EXPECT_TRUE(std::holds_alternative<TurnCanceledRecord>(last.event));
}

TEST(ThreadStateMachineTest, EventsBuildLocalEntries) {
    ThreadStateMachine machine(kKey);
    auto run = started(submit(machine, "A"));
    ASSERT_TRUE(run.has_value());

    machine.apply_event(run->run_id, ThreadStarted{"th_remote"});
    machine.apply_event(run->run_id, ItemCompleted{AgentMessageItem{"t/item_0", "hi"}});
    machine.apply_event(run->run_id, ItemCompleted{AgentMessageItem{"t/item_0", "hi"}});
    machine.apply_event(run->run_id, TurnCompleted{TokenUsage{1, 0, 2}});
    machine.apply_event(run->run_id, TurnDuration{42});

    EXPECT_EQ(machine.remote_thread_id().value_or(""), "th_remote");
    // user, message (deduplicated), usage, duration
    EXPECT_EQ(machine.entries().size(), 4u);
}

TEST(ThreadStateMachineTest, QueueEditing) {
    ThreadStateMachine machine(kKey);
    submit(machine, "A");
    submit(machine, "B");
    submit(machine, "C");
    submit(machine, "D");
    ASSERT_EQ(machine.queue().size(), 3u);
    const std::uint64_t b = machine.queue()[0].id;
    const std::uint64_t d = machine.queue()[2].id;

    auto moved = machine.move_queued(d, 0);
    ASSERT_FALSE(is_error(moved));
    EXPECT_EQ(machine.queue()[0].text, "D");

    auto updated = machine.update_queued(b, "B2");
    ASSERT_FALSE(is_error(updated));
    EXPECT_EQ(machine.queue()[1].text, "B2");

    auto removed = machine.remove_queued(b);
    ASSERT_FALSE(is_error(removed));
    EXPECT_EQ(machine.queue().size(), 2u);

    auto missing = machine.remove_queued(999);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_argument");

    EXPECT_TRUE(has_persist(machine.clear_queue()));
    EXPECT_TRUE(machine.queue().empty());
}

TEST(ThreadStateMachineTest, ReconcileAdoptsLongerSnapshot) {
    ThreadStateMachine machine(kKey);
    const auto a = message("a", "1");
    const auto b = message("b", "2");
    const auto c = message("c", "3");

    EXPECT_TRUE(machine.reconcile({a, b}));
    EXPECT_TRUE(machine.reconcile({a, b, c}));
    EXPECT_EQ(machine.entries().size(), 3u);
}

TEST(ThreadStateMachineTest, ReconcileKeepsNewerLocal) {
    ThreadStateMachine machine(kKey);
    const auto a = message("a", "1");
    const auto b = message("b", "2");
    const auto c = message("c", "3");

    machine.reconcile({a, b, c});
    EXPECT_FALSE(machine.reconcile({a, b}));
    EXPECT_EQ(machine.entries().size(), 3u);
}

TEST(ThreadStateMachineTest, ReconcileKeepsLocalOnDivergence) {
    ThreadStateMachine machine(kKey);
    machine.reconcile({message("a", "1"), message("b", "2")});
    EXPECT_FALSE(machine.reconcile({message("x", "9"), message("y", "8"), message("z", "7")}));
    EXPECT_EQ(machine.entries().size(), 2u);
}

TEST(ThreadStateMachineTest, RestoreSeedsQueueAndPausesInterruptedRun) {
    turnloom::store::ConversationSnapshot snapshot;
    snapshot.key = kKey;
    snapshot.remote_thread_id = std::string("th_9");
    snapshot.queue.prompts = {QueuedPrompt{4, "queued", {}, AgentRunConfig{}}};
    snapshot.queue.next_prompt_id = 5;
    snapshot.queue.run_started_at_unix_ms = 100;
    snapshot.entries = {message("a", "1")};

    ThreadStateMachine machine(kKey);
    const Effects effects = machine.restore(snapshot);
    EXPECT_TRUE(has_persist(effects));
    EXPECT_EQ(machine.phase(), ThreadPhase::QueuePaused);
    EXPECT_EQ(machine.queue().size(), 1u);
    EXPECT_EQ(machine.next_prompt_id(), 5u);
    EXPECT_EQ(machine.remote_thread_id().value_or(""), "th_9");
    EXPECT_EQ(machine.entries().size(), 1u);

    const auto state = machine.queue_state();
    EXPECT_TRUE(state.paused);
    ASSERT_TRUE(state.run_finished_at_unix_ms.has_value());
    EXPECT_GE(*state.run_finished_at_unix_ms, 100);
}

TEST(ThreadStateMachineTest, RestoreOfSettledThreadHasNoEffects) {
    turnloom::store::ConversationSnapshot snapshot;
    snapshot.key = kKey;
    snapshot.queue.run_started_at_unix_ms = 100;
    snapshot.queue.run_finished_at_unix_ms = 200;

    ThreadStateMachine machine(kKey);
    EXPECT_TRUE(machine.restore(snapshot).empty());
    EXPECT_EQ(machine.phase(), ThreadPhase::Idle);
}

TEST(ThreadStateMachineTest, PrefixAndSuffixHelpers) {
    const auto a = message("a", "1");
    const auto b = message("b", "2");
    EXPECT_TRUE(entries_is_prefix({a}, {a, b}));
    EXPECT_FALSE(entries_is_prefix({b}, {a, b}));
    EXPECT_TRUE(entries_is_suffix({b}, {a, b}));
    EXPECT_FALSE(entries_is_suffix({a, b, a}, {a, b}));
}

}  // namespace
