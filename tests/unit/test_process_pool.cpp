#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include "runtime/process_pool.hpp"
#include "test_support.hpp"

namespace {

using turnloom::core::config::LaunchProfile;
using turnloom::core::errors::get_error;
using turnloom::core::errors::get_value;
using turnloom::core::errors::is_error;
using turnloom::core::errors::take_value;
using turnloom::runtime::PollResult;
using turnloom::runtime::ProcessPool;
using namespace turnloom::protocol;

// Answers every stdin line with one agent message and a turn.completed.
const char* kEchoAgent = R"SH(
if [ "$1" = "--resume" ]; then
  printf '{"type":"thread.started","thread_id":"%s"}\n' "$2"
fi
n=0
while IFS= read -r line; do
  n=$((n+1))
  printf '{"type":"item.completed","item":{"type":"agent_message","id":"item_0","text":"reply %s"}}\n' "$n"
  printf '{"type":"turn.completed"}\n'
done
)SH";

// Answers a single prompt, then exits.
const char* kOneTurnAgent = R"SH(
IFS= read -r line
printf '{"type":"item.completed","item":{"type":"agent_message","id":"item_0","text":"bye"}}\n'
printf '{"type":"turn.completed"}\n'
)SH";

// kOneTurnAgent that also reports the id it was resumed with.
const char* kOneTurnResumableAgent = R"SH(
if [ "$1" = "--resume" ]; then
  printf '{"type":"thread.started","thread_id":"%s"}\n' "$2"
fi
IFS= read -r line
printf '{"type":"item.completed","item":{"type":"agent_message","id":"item_0","text":"bye"}}\n'
printf '{"type":"turn.completed"}\n'
)SH";

const char* kGarbageAgent = R"SH(
while IFS= read -r line; do
  printf '{"type": broken\n'
done
)SH";

LaunchProfile shell_profile(const char* script) {
    LaunchProfile profile;
    profile.command = {"/bin/sh", "-c", script, "fake-agent"};
    profile.resume_flag = "--resume";
    profile.reuse_process = true;
    return profile;
}

const ThreadKey kKey{"proj", "main", 1};

// Polls until the turn completes or the process dies.
PollResult collect_turn(ProcessPool& pool, const ThreadKey& key) {
    PollResult all;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        auto polled = pool.poll(key);
        if (is_error(polled)) {
            ADD_FAILURE() << get_error(polled).message;
            return all;
        }
        PollResult batch = take_value(polled);
        for (auto& event : batch.events) {
            all.events.push_back(std::move(event));
        }
        all.alive = batch.alive;
        if (batch.protocol_error.has_value()) {
            all.protocol_error = batch.protocol_error;
        }
        if (batch.turn_completed || !batch.alive) {
            all.turn_completed = batch.turn_completed;
            return all;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ADD_FAILURE() << "turn did not complete in time";
    return all;
}

// Polls until the pooled process has exited.
bool wait_for_exit(ProcessPool& pool, const ThreadKey& key) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        auto polled = pool.poll(key);
        if (is_error(polled)) {
            ADD_FAILURE() << get_error(polled).message;
            return false;
        }
        if (!get_value(polled).alive) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

std::string resumed_thread(const PollResult& result) {
    for (const auto& event : result.events) {
        if (const auto* started = std::get_if<ThreadStarted>(&event)) {
            return started->thread_id;
        }
    }
    return "";
}

std::string message_text(const PollResult& result) {
    for (const auto& event : result.events) {
        if (const AgentItem* item = event_item(event)) {
            if (const auto* message = std::get_if<AgentMessageItem>(item)) {
                return message->text;
            }
        }
    }
    return "";
}

TEST(ProcessPoolTest, SendWithoutEnsureIsNotFound) {
    ProcessPool pool(shell_profile(kEchoAgent));
    auto sent = pool.send(kKey, "hello");
    ASSERT_TRUE(is_error(sent));
    EXPECT_EQ(get_error(sent).code, "process_not_found");

    auto polled = pool.poll(kKey);
    ASSERT_TRUE(is_error(polled));
    EXPECT_EQ(get_error(polled).code, "process_not_found");
}

TEST(ProcessPoolTest, ReusesOneProcessAcrossTurns) {
    turnloom::testing::TempWorkspace workspace("pool");
    ProcessPool pool(shell_profile(kEchoAgent));

    ASSERT_FALSE(is_error(pool.ensure(kKey, workspace.root(), std::nullopt, {})));
    ASSERT_FALSE(is_error(pool.ensure(kKey, workspace.root(), std::nullopt, {})));
    EXPECT_EQ(pool.size(), 1u);

    ASSERT_FALSE(is_error(pool.send(kKey, "first")));
    PollResult first = collect_turn(pool, kKey);
    EXPECT_TRUE(first.turn_completed);
    EXPECT_EQ(message_text(first), "reply 1");

    ASSERT_FALSE(is_error(pool.send(kKey, "second")));
    PollResult second = collect_turn(pool, kKey);
    EXPECT_TRUE(second.turn_completed);
    // Same process: its counter kept going.
    EXPECT_EQ(message_text(second), "reply 2");
}

TEST(ProcessPoolTest, PassesResumeIdToTheAgent) {
    turnloom::testing::TempWorkspace workspace("pool");
    ProcessPool pool(shell_profile(kEchoAgent));
    ASSERT_FALSE(is_error(pool.ensure(kKey, workspace.root(), std::string("th_resume"), {})));
    ASSERT_FALSE(is_error(pool.send(kKey, "hi")));

    PollResult turn = collect_turn(pool, kKey);
    ASSERT_FALSE(turn.events.empty());
    const auto* started = std::get_if<ThreadStarted>(&turn.events.front());
    ASSERT_NE(started, nullptr);
    EXPECT_EQ(started->thread_id, "th_resume");
}

TEST(ProcessPoolTest, RespawnsADeadProcessOnce) {
    turnloom::testing::TempWorkspace workspace("pool");
    ProcessPool pool(shell_profile(kOneTurnAgent));
    ASSERT_FALSE(is_error(pool.ensure(kKey, workspace.root(), std::nullopt, {})));

    ASSERT_FALSE(is_error(pool.send(kKey, "one")));
    EXPECT_TRUE(collect_turn(pool, kKey).turn_completed);

    // The agent exits after its single turn.
    ASSERT_TRUE(wait_for_exit(pool, kKey));

    ASSERT_FALSE(is_error(pool.send(kKey, "two")));
    PollResult second = collect_turn(pool, kKey);
    EXPECT_TRUE(second.turn_completed);
    EXPECT_EQ(message_text(second), "bye");
    EXPECT_EQ(pool.size(), 1u);
}

TEST(ProcessPoolTest, EnsureRespawnsWithCurrentResumeId) {
    turnloom::testing::TempWorkspace workspace("pool");
    ProcessPool pool(shell_profile(kOneTurnResumableAgent));
    ASSERT_FALSE(is_error(pool.ensure(kKey, workspace.root(), std::nullopt, {})));
    ASSERT_FALSE(is_error(pool.send(kKey, "one")));
    PollResult first = collect_turn(pool, kKey);
    EXPECT_TRUE(first.turn_completed);
    EXPECT_EQ(resumed_thread(first), "");
    ASSERT_TRUE(wait_for_exit(pool, kKey));

    // The vendor thread id is known by now; the replacement must resume it.
    ASSERT_FALSE(is_error(pool.ensure(kKey, workspace.root(), std::string("th_R"), {})));
    ASSERT_FALSE(is_error(pool.send(kKey, "two")));
    PollResult second = collect_turn(pool, kKey);
    EXPECT_TRUE(second.turn_completed);
    EXPECT_EQ(resumed_thread(second), "th_R");
}

TEST(ProcessPoolTest, SendRespawnUsesArgumentsOfLatestEnsure) {
    turnloom::testing::TempWorkspace workspace("pool");
    ProcessPool pool(shell_profile(kOneTurnResumableAgent));
    ASSERT_FALSE(is_error(pool.ensure(kKey, workspace.root(), std::nullopt, {})));
    // Still alive: only the recorded arguments change.
    ASSERT_FALSE(is_error(pool.ensure(kKey, workspace.root(), std::string("th_late"), {})));

    ASSERT_FALSE(is_error(pool.send(kKey, "one")));
    EXPECT_EQ(resumed_thread(collect_turn(pool, kKey)), "");
    ASSERT_TRUE(wait_for_exit(pool, kKey));

    ASSERT_FALSE(is_error(pool.send(kKey, "two")));
    EXPECT_EQ(resumed_thread(collect_turn(pool, kKey)), "th_late");
}

TEST(ProcessPoolTest, FailedRespawnFromEnsureIsSurfaced) {
    turnloom::testing::TempWorkspace workspace("pool");
    ProcessPool pool(shell_profile(kOneTurnAgent));
    ASSERT_FALSE(is_error(pool.ensure(kKey, workspace.root(), std::nullopt, {})));
    ASSERT_FALSE(is_error(pool.send(kKey, "one")));
    EXPECT_TRUE(collect_turn(pool, kKey).turn_completed);
    ASSERT_TRUE(wait_for_exit(pool, kKey));

    auto ensured = pool.ensure(kKey, workspace.root() / "missing", std::nullopt, {});
    ASSERT_TRUE(is_error(ensured));
    EXPECT_EQ(get_error(ensured).code, "process_spawn_failed");
    EXPECT_FALSE(pool.contains(kKey));
}

TEST(ProcessPoolTest, SendRespawnsOnlyOnce) {
    turnloom::testing::TempWorkspace workspace("pool");
    const auto workdir = workspace.root() / "checkout";
    std::filesystem::create_directories(workdir);
    ProcessPool pool(shell_profile(kOneTurnAgent));
    ASSERT_FALSE(is_error(pool.ensure(kKey, workdir, std::nullopt, {})));
    ASSERT_FALSE(is_error(pool.send(kKey, "one")));
    EXPECT_TRUE(collect_turn(pool, kKey).turn_completed);
    ASSERT_TRUE(wait_for_exit(pool, kKey));

    // The replacement cannot start without its working directory.
    std::filesystem::remove_all(workdir);
    auto sent = pool.send(kKey, "two");
    ASSERT_TRUE(is_error(sent));
    EXPECT_EQ(get_error(sent).code, "process_spawn_failed");
    EXPECT_FALSE(pool.contains(kKey));

    auto again = pool.send(kKey, "three");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "process_not_found");
}

TEST(ProcessPoolTest, MalformedOutputEndsTheTurn) {
    turnloom::testing::TempWorkspace workspace("pool");
    ProcessPool pool(shell_profile(kGarbageAgent));
    ASSERT_FALSE(is_error(pool.ensure(kKey, workspace.root(), std::nullopt, {})));
    ASSERT_FALSE(is_error(pool.send(kKey, "hi")));

    PollResult turn = collect_turn(pool, kKey);
    EXPECT_TRUE(turn.turn_completed);
    EXPECT_TRUE(turn.events.empty());
    ASSERT_TRUE(turn.protocol_error.has_value());
    EXPECT_EQ(turn.protocol_error->code, "vendor_protocol_error");
}

TEST(ProcessPoolTest, MissingBinaryFailsEnsure) {
    LaunchProfile profile;
    profile.command = {"/nonexistent/agent-binary"};
    ProcessPool pool(profile);
    auto ensured = pool.ensure(kKey, ".", std::nullopt, {});
    ASSERT_TRUE(is_error(ensured));
    EXPECT_EQ(get_error(ensured).code, "process_spawn_failed");
    EXPECT_FALSE(pool.contains(kKey));
}

TEST(ProcessPoolTest, ShutdownRemovesProcesses) {
    turnloom::testing::TempWorkspace workspace("pool");
    ProcessPool pool(shell_profile(kEchoAgent));
    const ThreadKey other{"proj", "main", 2};
    const ThreadKey foreign{"proj", "feature", 1};
    ASSERT_FALSE(is_error(pool.ensure(kKey, workspace.root(), std::nullopt, {})));
    ASSERT_FALSE(is_error(pool.ensure(other, workspace.root(), std::nullopt, {})));
    ASSERT_FALSE(is_error(pool.ensure(foreign, workspace.root(), std::nullopt, {})));
    EXPECT_EQ(pool.size(), 3u);

    pool.shutdown(kKey);
    pool.shutdown(kKey);
    EXPECT_FALSE(pool.contains(kKey));

    pool.shutdown_all_for("proj", "main");
    EXPECT_FALSE(pool.contains(other));
    EXPECT_TRUE(pool.contains(foreign));
    EXPECT_EQ(pool.size(), 1u);
}

}  // namespace
