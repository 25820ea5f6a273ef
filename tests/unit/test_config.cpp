#include <map>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/config/engine_config.hpp"
#include "core/config/ids.hpp"

namespace {

using turnloom::core::config::EnvLookup;
using turnloom::core::config::load_engine_config;
using turnloom::core::errors::get_error;
using turnloom::core::errors::get_value;
using turnloom::core::errors::is_error;

EnvLookup fake_env(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        auto found = values.find(name);
        if (found == values.end()) {
            return std::nullopt;
        }
        return found->second;
    };
}

TEST(EngineConfigTest, DefaultsRootedAtHome) {
    auto loaded = load_engine_config(fake_env({{"HOME", "/home/dev"}}));
    ASSERT_FALSE(is_error(loaded));
    const auto& config = get_value(loaded);
    EXPECT_EQ(config.db_path.string(), "/home/dev/.turnloom/turnloom.db");
    EXPECT_EQ(config.blobs_dir.string(), "/home/dev/.turnloom/blobs");
    EXPECT_EQ(config.poll_interval_ms, 25u);
    EXPECT_EQ(config.turn_timeout_ms, 10u * 60 * 1000);
    EXPECT_TRUE(config.claude.reuse_process);
    EXPECT_FALSE(config.codex.reuse_process);
    EXPECT_FALSE(config.runner_override.has_value());
}

TEST(EngineConfigTest, ExplicitRootAndOverrides) {
    auto loaded = load_engine_config(fake_env({
        {"TURNLOOM_ROOT", "/srv/tl"},
        {"TURNLOOM_DB_PATH", "/tmp/other.db"},
        {"TURNLOOM_CLAUDE_BIN", "/opt/claude"},
        {"TURNLOOM_AGENT_RUNNER", "amp"},
        {"TURNLOOM_POLL_INTERVAL_MS", "5"},
        {"TURNLOOM_TURN_TIMEOUT_MS", "2000"},
        {"TURNLOOM_LOG_LEVEL", "debug"},
    }));
    ASSERT_FALSE(is_error(loaded));
    const auto& config = get_value(loaded);
    EXPECT_EQ(config.db_path.string(), "/tmp/other.db");
    EXPECT_EQ(config.blobs_dir.string(), "/srv/tl/blobs");
    EXPECT_EQ(config.claude.command.front(), "/opt/claude");
    ASSERT_TRUE(config.runner_override.has_value());
    EXPECT_EQ(*config.runner_override, "amp");
    EXPECT_EQ(config.poll_interval_ms, 5u);
    EXPECT_EQ(config.turn_timeout_ms, 2000u);
    EXPECT_EQ(config.log_level, turnloom::core::logging::LogLevel::DEBUG);
}

TEST(EngineConfigTest, RejectsNonNumericPollInterval) {
    auto loaded = load_engine_config(
        fake_env({{"HOME", "/home/dev"}, {"TURNLOOM_POLL_INTERVAL_MS", "fast"}}));
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_config");
}

TEST(EngineConfigTest, RejectsOutOfBoundsTimeout) {
    auto loaded = load_engine_config(
        fake_env({{"HOME", "/home/dev"}, {"TURNLOOM_TURN_TIMEOUT_MS", "0"}}));
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_config");
}

TEST(EngineConfigTest, RejectsUnknownLogLevel) {
    auto loaded =
        load_engine_config(fake_env({{"HOME", "/home/dev"}, {"TURNLOOM_LOG_LEVEL", "loud"}}));
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_config");
}

TEST(EngineConfigTest, FailsWithoutRootOrHome) {
    auto loaded = load_engine_config(fake_env({}));
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_config");
}

TEST(IdsTest, TurnScopeIdsAreDistinctAndPrefixed) {
    const std::string a = turnloom::core::config::generate_turn_scope_id();
    const std::string b = turnloom::core::config::generate_turn_scope_id();
    EXPECT_EQ(a.rfind("turn-", 0), 0u);
    EXPECT_NE(a, b);
}

TEST(IdsTest, TokenHasPrefixAndLength) {
    const std::string token = turnloom::core::config::generate_token("x_", 10);
    EXPECT_EQ(token.size(), 12u);
    EXPECT_EQ(token.rfind("x_", 0), 0u);
}

}  // namespace
