#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/engine_errors.hpp"
#include "protocol/conversation_entry.hpp"

namespace turnloom::protocol {

    enum class AgentRunnerKind {
        Codex,
        Claude,
        Amp
    };

    enum class ThinkingEffort {
        Minimal,
        Low,
        Medium,
        High,
        XHigh
    };

    // Per-turn agent selection. Captured with each queued prompt so a prompt runs with
    // the configuration it was submitted under.
    struct AgentRunConfig {
        AgentRunnerKind runner = AgentRunnerKind::Codex;
        std::string model_id;
        ThinkingEffort thinking_effort = ThinkingEffort::Medium;
        std::optional<std::string> amp_mode;

        bool operator==(const AgentRunConfig& other) const {
            return runner == other.runner && model_id == other.model_id &&
                   thinking_effort == other.thinking_effort && amp_mode == other.amp_mode;
        }
    };

    struct QueuedPrompt {
        std::uint64_t id = 0;
        std::string text;
        std::vector<AttachmentRef> attachments;
        AgentRunConfig run_config;
    };

    std::string to_string(AgentRunnerKind runner);
    std::optional<AgentRunnerKind> parse_runner_kind(const std::string& text);
    std::string to_string(ThinkingEffort effort);
    std::optional<ThinkingEffort> parse_thinking_effort(const std::string& text);

    nlohmann::json run_config_to_json(const AgentRunConfig& config);
    nlohmann::json queued_prompt_to_json(const QueuedPrompt& prompt);
    core::errors::Result<QueuedPrompt> queued_prompt_from_json(const nlohmann::json& value);

} // namespace turnloom::protocol
