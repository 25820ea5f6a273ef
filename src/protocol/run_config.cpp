#include "protocol/run_config.hpp"

namespace turnloom::protocol {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentRunConfig run_config_from_json(const json& value) {
    AgentRunConfig config;
    if (!value.is_object()) {
        return config;
    }
    const auto runner = parse_runner_kind(value.value("runner", std::string("codex")));
    if (runner.has_value()) {
        config.runner = *runner;
    }
    config.model_id = value.value("model_id", std::string());
    const auto effort = parse_thinking_effort(value.value("thinking_effort", std::string("medium")));
    if (effort.has_value()) {
        config.thinking_effort = *effort;
    }
    if (value.contains("amp_mode") && value.at("amp_mode").is_string()) {
        config.amp_mode = value.at("amp_mode").get<std::string>();
    }
    return config;
}

}  // namespace

std::string to_string(const AgentRunnerKind runner) {
    switch (runner) {
        case AgentRunnerKind::Codex:
            return "codex";
        case AgentRunnerKind::Claude:
            return "claude";
        case AgentRunnerKind::Amp:
            return "amp";
        default:
            return "unknown";
    }
}

std::optional<AgentRunnerKind> parse_runner_kind(const std::string& text) {
    if (text == "codex") return AgentRunnerKind::Codex;
    if (text == "claude") return AgentRunnerKind::Claude;
    if (text == "amp") return AgentRunnerKind::Amp;
    return std::nullopt;
}

std::string to_string(const ThinkingEffort effort) {
    switch (effort) {
        case ThinkingEffort::Minimal:
            return "minimal";
        case ThinkingEffort::Low:
            return "low";
        case ThinkingEffort::Medium:
            return "medium";
        case ThinkingEffort::High:
            return "high";
        case ThinkingEffort::XHigh:
            return "xhigh";
        default:
            return "unknown";
    }
}

std::optional<ThinkingEffort> parse_thinking_effort(const std::string& text) {
    if (text == "minimal") return ThinkingEffort::Minimal;
    if (text == "low") return ThinkingEffort::Low;
    if (text == "medium") return ThinkingEffort::Medium;
    if (text == "high") return ThinkingEffort::High;
    if (text == "xhigh") return ThinkingEffort::XHigh;
    return std::nullopt;
}

json run_config_to_json(const AgentRunConfig& config) {
    json out{{"runner", to_string(config.runner)},
             {"model_id", config.model_id},
             {"thinking_effort", to_string(config.thinking_effort)}};
    out["amp_mode"] = config.amp_mode.has_value() ? json(*config.amp_mode) : json();
    return out;
}

json queued_prompt_to_json(const QueuedPrompt& prompt) {
    json attachments = json::array();
    for (const auto& attachment : prompt.attachments) {
        attachments.push_back(attachment_to_json(attachment));
    }
    return json{{"id", prompt.id},
                {"text", prompt.text},
                {"attachments", attachments},
                {"run_config", run_config_to_json(prompt.run_config)}};
}

core::errors::Result<QueuedPrompt> queued_prompt_from_json(const json& value) {
    try {
        QueuedPrompt prompt;
        prompt.id = value.at("id").get<std::uint64_t>();
        prompt.text = value.value("text", std::string());
        if (value.contains("attachments")) {
            for (const auto& attachment : value.at("attachments")) {
                prompt.attachments.push_back(attachment_from_json(attachment));
            }
        }
        prompt.run_config = run_config_from_json(value.value("run_config", json::object()));
        return prompt;
    } catch (const json::exception& e) {
        return EngineError{ErrorCategory::Storage,
                           "Malformed queued prompt: " + std::string(e.what()),
                           core::errors::codes::kMalformedEntry};
    }
}

} // namespace turnloom::protocol
