#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/engine_errors.hpp"
#include "protocol/agent_items.hpp"

namespace turnloom::protocol {

    struct TokenUsage {
        std::uint64_t input_tokens = 0;
        std::uint64_t cached_input_tokens = 0;
        std::uint64_t output_tokens = 0;

        bool operator==(const TokenUsage& other) const {
            return input_tokens == other.input_tokens &&
                   cached_input_tokens == other.cached_input_tokens &&
                   output_tokens == other.output_tokens;
        }
    };

    // Normalized agent stream. Every vendor is reduced to these events.
    struct ThreadStarted { std::string thread_id; };
    struct TurnStarted {};
    struct TurnCompleted { TokenUsage usage; };
    struct TurnDuration { std::uint64_t duration_ms = 0; };
    struct TurnFailed { std::string message; };
    struct StreamError { std::string message; };
    struct ItemStarted { AgentItem item; };
    struct ItemUpdated { AgentItem item; };
    struct ItemCompleted { AgentItem item; };

    using ThreadEvent = std::variant<
        ThreadStarted,
        TurnStarted,
        TurnCompleted,
        TurnDuration,
        TurnFailed,
        StreamError,
        ItemStarted,
        ItemUpdated,
        ItemCompleted
    >;

    std::string event_type(const ThreadEvent& event);

    // Item carried by an item.* event, or nullptr for the other kinds.
    const AgentItem* event_item(const ThreadEvent& event);
    AgentItem* event_item(ThreadEvent& event);

    nlohmann::json event_to_json(const ThreadEvent& event);

    // nullopt for a well-formed event of a type this build does not know.
    core::errors::Result<std::optional<ThreadEvent>> event_from_json(const nlohmann::json& value);

    // Parses one line of the line-delimited stream.
    core::errors::Result<std::optional<ThreadEvent>> parse_event_line(const std::string& line);

} // namespace turnloom::protocol
