#include "protocol/thread_events.hpp"

#include "core/logging/logger.hpp"
#include "protocol/overloaded.hpp"

namespace turnloom::protocol {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

EngineError protocol_error(const std::string& message) {
    return EngineError{ErrorCategory::Vendor, message,
                       core::errors::codes::kVendorProtocolError};
}

json usage_to_json(const TokenUsage& usage) {
    return json{{"input_tokens", usage.input_tokens},
                {"cached_input_tokens", usage.cached_input_tokens},
                {"output_tokens", usage.output_tokens}};
}

TokenUsage usage_from_json(const json& value) {
    TokenUsage usage;
    if (!value.is_object()) {
        return usage;
    }
    usage.input_tokens = value.value("input_tokens", std::uint64_t{0});
    usage.cached_input_tokens = value.value("cached_input_tokens", std::uint64_t{0});
    usage.output_tokens = value.value("output_tokens", std::uint64_t{0});
    return usage;
}

core::errors::Result<AgentItem> required_item(const json& value) {
    if (!value.contains("item")) {
        return protocol_error("Item event is missing its item.");
    }
    return item_from_json(value.at("item"));
}

core::errors::Result<std::optional<ThreadEvent>> parse_event(const json& value) {
    const std::string type = value.at("type").get<std::string>();

    if (type == "thread.started") {
        return std::optional<ThreadEvent>(ThreadStarted{value.at("thread_id").get<std::string>()});
    }
    if (type == "turn.started") {
        return std::optional<ThreadEvent>(TurnStarted{});
    }
    if (type == "turn.completed") {
        return std::optional<ThreadEvent>(
            TurnCompleted{usage_from_json(value.value("usage", json::object()))});
    }
    if (type == "turn.duration") {
        return std::optional<ThreadEvent>(
            TurnDuration{value.value("duration_ms", std::uint64_t{0})});
    }
    if (type == "turn.failed") {
        std::string message;
        if (value.contains("error") && value.at("error").is_object()) {
            message = value.at("error").value("message", std::string());
        }
        return std::optional<ThreadEvent>(TurnFailed{message});
    }
    if (type == "error") {
        return std::optional<ThreadEvent>(StreamError{value.value("message", std::string())});
    }
    if (type == "item.started" || type == "item.updated" || type == "item.completed") {
        auto item = required_item(value);
        if (core::errors::is_error(item)) {
            return core::errors::get_error(item);
        }
        AgentItem parsed = core::errors::take_value(item);
        if (type == "item.started") {
            return std::optional<ThreadEvent>(ItemStarted{std::move(parsed)});
        }
        if (type == "item.updated") {
            return std::optional<ThreadEvent>(ItemUpdated{std::move(parsed)});
        }
        return std::optional<ThreadEvent>(ItemCompleted{std::move(parsed)});
    }
    TURNLOOM_LOG_WARN("Protocol: ignoring agent event of unknown type '" + type + "'");
    return std::optional<ThreadEvent>();
}

}  // namespace

std::string event_type(const ThreadEvent& event) {
    return std::visit(
        overloaded{
            [](const ThreadStarted&) { return std::string("thread.started"); },
            [](const TurnStarted&) { return std::string("turn.started"); },
            [](const TurnCompleted&) { return std::string("turn.completed"); },
            [](const TurnDuration&) { return std::string("turn.duration"); },
            [](const TurnFailed&) { return std::string("turn.failed"); },
            [](const StreamError&) { return std::string("error"); },
            [](const ItemStarted&) { return std::string("item.started"); },
            [](const ItemUpdated&) { return std::string("item.updated"); },
            [](const ItemCompleted&) { return std::string("item.completed"); },
        },
        event);
}

const AgentItem* event_item(const ThreadEvent& event) {
    if (const auto* started = std::get_if<ItemStarted>(&event)) {
        return &started->item;
    }
    if (const auto* updated = std::get_if<ItemUpdated>(&event)) {
        return &updated->item;
    }
    if (const auto* completed = std::get_if<ItemCompleted>(&event)) {
        return &completed->item;
    }
    return nullptr;
}

AgentItem* event_item(ThreadEvent& event) {
    return const_cast<AgentItem*>(event_item(static_cast<const ThreadEvent&>(event)));
}

json event_to_json(const ThreadEvent& event) {
    json out = std::visit(
        overloaded{
            [](const ThreadStarted& typed) { return json{{"thread_id", typed.thread_id}}; },
            [](const TurnStarted&) { return json::object(); },
            [](const TurnCompleted& typed) { return json{{"usage", usage_to_json(typed.usage)}}; },
            [](const TurnDuration& typed) { return json{{"duration_ms", typed.duration_ms}}; },
            [](const TurnFailed& typed) {
                return json{{"error", json{{"message", typed.message}}}};
            },
            [](const StreamError& typed) { return json{{"message", typed.message}}; },
            [](const ItemStarted& typed) { return json{{"item", item_to_json(typed.item)}}; },
            [](const ItemUpdated& typed) { return json{{"item", item_to_json(typed.item)}}; },
            [](const ItemCompleted& typed) { return json{{"item", item_to_json(typed.item)}}; },
        },
        event);
    out["type"] = event_type(event);
    return out;
}

core::errors::Result<std::optional<ThreadEvent>> event_from_json(const json& value) {
    if (!value.is_object() || !value.contains("type") || !value.at("type").is_string()) {
        return protocol_error("Agent event is missing a type tag.");
    }
    try {
        return parse_event(value);
    } catch (const json::exception& e) {
        return protocol_error("Malformed agent event: " + std::string(e.what()));
    }
}

core::errors::Result<std::optional<ThreadEvent>> parse_event_line(const std::string& line) {
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos || line[first] != '{') {
        return std::optional<ThreadEvent>();
    }

    json value = json::parse(line, nullptr, false);
    if (value.is_discarded()) {
        return protocol_error("Agent emitted a line that is not valid JSON: " +
                              line.substr(0, 200));
    }
    return event_from_json(value);
}

} // namespace turnloom::protocol
