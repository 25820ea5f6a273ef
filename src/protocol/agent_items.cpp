#include "protocol/agent_items.hpp"

#include <utility>
#include "protocol/overloaded.hpp"

namespace turnloom::protocol {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

ItemStatus parse_status(const json& value) {
    const std::string raw = value.value("status", std::string("in_progress"));
    if (raw == "completed") {
        return ItemStatus::Completed;
    }
    if (raw == "failed") {
        return ItemStatus::Failed;
    }
    return ItemStatus::InProgress;
}

FileChangeKind parse_change_kind(const std::string& raw) {
    if (raw == "add") {
        return FileChangeKind::Add;
    }
    if (raw == "delete") {
        return FileChangeKind::Delete;
    }
    return FileChangeKind::Update;
}

AgentItem parse_item(const json& value) {
    const std::string type = value.at("type").get<std::string>();
    const std::string id = value.value("id", std::string());

    if (type == "agent_message") {
        return AgentMessageItem{id, value.value("text", std::string())};
    }
    if (type == "reasoning") {
        return ReasoningItem{id, value.value("text", std::string())};
    }
    if (type == "command_execution") {
        CommandExecutionItem item;
        item.id = id;
        item.command = value.value("command", std::string());
        item.aggregated_output = value.value("aggregated_output", std::string());
        if (value.contains("exit_code") && !value.at("exit_code").is_null()) {
            item.exit_code = value.at("exit_code").get<int>();
        }
        item.status = parse_status(value);
        return item;
    }
    if (type == "file_change") {
        FileChangeItem item;
        item.id = id;
        if (value.contains("changes")) {
            for (const auto& change : value.at("changes")) {
                item.changes.push_back(FileChange{
                    change.value("path", std::string()),
                    parse_change_kind(change.value("kind", std::string("update")))});
            }
        }
        item.status = parse_status(value);
        return item;
    }
    if (type == "mcp_tool_call") {
        McpToolCallItem item;
        item.id = id;
        item.server = value.value("server", std::string());
        item.tool = value.value("tool", std::string());
        item.arguments = value.value("arguments", json());
        if (value.contains("result") && !value.at("result").is_null()) {
            item.result = value.at("result");
        }
        if (value.contains("error") && value.at("error").is_object()) {
            item.error_message = value.at("error").value("message", std::string());
        }
        item.status = parse_status(value);
        return item;
    }
    if (type == "web_search") {
        return WebSearchItem{id, value.value("query", std::string())};
    }
    if (type == "todo_list") {
        TodoListItem item;
        item.id = id;
        if (value.contains("items")) {
            for (const auto& todo : value.at("items")) {
                item.items.push_back(
                    TodoEntry{todo.value("text", std::string()), todo.value("completed", false)});
            }
        }
        return item;
    }
    if (type == "error") {
        return ErrorItem{id, value.value("message", std::string())};
    }
    return UnknownItem{type, id, value};
}

}  // namespace

const std::string& item_id(const AgentItem& item) {
    return std::visit([](const auto& typed) -> const std::string& { return typed.id; }, item);
}

void set_item_id(AgentItem& item, std::string id) {
    std::visit(
        overloaded{
            [&](UnknownItem& typed) {
                typed.raw["id"] = id;
                typed.id = std::move(id);
            },
            [&](auto& typed) { typed.id = std::move(id); },
        },
        item);
}

std::string item_type(const AgentItem& item) {
    return std::visit(
        overloaded{
            [](const AgentMessageItem&) { return std::string("agent_message"); },
            [](const ReasoningItem&) { return std::string("reasoning"); },
            [](const CommandExecutionItem&) { return std::string("command_execution"); },
            [](const FileChangeItem&) { return std::string("file_change"); },
            [](const McpToolCallItem&) { return std::string("mcp_tool_call"); },
            [](const WebSearchItem&) { return std::string("web_search"); },
            [](const TodoListItem&) { return std::string("todo_list"); },
            [](const ErrorItem&) { return std::string("error"); },
            [](const UnknownItem& typed) { return typed.type; },
        },
        item);
}

bool is_agent_message(const AgentItem& item) {
    return std::holds_alternative<AgentMessageItem>(item);
}

std::string to_string(const ItemStatus status) {
    switch (status) {
        case ItemStatus::InProgress:
            return "in_progress";
        case ItemStatus::Completed:
            return "completed";
        case ItemStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

std::string to_string(const FileChangeKind kind) {
    switch (kind) {
        case FileChangeKind::Add:
            return "add";
        case FileChangeKind::Delete:
            return "delete";
        case FileChangeKind::Update:
            return "update";
        default:
            return "unknown";
    }
}

json item_to_json(const AgentItem& item) {
    return std::visit(
        overloaded{
            [](const AgentMessageItem& typed) {
                return json{{"type", "agent_message"}, {"id", typed.id}, {"text", typed.text}};
            },
            [](const ReasoningItem& typed) {
                return json{{"type", "reasoning"}, {"id", typed.id}, {"text", typed.text}};
            },
            [](const CommandExecutionItem& typed) {
                json out{{"type", "command_execution"},
                         {"id", typed.id},
                         {"command", typed.command},
                         {"aggregated_output", typed.aggregated_output},
                         {"status", to_string(typed.status)}};
                out["exit_code"] = typed.exit_code.has_value() ? json(*typed.exit_code) : json();
                return out;
            },
            [](const FileChangeItem& typed) {
                json changes = json::array();
                for (const auto& change : typed.changes) {
                    changes.push_back({{"path", change.path}, {"kind", to_string(change.kind)}});
                }
                return json{{"type", "file_change"},
                            {"id", typed.id},
                            {"changes", changes},
                            {"status", to_string(typed.status)}};
            },
            [](const McpToolCallItem& typed) {
                json out{{"type", "mcp_tool_call"},
                         {"id", typed.id},
                         {"server", typed.server},
                         {"tool", typed.tool},
                         {"arguments", typed.arguments},
                         {"status", to_string(typed.status)}};
                out["result"] = typed.result.has_value() ? *typed.result : json();
                out["error"] = typed.error_message.has_value()
                                   ? json{{"message", *typed.error_message}}
                                   : json();
                return out;
            },
            [](const WebSearchItem& typed) {
                return json{{"type", "web_search"}, {"id", typed.id}, {"query", typed.query}};
            },
            [](const TodoListItem& typed) {
                json items = json::array();
                for (const auto& todo : typed.items) {
                    items.push_back({{"text", todo.text}, {"completed", todo.completed}});
                }
                return json{{"type", "todo_list"}, {"id", typed.id}, {"items", items}};
            },
            [](const ErrorItem& typed) {
                return json{{"type", "error"}, {"id", typed.id}, {"message", typed.message}};
            },
            [](const UnknownItem& typed) {
                json out = typed.raw.is_object() ? typed.raw : json::object();
                out["type"] = typed.type;
                out["id"] = typed.id;
                return out;
            },
        },
        item);
}

core::errors::Result<AgentItem> item_from_json(const json& value) {
    if (!value.is_object() || !value.contains("type") || !value.at("type").is_string()) {
        return EngineError{ErrorCategory::Vendor, "Agent item is missing a type tag.",
                           core::errors::codes::kVendorProtocolError};
    }
    try {
        return parse_item(value);
    } catch (const json::exception& e) {
        return EngineError{ErrorCategory::Vendor,
                           "Malformed agent item: " + std::string(e.what()),
                           core::errors::codes::kVendorProtocolError};
    }
}

} // namespace turnloom::protocol
