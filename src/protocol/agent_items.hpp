#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/engine_errors.hpp"

namespace turnloom::protocol {

    enum class ItemStatus {
        InProgress,
        Completed,
        Failed
    };

    enum class FileChangeKind {
        Add,
        Delete,
        Update
    };

    struct FileChange {
        std::string path;
        FileChangeKind kind = FileChangeKind::Update;
    };

    struct TodoEntry {
        std::string text;
        bool completed = false;
    };

    // One item variant per kind the agents emit today.
    struct AgentMessageItem { std::string id; std::string text; };
    struct ReasoningItem { std::string id; std::string text; };
    struct CommandExecutionItem {
        std::string id;
        std::string command;
        std::string aggregated_output;
        std::optional<int> exit_code;
        ItemStatus status = ItemStatus::InProgress;
    };
    struct FileChangeItem {
        std::string id;
        std::vector<FileChange> changes;
        ItemStatus status = ItemStatus::InProgress;
    };
    struct McpToolCallItem {
        std::string id;
        std::string server;
        std::string tool;
        nlohmann::json arguments;
        std::optional<nlohmann::json> result;
        std::optional<std::string> error_message;
        ItemStatus status = ItemStatus::InProgress;
    };
    struct WebSearchItem { std::string id; std::string query; };
    struct TodoListItem { std::string id; std::vector<TodoEntry> items; };
    struct ErrorItem { std::string id; std::string message; };

    // Kinds this build does not know yet. Kept verbatim so they survive a round trip.
    struct UnknownItem {
        std::string type;
        std::string id;
        nlohmann::json raw;
    };

    using AgentItem = std::variant<
        AgentMessageItem,
        ReasoningItem,
        CommandExecutionItem,
        FileChangeItem,
        McpToolCallItem,
        WebSearchItem,
        TodoListItem,
        ErrorItem,
        UnknownItem
    >;

    const std::string& item_id(const AgentItem& item);
    void set_item_id(AgentItem& item, std::string id);
    std::string item_type(const AgentItem& item);
    bool is_agent_message(const AgentItem& item);

    nlohmann::json item_to_json(const AgentItem& item);
    core::errors::Result<AgentItem> item_from_json(const nlohmann::json& value);

    std::string to_string(ItemStatus status);
    std::string to_string(FileChangeKind kind);

} // namespace turnloom::protocol
