#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/engine_errors.hpp"
#include "protocol/agent_items.hpp"
#include "protocol/thread_events.hpp"

namespace turnloom::protocol {

    enum class AttachmentKind {
        Image,
        Text,
        File
    };

    // Reference to an attachment blob. Bytes are resolved by the caller.
    struct AttachmentRef {
        std::string id;
        AttachmentKind kind = AttachmentKind::File;
        std::string name;
        std::string extension;
        std::optional<std::string> mime;
        std::uint64_t byte_len = 0;

        bool operator==(const AttachmentRef& other) const {
            return id == other.id && kind == other.kind && name == other.name &&
                   extension == other.extension && mime == other.mime &&
                   byte_len == other.byte_len;
        }
    };

    enum class TaskStatus {
        Backlog,
        Todo,
        Iterating,
        Validating,
        Done,
        Canceled
    };

    struct TaskCreated {};
    struct TaskStatusChanged {
        TaskStatus from = TaskStatus::Backlog;
        TaskStatus to = TaskStatus::Backlog;
    };
    using SystemEvent = std::variant<TaskCreated, TaskStatusChanged>;

    struct UserMessage {
        std::string text;
        std::vector<AttachmentRef> attachments;
    };

    struct AgentMessage { std::string id; std::string text; };
    struct AgentItemRecord { AgentItem item; };
    struct TurnUsageRecord { std::optional<TokenUsage> usage; };
    struct TurnDurationRecord { std::uint64_t duration_ms = 0; };
    struct TurnCanceledRecord {};
    struct TurnErrorRecord { std::string message; };

    using AgentEvent = std::variant<
        AgentMessage,
        AgentItemRecord,
        TurnUsageRecord,
        TurnDurationRecord,
        TurnCanceledRecord,
        TurnErrorRecord
    >;

    struct SystemEntry {
        std::string entry_id;
        std::int64_t created_at_unix_ms = 0;
        SystemEvent event;
    };

    struct UserEntry {
        std::string entry_id;
        UserMessage event;
    };

    struct AgentEntry {
        std::string entry_id;
        AgentEvent event;
    };

    using ConversationEntry = std::variant<SystemEntry, UserEntry, AgentEntry>;

    // Columns the store indexes an entry by. item_id is set for agent messages and items.
    struct EntryIndex {
        std::string kind;
        std::optional<std::string> item_id;
    };

    namespace entry_kinds {
        inline constexpr const char* kSystemEvent = "system_event";
        inline constexpr const char* kUserMessage = "user_message";
        inline constexpr const char* kAgentItem = "agent_item";
        inline constexpr const char* kTurnUsage = "turn_usage";
        inline constexpr const char* kTurnDuration = "turn_duration";
        inline constexpr const char* kTurnCanceled = "turn_canceled";
        inline constexpr const char* kTurnError = "turn_error";
    }  // namespace entry_kinds

    const std::string& entry_id(const ConversationEntry& entry);
    void set_entry_id(ConversationEntry& entry, std::string id);
    EntryIndex entry_index(const ConversationEntry& entry);

    // True when both entries describe the same record. Items compare by item id only,
    // so an item that progressed (in_progress -> completed) is still the same entry.
    // Entry ids are compared only when both sides carry one.
    bool entry_is_same(const ConversationEntry& a, const ConversationEntry& b);

    ConversationEntry make_user_entry(std::string text, std::vector<AttachmentRef> attachments);
    ConversationEntry make_agent_entry(AgentEvent event);
    // agent_message items become AgentMessage records, everything else AgentItemRecord.
    ConversationEntry make_item_entry(const AgentItem& item);
    ConversationEntry make_system_entry(std::string entry_id, std::int64_t created_at_unix_ms,
                                        SystemEvent event);

    std::string to_string(TaskStatus status);
    std::optional<TaskStatus> parse_task_status(const std::string& text);
    std::string to_string(AttachmentKind kind);

    nlohmann::json attachment_to_json(const AttachmentRef& attachment);
    AttachmentRef attachment_from_json(const nlohmann::json& value);

    nlohmann::json entry_to_json(const ConversationEntry& entry);
    core::errors::Result<ConversationEntry> entry_from_json(const nlohmann::json& value);

    // First line of the text, trimmed, at most 48 characters.
    std::string derive_thread_title(const std::string& text);

} // namespace turnloom::protocol
