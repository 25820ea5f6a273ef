#include "protocol/conversation_entry.hpp"

#include <stdexcept>
#include <utility>
#include "protocol/overloaded.hpp"

namespace turnloom::protocol {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

EngineError malformed(const std::string& message) {
    return EngineError{ErrorCategory::Storage, message, core::errors::codes::kMalformedEntry};
}

AttachmentKind parse_attachment_kind(const std::string& raw) {
    if (raw == "image") {
        return AttachmentKind::Image;
    }
    if (raw == "text") {
        return AttachmentKind::Text;
    }
    return AttachmentKind::File;
}

json system_event_to_json(const SystemEvent& event) {
    return std::visit(
        overloaded{
            [](const TaskCreated&) { return json{{"event_type", "task_created"}}; },
            [](const TaskStatusChanged& typed) {
                return json{{"event_type", "task_status_changed"},
                            {"from", to_string(typed.from)},
                            {"to", to_string(typed.to)}};
            },
        },
        event);
}

TaskStatus required_status(const json& value, const char* field) {
    const auto parsed = parse_task_status(value.at(field).get<std::string>());
    if (!parsed.has_value()) {
        throw std::invalid_argument("unknown task status '" + value.at(field).get<std::string>() +
                                    "'");
    }
    return *parsed;
}

SystemEvent system_event_from_json(const json& value) {
    const std::string type = value.at("event_type").get<std::string>();
    if (type == "task_created") {
        return TaskCreated{};
    }
    if (type == "task_status_changed") {
        return TaskStatusChanged{required_status(value, "from"), required_status(value, "to")};
    }
    throw std::invalid_argument("unknown system event '" + type + "'");
}

json agent_event_to_json(const AgentEvent& event) {
    return std::visit(
        overloaded{
            [](const AgentMessage& typed) {
                return json{{"type", "message"}, {"id", typed.id}, {"text", typed.text}};
            },
            [](const AgentItemRecord& typed) {
                return json{{"type", "item"}, {"item", item_to_json(typed.item)}};
            },
            [](const TurnUsageRecord& typed) {
                json usage;
                if (typed.usage.has_value()) {
                    usage = json{{"input_tokens", typed.usage->input_tokens},
                                 {"cached_input_tokens", typed.usage->cached_input_tokens},
                                 {"output_tokens", typed.usage->output_tokens}};
                }
                return json{{"type", "turn_usage"}, {"usage", usage}};
            },
            [](const TurnDurationRecord& typed) {
                return json{{"type", "turn_duration"}, {"duration_ms", typed.duration_ms}};
            },
            [](const TurnCanceledRecord&) { return json{{"type", "turn_canceled"}}; },
            [](const TurnErrorRecord& typed) {
                return json{{"type", "turn_error"}, {"message", typed.message}};
            },
        },
        event);
}

AgentEvent agent_event_from_json(const json& value) {
    const std::string type = value.at("type").get<std::string>();
    if (type == "message") {
        return AgentMessage{value.value("id", std::string()), value.value("text", std::string())};
    }
    if (type == "item") {
        auto item = item_from_json(value.at("item"));
        if (core::errors::is_error(item)) {
            throw std::invalid_argument(core::errors::get_error(item).message);
        }
        return AgentItemRecord{core::errors::take_value(item)};
    }
    if (type == "turn_usage") {
        TurnUsageRecord record;
        if (value.contains("usage") && value.at("usage").is_object()) {
            const auto& usage = value.at("usage");
            record.usage = TokenUsage{usage.value("input_tokens", std::uint64_t{0}),
                                      usage.value("cached_input_tokens", std::uint64_t{0}),
                                      usage.value("output_tokens", std::uint64_t{0})};
        }
        return record;
    }
    if (type == "turn_duration") {
        return TurnDurationRecord{value.value("duration_ms", std::uint64_t{0})};
    }
    if (type == "turn_canceled") {
        return TurnCanceledRecord{};
    }
    if (type == "turn_error") {
        return TurnErrorRecord{value.value("message", std::string())};
    }
    throw std::invalid_argument("unknown agent event '" + type + "'");
}

ConversationEntry parse_entry(const json& value) {
    const std::string type = value.at("type").get<std::string>();
    if (type == "system_event") {
        SystemEntry entry;
        if (value.contains("entry_id")) {
            entry.entry_id = value.at("entry_id").get<std::string>();
        } else {
            entry.entry_id = value.value("id", std::string());
        }
        entry.created_at_unix_ms = value.value("created_at_unix_ms", std::int64_t{0});
        entry.event = system_event_from_json(value.at("event"));
        return entry;
    }
    if (type == "user_event") {
        const auto& event = value.at("event");
        if (event.value("type", std::string()) != "message") {
            throw std::invalid_argument("unknown user event");
        }
        UserEntry entry;
        entry.entry_id = value.value("entry_id", std::string());
        entry.event.text = event.value("text", std::string());
        if (event.contains("attachments")) {
            for (const auto& attachment : event.at("attachments")) {
                entry.event.attachments.push_back(attachment_from_json(attachment));
            }
        }
        return entry;
    }
    if (type == "agent_event") {
        AgentEntry entry;
        entry.entry_id = value.value("entry_id", std::string());
        entry.event = agent_event_from_json(value.at("event"));
        return entry;
    }
    throw std::invalid_argument("unknown conversation entry type '" + type + "'");
}

}  // namespace

const std::string& entry_id(const ConversationEntry& entry) {
    return std::visit([](const auto& typed) -> const std::string& { return typed.entry_id; },
                      entry);
}

void set_entry_id(ConversationEntry& entry, std::string id) {
    std::visit([&](auto& typed) { typed.entry_id = std::move(id); }, entry);
}

EntryIndex entry_index(const ConversationEntry& entry) {
    return std::visit(
        overloaded{
            [](const SystemEntry&) { return EntryIndex{entry_kinds::kSystemEvent, std::nullopt}; },
            [](const UserEntry&) { return EntryIndex{entry_kinds::kUserMessage, std::nullopt}; },
            [](const AgentEntry& typed) {
                return std::visit(
                    overloaded{
                        [](const AgentMessage& event) {
                            return EntryIndex{entry_kinds::kAgentItem, event.id};
                        },
                        [](const AgentItemRecord& event) {
                            return EntryIndex{entry_kinds::kAgentItem, item_id(event.item)};
                        },
                        [](const TurnUsageRecord&) {
                            return EntryIndex{entry_kinds::kTurnUsage, std::nullopt};
                        },
                        [](const TurnDurationRecord&) {
                            return EntryIndex{entry_kinds::kTurnDuration, std::nullopt};
                        },
                        [](const TurnCanceledRecord&) {
                            return EntryIndex{entry_kinds::kTurnCanceled, std::nullopt};
                        },
                        [](const TurnErrorRecord&) {
                            return EntryIndex{entry_kinds::kTurnError, std::nullopt};
                        },
                    },
                    typed.event);
            },
        },
        entry);
}

bool entry_is_same(const ConversationEntry& a, const ConversationEntry& b) {
    if (a.index() != b.index()) {
        return false;
    }
    // Optimistic local entries have no id until the store assigns one.
    const bool both_have_ids = !entry_id(a).empty() && !entry_id(b).empty();
    if (both_have_ids && entry_id(a) != entry_id(b)) {
        return false;
    }
    const auto* a_agent = std::get_if<AgentEntry>(&a);
    const auto* b_agent = std::get_if<AgentEntry>(&b);
    if (a_agent != nullptr && b_agent != nullptr) {
        const auto* a_item = std::get_if<AgentItemRecord>(&a_agent->event);
        const auto* b_item = std::get_if<AgentItemRecord>(&b_agent->event);
        if (a_item != nullptr && b_item != nullptr) {
            return item_id(a_item->item) == item_id(b_item->item);
        }
    }
    json a_json = entry_to_json(a);
    json b_json = entry_to_json(b);
    a_json.erase("entry_id");
    b_json.erase("entry_id");
    if (std::holds_alternative<SystemEntry>(a) && !both_have_ids) {
        a_json.erase("created_at_unix_ms");
        b_json.erase("created_at_unix_ms");
    }
    return a_json == b_json;
}

ConversationEntry make_user_entry(std::string text, std::vector<AttachmentRef> attachments) {
    return UserEntry{"", UserMessage{std::move(text), std::move(attachments)}};
}

ConversationEntry make_agent_entry(AgentEvent event) {
    return AgentEntry{"", std::move(event)};
}

ConversationEntry make_item_entry(const AgentItem& item) {
    if (const auto* message = std::get_if<AgentMessageItem>(&item)) {
        return make_agent_entry(AgentMessage{message->id, message->text});
    }
    return make_agent_entry(AgentItemRecord{item});
}

ConversationEntry make_system_entry(std::string entry_id, const std::int64_t created_at_unix_ms,
                                    SystemEvent event) {
    return SystemEntry{std::move(entry_id), created_at_unix_ms, std::move(event)};
}

std::string to_string(const TaskStatus status) {
    switch (status) {
        case TaskStatus::Backlog:
            return "backlog";
        case TaskStatus::Todo:
            return "todo";
        case TaskStatus::Iterating:
            return "iterating";
        case TaskStatus::Validating:
            return "validating";
        case TaskStatus::Done:
            return "done";
        case TaskStatus::Canceled:
            return "canceled";
        default:
            return "unknown";
    }
}

std::optional<TaskStatus> parse_task_status(const std::string& text) {
    if (text == "backlog") return TaskStatus::Backlog;
    if (text == "todo") return TaskStatus::Todo;
    if (text == "iterating" || text == "in_progress") return TaskStatus::Iterating;
    if (text == "validating" || text == "in_review") return TaskStatus::Validating;
    if (text == "done") return TaskStatus::Done;
    if (text == "canceled") return TaskStatus::Canceled;
    return std::nullopt;
}

std::string to_string(const AttachmentKind kind) {
    switch (kind) {
        case AttachmentKind::Image:
            return "image";
        case AttachmentKind::Text:
            return "text";
        case AttachmentKind::File:
            return "file";
        default:
            return "unknown";
    }
}

json attachment_to_json(const AttachmentRef& attachment) {
    json out{{"id", attachment.id},
             {"kind", to_string(attachment.kind)},
             {"name", attachment.name},
             {"extension", attachment.extension},
             {"byte_len", attachment.byte_len}};
    out["mime"] = attachment.mime.has_value() ? json(*attachment.mime) : json();
    return out;
}

AttachmentRef attachment_from_json(const json& value) {
    AttachmentRef attachment;
    attachment.id = value.at("id").get<std::string>();
    attachment.kind = parse_attachment_kind(value.value("kind", std::string("file")));
    attachment.name = value.value("name", std::string());
    attachment.extension = value.value("extension", std::string());
    if (value.contains("mime") && value.at("mime").is_string()) {
        attachment.mime = value.at("mime").get<std::string>();
    }
    attachment.byte_len = value.value("byte_len", std::uint64_t{0});
    return attachment;
}

json entry_to_json(const ConversationEntry& entry) {
    return std::visit(
        overloaded{
            [](const SystemEntry& typed) {
                return json{{"type", "system_event"},
                            {"entry_id", typed.entry_id},
                            {"created_at_unix_ms", typed.created_at_unix_ms},
                            {"event", system_event_to_json(typed.event)}};
            },
            [](const UserEntry& typed) {
                json attachments = json::array();
                for (const auto& attachment : typed.event.attachments) {
                    attachments.push_back(attachment_to_json(attachment));
                }
                return json{{"type", "user_event"},
                            {"entry_id", typed.entry_id},
                            {"event",
                             json{{"type", "message"},
                                  {"text", typed.event.text},
                                  {"attachments", attachments}}}};
            },
            [](const AgentEntry& typed) {
                return json{{"type", "agent_event"},
                            {"entry_id", typed.entry_id},
                            {"event", agent_event_to_json(typed.event)}};
            },
        },
        entry);
}

core::errors::Result<ConversationEntry> entry_from_json(const json& value) {
    if (!value.is_object() || !value.contains("type") || !value.at("type").is_string()) {
        return malformed("Conversation entry is missing a type tag.");
    }
    try {
        return parse_entry(value);
    } catch (const json::exception& e) {
        return malformed("Malformed conversation entry: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        return malformed("Malformed conversation entry: " + std::string(e.what()));
    }
}

std::string derive_thread_title(const std::string& text) {
    const auto line_end = text.find('\n');
    std::string first_line = text.substr(0, line_end);
    const auto begin = first_line.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = first_line.find_last_not_of(" \t\r");
    first_line = first_line.substr(begin, end - begin + 1);

    constexpr std::size_t kMaxTitleChars = 48;
    std::size_t chars = 0;
    std::size_t cut = 0;
    while (cut < first_line.size()) {
        const auto byte = static_cast<unsigned char>(first_line[cut]);
        // Count UTF-8 lead bytes only.
        if ((byte & 0xC0) != 0x80) {
            if (chars == kMaxTitleChars) {
                break;
            }
            ++chars;
        }
        ++cut;
    }
    return first_line.substr(0, cut);
}

} // namespace turnloom::protocol
