#include "runtime/turn_scope.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace turnloom::runtime {

protocol::AgentItem qualify_item(const std::string& turn_scope_id, protocol::AgentItem item) {
    const std::string raw_id = protocol::item_id(item);
    const std::string prefix = turn_scope_id + "/";
    if (raw_id.compare(0, prefix.size(), prefix) == 0) {
        return item;
    }
    protocol::set_item_id(item, turn_scope_id + "/" + raw_id);
    return item;
}

protocol::ThreadEvent qualify_event(const std::string& turn_scope_id,
                                    protocol::ThreadEvent event) {
    if (protocol::AgentItem* item = protocol::event_item(event)) {
        *item = qualify_item(turn_scope_id, std::move(*item));
    }
    return event;
}

bool contains_attempt_fraction(const std::string& text) {
    const auto is_digit = [](const char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    };
    std::size_t i = 0;
    while (i < text.size()) {
        if (!is_digit(text[i])) {
            ++i;
            continue;
        }
        while (i < text.size() && is_digit(text[i])) {
            ++i;
        }
        if (i < text.size() && text[i] == '/') {
            if (i + 1 < text.size() && is_digit(text[i + 1])) {
                return true;
            }
            ++i;
        }
    }
    return false;
}

bool is_transient_reconnect_notice(const std::string& message) {
    const auto begin = message.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return false;
    }
    std::string lower = message.substr(begin);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower.find("reconnecting") == std::string::npos) {
        return false;
    }
    return contains_attempt_fraction(lower);
}

}  // namespace turnloom::runtime
