#pragma once

#include <string>
#include "protocol/agent_items.hpp"
#include "protocol/thread_events.hpp"

namespace turnloom::runtime {

    // Vendors reuse raw item ids ("item_0", ...) across turns. Every item.* event of a
    // turn is rewritten to "<scope>/<raw id>"; ids already in the scope are left as-is.
    protocol::AgentItem qualify_item(const std::string& turn_scope_id, protocol::AgentItem item);
    protocol::ThreadEvent qualify_event(const std::string& turn_scope_id,
                                        protocol::ThreadEvent event);

    // True when text contains "<digits>/<digits>", e.g. "attempt 2/5".
    bool contains_attempt_fraction(const std::string& text);

    // Vendor "error" events that only announce a reconnect attempt.
    bool is_transient_reconnect_notice(const std::string& message);

} // namespace turnloom::runtime
