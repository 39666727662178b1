#include "security/security_event.hpp"
#include "core/utils.hpp"

#include <format>

namespace querygate {

const char* security_event_type_to_string(SecurityEventType type) {
    switch (type) {
        case SecurityEventType::TENANT_FILTER_BYPASS:    return "tenant_filter_bypass";
        case SecurityEventType::QUERY_REJECTED:          return "query_rejected";
        case SecurityEventType::TENANT_SCOPE_EMPTY:      return "tenant_scope_empty";
        case SecurityEventType::FILTER_INJECTION_FAILED: return "filter_injection_failed";
    }
    return "unknown";
}

std::string SecurityEvent::to_json() const {
    return std::format(
        R"({{"type":"{}","user_id":"{}","detail":"{}","sql_preview":"{}","timestamp":"{}"}})",
        security_event_type_to_string(type),
        utils::escape_json(user_id),
        utils::escape_json(detail),
        utils::escape_json(sql_preview),
        utils::format_timestamp(timestamp));
}

void LogSecurityEventSink::record(const SecurityEvent& event) {
    utils::log::security(event.to_json());
}

} // namespace querygate
