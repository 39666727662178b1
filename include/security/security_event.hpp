#pragma once

#include <chrono>
#include <string>

namespace querygate {

enum class SecurityEventType {
    TENANT_FILTER_BYPASS,
    QUERY_REJECTED,
    TENANT_SCOPE_EMPTY,
    FILTER_INJECTION_FAILED
};

[[nodiscard]] const char* security_event_type_to_string(SecurityEventType type);

struct SecurityEvent {
    SecurityEventType type = SecurityEventType::QUERY_REJECTED;
    std::string user_id;
    std::string detail;
    std::string sql_preview;      // first 200 characters
    std::chrono::system_clock::time_point timestamp;

    /// One-line JSON form used by the log sink
    [[nodiscard]] std::string to_json() const;
};

/**
 * @brief Destination for security-relevant events
 *
 * Called synchronously from the securing pipeline; implementations must
 * be safe for concurrent use.
 */
class ISecurityEventSink {
public:
    virtual ~ISecurityEventSink() = default;

    virtual void record(const SecurityEvent& event) = 0;
};

/// Writes events through the logger at SECURITY level (never filtered)
class LogSecurityEventSink : public ISecurityEventSink {
public:
    void record(const SecurityEvent& event) override;
};

} // namespace querygate
