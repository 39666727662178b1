#pragma once

#include "security/security_event.hpp"

#include <algorithm>
#include <mutex>
#include <vector>

namespace querygate::testing {

/**
 * @brief Security event sink that keeps every event for inspection
 */
class RecordingEventSink : public ISecurityEventSink {
public:
    void record(const SecurityEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    [[nodiscard]] std::vector<SecurityEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    [[nodiscard]] size_t count(SecurityEventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
            [type](const SecurityEvent& e) { return e.type == type; }));
    }

private:
    mutable std::mutex mutex_;
    std::vector<SecurityEvent> events_;
};

} // namespace querygate::testing
