#pragma once

#include <chrono>

namespace querygate {

/**
 * @brief Time source for TTL decisions (injectable for tests)
 */
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual std::chrono::system_clock::time_point now() const = 0;
};

class SystemClock : public IClock {
public:
    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace querygate
