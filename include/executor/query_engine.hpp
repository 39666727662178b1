#pragma once

#include "core/types.hpp"

#include <chrono>
#include <string>

namespace querygate {

/**
 * @brief Downstream query engine
 *
 * Receives only fully secured SQL. Cancelling a query the caller has
 * stopped waiting for is the engine's own concern.
 */
class IQueryEngine {
public:
    virtual ~IQueryEngine() = default;

    /// Reachability probe, independent of any caller query
    [[nodiscard]] virtual bool health_check() = 0;

    /// Failures are reported through EngineResult, never thrown
    [[nodiscard]] virtual EngineResult run(const std::string& sql,
                                           std::chrono::milliseconds timeout) = 0;
};

} // namespace querygate
