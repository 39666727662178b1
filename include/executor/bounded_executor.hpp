#pragma once

#include "core/types.hpp"
#include "executor/query_engine.hpp"
#include "parser/sql_parser.hpp"
#include "security/query_guard.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace querygate {

struct BoundedExecutorConfig {
    int64_t default_timeout_ms{30000};
    int64_t max_timeout_ms{120000};
    int64_t default_row_limit{1000};
    int64_t max_row_limit{10000};
};

/**
 * @brief Execution boundary: secure, cap rows, race a timeout, run
 *
 * Order per call:
 *   1. resolve the effective row ceiling and timeout
 *   2. engine health check (EngineUnreachable)
 *   3. QueryGuard::secure (validation kind + full error list)
 *   4. apply the row ceiling to the secured statement
 *   5. run on a worker thread; the caller waits at most the timeout
 *
 * Every failure is thrown as GatewayError; the engine is never contacted
 * for a query that did not clear securing.
 */
class BoundedExecutor {
public:
    using Config = BoundedExecutorConfig;

    BoundedExecutor(std::shared_ptr<QueryGuard> guard,
                    std::shared_ptr<IQueryEngine> engine,
                    Config config = {});

    /// @throws GatewayError
    [[nodiscard]] ExecuteResult execute(std::string_view sql, const Principal& principal,
                                        const ExecuteOptions& options = {}) const;

    [[nodiscard]] int64_t effective_row_limit(const ExecuteOptions& options) const;
    [[nodiscard]] std::chrono::milliseconds effective_timeout(const ExecuteOptions& options) const;

    /**
     * @brief Add or lower the LIMIT of a secured statement
     *
     * No LIMIT gets `LIMIT ceiling`; an integer LIMIT above the ceiling is
     * lowered; any other LIMIT (ALL, expressions) is replaced. The result
     * is re-parsed and must still be a valid statement.
     * @throws GatewayError(EXECUTION_FAILED)
     */
    [[nodiscard]] std::string apply_row_limit(std::string_view secured_sql, int64_t ceiling) const;

private:
    std::shared_ptr<QueryGuard> guard_;
    std::shared_ptr<IQueryEngine> engine_;
    Config config_;
    SQLParser parser_;
};

} // namespace querygate
