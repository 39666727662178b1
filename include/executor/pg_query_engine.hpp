#pragma once

#include "executor/connection_pool.hpp"
#include "executor/query_engine.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace querygate {

struct PgQueryEngineConfig {
    std::chrono::milliseconds acquire_timeout{5000};
};

/**
 * @brief PostgreSQL query engine over a ConnectionPool
 *
 * Each run() sets statement_timeout on its pooled connection, so the
 * server cancels a query the gateway has already given up on.
 */
class PgQueryEngine : public IQueryEngine {
public:
    using Config = PgQueryEngineConfig;

    explicit PgQueryEngine(std::shared_ptr<ConnectionPool> pool, Config config = {});

    [[nodiscard]] bool health_check() override;

    [[nodiscard]] EngineResult run(const std::string& sql,
                                   std::chrono::milliseconds timeout) override;

    /// PostgreSQL type name for a built-in type OID ("unknown" otherwise)
    [[nodiscard]] static std::string type_name(uint32_t oid);

private:
    std::shared_ptr<ConnectionPool> pool_;
    Config config_;
};

} // namespace querygate
