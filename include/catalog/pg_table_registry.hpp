#pragma once

#include "catalog/table_registry.hpp"

#include <chrono>
#include <string>

namespace querygate {

/**
 * @brief Table registry backed by a PostgreSQL metadata table
 *
 * Reads (schema_name, table_name, tier) of rows with is_active = true.
 * Opens a short-lived connection per load; reloads are rare (TTL-bound).
 */
class PgTableRegistry : public ITableRegistry {
public:
    struct Config {
        std::string connection_string;
        std::string registry_table{"explorer_table_metadata"};   // may be schema-qualified
        std::chrono::milliseconds connect_timeout{5000};
    };

    explicit PgTableRegistry(Config config);

    [[nodiscard]] std::vector<AllowedTable> list_active_tables() override;

    /// SELECT text issued by list_active_tables()
    [[nodiscard]] std::string build_query() const;

private:
    Config config_;
};

} // namespace querygate
