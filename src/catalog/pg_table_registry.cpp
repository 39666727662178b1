#include "catalog/pg_table_registry.hpp"
#include "db/pg_handles.hpp"
#include "parser/sql_deparser.hpp"
#include "core/utils.hpp"

#include <format>

namespace querygate {

// Column indices in the result set (matching the SELECT order)
static constexpr int COL_SCHEMA = 0;
static constexpr int COL_TABLE  = 1;
static constexpr int COL_TIER   = 2;

static constexpr std::string_view kDefaultSchema = "ih";
static constexpr int kDefaultTier = 3;

PgTableRegistry::PgTableRegistry(Config config)
    : config_(std::move(config)) {}

std::string PgTableRegistry::build_query() const {
    // Configured name may be "schema.table"; each part is quoted independently
    std::string qualified;
    std::string_view rest = config_.registry_table;
    while (true) {
        const auto dot = rest.find('.');
        if (!qualified.empty()) qualified += '.';
        qualified += SqlDeparser::quote_identifier(rest.substr(0, dot));
        if (dot == std::string_view::npos) break;
        rest.remove_prefix(dot + 1);
    }

    return std::format(
        "SELECT schema_name, table_name, tier FROM {} WHERE is_active = true "
        "ORDER BY schema_name, table_name", qualified);
}

std::vector<AllowedTable> PgTableRegistry::list_active_tables() {
    PGConnPtr conn = connect_with_timeout(config_.connection_string, config_.connect_timeout);
    if (!conn || PQstatus(conn.get()) != CONNECTION_OK) {
        const std::string detail = conn ? utils::trim(PQerrorMessage(conn.get())) : "out of memory";
        throw RegistryError(std::format("Table registry connection failed: {}", detail));
    }

    const std::string query = build_query();
    PGResultPtr res(PQexec(conn.get(), query.c_str()));
    if (!res || PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        throw RegistryError(std::format("Table registry query failed: {}",
                                        utils::trim(PQerrorMessage(conn.get()))));
    }

    const int nrows = PQntuples(res.get());
    std::vector<AllowedTable> tables;
    tables.reserve(static_cast<size_t>(nrows));

    for (int row = 0; row < nrows; ++row) {
        AllowedTable entry;
        entry.schema = PQgetisnull(res.get(), row, COL_SCHEMA)
            ? std::string(kDefaultSchema)
            : std::string(PQgetvalue(res.get(), row, COL_SCHEMA));
        entry.table = PQgetvalue(res.get(), row, COL_TABLE);
        entry.tier = PQgetisnull(res.get(), row, COL_TIER)
            ? kDefaultTier
            : utils::try_parse_int<int>(PQgetvalue(res.get(), row, COL_TIER)).value_or(kDefaultTier);
        entry.active = true;
        tables.push_back(std::move(entry));
    }

    return tables;
}

} // namespace querygate
