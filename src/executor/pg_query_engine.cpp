#include "executor/pg_query_engine.hpp"
#include "db/pg_handles.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_map>

namespace querygate {

PgQueryEngine::PgQueryEngine(std::shared_ptr<ConnectionPool> pool, Config config)
    : pool_(std::move(pool)), config_(config) {}

bool PgQueryEngine::health_check() {
    return pool_->ping(config_.acquire_timeout);
}

EngineResult PgQueryEngine::run(const std::string& sql, std::chrono::milliseconds timeout) {
    EngineResult result;

    auto conn_handle = pool_->acquire(config_.acquire_timeout);
    if (!conn_handle || !conn_handle->is_valid()) {
        result.error_message = "Failed to acquire database connection from pool";
        return result;
    }
    PGconn* conn = conn_handle->get();

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout.count());
    PGResultPtr timeout_res(PQexec(conn, timeout_sql.c_str()));
    if (!timeout_res || PQresultStatus(timeout_res.get()) != PGRES_COMMAND_OK) {
        result.error_message = utils::trim(PQerrorMessage(conn));
        return result;
    }

    PGResultPtr res(PQexec(conn, sql.c_str()));
    if (!res || PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        result.error_message = utils::trim(PQerrorMessage(conn));
        return result;
    }

    const int ncols = PQnfields(res.get());
    result.column_names.reserve(static_cast<size_t>(ncols));
    result.column_types.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; ++i) {
        result.column_names.emplace_back(PQfname(res.get(), i));
        result.column_types.push_back(type_name(PQftype(res.get(), i)));
    }

    const int nrows = PQntuples(res.get());
    result.rows.reserve(static_cast<size_t>(nrows));
    for (int i = 0; i < nrows; ++i) {
        Row row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; ++j) {
            if (PQgetisnull(res.get(), i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res.get(), i, j),
                                             static_cast<size_t>(PQgetlength(res.get(), i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    result.success = true;
    return result;
}

std::string PgQueryEngine::type_name(uint32_t oid) {
    static const std::unordered_map<uint32_t, std::string_view> OID_NAMES = {
        {16, "boolean"},   {17, "bytea"},     {18, "char"},      {19, "name"},
        {20, "bigint"},    {21, "smallint"},  {23, "integer"},   {25, "text"},
        {26, "oid"},       {114, "json"},     {142, "xml"},      {600, "point"},
        {650, "cidr"},     {700, "real"},     {701, "double precision"},
        {790, "money"},    {829, "macaddr"},  {869, "inet"},
        {1042, "character"},       {1043, "character varying"},
        {1082, "date"},            {1083, "time without time zone"},
        {1114, "timestamp without time zone"},
        {1184, "timestamp with time zone"},
        {1186, "interval"},        {1266, "time with time zone"},
        {1700, "numeric"},         {2950, "uuid"},    {3802, "jsonb"},
        {1000, "boolean[]"},       {1005, "smallint[]"},  {1007, "integer[]"},
        {1016, "bigint[]"},        {1009, "text[]"},      {1015, "character varying[]"},
        {1021, "real[]"},          {1022, "double precision[]"},
        {1231, "numeric[]"},       {2951, "uuid[]"},
    };

    auto it = OID_NAMES.find(oid);
    return it != OID_NAMES.end() ? std::string(it->second) : std::string("unknown");
}

} // namespace querygate
