#pragma once

#include <libpq-fe.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace querygate {

// ============================================================================
// RAII Wrappers for libpq resources
// ============================================================================

/**
 * @brief RAII wrapper for PGconn* (auto-calls PQfinish on destruction)
 */
struct PGConnDeleter {
    void operator()(PGconn* conn) const noexcept {
        if (conn) {
            PQfinish(conn);
        }
    }
};
using PGConnPtr = std::unique_ptr<PGconn, PGConnDeleter>;

/**
 * @brief RAII wrapper for PGresult* (auto-calls PQclear on destruction)
 */
struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

/**
 * @brief Blocking connect with an explicit connect_timeout
 *
 * The connection string may be keyword/value or URI form; connect_timeout
 * (whole seconds, at least 1) overrides any value it carries.
 * The caller checks PQstatus.
 */
inline PGConnPtr connect_with_timeout(const std::string& connection_string,
                                      std::chrono::milliseconds timeout) {
    const int64_t seconds = std::max<int64_t>(
        1, std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
    const std::string timeout_str = std::to_string(seconds);

    const char* const keywords[] = {"dbname", "connect_timeout", nullptr};
    const char* const values[] = {connection_string.c_str(), timeout_str.c_str(), nullptr};
    return PGConnPtr(PQconnectdbParams(keywords, values, /*expand_dbname=*/1));
}

} // namespace querygate
