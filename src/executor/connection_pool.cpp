#include "executor/connection_pool.hpp"
#include "db/pg_handles.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace querygate {

// ============================================================================
// PooledConnection
// ============================================================================

PooledConnection::PooledConnection(PGconn* conn, std::function<void(PGconn*)> return_fn)
    : conn_(conn), return_fn_(std::move(return_fn)) {}

PooledConnection::~PooledConnection() {
    if (conn_ && return_fn_) {
        return_fn_(conn_);
    }
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : conn_(other.conn_), return_fn_(std::move(other.return_fn_)) {
    other.conn_ = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        if (conn_ && return_fn_) {
            return_fn_(conn_);
        }
        conn_ = other.conn_;
        return_fn_ = std::move(other.return_fn_);
        other.conn_ = nullptr;
    }
    return *this;
}

// ============================================================================
// ConnectionPool
// ============================================================================

ConnectionPool::ConnectionPool(Config config)
    : config_(std::move(config)),
      semaphore_(static_cast<std::ptrdiff_t>(config_.max_connections)) {
    utils::log::info(std::format("ConnectionPool initialized (max={})", config_.max_connections));
}

ConnectionPool::~ConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }
    if (!semaphore_.try_acquire_for(timeout)) {
        utils::log::warn(std::format("Connection pool exhausted after {}ms", timeout.count()));
        return nullptr;
    }
    return checkout();
}

std::unique_ptr<PooledConnection> ConnectionPool::checkout() {
    PGconn* conn = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = idle_connections_.front();
            idle_connections_.pop_front();
        }
    }

    // Idle connection died while parked: replace it
    if (conn && PQstatus(conn) != CONNECTION_OK) {
        PQfinish(conn);
        conn = nullptr;
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            return nullptr;
        }
    }

    return std::make_unique<PooledConnection>(conn, [this](PGconn* c) {
        this->return_connection(c);
    });
}

bool ConnectionPool::ping(std::chrono::milliseconds timeout) {
    if (shutdown_.load(std::memory_order_acquire)) {
        return false;
    }

    if (semaphore_.try_acquire()) {
        auto handle = checkout();
        return handle && run_health_query(handle->get());
    }

    utils::log::info("Connection pool saturated, health check uses a dedicated connection");
    PGConnPtr conn = connect_with_timeout(config_.connection_string,
                                          std::min(timeout, config_.connect_timeout));
    if (!conn || PQstatus(conn.get()) != CONNECTION_OK) {
        return false;
    }
    return run_health_query(conn.get());
}

bool ConnectionPool::run_health_query(PGconn* conn) const {
    PGResultPtr res(PQexec(conn, config_.health_check_query.c_str()));
    if (!res) {
        return false;
    }
    const ExecStatusType status = PQresultStatus(res.get());
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

void ConnectionPool::drain() {
    shutdown_.store(true, std::memory_order_release);

    std::lock_guard<std::mutex> lock(mutex_);
    for (PGconn* conn : idle_connections_) {
        PQfinish(conn);
    }
    idle_connections_.clear();
}

PGconn* ConnectionPool::create_connection() {
    PGConnPtr conn = connect_with_timeout(config_.connection_string, config_.connect_timeout);
    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }
    if (PQstatus(conn.get()) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect to query engine: {}",
                                      utils::trim(PQerrorMessage(conn.get()))));
        return nullptr;
    }

    for (const auto& statement : config_.session_setup) {
        PGResultPtr res(PQexec(conn.get(), statement.c_str()));
        if (!res || PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
            utils::log::error(std::format("Session setup '{}' failed: {}", statement,
                                          utils::trim(PQerrorMessage(conn.get()))));
            return nullptr;
        }
    }

    return conn.release();
}

void ConnectionPool::return_connection(PGconn* conn) {
    if (!conn) {
        return;
    }

    // Closed on shutdown, or when a timed-out query left it unusable
    if (shutdown_.load(std::memory_order_acquire) || PQstatus(conn) != CONNECTION_OK ||
        PQtransactionStatus(conn) != PQTRANS_IDLE) {
        PQfinish(conn);
        semaphore_.release();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_connections_.push_back(conn);
    }
    semaphore_.release();
}

} // namespace querygate
