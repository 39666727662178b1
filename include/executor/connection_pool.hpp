#pragma once

#include <libpq-fe.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <vector>

namespace querygate {

/**
 * @brief RAII handle for a pooled libpq connection
 *
 * Returns the connection to its pool on destruction. Move-only.
 */
class PooledConnection {
public:
    PooledConnection(PGconn* conn, std::function<void(PGconn*)> return_fn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    PGconn* get() const { return conn_; }
    bool is_valid() const { return conn_ != nullptr; }

private:
    PGconn* conn_;
    std::function<void(PGconn*)> return_fn_;
};

/**
 * @brief Bounded pool of read-only libpq connections
 *
 * - max_connections enforced by a counting_semaphore
 * - connections created lazily, each opened with the session setup
 *   statements (default_transaction_read_only = on)
 * - broken connections are closed on return instead of being reused
 *
 * Thread-safe: mutex protects the idle deque, the semaphore bounds use.
 */
class ConnectionPool {
public:
    struct Config {
        std::string connection_string;
        size_t max_connections{4};
        std::chrono::milliseconds connect_timeout{5000};
        std::string health_check_query{"SELECT 1"};
        std::vector<std::string> session_setup{"SET default_transaction_read_only = on"};
    };

    explicit ConnectionPool(Config config);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Acquire a connection, waiting up to `timeout` for a free slot
     * @return RAII handle, or nullptr on timeout, connect failure or shutdown
     */
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Run the health-check query
     *
     * Uses a pooled connection when a slot is free. When every slot is
     * checked out the pool is busy, not the engine down, so the query runs
     * on a short-lived connection outside the pool instead of waiting.
     */
    [[nodiscard]] bool ping(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /// Close idle connections and refuse further acquires
    void drain();

private:
    // Caller holds a semaphore slot; released again on failure
    std::unique_ptr<PooledConnection> checkout();
    [[nodiscard]] bool run_health_query(PGconn* conn) const;

    PGconn* create_connection();
    void return_connection(PGconn* conn);

    Config config_;

    std::deque<PGconn*> idle_connections_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<bool> shutdown_{false};
};

} // namespace querygate
