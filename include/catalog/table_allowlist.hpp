#pragma once

#include "catalog/clock.hpp"
#include "catalog/table_registry.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace querygate {

struct TableAllowListConfig {
    std::chrono::seconds ttl{300};
};

/**
 * @brief Time-bounded snapshot of allow-listed tables with RCU reload
 *
 * Readers atomically load an immutable snapshot; a reload builds a new
 * snapshot and swaps the pointer, so concurrent readers never observe a
 * partially built set.
 *
 * Each registry row is stored under four keys: schema.table, table,
 * "schema"."table" and "table".
 *
 * Failure policy:
 * - reload fails, snapshot exists: serve the stale snapshot (logged), and
 *   retry on the next call
 * - reload fails, no snapshot: return an empty set, nothing is cached
 */
class TableAllowList {
public:
    using Config = TableAllowListConfig;

    struct Snapshot {
        std::unordered_set<std::string> tables;
        std::vector<AllowedTable> entries;
        std::chrono::system_clock::time_point captured_at;
    };

    explicit TableAllowList(std::shared_ptr<ITableRegistry> registry,
                            std::shared_ptr<IClock> clock = std::make_shared<SystemClock>(),
                            Config config = {});

    /// Allowed table keys; reloads on TTL expiry, after invalidate(), or when forced
    [[nodiscard]] std::unordered_set<std::string> get_allowed_tables(bool force_refresh = false);

    /// Same, restricted to registry rows with tier <= max_tier
    [[nodiscard]] std::unordered_set<std::string> get_allowed_tables_up_to_tier(
        int max_tier, bool force_refresh = false);

    /// Drop the snapshot; the next read reloads
    void invalidate();

    /// Current snapshot without triggering a reload (nullptr if none)
    [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const {
        return std::atomic_load_explicit(&snapshot_, std::memory_order_acquire);
    }

    /// Monotonic count of successful reloads
    [[nodiscard]] uint64_t version() const {
        return version_.load(std::memory_order_acquire);
    }

    [[nodiscard]] static std::vector<std::string> keys_for(const std::string& schema,
                                                           const std::string& table);

    /**
     * @brief References that do not resolve against the key set
     *
     * A qualified reference matches only its schema.table key; a bare
     * reference matches only the bare key. Result uses full_name(),
     * each name once, in first-seen order.
     */
    [[nodiscard]] static std::vector<std::string> find_disallowed(
        const std::vector<ParsedTableRef>& tables,
        const std::unordered_set<std::string>& allowed);

private:
    std::shared_ptr<const Snapshot> current(bool force_refresh);
    [[nodiscard]] bool is_fresh(const std::shared_ptr<const Snapshot>& snap,
                                std::chrono::system_clock::time_point now) const;

    std::shared_ptr<ITableRegistry> registry_;
    std::shared_ptr<IClock> clock_;
    Config config_;

    // RCU: readers load this shared_ptr atomically
    std::shared_ptr<const Snapshot> snapshot_;

    // Only one reload at a time
    std::mutex reload_mutex_;

    std::atomic<uint64_t> version_{0};
};

} // namespace querygate
