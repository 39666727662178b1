#include "catalog/table_allowlist.hpp"
#include "core/utils.hpp"

#include <format>

namespace querygate {

namespace {

std::shared_ptr<const TableAllowList::Snapshot> build_snapshot(
    std::vector<AllowedTable> rows, std::chrono::system_clock::time_point now) {

    auto snap = std::make_shared<TableAllowList::Snapshot>();
    snap->captured_at = now;
    snap->entries.reserve(rows.size());

    for (auto& row : rows) {
        if (!row.active || row.table.empty()) continue;
        for (auto& key : TableAllowList::keys_for(row.schema, row.table)) {
            snap->tables.insert(std::move(key));
        }
        snap->entries.push_back(std::move(row));
    }
    return snap;
}

} // anonymous namespace

TableAllowList::TableAllowList(std::shared_ptr<ITableRegistry> registry,
                               std::shared_ptr<IClock> clock,
                               Config config)
    : registry_(std::move(registry)),
      clock_(std::move(clock)),
      config_(config) {}

// ============================================================================
// Read Operations
// ============================================================================

std::unordered_set<std::string> TableAllowList::get_allowed_tables(bool force_refresh) {
    return current(force_refresh)->tables;
}

std::unordered_set<std::string> TableAllowList::get_allowed_tables_up_to_tier(
    int max_tier, bool force_refresh) {

    const auto snap = current(force_refresh);
    std::unordered_set<std::string> result;
    for (const auto& entry : snap->entries) {
        if (entry.tier > max_tier) continue;
        for (auto& key : keys_for(entry.schema, entry.table)) {
            result.insert(std::move(key));
        }
    }
    return result;
}

bool TableAllowList::is_fresh(const std::shared_ptr<const Snapshot>& snap,
                              std::chrono::system_clock::time_point now) const {
    return snap && (now - snap->captured_at) < config_.ttl;
}

std::shared_ptr<const TableAllowList::Snapshot> TableAllowList::current(bool force_refresh) {
    // Fast path: wait-free snapshot read
    auto snap = std::atomic_load_explicit(&snapshot_, std::memory_order_acquire);
    if (!force_refresh && is_fresh(snap, clock_->now())) {
        return snap;
    }

    std::lock_guard<std::mutex> lock(reload_mutex_);

    // Another caller may have reloaded while we waited
    snap = std::atomic_load_explicit(&snapshot_, std::memory_order_acquire);
    const auto now = clock_->now();
    if (!force_refresh && is_fresh(snap, now)) {
        return snap;
    }

    try {
        auto fresh = build_snapshot(registry_->list_active_tables(), now);

        // RCU write: in-flight readers keep the old snapshot alive
        std::atomic_store_explicit(&snapshot_, fresh, std::memory_order_release);
        version_.fetch_add(1, std::memory_order_release);

        utils::log::info(std::format("Table allow-list reloaded: {} tables", fresh->entries.size()));
        return fresh;

    } catch (const std::exception& e) {
        if (snap) {
            // captured_at is left alone so the next call retries the reload
            utils::log::warn(std::format(
                "Table allow-list reload failed, serving stale snapshot from {}: {}",
                utils::format_timestamp(snap->captured_at), e.what()));
            return snap;
        }
        utils::log::error(std::format(
            "Table allow-list reload failed with no snapshot, allowing no tables: {}", e.what()));
        return std::make_shared<const Snapshot>();
    }
}

// ============================================================================
// Write Operations
// ============================================================================

void TableAllowList::invalidate() {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    std::atomic_store_explicit(&snapshot_, std::shared_ptr<const Snapshot>(),
                               std::memory_order_release);
    utils::log::info("Table allow-list invalidated");
}

// ============================================================================
// Key Matching
// ============================================================================

std::vector<std::string> TableAllowList::keys_for(const std::string& schema,
                                                  const std::string& table) {
    std::vector<std::string> keys;
    keys.reserve(4);
    if (!schema.empty()) {
        keys.push_back(std::format("{}.{}", schema, table));
        keys.push_back(std::format("\"{}\".\"{}\"", schema, table));
    }
    keys.push_back(table);
    keys.push_back(std::format("\"{}\"", table));
    return keys;
}

std::vector<std::string> TableAllowList::find_disallowed(
    const std::vector<ParsedTableRef>& tables,
    const std::unordered_set<std::string>& allowed) {

    std::vector<std::string> disallowed;
    std::unordered_set<std::string> seen;

    for (const auto& ref : tables) {
        const std::string key = ref.full_name();
        if (allowed.contains(key)) continue;
        if (seen.insert(key).second) {
            disallowed.push_back(key);
        }
    }
    return disallowed;
}

} // namespace querygate
