#include "security/query_guard.hpp"
#include "security/destructive_screen.hpp"
#include "security/tenant_filter.hpp"
#include "core/utils.hpp"

#include <format>

namespace querygate {

namespace {

constexpr std::string_view kNoTableError = "Query must reference at least one table";
constexpr std::string_view kEmptyScopeError =
    "Tenant scope is empty; a query cannot run without at least one tenant";
constexpr std::string_view kNoLimitWarning =
    "Query has no LIMIT clause; a row ceiling will be applied";
constexpr std::string_view kStarWarning =
    "SELECT * returns every column of the referenced tables";

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += ", ";
        out += part;
    }
    return out;
}

std::string disallowed_error(const std::vector<std::string>& tables) {
    return std::format("Tables not in allow-list: {}", join(tables));
}

bool references_no_table(const ParseResult& parsed) {
    return parsed.statement_kind == "select" && parsed.tables.empty();
}

} // anonymous namespace

QueryGuard::QueryGuard(std::shared_ptr<TableAllowList> allow_list,
                       std::shared_ptr<ISecurityEventSink> events,
                       Config config)
    : allow_list_(std::move(allow_list)),
      events_(std::move(events)),
      config_(std::move(config)) {}

std::unordered_set<std::string> QueryGuard::allowed_tables() const {
    if (config_.max_tier) {
        return allow_list_->get_allowed_tables_up_to_tier(*config_.max_tier);
    }
    return allow_list_->get_allowed_tables();
}

bool QueryGuard::bypasses_tenant_filter(const Principal& principal) const {
    return principal.is_super_admin || principal.has_permission(config_.bypass_permission);
}

void QueryGuard::emit(SecurityEventType type, const Principal& principal,
                      std::string detail, std::string_view sql) const {
    if (!events_) return;

    SecurityEvent event;
    event.type = type;
    event.user_id = principal.user_id;
    event.detail = std::move(detail);
    event.sql_preview = utils::preview(sql);
    event.timestamp = std::chrono::system_clock::now();
    events_->record(event);
}

// ============================================================================
// Validation (collects every problem)
// ============================================================================

ValidationResult QueryGuard::validate(std::string_view sql) const {
    ValidationResult result;
    auto add_error = [&result](ErrorKind kind, std::string message) {
        if (!result.error_kind) result.error_kind = kind;
        result.errors.push_back(std::move(message));
    };

    const auto keywords = DestructiveScreen::scan(sql);
    if (!keywords.empty()) {
        add_error(ErrorKind::DESTRUCTIVE_KEYWORD_DETECTED, DestructiveScreen::format_error(keywords));
    }

    ParseResult parsed = parser_.parse(sql);
    for (auto& message : parsed.errors) {
        add_error(parsed.error_kind.value_or(ErrorKind::INVALID_SQL), std::move(message));
    }
    result.tables = parsed.tables;

    if (!parsed.tables.empty()) {
        const auto disallowed = TableAllowList::find_disallowed(parsed.tables, allowed_tables());
        if (!disallowed.empty()) {
            add_error(ErrorKind::TABLE_NOT_ALLOWED, disallowed_error(disallowed));
        }
    } else if (references_no_table(parsed)) {
        add_error(ErrorKind::INVALID_SQL, std::string(kNoTableError));
    }

    if (parsed.ast) {
        if (!parsed.ast->limit) result.warnings.emplace_back(kNoLimitWarning);
        if (parsed.has_star) result.warnings.emplace_back(kStarWarning);
    }

    result.is_valid = result.errors.empty();
    result.requires_tenant_filter = result.is_valid;
    return result;
}

// ============================================================================
// Securing (aborts at the first failing stage)
// ============================================================================

SecureResult QueryGuard::secure(std::string_view sql, const Principal& principal) const {
    auto reject = [&](ErrorKind kind, std::vector<std::string> errors,
                      std::vector<ParsedTableRef> tables = {}) {
        emit(SecurityEventType::QUERY_REJECTED, principal,
             std::format("{}: {}", error_kind_to_string(kind), errors.front()), sql);
        return SecureResult::rejected(kind, std::move(errors), std::move(tables));
    };

    // Stage 1: destructive keyword screen
    const auto keywords = DestructiveScreen::scan(sql);
    if (!keywords.empty()) {
        return reject(ErrorKind::DESTRUCTIVE_KEYWORD_DETECTED,
                      {DestructiveScreen::format_error(keywords)});
    }

    // Stage 2: structural parse
    ParseResult parsed = parser_.parse(sql);
    if (!parsed.is_valid) {
        return reject(parsed.error_kind.value_or(ErrorKind::INVALID_SQL),
                      std::move(parsed.errors), std::move(parsed.tables));
    }
    if (references_no_table(parsed)) {
        return reject(ErrorKind::INVALID_SQL, {std::string(kNoTableError)});
    }

    // Stage 3: table allow-list
    const auto disallowed = TableAllowList::find_disallowed(parsed.tables, allowed_tables());
    if (!disallowed.empty()) {
        return reject(ErrorKind::TABLE_NOT_ALLOWED, {disallowed_error(disallowed)},
                      std::move(parsed.tables));
    }

    // Stage 4: bypass decision and tenant scope
    if (bypasses_tenant_filter(principal)) {
        emit(SecurityEventType::TENANT_FILTER_BYPASS, principal,
             principal.is_super_admin
                 ? std::string("super-admin")
                 : std::format("permission {}", config_.bypass_permission),
             sql);
        return SecureResult::ok(std::string(sql), std::move(parsed.tables), true);
    }

    if (principal.tenant_ids.empty()) {
        emit(SecurityEventType::TENANT_SCOPE_EMPTY, principal, std::string(kEmptyScopeError), sql);
        return SecureResult::rejected(ErrorKind::EMPTY_TENANT_SCOPE,
                                      {std::string(kEmptyScopeError)}, std::move(parsed.tables));
    }

    // Stage 5: tenant filter injection
    const SecurityFilterResult filtered = inject_tenant_filter(*parsed.ast, principal.tenant_ids);
    if (!filtered.success) {
        const std::string message = filtered.error.value_or("Tenant filter injection failed");
        emit(SecurityEventType::FILTER_INJECTION_FAILED, principal, message, sql);
        return SecureResult::rejected(ErrorKind::FILTER_INJECTION_FAILED,
                                      {message}, std::move(parsed.tables));
    }

    utils::log::info(std::format("Secured query for user '{}' across {} tenant(s)",
                                 principal.user_id, principal.tenant_ids.size()));
    return SecureResult::ok(filtered.sql, std::move(parsed.tables), false);
}

} // namespace querygate
