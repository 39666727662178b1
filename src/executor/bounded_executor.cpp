#include "executor/bounded_executor.hpp"
#include "parser/sql_deparser.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <thread>

namespace querygate {

namespace {

constexpr std::string_view kExecutionFailed = "Query execution failed";

std::optional<int64_t> integer_limit(const ast::ExprPtr& limit) {
    if (!limit) return std::nullopt;
    const auto* literal = std::get_if<ast::Literal>(&limit->node);
    if (!literal || literal->kind != ast::Literal::Kind::INTEGER) return std::nullopt;
    return utils::try_parse_int<int64_t>(literal->text);
}

std::vector<ColumnInfo> derive_columns(const EngineResult& result) {
    std::vector<ColumnInfo> columns;
    if (result.rows.empty()) return columns;

    const size_t width = result.rows.front().size();
    columns.reserve(width);
    for (size_t i = 0; i < width; ++i) {
        ColumnInfo column;
        column.name = i < result.column_names.size() ? result.column_names[i] : std::format("column{}", i + 1);
        column.type = i < result.column_types.size() ? result.column_types[i] : "unknown";
        columns.push_back(std::move(column));
    }
    return columns;
}

} // anonymous namespace

BoundedExecutor::BoundedExecutor(std::shared_ptr<QueryGuard> guard,
                                 std::shared_ptr<IQueryEngine> engine,
                                 Config config)
    : guard_(std::move(guard)),
      engine_(std::move(engine)),
      config_(config) {}

int64_t BoundedExecutor::effective_row_limit(const ExecuteOptions& options) const {
    if (options.row_limit && *options.row_limit <= 0) {
        throw GatewayError(ErrorKind::EXECUTION_FAILED,
                           std::format("Row limit must be positive, got {}", *options.row_limit));
    }
    return std::min(options.row_limit.value_or(config_.default_row_limit), config_.max_row_limit);
}

std::chrono::milliseconds BoundedExecutor::effective_timeout(const ExecuteOptions& options) const {
    if (options.timeout_ms && *options.timeout_ms <= 0) {
        throw GatewayError(ErrorKind::EXECUTION_FAILED,
                           std::format("Timeout must be positive, got {}ms", *options.timeout_ms));
    }
    return std::chrono::milliseconds{
        std::min(options.timeout_ms.value_or(config_.default_timeout_ms), config_.max_timeout_ms)};
}

std::string BoundedExecutor::apply_row_limit(std::string_view secured_sql, int64_t ceiling) const {
    ParseResult parsed = parser_.parse(secured_sql);
    if (!parsed.is_valid || !parsed.ast) {
        utils::log::error(std::format("Secured query failed to re-parse: {}",
                                      parsed.errors.empty() ? "no statement" : parsed.errors.front()));
        throw GatewayError(ErrorKind::EXECUTION_FAILED, std::string(kExecutionFailed));
    }

    auto& stmt = *parsed.ast;
    const auto current = integer_limit(stmt.limit);
    if (current && *current <= ceiling) {
        return std::string(secured_sql);
    }
    stmt.limit = ast::make_expr(ast::Literal{ast::Literal::Kind::INTEGER, std::to_string(ceiling)});

    std::string limited;
    try {
        limited = SqlDeparser::deparse(stmt);
    } catch (const DeparseError& e) {
        utils::log::error(std::format("Row limit serialization failed: {}", e.what()));
        throw GatewayError(ErrorKind::EXECUTION_FAILED, std::string(kExecutionFailed));
    }

    const ParseResult check = parser_.parse(limited);
    if (!check.is_valid) {
        utils::log::error(std::format("Row-limited query failed to re-parse: {}", check.errors.front()));
        throw GatewayError(ErrorKind::EXECUTION_FAILED, std::string(kExecutionFailed));
    }
    return limited;
}

ExecuteResult BoundedExecutor::execute(std::string_view sql, const Principal& principal,
                                       const ExecuteOptions& options) const {
    const int64_t row_limit = effective_row_limit(options);
    const auto timeout = effective_timeout(options);

    if (!engine_->health_check()) {
        throw GatewayError(ErrorKind::ENGINE_UNREACHABLE, "Query engine is unreachable");
    }

    SecureResult secured = guard_->secure(sql, principal);
    if (!secured.success) {
        const std::string message = secured.errors.empty() ? "Query rejected" : secured.errors.front();
        throw GatewayError(secured.error_kind.value_or(ErrorKind::INVALID_SQL), message,
                           std::move(secured.errors));
    }

    std::string final_sql = apply_row_limit(secured.sql, row_limit);

    utils::Timer timer;

    // The worker owns everything it touches; a timed-out call leaves it running
    auto promise = std::make_shared<std::promise<EngineResult>>();
    std::future<EngineResult> future = promise->get_future();
    std::thread([engine = engine_, promise, query = std::move(final_sql), timeout]() {
        try {
            promise->set_value(engine->run(query, timeout));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout) == std::future_status::timeout) {
        utils::log::warn(std::format("Query for user '{}' exceeded timeout of {}ms",
                                     principal.user_id, timeout.count()));
        throw GatewayError(ErrorKind::QUERY_TIMEOUT,
                           std::format("Query exceeded timeout of {}ms", timeout.count()));
    }

    EngineResult engine_result;
    try {
        engine_result = future.get();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Query engine threw: {}", e.what()));
        throw GatewayError(ErrorKind::EXECUTION_FAILED, std::string(kExecutionFailed));
    }

    if (!engine_result.success) {
        utils::log::error(std::format("Query execution failed for user '{}': {}",
                                      principal.user_id, engine_result.error_message));
        throw GatewayError(ErrorKind::EXECUTION_FAILED, std::string(kExecutionFailed));
    }

    ExecuteResult result;
    result.execution_time_ms = timer.elapsed_ms().count();
    result.columns = derive_columns(engine_result);
    result.row_count = engine_result.rows.size();
    result.rows = std::move(engine_result.rows);
    return result;
}

} // namespace querygate
