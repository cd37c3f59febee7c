#include "sandbox/sandbox.hpp"
#include "core/utils.hpp"
#include "security/identifier_validator.hpp"
#include "security/query_validator.hpp"

#include "duckdb.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <format>
#include <future>
#include <thread>

namespace sqlsandbox {

namespace {

std::atomic<uint64_t> g_next_sandbox_id{1};

ErrorCategory map_engine_error(duckdb::ExceptionType type) {
    switch (type) {
        case duckdb::ExceptionType::OUT_OF_MEMORY: return ErrorCategory::RESOURCE_LIMIT_EXCEEDED;
        case duckdb::ExceptionType::INTERRUPT:     return ErrorCategory::EXECUTION_TIMEOUT;
        default:                                   return ErrorCategory::ENGINE_ERROR;
    }
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

Cell to_cell(const duckdb::Value& v) {
    if (v.IsNull()) return std::monostate{};
    switch (v.type().id()) {
        case duckdb::LogicalTypeId::BOOLEAN:
            return v.GetValue<bool>();
        case duckdb::LogicalTypeId::TINYINT:
        case duckdb::LogicalTypeId::SMALLINT:
        case duckdb::LogicalTypeId::INTEGER:
        case duckdb::LogicalTypeId::BIGINT:
        case duckdb::LogicalTypeId::UTINYINT:
        case duckdb::LogicalTypeId::USMALLINT:
        case duckdb::LogicalTypeId::UINTEGER:
            return v.GetValue<int64_t>();
        case duckdb::LogicalTypeId::UBIGINT:
        case duckdb::LogicalTypeId::HUGEINT: {
            // Out-of-range wide integers degrade to double
            const auto text = v.ToString();
            if (auto i = utils::try_parse_int<int64_t>(text)) return *i;
            if (auto d = utils::try_parse_double(text)) return *d;
            return text;
        }
        case duckdb::LogicalTypeId::FLOAT:
        case duckdb::LogicalTypeId::DOUBLE:
        case duckdb::LogicalTypeId::DECIMAL:
            return v.GetValue<double>();
        default:
            return v.ToString();
    }
}

duckdb::Value to_value(const Cell& cell) {
    return std::visit([](const auto& v) -> duckdb::Value {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return duckdb::Value();
        } else if constexpr (std::is_same_v<T, bool>) {
            return duckdb::Value::BOOLEAN(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return duckdb::Value::BIGINT(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return duckdb::Value::DOUBLE(v);
        } else {
            return duckdb::Value(v);
        }
    }, cell);
}

bool is_numeric_type(const std::string& type) {
    static constexpr std::string_view kNumeric[] = {
        "TINYINT", "SMALLINT", "INTEGER", "BIGINT", "HUGEINT", "UTINYINT",
        "USMALLINT", "UINTEGER", "UBIGINT", "FLOAT", "DOUBLE", "REAL",
        "DECIMAL", "NUMERIC",
    };
    return std::ranges::any_of(kNumeric, [&](std::string_view t) { return type.starts_with(t); });
}

bool is_text_type(const std::string& type) {
    return type.starts_with("VARCHAR") || type == "TEXT" || type == "STRING";
}

// Drains a (possibly streaming) result, keeping at most max_rows rows.
// truncated is set only when a further row actually existed.
Result<ResultSet> fetch_rows(duckdb::QueryResult& result, size_t max_rows) {
    if (result.HasError()) {
        return Result<ResultSet>::error(map_engine_error(result.GetErrorType()), result.GetError());
    }

    ResultSet rs;
    rs.columns.assign(result.names.begin(), result.names.end());

    while (!rs.truncated) {
        auto chunk = result.Fetch();
        if (result.HasError()) {
            return Result<ResultSet>::error(map_engine_error(result.GetErrorType()), result.GetError());
        }
        if (!chunk || chunk->size() == 0) break;

        const auto columns = chunk->ColumnCount();
        for (duckdb::idx_t r = 0; r < chunk->size(); ++r) {
            if (rs.rows.size() >= max_rows) {
                rs.truncated = true;
                break;
            }
            Row row;
            row.reserve(columns);
            for (duckdb::idx_t c = 0; c < columns; ++c) {
                row.push_back(to_cell(chunk->GetValue(c, r)));
            }
            rs.rows.push_back(std::move(row));
        }
    }
    return Result<ResultSet>::ok(std::move(rs));
}

Result<TableInfo> describe_table(duckdb::Connection& conn, const std::string& name,
                                 const std::string& source, const std::string& tag) {
    auto cols = conn.Query(std::format(
        "SELECT column_name, data_type FROM information_schema.columns "
        "WHERE table_schema = 'main' AND table_name = {} ORDER BY ordinal_position",
        utils::quote_literal(name)));
    if (cols->HasError()) {
        return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR, cols->GetError());
    }

    TableInfo info;
    info.name = name;
    info.source = source;
    info.integrity_tag = tag;
    for (duckdb::idx_t r = 0; r < cols->RowCount(); ++r) {
        info.columns.emplace_back(cols->GetValue(0, r).ToString(), cols->GetValue(1, r).ToString());
    }

    auto count = conn.Query(std::format("SELECT COUNT(*) FROM {}", utils::quote_identifier(name)));
    if (count->HasError()) {
        return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR, count->GetError());
    }
    info.row_count = static_cast<uint64_t>(count->GetValue(0, 0).GetValue<int64_t>());
    return Result<TableInfo>::ok(std::move(info));
}

} // anonymous namespace

// ============================================================================
// Worker: one thread, FIFO task queue
// ============================================================================

class Sandbox::Worker {
public:
    static std::shared_ptr<Worker> start() {
        auto worker = std::make_shared<Worker>();
        worker->thread_ = std::thread([worker] { worker->run(); });
        return worker;
    }

    ~Worker() {
        if (thread_.joinable()) {
            // Last reference dropped by the worker thread itself
            if (thread_.get_id() == std::this_thread::get_id()) {
                thread_.detach();
            } else {
                stop();
            }
        }
    }

    void post(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
            thread_.join();
        }
    }

    // Leaves a stuck thread behind; it exits once its current task returns
    void abandon() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
            tasks_.clear();
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.detach();
    }

private:
    void run() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
                if (stopping_) return;
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    bool stopping_ = false;
    std::thread thread_;
};

// ============================================================================
// Lifecycle
// ============================================================================

Sandbox::Sandbox(std::string user_id, std::string problem_id, const Config& config,
                 std::shared_ptr<const QueryValidator> validator)
    : user_id_(std::move(user_id)),
      problem_id_(std::move(problem_id)),
      id_(g_next_sandbox_id.fetch_add(1)),
      config_(config),
      validator_(std::move(validator)) {
    if (!validator_) {
        throw std::invalid_argument("Sandbox requires a query validator");
    }
    try {
        duckdb::DBConfig db_config;
        db_config.SetOptionByName("memory_limit", duckdb::Value(config_.memory_limit));
        db_config.SetOptionByName("threads", duckdb::Value::BIGINT(config_.threads));
        // No spilling: the memory ceiling must fail the query, not the disk
        db_config.SetOptionByName("temp_directory", duckdb::Value(""));
        db_config.SetOptionByName("autoinstall_known_extensions", duckdb::Value::BOOLEAN(false));
        db_config.SetOptionByName("autoload_known_extensions", duckdb::Value::BOOLEAN(false));

        db_ = std::make_unique<duckdb::DuckDB>(nullptr, &db_config);
        conn_ = std::make_shared<duckdb::Connection>(*db_);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::format("Cannot create sandbox engine: {}", e.what()));
    }
    worker_ = Worker::start();
}

Sandbox::~Sandbox() {
    cleanup();
}

void Sandbox::cleanup() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) return;

    // Waits for an in-flight execution to finish or time out
    std::lock_guard<std::mutex> lock(exec_mutex_);
    if (worker_) {
        worker_->stop();
        worker_.reset();
    }
    conn_.reset();
    db_.reset();
    {
        std::lock_guard<std::mutex> tables_lock(tables_mutex_);
        tables_.clear();
    }
}

void Sandbox::rebuild_connection() {
    conn_ = std::make_shared<duckdb::Connection>(*db_);
    rebuilds_.fetch_add(1);
}

// ============================================================================
// Worker dispatch with wall-clock timeout
// ============================================================================

// Caller holds exec_mutex_.
template <typename T>
Result<T> Sandbox::run_on_worker(std::function<Result<T>(duckdb::Connection&)> fn,
                                 std::chrono::milliseconds timeout, std::string_view what) {
    if (closed_.load() || !conn_ || !worker_) {
        return Result<T>::error(ErrorCategory::INTERNAL_ERROR, "Sandbox has been closed");
    }

    auto conn = conn_;
    auto promise = std::make_shared<std::promise<Result<T>>>();
    auto future = promise->get_future();

    worker_->post([conn, promise, fn = std::move(fn)] {
        try {
            promise->set_value(fn(*conn));
        } catch (const std::exception& e) {
            duckdb::ErrorData error(e);
            promise->set_value(Result<T>::error(map_engine_error(error.Type()), error.Message()));
        }
    });

    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }

    conn->Interrupt();
    if (future.wait_for(config_.interrupt_grace) != std::future_status::ready) {
        utils::log::warn(std::format("Sandbox {} ({}/{}): worker did not stop after interrupt, abandoning it",
            id_, user_id_, problem_id_));
        worker_->abandon();
        worker_ = Worker::start();
    }

    try {
        rebuild_connection();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Sandbox {}: connection rebuild failed: {}", id_, e.what()));
        conn_.reset();
    }
    utils::log::warn(std::format("Sandbox {} ({}/{}): {} timed out after {} ms, connection rebuilt",
        id_, user_id_, problem_id_, what, timeout.count()));

    return Result<T>::error(ErrorCategory::EXECUTION_TIMEOUT,
        std::format("{} exceeded the {} second time limit and was cancelled",
                    what, std::chrono::duration_cast<std::chrono::seconds>(timeout).count()));
}

// ============================================================================
// Table Loading
// ============================================================================

Result<TableInfo> Sandbox::load_table_from_file(const std::string& table_name,
                                                const std::filesystem::path& local_path,
                                                const std::string& source,
                                                const std::string& integrity_tag) {
    auto name_check = IdentifierValidator::validate_identifier(table_name);
    if (name_check.is_error()) {
        return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR, name_check.error_message());
    }
    if (sealed_.load()) {
        return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR,
            "Sandbox is sealed; external datasets can no longer be loaded");
    }

    const auto ext = utils::to_lower(local_path.extension().string());
    const char* reader = (ext == ".csv") ? "read_csv_auto" : "read_parquet";
    const auto ddl = std::format("CREATE OR REPLACE TABLE {} AS SELECT * FROM {}({})",
        utils::quote_identifier(table_name), reader, utils::quote_literal(local_path.string()));

    std::lock_guard<std::mutex> lock(exec_mutex_);
    auto result = run_on_worker<TableInfo>(
        [ddl, table_name, source, integrity_tag](duckdb::Connection& conn) -> Result<TableInfo> {
            auto created = conn.Query(ddl);
            if (created->HasError()) {
                return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR, created->GetError());
            }
            return describe_table(conn, table_name, source, integrity_tag);
        },
        config_.load_timeout, "Dataset load");

    if (result.is_ok()) record_table(result.value());
    return result;
}

Result<TableInfo> Sandbox::create_table_from_schema(const TableSchema& schema,
                                                    const std::string& integrity_tag) {
    auto name_check = IdentifierValidator::validate_identifier(schema.table_name);
    if (name_check.is_error()) {
        return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR, name_check.error_message());
    }
    if (schema.columns.empty()) {
        return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("Table {} has no columns", schema.table_name));
    }

    std::vector<std::string> seen;
    std::string column_list;
    for (const auto& col : schema.columns) {
        auto col_check = IdentifierValidator::validate_identifier(col.name);
        if (col_check.is_error()) {
            return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR,
                std::format("Table {}: {}", schema.table_name, col_check.error_message()));
        }
        auto type = IdentifierValidator::normalize_type(col.type);
        if (type.is_error()) {
            return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR,
                std::format("Table {}, column {}: {}", schema.table_name, col.name, type.error_message()));
        }
        auto lowered = utils::to_lower(col.name);
        if (std::ranges::find(seen, lowered) != seen.end()) {
            return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR,
                std::format("Table {}: duplicate column {}", schema.table_name, col.name));
        }
        seen.push_back(std::move(lowered));

        if (!column_list.empty()) column_list += ", ";
        column_list += std::format("{} {}", utils::quote_identifier(col.name), type.value());
    }

    for (size_t i = 0; i < schema.sample_rows.size(); ++i) {
        if (schema.sample_rows[i].size() != schema.columns.size()) {
            return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR,
                std::format("Table {}: sample row {} has {} values, expected {}",
                            schema.table_name, i + 1, schema.sample_rows[i].size(),
                            schema.columns.size()));
        }
    }

    const auto quoted = utils::quote_identifier(schema.table_name);
    const auto ddl = std::format("CREATE TABLE {} ({})", quoted, column_list);
    std::string placeholders;
    for (size_t i = 1; i <= schema.columns.size(); ++i) {
        if (i > 1) placeholders += ", ";
        placeholders += std::format("${}", i);
    }
    const auto insert = std::format("INSERT INTO {} VALUES ({})", quoted, placeholders);

    std::lock_guard<std::mutex> lock(exec_mutex_);
    auto result = run_on_worker<TableInfo>(
        [schema, integrity_tag, quoted, ddl, insert](duckdb::Connection& conn) -> Result<TableInfo> {
            auto fail = [&conn](std::string message) {
                auto rollback = conn.Query("ROLLBACK");
                if (rollback->HasError()) {
                    utils::log::warn(std::format("ROLLBACK failed: {}", rollback->GetError()));
                }
                return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR, std::move(message));
            };

            auto begin = conn.Query("BEGIN TRANSACTION");
            if (begin->HasError()) {
                return Result<TableInfo>::error(ErrorCategory::DATASET_LOAD_ERROR, begin->GetError());
            }
            auto dropped = conn.Query(std::format("DROP TABLE IF EXISTS {}", quoted));
            if (dropped->HasError()) return fail(dropped->GetError());
            auto created = conn.Query(ddl);
            if (created->HasError()) return fail(created->GetError());

            if (!schema.sample_rows.empty()) {
                auto stmt = conn.Prepare(insert);
                if (stmt->HasError()) return fail(stmt->GetError());
                for (size_t i = 0; i < schema.sample_rows.size(); ++i) {
                    duckdb::vector<duckdb::Value> values;
                    values.reserve(schema.sample_rows[i].size());
                    for (const auto& cell : schema.sample_rows[i]) {
                        values.push_back(to_value(cell));
                    }
                    auto inserted = stmt->Execute(values, false);
                    if (inserted->HasError()) {
                        return fail(std::format("Sample row {}: {}", i + 1, inserted->GetError()));
                    }
                }
            }

            auto commit = conn.Query("COMMIT");
            if (commit->HasError()) return fail(commit->GetError());
            return describe_table(conn, schema.table_name, "schema:" + schema.table_name, integrity_tag);
        },
        config_.load_timeout, "Table creation");

    if (result.is_ok()) record_table(result.value());
    return result;
}

Result<Unit> Sandbox::seal() {
    if (sealed_.load()) return Result<Unit>::ok(Unit{});

    std::lock_guard<std::mutex> lock(exec_mutex_);
    auto result = run_on_worker<Unit>(
        [](duckdb::Connection& conn) -> Result<Unit> {
            for (const char* stmt : {"SET enable_external_access = false",
                                     "SET lock_configuration = true"}) {
                auto r = conn.Query(stmt);
                if (r->HasError()) {
                    return Result<Unit>::error(ErrorCategory::INTERNAL_ERROR,
                        std::format("Cannot seal sandbox ({}): {}", stmt, r->GetError()));
                }
            }
            return Result<Unit>::ok(Unit{});
        },
        config_.load_timeout, "Seal");

    if (result.is_ok()) sealed_.store(true);
    return result;
}

// ============================================================================
// Execution
// ============================================================================

Result<ResultSet> Sandbox::execute(std::string_view sql) {
    if (closed_.load()) {
        return Result<ResultSet>::error(ErrorCategory::INTERNAL_ERROR, "Sandbox has been closed");
    }

    const auto verdict = validator_->validate(sql);
    if (!verdict.is_valid) {
        return Result<ResultSet>::error(ErrorCategory::SECURITY_REJECTED, join(verdict.errors, "; "));
    }

    const size_t max_rows = config_.max_result_rows;
    std::lock_guard<std::mutex> lock(exec_mutex_);
    return run_on_worker<ResultSet>(
        [query = verdict.sanitized_sql, max_rows](duckdb::Connection& conn) -> Result<ResultSet> {
            utils::Timer timer;
            auto streamed = conn.SendQuery(query);
            auto rs = fetch_rows(*streamed, max_rows);
            if (rs.is_ok()) rs.value().execution_time = timer.elapsed_us();
            return rs;
        },
        config_.query_timeout, "Query");
}

Result<VariantRun> Sandbox::execute_on_variant(std::string_view sql, const PerturbationPlan& plan) {
    if (closed_.load()) {
        return Result<VariantRun>::error(ErrorCategory::INTERNAL_ERROR, "Sandbox has been closed");
    }

    const auto verdict = validator_->validate(sql);
    if (!verdict.is_valid) {
        return Result<VariantRun>::error(ErrorCategory::SECURITY_REJECTED, join(verdict.errors, "; "));
    }

    // One UPDATE per table that has something to perturb
    std::vector<std::pair<std::string, std::string>> updates;
    size_t rows_perturbed = 0;
    const auto seed = static_cast<int64_t>(plan.seed & 0xFFFFFFFFULL);
    for (const auto& info : tables()) {
        if (info.row_count == 0) continue;
        std::string assignments;
        for (const auto& col : info.columns) {
            const auto type = utils::to_upper(col.type);
            const auto quoted = utils::quote_identifier(col.name);
            std::string assignment;
            if (is_numeric_type(type)) {
                assignment = std::format("{0} = {0} + 1", quoted);
            } else if (is_text_type(type)) {
                assignment = std::format("{0} = {0} || '~'", quoted);
            } else {
                continue;
            }
            if (!assignments.empty()) assignments += ", ";
            assignments += assignment;
        }
        if (assignments.empty()) continue;

        const auto n = std::max<uint64_t>(1,
            static_cast<uint64_t>(std::ceil(static_cast<double>(info.row_count) * plan.fraction)));
        const auto table = utils::quote_identifier(info.name);
        updates.emplace_back(info.name, std::format(
            "UPDATE {0} SET {1} WHERE rowid IN "
            "(SELECT rowid FROM {0} ORDER BY hash(rowid + {2}) LIMIT {3})",
            table, assignments, seed, n));
        rows_perturbed += std::min<uint64_t>(n, info.row_count);
    }

    if (updates.empty()) {
        return Result<VariantRun>::error(ErrorCategory::VALIDATION_ERROR,
            "No numeric or text column available to build a data variant");
    }

    const size_t max_rows = config_.max_result_rows;
    std::lock_guard<std::mutex> lock(exec_mutex_);
    return run_on_worker<VariantRun>(
        [query = verdict.sanitized_sql, updates, rows_perturbed, max_rows](
            duckdb::Connection& conn) -> Result<VariantRun> {
            auto rollback = [&conn] {
                auto r = conn.Query("ROLLBACK");
                if (r->HasError()) {
                    utils::log::warn(std::format("Variant ROLLBACK failed: {}", r->GetError()));
                }
            };

            auto begin = conn.Query("BEGIN TRANSACTION");
            if (begin->HasError()) {
                return Result<VariantRun>::error(ErrorCategory::VALIDATION_ERROR, begin->GetError());
            }

            VariantRun run;
            run.rows_perturbed = rows_perturbed;
            for (const auto& [table, update] : updates) {
                auto r = conn.Query(update);
                if (r->HasError()) {
                    rollback();
                    return Result<VariantRun>::error(ErrorCategory::VALIDATION_ERROR,
                        std::format("Cannot perturb table {}: {}", table, r->GetError()));
                }
                run.perturbed_tables.push_back(table);
            }

            Result<ResultSet> rs = [&] {
                utils::Timer timer;
                auto streamed = conn.SendQuery(query);
                auto fetched = fetch_rows(*streamed, max_rows);
                if (fetched.is_ok()) fetched.value().execution_time = timer.elapsed_us();
                return fetched;
            }();
            rollback();

            if (rs.is_error()) {
                return Result<VariantRun>::error(rs.error_category(), rs.error_message());
            }
            run.result = std::move(rs.value());
            return Result<VariantRun>::ok(std::move(run));
        },
        config_.query_timeout, "Variant query");
}

// ============================================================================
// Table Provenance
// ============================================================================

void Sandbox::record_table(TableInfo info) {
    std::lock_guard<std::mutex> lock(tables_mutex_);
    auto name = info.name;
    tables_[std::move(name)] = std::move(info);
}

std::vector<TableInfo> Sandbox::tables() const {
    std::lock_guard<std::mutex> lock(tables_mutex_);
    std::vector<TableInfo> out;
    out.reserve(tables_.size());
    for (const auto& [_, info] : tables_) out.push_back(info);
    return out;
}

std::optional<TableInfo> Sandbox::table(const std::string& name) const {
    std::lock_guard<std::mutex> lock(tables_mutex_);
    auto it = tables_.find(name);
    if (it == tables_.end()) return std::nullopt;
    return it->second;
}

bool Sandbox::has_table_with_tag(const std::string& name, const std::string& integrity_tag) const {
    std::lock_guard<std::mutex> lock(tables_mutex_);
    auto it = tables_.find(name);
    return it != tables_.end() && !integrity_tag.empty() && it->second.integrity_tag == integrity_tag;
}

} // namespace sqlsandbox
