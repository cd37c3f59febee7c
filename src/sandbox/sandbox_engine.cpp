#include "sandbox/sandbox_engine.hpp"
#include "core/utils.hpp"
#include "security/identifier_validator.hpp"

#define XXH_INLINE_ALL
#include <xxhash.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <set>

namespace sqlsandbox {

SandboxEngine::SandboxEngine(const Config& config,
                             std::shared_ptr<IDatasetResolver> resolver,
                             std::shared_ptr<const QueryValidator> validator)
    : config_(config),
      resolver_(std::move(resolver)),
      validator_(std::move(validator)) {
    if (config_.max_concurrent_sandboxes == 0) config_.max_concurrent_sandboxes = 1;
}

SandboxEngine::~SandboxEngine() {
    cleanup_all();
}

SandboxEngine::Key SandboxEngine::make_key(const std::string& user_id, const std::string& problem_id) {
    // Length prefix keeps ("a:b", "c") and ("a", "b:c") apart
    return std::format("{}:{}:{}", user_id.size(), user_id, problem_id);
}

std::string SandboxEngine::schema_tag(const TableSchema& schema) {
    std::string canonical = schema.table_name;
    for (const auto& col : schema.columns) {
        canonical += std::format("|{}:{}", col.name, col.type);
    }
    for (const auto& row : schema.sample_rows) {
        canonical += '\n';
        for (const auto& cell : row) {
            canonical += std::format("{}:{}\x1f", cell.index(), cell_to_string(cell));
        }
    }
    return std::format("xxh64:{:016x}", XXH64(canonical.data(), canonical.size(), 0));
}

// ============================================================================
// Arena
// ============================================================================

Result<std::shared_ptr<Sandbox>> SandboxEngine::acquire(const std::string& user_id,
                                                        const std::string& problem_id) {
    using R = Result<std::shared_ptr<Sandbox>>;
    const Key key = make_key(user_id, problem_id);
    std::vector<std::shared_ptr<Sandbox>> evicted;
    std::shared_ptr<Sandbox> sandbox;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sandboxes_.find(key);
        if (it != sandboxes_.end() && !it->second.sandbox->is_closed()) {
            lru_.splice(lru_.begin(), lru_, it->second.lru_it);
            reused_.fetch_add(1);
            return R::ok(it->second.sandbox);
        }
        if (it != sandboxes_.end()) {
            lru_.erase(it->second.lru_it);
            sandboxes_.erase(it);
        }

        while (sandboxes_.size() >= config_.max_concurrent_sandboxes && !lru_.empty()) {
            const Key victim = lru_.back();
            lru_.pop_back();
            auto vit = sandboxes_.find(victim);
            if (vit != sandboxes_.end()) {
                evicted.push_back(std::move(vit->second.sandbox));
                sandboxes_.erase(vit);
            }
        }

        try {
            sandbox = std::make_shared<Sandbox>(user_id, problem_id, config_.sandbox, validator_);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Sandbox creation for {}/{} failed: {}",
                user_id, problem_id, e.what()));
            // Evicted sandboxes are torn down below either way
            for (auto& old : evicted) old->cleanup();
            return R::error(ErrorCategory::INTERNAL_ERROR, e.what());
        }

        lru_.push_front(key);
        sandboxes_.emplace(key, Entry{sandbox, lru_.begin()});
        created_.fetch_add(1);
    }

    for (auto& old : evicted) {
        utils::log::info(std::format("Evicting sandbox {} ({}/{})",
            old->id(), old->user_id(), old->problem_id()));
        old->cleanup();
        evicted_.fetch_add(1);
    }
    utils::log::info(std::format("Created sandbox {} for {}/{}", sandbox->id(), user_id, problem_id));
    return R::ok(std::move(sandbox));
}

void SandboxEngine::forget(const Key& key, uint64_t sandbox_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandboxes_.find(key);
    if (it != sandboxes_.end() && it->second.sandbox->id() == sandbox_id) {
        lru_.erase(it->second.lru_it);
        sandboxes_.erase(it);
    }
}

void SandboxEngine::cleanup(Sandbox& sandbox) {
    forget(make_key(sandbox.user_id(), sandbox.problem_id()), sandbox.id());
    sandbox.cleanup();
}

void SandboxEngine::cleanup_all() {
    std::vector<std::shared_ptr<Sandbox>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [_, entry] : sandboxes_) all.push_back(std::move(entry.sandbox));
        sandboxes_.clear();
        lru_.clear();
    }
    for (auto& sandbox : all) sandbox->cleanup();
}

bool SandboxEngine::contains(const std::string& user_id, const std::string& problem_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sandboxes_.contains(make_key(user_id, problem_id));
}

SandboxEngine::Stats SandboxEngine::stats() const {
    Stats s;
    s.created = created_.load();
    s.reused = reused_.load();
    s.evicted = evicted_.load();
    std::lock_guard<std::mutex> lock(mutex_);
    s.live = sandboxes_.size();
    return s;
}

// ============================================================================
// Dataset Loading
// ============================================================================

std::vector<Result<StagedDataset>> SandboxEngine::stage(const std::vector<DatasetSource>& sources) {
    std::vector<Result<StagedDataset>> staged;
    staged.reserve(sources.size());
    for (size_t i = 0; i < sources.size(); ++i) {
        if (i >= config_.max_tables) {
            staged.push_back(Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
                std::format("Table limit of {} reached", config_.max_tables)));
            continue;
        }
        if (!resolver_) {
            staged.push_back(Result<StagedDataset>::error(ErrorCategory::DATASET_LOAD_ERROR,
                "No dataset resolver configured"));
            continue;
        }
        staged.push_back(resolver_->resolve(sources[i].bucket, sources[i].key));
    }
    return staged;
}

LoadReport SandboxEngine::load_staged(Sandbox& sandbox,
                                      const std::vector<DatasetSource>& sources,
                                      const std::vector<Result<StagedDataset>>& staged) {
    LoadReport report;
    std::set<std::string> names;

    for (size_t i = 0; i < sources.size(); ++i) {
        const auto& source = sources[i];
        auto fail = [&](std::string message) {
            utils::log::warn(std::format("Sandbox {}: table {} from {} not loaded: {}",
                sandbox.id(), source.table_name, source.locator(), message));
            report.errors.push_back(TableLoadError{source.table_name, source.locator(), std::move(message)});
        };

        auto name_check = IdentifierValidator::validate_identifier(source.table_name);
        if (name_check.is_error()) {
            fail(name_check.error_message());
            continue;
        }
        if (!names.insert(utils::to_lower(source.table_name)).second) {
            fail(std::format("Duplicate table name {}", source.table_name));
            continue;
        }
        if (staged[i].is_error()) {
            fail(staged[i].error_message());
            continue;
        }

        const auto& file = staged[i].value();
        if (sandbox.has_table_with_tag(source.table_name, file.integrity_tag)) {
            if (auto existing = sandbox.table(source.table_name)) {
                report.loaded.push_back(*existing);
            }
            ++report.skipped_unchanged;
            continue;
        }

        auto loaded = sandbox.load_table_from_file(source.table_name, file.local_path,
                                                   source.locator(), file.integrity_tag);
        if (loaded.is_error()) {
            fail(loaded.error_message());
            continue;
        }
        report.loaded.push_back(std::move(loaded.value()));
    }

    for (const auto& result : staged) {
        if (result.is_ok() && result.value().temporary) {
            std::error_code ec;
            std::filesystem::remove(result.value().local_path, ec);
            if (ec) {
                utils::log::warn(std::format("Cannot remove staged file {}: {}",
                    result.value().local_path.string(), ec.message()));
            }
        }
    }

    report.success = sources.empty() || !report.loaded.empty();
    return report;
}

LoadReport SandboxEngine::load_tables(Sandbox& sandbox, const std::vector<DatasetSource>& sources) {
    const auto staged = stage(sources);
    return load_staged(sandbox, sources, staged);
}

Result<TableInfo> SandboxEngine::create_table_from_schema(Sandbox& sandbox, const TableSchema& schema) {
    return sandbox.create_table_from_schema(schema, schema_tag(schema));
}

Result<ResultSet> SandboxEngine::execute(Sandbox& sandbox, std::string_view sql) {
    return sandbox.execute(sql);
}

bool SandboxEngine::is_current(const Sandbox& sandbox,
                               const SandboxDatasets& datasets,
                               const std::vector<Result<StagedDataset>>& staged) {
    for (size_t i = 0; i < datasets.sources.size(); ++i) {
        if (staged[i].is_error()) continue;     // A failing source cannot be fixed by a rebuild
        if (!sandbox.has_table_with_tag(datasets.sources[i].table_name, staged[i].value().integrity_tag)) {
            return false;
        }
    }
    for (const auto& schema : datasets.schemas) {
        if (!sandbox.has_table_with_tag(schema.table_name, schema_tag(schema))) return false;
    }
    return true;
}

Result<PreparedSandbox> SandboxEngine::prepare(const std::string& user_id,
                                               const std::string& problem_id,
                                               const SandboxDatasets& datasets) {
    using R = Result<PreparedSandbox>;

    auto acquired = acquire(user_id, problem_id);
    if (acquired.is_error()) {
        return R::error(acquired.error_category(), acquired.error_message());
    }
    auto sandbox = acquired.value();
    const auto staged = stage(datasets.sources);

    if (sandbox->is_sealed() && !is_current(*sandbox, datasets, staged)) {
        utils::log::info(std::format("Sandbox {} ({}/{}): datasets changed, rebuilding",
            sandbox->id(), user_id, problem_id));
        cleanup(*sandbox);
        acquired = acquire(user_id, problem_id);
        if (acquired.is_error()) {
            return R::error(acquired.error_category(), acquired.error_message());
        }
        sandbox = acquired.value();
    }

    PreparedSandbox prepared;
    prepared.report = load_staged(*sandbox, datasets.sources, staged);

    for (const auto& schema : datasets.schemas) {
        const auto tag = schema_tag(schema);
        if (sandbox->has_table_with_tag(schema.table_name, tag)) {
            if (auto existing = sandbox->table(schema.table_name)) {
                prepared.report.loaded.push_back(*existing);
            }
            ++prepared.report.skipped_unchanged;
            continue;
        }
        auto created = sandbox->create_table_from_schema(schema, tag);
        if (created.is_error()) {
            utils::log::warn(std::format("Sandbox {}: schema table {} not created: {}",
                sandbox->id(), schema.table_name, created.error_message()));
            prepared.report.errors.push_back(TableLoadError{
                schema.table_name, "schema:" + schema.table_name, created.error_message()});
            continue;
        }
        prepared.report.loaded.push_back(std::move(created.value()));
    }

    const bool anything_requested = !datasets.sources.empty() || !datasets.schemas.empty();
    prepared.report.success = !anything_requested || !prepared.report.loaded.empty();
    if (!prepared.report.success) {
        std::string detail;
        for (const auto& err : prepared.report.errors) {
            if (!detail.empty()) detail += "; ";
            detail += std::format("{}: {}", err.table_name, err.message);
        }
        return R::error(ErrorCategory::DATASET_LOAD_ERROR,
            std::format("No dataset could be loaded ({})", detail));
    }

    auto sealed = sandbox->seal();
    if (sealed.is_error()) {
        return R::error(sealed.error_category(), sealed.error_message());
    }

    prepared.sandbox = std::move(sandbox);
    return R::ok(std::move(prepared));
}

} // namespace sqlsandbox
