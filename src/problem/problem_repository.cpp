#include "problem/problem_repository.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sqlsandbox {

namespace {

struct DefinitionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::string require_string(const JsonValue& node, std::string_view key, std::string_view where) {
    const auto v = node[key];
    if (!v.is_string() || v.get<std::string>().empty()) {
        throw DefinitionError(std::format("{}: '{}' must be a non-empty string", where, key));
    }
    return v.get<std::string>();
}

ValidationRules parse_rules(const JsonValue& node, const ValidationRules& defaults) {
    ValidationRules rules = defaults;
    if (node.is_null()) return rules;
    if (!node.is_object()) throw DefinitionError("'rules' must be an object");
    rules.strict_ordering = node.value("strict_ordering", defaults.strict_ordering);
    const auto tol = node["numeric_tolerance"];
    if (tol.is_number()) {
        const double t = tol.get<double>();
        if (t < 0.0) throw DefinitionError("'numeric_tolerance' must not be negative");
        rules.numeric_tolerance = t;
    }
    return rules;
}

// Rows are arrays aligned with "columns", or objects keyed by column name
ResultSet parse_expected(const JsonValue& node, std::string_view where) {
    if (!node.is_object()) throw DefinitionError(std::format("{}: 'expected' must be an object", where));

    ResultSet rs;
    node["columns"].for_each_element([&](const JsonValue& col) {
        if (!col.is_string()) throw DefinitionError(std::format("{}: column names must be strings", where));
        rs.columns.push_back(col.get<std::string>());
    });

    const auto rows = node["rows"];
    if (!rows.is_array()) throw DefinitionError(std::format("{}: 'rows' must be an array", where));

    rows.for_each_element([&](const JsonValue& row) {
        Row out;
        if (row.is_array()) {
            if (row.size() != rs.columns.size()) {
                throw DefinitionError(std::format("{}: row has {} values for {} columns",
                    where, row.size(), rs.columns.size()));
            }
            row.for_each_element([&](const JsonValue& cell) { out.push_back(cell.to_cell()); });
        } else if (row.is_object()) {
            if (rs.columns.empty()) {
                row.for_each_member([&](std::string_view key, const JsonValue&) {
                    rs.columns.emplace_back(key);
                });
            }
            for (const auto& col : rs.columns) {
                if (!row.contains(col)) {
                    throw DefinitionError(std::format("{}: row is missing column '{}'", where, col));
                }
                out.push_back(row[col].to_cell());
            }
        } else {
            throw DefinitionError(std::format("{}: rows must be arrays or objects", where));
        }
        rs.rows.push_back(std::move(out));
    });

    if (rs.columns.empty()) throw DefinitionError(std::format("{}: expected result has no columns", where));
    return rs;
}

std::optional<std::string> parse_hash(const JsonValue& node) {
    if (node.is_null()) return std::nullopt;
    if (!node.is_string() || node.get<std::string>().empty()) {
        throw DefinitionError("'expected_hash' must be a non-empty string");
    }
    return node.get<std::string>();
}

SandboxDatasets parse_datasets(const JsonValue& root) {
    SandboxDatasets datasets;

    root["datasets"].for_each_element([&](const JsonValue& ds) {
        DatasetSource source;
        source.bucket = require_string(ds, "bucket", "dataset");
        source.key = require_string(ds, "key", "dataset");
        source.table_name = require_string(ds, "table", "dataset");
        datasets.sources.push_back(std::move(source));
    });

    root["schemas"].for_each_element([&](const JsonValue& s) {
        TableSchema schema;
        schema.table_name = require_string(s, "table", "schema");
        const std::string where = "schema " + schema.table_name;
        s["columns"].for_each_element([&](const JsonValue& c) {
            schema.columns.emplace_back(require_string(c, "name", where), require_string(c, "type", where));
        });
        if (schema.columns.empty()) throw DefinitionError(where + ": no columns");
        s["rows"].for_each_element([&](const JsonValue& r) {
            if (!r.is_array() || r.size() != schema.columns.size()) {
                throw DefinitionError(where + ": sample row width does not match columns");
            }
            Row row;
            r.for_each_element([&](const JsonValue& cell) { row.push_back(cell.to_cell()); });
            schema.sample_rows.push_back(std::move(row));
        });
        datasets.schemas.push_back(std::move(schema));
    });

    return datasets;
}

} // anonymous namespace

FileProblemRepository::FileProblemRepository(const Config& config)
    : config_(config) {}

bool FileProblemRepository::is_safe_id(std::string_view id) {
    if (id.empty() || id.size() > 128) return false;
    for (char c : id) {
        const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

Result<ProblemDefinition> FileProblemRepository::parse(const std::string& problem_id,
                                                       std::string_view json_text) {
    using R = Result<ProblemDefinition>;
    try {
        const auto root = JsonValue::parse(json_text);
        if (!root.is_object()) {
            return R::error(ErrorCategory::VALIDATION_ERROR, "Problem definition must be a JSON object");
        }

        ProblemDefinition def;
        def.id = problem_id;
        def.title = root.value("title", problem_id);
        def.anti_hardcode = root.value("anti_hardcode", true);
        def.datasets = parse_datasets(root);

        const auto default_rules = parse_rules(root["rules"], ValidationRules{});

        std::optional<ResultSet> master;
        if (!root["expected"].is_null()) master = parse_expected(root["expected"], "expected");
        const auto master_hash = parse_hash(root["expected_hash"]);

        root["test_cases"].for_each_element([&](const JsonValue& tc) {
            TestCase test;
            test.id = require_string(tc, "id", "test case");
            test.name = tc.value("name", test.id);
            test.hidden = tc.value("hidden", false);
            test.rules = parse_rules(tc["rules"], default_rules);
            const std::string where = "test case " + test.id;
            if (!tc["expected"].is_null()) test.expected = parse_expected(tc["expected"], where);
            test.expected_hash = parse_hash(tc["expected_hash"]);
            if (!test.expected && !test.expected_hash) {
                test.expected = master;
                test.expected_hash = master_hash;
            }
            if (!test.expected && !test.expected_hash) {
                throw DefinitionError(where + ": no expected result");
            }
            def.test_cases.push_back(std::move(test));
        });

        if (def.test_cases.empty()) {
            if (!master && !master_hash) {
                return R::error(ErrorCategory::VALIDATION_ERROR,
                    std::format("Problem {} defines no expected result", problem_id));
            }
            TestCase main_case;
            main_case.id = "main";
            main_case.name = "main";
            main_case.expected = std::move(master);
            main_case.expected_hash = master_hash;
            main_case.rules = default_rules;
            def.test_cases.push_back(std::move(main_case));
        }
        return R::ok(std::move(def));
    } catch (const JsonValue::parse_error& e) {
        return R::error(ErrorCategory::VALIDATION_ERROR, e.what());
    } catch (const DefinitionError& e) {
        return R::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Problem {}: {}", problem_id, e.what()));
    }
}

Result<ProblemDefinition> FileProblemRepository::get(const std::string& problem_id) {
    using R = Result<ProblemDefinition>;
    if (!is_safe_id(problem_id)) {
        return R::error(ErrorCategory::NOT_FOUND, "Problem not found");
    }

    const auto path = config_.dir / (problem_id + ".json");
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return R::error(ErrorCategory::NOT_FOUND, "Problem not found");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(problem_id);
        if (it != cache_.end() && it->second.mtime == mtime) {
            return R::ok(it->second.definition);
        }
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return R::error(ErrorCategory::NOT_FOUND, "Problem not found");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto parsed = parse(problem_id, buffer.str());
    if (parsed.is_error()) {
        utils::log::error(std::format("Problem definition {} is invalid: {}",
            path.string(), parsed.error_message()));
        return parsed;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[problem_id] = CachedDefinition{mtime, parsed.value()};
    return parsed;
}

} // namespace sqlsandbox
