#include "security/query_validator.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"
#include "parser/ast_keys.hpp"

// libpg_query C API
extern "C" {
#include <pg_query.h>
}

#include <algorithm>
#include <format>
#include <unordered_set>
#include <utility>

namespace sqlsandbox {

namespace {

// DML, DDL and every administrative statement the engine understands.
// DESC and REPLACE are left out: both are legal inside a SELECT.
const std::unordered_set<std::string_view> kDeniedKeywords = {
    // DML
    "INSERT", "UPDATE", "DELETE", "MERGE", "UPSERT",
    // DDL
    "CREATE", "ALTER", "DROP", "TRUNCATE", "RENAME",
    // Privileges and session state
    "GRANT", "REVOKE", "SET", "RESET", "USE",
    // Engine administration and file movement
    "ATTACH", "DETACH", "COPY", "EXPORT", "IMPORT", "PRAGMA", "INSTALL",
    "LOAD", "CALL", "CHECKPOINT", "VACUUM", "ANALYZE",
    // Prepared statements
    "PREPARE", "EXECUTE", "DEALLOCATE",
    // Transactions
    "BEGIN", "COMMIT", "ROLLBACK", "SAVEPOINT", "TRANSACTION",
    // Catalog inspection
    "SHOW", "DESCRIBE", "EXPLAIN", "SUMMARIZE",
};

// Words that may precede a parenthesized group without being a function
const std::unordered_set<std::string_view> kNonFunctionWords = {
    "AS", "IN", "EXISTS", "ANY", "ALL", "SOME", "OVER", "VALUES", "FROM",
    "JOIN", "USING", "ON", "WHERE", "AND", "OR", "NOT", "SELECT", "WITH",
    "UNION", "INTERSECT", "EXCEPT", "THEN", "ELSE", "WHEN", "FILTER",
    "WITHIN", "LATERAL", "BY", "HAVING", "QUALIFY", "MATERIALIZED", "RECURSIVE",
};

// libpg_query statement nodes that must never appear anywhere in the tree
const std::unordered_set<std::string_view> kDeniedNodes = {
    "InsertStmt", "UpdateStmt", "DeleteStmt", "MergeStmt",
    "CreateStmt", "CreateTableAsStmt", "CreateSchemaStmt", "ViewStmt",
    "IndexStmt", "AlterTableStmt", "DropStmt", "TruncateStmt", "RenameStmt",
    "GrantStmt", "GrantRoleStmt", "VariableSetStmt", "VariableShowStmt",
    "CopyStmt", "LoadStmt", "TransactionStmt", "ExplainStmt", "VacuumStmt",
    "CallStmt", "DoStmt", "ExecuteStmt", "PrepareStmt", "DeallocateStmt",
    "CheckPointStmt", "CreateFunctionStmt", "CreateExtensionStmt",
};

const std::unordered_set<std::string_view> kDeniedFunctions = {
    "load_file", "pg_read_file", "pg_read_binary_file", "pg_write_file",
    "pg_ls_dir", "pg_stat_file", "lo_import", "lo_export", "dblink",
    "glob", "getenv", "current_setting", "set_config", "sleep", "pg_sleep",
    "benchmark", "sniff_csv", "parquet_metadata", "parquet_schema",
    "parquet_file_metadata", "parquet_kv_metadata",
};

constexpr int kMaxAstDepth = 512;

bool is_denied_function(const std::string& name) {
    // Qualified names: only the last segment decides
    const auto dot = name.rfind('.');
    const std::string base = (dot == std::string::npos) ? name : name.substr(dot + 1);
    if (kDeniedFunctions.contains(base)) return true;
    if (base.starts_with("read_") || base.starts_with("duckdb_")) return true;
    if (base.ends_with("_scan")) return true;
    return false;
}

struct AstFindings {
    std::vector<std::string> statement_kinds;
    std::vector<std::string> denied_nodes;
    std::vector<std::string> functions;
    std::unordered_set<std::string> tables;
    size_t joins = 0;
    size_t subqueries = 0;
    bool select_into = false;
};

std::string function_name(const JsonValue& func_call) {
    std::string name;
    func_call[ast::kFuncname].for_each_element([&name](const JsonValue& part) {
        const auto str = part[ast::kString];
        std::string segment = str.value(ast::kSval, std::string{});
        if (segment.empty()) segment = str.value(ast::kStr, std::string{});
        if (segment.empty()) return;
        if (!name.empty()) name += '.';
        name += segment;
    });
    return utils::to_lower(name);
}

void walk_ast(const JsonValue& node, AstFindings& findings, int depth) {
    if (depth > kMaxAstDepth) return;

    if (node.is_array()) {
        node.for_each_element([&](const JsonValue& elem) {
            walk_ast(elem, findings, depth + 1);
        });
        return;
    }
    if (!node.is_object()) return;

    node.for_each_member([&](std::string_view key, const JsonValue& child) {
        if (kDeniedNodes.contains(key)) {
            findings.denied_nodes.emplace_back(key);
        } else if (key == ast::kRangeVar) {
            const auto rel = child.value(ast::kRelname, std::string{});
            if (!rel.empty()) findings.tables.insert(utils::to_lower(rel));
        } else if (key == ast::kJoinExpr) {
            ++findings.joins;
        } else if (key == ast::kFuncCall) {
            auto name = function_name(child);
            if (!name.empty()) findings.functions.push_back(std::move(name));
        } else if (key == ast::kSubLink || key == ast::kRangeSubselect) {
            ++findings.subqueries;
        } else if (key == ast::kIntoClause && child.is_object()) {
            findings.select_into = true;
        }
        walk_ast(child, findings, depth + 1);
    });
}

void collect_complexity(const TokenList& tokens, QueryValidator::ComplexitySignals& signals,
                        std::unordered_set<std::string>& tables,
                        std::unordered_set<std::string>& functions) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        const SqlToken* next = (i + 1 < tokens.size()) ? &tokens[i + 1] : nullptr;

        if (tok.kind == SqlToken::Kind::GROUP) {
            const auto first = SqlTokenizer::first_keyword(tok.children);
            if (first && (*first == "SELECT" || *first == "WITH")) {
                ++signals.subqueries;
            }
            collect_complexity(tok.children, signals, tables, functions);
            continue;
        }
        if (tok.kind != SqlToken::Kind::WORD) continue;

        if (tok.text == "JOIN") ++signals.joins;
        if (tok.text == "WHERE") ++signals.where_clauses;

        if ((tok.text == "FROM" || tok.text == "JOIN") && next &&
            (next->kind == SqlToken::Kind::WORD || next->kind == SqlToken::Kind::QUOTED_IDENTIFIER) &&
            !next->is_word("LATERAL")) {
            tables.insert(utils::to_lower(next->text));
        }

        if (next && next->kind == SqlToken::Kind::GROUP && !kNonFunctionWords.contains(tok.text)) {
            functions.insert(tok.text);
        }
    }
}

// Functions whose argument list may hold FROM followed by a literal,
// e.g. EXTRACT(YEAR FROM '2024-05-01'::DATE) or TRIM(BOTH 'x' FROM name)
const std::unordered_set<std::string_view> kFromArgumentFunctions = {
    "EXTRACT", "TRIM", "SUBSTRING", "SUBSTR", "OVERLAY", "DATE_PART",
};

// The engine reads a string literal in table position as a file path
bool has_quoted_source(const TokenList& tokens, bool function_args) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (tok.kind == SqlToken::Kind::GROUP) {
            const bool args = i > 0 && tokens[i - 1].kind == SqlToken::Kind::WORD &&
                              kFromArgumentFunctions.contains(tokens[i - 1].text);
            if (has_quoted_source(tok.children, args)) return true;
            continue;
        }
        if (i + 1 >= tokens.size() || tokens[i + 1].kind != SqlToken::Kind::STRING) continue;

        if (tok.is_word("JOIN")) return true;
        // IS [NOT] DISTINCT FROM 'x' is a comparison
        if (tok.is_word("FROM") && !function_args && !(i > 0 && tokens[i - 1].is_word("DISTINCT"))) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// QueryValidator
// ============================================================================

QueryValidator::QueryValidator(const Config& config)
    : config_(config) {
    const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
    auto add = [this, flags](const char* pattern, const char* message, const char* operation) {
        patterns_.push_back(DenyPattern{std::regex(pattern, flags), message, operation});
    };

    add(R"(\bload_file\s*\()", "File read function LOAD_FILE is not allowed", "FILE_ACCESS");
    add(R"(\binto\s+(outfile|dumpfile)\b)", "INTO OUTFILE/DUMPFILE is not allowed", "FILE_WRITE");
    add(R"(\b(xp_cmdshell|sp_configure|sp_executesql|openrowset|opendatasource)\b)",
        "System procedure access is not allowed", "SYSTEM_ACCESS");
    add(R"(\b(pg_(read|write)_(binary_)?file|pg_ls_dir|pg_stat_file|lo_import|lo_export)\s*\()",
        "Server file access functions are not allowed", "FILE_ACCESS");
    add(R"(\b(https?|s3[an]?|gcs|gs|az|azure|abfss?|r2|hf|file|ftp|sftp)://)",
        "URL access is not allowed", "NETWORK_ACCESS");
    add(R"(\bread_\w+\s*\()", "READ_* table functions are not allowed", "FILE_ACCESS");
    add(R"(\b\w+_scan\s*\()", "*_SCAN table functions are not allowed", "FILE_ACCESS");
    add(R"(\b(glob|sniff_csv|parquet_\w+|iceberg_\w+|delta_\w+)\s*\()",
        "File inspection functions are not allowed", "FILE_ACCESS");
    add(R"(\bduckdb_\w+\s*\()", "Engine catalog functions are not allowed", "SYSTEM_ACCESS");
    add(R"(\b(getenv|current_setting|set_config)\s*\()",
        "Configuration access functions are not allowed", "SYSTEM_ACCESS");
    add(R"(\b(sleep|pg_sleep|benchmark)\s*\(|\bwaitfor\s+delay\b)",
        "Time-delay functions are not allowed", "TIME_DELAY");
    add(R"(\b(from|join)\s+"[^"]*[./\\~][^"]*")",
        "Path-like identifiers in FROM/JOIN are not allowed", "FILE_ACCESS");
    add(R"(\b(from|join)\s+(\.{1,2}/|~/|/|[a-z]:\\))",
        "Filesystem paths in FROM/JOIN are not allowed", "FILE_ACCESS");
    add(R"(\b(from|join)\s+[\w.]+\.(csv|tsv|parquet|json|jsonl|ndjson|txt|xlsx|db|duckdb|sqlite)\b)",
        "File names in FROM/JOIN are not allowed", "FILE_ACCESS");
}

bool QueryValidator::is_denied_keyword(std::string_view upper_word) {
    return kDeniedKeywords.contains(upper_word);
}

std::string QueryValidator::strip_control_chars(std::string_view sql) {
    std::string out;
    out.reserve(sql.size());
    for (const char ch : sql) {
        const auto c = static_cast<unsigned char>(ch);
        if ((c < 0x20 && c != '\t' && c != '\n' && c != '\r') || c == 0x7F) continue;
        out += ch;
    }
    return out;
}

void QueryValidator::elevate(SecurityVerdict& verdict, RiskLevel level) {
    if (std::to_underlying(level) > std::to_underlying(verdict.risk_level)) {
        verdict.risk_level = level;
    }
}

void QueryValidator::add_unique(std::vector<std::string>& list, std::string value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(std::move(value));
    }
}

SecurityVerdict QueryValidator::validate(std::string_view sql) const {
    return run(sql, true);
}

SecurityVerdict QueryValidator::validate_fast(std::string_view sql) const {
    return run(sql, false);
}

SecurityVerdict QueryValidator::run(std::string_view sql, bool exhaustive) const {
    SecurityVerdict verdict;

    // Layer 1: limits
    if (utils::trim(sql).empty()) {
        verdict.errors.emplace_back("Query cannot be empty");
        elevate(verdict, RiskLevel::LOW);
        return verdict;
    }
    if (sql.size() > config_.max_query_length) {
        verdict.errors.push_back(std::format(
            "Query exceeds maximum length of {} characters", config_.max_query_length));
        elevate(verdict, RiskLevel::MEDIUM);
        return verdict;
    }

    // Layer 2: control characters
    verdict.sanitized_sql = strip_control_chars(sql);

    // Layer 3: statements
    auto tokens = SqlTokenizer::tokenize(verdict.sanitized_sql);
    if (tokens.is_error()) {
        verdict.errors.push_back(std::format("Malformed SQL: {}", tokens.error_message()));
        elevate(verdict, RiskLevel::MEDIUM);
        return verdict;
    }
    const auto statements = SqlTokenizer::split_statements(tokens.value());
    if (statements.empty()) {
        verdict.errors.emplace_back("Query cannot be empty");
        elevate(verdict, RiskLevel::LOW);
        return verdict;
    }
    if (statements.size() > 1) {
        verdict.errors.emplace_back(kMultipleStatementsError);
        add_unique(verdict.detected_operations, "MULTIPLE_STATEMENTS");
        elevate(verdict, RiskLevel::CRITICAL);
    }

    // Layer 4: deny-listed keywords anywhere in the tree (all statements)
    check_keywords(tokens.value(), verdict);

    // Layer 5: leading keyword
    check_leading_keyword(statements.front(), verdict);

    if (exhaustive) {
        // Layer 6: file/network/system access patterns, comments excluded.
        // Tokenization succeeded above, so stripping cannot fail here.
        auto uncommented = SqlTokenizer::strip_comments(verdict.sanitized_sql);
        check_patterns(uncommented.is_ok() ? uncommented.value() : verdict.sanitized_sql,
                       tokens.value(), verdict);

        // Layer 7: complexity (advisory)
        ComplexitySignals signals = measure_complexity(tokens.value());
        if (config_.ast_analysis && statements.size() == 1) {
            analyze_ast(verdict.sanitized_sql, verdict, signals);
        }
        check_complexity(signals, verdict);
    }

    verdict.is_valid = verdict.errors.empty();
    if (verdict.is_valid && !verdict.warnings.empty()) {
        elevate(verdict, RiskLevel::LOW);
    }
    return verdict;
}

void QueryValidator::check_keywords(const TokenList& tokens, SecurityVerdict& verdict) const {
    std::vector<const SqlToken*> words;
    SqlTokenizer::collect_words(tokens, words);

    std::unordered_set<std::string> reported;
    for (const auto* word : words) {
        if (!is_denied_keyword(word->text)) continue;
        if (!reported.insert(word->text).second) continue;
        verdict.errors.push_back(std::format("Forbidden keyword: {}", word->text));
        add_unique(verdict.detected_operations, word->text);
        elevate(verdict, RiskLevel::HIGH);
    }
}

void QueryValidator::check_leading_keyword(const TokenList& statement,
                                           SecurityVerdict& verdict) const {
    const auto first = SqlTokenizer::first_keyword(statement);
    if (first && (*first == "SELECT" || *first == "WITH")) {
        add_unique(verdict.detected_operations, *first);
        return;
    }
    verdict.errors.push_back(std::format(
        "Only SELECT or WITH queries are allowed (query starts with {})",
        first ? *first : std::string("a non-keyword token")));
    elevate(verdict, RiskLevel::MEDIUM);
}

void QueryValidator::check_patterns(const std::string& sql, const TokenList& tokens,
                                    SecurityVerdict& verdict) const {
    for (const auto& deny : patterns_) {
        if (std::regex_search(sql, deny.pattern)) {
            add_unique(verdict.errors, deny.message);
            add_unique(verdict.detected_operations, deny.operation);
            elevate(verdict, RiskLevel::CRITICAL);
        }
    }
    if (has_quoted_source(tokens, false)) {
        add_unique(verdict.errors, "Quoted file references in FROM/JOIN are not allowed");
        add_unique(verdict.detected_operations, "FILE_ACCESS");
        elevate(verdict, RiskLevel::CRITICAL);
    }
}

void QueryValidator::analyze_ast(const std::string& sql, SecurityVerdict& verdict,
                                 ComplexitySignals& signals) const {
    PgQueryParseResult parse_result = pg_query_parse(sql.c_str());

    if (parse_result.error) {
        // The engine dialect is wider than PostgreSQL's grammar: lexical
        // layers already ran, so a parse failure is advisory only.
        const std::string msg = parse_result.error->message
            ? parse_result.error->message
            : std::string(ast::kUnknownParseError);
        pg_query_free_parse_result(parse_result);
        verdict.warnings.push_back(std::format(
            "Query uses syntax outside the PostgreSQL grammar ({}); lexical checks only", msg));
        return;
    }

    AstFindings findings;
    try {
        const auto tree = JsonValue::parse(parse_result.parse_tree ? parse_result.parse_tree : "{}");
        tree[ast::kStmts].for_each_element([&findings](const JsonValue& entry) {
            entry[ast::kStmt].for_each_member([&findings](std::string_view kind, const JsonValue&) {
                findings.statement_kinds.emplace_back(kind);
            });
        });
        walk_ast(tree, findings, 0);
    } catch (const JsonValue::parse_error& e) {
        pg_query_free_parse_result(parse_result);
        verdict.warnings.push_back(std::format("Parse tree could not be analyzed: {}", e.what()));
        return;
    }
    pg_query_free_parse_result(parse_result);

    for (const auto& kind : findings.statement_kinds) {
        if (kind != ast::kSelectStmt) {
            verdict.errors.push_back(std::format("Statement type {} is not allowed", kind));
            add_unique(verdict.detected_operations, kind);
            elevate(verdict, RiskLevel::HIGH);
        }
    }
    for (const auto& node : findings.denied_nodes) {
        add_unique(verdict.errors, std::format("Forbidden operation in query tree: {}", node));
        add_unique(verdict.detected_operations, node);
        elevate(verdict, RiskLevel::HIGH);
    }
    if (findings.select_into) {
        add_unique(verdict.errors, "SELECT INTO is not allowed");
        add_unique(verdict.detected_operations, "SELECT_INTO");
        elevate(verdict, RiskLevel::HIGH);
    }

    std::unordered_set<std::string> distinct_functions;
    for (const auto& fn : findings.functions) {
        if (is_denied_function(fn)) {
            add_unique(verdict.errors, std::format("Function {} is not allowed", fn));
            add_unique(verdict.detected_operations, "FUNCTION:" + fn);
            elevate(verdict, RiskLevel::CRITICAL);
        }
        distinct_functions.insert(fn);
    }

    // The AST sees through quoting and aliasing, so take the larger count
    signals.tables = std::max(signals.tables, findings.tables.size());
    signals.joins = std::max(signals.joins, findings.joins);
    signals.functions = std::max(signals.functions, distinct_functions.size());
    signals.subqueries = std::max(signals.subqueries, findings.subqueries);
}

QueryValidator::ComplexitySignals QueryValidator::measure_complexity(const TokenList& tokens) {
    ComplexitySignals signals;
    std::unordered_set<std::string> tables;
    std::unordered_set<std::string> functions;
    collect_complexity(tokens, signals, tables, functions);
    signals.tables = tables.size();
    signals.functions = functions.size();
    return signals;
}

void QueryValidator::check_complexity(const ComplexitySignals& signals,
                                      SecurityVerdict& verdict) const {
    const size_t score = signals.score();
    if (score > 25) {
        verdict.warnings.emplace_back("Very high query complexity detected");
    } else if (score > 15) {
        verdict.warnings.emplace_back("High query complexity detected");
    }

    if (signals.tables > 6) {
        verdict.warnings.push_back(std::format(
            "Query accesses {} tables - ensure proper JOIN conditions to avoid cartesian products",
            signals.tables));
    } else if (signals.tables > 3) {
        verdict.warnings.emplace_back("Query accesses multiple tables - verify JOIN conditions");
    }
}

} // namespace sqlsandbox
