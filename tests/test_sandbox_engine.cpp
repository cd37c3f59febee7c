#include <catch2/catch_test_macros.hpp>
#include "sandbox/sandbox_engine.hpp"
#include "mocks/sandbox_fixture.hpp"

#include "duckdb.hpp"

#include <format>

using namespace sqlsandbox;
using sqlsandbox::testing::SandboxFixture;

namespace {

std::shared_ptr<Sandbox> prepared(SandboxFixture& fx, const SandboxDatasets& datasets,
                                  const std::string& user = "alice",
                                  const std::string& problem = "p1") {
    auto result = fx.engine->prepare(user, problem, datasets);
    REQUIRE(result.is_ok());
    return result.value().sandbox;
}

int64_t count_rows(Sandbox& sandbox, const std::string& table) {
    auto rs = sandbox.execute(std::format("SELECT COUNT(*) FROM {}", table));
    REQUIRE(rs.is_ok());
    REQUIRE(rs.value().rows.size() == 1);
    return std::get<int64_t>(rs.value().rows[0][0]);
}

void write_parquet(const std::filesystem::path& path) {
    duckdb::DuckDB db(nullptr);
    duckdb::Connection conn(db);
    auto r = conn.Query(std::format(
        "COPY (SELECT * FROM (VALUES (1, 'North'), (2, 'South')) v(id, name)) TO '{}' (FORMAT PARQUET)",
        path.string()));
    REQUIRE_FALSE(r->HasError());
}

} // anonymous namespace

// ============================================================================
// Arena
// ============================================================================

TEST_CASE("SandboxEngine: acquire is idempotent per user and problem", "[sandbox_engine]") {
    SandboxFixture fx;

    auto first = fx.engine->acquire("alice", "p1");
    auto second = fx.engine->acquire("alice", "p1");
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    CHECK(first.value()->id() == second.value()->id());

    auto other = fx.engine->acquire("bob", "p1");
    REQUIRE(other.is_ok());
    CHECK(other.value()->id() != first.value()->id());

    auto stats = fx.engine->stats();
    CHECK(stats.created == 2);
    CHECK(stats.reused == 1);
    CHECK(stats.live == 2);
}

TEST_CASE("SandboxEngine: least recently used sandbox is evicted at the ceiling", "[sandbox_engine]") {
    auto config = SandboxFixture::default_config();
    config.max_concurrent_sandboxes = 2;
    SandboxFixture fx(config);

    auto a = fx.engine->acquire("u1", "p");
    auto b = fx.engine->acquire("u2", "p");
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    // Touch u1 so u2 becomes the eviction victim
    REQUIRE(fx.engine->acquire("u1", "p").is_ok());
    REQUIRE(fx.engine->acquire("u3", "p").is_ok());

    CHECK(fx.engine->contains("u1", "p"));
    CHECK_FALSE(fx.engine->contains("u2", "p"));
    CHECK(fx.engine->contains("u3", "p"));
    CHECK(b.value()->is_closed());
    CHECK_FALSE(a.value()->is_closed());

    auto stats = fx.engine->stats();
    CHECK(stats.evicted == 1);
    CHECK(stats.live == 2);
}

TEST_CASE("SandboxEngine: cleanup is idempotent", "[sandbox_engine]") {
    SandboxFixture fx;
    auto sandbox = fx.engine->acquire("alice", "p1").value();

    fx.engine->cleanup(*sandbox);
    fx.engine->cleanup(*sandbox);
    CHECK(sandbox->is_closed());
    CHECK_FALSE(fx.engine->contains("alice", "p1"));

    auto rs = sandbox->execute("SELECT 1");
    REQUIRE(rs.is_error());
    CHECK(rs.error_category() == ErrorCategory::INTERNAL_ERROR);
}

// ============================================================================
// Dataset loading
// ============================================================================

TEST_CASE("SandboxEngine: prepare loads, seals and reuses unchanged tables", "[sandbox_engine]") {
    SandboxFixture fx;

    auto first = fx.engine->prepare("alice", "p1", SandboxFixture::orders_only());
    REQUIRE(first.is_ok());
    const auto& report = first.value().report;
    CHECK(report.success);
    REQUIRE(report.loaded.size() == 1);
    CHECK(report.loaded[0].name == "orders");
    CHECK(report.loaded[0].row_count == 3);
    CHECK(report.loaded[0].source == "course/orders.csv");
    CHECK(first.value().sandbox->is_sealed());

    auto second = fx.engine->prepare("alice", "p1", SandboxFixture::orders_only());
    REQUIRE(second.is_ok());
    CHECK(second.value().sandbox->id() == first.value().sandbox->id());
    CHECK(second.value().report.skipped_unchanged == 1);
    CHECK(second.value().report.loaded.size() == 1);
}

TEST_CASE("SandboxEngine: changed dataset rebuilds a sealed sandbox", "[sandbox_engine]") {
    SandboxFixture fx;
    auto before = prepared(fx, SandboxFixture::orders_only());
    CHECK(count_rows(*before, "orders") == 3);

    fx.dir.write("orders.csv", "id,region,amount\n1,South,5\n");
    auto after = prepared(fx, SandboxFixture::orders_only());

    CHECK(after->id() != before->id());
    CHECK(before->is_closed());
    CHECK(count_rows(*after, "orders") == 1);
}

TEST_CASE("SandboxEngine: one failing source does not block the others", "[sandbox_engine]") {
    SandboxFixture fx;
    fx.resolver->add("course", "customers.csv", fx.dir.write("customers.csv", "id,name\n1,Ann\n2,Bo\n"));
    const auto parquet = fx.dir.path() / "regions.parquet";
    write_parquet(parquet);
    fx.resolver->add("course", "regions.parquet", parquet);

    SandboxDatasets datasets;
    datasets.sources = {
        {"course", "orders.csv", "orders"},
        {"course", "customers.csv", "customers"},
        {"course", "regions.parquet", "regions"},
        {"forbidden", "secret.csv", "secrets"},
    };

    auto result = fx.engine->prepare("alice", "p1", datasets);
    REQUIRE(result.is_ok());
    const auto& report = result.value().report;
    CHECK(report.success);
    CHECK(report.loaded.size() == 3);
    REQUIRE(report.errors.size() == 1);
    CHECK(report.errors[0].table_name == "secrets");
    CHECK(report.errors[0].source == "forbidden/secret.csv");

    auto& sandbox = *result.value().sandbox;
    CHECK(count_rows(sandbox, "regions") == 2);
    CHECK(count_rows(sandbox, "customers") == 2);
}

TEST_CASE("SandboxEngine: nothing loadable is a dataset error", "[sandbox_engine]") {
    SandboxFixture fx;
    SandboxDatasets datasets;
    datasets.sources = {{"forbidden", "a.csv", "a"}, {"course", "orders.csv", "bad name"}};

    auto result = fx.engine->prepare("alice", "p1", datasets);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::DATASET_LOAD_ERROR);
    CHECK(result.error_message().find("No dataset could be loaded") != std::string::npos);
}

TEST_CASE("SandboxEngine: duplicate table names and the table limit", "[sandbox_engine]") {
    auto config = SandboxFixture::default_config();
    config.max_tables = 2;
    SandboxFixture fx(config);

    auto sandbox = fx.engine->acquire("alice", "p1").value();
    auto report = fx.engine->load_tables(*sandbox, {
        {"course", "orders.csv", "orders"},
        {"course", "orders.csv", "ORDERS"},
        {"course", "orders.csv", "third"},
    });

    CHECK(report.success);
    CHECK(report.loaded.size() == 1);
    REQUIRE(report.errors.size() == 2);
    CHECK(report.errors[0].message.find("Duplicate table name") != std::string::npos);
    CHECK(report.errors[1].message.find("Table limit of 2") != std::string::npos);
}

TEST_CASE("SandboxEngine: schema tables are created with their rows", "[sandbox_engine]") {
    SandboxFixture fx;
    TableSchema regions;
    regions.table_name = "regions";
    regions.columns = {{"id", "INTEGER"}, {"name", "VARCHAR(20)"}};
    regions.sample_rows = {
        {int64_t{1}, std::string("North")},
        {int64_t{2}, std::string("South")},
    };

    SECTION("Valid definition") {
        SandboxDatasets datasets;
        datasets.schemas.push_back(regions);
        auto sandbox = prepared(fx, datasets);

        auto rs = sandbox->execute("SELECT name FROM regions ORDER BY id");
        REQUIRE(rs.is_ok());
        REQUIRE(rs.value().rows.size() == 2);
        CHECK(std::get<std::string>(rs.value().rows[1][0]) == "South");
        CHECK(sandbox->has_table_with_tag("regions", SandboxEngine::schema_tag(regions)));
    }

    SECTION("Disallowed column type") {
        regions.columns[1].type = "VARCHAR; DROP TABLE x";
        auto sandbox = fx.engine->acquire("alice", "p1").value();
        auto created = fx.engine->create_table_from_schema(*sandbox, regions);
        REQUIRE(created.is_error());
        CHECK(created.error_category() == ErrorCategory::DATASET_LOAD_ERROR);
        CHECK_FALSE(sandbox->table("regions").has_value());
    }

    SECTION("Row width mismatch") {
        regions.sample_rows.push_back({int64_t{3}});
        auto sandbox = fx.engine->acquire("alice", "p1").value();
        CHECK(fx.engine->create_table_from_schema(*sandbox, regions).is_error());
    }
}

// ============================================================================
// Execution
// ============================================================================

TEST_CASE("SandboxEngine: correct answer runs against loaded data", "[sandbox_engine]") {
    SandboxFixture fx;
    auto sandbox = prepared(fx, SandboxFixture::orders_only());

    auto rs = fx.engine->execute(*sandbox, "SELECT region, SUM(amount) FROM orders GROUP BY region");
    REQUIRE(rs.is_ok());
    REQUIRE(rs.value().columns.size() == 2);
    REQUIRE(rs.value().rows.size() == 1);
    CHECK(std::get<std::string>(rs.value().rows[0][0]) == "North");
    CHECK(std::get<double>(rs.value().rows[0][1]) == 800.25);
    CHECK_FALSE(rs.value().truncated);
}

TEST_CASE("SandboxEngine: chained destructive statement never executes", "[sandbox_engine]") {
    SandboxFixture fx;
    auto sandbox = prepared(fx, SandboxFixture::orders_only());

    auto rs = fx.engine->execute(*sandbox, "SELECT * FROM orders; DROP TABLE orders;");
    REQUIRE(rs.is_error());
    CHECK(rs.error_category() == ErrorCategory::SECURITY_REJECTED);
    CHECK(count_rows(*sandbox, "orders") == 3);
}

TEST_CASE("SandboxEngine: result rows are capped", "[sandbox_engine]") {
    auto config = SandboxFixture::default_config();
    config.sandbox.max_result_rows = 5;
    SandboxFixture fx(config);
    auto sandbox = fx.engine->acquire("alice", "p1").value();

    auto over = sandbox->execute("SELECT i FROM range(10) t(i)");
    REQUIRE(over.is_ok());
    CHECK(over.value().rows.size() == 5);
    CHECK(over.value().truncated);

    auto exact = sandbox->execute("SELECT i FROM range(5) t(i)");
    REQUIRE(exact.is_ok());
    CHECK(exact.value().rows.size() == 5);
    CHECK_FALSE(exact.value().truncated);
}

TEST_CASE("SandboxEngine: engine errors keep their category", "[sandbox_engine]") {
    SandboxFixture fx;
    auto sandbox = prepared(fx, SandboxFixture::orders_only());

    auto rs = sandbox->execute("SELECT no_such_column FROM orders");
    REQUIRE(rs.is_error());
    CHECK(rs.error_category() == ErrorCategory::ENGINE_ERROR);
    CHECK(count_rows(*sandbox, "orders") == 3);
}

TEST_CASE("SandboxEngine: runaway query times out and the sandbox recovers", "[sandbox_engine]") {
    auto config = SandboxFixture::default_config();
    config.sandbox.query_timeout = std::chrono::milliseconds(200);
    SandboxFixture fx(config);
    auto sandbox = prepared(fx, SandboxFixture::orders_only());

    auto rs = sandbox->execute("SELECT SUM(i) FROM range(10000000000) t(i)");
    REQUIRE(rs.is_error());
    CHECK(rs.error_category() == ErrorCategory::EXECUTION_TIMEOUT);
    CHECK(sandbox->connection_rebuilds() == 1);

    CHECK(count_rows(*sandbox, "orders") == 3);
    CHECK(sandbox->is_sealed());
}

TEST_CASE("SandboxEngine: sealed sandbox refuses further file loads", "[sandbox_engine]") {
    SandboxFixture fx;
    auto sandbox = prepared(fx, SandboxFixture::orders_only());
    REQUIRE(sandbox->is_sealed());

    auto loaded = sandbox->load_table_from_file("extra", fx.dir.path() / "orders.csv", "local", "tag");
    REQUIRE(loaded.is_error());
    CHECK(loaded.error_category() == ErrorCategory::DATASET_LOAD_ERROR);

    auto settings = sandbox->execute("SET enable_external_access = true");
    REQUIRE(settings.is_error());
    CHECK(settings.error_category() == ErrorCategory::SECURITY_REJECTED);
}

TEST_CASE("SandboxEngine: variant run perturbs and rolls back", "[sandbox_engine]") {
    SandboxFixture fx;
    auto sandbox = prepared(fx, SandboxFixture::orders_only());

    auto variant = sandbox->execute_on_variant("SELECT SUM(amount) FROM orders", PerturbationPlan{});
    REQUIRE(variant.is_ok());
    CHECK(variant.value().rows_perturbed == 1);
    REQUIRE(variant.value().perturbed_tables.size() == 1);
    CHECK(variant.value().perturbed_tables[0] == "orders");
    CHECK(std::get<double>(variant.value().result.rows[0][0]) == 801.25);

    auto original = sandbox->execute("SELECT SUM(amount) FROM orders");
    REQUIRE(original.is_ok());
    CHECK(std::get<double>(original.value().rows[0][0]) == 800.25);

    // Same seed, same rows
    auto again = sandbox->execute_on_variant(
        "SELECT id FROM orders WHERE region LIKE '%~' ORDER BY id", PerturbationPlan{});
    auto again2 = sandbox->execute_on_variant(
        "SELECT id FROM orders WHERE region LIKE '%~' ORDER BY id", PerturbationPlan{});
    REQUIRE(again.is_ok());
    REQUIRE(again2.is_ok());
    REQUIRE(again.value().result.rows.size() == 1);
    CHECK(again.value().result.rows == again2.value().result.rows);
}
