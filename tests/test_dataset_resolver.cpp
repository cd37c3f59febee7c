#include <catch2/catch_test_macros.hpp>
#include "core/digest.hpp"
#include "sandbox/dataset_resolver.hpp"
#include "mocks/temp_dir.hpp"

#include <filesystem>

using namespace sqlsandbox;
using sqlsandbox::testing::TempDir;

namespace {

LocalDatasetResolver make_resolver(const TempDir& dir, std::vector<std::string> buckets = {},
                                   uint64_t max_size = 1024 * 1024) {
    LocalDatasetResolver::Config cfg;
    cfg.root = dir.path() / "root";
    cfg.staging_dir = dir.path() / "staging";
    cfg.allowed_buckets = std::move(buckets);
    cfg.max_file_size_bytes = max_size;
    return LocalDatasetResolver(cfg);
}

} // anonymous namespace

TEST_CASE("LocalDatasetResolver: stages a copy with its digest", "[dataset_resolver]") {
    TempDir dir;
    dir.write("root/course/orders.csv", "id,amount\n1,10\n");
    auto resolver = make_resolver(dir);

    auto staged = resolver.resolve("course", "orders.csv");
    REQUIRE(staged.is_ok());
    const auto& s = staged.value();
    CHECK(std::filesystem::exists(s.local_path));
    CHECK(s.local_path.parent_path() == dir.path() / "staging");
    CHECK(s.size_bytes == 15);
    CHECK(s.integrity_tag == Sha256::hex("id,amount\n1,10\n"));
    CHECK(s.temporary);
}

TEST_CASE("LocalDatasetResolver: nested keys resolve", "[dataset_resolver]") {
    TempDir dir;
    dir.write("root/course/week1/orders.parquet", "PAR1");
    auto resolver = make_resolver(dir);
    CHECK(resolver.resolve("course", "week1/orders.parquet").is_ok());
}

TEST_CASE("LocalDatasetResolver: rejects unsafe locators", "[dataset_resolver]") {
    TempDir dir;
    dir.write("root/course/orders.csv", "id\n1\n");
    dir.write("root/secret.csv", "password\nx\n");
    auto resolver = make_resolver(dir);

    SECTION("Path traversal") {
        auto r = resolver.resolve("course", "../secret.csv");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::DATASET_LOAD_ERROR);
    }
    SECTION("Absolute key") {
        CHECK(resolver.resolve("course", "/etc/passwd.csv").is_error());
    }
    SECTION("Unsafe bucket names") {
        CHECK(resolver.resolve("..", "orders.csv").is_error());
        CHECK(resolver.resolve("Course", "orders.csv").is_error());
        CHECK(resolver.resolve("ab", "orders.csv").is_error());
    }
    SECTION("Unsupported extension") {
        dir.write("root/course/orders.db", "x");
        CHECK(resolver.resolve("course", "orders.db").is_error());
    }
    SECTION("Missing file and bucket") {
        CHECK(resolver.resolve("course", "missing.csv").is_error());
        CHECK(resolver.resolve("other", "orders.csv").is_error());
    }
}

TEST_CASE("LocalDatasetResolver: symlink out of the bucket is rejected", "[dataset_resolver]") {
    TempDir dir;
    const auto outside = dir.write("outside.csv", "a\n1\n");
    dir.write("root/course/.keep", "");
    std::error_code ec;
    std::filesystem::create_symlink(outside, dir.path() / "root/course/link.csv", ec);
    REQUIRE_FALSE(ec);

    auto resolver = make_resolver(dir);
    auto r = resolver.resolve("course", "link.csv");
    REQUIRE(r.is_error());
    CHECK(r.error_message().find("escapes its bucket") != std::string::npos);
}

TEST_CASE("LocalDatasetResolver: bucket allow-list and size ceiling", "[dataset_resolver]") {
    TempDir dir;
    dir.write("root/course/orders.csv", "id\n1\n");
    dir.write("root/private/orders.csv", "id\n1\n");
    dir.write("root/course/big.csv", std::string(200, 'x'));

    auto resolver = make_resolver(dir, {"course"}, 100);
    CHECK(resolver.resolve("course", "orders.csv").is_ok());
    CHECK(resolver.resolve("private", "orders.csv").is_error());

    auto big = resolver.resolve("course", "big.csv");
    REQUIRE(big.is_error());
    CHECK(big.error_message().find("limit is 100") != std::string::npos);
}
