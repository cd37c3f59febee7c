#pragma once

#include "mocks/fake_dataset_resolver.hpp"
#include "mocks/temp_dir.hpp"
#include "sandbox/sandbox_engine.hpp"
#include "security/query_validator.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace sqlsandbox::testing {

inline constexpr const char* kOrdersCsv =
    "id,region,amount\n"
    "1,North,500\n"
    "2,North,200.25\n"
    "3,North,100\n";

/**
 * @brief Engine over a FakeDatasetResolver with course/orders.csv registered
 */
struct SandboxFixture {
    TempDir dir;
    std::shared_ptr<FakeDatasetResolver> resolver = std::make_shared<FakeDatasetResolver>();
    std::shared_ptr<const QueryValidator> validator = std::make_shared<QueryValidator>();
    std::shared_ptr<SandboxEngine> engine;

    explicit SandboxFixture(SandboxEngine::Config config = default_config()) {
        resolver->add("course", "orders.csv", dir.write("orders.csv", kOrdersCsv));
        engine = std::make_shared<SandboxEngine>(config, resolver, validator);
    }

    static SandboxEngine::Config default_config() {
        SandboxEngine::Config config;
        config.sandbox.memory_limit = "256MB";
        config.sandbox.query_timeout = std::chrono::milliseconds(10000);
        config.sandbox.interrupt_grace = std::chrono::milliseconds(2000);
        config.max_concurrent_sandboxes = 4;
        return config;
    }

    static SandboxDatasets orders_only() {
        SandboxDatasets datasets;
        datasets.sources.push_back(DatasetSource{"course", "orders.csv", "orders"});
        return datasets;
    }
};

} // namespace sqlsandbox::testing
