#pragma once

#include "core/types.hpp"
#include "sandbox/sandbox.hpp"

#include <string>
#include <string_view>

namespace sqlsandbox {

/**
 * @brief Advisory anti-hardcoding check
 *
 * Re-runs the query against a seeded perturbation of the sandbox data.
 * When the output is byte-identical to the unperturbed run although rows
 * were changed, the answer probably ignores the data (SELECT 42).
 */
class HardcodeDetector {
public:
    struct Config {
        bool enabled = true;
        PerturbationPlan plan;
    };

    struct Verdict {
        bool checked = false;           // Variant actually ran
        bool low_confidence = false;
        std::string note;
    };

    HardcodeDetector() : HardcodeDetector(Config{}) {}
    explicit HardcodeDetector(const Config& config);

    [[nodiscard]] Verdict check(Sandbox& sandbox, std::string_view sql, const ResultSet& baseline) const;

    [[nodiscard]] bool enabled() const { return config_.enabled; }

    static constexpr std::string_view kLowConfidenceNote =
        "Result did not change when the underlying data was perturbed; "
        "the query may not depend on the dataset";

private:
    Config config_;
};

} // namespace sqlsandbox
