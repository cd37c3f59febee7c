#include "validation/hardcode_detector.hpp"
#include "core/utils.hpp"
#include "validation/result_hasher.hpp"

#include <format>

namespace sqlsandbox {

HardcodeDetector::HardcodeDetector(const Config& config)
    : config_(config) {}

HardcodeDetector::Verdict HardcodeDetector::check(Sandbox& sandbox, std::string_view sql,
                                                  const ResultSet& baseline) const {
    Verdict verdict;
    if (!config_.enabled) return verdict;

    auto variant = sandbox.execute_on_variant(sql, config_.plan);
    if (variant.is_error()) {
        // Advisory only: the grade stands without it
        utils::log::warn(std::format("Sandbox {}: anti-hardcoding variant skipped: {}",
            sandbox.id(), variant.error_message()));
        verdict.note = "Data variant could not be evaluated";
        return verdict;
    }

    verdict.checked = true;
    if (variant.value().rows_perturbed == 0) return verdict;

    const auto before = ResultHasher::canonicalize(baseline, true);
    const auto after = ResultHasher::canonicalize(variant.value().result, true);
    if (before == after) {
        verdict.low_confidence = true;
        verdict.note = std::string(kLowConfidenceNote);
    }
    return verdict;
}

} // namespace sqlsandbox
