#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

namespace sqlsandbox {

[[nodiscard]] nlohmann::json cell_to_json(const Cell& cell);
[[nodiscard]] nlohmann::json outcome_to_json(const ValidationOutcome& outcome);
[[nodiscard]] nlohmann::json grade_report_to_json(const GradeReport& report);

} // namespace sqlsandbox
