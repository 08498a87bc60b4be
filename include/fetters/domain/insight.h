#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace fetters::domain {

// Raw aggregation row produced by the job store: a label (status or sprint name)
// and the number of jobs carrying it.
struct LabelCount {
  std::string label;
  std::int64_t count{0};
};

// One row of the insights view: the count as a percentage of the current sprint
// and of all jobs. Percentages are formatted with two decimals and a '%' suffix,
// e.g. "40.00%".
struct CountAndPercentage {
  std::string label;
  std::int64_t count{0};
  std::string sprint_percentage;
  std::string overall_percentage;

  bool operator==(const CountAndPercentage&) const = default;
};

// count / total * 100 with two decimals, e.g. format_percentage(2, 5) == "40.00%".
// Precondition: total > 0.
[[nodiscard]] std::string format_percentage(std::int64_t count, std::int64_t total);

// Attach percentages to raw counts, preserving order. Returns an empty list when
// either denominator is zero so no "inf%" or "nan%" row is ever produced.
// Sprint percentages are relative to the current sprint's total even for other
// sprints, so they may exceed 100%.
[[nodiscard]] std::vector<CountAndPercentage> project_insights(
    const std::vector<LabelCount>& counts, std::int64_t current_sprint_total,
    std::int64_t overall_total);

[[nodiscard]] nlohmann::json insight_to_json(const CountAndPercentage& row);

}  // namespace fetters::domain
