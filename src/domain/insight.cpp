#include "fetters/domain/insight.h"

#include <cstdio>

namespace fetters::domain {

std::string format_percentage(std::int64_t count, std::int64_t total) {
  const double ratio = static_cast<double>(count) / static_cast<double>(total) * 100.0;
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2f%%", ratio);
  return std::string{buffer};
}

std::vector<CountAndPercentage> project_insights(const std::vector<LabelCount>& counts,
                                                 std::int64_t current_sprint_total,
                                                 std::int64_t overall_total) {
  if (current_sprint_total <= 0 || overall_total <= 0) {
    return {};
  }

  std::vector<CountAndPercentage> rows;
  rows.reserve(counts.size());
  for (const auto& entry : counts) {
    rows.push_back(CountAndPercentage{
        entry.label,
        entry.count,
        format_percentage(entry.count, current_sprint_total),
        format_percentage(entry.count, overall_total),
    });
  }
  return rows;
}

nlohmann::json insight_to_json(const CountAndPercentage& row) {
  nlohmann::json j;
  j["label"] = row.label;
  j["count"] = row.count;
  j["sprint_percentage"] = row.sprint_percentage;
  j["overall_percentage"] = row.overall_percentage;
  return j;
}

}  // namespace fetters::domain
