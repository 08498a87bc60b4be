#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace fetters::domain {

// Sprint groups job applications the user tracks together.
// - name: unique across all sprints
// - start_date / end_date: YYYY-MM-DD (end_date absent while the sprint is open)
// - num_jobs: maintained counter, always equal to the number of jobs in the sprint
struct Sprint {
  std::int64_t id{0};
  std::string name;
  std::string start_date;
  std::optional<std::string> end_date;
  std::int64_t num_jobs{0};

  bool operator==(const Sprint&) const = default;
};

struct NewSprint {
  std::string name;
  std::string start_date;
  std::optional<std::string> end_date;
  std::int64_t num_jobs{0};
};

// SprintUpdate is a partial record: only engaged fields are written.
// end_date uses a nested optional so it can be explicitly cleared:
//   std::nullopt          -> leave unchanged
//   std::optional{nullopt} -> set to NULL
struct SprintUpdate {
  std::optional<std::string> name;
  std::optional<std::string> start_date;
  std::optional<std::optional<std::string>> end_date;

  [[nodiscard]] bool empty() const { return !name && !start_date && !end_date; }
};

[[nodiscard]] nlohmann::json sprint_to_json(const Sprint& sprint);

}  // namespace fetters::domain
