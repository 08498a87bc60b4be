#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace fetters::domain {

// Job is one tracked application as stored in the jobs table.
// created: YYYY-MM-DD HH:MM:SS
struct Job {
  std::int64_t id{0};
  std::string created;
  std::string company_name;
  std::int64_t title_id{0};
  std::int64_t status_id{0};
  std::optional<std::string> link;
  std::optional<std::string> notes;
  std::int64_t sprint_id{0};

  bool operator==(const Job&) const = default;
};

struct NewJob {
  std::string company_name;
  std::string created;
  std::int64_t title_id{0};
  std::int64_t status_id{0};
  std::optional<std::string> link;
  std::optional<std::string> notes;
  std::int64_t sprint_id{0};
};

// JobUpdate writes only engaged fields. link/notes may be cleared with a
// nested empty optional. A changed sprint_id moves the job between sprints.
struct JobUpdate {
  std::optional<std::string> company_name;
  std::optional<std::int64_t> title_id;
  std::optional<std::int64_t> status_id;
  std::optional<std::optional<std::string>> link;
  std::optional<std::optional<std::string>> notes;
  std::optional<std::int64_t> sprint_id;

  [[nodiscard]] bool empty() const {
    return !company_name && !title_id && !status_id && !link && !notes && !sprint_id;
  }
};

// ListedJob is the flattened projection of Job joined with Title, Status and Sprint.
// stages_count is nullopt when the job has no interview stages.
struct ListedJob {
  std::int64_t id{0};
  std::string created;
  std::string company_name;
  std::optional<std::string> title;
  std::optional<std::string> status;
  std::optional<std::int64_t> stages_count;
  std::optional<std::string> link;
  std::optional<std::string> notes;

  bool operator==(const ListedJob&) const = default;
};

// JobFilter narrows a job listing. String fields are substring matches;
// sprint falls back to the current sprint when absent.
// stages: nullopt = no filter, 0 = any stages, N >= 1 = exactly N stages.
struct JobFilter {
  std::optional<std::string> company;
  std::optional<std::string> link;
  std::optional<std::string> notes;
  std::optional<std::string> sprint;
  std::optional<std::string> status;
  std::optional<std::string> title;
  std::optional<std::int64_t> stages;
};

[[nodiscard]] nlohmann::json listed_job_to_json(const ListedJob& job);

}  // namespace fetters::domain
