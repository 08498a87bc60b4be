#include "fetters/domain/sprint.h"

namespace fetters::domain {

nlohmann::json sprint_to_json(const Sprint& sprint) {
  nlohmann::json j;
  j["id"] = sprint.id;
  j["name"] = sprint.name;
  j["start_date"] = sprint.start_date;
  if (sprint.end_date.has_value()) {
    j["end_date"] = sprint.end_date.value();
  } else {
    j["end_date"] = nullptr;
  }
  j["num_jobs"] = sprint.num_jobs;
  return j;
}

}  // namespace fetters::domain
