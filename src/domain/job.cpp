#include "fetters/domain/job.h"

namespace fetters::domain {

namespace {

nlohmann::json optional_to_json(const std::optional<std::string>& value) {
  if (value.has_value()) {
    return value.value();
  }
  return nullptr;
}

}  // namespace

nlohmann::json listed_job_to_json(const ListedJob& job) {
  nlohmann::json j;
  j["id"] = job.id;
  j["created"] = job.created;
  j["company_name"] = job.company_name;
  j["title"] = optional_to_json(job.title);
  j["status"] = optional_to_json(job.status);
  if (job.stages_count.has_value()) {
    j["stages"] = job.stages_count.value();
  } else {
    j["stages"] = nullptr;
  }
  j["link"] = optional_to_json(job.link);
  j["notes"] = optional_to_json(job.notes);
  return j;
}

}  // namespace fetters::domain
