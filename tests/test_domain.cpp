#include "fetters/domain/insight.h"
#include "fetters/domain/job.h"
#include "fetters/domain/sprint.h"
#include "fetters/domain/stage.h"
#include "fetters/domain/status.h"

#include <catch2/catch_test_macros.hpp>

using namespace fetters::domain;

TEST_CASE("format_percentage uses two decimals", "[domain][insights]") {
  CHECK(format_percentage(2, 5) == "40.00%");
  CHECK(format_percentage(2, 4) == "50.00%");
  CHECK(format_percentage(1, 3) == "33.33%");
  CHECK(format_percentage(3, 2) == "150.00%");
}

TEST_CASE("project_insights keeps order and skips zero denominators", "[domain][insights]") {
  const std::vector<LabelCount> counts = {{"PENDING", 2}, {"REJECTED", 2}};

  const auto rows = project_insights(counts, 4, 5);
  REQUIRE(rows.size() == 2);
  CHECK(rows[0] == CountAndPercentage{"PENDING", 2, "50.00%", "40.00%"});
  CHECK(rows[1] == CountAndPercentage{"REJECTED", 2, "50.00%", "40.00%"});

  CHECK(project_insights(counts, 0, 5).empty());
  CHECK(project_insights(counts, 4, 0).empty());
}

TEST_CASE("insight_to_json carries every column", "[domain][insights]") {
  const auto j = insight_to_json(CountAndPercentage{"HIRED", 1, "25.00%", "10.00%"});
  CHECK(j["label"] == "HIRED");
  CHECK(j["count"] == 1);
  CHECK(j["sprint_percentage"] == "25.00%");
  CHECK(j["overall_percentage"] == "10.00%");
}

TEST_CASE("stage statuses parse case-insensitively", "[domain][stage]") {
  CHECK(parse_stage_status("passed") == StageStatus::kPassed);
  CHECK(parse_stage_status(" Rejected ") == StageStatus::kRejected);
  CHECK(parse_stage_status("SCHEDULED") == StageStatus::kScheduled);
  CHECK_FALSE(parse_stage_status("cancelled").has_value());
  CHECK(to_string(StageStatus::kPassed) == "PASSED");
}

TEST_CASE("date prompts follow the stage status", "[domain][stage]") {
  CHECK(date_prompt(StageStatus::kScheduled) == "Select the scheduled date:");
  CHECK(date_prompt(StageStatus::kPassed) == "Select the passed date:");
  CHECK(date_prompt(StageStatus::kRejected) == "Select the rejected date:");
}

TEST_CASE("stage_label includes the name only when present", "[domain][stage]") {
  InterviewStage stage;
  stage.stage_number = 2;
  CHECK(stage_label(stage) == "Stage 2");
  stage.name = "";
  CHECK(stage_label(stage) == "Stage 2");
  stage.name = "Phone Screen";
  CHECK(stage_label(stage) == "Stage 2: Phone Screen");
}

TEST_CASE("apply_update changes only engaged fields", "[domain][stage]") {
  InterviewStage stage{7, 1, 1, "Phone Screen", StageStatus::kScheduled, "2025/01/20", "prep",
                      "2025-01-15 09:30:00"};

  InterviewStageUpdate update;
  update.status = StageStatus::kPassed;
  update.notes = std::optional<std::string>{};
  const auto updated = apply_update(stage, update);
  CHECK(updated.status == StageStatus::kPassed);
  CHECK_FALSE(updated.notes.has_value());
  CHECK(updated.name == stage.name);
  CHECK(updated.scheduled_date == "2025/01/20");
  CHECK(updated.id == 7);
}

TEST_CASE("default statuses are recognised by exact name", "[domain][status]") {
  CHECK(is_default_status("IN PROGRESS"));
  CHECK_FALSE(is_default_status("in progress"));
  CHECK(kDefaultStatuses.size() == 7);
}

TEST_CASE("sprint_to_json writes null for an open sprint", "[domain][sprint]") {
  const auto open = sprint_to_json(Sprint{1, "winter", "2025-01-01", std::nullopt, 3});
  CHECK(open["name"] == "winter");
  CHECK(open["end_date"].is_null());
  CHECK(open["num_jobs"] == 3);

  const auto closed = sprint_to_json(Sprint{2, "spring", "2025-03-01", "2025-03-31", 0});
  CHECK(closed["end_date"] == "2025-03-31");
}

TEST_CASE("listed_job_to_json writes null for missing values", "[domain][job]") {
  ListedJob job;
  job.id = 4;
  job.created = "2025-01-15 09:30:00";
  job.company_name = "Google";
  job.status = "PENDING";
  const auto j = listed_job_to_json(job);
  CHECK(j["id"] == 4);
  CHECK(j["company_name"] == "Google");
  CHECK(j["status"] == "PENDING");
  CHECK(j["title"].is_null());
  CHECK(j["stages"].is_null());
  CHECK(j["link"].is_null());
}
