#include "fetters/domain/stage.h"

#include "fetters/core/normalization.h"

namespace fetters::domain {

std::string_view to_string(StageStatus status) {
  switch (status) {
    case StageStatus::kScheduled:
      return "SCHEDULED";
    case StageStatus::kPassed:
      return "PASSED";
    case StageStatus::kRejected:
      return "REJECTED";
  }
  return "SCHEDULED";
}

std::optional<StageStatus> parse_stage_status(std::string_view text) {
  const std::string upper = core::normalize_ascii_upper(core::trim(text));
  for (const StageStatus status : kStageStatuses) {
    if (upper == to_string(status)) {
      return status;
    }
  }
  return std::nullopt;
}

std::string_view date_prompt(StageStatus status) {
  switch (status) {
    case StageStatus::kScheduled:
      return "Select the scheduled date:";
    case StageStatus::kPassed:
      return "Select the passed date:";
    case StageStatus::kRejected:
      return "Select the rejected date:";
  }
  return "Select a date:";
}

InterviewStage apply_update(const InterviewStage& stage, const InterviewStageUpdate& update) {
  InterviewStage updated = stage;
  if (update.name.has_value()) {
    updated.name = update.name.value();
  }
  if (update.status.has_value()) {
    updated.status = update.status.value();
  }
  if (update.scheduled_date.has_value()) {
    updated.scheduled_date = update.scheduled_date.value();
  }
  if (update.notes.has_value()) {
    updated.notes = update.notes.value();
  }
  return updated;
}

std::string stage_label(const InterviewStage& stage) {
  std::string label = "Stage " + std::to_string(stage.stage_number);
  if (stage.name.has_value() && !stage.name->empty()) {
    label += ": " + stage.name.value();
  }
  return label;
}

}  // namespace fetters::domain
