#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fetters::domain {

enum class StageStatus {
  kScheduled,
  kPassed,
  kRejected,
};

inline constexpr std::array<StageStatus, 3> kStageStatuses = {
    StageStatus::kScheduled,
    StageStatus::kPassed,
    StageStatus::kRejected,
};

[[nodiscard]] std::string_view to_string(StageStatus status);

// Case-insensitive: "passed" parses as kPassed.
[[nodiscard]] std::optional<StageStatus> parse_stage_status(std::string_view text);

// Prompt shown when asking for the date that goes with a status.
[[nodiscard]] std::string_view date_prompt(StageStatus status);

// InterviewStage is one interview round for a job.
// stage_number: 1..N, contiguous per job
// scheduled_date: YYYY/MM/DD
// created: YYYY-MM-DD HH:MM:SS
struct InterviewStage {
  std::int64_t id{0};
  std::int64_t job_id{0};
  std::int64_t stage_number{0};
  std::optional<std::string> name;
  StageStatus status{StageStatus::kScheduled};
  std::string scheduled_date;
  std::optional<std::string> notes;
  std::string created;

  bool operator==(const InterviewStage&) const = default;
};

struct NewInterviewStage {
  std::int64_t job_id{0};
  std::int64_t stage_number{0};
  std::optional<std::string> name;
  StageStatus status{StageStatus::kScheduled};
  std::string scheduled_date;
  std::optional<std::string> notes;
  std::string created;
};

// stage_number and job_id are immutable once a stage exists.
struct InterviewStageUpdate {
  std::optional<std::optional<std::string>> name;
  std::optional<StageStatus> status;
  std::optional<std::string> scheduled_date;
  std::optional<std::optional<std::string>> notes;

  [[nodiscard]] bool empty() const { return !name && !status && !scheduled_date && !notes; }
};

// Apply an update to an in-memory copy (used for previews before writing).
[[nodiscard]] InterviewStage apply_update(const InterviewStage& stage,
                                          const InterviewStageUpdate& update);

// "Stage 2: Phone Screen" or "Stage 2" when the name is absent or empty.
[[nodiscard]] std::string stage_label(const InterviewStage& stage);

}  // namespace fetters::domain
