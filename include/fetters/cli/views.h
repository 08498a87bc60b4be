#pragma once

#include "fetters/cli/console.h"
#include "fetters/domain/insight.h"
#include "fetters/domain/job.h"
#include "fetters/domain/sprint.h"
#include "fetters/domain/stage.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fetters::cli {

// Jobs table titled "Sprint: <sprint_label>", one row per job colored by status.
// Columns: ID, Created, Company, Title, Status, Stages, Link, Notes.
void render_jobs(const Console& console, const std::string& sprint_label,
                 const std::vector<domain::ListedJob>& jobs);

// Columns: ID, Name, Start Date, End Date, Jobs. The current sprint is marked with '*'.
void render_sprints(const Console& console, const std::vector<domain::Sprint>& sprints,
                    const std::string& current_sprint_name);

// Columns: <label_header>, Count, Sprint %, Overall %.
void render_insights(const Console& console, const std::string& title,
                     const std::string& label_header,
                     const std::vector<domain::CountAndPercentage>& rows);

enum class Highlight {
  kGreen,
  kRed,
};

// Stage tree for one job:
//
//   Google - Software Engineer
//   ├── Stage 1: Phone Screen
//   │   ├── [PASSED] 2025/01/20
//   │   └── went well
//   └── Stage 2
//       └── [SCHEDULED] 2025/01/27
//
// The stage whose id equals highlight_id is drawn in the highlight color.
void render_stage_tree(const Console& console, const domain::ListedJob& job,
                       const std::vector<domain::InterviewStage>& stages,
                       std::optional<std::int64_t> highlight_id = std::nullopt,
                       Highlight highlight = Highlight::kGreen);

// Option labels used in selection prompts.
[[nodiscard]] std::string job_choice_label(const domain::ListedJob& job);
[[nodiscard]] std::string stage_choice_label(const domain::InterviewStage& stage);
[[nodiscard]] std::string sprint_choice_label(const domain::Sprint& sprint);

}  // namespace fetters::cli
