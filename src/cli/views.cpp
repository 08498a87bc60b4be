#include "fetters/cli/views.h"

#include "fetters/cli/table.h"

namespace fetters::cli {

namespace {

constexpr const char* kNotAvailable = "N/A";

Color highlight_color(Highlight highlight) {
  return highlight == Highlight::kGreen ? Color::kGreen : Color::kRed;
}

}  // namespace

void render_jobs(const Console& console, const std::string& sprint_label,
                 const std::vector<domain::ListedJob>& jobs) {
  Table table;
  table.title = "Sprint: " + sprint_label;
  table.headers = {"ID", "Created", "Company", "Title", "Status", "Stages", "Link", "Notes"};
  for (const auto& job : jobs) {
    table.rows.push_back({
        std::to_string(job.id),
        job.created,
        job.company_name,
        job.title.value_or(kNotAvailable),
        job.status.value_or(kNotAvailable),
        job.stages_count.has_value() ? std::to_string(job.stages_count.value()) : "",
        job.link.value_or(kNotAvailable),
        job.notes.value_or(kNotAvailable),
    });
    table.row_colors.push_back(job_status_color(job.status.value_or("")));
  }
  render_table(console, table);
}

void render_sprints(const Console& console, const std::vector<domain::Sprint>& sprints,
                    const std::string& current_sprint_name) {
  Table table;
  table.title = "Sprints";
  table.headers = {"", "ID", "Name", "Start Date", "End Date", "Jobs"};
  for (const auto& sprint : sprints) {
    const bool current = sprint.name == current_sprint_name;
    table.rows.push_back({
        current ? "*" : "",
        std::to_string(sprint.id),
        sprint.name,
        sprint.start_date,
        sprint.end_date.value_or(""),
        std::to_string(sprint.num_jobs),
    });
    table.row_colors.push_back(current ? Color::kGreen : Color::kDefault);
  }
  render_table(console, table);
}

void render_insights(const Console& console, const std::string& title,
                     const std::string& label_header,
                     const std::vector<domain::CountAndPercentage>& rows) {
  Table table;
  table.title = title;
  table.headers = {label_header, "Count", "Sprint %", "Overall %"};
  for (const auto& row : rows) {
    table.rows.push_back(
        {row.label, std::to_string(row.count), row.sprint_percentage, row.overall_percentage});
    table.row_colors.push_back(job_status_color(row.label));
  }
  render_table(console, table);
}

void render_stage_tree(const Console& console, const domain::ListedJob& job,
                       const std::vector<domain::InterviewStage>& stages,
                       std::optional<std::int64_t> highlight_id, Highlight highlight) {
  console.out << "\n"
              << paint(console, job.company_name, Color::kWhite, true) << " - "
              << paint(console, job.title.value_or(kNotAvailable), Color::kBrightCyan, true)
              << "\n";

  for (std::size_t i = 0; i < stages.size(); ++i) {
    const auto& stage = stages[i];
    const bool last_stage = i + 1 == stages.size();
    const bool highlighted = highlight_id.has_value() && highlight_id.value() == stage.id;
    const Color accent = highlight_color(highlight);

    const std::string label = domain::stage_label(stage);
    console.out << (last_stage ? "└── " : "├── ")
                << paint(console, label, highlighted ? accent : Color::kWhite, true) << "\n";

    const std::string indent = last_stage ? "    " : "│   ";
    const bool has_notes = stage.notes.has_value() && !stage.notes->empty();

    const std::string_view status = domain::to_string(stage.status);
    const std::string status_text =
        highlighted ? paint(console, status, accent, true)
                    : paint(console, status, stage_status_color(stage.status), true);
    const std::string date_text =
        highlighted ? paint(console, stage.scheduled_date, accent) : stage.scheduled_date;
    console.out << indent << (has_notes ? "├── " : "└── ") << "[" << status_text << "] "
                << date_text << "\n";

    if (has_notes) {
      console.out << indent << "└── "
                  << (highlighted ? paint(console, stage.notes.value(), accent)
                                  : stage.notes.value())
                  << "\n";
    }
  }
  console.out << "\n";
}

std::string job_choice_label(const domain::ListedJob& job) {
  return "ID: " + std::to_string(job.id) + " | Company: " + job.company_name +
         " | Title: " + job.title.value_or("") + " | Status: " + job.status.value_or("");
}

std::string stage_choice_label(const domain::InterviewStage& stage) {
  return domain::stage_label(stage) + " [" + std::string{domain::to_string(stage.status)} + "] " +
         stage.scheduled_date;
}

std::string sprint_choice_label(const domain::Sprint& sprint) {
  return sprint.name + " (Start Date: " + sprint.start_date +
         ", End Date: " + sprint.end_date.value_or("N/A") + ")";
}

}  // namespace fetters::cli
