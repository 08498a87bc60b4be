#include "fetters/exporting/projection.h"

#include <utility>

namespace fetters::exporting {

namespace {

constexpr const char* kUnknownSprint = "unknown";
constexpr std::string_view kXlsxExtension = ".xlsx";

constexpr std::array<std::pair<std::string_view, std::string_view>, 7> kStatusFills = {{
    {"GHOSTED", "FF999999"},
    {"HIRED", "FF00A36C"},
    {"IN PROGRESS", "FFFFFF00"},
    {"NOT HIRING ANYMORE", "FFC9C9C9"},
    {"OFFER RECEIVED", "FFFF00FF"},
    {"PENDING", "FF0096FF"},
    {"REJECTED", "FFEE4B2B"},
}};

}  // namespace

ExportRow project_export_row(const domain::ListedJob& job) {
  return ExportRow{
      job.created,
      job.company_name,
      job.title.value_or("N/A"),
      job.status.value_or("N/A"),
      job.link.value_or(""),
      job.notes.value_or(""),
  };
}

std::vector<ExportRow> project_export(const std::vector<domain::ListedJob>& jobs) {
  std::vector<ExportRow> rows;
  rows.reserve(jobs.size());
  for (const auto& job : jobs) {
    rows.push_back(project_export_row(job));
  }
  return rows;
}

std::string_view status_fill(const std::optional<std::string>& status) {
  if (!status.has_value()) {
    return kDefaultFill;
  }
  for (const auto& [name, fill] : kStatusFills) {
    if (name == status.value()) {
      return fill;
    }
  }
  return kDefaultFill;
}

std::string export_sheet_name(const std::optional<std::string>& sprint) {
  return "Sprint: " + sprint.value_or(kUnknownSprint);
}

std::string export_filename(const std::optional<std::string>& requested, const std::string& today,
                            const std::optional<std::string>& sprint) {
  if (requested.has_value()) {
    if (requested->ends_with(kXlsxExtension)) {
      return requested.value();
    }
    return requested.value() + std::string{kXlsxExtension};
  }
  return today + "-fetters-export-sprint-" + sprint.value_or(kUnknownSprint) +
         std::string{kXlsxExtension};
}

XlsxSheet build_export_sheet(const std::optional<std::string>& sprint,
                             const std::vector<domain::ListedJob>& jobs) {
  XlsxSheet sheet;
  sheet.name = export_sheet_name(sprint);

  std::vector<XlsxCell> header;
  for (const auto& title : kExportHeaders) {
    header.push_back(XlsxCell{std::string{title}, std::string{kDefaultFill}});
  }
  sheet.rows.push_back(std::move(header));

  for (const auto& job : jobs) {
    const std::string fill{status_fill(job.status)};
    std::vector<XlsxCell> row;
    for (auto& value : project_export_row(job)) {
      row.push_back(XlsxCell{std::move(value), fill});
    }
    sheet.rows.push_back(std::move(row));
  }
  return sheet;
}

}  // namespace fetters::exporting
