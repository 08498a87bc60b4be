#pragma once

#include "fetters/domain/job.h"
#include "fetters/exporting/xlsx_writer.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fetters::exporting {

inline constexpr std::array<std::string_view, 6> kExportHeaders = {
    "Timestamp", "Company Name", "Title", "Status", "Link", "Notes",
};

// ARGB fill for the header row and for rows whose status has no color of its own.
inline constexpr std::string_view kDefaultFill = "FF999999";

using ExportRow = std::array<std::string, 6>;

// (created, company, title | "N/A", status | "N/A", link | "", notes | ""),
// one row per job, order preserved.
[[nodiscard]] ExportRow project_export_row(const domain::ListedJob& job);
[[nodiscard]] std::vector<ExportRow> project_export(const std::vector<domain::ListedJob>& jobs);

// ARGB background for a job status; kDefaultFill for unknown or absent statuses.
[[nodiscard]] std::string_view status_fill(const std::optional<std::string>& status);

// "Sprint: <sprint>" or "Sprint: unknown".
[[nodiscard]] std::string export_sheet_name(const std::optional<std::string>& sprint);

// The requested name with ".xlsx" appended when missing, or
// "<today>-fetters-export-sprint-<sprint|unknown>.xlsx".
[[nodiscard]] std::string export_filename(const std::optional<std::string>& requested,
                                          const std::string& today,
                                          const std::optional<std::string>& sprint);

// Header row on kDefaultFill, then one row per job filled with its status color.
[[nodiscard]] XlsxSheet build_export_sheet(const std::optional<std::string>& sprint,
                                           const std::vector<domain::ListedJob>& jobs);

}  // namespace fetters::exporting
