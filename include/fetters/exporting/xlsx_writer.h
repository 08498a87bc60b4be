#pragma once

#include "fetters/core/error.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fetters::exporting {

// One text cell. fill is an ARGB background such as "FF999999"; empty for none.
struct XlsxCell {
  std::string text;
  std::string fill;
};

// A single worksheet. rows[0] is spreadsheet row 1.
struct XlsxSheet {
  std::string name;
  std::vector<std::vector<XlsxCell>> rows;
};

inline constexpr std::size_t kMaxSheetNameLength = 31;

// Worksheet names are 1..31 characters and may not contain \ / ? * [ ]
// nor start or end with an apostrophe. Violations are kSheetName errors.
[[nodiscard]] core::FettersResult<bool> validate_sheet_name(std::string_view name);

// "A".."Z", "AA".. for a zero-based column index.
[[nodiscard]] std::string column_letters(std::size_t column);

// Write a one-sheet workbook (Office Open XML) to path, replacing any existing
// file. Cells are inline strings; each distinct fill gets its own solid pattern
// fill in the stylesheet. Failures are kSheetName or kXlsx errors.
[[nodiscard]] core::FettersResult<bool> write_xlsx(const std::filesystem::path& path,
                                                   const XlsxSheet& sheet);

}  // namespace fetters::exporting
