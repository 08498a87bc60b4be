#pragma once

#include "fetters/cli/console.h"

#include <string>
#include <vector>

namespace fetters::cli {

// Table is a titled grid of text cells. row_colors, when not empty, holds one
// color per row applied to every cell of that row.
struct Table {
  std::string title;
  std::vector<std::string> headers;
  std::vector<std::vector<std::string>> rows;
  std::vector<Color> row_colors;
};

// Display width of a UTF-8 string, counted in code points.
[[nodiscard]] std::size_t display_width(std::string_view text);

// Draw the table with ASCII borders:
//
//   Sprint: 2025-01-15
//   +----+---------+
//   | ID | Company |
//   +----+---------+
//   | 1  | Google  |
//   +----+---------+
//
// Rows shorter than the header are padded with empty cells.
void render_table(const Console& console, const Table& table);

}  // namespace fetters::cli
