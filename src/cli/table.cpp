#include "fetters/cli/table.h"

#include <algorithm>

namespace fetters::cli {

namespace {

std::string separator_line(const std::vector<std::size_t>& widths) {
  std::string line = "+";
  for (const auto width : widths) {
    line.append(width + 2, '-');
    line += '+';
  }
  return line;
}

std::string padded(std::string_view text, std::size_t width) {
  std::string cell{text};
  const std::size_t current = display_width(text);
  if (current < width) {
    cell.append(width - current, ' ');
  }
  return cell;
}

}  // namespace

std::size_t display_width(std::string_view text) {
  std::size_t width = 0;
  for (const char c : text) {
    // Count every byte that does not continue a multi-byte sequence.
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      ++width;
    }
  }
  return width;
}

void render_table(const Console& console, const Table& table) {
  std::vector<std::size_t> widths;
  widths.reserve(table.headers.size());
  for (const auto& header : table.headers) {
    widths.push_back(display_width(header));
  }
  for (const auto& row : table.rows) {
    for (std::size_t col = 0; col < row.size() && col < widths.size(); ++col) {
      widths[col] = std::max(widths[col], display_width(row[col]));
    }
  }

  const std::string border = separator_line(widths);

  if (!table.title.empty()) {
    console.out << paint(console, table.title, Color::kCyan, true) << "\n";
  }
  console.out << border << "\n|";
  for (std::size_t col = 0; col < widths.size(); ++col) {
    console.out << " " << paint(console, padded(table.headers[col], widths[col]), Color::kDefault, true)
                << " |";
  }
  console.out << "\n" << border << "\n";

  for (std::size_t row_index = 0; row_index < table.rows.size(); ++row_index) {
    const auto& row = table.rows[row_index];
    const Color color =
        row_index < table.row_colors.size() ? table.row_colors[row_index] : Color::kDefault;

    console.out << "|";
    for (std::size_t col = 0; col < widths.size(); ++col) {
      const std::string_view value = col < row.size() ? std::string_view{row[col]} : "";
      console.out << " " << paint(console, padded(value, widths[col]), color) << " |";
    }
    console.out << "\n";
  }
  if (!table.rows.empty()) {
    console.out << border << "\n";
  }
}

}  // namespace fetters::cli
