#pragma once

#include <catch2/catch_test_macros.hpp>
#include <pugixml.hpp>
#include <zip.h>

#include <filesystem>
#include <string>
#include <vector>

namespace fetters::testing {

// Reads one member of a zip archive; empty when the member is absent.
inline std::string read_member(const std::filesystem::path& path, const std::string& member) {
  int error = 0;
  zip_t* archive = zip_open(path.string().c_str(), ZIP_RDONLY, &error);
  REQUIRE(archive != nullptr);

  std::string content;
  zip_stat_t stat;
  zip_stat_init(&stat);
  if (zip_stat(archive, member.c_str(), 0, &stat) == 0) {
    zip_file_t* file = zip_fopen(archive, member.c_str(), 0);
    REQUIRE(file != nullptr);
    content.resize(static_cast<std::size_t>(stat.size));
    const zip_int64_t read = zip_fread(file, content.data(), stat.size);
    zip_fclose(file);
    REQUIRE(read == static_cast<zip_int64_t>(stat.size));
  }
  zip_close(archive);
  return content;
}

// The inline-string cell texts of the first worksheet, row by row.
inline std::vector<std::vector<std::string>> read_sheet_rows(const std::filesystem::path& path) {
  pugi::xml_document worksheet;
  REQUIRE(worksheet.load_string(read_member(path, "xl/worksheets/sheet1.xml").c_str()));

  std::vector<std::vector<std::string>> rows;
  for (pugi::xml_node row : worksheet.child("worksheet").child("sheetData").children("row")) {
    std::vector<std::string> cells;
    for (pugi::xml_node cell : row.children("c")) {
      cells.emplace_back(cell.child("is").child("t").text().get());
    }
    rows.push_back(std::move(cells));
  }
  return rows;
}

}  // namespace fetters::testing
