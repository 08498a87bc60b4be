#include "fetters/exporting/xlsx_writer.h"

#include <pugixml.hpp>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <zip.h>

namespace fetters::exporting {

namespace {

constexpr const char* kSpreadsheetNs =
    "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
constexpr const char* kRelationshipsNs =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* kPackageRelationshipsNs =
    "http://schemas.openxmlformats.org/package/2006/relationships";
constexpr const char* kContentTypesNs =
    "http://schemas.openxmlformats.org/package/2006/content-types";

// Fills 0 and 1 are reserved by the format (none, gray125).
constexpr std::size_t kFirstCustomFill = 2;

struct Part {
  std::string name;
  std::string data;
};

core::Error xlsx_error(const std::string& message) {
  return core::make_error(core::ErrorKind::kXlsx, message);
}

pugi::xml_node start_document(pugi::xml_document& doc, const char* root_name) {
  pugi::xml_node declaration = doc.append_child(pugi::node_declaration);
  declaration.append_attribute("version") = "1.0";
  declaration.append_attribute("encoding") = "UTF-8";
  declaration.append_attribute("standalone") = "yes";
  return doc.append_child(root_name);
}

std::string serialize(const pugi::xml_document& doc) {
  std::ostringstream out;
  doc.save(out, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
  return out.str();
}

void add_relationship(pugi::xml_node relationships, const char* id, const char* type,
                      const char* target) {
  pugi::xml_node rel = relationships.append_child("Relationship");
  rel.append_attribute("Id") = id;
  rel.append_attribute("Type") = type;
  rel.append_attribute("Target") = target;
}

std::string content_types_part() {
  pugi::xml_document doc;
  pugi::xml_node types = start_document(doc, "Types");
  types.append_attribute("xmlns") = kContentTypesNs;

  pugi::xml_node rels = types.append_child("Default");
  rels.append_attribute("Extension") = "rels";
  rels.append_attribute("ContentType") = "application/vnd.openxmlformats-package.relationships+xml";
  pugi::xml_node xml = types.append_child("Default");
  xml.append_attribute("Extension") = "xml";
  xml.append_attribute("ContentType") = "application/xml";

  const std::pair<const char*, const char*> overrides[] = {
      {"/xl/workbook.xml",
       "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml"},
      {"/xl/worksheets/sheet1.xml",
       "application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml"},
      {"/xl/styles.xml", "application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml"},
  };
  for (const auto& [part_name, content_type] : overrides) {
    pugi::xml_node node = types.append_child("Override");
    node.append_attribute("PartName") = part_name;
    node.append_attribute("ContentType") = content_type;
  }
  return serialize(doc);
}

std::string package_relationships_part() {
  pugi::xml_document doc;
  pugi::xml_node relationships = start_document(doc, "Relationships");
  relationships.append_attribute("xmlns") = kPackageRelationshipsNs;
  add_relationship(relationships, "rId1",
                   "http://schemas.openxmlformats.org/officeDocument/2006/relationships/"
                   "officeDocument",
                   "xl/workbook.xml");
  return serialize(doc);
}

std::string workbook_part(const std::string& sheet_name) {
  pugi::xml_document doc;
  pugi::xml_node workbook = start_document(doc, "workbook");
  workbook.append_attribute("xmlns") = kSpreadsheetNs;
  workbook.append_attribute("xmlns:r") = kRelationshipsNs;

  pugi::xml_node sheet = workbook.append_child("sheets").append_child("sheet");
  sheet.append_attribute("name") = sheet_name.c_str();
  sheet.append_attribute("sheetId") = 1;
  sheet.append_attribute("r:id") = "rId1";
  return serialize(doc);
}

std::string workbook_relationships_part() {
  pugi::xml_document doc;
  pugi::xml_node relationships = start_document(doc, "Relationships");
  relationships.append_attribute("xmlns") = kPackageRelationshipsNs;
  add_relationship(relationships, "rId1",
                   "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet",
                   "worksheets/sheet1.xml");
  add_relationship(relationships, "rId2",
                   "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles",
                   "styles.xml");
  return serialize(doc);
}

// Distinct fills in order of first use; a cell with fill fills[k] uses style k + 1.
std::vector<std::string> collect_fills(const XlsxSheet& sheet) {
  std::vector<std::string> fills;
  for (const auto& row : sheet.rows) {
    for (const auto& cell : row) {
      if (cell.fill.empty()) {
        continue;
      }
      bool seen = false;
      for (const auto& fill : fills) {
        if (fill == cell.fill) {
          seen = true;
          break;
        }
      }
      if (!seen) {
        fills.push_back(cell.fill);
      }
    }
  }
  return fills;
}

std::size_t style_index(const std::vector<std::string>& fills, const std::string& fill) {
  if (fill.empty()) {
    return 0;
  }
  for (std::size_t i = 0; i < fills.size(); ++i) {
    if (fills[i] == fill) {
      return i + 1;
    }
  }
  return 0;
}

std::string styles_part(const std::vector<std::string>& fills) {
  pugi::xml_document doc;
  pugi::xml_node style_sheet = start_document(doc, "styleSheet");
  style_sheet.append_attribute("xmlns") = kSpreadsheetNs;

  pugi::xml_node fonts = style_sheet.append_child("fonts");
  fonts.append_attribute("count") = 1;
  pugi::xml_node font = fonts.append_child("font");
  font.append_child("sz").append_attribute("val") = 11;
  font.append_child("name").append_attribute("val") = "Calibri";

  pugi::xml_node fill_list = style_sheet.append_child("fills");
  fill_list.append_attribute("count") = static_cast<unsigned int>(fills.size() + kFirstCustomFill);
  fill_list.append_child("fill").append_child("patternFill").append_attribute("patternType") =
      "none";
  fill_list.append_child("fill").append_child("patternFill").append_attribute("patternType") =
      "gray125";
  for (const auto& argb : fills) {
    pugi::xml_node pattern = fill_list.append_child("fill").append_child("patternFill");
    pattern.append_attribute("patternType") = "solid";
    pattern.append_child("fgColor").append_attribute("rgb") = argb.c_str();
    pattern.append_child("bgColor").append_attribute("indexed") = 64;
  }

  pugi::xml_node borders = style_sheet.append_child("borders");
  borders.append_attribute("count") = 1;
  pugi::xml_node border = borders.append_child("border");
  for (const char* side : {"left", "right", "top", "bottom", "diagonal"}) {
    border.append_child(side);
  }

  pugi::xml_node style_xfs = style_sheet.append_child("cellStyleXfs");
  style_xfs.append_attribute("count") = 1;
  pugi::xml_node base_xf = style_xfs.append_child("xf");
  base_xf.append_attribute("numFmtId") = 0;
  base_xf.append_attribute("fontId") = 0;
  base_xf.append_attribute("fillId") = 0;
  base_xf.append_attribute("borderId") = 0;

  pugi::xml_node cell_xfs = style_sheet.append_child("cellXfs");
  cell_xfs.append_attribute("count") = static_cast<unsigned int>(fills.size() + 1);
  for (std::size_t i = 0; i <= fills.size(); ++i) {
    pugi::xml_node xf = cell_xfs.append_child("xf");
    xf.append_attribute("numFmtId") = 0;
    xf.append_attribute("fontId") = 0;
    xf.append_attribute("fillId") = static_cast<unsigned int>(i == 0 ? 0 : i - 1 + kFirstCustomFill);
    xf.append_attribute("borderId") = 0;
    xf.append_attribute("xfId") = 0;
    if (i > 0) {
      xf.append_attribute("applyFill") = 1;
    }
  }

  pugi::xml_node cell_styles = style_sheet.append_child("cellStyles");
  cell_styles.append_attribute("count") = 1;
  pugi::xml_node normal = cell_styles.append_child("cellStyle");
  normal.append_attribute("name") = "Normal";
  normal.append_attribute("xfId") = 0;
  normal.append_attribute("builtinId") = 0;

  return serialize(doc);
}

std::string worksheet_part(const XlsxSheet& sheet, const std::vector<std::string>& fills) {
  pugi::xml_document doc;
  pugi::xml_node worksheet = start_document(doc, "worksheet");
  worksheet.append_attribute("xmlns") = kSpreadsheetNs;
  worksheet.append_attribute("xmlns:r") = kRelationshipsNs;

  pugi::xml_node sheet_data = worksheet.append_child("sheetData");
  for (std::size_t row_index = 0; row_index < sheet.rows.size(); ++row_index) {
    const std::string row_number = std::to_string(row_index + 1);
    pugi::xml_node row = sheet_data.append_child("row");
    row.append_attribute("r") = row_number.c_str();

    const auto& cells = sheet.rows[row_index];
    for (std::size_t col = 0; col < cells.size(); ++col) {
      const std::string reference = column_letters(col) + row_number;
      pugi::xml_node cell = row.append_child("c");
      cell.append_attribute("r") = reference.c_str();
      const std::size_t style = style_index(fills, cells[col].fill);
      if (style != 0) {
        cell.append_attribute("s") = static_cast<unsigned int>(style);
      }
      cell.append_attribute("t") = "inlineStr";

      pugi::xml_node text = cell.append_child("is").append_child("t");
      text.append_attribute("xml:space") = "preserve";
      text.text().set(cells[col].text.c_str());
    }
  }
  return serialize(doc);
}

std::string zip_error_message(int code) {
  zip_error_t error;
  zip_error_init_with_code(&error, code);
  std::string message = zip_error_strerror(&error);
  zip_error_fini(&error);
  return message;
}

}  // namespace

core::FettersResult<bool> validate_sheet_name(std::string_view name) {
  using ResultType = core::FettersResult<bool>;

  std::size_t length = 0;
  for (const char c : name) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      ++length;
    }
  }
  if (length == 0) {
    return ResultType::err(
        core::make_error(core::ErrorKind::kSheetName, "sheet name must not be empty"));
  }
  if (length > kMaxSheetNameLength) {
    return ResultType::err(core::make_error(
        core::ErrorKind::kSheetName, "sheet name '" + std::string{name} + "' exceeds " +
                                         std::to_string(kMaxSheetNameLength) + " characters"));
  }
  for (const char c : name) {
    if (c == '\\' || c == '/' || c == '?' || c == '*' || c == '[' || c == ']') {
      return ResultType::err(core::make_error(
          core::ErrorKind::kSheetName,
          "sheet name '" + std::string{name} + "' contains invalid character '" + c + "'"));
    }
  }
  if (name.front() == '\'' || name.back() == '\'') {
    return ResultType::err(core::make_error(
        core::ErrorKind::kSheetName,
        "sheet name '" + std::string{name} + "' must not start or end with an apostrophe"));
  }
  return ResultType::ok(true);
}

std::string column_letters(std::size_t column) {
  std::string letters;
  std::size_t n = column + 1;
  while (n > 0) {
    const std::size_t remainder = (n - 1) % 26;
    letters.insert(letters.begin(), static_cast<char>('A' + remainder));
    n = (n - 1) / 26;
  }
  return letters;
}

core::FettersResult<bool> write_xlsx(const std::filesystem::path& path, const XlsxSheet& sheet) {
  using ResultType = core::FettersResult<bool>;

  auto name_check = validate_sheet_name(sheet.name);
  if (!name_check.has_value()) {
    return name_check;
  }

  // Every part is rendered before the archive is opened: libzip reads the
  // buffers only at zip_close(), so they must stay untouched until then.
  const std::vector<std::string> fills = collect_fills(sheet);
  const std::vector<Part> parts = {
      {"[Content_Types].xml", content_types_part()},
      {"_rels/.rels", package_relationships_part()},
      {"xl/workbook.xml", workbook_part(sheet.name)},
      {"xl/_rels/workbook.xml.rels", workbook_relationships_part()},
      {"xl/styles.xml", styles_part(fills)},
      {"xl/worksheets/sheet1.xml", worksheet_part(sheet, fills)},
  };

  int open_error = 0;
  zip_t* archive = zip_open(path.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &open_error);
  if (archive == nullptr) {
    return ResultType::err(
        xlsx_error("cannot create " + path.string() + ": " + zip_error_message(open_error)));
  }

  for (const auto& part : parts) {
    zip_source_t* source = zip_source_buffer(archive, part.data.data(), part.data.size(), 0);
    if (source == nullptr) {
      const std::string message = zip_strerror(archive);
      zip_discard(archive);
      return ResultType::err(xlsx_error("cannot buffer " + part.name + ": " + message));
    }
    if (zip_file_add(archive, part.name.c_str(), source, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) <
        0) {
      const std::string message = zip_strerror(archive);
      zip_source_free(source);
      zip_discard(archive);
      return ResultType::err(xlsx_error("cannot add " + part.name + ": " + message));
    }
  }

  if (zip_close(archive) != 0) {
    const std::string message = zip_strerror(archive);
    zip_discard(archive);
    return ResultType::err(xlsx_error("cannot write " + path.string() + ": " + message));
  }

  return ResultType::ok(true);
}

}  // namespace fetters::exporting
