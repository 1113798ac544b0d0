#include "spreadsheet/xlsx_reader.h"

#include <cstdlib>
#include <map>
#include <vector>

#include "spreadsheet/xml_doc.h"
#include "spreadsheet/zip_archive.h"

namespace scriptbox {

namespace {

bool ReadPart(const ZipReader& zip, const std::string& name, XmlNode* root,
              std::string* error_out) {
  std::string data;
  if (!zip.Read(name, &data, error_out)) return false;
  return ParseXml(data, root, error_out);
}

// Text of a <si> or <is> element: plain <t> or concatenated rich-text runs
std::string RichText(const XmlNode& node) {
  std::string text;
  for (const auto& child : node.children) {
    if (child.name == "t") {
      text += child.text;
    } else if (child.name == "r") {
      const XmlNode* t = child.Child("t");
      if (t) text += t->text;
    }
  }
  return text;
}

std::vector<std::string> ReadSharedStrings(const ZipReader& zip, std::string* error_out,
                                           bool* ok) {
  std::vector<std::string> strings;
  *ok = true;
  if (!zip.Contains("xl/sharedStrings.xml")) return strings;
  XmlNode root;
  if (!ReadPart(zip, "xl/sharedStrings.xml", &root, error_out)) {
    *ok = false;
    return strings;
  }
  for (const XmlNode* si : root.ChildrenNamed("si")) {
    strings.push_back(RichText(*si));
  }
  return strings;
}

std::string ColorOf(const XmlNode* color) {
  return color ? color->Attr("rgb") : std::string();
}

// Styles indexed by cellXfs position
std::vector<CellStyle> ReadStyles(const ZipReader& zip, std::string* error_out, bool* ok) {
  std::vector<CellStyle> styles;
  *ok = true;
  if (!zip.Contains("xl/styles.xml")) return styles;
  XmlNode root;
  if (!ReadPart(zip, "xl/styles.xml", &root, error_out)) {
    *ok = false;
    return styles;
  }

  std::vector<CellStyle> fonts;
  if (const XmlNode* fonts_node = root.Child("fonts")) {
    for (const XmlNode* font : fonts_node->ChildrenNamed("font")) {
      CellStyle style;
      style.bold = font->Child("b") != nullptr;
      style.font_color = ColorOf(font->Child("color"));
      fonts.push_back(style);
    }
  }
  std::vector<std::string> fills;
  if (const XmlNode* fills_node = root.Child("fills")) {
    for (const XmlNode* fill : fills_node->ChildrenNamed("fill")) {
      const XmlNode* pattern = fill->Child("patternFill");
      std::string color;
      if (pattern && pattern->Attr("patternType") == "solid") {
        color = ColorOf(pattern->Child("fgColor"));
      }
      fills.push_back(color);
    }
  }
  if (const XmlNode* xfs = root.Child("cellXfs")) {
    for (const XmlNode* xf : xfs->ChildrenNamed("xf")) {
      CellStyle style;
      size_t font_id = std::strtoul(xf->Attr("fontId", "0").c_str(), nullptr, 10);
      size_t fill_id = std::strtoul(xf->Attr("fillId", "0").c_str(), nullptr, 10);
      if (font_id < fonts.size()) {
        style.bold = fonts[font_id].bold;
        style.font_color = fonts[font_id].font_color;
      }
      if (fill_id < fills.size()) {
        style.fill_color = fills[fill_id];
      }
      styles.push_back(style);
    }
  }
  return styles;
}

// Zip entry name of a relationship target relative to xl/
std::string PartPath(const std::string& target) {
  if (!target.empty() && target[0] == '/') return target.substr(1);
  return "xl/" + target;
}

bool ReadCell(const XmlNode& c, const std::vector<std::string>& shared,
              const std::vector<CellStyle>& styles, int row_number, int next_column,
              Cell* cell) {
  int column = next_column;
  int row = row_number;
  std::string ref = c.Attr("r");
  if (!ref.empty() && !ParseCellRef(ref, &column, &row)) {
    return false;
  }
  cell->column = column;

  size_t style_id = std::strtoul(c.Attr("s", "0").c_str(), nullptr, 10);
  if (style_id < styles.size()) {
    cell->style = styles[style_id];
  }

  std::string type = c.Attr("t", "n");
  const XmlNode* v = c.Child("v");
  const XmlNode* f = c.Child("f");
  std::string raw = v ? v->text : std::string();

  CellKind value_kind = CellKind::kEmpty;
  std::string text;
  double number = 0;
  bool boolean = false;

  if (type == "s") {
    size_t idx = std::strtoul(raw.c_str(), nullptr, 10);
    if (v && idx < shared.size()) {
      value_kind = CellKind::kString;
      text = shared[idx];
    }
  } else if (type == "inlineStr") {
    const XmlNode* is = c.Child("is");
    if (is) {
      value_kind = CellKind::kString;
      text = RichText(*is);
    }
  } else if (type == "str" || type == "e") {
    if (v) {
      value_kind = CellKind::kString;
      text = raw;
    }
  } else if (type == "b") {
    if (v) {
      value_kind = CellKind::kBoolean;
      boolean = raw == "1" || raw == "true";
    }
  } else if (v && !raw.empty()) {
    value_kind = CellKind::kNumber;
    number = std::strtod(raw.c_str(), nullptr);
  }

  if (f && !f->text.empty()) {
    cell->kind = CellKind::kFormula;
    cell->formula = f->text;
    cell->result_kind = value_kind;
    cell->result_text = text;
    cell->result_number = number;
    cell->result_boolean = boolean;
  } else {
    cell->kind = value_kind;
    cell->text = text;
    cell->number = number;
    cell->boolean = boolean;
  }
  return true;
}

bool ReadSheet(const XmlNode& root, const std::vector<std::string>& shared,
               const std::vector<CellStyle>& styles, Sheet* sheet, std::string* error_out) {
  if (const XmlNode* cols = root.Child("cols")) {
    for (const XmlNode* col : cols->ChildrenNamed("col")) {
      int min = std::atoi(col->Attr("min", "0").c_str());
      int max = std::atoi(col->Attr("max", "0").c_str());
      double width = std::strtod(col->Attr("width", "0").c_str(), nullptr);
      // Guard against whole-sheet ranges (max=16384)
      if (min < 1 || max < min || max - min > 1024) continue;
      for (int i = min; i <= max; i++) {
        sheet->columns.push_back(SheetColumn{i, width});
      }
    }
  }

  const XmlNode* data = root.Child("sheetData");
  if (!data) return true;

  int next_row = 1;
  for (const XmlNode* row_node : data->ChildrenNamed("row")) {
    SheetRow row;
    row.number = std::atoi(row_node->Attr("r", std::to_string(next_row)).c_str());
    if (row.number < 1) row.number = next_row;
    next_row = row.number + 1;

    int next_column = 1;
    for (const XmlNode* c : row_node->ChildrenNamed("c")) {
      Cell cell;
      if (!ReadCell(*c, shared, styles, row.number, next_column, &cell)) {
        if (error_out) *error_out = "Invalid cell reference: " + c->Attr("r");
        return false;
      }
      next_column = cell.column + 1;
      if (cell.kind != CellKind::kEmpty || !cell.style.IsDefault()) {
        row.cells.push_back(cell);
      }
    }
    sheet->rows.push_back(std::move(row));
  }
  return true;
}

}  // namespace

bool ReadXlsx(const std::string& bytes, Workbook* workbook, std::string* error_out,
              size_t max_part_bytes) {
  ZipReader zip;
  zip.SetMaxEntrySize(max_part_bytes);
  if (!zip.Open(bytes, error_out)) {
    return false;
  }

  XmlNode wb_root;
  if (!ReadPart(zip, "xl/workbook.xml", &wb_root, error_out)) {
    return false;
  }

  std::map<std::string, std::string> targets;
  if (zip.Contains("xl/_rels/workbook.xml.rels")) {
    XmlNode rels;
    if (!ReadPart(zip, "xl/_rels/workbook.xml.rels", &rels, error_out)) {
      return false;
    }
    for (const XmlNode* rel : rels.ChildrenNamed("Relationship")) {
      targets[rel->Attr("Id")] = PartPath(rel->Attr("Target"));
    }
  }

  bool ok = true;
  std::vector<std::string> shared = ReadSharedStrings(zip, error_out, &ok);
  if (!ok) return false;
  std::vector<CellStyle> styles = ReadStyles(zip, error_out, &ok);
  if (!ok) return false;

  Workbook result;
  if (zip.Contains("docProps/core.xml")) {
    XmlNode core;
    if (ReadPart(zip, "docProps/core.xml", &core, nullptr)) {
      if (const XmlNode* creator = core.Child("creator")) {
        result.creator = creator->text;
      }
    }
  }

  const XmlNode* sheets = wb_root.Child("sheets");
  if (!sheets) {
    if (error_out) *error_out = "Workbook has no sheets";
    return false;
  }
  int position = 1;
  for (const XmlNode* sheet_node : sheets->ChildrenNamed("sheet")) {
    Sheet sheet;
    sheet.name = sheet_node->Attr("name");

    std::string part;
    auto it = targets.find(sheet_node->Attr("id"));
    part = it != targets.end() ? it->second
                               : "xl/worksheets/sheet" + std::to_string(position) + ".xml";
    position++;

    XmlNode sheet_root;
    if (!ReadPart(zip, part, &sheet_root, error_out)) {
      return false;
    }
    if (!ReadSheet(sheet_root, shared, styles, &sheet, error_out)) {
      return false;
    }
    result.sheets.push_back(std::move(sheet));
  }

  *workbook = std::move(result);
  return true;
}

}  // namespace scriptbox
