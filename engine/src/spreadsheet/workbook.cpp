#include "spreadsheet/workbook.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace scriptbox {

namespace {

CellStyle ParseStyle(const nlohmann::json& j) {
  CellStyle style;
  if (!j.is_object()) return style;
  if (j.contains("bold") && j["bold"].is_boolean()) {
    style.bold = j["bold"].get<bool>();
  }
  if (j.contains("color") && j["color"].is_string()) {
    style.font_color = j["color"].get<std::string>();
  }
  if (j.contains("fill") && j["fill"].is_string()) {
    style.fill_color = j["fill"].get<std::string>();
  }
  return style;
}

nlohmann::json StyleToJson(const CellStyle& style) {
  nlohmann::json j = nlohmann::json::object();
  if (style.bold) j["bold"] = true;
  if (!style.font_color.empty()) j["color"] = style.font_color;
  if (!style.fill_color.empty()) j["fill"] = style.fill_color;
  return j;
}

Cell ParseCell(const nlohmann::json& j) {
  Cell cell;
  cell.column = j.at("col").get<int>();
  if (cell.column < 1) {
    throw std::invalid_argument("cell column must be >= 1");
  }
  std::string type = j.value("type", "empty");
  if (type == "string") {
    cell.kind = CellKind::kString;
    cell.text = j.at("value").get<std::string>();
  } else if (type == "number") {
    cell.kind = CellKind::kNumber;
    cell.number = j.at("value").get<double>();
  } else if (type == "boolean") {
    cell.kind = CellKind::kBoolean;
    cell.boolean = j.at("value").get<bool>();
  } else if (type == "formula") {
    cell.kind = CellKind::kFormula;
    cell.formula = j.at("formula").get<std::string>();
    if (!cell.formula.empty() && cell.formula[0] == '=') cell.formula.erase(0, 1);
    if (j.contains("result")) {
      const auto& result = j["result"];
      if (result.is_number()) {
        cell.result_kind = CellKind::kNumber;
        cell.result_number = result.get<double>();
      } else if (result.is_string()) {
        cell.result_kind = CellKind::kString;
        cell.result_text = result.get<std::string>();
      } else if (result.is_boolean()) {
        cell.result_kind = CellKind::kBoolean;
        cell.result_boolean = result.get<bool>();
      }
    }
  } else if (type != "empty" && type != "null") {
    throw std::invalid_argument("unknown cell type: " + type);
  }
  if (j.contains("style")) {
    cell.style = ParseStyle(j["style"]);
  }
  return cell;
}

nlohmann::json CellToJson(const Cell& cell) {
  nlohmann::json j;
  j["col"] = cell.column;
  switch (cell.kind) {
    case CellKind::kEmpty:
      j["type"] = "empty";
      break;
    case CellKind::kString:
      j["type"] = "string";
      j["value"] = cell.text;
      break;
    case CellKind::kNumber:
      j["type"] = "number";
      j["value"] = cell.number;
      break;
    case CellKind::kBoolean:
      j["type"] = "boolean";
      j["value"] = cell.boolean;
      break;
    case CellKind::kFormula:
      j["type"] = "formula";
      j["formula"] = cell.formula;
      if (cell.result_kind == CellKind::kNumber) {
        j["result"] = cell.result_number;
      } else if (cell.result_kind == CellKind::kString) {
        j["result"] = cell.result_text;
      } else if (cell.result_kind == CellKind::kBoolean) {
        j["result"] = cell.result_boolean;
      }
      break;
  }
  if (!cell.style.IsDefault()) {
    j["style"] = StyleToJson(cell.style);
  }
  return j;
}

}  // namespace

bool Workbook::FromJson(const nlohmann::json& j, Workbook* out, std::string* error_out) {
  try {
    Workbook wb;
    if (!j.is_object()) {
      throw std::invalid_argument("workbook must be an object");
    }
    if (j.contains("creator") && j["creator"].is_string()) {
      wb.creator = j["creator"].get<std::string>();
    }
    if (j.contains("sheets")) {
      for (const auto& sj : j.at("sheets")) {
        Sheet sheet;
        sheet.name = sj.at("name").get<std::string>();
        if (sj.contains("columns")) {
          for (const auto& cj : sj["columns"]) {
            SheetColumn col;
            col.index = cj.at("index").get<int>();
            col.width = cj.value("width", 0.0);
            sheet.columns.push_back(col);
          }
        }
        if (sj.contains("rows")) {
          for (const auto& rj : sj["rows"]) {
            SheetRow row;
            row.number = rj.at("number").get<int>();
            if (row.number < 1) {
              throw std::invalid_argument("row number must be >= 1");
            }
            if (rj.contains("cells")) {
              for (const auto& cj : rj["cells"]) {
                row.cells.push_back(ParseCell(cj));
              }
            }
            std::sort(row.cells.begin(), row.cells.end(),
                      [](const Cell& a, const Cell& b) { return a.column < b.column; });
            sheet.rows.push_back(std::move(row));
          }
        }
        std::sort(sheet.rows.begin(), sheet.rows.end(),
                  [](const SheetRow& a, const SheetRow& b) { return a.number < b.number; });
        wb.sheets.push_back(std::move(sheet));
      }
    }
    *out = std::move(wb);
    return true;
  } catch (const std::exception& e) {
    if (error_out) *error_out = std::string("Invalid workbook: ") + e.what();
    return false;
  }
}

nlohmann::json Workbook::ToJson() const {
  nlohmann::json j;
  j["creator"] = creator;
  j["sheets"] = nlohmann::json::array();
  for (const auto& sheet : sheets) {
    nlohmann::json sj;
    sj["name"] = sheet.name;
    sj["columns"] = nlohmann::json::array();
    for (const auto& col : sheet.columns) {
      sj["columns"].push_back({{"index", col.index}, {"width", col.width}});
    }
    sj["rows"] = nlohmann::json::array();
    for (const auto& row : sheet.rows) {
      nlohmann::json rj;
      rj["number"] = row.number;
      rj["cells"] = nlohmann::json::array();
      for (const auto& cell : row.cells) {
        rj["cells"].push_back(CellToJson(cell));
      }
      sj["rows"].push_back(rj);
    }
    j["sheets"].push_back(sj);
  }
  return j;
}

std::string ColumnLetters(int column) {
  std::string letters;
  while (column > 0) {
    int rem = (column - 1) % 26;
    letters.insert(letters.begin(), static_cast<char>('A' + rem));
    column = (column - 1) / 26;
  }
  return letters;
}

bool ParseCellRef(const std::string& ref, int* column, int* row) {
  size_t i = 0;
  int col = 0;
  while (i < ref.size() && std::isalpha(static_cast<unsigned char>(ref[i]))) {
    col = col * 26 + (std::toupper(static_cast<unsigned char>(ref[i])) - 'A' + 1);
    i++;
  }
  if (i == 0 || i == ref.size()) return false;
  int r = 0;
  for (; i < ref.size(); i++) {
    if (!std::isdigit(static_cast<unsigned char>(ref[i]))) return false;
    r = r * 10 + (ref[i] - '0');
  }
  if (r < 1) return false;
  if (column) *column = col;
  if (row) *row = r;
  return true;
}

}  // namespace scriptbox
