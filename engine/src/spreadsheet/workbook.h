#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace scriptbox {

enum class CellKind { kEmpty, kString, kNumber, kBoolean, kFormula };

/**
 * Cell formatting persisted to XLSX. Colours are ARGB hex ("FFFF0000").
 */
struct CellStyle {
  bool bold = false;
  std::string font_color;
  std::string fill_color;

  bool IsDefault() const { return !bold && font_color.empty() && fill_color.empty(); }
  bool operator==(const CellStyle& other) const {
    return bold == other.bold && font_color == other.font_color &&
           fill_color == other.fill_color;
  }
};

struct Cell {
  int column = 0;  // 1-based
  CellKind kind = CellKind::kEmpty;
  std::string text;      // kString
  double number = 0;     // kNumber
  bool boolean = false;  // kBoolean

  // kFormula: expression without the leading '=' plus its cached result
  std::string formula;
  CellKind result_kind = CellKind::kEmpty;
  std::string result_text;
  double result_number = 0;
  bool result_boolean = false;

  CellStyle style;
};

struct SheetRow {
  int number = 0;  // 1-based
  std::vector<Cell> cells;
};

struct SheetColumn {
  int index = 0;  // 1-based
  double width = 0;
};

struct Sheet {
  std::string name;
  std::vector<SheetColumn> columns;
  std::vector<SheetRow> rows;
};

/**
 * In-memory workbook exchanged between the `exceljs` facade and the XLSX
 * codec.
 *
 * JSON form (as produced by the facade):
 * {
 *   "creator": "...",
 *   "sheets": [{
 *     "name": "Sheet1",
 *     "columns": [{"index": 1, "width": 20}],
 *     "rows": [{"number": 1, "cells": [
 *       {"col": 1, "type": "string", "value": "x",
 *        "style": {"bold": true, "color": "FFFF0000", "fill": "FFFFFF00"}},
 *       {"col": 2, "type": "formula", "formula": "A1*2", "result": 4}
 *     ]}]
 *   }]
 * }
 */
struct Workbook {
  std::string creator;
  std::vector<Sheet> sheets;

  static bool FromJson(const nlohmann::json& j, Workbook* out, std::string* error_out = nullptr);
  nlohmann::json ToJson() const;
};

// "A" for 1, "Z" for 26, "AA" for 27
std::string ColumnLetters(int column);

/**
 * Parse "B12" into column 2, row 12. Returns false when malformed.
 */
bool ParseCellRef(const std::string& ref, int* column, int* row);

}  // namespace scriptbox
