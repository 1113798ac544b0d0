#pragma once

#include <string>

#include "spreadsheet/workbook.h"
#include "spreadsheet/zip_archive.h"

namespace scriptbox {

/**
 * Parse an .xlsx file into a workbook: sheet names and order, cell values
 * (shared and inline strings, numbers, booleans, formulas with cached
 * results), bold/colour/fill styles and column widths.
 * Returns false and sets error_out on failure. No single archive part may
 * inflate to more than max_part_bytes.
 */
bool ReadXlsx(const std::string& bytes, Workbook* workbook, std::string* error_out = nullptr,
              size_t max_part_bytes = kDefaultMaxZipEntrySize);

}  // namespace scriptbox
