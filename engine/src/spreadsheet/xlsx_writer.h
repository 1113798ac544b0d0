#pragma once

#include <string>

#include "spreadsheet/workbook.h"

namespace scriptbox {

/**
 * Serialize a workbook as an Office Open XML spreadsheet (.xlsx).
 *
 * Strings go to the shared string table; bold, font colour and solid fill
 * become entries of styles.xml; column widths become <cols>.
 * Returns false and sets error_out on failure.
 */
bool WriteXlsx(const Workbook& workbook, std::string* bytes_out,
               std::string* error_out = nullptr);

}  // namespace scriptbox
