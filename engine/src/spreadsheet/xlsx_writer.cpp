#include "spreadsheet/xlsx_writer.h"

#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include "spreadsheet/xml_doc.h"
#include "spreadsheet/zip_archive.h"

namespace scriptbox {

namespace {

constexpr const char* kXmlDecl = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
constexpr const char* kMainNs = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
constexpr const char* kRelNs =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships";

class SharedStrings {
 public:
  int Index(const std::string& s) {
    auto it = index_.find(s);
    if (it != index_.end()) return it->second;
    int idx = static_cast<int>(strings_.size());
    index_.emplace(s, idx);
    strings_.push_back(s);
    return idx;
  }

  int total() const { return total_; }
  void Count() { total_++; }

  std::string ToXml() const {
    std::string xml = kXmlDecl;
    xml += fmt::format("<sst xmlns=\"{}\" count=\"{}\" uniqueCount=\"{}\">", kMainNs, total_,
                       strings_.size());
    for (const auto& s : strings_) {
      xml += "<si><t xml:space=\"preserve\">" + XmlEscape(s) + "</t></si>";
    }
    xml += "</sst>";
    return xml;
  }

 private:
  std::unordered_map<std::string, int> index_;
  std::vector<std::string> strings_;
  int total_ = 0;
};

// Distinct cell styles; index 0 is the default format
class StyleTable {
 public:
  StyleTable() { styles_.push_back(CellStyle{}); }

  int Index(const CellStyle& style) {
    if (style.IsDefault()) return 0;
    for (size_t i = 1; i < styles_.size(); i++) {
      if (styles_[i] == style) return static_cast<int>(i);
    }
    styles_.push_back(style);
    return static_cast<int>(styles_.size() - 1);
  }

  std::string ToXml() const {
    // Fonts: 0 = default, one per style beyond that
    std::string fonts;
    std::string fills = "<fill><patternFill patternType=\"none\"/></fill>"
                        "<fill><patternFill patternType=\"gray125\"/></fill>";
    std::string xfs = "<xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\" xfId=\"0\"/>";
    int font_count = 1;
    int fill_count = 2;
    fonts += DefaultFont();

    for (size_t i = 1; i < styles_.size(); i++) {
      const CellStyle& style = styles_[i];
      int font_id = 0;
      if (style.bold || !style.font_color.empty()) {
        fonts += "<font>";
        if (style.bold) fonts += "<b/>";
        fonts += "<sz val=\"11\"/>";
        if (!style.font_color.empty()) {
          fonts += fmt::format("<color rgb=\"{}\"/>", XmlEscape(NormalizeColor(style.font_color)));
        }
        fonts += "<name val=\"Calibri\"/><family val=\"2\"/></font>";
        font_id = font_count++;
      }
      int fill_id = 0;
      if (!style.fill_color.empty()) {
        fills += fmt::format(
            "<fill><patternFill patternType=\"solid\"><fgColor rgb=\"{}\"/>"
            "<bgColor indexed=\"64\"/></patternFill></fill>",
            XmlEscape(NormalizeColor(style.fill_color)));
        fill_id = fill_count++;
      }
      xfs += fmt::format(
          "<xf numFmtId=\"0\" fontId=\"{}\" fillId=\"{}\" borderId=\"0\" xfId=\"0\"{}{}/>",
          font_id, fill_id, font_id ? " applyFont=\"1\"" : "",
          fill_id ? " applyFill=\"1\"" : "");
    }

    std::string xml = kXmlDecl;
    xml += fmt::format("<styleSheet xmlns=\"{}\">", kMainNs);
    xml += fmt::format("<fonts count=\"{}\">{}</fonts>", font_count, fonts);
    xml += fmt::format("<fills count=\"{}\">{}</fills>", fill_count, fills);
    xml += "<borders count=\"1\"><border><left/><right/><top/><bottom/><diagonal/></border></borders>";
    xml += "<cellStyleXfs count=\"1\"><xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\"/></cellStyleXfs>";
    xml += fmt::format("<cellXfs count=\"{}\">{}</cellXfs>", styles_.size(), xfs);
    xml += "<cellStyles count=\"1\"><cellStyle name=\"Normal\" xfId=\"0\" builtinId=\"0\"/></cellStyles>";
    xml += "</styleSheet>";
    return xml;
  }

 private:
  static std::string DefaultFont() {
    return "<font><sz val=\"11\"/><name val=\"Calibri\"/><family val=\"2\"/></font>";
  }

  // "#FF0000" / "FF0000" -> "FFFF0000"
  static std::string NormalizeColor(std::string color) {
    if (!color.empty() && color[0] == '#') color.erase(0, 1);
    if (color.size() == 6) color = "FF" + color;
    return color;
  }

  std::vector<CellStyle> styles_;
};

std::string FormatNumber(double value) {
  return fmt::format("{}", value);
}

std::string SheetXml(const Sheet& sheet, SharedStrings& strings, StyleTable& styles) {
  std::string xml = kXmlDecl;
  xml += fmt::format("<worksheet xmlns=\"{}\" xmlns:r=\"{}\">", kMainNs, kRelNs);

  std::vector<SheetColumn> widths;
  for (const auto& col : sheet.columns) {
    if (col.index >= 1 && col.width > 0) widths.push_back(col);
  }
  if (!widths.empty()) {
    xml += "<cols>";
    for (const auto& col : widths) {
      xml += fmt::format("<col min=\"{0}\" max=\"{0}\" width=\"{1}\" customWidth=\"1\"/>",
                         col.index, FormatNumber(col.width));
    }
    xml += "</cols>";
  }

  xml += "<sheetData>";
  for (const auto& row : sheet.rows) {
    xml += fmt::format("<row r=\"{}\">", row.number);
    for (const auto& cell : row.cells) {
      std::string ref = ColumnLetters(cell.column) + std::to_string(row.number);
      int style = styles.Index(cell.style);
      std::string style_attr = style ? fmt::format(" s=\"{}\"", style) : "";

      switch (cell.kind) {
        case CellKind::kEmpty:
          if (style) xml += fmt::format("<c r=\"{}\"{}/>", ref, style_attr);
          break;
        case CellKind::kString:
          strings.Count();
          xml += fmt::format("<c r=\"{}\"{} t=\"s\"><v>{}</v></c>", ref, style_attr,
                             strings.Index(cell.text));
          break;
        case CellKind::kNumber:
          xml += fmt::format("<c r=\"{}\"{}><v>{}</v></c>", ref, style_attr,
                             FormatNumber(cell.number));
          break;
        case CellKind::kBoolean:
          xml += fmt::format("<c r=\"{}\"{} t=\"b\"><v>{}</v></c>", ref, style_attr,
                             cell.boolean ? 1 : 0);
          break;
        case CellKind::kFormula: {
          std::string type_attr;
          std::string cached;
          if (cell.result_kind == CellKind::kNumber) {
            cached = "<v>" + FormatNumber(cell.result_number) + "</v>";
          } else if (cell.result_kind == CellKind::kString) {
            type_attr = " t=\"str\"";
            cached = "<v>" + XmlEscape(cell.result_text) + "</v>";
          } else if (cell.result_kind == CellKind::kBoolean) {
            type_attr = " t=\"b\"";
            cached = cell.result_boolean ? "<v>1</v>" : "<v>0</v>";
          }
          xml += fmt::format("<c r=\"{}\"{}{}><f>{}</f>{}</c>", ref, style_attr, type_attr,
                             XmlEscape(cell.formula), cached);
          break;
        }
      }
    }
    xml += "</row>";
  }
  xml += "</sheetData>";
  xml += "<pageMargins left=\"0.7\" right=\"0.7\" top=\"0.75\" bottom=\"0.75\" header=\"0.3\" footer=\"0.3\"/>";
  xml += "</worksheet>";
  return xml;
}

std::string ContentTypesXml(size_t sheet_count) {
  std::string xml = kXmlDecl;
  xml += "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">";
  xml += "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>";
  xml += "<Default Extension=\"xml\" ContentType=\"application/xml\"/>";
  xml += "<Override PartName=\"/xl/workbook.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml\"/>";
  for (size_t i = 1; i <= sheet_count; i++) {
    xml += fmt::format(
        "<Override PartName=\"/xl/worksheets/sheet{}.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml\"/>",
        i);
  }
  xml += "<Override PartName=\"/xl/styles.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml\"/>";
  xml += "<Override PartName=\"/xl/sharedStrings.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.sharedStrings+xml\"/>";
  xml += "<Override PartName=\"/docProps/core.xml\" ContentType=\"application/vnd.openxmlformats-package.core-properties+xml\"/>";
  xml += "</Types>";
  return xml;
}

std::string RootRelsXml() {
  std::string xml = kXmlDecl;
  xml += "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";
  xml += "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" Target=\"xl/workbook.xml\"/>";
  xml += "<Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties\" Target=\"docProps/core.xml\"/>";
  xml += "</Relationships>";
  return xml;
}

std::string CoreXml(const std::string& creator) {
  std::string xml = kXmlDecl;
  xml += "<cp:coreProperties xmlns:cp=\"http://schemas.openxmlformats.org/package/2006/metadata/core-properties\" "
         "xmlns:dc=\"http://purl.org/dc/elements/1.1/\">";
  xml += "<dc:creator>" + XmlEscape(creator) + "</dc:creator>";
  xml += "</cp:coreProperties>";
  return xml;
}

std::string WorkbookXml(const Workbook& workbook) {
  std::string xml = kXmlDecl;
  xml += fmt::format("<workbook xmlns=\"{}\" xmlns:r=\"{}\"><sheets>", kMainNs, kRelNs);
  for (size_t i = 0; i < workbook.sheets.size(); i++) {
    xml += fmt::format("<sheet name=\"{}\" sheetId=\"{}\" r:id=\"rId{}\"/>",
                       XmlEscape(workbook.sheets[i].name), i + 1, i + 1);
  }
  xml += "</sheets></workbook>";
  return xml;
}

std::string WorkbookRelsXml(size_t sheet_count) {
  std::string xml = kXmlDecl;
  xml += "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";
  for (size_t i = 1; i <= sheet_count; i++) {
    xml += fmt::format(
        "<Relationship Id=\"rId{0}\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" Target=\"worksheets/sheet{0}.xml\"/>",
        i);
  }
  xml += fmt::format(
      "<Relationship Id=\"rId{}\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" Target=\"styles.xml\"/>",
      sheet_count + 1);
  xml += fmt::format(
      "<Relationship Id=\"rId{}\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/sharedStrings\" Target=\"sharedStrings.xml\"/>",
      sheet_count + 2);
  xml += "</Relationships>";
  return xml;
}

}  // namespace

bool WriteXlsx(const Workbook& workbook, std::string* bytes_out, std::string* error_out) {
  if (workbook.sheets.empty()) {
    if (error_out) *error_out = "Workbook must contain at least one worksheet";
    return false;
  }

  SharedStrings strings;
  StyleTable styles;
  std::vector<std::string> sheet_parts;
  for (const auto& sheet : workbook.sheets) {
    sheet_parts.push_back(SheetXml(sheet, strings, styles));
  }

  ZipWriter zip;
  const size_t n = workbook.sheets.size();
  bool ok = zip.AddFile("[Content_Types].xml", ContentTypesXml(n), error_out) &&
            zip.AddFile("_rels/.rels", RootRelsXml(), error_out) &&
            zip.AddFile("docProps/core.xml", CoreXml(workbook.creator), error_out) &&
            zip.AddFile("xl/workbook.xml", WorkbookXml(workbook), error_out) &&
            zip.AddFile("xl/_rels/workbook.xml.rels", WorkbookRelsXml(n), error_out) &&
            zip.AddFile("xl/styles.xml", styles.ToXml(), error_out) &&
            zip.AddFile("xl/sharedStrings.xml", strings.ToXml(), error_out);
  for (size_t i = 0; ok && i < n; i++) {
    ok = zip.AddFile(fmt::format("xl/worksheets/sheet{}.xml", i + 1), sheet_parts[i], error_out);
  }
  if (!ok) {
    return false;
  }

  *bytes_out = zip.Finish();
  return true;
}

}  // namespace scriptbox
