#include "spreadsheet/xml_doc.h"

#include <cctype>
#include <cstdlib>

namespace scriptbox {

namespace {

// OOXML parts nest a handful of levels; anything deeper is hostile input
constexpr int kMaxXmlDepth = 256;

std::string LocalName(const std::string& qname) {
  size_t colon = qname.find(':');
  return colon == std::string::npos ? qname : qname.substr(colon + 1);
}

void AppendUtf8(std::string& out, unsigned long cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

std::string Unescape(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  size_t i = 0;
  while (i < raw.size()) {
    if (raw[i] != '&') {
      out += raw[i++];
      continue;
    }
    size_t semi = raw.find(';', i);
    if (semi == std::string::npos) {
      out += raw[i++];
      continue;
    }
    std::string entity = raw.substr(i + 1, semi - i - 1);
    if (entity == "lt") {
      out += '<';
    } else if (entity == "gt") {
      out += '>';
    } else if (entity == "amp") {
      out += '&';
    } else if (entity == "quot") {
      out += '"';
    } else if (entity == "apos") {
      out += '\'';
    } else if (!entity.empty() && entity[0] == '#') {
      unsigned long cp = (entity.size() > 1 && (entity[1] == 'x' || entity[1] == 'X'))
                             ? std::strtoul(entity.c_str() + 2, nullptr, 16)
                             : std::strtoul(entity.c_str() + 1, nullptr, 10);
      AppendUtf8(out, cp);
    } else {
      out += raw.substr(i, semi - i + 1);
    }
    i = semi + 1;
  }
  return out;
}

class Parser {
 public:
  explicit Parser(const std::string& text) : s_(text) {}

  bool ParseDocument(XmlNode* root, std::string* error_out) {
    SkipMisc();
    if (pos_ >= s_.size() || s_[pos_] != '<') {
      return Error("Expected root element", error_out);
    }
    return ParseElement(root, 1, error_out);
  }

 private:
  bool Error(const std::string& message, std::string* error_out) {
    if (error_out) *error_out = "XML parse error at offset " + std::to_string(pos_) + ": " + message;
    return false;
  }

  bool StartsWith(const char* token) const { return s_.compare(pos_, std::char_traits<char>::length(token), token) == 0; }

  void SkipSpace() {
    while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) pos_++;
  }

  // Skip whitespace, declarations, comments and doctype between elements
  void SkipMisc() {
    while (true) {
      SkipSpace();
      if (StartsWith("<?")) {
        size_t end = s_.find("?>", pos_);
        pos_ = end == std::string::npos ? s_.size() : end + 2;
      } else if (StartsWith("<!--")) {
        size_t end = s_.find("-->", pos_);
        pos_ = end == std::string::npos ? s_.size() : end + 3;
      } else if (StartsWith("<!DOCTYPE")) {
        size_t end = s_.find('>', pos_);
        pos_ = end == std::string::npos ? s_.size() : end + 1;
      } else {
        return;
      }
    }
  }

  std::string ReadName() {
    size_t start = pos_;
    while (pos_ < s_.size()) {
      char c = s_[pos_];
      if (std::isspace(static_cast<unsigned char>(c)) || c == '>' || c == '/' || c == '=') break;
      pos_++;
    }
    return s_.substr(start, pos_ - start);
  }

  bool ParseElement(XmlNode* node, int depth, std::string* error_out) {
    if (depth > kMaxXmlDepth) return Error("XML nesting too deep", error_out);
    pos_++;  // '<'
    std::string qname = ReadName();
    if (qname.empty()) return Error("Empty element name", error_out);
    node->name = LocalName(qname);

    // Attributes
    while (true) {
      SkipSpace();
      if (pos_ >= s_.size()) return Error("Unterminated start tag", error_out);
      if (s_[pos_] == '/') {
        if (pos_ + 1 >= s_.size() || s_[pos_ + 1] != '>') {
          return Error("Malformed empty element", error_out);
        }
        pos_ += 2;
        return true;
      }
      if (s_[pos_] == '>') {
        pos_++;
        break;
      }
      std::string attr = ReadName();
      SkipSpace();
      if (attr.empty() || pos_ >= s_.size() || s_[pos_] != '=') {
        return Error("Malformed attribute", error_out);
      }
      pos_++;
      SkipSpace();
      if (pos_ >= s_.size() || (s_[pos_] != '"' && s_[pos_] != '\'')) {
        return Error("Unquoted attribute value", error_out);
      }
      char quote = s_[pos_++];
      size_t end = s_.find(quote, pos_);
      if (end == std::string::npos) return Error("Unterminated attribute value", error_out);
      node->attrs[LocalName(attr)] = Unescape(s_.substr(pos_, end - pos_));
      pos_ = end + 1;
    }

    // Content
    while (pos_ < s_.size()) {
      if (StartsWith("</")) {
        pos_ += 2;
        std::string closing = ReadName();
        SkipSpace();
        if (pos_ >= s_.size() || s_[pos_] != '>') return Error("Malformed end tag", error_out);
        pos_++;
        if (LocalName(closing) != node->name) {
          return Error("Mismatched end tag </" + closing + ">", error_out);
        }
        return true;
      }
      if (StartsWith("<![CDATA[")) {
        size_t end = s_.find("]]>", pos_);
        if (end == std::string::npos) return Error("Unterminated CDATA", error_out);
        node->text += s_.substr(pos_ + 9, end - pos_ - 9);
        pos_ = end + 3;
        continue;
      }
      if (StartsWith("<!--") || StartsWith("<?")) {
        SkipMisc();
        continue;
      }
      if (s_[pos_] == '<') {
        node->children.emplace_back();
        if (!ParseElement(&node->children.back(), depth + 1, error_out)) return false;
        continue;
      }
      size_t end = s_.find('<', pos_);
      if (end == std::string::npos) end = s_.size();
      node->text += Unescape(s_.substr(pos_, end - pos_));
      pos_ = end;
    }
    return Error("Unterminated element <" + node->name + ">", error_out);
  }

  const std::string& s_;
  size_t pos_ = 0;
};

}  // namespace

std::string XmlEscape(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '&':
        out += "&amp;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&apos;";
        break;
      default:
        // Control characters other than tab/newline/CR are not valid XML 1.0
        if (static_cast<unsigned char>(c) < 0x20 && c != '\t' && c != '\n' && c != '\r') {
          break;
        }
        out += c;
    }
  }
  return out;
}

std::string XmlNode::Attr(const std::string& key, const std::string& fallback) const {
  auto it = attrs.find(key);
  return it != attrs.end() ? it->second : fallback;
}

const XmlNode* XmlNode::Child(const std::string& child_name) const {
  for (const auto& child : children) {
    if (child.name == child_name) return &child;
  }
  return nullptr;
}

std::vector<const XmlNode*> XmlNode::ChildrenNamed(const std::string& child_name) const {
  std::vector<const XmlNode*> result;
  for (const auto& child : children) {
    if (child.name == child_name) result.push_back(&child);
  }
  return result;
}

bool ParseXml(const std::string& text, XmlNode* root, std::string* error_out) {
  Parser parser(text);
  return parser.ParseDocument(root, error_out);
}

}  // namespace scriptbox
