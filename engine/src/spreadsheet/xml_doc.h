#pragma once

#include <map>
#include <string>
#include <vector>

namespace scriptbox {

// Escape text for XML element content and attribute values
std::string XmlEscape(const std::string& text);

/**
 * Element of a parsed XML document. Namespace prefixes are dropped from
 * element and attribute names ("x:row" -> "row", "r:id" -> "id").
 */
struct XmlNode {
  std::string name;
  std::map<std::string, std::string> attrs;
  std::vector<XmlNode> children;
  std::string text;  // Concatenated character data of this element

  // Attribute value, or fallback when absent
  std::string Attr(const std::string& key, const std::string& fallback = "") const;

  // First child with the given name, or nullptr
  const XmlNode* Child(const std::string& child_name) const;

  // All direct children with the given name
  std::vector<const XmlNode*> ChildrenNamed(const std::string& child_name) const;
};

/**
 * Parse an XML document into its root element. Supports the subset used
 * by OOXML parts: declarations, comments, CDATA, character and predefined
 * entity references. Returns false and sets error_out on malformed input.
 */
bool ParseXml(const std::string& text, XmlNode* root, std::string* error_out = nullptr);

}  // namespace scriptbox
