#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace scriptbox {

/**
 * A tool invocation: operation name plus free-form arguments.
 */
struct ToolCallRequest {
  std::string name;
  nlohmann::json arguments = nlohmann::json::object();

  /**
   * Parse from a {name, arguments} JSON object.
   * Returns false and sets error_out when the envelope itself is malformed.
   */
  static bool FromJson(const nlohmann::json& j, ToolCallRequest& out,
                       std::string* error_out = nullptr);
};

/**
 * A single content block of a tool result. Only text blocks are produced.
 */
struct ToolContent {
  std::string type = "text";
  std::string text;
};

/**
 * The envelope returned for every tool call.
 */
struct ToolCallResult {
  std::vector<ToolContent> content;
  bool is_error = false;

  static ToolCallResult Text(std::string text, bool is_error);

  // First text block, or empty
  const std::string& FirstText() const;

  nlohmann::json ToJson() const;
};

/**
 * Tool metadata advertised to callers.
 */
struct ToolDescriptor {
  std::string name;
  std::string description;
  nlohmann::json input_schema;

  nlohmann::json ToJson() const;
};

/**
 * Typed view of the run_ts arguments.
 */
struct RunTsArgs {
  std::string code;
  std::vector<std::string> libraries;
  bool allow_net = false;
  std::optional<long long> timeout_ms;
  std::optional<long long> memory_mb;
  std::map<std::string, std::string> file_path_map;
  nlohmann::json inputs = nlohmann::json::object();

  /**
   * Extract typed arguments. `code` is taken verbatim when it is a string;
   * presence and contract checks belong to the static validator.
   * Returns false and sets error_out when an optional argument has the
   * wrong type.
   */
  static bool FromJson(const nlohmann::json& arguments, RunTsArgs& out,
                       std::string* error_out = nullptr);
};

}  // namespace scriptbox
