#include "tool/tool_types.h"

namespace scriptbox {

bool ToolCallRequest::FromJson(const nlohmann::json& j, ToolCallRequest& out,
                               std::string* error_out) {
  if (!j.is_object()) {
    if (error_out) *error_out = "Tool call must be a JSON object";
    return false;
  }
  if (!j.contains("name") || !j["name"].is_string()) {
    if (error_out) *error_out = "Tool call requires a string 'name'";
    return false;
  }

  out.name = j["name"].get<std::string>();
  out.arguments = nlohmann::json::object();

  if (j.contains("arguments") && !j["arguments"].is_null()) {
    if (!j["arguments"].is_object()) {
      if (error_out) *error_out = "Tool call 'arguments' must be an object";
      return false;
    }
    out.arguments = j["arguments"];
  }
  return true;
}

ToolCallResult ToolCallResult::Text(std::string text, bool is_error) {
  ToolCallResult result;
  ToolContent block;
  block.text = std::move(text);
  result.content.push_back(std::move(block));
  result.is_error = is_error;
  return result;
}

const std::string& ToolCallResult::FirstText() const {
  static const std::string kEmpty;
  return content.empty() ? kEmpty : content.front().text;
}

nlohmann::json ToolCallResult::ToJson() const {
  nlohmann::json blocks = nlohmann::json::array();
  for (const auto& block : content) {
    blocks.push_back({{"type", block.type}, {"text", block.text}});
  }
  return {{"content", blocks}, {"isError", is_error}};
}

nlohmann::json ToolDescriptor::ToJson() const {
  return {{"name", name}, {"description", description}, {"inputSchema", input_schema}};
}

bool RunTsArgs::FromJson(const nlohmann::json& arguments, RunTsArgs& out,
                         std::string* error_out) {
  if (!arguments.is_object()) {
    if (error_out) *error_out = "arguments must be an object";
    return false;
  }

  if (arguments.contains("code") && arguments["code"].is_string()) {
    out.code = arguments["code"].get<std::string>();
  }

  if (arguments.contains("libraries") && !arguments["libraries"].is_null()) {
    const auto& libs = arguments["libraries"];
    if (!libs.is_array()) {
      if (error_out) *error_out = "'libraries' must be an array of strings";
      return false;
    }
    for (const auto& lib : libs) {
      if (!lib.is_string()) {
        if (error_out) *error_out = "'libraries' must be an array of strings";
        return false;
      }
      out.libraries.push_back(lib.get<std::string>());
    }
  }

  if (arguments.contains("allowNet") && !arguments["allowNet"].is_null()) {
    if (!arguments["allowNet"].is_boolean()) {
      if (error_out) *error_out = "'allowNet' must be a boolean";
      return false;
    }
    out.allow_net = arguments["allowNet"].get<bool>();
  }

  // JSON numbers from JS callers arrive as doubles as often as integers
  if (arguments.contains("timeoutMs") && !arguments["timeoutMs"].is_null()) {
    if (!arguments["timeoutMs"].is_number()) {
      if (error_out) *error_out = "'timeoutMs' must be a number";
      return false;
    }
    out.timeout_ms = static_cast<long long>(arguments["timeoutMs"].get<double>());
  }

  if (arguments.contains("memoryMb") && !arguments["memoryMb"].is_null()) {
    if (!arguments["memoryMb"].is_number()) {
      if (error_out) *error_out = "'memoryMb' must be a number";
      return false;
    }
    out.memory_mb = static_cast<long long>(arguments["memoryMb"].get<double>());
  }

  if (arguments.contains("filePathMap") && !arguments["filePathMap"].is_null()) {
    const auto& map = arguments["filePathMap"];
    if (!map.is_object()) {
      if (error_out) *error_out = "'filePathMap' must be an object of strings";
      return false;
    }
    for (auto it = map.begin(); it != map.end(); ++it) {
      if (!it.value().is_string()) {
        if (error_out) *error_out = "'filePathMap' entry '" + it.key() + "' must be a string";
        return false;
      }
      out.file_path_map[it.key()] = it.value().get<std::string>();
    }
  }

  if (arguments.contains("inputs") && !arguments["inputs"].is_null()) {
    if (!arguments["inputs"].is_object()) {
      if (error_out) *error_out = "'inputs' must be an object";
      return false;
    }
    out.inputs = arguments["inputs"];
  }

  return true;
}

}  // namespace scriptbox
