#include "rpc/jsonrpc.h"

namespace scriptbox {

using json = nlohmann::json;

json MakeRpcError(const json& id, int code, const std::string& message) {
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

json MakeRpcResult(const json& id, const json& result) {
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

JsonRpcDispatcher::JsonRpcDispatcher(const ExecutorTool& tool) : tool_(tool) {}

std::optional<json> JsonRpcDispatcher::HandleLine(const std::string& line) const {
  json message;
  try {
    message = json::parse(line);
  } catch (const json::parse_error& e) {
    return MakeRpcError(nullptr, rpc_error::kParseError, std::string("Parse error: ") + e.what());
  }
  return HandleMessage(message);
}

std::optional<json> JsonRpcDispatcher::HandleMessage(const json& message) const {
  if (!message.is_object()) {
    return MakeRpcError(nullptr, rpc_error::kInvalidRequest, "Invalid Request");
  }

  const bool is_notification = !message.contains("id");
  json id = is_notification ? json(nullptr) : message["id"];
  if (!id.is_null() && !id.is_string() && !id.is_number_integer()) {
    return MakeRpcError(nullptr, rpc_error::kInvalidRequest, "Invalid Request: bad id");
  }
  if (!message.contains("method") || !message["method"].is_string()) {
    if (is_notification) return std::nullopt;
    return MakeRpcError(id, rpc_error::kInvalidRequest, "Invalid Request: missing method");
  }

  json params = message.value("params", json::object());
  int error_code = 0;
  std::string error_message;
  json result = Dispatch(message["method"].get<std::string>(), params, &error_code,
                         &error_message);

  if (is_notification) {
    return std::nullopt;
  }
  if (error_code != 0) {
    return MakeRpcError(id, error_code, error_message);
  }
  return MakeRpcResult(id, result);
}

json JsonRpcDispatcher::Dispatch(const std::string& method, const json& params,
                                 int* error_code, std::string* error_message) const {
  if (method == "initialize") {
    return json{
        {"protocolVersion", kProtocolVersion},
        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}},
        {"capabilities", {{"tools", json::object()}}},
    };
  }
  if (method == "notifications/initialized" || method == "ping") {
    return json::object();
  }
  if (method == "tools/list") {
    json tools = json::array();
    for (const auto& desc : tool_.ListTools()) {
      tools.push_back(desc.ToJson());
    }
    return json{{"tools", tools}};
  }
  if (method == "tools/call") {
    ToolCallRequest request;
    std::string error;
    if (!ToolCallRequest::FromJson(params, request, &error)) {
      *error_code = rpc_error::kInvalidParams;
      *error_message = error;
      return nullptr;
    }
    return tool_.HandleToolCall(request).ToJson();
  }

  *error_code = rpc_error::kMethodNotFound;
  *error_message = "Method not found: " + method;
  return nullptr;
}

}  // namespace scriptbox
