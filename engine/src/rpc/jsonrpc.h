#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "tool/executor_tool.h"

namespace scriptbox {

namespace rpc_error {
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
}  // namespace rpc_error

inline constexpr const char* kServerName = "scriptbox";
inline constexpr const char* kServerVersion = "1.0.0";
inline constexpr const char* kProtocolVersion = "2024-11-05";

/**
 * JsonRpcDispatcher - JSON-RPC 2.0 front for the executor tool.
 *
 * Methods: initialize, tools/list, tools/call. Notifications (requests
 * without an id) are processed but produce no response.
 */
class JsonRpcDispatcher {
 public:
  explicit JsonRpcDispatcher(const ExecutorTool& tool);

  /**
   * Handle one serialized message. Returns the response to send, or
   * nullopt for notifications.
   */
  std::optional<nlohmann::json> HandleLine(const std::string& line) const;

  // Handle one parsed message
  std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message) const;

 private:
  nlohmann::json Dispatch(const std::string& method, const nlohmann::json& params,
                          int* error_code, std::string* error_message) const;

  const ExecutorTool& tool_;
};

nlohmann::json MakeRpcError(const nlohmann::json& id, int code, const std::string& message);
nlohmann::json MakeRpcResult(const nlohmann::json& id, const nlohmann::json& result);

}  // namespace scriptbox
