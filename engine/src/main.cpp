#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "config/engine_config.h"
#include "logging/trace.h"
#include "rpc/jsonrpc.h"
#include "rpc/stdio_server.h"
#include "tool/executor_tool.h"

using namespace scriptbox;

void PrintUsage(const char* prog) {
  fmt::print("Usage: {} [--config <config.json>] [--quiet] (--list-tools | --call <request.json|-> | --stdio)\n",
             prog);
}

bool ReadRequestText(const std::string& path, std::string* text, std::string* error) {
  if (path == "-") {
    text->assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream file(path);
  if (!file) {
    *error = "Failed to open file: " + path;
    return false;
  }
  text->assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  return true;
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string config_path;
  std::string call_path;
  bool list_tools = false;
  bool stdio = false;
  bool quiet = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--call" && i + 1 < argc) {
      call_path = argv[++i];
    } else if (arg == "--list-tools") {
      list_tools = true;
    } else if (arg == "--stdio") {
      stdio = true;
    } else if (arg == "--quiet") {
      quiet = true;
    } else {
      fmt::print(stderr, "Unknown option: {}\n", arg);
      PrintUsage(argv[0]);
      return 1;
    }
  }

  int modes = (list_tools ? 1 : 0) + (stdio ? 1 : 0) + (call_path.empty() ? 0 : 1);
  if (modes != 1) {
    fmt::print(stderr, "Error: exactly one of --list-tools, --call, --stdio is required\n");
    PrintUsage(argv[0]);
    return 1;
  }

  // Set tracing based on quiet flag
  Tracer::SetEnabled(!quiet);

  EngineConfig config;
  if (!config_path.empty()) {
    std::string error;
    if (!config.LoadFromFile(config_path, &error)) {
      fmt::print(stderr, "Error loading config: {}\n", error);
      return 1;
    }
  }

  ExecutorTool tool(config);

  if (list_tools) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& desc : tool.ListTools()) {
      tools.push_back(desc.ToJson());
    }
    fmt::print("{}\n", nlohmann::json{{"tools", tools}}.dump(2));
    return 0;
  }

  if (stdio) {
    JsonRpcDispatcher dispatcher(tool);
    StdioServer server(dispatcher, std::cin, std::cout);
    server.Serve();
    return 0;
  }

  // One-shot call
  std::string text;
  std::string error;
  if (!ReadRequestText(call_path, &text, &error)) {
    fmt::print(stderr, "Error reading request: {}\n", error);
    return 1;
  }
  nlohmann::json request_json;
  try {
    request_json = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    fmt::print(stderr, "Error parsing request: {}\n", e.what());
    return 1;
  }
  ToolCallRequest request;
  if (!ToolCallRequest::FromJson(request_json, request, &error)) {
    fmt::print(stderr, "Error in request: {}\n", error);
    return 1;
  }

  ToolCallResult result = tool.HandleToolCall(request);
  fmt::print("{}\n", result.ToJson().dump(2, ' ', false,
                                           nlohmann::json::error_handler_t::replace));
  return result.is_error ? 2 : 0;
}
