#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "logging/trace.h"
#include "rpc/jsonrpc.h"
#include "rpc/stdio_server.h"
#include "temp_dir.h"

using namespace scriptbox;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using json = nlohmann::json;

namespace {

struct RpcFixture {
  RpcFixture() : config(dir.MakeConfig()), tool(config), dispatcher(tool) {
    Tracer::SetEnabled(false);
  }

  json Call(const json& message) {
    auto response = dispatcher.HandleMessage(message);
    REQUIRE(response.has_value());
    return *response;
  }

  TempDir dir;
  EngineConfig config;
  ExecutorTool tool;
  JsonRpcDispatcher dispatcher;
};

}  // namespace

TEST_CASE("JsonRpcDispatcher initialize", "[rpc]") {
  RpcFixture f;
  json response = f.Call({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                          {"params", {{"protocolVersion", "2024-11-05"}}}});
  REQUIRE(response["jsonrpc"] == "2.0");
  REQUIRE(response["id"] == 1);
  REQUIRE(response["result"]["protocolVersion"] == kProtocolVersion);
  REQUIRE(response["result"]["serverInfo"]["name"] == "scriptbox");
  REQUIRE(response["result"]["capabilities"].contains("tools"));
}

TEST_CASE("JsonRpcDispatcher tools/list", "[rpc]") {
  RpcFixture f;
  json response = f.Call({{"jsonrpc", "2.0"}, {"id", "list-1"}, {"method", "tools/list"}});
  REQUIRE(response["id"] == "list-1");
  const json& tools = response["result"]["tools"];
  REQUIRE(tools.size() == 1);
  REQUIRE(tools[0]["name"] == "run_ts");
  REQUIRE(tools[0]["inputSchema"]["required"] == json::array({"code"}));
}

TEST_CASE("JsonRpcDispatcher tools/call", "[rpc]") {
  RpcFixture f;

  SECTION("successful run") {
    json response = f.Call(
        {{"jsonrpc", "2.0"},
         {"id", 7},
         {"method", "tools/call"},
         {"params",
          {{"name", "run_ts"},
           {"arguments", {{"code", "export async function main() { return 6 * 7; }"}}}}}});
    const json& result = response["result"];
    REQUIRE(result["isError"] == false);
    REQUIRE(result["content"][0]["type"] == "text");
    REQUIRE(json::parse(result["content"][0]["text"].get<std::string>())["result"] == 42);
  }

  SECTION("tool-level error stays a JSON-RPC result") {
    json response = f.Call({{"jsonrpc", "2.0"},
                            {"id", 8},
                            {"method", "tools/call"},
                            {"params", {{"name", "run_ts"}, {"arguments", json::object()}}}});
    REQUIRE_FALSE(response.contains("error"));
    REQUIRE(response["result"]["isError"] == true);
    REQUIRE(response["result"]["content"][0]["text"] == "Missing \"code\" string.");
  }

  SECTION("malformed params") {
    json response = f.Call({{"jsonrpc", "2.0"},
                            {"id", 9},
                            {"method", "tools/call"},
                            {"params", {{"arguments", json::object()}}}});
    REQUIRE(response["error"]["code"] == rpc_error::kInvalidParams);
    REQUIRE(response["id"] == 9);
  }
}

TEST_CASE("JsonRpcDispatcher protocol errors", "[rpc]") {
  RpcFixture f;

  SECTION("unknown method") {
    json response = f.Call({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "resources/list"}});
    REQUIRE(response["error"]["code"] == rpc_error::kMethodNotFound);
    REQUIRE(response["error"]["message"] == "Method not found: resources/list");
  }

  SECTION("unparseable line") {
    auto response = f.dispatcher.HandleLine("{not json");
    REQUIRE(response.has_value());
    REQUIRE((*response)["error"]["code"] == rpc_error::kParseError);
    REQUIRE((*response)["id"].is_null());
  }

  SECTION("non-object message") {
    json response = f.Call(json::array({1, 2}));
    REQUIRE(response["error"]["code"] == rpc_error::kInvalidRequest);
  }

  SECTION("missing method") {
    json response = f.Call({{"jsonrpc", "2.0"}, {"id", 3}});
    REQUIRE(response["error"]["code"] == rpc_error::kInvalidRequest);
    REQUIRE(response["id"] == 3);
  }

  SECTION("bad id") {
    json response = f.Call({{"jsonrpc", "2.0"}, {"id", {{"nested", true}}}, {"method", "ping"}});
    REQUIRE(response["error"]["code"] == rpc_error::kInvalidRequest);
  }
}

TEST_CASE("JsonRpcDispatcher notifications produce no response", "[rpc]") {
  RpcFixture f;
  REQUIRE_FALSE(f.dispatcher
                    .HandleMessage({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}})
                    .has_value());
  REQUIRE_FALSE(
      f.dispatcher.HandleMessage({{"jsonrpc", "2.0"}, {"method", "no/such/method"}}).has_value());
}

TEST_CASE("StdioServer serves line-delimited messages", "[rpc]") {
  RpcFixture f;
  std::istringstream in(
      "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\r\n"
      "\n"
      "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
      "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\n"
      "garbage\n");
  std::ostringstream out;
  StdioServer server(f.dispatcher, in, out);
  REQUIRE(server.Serve() == 4);

  std::vector<json> responses;
  std::istringstream lines(out.str());
  std::string line;
  while (std::getline(lines, line)) {
    responses.push_back(json::parse(line));
  }
  REQUIRE(responses.size() == 3);
  REQUIRE(responses[0]["id"] == 1);
  REQUIRE(responses[0]["result"]["serverInfo"]["version"] == kServerVersion);
  REQUIRE(responses[1]["id"] == 2);
  REQUIRE(responses[1]["result"] == json::object());
  REQUIRE(responses[2]["error"]["code"] == rpc_error::kParseError);
}

TEST_CASE("StdioServer answers lines with invalid UTF-8", "[rpc]") {
  RpcFixture f;
  std::istringstream in(
      "{\"id\":1, \xff}\n"
      "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\",\"params\":{\"x\":\"\xff\xfe\"}}\n"
      "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"ping\"}\n");
  std::ostringstream out;
  StdioServer server(f.dispatcher, in, out);
  REQUIRE(server.Serve() == 3);

  std::vector<json> responses;
  std::istringstream lines(out.str());
  std::string line;
  while (std::getline(lines, line)) {
    responses.push_back(json::parse(line));
  }
  REQUIRE(responses.size() == 3);
  REQUIRE(responses[0]["error"]["code"] == rpc_error::kParseError);
  REQUIRE(responses[1]["error"]["code"] == rpc_error::kParseError);
  REQUIRE(responses[2]["id"] == 3);
  REQUIRE(responses[2]["result"] == json::object());
}
