#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <thread>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "logging/trace.h"
#include "tool/executor_tool.h"
#include "temp_dir.h"

using namespace scriptbox;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;
using Catch::Matchers::Matches;
using Catch::Matchers::StartsWith;
using json = nlohmann::json;

namespace {

// Every URL is missing
class NotFoundFetcher : public ModuleFetcher {
 public:
  FetchResponse Get(const std::string& url, long timeout_ms,
                    const std::function<bool()>& should_abort) override {
    FetchResponse resp;
    resp.status_code = 404;
    resp.body = "Not Found";
    resp.effective_url = url;
    return resp;
  }
};

ToolCallRequest RunTs(const std::string& code, json extra = json::object()) {
  ToolCallRequest request;
  request.name = "run_ts";
  request.arguments = std::move(extra);
  request.arguments["code"] = code;
  return request;
}

struct ToolFixture {
  ToolFixture() : config(dir.MakeConfig()), tool(config, &fetcher) {
    config.module_cache = false;
    Tracer::SetEnabled(false);
  }

  TempDir dir;
  EngineConfig config;
  NotFoundFetcher fetcher;
  ExecutorTool tool;
};

}  // namespace

TEST_CASE("ExecutorTool advertises run_ts", "[tool]") {
  ToolFixture f;
  auto tools = f.tool.ListTools();
  REQUIRE(tools.size() == 1);
  REQUIRE(tools[0].name == "run_ts");
  REQUIRE_THAT(tools[0].description, ContainsSubstring("ExcelJS"));
  REQUIRE_THAT(tools[0].description, ContainsSubstring(f.dir.Sub("out")));

  const json& schema = tools[0].input_schema;
  REQUIRE(schema["type"] == "object");
  REQUIRE(schema["required"] == json::array({"code"}));
  for (const char* key :
       {"code", "inputs", "filePathMap", "libraries", "allowNet", "timeoutMs", "memoryMb"}) {
    REQUIRE(schema["properties"].contains(key));
  }
}

TEST_CASE("ExecutorTool rejects malformed requests", "[tool]") {
  ToolFixture f;

  SECTION("unknown operation") {
    ToolCallRequest request = RunTs("export async function main() {}");
    request.name = "run_python";
    auto result = f.tool.HandleToolCall(request);
    REQUIRE(result.is_error);
    REQUIRE_THAT(result.FirstText(), StartsWith("Unknown executor operation: run_python"));
  }

  SECTION("missing code") {
    ToolCallRequest request;
    request.name = "run_ts";
    auto result = f.tool.HandleToolCall(request);
    REQUIRE(result.is_error);
    REQUIRE(result.FirstText() == "Missing \"code\" string.");
  }

  SECTION("no main export") {
    auto result = f.tool.HandleToolCall(RunTs("export const value = 42;"));
    REQUIRE(result.is_error);
    REQUIRE_THAT(result.FirstText(), ContainsSubstring("export an async function named \"main\""));
  }

  SECTION("wrongly typed argument") {
    auto result = f.tool.HandleToolCall(
        RunTs("export async function main() {}", {{"timeoutMs", "soon"}}));
    REQUIRE(result.is_error);
    REQUIRE_THAT(result.FirstText(), StartsWith("Invalid arguments"));
  }
}

TEST_CASE("ExecutorTool returns the pretty-printed result", "[tool]") {
  ToolFixture f;
  auto result = f.tool.HandleToolCall(
      RunTs("export async function main(ctx) { return { echoed: ctx.inputs.value }; }",
            {{"inputs", {{"value", 7}}}}));
  REQUIRE_FALSE(result.is_error);
  REQUIRE_THAT(result.FirstText(), StartsWith("{\n  \"ok\": true"));

  json payload = json::parse(result.FirstText());
  REQUIRE(payload["ok"] == true);
  REQUIRE(payload["result"]["echoed"] == 7);
}

TEST_CASE("ExecutorTool writes a spreadsheet to the output folder", "[tool][xlsx]") {
  ToolFixture f;
  auto result = f.tool.HandleToolCall(RunTs(
      "import ExcelJS from 'exceljs';\n"
      "export async function main(ctx: any) {\n"
      "  const wb = new ExcelJS.Workbook();\n"
      "  const ws = wb.addWorksheet('Data');\n"
      "  ws.addRow(['Name', 'Value']);\n"
      "  ws.addRow(['alpha', 1]);\n"
      "  const name = ctx.excel.generateOutputName('report');\n"
      "  const path = await ctx.files.write(name, await wb.xlsx.writeBuffer());\n"
      "  return { path, name };\n"
      "}\n",
      {{"libraries", {"exceljs"}}}));
  REQUIRE_FALSE(result.is_error);
  json payload = json::parse(result.FirstText());
  REQUIRE(payload["ok"] == true);

  std::string path = payload["result"]["path"].get<std::string>();
  std::string name = payload["result"]["name"].get<std::string>();
  REQUIRE_THAT(name, Matches(R"(report_\d{8}T\d{9}-[0-9A-Za-z]+\.xlsx)"));
  REQUIRE_THAT(path, EndsWith(name));
  REQUIRE(std::filesystem::path(path).is_absolute());
  REQUIRE(std::filesystem::exists(path));
  REQUIRE(std::filesystem::equivalent(std::filesystem::path(path).parent_path(),
                                      f.dir.Sub("out")));
}

TEST_CASE("ExecutorTool exposes context facts", "[tool]") {
  ToolFixture f;
  auto result = f.tool.HandleToolCall(RunTs(
      "export async function main(ctx) {\n"
      "  return { paths: ctx.paths, env: ctx.env, mime: ctx.excel.MIME_TYPES.xlsx,\n"
      "           kind: ctx.excel.getFileType('Book.XLSX') };\n"
      "}\n"));
  REQUIRE_FALSE(result.is_error);
  json payload = json::parse(result.FirstText());
  const json& facts = payload["result"];
  REQUIRE(facts["paths"]["output"] == f.dir.Sub("out"));
  REQUIRE(facts["paths"]["temp"] == f.dir.Sub("tmp"));
  REQUIRE(facts["env"]["platform"] == HostPlatform());
  REQUIRE(facts["env"]["arch"] == HostArch());
  REQUIRE(facts["env"]["appName"] == "Scriptbox");
  REQUIRE(facts["mime"] == mime::kXlsx);
  REQUIRE(facts["kind"] == "xlsx");
}

TEST_CASE("ExecutorTool resolves mapped files", "[tool]") {
  ToolFixture f;
  std::string real = f.dir.WriteFile("incoming/data.csv", "a,b\n1,2\n");
  auto result = f.tool.HandleToolCall(RunTs(
      "export async function main(ctx) {\n"
      "  const text = new TextDecoder().decode(await ctx.files.read('data.csv'));\n"
      "  return { text, exists: ctx.files.exists('data.csv'), path: ctx.files.getPath('data.csv'),\n"
      "           other: ctx.files.exists('other.csv') };\n"
      "}\n",
      {{"filePathMap", {{"data.csv", real}}}}));
  REQUIRE_FALSE(result.is_error);
  json payload = json::parse(result.FirstText());
  REQUIRE(payload["result"]["text"] == "a,b\n1,2\n");
  REQUIRE(payload["result"]["exists"] == true);
  REQUIRE(payload["result"]["path"] == real);
  REQUIRE(payload["result"]["other"] == false);
}

TEST_CASE("ExecutorTool reports user errors inside the result", "[tool]") {
  ToolFixture f;
  auto result = f.tool.HandleToolCall(
      RunTs("export async function main() { throw new Error('intentional'); }"));
  REQUIRE_FALSE(result.is_error);
  REQUIRE_THAT(result.FirstText(), ContainsSubstring("\"ok\": false"));
  json payload = json::parse(result.FirstText());
  REQUIRE(payload["error"] == "intentional");
}

TEST_CASE("ExecutorTool reports infrastructure faults as tool errors", "[tool]") {
  ToolFixture f;

  SECTION("unknown package") {
    auto result = f.tool.HandleToolCall(
        RunTs("import pkg from 'npm:definitely-not-a-package-42';\n"
              "export async function main() { return pkg; }\n",
              {{"allowNet", true}}));
    REQUIRE(result.is_error);
    REQUIRE_THAT(result.FirstText(), ContainsSubstring("Module import failed"));
  }

  SECTION("network disabled") {
    auto result = f.tool.HandleToolCall(
        RunTs("import pkg from 'https://esm.sh/dayjs';\n"
              "export async function main() { return pkg; }\n"));
    REQUIRE(result.is_error);
    REQUIRE_THAT(result.FirstText(), ContainsSubstring("Module import failed"));
  }

  SECTION("timeout") {
    auto result = f.tool.HandleToolCall(
        RunTs("export async function main() { for (;;) {} }", {{"timeoutMs", 200}}));
    REQUIRE(result.is_error);
    REQUIRE(result.FirstText() == "Execution timed out after 200 ms");
  }

  SECTION("timeout below the minimum is raised") {
    auto result = f.tool.HandleToolCall(
        RunTs("export async function main() { for (;;) {} }", {{"timeoutMs", 1}}));
    REQUIRE(result.is_error);
    REQUIRE(result.FirstText() == "Execution timed out after 100 ms");
  }
}

TEST_CASE("ExecutorTool calls are independent", "[tool][xlsx]") {
  ToolFixture f;
  const std::string code =
      "import ExcelJS from 'exceljs';\n"
      "let counter = 0;\n"
      "export async function main(ctx) {\n"
      "  counter += 1;\n"
      "  globalThis.leak = (globalThis.leak || 0) + 1;\n"
      "  const wb = new ExcelJS.Workbook();\n"
      "  wb.addWorksheet('Data').addRow(['run', counter]);\n"
      "  const name = ctx.excel.generateOutputName('report');\n"
      "  const path = await ctx.files.write(name, await wb.xlsx.writeBuffer());\n"
      "  return { counter, leak: globalThis.leak, path };\n"
      "}\n";
  json extra = {{"libraries", {"exceljs"}}};
  auto first_call = f.tool.HandleToolCall(RunTs(code, extra));
  auto second_call = f.tool.HandleToolCall(RunTs(code, extra));
  REQUIRE_FALSE(first_call.is_error);
  REQUIRE_FALSE(second_call.is_error);
  json first = json::parse(first_call.FirstText());
  json second = json::parse(second_call.FirstText());

  REQUIRE(first["result"]["counter"] == 1);
  REQUIRE(second["result"]["counter"] == 1);
  REQUIRE(second["result"]["leak"] == 1);

  std::string first_path = first["result"]["path"].get<std::string>();
  std::string second_path = second["result"]["path"].get<std::string>();
  REQUIRE(first_path != second_path);
  REQUIRE(std::filesystem::exists(first_path));
  REQUIRE(std::filesystem::exists(second_path));
}

TEST_CASE("ExecutorTool tolerates lone surrogates in script output", "[tool]") {
  ToolFixture f;

  SECTION("thrown message") {
    auto result = f.tool.HandleToolCall(
        RunTs("export async function main() { throw new Error('bad \\uD800 value'); }"));
    REQUIRE_FALSE(result.is_error);
    json payload = json::parse(result.FirstText());
    REQUIRE(payload["ok"] == false);
    REQUIRE_THAT(payload["error"].get<std::string>(), StartsWith("bad "));
    REQUIRE_THAT(payload["error"].get<std::string>(), EndsWith(" value"));
  }

  SECTION("formatted outcome") {
    RunOutcome outcome;
    outcome.status = RunStatus::kFaulted;
    outcome.error = "bad \xED\xA0\x80";
    outcome.stack = "at main \xFF";
    auto result = FormatOutcome(outcome);
    REQUIRE_FALSE(result.is_error);
    json payload = json::parse(result.FirstText());
    REQUIRE(payload["ok"] == false);
    REQUIRE_THAT(payload["error"].get<std::string>(), StartsWith("bad \xEF\xBF\xBD"));
    REQUIRE(payload["stack"] == "at main \xEF\xBF\xBD");
  }
}

TEST_CASE("ExecutorTool runs calls concurrently", "[tool][async]") {
  ToolFixture f;
  auto a = f.tool.HandleToolCallAsync(RunTs(
      "export async function main() { await new Promise((r) => setTimeout(r, 50)); return 'a'; }"));
  auto b = f.tool.HandleToolCallAsync(
      RunTs("export async function main() { return 'b'; }"));

  auto result_a = a.result.get();
  auto result_b = b.result.get();
  REQUIRE_FALSE(result_a.is_error);
  REQUIRE_FALSE(result_b.is_error);
  REQUIRE(json::parse(result_a.FirstText())["result"] == "a");
  REQUIRE(json::parse(result_b.FirstText())["result"] == "b");
}

TEST_CASE("ExecutorTool cancels a running call", "[tool][async]") {
  ToolFixture f;
  auto pending = f.tool.HandleToolCallAsync(
      RunTs("export async function main() { while (true) {} }", {{"timeoutMs", 10000}}));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  pending.token->Cancel();

  REQUIRE(pending.result.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
  auto result = pending.result.get();
  REQUIRE(result.is_error);
  REQUIRE(result.FirstText() == "Execution cancelled");
}
