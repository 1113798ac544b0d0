#include "tool/executor_tool.h"

#include <chrono>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "logging/trace.h"
#include "sandbox/execution_context.h"
#include "tool/static_validator.h"

namespace scriptbox {

namespace {

using json = nlohmann::json;

json RunTsInputSchema() {
  return json{
      {"type", "object"},
      {"properties",
       {
           {"code",
            {{"type", "string"},
             {"description",
              "TypeScript/JavaScript module source exporting `async function main(ctx)`"}}},
           {"inputs",
            {{"type", "object"}, {"description", "Arbitrary JSON exposed as ctx.inputs"}}},
           {"filePathMap",
            {{"type", "object"},
             {"additionalProperties", {{"type", "string"}}},
             {"description", "Logical file name to real path, used by ctx.files"}}},
           {"libraries",
            {{"type", "array"},
             {"items", {{"type", "string"}}},
             {"description", "Declared dependencies, e.g. \"exceljs\" or \"lodash@4\""}}},
           {"allowNet",
            {{"type", "boolean"},
             {"description", "Allow fetching npm: and URL modules (default false)"}}},
           {"timeoutMs",
            {{"type", "integer"}, {"description", "Deadline in milliseconds (default 3000)"}}},
           {"memoryMb",
            {{"type", "integer"}, {"description", "JS heap limit in megabytes (default 256)"}}},
       }},
      {"required", json::array({"code"})},
  };
}

// Script-supplied strings may carry lone surrogates (WTF-8); never fail on them
std::string DumpPayload(const json& payload) {
  return payload.dump(2, ' ', false, json::error_handler_t::replace);
}

std::string OutputFolder(const EngineConfig& config) {
  return config.output_dir.empty() ? DefaultOutputDir(config.app_folder) : config.output_dir;
}

}  // namespace

ToolDescriptor RunTsDescriptor(const EngineConfig& config) {
  ToolDescriptor desc;
  desc.name = kRunTsOperation;
  desc.description = fmt::format(
      "Run a TypeScript/JavaScript module in a sandbox. The module must export "
      "`async function main(ctx)`; its return value is serialised as JSON. "
      "Spreadsheets can be built with the bundled ExcelJS library "
      "(`import ExcelJS from \"exceljs\"`) and saved with ctx.files.write(name, bytes), "
      "which writes into the default output folder ({}). Use "
      "ctx.excel.generateOutputName(base) for collision-free file names.",
      OutputFolder(config));
  desc.input_schema = RunTsInputSchema();
  return desc;
}

ToolCallResult FormatOutcome(const RunOutcome& outcome) {
  switch (outcome.status) {
    case RunStatus::kCompleted: {
      json payload = {{"ok", true}, {"result", outcome.result}};
      return ToolCallResult::Text(DumpPayload(payload), false);
    }
    case RunStatus::kFaulted: {
      json payload = {{"ok", false}, {"error", outcome.error}};
      if (!outcome.stack.empty()) {
        payload["stack"] = outcome.stack;
      }
      return ToolCallResult::Text(DumpPayload(payload), false);
    }
    case RunStatus::kResolutionFault:
      return ToolCallResult::Text(outcome.error, true);
    case RunStatus::kTimedOut:
      return ToolCallResult::Text(
          fmt::format("Execution timed out after {} ms", outcome.timeout_ms), true);
    case RunStatus::kCancelled:
      return ToolCallResult::Text(
          outcome.error.empty() ? "Execution cancelled" : outcome.error, true);
  }
  return ToolCallResult::Text("Executor error: unknown run status", true);
}

ExecutorTool::ExecutorTool(const EngineConfig& config, ModuleFetcher* fetcher)
    : config_(config), runner_(config, fetcher) {}

std::vector<ToolDescriptor> ExecutorTool::ListTools() const {
  return {RunTsDescriptor(config_)};
}

ToolCallResult ExecutorTool::HandleToolCall(const ToolCallRequest& request,
                                            const CancellationToken* token) const {
  TraceContext trace_ctx{Tracer::NextCallId(), request.name};
  size_t code_bytes = 0;
  if (request.arguments.is_object() && request.arguments.contains("code") &&
      request.arguments["code"].is_string()) {
    code_bytes = request.arguments["code"].get_ref<const std::string&>().size();
  }
  Tracer::LogCallStart(trace_ctx, code_bytes);

  auto start = std::chrono::steady_clock::now();
  std::string status;
  std::string error;
  ToolCallResult result;
  try {
    result = Execute(request, trace_ctx, token, &status, &error);
  } catch (const std::exception& e) {
    status = "executor_error";
    error = e.what();
    result = ToolCallResult::Text(fmt::format("Executor error: {}", e.what()), true);
  }

  double duration_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
          .count();
  Tracer::LogCallEnd(trace_ctx, status, duration_ms, error);
  return result;
}

ToolCallResult ExecutorTool::Execute(const ToolCallRequest& request,
                                     const TraceContext& trace_ctx,
                                     const CancellationToken* token, std::string* status_out,
                                     std::string* error_out) const {
  ValidationResult validation = ValidateRequest(request);
  if (!validation.ok()) {
    *status_out = validation.fault == ValidationFault::kMissingEntryPoint ? "contract_fault"
                                                                         : "request_fault";
    *error_out = validation.message;
    return ToolCallResult::Text(validation.message, true);
  }

  const RunTsArgs& args = validation.args;
  ExecutionContext exec_ctx(config_, args.inputs, args.file_path_map);

  RunOptions options;
  options.code = args.code;
  options.libraries = args.libraries;
  options.allow_net = args.allow_net;
  options.timeout_ms = config_.ClampTimeout(args.timeout_ms.value_or(0));
  options.memory_mb = config_.ClampMemory(args.memory_mb.value_or(0));

  RunOutcome outcome = runner_.Run(options, exec_ctx, trace_ctx, token);
  *status_out = RunStatusName(outcome.status);
  if (outcome.status == RunStatus::kTimedOut) {
    *error_out = fmt::format("timed out after {} ms", outcome.timeout_ms);
  } else {
    *error_out = outcome.error;
  }
  return FormatOutcome(outcome);
}

PendingToolCall ExecutorTool::HandleToolCallAsync(ToolCallRequest request) const {
  PendingToolCall pending;
  pending.token = std::make_shared<CancellationToken>();
  std::shared_ptr<CancellationToken> token = pending.token;
  pending.result = std::async(std::launch::async, [this, request = std::move(request), token] {
    return HandleToolCall(request, token.get());
  });
  return pending;
}

}  // namespace scriptbox
