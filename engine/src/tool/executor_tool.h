#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "config/engine_config.h"
#include "sandbox/cancellation_token.h"
#include "sandbox/http_fetcher.h"
#include "sandbox/sandbox_runner.h"
#include "tool/tool_types.h"

namespace scriptbox {

/**
 * A tool call scheduled on a worker thread.
 */
struct PendingToolCall {
  std::future<ToolCallResult> result;
  std::shared_ptr<CancellationToken> token;
};

/**
 * ExecutorTool - the `run_ts` tool.
 *
 * Validates the request, builds the per-call ExecutionContext, runs the
 * module in a SandboxRunner and maps the outcome onto a ToolCallResult:
 * infrastructure faults (request, contract, resolution, timeout) are
 * tool-level errors; faults raised by the user's code are a successful
 * call carrying {"ok": false, ...}.
 */
class ExecutorTool {
 public:
  explicit ExecutorTool(const EngineConfig& config, ModuleFetcher* fetcher = nullptr);

  // Descriptors of the tools this executor serves
  std::vector<ToolDescriptor> ListTools() const;

  /**
   * Handle one call synchronously. Never throws.
   */
  ToolCallResult HandleToolCall(const ToolCallRequest& request,
                                const CancellationToken* token = nullptr) const;

  /**
   * Schedule a call with std::async. The returned token cancels it.
   * The executor must outlive the future.
   */
  PendingToolCall HandleToolCallAsync(ToolCallRequest request) const;

 private:
  ToolCallResult Execute(const ToolCallRequest& request, const TraceContext& trace_ctx,
                         const CancellationToken* token, std::string* status_out,
                         std::string* error_out) const;

  const EngineConfig& config_;
  SandboxRunner runner_;
};

// Descriptor for run_ts; mentions the default output folder
ToolDescriptor RunTsDescriptor(const EngineConfig& config);

/**
 * Map a sandbox outcome onto the result envelope.
 */
ToolCallResult FormatOutcome(const RunOutcome& outcome);

}  // namespace scriptbox
