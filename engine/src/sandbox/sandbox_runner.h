#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/engine_config.h"
#include "logging/trace.h"
#include "sandbox/cancellation_token.h"
#include "sandbox/execution_context.h"
#include "sandbox/http_fetcher.h"

namespace scriptbox {

/**
 * Terminal state of one sandboxed run.
 */
enum class RunStatus {
  kCompleted,        // main() settled with a value
  kFaulted,          // main() threw / rejected, or the module failed to evaluate
  kResolutionFault,  // an import could not be resolved
  kTimedOut,         // deadline reached
  kCancelled         // cancellation token fired
};

const char* RunStatusName(RunStatus status);

struct RunOutcome {
  RunStatus status = RunStatus::kFaulted;
  nlohmann::json result;  // kCompleted: JSON.stringify semantics
  std::string error;      // Fault message
  std::string stack;      // Stack trace when the thrown value carried one
  int timeout_ms = 0;     // Deadline that applied
  double duration_ms = 0;
};

struct RunOptions {
  std::string code;
  std::vector<std::string> libraries;
  bool allow_net = false;
  int timeout_ms = 3000;
  int memory_mb = 256;
};

/**
 * SandboxRunner - executes one module's `main(ctx)` in a fresh QuickJS
 * runtime.
 *
 * Each Run() creates its own JSRuntime/JSContext (released on every exit
 * path), so independent runs may proceed on different threads. The module
 * graph is loaded through ModuleResolver; the job queue and timer queue
 * are driven until main's promise settles or the deadline passes.
 */
class SandboxRunner {
 public:
  /**
   * @param fetcher Remote module fetcher; when null each run creates a
   *                CurlFetcher on demand.
   */
  explicit SandboxRunner(const EngineConfig& config, ModuleFetcher* fetcher = nullptr);

  RunOutcome Run(const RunOptions& options, const ExecutionContext& exec_ctx,
                 const TraceContext& trace_ctx, const CancellationToken* token = nullptr) const;

 private:
  const EngineConfig& config_;
  ModuleFetcher* fetcher_;
};

/**
 * Prepare a submitted source for evaluation as an ES module: erase
 * TypeScript syntax and wrap CommonJS exports.
 */
std::string PrepareModuleSource(const std::string& code);

}  // namespace scriptbox
