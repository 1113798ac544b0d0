#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

extern "C" {
#include "quickjs.h"
}

#include "config/engine_config.h"
#include "logging/trace.h"
#include "sandbox/cancellation_token.h"
#include "sandbox/execution_context.h"
#include "sandbox/module_resolver.h"

namespace scriptbox {

/**
 * A setTimeout registration waiting in the timer queue.
 */
struct PendingTimer {
  int64_t id = 0;
  uint64_t seq = 0;  // Registration order, breaks ties between equal due times
  std::chrono::steady_clock::time_point due;
  JSValue callback = JS_UNDEFINED;
  std::vector<JSValue> args;
};

/**
 * Per-call state reachable from native functions through the context opaque.
 */
struct SandboxState {
  const EngineConfig* config = nullptr;
  const ExecutionContext* exec_ctx = nullptr;
  ModuleResolver* resolver = nullptr;
  const CancellationToken* token = nullptr;
  TraceContext trace_ctx;

  // Prepared source of the user module (TS stripped, CommonJS wrapped)
  std::string user_source;

  // JS heap limit of the call; also bounds native buffers built for it
  size_t memory_limit_bytes = 0;

  std::chrono::steady_clock::time_point deadline;
  bool deadline_hit = false;
  bool cancelled = false;

  std::vector<PendingTimer> timers;
  int64_t next_timer_id = 1;
  uint64_t timer_seq = 0;

  // Namespace object of the user module, captured by the entry module
  JSValue user_namespace = JS_UNDEFINED;
};

SandboxState* GetSandboxState(JSContext* ctx);

// Name of the native the entry module hands the user namespace to
inline constexpr const char* kCaptureFunctionName = "__scriptbox_capture";

/**
 * Install setTimeout, clearTimeout and the namespace capture function on
 * the global object.
 */
void InstallSandboxGlobals(JSContext* ctx);

/**
 * Build the `host` object passed to the context prelude: native bindings
 * for files, logging, UTF-8 and the excel helpers plus per-call data.
 */
JSValue NewHostObject(JSContext* ctx, const ExecutionContext& exec_ctx);

/**
 * Create the native `host:xlsx` module exporting encode(model) and
 * decode(bytes).
 */
JSModuleDef* NewHostXlsxModule(JSContext* ctx, const char* module_name);

// Release the JS values held by queued timers
void FreeTimers(JSContext* ctx, SandboxState* state);

}  // namespace scriptbox
