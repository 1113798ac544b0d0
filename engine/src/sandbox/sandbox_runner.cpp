#include "sandbox/sandbox_runner.h"

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>

extern "C" {
#include "quickjs.h"
}

#include "sandbox/host_bindings.h"
#include "sandbox/js_convert.h"
#include "sandbox/module_resolver.h"
#include "sandbox/prelude.h"
#include "sandbox/ts_strip.h"
#include "tool/static_validator.h"

namespace scriptbox {

namespace {

using Clock = std::chrono::steady_clock;

// Upper bound for one sleep while waiting on a timer, so cancellation is
// noticed promptly
constexpr auto kWaitSlice = std::chrono::milliseconds(5);

constexpr const char* kMissingMainMessage = "Module must export async function main(ctx)";
constexpr const char* kNeverSettledMessage = "main() returned a promise that never settled";
constexpr const char* kModuleStalledMessage = "Module evaluation never completed";

// Interrupt handler: abort once the deadline passes or the call is cancelled
int InterruptHandler(JSRuntime* rt, void* opaque) {
  auto* state = static_cast<SandboxState*>(opaque);
  if (state->token && state->token->IsCancelled()) {
    state->cancelled = true;
    return 1;
  }
  if (Clock::now() >= state->deadline) {
    state->deadline_hit = true;
    return 1;
  }
  return 0;
}

char* NormalizeModuleName(JSContext* ctx, const char* base, const char* name, void* opaque) {
  auto* state = static_cast<SandboxState*>(opaque);
  std::string normalized = state->resolver->Normalize(base ? base : "", name);
  return js_strdup(ctx, normalized.c_str());
}

JSModuleDef* LoadModule(JSContext* ctx, const char* name, void* opaque) {
  auto* state = static_cast<SandboxState*>(opaque);
  std::string module_name(name);
  std::string source;

  if (module_name == kUserModuleName) {
    source = state->user_source;
  } else {
    ModuleSource loaded;
    std::string error;
    if (!state->resolver->Load(module_name, &loaded, &error)) {
      JsThrowError(ctx, error);
      return nullptr;
    }
    if (loaded.kind == SpecifierKind::kHostNative) {
      return NewHostXlsxModule(ctx, name);
    }
    source = std::move(loaded.source);
  }

  JSValue func = JS_Eval(ctx, source.c_str(), source.size(), name,
                         JS_EVAL_TYPE_MODULE | JS_EVAL_FLAG_COMPILE_ONLY);
  if (JS_IsException(func)) {
    return nullptr;
  }
  // The module definition stays owned by the context
  auto* m = static_cast<JSModuleDef*>(JS_VALUE_GET_PTR(func));
  JS_FreeValue(ctx, func);
  return m;
}

/**
 * One QuickJS runtime + context. Values handed to Hold() and the state's
 * timers and captured namespace are released before the context.
 */
class QuickJsSession {
 public:
  QuickJsSession(SandboxState* state, size_t memory_limit, size_t stack_size) : state_(state) {
    rt_ = JS_NewRuntime();
    if (!rt_) {
      throw std::runtime_error("Failed to create JS runtime");
    }
    JS_SetMemoryLimit(rt_, memory_limit);
    JS_SetMaxStackSize(rt_, stack_size);
    JS_SetInterruptHandler(rt_, InterruptHandler, state_);
    JS_SetModuleLoaderFunc(rt_, NormalizeModuleName, LoadModule, state_);

    ctx_ = JS_NewContext(rt_);
    if (!ctx_) {
      JS_FreeRuntime(rt_);
      throw std::runtime_error("Failed to create JS context");
    }
    JS_SetContextOpaque(ctx_, state_);
  }

  ~QuickJsSession() {
    for (JSValue value : held_) {
      JS_FreeValue(ctx_, value);
    }
    FreeTimers(ctx_, state_);
    JS_FreeValue(ctx_, state_->user_namespace);
    state_->user_namespace = JS_UNDEFINED;
    JS_FreeContext(ctx_);
    JS_FreeRuntime(rt_);
  }

  QuickJsSession(const QuickJsSession&) = delete;
  QuickJsSession& operator=(const QuickJsSession&) = delete;

  JSContext* ctx() const { return ctx_; }
  JSRuntime* rt() const { return rt_; }

  // Keep a value alive until the session ends
  JSValue Hold(JSValue value) {
    held_.push_back(value);
    return value;
  }

 private:
  SandboxState* state_;
  JSRuntime* rt_ = nullptr;
  JSContext* ctx_ = nullptr;
  std::vector<JSValue> held_;
};

RunOutcome MakeOutcome(RunStatus status, std::string error = "", std::string stack = "") {
  RunOutcome outcome;
  outcome.status = status;
  outcome.error = std::move(error);
  outcome.stack = std::move(stack);
  return outcome;
}

bool StopRequested(const SandboxState& state, RunOutcome* outcome) {
  if (state.cancelled || (state.token && state.token->IsCancelled())) {
    *outcome = MakeOutcome(RunStatus::kCancelled, "Execution cancelled");
    return true;
  }
  if (state.deadline_hit || Clock::now() >= state.deadline) {
    *outcome = MakeOutcome(RunStatus::kTimedOut);
    return true;
  }
  return false;
}

/**
 * Map a thrown value to an outcome. During module loading (`linking`),
 * faults recorded by the resolver take precedence over the JS error.
 */
RunOutcome ClassifyException(JSContext* ctx, const SandboxState& state, bool linking,
                             JSValueConst exception) {
  RunOutcome outcome;
  if (StopRequested(state, &outcome)) {
    return outcome;
  }
  if (linking && state.resolver->fault() != ResolveFault::kNone) {
    if (state.resolver->fault() == ResolveFault::kTimedOut) {
      return MakeOutcome(RunStatus::kTimedOut);
    }
    return MakeOutcome(RunStatus::kResolutionFault, state.resolver->fault_message());
  }
  JsErrorInfo info = JsDescribeException(ctx, exception);
  return MakeOutcome(RunStatus::kFaulted, info.message, info.stack);
}

RunOutcome TakeException(JSContext* ctx, const SandboxState& state, bool linking) {
  JSValue exception = JS_GetException(ctx);
  RunOutcome outcome = ClassifyException(ctx, state, linking, exception);
  JS_FreeValue(ctx, exception);
  return outcome;
}

// Sleep until `until`. Returns false when cancelled first.
bool WaitUntil(const SandboxState& state, Clock::time_point until) {
  while (true) {
    if (state.token && state.token->IsCancelled()) return false;
    auto now = Clock::now();
    if (now >= until) return true;
    std::this_thread::sleep_for(std::min<Clock::duration>(until - now, kWaitSlice));
  }
}

bool IsPending(JSContext* ctx, JSValueConst promise) {
  return JS_PromiseState(ctx, promise) == JS_PROMISE_PENDING;
}

/**
 * Drive the job queue and the timer queue until `promise` settles.
 * Values that are not promises count as settled.
 * Returns false and fills failure when the run must stop.
 */
bool DriveEventLoop(QuickJsSession& session, SandboxState* state, JSValueConst promise,
                    bool linking, const char* stall_message, RunOutcome* failure) {
  JSContext* ctx = session.ctx();
  while (true) {
    // Run every queued job
    while (true) {
      JSContext* job_ctx = nullptr;
      int ret = JS_ExecutePendingJob(session.rt(), &job_ctx);
      if (ret == 0) break;
      if (ret < 0) {
        *failure = TakeException(job_ctx ? job_ctx : ctx, *state, linking);
        return false;
      }
    }
    if (!IsPending(ctx, promise)) {
      return true;
    }
    if (StopRequested(*state, failure)) {
      return false;
    }
    if (state->timers.empty()) {
      *failure = MakeOutcome(RunStatus::kFaulted, stall_message);
      return false;
    }

    auto next = std::min_element(state->timers.begin(), state->timers.end(),
                                 [](const PendingTimer& a, const PendingTimer& b) {
                                   return a.due != b.due ? a.due < b.due : a.seq < b.seq;
                                 });
    Clock::time_point due = std::min(next->due, state->deadline);
    if (!WaitUntil(*state, due) || next->due > state->deadline) {
      StopRequested(*state, failure);
      if (failure->status != RunStatus::kCancelled) {
        *failure = MakeOutcome(RunStatus::kTimedOut);
      }
      return false;
    }

    PendingTimer timer = std::move(*next);
    state->timers.erase(next);
    JSValue ret = JS_Call(ctx, timer.callback, JS_UNDEFINED, static_cast<int>(timer.args.size()),
                          timer.args.data());
    JS_FreeValue(ctx, timer.callback);
    for (JSValue arg : timer.args) JS_FreeValue(ctx, arg);
    if (JS_IsException(ret)) {
      *failure = TakeException(ctx, *state, linking);
      return false;
    }
    JS_FreeValue(ctx, ret);
  }
}

void DeleteGlobal(JSContext* ctx, const char* name) {
  JSValue global = JS_GetGlobalObject(ctx);
  JSAtom atom = JS_NewAtom(ctx, name);
  JS_DeleteProperty(ctx, global, atom, 0);
  JS_FreeAtom(ctx, atom);
  JS_FreeValue(ctx, global);
}

RunOutcome Execute(QuickJsSession& session, SandboxState* state,
                   const ExecutionContext& exec_ctx) {
  JSContext* ctx = session.ctx();
  RunOutcome failure;

  // Sandbox globals and the frozen ctx object
  InstallSandboxGlobals(ctx);
  const char* prelude = ContextPreludeSource();
  JSValue factory = session.Hold(
      JS_Eval(ctx, prelude, std::strlen(prelude), "<prelude>", JS_EVAL_TYPE_GLOBAL));
  if (JS_IsException(factory)) {
    RunOutcome outcome = TakeException(ctx, *state, false);
    if (outcome.status != RunStatus::kFaulted) return outcome;
    throw std::runtime_error("Failed to initialise sandbox context: " + outcome.error);
  }
  JSValue host = session.Hold(NewHostObject(ctx, exec_ctx));
  JSValue ctx_obj = session.Hold(JS_Call(ctx, factory, JS_UNDEFINED, 1, &host));
  if (JS_IsException(ctx_obj)) {
    RunOutcome outcome = TakeException(ctx, *state, false);
    if (outcome.status != RunStatus::kFaulted) return outcome;
    throw std::runtime_error("Failed to initialise sandbox context: " + outcome.error);
  }

  // Load, link and evaluate the module graph through the entry module
  std::string entry = fmt::format("import * as user from '{}';\n{}(user);\n", kUserModuleName,
                                  kCaptureFunctionName);
  JSValue entry_func = JS_Eval(ctx, entry.c_str(), entry.size(), kEntryModuleName,
                               JS_EVAL_TYPE_MODULE | JS_EVAL_FLAG_COMPILE_ONLY);
  if (JS_IsException(entry_func)) {
    return TakeException(ctx, *state, true);
  }
  JSValue evaluated = session.Hold(JS_EvalFunction(ctx, entry_func));
  if (JS_IsException(evaluated)) {
    return TakeException(ctx, *state, true);
  }
  if (!DriveEventLoop(session, state, evaluated, true, kModuleStalledMessage, &failure)) {
    return failure;
  }
  if (JS_PromiseState(ctx, evaluated) == JS_PROMISE_REJECTED) {
    JSValue reason = JS_PromiseResult(ctx, evaluated);
    RunOutcome outcome = ClassifyException(ctx, *state, true, reason);
    JS_FreeValue(ctx, reason);
    return outcome;
  }
  DeleteGlobal(ctx, kCaptureFunctionName);

  // Invoke main(ctx) once
  if (!JS_IsObject(state->user_namespace)) {
    return MakeOutcome(RunStatus::kFaulted, kMissingMainMessage);
  }
  JSValue main_fn = session.Hold(JS_GetPropertyStr(ctx, state->user_namespace, kEntryPointName));
  if (!JS_IsFunction(ctx, main_fn)) {
    return MakeOutcome(RunStatus::kFaulted, kMissingMainMessage);
  }
  JSValue returned = session.Hold(JS_Call(ctx, main_fn, JS_UNDEFINED, 1, &ctx_obj));
  if (JS_IsException(returned)) {
    return TakeException(ctx, *state, false);
  }
  if (!DriveEventLoop(session, state, returned, false, kNeverSettledMessage, &failure)) {
    return failure;
  }

  JSValue value = JS_UNDEFINED;
  int promise_state = JS_PromiseState(ctx, returned);
  if (promise_state == JS_PROMISE_REJECTED) {
    JSValue reason = JS_PromiseResult(ctx, returned);
    RunOutcome outcome = ClassifyException(ctx, *state, false, reason);
    JS_FreeValue(ctx, reason);
    return outcome;
  }
  if (promise_state == JS_PROMISE_FULFILLED) {
    value = session.Hold(JS_PromiseResult(ctx, returned));
  } else {
    value = returned;
  }

  std::string error;
  auto result = JsStringifyToJson(ctx, value, &error);
  if (!result) {
    RunOutcome outcome;
    if (StopRequested(*state, &outcome)) return outcome;
    return MakeOutcome(RunStatus::kFaulted, error);
  }
  RunOutcome outcome = MakeOutcome(RunStatus::kCompleted);
  outcome.result = std::move(*result);
  return outcome;
}

}  // namespace

const char* RunStatusName(RunStatus status) {
  switch (status) {
    case RunStatus::kCompleted:
      return "completed";
    case RunStatus::kFaulted:
      return "faulted";
    case RunStatus::kResolutionFault:
      return "resolution_fault";
    case RunStatus::kTimedOut:
      return "timed_out";
    case RunStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

std::string PrepareModuleSource(const std::string& code) {
  std::string source = StripTypeScript(code);
  if (UsesCommonJsExports(source)) {
    // Kept on the first line so reported line numbers still match
    source = "const module = { exports: {} }; const exports = module.exports; " + source +
             "\n;export const main = module.exports.main;\n";
  }
  return source;
}

SandboxRunner::SandboxRunner(const EngineConfig& config, ModuleFetcher* fetcher)
    : config_(config), fetcher_(fetcher) {}

RunOutcome SandboxRunner::Run(const RunOptions& options, const ExecutionContext& exec_ctx,
                              const TraceContext& trace_ctx,
                              const CancellationToken* token) const {
  const auto start = Clock::now();
  auto finish = [&](RunOutcome outcome) {
    outcome.timeout_ms = options.timeout_ms;
    outcome.duration_ms =
        std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    return outcome;
  };

  std::unique_ptr<CurlFetcher> owned_fetcher;
  ModuleFetcher* fetcher = fetcher_;
  if (!fetcher && options.allow_net) {
    owned_fetcher = std::make_unique<CurlFetcher>();
    fetcher = owned_fetcher.get();
  }

  ModuleResolver resolver(config_, options.allow_net, fetcher, trace_ctx);

  SandboxState state;
  state.config = &config_;
  state.exec_ctx = &exec_ctx;
  state.resolver = &resolver;
  state.token = token;
  state.trace_ctx = trace_ctx;
  state.memory_limit_bytes = static_cast<size_t>(options.memory_mb) * 1024 * 1024;
  state.deadline = start + std::chrono::milliseconds(options.timeout_ms);
  state.user_source = PrepareModuleSource(options.code);

  resolver.SetDeadline(state.deadline, [token] { return token && token->IsCancelled(); });

  // Declared libraries are resolved before anything is evaluated
  if (!options.libraries.empty()) {
    std::string error;
    if (!resolver.ResolveLibraries(options.libraries, &error)) {
      if (token && token->IsCancelled()) {
        return finish(MakeOutcome(RunStatus::kCancelled, "Execution cancelled"));
      }
      if (resolver.fault() == ResolveFault::kTimedOut) {
        return finish(MakeOutcome(RunStatus::kTimedOut));
      }
      return finish(MakeOutcome(RunStatus::kResolutionFault, error));
    }
  }

  QuickJsSession session(&state, static_cast<size_t>(options.memory_mb) * 1024 * 1024,
                         static_cast<size_t>(config_.max_stack_kb) * 1024);
  return finish(Execute(session, &state, exec_ctx));
}

}  // namespace scriptbox
