#include "logging/trace.h"

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace scriptbox {

namespace {

std::atomic<bool> g_enabled{true};
std::atomic<uint64_t> g_next_call{1};
std::mutex g_emit_mu;

}  // namespace

void Tracer::Emit(const nlohmann::json& event) {
  // Calls run concurrently; keep each line intact.
  std::lock_guard<std::mutex> lock(g_emit_mu);
  std::cerr << event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
            << std::endl;
}

void Tracer::LogCallStart(const TraceContext& trace_ctx, size_t code_bytes) {
  if (!g_enabled) return;

  nlohmann::json log;
  log["event"] = "call_start";
  log["call_id"] = trace_ctx.call_id;
  log["operation"] = trace_ctx.operation;
  log["code_bytes"] = code_bytes;
  Emit(log);
}

void Tracer::LogCallEnd(const TraceContext& trace_ctx,
                        const std::string& status,
                        double duration_ms,
                        const std::string& error) {
  if (!g_enabled) return;

  nlohmann::json log;
  log["event"] = "call_end";
  log["call_id"] = trace_ctx.call_id;
  log["operation"] = trace_ctx.operation;
  log["status"] = status;
  log["duration_ms"] = duration_ms;

  if (!error.empty()) {
    log["error"] = error;
  }

  Emit(log);
}

void Tracer::LogModuleResolve(const TraceContext& trace_ctx,
                              const std::string& specifier,
                              const std::string& kind,
                              const std::string& url,
                              bool cache_hit,
                              const std::string& error) {
  if (!g_enabled) return;

  nlohmann::json log;
  log["event"] = "module_resolve";
  log["call_id"] = trace_ctx.call_id;
  log["specifier"] = specifier;
  log["kind"] = kind;
  if (!url.empty()) {
    log["url"] = url;
  }
  log["cache_hit"] = cache_hit;
  if (!error.empty()) {
    log["error"] = error;
  }
  Emit(log);
}

void Tracer::LogScript(const TraceContext& trace_ctx,
                       const std::string& level,
                       const std::string& message) {
  if (!g_enabled) return;

  nlohmann::json log;
  log["event"] = "script_log";
  log["call_id"] = trace_ctx.call_id;
  log["level"] = level;
  log["message"] = message;
  Emit(log);
}

std::string Tracer::NextCallId() {
  return fmt::format("call-{}", g_next_call.fetch_add(1));
}

void Tracer::SetEnabled(bool enabled) {
  g_enabled = enabled;
}

bool Tracer::IsEnabled() {
  return g_enabled;
}

}  // namespace scriptbox
