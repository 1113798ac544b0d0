#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace scriptbox {

/**
 * Identifies the tool call a trace event belongs to.
 */
struct TraceContext {
  std::string call_id;    // Unique per tool call
  std::string operation;  // Requested operation name
};

/**
 * Tracer - structured logging for tool calls.
 *
 * Every event is a single JSON object written on its own line to stderr,
 * leaving stdout to the protocol channel.
 */
class Tracer {
 public:
  /**
   * Log the start of a tool call.
   */
  static void LogCallStart(const TraceContext& trace_ctx, size_t code_bytes);

  /**
   * Log the end of a tool call.
   * @param status Terminal state name (completed, faulted, timed_out, ...)
   * @param error  Fault message, empty on success
   */
  static void LogCallEnd(const TraceContext& trace_ctx,
                         const std::string& status,
                         double duration_ms,
                         const std::string& error = "");

  /**
   * Log a module resolution.
   * @param kind      builtin, registry or url
   * @param url       Fetched URL (empty for builtins)
   * @param cache_hit True when the source came from the module cache
   * @param error     Resolution fault, empty on success
   */
  static void LogModuleResolve(const TraceContext& trace_ctx,
                               const std::string& specifier,
                               const std::string& kind,
                               const std::string& url,
                               bool cache_hit,
                               const std::string& error = "");

  /**
   * Log a message emitted by the submitted script (ctx.log / console).
   */
  static void LogScript(const TraceContext& trace_ctx,
                        const std::string& level,
                        const std::string& message);

  /**
   * Generate a new call id ("call-<n>").
   */
  static std::string NextCallId();

  /**
   * Enable/disable tracing output.
   */
  static void SetEnabled(bool enabled);

  /**
   * Check if tracing is enabled.
   */
  static bool IsEnabled();

 private:
  static void Emit(const nlohmann::json& event);
};

}  // namespace scriptbox
