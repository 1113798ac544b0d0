#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "config/engine_config.h"
#include "logging/trace.h"
#include "sandbox/http_fetcher.h"

namespace scriptbox {

// Canonical names of the modules the runner itself provides
inline constexpr const char* kUserModuleName = "scriptbox:main";
inline constexpr const char* kEntryModuleName = "scriptbox:entry";
inline constexpr const char* kExcelJsModuleName = "builtin:exceljs";
inline constexpr const char* kHostXlsxModuleName = "host:xlsx";

enum class SpecifierKind {
  kBuiltin,     // Bundled JS module (exceljs facade)
  kHostNative,  // Native module backed by C++ (host:xlsx)
  kRegistry,    // npm:<name>[@<version>] mapped onto the registry URL
  kUrl,         // Absolute URL or path relative to a remote module
  kUnresolvable
};

const char* SpecifierKindName(SpecifierKind kind);

enum class ResolveFault {
  kNone,
  kNotFound,
  kNetworkDisabled,
  kHostNotAllowed,
  kFetchFailed,
  kTimedOut
};

/**
 * A module ready to be compiled.
 */
struct ModuleSource {
  std::string name;  // Canonical module name (URL for remote modules)
  SpecifierKind kind = SpecifierKind::kUnresolvable;
  std::string source;
  bool cache_hit = false;
};

/**
 * Split of an `npm:` specifier.
 */
struct NpmSpecifier {
  std::string package;  // "name" or "@scope/name"
  std::string version;  // Empty when unpinned
  std::string subpath;  // Without leading '/', empty when absent
};

// Parse "npm:<package>[@<version>][/<subpath>]". Returns false when malformed.
bool ParseNpmSpecifier(const std::string& specifier, NpmSpecifier* out);

// Host of an http(s) URL (lowercase, no port), empty when not a URL
std::string UrlHost(const std::string& url);

bool IsRemoteUrl(const std::string& specifier);

/**
 * Resolve `relative` ("/x", "./x", "../x") against an absolute base URL.
 */
std::string ResolveUrl(const std::string& base_url, const std::string& relative);

/**
 * Map a declared library ("exceljs", "lodash@4", "npm:x", URL) to an
 * import specifier.
 */
std::string NormalizeLibrary(const std::string& library);

/**
 * ModuleResolver - maps import specifiers to module sources for one call.
 *
 * Classes of specifier:
 * - builtin: exceljs, npm:exceljs, npm:exceljs@<any>
 * - registry: npm:<name>[@<version>][/<subpath>] -> <registry_url>/<...>
 * - url: http(s) URLs, and /, ./, ../ paths imported from a remote module
 *
 * Remote classes require allow_net. Fetched sources go through the
 * process-wide ModuleCache when enabled in the config.
 *
 * The first fault is recorded so the runner can classify a failed module
 * link as a resolution fault.
 */
class ModuleResolver {
 public:
  ModuleResolver(const EngineConfig& config, bool allow_net, ModuleFetcher* fetcher,
                 TraceContext trace_ctx);

  /**
   * Bound remote fetches by a deadline and an abort predicate.
   */
  void SetDeadline(std::chrono::steady_clock::time_point deadline,
                   std::function<bool()> should_abort);

  /**
   * Map a specifier imported from module `base` to a canonical name.
   * Never fails: unresolvable specifiers keep their text and fail in Load.
   */
  std::string Normalize(const std::string& base, const std::string& specifier);

  /**
   * Produce the source of a canonical module name.
   * Returns false and sets error_out ("Module import failed: ...") on failure.
   */
  bool Load(const std::string& name, ModuleSource* out, std::string* error_out);

  /**
   * Resolve declared libraries before the user module is evaluated.
   */
  bool ResolveLibraries(const std::vector<std::string>& libraries, std::string* error_out);

  ResolveFault fault() const { return fault_; }
  const std::string& fault_message() const { return fault_message_; }

  // Original specifier a canonical name was first requested as
  std::string SpecifierFor(const std::string& name) const;

 private:
  SpecifierKind Classify(const std::string& name) const;
  bool Fail(ResolveFault fault, const std::string& specifier, SpecifierKind kind,
            const std::string& url, const std::string& message, std::string* error_out);
  bool FetchRemote(const std::string& url, SpecifierKind kind, ModuleSource* out,
                   std::string* error_out);
  long RemainingMs() const;

  const EngineConfig& config_;
  bool allow_net_;
  ModuleFetcher* fetcher_;
  TraceContext trace_ctx_;

  bool has_deadline_ = false;
  std::chrono::steady_clock::time_point deadline_;
  std::function<bool()> should_abort_;

  std::map<std::string, std::string> specifiers_;  // canonical name -> specifier
  std::map<std::string, std::string> loaded_;      // canonical name -> source
  std::map<std::string, std::string> effective_urls_;  // URL -> URL after redirects

  ResolveFault fault_ = ResolveFault::kNone;
  std::string fault_message_;
};

}  // namespace scriptbox
