#pragma once

#include <string>
#include <vector>

namespace scriptbox {

/**
 * Engine-wide configuration.
 *
 * Loaded from a JSON file; every key is optional and keeps its default
 * when absent.
 */
struct EngineConfig {
  // Application-scoped folder name used for the output and temp directories
  std::string app_folder = "Scriptbox";

  // Explicit directory overrides (empty = platform default)
  std::string output_dir;
  std::string temp_dir;

  // Deadline for one call, in milliseconds
  int default_timeout_ms = 3000;
  int min_timeout_ms = 100;
  int max_timeout_ms = 10000;

  // JS heap limit for one call, in megabytes
  int default_memory_mb = 256;
  int min_memory_mb = 64;
  int max_memory_mb = 1024;

  // Native stack budget for the interpreter, in kilobytes
  int max_stack_kb = 1024;

  // Base URL that npm: specifiers are mapped onto
  std::string registry_url = "https://esm.sh";

  // Hosts remote modules may be fetched from
  std::vector<std::string> allowed_hosts = {
      "registry.npmjs.org", "cdn.jsdelivr.net", "esm.sh",
      "cdn.skypack.dev", "unpkg.com"};

  // Keep fetched module sources for the lifetime of the process
  bool module_cache = true;

  /**
   * Load configuration from a JSON file.
   * Returns false and sets error_out on failure.
   */
  bool LoadFromFile(const std::string& path, std::string* error_out = nullptr);

  /**
   * Load configuration from a JSON string.
   * Returns false and sets error_out on failure.
   */
  bool LoadFromJson(const std::string& json_str, std::string* error_out = nullptr);

  /**
   * Clamp a requested timeout into [min_timeout_ms, max_timeout_ms].
   * A non-positive request selects default_timeout_ms.
   */
  int ClampTimeout(long long requested_ms) const;

  /**
   * Clamp a requested heap limit into [min_memory_mb, max_memory_mb].
   * A non-positive request selects default_memory_mb.
   */
  int ClampMemory(long long requested_mb) const;

  /**
   * Check whether a remote host is allowlisted.
   */
  bool IsHostAllowed(const std::string& host) const;
};

}  // namespace scriptbox
