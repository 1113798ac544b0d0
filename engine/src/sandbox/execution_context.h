#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/engine_config.h"

namespace scriptbox {

/**
 * Well-known spreadsheet MIME types exposed as ctx.excel.MIME_TYPES.
 */
namespace mime {
inline constexpr const char* kXlsx =
    "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
inline constexpr const char* kXls = "application/vnd.ms-excel";
inline constexpr const char* kCsv = "text/csv";
}  // namespace mime

struct ContextPaths {
  std::string output;
  std::string temp;
  std::string downloads;
};

struct EnvFacts {
  std::string platform;  // linux | darwin | win32
  std::string arch;      // x64 | arm64 | ia32 | arm
  std::string app_name;
};

// Host facts in the vocabulary scripts expect
std::string HostPlatform();
std::string HostArch();

/**
 * Default directories for an application folder name.
 * Output: $HOME/Downloads/<app> (%USERPROFILE% on Windows), or
 * <system temp>/<app> when there is no home directory.
 */
std::string DefaultOutputDir(const std::string& app_folder);
std::string DefaultTempDir(const std::string& app_folder);

/**
 * "<base>_<YYYYMMDDTHHMMSSmmm>-<seq><hex>.<ext>", whitespace in base
 * replaced by '_'. Unique within the process.
 */
std::string GenerateOutputName(const std::string& base, const std::string& ext = "xlsx");

// "xlsx" | "xls" | "csv" | "unknown", by extension (case-insensitive)
std::string GetFileType(const std::string& filename);

/**
 * Per-call execution context: caller inputs, directories, environment facts
 * and the logical file map. Immutable after construction; the JS `ctx`
 * object is a frozen view over it.
 */
class ExecutionContext {
 public:
  /**
   * Build the context for one call. Creates the output and temp
   * directories when absent. Throws std::runtime_error when no usable
   * directory can be created.
   */
  ExecutionContext(const EngineConfig& config, const nlohmann::json& inputs,
                   const std::map<std::string, std::string>& file_path_map);

  const nlohmann::json& inputs() const { return inputs_; }
  const ContextPaths& paths() const { return paths_; }
  const EnvFacts& env() const { return env_; }
  const std::map<std::string, std::string>& file_path_map() const { return file_path_map_; }

  // Mapped path, else first existing of <temp>/<name>, <output>/<name>,
  // <name>, else `name` itself.
  std::string GetPath(const std::string& name) const;

  bool Exists(const std::string& name) const;

  std::vector<std::string> ListMapped() const;

  // Read a file by logical name. Fails with "File not found: <name>".
  bool ReadFile(const std::string& name, std::string* bytes_out, std::string* error_out) const;

  /**
   * Write bytes to <output>/<name> atomically (temp file + rename),
   * creating parent directories. Returns the absolute path in path_out.
   * Names that are absolute or contain ".." are rejected.
   */
  bool WriteFile(const std::string& name, const std::string& bytes, std::string* path_out,
                 std::string* error_out) const;

  // <output>/<name> without creating anything; same name rules as WriteFile.
  bool CreateOutputPath(const std::string& name, std::string* path_out,
                        std::string* error_out) const;

 private:
  nlohmann::json inputs_;
  ContextPaths paths_;
  EnvFacts env_;
  std::map<std::string, std::string> file_path_map_;
};

}  // namespace scriptbox
