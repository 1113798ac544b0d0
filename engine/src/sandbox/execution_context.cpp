#include "sandbox/execution_context.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace scriptbox {

namespace {

std::atomic<uint64_t> g_output_sequence{0};
std::atomic<uint64_t> g_write_sequence{0};

std::string SystemTempDir() {
  std::error_code ec;
  fs::path tmp = fs::temp_directory_path(ec);
  if (ec || tmp.empty()) {
#ifdef _WIN32
    return "C:/Windows/Temp";
#else
    return "/tmp";
#endif
  }
  return tmp.generic_string();
}

std::string HomeDir() {
#ifdef _WIN32
  const char* home = std::getenv("USERPROFILE");
  if (!home || !*home) home = std::getenv("HOME");
#else
  const char* home = std::getenv("HOME");
#endif
  return home ? std::string(home) : std::string();
}

bool EnsureDir(const std::string& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  return !ec && fs::is_directory(dir, ec);
}

bool IsRegularFile(const std::string& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

// Reject names that are absolute or walk out of the base directory
bool ValidateOutputName(const std::string& name, std::string* error_out) {
  if (name.empty()) {
    if (error_out) *error_out = "File name must not be empty";
    return false;
  }
  fs::path p(name);
  if (p.is_absolute() || p.has_root_name() || name[0] == '/' || name[0] == '\\') {
    if (error_out) *error_out = "Absolute paths not allowed: " + name;
    return false;
  }
  for (const auto& part : p) {
    if (part == "..") {
      if (error_out) *error_out = "Path traversal not allowed: " + name;
      return false;
    }
  }
  return true;
}

std::string RandomHex(int digits) {
  static std::mutex mu;
  static std::mt19937_64 rng(std::random_device{}());
  uint64_t value;
  {
    std::lock_guard<std::mutex> lock(mu);
    value = rng();
  }
  std::string hex = fmt::format("{:016x}", value);
  return hex.substr(0, static_cast<size_t>(digits));
}

}  // namespace

std::string HostPlatform() {
#if defined(_WIN32)
  return "win32";
#elif defined(__APPLE__)
  return "darwin";
#else
  return "linux";
#endif
}

std::string HostArch() {
#if defined(__x86_64__) || defined(_M_X64)
  return "x64";
#elif defined(__aarch64__) || defined(_M_ARM64)
  return "arm64";
#elif defined(__i386__) || defined(_M_IX86)
  return "ia32";
#elif defined(__arm__) || defined(_M_ARM)
  return "arm";
#else
  return "unknown";
#endif
}

std::string DefaultTempDir(const std::string& app_folder) {
  return (fs::path(SystemTempDir()) / app_folder).generic_string();
}

std::string DefaultOutputDir(const std::string& app_folder) {
  std::string home = HomeDir();
  if (!home.empty()) {
    std::replace(home.begin(), home.end(), '\\', '/');
    return (fs::path(home) / "Downloads" / app_folder).generic_string();
  }
  return DefaultTempDir(app_folder);
}

std::string GenerateOutputName(const std::string& base, const std::string& ext) {
  std::string clean;
  bool in_space = false;
  for (char c : base) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!in_space) clean += '_';
      in_space = true;
    } else {
      clean += c;
      in_space = false;
    }
  }

  auto now = std::chrono::system_clock::now();
  std::time_t secs = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()).count() % 1000;
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &secs);
#else
  gmtime_r(&secs, &utc);
#endif

  std::string extension = ext.empty() ? "xlsx" : ext;
  if (extension[0] == '.') extension.erase(0, 1);

  uint64_t seq = ++g_output_sequence;
  return fmt::format("{}_{:04}{:02}{:02}T{:02}{:02}{:02}{:03}-{}{}.{}", clean,
                     utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                     utc.tm_min, utc.tm_sec, static_cast<int>(millis), seq, RandomHex(6),
                     extension);
}

std::string GetFileType(const std::string& filename) {
  auto dot = filename.find_last_of('.');
  if (dot == std::string::npos) return "unknown";
  std::string ext = filename.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == "xlsx" || ext == "xls" || ext == "csv") return ext;
  return "unknown";
}

ExecutionContext::ExecutionContext(const EngineConfig& config, const nlohmann::json& inputs,
                                   const std::map<std::string, std::string>& file_path_map)
    : file_path_map_(file_path_map) {
  inputs_ = inputs.is_object() ? inputs : nlohmann::json::object();
  if (!inputs_.contains("_filePathMap")) {
    inputs_["_filePathMap"] = file_path_map_;
  }

  paths_.temp = config.temp_dir.empty() ? DefaultTempDir(config.app_folder) : config.temp_dir;
  if (!EnsureDir(paths_.temp)) {
    throw std::runtime_error("Failed to create temp directory: " + paths_.temp);
  }

  paths_.output =
      config.output_dir.empty() ? DefaultOutputDir(config.app_folder) : config.output_dir;
  if (!EnsureDir(paths_.output)) {
    // Fall back to the temp directory when the downloads folder is unusable
    if (!config.output_dir.empty()) {
      throw std::runtime_error("Failed to create output directory: " + paths_.output);
    }
    paths_.output = paths_.temp;
  }
  paths_.downloads = paths_.output;

  env_.platform = HostPlatform();
  env_.arch = HostArch();
  env_.app_name = config.app_folder;
}

std::string ExecutionContext::GetPath(const std::string& name) const {
  auto it = file_path_map_.find(name);
  if (it != file_path_map_.end()) {
    return it->second;
  }
  const std::string candidates[] = {
      (fs::path(paths_.temp) / name).generic_string(),
      (fs::path(paths_.output) / name).generic_string(),
      name,
  };
  for (const auto& candidate : candidates) {
    if (IsRegularFile(candidate)) {
      return candidate;
    }
  }
  return name;
}

bool ExecutionContext::Exists(const std::string& name) const {
  return !name.empty() && IsRegularFile(GetPath(name));
}

std::vector<std::string> ExecutionContext::ListMapped() const {
  std::vector<std::string> names;
  names.reserve(file_path_map_.size());
  for (const auto& [logical, path] : file_path_map_) {
    names.push_back(logical);
  }
  return names;
}

bool ExecutionContext::ReadFile(const std::string& name, std::string* bytes_out,
                                std::string* error_out) const {
  std::string path = name.empty() ? std::string() : GetPath(name);
  if (path.empty() || !IsRegularFile(path)) {
    if (error_out) *error_out = "File not found: " + name;
    return false;
  }
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    if (error_out) *error_out = "File not found: " + name;
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  *bytes_out = buffer.str();
  return true;
}

bool ExecutionContext::CreateOutputPath(const std::string& name, std::string* path_out,
                                        std::string* error_out) const {
  if (!ValidateOutputName(name, error_out)) {
    return false;
  }
  *path_out = (fs::path(paths_.output) / name).lexically_normal().generic_string();
  return true;
}

bool ExecutionContext::WriteFile(const std::string& name, const std::string& bytes,
                                 std::string* path_out, std::string* error_out) const {
  std::string target;
  if (!CreateOutputPath(name, &target, error_out)) {
    return false;
  }

  fs::path target_path(target);
  std::error_code ec;
  fs::create_directories(target_path.parent_path(), ec);
  if (ec) {
    if (error_out) *error_out = "Failed to create directory for " + name + ": " + ec.message();
    return false;
  }

  fs::path tmp_path = target_path;
  tmp_path += fmt::format(".tmp-{}", ++g_write_sequence);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      if (error_out) *error_out = "Failed to open file for writing: " + target;
      return false;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp_path, ec);
      if (error_out) *error_out = "Failed to write file: " + target;
      return false;
    }
  }

  fs::rename(tmp_path, target_path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    if (error_out) *error_out = "Failed to write file: " + target + ": " + ec.message();
    return false;
  }

  *path_out = fs::absolute(target_path, ec).generic_string();
  if (ec) *path_out = target;
  return true;
}

}  // namespace scriptbox
