#include "config/engine_config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace scriptbox {

namespace {

template <typename T>
bool ReadKey(const nlohmann::json& j, const char* key, T& out, std::string* error_out) {
  if (!j.contains(key)) return true;
  try {
    out = j.at(key).get<T>();
    return true;
  } catch (const nlohmann::json::exception& e) {
    if (error_out) *error_out = std::string("Invalid value for '") + key + "': " + e.what();
    return false;
  }
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

bool EngineConfig::LoadFromFile(const std::string& path, std::string* error_out) {
  std::ifstream file(path);
  if (!file.is_open()) {
    if (error_out) *error_out = "Failed to open config file: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return LoadFromJson(buffer.str(), error_out);
}

bool EngineConfig::LoadFromJson(const std::string& json_str, std::string* error_out) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_str);
  } catch (const std::exception& e) {
    if (error_out) *error_out = std::string("JSON parse error: ") + e.what();
    return false;
  }

  if (!j.is_object()) {
    if (error_out) *error_out = "Config must be a JSON object";
    return false;
  }

  EngineConfig next = *this;
  bool ok = ReadKey(j, "app_folder", next.app_folder, error_out) &&
            ReadKey(j, "output_dir", next.output_dir, error_out) &&
            ReadKey(j, "temp_dir", next.temp_dir, error_out) &&
            ReadKey(j, "default_timeout_ms", next.default_timeout_ms, error_out) &&
            ReadKey(j, "min_timeout_ms", next.min_timeout_ms, error_out) &&
            ReadKey(j, "max_timeout_ms", next.max_timeout_ms, error_out) &&
            ReadKey(j, "default_memory_mb", next.default_memory_mb, error_out) &&
            ReadKey(j, "min_memory_mb", next.min_memory_mb, error_out) &&
            ReadKey(j, "max_memory_mb", next.max_memory_mb, error_out) &&
            ReadKey(j, "max_stack_kb", next.max_stack_kb, error_out) &&
            ReadKey(j, "registry_url", next.registry_url, error_out) &&
            ReadKey(j, "allowed_hosts", next.allowed_hosts, error_out) &&
            ReadKey(j, "module_cache", next.module_cache, error_out);
  if (!ok) return false;

  if (next.app_folder.empty()) {
    if (error_out) *error_out = "app_folder must not be empty";
    return false;
  }
  if (next.min_timeout_ms <= 0 || next.min_timeout_ms > next.max_timeout_ms) {
    if (error_out) *error_out = "min_timeout_ms must be positive and <= max_timeout_ms";
    return false;
  }
  if (next.min_memory_mb <= 0 || next.min_memory_mb > next.max_memory_mb) {
    if (error_out) *error_out = "min_memory_mb must be positive and <= max_memory_mb";
    return false;
  }
  while (!next.registry_url.empty() && next.registry_url.back() == '/') {
    next.registry_url.pop_back();
  }

  *this = std::move(next);
  return true;
}

int EngineConfig::ClampTimeout(long long requested_ms) const {
  long long value = requested_ms > 0 ? requested_ms : default_timeout_ms;
  return static_cast<int>(std::clamp<long long>(value, min_timeout_ms, max_timeout_ms));
}

int EngineConfig::ClampMemory(long long requested_mb) const {
  long long value = requested_mb > 0 ? requested_mb : default_memory_mb;
  return static_cast<int>(std::clamp<long long>(value, min_memory_mb, max_memory_mb));
}

bool EngineConfig::IsHostAllowed(const std::string& host) const {
  std::string lower = ToLower(host);
  for (const auto& allowed : allowed_hosts) {
    if (ToLower(allowed) == lower) return true;
  }
  return false;
}

}  // namespace scriptbox
