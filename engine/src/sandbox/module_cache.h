#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace scriptbox {

/**
 * Process-wide cache of fetched module sources, keyed by URL.
 *
 * Entries are only ever added or replaced (last writer wins); readers
 * and writers are serialized by a mutex.
 */
class ModuleCache {
 public:
  /**
   * The cache shared by every call in this process.
   */
  static ModuleCache& Global();

  bool Lookup(const std::string& url, std::string* source_out) const;
  void Store(const std::string& url, const std::string& source);

  size_t Size() const;
  void Clear();

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::string> entries_;
};

}  // namespace scriptbox
