#include "sandbox/module_cache.h"

namespace scriptbox {

ModuleCache& ModuleCache::Global() {
  static ModuleCache cache;
  return cache;
}

bool ModuleCache::Lookup(const std::string& url, std::string* source_out) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(url);
  if (it == entries_.end()) {
    return false;
  }
  if (source_out) *source_out = it->second;
  return true;
}

void ModuleCache::Store(const std::string& url, const std::string& source) {
  std::lock_guard<std::mutex> lock(mu_);
  entries_[url] = source;
}

size_t ModuleCache::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

void ModuleCache::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
}

}  // namespace scriptbox
