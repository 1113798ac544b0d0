#include "sandbox/module_resolver.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/format.h>

#include "sandbox/module_cache.h"
#include "sandbox/prelude.h"

namespace scriptbox {

namespace {

bool StartsWith(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string Trim(const std::string& s) {
  size_t start = 0;
  size_t end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

// Collapse "." and ".." segments of an absolute URL path
std::string NormalizePath(const std::string& path) {
  std::vector<std::string> segments;
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t next = path.find('/', pos);
    if (next == std::string::npos) next = path.size();
    std::string segment = path.substr(pos, next - pos);
    if (segment == "..") {
      if (!segments.empty()) segments.pop_back();
    } else if (!segment.empty() && segment != ".") {
      segments.push_back(segment);
    }
    pos = next + 1;
  }
  std::string out;
  for (const auto& segment : segments) {
    out += "/" + segment;
  }
  bool trailing = !path.empty() && path.back() == '/';
  if (out.empty() || trailing) out += "/";
  return out;
}

bool IsBuiltinExcelJs(const std::string& specifier) {
  if (specifier == "exceljs") return true;
  NpmSpecifier npm;
  return ParseNpmSpecifier(specifier, &npm) && npm.package == "exceljs" && npm.subpath.empty();
}

}  // namespace

const char* SpecifierKindName(SpecifierKind kind) {
  switch (kind) {
    case SpecifierKind::kBuiltin:
      return "builtin";
    case SpecifierKind::kHostNative:
      return "host";
    case SpecifierKind::kRegistry:
      return "registry";
    case SpecifierKind::kUrl:
      return "url";
    case SpecifierKind::kUnresolvable:
      return "unresolvable";
  }
  return "unknown";
}

bool ParseNpmSpecifier(const std::string& specifier, NpmSpecifier* out) {
  if (!StartsWith(specifier, "npm:")) return false;
  std::string rest = specifier.substr(4);
  if (!rest.empty() && rest[0] == '/') rest.erase(0, 1);
  if (rest.empty()) return false;

  size_t name_start = 0;
  if (rest[0] == '@') {
    size_t slash = rest.find('/');
    if (slash == std::string::npos || slash == 1) return false;
    name_start = slash + 1;
  }
  size_t end = rest.find_first_of("@/", name_start);
  NpmSpecifier parsed;
  parsed.package = rest.substr(0, end);
  if (parsed.package.size() == name_start) return false;

  if (end != std::string::npos) {
    if (rest[end] == '@') {
      size_t version_end = rest.find('/', end + 1);
      parsed.version = rest.substr(end + 1, version_end == std::string::npos
                                                ? std::string::npos
                                                : version_end - end - 1);
      if (parsed.version.empty()) return false;
      if (version_end != std::string::npos) parsed.subpath = rest.substr(version_end + 1);
    } else {
      parsed.subpath = rest.substr(end + 1);
    }
  }
  if (out) *out = parsed;
  return true;
}

bool IsRemoteUrl(const std::string& specifier) {
  std::string lower = ToLower(specifier.substr(0, 8));
  return StartsWith(lower, "https://") || StartsWith(lower, "http://");
}

std::string UrlHost(const std::string& url) {
  if (!IsRemoteUrl(url)) return "";
  size_t start = url.find("://") + 3;
  size_t end = url.find_first_of("/?#", start);
  std::string authority = url.substr(start, end == std::string::npos ? std::string::npos
                                                                     : end - start);
  size_t at = authority.rfind('@');
  if (at != std::string::npos) authority = authority.substr(at + 1);
  if (!authority.empty() && authority[0] == '[') {
    size_t close = authority.find(']');
    return ToLower(authority.substr(0, close == std::string::npos ? std::string::npos
                                                                  : close + 1));
  }
  size_t colon = authority.find(':');
  if (colon != std::string::npos) authority = authority.substr(0, colon);
  return ToLower(authority);
}

std::string ResolveUrl(const std::string& base_url, const std::string& relative) {
  size_t scheme_end = base_url.find("://");
  if (scheme_end == std::string::npos) return relative;
  if (StartsWith(relative, "//")) {
    return base_url.substr(0, scheme_end + 1) + relative;
  }

  size_t path_start = base_url.find_first_of("/?#", scheme_end + 3);
  std::string origin = base_url.substr(0, path_start);
  std::string base_path = "/";
  if (path_start != std::string::npos && base_url[path_start] == '/') {
    base_path = base_url.substr(path_start);
    base_path = base_path.substr(0, base_path.find_first_of("?#"));
  }

  std::string rel_path = relative;
  std::string suffix;
  size_t query = rel_path.find_first_of("?#");
  if (query != std::string::npos) {
    suffix = rel_path.substr(query);
    rel_path = rel_path.substr(0, query);
  }

  std::string joined;
  if (StartsWith(rel_path, "/")) {
    joined = rel_path;
  } else {
    joined = base_path.substr(0, base_path.rfind('/') + 1) + rel_path;
  }
  return origin + NormalizePath(joined) + suffix;
}

std::string NormalizeLibrary(const std::string& library) {
  std::string lib = Trim(library);
  if (lib == "exceljs" || StartsWith(lib, "exceljs@")) return "exceljs";
  if (StartsWith(lib, "npm:") || IsRemoteUrl(lib)) return lib;
  return "npm:" + lib;
}

ModuleResolver::ModuleResolver(const EngineConfig& config, bool allow_net,
                               ModuleFetcher* fetcher, TraceContext trace_ctx)
    : config_(config),
      allow_net_(allow_net),
      fetcher_(fetcher),
      trace_ctx_(std::move(trace_ctx)) {}

void ModuleResolver::SetDeadline(std::chrono::steady_clock::time_point deadline,
                                 std::function<bool()> should_abort) {
  has_deadline_ = true;
  deadline_ = deadline;
  should_abort_ = std::move(should_abort);
}

long ModuleResolver::RemainingMs() const {
  if (!has_deadline_) return config_.max_timeout_ms;
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline_ - std::chrono::steady_clock::now());
  return static_cast<long>(remaining.count());
}

std::string ModuleResolver::Normalize(const std::string& base, const std::string& specifier) {
  std::string name;
  if (specifier == kUserModuleName && base == kEntryModuleName) {
    return kUserModuleName;
  }
  if (IsBuiltinExcelJs(specifier)) {
    name = kExcelJsModuleName;
  } else if (specifier == kHostXlsxModuleName && StartsWith(base, "builtin:")) {
    name = kHostXlsxModuleName;
  } else if (StartsWith(specifier, "npm:")) {
    NpmSpecifier npm;
    if (ParseNpmSpecifier(specifier, &npm)) {
      name = config_.registry_url + "/" + npm.package;
      if (!npm.version.empty()) name += "@" + npm.version;
      if (!npm.subpath.empty()) name += "/" + npm.subpath;
    }
  } else if (IsRemoteUrl(specifier)) {
    name = specifier;
  } else if (IsRemoteUrl(base) &&
             (StartsWith(specifier, "/") || StartsWith(specifier, "./") ||
              StartsWith(specifier, "../"))) {
    // Resolve against the URL the importer was actually served from
    auto served = effective_urls_.find(base);
    name = ResolveUrl(served != effective_urls_.end() ? served->second : base, specifier);
  }

  if (name.empty()) {
    name = "unresolved:" + specifier;
  }
  specifiers_.emplace(name, specifier);
  return name;
}

std::string ModuleResolver::SpecifierFor(const std::string& name) const {
  auto it = specifiers_.find(name);
  return it != specifiers_.end() ? it->second : name;
}

SpecifierKind ModuleResolver::Classify(const std::string& name) const {
  if (name == kExcelJsModuleName) return SpecifierKind::kBuiltin;
  if (name == kHostXlsxModuleName) return SpecifierKind::kHostNative;
  if (IsRemoteUrl(name)) {
    return StartsWith(SpecifierFor(name), "npm:") ? SpecifierKind::kRegistry
                                                  : SpecifierKind::kUrl;
  }
  return SpecifierKind::kUnresolvable;
}

bool ModuleResolver::Fail(ResolveFault fault, const std::string& specifier, SpecifierKind kind,
                          const std::string& url, const std::string& message,
                          std::string* error_out) {
  if (fault_ == ResolveFault::kNone) {
    fault_ = fault;
    fault_message_ = message;
  }
  Tracer::LogModuleResolve(trace_ctx_, specifier, SpecifierKindName(kind), url, false, message);
  if (error_out) *error_out = message;
  return false;
}

bool ModuleResolver::Load(const std::string& name, ModuleSource* out, std::string* error_out) {
  const std::string specifier = SpecifierFor(name);
  const SpecifierKind kind = Classify(name);

  out->name = name;
  out->kind = kind;
  out->cache_hit = false;

  switch (kind) {
    case SpecifierKind::kBuiltin:
      out->source = ExcelJsModuleSource();
      Tracer::LogModuleResolve(trace_ctx_, specifier, SpecifierKindName(kind), "", false);
      return true;
    case SpecifierKind::kHostNative:
      out->source.clear();
      return true;
    case SpecifierKind::kUnresolvable:
      return Fail(ResolveFault::kNotFound, specifier, kind, "",
                  fmt::format("Module import failed: Cannot find module '{}'", specifier),
                  error_out);
    case SpecifierKind::kRegistry:
    case SpecifierKind::kUrl:
      break;
  }

  if (!allow_net_) {
    return Fail(ResolveFault::kNetworkDisabled, specifier, kind, name,
                fmt::format("Module import failed: network access is disabled (allowNet is "
                            "false); cannot load '{}'",
                            specifier),
                error_out);
  }
  return FetchRemote(name, kind, out, error_out);
}

bool ModuleResolver::FetchRemote(const std::string& url, SpecifierKind kind, ModuleSource* out,
                                 std::string* error_out) {
  const std::string specifier = SpecifierFor(url);

  auto local = loaded_.find(url);
  if (local != loaded_.end()) {
    out->source = local->second;
    out->cache_hit = true;
    return true;
  }
  if (config_.module_cache && ModuleCache::Global().Lookup(url, &out->source)) {
    out->cache_hit = true;
    loaded_[url] = out->source;
    Tracer::LogModuleResolve(trace_ctx_, specifier, SpecifierKindName(kind), url, true);
    return true;
  }

  std::string host = UrlHost(url);
  if (!config_.IsHostAllowed(host)) {
    return Fail(ResolveFault::kHostNotAllowed, specifier, kind, url,
                fmt::format("Module import failed: host '{}' is not in the allowed hosts; "
                            "cannot load '{}'",
                            host, specifier),
                error_out);
  }
  if (!fetcher_) {
    return Fail(ResolveFault::kFetchFailed, specifier, kind, url,
                fmt::format("Module import failed: no fetcher available for '{}'", specifier),
                error_out);
  }

  long remaining = RemainingMs();
  if (remaining <= 0) {
    return Fail(ResolveFault::kTimedOut, specifier, kind, url,
                fmt::format("Module import failed: timed out loading '{}'", specifier),
                error_out);
  }

  FetchResponse resp = fetcher_->Get(url, remaining, should_abort_);
  if (resp.timed_out || resp.aborted) {
    return Fail(ResolveFault::kTimedOut, specifier, kind, url,
                fmt::format("Module import failed: timed out loading '{}'", specifier),
                error_out);
  }
  if (!resp.error.empty()) {
    return Fail(ResolveFault::kFetchFailed, specifier, kind, url,
                fmt::format("Module import failed: {} ({})", resp.error, url), error_out);
  }
  if (resp.status_code == 404) {
    return Fail(ResolveFault::kNotFound, specifier, kind, url,
                fmt::format("Module import failed: package not found (HTTP 404) for '{}'",
                            specifier),
                error_out);
  }
  if (!resp.ok()) {
    return Fail(ResolveFault::kFetchFailed, specifier, kind, url,
                fmt::format("Module import failed: HTTP {} for '{}'", resp.status_code,
                            specifier),
                error_out);
  }
  std::string final_host = UrlHost(resp.effective_url);
  if (!final_host.empty() && !config_.IsHostAllowed(final_host)) {
    return Fail(ResolveFault::kHostNotAllowed, specifier, kind, resp.effective_url,
                fmt::format("Module import failed: host '{}' is not in the allowed hosts; "
                            "cannot load '{}'",
                            final_host, specifier),
                error_out);
  }

  out->source = resp.body;
  loaded_[url] = resp.body;
  if (!resp.effective_url.empty() && resp.effective_url != url) {
    effective_urls_[url] = resp.effective_url;
  }
  if (config_.module_cache) {
    ModuleCache::Global().Store(url, resp.body);
  }
  Tracer::LogModuleResolve(trace_ctx_, specifier, SpecifierKindName(kind), url, false);
  return true;
}

bool ModuleResolver::ResolveLibraries(const std::vector<std::string>& libraries,
                                      std::string* error_out) {
  for (const auto& library : libraries) {
    std::string name = Normalize(kUserModuleName, NormalizeLibrary(library));
    ModuleSource source;
    if (!Load(name, &source, error_out)) {
      return false;
    }
  }
  return true;
}

}  // namespace scriptbox
