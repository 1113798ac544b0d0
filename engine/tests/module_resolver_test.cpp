#include <map>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "sandbox/module_cache.h"
#include "sandbox/module_resolver.h"

using namespace scriptbox;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

// Serves canned responses and counts requests
class FakeFetcher : public ModuleFetcher {
 public:
  FetchResponse Get(const std::string& url, long timeout_ms,
                    const std::function<bool()>& should_abort) override {
    ++calls;
    last_timeout_ms = timeout_ms;
    auto it = responses.find(url);
    if (it != responses.end()) {
      FetchResponse resp = it->second;
      if (resp.effective_url.empty()) resp.effective_url = url;
      return resp;
    }
    FetchResponse resp;
    resp.status_code = 404;
    resp.body = "Not Found";
    resp.effective_url = url;
    return resp;
  }

  void Serve(const std::string& url, const std::string& body) {
    FetchResponse resp;
    resp.status_code = 200;
    resp.body = body;
    responses[url] = resp;
  }

  std::map<std::string, FetchResponse> responses;
  int calls = 0;
  long last_timeout_ms = 0;
};

EngineConfig NoCacheConfig() {
  EngineConfig config;
  config.module_cache = false;
  return config;
}

TraceContext TestTrace() {
  return TraceContext{"call-test", "run_ts"};
}

}  // namespace

TEST_CASE("ParseNpmSpecifier", "[resolver]") {
  NpmSpecifier npm;

  REQUIRE(ParseNpmSpecifier("npm:lodash", &npm));
  REQUIRE(npm.package == "lodash");
  REQUIRE(npm.version.empty());

  REQUIRE(ParseNpmSpecifier("npm:lodash@4.17.21/fp", &npm));
  REQUIRE(npm.package == "lodash");
  REQUIRE(npm.version == "4.17.21");
  REQUIRE(npm.subpath == "fp");

  REQUIRE(ParseNpmSpecifier("npm:@scope/pkg@1.0.0", &npm));
  REQUIRE(npm.package == "@scope/pkg");
  REQUIRE(npm.version == "1.0.0");

  REQUIRE_FALSE(ParseNpmSpecifier("lodash", &npm));
  REQUIRE_FALSE(ParseNpmSpecifier("npm:", &npm));
  REQUIRE_FALSE(ParseNpmSpecifier("npm:lodash@", &npm));
}

TEST_CASE("NormalizeLibrary", "[resolver]") {
  REQUIRE(NormalizeLibrary("exceljs") == "exceljs");
  REQUIRE(NormalizeLibrary("exceljs@4.4.0") == "exceljs");
  REQUIRE(NormalizeLibrary(" lodash@4 ") == "npm:lodash@4");
  REQUIRE(NormalizeLibrary("npm:dayjs") == "npm:dayjs");
  REQUIRE(NormalizeLibrary("https://esm.sh/dayjs") == "https://esm.sh/dayjs");
}

TEST_CASE("URL helpers", "[resolver]") {
  REQUIRE(UrlHost("https://ESM.sh/lodash") == "esm.sh");
  REQUIRE(UrlHost("http://user@cdn.jsdelivr.net:8080/x") == "cdn.jsdelivr.net");
  REQUIRE(UrlHost("lodash").empty());

  const std::string base = "https://esm.sh/lodash@4/es2022/lodash.mjs";
  REQUIRE(ResolveUrl(base, "./chunk.js") == "https://esm.sh/lodash@4/es2022/chunk.js");
  REQUIRE(ResolveUrl(base, "../x.js") == "https://esm.sh/lodash@4/x.js");
  REQUIRE(ResolveUrl(base, "/v135/a.js?target=es2022") == "https://esm.sh/v135/a.js?target=es2022");
}

TEST_CASE("ModuleResolver normalizes specifiers", "[resolver]") {
  EngineConfig config = NoCacheConfig();
  ModuleResolver resolver(config, false, nullptr, TestTrace());

  REQUIRE(resolver.Normalize(kUserModuleName, "exceljs") == kExcelJsModuleName);
  REQUIRE(resolver.Normalize(kUserModuleName, "npm:exceljs@4.4.0") == kExcelJsModuleName);
  REQUIRE(resolver.Normalize(kUserModuleName, "npm:lodash@4.17.21") ==
          "https://esm.sh/lodash@4.17.21");
  REQUIRE(resolver.Normalize(kUserModuleName, "https://cdn.jsdelivr.net/npm/x") ==
          "https://cdn.jsdelivr.net/npm/x");
  REQUIRE(resolver.Normalize(kEntryModuleName, kUserModuleName) == kUserModuleName);

  // Internal and relative specifiers are not importable from user code
  REQUIRE(resolver.Normalize(kUserModuleName, "host:xlsx") == "unresolved:host:xlsx");
  REQUIRE(resolver.Normalize(kExcelJsModuleName, "host:xlsx") == kHostXlsxModuleName);
  REQUIRE(resolver.Normalize(kUserModuleName, "./util.js") == "unresolved:./util.js");
  REQUIRE(resolver.Normalize("https://esm.sh/a/index.js", "./b.js") == "https://esm.sh/a/b.js");
}

TEST_CASE("ModuleResolver loads the builtin spreadsheet module offline", "[resolver]") {
  EngineConfig config = NoCacheConfig();
  FakeFetcher fetcher;
  ModuleResolver resolver(config, false, &fetcher, TestTrace());

  ModuleSource source;
  std::string error;
  REQUIRE(resolver.Load(resolver.Normalize(kUserModuleName, "exceljs"), &source, &error));
  REQUIRE(source.kind == SpecifierKind::kBuiltin);
  REQUIRE_THAT(source.source, ContainsSubstring("class Workbook"));
  REQUIRE(fetcher.calls == 0);
  REQUIRE(resolver.fault() == ResolveFault::kNone);
}

TEST_CASE("ModuleResolver reports unresolvable specifiers", "[resolver]") {
  EngineConfig config = NoCacheConfig();
  ModuleResolver resolver(config, true, nullptr, TestTrace());

  ModuleSource source;
  std::string error;
  REQUIRE_FALSE(resolver.Load(resolver.Normalize(kUserModuleName, "lodash"), &source, &error));
  REQUIRE(error == "Module import failed: Cannot find module 'lodash'");
  REQUIRE(resolver.fault() == ResolveFault::kNotFound);
  REQUIRE(resolver.fault_message() == error);
}

TEST_CASE("ModuleResolver refuses the network when allowNet is false", "[resolver]") {
  EngineConfig config = NoCacheConfig();
  FakeFetcher fetcher;
  fetcher.Serve("https://esm.sh/lodash@4", "export default {};");
  ModuleResolver resolver(config, false, &fetcher, TestTrace());

  ModuleSource source;
  std::string error;
  REQUIRE_FALSE(
      resolver.Load(resolver.Normalize(kUserModuleName, "npm:lodash@4"), &source, &error));
  REQUIRE_THAT(error, StartsWith("Module import failed"));
  REQUIRE_THAT(error, ContainsSubstring("network access is disabled"));
  REQUIRE(resolver.fault() == ResolveFault::kNetworkDisabled);
  REQUIRE(fetcher.calls == 0);
}

TEST_CASE("ModuleResolver fetches registry modules", "[resolver]") {
  EngineConfig config = NoCacheConfig();
  FakeFetcher fetcher;
  fetcher.Serve("https://esm.sh/lodash@4", "export default { ok: true };");
  ModuleResolver resolver(config, true, &fetcher, TestTrace());

  std::string name = resolver.Normalize(kUserModuleName, "npm:lodash@4");
  ModuleSource source;
  std::string error;
  REQUIRE(resolver.Load(name, &source, &error));
  REQUIRE(source.kind == SpecifierKind::kRegistry);
  REQUIRE(source.source == "export default { ok: true };");
  REQUIRE_FALSE(source.cache_hit);

  // Second load in the same call reuses the source
  REQUIRE(resolver.Load(name, &source, &error));
  REQUIRE(source.cache_hit);
  REQUIRE(fetcher.calls == 1);
}

TEST_CASE("ModuleResolver maps fetch failures", "[resolver]") {
  EngineConfig config = NoCacheConfig();
  FakeFetcher fetcher;
  ModuleResolver resolver(config, true, &fetcher, TestTrace());
  ModuleSource source;
  std::string error;

  SECTION("missing package") {
    REQUIRE_FALSE(resolver.Load(resolver.Normalize(kUserModuleName, "npm:nonexistent-pkg-xyz"),
                                &source, &error));
    REQUIRE(error ==
            "Module import failed: package not found (HTTP 404) for 'npm:nonexistent-pkg-xyz'");
    REQUIRE(resolver.fault() == ResolveFault::kNotFound);
  }

  SECTION("server error") {
    FetchResponse resp;
    resp.status_code = 503;
    fetcher.responses["https://esm.sh/flaky"] = resp;
    REQUIRE_FALSE(
        resolver.Load(resolver.Normalize(kUserModuleName, "npm:flaky"), &source, &error));
    REQUIRE(error == "Module import failed: HTTP 503 for 'npm:flaky'");
    REQUIRE(resolver.fault() == ResolveFault::kFetchFailed);
  }

  SECTION("transport error") {
    FetchResponse resp;
    resp.error = "Could not resolve host";
    fetcher.responses["https://esm.sh/offline"] = resp;
    REQUIRE_FALSE(
        resolver.Load(resolver.Normalize(kUserModuleName, "npm:offline"), &source, &error));
    REQUIRE_THAT(error, StartsWith("Module import failed: Could not resolve host"));
    REQUIRE(resolver.fault() == ResolveFault::kFetchFailed);
  }

  SECTION("timeout") {
    FetchResponse resp;
    resp.timed_out = true;
    resp.error = "Timeout was reached";
    fetcher.responses["https://esm.sh/slow"] = resp;
    REQUIRE_FALSE(
        resolver.Load(resolver.Normalize(kUserModuleName, "npm:slow"), &source, &error));
    REQUIRE(resolver.fault() == ResolveFault::kTimedOut);
  }

  SECTION("host not allowed") {
    REQUIRE_FALSE(resolver.Load(
        resolver.Normalize(kUserModuleName, "https://evil.example/x.js"), &source, &error));
    REQUIRE_THAT(error, ContainsSubstring("evil.example"));
    REQUIRE(resolver.fault() == ResolveFault::kHostNotAllowed);
    REQUIRE(fetcher.calls == 0);
  }

  SECTION("first fault is kept") {
    REQUIRE_FALSE(resolver.Load(resolver.Normalize(kUserModuleName, "left-pad"), &source,
                                &error));
    REQUIRE_FALSE(resolver.Load(resolver.Normalize(kUserModuleName, "npm:gone"), &source,
                                &error));
    REQUIRE(resolver.fault_message() == "Module import failed: Cannot find module 'left-pad'");
  }
}

TEST_CASE("ModuleResolver honours the deadline", "[resolver]") {
  EngineConfig config = NoCacheConfig();
  FakeFetcher fetcher;
  fetcher.Serve("https://esm.sh/dayjs", "export default 1;");
  ModuleResolver resolver(config, true, &fetcher, TestTrace());
  ModuleSource source;
  std::string error;

  SECTION("deadline already passed") {
    resolver.SetDeadline(std::chrono::steady_clock::now() - std::chrono::milliseconds(1),
                         [] { return false; });
    REQUIRE_FALSE(
        resolver.Load(resolver.Normalize(kUserModuleName, "npm:dayjs"), &source, &error));
    REQUIRE(resolver.fault() == ResolveFault::kTimedOut);
    REQUIRE(fetcher.calls == 0);
  }

  SECTION("fetch bounded by the remaining time") {
    resolver.SetDeadline(std::chrono::steady_clock::now() + std::chrono::seconds(2),
                         [] { return false; });
    REQUIRE(resolver.Load(resolver.Normalize(kUserModuleName, "npm:dayjs"), &source, &error));
    REQUIRE(fetcher.last_timeout_ms > 0);
    REQUIRE(fetcher.last_timeout_ms <= 2000);
  }
}

TEST_CASE("ModuleResolver resolves relative imports against redirects", "[resolver]") {
  EngineConfig config = NoCacheConfig();
  FakeFetcher fetcher;
  FetchResponse redirected;
  redirected.status_code = 200;
  redirected.body = "export * from './impl.js';";
  redirected.effective_url = "https://esm.sh/v135/dayjs@1.11.0/es2022/dayjs.mjs";
  fetcher.responses["https://esm.sh/dayjs"] = redirected;
  ModuleResolver resolver(config, true, &fetcher, TestTrace());

  std::string name = resolver.Normalize(kUserModuleName, "npm:dayjs");
  ModuleSource source;
  std::string error;
  REQUIRE(resolver.Load(name, &source, &error));
  REQUIRE(resolver.Normalize(name, "./impl.js") ==
          "https://esm.sh/v135/dayjs@1.11.0/es2022/impl.js");
}

TEST_CASE("ModuleResolver shares fetched sources through the module cache", "[resolver]") {
  EngineConfig config;
  config.module_cache = true;
  const std::string url = "https://esm.sh/cache-check@1.0.0";

  FakeFetcher first_fetcher;
  first_fetcher.Serve(url, "export const cached = 1;");
  ModuleResolver first(config, true, &first_fetcher, TestTrace());
  ModuleSource source;
  std::string error;
  REQUIRE(first.Load(first.Normalize(kUserModuleName, "npm:cache-check@1.0.0"), &source, &error));
  REQUIRE(first_fetcher.calls == 1);

  FakeFetcher second_fetcher;
  ModuleResolver second(config, true, &second_fetcher, TestTrace());
  REQUIRE(
      second.Load(second.Normalize(kUserModuleName, "npm:cache-check@1.0.0"), &source, &error));
  REQUIRE(source.cache_hit);
  REQUIRE(source.source == "export const cached = 1;");
  REQUIRE(second_fetcher.calls == 0);

  std::string cached;
  REQUIRE(ModuleCache::Global().Lookup(url, &cached));
}

TEST_CASE("ModuleResolver resolves declared libraries", "[resolver]") {
  EngineConfig config = NoCacheConfig();
  FakeFetcher fetcher;
  std::string error;

  SECTION("builtin only") {
    ModuleResolver resolver(config, false, &fetcher, TestTrace());
    REQUIRE(resolver.ResolveLibraries({"exceljs", "exceljs@4.4.0"}, &error));
    REQUIRE(fetcher.calls == 0);
  }

  SECTION("remote library without network") {
    ModuleResolver resolver(config, false, &fetcher, TestTrace());
    REQUIRE_FALSE(resolver.ResolveLibraries({"exceljs", "lodash@4"}, &error));
    REQUIRE_THAT(error, ContainsSubstring("network access is disabled"));
    REQUIRE_THAT(error, ContainsSubstring("npm:lodash@4"));
  }
}
