#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "config/engine_config.h"

using namespace scriptbox;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("EngineConfig defaults", "[config]") {
  EngineConfig config;
  REQUIRE(config.app_folder == "Scriptbox");
  REQUIRE(config.default_timeout_ms == 3000);
  REQUIRE(config.default_memory_mb == 256);
  REQUIRE(config.registry_url == "https://esm.sh");
  REQUIRE(config.module_cache);
  REQUIRE(config.IsHostAllowed("esm.sh"));
  REQUIRE(config.IsHostAllowed("CDN.JSDELIVR.NET"));
  REQUIRE_FALSE(config.IsHostAllowed("example.com"));
}

TEST_CASE("EngineConfig loads from JSON", "[config]") {
  EngineConfig config;
  std::string error;

  SECTION("partial config keeps defaults") {
    REQUIRE(config.LoadFromJson(R"({"app_folder": "Reports", "max_timeout_ms": 20000})", &error));
    REQUIRE(config.app_folder == "Reports");
    REQUIRE(config.max_timeout_ms == 20000);
    REQUIRE(config.min_timeout_ms == 100);
    REQUIRE(config.default_memory_mb == 256);
  }

  SECTION("allowed hosts and registry") {
    REQUIRE(config.LoadFromJson(
        R"({"registry_url": "https://registry.example/", "allowed_hosts": ["registry.example"]})",
        &error));
    REQUIRE(config.registry_url == "https://registry.example");
    REQUIRE(config.IsHostAllowed("registry.example"));
    REQUIRE_FALSE(config.IsHostAllowed("esm.sh"));
  }

  SECTION("wrong type is an error") {
    REQUIRE_FALSE(config.LoadFromJson(R"({"default_timeout_ms": "fast"})", &error));
    REQUIRE_THAT(error, ContainsSubstring("default_timeout_ms"));
    // A failed load leaves the previous values in place
    REQUIRE(config.default_timeout_ms == 3000);
  }

  SECTION("invalid JSON") {
    REQUIRE_FALSE(config.LoadFromJson("{not json", &error));
    REQUIRE_THAT(error, ContainsSubstring("JSON parse error"));
  }

  SECTION("non-object") {
    REQUIRE_FALSE(config.LoadFromJson("[1, 2]", &error));
    REQUIRE(error == "Config must be a JSON object");
  }

  SECTION("inconsistent bounds") {
    REQUIRE_FALSE(config.LoadFromJson(R"({"min_memory_mb": 2048})", &error));
    REQUIRE_THAT(error, ContainsSubstring("min_memory_mb"));
  }
}

TEST_CASE("EngineConfig missing file", "[config]") {
  EngineConfig config;
  std::string error;
  REQUIRE_FALSE(config.LoadFromFile("/nonexistent/scriptbox.json", &error));
  REQUIRE_THAT(error, ContainsSubstring("Failed to open config file"));
}

TEST_CASE("EngineConfig clamps limits", "[config]") {
  EngineConfig config;

  REQUIRE(config.ClampTimeout(0) == 3000);
  REQUIRE(config.ClampTimeout(-5) == 3000);
  REQUIRE(config.ClampTimeout(10) == 100);
  REQUIRE(config.ClampTimeout(5000) == 5000);
  REQUIRE(config.ClampTimeout(60000) == 10000);

  REQUIRE(config.ClampMemory(0) == 256);
  REQUIRE(config.ClampMemory(1) == 64);
  REQUIRE(config.ClampMemory(512) == 512);
  REQUIRE(config.ClampMemory(4096) == 1024);
}
