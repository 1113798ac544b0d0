#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "tool/static_validator.h"

using namespace scriptbox;
using Catch::Matchers::ContainsSubstring;

namespace {

ToolCallRequest MakeRequest(const std::string& name, nlohmann::json arguments) {
  ToolCallRequest request;
  request.name = name;
  request.arguments = std::move(arguments);
  return request;
}

}  // namespace

TEST_CASE("ValidateRequest checks the operation name first", "[validator]") {
  auto result = ValidateRequest(MakeRequest("unknown_op", nlohmann::json::object()));
  REQUIRE(result.fault == ValidationFault::kUnknownOperation);
  REQUIRE_THAT(result.message, ContainsSubstring("Unknown executor operation"));
  REQUIRE_THAT(result.message, ContainsSubstring("unknown_op"));
}

TEST_CASE("ValidateRequest requires a code string", "[validator]") {
  SECTION("absent") {
    auto result = ValidateRequest(MakeRequest("run_ts", nlohmann::json::object()));
    REQUIRE(result.fault == ValidationFault::kMissingCode);
    REQUIRE_THAT(result.message, ContainsSubstring("Missing \"code\" string"));
  }
  SECTION("not a string") {
    auto result = ValidateRequest(MakeRequest("run_ts", {{"code", 42}}));
    REQUIRE(result.fault == ValidationFault::kMissingCode);
  }
  SECTION("empty") {
    auto result = ValidateRequest(MakeRequest("run_ts", {{"code", ""}}));
    REQUIRE(result.fault == ValidationFault::kMissingCode);
  }
}

TEST_CASE("ValidateRequest enforces the main export", "[validator]") {
  auto result =
      ValidateRequest(MakeRequest("run_ts", {{"code", "export function helper() { return 1; }"}}));
  REQUIRE(result.fault == ValidationFault::kMissingEntryPoint);
  REQUIRE_THAT(result.message, ContainsSubstring("export an async function named \"main\""));
}

TEST_CASE("ValidateRequest rejects mistyped optional arguments", "[validator]") {
  auto result = ValidateRequest(MakeRequest(
      "run_ts", {{"code", "export async function main() {}"}, {"libraries", "exceljs"}}));
  REQUIRE(result.fault == ValidationFault::kBadArgument);
}

TEST_CASE("ValidateRequest accepts a valid call", "[validator]") {
  auto result = ValidateRequest(MakeRequest(
      "run_ts", {{"code", "export async function main(ctx) { return 1; }"},
                 {"allowNet", true},
                 {"timeoutMs", 500},
                 {"libraries", {"exceljs"}},
                 {"inputs", {{"a", 1}}}}));
  REQUIRE(result.ok());
  REQUIRE(result.args.allow_net);
  REQUIRE(result.args.timeout_ms.value() == 500);
  REQUIRE(result.args.libraries.size() == 1);
  REQUIRE(result.args.inputs["a"] == 1);
}

TEST_CASE("CountAsyncMainExports recognises export forms", "[validator]") {
  REQUIRE(CountAsyncMainExports("export async function main(ctx) {}") == 1);
  REQUIRE(CountAsyncMainExports("export async function main (ctx) {}") == 1);
  REQUIRE(CountAsyncMainExports("export const main = async (ctx) => 1;") == 1);
  REQUIRE(CountAsyncMainExports("export let main = async function () {};") == 1);
  REQUIRE(CountAsyncMainExports("module.exports = { main: async (ctx) => 1 };") == 1);
  REQUIRE(CountAsyncMainExports("module.exports.main = async (ctx) => 1;") == 1);
  REQUIRE(CountAsyncMainExports("exports.main = async function (ctx) {};") == 1);

  REQUIRE(CountAsyncMainExports("export function main(ctx) {}") == 0);
  REQUIRE(CountAsyncMainExports("async function main(ctx) {}") == 0);
  REQUIRE(CountAsyncMainExports("export async function mainly(ctx) {}") == 0);
}

TEST_CASE("CountAsyncMainExports ignores comments and strings", "[validator]") {
  REQUIRE(CountAsyncMainExports("// export async function main() {}\n") == 0);
  REQUIRE(CountAsyncMainExports("/* export async function main() {} */") == 0);
  REQUIRE(CountAsyncMainExports("const s = 'export async function main() {}';") == 0);
  REQUIRE(CountAsyncMainExports("const s = `export async function main() {}`;") == 0);
  REQUIRE(CountAsyncMainExports(
              "const s = `${'x'}`;\nexport async function main() { return s; }") == 1);
}

TEST_CASE("ValidateRequest rejects duplicate main exports", "[validator]") {
  auto result = ValidateRequest(MakeRequest(
      "run_ts", {{"code",
                  "export async function main() {}\nexport const main = async () => 1;"}}));
  REQUIRE(result.fault == ValidationFault::kMissingEntryPoint);
}

TEST_CASE("UsesCommonJsExports", "[validator]") {
  REQUIRE(UsesCommonJsExports("module.exports = { main: async () => 1 };"));
  REQUIRE(UsesCommonJsExports("exports.main = async () => 1;"));
  REQUIRE_FALSE(UsesCommonJsExports("export async function main() {}"));
}

TEST_CASE("BlankCommentsAndStrings preserves layout", "[validator]") {
  std::string source = "const a = 'x'; // note\nconst b = \"y\";";
  std::string blanked = BlankCommentsAndStrings(source);
  REQUIRE(blanked.size() == source.size());
  REQUIRE(blanked.find('\n') == source.find('\n'));
  REQUIRE(blanked.find("note") == std::string::npos);
  REQUIRE(blanked.find("const b") != std::string::npos);
}
