#include <algorithm>
#include <string>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "sandbox/sandbox_runner.h"
#include "sandbox/ts_strip.h"

using namespace scriptbox;
using Catch::Matchers::ContainsSubstring;

namespace {

size_t LineCount(const std::string& s) {
  return static_cast<size_t>(std::count(s.begin(), s.end(), '\n'));
}

// Collapse runs of whitespace so assertions ignore blanked columns
std::string Squash(const std::string& s) {
  std::string out;
  bool space = false;
  for (char c : s) {
    if (c == ' ' || c == '\t') {
      space = true;
      continue;
    }
    if (space && !out.empty() && out.back() != '\n' && c != '\n') out += ' ';
    space = false;
    out += c;
  }
  return out;
}

}  // namespace

TEST_CASE("StripTypeScript erases annotations", "[ts_strip]") {
  std::string source =
      "export async function main(ctx: any): Promise<number> {\n"
      "  const x: number = 5;\n"
      "  return x;\n"
      "}\n";
  std::string stripped = StripTypeScript(source);

  REQUIRE(stripped.size() == source.size());
  REQUIRE(LineCount(stripped) == LineCount(source));
  REQUIRE_THAT(stripped, !ContainsSubstring("Promise<number>"));
  REQUIRE_THAT(stripped, !ContainsSubstring(": any"));
  REQUIRE_THAT(stripped, !ContainsSubstring(": number"));
  REQUIRE(Squash(stripped) ==
          "export async function main(ctx ) {\nconst x = 5;\nreturn x;\n}\n");
}

TEST_CASE("StripTypeScript removes type-only statements", "[ts_strip]") {
  std::string source =
      "interface Row { name: string; age: number }\n"
      "type Pair = { a: string; b: number };\n"
      "export async function main() { return 1; }\n";
  std::string stripped = StripTypeScript(source);

  REQUIRE_THAT(stripped, !ContainsSubstring("interface"));
  REQUIRE_THAT(stripped, !ContainsSubstring("Pair"));
  REQUIRE_THAT(stripped, ContainsSubstring("export async function main() { return 1; }"));
  REQUIRE(LineCount(stripped) == 3);
}

TEST_CASE("StripTypeScript erases assertions", "[ts_strip]") {
  std::string stripped = StripTypeScript("const v = value as string;\nconst n = user!.name;\n");
  REQUIRE(Squash(stripped) == "const v = value ;\nconst n = user .name;\n");
}

TEST_CASE("StripTypeScript leaves plain JavaScript alone", "[ts_strip]") {
  std::string source =
      "const f = (a, b) => a ? b : 0;\n"
      "const s = \"label: value\";\n"
      "const t = `total: ${f(1, 2)}`;\n"
      "if (a < b && c > d) { call(a ? 1 : 2); }\n";
  REQUIRE(StripTypeScript(source) == source);
}

TEST_CASE("PrepareModuleSource wraps CommonJS exports", "[ts_strip]") {
  std::string prepared = PrepareModuleSource("module.exports = { main: async () => 1 };");
  REQUIRE_THAT(prepared, ContainsSubstring("const module = { exports: {} };"));
  REQUIRE_THAT(prepared, ContainsSubstring("export const main = module.exports.main;"));
  // The user code stays on the first line
  REQUIRE(prepared.find("module.exports = { main") < prepared.find('\n'));

  std::string esm = "export async function main() { return 1; }";
  REQUIRE(PrepareModuleSource(esm) == esm);
}

TEST_CASE("StripTypeScript erases class member syntax", "[ts_strip]") {
  std::string source =
      "class Counter implements Tick {\n"
      "  private count: number = 0;\n"
      "  public readonly step: number;\n"
      "  label?: string;\n"
      "  total!: number;\n"
      "  constructor(step: number) {\n"
      "    this.step = step;\n"
      "  }\n"
      "  protected inc(): number {\n"
      "    return this.count += this.step;\n"
      "  }\n"
      "}\n";
  std::string stripped = StripTypeScript(source);

  REQUIRE(stripped.size() == source.size());
  REQUIRE(LineCount(stripped) == LineCount(source));
  REQUIRE(Squash(stripped) ==
          "class Counter {\n"
          "count = 0;\n"
          "step ;\n"
          "label ;\n"
          "total ;\n"
          "constructor(step ) {\n"
          "this.step = step;\n"
          "}\n"
          "inc() {\n"
          "return this.count += this.step;\n"
          "}\n"
          "}\n");

  SECTION("generic base class") {
    std::string generic = StripTypeScript("class Box<T> extends Base<T> {\n  value: T;\n}\n");
    REQUIRE(Squash(generic) == "class Box extends Base {\nvalue ;\n}\n");
  }

  SECTION("plain class bodies keep ternaries and methods") {
    std::string plain =
        "class A {\n"
        "  x = a ? b : c;\n"
        "  static y = { k: 1 };\n"
        "  private() { return 1; }\n"
        "}\n";
    REQUIRE(StripTypeScript(plain) == plain);
  }
}

TEST_CASE("StripTypeScript erases generic arrow parameters", "[ts_strip]") {
  std::string stripped = StripTypeScript("const id = <T,>(x: T): T => x;\n");
  REQUIRE(Squash(stripped) == "const id = (x ) => x;\n");

  std::string call = StripTypeScript("const ok = run(<K extends string>(k: K) => k);\n");
  REQUIRE(Squash(call) == "const ok = run( (k ) => k);\n");

  std::string compare = "const lt = a < b && c > (d);\n";
  REQUIRE(StripTypeScript(compare) == compare);
}

TEST_CASE("StripTypeScript tolerates unterminated literals at end of input", "[ts_strip]") {
  for (std::string source : {std::string("const s = 'abc\\"), std::string("const r = /a\\"),
                             std::string("const t = `abc\\"), std::string("let v: string = \"x\\")}) {
    std::string stripped = StripTypeScript(source);
    REQUIRE(stripped.size() == source.size());
  }
}
