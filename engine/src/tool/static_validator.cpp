#include "tool/static_validator.h"

#include <cctype>
#include <iterator>
#include <regex>
#include <vector>

#include <fmt/format.h>

namespace scriptbox {

namespace {

const std::regex& EsmMainPattern() {
  static const std::regex re(
      R"((^|[^\w$.])export\s+(async\s+function\s*\*?\s*main\s*\(|(const|let|var)\s+main\s*=\s*async\b))");
  return re;
}

const std::regex& CjsMainPattern() {
  static const std::regex re(
      R"((^|[^\w$.])(module\.exports\s*=\s*\{[^}]*?\bmain\s*:\s*async\b|module\.exports\.main\s*=\s*async\b|exports\.main\s*=\s*async\b))");
  return re;
}

int CountMatches(const std::string& text, const std::regex& re) {
  return static_cast<int>(std::distance(
      std::sregex_iterator(text.begin(), text.end(), re), std::sregex_iterator()));
}

bool IsBlank(const std::string& s) {
  for (unsigned char c : s) {
    if (!std::isspace(c)) return false;
  }
  return true;
}

}  // namespace

std::string BlankCommentsAndStrings(std::string_view source) {
  std::string out(source);
  size_t i = 0;
  const size_t n = out.size();

  auto blank = [&](size_t pos) {
    if (out[pos] != '\n') out[pos] = ' ';
  };

  // Template literal nesting: each entry is the brace depth at which the
  // enclosing template resumes.
  std::vector<int> template_stack;
  int brace_depth = 0;

  while (i < n) {
    char c = out[i];
    char next = i + 1 < n ? out[i + 1] : '\0';

    if (c == '/' && next == '/') {
      while (i < n && out[i] != '\n') blank(i++);
      continue;
    }
    if (c == '/' && next == '*') {
      blank(i++);
      blank(i++);
      while (i < n && !(out[i] == '*' && i + 1 < n && out[i + 1] == '/')) blank(i++);
      if (i < n) {
        blank(i++);
        blank(i++);
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      char quote = c;
      ++i;
      while (i < n && out[i] != quote && out[i] != '\n') {
        if (out[i] == '\\' && i + 1 < n) blank(i++);
        blank(i++);
      }
      if (i < n) ++i;
      continue;
    }
    if (c == '`' || (c == '}' && !template_stack.empty() &&
                     template_stack.back() == brace_depth)) {
      if (c == '}') template_stack.pop_back();
      ++i;
      while (i < n && out[i] != '`') {
        if (out[i] == '\\' && i + 1 < n) {
          blank(i++);
          blank(i++);
          continue;
        }
        if (out[i] == '$' && i + 1 < n && out[i + 1] == '{') {
          template_stack.push_back(brace_depth);
          i += 2;
          break;
        }
        blank(i++);
      }
      if (i < n && out[i] == '`') ++i;
      continue;
    }
    if (c == '{') {
      ++brace_depth;
    } else if (c == '}') {
      --brace_depth;
    }
    ++i;
  }
  return out;
}

int CountAsyncMainExports(std::string_view source) {
  std::string code = BlankCommentsAndStrings(source);
  return CountMatches(code, EsmMainPattern()) + CountMatches(code, CjsMainPattern());
}

bool UsesCommonJsExports(std::string_view source) {
  std::string code = BlankCommentsAndStrings(source);
  return CountMatches(code, EsmMainPattern()) == 0 &&
         CountMatches(code, CjsMainPattern()) > 0;
}

ValidationResult ValidateRequest(const ToolCallRequest& request) {
  ValidationResult result;

  if (request.name != kRunTsOperation) {
    result.fault = ValidationFault::kUnknownOperation;
    result.message = fmt::format("Unknown executor operation: {}. Use {}.",
                                 request.name, kRunTsOperation);
    return result;
  }

  const auto& arguments = request.arguments;
  if (!arguments.is_object() || !arguments.contains("code") ||
      !arguments["code"].is_string() ||
      IsBlank(arguments["code"].get<std::string>())) {
    result.fault = ValidationFault::kMissingCode;
    result.message = "Missing \"code\" string.";
    return result;
  }

  std::string error;
  if (!RunTsArgs::FromJson(arguments, result.args, &error)) {
    result.fault = ValidationFault::kBadArgument;
    result.message = fmt::format("Invalid arguments: {}", error);
    return result;
  }

  if (CountAsyncMainExports(result.args.code) != 1) {
    result.fault = ValidationFault::kMissingEntryPoint;
    result.message = fmt::format("Please export an async function named \"{}\"",
                                 kEntryPointName);
    return result;
  }

  return result;
}

}  // namespace scriptbox
