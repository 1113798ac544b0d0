#pragma once

#include <string>
#include <string_view>

#include "tool/tool_types.h"

namespace scriptbox {

/**
 * Canonical operation and entry point names.
 */
inline constexpr const char* kRunTsOperation = "run_ts";
inline constexpr const char* kEntryPointName = "main";

/**
 * Static fault classes detected before anything executes.
 */
enum class ValidationFault {
  kNone,
  kUnknownOperation,  // RequestFault: operation name not recognised
  kMissingCode,       // RequestFault: `code` absent, not a string or empty
  kBadArgument,       // RequestFault: optional argument with the wrong type
  kMissingEntryPoint  // ContractFault: no single `export async function main`
};

struct ValidationResult {
  ValidationFault fault = ValidationFault::kNone;
  std::string message;
  RunTsArgs args;  // Populated when fault == kNone

  bool ok() const { return fault == ValidationFault::kNone; }
};

/**
 * Validate a tool call without executing anything:
 * operation name, then `code`, then the entry point export contract.
 */
ValidationResult ValidateRequest(const ToolCallRequest& request);

/**
 * Count the async `main` exports in a source text. Recognises the ES module
 * forms `export async function main(` and `export const|let main = async`,
 * and the CommonJS forms `module.exports = { main: async`,
 * `module.exports.main = async` and `exports.main = async`.
 */
int CountAsyncMainExports(std::string_view source);

/**
 * True when the source exports main through module.exports / exports
 * rather than ES module syntax.
 */
bool UsesCommonJsExports(std::string_view source);

/**
 * Replace the contents of comments and string/template literals with
 * spaces, preserving length and line breaks, so textual scans see code only.
 */
std::string BlankCommentsAndStrings(std::string_view source);

}  // namespace scriptbox
