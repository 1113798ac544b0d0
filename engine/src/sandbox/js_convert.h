#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

extern "C" {
#include "quickjs.h"
}

namespace scriptbox {

// Get string from JS value (empty when the conversion throws)
std::string JsGetString(JSContext* ctx, JSValueConst val);

// Convert JS value to nlohmann::json (structural walk, functions dropped)
nlohmann::json JsToJson(JSContext* ctx, JSValueConst val);

// Convert nlohmann::json to JS value
JSValue JsonToJs(JSContext* ctx, const nlohmann::json& j);

/**
 * Serialize a JS value with JSON.stringify semantics (toJSON, Date, dropped
 * undefined members) and parse it back as nlohmann::json.
 * `undefined` and functions become null. Returns std::nullopt and sets
 * error_out when stringify throws (e.g. a cyclic structure).
 */
std::optional<nlohmann::json> JsStringifyToJson(JSContext* ctx, JSValueConst val,
                                                std::string* error_out = nullptr);

/**
 * Copy bytes out of a Uint8Array / typed array / ArrayBuffer / DataView.
 * Strings are encoded as UTF-8. Returns false for any other value.
 */
bool JsGetBytes(JSContext* ctx, JSValueConst val, std::string* out);

// Create a Uint8Array holding a copy of the given bytes
JSValue JsNewUint8Array(JSContext* ctx, const std::string& bytes);

/**
 * Describe a thrown value: `message` for Error objects (String(value)
 * otherwise) and the `stack` property when present.
 */
struct JsErrorInfo {
  std::string message;
  std::string stack;
};

JsErrorInfo JsDescribeException(JSContext* ctx, JSValueConst exception);

// Throw a plain `Error` with the given message. Returns JS_EXCEPTION.
JSValue JsThrowError(JSContext* ctx, const std::string& message);

}  // namespace scriptbox
