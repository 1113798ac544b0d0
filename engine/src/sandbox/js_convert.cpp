#include "sandbox/js_convert.h"

#include <cmath>
#include <cstdint>

namespace scriptbox {

namespace {

void ClearException(JSContext* ctx) {
  JSValue exc = JS_GetException(ctx);
  JS_FreeValue(ctx, exc);
}

// Copy an ArrayBuffer slice. Returns false (with no pending exception) when
// `val` is not an ArrayBuffer.
bool CopyArrayBuffer(JSContext* ctx, JSValueConst val, size_t offset, int64_t length,
                     std::string* out) {
  size_t size = 0;
  uint8_t* data = JS_GetArrayBuffer(ctx, &size, val);
  if (!data) {
    ClearException(ctx);
    return false;
  }
  if (offset > size) offset = size;
  size_t count = size - offset;
  if (length >= 0 && static_cast<size_t>(length) < count) {
    count = static_cast<size_t>(length);
  }
  out->assign(reinterpret_cast<const char*>(data) + offset, count);
  return true;
}

}  // namespace

// Get string from JS value
std::string JsGetString(JSContext* ctx, JSValueConst val) {
  const char* str = JS_ToCString(ctx, val);
  if (!str) {
    ClearException(ctx);
    return "";
  }
  std::string result(str);
  JS_FreeCString(ctx, str);
  return result;
}

// Convert JS value to nlohmann::json
nlohmann::json JsToJson(JSContext* ctx, JSValueConst val) {
  if (JS_IsNull(val) || JS_IsUndefined(val)) {
    return nullptr;
  }
  if (JS_IsBool(val)) {
    return JS_ToBool(ctx, val) != 0;
  }
  if (JS_IsNumber(val)) {
    double d;
    JS_ToFloat64(ctx, &d, val);
    // Keep integral values integral so they print without a fraction
    if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9007199254740992.0) {
      return static_cast<int64_t>(d);
    }
    return d;
  }
  if (JS_IsString(val)) {
    return JsGetString(ctx, val);
  }
  if (JS_IsFunction(ctx, val)) {
    return nullptr;
  }
  if (JS_IsArray(ctx, val)) {
    nlohmann::json arr = nlohmann::json::array();
    JSValue length_val = JS_GetPropertyStr(ctx, val, "length");
    int64_t length = 0;
    JS_ToInt64(ctx, &length, length_val);
    JS_FreeValue(ctx, length_val);
    for (int64_t i = 0; i < length; i++) {
      JSValue elem = JS_GetPropertyUint32(ctx, val, static_cast<uint32_t>(i));
      arr.push_back(JsToJson(ctx, elem));
      JS_FreeValue(ctx, elem);
    }
    return arr;
  }
  if (JS_IsObject(val)) {
    nlohmann::json obj = nlohmann::json::object();
    JSPropertyEnum* props;
    uint32_t prop_count;
    if (JS_GetOwnPropertyNames(ctx, &props, &prop_count, val,
                               JS_GPN_STRING_MASK | JS_GPN_ENUM_ONLY) == 0) {
      for (uint32_t i = 0; i < prop_count; i++) {
        const char* key = JS_AtomToCString(ctx, props[i].atom);
        if (key) {
          JSValue prop_val = JS_GetProperty(ctx, val, props[i].atom);
          if (!JS_IsFunction(ctx, prop_val)) {
            obj[key] = JsToJson(ctx, prop_val);
          }
          JS_FreeValue(ctx, prop_val);
          JS_FreeCString(ctx, key);
        }
        JS_FreeAtom(ctx, props[i].atom);
      }
      js_free(ctx, props);
    } else {
      ClearException(ctx);
    }
    return obj;
  }
  return nullptr;
}

// Convert nlohmann::json to JS value
JSValue JsonToJs(JSContext* ctx, const nlohmann::json& j) {
  if (j.is_null()) {
    return JS_NULL;
  }
  if (j.is_boolean()) {
    return JS_NewBool(ctx, j.get<bool>());
  }
  if (j.is_number_integer()) {
    return JS_NewInt64(ctx, j.get<int64_t>());
  }
  if (j.is_number_float()) {
    return JS_NewFloat64(ctx, j.get<double>());
  }
  if (j.is_string()) {
    const auto& s = j.get_ref<const std::string&>();
    return JS_NewStringLen(ctx, s.data(), s.size());
  }
  if (j.is_array()) {
    JSValue arr = JS_NewArray(ctx);
    for (size_t i = 0; i < j.size(); i++) {
      JS_SetPropertyUint32(ctx, arr, static_cast<uint32_t>(i), JsonToJs(ctx, j[i]));
    }
    return arr;
  }
  if (j.is_object()) {
    JSValue obj = JS_NewObject(ctx);
    for (auto& [key, val] : j.items()) {
      JS_SetPropertyStr(ctx, obj, key.c_str(), JsonToJs(ctx, val));
    }
    return obj;
  }
  return JS_UNDEFINED;
}

std::optional<nlohmann::json> JsStringifyToJson(JSContext* ctx, JSValueConst val,
                                                std::string* error_out) {
  JSValue text = JS_JSONStringify(ctx, val, JS_UNDEFINED, JS_UNDEFINED);
  if (JS_IsException(text)) {
    JSValue exc = JS_GetException(ctx);
    if (error_out) *error_out = JsDescribeException(ctx, exc).message;
    JS_FreeValue(ctx, exc);
    return std::nullopt;
  }
  if (JS_IsUndefined(text)) {
    return nlohmann::json(nullptr);
  }
  std::string serialized = JsGetString(ctx, text);
  JS_FreeValue(ctx, text);
  try {
    return nlohmann::json::parse(serialized);
  } catch (const std::exception& e) {
    if (error_out) *error_out = std::string("Result is not serializable: ") + e.what();
    return std::nullopt;
  }
}

bool JsGetBytes(JSContext* ctx, JSValueConst val, std::string* out) {
  if (JS_IsString(val)) {
    size_t len = 0;
    const char* str = JS_ToCStringLen(ctx, &len, val);
    if (!str) {
      ClearException(ctx);
      return false;
    }
    out->assign(str, len);
    JS_FreeCString(ctx, str);
    return true;
  }
  if (!JS_IsObject(val)) {
    return false;
  }

  // ArrayBuffer itself
  if (CopyArrayBuffer(ctx, val, 0, -1, out)) {
    return true;
  }

  // Views (typed arrays, DataView): read through buffer/byteOffset/byteLength
  JSValue buffer = JS_GetPropertyStr(ctx, val, "buffer");
  if (JS_IsException(buffer) || !JS_IsObject(buffer)) {
    if (JS_IsException(buffer)) ClearException(ctx);
    JS_FreeValue(ctx, buffer);
    return false;
  }
  int64_t offset = 0;
  int64_t length = -1;
  JSValue offset_val = JS_GetPropertyStr(ctx, val, "byteOffset");
  JSValue length_val = JS_GetPropertyStr(ctx, val, "byteLength");
  if (JS_IsNumber(offset_val)) JS_ToInt64(ctx, &offset, offset_val);
  if (JS_IsNumber(length_val)) JS_ToInt64(ctx, &length, length_val);
  JS_FreeValue(ctx, offset_val);
  JS_FreeValue(ctx, length_val);

  bool ok = CopyArrayBuffer(ctx, buffer, static_cast<size_t>(offset < 0 ? 0 : offset),
                            length, out);
  JS_FreeValue(ctx, buffer);
  return ok;
}

JSValue JsNewUint8Array(JSContext* ctx, const std::string& bytes) {
  JSValue buffer = JS_NewArrayBufferCopy(
      ctx, reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
  if (JS_IsException(buffer)) return buffer;

  JSValue global = JS_GetGlobalObject(ctx);
  JSValue ctor = JS_GetPropertyStr(ctx, global, "Uint8Array");
  JSValue arr = JS_CallConstructor(ctx, ctor, 1, &buffer);
  JS_FreeValue(ctx, ctor);
  JS_FreeValue(ctx, global);
  JS_FreeValue(ctx, buffer);
  return arr;
}

JsErrorInfo JsDescribeException(JSContext* ctx, JSValueConst exception) {
  JsErrorInfo info;
  if (JS_IsError(ctx, exception)) {
    JSValue message = JS_GetPropertyStr(ctx, exception, "message");
    info.message = JS_IsUndefined(message) ? JsGetString(ctx, exception)
                                           : JsGetString(ctx, message);
    JS_FreeValue(ctx, message);

    JSValue stack = JS_GetPropertyStr(ctx, exception, "stack");
    if (JS_IsString(stack)) {
      info.stack = JsGetString(ctx, stack);
    }
    JS_FreeValue(ctx, stack);
  } else {
    info.message = JsGetString(ctx, exception);
  }
  return info;
}

JSValue JsThrowError(JSContext* ctx, const std::string& message) {
  JSValue error = JS_NewError(ctx);
  if (JS_IsException(error)) return error;
  JS_DefinePropertyValueStr(ctx, error, "message",
                            JS_NewStringLen(ctx, message.data(), message.size()),
                            JS_PROP_WRITABLE | JS_PROP_CONFIGURABLE);
  return JS_Throw(ctx, error);
}

}  // namespace scriptbox
