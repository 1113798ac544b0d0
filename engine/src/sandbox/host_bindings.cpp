#include "sandbox/host_bindings.h"

#include <algorithm>
#include <cmath>
#include <exception>

#include "sandbox/js_convert.h"
#include "spreadsheet/workbook.h"
#include "spreadsheet/xlsx_reader.h"
#include "spreadsheet/xlsx_writer.h"

namespace scriptbox {

namespace {

// Timer delays are capped so the due time cannot overflow
constexpr double kMaxTimerDelayMs = 2147483647.0;

std::string ArgString(JSContext* ctx, int argc, JSValueConst* argv, int index) {
  return index < argc ? JsGetString(ctx, argv[index]) : std::string();
}

JSValue NewString(JSContext* ctx, const std::string& s) {
  return JS_NewStringLen(ctx, s.data(), s.size());
}

// host.log(level, message)
JSValue HostLog(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  auto* state = GetSandboxState(ctx);
  Tracer::LogScript(state->trace_ctx, ArgString(ctx, argc, argv, 0),
                    ArgString(ctx, argc, argv, 1));
  return JS_UNDEFINED;
}

// host.readFile(name) -> Uint8Array
JSValue HostReadFile(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  if (argc < 1) return JS_ThrowTypeError(ctx, "files.read requires a file name");
  auto* state = GetSandboxState(ctx);
  std::string name = JsGetString(ctx, argv[0]);
  std::string bytes;
  std::string error;
  if (!state->exec_ctx->ReadFile(name, &bytes, &error)) {
    return JsThrowError(ctx, error);
  }
  return JsNewUint8Array(ctx, bytes);
}

// host.writeFile(name, data) -> absolute path
JSValue HostWriteFile(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  if (argc < 2) return JS_ThrowTypeError(ctx, "files.write requires a file name and data");
  auto* state = GetSandboxState(ctx);
  std::string name = JsGetString(ctx, argv[0]);
  std::string bytes;
  if (!JsGetBytes(ctx, argv[1], &bytes)) {
    return JS_ThrowTypeError(ctx, "files.write expects a Uint8Array, ArrayBuffer or string");
  }
  std::string path;
  std::string error;
  if (!state->exec_ctx->WriteFile(name, bytes, &path, &error)) {
    return JsThrowError(ctx, error);
  }
  return NewString(ctx, path);
}

// host.exists(name)
JSValue HostExists(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  auto* state = GetSandboxState(ctx);
  return JS_NewBool(ctx, state->exec_ctx->Exists(ArgString(ctx, argc, argv, 0)));
}

// host.getPath(name)
JSValue HostGetPath(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  auto* state = GetSandboxState(ctx);
  return NewString(ctx, state->exec_ctx->GetPath(ArgString(ctx, argc, argv, 0)));
}

// host.createOutputPath(name)
JSValue HostCreateOutputPath(JSContext* ctx, JSValueConst this_val, int argc,
                             JSValueConst* argv) {
  auto* state = GetSandboxState(ctx);
  std::string path;
  std::string error;
  if (!state->exec_ctx->CreateOutputPath(ArgString(ctx, argc, argv, 0), &path, &error)) {
    return JsThrowError(ctx, error);
  }
  return NewString(ctx, path);
}

// host.generateOutputName(base, ext)
JSValue HostGenerateOutputName(JSContext* ctx, JSValueConst this_val, int argc,
                               JSValueConst* argv) {
  std::string ext = argc > 1 ? ArgString(ctx, argc, argv, 1) : "xlsx";
  return NewString(ctx, GenerateOutputName(ArgString(ctx, argc, argv, 0), ext));
}

// host.getFileType(name)
JSValue HostGetFileType(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  return NewString(ctx, GetFileType(ArgString(ctx, argc, argv, 0)));
}

// host.utf8Encode(string) -> Uint8Array
JSValue HostUtf8Encode(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  if (argc < 1) return JsNewUint8Array(ctx, std::string());
  size_t len = 0;
  const char* str = JS_ToCStringLen(ctx, &len, argv[0]);
  if (!str) return JS_EXCEPTION;
  std::string bytes(str, len);
  JS_FreeCString(ctx, str);
  return JsNewUint8Array(ctx, bytes);
}

// host.utf8Decode(bytes) -> string
JSValue HostUtf8Decode(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  std::string bytes;
  if (argc < 1 || !JsGetBytes(ctx, argv[0], &bytes)) {
    return JS_ThrowTypeError(ctx, "TextDecoder.decode expects an ArrayBuffer or a view");
  }
  return NewString(ctx, bytes);
}

// setTimeout(callback, delay, ...args) -> id
JSValue SetTimeout(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  if (argc < 1 || !JS_IsFunction(ctx, argv[0])) {
    return JS_ThrowTypeError(ctx, "setTimeout requires a callback function");
  }
  auto* state = GetSandboxState(ctx);

  double delay = 0;
  if (argc > 1 && JS_ToFloat64(ctx, &delay, argv[1]) < 0) {
    return JS_EXCEPTION;
  }
  if (!std::isfinite(delay) || delay < 0) delay = 0;
  delay = std::min(delay, kMaxTimerDelayMs);

  PendingTimer timer;
  timer.id = state->next_timer_id++;
  timer.seq = state->timer_seq++;
  timer.due = std::chrono::steady_clock::now() +
              std::chrono::milliseconds(static_cast<int64_t>(delay));
  timer.callback = JS_DupValue(ctx, argv[0]);
  for (int i = 2; i < argc; i++) {
    timer.args.push_back(JS_DupValue(ctx, argv[i]));
  }
  state->timers.push_back(std::move(timer));
  return JS_NewInt64(ctx, state->timers.back().id);
}

// clearTimeout(id)
JSValue ClearTimeout(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  if (argc < 1 || !JS_IsNumber(argv[0])) return JS_UNDEFINED;
  auto* state = GetSandboxState(ctx);
  int64_t id = 0;
  JS_ToInt64(ctx, &id, argv[0]);
  auto it = std::find_if(state->timers.begin(), state->timers.end(),
                         [id](const PendingTimer& t) { return t.id == id; });
  if (it != state->timers.end()) {
    JS_FreeValue(ctx, it->callback);
    for (JSValue arg : it->args) JS_FreeValue(ctx, arg);
    state->timers.erase(it);
  }
  return JS_UNDEFINED;
}

// __scriptbox_capture(namespace)
JSValue CaptureNamespace(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  auto* state = GetSandboxState(ctx);
  if (argc > 0) {
    JS_FreeValue(ctx, state->user_namespace);
    state->user_namespace = JS_DupValue(ctx, argv[0]);
  }
  return JS_UNDEFINED;
}

// xlsx encode(model) -> Uint8Array
JSValue XlsxEncode(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  if (argc < 1) return JS_ThrowTypeError(ctx, "encode requires a workbook model");
  try {
    std::string error;
    auto model = JsStringifyToJson(ctx, argv[0], &error);
    if (!model) {
      return JS_ThrowTypeError(ctx, "%s", error.c_str());
    }
    Workbook workbook;
    if (!Workbook::FromJson(*model, &workbook, &error)) {
      return JS_ThrowTypeError(ctx, "%s", error.c_str());
    }
    std::string bytes;
    if (!WriteXlsx(workbook, &bytes, &error)) {
      return JsThrowError(ctx, error);
    }
    return JsNewUint8Array(ctx, bytes);
  } catch (const std::exception& e) {
    return JsThrowError(ctx, std::string("Failed to write xlsx: ") + e.what());
  }
}

// xlsx decode(bytes) -> workbook model
JSValue XlsxDecode(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  try {
    std::string bytes;
    if (argc < 1 || JS_IsString(argv[0]) || !JsGetBytes(ctx, argv[0], &bytes)) {
      return JS_ThrowTypeError(ctx, "xlsx.load expects a Uint8Array or ArrayBuffer");
    }
    auto* state = GetSandboxState(ctx);
    size_t max_part = kDefaultMaxZipEntrySize;
    if (state && state->memory_limit_bytes > 0) {
      max_part = std::min(max_part, state->memory_limit_bytes);
    }
    Workbook workbook;
    std::string error;
    if (!ReadXlsx(bytes, &workbook, &error, max_part)) {
      return JsThrowError(ctx, "Failed to read xlsx: " + error);
    }
    return JsonToJs(ctx, workbook.ToJson());
  } catch (const std::exception& e) {
    return JsThrowError(ctx, std::string("Failed to read xlsx: ") + e.what());
  }
}

int HostXlsxInit(JSContext* ctx, JSModuleDef* m) {
  JS_SetModuleExport(ctx, m, "encode", JS_NewCFunction(ctx, XlsxEncode, "encode", 1));
  JS_SetModuleExport(ctx, m, "decode", JS_NewCFunction(ctx, XlsxDecode, "decode", 1));
  return 0;
}

void SetFunction(JSContext* ctx, JSValueConst obj, const char* name, JSCFunction* fn,
                 int length) {
  JS_SetPropertyStr(ctx, obj, name, JS_NewCFunction(ctx, fn, name, length));
}

}  // namespace

SandboxState* GetSandboxState(JSContext* ctx) {
  return static_cast<SandboxState*>(JS_GetContextOpaque(ctx));
}

void InstallSandboxGlobals(JSContext* ctx) {
  JSValue global = JS_GetGlobalObject(ctx);
  SetFunction(ctx, global, "setTimeout", SetTimeout, 2);
  SetFunction(ctx, global, "clearTimeout", ClearTimeout, 1);
  SetFunction(ctx, global, kCaptureFunctionName, CaptureNamespace, 1);
  JS_FreeValue(ctx, global);
}

JSValue NewHostObject(JSContext* ctx, const ExecutionContext& exec_ctx) {
  JSValue host = JS_NewObject(ctx);

  SetFunction(ctx, host, "log", HostLog, 2);
  SetFunction(ctx, host, "readFile", HostReadFile, 1);
  SetFunction(ctx, host, "writeFile", HostWriteFile, 2);
  SetFunction(ctx, host, "exists", HostExists, 1);
  SetFunction(ctx, host, "getPath", HostGetPath, 1);
  SetFunction(ctx, host, "createOutputPath", HostCreateOutputPath, 1);
  SetFunction(ctx, host, "generateOutputName", HostGenerateOutputName, 2);
  SetFunction(ctx, host, "getFileType", HostGetFileType, 1);
  SetFunction(ctx, host, "utf8Encode", HostUtf8Encode, 1);
  SetFunction(ctx, host, "utf8Decode", HostUtf8Decode, 1);

  const ContextPaths& paths = exec_ctx.paths();
  const EnvFacts& env = exec_ctx.env();

  JS_SetPropertyStr(ctx, host, "inputs", JsonToJs(ctx, exec_ctx.inputs()));
  JS_SetPropertyStr(ctx, host, "fileMap",
                    JsonToJs(ctx, nlohmann::json(exec_ctx.file_path_map())));
  JS_SetPropertyStr(ctx, host, "paths",
                    JsonToJs(ctx, {{"output", paths.output},
                                   {"temp", paths.temp},
                                   {"downloads", paths.downloads}}));
  JS_SetPropertyStr(ctx, host, "env",
                    JsonToJs(ctx, {{"platform", env.platform},
                                   {"arch", env.arch},
                                   {"appName", env.app_name}}));
  JS_SetPropertyStr(ctx, host, "mimeTypes",
                    JsonToJs(ctx, {{"XLSX", mime::kXlsx},
                                   {"XLS", mime::kXls},
                                   {"CSV", mime::kCsv}}));
  return host;
}

JSModuleDef* NewHostXlsxModule(JSContext* ctx, const char* module_name) {
  JSModuleDef* m = JS_NewCModule(ctx, module_name, HostXlsxInit);
  if (!m) return nullptr;
  JS_AddModuleExport(ctx, m, "encode");
  JS_AddModuleExport(ctx, m, "decode");
  return m;
}

void FreeTimers(JSContext* ctx, SandboxState* state) {
  for (auto& timer : state->timers) {
    JS_FreeValue(ctx, timer.callback);
    for (JSValue arg : timer.args) JS_FreeValue(ctx, arg);
  }
  state->timers.clear();
}

}  // namespace scriptbox
