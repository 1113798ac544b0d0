#pragma once

namespace scriptbox {

/**
 * Script evaluating to `function (host) -> ctx`.
 *
 * `host` carries the native bindings and per-call data (inputs, paths, env,
 * file map). The function installs the sandbox globals (console,
 * TextEncoder, TextDecoder) and returns the deep-frozen `ctx` object
 * passed to main().
 */
const char* ContextPreludeSource();

/**
 * ES module source of the builtin `exceljs` module. Imports the native
 * codec from `host:xlsx`.
 */
const char* ExcelJsModuleSource();

}  // namespace scriptbox
