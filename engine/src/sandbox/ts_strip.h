#pragma once

#include <string>
#include <string_view>

namespace scriptbox {

/**
 * Erase TypeScript-only syntax from a module source so it can be evaluated
 * as plain JavaScript.
 *
 * Erased constructs are overwritten with spaces (line breaks are kept), so
 * line and column numbers in stack traces still match the submitted code.
 *
 * Handles:
 * - parameter, variable and return type annotations (`x: T`, `): T {`)
 * - optional parameter markers (`x?: T`)
 * - `as T`, `as const` and `satisfies T` expressions
 * - non-null assertions (`value!.field`)
 * - generic parameters/arguments on declarations and calls (`f<T>(...)`)
 * - generic arrow functions (`<T,>(x: T) => x`)
 * - `interface`, `type` alias, `declare` and `import type` statements
 * - class members: access modifiers (`private`, `public`, `protected`,
 *   `readonly`, `override`, `abstract`), field annotations (`count: number = 0`),
 *   `?`/`!` field markers and `implements` clauses
 *
 * Sources that use runtime-affecting TypeScript features (enums, namespaces,
 * parameter properties, decorators) and abstract methods without a body are
 * passed through unchanged and fail in the interpreter with a syntax error.
 */
std::string StripTypeScript(std::string_view source);

}  // namespace scriptbox
