#pragma once

#include <string_view>

namespace WC {

// Interprets an environment value the way every WIDGETCORE_* switch does:
// unset is false, empty or any value other than 0/false/off/no is true.
[[nodiscard]] auto ParseTruthy(char const* value) -> bool;

// Returns true when WIDGETCORE_DIAGNOSTICS (alias WIDGETCORE_DEBUG) asks for
// budget and coalescing diagnostics. Read on every call so tests can toggle it.
[[nodiscard]] auto EnvironmentDiagnosticsRequested() -> bool;

} // namespace WC
