#include <widgetcore/runtime/DebugFlags.hpp>

#include <array>
#include <cctype>
#include <cstdlib>
#include <string>
#include <string_view>

namespace {

constexpr auto kDiagnosticsEnvFlags = std::to_array({
    "WIDGETCORE_DIAGNOSTICS",
    "WIDGETCORE_DEBUG",
});

auto is_blank(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n';
}

} // namespace

namespace WC {

auto ParseTruthy(char const* value) -> bool {
    if (value == nullptr) {
        return false;
    }
    std::string_view text{value};
    while (!text.empty() && is_blank(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_blank(text.back())) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return !(normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no");
}

auto EnvironmentDiagnosticsRequested() -> bool {
    for (auto const* name : kDiagnosticsEnvFlags) {
        if (ParseTruthy(std::getenv(name))) {
            return true;
        }
    }
    return false;
}

} // namespace WC
