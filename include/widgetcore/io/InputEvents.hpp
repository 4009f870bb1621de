#pragma once

#include <widgetcore/core/WidgetId.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace WC {

enum class InputKind : std::uint8_t {
    PointerMove = 0,
    PointerDown,
    PointerUp,
    PointerWheel,
    PointerHover,
    TouchStart,
    TouchMove,
    TouchEnd,
    KeyDown,
    KeyUp,
    Text,
};

inline constexpr std::size_t kInputKindCount = static_cast<std::size_t>(InputKind::Text) + 1;

inline constexpr auto kAllInputKinds = std::array<InputKind, kInputKindCount>{
    InputKind::PointerMove, InputKind::PointerDown, InputKind::PointerUp,  InputKind::PointerWheel,
    InputKind::PointerHover, InputKind::TouchStart, InputKind::TouchMove, InputKind::TouchEnd,
    InputKind::KeyDown,     InputKind::KeyUp,      InputKind::Text,
};

[[nodiscard]] constexpr auto kindIndex(InputKind kind) -> std::size_t {
    return static_cast<std::size_t>(kind);
}

// Pointer-class events resolve by coordinate, keyboard-class ones by focus.
[[nodiscard]] constexpr auto isPointerKind(InputKind kind) -> bool {
    switch (kind) {
    case InputKind::PointerMove:
    case InputKind::PointerDown:
    case InputKind::PointerUp:
    case InputKind::PointerWheel:
    case InputKind::PointerHover:
    case InputKind::TouchStart:
    case InputKind::TouchMove:
    case InputKind::TouchEnd:
        return true;
    case InputKind::KeyDown:
    case InputKind::KeyUp:
    case InputKind::Text:
        return false;
    }
    return false;
}

[[nodiscard]] constexpr auto isKeyboardKind(InputKind kind) -> bool {
    return !isPointerKind(kind);
}

[[nodiscard]] constexpr auto inputKindName(InputKind kind) -> std::string_view {
    switch (kind) {
    case InputKind::PointerMove:
        return "pointer_move";
    case InputKind::PointerDown:
        return "pointer_down";
    case InputKind::PointerUp:
        return "pointer_up";
    case InputKind::PointerWheel:
        return "pointer_wheel";
    case InputKind::PointerHover:
        return "pointer_hover";
    case InputKind::TouchStart:
        return "touch_start";
    case InputKind::TouchMove:
        return "touch_move";
    case InputKind::TouchEnd:
        return "touch_end";
    case InputKind::KeyDown:
        return "key_down";
    case InputKind::KeyUp:
        return "key_up";
    case InputKind::Text:
        return "text";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto inputKindFromName(std::string_view name) -> std::optional<InputKind> {
    for (auto kind : kAllInputKinds) {
        if (inputKindName(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

enum class ButtonModifiers : std::uint32_t {
    None     = 0,
    Shift    = 1u << 0,
    Control  = 1u << 1,
    Alt      = 1u << 2,
    Command  = 1u << 3,
    Function = 1u << 4
};

[[nodiscard]] constexpr auto operator|(ButtonModifiers lhs, ButtonModifiers rhs) -> ButtonModifiers {
    return static_cast<ButtonModifiers>(static_cast<std::uint32_t>(lhs) |
                                        static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(ButtonModifiers lhs, ButtonModifiers rhs) -> ButtonModifiers {
    return static_cast<ButtonModifiers>(static_cast<std::uint32_t>(lhs) &
                                        static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr auto hasModifier(ButtonModifiers value, ButtonModifiers flag) -> bool {
    return (value & flag) != ButtonModifiers::None;
}

namespace Keys {
inline constexpr std::uint32_t Tab       = 0x09;
inline constexpr std::uint32_t Enter     = 0x0D;
inline constexpr std::uint32_t Escape    = 0x1B;
inline constexpr std::uint32_t Space     = 0x20;
inline constexpr std::uint32_t Backspace = 0x08;
} // namespace Keys

struct InputEvent {
    InputKind       kind = InputKind::PointerMove;
    // Monotonic, supplied by the input source; coalescing compares these.
    std::chrono::nanoseconds timestamp{};
    float           x        = 0.0f;
    float           y        = 0.0f;
    float           wheel_dx = 0.0f;
    float           wheel_dy = 0.0f;
    int             button   = 0;
    std::uint64_t   pointer_id = 0;
    std::uint32_t   key_code = 0;
    char32_t        codepoint = 0;
    ButtonModifiers modifiers = ButtonModifiers::None;
    bool            repeat    = false;
    // Routes the event to this widget instead of hit-testing or focus
    // (pointer capture, scripted input).
    std::optional<WidgetId> target{};
};

[[nodiscard]] inline auto MakePointerEvent(InputKind kind, float x, float y, std::chrono::nanoseconds timestamp = {})
    -> InputEvent {
    InputEvent event{};
    event.kind      = kind;
    event.x         = x;
    event.y         = y;
    event.timestamp = timestamp;
    return event;
}

[[nodiscard]] inline auto MakeWheelEvent(float x, float y, float dx, float dy, std::chrono::nanoseconds timestamp = {})
    -> InputEvent {
    auto event     = MakePointerEvent(InputKind::PointerWheel, x, y, timestamp);
    event.wheel_dx = dx;
    event.wheel_dy = dy;
    return event;
}

[[nodiscard]] inline auto MakeKeyEvent(InputKind kind,
                                       std::uint32_t key_code,
                                       ButtonModifiers modifiers = ButtonModifiers::None,
                                       std::chrono::nanoseconds timestamp = {}) -> InputEvent {
    InputEvent event{};
    event.kind      = kind;
    event.key_code  = key_code;
    event.modifiers = modifiers;
    event.timestamp = timestamp;
    return event;
}

[[nodiscard]] inline auto MakeTextEvent(char32_t codepoint, std::chrono::nanoseconds timestamp = {}) -> InputEvent {
    InputEvent event{};
    event.kind      = InputKind::Text;
    event.codepoint = codepoint;
    event.timestamp = timestamp;
    return event;
}

} // namespace WC
