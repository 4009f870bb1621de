#pragma once

#include <widgetcore/core/Error.hpp>
#include <widgetcore/core/WidgetId.hpp>

#include <functional>
#include <memory>
#include <utility>

namespace WC {

struct InputEvent;
struct EventContext;

// Capability implemented by widgets that react to input. Returning true
// consumes the event; false lets it bubble to the parent. Returning an error
// (or throwing) is recorded as a handler fault by the EventManager.
class EventHandler {
public:
    virtual ~EventHandler() = default;

    virtual auto handle_event(InputEvent const& event, EventContext& context) -> Expected<bool> = 0;
};

// Capability implemented by widgets that want focus notifications.
class FocusHandler {
public:
    virtual ~FocusHandler() = default;

    virtual auto on_focus(WidgetId widget) -> void = 0;
    virtual auto on_blur(WidgetId widget) -> void  = 0;
};

using EventCallback = std::function<Expected<bool>(InputEvent const&, EventContext&)>;
using FocusCallback = std::function<void(WidgetId)>;

class CallbackEventHandler final : public EventHandler {
public:
    explicit CallbackEventHandler(EventCallback callback)
        : callback_(std::move(callback)) {}

    auto handle_event(InputEvent const& event, EventContext& context) -> Expected<bool> override {
        if (!callback_) {
            return false;
        }
        return callback_(event, context);
    }

private:
    EventCallback callback_;
};

class CallbackFocusHandler final : public FocusHandler {
public:
    CallbackFocusHandler(FocusCallback on_focus, FocusCallback on_blur)
        : on_focus_(std::move(on_focus))
        , on_blur_(std::move(on_blur)) {}

    auto on_focus(WidgetId widget) -> void override {
        if (on_focus_) {
            on_focus_(widget);
        }
    }

    auto on_blur(WidgetId widget) -> void override {
        if (on_blur_) {
            on_blur_(widget);
        }
    }

private:
    FocusCallback on_focus_;
    FocusCallback on_blur_;
};

[[nodiscard]] inline auto MakeEventHandler(EventCallback callback) -> std::shared_ptr<EventHandler> {
    return std::make_shared<CallbackEventHandler>(std::move(callback));
}

[[nodiscard]] inline auto MakeFocusHandler(FocusCallback on_focus, FocusCallback on_blur = {})
    -> std::shared_ptr<FocusHandler> {
    return std::make_shared<CallbackFocusHandler>(std::move(on_focus), std::move(on_blur));
}

} // namespace WC
