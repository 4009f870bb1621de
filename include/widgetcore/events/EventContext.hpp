#pragma once

#include <widgetcore/core/Geometry.hpp>
#include <widgetcore/core/WidgetId.hpp>

namespace WC {

class WidgetTree;
class DirtyScheduler;
class EventManager;

// Passed explicitly to every handler in place of process-wide state.
struct EventContext {
    WidgetTree&     tree;
    DirtyScheduler& scheduler;
    EventManager&   events;
    WidgetId        target{};  // widget the event resolved to
    WidgetId        current{}; // widget whose handler is running (differs while bubbling)
    Point           local{};   // pointer position relative to current's bounds
};

} // namespace WC
