#pragma once

#include <widgetcore/core/Error.hpp>
#include <widgetcore/core/Geometry.hpp>
#include <widgetcore/core/WidgetTree.hpp>
#include <widgetcore/events/EventManager.hpp>
#include <widgetcore/reactive/Link.hpp>
#include <widgetcore/runtime/RuntimeConfig.hpp>
#include <widgetcore/scheduler/DirtyScheduler.hpp>
#include <widgetcore/spatial/SpatialIndex.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <utility>

namespace WC {

class FrameLoop;

struct FrameCallbacks {
    // Receives the minimal subtrees to lay out; expected to call apply_layout.
    std::function<void(FrameLoop&, std::span<WidgetId const> layout_roots)> layout;
    // Receives every dirty widget and the damaged area. Widgets passed here
    // are cleared once the callback returns.
    std::function<void(FrameLoop&, std::span<WidgetId const> dirty, std::span<Rect const> damage)> render;
};

struct FrameReport {
    std::uint64_t            frame_index      = 0;
    std::size_t              events_processed = 0;
    std::size_t              events_pending   = 0;
    std::size_t              layout_roots     = 0;
    std::size_t              rendered         = 0;
    std::size_t              damage_rects     = 0;
    bool                     index_rebuilt    = false;
    std::chrono::nanoseconds budget{};
};

// Owns the widget tree and the three services around it, and runs one frame
// as drain, layout, render, clear.
class FrameLoop {
public:
    explicit FrameLoop(RuntimeConfig config = {});

    FrameLoop(FrameLoop const&)            = delete;
    FrameLoop& operator=(FrameLoop const&) = delete;

    // No parent creates a new root.
    auto create_widget(std::optional<WidgetId> parent, WidgetSpec spec) -> Expected<WidgetId>;
    auto destroy_widget(WidgetId widget) -> Expected<void>;
    auto set_visible(WidgetId widget, bool visible) -> Expected<void>;
    auto apply_layout(WidgetId widget, Rect bounds) -> Expected<void>;

    auto post(InputEvent event) -> void {
        events_.post(std::move(event));
    }

    template <typename T>
    [[nodiscard]] auto make_link(T initial) -> Link<T> {
        return Link<T>(scheduler_, std::move(initial));
    }

    auto run_frame(FrameCallbacks const& callbacks) -> FrameReport;
    auto run_frame(FrameCallbacks const& callbacks, std::chrono::nanoseconds budget) -> FrameReport;

    [[nodiscard]] auto tree() -> WidgetTree& {
        return tree_;
    }
    [[nodiscard]] auto tree() const -> WidgetTree const& {
        return tree_;
    }
    [[nodiscard]] auto index() -> SpatialIndex& {
        return index_;
    }
    [[nodiscard]] auto index() const -> SpatialIndex const& {
        return index_;
    }
    [[nodiscard]] auto scheduler() -> DirtyScheduler& {
        return scheduler_;
    }
    [[nodiscard]] auto scheduler() const -> DirtyScheduler const& {
        return scheduler_;
    }
    [[nodiscard]] auto events() -> EventManager& {
        return events_;
    }
    [[nodiscard]] auto events() const -> EventManager const& {
        return events_;
    }
    [[nodiscard]] auto config() const -> RuntimeConfig const& {
        return config_;
    }
    [[nodiscard]] auto frame_count() const -> std::uint64_t {
        return frame_count_;
    }

private:
    auto sync_index(WidgetId root) -> void;
    auto refresh_paint_order() -> bool;

    RuntimeConfig  config_;
    WidgetTree     tree_{};
    SpatialIndex   index_{};
    DirtyScheduler scheduler_;
    EventManager   events_;
    // Set when a structural change may have broken index stacking; the next
    // frame rebuilds the index in tree paint order before hit testing.
    bool           paint_order_stale_ = false;
    std::uint64_t  frame_count_       = 0;
};

} // namespace WC
