#include <widgetcore/runtime/FrameLoop.hpp>

#include "log/TaggedLogger.hpp"

#include <sstream>
#include <vector>

namespace WC {

FrameLoop::FrameLoop(RuntimeConfig config)
    : config_(std::move(config))
    , scheduler_(tree_)
    , events_(tree_, index_, scheduler_, config_.events) {}

auto FrameLoop::create_widget(std::optional<WidgetId> parent, WidgetSpec spec) -> Expected<WidgetId> {
    WidgetId widget{};
    if (parent) {
        auto created = tree_.create_child(*parent, std::move(spec));
        if (!created) {
            return std::unexpected(created.error());
        }
        widget = *created;
        scheduler_.mark_dirty(*parent, DirtyKind::Layout);
    } else {
        widget = tree_.create_root(std::move(spec));
    }
    scheduler_.mark_dirty(widget, DirtyKind::All);

    if (tree_.is_effectively_visible(widget)) {
        auto const* node = tree_.node(widget);
        index_.insert(widget, node->bounds);
        // A child inserted under an earlier sibling paints below later siblings.
        paint_order_stale_ = true;
    }
    return widget;
}

auto FrameLoop::destroy_widget(WidgetId widget) -> Expected<void> {
    if (!tree_.contains(widget)) {
        std::ostringstream oss;
        oss << "Cannot destroy dead widget " << widget;
        return std::unexpected(Error{Error::Code::InvalidWidget, oss.str()});
    }

    auto const parent = tree_.parent(widget);
    for (auto id : tree_.subtree(widget)) {
        events_.widget_removed(id);
        index_.remove(id);
        scheduler_.forget(id);
    }

    auto destroyed = tree_.destroy(widget);
    if (!destroyed) {
        return std::unexpected(destroyed.error());
    }
    if (parent) {
        scheduler_.mark_dirty(*parent, DirtyKind::Layout | DirtyKind::Visual);
    }
    wc_log("Destroyed " + std::to_string(destroyed->size()) + " widget(s)", "FrameLoop");
    return {};
}

auto FrameLoop::sync_index(WidgetId root) -> void {
    for (auto id : tree_.subtree(root)) {
        if (tree_.is_effectively_visible(id)) {
            if (!index_.contains(id)) {
                index_.insert(id, tree_.node(id)->bounds);
                paint_order_stale_ = true;
            }
        } else {
            index_.remove(id);
        }
    }
}

auto FrameLoop::set_visible(WidgetId widget, bool visible) -> Expected<void> {
    if (auto result = tree_.set_visible(widget, visible); !result) {
        return result;
    }
    sync_index(widget);
    if (!visible) {
        auto const focus = events_.focused();
        if (focus && (*focus == widget || tree_.is_ancestor(widget, *focus))) {
            events_.clear_focus();
        }
    }
    scheduler_.mark_dirty(widget, DirtyKind::Visual);
    if (auto parent = tree_.parent(widget)) {
        scheduler_.mark_dirty(*parent, DirtyKind::Layout | DirtyKind::Visual);
    }
    return {};
}

auto FrameLoop::apply_layout(WidgetId widget, Rect bounds) -> Expected<void> {
    auto const* node = tree_.node(widget);
    if (node == nullptr) {
        std::ostringstream oss;
        oss << "Cannot lay out dead widget " << widget;
        return std::unexpected(Error{Error::Code::InvalidWidget, oss.str()});
    }
    if (node->bounds == bounds) {
        return {};
    }
    if (auto result = tree_.set_bounds(widget, bounds); !result) {
        return result;
    }
    if (tree_.is_effectively_visible(widget)) {
        index_.update(widget, bounds);
    }
    scheduler_.mark_dirty(widget, DirtyKind::Visual);
    return {};
}

auto FrameLoop::refresh_paint_order() -> bool {
    if (!paint_order_stale_) {
        return false;
    }
    index_.rebuild(tree_);
    paint_order_stale_ = false;
    return true;
}

auto FrameLoop::run_frame(FrameCallbacks const& callbacks) -> FrameReport {
    return run_frame(callbacks, config_.frame_budget);
}

auto FrameLoop::run_frame(FrameCallbacks const& callbacks, std::chrono::nanoseconds budget) -> FrameReport {
    FrameReport report{};
    report.frame_index = frame_count_++;
    report.budget      = budget;

    report.index_rebuilt    = refresh_paint_order();
    report.events_processed = events_.drain(budget);
    report.events_pending   = events_.pending_count();

    auto const layout_roots = scheduler_.layout_roots();
    report.layout_roots     = layout_roots.size();
    if (callbacks.layout && !layout_roots.empty()) {
        callbacks.layout(*this, layout_roots);
    }
    // Handlers and layout may have added or shown widgets.
    report.index_rebuilt = refresh_paint_order() || report.index_rebuilt;

    auto const dirty  = scheduler_.dirty_widgets();
    auto const damage = scheduler_.damage_rects();
    report.damage_rects = damage.size();
    if (callbacks.render && !dirty.empty()) {
        callbacks.render(*this, dirty, damage);
        scheduler_.clear(std::span<WidgetId const>{dirty});
        report.rendered = dirty.size();
    }

    if (config_.events.diagnostics && report.events_pending > 0) {
        wc_log("Frame " + std::to_string(report.frame_index) + " deferred " + std::to_string(report.events_pending)
                   + " event(s)",
               "FrameLoop");
    }
    return report;
}

} // namespace WC
