#include <widgetcore/scheduler/DirtyScheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>

namespace WC {

DirtyScheduler::DirtyScheduler(WidgetTree& tree)
    : tree_(tree) {}

auto DirtyScheduler::mark_dirty(WidgetId widget, DirtyKind kinds) -> bool {
    auto* node = tree_.node(widget);
    if (node == nullptr) {
        ++stale_marks_;
        dirty_.erase(widget);
        wc_log("Skipped dirty mark for detached widget", "DirtyScheduler");
        return false;
    }
    ++total_marks_;
    node->dirty |= kinds;
    if (dirty_.try_emplace(widget, next_sequence_).second) {
        order_.push_back(OrderEntry{.widget = widget, .sequence = next_sequence_++});
    }
    return true;
}

auto DirtyScheduler::is_dirty(WidgetId widget) const -> bool {
    return dirty_.contains(widget);
}

auto DirtyScheduler::dirty_kinds(WidgetId widget) const -> DirtyKind {
    auto const* node = tree_.node(widget);
    if (node == nullptr) {
        return DirtyKind::None;
    }
    return node->dirty;
}

auto DirtyScheduler::dirty_widgets() const -> std::vector<WidgetId> {
    std::vector<WidgetId> out;
    out.reserve(dirty_.size());
    for (auto const& entry : order_) {
        if (is_live(entry)) {
            out.push_back(entry.widget);
        }
    }
    return out;
}

auto DirtyScheduler::layout_roots() const -> std::vector<WidgetId> {
    std::vector<WidgetId> roots;
    for (auto id : dirty_widgets()) {
        auto const* node = tree_.node(id);
        if (node == nullptr || !hasDirtyKind(node->dirty, DirtyKind::Layout)) {
            continue;
        }
        bool covered = false;
        for (auto const* walk = tree_.node(node->parent); walk != nullptr; walk = tree_.node(walk->parent)) {
            if (hasDirtyKind(walk->dirty, DirtyKind::Layout)) {
                covered = true;
                break;
            }
        }
        if (!covered) {
            roots.push_back(id);
        }
    }
    return roots;
}

auto DirtyScheduler::damage_rects() const -> std::vector<Rect> {
    std::vector<Rect> rects;
    for (auto id : dirty_widgets()) {
        auto const* node = tree_.node(id);
        if (node == nullptr || !hasDirtyKind(node->dirty, DirtyKind::Visual) || node->bounds.empty()) {
            continue;
        }
        rects.push_back(node->bounds);
    }
    return rects;
}

auto DirtyScheduler::clear(WidgetId widget) -> void {
    if (auto* node = tree_.node(widget)) {
        node->dirty = DirtyKind::None;
    }
    dirty_.erase(widget);
    compact_order();
}

auto DirtyScheduler::clear(std::span<WidgetId const> widgets) -> void {
    for (auto id : widgets) {
        if (auto* node = tree_.node(id)) {
            node->dirty = DirtyKind::None;
        }
        dirty_.erase(id);
    }
    compact_order();
}

auto DirtyScheduler::clear_all() -> void {
    for (auto const& entry : dirty_) {
        if (auto* node = tree_.node(entry.first)) {
            node->dirty = DirtyKind::None;
        }
    }
    dirty_.clear();
    order_.clear();
}

auto DirtyScheduler::forget(WidgetId widget) -> void {
    dirty_.erase(widget);
    compact_order();
}

auto DirtyScheduler::compact_order() -> void {
    if (dirty_.empty()) {
        order_.clear();
        return;
    }
    if (order_.size() <= 2 * dirty_.size() + 16) {
        return;
    }
    std::erase_if(order_, [this](OrderEntry const& entry) { return !is_live(entry); });
}

auto DirtyScheduler::is_live(OrderEntry const& entry) const -> bool {
    auto it = dirty_.find(entry.widget);
    return it != dirty_.end() && it->second == entry.sequence;
}

} // namespace WC
