#include <widgetcore/spatial/SpatialIndex.hpp>

#include <widgetcore/core/WidgetTree.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>

namespace WC {

auto SpatialIndex::insert_intervals(WidgetId widget, SpatialEntry& entry) -> void {
    entry.indexed = false;
    if (entry.bounds.empty()) {
        return;
    }
    auto const& r       = entry.bounds;
    auto const  x_added = x_tree_.insert(r.x, r.right(), widget);
    auto const  y_added = y_tree_.insert(r.y, r.bottom(), widget);
    if (x_added && y_added) {
        entry.indexed = true;
        return;
    }
    // Positive area but a degenerate axis (float overflow); keep both trees in step.
    if (x_added) {
        x_tree_.remove(r.x, widget);
    }
    if (y_added) {
        y_tree_.remove(r.y, widget);
    }
}

auto SpatialIndex::remove_intervals(WidgetId widget, SpatialEntry const& entry) -> void {
    if (!entry.indexed) {
        return;
    }
    auto const x_removed = x_tree_.remove(entry.bounds.x, widget);
    auto const y_removed = y_tree_.remove(entry.bounds.y, widget);
    if (!x_removed || !y_removed) {
        wc_log("Axis interval missing while removing widget", "SpatialIndex", "ERROR");
    }
}

auto SpatialIndex::insert(WidgetId widget, Rect const& bounds, std::optional<std::uint64_t> paint_order) -> void {
    auto found = entries_.find(widget);
    if (found != entries_.end()) {
        remove_intervals(widget, found->second);
        found->second.bounds = bounds;
        if (paint_order) {
            found->second.paint_order = *paint_order;
            next_paint_order_         = std::max(next_paint_order_, *paint_order + 1);
        }
        insert_intervals(widget, found->second);
        return;
    }

    SpatialEntry entry{};
    entry.bounds = bounds;
    if (paint_order) {
        entry.paint_order = *paint_order;
        next_paint_order_ = std::max(next_paint_order_, *paint_order + 1);
    } else {
        entry.paint_order = next_paint_order_++;
    }
    insert_intervals(widget, entry);
    entries_.emplace(widget, entry);
}

auto SpatialIndex::remove(WidgetId widget) -> bool {
    auto found = entries_.find(widget);
    if (found == entries_.end()) {
        return false;
    }
    remove_intervals(widget, found->second);
    entries_.erase(found);
    return true;
}

auto SpatialIndex::update(WidgetId widget, Rect const& bounds) -> void {
    insert(widget, bounds, std::nullopt);
}

auto SpatialIndex::clear() -> void {
    entries_.clear();
    x_tree_.clear();
    y_tree_.clear();
    next_paint_order_ = 0;
}

auto SpatialIndex::rebuild(WidgetTree const& tree) -> void {
    clear();
    std::uint64_t order = 0;
    for (auto id : tree.paint_order()) {
        if (!tree.is_effectively_visible(id)) {
            continue;
        }
        auto const* node = tree.node(id);
        insert(id, node->bounds, order++);
    }
    wc_log("Rebuilt spatial index with " + std::to_string(entries_.size()) + " entries", "SpatialIndex");
}

auto SpatialIndex::intersect(std::vector<WidgetId> const& xs, std::vector<WidgetId> const& ys) const
    -> std::vector<WidgetId> {
    std::vector<WidgetId> out;
    if (xs.empty() || ys.empty()) {
        return out;
    }
    auto const& smaller = xs.size() <= ys.size() ? xs : ys;
    auto const& larger  = xs.size() <= ys.size() ? ys : xs;

    phmap::flat_hash_set<WidgetId> probe;
    probe.reserve(smaller.size());
    probe.insert(smaller.begin(), smaller.end());

    out.reserve(smaller.size());
    for (auto id : larger) {
        if (probe.contains(id)) {
            out.push_back(id);
        }
    }
    return out;
}

auto SpatialIndex::query_point(float x, float y) const -> std::optional<WidgetId> {
    ++point_queries_;
    std::vector<WidgetId> xs;
    std::vector<WidgetId> ys;
    x_tree_.query_point(x, xs);
    if (xs.empty()) {
        return std::nullopt;
    }
    y_tree_.query_point(y, ys);

    std::optional<WidgetId> top;
    std::uint64_t           top_order = 0;
    for (auto id : intersect(xs, ys)) {
        auto const& entry = entries_.at(id);
        if (!entry.bounds.contains(x, y)) {
            continue;
        }
        if (!top || entry.paint_order > top_order) {
            top       = id;
            top_order = entry.paint_order;
        }
    }
    return top;
}

auto SpatialIndex::query_point_all(float x, float y) const -> std::vector<WidgetId> {
    ++point_queries_;
    std::vector<WidgetId> xs;
    std::vector<WidgetId> ys;
    x_tree_.query_point(x, xs);
    y_tree_.query_point(y, ys);

    auto hits = intersect(xs, ys);
    std::erase_if(hits, [&](WidgetId id) { return !entries_.at(id).bounds.contains(x, y); });
    std::sort(hits.begin(), hits.end(), [&](WidgetId lhs, WidgetId rhs) {
        return entries_.at(lhs).paint_order > entries_.at(rhs).paint_order;
    });
    return hits;
}

auto SpatialIndex::query_region(Rect const& region) const -> std::vector<WidgetId> {
    ++region_queries_;
    if (region.empty()) {
        return {};
    }
    std::vector<WidgetId> xs;
    std::vector<WidgetId> ys;
    x_tree_.query_overlap(region.x, region.right(), xs);
    if (xs.empty()) {
        return {};
    }
    y_tree_.query_overlap(region.y, region.bottom(), ys);

    auto hits = intersect(xs, ys);
    std::erase_if(hits, [&](WidgetId id) { return !entries_.at(id).bounds.intersects(region); });
    return hits;
}

auto SpatialIndex::contains(WidgetId widget) const -> bool {
    return entries_.contains(widget);
}

auto SpatialIndex::bounds_of(WidgetId widget) const -> std::optional<Rect> {
    auto found = entries_.find(widget);
    if (found == entries_.end()) {
        return std::nullopt;
    }
    return found->second.bounds;
}

auto SpatialIndex::paint_order_of(WidgetId widget) const -> std::optional<std::uint64_t> {
    auto found = entries_.find(widget);
    if (found == entries_.end()) {
        return std::nullopt;
    }
    return found->second.paint_order;
}

auto SpatialIndex::verify_integrity() const -> bool {
    std::size_t indexed = 0;
    for (auto const& [id, entry] : entries_) {
        if (entry.indexed) {
            ++indexed;
        }
    }
    if (x_tree_.size() != indexed || y_tree_.size() != indexed) {
        return false;
    }
    return x_tree_.is_balanced() && y_tree_.is_balanced();
}

auto SpatialIndex::stats() const -> SpatialIndexStats {
    return SpatialIndexStats{
        .entries        = entries_.size(),
        .x_intervals    = x_tree_.size(),
        .y_intervals    = y_tree_.size(),
        .x_height       = x_tree_.height(),
        .y_height       = y_tree_.height(),
        .x_balanced     = x_tree_.is_balanced(),
        .y_balanced     = y_tree_.is_balanced(),
        .point_queries  = point_queries_,
        .region_queries = region_queries_,
    };
}

} // namespace WC
