#pragma once

#include <widgetcore/core/Geometry.hpp>
#include <widgetcore/core/WidgetId.hpp>
#include <widgetcore/spatial/IntervalTree.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace WC {

class WidgetTree;

struct SpatialEntry {
    Rect          bounds{};
    std::uint64_t paint_order = 0;
    bool          indexed     = false; // false for zero-area bounds kept out of the axis trees
};

struct SpatialIndexStats {
    std::size_t   entries      = 0;
    std::size_t   x_intervals  = 0;
    std::size_t   y_intervals  = 0;
    std::int32_t  x_height     = 0;
    std::int32_t  y_height     = 0;
    bool          x_balanced   = true;
    bool          y_balanced   = true;
    std::uint64_t point_queries  = 0;
    std::uint64_t region_queries = 0;
};

// Hit-testing index over widget bounds built from two interval trees, one per
// axis. A 2-D query intersects the per-axis results, probing the smaller set.
// Later paint order wins when several widgets contain the same point.
class SpatialIndex {
public:
    SpatialIndex() = default;

    // Adds or replaces the widget's rectangle. Without an explicit paint order
    // the widget stacks above everything inserted before it.
    auto insert(WidgetId widget, Rect const& bounds, std::optional<std::uint64_t> paint_order = std::nullopt) -> void;
    auto remove(WidgetId widget) -> bool;
    // Remove then reinsert, keeping the widget's paint order. Upserts when absent.
    auto update(WidgetId widget, Rect const& bounds) -> void;
    auto clear() -> void;

    // Reinserts every attached and visible widget of the tree in paint order.
    auto rebuild(WidgetTree const& tree) -> void;

    [[nodiscard]] auto query_point(float x, float y) const -> std::optional<WidgetId>;
    // Every widget containing the point, topmost first.
    [[nodiscard]] auto query_point_all(float x, float y) const -> std::vector<WidgetId>;
    [[nodiscard]] auto query_region(Rect const& region) const -> std::vector<WidgetId>;

    [[nodiscard]] auto contains(WidgetId widget) const -> bool;
    [[nodiscard]] auto bounds_of(WidgetId widget) const -> std::optional<Rect>;
    [[nodiscard]] auto paint_order_of(WidgetId widget) const -> std::optional<std::uint64_t>;
    [[nodiscard]] auto size() const -> std::size_t {
        return entries_.size();
    }
    [[nodiscard]] auto empty() const -> bool {
        return entries_.empty();
    }

    [[nodiscard]] auto verify_integrity() const -> bool;
    [[nodiscard]] auto stats() const -> SpatialIndexStats;

private:
    auto insert_intervals(WidgetId widget, SpatialEntry& entry) -> void;
    auto remove_intervals(WidgetId widget, SpatialEntry const& entry) -> void;
    [[nodiscard]] auto intersect(std::vector<WidgetId> const& xs, std::vector<WidgetId> const& ys) const
        -> std::vector<WidgetId>;

    phmap::flat_hash_map<WidgetId, SpatialEntry> entries_{};
    IntervalTree<WidgetId>                       x_tree_{};
    IntervalTree<WidgetId>                       y_tree_{};
    std::uint64_t                                next_paint_order_ = 0;
    mutable std::uint64_t                        point_queries_    = 0;
    mutable std::uint64_t                        region_queries_   = 0;
};

} // namespace WC
