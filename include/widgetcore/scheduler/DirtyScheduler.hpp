#pragma once

#include <widgetcore/core/Geometry.hpp>
#include <widgetcore/core/WidgetId.hpp>
#include <widgetcore/core/WidgetTree.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <span>
#include <vector>

namespace WC {

// Collects the widgets dirtied by reactive writes and external mutations and
// answers what must re-layout and re-render this frame. Flags are cleared on
// consume (after a render), never on set, so a widget dirtied twice before a
// render is rendered once.
class DirtyScheduler {
public:
    explicit DirtyScheduler(WidgetTree& tree);

    // O(1). Returns false (and counts a stale mark) when the handle no longer
    // refers to an attached widget.
    auto mark_dirty(WidgetId widget, DirtyKind kinds = DirtyKind::All) -> bool;

    [[nodiscard]] auto is_dirty(WidgetId widget) const -> bool;
    [[nodiscard]] auto dirty_kinds(WidgetId widget) const -> DirtyKind;
    [[nodiscard]] auto dirty_count() const -> std::size_t {
        return dirty_.size();
    }
    [[nodiscard]] auto empty() const -> bool {
        return dirty_.empty();
    }

    // Dirty widgets in the order they were first marked.
    [[nodiscard]] auto dirty_widgets() const -> std::vector<WidgetId>;
    // Layout-dirty widgets without a layout-dirty ancestor: the minimal set of
    // subtrees layout has to re-run.
    [[nodiscard]] auto layout_roots() const -> std::vector<WidgetId>;
    // Bounds of visually dirty widgets with positive area.
    [[nodiscard]] auto damage_rects() const -> std::vector<Rect>;

    auto clear(WidgetId widget) -> void;
    auto clear(std::span<WidgetId const> widgets) -> void;
    auto clear_all() -> void;
    // Drops a destroyed widget without touching the (already released) node.
    auto forget(WidgetId widget) -> void;

    [[nodiscard]] auto stale_marks() const -> std::uint64_t {
        return stale_marks_;
    }
    [[nodiscard]] auto total_marks() const -> std::uint64_t {
        return total_marks_;
    }

    [[nodiscard]] auto tree() -> WidgetTree& {
        return tree_;
    }
    [[nodiscard]] auto tree() const -> WidgetTree const& {
        return tree_;
    }

private:
    struct OrderEntry {
        WidgetId      widget{};
        std::uint64_t sequence = 0;
    };

    [[nodiscard]] auto is_live(OrderEntry const& entry) const -> bool;
    auto compact_order() -> void;

    WidgetTree& tree_;
    // Dirty widget -> sequence of the mark that made it dirty. An order_ entry
    // is live only while its sequence matches.
    phmap::flat_hash_map<WidgetId, std::uint64_t> dirty_{};
    std::vector<OrderEntry>                        order_{};
    std::uint64_t                                  next_sequence_ = 0;
    std::uint64_t                                  stale_marks_   = 0;
    std::uint64_t                                  total_marks_   = 0;
};

} // namespace WC
