#pragma once

#include <widgetcore/core/Error.hpp>
#include <widgetcore/core/Geometry.hpp>
#include <widgetcore/core/WidgetHandlers.hpp>
#include <widgetcore/core/WidgetId.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace WC {

enum class DirtyKind : std::uint32_t {
    None   = 0,
    Layout = 1u << 0,
    Visual = 1u << 1,
    All    = (1u << 2) - 1,
};

[[nodiscard]] inline constexpr DirtyKind operator|(DirtyKind lhs, DirtyKind rhs) {
    return static_cast<DirtyKind>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] inline constexpr DirtyKind operator&(DirtyKind lhs, DirtyKind rhs) {
    return static_cast<DirtyKind>(static_cast<std::uint32_t>(lhs) & static_cast<std::uint32_t>(rhs));
}

inline constexpr DirtyKind& operator|=(DirtyKind& lhs, DirtyKind rhs) {
    lhs = lhs | rhs;
    return lhs;
}

[[nodiscard]] inline constexpr auto hasDirtyKind(DirtyKind value, DirtyKind flag) -> bool {
    return (value & flag) != DirtyKind::None;
}

struct WidgetSpec {
    std::string                   name;
    Rect                          bounds{};
    bool                          focusable = false;
    bool                          enabled   = true;
    bool                          visible   = true;
    std::shared_ptr<EventHandler> event_handler{};
    std::shared_ptr<FocusHandler> focus_handler{};
};

struct WidgetNode {
    WidgetId                      id{};
    WidgetId                      parent{}; // traversal only, never lifetime
    std::vector<WidgetId>         children{};
    std::string                   name;
    Rect                          bounds{};
    DirtyKind                     dirty     = DirtyKind::None;
    bool                          focusable = false;
    bool                          enabled   = true;
    bool                          visible   = true;
    std::shared_ptr<EventHandler> event_handler{};
    std::shared_ptr<FocusHandler> focus_handler{};

    [[nodiscard]] auto is_dirty() const -> bool {
        return dirty != DirtyKind::None;
    }
};

// Arena owning every widget node. Parents exclusively own their children;
// everything outside the tree refers to widgets through WidgetId handles.
class WidgetTree {
public:
    WidgetTree() = default;

    WidgetTree(WidgetTree const&)            = delete;
    WidgetTree& operator=(WidgetTree const&) = delete;

    auto create_root(WidgetSpec spec) -> WidgetId;
    auto create_child(WidgetId parent, WidgetSpec spec) -> Expected<WidgetId>;

    // Destroys the widget and its subtree. Returns the destroyed handles in
    // post-order (children before parents).
    auto destroy(WidgetId id) -> Expected<std::vector<WidgetId>>;
    auto clear() -> void;

    [[nodiscard]] auto contains(WidgetId id) const -> bool;
    [[nodiscard]] auto node(WidgetId id) -> WidgetNode*;
    [[nodiscard]] auto node(WidgetId id) const -> WidgetNode const*;

    [[nodiscard]] auto parent(WidgetId id) const -> std::optional<WidgetId>;
    [[nodiscard]] auto children(WidgetId id) const -> std::span<WidgetId const>;
    [[nodiscard]] auto roots() const -> std::span<WidgetId const> {
        return roots_;
    }

    auto set_bounds(WidgetId id, Rect bounds) -> Expected<void>;
    auto set_visible(WidgetId id, bool visible) -> Expected<void>;
    auto set_enabled(WidgetId id, bool enabled) -> Expected<void>;
    auto set_focusable(WidgetId id, bool focusable) -> Expected<void>;

    // Visible itself and every ancestor visible.
    [[nodiscard]] auto is_effectively_visible(WidgetId id) const -> bool;
    [[nodiscard]] auto is_ancestor(WidgetId ancestor, WidgetId descendant) const -> bool;

    // Pre-order walk of one subtree, parent first.
    [[nodiscard]] auto subtree(WidgetId id) const -> std::vector<WidgetId>;
    // Pre-order walk of every root: the order widgets are painted in.
    [[nodiscard]] auto paint_order() const -> std::vector<WidgetId>;

    [[nodiscard]] auto size() const -> std::size_t {
        return live_count_;
    }

    // Bumped on every create/destroy/flag change that affects traversal.
    [[nodiscard]] auto structure_version() const -> std::uint64_t {
        return structure_version_;
    }

private:
    [[nodiscard]] auto allocate_slot() -> std::uint32_t;
    [[nodiscard]] auto invalid_widget(WidgetId id) const -> Error;
    auto append_subtree(WidgetId id, std::vector<WidgetId>& out) const -> void;

    std::vector<WidgetNode>    nodes_{};
    std::vector<bool>          active_{};
    std::vector<std::uint32_t> generations_{};
    std::vector<std::uint32_t> free_list_{};
    std::vector<WidgetId>      roots_{};
    std::size_t                live_count_        = 0;
    std::uint64_t              structure_version_ = 0;
};

} // namespace WC
