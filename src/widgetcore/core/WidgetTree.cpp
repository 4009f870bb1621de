#include <widgetcore/core/WidgetTree.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>

namespace WC {

auto WidgetTree::allocate_slot() -> std::uint32_t {
    if (!free_list_.empty()) {
        auto const index = free_list_.back();
        free_list_.pop_back();
        return index;
    }
    auto const index = static_cast<std::uint32_t>(nodes_.size());
    nodes_.emplace_back();
    active_.push_back(false);
    generations_.push_back(0);
    return index;
}

auto WidgetTree::invalid_widget(WidgetId id) const -> Error {
    return Error{Error::Code::InvalidWidget,
                 "widget " + std::to_string(id.index) + "." + std::to_string(id.generation) + " is not attached"};
}

auto WidgetTree::create_root(WidgetSpec spec) -> WidgetId {
    auto const index = allocate_slot();
    auto generation  = generations_[index] + 1;
    if (generation == 0) {
        generation = 1;
    }
    generations_[index] = generation;
    active_[index]      = true;

    WidgetId const id{index, generation};
    auto&          node = nodes_[index];
    node                = WidgetNode{};
    node.id             = id;
    node.name           = std::move(spec.name);
    node.bounds         = spec.bounds;
    node.focusable      = spec.focusable;
    node.enabled        = spec.enabled;
    node.visible        = spec.visible;
    node.event_handler  = std::move(spec.event_handler);
    node.focus_handler  = std::move(spec.focus_handler);

    roots_.push_back(id);
    ++live_count_;
    ++structure_version_;
    return id;
}

auto WidgetTree::create_child(WidgetId parent, WidgetSpec spec) -> Expected<WidgetId> {
    if (!contains(parent)) {
        return std::unexpected(invalid_widget(parent));
    }
    auto const id = create_root(std::move(spec));
    // create_root registered the widget as a root; move it under the parent.
    roots_.pop_back();
    nodes_[id.index].parent = parent;
    nodes_[parent.index].children.push_back(id);
    return id;
}

auto WidgetTree::append_subtree(WidgetId id, std::vector<WidgetId>& out) const -> void {
    auto const* current = node(id);
    if (current == nullptr) {
        return;
    }
    out.push_back(id);
    for (auto child : current->children) {
        append_subtree(child, out);
    }
}

auto WidgetTree::destroy(WidgetId id) -> Expected<std::vector<WidgetId>> {
    if (!contains(id)) {
        return std::unexpected(invalid_widget(id));
    }

    auto doomed = subtree(id);
    std::reverse(doomed.begin(), doomed.end());

    auto const parent = nodes_[id.index].parent;
    if (contains(parent)) {
        auto& siblings = nodes_[parent.index].children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
    } else {
        roots_.erase(std::remove(roots_.begin(), roots_.end(), id), roots_.end());
    }

    for (auto victim : doomed) {
        nodes_[victim.index] = WidgetNode{};
        active_[victim.index] = false;
        free_list_.push_back(victim.index);
        --live_count_;
    }
    ++structure_version_;
    wc_log("Destroyed " + std::to_string(doomed.size()) + " widget(s)", "WidgetTree");
    return doomed;
}

auto WidgetTree::clear() -> void {
    nodes_.clear();
    active_.clear();
    free_list_.clear();
    roots_.clear();
    // Generations are kept so handles issued before the clear stay invalid.
    for (std::uint32_t index = 0; index < generations_.size(); ++index) {
        nodes_.emplace_back();
        active_.push_back(false);
        free_list_.push_back(index);
    }
    live_count_ = 0;
    ++structure_version_;
}

auto WidgetTree::contains(WidgetId id) const -> bool {
    return id.valid() && id.index < active_.size() && active_[id.index]
           && generations_[id.index] == id.generation;
}

auto WidgetTree::node(WidgetId id) -> WidgetNode* {
    if (!contains(id)) {
        return nullptr;
    }
    return &nodes_[id.index];
}

auto WidgetTree::node(WidgetId id) const -> WidgetNode const* {
    if (!contains(id)) {
        return nullptr;
    }
    return &nodes_[id.index];
}

auto WidgetTree::parent(WidgetId id) const -> std::optional<WidgetId> {
    auto const* current = node(id);
    if (current == nullptr || !contains(current->parent)) {
        return std::nullopt;
    }
    return current->parent;
}

auto WidgetTree::children(WidgetId id) const -> std::span<WidgetId const> {
    auto const* current = node(id);
    if (current == nullptr) {
        return {};
    }
    return current->children;
}

auto WidgetTree::set_bounds(WidgetId id, Rect bounds) -> Expected<void> {
    auto* current = node(id);
    if (current == nullptr) {
        return std::unexpected(invalid_widget(id));
    }
    current->bounds = bounds;
    return {};
}

auto WidgetTree::set_visible(WidgetId id, bool visible) -> Expected<void> {
    auto* current = node(id);
    if (current == nullptr) {
        return std::unexpected(invalid_widget(id));
    }
    if (current->visible != visible) {
        current->visible = visible;
        ++structure_version_;
    }
    return {};
}

auto WidgetTree::set_enabled(WidgetId id, bool enabled) -> Expected<void> {
    auto* current = node(id);
    if (current == nullptr) {
        return std::unexpected(invalid_widget(id));
    }
    if (current->enabled != enabled) {
        current->enabled = enabled;
        ++structure_version_;
    }
    return {};
}

auto WidgetTree::set_focusable(WidgetId id, bool focusable) -> Expected<void> {
    auto* current = node(id);
    if (current == nullptr) {
        return std::unexpected(invalid_widget(id));
    }
    if (current->focusable != focusable) {
        current->focusable = focusable;
        ++structure_version_;
    }
    return {};
}

auto WidgetTree::is_effectively_visible(WidgetId id) const -> bool {
    auto const* current = node(id);
    while (current != nullptr) {
        if (!current->visible) {
            return false;
        }
        current = node(current->parent);
    }
    return contains(id);
}

auto WidgetTree::is_ancestor(WidgetId ancestor, WidgetId descendant) const -> bool {
    auto walk = parent(descendant);
    while (walk) {
        if (*walk == ancestor) {
            return true;
        }
        walk = parent(*walk);
    }
    return false;
}

auto WidgetTree::subtree(WidgetId id) const -> std::vector<WidgetId> {
    std::vector<WidgetId> out;
    append_subtree(id, out);
    return out;
}

auto WidgetTree::paint_order() const -> std::vector<WidgetId> {
    std::vector<WidgetId> out;
    out.reserve(live_count_);
    for (auto root : roots_) {
        append_subtree(root, out);
    }
    return out;
}

} // namespace WC
