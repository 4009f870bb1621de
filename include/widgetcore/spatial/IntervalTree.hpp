#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <vector>

namespace WC {

// AVL-balanced interval tree over half-open intervals [start, end).
//
// Nodes live in an index arena with a free list. Nodes are ordered by
// (start, value) so that removal is exact even when several intervals share a
// start coordinate; Value must therefore be unique per tree and ordered with
// operator<. Every node caches the maximum end of its subtree, which lets
// point and overlap queries prune subtrees that end before the query.
template <typename Value>
class IntervalTree {
public:
    struct Interval {
        float start = 0.0f;
        float end   = 0.0f;
        Value value{};
    };

    IntervalTree() = default;

    // Degenerate intervals (end <= start, NaN) are rejected and never stored.
    auto insert(float start, float end, Value const& value) -> bool {
        if (!(end > start)) {
            return false;
        }
        root_ = insert_node(root_, Interval{start, end, value});
        ++size_;
        return true;
    }

    auto remove(float start, Value const& value) -> bool {
        bool removed = false;
        root_        = remove_node(root_, start, value, removed);
        if (removed) {
            --size_;
        }
        return removed;
    }

    // Appends every value whose interval contains point.
    auto query_point(float point, std::vector<Value>& out) const -> void {
        query_point_node(root_, point, out);
    }

    // Appends every value whose interval overlaps [start, end).
    auto query_overlap(float start, float end, std::vector<Value>& out) const -> void {
        if (!(end > start)) {
            return;
        }
        query_overlap_node(root_, start, end, out);
    }

    auto clear() -> void {
        nodes_.clear();
        free_list_.clear();
        root_ = kNil;
        size_ = 0;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        return size_;
    }

    [[nodiscard]] auto empty() const -> bool {
        return size_ == 0;
    }

    [[nodiscard]] auto height() const -> std::int32_t {
        return node_height(root_);
    }

    // Checks the AVL balance factor, cached heights and max-end values of
    // every node.
    [[nodiscard]] auto is_balanced() const -> bool {
        return verify_node(root_);
    }

    // In-order listing, for diagnostics and tests.
    [[nodiscard]] auto intervals() const -> std::vector<Interval> {
        std::vector<Interval> out;
        out.reserve(size_);
        collect_in_order(root_, out);
        return out;
    }

private:
    using NodeIndex = std::int32_t;
    static constexpr NodeIndex kNil = -1;

    struct Node {
        Interval     interval{};
        float        max_end = 0.0f;
        std::int32_t height  = 1;
        NodeIndex    left    = kNil;
        NodeIndex    right   = kNil;
    };

    [[nodiscard]] static auto key_less(float lhs_start, Value const& lhs_value, float rhs_start, Value const& rhs_value)
        -> bool {
        if (lhs_start != rhs_start) {
            return lhs_start < rhs_start;
        }
        return lhs_value < rhs_value;
    }

    [[nodiscard]] auto allocate(Interval const& interval) -> NodeIndex {
        Node node{};
        node.interval = interval;
        node.max_end  = interval.end;
        if (!free_list_.empty()) {
            auto const index = free_list_.back();
            free_list_.pop_back();
            nodes_[static_cast<std::size_t>(index)] = node;
            return index;
        }
        nodes_.push_back(node);
        return static_cast<NodeIndex>(nodes_.size() - 1);
    }

    auto release(NodeIndex index) -> void {
        free_list_.push_back(index);
    }

    [[nodiscard]] auto at(NodeIndex index) -> Node& {
        return nodes_[static_cast<std::size_t>(index)];
    }

    [[nodiscard]] auto at(NodeIndex index) const -> Node const& {
        return nodes_[static_cast<std::size_t>(index)];
    }

    [[nodiscard]] auto node_height(NodeIndex index) const -> std::int32_t {
        return index == kNil ? 0 : at(index).height;
    }

    [[nodiscard]] auto balance_factor(NodeIndex index) const -> std::int32_t {
        if (index == kNil) {
            return 0;
        }
        return node_height(at(index).left) - node_height(at(index).right);
    }

    auto refresh(NodeIndex index) -> void {
        auto& node   = at(index);
        node.height  = 1 + std::max(node_height(node.left), node_height(node.right));
        node.max_end = node.interval.end;
        if (node.left != kNil) {
            node.max_end = std::max(node.max_end, at(node.left).max_end);
        }
        if (node.right != kNil) {
            node.max_end = std::max(node.max_end, at(node.right).max_end);
        }
    }

    [[nodiscard]] auto rotate_right(NodeIndex y) -> NodeIndex {
        auto const x  = at(y).left;
        auto const t2 = at(x).right;
        at(x).right   = y;
        at(y).left    = t2;
        refresh(y);
        refresh(x);
        return x;
    }

    [[nodiscard]] auto rotate_left(NodeIndex x) -> NodeIndex {
        auto const y  = at(x).right;
        auto const t2 = at(y).left;
        at(y).left    = x;
        at(x).right   = t2;
        refresh(x);
        refresh(y);
        return y;
    }

    [[nodiscard]] auto rebalance(NodeIndex index) -> NodeIndex {
        refresh(index);
        auto const balance = balance_factor(index);
        if (balance > 1) {
            if (balance_factor(at(index).left) < 0) {
                auto const rotated = rotate_left(at(index).left);
                at(index).left     = rotated;
            }
            return rotate_right(index);
        }
        if (balance < -1) {
            if (balance_factor(at(index).right) > 0) {
                auto const rotated = rotate_right(at(index).right);
                at(index).right    = rotated;
            }
            return rotate_left(index);
        }
        return index;
    }

    // Child links are re-read through at() after each recursive call because
    // allocate() may grow nodes_ and invalidate references.
    [[nodiscard]] auto insert_node(NodeIndex index, Interval const& interval) -> NodeIndex {
        if (index == kNil) {
            return allocate(interval);
        }
        if (key_less(interval.start, interval.value, at(index).interval.start, at(index).interval.value)) {
            auto const child = insert_node(at(index).left, interval);
            at(index).left   = child;
        } else {
            auto const child = insert_node(at(index).right, interval);
            at(index).right  = child;
        }
        return rebalance(index);
    }

    [[nodiscard]] auto min_node(NodeIndex index) const -> NodeIndex {
        while (at(index).left != kNil) {
            index = at(index).left;
        }
        return index;
    }

    [[nodiscard]] auto remove_node(NodeIndex index, float start, Value const& value, bool& removed) -> NodeIndex {
        if (index == kNil) {
            return kNil;
        }
        auto const& current = at(index).interval;
        if (key_less(start, value, current.start, current.value)) {
            auto const child = remove_node(at(index).left, start, value, removed);
            at(index).left   = child;
        } else if (key_less(current.start, current.value, start, value)) {
            auto const child = remove_node(at(index).right, start, value, removed);
            at(index).right  = child;
        } else {
            removed          = true;
            auto const left  = at(index).left;
            auto const right = at(index).right;
            if (left == kNil || right == kNil) {
                release(index);
                return left == kNil ? right : left;
            }
            // Two children: pull the in-order successor into this slot.
            auto const successor = min_node(right);
            auto const moved     = at(successor).interval;
            bool       ignored   = false;
            auto const child     = remove_node(right, moved.start, moved.value, ignored);
            at(index).right      = child;
            at(index).interval   = moved;
        }
        return rebalance(index);
    }

    auto query_point_node(NodeIndex index, float point, std::vector<Value>& out) const -> void {
        if (index == kNil) {
            return;
        }
        auto const& node = at(index);
        if (!(point < node.max_end)) {
            return;
        }
        query_point_node(node.left, point, out);
        if (node.interval.start <= point) {
            if (point < node.interval.end) {
                out.push_back(node.interval.value);
            }
            // Right subtree starts at or after this node's start.
            query_point_node(node.right, point, out);
        }
    }

    auto query_overlap_node(NodeIndex index, float start, float end, std::vector<Value>& out) const -> void {
        if (index == kNil) {
            return;
        }
        auto const& node = at(index);
        if (!(start < node.max_end)) {
            return;
        }
        query_overlap_node(node.left, start, end, out);
        if (node.interval.start < end) {
            if (start < node.interval.end) {
                out.push_back(node.interval.value);
            }
            query_overlap_node(node.right, start, end, out);
        }
    }

    auto collect_in_order(NodeIndex index, std::vector<Interval>& out) const -> void {
        if (index == kNil) {
            return;
        }
        collect_in_order(at(index).left, out);
        out.push_back(at(index).interval);
        collect_in_order(at(index).right, out);
    }

    [[nodiscard]] auto verify_node(NodeIndex index) const -> bool {
        if (index == kNil) {
            return true;
        }
        auto const& node = at(index);
        if (std::abs(balance_factor(index)) > 1) {
            return false;
        }
        if (node.height != 1 + std::max(node_height(node.left), node_height(node.right))) {
            return false;
        }
        auto expected_max = node.interval.end;
        if (node.left != kNil) {
            expected_max = std::max(expected_max, at(node.left).max_end);
        }
        if (node.right != kNil) {
            expected_max = std::max(expected_max, at(node.right).max_end);
        }
        if (expected_max != node.max_end) {
            return false;
        }
        return verify_node(node.left) && verify_node(node.right);
    }

    std::vector<Node>      nodes_{};
    std::vector<NodeIndex> free_list_{};
    NodeIndex              root_ = kNil;
    std::size_t            size_ = 0;
};

} // namespace WC
