#pragma once

#include <widgetcore/core/WidgetId.hpp>
#include <widgetcore/core/WidgetTree.hpp>
#include <widgetcore/scheduler/DirtyScheduler.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace WC {

namespace Detail {
// Out of line so the header does not depend on the logger.
auto report_link_reentrancy_limit(std::uint32_t depth) -> void;
} // namespace Detail

// Nested set() calls made from change callbacks beyond this depth still store
// the value and mark dependents, but do not run the callback again.
inline constexpr std::uint32_t kMaxReentrantSetDepth = 32;

// Observable value with a set of dependent widgets. Every set() marks every
// dependent dirty, whether or not the value changed; T needs no equality.
template <typename T>
class Link {
public:
    using ChangeCallback = std::function<void(T const& previous, T const& current)>;

    Link(DirtyScheduler& scheduler, T initial)
        : scheduler_(&scheduler)
        , value_(std::move(initial)) {}

    Link(Link const&)            = delete;
    Link& operator=(Link const&) = delete;
    Link(Link&&)                 = default;
    Link& operator=(Link&&)      = default;

    [[nodiscard]] auto get() const -> T const& {
        return value_;
    }

    auto set(T value) -> void {
        T previous = std::exchange(value_, std::move(value));
        for (auto id : dependents_) {
            scheduler_->mark_dirty(id, DirtyKind::Layout | DirtyKind::Visual);
        }
        if (!on_change_) {
            return;
        }
        if (set_depth_ >= kMaxReentrantSetDepth) {
            ++suppressed_callbacks_;
            Detail::report_link_reentrancy_limit(set_depth_);
            return;
        }
        // Copy so the callback may replace or clear itself.
        auto callback = on_change_;
        ++set_depth_;
        struct DepthGuard {
            std::uint32_t& depth;
            ~DepthGuard() { --depth; }
        } guard{set_depth_};
        callback(previous, value_);
    }

    template <typename Fn>
    auto update(Fn&& fn) -> void {
        T next = value_;
        std::forward<Fn>(fn)(next);
        set(std::move(next));
    }

    auto add_dependent(WidgetId widget) -> void {
        dependents_.insert(widget);
    }

    auto remove_dependent(WidgetId widget) -> void {
        dependents_.erase(widget);
    }

    [[nodiscard]] auto has_dependent(WidgetId widget) const -> bool {
        return dependents_.contains(widget);
    }

    [[nodiscard]] auto dependent_count() const -> std::size_t {
        return dependents_.size();
    }

    auto set_on_change(ChangeCallback callback) -> void {
        on_change_ = std::move(callback);
    }

    auto clear_on_change() -> void {
        on_change_ = nullptr;
    }

    [[nodiscard]] auto suppressed_callbacks() const -> std::uint64_t {
        return suppressed_callbacks_;
    }

    [[nodiscard]] auto describe() const -> std::string {
        std::string text = "Link(";
        text += std::to_string(dependents_.size());
        text += dependents_.size() == 1 ? " dependent" : " dependents";
        if (on_change_) {
            text += ", on_change";
        }
        text += ")";
        return text;
    }

private:
    DirtyScheduler*                scheduler_ = nullptr;
    T                              value_;
    phmap::flat_hash_set<WidgetId> dependents_{};
    ChangeCallback                 on_change_{};
    std::uint32_t                  set_depth_            = 0;
    std::uint64_t                  suppressed_callbacks_ = 0;
};

} // namespace WC
