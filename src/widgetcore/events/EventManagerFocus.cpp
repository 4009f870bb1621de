#include <widgetcore/events/EventManager.hpp>

#include <widgetcore/core/WidgetTree.hpp>
#include <widgetcore/scheduler/DirtyScheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <sstream>
#include <utility>

namespace WC {

namespace {

auto describe_widget(WidgetId id) -> std::string {
    std::ostringstream oss;
    oss << id;
    return oss.str();
}

// Runs a focus notification, turning anything it throws into an Error.
template <typename Fn>
auto call_focus_handler(Fn&& fn) -> Expected<void> {
    try {
        std::forward<Fn>(fn)();
    } catch (std::exception const& ex) {
        return std::unexpected(Error{Error::Code::HandlerFailed, ex.what()});
    } catch (...) {
        return std::unexpected(Error{Error::Code::HandlerFailed, "unknown exception"});
    }
    return {};
}

} // namespace

auto EventManager::focused() const -> std::optional<WidgetId> {
    return focus_;
}

auto EventManager::can_take_focus(WidgetId widget) const -> bool {
    auto const* node = tree_.node(widget);
    if (node == nullptr) {
        return false;
    }
    return node->focusable && node->enabled && tree_.is_effectively_visible(widget);
}

auto EventManager::notify_blur(WidgetId widget) -> void {
    auto const* node = tree_.node(widget);
    if (node == nullptr) {
        return;
    }
    auto handler = node->focus_handler;
    scheduler_.mark_dirty(widget, DirtyKind::Visual);
    if (handler) {
        if (auto result = call_focus_handler([&] { handler->on_blur(widget); }); !result) {
            record_fault(widget, dispatching_kind_, std::move(result.error()));
        }
    }
}

auto EventManager::notify_focus(WidgetId widget) -> void {
    auto const* node = tree_.node(widget);
    if (node == nullptr) {
        return;
    }
    auto handler = node->focus_handler;
    scheduler_.mark_dirty(widget, DirtyKind::Visual);
    ++stats_.focus_changes;
    if (handler) {
        if (auto result = call_focus_handler([&] { handler->on_focus(widget); }); !result) {
            record_fault(widget, dispatching_kind_, std::move(result.error()));
        }
    }
}

auto EventManager::set_focus(std::optional<WidgetId> widget) -> Expected<void> {
    if (!widget) {
        clear_focus();
        return {};
    }
    if (!tree_.contains(*widget)) {
        return std::unexpected(Error{Error::Code::InvalidWidget, "Cannot focus dead widget " + describe_widget(*widget)});
    }
    if (!can_take_focus(*widget)) {
        return std::unexpected(Error{Error::Code::NotFocusable,
                                     "Widget " + describe_widget(*widget) + " is not focusable, enabled and visible"});
    }
    if (focus_ == widget) {
        return {};
    }

    auto const previous = focus_;
    focus_              = widget;
    // Blur before focus so handlers observe a single focused widget at a time.
    if (previous && tree_.contains(*previous)) {
        notify_blur(*previous);
    }
    // A blur handler may have moved focus elsewhere; respect the last request.
    if (focus_ == widget) {
        notify_focus(*widget);
    }
    wc_log("Focus moved to " + describe_widget(*widget), "Focus");
    return {};
}

auto EventManager::clear_focus() -> void {
    if (!focus_) {
        return;
    }
    auto const previous = *focus_;
    focus_.reset();
    if (tree_.contains(previous)) {
        notify_blur(previous);
    }
    wc_log("Focus cleared", "Focus");
}

auto EventManager::focus_chain() -> std::vector<WidgetId> const& {
    auto const version = tree_.structure_version();
    if (focus_chain_version_ && *focus_chain_version_ == version) {
        return focus_chain_;
    }
    focus_chain_.clear();
    for (auto id : tree_.paint_order()) {
        if (can_take_focus(id)) {
            focus_chain_.push_back(id);
        }
    }
    focus_chain_version_ = version;
    return focus_chain_;
}

auto EventManager::step_focus(int direction) -> std::optional<WidgetId> {
    auto const& chain = focus_chain();
    if (chain.empty()) {
        return std::nullopt;
    }

    auto const count = static_cast<std::ptrdiff_t>(chain.size());
    std::ptrdiff_t next = direction > 0 ? 0 : count - 1;
    if (focus_) {
        auto it = std::find(chain.begin(), chain.end(), *focus_);
        if (it != chain.end()) {
            auto const current = std::distance(chain.begin(), it);
            next               = ((current + direction) % count + count) % count;
        }
    }

    auto const candidate = chain[static_cast<std::size_t>(next)];
    if (auto result = set_focus(candidate); !result) {
        wc_log("Focus traversal failed: " + describeError(result.error()), "Focus", "WARNING");
        return std::nullopt;
    }
    return focus_;
}

auto EventManager::focus_next() -> std::optional<WidgetId> {
    return step_focus(1);
}

auto EventManager::focus_previous() -> std::optional<WidgetId> {
    return step_focus(-1);
}

auto EventManager::handle_tab_navigation(InputEvent const& event) -> bool {
    if (!options_.tab_navigation || event.kind != InputKind::KeyDown || event.key_code != Keys::Tab) {
        return false;
    }
    auto const moved = hasModifier(event.modifiers, ButtonModifiers::Shift) ? focus_previous() : focus_next();
    return moved.has_value();
}

auto EventManager::focus_from_pointer(WidgetId target) -> void {
    for (auto current = std::optional<WidgetId>{target}; current; current = tree_.parent(*current)) {
        if (!can_take_focus(*current)) {
            continue;
        }
        if (auto result = set_focus(*current); !result) {
            wc_log("Click-to-focus failed: " + describeError(result.error()), "Focus", "WARNING");
        }
        return;
    }
}

auto EventManager::widget_removed(WidgetId widget) -> void {
    if (focus_ && (*focus_ == widget || tree_.is_ancestor(widget, *focus_))) {
        clear_focus();
    }
    std::erase_if(queue_, [widget](QueuedEvent const& queued) {
        return queued.event.target && *queued.event.target == widget;
    });
}

} // namespace WC
