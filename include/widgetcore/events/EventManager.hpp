#pragma once

#include <widgetcore/core/Error.hpp>
#include <widgetcore/core/WidgetId.hpp>
#include <widgetcore/events/EventContext.hpp>
#include <widgetcore/io/InputEvents.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace WC {

class WidgetTree;
class SpatialIndex;
class DirtyScheduler;

enum class CoalescePolicy : std::uint8_t {
    None = 0,   // every event is queued
    Replace,    // latest event replaces the queued one
    Accumulate, // wheel-style: deltas are summed into the queued event
};

[[nodiscard]] auto coalescePolicyName(CoalescePolicy policy) -> std::string_view;
[[nodiscard]] auto coalescePolicyFromName(std::string_view name) -> std::optional<CoalescePolicy>;
[[nodiscard]] auto DefaultCoalescePolicies() -> std::array<CoalescePolicy, kInputKindCount>;

struct EventManagerOptions {
    using Clock     = std::chrono::steady_clock;
    using ClockFunc = std::function<Clock::time_point()>;

    // Trailing queue entries eligible for coalescing.
    std::size_t coalesce_window_events = 8;
    // Maximum timestamp distance between two events that may coalesce.
    std::chrono::nanoseconds coalesce_window_time{std::chrono::milliseconds{50}};
    bool focus_on_pointer_down = true;
    bool tab_navigation        = true;
    // Logs budget exhaustion and coalescing decisions.
    bool diagnostics = false;
    std::array<CoalescePolicy, kInputKindCount> coalesce = DefaultCoalescePolicies();
    // Injectable for deterministic tests; defaults to steady_clock::now.
    ClockFunc clock{};
};

enum class EventManagerState : std::uint8_t {
    Idle,
    Draining,
};

// A failed or throwing handler. `kind` is the input being dispatched when the
// fault happened; empty for focus notifications made outside drain().
struct HandlerFault {
    WidgetId                 widget{};
    std::optional<InputKind> kind{};
    Error                    error{Error::Code::UnknownError, ""};
};

struct EventKindTiming {
    std::uint64_t            count = 0;
    std::chrono::nanoseconds total{};
    std::chrono::nanoseconds max{};

    [[nodiscard]] auto average() const -> std::chrono::nanoseconds {
        if (count == 0) {
            return std::chrono::nanoseconds{};
        }
        return total / static_cast<std::int64_t>(count);
    }
};

struct EventManagerStats {
    std::array<EventKindTiming, kInputKindCount> timings{};
    std::uint64_t posted             = 0;
    std::uint64_t coalesced          = 0;
    std::uint64_t processed          = 0;
    std::uint64_t consumed           = 0;
    std::uint64_t unconsumed         = 0;
    std::uint64_t discarded          = 0;
    std::uint64_t faulted            = 0;
    std::uint64_t budget_exhaustions = 0;
    std::uint64_t focus_changes      = 0;
};

[[nodiscard]] auto describeEventStats(EventManagerStats const& stats) -> std::string;

// Queues raw input, collapses redundant events, dispatches within a per-frame
// time budget and tracks keyboard focus. Single-threaded: drain() must not be
// re-entered from a handler.
class EventManager {
public:
    static constexpr std::size_t kMaxRecordedFaults = 64;

    EventManager(WidgetTree& tree, SpatialIndex& index, DirtyScheduler& scheduler, EventManagerOptions options = {});

    EventManager(EventManager const&)            = delete;
    EventManager& operator=(EventManager const&) = delete;

    auto post(InputEvent event) -> void;
    // Returns how many events were dispatched (consumed, bubbled out or
    // discarded). Leftover events stay queued in post order.
    auto drain(std::chrono::nanoseconds budget) -> std::size_t;

    auto set_focus(std::optional<WidgetId> widget) -> Expected<void>;
    auto clear_focus() -> void;
    [[nodiscard]] auto focused() const -> std::optional<WidgetId>;
    // Tab order: focusable, enabled, visible widgets in tree order, wrapping.
    auto focus_next() -> std::optional<WidgetId>;
    auto focus_previous() -> std::optional<WidgetId>;
    [[nodiscard]] auto focus_chain() -> std::vector<WidgetId> const&;

    // Call before the widget is destroyed: clears its focus (delivering blur)
    // and drops queued events explicitly targeted at it.
    auto widget_removed(WidgetId widget) -> void;

    [[nodiscard]] auto has_pending_events() const -> bool {
        return !queue_.empty();
    }
    [[nodiscard]] auto pending_count() const -> std::size_t {
        return queue_.size();
    }
    [[nodiscard]] auto pending_events() const -> std::vector<InputEvent>;
    [[nodiscard]] auto state() const -> EventManagerState {
        return state_;
    }

    [[nodiscard]] auto stats() const -> EventManagerStats const& {
        return stats_;
    }
    auto reset_stats() -> void;
    [[nodiscard]] auto faults() const -> std::deque<HandlerFault> const& {
        return faults_;
    }
    auto clear_faults() -> void {
        faults_.clear();
    }

    [[nodiscard]] auto options() const -> EventManagerOptions const& {
        return options_;
    }
    auto set_options(EventManagerOptions options) -> void;

private:
    struct QueuedEvent {
        InputEvent              event{};
        std::optional<WidgetId> coalesce_target{};
    };

    enum class DispatchOutcome {
        Consumed,
        Unconsumed,
        Discarded,
        Faulted,
    };

    [[nodiscard]] auto now() const -> EventManagerOptions::Clock::time_point;
    [[nodiscard]] auto coalesce_target_for(InputEvent const& event) const -> std::optional<WidgetId>;
    auto try_coalesce(InputEvent const& event, std::optional<WidgetId> const& target) -> bool;

    [[nodiscard]] auto resolve_target(InputEvent const& event) -> std::optional<WidgetId>;
    auto dispatch(InputEvent const& event) -> DispatchOutcome;
    auto bubble(InputEvent const& event, WidgetId target) -> DispatchOutcome;
    auto handle_tab_navigation(InputEvent const& event) -> bool;
    auto focus_from_pointer(WidgetId target) -> void;
    auto record_fault(WidgetId widget, std::optional<InputKind> kind, Error error) -> void;
    auto record_timing(InputKind kind, std::chrono::nanoseconds elapsed) -> void;

    [[nodiscard]] auto can_take_focus(WidgetId widget) const -> bool;
    auto notify_focus(WidgetId widget) -> void;
    auto notify_blur(WidgetId widget) -> void;
    auto step_focus(int direction) -> std::optional<WidgetId>;

    WidgetTree&               tree_;
    SpatialIndex&             index_;
    DirtyScheduler&           scheduler_;
    EventManagerOptions       options_;
    std::deque<QueuedEvent>   queue_{};
    std::optional<WidgetId>   focus_{};
    EventManagerState         state_ = EventManagerState::Idle;
    EventManagerStats         stats_{};
    std::deque<HandlerFault>  faults_{};
    std::optional<InputKind>  dispatching_kind_{};
    std::vector<WidgetId>     focus_chain_{};
    std::optional<std::uint64_t> focus_chain_version_{};
};

} // namespace WC
