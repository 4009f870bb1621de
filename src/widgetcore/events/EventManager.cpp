#include <widgetcore/events/EventManager.hpp>

#include <widgetcore/core/WidgetTree.hpp>
#include <widgetcore/scheduler/DirtyScheduler.hpp>
#include <widgetcore/spatial/SpatialIndex.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cassert>
#include <exception>
#include <sstream>
#include <utility>

namespace WC {

auto coalescePolicyName(CoalescePolicy policy) -> std::string_view {
    switch (policy) {
    case CoalescePolicy::None:
        return "none";
    case CoalescePolicy::Replace:
        return "replace";
    case CoalescePolicy::Accumulate:
        return "accumulate";
    }
    return "none";
}

auto coalescePolicyFromName(std::string_view name) -> std::optional<CoalescePolicy> {
    if (name == "none") {
        return CoalescePolicy::None;
    }
    if (name == "replace") {
        return CoalescePolicy::Replace;
    }
    if (name == "accumulate") {
        return CoalescePolicy::Accumulate;
    }
    return std::nullopt;
}

auto DefaultCoalescePolicies() -> std::array<CoalescePolicy, kInputKindCount> {
    std::array<CoalescePolicy, kInputKindCount> policies{};
    policies.fill(CoalescePolicy::None);
    policies[kindIndex(InputKind::PointerMove)]  = CoalescePolicy::Replace;
    policies[kindIndex(InputKind::PointerHover)] = CoalescePolicy::Replace;
    policies[kindIndex(InputKind::TouchMove)]    = CoalescePolicy::Replace;
    policies[kindIndex(InputKind::PointerWheel)] = CoalescePolicy::Accumulate;
    return policies;
}

auto describeEventStats(EventManagerStats const& stats) -> std::string {
    std::ostringstream oss;
    oss << "EventManager stats:\n";
    oss << "  posted=" << stats.posted << " coalesced=" << stats.coalesced << " processed=" << stats.processed
        << '\n';
    oss << "  consumed=" << stats.consumed << " unconsumed=" << stats.unconsumed << " discarded=" << stats.discarded
        << " faulted=" << stats.faulted << '\n';
    oss << "  budget_exhaustions=" << stats.budget_exhaustions << " focus_changes=" << stats.focus_changes << '\n';
    for (auto kind : kAllInputKinds) {
        auto const& timing = stats.timings[kindIndex(kind)];
        if (timing.count == 0) {
            continue;
        }
        oss << "  " << inputKindName(kind) << ": count=" << timing.count
            << " avg_us=" << std::chrono::duration_cast<std::chrono::microseconds>(timing.average()).count()
            << " max_us=" << std::chrono::duration_cast<std::chrono::microseconds>(timing.max).count() << '\n';
    }
    return oss.str();
}

EventManager::EventManager(WidgetTree& tree, SpatialIndex& index, DirtyScheduler& scheduler, EventManagerOptions options)
    : tree_(tree)
    , index_(index)
    , scheduler_(scheduler)
    , options_(std::move(options)) {}

auto EventManager::set_options(EventManagerOptions options) -> void {
    options_ = std::move(options);
}

auto EventManager::reset_stats() -> void {
    stats_ = EventManagerStats{};
}

auto EventManager::now() const -> EventManagerOptions::Clock::time_point {
    if (options_.clock) {
        return options_.clock();
    }
    return EventManagerOptions::Clock::now();
}

auto EventManager::pending_events() const -> std::vector<InputEvent> {
    std::vector<InputEvent> events;
    events.reserve(queue_.size());
    for (auto const& queued : queue_) {
        events.push_back(queued.event);
    }
    return events;
}

auto EventManager::coalesce_target_for(InputEvent const& event) const -> std::optional<WidgetId> {
    if (event.target) {
        return event.target;
    }
    if (isPointerKind(event.kind)) {
        return index_.query_point(event.x, event.y);
    }
    return focus_;
}

auto EventManager::try_coalesce(InputEvent const& event, std::optional<WidgetId> const& target) -> bool {
    auto const policy = options_.coalesce[kindIndex(event.kind)];
    if (policy == CoalescePolicy::None || options_.coalesce_window_events == 0) {
        return false;
    }

    std::size_t scanned = 0;
    for (auto it = queue_.rbegin(); it != queue_.rend() && scanned < options_.coalesce_window_events; ++it, ++scanned) {
        auto& queued = *it;
        // Ordered events (clicks, keys) are barriers: never move input across them.
        if (options_.coalesce[kindIndex(queued.event.kind)] == CoalescePolicy::None) {
            return false;
        }
        if (event.timestamp - queued.event.timestamp > options_.coalesce_window_time) {
            return false;
        }
        if (queued.event.kind != event.kind || queued.coalesce_target != target) {
            continue;
        }

        if (policy == CoalescePolicy::Accumulate) {
            auto const dx          = queued.event.wheel_dx + event.wheel_dx;
            auto const dy          = queued.event.wheel_dy + event.wheel_dy;
            queued.event           = event;
            queued.event.wheel_dx  = dx;
            queued.event.wheel_dy  = dy;
        } else {
            queued.event = event;
        }
        ++stats_.coalesced;
        if (options_.diagnostics) {
            wc_log(std::string("Coalesced ") + std::string(inputKindName(event.kind)), "EventManager");
        }
        return true;
    }
    return false;
}

auto EventManager::post(InputEvent event) -> void {
    ++stats_.posted;
    auto target = coalesce_target_for(event);
    if (try_coalesce(event, target)) {
        return;
    }
    queue_.push_back(QueuedEvent{.event = std::move(event), .coalesce_target = target});
}

auto EventManager::drain(std::chrono::nanoseconds budget) -> std::size_t {
    assert(state_ == EventManagerState::Idle && "EventManager::drain re-entered");
    if (state_ != EventManagerState::Idle) {
        return 0;
    }
    state_ = EventManagerState::Draining;
    struct StateReset {
        EventManagerState& state;
        ~StateReset() { state = EventManagerState::Idle; }
    } reset{state_};

    auto const  start     = now();
    std::size_t processed = 0;
    while (!queue_.empty()) {
        // Budget only stops new work from starting; at least one event per
        // call keeps a tiny budget from starving the queue.
        if (processed > 0 && now() - start >= budget) {
            ++stats_.budget_exhaustions;
            if (options_.diagnostics) {
                wc_log("Frame budget exhausted with " + std::to_string(queue_.size()) + " event(s) deferred",
                       "EventManager");
            }
            break;
        }

        auto queued = std::move(queue_.front());
        queue_.pop_front();

        auto const event_start = now();
        auto const outcome     = dispatch(queued.event);
        record_timing(queued.event.kind, now() - event_start);

        ++processed;
        ++stats_.processed;
        switch (outcome) {
        case DispatchOutcome::Consumed:
            ++stats_.consumed;
            break;
        case DispatchOutcome::Unconsumed:
            ++stats_.unconsumed;
            break;
        case DispatchOutcome::Discarded:
            ++stats_.discarded;
            break;
        case DispatchOutcome::Faulted:
            ++stats_.faulted;
            break;
        }
    }
    return processed;
}

auto EventManager::record_timing(InputKind kind, std::chrono::nanoseconds elapsed) -> void {
    auto& timing = stats_.timings[kindIndex(kind)];
    ++timing.count;
    timing.total += elapsed;
    timing.max = std::max(timing.max, elapsed);
}

auto EventManager::record_fault(WidgetId widget, std::optional<InputKind> kind, Error error) -> void {
    wc_log("Handler fault on " + std::string(kind ? inputKindName(*kind) : "focus") + ": " + describeError(error),
           "EventManager", "ERROR");
    faults_.push_back(HandlerFault{.widget = widget, .kind = kind, .error = std::move(error)});
    while (faults_.size() > kMaxRecordedFaults) {
        faults_.pop_front();
    }
}

auto EventManager::resolve_target(InputEvent const& event) -> std::optional<WidgetId> {
    if (event.target) {
        if (tree_.contains(*event.target)) {
            return event.target;
        }
        return std::nullopt;
    }
    if (isPointerKind(event.kind)) {
        return index_.query_point(event.x, event.y);
    }
    if (focus_ && !tree_.contains(*focus_)) {
        // Focused widget went away without widget_removed(); drop the stale handle.
        focus_.reset();
    }
    return focus_;
}

auto EventManager::dispatch(InputEvent const& event) -> DispatchOutcome {
    dispatching_kind_ = event.kind;
    struct KindReset {
        std::optional<InputKind>& kind;
        ~KindReset() { kind.reset(); }
    } reset{dispatching_kind_};

    auto target  = resolve_target(event);
    auto outcome = DispatchOutcome::Discarded;
    if (target) {
        if (event.kind == InputKind::PointerDown && options_.focus_on_pointer_down) {
            focus_from_pointer(*target);
        }
        outcome = bubble(event, *target);
    }

    // Tab only moves focus when nothing on the focus path consumed it.
    if ((outcome == DispatchOutcome::Discarded || outcome == DispatchOutcome::Unconsumed)
        && handle_tab_navigation(event)) {
        return DispatchOutcome::Consumed;
    }
    return outcome;
}

auto EventManager::bubble(InputEvent const& event, WidgetId target) -> DispatchOutcome {
    auto current = std::optional<WidgetId>{target};
    while (current) {
        auto const* node = tree_.node(*current);
        if (node == nullptr) {
            break;
        }
        // Copy out before the call: the handler may mutate the tree.
        auto       handler = node->event_handler;
        auto const enabled = node->enabled;
        auto const bounds  = node->bounds;
        auto const parent  = tree_.parent(*current);

        if (enabled && handler) {
            EventContext context{
                .tree      = tree_,
                .scheduler = scheduler_,
                .events    = *this,
                .target    = target,
                .current   = *current,
                .local     = Point{event.x - bounds.x, event.y - bounds.y},
            };

            Expected<bool> result = false;
            try {
                result = handler->handle_event(event, context);
            } catch (std::exception const& ex) {
                result = std::unexpected(Error{Error::Code::HandlerFailed, ex.what()});
            } catch (...) {
                result = std::unexpected(Error{Error::Code::HandlerFailed, "unknown exception"});
            }

            if (!result) {
                record_fault(*current, event.kind, std::move(result.error()));
                return DispatchOutcome::Faulted;
            }
            if (*result) {
                return DispatchOutcome::Consumed;
            }
        }
        current = parent;
    }
    return DispatchOutcome::Unconsumed;
}

} // namespace WC
