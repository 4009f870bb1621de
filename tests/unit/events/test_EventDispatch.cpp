#include <doctest/doctest.h>

#include "EventTestHarness.hpp"

#include <stdexcept>

using namespace WC;
using namespace WC::Test;

TEST_SUITE("widgetcore.events.dispatch") {
    TEST_CASE("budget_defers_remaining_events_in_order") {
        EventHarness      h;
        std::vector<float> seen;
        auto handler = MakeEventHandler([&](InputEvent const& event, EventContext&) -> Expected<bool> {
            seen.push_back(event.x);
            h.clock->advance(ms(3));
            return true;
        });
        auto button = h.tree.create_root({.bounds = {0, 0, 100, 100}, .event_handler = handler});
        h.index.insert(button, Rect{0, 0, 100, 100});
        for (int i = 0; i < 5; ++i) {
            h.events.post(MakePointerEvent(InputKind::PointerDown, static_cast<float>(i), 0, ms(i)));
        }

        CHECK(h.events.drain(ms(5)) == 2);
        CHECK(h.events.pending_count() == 3);
        CHECK(h.events.stats().budget_exhaustions == 1);
        auto pending = h.events.pending_events();
        CHECK(pending[0].x == doctest::Approx(2));
        CHECK(pending[2].x == doctest::Approx(4));

        CHECK(h.events.drain(ms(100)) == 3);
        CHECK(seen == std::vector<float>{0, 1, 2, 3, 4});
        CHECK(h.events.state() == EventManagerState::Idle);
    }

    TEST_CASE("zero_budget_still_makes_progress") {
        EventHarness h;
        h.add(std::nullopt, "button", Rect{0, 0, 10, 10});
        h.events.post(MakePointerEvent(InputKind::PointerDown, 1, 1, ms(0)));
        h.events.post(MakePointerEvent(InputKind::PointerUp, 1, 1, ms(1)));
        CHECK(h.events.drain(std::chrono::nanoseconds{0}) == 1);
        CHECK(h.events.pending_count() == 1);
        CHECK(h.events.drain(std::chrono::nanoseconds{0}) == 1);
        CHECK_FALSE(h.events.has_pending_events());
    }

    TEST_CASE("drain_on_empty_queue_processes_nothing") {
        EventHarness h;
        CHECK(h.events.drain(ms(8)) == 0);
        CHECK(h.events.stats().budget_exhaustions == 0);
    }

    TEST_CASE("unconsumed_events_bubble_until_consumed") {
        EventHarness h;
        auto window = h.add(std::nullopt, "window", Rect{0, 0, 100, 100}, true);
        auto panel  = h.add(window, "panel", Rect{0, 0, 50, 50}, true);
        h.add(panel, "button", Rect{0, 0, 20, 20}, false);
        h.events.post(MakePointerEvent(InputKind::PointerDown, 5, 5, ms(0)));
        h.events.drain(ms(8));
        CHECK(h.log == std::vector<std::string>{"button:pointer_down", "panel:pointer_down"});
        CHECK(h.events.stats().consumed == 1);
    }

    TEST_CASE("disabled_widgets_and_missing_handlers_are_skipped") {
        EventHarness h;
        auto window  = h.add(std::nullopt, "window", Rect{0, 0, 100, 100}, true);
        auto plain   = h.tree.create_child(window, {.name = "plain", .bounds = {0, 0, 50, 50}});
        REQUIRE(plain.has_value());
        h.index.insert(*plain, Rect{0, 0, 50, 50});
        auto button = h.add(*plain, "button", Rect{0, 0, 20, 20}, true);
        REQUIRE(h.tree.set_enabled(button, false).has_value());

        h.events.post(MakePointerEvent(InputKind::PointerDown, 5, 5, ms(0)));
        h.events.drain(ms(8));
        CHECK(h.log == std::vector<std::string>{"window:pointer_down"});
    }

    TEST_CASE("event_reaching_past_the_root_is_unconsumed") {
        EventHarness h;
        h.add(std::nullopt, "window", Rect{0, 0, 100, 100}, false);
        h.events.post(MakePointerEvent(InputKind::PointerUp, 5, 5, ms(0)));
        h.events.drain(ms(8));
        CHECK(h.events.stats().unconsumed == 1);
    }

    TEST_CASE("events_without_target_are_discarded") {
        EventHarness h;
        h.add(std::nullopt, "window", Rect{0, 0, 100, 100});
        h.events.post(MakePointerEvent(InputKind::PointerDown, 500, 500, ms(0)));
        h.events.post(MakeKeyEvent(InputKind::KeyDown, 'x', ButtonModifiers::None, ms(1)));
        CHECK(h.events.drain(ms(8)) == 2);
        CHECK(h.events.stats().discarded == 2);
        CHECK(h.log.empty());
    }

    TEST_CASE("explicit_target_bypasses_hit_testing") {
        EventHarness h;
        h.add(std::nullopt, "under", Rect{0, 0, 100, 100});
        auto captured = h.add(std::nullopt, "captured", Rect{200, 200, 10, 10});
        auto event    = MakePointerEvent(InputKind::PointerMove, 5, 5, ms(0));
        event.target  = captured;
        h.events.post(event);
        h.events.drain(ms(8));
        CHECK(h.log == std::vector<std::string>{"captured:pointer_move"});
    }

    TEST_CASE("handler_errors_are_recorded_and_dispatch_continues") {
        EventHarness h;
        auto failing = MakeEventHandler([](InputEvent const&, EventContext&) -> Expected<bool> {
            return std::unexpected(Error{Error::Code::InvalidArgument, "bad state"});
        });
        auto throwing = MakeEventHandler([](InputEvent const&, EventContext&) -> Expected<bool> {
            throw std::runtime_error("boom");
        });
        auto first  = h.tree.create_root({.bounds = {0, 0, 10, 10}, .event_handler = failing});
        auto second = h.tree.create_root({.bounds = {20, 0, 10, 10}, .event_handler = throwing});
        h.index.insert(first, Rect{0, 0, 10, 10});
        h.index.insert(second, Rect{20, 0, 10, 10});
        h.add(std::nullopt, "healthy", Rect{40, 0, 10, 10});

        h.events.post(MakePointerEvent(InputKind::PointerDown, 5, 5, ms(0)));
        h.events.post(MakePointerEvent(InputKind::PointerDown, 25, 5, ms(1)));
        h.events.post(MakePointerEvent(InputKind::PointerDown, 45, 5, ms(2)));
        CHECK(h.events.drain(ms(8)) == 3);

        REQUIRE(h.events.faults().size() == 2);
        CHECK(h.events.faults()[0].widget == first);
        CHECK(h.events.faults()[0].error.code == Error::Code::InvalidArgument);
        CHECK(h.events.faults()[1].widget == second);
        CHECK(h.events.faults()[1].error.code == Error::Code::HandlerFailed);
        CHECK(h.events.faults()[1].error.message == std::optional<std::string>{"boom"});
        CHECK(h.events.stats().faulted == 2);
        CHECK(h.log == std::vector<std::string>{"healthy:pointer_down"});
        h.events.clear_faults();
        CHECK(h.events.faults().empty());
    }

    TEST_CASE("non_standard_exceptions_are_recorded_as_faults") {
        EventHarness h;
        auto throwing = MakeEventHandler([](InputEvent const&, EventContext&) -> Expected<bool> {
            throw 42;
        });
        auto widget = h.tree.create_root({.bounds = {0, 0, 10, 10}, .event_handler = throwing});
        h.index.insert(widget, Rect{0, 0, 10, 10});
        h.add(std::nullopt, "healthy", Rect{20, 0, 10, 10});

        h.events.post(MakePointerEvent(InputKind::PointerUp, 5, 5, ms(0)));
        h.events.post(MakePointerEvent(InputKind::PointerUp, 25, 5, ms(1)));
        CHECK(h.events.drain(std::chrono::seconds{1}) == 2);
        CHECK_FALSE(h.events.has_pending_events());

        REQUIRE(h.events.faults().size() == 1);
        CHECK(h.events.faults()[0].widget == widget);
        CHECK(h.events.faults()[0].kind == std::optional<InputKind>{InputKind::PointerUp});
        CHECK(h.events.faults()[0].error.code == Error::Code::HandlerFailed);
        CHECK(h.events.faults()[0].error.message == std::optional<std::string>{"unknown exception"});
        CHECK(h.events.stats().faulted == 1);
        CHECK(h.log == std::vector<std::string>{"healthy:pointer_up"});
        CHECK(h.events.state() == EventManagerState::Idle);
    }

    TEST_CASE("fault_log_is_bounded") {
        EventHarness h;
        auto failing = MakeEventHandler([](InputEvent const&, EventContext&) -> Expected<bool> {
            return std::unexpected(Error{Error::Code::UnknownError, "again"});
        });
        auto widget = h.tree.create_root({.bounds = {0, 0, 10, 10}, .event_handler = failing});
        h.index.insert(widget, Rect{0, 0, 10, 10});
        for (std::size_t i = 0; i < EventManager::kMaxRecordedFaults + 10; ++i) {
            h.events.post(MakePointerEvent(InputKind::PointerDown, 1, 1, ms(static_cast<double>(i))));
        }
        h.events.drain(std::chrono::seconds{1});
        CHECK(h.events.faults().size() == EventManager::kMaxRecordedFaults);
        CHECK(h.events.stats().faulted == EventManager::kMaxRecordedFaults + 10);
    }

    TEST_CASE("handler_may_destroy_its_own_ancestors") {
        EventHarness h;
        auto window = h.add(std::nullopt, "window", Rect{0, 0, 100, 100}, true);
        auto panel  = h.add(window, "panel", Rect{0, 0, 50, 50}, true);
        auto destroyer = MakeEventHandler([&](InputEvent const&, EventContext& context) -> Expected<bool> {
            h.index.remove(context.current);
            auto destroyed = context.tree.destroy(panel);
            if (!destroyed) {
                return std::unexpected(destroyed.error());
            }
            return false;
        });
        auto button = h.tree.create_child(panel, {.bounds = {0, 0, 10, 10}, .event_handler = destroyer});
        REQUIRE(button.has_value());
        h.index.insert(*button, Rect{0, 0, 10, 10});

        h.events.post(MakePointerEvent(InputKind::PointerDown, 5, 5, ms(0)));
        CHECK(h.events.drain(ms(8)) == 1);
        CHECK_FALSE(h.tree.contains(panel));
        CHECK(h.log.empty());
        CHECK(h.events.stats().unconsumed == 1);
    }

    TEST_CASE("handler_context_carries_target_and_local_position") {
        EventHarness h;
        WidgetId     seen_target{};
        WidgetId     seen_current{};
        Point        seen_local{};
        auto parent_handler = MakeEventHandler([&](InputEvent const&, EventContext& context) -> Expected<bool> {
            seen_target  = context.target;
            seen_current = context.current;
            seen_local   = context.local;
            context.scheduler.mark_dirty(context.current, DirtyKind::Visual);
            return true;
        });
        auto parent = h.tree.create_root({.bounds = {10, 10, 100, 100}, .event_handler = parent_handler});
        h.index.insert(parent, Rect{10, 10, 100, 100});
        auto child = h.add(parent, "child", Rect{20, 20, 10, 10}, false);

        h.events.post(MakePointerEvent(InputKind::PointerDown, 25, 26, ms(0)));
        h.events.drain(ms(8));
        CHECK(seen_target == child);
        CHECK(seen_current == parent);
        CHECK(seen_local.x == doctest::Approx(15));
        CHECK(seen_local.y == doctest::Approx(16));
        CHECK(h.scheduler.is_dirty(parent));
    }

    TEST_CASE("stats_track_per_kind_timing") {
        EventHarness h;
        auto slow = MakeEventHandler([&](InputEvent const&, EventContext&) -> Expected<bool> {
            h.clock->advance(ms(2));
            return true;
        });
        auto widget = h.tree.create_root({.bounds = {0, 0, 10, 10}, .event_handler = slow});
        h.index.insert(widget, Rect{0, 0, 10, 10});
        h.events.post(MakePointerEvent(InputKind::PointerDown, 1, 1, ms(0)));
        h.events.post(MakePointerEvent(InputKind::PointerUp, 1, 1, ms(1)));
        h.events.drain(ms(100));

        auto const& timing = h.events.stats().timings[kindIndex(InputKind::PointerDown)];
        CHECK(timing.count == 1);
        CHECK(timing.max == ms(2));
        CHECK(timing.average() == ms(2));
        CHECK(h.events.stats().processed == 2);
        CHECK(h.events.stats().posted == 2);
        auto text = describeEventStats(h.events.stats());
        CHECK(text.find("pointer_down: count=1") != std::string::npos);
        h.events.reset_stats();
        CHECK(h.events.stats().processed == 0);
    }

#ifdef NDEBUG
    TEST_CASE("reentrant_drain_returns_zero") {
        EventHarness h;
        std::size_t  nested = 99;
        auto handler = MakeEventHandler([&](InputEvent const&, EventContext& context) -> Expected<bool> {
            nested = context.events.drain(ms(8));
            return true;
        });
        auto widget = h.tree.create_root({.bounds = {0, 0, 10, 10}, .event_handler = handler});
        h.index.insert(widget, Rect{0, 0, 10, 10});
        h.events.post(MakePointerEvent(InputKind::PointerDown, 1, 1, ms(0)));
        h.events.post(MakePointerEvent(InputKind::PointerUp, 1, 1, ms(1)));
        CHECK(h.events.drain(ms(8)) == 2);
        CHECK(nested == 0);
    }
#endif
}
