#include <doctest/doctest.h>

#include "EventTestHarness.hpp"

using namespace WC;
using namespace WC::Test;

TEST_SUITE("widgetcore.events.coalescing") {
    TEST_CASE("moves_collapse_and_click_keeps_its_place") {
        EventHarness h;
        h.add(std::nullopt, "canvas", Rect{0, 0, 100, 100});
        h.events.post(MakePointerEvent(InputKind::PointerMove, 10, 10, ms(0)));
        h.events.post(MakePointerEvent(InputKind::PointerMove, 12, 12, ms(1)));
        h.events.post(MakePointerEvent(InputKind::PointerDown, 12, 12, ms(2)));

        auto pending = h.events.pending_events();
        REQUIRE(pending.size() == 2);
        CHECK(pending[0].kind == InputKind::PointerMove);
        CHECK(pending[0].x == doctest::Approx(12));
        CHECK(pending[0].y == doctest::Approx(12));
        CHECK(pending[1].kind == InputKind::PointerDown);
        CHECK(h.events.stats().coalesced == 1);

        CHECK(h.events.drain(ms(100)) == 2);
        CHECK(h.log == std::vector<std::string>{"canvas:pointer_move", "canvas:pointer_down"});
        CHECK_FALSE(h.events.has_pending_events());
    }

    TEST_CASE("ordered_events_are_coalescing_barriers") {
        EventHarness h;
        h.add(std::nullopt, "canvas", Rect{0, 0, 100, 100});
        h.events.post(MakePointerEvent(InputKind::PointerMove, 10, 10, ms(0)));
        h.events.post(MakePointerEvent(InputKind::PointerDown, 10, 10, ms(1)));
        h.events.post(MakePointerEvent(InputKind::PointerMove, 20, 20, ms(2)));
        CHECK(h.events.pending_count() == 3);
        CHECK(h.events.stats().coalesced == 0);
    }

    TEST_CASE("moves_over_different_targets_stay_separate") {
        EventHarness h;
        h.add(std::nullopt, "left", Rect{0, 0, 50, 50});
        h.add(std::nullopt, "right", Rect{50, 0, 50, 50});
        h.events.post(MakePointerEvent(InputKind::PointerMove, 10, 10, ms(0)));
        h.events.post(MakePointerEvent(InputKind::PointerMove, 60, 10, ms(1)));
        CHECK(h.events.pending_count() == 2);

        // Scans past the other target's move to find its own.
        h.events.post(MakePointerEvent(InputKind::PointerMove, 20, 20, ms(2)));
        auto pending = h.events.pending_events();
        REQUIRE(pending.size() == 2);
        CHECK(pending[0].x == doctest::Approx(20));
        CHECK(pending[1].x == doctest::Approx(60));
    }

    TEST_CASE("time_window_limits_coalescing") {
        EventHarness h;
        h.add(std::nullopt, "canvas", Rect{0, 0, 100, 100});
        h.events.post(MakePointerEvent(InputKind::PointerMove, 10, 10, ms(0)));
        h.events.post(MakePointerEvent(InputKind::PointerMove, 12, 12, ms(60)));
        CHECK(h.events.pending_count() == 2);
    }

    TEST_CASE("event_window_limits_how_far_back_coalescing_looks") {
        EventManagerOptions options{};
        options.coalesce_window_events = 2;
        EventHarness h{options};
        h.add(std::nullopt, "a", Rect{0, 0, 10, 10});
        h.add(std::nullopt, "b", Rect{10, 0, 10, 10});
        h.add(std::nullopt, "c", Rect{20, 0, 10, 10});
        h.events.post(MakePointerEvent(InputKind::PointerMove, 5, 5, ms(0)));
        h.events.post(MakePointerEvent(InputKind::PointerMove, 15, 5, ms(1)));
        h.events.post(MakePointerEvent(InputKind::PointerMove, 25, 5, ms(2)));
        h.events.post(MakePointerEvent(InputKind::PointerMove, 6, 6, ms(3)));
        CHECK(h.events.pending_count() == 4);
    }

    TEST_CASE("wheel_deltas_accumulate") {
        EventHarness h;
        h.add(std::nullopt, "scroller", Rect{0, 0, 100, 100});
        h.events.post(MakeWheelEvent(10, 10, 1.0f, -2.0f, ms(0)));
        h.events.post(MakeWheelEvent(11, 11, 2.0f, -3.0f, ms(1)));
        auto pending = h.events.pending_events();
        REQUIRE(pending.size() == 1);
        CHECK(pending[0].wheel_dx == doctest::Approx(3.0f));
        CHECK(pending[0].wheel_dy == doctest::Approx(-5.0f));
        CHECK(pending[0].x == doctest::Approx(11));
    }

    TEST_CASE("policy_none_queues_every_event") {
        EventManagerOptions options{};
        options.coalesce[kindIndex(InputKind::PointerMove)] = CoalescePolicy::None;
        EventHarness h{options};
        h.add(std::nullopt, "canvas", Rect{0, 0, 100, 100});
        h.events.post(MakePointerEvent(InputKind::PointerMove, 10, 10, ms(0)));
        h.events.post(MakePointerEvent(InputKind::PointerMove, 12, 12, ms(1)));
        CHECK(h.events.pending_count() == 2);
    }

    TEST_CASE("keyboard_events_are_never_coalesced_by_default") {
        EventHarness h;
        for (int i = 0; i < 3; ++i) {
            h.events.post(MakeKeyEvent(InputKind::KeyDown, 'a', ButtonModifiers::None, ms(i)));
        }
        CHECK(h.events.pending_count() == 3);
    }

    TEST_CASE("policy_names_round_trip_through_config_text") {
        CHECK(coalescePolicyFromName("accumulate") == CoalescePolicy::Accumulate);
        CHECK(coalescePolicyName(CoalescePolicy::Replace) == "replace");
        CHECK_FALSE(coalescePolicyFromName("merge").has_value());
        auto defaults = DefaultCoalescePolicies();
        CHECK(defaults[kindIndex(InputKind::TouchMove)] == CoalescePolicy::Replace);
        CHECK(defaults[kindIndex(InputKind::PointerWheel)] == CoalescePolicy::Accumulate);
        CHECK(defaults[kindIndex(InputKind::PointerDown)] == CoalescePolicy::None);
    }
}
