#include <widgetcore/WidgetCore.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

using namespace std::chrono_literals;

// A window with a counter label and two buttons. Clicking a button updates a
// Link; the label depends on it and is re-rendered on the next frame.
int main(int argc, char** argv) {
    std::string config_path;
    bool        print_stats = false;
    for (int idx = 1; idx < argc; ++idx) {
        std::string_view arg{argv[idx]};
        if (arg == "--config" && idx + 1 < argc) {
            config_path = argv[++idx];
        } else if (arg == "--stats") {
            print_stats = true;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--config <file.json>] [--stats]\n";
            return 1;
        }
    }

    WC::RuntimeConfig config{};
    if (!config_path.empty()) {
        auto loaded = WC::load_runtime_config_file(config_path);
        if (!loaded) {
            std::cerr << "load_runtime_config_file failed: " << WC::describeError(loaded.error()) << '\n';
            return 1;
        }
        config = std::move(*loaded);
    }
    WC::apply_environment_overrides(config);

    WC::FrameLoop loop{config};
    auto          window = loop.create_widget(std::nullopt, {.name = "window", .bounds = {0, 0, 320, 200}});
    if (!window) {
        std::cerr << "create window failed: " << WC::describeError(window.error()) << '\n';
        return 1;
    }

    auto counter = loop.make_link(0);
    auto label   = loop.create_widget(*window, {.name = "label", .bounds = {20, 20, 280, 40}});
    if (!label) {
        std::cerr << "create label failed: " << WC::describeError(label.error()) << '\n';
        return 1;
    }
    counter.add_dependent(*label);

    auto make_button = [&](std::string name, WC::Rect bounds, int delta) -> WC::Expected<WC::WidgetId> {
        auto handler = WC::MakeEventHandler([&counter, delta](WC::InputEvent const& event, WC::EventContext&) -> WC::Expected<bool> {
            if (event.kind == WC::InputKind::PointerDown
                || (event.kind == WC::InputKind::KeyDown && event.key_code == WC::Keys::Space)) {
                counter.update([delta](int& value) { value += delta; });
                return true;
            }
            return false;
        });
        return loop.create_widget(*window,
                                  {.name          = std::move(name),
                                   .bounds        = bounds,
                                   .focusable     = true,
                                   .event_handler = std::move(handler)});
    };

    auto increment = make_button("increment", {20, 100, 120, 40}, 1);
    auto decrement = make_button("decrement", {180, 100, 120, 40}, -1);
    if (!increment || !decrement) {
        std::cerr << "create button failed\n";
        return 1;
    }

    WC::FrameCallbacks callbacks{
        .layout = {},
        .render =
            [&](WC::FrameLoop& frame, std::span<WC::WidgetId const> dirty, std::span<WC::Rect const> damage) {
                for (auto id : dirty) {
                    if (id == *label) {
                        std::cout << "label: " << counter.get() << '\n';
                    } else if (auto const* node = frame.tree().node(id)) {
                        std::cout << "repaint " << node->name << '\n';
                    }
                }
                std::cout << "  " << damage.size() << " damage rect(s)\n";
            },
    };

    loop.run_frame(callbacks);

    auto timestamp = 0ns;
    auto click     = [&](float x, float y) {
        timestamp += 5ms;
        loop.post(WC::MakePointerEvent(WC::InputKind::PointerDown, x, y, timestamp));
        loop.post(WC::MakePointerEvent(WC::InputKind::PointerUp, x, y, timestamp));
    };
    click(60, 120);
    click(60, 120);
    click(220, 120);
    for (int step = 0; step < 5; ++step) {
        timestamp += 1ms;
        loop.post(WC::MakePointerEvent(WC::InputKind::PointerMove, 100 + step, 120, timestamp));
    }
    timestamp += 1ms;
    loop.post(WC::MakeKeyEvent(WC::InputKind::KeyDown, WC::Keys::Tab, WC::ButtonModifiers::None, timestamp));
    timestamp += 1ms;
    loop.post(WC::MakeKeyEvent(WC::InputKind::KeyDown, WC::Keys::Space, WC::ButtonModifiers::None, timestamp));

    while (loop.events().has_pending_events()) {
        auto report = loop.run_frame(callbacks);
        std::cout << "frame " << report.frame_index << ": " << report.events_processed << " event(s), "
                  << report.rendered << " repainted\n";
    }

    std::cout << "final count: " << counter.get() << '\n';
    if (print_stats) {
        std::cout << WC::describeEventStats(loop.events().stats());
        std::cout << WC::runtime_config_to_json(loop.config()) << '\n';
    }
    // +1 +1 -1 by pointer, then Tab wraps focus back to "increment" and Space adds one.
    return counter.get() == 2 ? EXIT_SUCCESS : EXIT_FAILURE;
}
