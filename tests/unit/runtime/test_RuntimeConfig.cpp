#include <doctest/doctest.h>

#include <widgetcore/runtime/DebugFlags.hpp>
#include <widgetcore/runtime/RuntimeConfig.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

using namespace WC;
using namespace std::chrono_literals;

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

} // namespace

TEST_SUITE("widgetcore.runtime.config") {
    TEST_CASE("empty_object_keeps_defaults") {
        auto config = load_runtime_config("{}");
        REQUIRE(config.has_value());
        CHECK(config->frame_budget == 8ms);
        CHECK(config->events.coalesce_window_events == 8);
        CHECK(config->events.coalesce_window_time == 50ms);
        CHECK(config->events.focus_on_pointer_down);
        CHECK(config->events.tab_navigation);
        CHECK_FALSE(config->events.diagnostics);
        CHECK(config->events.coalesce == DefaultCoalescePolicies());
    }

    TEST_CASE("values_override_defaults") {
        auto config = load_runtime_config(R"({
            "frame_budget_ms": 16.5,
            "coalesce_window_events": 4,
            "coalesce_window_ms": 20,
            "focus_on_pointer_down": false,
            "tab_navigation": false,
            "diagnostics": true,
            "coalesce": {"pointer_move": "none", "touch_move": "accumulate"},
            "unknown_key": 1
        })");
        REQUIRE(config.has_value());
        CHECK(config->frame_budget == 16500us);
        CHECK(config->events.coalesce_window_events == 4);
        CHECK(config->events.coalesce_window_time == 20ms);
        CHECK_FALSE(config->events.focus_on_pointer_down);
        CHECK_FALSE(config->events.tab_navigation);
        CHECK(config->events.diagnostics);
        CHECK(config->events.coalesce[kindIndex(InputKind::PointerMove)] == CoalescePolicy::None);
        CHECK(config->events.coalesce[kindIndex(InputKind::TouchMove)] == CoalescePolicy::Accumulate);
        CHECK(config->events.coalesce[kindIndex(InputKind::PointerWheel)] == CoalescePolicy::Accumulate);
    }

    TEST_CASE("malformed_input_is_reported") {
        auto expect_malformed = [](std::string_view text) {
            auto config = load_runtime_config(text);
            REQUIRE_FALSE(config.has_value());
            CHECK(config.error().code == Error::Code::MalformedInput);
        };
        expect_malformed("{not json");
        expect_malformed("[1, 2]");
        expect_malformed(R"({"frame_budget_ms": "fast"})");
        expect_malformed(R"({"frame_budget_ms": -1})");
        expect_malformed(R"({"coalesce_window_events": -3})");
        expect_malformed(R"({"tab_navigation": 1})");
        expect_malformed(R"({"coalesce": []})");
        expect_malformed(R"({"coalesce": {"pointer_move": "merge"}})");
        expect_malformed(R"({"coalesce": {"mouse_move": "replace"}})");
    }

    TEST_CASE("error_message_names_the_field") {
        auto config = load_runtime_config(R"({"diagnostics": "yes"})");
        REQUIRE_FALSE(config.has_value());
        CHECK(describeError(config.error()) == "malformed_input:diagnostics: must be a bool");
    }

    TEST_CASE("serialized_config_loads_back") {
        RuntimeConfig original{};
        original.frame_budget                  = 12ms;
        original.events.coalesce_window_events = 3;
        original.events.tab_navigation         = false;
        original.events.coalesce[kindIndex(InputKind::PointerHover)] = CoalescePolicy::None;

        auto loaded = load_runtime_config(runtime_config_to_json(original));
        REQUIRE(loaded.has_value());
        CHECK(loaded->frame_budget == 12ms);
        CHECK(loaded->events.coalesce_window_events == 3);
        CHECK_FALSE(loaded->events.tab_navigation);
        CHECK(loaded->events.coalesce == original.events.coalesce);
    }

    TEST_CASE("config_file_loading") {
        auto path = std::filesystem::temp_directory_path() / "widgetcore_runtime_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"coalesce_window_ms": 10})";
        }
        auto config = load_runtime_config_file(path);
        std::filesystem::remove(path);
        REQUIRE(config.has_value());
        CHECK(config->events.coalesce_window_time == 10ms);

        auto missing = load_runtime_config_file(path);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NotFound);
    }

    TEST_CASE("environment_enables_diagnostics") {
        RuntimeConfig config{};
        {
            EnvGuard guard{"WIDGETCORE_DIAGNOSTICS", "0"};
            EnvGuard alias{"WIDGETCORE_DEBUG", nullptr};
            apply_environment_overrides(config);
            CHECK_FALSE(config.events.diagnostics);
        }
        {
            EnvGuard guard{"WIDGETCORE_DIAGNOSTICS", "yes"};
            apply_environment_overrides(config);
            CHECK(config.events.diagnostics);
        }
    }
}

TEST_SUITE("widgetcore.runtime.debug_flags") {
    TEST_CASE("truthy_parsing") {
        CHECK_FALSE(ParseTruthy(nullptr));
        CHECK(ParseTruthy(""));
        CHECK(ParseTruthy("1"));
        CHECK(ParseTruthy("on"));
        CHECK(ParseTruthy("  TRUE \n"));
        CHECK_FALSE(ParseTruthy("0"));
        CHECK_FALSE(ParseTruthy("False"));
        CHECK_FALSE(ParseTruthy(" off "));
        CHECK_FALSE(ParseTruthy("NO"));
    }
}
