#include <widgetcore/runtime/RuntimeConfig.hpp>
#include <widgetcore/runtime/DebugFlags.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace WC {

namespace {

using Json = nlohmann::json;

[[nodiscard]] auto make_error(Error::Code code, std::string_view field, std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    if (!detail.empty()) {
        message.append(": ");
        message.append(detail);
    }
    return Error{code, std::move(message)};
}

[[nodiscard]] auto read_boolean(Json const& json, char const* key, bool default_value) -> Expected<bool> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be a bool"));
        }
        return it->get<bool>();
    }
    return default_value;
}

[[nodiscard]] auto read_uint64(Json const& json, char const* key, std::uint64_t default_value)
    -> Expected<std::uint64_t> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_number_unsigned()) {
            return it->get<std::uint64_t>();
        }
        if (it->is_number_integer()) {
            auto value = it->get<std::int64_t>();
            if (value < 0) {
                return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be non-negative"));
            }
            return static_cast<std::uint64_t>(value);
        }
        return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be an integer"));
    }
    return default_value;
}

// Accepts fractional milliseconds ("frame_budget_ms": 16.6).
[[nodiscard]] auto read_milliseconds(Json const& json, char const* key, std::chrono::nanoseconds default_value)
    -> Expected<std::chrono::nanoseconds> {
    auto it = json.find(key);
    if (it == json.end()) {
        return default_value;
    }
    if (!it->is_number()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be a number of milliseconds"));
    }
    auto const millis = it->get<double>();
    if (!(millis >= 0.0)) {
        return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be non-negative"));
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double, std::milli>{millis});
}

[[nodiscard]] auto read_coalesce_map(Json const& json, std::array<CoalescePolicy, kInputKindCount>& policies)
    -> Expected<void> {
    auto it = json.find("coalesce");
    if (it == json.end()) {
        return {};
    }
    if (!it->is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "coalesce", "must be a JSON object"));
    }
    for (auto const& [name, value] : it->items()) {
        auto kind = inputKindFromName(name);
        if (!kind) {
            return std::unexpected(make_error(Error::Code::MalformedInput, "coalesce." + name, "unknown input kind"));
        }
        if (!value.is_string()) {
            return std::unexpected(make_error(Error::Code::MalformedInput, "coalesce." + name, "must be a string"));
        }
        auto policy = coalescePolicyFromName(value.get<std::string>());
        if (!policy) {
            return std::unexpected(make_error(Error::Code::MalformedInput,
                                              "coalesce." + name,
                                              "must be one of none, replace, accumulate"));
        }
        policies[kindIndex(*kind)] = *policy;
    }
    return {};
}

[[nodiscard]] auto to_milliseconds(std::chrono::nanoseconds value) -> double {
    return std::chrono::duration<double, std::milli>{value}.count();
}

} // namespace

auto load_runtime_config(std::string_view json_text) -> Expected<RuntimeConfig> {
    auto json = Json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "runtime config", "invalid JSON"));
    }
    if (!json.is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "runtime config", "must be a JSON object"));
    }

    RuntimeConfig config{};

    auto budget = read_milliseconds(json, "frame_budget_ms", config.frame_budget);
    if (!budget) {
        return std::unexpected(budget.error());
    }
    config.frame_budget = *budget;

    auto window_events = read_uint64(json, "coalesce_window_events", config.events.coalesce_window_events);
    if (!window_events) {
        return std::unexpected(window_events.error());
    }
    config.events.coalesce_window_events = static_cast<std::size_t>(*window_events);

    auto window_time = read_milliseconds(json, "coalesce_window_ms", config.events.coalesce_window_time);
    if (!window_time) {
        return std::unexpected(window_time.error());
    }
    config.events.coalesce_window_time = *window_time;

    auto focus_on_pointer_down = read_boolean(json, "focus_on_pointer_down", config.events.focus_on_pointer_down);
    if (!focus_on_pointer_down) {
        return std::unexpected(focus_on_pointer_down.error());
    }
    config.events.focus_on_pointer_down = *focus_on_pointer_down;

    auto tab_navigation = read_boolean(json, "tab_navigation", config.events.tab_navigation);
    if (!tab_navigation) {
        return std::unexpected(tab_navigation.error());
    }
    config.events.tab_navigation = *tab_navigation;

    auto diagnostics = read_boolean(json, "diagnostics", config.events.diagnostics);
    if (!diagnostics) {
        return std::unexpected(diagnostics.error());
    }
    config.events.diagnostics = *diagnostics;

    if (auto coalesce = read_coalesce_map(json, config.events.coalesce); !coalesce) {
        return std::unexpected(coalesce.error());
    }
    return config;
}

auto load_runtime_config_file(std::filesystem::path const& path) -> Expected<RuntimeConfig> {
    std::ifstream input(path);
    if (!input) {
        return std::unexpected(Error{Error::Code::NotFound, "Cannot open runtime config " + path.string()});
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto config = load_runtime_config(buffer.str());
    if (!config) {
        wc_log("Rejected runtime config " + path.string() + ": " + describeError(config.error()), "Config", "ERROR");
    }
    return config;
}

auto apply_environment_overrides(RuntimeConfig& config) -> void {
    if (EnvironmentDiagnosticsRequested()) {
        config.events.diagnostics = true;
        wc_log("Diagnostics enabled from environment", "Config");
    }
}

auto runtime_config_to_json(RuntimeConfig const& config) -> std::string {
    Json coalesce = Json::object();
    for (auto kind : kAllInputKinds) {
        coalesce[std::string(inputKindName(kind))] = std::string(coalescePolicyName(config.events.coalesce[kindIndex(kind)]));
    }
    Json json{
        {"frame_budget_ms", to_milliseconds(config.frame_budget)},
        {"coalesce_window_events", config.events.coalesce_window_events},
        {"coalesce_window_ms", to_milliseconds(config.events.coalesce_window_time)},
        {"focus_on_pointer_down", config.events.focus_on_pointer_down},
        {"tab_navigation", config.events.tab_navigation},
        {"diagnostics", config.events.diagnostics},
        {"coalesce", std::move(coalesce)},
    };
    return json.dump(2);
}

} // namespace WC
