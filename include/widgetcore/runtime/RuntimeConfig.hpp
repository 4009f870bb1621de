#pragma once

#include <widgetcore/core/Error.hpp>
#include <widgetcore/events/EventManager.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace WC {

struct RuntimeConfig {
    // Default drain budget handed to EventManager::drain by the frame loop.
    std::chrono::nanoseconds frame_budget{std::chrono::milliseconds{8}};
    EventManagerOptions      events{};
};

// Missing keys keep their defaults; unknown keys are ignored. Wrong types,
// negative durations and unknown policy or kind names are MalformedInput.
[[nodiscard]] auto load_runtime_config(std::string_view json_text) -> Expected<RuntimeConfig>;
[[nodiscard]] auto load_runtime_config_file(std::filesystem::path const& path) -> Expected<RuntimeConfig>;

// WIDGETCORE_DIAGNOSTICS turns diagnostics on; it never turns them off.
auto apply_environment_overrides(RuntimeConfig& config) -> void;

[[nodiscard]] auto runtime_config_to_json(RuntimeConfig const& config) -> std::string;

} // namespace WC
