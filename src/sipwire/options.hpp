#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

struct ListenerOptions {
    std::string bind_address = "0.0.0.0";
    // Upper bound on how long the listener waits before re-checking its stop flag
    std::chrono::milliseconds poll_interval { 100 };
    // Pause after a failed receive, at least 1ms
    std::chrono::milliseconds error_backoff { 50 };
    std::size_t buffer_size = 65535;
};

// Throws std::invalid_argument naming the first value out of range.
void validate_listener_options(const ListenerOptions& options);

// Missing keys keep their defaults. Throws nlohmann::json::exception on wrong types and
// std::invalid_argument on out of range values.
[[nodiscard]] ListenerOptions parse_listener_options(const nlohmann::json& options_json);

[[nodiscard]] nlohmann::json listener_options_to_json(const ListenerOptions& options);

[[nodiscard]] std::optional<ListenerOptions> load_listener_options(const std::filesystem::path& path);
