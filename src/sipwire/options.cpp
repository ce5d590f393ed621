#include "options.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

#include <asio.hpp>

using json = nlohmann::json;

constexpr std::size_t max_udp_payload = 65535;

void validate_listener_options(const ListenerOptions& options)
{
    asio::error_code error;
    asio::ip::make_address(options.bind_address, error);
    if (error) {
        throw std::invalid_argument("invalid bind_address: " + options.bind_address);
    }
    if (options.poll_interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("poll_interval_ms must be positive");
    }
    if (options.error_backoff < std::chrono::milliseconds(1)) {
        throw std::invalid_argument("error_backoff_ms must be at least 1");
    }
    if (options.buffer_size < 1 || options.buffer_size > max_udp_payload) {
        throw std::invalid_argument("buffer_size must be between 1 and 65535");
    }
}

ListenerOptions parse_listener_options(const json& options_json)
{
    if (!options_json.is_object()) {
        throw std::invalid_argument("listener options must be a JSON object");
    }

    ListenerOptions options;
    if (options_json.contains("bind_address")) {
        options.bind_address = options_json["bind_address"].get<std::string>();
    }
    if (options_json.contains("poll_interval_ms")) {
        options.poll_interval = std::chrono::milliseconds(options_json["poll_interval_ms"].get<long long>());
    }
    if (options_json.contains("error_backoff_ms")) {
        options.error_backoff = std::chrono::milliseconds(options_json["error_backoff_ms"].get<long long>());
    }
    if (options_json.contains("buffer_size")) {
        const auto buffer_size = options_json["buffer_size"].get<long long>();
        if (buffer_size < 1) {
            throw std::invalid_argument("buffer_size must be between 1 and 65535");
        }
        options.buffer_size = static_cast<std::size_t>(buffer_size);
    }
    validate_listener_options(options);
    return options;
}

json listener_options_to_json(const ListenerOptions& options)
{
    return { { "bind_address", options.bind_address },
             { "poll_interval_ms", options.poll_interval.count() },
             { "error_backoff_ms", options.error_backoff.count() },
             { "buffer_size", options.buffer_size } };
}

std::optional<ListenerOptions> load_listener_options(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        std::cerr << "[ListenerOptions] " << path << " not found" << std::endl;
        return std::nullopt;
    }
    try {
        std::ifstream file(path);
        return parse_listener_options(json::parse(file));
    }
    catch (const json::exception& e) {
        std::cerr << "[ListenerOptions] Invalid " << path << ": " << e.what() << std::endl;
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "[ListenerOptions] Invalid " << path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}
