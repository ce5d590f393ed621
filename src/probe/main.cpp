#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "sipwire/sipwire.h"

using json = nlohmann::json;

struct ProbeConfig {
    std::uint16_t port = 15060;
    std::string host = "127.0.0.1";
    std::string message = "INVITE sip:probe@localhost SIP/2.0\r\nVia: SIP/2.0/UDP 127.0.0.1\r\n\r\n";
    std::chrono::milliseconds wait { 1000 };
    json listener = json::object();
};

ProbeConfig parse_probe_config(const json& config_json)
{
    ProbeConfig config;
    config.port = config_json.value("port", config.port);
    config.host = config_json.value("host", config.host);
    config.message = config_json.value("message", config.message);
    config.wait = std::chrono::milliseconds(config_json.value("wait_ms", config.wait.count()));
    config.listener = config_json.value("listener", config.listener);
    return config;
}

// Events are copied out of the callback; the strings it gets die when it returns.
std::mutex events_mutex;
std::condition_variable events_cv;
std::vector<std::pair<std::string, std::string>> events;

void on_event(const char* event, const char* payload)
{
    {
        std::lock_guard lock(events_mutex);
        events.emplace_back(event, payload);
    }
    events_cv.notify_one();
}

bool wait_for_rx(const std::chrono::milliseconds timeout)
{
    std::unique_lock lock(events_mutex);
    return events_cv.wait_for(lock, timeout, [] {
        for (const auto& [event, payload] : events) {
            if (event == "sip_rx") {
                return true;
            }
        }
        return false;
    });
}

int main(const int argc, char** argv)
{
    const std::filesystem::path config_path = argc > 1 ? argv[1] : "sipwire.json";

    ProbeConfig config;
    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream file(config_path);
            config = parse_probe_config(json::parse(file));
        }
        catch (const json::exception& e) {
            std::cerr << "Invalid " << config_path << ": " << e.what() << std::endl;
            return EXIT_FAILURE;
        }
    }
    else if (argc > 1) {
        std::cerr << config_path << " not found" << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "sipwire probe, " << sipwire_version() << std::endl;

    if (!sipwire_init()) {
        std::cerr << "sipwire_init failed" << std::endl;
        return EXIT_FAILURE;
    }
    if (!sipwire_configure(config.listener.dump().c_str())) {
        std::cerr << "Invalid listener options" << std::endl;
        return EXIT_FAILURE;
    }

    sipwire_set_event_callback(on_event);

    if (!sipwire_start_udp_listener(config.port)) {
        std::cerr << "Failed to listen on port " << config.port << std::endl;
        sipwire_shutdown();
        return EXIT_FAILURE;
    }
    const std::uint16_t port = sipwire_listener_port();
    std::cout << "Listening on port " << port << std::endl;

    if (!sipwire_send_udp(config.host.c_str(), port, config.message.c_str())) {
        std::cerr << "Failed to send to " << config.host << ":" << port << std::endl;
        sipwire_shutdown();
        return EXIT_FAILURE;
    }

    const bool received = wait_for_rx(config.wait);
    sipwire_shutdown();

    std::lock_guard lock(events_mutex);
    for (const auto& [event, payload] : events) {
        std::cout << "event=" << event << " payload_len=" << payload.size() << std::endl;
    }
    if (!received) {
        std::cerr << "No sip_rx event within " << config.wait.count() << "ms" << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
