#include "sipwire.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "context.hpp"

using json = nlohmann::json;

namespace {

SipwireContext& global_context()
{
    static SipwireContext context;
    return context;
}

}

bool sipwire_init(void)
{
    return global_context().reset();
}

void sipwire_set_event_callback(const sipwire_event_cb cb)
{
    if (cb == nullptr) {
        global_context().clear_callback();
        return;
    }
    global_context().register_callback(cb);
}

void sipwire_clear_event_callback(void)
{
    global_context().clear_callback();
}

bool sipwire_start_udp_listener(const uint16_t port)
{
    return global_context().start_listener(port);
}

uint16_t sipwire_listener_port(void)
{
    return global_context().listener_port().value_or(0);
}

bool sipwire_send_udp(const char* dest_ip, const uint16_t dest_port, const char* data)
{
    if (dest_ip == nullptr || data == nullptr) {
        return false;
    }
    return global_context().send(dest_ip, dest_port, std::string_view(data));
}

bool sipwire_send_udp_bytes(const char* dest_ip, const uint16_t dest_port, const uint8_t* data, const size_t size)
{
    if (dest_ip == nullptr || data == nullptr) {
        return false;
    }
    // Raw bytes travel as a char view; nothing reads them as text
    return global_context().send(dest_ip, dest_port, std::string_view(reinterpret_cast<const char*>(data), size));
}

bool sipwire_configure(const char* options_json)
{
    if (options_json == nullptr) {
        return false;
    }
    try {
        return global_context().configure(parse_listener_options(json::parse(options_json)));
    }
    catch (const json::exception& e) {
        std::cerr << "[sipwire] Invalid options: " << e.what() << std::endl;
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "[sipwire] Invalid options: " << e.what() << std::endl;
    }
    return false;
}

void sipwire_shutdown(void)
{
    global_context().stop_listener();
}

const char* sipwire_version(void)
{
    return SipwireContext::version();
}
