#include "context.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include <asio.hpp>

#include "sender.hpp"
#include "text.hpp"

namespace {

constexpr const char* version_string = "sipwire-0.1.0";

}

SipwireContext::SipwireContext(ListenerOptions options)
    : m_running(false)
    , m_options(std::move(options))
{
    validate_listener_options(m_options);
}

SipwireContext::~SipwireContext()
{
    stop_listener();
}

bool SipwireContext::reset()
{
    std::lock_guard lock(m_mutex);
    if (m_listener) {
        std::cerr << "[SipwireContext] Reset refused while a listener is active" << std::endl;
        return false;
    }
    m_running = false;
    m_registry.clear();
    return true;
}

void SipwireContext::register_callback(CallbackRegistry::Callback callback)
{
    m_registry.set(std::move(callback));
}

void SipwireContext::clear_callback()
{
    m_registry.clear();
}

bool SipwireContext::start_listener(const std::uint16_t port)
{
    std::lock_guard lock(m_mutex);
    if (m_running || m_listener) {
        return false;
    }

    try {
        auto listener = std::make_unique<ListenerUdp>(port, m_options);
        m_running = true;
        listener->start(m_running, m_registry);
        m_listener = std::move(listener);
    }
    catch (const asio::system_error& e) {
        m_running = false;
        std::cerr << "[SipwireContext] Cannot listen on " << m_options.bind_address << ":" << port << ": "
                  << e.what() << std::endl;
        return false;
    }
    return true;
}

void SipwireContext::stop_listener()
{
    {
        std::lock_guard lock(m_mutex);
        m_running = false;
        // Destroying the listener joins its thread
        m_listener.reset();
    }
    m_registry.clear();
}

bool SipwireContext::configure(const ListenerOptions& options)
{
    std::lock_guard lock(m_mutex);
    if (m_listener) {
        std::cerr << "[SipwireContext] Options cannot change while a listener is active" << std::endl;
        return false;
    }
    try {
        validate_listener_options(options);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "[SipwireContext] Invalid options: " << e.what() << std::endl;
        return false;
    }
    m_options = options;
    return true;
}

bool SipwireContext::send(const std::string& host, const std::uint16_t port, const std::string_view payload) const
{
    if (!is_valid_utf8(host)) {
        std::cerr << "[SipwireContext] Destination host is not valid UTF-8" << std::endl;
        return false;
    }
    return send_udp_datagram(host, port, payload);
}

bool SipwireContext::is_running() const
{
    return m_running;
}

bool SipwireContext::has_callback() const
{
    return m_registry.has_callback();
}

std::optional<std::uint16_t> SipwireContext::listener_port() const
{
    std::lock_guard lock(m_mutex);
    if (!m_listener) {
        return std::nullopt;
    }
    return m_listener->local_port();
}

ListenerOptions SipwireContext::options() const
{
    std::lock_guard lock(m_mutex);
    return m_options;
}

const char* SipwireContext::version()
{
    return version_string;
}
