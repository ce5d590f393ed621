#include "callback_registry.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include "text.hpp"

void CallbackRegistry::set(Callback callback)
{
    std::lock_guard lock(m_mutex);
    m_callback = std::move(callback);
}

void CallbackRegistry::clear()
{
    std::lock_guard lock(m_mutex);
    m_callback = nullptr;
}

bool CallbackRegistry::has_callback() const
{
    std::lock_guard lock(m_mutex);
    return static_cast<bool>(m_callback);
}

void CallbackRegistry::dispatch(const std::string_view event, const std::string_view payload) const
{
    std::lock_guard lock(m_mutex);
    if (!m_callback) {
        return;
    }

    const std::string event_text = is_c_string_safe(event) ? std::string(event) : std::string("err");
    const std::string payload_text = is_c_string_safe(payload) ? std::string(payload) : std::string();

    try {
        m_callback(event_text.c_str(), payload_text.c_str());
    }
    catch (const std::exception& e) {
        std::cerr << "[CallbackRegistry] Callback for " << event_text << " threw: " << e.what() << std::endl;
    }
    catch (...) {
        std::cerr << "[CallbackRegistry] Callback for " << event_text << " threw a non-standard exception"
                  << std::endl;
    }
}
