#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "callback_registry.hpp"
#include "listener.hpp"
#include "options.hpp"

// Owns the listener lifecycle: at most one ListenerUdp per context, one event callback,
// and the running flag the listener thread polls.
//
// None of the members may be called from inside the event callback on the listener
// thread; stop_listener() joins that thread and the registry is locked while the
// callback runs.
class SipwireContext {
public:
    // Throws std::invalid_argument for options validate_listener_options() rejects
    explicit SipwireContext(ListenerOptions options = {});
    ~SipwireContext();

    SipwireContext(const SipwireContext&) = delete;
    SipwireContext& operator=(const SipwireContext&) = delete;

    // Clears the running flag and the callback. Refused while a listener is active.
    bool reset();

    void register_callback(CallbackRegistry::Callback callback);
    void clear_callback();

    bool start_listener(std::uint16_t port);

    // Signals the listener, waits for its thread to exit and clears the callback. Idempotent.
    void stop_listener();

    // Applies to the next start_listener(); refused while a listener is active.
    bool configure(const ListenerOptions& options);

    // False when host is not valid UTF-8 or no sending socket could be bound
    bool send(const std::string& host, std::uint16_t port, std::string_view payload) const;

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] bool has_callback() const;
    [[nodiscard]] std::optional<std::uint16_t> listener_port() const;
    [[nodiscard]] ListenerOptions options() const;

    [[nodiscard]] static const char* version();

private:
    mutable std::mutex m_mutex;
    std::atomic<bool> m_running;
    CallbackRegistry m_registry;
    std::unique_ptr<ListenerUdp> m_listener;
    ListenerOptions m_options;
};
