#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "callback_registry.hpp"
#include "options.hpp"

// Background UDP receive loop. The constructor binds the socket (throws asio::system_error
// when the bind fails), start() spawns the thread, and destruction joins it, so the running
// flag has to be cleared first. The thread keeps going while that flag is true and forwards
// each datagram as a "sip_rx" event and each receive failure as an "error" event.
class ListenerUdp {
public:
    ListenerUdp(std::uint16_t port, const ListenerOptions& options);

    // running and registry must outlive this listener
    void start(const std::atomic<bool>& running, const CallbackRegistry& registry);

    [[nodiscard]] std::uint16_t local_port() const;

    // Closes the socket on the listener thread. Every later receive fails and is reported
    // as an "error" event until the listener is stopped.
    void close_socket();

private:
    struct Impl;
    struct Deleter {
        void operator()(Impl* p) const;
    };

    static void handle_receive(Impl* impl, const std::atomic<bool>* running, const CallbackRegistry* registry);

    std::unique_ptr<Impl, Deleter> m_impl;
};
