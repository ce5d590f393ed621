#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// One-shot UDP sender on an ephemeral IPv4 port. The constructor opens and binds the socket
// and throws asio::system_error when that fails.
class SenderUdp {
public:
    SenderUdp();

    // Best effort: resolution and send failures are logged, not reported.
    void send_data(const std::string& host, std::uint16_t port, std::string_view data) const;

private:
    struct Impl;
    struct Deleter {
        void operator()(const Impl* p) const;
    };

    std::unique_ptr<Impl, Deleter> m_impl;
};

// Returns true iff the ephemeral socket could be bound.
bool send_udp_datagram(const std::string& host, std::uint16_t port, std::string_view data);
