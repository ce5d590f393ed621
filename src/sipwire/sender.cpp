#include "sender.hpp"

#include <iostream>
#include <string>

#include <asio.hpp>

struct SenderUdp::Impl {
    asio::io_context asio_context;
    asio::ip::udp::resolver asio_resolver;
    asio::ip::udp::socket asio_socket;

    Impl()
        : asio_resolver(asio_context)
        , asio_socket(asio_context)
    {
        asio_socket.open(asio::ip::udp::v4());
        asio_socket.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), 0));
    }
};

void SenderUdp::Deleter::operator()(const Impl* p) const
{
    delete p;
}

SenderUdp::SenderUdp()
    : m_impl(new Impl)
{
}

void SenderUdp::send_data(const std::string& host, const std::uint16_t port, const std::string_view data) const
{
    asio::error_code error;
    const auto endpoints = m_impl->asio_resolver.resolve(asio::ip::udp::v4(), host, std::to_string(port), error);
    if (error || endpoints.empty()) {
        std::cerr << "[SenderUdp] Cannot resolve " << host << ": " << error.message() << std::endl;
        return;
    }
    m_impl->asio_socket.send_to(asio::buffer(data.data(), data.size()), endpoints.begin()->endpoint(), 0, error);
    if (error) {
        std::cerr << "[SenderUdp] Error sending to " << host << ":" << port << ": " << error.message() << std::endl;
    }
}

bool send_udp_datagram(const std::string& host, const std::uint16_t port, const std::string_view data)
{
    try {
        const SenderUdp sender;
        sender.send_data(host, port, data);
        return true;
    }
    catch (const asio::system_error& e) {
        std::cerr << "[SenderUdp] Cannot bind sender socket: " << e.what() << std::endl;
        return false;
    }
}
