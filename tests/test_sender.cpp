#include <catch2/catch.hpp>

#include <array>
#include <chrono>
#include <string>

#include <asio.hpp>

#include "sipwire/sender.hpp"
#include "test_helpers.hpp"

using namespace std::string_literals;

namespace {

// Receives one datagram on a loopback socket, with a timeout.
class LoopbackReceiver {
public:
    LoopbackReceiver()
        : m_socket(m_context, asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
    {
    }

    [[nodiscard]] std::uint16_t port() const
    {
        return m_socket.local_endpoint().port();
    }

    std::string receive()
    {
        std::array<char, 2048> buffer {};
        std::size_t received = 0;
        asio::ip::udp::endpoint sender;
        m_socket.async_receive_from(
            asio::buffer(buffer), sender, [&received](const asio::error_code& error, const std::size_t bytes) {
                if (!error) {
                    received = bytes;
                }
            });
        m_context.run_for(std::chrono::seconds(2));
        return { buffer.data(), received };
    }

private:
    asio::io_context m_context;
    asio::ip::udp::socket m_socket;
};

}

TEST_CASE("Sender delivers text to a loopback socket", "[sender]")
{
    LoopbackReceiver receiver;
    REQUIRE(send_udp_datagram("127.0.0.1", receiver.port(), invite_line));
    CHECK(receiver.receive() == invite_line);
}

TEST_CASE("Sender keeps binary payloads intact", "[sender]")
{
    LoopbackReceiver receiver;
    const std::string payload = "\x01\x00\xFF\x7F"s;
    REQUIRE(send_udp_datagram("127.0.0.1", receiver.port(), payload));
    CHECK(receiver.receive() == payload);
}

TEST_CASE("Sender resolves host names", "[sender]")
{
    LoopbackReceiver receiver;
    REQUIRE(send_udp_datagram("localhost", receiver.port(), "OPTIONS sip:probe SIP/2.0"));
    CHECK(receiver.receive() == "OPTIONS sip:probe SIP/2.0");
}

TEST_CASE("Sender reports bind success even when the destination is unusable", "[sender]")
{
    CHECK(send_udp_datagram("999.999.999.999", 5060, "test"));
    CHECK(send_udp_datagram("", 5060, "test"));
}
