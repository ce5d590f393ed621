#include "listener.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <asio.hpp>

#include "text.hpp"

struct ListenerUdp::Impl {
    asio::io_context asio_context;
    asio::ip::udp::endpoint asio_endpoint;
    asio::ip::udp::socket asio_socket;
    asio::ip::udp::endpoint sender_endpoint;
    std::thread thread;
    std::vector<char> buffer;
    ListenerOptions options;
    std::uint16_t bound_port;

    Impl(const std::uint16_t port, const ListenerOptions& listener_options)
        : asio_endpoint(asio::ip::make_address(listener_options.bind_address), port)
        , asio_socket(asio_context)
        , buffer(listener_options.buffer_size)
        , options(listener_options)
    {
        asio_socket.open(asio_endpoint.protocol());
        asio_socket.bind(asio_endpoint);
        bound_port = asio_socket.local_endpoint().port();
    }

    struct Received {
        asio::error_code error;
        std::size_t bytes;
    };

    // Waits at most one poll interval. An empty result means nothing arrived in time.
    std::optional<Received> receive_once()
    {
        std::optional<Received> received;
        asio_socket.async_receive_from(
            asio::buffer(buffer), sender_endpoint, [&received](const asio::error_code& error, const std::size_t bytes) {
                received = Received { error, bytes };
            });
        asio_context.restart();
        asio_context.run_for(options.poll_interval);
        if (!received.has_value()) {
            // Drain the cancelled handler so it never outlives `received`
            asio::error_code cancel_error;
            asio_socket.cancel(cancel_error);
            asio_context.restart();
            asio_context.run();
        }
        if (received.has_value() && received->error == asio::error::operation_aborted) {
            return std::nullopt;
        }
        return received;
    }
};

void ListenerUdp::Deleter::operator()(Impl* p) const
{
    if (p->thread.joinable()) {
        p->thread.join();
    }
    delete p;
}

void ListenerUdp::handle_receive(Impl* impl, const std::atomic<bool>* running, const CallbackRegistry* registry)
{
    while (running->load()) {
        const std::optional<Impl::Received> received = impl->receive_once();
        if (!received.has_value()) {
            continue;
        }

        if (received->error) {
            registry->dispatch("error", "recv_err:" + received->error.message());
            std::this_thread::sleep_for(impl->options.error_backoff);
            continue;
        }

        if (received->bytes == 0) {
            continue;
        }
        registry->dispatch("sip_rx", decode_lossy(std::string_view(impl->buffer.data(), received->bytes)));
    }
}

ListenerUdp::ListenerUdp(const std::uint16_t port, const ListenerOptions& options)
    : m_impl(new Impl(port, options))
{
}

void ListenerUdp::start(const std::atomic<bool>& running, const CallbackRegistry& registry)
{
    m_impl->thread = std::thread(handle_receive, m_impl.get(), &running, &registry);
}

std::uint16_t ListenerUdp::local_port() const
{
    return m_impl->bound_port;
}

void ListenerUdp::close_socket()
{
    asio::post(m_impl->asio_context, [impl = m_impl.get()] {
        asio::error_code error;
        impl->asio_socket.close(error);
    });
}
