#include "tcp_socket.hpp"
#include "../operation_deadline.hpp"

namespace resumable::asio {

tcp_socket::tcp_socket(const std::string& context, boost::asio::io_context& io_context)
    : socket(context, io_context), socket_(io_context) {
}

tcp_socket::~tcp_socket() {
    LOG_TRACE("[{}] releasing tcp connection", context_);
    close();
}

void tcp_socket::close() {
    boost::system::error_code ec;
    if (socket_.is_open()) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
    socket_.close(ec);
}

void tcp_socket::cancel() {
    boost::system::error_code ec;
    socket_.cancel(ec);
}

awaitable<boost::system::error_code> tcp_socket::connect(
    const std::string& host,
    const std::string& port,
    std::chrono::seconds timeout)
{
    close();

    // the deadline covers both name resolution and connection establishment
    boost::asio::ip::tcp::resolver resolver(io_context_);
    operation_deadline deadline(io_context_, timeout, [this, &resolver]() {
        resolver.cancel();
        cancel();
    });

    boost::system::error_code ec;
    auto endpoints = co_await resolver.async_resolve(
        host, port, boost::asio::redirect_error(use_awaitable, ec));

    if (!ec) {
        co_await boost::asio::async_connect(
            socket_, endpoints, boost::asio::redirect_error(use_awaitable, ec));
    }

    if (ec) {
        if (ec == boost::asio::error::operation_aborted && deadline.expired()) {
            ec = boost::asio::error::timed_out;
        }
        LOG_TRACE("[{}] cannot connect to {}:{}: {}", context_, host, port, ec.message());
        close();
        co_return ec;
    }

    // Run handshake if required (for SSL sockets)
    if (requires_handshake()) {
        auto hs_ec = co_await handshake(host);
        if (hs_ec) {
            close();
            co_return hs_ec;
        }
    }

    co_return boost::system::error_code{};
}

boost::asio::ip::tcp::socket& tcp_socket::get_socket() {
    return socket_;
}

std::string tcp_socket::get_remote_ip() const {
    boost::system::error_code ec;
    auto remote_ep = socket_.remote_endpoint(ec);
    if (!ec) {
        return remote_ep.address().to_string();
    }
    return "0.0.0.0";
}

std::string tcp_socket::get_remote_port() const {
    boost::system::error_code ec;
    auto remote_ep = socket_.remote_endpoint(ec);
    if (!ec) {
        return std::to_string(remote_ep.port());
    }
    return "0";
}

awaitable<io_result> tcp_socket::read_some(uint8_t* buffer, size_t max_size) {
    boost::system::error_code ec;
    auto bytes = co_await socket_.async_read_some(
        boost::asio::buffer(buffer, max_size),
        boost::asio::redirect_error(use_awaitable, ec));
    co_return io_result{ec, bytes};
}

awaitable<io_result> tcp_socket::write(std::string_view str) {
    boost::system::error_code ec;
    auto bytes = co_await boost::asio::async_write(
        socket_,
        boost::asio::buffer(str.data(), str.size()),
        boost::asio::redirect_error(use_awaitable, ec));
    co_return io_result{ec, bytes};
}

void tcp_socket::enable_tcp_no_delay() {
    boost::system::error_code ec;
    socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
}

bool tcp_socket::is_open() const {
    return socket_.is_open();
}

bool tcp_socket::is_secure() const {
    return false;
}

}
