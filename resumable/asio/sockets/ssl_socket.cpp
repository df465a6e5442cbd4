#include "ssl_socket.hpp"

namespace resumable::asio {

ssl_socket::ssl_socket(const std::string& context, boost::asio::io_context& io_context,
                       const std::shared_ptr<boost::asio::ssl::context>& ssl_context)
    : tcp_socket(context, io_context)
    , ssl_stream_(socket_, *ssl_context)
    , ssl_context_(ssl_context) {
}

ssl_socket::~ssl_socket() {
    LOG_TRACE("[{}] releasing ssl connection", context_);
}

void ssl_socket::close() {
    // close underlying TCP socket
    tcp_socket::close();

    // clear ssl session to allow reusing socket (if necessary)
    // From SSL_clear: If a session is still open, it is considered bad and will be removed
    // from the session cache, as required by RFC2246
    SSL_clear(ssl_stream_.native_handle());
}

bool ssl_socket::requires_handshake() const {
    return true;
}

awaitable<boost::system::error_code> ssl_socket::handshake(const std::string& host) {
    // add support for SNI
    if (!SSL_set_tlsext_host_name(ssl_stream_.native_handle(), host.c_str())) {
        LOG_ERROR("SSL_set_tlsext_host_name failed. SNI will fail");
    }

    if (SSL_CTX_get_verify_mode(ssl_context_->native_handle()) != SSL_VERIFY_NONE) {
        ssl_stream_.set_verify_callback(boost::asio::ssl::host_name_verification(host));
    }

    boost::system::error_code ec;
    co_await ssl_stream_.async_handshake(
        boost::asio::ssl::stream_base::client,
        boost::asio::redirect_error(use_awaitable, ec));
    if (ec) {
        LOG_DEBUG("[{}] ssl handshake with {} failed: {}", context_, host, ec.message());
    }
    co_return ec;
}

awaitable<io_result> ssl_socket::read_some(uint8_t buffer[], size_t max_size) {
    boost::system::error_code ec;
    auto bytes = co_await ssl_stream_.async_read_some(
        boost::asio::buffer(buffer, max_size),
        boost::asio::redirect_error(use_awaitable, ec));
    // a peer closing the TLS session without close_notify is reported as a short read
    if (ec == boost::asio::ssl::error::stream_truncated) {
        ec = boost::asio::error::eof;
    }
    co_return io_result{ec, bytes};
}

awaitable<io_result> ssl_socket::write(std::string_view str) {
    boost::system::error_code ec;
    auto bytes = co_await boost::asio::async_write(
        ssl_stream_,
        boost::asio::buffer(str.data(), str.size()),
        boost::asio::redirect_error(use_awaitable, ec));
    co_return io_result{ec, bytes};
}

bool ssl_socket::is_secure() const {
    return true;
}

}
