#ifndef RESUMABLE_HTTP_CLIENT_CONNECTION_HPP
#define RESUMABLE_HTTP_CLIENT_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <boost/noncopyable.hpp>

#include "../common/http_request.hpp"
#include "../common/http_response.hpp"
#include "response_parser.hpp"
#include "../../asio/sockets/socket.hpp"
#include "../../util/types.hpp"

namespace resumable::http {

/**
 * A single HTTP/1.1 connection to an origin. A request is sent with send_request(), which
 * returns once the response head is available; the body is then pulled with read_body()
 * until it returns 0. Only one request can be in flight at a time.
 */
class client_connection : public std::enable_shared_from_this<client_connection>, public boost::noncopyable {

    static constexpr unsigned MAX_BUFFER_SIZE = 8192;
    static constexpr auto DEFAULT_TIMEOUT = std::chrono::seconds{30};

public:
    static std::atomic<unsigned long> connections;

    client_connection(std::shared_ptr<resumable::asio::socket> socket,
                      std::string host,
                      std::string port,
                      std::chrono::seconds timeout = DEFAULT_TIMEOUT);

    virtual ~client_connection();

    // send the request and read the response head (throws boost::system::system_error)
    awaitable<std::shared_ptr<http_response>> send_request(const http_request& request);

    // read decoded body bytes, returning 0 once the body is complete (throws boost::system::system_error)
    awaitable<std::size_t> read_body(uint8_t buffer[], std::size_t max_size);

    // connection management
    void close();
    void cancel();
    bool is_open() const { return socket_ && socket_->is_open(); }
    bool body_complete() const;
    bool reusable() const;

    // number of requests sent over this connection (including the in-flight one)
    unsigned long get_requests() const { return requests_; }

    const std::string& get_host() const { return host_; }
    const std::string& get_port() const { return port_; }
    bool is_secure() const { return socket_ && socket_->is_secure(); }

private:
    awaitable<void> ensure_connected();
    awaitable<std::size_t> read_socket();

    std::shared_ptr<resumable::asio::socket> socket_;
    std::string host_;
    std::string port_;
    std::chrono::seconds timeout_;
    uint8_t buffer_[MAX_BUFFER_SIZE];
    const uint8_t* begin_ = buffer_;
    const uint8_t* end_ = buffer_;
    response_parser response_parser_;
    std::shared_ptr<http_response> response_;
    bool closed_body_complete_ = false;
    unsigned long requests_ = 0;
};

}

#endif
