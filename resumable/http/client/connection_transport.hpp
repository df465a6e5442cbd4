#ifndef RESUMABLE_HTTP_CLIENT_CONNECTION_TRANSPORT_HPP
#define RESUMABLE_HTTP_CLIENT_CONNECTION_TRANSPORT_HPP

#include <chrono>
#include <memory>
#include <string>
#include <boost/asio/ssl.hpp>

#include "../common/http_request.hpp"
#include "../common/http_response.hpp"
#include "client_connection.hpp"
#include "connection_pool.hpp"
#include "transport.hpp"

namespace resumable::http {

/**
 * HTTP/1.1 transport over plain TCP or TLS sockets. Keeps idle keep-alive connections in a
 * pool shared by every response it hands out, and follows redirects when enabled.
 * Bodies are always requested without content coding.
 */
class connection_transport : public transport {
public:
    static constexpr auto DEFAULT_TIMEOUT = std::chrono::seconds{30};
    static constexpr unsigned DEFAULT_MAX_REDIRECTS = 5;
    static constexpr const char* DEFAULT_USER_AGENT = "ResumableHTTP/1.0";

    explicit connection_transport(boost::asio::io_context& io_context);
    ~connection_transport() override;

    // Configuration setters (fluent API)
    connection_transport& timeout(std::chrono::seconds t) { timeout_ = t; return *this; }
    connection_transport& max_redirects(unsigned int max) { max_redirects_ = max; return *this; }
    connection_transport& follow_redirects(bool follow) { follow_redirects_ = follow; return *this; }
    connection_transport& user_agent(const std::string& agent) { user_agent_ = agent; return *this; }
    connection_transport& verify_ssl(bool verify);

    // Configuration getters
    std::chrono::seconds get_timeout() const { return timeout_; }
    unsigned int get_max_redirects() const { return max_redirects_; }
    bool get_follow_redirects() const { return follow_redirects_; }
    const std::string& get_user_agent() const { return user_agent_; }
    bool get_verify_ssl() const { return verify_ssl_; }

    awaitable<std::unique_ptr<physical_response>> issue(const endpoint& target,
                                                        const headers_map& extra_headers = {}) override;

    // Connection pool management
    void clear_connections() { pool_->clear(); }
    size_t pool_size() const { return pool_->size(); }

    boost::asio::io_context& get_io_context() const { return io_context_; }

private:
    std::shared_ptr<http_request> create_request(method m, const std::string& url) const;

    // take an idle connection from the pool or create a new one (reused is set accordingly)
    std::shared_ptr<client_connection> get_or_create_connection(const http_request& request, bool& reused);

    // send over the given connection, retrying once on a fresh connection when a pooled one went stale
    awaitable<std::shared_ptr<http_response>> send(std::shared_ptr<client_connection>& connection,
                                                   bool reused,
                                                   const http_request& request);

    std::shared_ptr<boost::asio::ssl::context> get_ssl_context();

    // resolve a Location header against the request url
    static std::string resolve_location(const http_request& request, const std::string& location);

    // Check if URLs have same origin (for security when forwarding headers)
    static bool is_same_origin(const std::string& url1, const std::string& url2);

    boost::asio::io_context& io_context_;

    // Configuration
    std::chrono::seconds timeout_{DEFAULT_TIMEOUT};
    unsigned int max_redirects_{DEFAULT_MAX_REDIRECTS};
    bool follow_redirects_{true};
    std::string user_agent_{DEFAULT_USER_AGENT};
    bool verify_ssl_{true};

    // shared with the responses, which return their connection once the body is read
    std::shared_ptr<connection_pool> pool_;
    std::shared_ptr<boost::asio::ssl::context> ssl_context_;
};

}

#endif
