#include "connection_transport.hpp"
#include "../../asio/sockets/ssl_socket.hpp"
#include "../../asio/sockets/tcp_socket.hpp"
#include "../../util/logger.hpp"

namespace resumable::http {

namespace {

    /// Response whose body is read from a client connection. The connection goes back to
    /// the pool once the body has been fully consumed, and is closed if the response is
    /// dropped before that.
    class connection_response : public physical_response {
    public:
        connection_response(std::shared_ptr<http_response> head,
                            std::shared_ptr<client_connection> connection,
                            std::weak_ptr<connection_pool> pool,
                            bool ssl)
            : physical_response(std::move(head))
            , connection_(std::move(connection))
            , pool_(std::move(pool))
            , ssl_(ssl) {
            if (connection_->body_complete()) {
                release();
            }
        }

        ~connection_response() override {
            if (connection_ && !connection_->body_complete()) {
                connection_->close();
            }
        }

        awaitable<std::size_t> read_some(uint8_t buffer[], std::size_t max_size) override {
            if (!connection_) {
                co_return 0;
            }

            std::size_t bytes = 0;
            try {
                bytes = co_await connection_->read_body(buffer, max_size);
            } catch (const boost::system::system_error&) {
                // a connection that failed mid-body cannot carry more requests
                connection_->close();
                connection_.reset();
                throw;
            }

            if (connection_->body_complete()) {
                release();
            }
            co_return bytes;
        }

        void cancel() override {
            if (connection_) {
                connection_->cancel();
            }
        }

    private:
        void release() {
            if (auto pool = pool_.lock()) {
                auto host = connection_->get_host();
                auto port = connection_->get_port();
                pool->checkin(host, port, ssl_, std::move(connection_));
            }
            connection_.reset();
        }

        std::shared_ptr<client_connection> connection_;
        std::weak_ptr<connection_pool> pool_;
        bool ssl_;
    };

}

connection_transport::connection_transport(boost::asio::io_context& io_context)
    : io_context_(io_context)
    , pool_(std::make_shared<connection_pool>()) {
}

connection_transport::~connection_transport() {
    LOG_DEBUG("Destroying HTTP connection transport");
    pool_->clear();
}

connection_transport& connection_transport::verify_ssl(bool verify) {
    if (verify != verify_ssl_) {
        verify_ssl_ = verify;
        // connections keep the context they were created with
        ssl_context_.reset();
        pool_->clear();
    }
    return *this;
}

std::shared_ptr<boost::asio::ssl::context> connection_transport::get_ssl_context() {
    if (!ssl_context_) {
        ssl_context_ = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::sslv23_client);
        ssl_context_->set_default_verify_paths();
        ssl_context_->set_verify_mode(verify_ssl_ ? boost::asio::ssl::verify_peer : boost::asio::ssl::verify_none);
    }
    return ssl_context_;
}

bool connection_transport::is_same_origin(const std::string& url1, const std::string& url2) {
    http_request req1, req2;
    if (!req1.set_url(url1) || !req2.set_url(url2)) {
        return false;
    }
    return req1.get_base_path() == req2.get_base_path();
}

std::string connection_transport::resolve_location(const http_request& request, const std::string& location) {
    if (location.find("://") != std::string::npos) {
        return location;
    }
    // scheme-relative
    if (location.rfind("//", 0) == 0) {
        return (request.is_ssl() ? "https:" : "http:") + location;
    }
    // absolute path
    if (!location.empty() && location[0] == '/') {
        return request.get_base_path() + location;
    }
    // relative path, resolved against the directory of the current target
    std::string path = request.get_uri().substr(0, request.get_uri().find('?'));
    return request.get_base_path() + path.substr(0, path.rfind('/') + 1) + location;
}

std::shared_ptr<http_request> connection_transport::create_request(method m, const std::string& url) const {
    auto request = std::make_shared<http_request>();
    request->set_method(m);
    if (!request->set_url(url)) {
        LOG_ERROR("invalid url: '{}'", url);
        throw boost::system::system_error(boost::asio::error::invalid_argument);
    }
    return request;
}

std::shared_ptr<client_connection> connection_transport::get_or_create_connection(const http_request& request,
                                                                                 bool& reused) {
    // Try to get existing connection from pool
    auto connection = pool_->checkout(request.get_host(), request.get_port(), request.is_ssl());
    if (connection) {
        LOG_DEBUG("Reusing connection from pool for {}", request.get_host());
        reused = true;
        return connection;
    }

    LOG_DEBUG("Creating new connection for {}", request.get_host());
    reused = false;

    std::shared_ptr<resumable::asio::socket> sock;
    if (!request.is_ssl()) {
        sock = std::make_shared<resumable::asio::tcp_socket>("http_client", io_context_);
    } else {
        sock = std::make_shared<resumable::asio::ssl_socket>("http_client", io_context_, get_ssl_context());
    }
    return std::make_shared<client_connection>(sock, request.get_host(), request.get_port(), timeout_);
}

awaitable<std::shared_ptr<http_response>> connection_transport::send(std::shared_ptr<client_connection>& connection,
                                                                     bool reused,
                                                                     const http_request& request) {
    boost::system::error_code ec;
    try {
        co_return co_await connection->send_request(request);
    } catch (const boost::system::system_error& e) {
        ec = e.code();
        connection->close();
        // only a pooled connection closed by the server while idle deserves another attempt
        if (!reused || ec == boost::asio::error::operation_aborted || ec == boost::asio::error::timed_out) {
            throw;
        }
    }

    LOG_DEBUG("pooled connection to {} failed ({}), retrying on a new connection", request.get_host(), ec.message());
    bool fresh_reused = false;
    do {
        connection = get_or_create_connection(request, fresh_reused);
        if (fresh_reused) connection->close();
    } while (fresh_reused);

    co_return co_await connection->send_request(request);
}

awaitable<std::unique_ptr<physical_response>> connection_transport::issue(const endpoint& target,
                                                                          const headers_map& extra_headers) {
    auto request = create_request(target.get_method(), target.get_url());

    headers_map request_headers = target.get_headers();
    for (const auto& [key, value] : extra_headers) {
        request_headers[key] = value;
    }

    unsigned redirect_count = 0;
    while (true) {
        // caller headers first, so they override the defaults below
        for (const auto& [key, value] : request_headers) {
            request->set_header(key, value);
        }
        if (!request->has_header(header::user_agent)) {
            request->add_header(header::user_agent, user_agent_);
        }
        request->set_header(header::accept_encoding, "identity");
        if (!request->has_header(header::connection)) {
            request->set_keep_alive(true);
        }

        bool reused = false;
        auto connection = get_or_create_connection(*request, reused);
        auto response = co_await send(connection, reused, *request);

        // Handle redirects
        if (follow_redirects_ && response->is_redirect_response() &&
            redirect_count < max_redirects_ && response->has_header(header::location)) {

            std::string location = resolve_location(*request, response->get_header(header::location));
            LOG_DEBUG("Following redirect #{} to: {}", redirect_count + 1, location);

            // the redirect body is not read, so the connection cannot be reused unless it is already complete
            if (connection->reusable()) {
                pool_->checkin(connection->get_host(), connection->get_port(), request->is_ssl(), connection);
            } else {
                connection->close();
            }

            // 303 See Other always changes to GET, as do 301/302 for unsafe methods
            method redirect_method = request->get_method();
            int status = response->get_status_code();
            if (status == 303 && redirect_method != method::HEAD) {
                redirect_method = method::GET;
            } else if ((status == 301 || status == 302) &&
                       (redirect_method == method::POST ||
                        redirect_method == method::PUT ||
                        redirect_method == method::DELETE)) {
                redirect_method = method::GET;
            }

            // Copy Authorization only for same origin
            if (!is_same_origin(request->get_url(), location)) {
                for (auto it = request_headers.begin(); it != request_headers.end();) {
                    if (headers::is_header(it->first, header::authorization)) {
                        LOG_DEBUG("Dropping Authorization header for cross-origin redirect");
                        it = request_headers.erase(it);
                    } else {
                        ++it;
                    }
                }
            }

            request = create_request(redirect_method, location);
            ++redirect_count;
            continue;
        }

        co_return std::make_unique<connection_response>(response, connection, pool_, request->is_ssl());
    }
}

}
