#ifndef RESUMABLE_HTTP_CLIENT_CLIENT_BASE_HPP
#define RESUMABLE_HTTP_CLIENT_CLIENT_BASE_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "../common/http_request.hpp"
#include "connection_transport.hpp"
#include "endpoint.hpp"
#include "resumable_stream.hpp"
#include "stream_types.hpp"
#include "transport.hpp"
#include "../../util/types.hpp"

namespace resumable::http {

/**
 * Common part of the clients: configuration and the coroutine operations that open
 * resumable downloads. Unless a transport is supplied on construction, requests go
 * through a connection_transport created on first use with the current configuration.
 */
class client_base {
protected:
    // Configuration
    std::chrono::seconds timeout_{connection_transport::DEFAULT_TIMEOUT};
    unsigned int max_redirects_{connection_transport::DEFAULT_MAX_REDIRECTS};
    bool follow_redirects_{true};
    std::string user_agent_{connection_transport::DEFAULT_USER_AGENT};
    bool verify_ssl_{true};
    unsigned int max_resumptions_{0};

    // Abstract method - each derived class provides its own io_context
    virtual boost::asio::io_context& get_io_context() = 0;

    // Transport used for initial requests and resumptions
    std::shared_ptr<transport> get_transport();

    // Drop the transport (derived classes call it before their io_context goes away)
    void release_transport();

public:
    client_base() = default;

    // Make downloads over an existing transport resumable
    explicit client_base(std::shared_ptr<transport> transport);

    virtual ~client_base();

    // Configuration setters (fluent API)
    client_base& timeout(std::chrono::seconds t);
    client_base& max_redirects(unsigned int max);
    client_base& follow_redirects(bool follow);
    client_base& user_agent(const std::string& agent);
    client_base& verify_ssl(bool verify);
    client_base& max_resumptions(unsigned int max) { max_resumptions_ = max; return *this; }

    // Configuration getters
    std::chrono::seconds get_timeout() const { return timeout_; }
    unsigned int get_max_redirects() const { return max_redirects_; }
    bool get_follow_redirects() const { return follow_redirects_; }
    const std::string& get_user_agent() const { return user_agent_; }
    bool get_verify_ssl() const { return verify_ssl_; }
    unsigned int get_max_resumptions() const { return max_resumptions_; }

    // Issue the initial request and wrap its response. A failure to obtain the initial
    // response is thrown as boost::system::system_error and no stream is created.
    awaitable<std::unique_ptr<resumable_stream>> open(method m, const std::string& url, headers_map headers = {});

    awaitable<std::unique_ptr<resumable_stream>> get(const std::string& url, headers_map headers = {});

    // Open a download and push its body through callback. Errors are reported in the result
    awaitable<stream_result> fetch(method m, const std::string& url, headers_map headers, stream_callback callback);

    // Download url into a file
    awaitable<stream_result> download(const std::string& url, const std::filesystem::path& path,
                                      progress_callback progress = {}, headers_map headers = {});

    // Connection pool management
    void clear_connections();
    size_t pool_size() const;

private:
    std::shared_ptr<transport> transport_;
    std::shared_ptr<connection_transport> connection_transport_;
};

}

#endif
