#include <fstream>
#include "client_base.hpp"
#include "../../util/logger.hpp"

namespace resumable::http {

client_base::client_base(std::shared_ptr<transport> transport)
    : transport_(std::move(transport)) {
}

client_base::~client_base() {
    LOG_DEBUG("Destroying HTTP client base");
}

std::shared_ptr<transport> client_base::get_transport() {
    if (!transport_) {
        connection_transport_ = std::make_shared<connection_transport>(get_io_context());
        connection_transport_->timeout(timeout_)
            .max_redirects(max_redirects_)
            .follow_redirects(follow_redirects_)
            .user_agent(user_agent_)
            .verify_ssl(verify_ssl_);
        transport_ = connection_transport_;
    }
    return transport_;
}

void client_base::release_transport() {
    if (connection_transport_) {
        connection_transport_->clear_connections();
    }
    connection_transport_.reset();
    transport_.reset();
}

client_base& client_base::timeout(std::chrono::seconds t) {
    timeout_ = t;
    if (connection_transport_) connection_transport_->timeout(t);
    return *this;
}

client_base& client_base::max_redirects(unsigned int max) {
    max_redirects_ = max;
    if (connection_transport_) connection_transport_->max_redirects(max);
    return *this;
}

client_base& client_base::follow_redirects(bool follow) {
    follow_redirects_ = follow;
    if (connection_transport_) connection_transport_->follow_redirects(follow);
    return *this;
}

client_base& client_base::user_agent(const std::string& agent) {
    user_agent_ = agent;
    if (connection_transport_) connection_transport_->user_agent(agent);
    return *this;
}

client_base& client_base::verify_ssl(bool verify) {
    verify_ssl_ = verify;
    if (connection_transport_) connection_transport_->verify_ssl(verify);
    return *this;
}

void client_base::clear_connections() {
    if (connection_transport_) connection_transport_->clear_connections();
}

size_t client_base::pool_size() const {
    return connection_transport_ ? connection_transport_->pool_size() : 0;
}

awaitable<std::unique_ptr<resumable_stream>> client_base::open(method m, const std::string& url, headers_map headers) {
    // a request with side effects must not be repeated by a resumption
    if (m == method::POST || m == method::PUT || m == method::PATCH) {
        LOG_ERROR("cannot open a resumable {} request to {}", get_method_string(m), url);
        throw boost::system::system_error(boost::asio::error::operation_not_supported);
    }

    endpoint target(m, url, std::move(headers));
    auto stream_transport = get_transport();

    LOG_DEBUG("opening {} {}", get_method_string(m), url);
    auto response = co_await stream_transport->issue(target);

    co_return std::make_unique<resumable_stream>(
        std::move(stream_transport), std::move(target), std::move(response), max_resumptions_);
}

awaitable<std::unique_ptr<resumable_stream>> client_base::get(const std::string& url, headers_map headers) {
    co_return co_await open(method::GET, url, std::move(headers));
}

awaitable<stream_result> client_base::fetch(method m, const std::string& url, headers_map headers,
                                            stream_callback callback) {
    stream_result result;
    std::unique_ptr<resumable_stream> stream;
    try {
        stream = co_await open(m, url, std::move(headers));
    } catch (const boost::system::system_error& e) {
        result.error = e.what();
        result.error_code = e.code();
        co_return result;
    }
    co_return co_await stream->stream(std::move(callback));
}

awaitable<stream_result> client_base::download(const std::string& url, const std::filesystem::path& path,
                                               progress_callback progress, headers_map headers) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        stream_result result;
        result.error = "Cannot open file for writing: " + path.string();
        result.error_code = boost::system::errc::make_error_code(boost::system::errc::io_error);
        co_return result;
    }

    auto result = co_await fetch(method::GET, url, std::move(headers),
        [&file, &progress](const stream_info& info) {
            file.write(info.data.data(), static_cast<std::streamsize>(info.data.size()));
            if (!file) {
                return false;
            }
            if (progress) {
                progress(info.downloaded, info.total);
            }
            return true;
        });

    if (result.error_code == boost::asio::error::operation_aborted && !file) {
        result.error = "Cannot write to file: " + path.string();
        result.error_code = boost::system::errc::make_error_code(boost::system::errc::io_error);
    }
    co_return result;
}

}
