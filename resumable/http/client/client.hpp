#ifndef RESUMABLE_HTTP_CLIENT_STANDALONE_HPP
#define RESUMABLE_HTTP_CLIENT_STANDALONE_HPP

#include "client_base.hpp"
#include "download_stream.hpp"
#include "request_builder.hpp"
#include "../../util/run_blocking.hpp"
#include <boost/asio/io_context.hpp>

namespace resumable::http {

/**
 * Standalone client with a blocking API.
 * Perfect for scripts, CLI tools, and simple applications.
 *
 * Usage:
 *   http::client client;
 *
 *   // Pull the body, surviving connection drops when the server supports ranges
 *   auto download = client.get("https://example.com/dataset.csv");
 *   std::string data = download.read_all();
 *
 *   // Straight to a file, with progress
 *   auto result = client.download("https://example.com/image.iso", "image.iso",
 *       [](std::uint64_t downloaded, std::uint64_t total) { ... });
 *
 *   // With configuration (fluent API)
 *   client.timeout(std::chrono::seconds(10)).max_resumptions(3);
 *
 * For coroutine based operation, use http::async_client instead.
 */
class client : public client_base {
private:
    std::shared_ptr<boost::asio::io_context> io_context_;

    // Internal helper to run an awaitable synchronously
    template<typename T>
    T exec(awaitable<T> coro) {
        return util::run_blocking(*io_context_, std::move(coro));
    }

protected:
    boost::asio::io_context& get_io_context() override {
        return *io_context_;
    }

public:
    client()
        : io_context_(std::make_shared<boost::asio::io_context>()) {
    }

    // Make downloads over an existing transport resumable. The transport must run on io_context
    client(std::shared_ptr<transport> transport, std::shared_ptr<boost::asio::io_context> io_context)
        : client_base(std::move(transport))
        , io_context_(std::move(io_context)) {
    }

    ~client() override {
        release_transport();
    }

    // ============================================
    // Synchronous operations
    // ============================================

    download_stream open(method m, const std::string& url, headers_map headers = {}) {
        return download_stream(io_context_, exec(client_base::open(m, url, std::move(headers))));
    }

    download_stream get(const std::string& url, headers_map headers = {}) {
        return download_stream(io_context_, exec(client_base::get(url, std::move(headers))));
    }

    stream_result fetch(method m, const std::string& url, headers_map headers, stream_callback callback) {
        return exec(client_base::fetch(m, url, std::move(headers), std::move(callback)));
    }

    stream_result download(const std::string& url, const std::filesystem::path& path,
                           progress_callback progress = {}, headers_map headers = {}) {
        return exec(client_base::download(url, path, std::move(progress), std::move(headers)));
    }

    // ============================================
    // Request builder for fluent API
    // ============================================

    /**
     * Create a request builder for fluent API.
     *
     * Usage:
     *   auto download = client.request("https://api.com/export")
     *       .header("Authorization", "Bearer xxx")
     *       .get();
     */
    request_builder<client> request(const std::string& url) {
        return request_builder<client>(this, url);
    }
};

/// One-shot blocking GET with a default client.
inline download_stream get(const std::string& url, headers_map headers = {}) {
    client default_client;
    return default_client.get(url, std::move(headers));
}

}

#endif
