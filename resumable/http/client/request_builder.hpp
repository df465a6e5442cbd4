#ifndef RESUMABLE_HTTP_CLIENT_REQUEST_BUILDER_HPP
#define RESUMABLE_HTTP_CLIENT_REQUEST_BUILDER_HPP

#include "../common/http_request.hpp"
#include "endpoint.hpp"
#include "stream_types.hpp"
#include <filesystem>
#include <string>

namespace resumable::http {

/**
 * Fluent builder for resumable downloads.
 * Works with both sync (client) and async (async_client) clients.
 *
 * Usage with sync client:
 *   auto download = client.request("https://api.com/archive.tar")
 *       .header("Authorization", "Bearer xxx")
 *       .get();  // Returns download_stream
 *
 * Usage with async client:
 *   auto stream = co_await async_client.request("https://api.com/archive.tar")
 *       .header("Authorization", "Bearer xxx")
 *       .get();  // Returns awaitable<std::unique_ptr<resumable_stream>>
 */
template<typename Client>
class request_builder {
public:
    request_builder(Client* c, std::string url)
        : client_(c)
        , url_(std::move(url)) {
    }

    // Non-copyable, movable
    request_builder(const request_builder&) = delete;
    request_builder& operator=(const request_builder&) = delete;
    request_builder(request_builder&&) = default;
    request_builder& operator=(request_builder&&) = default;

    // ============================================
    // Configuration methods (chainable)
    // ============================================

    // headers are sent with the initial request and with every resumption
    request_builder& header(const std::string& name, const std::string& value) {
        headers_[name] = value;
        return *this;
    }

    request_builder& headers(const headers_map& hdrs) {
        for (const auto& [name, value] : hdrs) {
            headers_[name] = value;
        }
        return *this;
    }

    // ============================================
    // Terminal methods - return type depends on Client
    // sync client: returns value directly
    // async client: returns awaitable
    // ============================================

    auto open(method m) {
        return client_->open(m, url_, headers_);
    }

    auto get() {
        return client_->get(url_, headers_);
    }

    auto get(stream_callback callback) {
        return client_->fetch(method::GET, url_, headers_, std::move(callback));
    }

    auto head() {
        return client_->open(method::HEAD, url_, headers_);
    }

    /**
     * Download response body to a file.
     * For sync client: blocks and returns stream_result
     * For async client: returns awaitable<stream_result>
     */
    auto download(const std::filesystem::path& path, progress_callback progress = {}) {
        return client_->download(url_, path, std::move(progress), headers_);
    }

private:
    Client* client_;
    std::string url_;
    headers_map headers_;
};

}

#endif
