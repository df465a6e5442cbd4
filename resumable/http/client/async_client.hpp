#ifndef RESUMABLE_HTTP_CLIENT_ASYNC_CLIENT_HPP
#define RESUMABLE_HTTP_CLIENT_ASYNC_CLIENT_HPP

#include "client_base.hpp"
#include "request_builder.hpp"
#include "stream_types.hpp"
#include <boost/asio/io_context.hpp>

namespace resumable::http {

/**
 * Coroutine client bound to a caller provided io_context.
 *
 * Usage with coroutines:
 *   boost::asio::io_context io_context;
 *   http::async_client client(io_context);
 *   co_spawn(io_context, [&]() -> awaitable<void> {
 *       auto stream = co_await client.get("https://example.com/file.bin");
 *       while (true) {
 *           auto chunk = co_await stream->read_chunk();
 *           if (chunk.empty()) break;
 *           ...
 *       }
 *   }, detached);
 *   io_context.run();
 *
 * Usage with callbacks:
 *   client.fetch("https://example.com/file.bin",
 *       [](const stream_info& info) { ...; return true; },
 *       [](const stream_result& result) { ... });
 *   io_context.run();
 */
class async_client : public client_base {
private:
    boost::asio::io_context& io_context_;

protected:
    boost::asio::io_context& get_io_context() override {
        return io_context_;
    }

public:
    explicit async_client(boost::asio::io_context& io_context);

    // Make downloads over an existing transport resumable. The transport must run on io_context
    async_client(boost::asio::io_context& io_context, std::shared_ptr<transport> transport);

    ~async_client() override;

    // Bring base class awaitable methods into scope for co_await usage
    using client_base::open;
    using client_base::get;
    using client_base::fetch;
    using client_base::download;

    /**
     * Streaming GET with callbacks, for callers outside a coroutine.
     * The client must outlive the operation.
     */
    template<typename Callback>
    void fetch(const std::string& url, stream_callback stream_cb, Callback&& result_cb, headers_map headers = {}) {
        co_spawn(io_context_,
            [this, url, scb = std::move(stream_cb), rcb = std::forward<Callback>(result_cb),
             h = std::move(headers)]() mutable -> awaitable<void> {
                auto result = co_await client_base::fetch(method::GET, url, std::move(h), std::move(scb));
                rcb(result);
            },
            detached);
    }

    // ============================================
    // Request builder for fluent API
    // ============================================

    /**
     * Create a request builder for fluent API.
     *
     * Usage:
     *   auto stream = co_await client.request("https://api.com/export")
     *       .header("Authorization", "Bearer xxx")
     *       .get();
     */
    request_builder<async_client> request(const std::string& url) {
        return request_builder<async_client>(this, url);
    }
};

}

#endif
