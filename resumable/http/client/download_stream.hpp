#ifndef RESUMABLE_HTTP_CLIENT_DOWNLOAD_STREAM_HPP
#define RESUMABLE_HTTP_CLIENT_DOWNLOAD_STREAM_HPP

#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>

#include "resumable_stream.hpp"
#include "../../util/run_blocking.hpp"

namespace resumable::http {

/**
 * Blocking view of a resumable_stream, as returned by http::client. Every call runs the
 * underlying coroutine to completion on the client io_context, which is kept alive for
 * as long as the download exists.
 *
 * Usage:
 *   http::client client;
 *   auto download = client.get("https://example.com/file.bin");
 *   uint8_t buffer[8192];
 *   while (auto bytes = download.read_some(buffer, sizeof(buffer))) {
 *       out.write(reinterpret_cast<const char*>(buffer), bytes);
 *   }
 */
class download_stream {
public:
    download_stream(std::shared_ptr<boost::asio::io_context> io_context,
                    std::unique_ptr<resumable_stream> stream)
        : io_context_(std::move(io_context))
        , stream_(std::move(stream)) {}

    download_stream(download_stream&&) = default;
    download_stream& operator=(download_stream&& other) noexcept {
        // release the current stream while its io_context is still alive
        stream_ = std::move(other.stream_);
        io_context_ = std::move(other.io_context_);
        return *this;
    }

    // blocking reads, same semantics as resumable_stream
    std::size_t read_some(uint8_t buffer[], std::size_t max_size) {
        return util::run_blocking(*io_context_, stream_->read_some(buffer, max_size));
    }

    std::string read_chunk(std::size_t max_size = resumable_stream::DEFAULT_CHUNK_SIZE) {
        return util::run_blocking(*io_context_, stream_->read_chunk(max_size));
    }

    std::string read_all() {
        return util::run_blocking(*io_context_, stream_->read_all());
    }

    stream_result stream(stream_callback callback, std::size_t chunk_size = resumable_stream::DEFAULT_CHUNK_SIZE) {
        return util::run_blocking(*io_context_, stream_->stream(std::move(callback), chunk_size));
    }

    // observers
    resumable_stream::state get_state() const { return stream_->get_state(); }
    std::uint64_t position() const { return stream_->position(); }
    bool accepts_ranges() const { return stream_->accepts_ranges(); }
    unsigned resumptions() const { return stream_->resumptions(); }
    int get_status_code() const { return stream_->get_status_code(); }
    std::uint64_t total_size() const { return stream_->total_size(); }
    std::shared_ptr<http_response> get_initial_response() const { return stream_->get_initial_response(); }
    const endpoint& get_endpoint() const { return stream_->get_endpoint(); }

    bool ok() const { return get_status_code() >= 200 && get_status_code() < 300; }

    resumable_stream& get_stream() { return *stream_; }

private:
    // declared first so it outlives the stream and its sockets
    std::shared_ptr<boost::asio::io_context> io_context_;
    std::unique_ptr<resumable_stream> stream_;
};

}

#endif
