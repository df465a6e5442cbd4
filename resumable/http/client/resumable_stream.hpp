#ifndef RESUMABLE_HTTP_CLIENT_RESUMABLE_STREAM_HPP
#define RESUMABLE_HTTP_CLIENT_RESUMABLE_STREAM_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <boost/noncopyable.hpp>
#include <boost/system/error_code.hpp>

#include "endpoint.hpp"
#include "physical_response.hpp"
#include "position_tracker.hpp"
#include "stream_types.hpp"
#include "transport.hpp"
#include "../../util/types.hpp"

namespace resumable::http {

/**
 * Body of a logical download, exposed as a single forward-only byte stream.
 *
 * Bytes are pulled from the active physical response. When it fails with a transport
 * error and the first response advertised byte ranges, the same endpoint is requested
 * again with "Range: bytes=<position>-" and the new response replaces the failed one,
 * so the consumer sees every byte exactly once. Each error triggers at most one such
 * request; if it cannot be established, its own error ends the download.
 *
 * Single consumer: all operations must run on the same executor.
 */
class resumable_stream : private boost::noncopyable {
public:
    static constexpr std::size_t DEFAULT_CHUNK_SIZE = 8192;

    enum class state {
        streaming,
        resuming,
        done,
        failed
    };

    /// Wrap the initial response of target. max_resumptions limits the number of
    /// successful resumptions (0 means unlimited).
    resumable_stream(std::shared_ptr<transport> transport,
                     endpoint target,
                     std::unique_ptr<physical_response> initial,
                     unsigned max_resumptions = 0);
    ~resumable_stream();

    /// Read up to max_size bytes. Returns 0 at end of stream (and on every call after
    /// it); throws boost::system::system_error with the error that ended the download.
    awaitable<std::size_t> read_some(uint8_t buffer[], std::size_t max_size);

    /// Next chunk of data, empty at end of stream.
    awaitable<std::string> read_chunk(std::size_t max_size = DEFAULT_CHUNK_SIZE);

    /// Remaining data until end of stream.
    awaitable<std::string> read_all();

    /// Push every remaining chunk to callback. Transport errors are reported in the
    /// result instead of being thrown. Returning false from the callback aborts the
    /// download with operation_aborted.
    awaitable<stream_result> stream(stream_callback callback, std::size_t chunk_size = DEFAULT_CHUNK_SIZE);

    /// Abort the pending read (or the resumption in flight). The download fails with
    /// operation_aborted.
    void cancel();

    // observers
    state get_state() const { return state_; }
    std::uint64_t position() const { return position_.current(); }
    bool accepts_ranges() const { return accepts_ranges_; }
    unsigned resumptions() const { return resumptions_; }
    unsigned get_max_resumptions() const { return max_resumptions_; }
    int get_status_code() const { return initial_->get_status_code(); }
    std::shared_ptr<http_response> get_initial_response() const { return initial_; }
    const endpoint& get_endpoint() const { return endpoint_; }
    const boost::system::error_code& get_error() const { return error_; }

    /// Content-Length of the initial response, 0 if unknown
    std::uint64_t total_size() const;

private:
    // replace the failed response with one starting at the current position, or fail with a terminal error
    awaitable<void> resume(boost::system::error_code ec);

    [[noreturn]] void fail(boost::system::error_code ec);

    std::shared_ptr<transport> transport_;
    endpoint endpoint_;
    std::unique_ptr<physical_response> response_;
    std::shared_ptr<http_response> initial_;
    position_tracker position_;
    bool accepts_ranges_;
    unsigned max_resumptions_;
    unsigned resumptions_ = 0;
    bool cancelled_ = false;
    state state_ = state::streaming;
    boost::system::error_code error_;
};

}

#endif
