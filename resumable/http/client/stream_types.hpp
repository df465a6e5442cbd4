#ifndef RESUMABLE_HTTP_CLIENT_STREAM_TYPES_HPP
#define RESUMABLE_HTTP_CLIENT_STREAM_TYPES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <functional>
#include <map>
#include <boost/system/error_code.hpp>

namespace resumable::http {

/**
 * Information passed to stream callbacks for each chunk of data.
 */
struct stream_info {
    std::string_view data;      // Current chunk data
    std::uint64_t downloaded;   // Total bytes delivered so far, across resumptions
    std::uint64_t total;        // Total expected size (0 if unknown, e.g., chunked)
    int status_code;            // HTTP status code of the initial response
};

/**
 * Result of a streaming operation.
 */
struct stream_result {
    int status_code = 0;
    std::string error;                              // Empty if no transport error
    boost::system::error_code error_code;           // Identity of the transport error, if any
    std::map<std::string, std::string> headers;     // Initial response headers
    std::uint64_t bytes_transferred = 0;
    unsigned resumptions = 0;                       // Requests issued to continue the download

    /**
     * Returns true if the download succeeded (no error and 2xx status).
     */
    bool ok() const {
        return error.empty() && status_code >= 200 && status_code < 300;
    }

    /**
     * Conversion to bool for if(result) checks.
     */
    explicit operator bool() const { return ok(); }

    /**
     * Returns true if the download completed (even if status is not 2xx).
     * Use this to distinguish between network errors and HTTP errors.
     */
    bool completed() const { return error.empty() && status_code > 0; }

    /**
     * Returns true if there was a network/connection error.
     */
    bool has_network_error() const { return !error.empty(); }

    /**
     * Returns true if the server returned an error status (4xx or 5xx).
     */
    bool has_http_error() const {
        return error.empty() && status_code >= 400;
    }
};

/**
 * Callback for streaming data.
 * Called for each chunk of data received.
 * Return true to continue, false to abort the download.
 */
using stream_callback = std::function<bool(const stream_info&)>;

/**
 * Callback for download progress.
 * @param downloaded Bytes downloaded so far
 * @param total Total bytes expected (0 if unknown)
 */
using progress_callback = std::function<void(std::uint64_t downloaded, std::uint64_t total)>;

}

#endif
