#include <vector>
#include "resumable_stream.hpp"
#include "range_capability.hpp"
#include "../../util/logger.hpp"

namespace resumable::http {

resumable_stream::resumable_stream(std::shared_ptr<transport> transport,
                                   endpoint target,
                                   std::unique_ptr<physical_response> initial,
                                   unsigned max_resumptions)
    : transport_(std::move(transport))
    , endpoint_(std::move(target))
    , response_(std::move(initial))
    , max_resumptions_(max_resumptions) {
    if (!transport_ || !response_) {
        throw boost::system::system_error(boost::asio::error::invalid_argument);
    }
    initial_ = response_->get_response();
    // decided once for the whole download, resumed responses are never re-checked
    accepts_ranges_ = accepts_byte_ranges(*initial_);
    LOG_TRACE("stream for {} created. status: {}, accepts ranges: {}",
              endpoint_.get_url(), initial_->get_status_code(), accepts_ranges_);
}

resumable_stream::~resumable_stream() = default;

std::uint64_t resumable_stream::total_size() const {
    return initial_->has_content_length() ? initial_->get_content_length() : 0;
}

void resumable_stream::fail(boost::system::error_code ec) {
    state_ = state::failed;
    error_ = ec;
    response_.reset();
    throw boost::system::system_error(ec);
}

awaitable<std::size_t> resumable_stream::read_some(uint8_t buffer[], std::size_t max_size) {
    if (state_ == state::done) {
        co_return 0;
    }
    if (state_ == state::failed) {
        throw boost::system::system_error(error_);
    }
    if (max_size == 0) {
        co_return 0;
    }

    while (true) {
        if (cancelled_) {
            fail(boost::asio::error::operation_aborted);
        }

        boost::system::error_code ec;
        std::size_t bytes = 0;
        try {
            bytes = co_await response_->read_some(buffer, max_size);
        } catch (const boost::system::system_error& e) {
            ec = e.code();
        }

        if (!ec) {
            if (bytes > 0) {
                position_.advance(bytes);
                co_return bytes;
            }
            LOG_TRACE("download of {} completed: {} bytes, {} resumptions",
                      endpoint_.get_url(), position_.current(), resumptions_);
            state_ = state::done;
            response_.reset();
            co_return 0;
        }

        if (cancelled_) {
            fail(boost::asio::error::operation_aborted);
        }

        co_await resume(ec);
    }
}

awaitable<void> resumable_stream::resume(boost::system::error_code ec) {
    if (!accepts_ranges_) {
        LOG_DEBUG("cannot resume {}: server does not accept byte ranges ({})", endpoint_.get_url(), ec.message());
        fail(ec);
    }
    if (max_resumptions_ > 0 && resumptions_ >= max_resumptions_) {
        LOG_DEBUG("cannot resume {}: reached maximum resumptions ({})", endpoint_.get_url(), max_resumptions_);
        fail(ec);
    }

    state_ = state::resuming;
    LOG_DEBUG("resuming {} from byte {} after error: {}", endpoint_.get_url(), position_.current(), ec.message());

    // the failed response is discarded along with its error
    response_.reset();

    headers_map range{{header::range, byte_range_from(position_.current())}};
    std::unique_ptr<physical_response> replacement;
    boost::system::error_code resume_ec;
    try {
        replacement = co_await transport_->issue(endpoint_, range);
    } catch (const boost::system::system_error& e) {
        resume_ec = e.code();
    }

    if (cancelled_) {
        fail(boost::asio::error::operation_aborted);
    }
    if (resume_ec) {
        LOG_DEBUG("resuming {} failed: {}", endpoint_.get_url(), resume_ec.message());
        fail(resume_ec);
    }

    LOG_TRACE("resumed {} with status {}", endpoint_.get_url(), replacement->get_status_code());
    response_ = std::move(replacement);
    ++resumptions_;
    state_ = state::streaming;
}

awaitable<std::string> resumable_stream::read_chunk(std::size_t max_size) {
    std::string chunk(max_size, '\0');
    auto bytes = co_await read_some(reinterpret_cast<uint8_t*>(chunk.data()), max_size);
    chunk.resize(bytes);
    co_return chunk;
}

awaitable<std::string> resumable_stream::read_all() {
    std::string data;
    std::vector<uint8_t> buffer(DEFAULT_CHUNK_SIZE);
    while (true) {
        auto bytes = co_await read_some(buffer.data(), buffer.size());
        if (bytes == 0) break;
        data.append(reinterpret_cast<const char*>(buffer.data()), bytes);
    }
    co_return data;
}

awaitable<stream_result> resumable_stream::stream(stream_callback callback, std::size_t chunk_size) {
    stream_result result;
    result.status_code = initial_->get_status_code();
    for (const auto& [key, value] : initial_->get_headers()) {
        result.headers[key] = value;
    }

    std::vector<uint8_t> buffer(chunk_size > 0 ? chunk_size : DEFAULT_CHUNK_SIZE);
    try {
        while (true) {
            auto bytes = co_await read_some(buffer.data(), buffer.size());
            if (bytes == 0) break;

            stream_info info{
                std::string_view(reinterpret_cast<const char*>(buffer.data()), bytes),
                position_.current(),
                total_size(),
                result.status_code
            };
            if (callback && !callback(info)) {
                LOG_DEBUG("download of {} aborted by callback at byte {}", endpoint_.get_url(), position_.current());
                fail(boost::asio::error::operation_aborted);
            }
        }
    } catch (const boost::system::system_error& e) {
        result.error = e.what();
        result.error_code = e.code();
    }

    result.bytes_transferred = position_.current();
    result.resumptions = resumptions_;
    co_return result;
}

void resumable_stream::cancel() {
    if (state_ == state::done || state_ == state::failed) {
        return;
    }
    cancelled_ = true;
    if (response_) {
        response_->cancel();
    }
}

}
