#include "client_connection.hpp"
#include "../../asio/operation_deadline.hpp"
#include "../../util/logger.hpp"

namespace resumable::http {

std::atomic<unsigned long> client_connection::connections(0);

client_connection::client_connection(std::shared_ptr<resumable::asio::socket> socket,
                                     std::string host,
                                     std::string port,
                                     std::chrono::seconds timeout)
    : socket_(std::move(socket))
    , host_(std::move(host))
    , port_(std::move(port))
    , timeout_(timeout) {
    ++connections;
    LOG_TRACE("created http client connection to {}:{} with timeout: {} seconds. total: {}",
              host_, port_, timeout.count(), connections.load());
}

client_connection::~client_connection() {
    --connections;
    LOG_TRACE("releasing http client connection. total: {}", connections.load());
}

awaitable<void> client_connection::ensure_connected() {
    if (socket_->is_open()) {
        co_return;
    }

    LOG_TRACE("connecting to: {}:{}", host_, port_);

    auto ec = co_await socket_->connect(host_, port_, timeout_);
    if (ec) {
        LOG_DEBUG("error while connecting to {}:{}: {} ({})", host_, port_, ec.message(), ec.value());
        throw boost::system::system_error(ec);
    }

    LOG_TRACE("connection established");
}

awaitable<std::size_t> client_connection::read_socket() {
    resumable::asio::operation_deadline deadline(socket_->get_io_context(), timeout_, [this]() {
        socket_->cancel();
    });

    auto [ec, bytes] = co_await socket_->read_some(buffer_, MAX_BUFFER_SIZE);

    if (ec == boost::asio::error::eof) {
        co_return 0;
    }
    if (ec) {
        if (ec == boost::asio::error::operation_aborted && deadline.expired()) {
            ec = boost::asio::error::timed_out;
        }
        throw boost::system::system_error(ec);
    }

    begin_ = buffer_;
    end_ = buffer_ + bytes;
    co_return bytes;
}

awaitable<std::shared_ptr<http_response>> client_connection::send_request(const http_request& request) {
    co_await ensure_connected();

    ++requests_;
    response_.reset();
    response_parser_.reset();
    closed_body_complete_ = false;
    begin_ = end_ = buffer_;

    request.log("CLIENT->");

    // send request head
    {
        std::string data = request.to_string();
        resumable::asio::operation_deadline deadline(socket_->get_io_context(), timeout_, [this]() {
            socket_->cancel();
        });
        auto [ec, bytes] = co_await socket_->write(data);
        if (ec) {
            if (ec == boost::asio::error::operation_aborted && deadline.expired()) {
                ec = boost::asio::error::timed_out;
            }
            throw boost::system::system_error(ec);
        }
    }

    // read response head
    bool head_request = request.get_method() == method::HEAD;
    while (true) {
        if (begin_ == end_) {
            auto bytes = co_await read_socket();
            if (bytes == 0) {
                // closed before a complete head was received
                throw boost::system::system_error(boost::asio::error::eof);
            }
        }

        boost::tribool result = response_parser_.parse(begin_, end_, head_request);

        if (result) {
            auto response = response_parser_.get_response();

            // skip interim responses
            if (response->get_status_code() >= 100 && response->get_status_code() < 200 &&
                response->get_status_code() != 101) {
                LOG_TRACE("skipping interim response: {}", response->get_status_code());
                response_parser_.reset();
                continue;
            }

            response->log("CLIENT<-");
            response_ = response;
            if (body_complete() && !reusable()) {
                close();
            }
            co_return response;
        } else if (!result) {
            // parse error
            throw boost::system::system_error(boost::asio::error::invalid_argument);
        }
        // else: indeterminate, keep reading
    }
}

awaitable<std::size_t> client_connection::read_body(uint8_t buffer[], std::size_t max_size) {
    if (!response_ || max_size == 0 || body_complete()) {
        co_return 0;
    }

    while (true) {
        if (begin_ != end_) {
            uint8_t* out = buffer;
            boost::tribool result = response_parser_.decode_body(begin_, end_, out, buffer + max_size);
            if (!result) {
                throw boost::system::system_error(boost::asio::error::invalid_argument);
            }

            auto produced = static_cast<std::size_t>(out - buffer);
            if (result && !reusable()) {
                close();
            }
            if (produced > 0 || result) {
                co_return produced;
            }
        }

        auto bytes = co_await read_socket();
        if (bytes == 0) {
            if (response_parser_.get_framing() == response_parser::body_framing::until_close) {
                closed_body_complete_ = true;
                close();
                co_return 0;
            }
            // connection closed before the announced end of the body
            close();
            throw boost::system::system_error(boost::asio::error::eof);
        }
    }
}

bool client_connection::body_complete() const {
    return closed_body_complete_ || (response_parser_.head_completed() && response_parser_.body_completed());
}

bool client_connection::reusable() const {
    return is_open() && response_ && body_complete() && response_->keep_alive() &&
           response_parser_.get_framing() != response_parser::body_framing::until_close;
}

void client_connection::close() {
    if (socket_->is_open()) {
        socket_->close();
    }
}

void client_connection::cancel() {
    socket_->cancel();
}

}
