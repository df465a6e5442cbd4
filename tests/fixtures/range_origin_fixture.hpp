#ifndef RESUMABLE_HTTP_TEST_RANGE_ORIGIN_FIXTURE_HPP
#define RESUMABLE_HTTP_TEST_RANGE_ORIGIN_FIXTURE_HPP

#include <utility>
#include <resumable/util/types.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/asio.hpp>
#include <chrono>
#include <algorithm>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace resumable::http::test {

/**
 * Plain HTTP/1.1 origin serving one resource on 127.0.0.1 from its own thread.
 *
 * Paths:
 *   /file       Content-Length framing, keep-alive, Accept-Ranges: bytes
 *   /norange    same body, Range ignored and no Accept-Ranges
 *   /chunked    chunked framing, Accept-Ranges: bytes
 *   /close      close delimited body, Accept-Ranges: bytes
 *   /redirect   302 to /file
 *
 * Responses are numbered in arrival order (0 is the first one served). A response can be
 * scripted to drop the connection or to stall after a number of body bytes.
 */
class range_origin {
public:
    struct received_request {
        std::string method;
        std::string target;
        std::map<std::string, std::string> headers;   // lowercase names

        std::string header(const std::string& name) const {
            auto it = headers.find(boost::algorithm::to_lower_copy(name));
            return it != headers.end() ? it->second : "";
        }
    };

    explicit range_origin(std::string body)
        : body_(std::move(body))
        , acceptor_(io_context_, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {
        port_ = acceptor_.local_endpoint().port();
        co_spawn(io_context_, accept_loop(), detached);
        thread_ = std::thread([this] { io_context_.run(); });
    }

    ~range_origin() {
        boost::asio::post(io_context_, [this] {
            boost::system::error_code ec;
            acceptor_.close(ec);
        });
        io_context_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const { return port_; }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    const std::string& body() const { return body_; }

    // response #index closes the connection after writing after_bytes body bytes
    void drop_response(std::size_t index, std::size_t after_bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        drops_[index] = after_bytes;
    }

    // response #index stops sending after after_bytes body bytes and keeps the connection open
    void stall_response(std::size_t index, std::size_t after_bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        stalls_[index] = after_bytes;
    }

    // stop listening once this many requests were received, so later connects are refused
    void refuse_after(std::size_t requests) {
        std::lock_guard<std::mutex> lock(mutex_);
        refuse_after_ = requests;
    }

    std::vector<received_request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::size_t connections() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_;
    }

private:
    awaitable<void> accept_loop() {
        while (acceptor_.is_open()) {
            boost::system::error_code ec;
            boost::asio::ip::tcp::socket socket(io_context_);
            co_await acceptor_.async_accept(socket, boost::asio::redirect_error(use_awaitable, ec));
            if (ec) break;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++connections_;
            }
            co_spawn(io_context_, serve(std::move(socket)), detached);
        }
    }

    awaitable<void> serve(boost::asio::ip::tcp::socket socket) {
        std::string buffer;
        try {
            while (true) {
                auto size = co_await boost::asio::async_read_until(
                    socket, boost::asio::dynamic_buffer(buffer), "\r\n\r\n", use_awaitable);
                auto request = parse_request(buffer.substr(0, size));
                buffer.erase(0, size);

                std::size_t index;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    index = requests_.size();
                    requests_.push_back(request);
                    if (refuse_after_ && requests_.size() >= refuse_after_) {
                        boost::system::error_code ignored;
                        acceptor_.close(ignored);
                    }
                }

                bool keep_alive = co_await respond(socket, request, index);
                if (!keep_alive) break;
            }
        } catch (const boost::system::system_error&) {
            // client went away
        }
        boost::system::error_code ignored;
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    awaitable<bool> respond(boost::asio::ip::tcp::socket& socket, const received_request& request, std::size_t index) {
        std::string path = request.target;
        bool head = request.method == "HEAD";

        if (path == "/redirect") {
            std::string response = "HTTP/1.1 302 Found\r\nLocation: /file\r\nContent-Length: 0\r\n\r\n";
            co_await boost::asio::async_write(socket, boost::asio::buffer(response), use_awaitable);
            co_return true;
        }

        if (path != "/file" && path != "/norange" && path != "/chunked" && path != "/close") {
            std::string response = "HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\n\r\nnot found";
            co_await boost::asio::async_write(socket, boost::asio::buffer(response), use_awaitable);
            co_return true;
        }

        bool ranges = path != "/norange";
        std::size_t begin = 0;
        auto range = request.header("range");
        if (ranges && boost::algorithm::starts_with(range, "bytes=")) {
            begin = std::min<std::size_t>(std::stoull(range.substr(6)), body_.size());
        }
        bool partial = ranges && !range.empty();
        std::string_view payload(body_.data() + begin, body_.size() - begin);

        std::string head_text = partial ? "HTTP/1.1 206 Partial Content\r\n" : "HTTP/1.1 200 OK\r\n";
        if (ranges) {
            head_text += "Accept-Ranges: bytes\r\n";
        }
        if (partial) {
            head_text += "Content-Range: bytes " + std::to_string(begin) + "-" + std::to_string(body_.size() - 1) +
                         "/" + std::to_string(body_.size()) + "\r\n";
        }
        if (path == "/chunked") {
            head_text += "Transfer-Encoding: chunked\r\n";
        } else if (path == "/close") {
            head_text += "Connection: close\r\n";
        } else {
            head_text += "Content-Length: " + std::to_string(payload.size()) + "\r\n";
        }
        head_text += "\r\n";
        co_await boost::asio::async_write(socket, boost::asio::buffer(head_text), use_awaitable);
        if (head) co_return true;

        std::size_t limit = payload.size();
        bool drop = false;
        bool stall = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto it = drops_.find(index); it != drops_.end()) {
                limit = std::min(limit, it->second);
                drop = true;
            } else if (auto stall_it = stalls_.find(index); stall_it != stalls_.end()) {
                limit = std::min(limit, stall_it->second);
                stall = true;
            }
        }

        // body goes out in pieces so the client sees several reads
        const std::size_t piece = 1024;
        for (std::size_t offset = 0; offset < limit; offset += piece) {
            auto size = std::min(piece, limit - offset);
            if (path == "/chunked") {
                std::stringstream chunk;
                chunk << std::hex << size << "\r\n";
                chunk << payload.substr(offset, size) << "\r\n";
                auto text = chunk.str();
                co_await boost::asio::async_write(socket, boost::asio::buffer(text), use_awaitable);
            } else {
                co_await boost::asio::async_write(socket, boost::asio::buffer(payload.data() + offset, size),
                                                  use_awaitable);
            }
        }

        if (stall) {
            boost::asio::steady_timer timer(io_context_, std::chrono::seconds(60));
            boost::system::error_code ignored;
            co_await timer.async_wait(boost::asio::redirect_error(use_awaitable, ignored));
            co_return false;
        }
        if (drop) {
            co_return false;
        }
        if (path == "/chunked") {
            std::string last = "0\r\n\r\n";
            co_await boost::asio::async_write(socket, boost::asio::buffer(last), use_awaitable);
        }
        co_return path != "/close";
    }

    static received_request parse_request(const std::string& text) {
        received_request request;
        std::vector<std::string> lines;
        boost::algorithm::split(lines, text, boost::algorithm::is_any_of("\n"));
        if (lines.empty()) return request;

        std::vector<std::string> request_line;
        auto first = boost::algorithm::trim_copy(lines[0]);
        boost::algorithm::split(request_line, first, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
        if (request_line.size() >= 2) {
            request.method = request_line[0];
            request.target = request_line[1];
        }
        for (std::size_t i = 1; i < lines.size(); ++i) {
            auto line = boost::algorithm::trim_copy(lines[i]);
            auto colon = line.find(':');
            if (colon == std::string::npos) continue;
            auto name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(line.substr(0, colon)));
            request.headers[name] = boost::algorithm::trim_copy(line.substr(colon + 1));
        }
        return request;
    }

    std::string body_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::map<std::size_t, std::size_t> drops_;
    std::map<std::size_t, std::size_t> stalls_;
    std::size_t refuse_after_ = 0;
    std::size_t connections_ = 0;
    std::vector<received_request> requests_;
};

}

#endif
