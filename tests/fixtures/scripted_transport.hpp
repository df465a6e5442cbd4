#ifndef RESUMABLE_HTTP_TEST_SCRIPTED_TRANSPORT_HPP
#define RESUMABLE_HTTP_TEST_SCRIPTED_TRANSPORT_HPP

#include <resumable/http/client/transport.hpp>
#include <resumable/http/common/http_response.hpp>
#include <algorithm>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace resumable::http::test {

// Body of an in-memory response, optionally failing once a number of bytes was delivered
class scripted_response : public physical_response {
public:
    scripted_response(std::shared_ptr<http_response> head,
                      std::shared_ptr<const std::string> body,
                      std::size_t begin,
                      std::size_t fail_after,
                      boost::system::error_code failure,
                      std::size_t chunk_size)
        : physical_response(std::move(head))
        , body_(std::move(body))
        , position_(begin)
        , fail_at_(failure ? begin + fail_after : std::string::npos)
        , failure_(failure)
        , chunk_size_(chunk_size) {}

    awaitable<std::size_t> read_some(uint8_t buffer[], std::size_t max_size) override {
        if (cancelled_) {
            throw boost::system::system_error(boost::asio::error::operation_aborted);
        }
        if (position_ == fail_at_) {
            throw boost::system::system_error(failure_);
        }
        std::size_t limit = std::min(body_->size(), fail_at_);
        std::size_t bytes = std::min({max_size, limit - position_, chunk_size_});
        std::memcpy(buffer, body_->data() + position_, bytes);
        position_ += bytes;
        co_return bytes;
    }

    void cancel() override {
        cancelled_ = true;
    }

private:
    std::shared_ptr<const std::string> body_;
    std::size_t position_;
    std::size_t fail_at_;
    boost::system::error_code failure_;
    std::size_t chunk_size_;
    bool cancelled_ = false;
};

// Transport serving one resource from memory, honoring "Range: bytes=N-" and recording
// every request it receives. Failures are scripted per request index (0 is the initial one).
class scripted_transport : public transport {
public:
    struct issued_request {
        method request_method;
        std::string url;
        headers_map endpoint_headers;
        headers_map extra_headers;

        std::string range() const {
            auto it = extra_headers.find(header::range);
            return it != extra_headers.end() ? it->second : "";
        }
    };

    explicit scripted_transport(std::string body, bool accept_ranges = true)
        : body_(std::make_shared<const std::string>(std::move(body)))
        , accept_ranges_(accept_ranges) {}

    // the response to request #index fails with ec after delivering after_bytes bytes
    void fail_response(std::size_t index, std::size_t after_bytes, boost::system::error_code ec) {
        response_failures_[index] = {after_bytes, ec};
    }

    // request #index cannot be established and throws ec
    void fail_issue(std::size_t index, boost::system::error_code ec) {
        issue_failures_[index] = ec;
    }

    void set_chunk_size(std::size_t size) { chunk_size_ = size; }
    void set_resume_status(int status) { resume_status_ = status; }
    void set_accept_ranges_value(std::string value) { accept_ranges_value_ = std::move(value); }

    // invoked after a request was recorded, before its outcome is produced
    void on_issue(std::function<void(std::size_t)> hook) { on_issue_ = std::move(hook); }

    const std::vector<issued_request>& requests() const { return requests_; }
    const std::string& body() const { return *body_; }

    awaitable<std::unique_ptr<physical_response>> issue(const endpoint& target,
                                                        const headers_map& extra_headers) override {
        std::size_t index = requests_.size();
        requests_.push_back({target.get_method(), target.get_url(), target.get_headers(), extra_headers});

        if (on_issue_) on_issue_(index);

        auto issue_failure = issue_failures_.find(index);
        if (issue_failure != issue_failures_.end()) {
            throw boost::system::system_error(issue_failure->second);
        }

        std::size_t begin = 0;
        auto range = requests_.back().range();
        if (range.rfind("bytes=", 0) == 0) {
            begin = std::min<std::size_t>(std::stoull(range.substr(6)), body_->size());
        }

        auto head = std::make_shared<http_response>();
        head->set_status(static_cast<uint16_t>(range.empty() ? 200 : resume_status_));
        head->process_header(header::content_length, std::to_string(body_->size() - begin));
        if (accept_ranges_) {
            head->process_header(header::accept_ranges, accept_ranges_value_);
        }
        if (!range.empty()) {
            head->process_header(header::content_range,
                                 "bytes " + std::to_string(begin) + "-" + std::to_string(body_->size() - 1) +
                                 "/" + std::to_string(body_->size()));
        }

        std::size_t fail_after = 0;
        boost::system::error_code failure;
        auto response_failure = response_failures_.find(index);
        if (response_failure != response_failures_.end()) {
            fail_after = response_failure->second.first;
            failure = response_failure->second.second;
        }

        co_return std::make_unique<scripted_response>(head, body_, begin, fail_after, failure, chunk_size_);
    }

private:
    std::shared_ptr<const std::string> body_;
    bool accept_ranges_;
    std::string accept_ranges_value_ = "bytes";
    std::size_t chunk_size_ = 64;
    int resume_status_ = 206;
    std::map<std::size_t, std::pair<std::size_t, boost::system::error_code>> response_failures_;
    std::map<std::size_t, boost::system::error_code> issue_failures_;
    std::function<void(std::size_t)> on_issue_;
    std::vector<issued_request> requests_;
};

// Deterministic body of the given size, so any gap or duplication changes the bytes
inline std::string make_pattern(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + i / 251) & 0xFF);
    }
    return data;
}

}

#endif
