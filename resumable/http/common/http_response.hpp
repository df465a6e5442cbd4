#ifndef RESUMABLE_HTTP_RESPONSE_HPP
#define RESUMABLE_HTTP_RESPONSE_HPP

#include <cstdint>
#include <string>
#include "headers.hpp"

namespace resumable::http {

/**
 * Status line and headers of a response received from the server. The body is not
 * stored here: it is streamed through the owning physical_response.
 */
class http_response : public headers {

public:

    // the status of the http_response.
    enum class status {
        ok = 200,
        created = 201,
        accepted = 202,
        no_content = 204,
        partial_content = 206,
        multiple_choices = 300,
        moved_permanently = 301,
        moved_temporarily = 302,
        see_other = 303,
        not_modified = 304,
        temporary_redirect = 307,
        permanent_redirect = 308,
        bad_request = 400,
        unauthorized = 401,
        forbidden = 403,
        not_found = 404,
        range_not_satisfiable = 416,
        internal_server_error = 500,
        bad_gateway = 502,
        service_unavailable = 503
    };

    // constructor
    http_response() = default;
    ~http_response() override = default;

    // some setters
    void set_status(uint16_t status_code);
    void set_status(status status_code);
    void set_reason_phrase(const std::string& reason);

    // some getters
    int get_status_code() const;
    const std::string& get_reason_phrase() const;
    bool is_ok() const;
    bool is_redirect_response() const;

    // responses to HEAD and 1xx/204/304 responses never carry a body
    bool has_body(bool head_request) const;

    // log
    void log(const char* scope) const;

private:
    uint16_t status_code_ = 200;
    std::string reason_phrase_;
};

}

#endif
