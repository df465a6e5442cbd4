#ifndef RESUMABLE_HTTP_REQUEST_HPP
#define RESUMABLE_HTTP_REQUEST_HPP

#include <string>
#include "headers.hpp"

namespace resumable::http {

    enum class method {
        GET,
        HEAD,
        POST,
        PUT,
        DELETE,
        PATCH,
        OPTIONS
    };

    const std::string& get_method_string(method m);

    /**
     * Outgoing HTTP/1.1 request: target URL, method and headers.
     * The URL is split into scheme, host, port and origin-form target on set_url().
     */
    class http_request : public headers {
    public:
        http_request() = default;
        ~http_request() override = default;

        // returns false (leaving the request untouched) if the url is not an absolute http(s) url
        bool set_url(const std::string& url);

        void set_method(method m);
        method get_method() const;

        const std::string& get_url() const;
        const std::string& get_host() const;
        const std::string& get_port() const;
        const std::string& get_uri() const;
        bool is_ssl() const;

        // scheme://host[:port], used for same-origin checks and relative redirects
        std::string get_base_path() const;

        // serialized request head (request line, headers and blank line)
        std::string to_string() const;

        void log(const char* scope) const;

    private:
        method method_ = method::GET;
        std::string url_;
        std::string host_;
        std::string port_;
        std::string uri_ = "/";
        bool ssl_ = false;
    };

}

#endif
