#ifndef RESUMABLE_HTTP_CLIENT_ENDPOINT_HPP
#define RESUMABLE_HTTP_CLIENT_ENDPOINT_HPP

#include <map>
#include <string>
#include "../common/http_request.hpp"

namespace resumable::http {

    // extra request headers supplied by the caller
    using headers_map = std::map<std::string, std::string>;

    /**
     * Request identity of a logical download: method, absolute URL and the caller headers.
     * It never changes once the download starts, so every resumption repeats it verbatim.
     */
    class endpoint {
    public:
        endpoint(method m, std::string url, headers_map headers = {})
            : method_(m), url_(std::move(url)), headers_(std::move(headers)) {}

        method get_method() const { return method_; }
        const std::string& get_url() const { return url_; }
        const headers_map& get_headers() const { return headers_; }

    private:
        method method_;
        std::string url_;
        headers_map headers_;
    };

}

#endif
