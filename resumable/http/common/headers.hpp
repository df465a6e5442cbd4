#ifndef RESUMABLE_HTTP_HEADERS_HPP
#define RESUMABLE_HTTP_HEADERS_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/logic/tribool.hpp>

namespace resumable::http {

    namespace header {
        static const std::string accept_encoding    = "Accept-Encoding";
        static const std::string accept_ranges      = "Accept-Ranges";
        static const std::string authorization      = "Authorization";
        static const std::string connection         = "Connection";
        static const std::string content_length     = "Content-Length";
        static const std::string content_range      = "Content-Range";
        static const std::string content_type       = "Content-Type";
        static const std::string host               = "Host";
        static const std::string location           = "Location";
        static const std::string range              = "Range";
        static const std::string transfer_encoding  = "Transfer-Encoding";
        static const std::string user_agent         = "User-Agent";
    }

    namespace connection {
        static const std::string keep_alive = "Keep-Alive";
        static const std::string close      = "Close";
    }

    namespace misc_strings {
        static const std::string name_value_separator = ": ";
        static const std::string crlf = "\r\n";
    }

    class headers {
    public:
        using http_header = std::pair<std::string, std::string>;

        headers() = default;
        virtual ~headers() = default;

        // header processing for parsed messages (tracks framing and connection state)
        void process_header(std::string key, std::string value);

        // header manipulation
        void add_header(std::string key, std::string value);
        void set_header(std::string key, std::string value);
        bool remove_header(std::string_view key);

        // header access (case-insensitive keys)
        bool has_header(std::string_view key) const;
        const std::string& get_header(std::string_view key) const;
        std::vector<std::string> get_headers_with_key(std::string_view key) const;
        const std::vector<http_header>& get_headers() const;
        bool empty_headers() const;

        // message framing
        bool has_content_length() const;
        std::uint64_t get_content_length() const;
        bool is_chunked() const;

        // connection state
        bool keep_alive() const;
        void set_keep_alive(bool keep_alive);

        void set_http_version_major(uint8_t http_version_major);
        void set_http_version_minor(uint8_t http_version_minor);
        int get_http_version_major() const;
        int get_http_version_minor() const;

        void log(const char* scope) const;

        static bool is_header(std::string_view key, std::string_view header);

    protected:
        std::vector<http_header> headers_;
        boost::tribool keep_alive_ = boost::indeterminate;
        bool has_content_length_ = false;
        std::uint64_t content_length_ = 0;
        bool chunked_ = false;
        uint8_t http_version_major_ = 1;
        uint8_t http_version_minor_ = 1;
    };

}

#endif
