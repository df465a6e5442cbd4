#ifndef RESUMABLE_HTTP_RESPONSE_PARSER_HPP
#define RESUMABLE_HTTP_RESPONSE_PARSER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <boost/logic/tribool.hpp>

namespace resumable::http {

    class http_response;

    /// Incremental parser for HTTP/1.x responses. The head (status line and headers) is
    /// parsed with parse(), and the body is then decoded in place with decode_body()
    /// according to the framing announced by the head.
    class response_parser {
    public:
        /// Maximum size accepted for the status line plus headers
        static constexpr std::size_t MAX_HEADERS_SIZE = 16*1024;   // 16KB

        /// How the end of the response body is determined
        enum class body_framing {
            none,
            length_delimited,
            chunked,
            until_close
        };

        response_parser() = default;

        /// Parse the response head. The tribool return value is true when the head has been
        /// completely parsed, false if the data is invalid, indeterminate when more
        /// data is required. begin is advanced past the consumed input, so on completion it
        /// points to the first body byte.
        boost::tribool parse(const uint8_t*& begin, const uint8_t* end, bool head_request = false);

        /// Decode body bytes from [in, in_end) into [out, out_end), advancing both pointers.
        /// Returns true once the whole body has been decoded, false on malformed chunked
        /// framing, indeterminate when more input (or output space) is required.
        boost::tribool decode_body(const uint8_t*& in, const uint8_t* in_end, uint8_t*& out, uint8_t* out_end);

        /// Response head being (or already) parsed
        std::shared_ptr<http_response> get_response() const { return resp_; }

        body_framing get_framing() const { return framing_; }
        bool head_completed() const { return head_completed_; }
        bool body_completed() const { return body_completed_; }

        void reset();

    private:
        /// Handle the next character of the response head.
        boost::tribool consume(char input, bool head_request);

        /// Decide the body framing once the head is complete.
        void on_head_completed(bool head_request);

        static bool is_char(int c);
        static bool is_ctl(int c);
        static bool is_tspecial(int c);
        static bool is_digit(int c);
        static int get_hex_value(int c);

        std::shared_ptr<http_response> resp_;

        std::string tempString1_;
        std::string tempString2_;
        std::uint64_t tempInt_      = 0;
        std::size_t headers_size_   = 0;
        std::uint64_t remaining_    = 0;
        unsigned chunk_digits_      = 0;
        bool head_completed_        = false;
        bool body_completed_        = false;
        body_framing framing_       = body_framing::none;

        /// The current state of the head parser.
        enum state {
            http_version_h,
            http_version_t_1,
            http_version_t_2,
            http_version_p,
            http_version_slash,
            http_version_major_start,
            http_version_major,
            http_version_minor_start,
            http_version_minor,
            status_code_start,
            status_code,
            reason_phrase,
            expecting_newline_1,
            header_line_start,
            header_name,
            space_before_header_value,
            header_value,
            expecting_newline_2,
            expecting_newline_3
        } state_ = http_version_h;

        /// The current state of the chunked body decoder.
        enum chunk_state {
            chunk_size,
            chunk_extension,
            chunk_size_expecting_n,
            chunk_data,
            chunk_data_expecting_r,
            chunk_data_expecting_n,
            trailer_line_start,
            trailer_line,
            trailer_line_expecting_n,
            trailer_end_expecting_n
        } chunk_state_ = chunk_size;
    };

}

#endif
