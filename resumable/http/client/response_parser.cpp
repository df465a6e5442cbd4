#include <algorithm>
#include <cstring>
#include "response_parser.hpp"
#include "../common/http_response.hpp"
#include "../../util/logger.hpp"

namespace resumable::http {

    boost::tribool response_parser::parse(const uint8_t*& begin, const uint8_t* end, bool head_request) {
        if(head_completed_) return true;
        if(!resp_) resp_ = std::make_shared<http_response>();

        // iterate over all input chars
        while (begin != end) {
            if(++headers_size_ > MAX_HEADERS_SIZE){
                LOG_ERROR("response headers exceed maximum size of {} bytes", MAX_HEADERS_SIZE);
                return false;
            }

            // consume character
            boost::tribool result = consume(static_cast<char>(*begin++), head_request);

            // parse completed/failed
            if (result || !result){
                return result;
            }
        }
        // still not finished
        return boost::indeterminate;
    }

    boost::tribool response_parser::consume(char input, bool head_request) {
        switch (state_) {
            case http_version_h:
                if (input == 'H') {
                    state_ = http_version_t_1;
                    return boost::indeterminate;
                }
                return false;
            case http_version_t_1:
                if (input == 'T') {
                    state_ = http_version_t_2;
                    return boost::indeterminate;
                }
                return false;
            case http_version_t_2:
                if (input == 'T') {
                    state_ = http_version_p;
                    return boost::indeterminate;
                }
                return false;
            case http_version_p:
                if (input == 'P') {
                    state_ = http_version_slash;
                    return boost::indeterminate;
                }
                return false;
            case http_version_slash:
                if (input == '/') {
                    state_ = http_version_major_start;
                    return boost::indeterminate;
                }
                return false;
            case http_version_major_start:
                if (is_digit(input)) {
                    tempInt_ = input - '0';
                    state_ = http_version_major;
                    return boost::indeterminate;
                }
                return false;
            case http_version_major:
                if (input == '.') {
                    resp_->set_http_version_major(static_cast<uint8_t>(tempInt_));
                    state_ = http_version_minor_start;
                    return boost::indeterminate;
                }
                else if (is_digit(input) && tempInt_ < 10) {
                    tempInt_ = tempInt_ * 10 + input - '0';
                    return boost::indeterminate;
                }
                return false;
            case http_version_minor_start:
                if (is_digit(input)) {
                    tempInt_ = input - '0';
                    state_ = http_version_minor;
                    return boost::indeterminate;
                }
                return false;
            case http_version_minor:
                if (input == ' ') {
                    resp_->set_http_version_minor(static_cast<uint8_t>(tempInt_));
                    state_ = status_code_start;
                    return boost::indeterminate;
                }
                else if (is_digit(input) && tempInt_ < 10) {
                    tempInt_ = tempInt_ * 10 + input - '0';
                    return boost::indeterminate;
                }
                return false;
            case status_code_start:
                if (input == ' ') {
                    return boost::indeterminate;
                }
                else if (is_digit(input)) {
                    tempInt_ = input - '0';
                    state_ = status_code;
                    return boost::indeterminate;
                }
                return false;
            case status_code:
                if (is_digit(input) && tempInt_ < 100) {
                    tempInt_ = tempInt_ * 10 + input - '0';
                    return boost::indeterminate;
                }
                else if (input == ' ' || input == '\r') {
                    if (tempInt_ < 100) return false;
                    resp_->set_status(static_cast<uint16_t>(tempInt_));
                    tempString1_.clear();
                    state_ = input == ' ' ? reason_phrase : expecting_newline_1;
                    return boost::indeterminate;
                }
                return false;
            case reason_phrase:
                if (input == '\r') {
                    resp_->set_reason_phrase(tempString1_);
                    tempString1_.clear();
                    state_ = expecting_newline_1;
                    return boost::indeterminate;
                }
                else if (is_ctl(input) && input != '\t') {
                    return false;
                }
                tempString1_.push_back(input);
                return boost::indeterminate;
            case expecting_newline_1:
                if (input == '\n') {
                    state_ = header_line_start;
                    return boost::indeterminate;
                }
                return false;
            case header_line_start:
                if (input == '\r') {
                    state_ = expecting_newline_3;
                    return boost::indeterminate;
                }
                else if (!is_char(input) || is_ctl(input) || is_tspecial(input)) {
                    // obsolete line folding is rejected as well
                    return false;
                }
                tempString1_.clear();
                tempString1_.push_back(input);
                state_ = header_name;
                return boost::indeterminate;
            case header_name:
                if (input == ':') {
                    tempString2_.clear();
                    state_ = space_before_header_value;
                    return boost::indeterminate;
                }
                else if (!is_char(input) || is_ctl(input) || is_tspecial(input)) {
                    return false;
                }
                tempString1_.push_back(input);
                return boost::indeterminate;
            case space_before_header_value:
                if (input == ' ' || input == '\t') {
                    return boost::indeterminate;
                }
                state_ = header_value;
                [[fallthrough]];
            case header_value:
                if (input == '\r') {
                    resp_->process_header(tempString1_, tempString2_);
                    state_ = expecting_newline_2;
                    return boost::indeterminate;
                }
                else if (is_ctl(input) && input != '\t') {
                    return false;
                }
                tempString2_.push_back(input);
                return boost::indeterminate;
            case expecting_newline_2:
                if (input == '\n') {
                    state_ = header_line_start;
                    return boost::indeterminate;
                }
                return false;
            case expecting_newline_3:
                if (input == '\n') {
                    on_head_completed(head_request);
                    return true;
                }
                return false;
            default:
                return false;
        }
    }

    void response_parser::on_head_completed(bool head_request) {
        head_completed_ = true;
        tempString1_.clear();
        tempString2_.clear();

        if (!resp_->has_body(head_request)) {
            framing_ = body_framing::none;
        }
        else if (resp_->is_chunked()) {
            framing_ = body_framing::chunked;
            chunk_state_ = chunk_size;
            tempInt_ = 0;
            chunk_digits_ = 0;
        }
        else if (resp_->has_content_length()) {
            framing_ = body_framing::length_delimited;
            remaining_ = resp_->get_content_length();
        }
        else {
            framing_ = body_framing::until_close;
        }

        body_completed_ = framing_ == body_framing::none ||
                          (framing_ == body_framing::length_delimited && remaining_ == 0);
    }

    boost::tribool response_parser::decode_body(const uint8_t*& in, const uint8_t* in_end, uint8_t*& out, uint8_t* out_end) {
        if (body_completed_) return true;

        switch (framing_) {
            case body_framing::none:
                return true;
            case body_framing::until_close: {
                auto size = static_cast<std::size_t>(std::min(in_end - in, out_end - out));
                std::memcpy(out, in, size);
                in += size;
                out += size;
                return boost::indeterminate;
            }
            case body_framing::length_delimited: {
                auto available = static_cast<std::uint64_t>(std::min(in_end - in, out_end - out));
                auto size = static_cast<std::size_t>(std::min(available, remaining_));
                std::memcpy(out, in, size);
                in += size;
                out += size;
                remaining_ -= size;
                if (remaining_ == 0) {
                    body_completed_ = true;
                    return true;
                }
                return boost::indeterminate;
            }
            case body_framing::chunked:
                break;
        }

        while (in != in_end) {
            char input = static_cast<char>(*in);
            switch (chunk_state_) {
                case chunk_size: {
                    int value = get_hex_value(input);
                    if (value >= 0) {
                        // 16 hex digits already fill an uint64
                        if (++chunk_digits_ > 16) return false;
                        tempInt_ = (tempInt_ << 4) | static_cast<std::uint64_t>(value);
                        ++in;
                        continue;
                    }
                    if (chunk_digits_ == 0) return false;
                    if (input == '\r') {
                        chunk_state_ = chunk_size_expecting_n;
                    }
                    else if (input == ';' || input == ' ' || input == '\t') {
                        chunk_state_ = chunk_extension;
                    }
                    else {
                        return false;
                    }
                    ++in;
                    continue;
                }
                case chunk_extension:
                    if (input == '\r') {
                        chunk_state_ = chunk_size_expecting_n;
                    }
                    ++in;
                    continue;
                case chunk_size_expecting_n:
                    if (input != '\n') return false;
                    ++in;
                    remaining_ = tempInt_;
                    tempInt_ = 0;
                    chunk_digits_ = 0;
                    chunk_state_ = remaining_ == 0 ? trailer_line_start : chunk_data;
                    continue;
                case chunk_data: {
                    if (out == out_end) return boost::indeterminate;
                    auto available = static_cast<std::uint64_t>(std::min(in_end - in, out_end - out));
                    auto size = static_cast<std::size_t>(std::min(available, remaining_));
                    std::memcpy(out, in, size);
                    in += size;
                    out += size;
                    remaining_ -= size;
                    if (remaining_ == 0) chunk_state_ = chunk_data_expecting_r;
                    continue;
                }
                case chunk_data_expecting_r:
                    if (input != '\r') return false;
                    ++in;
                    chunk_state_ = chunk_data_expecting_n;
                    continue;
                case chunk_data_expecting_n:
                    if (input != '\n') return false;
                    ++in;
                    chunk_state_ = chunk_size;
                    continue;
                case trailer_line_start:
                    ++in;
                    chunk_state_ = input == '\r' ? trailer_end_expecting_n : trailer_line;
                    continue;
                case trailer_line:
                    if (input == '\r') {
                        chunk_state_ = trailer_line_expecting_n;
                    }
                    ++in;
                    continue;
                case trailer_line_expecting_n:
                    if (input != '\n') return false;
                    ++in;
                    chunk_state_ = trailer_line_start;
                    continue;
                case trailer_end_expecting_n:
                    if (input != '\n') return false;
                    ++in;
                    body_completed_ = true;
                    return true;
            }
        }
        return boost::indeterminate;
    }

    void response_parser::reset() {
        resp_.reset();
        tempString1_.clear();
        tempString2_.clear();
        tempInt_ = 0;
        headers_size_ = 0;
        remaining_ = 0;
        chunk_digits_ = 0;
        head_completed_ = false;
        body_completed_ = false;
        framing_ = body_framing::none;
        state_ = http_version_h;
        chunk_state_ = chunk_size;
    }

    bool response_parser::is_char(int c) {
        return c >= 0 && c <= 127;
    }

    bool response_parser::is_ctl(int c) {
        return (c >= 0 && c <= 31) || (c == 127);
    }

    bool response_parser::is_tspecial(int c) {
        switch (c) {
            case '(':
            case ')':
            case '<':
            case '>':
            case '@':
            case ',':
            case ';':
            case ':':
            case '\\':
            case '"':
            case '/':
            case '[':
            case ']':
            case '?':
            case '=':
            case '{':
            case '}':
            case ' ':
            case '\t':
                return true;
            default:
                return false;
        }
    }

    bool response_parser::is_digit(int c) {
        return c >= '0' && c <= '9';
    }

    int response_parser::get_hex_value(int c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

}
