#ifndef RESUMABLE_HTTP_CLIENT_RANGE_CAPABILITY_HPP
#define RESUMABLE_HTTP_CLIENT_RANGE_CAPABILITY_HPP

#include <cstdint>
#include <string>
#include "../common/headers.hpp"

namespace resumable::http {

    /// True if any Accept-Ranges header lists the "bytes" range unit (case-insensitive).
    /// A missing header, "none" or other units only mean the server cannot serve ranges.
    bool accepts_byte_ranges(const headers& response_headers);

    /// Range header value requesting everything from offset to the end: "bytes=<offset>-"
    std::string byte_range_from(std::uint64_t offset);

}

#endif
