#include "range_capability.hpp"
#include <vector>
#include <boost/algorithm/string.hpp>

namespace resumable::http {

    bool accepts_byte_ranges(const headers& response_headers) {
        for (const auto& value : response_headers.get_headers_with_key(header::accept_ranges)) {
            std::vector<std::string> units;
            boost::split(units, value, boost::is_any_of(","));
            for (auto& unit : units) {
                boost::algorithm::trim(unit);
                if (boost::iequals(unit, "bytes")) {
                    return true;
                }
            }
        }
        return false;
    }

    std::string byte_range_from(std::uint64_t offset) {
        return "bytes=" + std::to_string(offset) + "-";
    }

}
