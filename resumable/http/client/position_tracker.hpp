#ifndef RESUMABLE_HTTP_CLIENT_POSITION_TRACKER_HPP
#define RESUMABLE_HTTP_CLIENT_POSITION_TRACKER_HPP

#include <cstdint>

namespace resumable::http {

    /// Number of body bytes handed to the consumer of a logical download. It only grows.
    class position_tracker {
    public:
        void advance(std::uint64_t bytes) { position_ += bytes; }
        std::uint64_t current() const { return position_; }

    private:
        std::uint64_t position_ = 0;
    };

}

#endif
