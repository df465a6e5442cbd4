#ifndef RESUMABLE_HTTP_CLIENT_PHYSICAL_RESPONSE_HPP
#define RESUMABLE_HTTP_CLIENT_PHYSICAL_RESPONSE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <boost/noncopyable.hpp>
#include "../common/http_response.hpp"
#include "../../util/types.hpp"

namespace resumable::http {

    /**
     * One HTTP response as delivered by a transport: a head that is already available and
     * a body that is pulled incrementally. Exactly one consumer reads it.
     */
    class physical_response : private boost::noncopyable {
    public:
        explicit physical_response(std::shared_ptr<http_response> head)
            : head_(std::move(head)) {}
        virtual ~physical_response() = default;

        const http_response& get_head() const { return *head_; }
        std::shared_ptr<http_response> get_response() const { return head_; }
        int get_status_code() const { return head_->get_status_code(); }

        /// Read the next body bytes into buffer. Returns 0 on clean end of body and throws
        /// boost::system::system_error on transport failures.
        virtual awaitable<std::size_t> read_some(uint8_t buffer[], std::size_t max_size) = 0;

        /// Abort any pending read_some, which then fails with operation_aborted.
        virtual void cancel() = 0;

    protected:
        std::shared_ptr<http_response> head_;
    };

}

#endif
