#ifndef RESUMABLE_HTTP_CLIENT_TRANSPORT_HPP
#define RESUMABLE_HTTP_CLIENT_TRANSPORT_HPP

#include <memory>
#include "endpoint.hpp"
#include "physical_response.hpp"
#include "../../util/types.hpp"

namespace resumable::http {

    /**
     * Anything able to turn an endpoint into a physical response. Connection handling,
     * TLS, redirects and pooling live behind this interface.
     */
    class transport {
    public:
        virtual ~transport() = default;

        /// Issue the endpoint request, adding extra_headers to the ones it already carries.
        /// Completes once the response head is available (any status code), and throws
        /// boost::system::system_error if no response could be obtained.
        virtual awaitable<std::unique_ptr<physical_response>> issue(const endpoint& target,
                                                                    const headers_map& extra_headers = {}) = 0;
    };

}

#endif
