#ifndef RESUMABLE_TYPES
#define RESUMABLE_TYPES

#include <cstddef>
#include <tuple>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

namespace resumable {

    // Awaitable type alias
    template<typename T = void>
    using awaitable = boost::asio::awaitable<T>;

    // Import commonly used awaitable utilities
    using boost::asio::use_awaitable;
    using boost::asio::co_spawn;
    using boost::asio::detached;

    // Result of a socket operation: error (if any) and bytes transferred
    using io_result = std::tuple<boost::system::error_code, std::size_t>;

}

#endif
