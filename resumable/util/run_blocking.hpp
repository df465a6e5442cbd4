#ifndef RESUMABLE_UTIL_RUN_BLOCKING_HPP
#define RESUMABLE_UTIL_RUN_BLOCKING_HPP

#include <exception>
#include <optional>
#include "types.hpp"

namespace resumable::util {

    /**
     * Run an awaitable to completion on the given io_context, blocking the calling thread.
     * Exceptions thrown by the coroutine are rethrown here. The io_context is restarted
     * afterwards so it can be reused for the next call.
     */
    template<typename T>
    T run_blocking(boost::asio::io_context& io_context, awaitable<T> coro) {
        std::optional<T> result;
        std::exception_ptr error;
        co_spawn(io_context, std::move(coro), [&result, &error](std::exception_ptr e, T value) {
            error = e;
            if (!e) result.emplace(std::move(value));
        });
        io_context.run();
        io_context.restart();
        if (error) {
            std::rethrow_exception(error);
        }
        // io_context stopped before the coroutine finished
        if (!result) {
            throw boost::system::system_error(boost::asio::error::operation_aborted);
        }
        return std::move(*result);
    }

    inline void run_blocking(boost::asio::io_context& io_context, awaitable<void> coro) {
        std::exception_ptr error;
        co_spawn(io_context, std::move(coro), [&error](std::exception_ptr e) {
            error = e;
        });
        io_context.run();
        io_context.restart();
        if (error) {
            std::rethrow_exception(error);
        }
    }

}

#endif
