#ifndef RESUMABLE_ASIO_OPERATION_DEADLINE_HPP
#define RESUMABLE_ASIO_OPERATION_DEADLINE_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace resumable::asio {

/**
 * Scoped watchdog for a single asynchronous operation. If the operation is still pending
 * when the timeout elapses, on_expire is invoked (usually cancelling the socket) and
 * expired() reports true, so the caller can translate operation_aborted into timed_out.
 * A zero timeout disables the watchdog.
 */
class operation_deadline : private boost::asio::noncopyable {
public:
    operation_deadline(boost::asio::io_context& io_context,
                       std::chrono::seconds timeout,
                       std::function<void()> on_expire);
    ~operation_deadline();

    bool expired() const { return state_->expired; }

private:
    struct state {
        bool active = true;
        bool expired = false;
    };
    // shared with the timer handler, which may run after this object is gone
    std::shared_ptr<state> state_;
    boost::asio::steady_timer timer_;
};

}

#endif
