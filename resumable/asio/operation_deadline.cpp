#include "operation_deadline.hpp"

namespace resumable::asio {

operation_deadline::operation_deadline(boost::asio::io_context& io_context,
                                       std::chrono::seconds timeout,
                                       std::function<void()> on_expire)
    : state_(std::make_shared<state>())
    , timer_(io_context) {
    if (timeout.count() <= 0) {
        return;
    }
    timer_.expires_after(timeout);
    timer_.async_wait([st = state_, on_expire = std::move(on_expire)](const boost::system::error_code& ec) {
        if (ec || !st->active) return;
        st->expired = true;
        if (on_expire) on_expire();
    });
}

operation_deadline::~operation_deadline() {
    state_->active = false;
    timer_.cancel();
}

}
