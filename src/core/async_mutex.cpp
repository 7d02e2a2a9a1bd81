#include <valvec/core/async_mutex.h>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace valvec::core {

using boost::asio::use_awaitable;

AsyncMutex::AsyncMutex(boost::asio::any_io_executor executor)
    : state_(std::make_shared<State>(std::move(executor))) {}

boost::asio::awaitable<AsyncMutex::Guard> AsyncMutex::lock() {
    auto state = state_;
    co_await boost::asio::dispatch(state->strand, use_awaitable);
    if (!state->locked) {
        state->locked = true;
        co_return Guard(this);
    }

    auto waiter = std::make_shared<Waiter>(state->strand);
    state->waiters.push_back(waiter);
    while (!waiter->granted) {
        boost::system::error_code ec;
        co_await waiter->timer.async_wait(boost::asio::redirect_error(use_awaitable, ec));
        // Re-enter the strand before reading the grant flag
        co_await boost::asio::dispatch(state->strand, use_awaitable);
    }
    co_return Guard(this);
}

void AsyncMutex::unlock() noexcept {
    boost::asio::dispatch(state_->strand, [state = state_]() {
        if (state->waiters.empty()) {
            state->locked = false;
            return;
        }
        // Ownership passes directly to the oldest waiter; locked stays true
        auto next = std::move(state->waiters.front());
        state->waiters.pop_front();
        next->granted = true;
        next->timer.cancel();
    });
}

} // namespace valvec::core
