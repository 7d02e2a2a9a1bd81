#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <valvec/core/types.h>

namespace valvec::core {

namespace detail {

template <typename R> struct GatherState {
    GatherState(boost::asio::any_io_executor ex, std::size_t count)
        : strand(boost::asio::make_strand(ex)),
          notify(strand, boost::asio::steady_timer::time_point::max()), remaining(count),
          results(count) {}

    boost::asio::strand<boost::asio::any_io_executor> strand;
    boost::asio::steady_timer notify;
    std::size_t remaining;
    std::vector<std::optional<R>> results;
};

template <typename T>
boost::asio::awaitable<Result<T>> guarded(boost::asio::awaitable<Result<T>> task) {
    try {
        co_return co_await std::move(task);
    } catch (const std::exception& e) {
        co_return Error{ErrorCode::InternalError, e.what()};
    }
}

// Spawns every task on the current executor and resumes once all of them completed.
template <typename T>
boost::asio::awaitable<std::vector<std::optional<Result<T>>>>
runAll(std::vector<boost::asio::awaitable<Result<T>>> tasks) {
    using boost::asio::use_awaitable;

    if (tasks.empty()) {
        co_return std::vector<std::optional<Result<T>>>{};
    }

    auto ex = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<GatherState<Result<T>>>(ex, tasks.size());

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        boost::asio::co_spawn(
            ex,
            [state, i, task = std::move(tasks[i])]() mutable -> boost::asio::awaitable<void> {
                auto r = co_await guarded<T>(std::move(task));
                co_await boost::asio::dispatch(state->strand, use_awaitable);
                state->results[i].emplace(std::move(r));
                if (--state->remaining == 0) {
                    state->notify.cancel();
                }
            },
            boost::asio::detached);
    }

    co_await boost::asio::dispatch(state->strand, use_awaitable);
    while (state->remaining > 0) {
        boost::system::error_code ec;
        co_await state->notify.async_wait(boost::asio::redirect_error(use_awaitable, ec));
        co_await boost::asio::dispatch(state->strand, use_awaitable);
    }
    co_return std::move(state->results);
}

} // namespace detail

// Fan-out/fan-in: runs all tasks concurrently and joins them. The first failure (in input
// order) fails the whole batch; otherwise values are returned positionally.
template <typename T>
boost::asio::awaitable<Result<std::vector<T>>>
gatherAll(std::vector<boost::asio::awaitable<Result<T>>> tasks) {
    auto results = co_await detail::runAll<T>(std::move(tasks));
    std::vector<T> values;
    values.reserve(results.size());
    for (auto& r : results) {
        if (!r || !r->has_value()) {
            co_return r ? r->error() : Error{ErrorCode::InternalError, "task did not complete"};
        }
        values.push_back(std::move(*r).value());
    }
    co_return values;
}

inline boost::asio::awaitable<Result<void>>
gatherAll(std::vector<boost::asio::awaitable<Result<void>>> tasks) {
    auto results = co_await detail::runAll<void>(std::move(tasks));
    for (auto& r : results) {
        if (!r) {
            co_return Error{ErrorCode::InternalError, "task did not complete"};
        }
        if (!r->has_value()) {
            co_return r->error();
        }
    }
    co_return Result<void>();
}

} // namespace valvec::core
