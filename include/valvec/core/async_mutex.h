#pragma once

#include <deque>
#include <memory>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace valvec::core {

// Coroutine-friendly mutex. Waiters park on a steady_timer owned by the mutex strand and are
// woken in FIFO order when the holder releases its Guard. Never blocks an io thread.
class AsyncMutex {
public:
    class Guard {
    public:
        Guard() = default;
        explicit Guard(AsyncMutex* mutex) : mutex_(mutex) {}
        Guard(Guard&& other) noexcept : mutex_(std::exchange(other.mutex_, nullptr)) {}
        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                release();
                mutex_ = std::exchange(other.mutex_, nullptr);
            }
            return *this;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard() { release(); }

        void release() noexcept {
            if (mutex_) {
                mutex_->unlock();
                mutex_ = nullptr;
            }
        }

        bool owns_lock() const noexcept { return mutex_ != nullptr; }

    private:
        AsyncMutex* mutex_{nullptr};
    };

    explicit AsyncMutex(boost::asio::any_io_executor executor);

    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    boost::asio::awaitable<Guard> lock();

private:
    struct Waiter {
        explicit Waiter(const boost::asio::strand<boost::asio::any_io_executor>& s)
            : timer(s, boost::asio::steady_timer::time_point::max()) {}
        boost::asio::steady_timer timer;
        bool granted{false};
    };

    // Shared with pending unlock handlers so they never outlive the lock state
    struct State {
        explicit State(boost::asio::any_io_executor executor)
            : strand(boost::asio::make_strand(std::move(executor))) {}
        boost::asio::strand<boost::asio::any_io_executor> strand;
        bool locked{false};
        std::deque<std::shared_ptr<Waiter>> waiters;
    };

    void unlock() noexcept;

    std::shared_ptr<State> state_;
};

} // namespace valvec::core
