#include <algorithm>
#include <memory>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

#include <valvec/client/global_io_context.h>

namespace valvec::client {

using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

GlobalIOContext& GlobalIOContext::instance() {
    // Constructed on first call, avoiding static initialization order issues
    static GlobalIOContext instance;
    return instance;
}

boost::asio::io_context& GlobalIOContext::get_io_context() {
    ensure_initialized();
    return *io_context_;
}

void GlobalIOContext::ensure_initialized() {
    std::call_once(init_flag_, [this]() {
        io_context_ = std::make_unique<boost::asio::io_context>();
        work_guard_ = std::make_unique<WorkGuard>(io_context_->get_executor());

        unsigned int thread_count = std::thread::hardware_concurrency();
        if (thread_count == 0)
            thread_count = 4;
        thread_count = std::min(thread_count, 16u);

        io_threads_.reserve(thread_count);
        try {
            for (unsigned int i = 0; i < thread_count; ++i) {
                io_threads_.emplace_back([this]() {
                    try {
                        io_context_->run();
                    } catch (const std::exception& e) {
                        spdlog::error("GlobalIOContext worker exited with exception: {}", e.what());
                    }
                });
            }
        } catch (const std::system_error& e) {
            spdlog::error("GlobalIOContext failed to start worker threads: {}", e.what());
            // Stop io_context first to wake any waiting threads
            io_context_->stop();
            for (auto& worker : io_threads_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
            work_guard_.reset();
            io_threads_.clear();
            throw;
        }
        spdlog::debug("GlobalIOContext started {} worker threads", thread_count);
    });
}

GlobalIOContext::GlobalIOContext() {
    // Actual initialization deferred to ensure_initialized()
}

GlobalIOContext::~GlobalIOContext() noexcept {
    if (work_guard_) {
        work_guard_->reset();
        work_guard_.reset();
    }
    if (io_context_) {
        io_context_->stop();
    }
    for (auto& t : io_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

} // namespace valvec::client
