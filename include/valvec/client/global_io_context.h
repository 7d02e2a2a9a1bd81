#pragma once

#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace valvec::client {

// Process-wide io_context serving every client that is not given an explicit executor
class GlobalIOContext {
public:
    static GlobalIOContext& instance();

    boost::asio::io_context& get_io_context();

    static boost::asio::any_io_executor global_executor() {
        return instance().get_io_context().get_executor();
    }

    GlobalIOContext(const GlobalIOContext&) = delete;
    GlobalIOContext& operator=(const GlobalIOContext&) = delete;

private:
    GlobalIOContext();
    ~GlobalIOContext() noexcept;

    std::unique_ptr<boost::asio::io_context> io_context_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_guard_;
    std::vector<std::thread> io_threads_;
    std::once_flag init_flag_;

    void ensure_initialized();
};

} // namespace valvec::client
