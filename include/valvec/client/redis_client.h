#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include <valvec/client/connection_options.h>
#include <valvec/client/valkey_client.h>
#include <valvec/core/async_mutex.h>
#include <valvec/core/types.h>

namespace valvec::client {

/**
 * ValkeyClient over a redis-plus-plus connection pool.
 *
 * redis-plus-plus calls block, so each command runs on a private thread pool sized like the
 * connection pool and resumes the caller on its own executor. A connection that fails or times
 * out is discarded by the pool; the next command first re-establishes connectivity following
 * ConnectionOptions::reconnect (one PING attempt plus numRetries retries, sleeping
 * delayFor(attempt) between them). Commands that fail mid-flight are not retried.
 */
class RedisClient final : public ValkeyClient, public std::enable_shared_from_this<RedisClient> {
public:
    // Connects eagerly. TLS requests fail with NotSupported.
    static boost::asio::awaitable<Result<std::shared_ptr<ValkeyClient>>>
    create(ConnectionOptions opts);

    ~RedisClient() override;

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    boost::asio::awaitable<Result<Reply>> command(std::vector<std::string> args) override;
    boost::asio::awaitable<Result<void>> close() override;
    bool isConnected() const noexcept override;

    const ConnectionOptions& options() const noexcept { return opts_; }

private:
    struct Impl; // hides redis-plus-plus and hiredis headers

    explicit RedisClient(ConnectionOptions opts);

    Result<void> open();
    boost::asio::awaitable<Result<void>> connectWithBackoff();
    boost::asio::awaitable<Result<Reply>> runBlocking(std::vector<std::string> args);
    Result<Reply> execute(const std::vector<std::string>& args);

    ConnectionOptions opts_;
    boost::asio::any_io_executor executor_;
    core::AsyncMutex reconnectMutex_;
    std::unique_ptr<Impl> impl_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> closed_{false};
};

} // namespace valvec::client
