#include <valvec/client/redis_client.h>

#include <mutex>
#include <optional>
#include <shared_mutex>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <hiredis/hiredis.h>
#include <spdlog/spdlog.h>
#include <sw/redis++/redis++.h>

#include <valvec/client/global_io_context.h>
#include <valvec/core/format.h>

namespace valvec::client {

using boost::asio::awaitable;
using boost::asio::use_awaitable;

namespace {

boost::asio::any_io_executor resolveExecutor(const ConnectionOptions& opts) {
    return opts.executor ? *opts.executor : GlobalIOContext::global_executor();
}

Reply fromRedisReply(const redisReply& r) {
    switch (r.type) {
        case REDIS_REPLY_STRING:
        case REDIS_REPLY_VERB:
        case REDIS_REPLY_BIGNUM:
            return Reply::makeString(std::string(r.str, r.len));
        case REDIS_REPLY_STATUS:
            return Reply::makeStatus(std::string(r.str, r.len));
        case REDIS_REPLY_ERROR:
            return Reply::makeError(std::string(r.str, r.len));
        case REDIS_REPLY_INTEGER:
            return Reply::makeInteger(static_cast<int64_t>(r.integer));
        case REDIS_REPLY_DOUBLE:
            return Reply::makeDouble(r.dval);
        case REDIS_REPLY_BOOL:
            return Reply::makeBoolean(r.integer != 0);
        case REDIS_REPLY_ARRAY:
        case REDIS_REPLY_SET:
        case REDIS_REPLY_PUSH:
        case REDIS_REPLY_MAP: {
            Reply out;
            out.type = r.type == REDIS_REPLY_MAP ? ReplyType::Map : ReplyType::Array;
            out.elements.reserve(r.elements);
            for (std::size_t i = 0; i < r.elements; ++i) {
                if (r.element[i]) {
                    out.elements.push_back(fromRedisReply(*r.element[i]));
                } else {
                    out.elements.push_back(Reply::makeNil());
                }
            }
            return out;
        }
        default:
            return Reply::makeNil();
    }
}

} // namespace

struct RedisClient::Impl {
    explicit Impl(std::size_t threads) : pool(threads) {}

    std::shared_mutex redisMutex;
    std::unique_ptr<sw::redis::Redis> redis;
    // Declared last so pending blocking calls finish before `redis` is destroyed
    boost::asio::thread_pool pool;
};

RedisClient::RedisClient(ConnectionOptions opts)
    : opts_(std::move(opts)), executor_(resolveExecutor(opts_)), reconnectMutex_(executor_),
      impl_(std::make_unique<Impl>(opts_.poolSize == 0 ? 1 : opts_.poolSize)) {
    opts_.executor = executor_;
}

RedisClient::~RedisClient() = default;

awaitable<Result<std::shared_ptr<ValkeyClient>>> RedisClient::create(ConnectionOptions opts) {
    if (opts.useTls) {
        co_return Error{ErrorCode::NotSupported, "TLS transport is not available in this build"};
    }
    if (opts.host.empty()) {
        co_return Error{ErrorCode::InvalidArgument, "Valkey host must not be empty"};
    }
    std::shared_ptr<RedisClient> client(new RedisClient(std::move(opts)));
    if (auto opened = client->open(); !opened) {
        co_return opened.error();
    }
    auto connected = co_await client->connectWithBackoff();
    if (!connected) {
        co_return connected.error();
    }
    co_return std::shared_ptr<ValkeyClient>(std::move(client));
}

Result<void> RedisClient::open() {
    sw::redis::ConnectionOptions conn;
    conn.type = sw::redis::ConnectionType::TCP;
    conn.host = opts_.host;
    conn.port = opts_.port;
    conn.connect_timeout = opts_.requestTimeout;
    conn.socket_timeout = opts_.requestTimeout;

    sw::redis::ConnectionPoolOptions pool;
    pool.size = opts_.poolSize == 0 ? 1 : opts_.poolSize;
    pool.wait_timeout = opts_.requestTimeout;

    try {
        std::unique_lock<std::shared_mutex> lk(impl_->redisMutex);
        impl_->redis = std::make_unique<sw::redis::Redis>(conn, pool);
    } catch (const sw::redis::Error& e) {
        return Error{ErrorCode::InvalidArgument,
                     valvec::format("Invalid connection options for {}:{}: {}", opts_.host,
                                    opts_.port, e.what())};
    }
    return Result<void>();
}

bool RedisClient::isConnected() const noexcept {
    return !closed_.load() && connected_.load();
}

awaitable<Result<void>> RedisClient::connectWithBackoff() {
    const auto& strategy = opts_.reconnect;
    Error last{ErrorCode::NetworkError, "No connection attempt made"};

    for (uint32_t attempt = 0; attempt <= strategy.numRetries; ++attempt) {
        auto pong = co_await runBlocking({"PING"});
        if (pong && !pong.value().isError()) {
            connected_ = true;
            if (attempt > 0) {
                spdlog::info("[RedisClient] connected to {}:{} after {} retries", opts_.host,
                             opts_.port, attempt);
            }
            co_return Result<void>();
        }
        last = pong ? Error{ErrorCode::ProtocolError, pong.value().str} : pong.error();
        if (last.code == ErrorCode::InvalidState || attempt == strategy.numRetries) {
            break;
        }

        auto delay = strategy.delayFor(attempt);
        spdlog::warn("[RedisClient] connect attempt {} to {}:{} failed: {} (retrying in {}ms)",
                     attempt + 1, opts_.host, opts_.port, last.message, delay.count());
        boost::asio::steady_timer timer(executor_, delay);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(use_awaitable, ec));
        if (closed_) {
            co_return Error{ErrorCode::InvalidState, "Valkey client is closed"};
        }
    }

    spdlog::error("[RedisClient] unable to connect to {}:{}: {}", opts_.host, opts_.port,
                  last.message);
    co_return last;
}

Result<Reply> RedisClient::execute(const std::vector<std::string>& args) {
    std::shared_lock<std::shared_mutex> lk(impl_->redisMutex);
    if (!impl_->redis) {
        return Error{ErrorCode::InvalidState, "Valkey client is closed"};
    }
    try {
        auto reply = impl_->redis->command(args.begin(), args.end());
        if (!reply) {
            return Reply::makeNil();
        }
        return fromRedisReply(*reply);
    } catch (const sw::redis::ReplyError& e) {
        return Reply::makeError(e.what());
    } catch (const sw::redis::TimeoutError& e) {
        connected_ = false;
        return Error{ErrorCode::Timeout,
                     valvec::format("{} timed out after {}ms: {}", args.front(),
                                    opts_.requestTimeout.count(), e.what())};
    } catch (const sw::redis::IoError& e) {
        connected_ = false;
        return Error{ErrorCode::NetworkError, valvec::format("{}: {}", args.front(), e.what())};
    } catch (const sw::redis::ClosedError& e) {
        connected_ = false;
        return Error{ErrorCode::NetworkError, valvec::format("{}: {}", args.front(), e.what())};
    } catch (const sw::redis::ProtoError& e) {
        connected_ = false;
        return Error{ErrorCode::ProtocolError, valvec::format("{}: {}", args.front(), e.what())};
    } catch (const sw::redis::Error& e) {
        return Error{ErrorCode::InternalError, valvec::format("{}: {}", args.front(), e.what())};
    }
}

awaitable<Result<Reply>> RedisClient::runBlocking(std::vector<std::string> args) {
    // Held by the caller's frame so the client is never destroyed on a pool thread
    const auto keepAlive = shared_from_this();
    std::optional<Result<Reply>> out;
    co_await boost::asio::co_spawn(
        impl_->pool,
        [this, &out, args = std::move(args)]() -> awaitable<void> {
            out.emplace(execute(args));
            co_return;
        },
        use_awaitable);
    co_return std::move(*out);
}

awaitable<Result<Reply>> RedisClient::command(std::vector<std::string> args) {
    if (args.empty()) {
        co_return Error{ErrorCode::InvalidArgument, "Empty command"};
    }
    if (closed_) {
        co_return Error{ErrorCode::InvalidState, "Valkey client is closed"};
    }
    if (!connected_) {
        auto guard = co_await reconnectMutex_.lock();
        // Another caller may have reconnected while this one waited
        if (!connected_ && !closed_) {
            auto reconnected = co_await connectWithBackoff();
            if (!reconnected) {
                co_return reconnected.error();
            }
        }
    }
    co_return co_await runBlocking(std::move(args));
}

awaitable<Result<void>> RedisClient::close() {
    if (closed_.exchange(true)) {
        co_return Result<void>();
    }
    connected_ = false;
    const auto keepAlive = shared_from_this();
    co_await boost::asio::co_spawn(
        impl_->pool,
        [this]() -> awaitable<void> {
            // Waits for in-flight commands before dropping the pooled connections
            std::unique_lock<std::shared_mutex> lk(impl_->redisMutex);
            impl_->redis.reset();
            co_return;
        },
        use_awaitable);
    spdlog::debug("[RedisClient] closed connection to {}:{}", opts_.host, opts_.port);
    co_return Result<void>();
}

} // namespace valvec::client
