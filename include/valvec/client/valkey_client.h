#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include <valvec/client/connection_options.h>
#include <valvec/client/reply.h>
#include <valvec/core/types.h>

namespace valvec::client {

/**
 * Connection handle to a Valkey server. Implementations are safe to share between
 * concurrent coroutines.
 */
class ValkeyClient {
public:
    virtual ~ValkeyClient() = default;

    // Sends one command. Server error replies come back as ReplyType::Error values so callers
    // can decide whether an error reply means "absent" or "failed". Transport failures are
    // NetworkError or Timeout; commands after close() fail with InvalidState.
    virtual boost::asio::awaitable<Result<Reply>> command(std::vector<std::string> args) = 0;

    // Closes the handle. Closing twice is harmless.
    virtual boost::asio::awaitable<Result<void>> close() = 0;

    virtual bool isConnected() const noexcept = 0;
};

// Opens a connected handle for the given options
using ClientFactory = std::function<boost::asio::awaitable<Result<std::shared_ptr<ValkeyClient>>>(
    ConnectionOptions)>;

} // namespace valvec::client
