#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <boost/asio/any_io_executor.hpp>

#include <valvec/core/types.h>

namespace valvec::client {

// Bounded exponential reconnect policy: attempt N (0-based) waits factor * exponentBase^N
struct ReconnectStrategy {
    uint32_t numRetries{3};
    std::chrono::milliseconds factor{1000};
    uint32_t exponentBase{2};

    std::chrono::milliseconds delayFor(uint32_t attempt) const {
        std::chrono::milliseconds::rep mult = 1;
        for (uint32_t i = 0; i < attempt; ++i) {
            mult *= exponentBase;
        }
        return factor * mult;
    }
};

struct ConnectionOptions {
    std::string host{DEFAULT_HOST};
    uint16_t port{DEFAULT_PORT};
    bool useTls{false};
    std::chrono::milliseconds requestTimeout{5000};
    // Pooled connections, and threads running their blocking calls
    std::size_t poolSize{4};
    ReconnectStrategy reconnect;
    std::optional<boost::asio::any_io_executor> executor;
};

} // namespace valvec::client
