#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <boost/asio/any_io_executor.hpp>

#include <valvec/client/connection_options.h>
#include <valvec/core/types.h>

namespace valvec::config {

struct Endpoint {
    std::string host{DEFAULT_HOST};
    uint16_t port{DEFAULT_PORT};
};

/**
 * Parse "scheme://[user[:pass]@]host[:port][/db]" into host and port.
 * Missing host → "localhost", missing port → 6379. A URL without "://" is read as
 * "host[:port]". Bracketed IPv6 literals are accepted.
 */
Result<Endpoint> parseHostPort(std::string_view url);

/**
 * Settings of one vector database adapter instance.
 */
struct AdapterConfig {
    std::string provider{"valkey"};
    std::string url{"valkey://localhost:6379"};
    std::optional<std::string> apiKey; // accepted for interface parity, unused by Valkey
    bool useTls{false};
    std::chrono::milliseconds requestTimeout{5000};
    std::size_t poolSize{4};
    client::ReconnectStrategy reconnect;
    bool pruneDeletesDocuments{true};
    std::optional<boost::asio::any_io_executor> executor;

    Result<client::ConnectionOptions> toConnectionOptions() const;
};

/**
 * Load [vector_db] from the config file (see get_config_path), then apply env overrides.
 * A missing file yields defaults; malformed numeric values are reported as InvalidArgument.
 */
Result<AdapterConfig> loadAdapterConfig(const std::filesystem::path& configPath = {});

// VALVEC_VECTOR_DB_URL (or VECTOR_DB_URL), VALVEC_REQUEST_TIMEOUT_MS, VALVEC_VECTOR_DB_PROVIDER
Result<void> applyEnvironmentOverrides(AdapterConfig& cfg);

} // namespace valvec::config
