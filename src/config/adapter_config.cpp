#include <valvec/config/adapter_config.h>

#include <spdlog/spdlog.h>
#include <charconv>
#include <valvec/config/config_helpers.h>
#include <valvec/core/format.h>

namespace valvec::config {

namespace {

Result<uint32_t> parse_u32(const std::string& key, const std::string& raw) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return Error{ErrorCode::InvalidArgument,
                     valvec::format("vector_db.{} must be a non-negative integer, got '{}'", key,
                                    raw)};
    }
    return value;
}

Result<std::chrono::milliseconds> parse_duration(const std::string& key, const std::string& raw) {
    if (auto ms = parse_ms(raw)) {
        return *ms;
    }
    return Error{ErrorCode::InvalidArgument,
                 valvec::format("vector_db.{} must be milliseconds, got '{}'", key, raw)};
}

} // namespace

Result<Endpoint> parseHostPort(std::string_view url) {
    Endpoint ep;

    std::string_view rest = url;
    if (auto scheme = rest.find("://"); scheme != std::string_view::npos) {
        rest.remove_prefix(scheme + 3);
    }
    // Strip path, query and fragment
    if (auto slash = rest.find_first_of("/?#"); slash != std::string_view::npos) {
        rest = rest.substr(0, slash);
    }
    // Strip userinfo
    if (auto at = rest.rfind('@'); at != std::string_view::npos) {
        rest.remove_prefix(at + 1);
    }

    std::string_view host = rest;
    std::string_view port;
    if (!rest.empty() && rest.front() == '[') {
        auto close = rest.find(']');
        if (close == std::string_view::npos) {
            return Error{ErrorCode::InvalidArgument,
                         valvec::format("Unterminated IPv6 literal in URL '{}'", url)};
        }
        host = rest.substr(1, close - 1);
        auto after = rest.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return Error{ErrorCode::InvalidArgument,
                             valvec::format("Unexpected characters after host in '{}'", url)};
            }
            port = after.substr(1);
        }
    } else if (auto colon = rest.rfind(':'); colon != std::string_view::npos) {
        host = rest.substr(0, colon);
        port = rest.substr(colon + 1);
    }

    if (!host.empty()) {
        ep.host = to_lower(host);
    }
    if (!port.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc{} || ptr != port.data() + port.size() || value > 65535) {
            return Error{ErrorCode::InvalidArgument,
                         valvec::format("Invalid port '{}' in URL '{}'", port, url)};
        }
        if (value != 0) {
            ep.port = static_cast<uint16_t>(value);
        }
    }
    return ep;
}

Result<client::ConnectionOptions> AdapterConfig::toConnectionOptions() const {
    auto ep = parseHostPort(url);
    if (!ep) {
        return ep.error();
    }
    client::ConnectionOptions opts;
    opts.host = ep.value().host;
    opts.port = ep.value().port;
    opts.useTls = useTls;
    opts.requestTimeout = requestTimeout;
    opts.poolSize = poolSize;
    opts.reconnect = reconnect;
    opts.executor = executor;
    return opts;
}

Result<void> applyEnvironmentOverrides(AdapterConfig& cfg) {
    if (auto v = env_value("VALVEC_VECTOR_DB_URL")) {
        cfg.url = *v;
    } else if (auto legacy = env_value("VECTOR_DB_URL")) {
        cfg.url = *legacy;
    }
    if (auto v = env_value("VALVEC_VECTOR_DB_PROVIDER")) {
        cfg.provider = to_lower(*v);
    }
    if (auto v = env_value("VALVEC_REQUEST_TIMEOUT_MS")) {
        auto d = parse_duration("request_timeout_ms", *v);
        if (!d) {
            return d.error();
        }
        cfg.requestTimeout = d.value();
    }
    return Result<void>();
}

Result<AdapterConfig> loadAdapterConfig(const std::filesystem::path& configPath) {
    AdapterConfig cfg;
    auto path = configPath.empty() ? get_config_path() : configPath;

    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        spdlog::debug("[AdapterConfig] reading {}", path.string());
        auto get = [&](const char* key) { return parse_config_value(path, "vector_db", key); };

        if (auto v = get("provider"); !v.empty()) {
            cfg.provider = to_lower(v);
        }
        if (auto v = get("url"); !v.empty()) {
            cfg.url = v;
        }
        if (auto v = get("api_key"); !v.empty()) {
            cfg.apiKey = v;
        }
        if (auto v = get("use_tls"); !v.empty()) {
            cfg.useTls = is_truthy(v);
        }
        if (auto v = get("prune_deletes_documents"); !v.empty()) {
            cfg.pruneDeletesDocuments = is_truthy(v);
        }
        if (auto v = get("request_timeout_ms"); !v.empty()) {
            auto d = parse_duration("request_timeout_ms", v);
            if (!d) {
                return d.error();
            }
            cfg.requestTimeout = d.value();
        }
        if (auto v = get("pool_size"); !v.empty()) {
            auto n = parse_u32("pool_size", v);
            if (!n) {
                return n.error();
            }
            if (n.value() == 0) {
                return Error{ErrorCode::InvalidArgument, "vector_db.pool_size must be positive"};
            }
            cfg.poolSize = n.value();
        }
        if (auto v = get("reconnect_factor_ms"); !v.empty()) {
            auto d = parse_duration("reconnect_factor_ms", v);
            if (!d) {
                return d.error();
            }
            cfg.reconnect.factor = d.value();
        }
        if (auto v = get("reconnect_retries"); !v.empty()) {
            auto n = parse_u32("reconnect_retries", v);
            if (!n) {
                return n.error();
            }
            cfg.reconnect.numRetries = n.value();
        }
        if (auto v = get("reconnect_exponent_base"); !v.empty()) {
            auto n = parse_u32("reconnect_exponent_base", v);
            if (!n) {
                return n.error();
            }
            cfg.reconnect.exponentBase = n.value();
        }
    } else if (!configPath.empty()) {
        spdlog::warn("[AdapterConfig] config file '{}' not found; using defaults", path.string());
    }

    if (auto r = applyEnvironmentOverrides(cfg); !r) {
        return r.error();
    }
    return cfg;
}

} // namespace valvec::config
