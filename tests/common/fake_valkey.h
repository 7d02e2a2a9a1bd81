// In-memory Valkey stand-in for unit tests. Implements the subset of valkey-search and
// valkey-json used by the adapter (brute-force cosine KNN) behind client::ValkeyClient.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <valvec/client/valkey_client.h>
#include <valvec/core/types.h>

namespace valvec::test {

class FakeValkey : public std::enable_shared_from_this<FakeValkey> {
public:
    static std::shared_ptr<FakeValkey> make() { return std::shared_ptr<FakeValkey>(new FakeValkey); }

    FakeValkey(const FakeValkey&) = delete;
    FakeValkey& operator=(const FakeValkey&) = delete;

    // Opens FakeValkeyClient handles on this store; fails with NetworkError while unreachable
    client::ClientFactory factory();
    std::size_t clientsCreated() const noexcept { return created_.load(); }
    void setReachable(bool reachable) noexcept { reachable_ = reachable; }
    bool reachable() const noexcept { return reachable_.load(); }

    // Number of times a command (upper-case name, e.g. "FT.CREATE") was received
    std::size_t commandCount(const std::string& name) const;
    std::size_t totalCommands() const;
    void resetCounters();

    // Answer the next `command` with an error reply
    void failNext(const std::string& command, std::string message);
    // Fail the next `command` in transport with `code` (NetworkError, Timeout)
    void failTransport(const std::string& command, ErrorCode code);
    // Hold the reply to the next `command` for `delay`
    void delayNext(const std::string& command, std::chrono::milliseconds delay);

    bool hasKey(const std::string& key) const;
    std::optional<std::string> document(const std::string& key) const;
    // Store raw document text as-is (may be malformed)
    void putDocument(const std::string& key, std::string json);
    std::vector<std::string> indexNames() const;

    std::optional<std::chrono::milliseconds> takeDelay(const std::string& command);
    std::optional<ErrorCode> takeTransportFailure(const std::string& command);
    client::Reply dispatch(const std::vector<std::string>& args);

private:
    FakeValkey() = default;

    struct Index {
        std::string prefix;
        std::size_t dimension{0};
    };

    client::Reply ftCreate(const std::vector<std::string>& args);
    client::Reply ftInfo(const std::vector<std::string>& args);
    client::Reply ftList();
    client::Reply ftDropIndex(const std::vector<std::string>& args);
    client::Reply ftSearch(const std::vector<std::string>& args);
    client::Reply jsonSet(const std::vector<std::string>& args);
    client::Reply jsonGet(const std::vector<std::string>& args);
    client::Reply del(const std::vector<std::string>& args);
    client::Reply scan(const std::vector<std::string>& args);

    std::atomic<std::size_t> created_{0};
    std::atomic<bool> reachable_{true};

    mutable std::mutex mutex_;
    std::map<std::string, std::size_t> counters_;
    std::map<std::string, std::deque<std::string>> failures_;
    std::map<std::string, std::deque<ErrorCode>> transportFailures_;
    std::map<std::string, std::deque<std::chrono::milliseconds>> delays_;
    std::map<std::string, Index> indexes_;
    std::map<std::string, std::string> documents_;
};

class FakeValkeyClient : public client::ValkeyClient {
public:
    FakeValkeyClient(std::shared_ptr<FakeValkey> store, client::ConnectionOptions opts);

    boost::asio::awaitable<Result<client::Reply>> command(std::vector<std::string> args) override;
    boost::asio::awaitable<Result<void>> close() override;
    bool isConnected() const noexcept override { return !closed_.load(); }

private:
    std::shared_ptr<FakeValkey> store_;
    client::ConnectionOptions opts_;
    std::atomic<bool> closed_{false};
};

} // namespace valvec::test
