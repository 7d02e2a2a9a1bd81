#include "fake_valkey.h"

#include <algorithm>
#include <bit>
#include <cctype>
#include <cmath>
#include <regex>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>

#include <valvec/core/format.h>

namespace valvec::test {

using boost::asio::awaitable;
using boost::asio::use_awaitable;
using client::Reply;

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Glob match supporting '*', '?' and backslash escapes
bool globMatch(std::string_view pattern, std::string_view text) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t starP = std::string_view::npos;
    std::size_t starT = 0;
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starT = t;
            continue;
        }
        if (p < pattern.size()) {
            char pc = pattern[p];
            std::size_t width = 1;
            if (pc == '\\' && p + 1 < pattern.size()) {
                pc = pattern[p + 1];
                width = 2;
            } else if (pc == '?') {
                p += 1;
                ++t;
                continue;
            }
            if (pc == text[t]) {
                p += width;
                ++t;
                continue;
            }
        }
        if (starP == std::string_view::npos) {
            return false;
        }
        p = starP + 1;
        t = ++starT;
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

float cosineDistance(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 1.0f;
    }
    double dot = 0;
    double na = 0;
    double nb = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na == 0 || nb == 0) {
        return 1.0f;
    }
    return static_cast<float>(1.0 - dot / (std::sqrt(na) * std::sqrt(nb)));
}

std::string fieldText(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

Reply ok() {
    return Reply::makeStatus("OK");
}

Reply wrongArity(const std::string& command) {
    return Reply::makeError("ERR wrong number of arguments for '" + command + "' command");
}

// Little-endian float32 blob back to floats
std::optional<std::vector<float>> unpackFloat32(const std::string& bytes) {
    if (bytes.size() % sizeof(float) != 0) {
        return std::nullopt;
    }
    std::vector<float> out(bytes.size() / sizeof(float));
    for (std::size_t i = 0; i < out.size(); ++i) {
        uint32_t bits = 0;
        for (std::size_t b = 0; b < sizeof(float); ++b) {
            bits |= static_cast<uint32_t>(static_cast<unsigned char>(bytes[i * sizeof(float) + b]))
                    << (8 * b);
        }
        out[i] = std::bit_cast<float>(bits);
    }
    return out;
}

} // namespace

client::ClientFactory FakeValkey::factory() {
    auto self = shared_from_this();
    return [self](client::ConnectionOptions opts)
               -> awaitable<Result<std::shared_ptr<client::ValkeyClient>>> {
        if (!self->reachable()) {
            co_return Error{ErrorCode::NetworkError,
                            valvec::format("Connection refused: {}:{}", opts.host, opts.port)};
        }
        self->created_.fetch_add(1);
        co_return std::shared_ptr<client::ValkeyClient>(
            std::make_shared<FakeValkeyClient>(self, std::move(opts)));
    };
}

std::size_t FakeValkey::commandCount(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = counters_.find(upper(name));
    return it == counters_.end() ? 0 : it->second;
}

std::size_t FakeValkey::totalCommands() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::size_t total = 0;
    for (const auto& [name, n] : counters_) {
        total += n;
    }
    return total;
}

void FakeValkey::resetCounters() {
    std::lock_guard<std::mutex> lk(mutex_);
    counters_.clear();
}

void FakeValkey::failNext(const std::string& command, std::string message) {
    std::lock_guard<std::mutex> lk(mutex_);
    failures_[upper(command)].push_back(std::move(message));
}

void FakeValkey::failTransport(const std::string& command, ErrorCode code) {
    std::lock_guard<std::mutex> lk(mutex_);
    transportFailures_[upper(command)].push_back(code);
}

void FakeValkey::delayNext(const std::string& command, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lk(mutex_);
    delays_[upper(command)].push_back(delay);
}

bool FakeValkey::hasKey(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return documents_.count(key) > 0;
}

std::optional<std::string> FakeValkey::document(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = documents_.find(key);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void FakeValkey::putDocument(const std::string& key, std::string json) {
    std::lock_guard<std::mutex> lk(mutex_);
    documents_[key] = std::move(json);
}

std::vector<std::string> FakeValkey::indexNames() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, idx] : indexes_) {
        names.push_back(name);
    }
    return names;
}

std::optional<std::chrono::milliseconds> FakeValkey::takeDelay(const std::string& command) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = delays_.find(upper(command));
    if (it == delays_.end() || it->second.empty()) {
        return std::nullopt;
    }
    auto d = it->second.front();
    it->second.pop_front();
    return d;
}

std::optional<ErrorCode> FakeValkey::takeTransportFailure(const std::string& command) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = transportFailures_.find(upper(command));
    if (it == transportFailures_.end() || it->second.empty()) {
        return std::nullopt;
    }
    auto code = it->second.front();
    it->second.pop_front();
    return code;
}

Reply FakeValkey::dispatch(const std::vector<std::string>& args) {
    const auto name = upper(args.front());
    std::lock_guard<std::mutex> lk(mutex_);
    ++counters_[name];

    if (auto it = failures_.find(name); it != failures_.end() && !it->second.empty()) {
        auto msg = std::move(it->second.front());
        it->second.pop_front();
        return Reply::makeError(msg);
    }

    if (name == "PING") {
        return Reply::makeStatus("PONG");
    }
    if (name == "FT.CREATE") {
        return ftCreate(args);
    }
    if (name == "FT.INFO") {
        return ftInfo(args);
    }
    if (name == "FT._LIST") {
        return ftList();
    }
    if (name == "FT.DROPINDEX") {
        return ftDropIndex(args);
    }
    if (name == "FT.SEARCH") {
        return ftSearch(args);
    }
    if (name == "JSON.SET") {
        return jsonSet(args);
    }
    if (name == "JSON.GET") {
        return jsonGet(args);
    }
    if (name == "DEL") {
        return del(args);
    }
    if (name == "SCAN") {
        return scan(args);
    }
    return Reply::makeError("ERR unknown command '" + args.front() + "'");
}

Reply FakeValkey::ftCreate(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return wrongArity("FT.CREATE");
    }
    const auto& index = args[1];
    if (indexes_.count(index)) {
        return Reply::makeError("Index " + index + " already exists.");
    }
    Index idx;
    for (std::size_t i = 2; i < args.size(); ++i) {
        auto token = upper(args[i]);
        if (token == "PREFIX" && i + 2 < args.size()) {
            idx.prefix = args[i + 2];
        } else if (token == "DIM" && i + 1 < args.size()) {
            idx.dimension = static_cast<std::size_t>(std::stoul(args[i + 1]));
        }
    }
    if (idx.dimension == 0) {
        return Reply::makeError("Invalid field type for field `vector`: missing DIM");
    }
    indexes_[index] = idx;
    return ok();
}

Reply FakeValkey::ftInfo(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return wrongArity("FT.INFO");
    }
    auto it = indexes_.find(args[1]);
    if (it == indexes_.end()) {
        return Reply::makeError("Index with name '" + args[1] + "' not found");
    }
    int64_t docs = 0;
    for (const auto& [key, doc] : documents_) {
        if (startsWith(key, it->second.prefix)) {
            ++docs;
        }
    }
    return Reply::makeArray({
        Reply::makeString("index_name"),
        Reply::makeString(args[1]),
        Reply::makeString("num_docs"),
        Reply::makeInteger(docs),
        Reply::makeString("dimensions"),
        Reply::makeInteger(static_cast<int64_t>(it->second.dimension)),
        Reply::makeString("state"),
        Reply::makeString("ready"),
    });
}

Reply FakeValkey::ftList() {
    std::vector<Reply> names;
    for (const auto& [name, idx] : indexes_) {
        names.push_back(Reply::makeString(name));
    }
    return Reply::makeArray(std::move(names));
}

Reply FakeValkey::ftDropIndex(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return wrongArity("FT.DROPINDEX");
    }
    if (indexes_.erase(args[1]) == 0) {
        return Reply::makeError("Index with name '" + args[1] + "' not found");
    }
    return ok();
}

Reply FakeValkey::ftSearch(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return wrongArity("FT.SEARCH");
    }
    auto idxIt = indexes_.find(args[1]);
    if (idxIt == indexes_.end()) {
        return Reply::makeError("Index with name '" + args[1] + "' not found");
    }

    std::map<std::string, std::string> params;
    std::vector<std::pair<std::string, std::string>> returns;
    std::size_t offset = 0;
    std::size_t count = 10;
    for (std::size_t i = 3; i < args.size(); ++i) {
        auto token = upper(args[i]);
        if (token == "PARAMS" && i + 1 < args.size()) {
            auto n = std::stoul(args[i + 1]);
            for (std::size_t k = 0; k + 1 < n && i + 3 + k < args.size(); k += 2) {
                params[args[i + 2 + k]] = args[i + 3 + k];
            }
            i += 1 + n;
        } else if (token == "RETURN" && i + 1 < args.size()) {
            auto n = std::stoul(args[i + 1]);
            std::size_t j = 0;
            while (j < n && i + 2 + j < args.size()) {
                const auto& id = args[i + 2 + j];
                if (j + 2 < n && upper(args[i + 3 + j]) == "AS") {
                    returns.emplace_back(id, args[i + 4 + j]);
                    j += 3;
                } else {
                    returns.emplace_back(id, id);
                    j += 1;
                }
            }
            i += 1 + n;
        } else if (token == "LIMIT" && i + 2 < args.size()) {
            offset = std::stoul(args[i + 1]);
            count = std::stoul(args[i + 2]);
            i += 2;
        } else if (token == "DIALECT") {
            ++i;
        }
    }

    static const std::regex knn(R"(KNN\s+(\d+)\s+@(\w+)\s+\$(\w+))");
    std::smatch m;
    if (!std::regex_search(args[2], m, knn)) {
        return Reply::makeError("Unsupported query: " + args[2]);
    }
    auto k = std::stoul(m[1].str());
    auto param = params.find(m[3].str());
    if (param == params.end()) {
        return Reply::makeError("Missing parameter " + m[3].str());
    }
    auto query = unpackFloat32(param->second);
    if (!query || query->size() != idxIt->second.dimension) {
        return Reply::makeError("Invalid vector blob for field " + m[2].str());
    }

    struct Hit {
        std::string key;
        nlohmann::json doc;
        float score;
    };
    std::vector<Hit> hits;
    for (const auto& [key, text] : documents_) {
        if (!startsWith(key, idxIt->second.prefix)) {
            continue;
        }
        auto doc = nlohmann::json::parse(text, nullptr, false);
        if (doc.is_discarded() || !doc.is_object() || !doc.contains("vector") ||
            !doc["vector"].is_array()) {
            continue;
        }
        std::vector<float> vec;
        for (const auto& v : doc["vector"]) {
            vec.push_back(v.is_number() ? v.get<float>() : 0.0f);
        }
        hits.push_back(Hit{key, std::move(doc), cosineDistance(*query, vec)});
    }
    std::stable_sort(hits.begin(), hits.end(),
                     [](const Hit& a, const Hit& b) { return a.score < b.score; });
    if (hits.size() > k) {
        hits.resize(k);
    }

    const auto total = static_cast<int64_t>(hits.size());
    std::vector<Reply> out{Reply::makeInteger(total)};
    for (std::size_t i = offset; i < hits.size() && i < offset + count; ++i) {
        const auto& hit = hits[i];
        std::vector<Reply> fields;
        if (returns.empty()) {
            fields.push_back(Reply::makeString("$"));
            fields.push_back(Reply::makeString(hit.doc.dump()));
        }
        for (const auto& [identifier, alias] : returns) {
            std::optional<std::string> value;
            if (identifier == "__vector_score") {
                value = valvec::format("{}", hit.score);
            } else {
                auto path = startsWith(identifier, "$.") ? identifier.substr(2) : identifier;
                if (hit.doc.contains(path)) {
                    value = fieldText(hit.doc[path]);
                }
            }
            if (value) {
                fields.push_back(Reply::makeString(alias));
                fields.push_back(Reply::makeString(std::move(*value)));
            }
        }
        out.push_back(Reply::makeString(hit.key));
        out.push_back(Reply::makeArray(std::move(fields)));
    }
    return Reply::makeArray(std::move(out));
}

Reply FakeValkey::jsonSet(const std::vector<std::string>& args) {
    if (args.size() != 4) {
        return wrongArity("JSON.SET");
    }
    if (args[2] != "$" && args[2] != ".") {
        return Reply::makeError("ERR only root path is supported");
    }
    auto doc = nlohmann::json::parse(args[3], nullptr, false);
    if (doc.is_discarded()) {
        return Reply::makeError("SYNTAXERR Failed to parse JSON string");
    }
    documents_[args[1]] = doc.dump();
    return ok();
}

Reply FakeValkey::jsonGet(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return wrongArity("JSON.GET");
    }
    auto it = documents_.find(args[1]);
    if (it == documents_.end()) {
        return Reply::makeNil();
    }
    if (args.size() > 2 && args[2] == "$") {
        return Reply::makeString("[" + it->second + "]");
    }
    return Reply::makeString(it->second);
}

Reply FakeValkey::del(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return wrongArity("DEL");
    }
    int64_t removed = 0;
    for (std::size_t i = 1; i < args.size(); ++i) {
        removed += static_cast<int64_t>(documents_.erase(args[i]));
    }
    return Reply::makeInteger(removed);
}

Reply FakeValkey::scan(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return wrongArity("SCAN");
    }
    std::string pattern = "*";
    for (std::size_t i = 2; i + 1 < args.size(); i += 2) {
        if (upper(args[i]) == "MATCH") {
            pattern = args[i + 1];
        }
    }
    std::vector<Reply> keys;
    for (const auto& [key, doc] : documents_) {
        if (globMatch(pattern, key)) {
            keys.push_back(Reply::makeString(key));
        }
    }
    return Reply::makeArray({Reply::makeString("0"), Reply::makeArray(std::move(keys))});
}

FakeValkeyClient::FakeValkeyClient(std::shared_ptr<FakeValkey> store,
                                   client::ConnectionOptions opts)
    : store_(std::move(store)), opts_(std::move(opts)) {}

awaitable<Result<Reply>> FakeValkeyClient::command(std::vector<std::string> args) {
    if (args.empty()) {
        co_return Error{ErrorCode::InvalidArgument, "Empty command"};
    }
    if (closed_) {
        co_return Error{ErrorCode::InvalidState, "Valkey client is closed"};
    }
    if (!store_->reachable()) {
        co_return Error{ErrorCode::NetworkError, "Connection reset by peer"};
    }
    if (auto delay = store_->takeDelay(args.front())) {
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, *delay);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(use_awaitable, ec));
    }
    if (auto code = store_->takeTransportFailure(args.front())) {
        co_return Error{*code, valvec::format("{} failed in transport", args.front())};
    }
    co_return store_->dispatch(args);
}

awaitable<Result<void>> FakeValkeyClient::close() {
    closed_ = true;
    co_return Result<void>();
}

} // namespace valvec::test
