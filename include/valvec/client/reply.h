#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace valvec::client {

// Reply kinds hiredis reports for RESP2 and the RESP3 types Valkey modules may emit
enum class ReplyType {
    Nil,
    Status,
    Error,
    Integer,
    String,
    Array,
    Map,
    Double,
    Boolean,
};

/**
 * Owned copy of a server reply. Strings keep raw bytes; conversion to text happens at the
 * protocol boundary (see toText and normalizeSearchReply).
 */
struct Reply {
    ReplyType type{ReplyType::Nil};
    std::string str;             // Status, Error, String
    int64_t integer{0};          // Integer
    double number{0.0};          // Double
    bool boolean{false};         // Boolean
    std::vector<Reply> elements; // Array; Map keeps key, value, key, value, ...

    static Reply makeNil() { return Reply{}; }
    static Reply makeStatus(std::string s) {
        Reply r;
        r.type = ReplyType::Status;
        r.str = std::move(s);
        return r;
    }
    static Reply makeError(std::string s) {
        Reply r;
        r.type = ReplyType::Error;
        r.str = std::move(s);
        return r;
    }
    static Reply makeInteger(int64_t i) {
        Reply r;
        r.type = ReplyType::Integer;
        r.integer = i;
        return r;
    }
    static Reply makeString(std::string s) {
        Reply r;
        r.type = ReplyType::String;
        r.str = std::move(s);
        return r;
    }
    static Reply makeDouble(double d) {
        Reply r;
        r.type = ReplyType::Double;
        r.number = d;
        return r;
    }
    static Reply makeBoolean(bool b) {
        Reply r;
        r.type = ReplyType::Boolean;
        r.boolean = b;
        return r;
    }
    static Reply makeArray(std::vector<Reply> items) {
        Reply r;
        r.type = ReplyType::Array;
        r.elements = std::move(items);
        return r;
    }
    static Reply makeMap(std::vector<std::pair<Reply, Reply>> entries) {
        Reply r;
        r.type = ReplyType::Map;
        r.elements.reserve(entries.size() * 2);
        for (auto& [key, value] : entries) {
            r.elements.push_back(std::move(key));
            r.elements.push_back(std::move(value));
        }
        return r;
    }

    bool isNull() const noexcept { return type == ReplyType::Nil; }
    bool isError() const noexcept { return type == ReplyType::Error; }
    bool isArray() const noexcept { return type == ReplyType::Array; }
    bool isMap() const noexcept { return type == ReplyType::Map; }
    bool isString() const noexcept {
        return type == ReplyType::Status || type == ReplyType::String;
    }
    bool isOk() const noexcept { return type == ReplyType::Status && str == "OK"; }

    // Integers, and strings holding a base-10 integer
    std::optional<int64_t> asInteger() const;

    // Integers, doubles, and strings holding a number
    std::optional<double> asDouble() const;

    // Debug rendering for logs
    std::string toDebugString() const;
};

// True if `bytes` is well-formed UTF-8
bool isValidUtf8(std::string_view bytes);

// Return `bytes` unchanged when valid UTF-8, otherwise replace each invalid byte with U+FFFD
std::string toText(std::string_view bytes);

} // namespace valvec::client
