#include <valvec/client/reply.h>

#include <charconv>
#include <cstdlib>
#include <valvec/core/format.h>

namespace valvec::client {

std::optional<int64_t> Reply::asInteger() const {
    if (type == ReplyType::Integer) {
        return integer;
    }
    if (isString()) {
        int64_t v = 0;
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), v);
        if (ec == std::errc{} && ptr == str.data() + str.size()) {
            return v;
        }
    }
    return std::nullopt;
}

std::optional<double> Reply::asDouble() const {
    if (type == ReplyType::Double) {
        return number;
    }
    if (type == ReplyType::Integer) {
        return static_cast<double>(integer);
    }
    if (isString() && !str.empty()) {
        char* end = nullptr;
        double v = std::strtod(str.c_str(), &end);
        if (end == str.c_str() + str.size()) {
            return v;
        }
    }
    return std::nullopt;
}

std::string Reply::toDebugString() const {
    switch (type) {
        case ReplyType::Nil:
            return "(nil)";
        case ReplyType::Status:
            return str;
        case ReplyType::Error:
            return "(error) " + str;
        case ReplyType::Integer:
            return valvec::format("(integer) {}", integer);
        case ReplyType::String:
            return valvec::format("\"{}\"", str.size() > 64 ? str.substr(0, 64) + "..." : str);
        case ReplyType::Double:
            return valvec::format("(double) {}", number);
        case ReplyType::Boolean:
            return boolean ? "(true)" : "(false)";
        case ReplyType::Array:
        case ReplyType::Map: {
            std::string out = type == ReplyType::Array ? "[" : "{";
            for (std::size_t i = 0; i < elements.size(); ++i) {
                if (i > 0) {
                    out += (type == ReplyType::Map && i % 2 == 1) ? ": " : ", ";
                }
                out += elements[i].toDebugString();
            }
            out += type == ReplyType::Array ? "]" : "}";
            return out;
        }
    }
    return "(unknown)";
}

bool isValidUtf8(std::string_view bytes) {
    std::size_t i = 0;
    const auto n = bytes.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(bytes[i]);
        std::size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong encodings, surrogates and out-of-range code points
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

std::string toText(std::string_view bytes) {
    if (isValidUtf8(bytes)) {
        return std::string(bytes);
    }
    static constexpr std::string_view kReplacement = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(bytes.size() + 8);
    std::size_t i = 0;
    while (i < bytes.size()) {
        // A well-formed sequence starting at i has exactly one valid length (1..4 bytes)
        std::size_t accepted = 0;
        for (std::size_t len = 1; len <= 4 && i + len <= bytes.size(); ++len) {
            if (isValidUtf8(bytes.substr(i, len))) {
                accepted = len;
                break;
            }
        }
        if (accepted == 0) {
            out += kReplacement;
            ++i;
        } else {
            out.append(bytes.substr(i, accepted));
            i += accepted;
        }
    }
    return out;
}

} // namespace valvec::client
