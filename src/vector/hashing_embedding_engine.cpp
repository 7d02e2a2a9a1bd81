#include <valvec/vector/hashing_embedding_engine.h>

#include <cctype>
#include <cmath>

#include <spdlog/spdlog.h>

#include <valvec/core/uuid.h>

namespace valvec::vector {

namespace {

constexpr float kWordWeight = 1.0f;
constexpr float kTrigramWeight = 0.5f;

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : text) {
        // Bytes >= 0x80 belong to multi-byte UTF-8 sequences and stay inside the word
        if (std::isalnum(c) || c >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

} // namespace

HashingEmbeddingEngine::HashingEmbeddingEngine(std::size_t dimension)
    : dimension_(dimension == 0 ? kDefaultDimension : dimension) {
    spdlog::debug("HashingEmbeddingEngine created with dimension {}", dimension_);
}

std::vector<float> HashingEmbeddingEngine::embedOne(std::string_view text) const {
    std::vector<float> embedding(dimension_, 0.0f);
    auto bump = [&](std::string_view feature, float weight) {
        embedding[core::fnv1a64(feature) % dimension_] += weight;
    };

    for (const auto& word : tokenize(text)) {
        bump("w:" + word, kWordWeight);
        for (std::size_t i = 0; i + 3 <= word.size(); ++i) {
            bump("t:" + word.substr(i, 3), kTrigramWeight);
        }
    }

    // Normalize to unit length; empty text stays the zero vector
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);
    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }
    return embedding;
}

boost::asio::awaitable<Result<std::vector<std::vector<float>>>>
HashingEmbeddingEngine::embedText(std::vector<std::string> texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(embedOne(text));
    }
    co_return out;
}

} // namespace valvec::vector
