#include <novelforge/ai/hash_embedding.hpp>
#include <novelforge/core/utils.hpp>

#include <openssl/sha.h>
#include <cctype>
#include <cmath>
#include <cstring>

namespace novelforge {

namespace {

bool is_cjk(uint32_t cp) {
    return cp >= 0x4E00 && cp <= 0x9FFF;
}

bool is_word_char(uint32_t cp) {
    return (cp >= '0' && cp <= '9') || (cp >= 'a' && cp <= 'z') ||
           (cp >= 'A' && cp <= 'Z') || cp == '_' ||
           (cp >= 0x80 && !is_cjk(cp) && cp != 0xFFFD &&
            !(cp >= 0x3000 && cp <= 0x303F) && !(cp >= 0xFF00 && cp <= 0xFFEF));
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

HashEmbeddingProvider::HashEmbeddingProvider(int dimension)
    : dimension_(dimension > 0 ? dimension : 256)
    , hashes_per_token_(4)
{}

std::vector<std::string> HashEmbeddingProvider::tokenize(const std::string& text) {
    std::vector<uint32_t> cps = utf8_code_points(text);
    std::vector<std::string> tokens;

    std::string word;
    uint32_t prev_cjk = 0;
    for (size_t i = 0; i < cps.size(); ++i) {
        uint32_t cp = cps[i];

        if (is_cjk(cp)) {
            if (!word.empty()) {
                tokens.push_back(word);
                word.clear();
            }
            std::string ch;
            append_utf8(ch, cp);
            tokens.push_back(ch);
            if (prev_cjk) {
                std::string bigram;
                append_utf8(bigram, prev_cjk);
                bigram += ch;
                tokens.push_back(bigram);
            }
            prev_cjk = cp;
            continue;
        }

        prev_cjk = 0;
        if (is_word_char(cp)) {
            if (cp < 0x80) cp = static_cast<uint32_t>(std::tolower(static_cast<int>(cp)));
            append_utf8(word, cp);
        } else if (!word.empty()) {
            tokens.push_back(word);
            word.clear();
        }
    }
    if (!word.empty()) tokens.push_back(word);
    return tokens;
}

EmbeddingResult HashEmbeddingProvider::embed(const std::string& text, const CancellationToken& cancel) {
    EmbeddingResult result;
    if (cancel.is_cancelled()) {
        result.status = Status::fail(ErrorCode::CANCELLED, "embedding cancelled");
        return result;
    }

    result.vector.assign(static_cast<size_t>(dimension_), 0.0f);
    std::vector<std::string> tokens = tokenize(text);

    for (size_t t = 0; t < tokens.size(); ++t) {
        unsigned char digest[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(tokens[t].data()), tokens[t].size(), digest);

        // Each hash takes 4 digest bytes: 31 bits of bucket index, 1 sign bit
        for (int h = 0; h < hashes_per_token_; ++h) {
            uint32_t word = 0;
            std::memcpy(&word, digest + h * 4, 4);
            size_t bucket = static_cast<size_t>((word >> 1) % static_cast<uint32_t>(dimension_));
            result.vector[bucket] += (word & 1u) ? 1.0f : -1.0f;
        }
    }

    double norm = 0.0;
    for (size_t i = 0; i < result.vector.size(); ++i) {
        norm += static_cast<double>(result.vector[i]) * result.vector[i];
    }
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (size_t i = 0; i < result.vector.size(); ++i) {
            result.vector[i] *= inv;
        }
    }
    return result;
}

} // namespace novelforge
