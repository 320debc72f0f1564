/*
 * NovelForge C++ - Hash Embedding Provider
 *
 * Deterministic local embedder: feature hashing of word and CJK character
 * tokens into a fixed number of buckets, L2-normalized. Identical text
 * always yields an identical vector, so no model server is needed.
 *
 * Config:
 *   embedding.dimension  - Vector size (default: 256)
 */
#ifndef novelforge_AI_HASH_EMBEDDING_HPP
#define novelforge_AI_HASH_EMBEDDING_HPP

#include <novelforge/ai/providers.hpp>

namespace novelforge {

class HashEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashEmbeddingProvider(int dimension = 256);

    std::string provider_id() const { return "hash"; }
    EmbeddingResult embed(const std::string& text, const CancellationToken& cancel);

    int dimension() const { return dimension_; }

    // Lowercased ASCII words, single CJK characters and CJK bigrams
    static std::vector<std::string> tokenize(const std::string& text);

private:
    int dimension_;
    int hashes_per_token_;
};

} // namespace novelforge

#endif // novelforge_AI_HASH_EMBEDDING_HPP
