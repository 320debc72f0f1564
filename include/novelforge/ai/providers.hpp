/*
 * NovelForge C++ - Model Providers
 *
 * Boundaries to the external models. Every call takes a cancellation token
 * that implementations should honor promptly; deadlines and retries are
 * the caller's job. A failed call reports whether it is worth retrying
 * through Status::transient.
 */
#ifndef novelforge_AI_PROVIDERS_HPP
#define novelforge_AI_PROVIDERS_HPP

#include <novelforge/core/status.hpp>
#include <novelforge/core/cancellation.hpp>
#include <novelforge/memory/types.hpp>
#include <novelforge/consistency/facts.hpp>
#include <string>
#include <vector>

namespace novelforge {

// Result of a text-producing call
struct CompletionResult {
    Status status;
    std::string content;
    std::string model;

    bool ok() const { return status.ok(); }

    static CompletionResult success(const std::string& text, const std::string& model = "") {
        CompletionResult r;
        r.content = text;
        r.model = model;
        return r;
    }

    static CompletionResult fail(const Status& status) {
        CompletionResult r;
        r.status = status;
        return r;
    }
};

struct EmbeddingResult {
    Status status;
    Embedding vector;

    bool ok() const { return status.ok(); }
};

struct ExtractionResult {
    Status status;
    std::vector<CandidateFact> facts;

    bool ok() const { return status.ok(); }
};

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() {}

    virtual std::string provider_id() const = 0;
    virtual EmbeddingResult embed(const std::string& text, const CancellationToken& cancel) = 0;
};

class GenerationProvider {
public:
    virtual ~GenerationProvider() {}

    virtual std::string provider_id() const = 0;
    virtual CompletionResult generate(const std::string& context,
                                      const std::string& instruction,
                                      const CancellationToken& cancel) = 0;
};

class SummarizationProvider {
public:
    virtual ~SummarizationProvider() {}

    virtual std::string provider_id() const = 0;
    virtual CompletionResult summarize(const std::string& evicted_segment,
                                       const std::string& previous_summary,
                                       const CancellationToken& cancel) = 0;
};

class ExtractionProvider {
public:
    virtual ~ExtractionProvider() {}

    virtual std::string provider_id() const = 0;
    virtual ExtractionResult extract(const std::string& text,
                                     const CancellationToken& cancel) = 0;
};

} // namespace novelforge

#endif // novelforge_AI_PROVIDERS_HPP
