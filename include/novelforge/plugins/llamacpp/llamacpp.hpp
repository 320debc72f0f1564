/*
 * NovelForge C++ - Llama.cpp Provider
 *
 * Generation, summarization, fact extraction and embeddings served by a
 * llama.cpp server through its OpenAI-compatible API:
 *
 *   POST /v1/chat/completions   generate, summarize, extract
 *   POST /v1/embeddings         embed
 *
 * Config:
 *   llamacpp.url              - Server URL (default: http://localhost:8080)
 *   llamacpp.model            - Chat model name (optional)
 *   llamacpp.embedding_model  - Embedding model name (default: chat model)
 *   llamacpp.api_key          - API key if the server requires one (optional)
 *   llamacpp.timeout_ms       - Transport timeout per call (default: 300000)
 *
 * Rate limiting (429), server errors (5xx) and transport failures are
 * reported as transient PROVIDER failures so callers can retry them.
 */
#ifndef novelforge_PLUGINS_LLAMACPP_HPP
#define novelforge_PLUGINS_LLAMACPP_HPP

#include <novelforge/ai/providers.hpp>
#include <novelforge/core/http_client.hpp>
#include <novelforge/core/config.hpp>
#include <string>

namespace novelforge {

class LlamaCppProvider : public EmbeddingProvider,
                         public GenerationProvider,
                         public SummarizationProvider,
                         public ExtractionProvider {
public:
    LlamaCppProvider();

    bool init(const Config& cfg);
    bool is_initialized() const { return initialized_; }

    std::string provider_id() const;
    std::string default_model() const { return default_model_; }

    EmbeddingResult embed(const std::string& text, const CancellationToken& cancel);

    CompletionResult generate(const std::string& context,
                              const std::string& instruction,
                              const CancellationToken& cancel);

    CompletionResult summarize(const std::string& evicted_segment,
                               const std::string& previous_summary,
                               const CancellationToken& cancel);

    ExtractionResult extract(const std::string& text, const CancellationToken& cancel);

    // Facts from a model reply: the JSON array between the first '[' and
    // the last ']'. VALIDATION when there is none or it does not parse.
    static Status parse_facts(const std::string& reply, std::vector<CandidateFact>& out);

private:
    std::string server_url_;
    std::string api_key_;
    std::string default_model_;
    std::string embedding_model_;
    int64_t timeout_ms_;
    bool initialized_;

    CompletionResult chat(const std::string& system_prompt,
                          const std::string& user_message,
                          double temperature,
                          const CancellationToken& cancel);

    HttpResponse post(const std::string& path, const Json& request, const CancellationToken& cancel);

    // Map transport and HTTP errors to a Status; ok for HTTP 200
    static Status response_status(const HttpResponse& response, const Json& body);
};

} // namespace novelforge

#endif // novelforge_PLUGINS_LLAMACPP_HPP
