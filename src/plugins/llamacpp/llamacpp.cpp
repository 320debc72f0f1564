#include <novelforge/plugins/llamacpp/llamacpp.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>
#include <sstream>

namespace novelforge {

namespace {

const char* kGenerationPrompt =
    "You are a novelist continuing a long-form story. Stay consistent with the "
    "pinned facts, the relevant memories and the story so far. Reply with the "
    "new passage only.";

const char* kSummaryPrompt =
    "You maintain the running summary of a novel. Merge the new passage into the "
    "previous summary. Keep names, deaths, locations and unresolved threads. "
    "Reply with the updated summary only.";

const char* kExtractionPrompt =
    "Extract the story facts stated in the passage as a JSON array. Each element "
    "is an object with a \"kind\" field:\n"
    "  {\"kind\":\"character_state\",\"character\":KEY,\"attributes\":{...}}\n"
    "  {\"kind\":\"location_change\",\"character\":KEY,\"location\":KEY}\n"
    "  {\"kind\":\"rule_invocation\",\"rule\":KEY,\"value\":VALUE}\n"
    "  {\"kind\":\"event\",\"event_kind\":KIND,\"participants\":[KEY,...],"
    "\"subject\":KEY,\"description\":TEXT}\n"
    "  {\"kind\":\"relation\",\"source\":\"type:KEY\",\"target\":\"type:KEY\","
    "\"relation\":NAME}\n"
    "Add \"flashback\":true to facts told as memories of the past. Use lowercase "
    "keys without spaces. Reply with the JSON array only; [] if there are no facts.";

} // namespace

LlamaCppProvider::LlamaCppProvider()
    : server_url_("http://localhost:8080")
    , api_key_()
    , default_model_("local-model")
    , embedding_model_()
    , timeout_ms_(300000)
    , initialized_(false)
{}

bool LlamaCppProvider::init(const Config& cfg) {
    server_url_ = cfg.get_string("llamacpp.url", "http://localhost:8080");
    api_key_ = cfg.get_string("llamacpp.api_key", "");

    std::string model = cfg.get_string("llamacpp.model", "");
    if (!model.empty()) {
        default_model_ = model;
    }
    embedding_model_ = cfg.get_string("llamacpp.embedding_model", default_model_);
    timeout_ms_ = cfg.get_int("llamacpp.timeout_ms", 300000);

    // Remove trailing slash from URL
    while (!server_url_.empty() && server_url_[server_url_.length() - 1] == '/') {
        server_url_ = server_url_.substr(0, server_url_.length() - 1);
    }

    LOG_INFO("[LlamaCpp] Initialized with server: %s, model: %s, embedding model: %s",
             server_url_.c_str(), default_model_.c_str(), embedding_model_.c_str());
    initialized_ = true;
    return true;
}

std::string LlamaCppProvider::provider_id() const { return "llamacpp"; }

Status LlamaCppProvider::response_status(const HttpResponse& response, const Json& body) {
    if (response.cancelled) {
        return Status::fail(ErrorCode::CANCELLED, "request cancelled");
    }
    if (response.timed_out) {
        return Status::fail(ErrorCode::GENERATION_TIMEOUT, "HTTP request timed out: " + response.error);
    }
    if (response.status_code == 0) {
        return Status::transient_failure(ErrorCode::PROVIDER, "HTTP request failed: " + response.error);
    }
    if (response.status_code == 200) {
        return Status::ok_status();
    }

    std::string error_msg = "API error";
    if (body.is_object() && body.contains("error") && body["error"].is_object()) {
        std::string msg = body["error"].value("message", std::string(""));
        if (!msg.empty()) {
            error_msg = msg;
        }
    }
    error_msg += " (HTTP " + std::to_string(response.status_code) + ")";

    if (response.status_code == 429 || response.status_code >= 500) {
        return Status::transient_failure(ErrorCode::PROVIDER, error_msg);
    }
    return Status::fail(ErrorCode::PROVIDER, error_msg);
}

HttpResponse LlamaCppProvider::post(const std::string& path, const Json& request,
                                    const CancellationToken& cancel)
{
    std::string endpoint = server_url_ + path;
    std::string request_body = request.dump();
    LOG_DEBUG("[LlamaCpp] Sending request to %s (%zu bytes)", endpoint.c_str(), request_body.size());

    HttpClient http;
    http.set_timeout_ms(timeout_ms_);
    http.set_cancellation(&cancel);

    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    if (!api_key_.empty()) {
        headers["Authorization"] = "Bearer " + api_key_;
    }

    HttpResponse response = http.post_json(endpoint, request_body, headers);
    LOG_DEBUG("[LlamaCpp] Received response [HTTP %d] (%zu bytes)",
              response.status_code, response.body.size());
    return response;
}

CompletionResult LlamaCppProvider::chat(const std::string& system_prompt,
                                        const std::string& user_message,
                                        double temperature,
                                        const CancellationToken& cancel)
{
    if (!initialized_) {
        return CompletionResult::fail(Status::fail(ErrorCode::PROVIDER, "Llama.cpp provider not initialized"));
    }

    Json request = Json::object();
    request["model"] = default_model_;

    Json msgs = Json::array();
    Json sys_msg = Json::object();
    sys_msg["role"] = "system";
    sys_msg["content"] = system_prompt;
    msgs.push_back(sys_msg);

    Json user_msg = Json::object();
    user_msg["role"] = "user";
    user_msg["content"] = user_message;
    msgs.push_back(user_msg);

    request["messages"] = msgs;
    request["temperature"] = temperature;
    request["stream"] = false;

    HttpResponse response = post("/v1/chat/completions", request, cancel);
    Json resp = response.json();

    Status s = response_status(response, resp);
    if (!s.ok()) {
        LOG_ERROR("[LlamaCpp] Chat request failed: %s", s.to_string().c_str());
        return CompletionResult::fail(s);
    }

    std::string content;
    if (resp.is_object() && resp.contains("choices") && resp["choices"].is_array() &&
        !resp["choices"].empty()) {
        const Json& first_choice = resp["choices"][0];
        if (first_choice.contains("message") && first_choice["message"].is_object()) {
            content = first_choice["message"].value("content", std::string(""));
        }
    }
    if (trim(content).empty()) {
        return CompletionResult::fail(Status::fail(ErrorCode::PROVIDER, "model returned no content"));
    }

    std::string model = resp.value("model", default_model_);
    LOG_DEBUG("[LlamaCpp] Response content (%zu chars): %.300s%s",
              content.size(), content.c_str(), content.size() > 300 ? "..." : "");
    return CompletionResult::success(content, model);
}

CompletionResult LlamaCppProvider::generate(const std::string& context,
                                            const std::string& instruction,
                                            const CancellationToken& cancel)
{
    std::ostringstream user;
    if (!context.empty()) {
        user << context << "\n\n";
    }
    user << "[INSTRUCTION]\n" << instruction;
    return chat(kGenerationPrompt, user.str(), 0.8, cancel);
}

CompletionResult LlamaCppProvider::summarize(const std::string& evicted_segment,
                                             const std::string& previous_summary,
                                             const CancellationToken& cancel)
{
    std::ostringstream user;
    user << "[PREVIOUS SUMMARY]\n"
         << (previous_summary.empty() ? std::string("(none)") : previous_summary)
         << "\n\n[NEW PASSAGE]\n" << evicted_segment;
    return chat(kSummaryPrompt, user.str(), 0.2, cancel);
}

Status LlamaCppProvider::parse_facts(const std::string& reply, std::vector<CandidateFact>& out) {
    size_t start = reply.find('[');
    size_t end = reply.rfind(']');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        return Status::fail(ErrorCode::VALIDATION, "extraction reply contains no JSON array");
    }

    Json facts = Json::parse(reply.substr(start, end - start + 1), nullptr, false);
    if (facts.is_discarded()) {
        return Status::fail(ErrorCode::VALIDATION, "extraction reply is not valid JSON");
    }
    return CandidateFact::list_from_json(facts, out);
}

ExtractionResult LlamaCppProvider::extract(const std::string& text, const CancellationToken& cancel) {
    ExtractionResult result;

    CompletionResult reply = chat(kExtractionPrompt, text, 0.0, cancel);
    if (!reply.ok()) {
        result.status = reply.status;
        return result;
    }

    result.status = parse_facts(reply.content, result.facts);
    if (!result.status.ok()) {
        LOG_WARN("[LlamaCpp] Could not parse extracted facts: %s", result.status.error.c_str());
        return result;
    }
    LOG_DEBUG("[LlamaCpp] Extracted %zu fact(s)", result.facts.size());
    return result;
}

EmbeddingResult LlamaCppProvider::embed(const std::string& text, const CancellationToken& cancel) {
    EmbeddingResult result;
    if (!initialized_) {
        result.status = Status::fail(ErrorCode::EMBEDDING, "Llama.cpp provider not initialized");
        return result;
    }

    Json request = Json::object();
    request["model"] = embedding_model_;
    request["input"] = text;

    HttpResponse response = post("/v1/embeddings", request, cancel);
    Json resp = response.json();

    result.status = response_status(response, resp);
    if (!result.status.ok()) {
        LOG_ERROR("[LlamaCpp] Embedding request failed: %s", result.status.to_string().c_str());
        return result;
    }

    if (!resp.is_object() || !resp.contains("data") || !resp["data"].is_array() ||
        resp["data"].empty() || !resp["data"][0].is_object() ||
        !resp["data"][0].contains("embedding") || !resp["data"][0]["embedding"].is_array()) {
        result.status = Status::fail(ErrorCode::EMBEDDING, "embedding response has no data[0].embedding");
        return result;
    }

    const Json& values = resp["data"][0]["embedding"];
    result.vector.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i].is_number()) {
            result.vector.clear();
            result.status = Status::fail(ErrorCode::EMBEDDING, "embedding contains a non-numeric value");
            return result;
        }
        result.vector.push_back(values[i].get<float>());
    }
    if (result.vector.empty()) {
        result.status = Status::fail(ErrorCode::EMBEDDING, "embedding is empty");
    }
    return result;
}

} // namespace novelforge
