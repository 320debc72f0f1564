#include <novelforge/context/summarizer.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>

namespace novelforge {

RecursiveSummarizer::RecursiveSummarizer(SummarizationProvider& provider,
                                         MemoryStore& memory,
                                         const SummarizerConfig& config)
    : provider_(provider)
    , memory_(memory)
    , config_(config)
{}

Status RecursiveSummarizer::persist(const std::string& project_id, const std::string& content,
                                    const Json& metadata, std::string& id)
{
    MemoryEntry entry;
    entry.project_id = project_id;
    entry.kind = MemoryKind::SUMMARY;
    entry.content = content;
    entry.metadata = metadata;

    Status s = memory_.add(entry);
    if (s.ok()) id = entry.id;
    return s;
}

Status RecursiveSummarizer::fold(const std::string& project_id,
                                 const std::vector<std::string>& evicted,
                                 const std::string& previous_summary,
                                 FoldResult& out,
                                 int64_t seq)
{
    out = FoldResult();
    out.summary = previous_summary;

    for (size_t i = 0; i < evicted.size(); ++i) {
        const std::string& segment = evicted[i];
        if (trim(segment).empty()) continue;

        std::string summary;
        Status s = retry_transient(config_.retry, nullptr, "summarization", [&]() {
            return call_with_timeout([&](const CancellationToken& token) {
                CompletionResult result = provider_.summarize(segment, out.summary, token);
                if (result.ok()) summary = result.content;
                return result.status;
            }, config_.timeout_ms, nullptr, "summarization");
        });
        if (s.ok() && trim(summary).empty()) {
            s = Status::fail(ErrorCode::PROVIDER, "summarizer returned an empty summary");
        }

        std::string id;
        if (s.ok()) {
            Json metadata = Json::object();
            metadata["rolling_summary"] = true;
            if (seq > 0) metadata["seq"] = seq;
            Status ps = persist(project_id, summary, metadata, id);
            if (!ps.ok()) {
                LOG_ERROR("[Summarizer] Failed to persist summary for project %s: %s",
                          project_id.c_str(), ps.to_string().c_str());
                return ps;
            }
            out.summary = summary;
            out.folded++;
        } else {
            LOG_WARN("[Summarizer] Summarization failed for project %s (%s); keeping raw segment",
                     project_id.c_str(), s.to_string().c_str());
            Json metadata = Json::object();
            metadata["fallback"] = true;
            if (seq > 0) metadata["seq"] = seq;
            Status ps = persist(project_id, segment, metadata, id);
            if (!ps.ok()) {
                LOG_ERROR("[Summarizer] Failed to persist fallback segment for project %s: %s",
                          project_id.c_str(), ps.to_string().c_str());
                return ps;
            }
            out.fallbacks++;
        }
        out.entry_ids.push_back(id);
    }

    LOG_DEBUG("[Summarizer] Project %s: %zu segment(s) folded, %zu kept raw",
              project_id.c_str(), out.folded, out.fallbacks);
    return Status::ok_status();
}

Status RecursiveSummarizer::latest_summary(const std::string& project_id, std::string& out) {
    MemoryFilter filter;
    filter.kinds.push_back(MemoryKind::SUMMARY);
    filter.metadata_equals["rolling_summary"] = true;

    std::vector<MemoryEntry> entries;
    Status s = memory_.recent(project_id, filter, 1, entries);
    if (!s.ok()) return s;

    out = entries.empty() ? std::string() : entries[0].content;
    return Status::ok_status();
}

} // namespace novelforge
