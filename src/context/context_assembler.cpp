#include <novelforge/context/context_assembler.hpp>
#include <novelforge/context/tokens.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>

#include <sstream>

namespace novelforge {

namespace {

// Render order
enum SectionIndex {
    SECTION_PINNED = 0,
    SECTION_MEMORY,
    SECTION_OUTLINE,
    SECTION_SUMMARY,
    SECTION_RECENT,
    SECTION_COUNT
};

const char* kSectionHeaders[SECTION_COUNT] = {
    "[PINNED FACTS]",
    "[RELEVANT MEMORY]",
    "[OUTLINE]",
    "[STORY SO FAR]",
    "[RECENT]"
};

struct Section {
    int64_t header_cost;
    bool opened;
    std::vector<std::string> items;

    Section() : header_cost(0), opened(false) {}
};

// Each admitted part is charged as "<part>\n"; each opened section as
// "\n<header>\n". The rendered text uses a subset of those characters, so
// its estimate never exceeds the charged total.
class BudgetPacker {
public:
    explicit BudgetPacker(int64_t budget) : remaining_(budget > 0 ? budget : 0), dropped_(0) {
        for (int i = 0; i < SECTION_COUNT; ++i) {
            sections_[i].header_cost = estimate_tokens(std::string("\n") + kSectionHeaders[i] + "\n");
        }
    }

    bool admit(int section, const std::string& part) {
        Section& sec = sections_[section];
        int64_t cost = estimate_tokens(part + "\n");
        if (!sec.opened) cost += sec.header_cost;
        if (cost > remaining_) {
            ++dropped_;
            return false;
        }
        remaining_ -= cost;
        sec.opened = true;
        return true;
    }

    void add(int section, const std::string& part) {
        sections_[section].items.push_back(part);
    }

    std::string render() const {
        std::ostringstream out;
        bool first = true;
        for (int i = 0; i < SECTION_COUNT; ++i) {
            if (sections_[i].items.empty()) continue;
            if (!first) out << "\n";
            first = false;
            out << kSectionHeaders[i] << "\n";
            for (size_t k = 0; k < sections_[i].items.size(); ++k) {
                out << sections_[i].items[k] << "\n";
            }
        }
        std::string text = out.str();
        if (!text.empty() && text[text.size() - 1] == '\n') {
            text.erase(text.size() - 1);
        }
        return text;
    }

    size_t dropped() const { return dropped_; }

private:
    Section sections_[SECTION_COUNT];
    int64_t remaining_;
    size_t dropped_;
};

} // namespace

Json AssembledContext::to_json() const {
    Json j = Json::object();
    j["token_count"] = token_count;
    j["token_budget"] = token_budget;
    j["pinned_kept"] = static_cast<uint64_t>(pinned_kept);
    j["retrieved_kept"] = static_cast<uint64_t>(retrieved_kept);
    j["outline_kept"] = static_cast<uint64_t>(outline_kept);
    j["recent_kept"] = static_cast<uint64_t>(recent_kept);
    j["summary_kept"] = summary_kept;
    j["dropped"] = static_cast<uint64_t>(dropped);
    j["memory_ids"] = memory_ids;
    return j;
}

ContextAssembler::ContextAssembler(MemoryStore& memory)
    : memory_(memory)
{}

Status ContextAssembler::retrieve_relevant(const std::string& query,
                                           const std::string& project_id,
                                           size_t top_k,
                                           const MemoryFilter& filter,
                                           std::vector<MemoryHit>& out,
                                           const CancellationToken* cancel)
{
    Status s = memory_.query(project_id, query, filter, top_k, out, cancel);
    if (!s.ok()) {
        LOG_WARN("[ContextAssembler] Retrieval for project %s failed: %s",
                 project_id.c_str(), s.to_string().c_str());
        return s;
    }
    LOG_DEBUG("[ContextAssembler] Retrieved %zu memories for project %s",
              out.size(), project_id.c_str());
    return s;
}

std::vector<std::string> ContextAssembler::split_outline(const std::string& outline) {
    std::vector<std::string> paragraphs;
    std::vector<std::string> lines = split(outline, '\n');

    std::string current;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (line.empty()) {
            if (!current.empty()) {
                paragraphs.push_back(current);
                current.clear();
            }
            continue;
        }
        current = current.empty() ? line : current + "\n" + line;
    }
    if (!current.empty()) paragraphs.push_back(current);
    return paragraphs;
}

AssembledContext ContextAssembler::build_context(const std::vector<std::string>& recent_segments,
                                                 const std::vector<MemoryHit>& retrieved,
                                                 const std::string& outline,
                                                 int64_t token_budget,
                                                 const std::vector<std::string>& pinned,
                                                 const std::string& rolling_summary) const
{
    AssembledContext ctx;
    ctx.token_budget = token_budget;
    BudgetPacker packer(token_budget);

    for (size_t i = 0; i < pinned.size(); ++i) {
        std::string line = "- " + trim(pinned[i]);
        if (trim(pinned[i]).empty()) continue;
        if (packer.admit(SECTION_PINNED, line)) {
            packer.add(SECTION_PINNED, line);
            ctx.pinned_kept++;
        }
    }

    for (size_t i = 0; i < retrieved.size(); ++i) {
        std::string content = trim(retrieved[i].entry.content);
        if (content.empty()) continue;
        std::string line = "- " + content;
        if (packer.admit(SECTION_MEMORY, line)) {
            packer.add(SECTION_MEMORY, line);
            ctx.retrieved_kept++;
            ctx.memory_ids.push_back(retrieved[i].entry.id);
        }
    }

    std::vector<std::string> paragraphs = split_outline(outline);
    for (size_t i = 0; i < paragraphs.size(); ++i) {
        if (packer.admit(SECTION_OUTLINE, paragraphs[i])) {
            packer.add(SECTION_OUTLINE, paragraphs[i]);
            ctx.outline_kept++;
        }
    }

    // Newest segments claim the budget first, rendering stays chronological
    std::vector<bool> kept(recent_segments.size(), false);
    for (size_t i = recent_segments.size(); i-- > 0; ) {
        if (trim(recent_segments[i]).empty()) continue;
        kept[i] = packer.admit(SECTION_RECENT, recent_segments[i]);
        if (kept[i]) ctx.recent_kept++;
    }
    for (size_t i = 0; i < recent_segments.size(); ++i) {
        if (kept[i]) packer.add(SECTION_RECENT, recent_segments[i]);
    }

    std::string summary = trim(rolling_summary);
    if (!summary.empty() && packer.admit(SECTION_SUMMARY, summary)) {
        packer.add(SECTION_SUMMARY, summary);
        ctx.summary_kept = true;
    }

    ctx.dropped = packer.dropped();
    ctx.text = packer.render();
    ctx.token_count = estimate_tokens(ctx.text);

    if (ctx.dropped > 0) {
        LOG_DEBUG("[ContextAssembler] Dropped %zu part(s) to fit %lld tokens",
                  ctx.dropped, static_cast<long long>(token_budget));
    }
    return ctx;
}

} // namespace novelforge
