#include <novelforge/orchestrator/project_context.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>

namespace novelforge {

ProjectContext::ProjectContext(const std::string& id, const ContextWindowConfig& config)
    : project_id(id)
    , window(config)
    , last_used_ms(monotonic_ms())
{}

ProjectRegistry::ProjectRegistry(MemoryStore& memory, const ContextWindowConfig& window_config)
    : memory_(memory)
    , window_config_(window_config)
{}

Status ProjectRegistry::load(ProjectContext& context) {
    MemoryFilter summary_filter;
    summary_filter.kinds.push_back(MemoryKind::SUMMARY);
    summary_filter.metadata_equals["rolling_summary"] = true;

    std::vector<MemoryEntry> summaries;
    Status s = memory_.recent(context.project_id, summary_filter, 1, summaries);
    if (!s.ok()) return s;

    MemoryFilter segment_filter;
    segment_filter.metadata_equals["segment"] = true;

    std::vector<MemoryEntry> recent;
    s = memory_.recent(context.project_id, segment_filter, window_config_.max_segments, recent);
    if (!s.ok()) return s;

    // recent() is newest first, the window wants oldest first
    std::vector<std::string> segments;
    for (std::vector<MemoryEntry>::reverse_iterator it = recent.rbegin(); it != recent.rend(); ++it) {
        segments.push_back(it->content);
    }

    std::string summary = summaries.empty() ? std::string() : summaries[0].content;
    context.window.restore(segments, summary);

    LOG_INFO("[ProjectRegistry] Loaded project %s: %zu segment(s), summary %s",
             context.project_id.c_str(), context.window.size(),
             summary.empty() ? "none" : "restored");
    return Status::ok_status();
}

Status ProjectRegistry::acquire(const std::string& project_id, ProjectContextPtr& out) {
    if (project_id.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "project id must not be empty");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, ProjectContextPtr>::iterator it = projects_.find(project_id);
        if (it != projects_.end()) {
            it->second->last_used_ms = monotonic_ms();
            out = it->second;
            return Status::ok_status();
        }
    }

    // Loaded without the registry lock; a concurrent acquire of the same
    // project may insert first, in which case its context is returned
    ProjectContextPtr context = std::make_shared<ProjectContext>(project_id, window_config_);
    Status s = load(*context);
    if (!s.ok()) {
        LOG_ERROR("[ProjectRegistry] Failed to load project %s: %s",
                  project_id.c_str(), s.to_string().c_str());
        return s;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::pair<std::map<std::string, ProjectContextPtr>::iterator, bool> inserted =
        projects_.insert(std::make_pair(project_id, context));
    if (!inserted.second) {
        LOG_DEBUG("[ProjectRegistry] Project %s was loaded concurrently; using that context",
                  project_id.c_str());
        inserted.first->second->last_used_ms = monotonic_ms();
    }
    out = inserted.first->second;
    return Status::ok_status();
}

size_t ProjectRegistry::flush_idle(int64_t idle_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t now = monotonic_ms();
    size_t unloaded = 0;
    std::map<std::string, ProjectContextPtr>::iterator it = projects_.begin();
    while (it != projects_.end()) {
        if (it->second.use_count() == 1 && now - it->second->last_used_ms >= idle_ms) {
            LOG_DEBUG("[ProjectRegistry] Unloading idle project %s", it->first.c_str());
            it = projects_.erase(it);
            ++unloaded;
        } else {
            ++it;
        }
    }
    return unloaded;
}

bool ProjectRegistry::unload(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, ProjectContextPtr>::iterator it = projects_.find(project_id);
    if (it == projects_.end() || it->second.use_count() > 1) return false;
    projects_.erase(it);
    LOG_DEBUG("[ProjectRegistry] Unloaded project %s", project_id.c_str());
    return true;
}

bool ProjectRegistry::is_loaded(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return projects_.count(project_id) > 0;
}

size_t ProjectRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return projects_.size();
}

} // namespace novelforge
