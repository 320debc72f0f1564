#include <novelforge/memory/query_cache.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>

namespace novelforge {

QueryCache::QueryCache(int64_t ttl_ms)
    : ttl_ms_(ttl_ms > 0 ? ttl_ms : 0)
{}

std::string QueryCache::make_key(const std::string& text,
                                 const MemoryFilter& filter,
                                 size_t top_k)
{
    Json kinds = Json::array();
    for (size_t i = 0; i < filter.kinds.size(); ++i) {
        kinds.push_back(memory_kind_to_string(filter.kinds[i]));
    }

    Json desc = Json::object();
    desc["text"] = text;
    desc["kinds"] = kinds;
    desc["after"] = filter.created_after;
    desc["before"] = filter.created_before;
    desc["metadata"] = filter.metadata_equals;
    desc["top_k"] = static_cast<uint64_t>(top_k);
    return sha256_hex(desc.dump());
}

uint64_t QueryCache::generation(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, ProjectCache>::const_iterator it = projects_.find(project_id);
    return it == projects_.end() ? 0 : it->second.generation;
}

bool QueryCache::get(const std::string& project_id, const std::string& key,
                     std::vector<MemoryHit>& out)
{
    if (ttl_ms_ == 0) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, ProjectCache>::iterator project = projects_.find(project_id);
    if (project == projects_.end()) return false;

    std::map<std::string, CachedResult>::iterator it = project->second.results.find(key);
    if (it == project->second.results.end()) return false;

    if (it->second.expires_at <= monotonic_ms()) {
        project->second.results.erase(it);
        return false;
    }
    out = it->second.hits;
    return true;
}

void QueryCache::put(const std::string& project_id, const std::string& key,
                     const std::vector<MemoryHit>& hits, uint64_t generation)
{
    if (ttl_ms_ == 0) return;

    std::lock_guard<std::mutex> lock(mutex_);
    ProjectCache& project = projects_[project_id];
    if (project.generation != generation) {
        LOG_DEBUG("[QueryCache] Dropping stale result for project %s", project_id.c_str());
        return;
    }

    int64_t now = monotonic_ms();
    std::map<std::string, CachedResult>::iterator it = project.results.begin();
    while (it != project.results.end()) {
        if (it->second.expires_at <= now) project.results.erase(it++);
        else ++it;
    }

    CachedResult cached;
    cached.hits = hits;
    cached.expires_at = now + ttl_ms_;
    project.results[key] = cached;
}

void QueryCache::invalidate(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ProjectCache& project = projects_[project_id];
    project.generation++;
    project.results.clear();
}

void QueryCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::map<std::string, ProjectCache>::iterator it = projects_.begin();
         it != projects_.end(); ++it) {
        it->second.generation++;
        it->second.results.clear();
    }
}

size_t QueryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (std::map<std::string, ProjectCache>::const_iterator it = projects_.begin();
         it != projects_.end(); ++it) {
        total += it->second.results.size();
    }
    return total;
}

} // namespace novelforge
