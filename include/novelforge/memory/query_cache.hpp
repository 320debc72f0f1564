/*
 * NovelForge C++ - Retrieval Query Cache
 *
 * Short-lived cache of memory query results, partitioned by project.
 * Any memory or graph mutation of a project drops that project's entries
 * and bumps its generation; a result computed against an older generation
 * is not stored.
 */
#ifndef novelforge_MEMORY_QUERY_CACHE_HPP
#define novelforge_MEMORY_QUERY_CACHE_HPP

#include <novelforge/memory/types.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>

namespace novelforge {

class QueryCache {
public:
    explicit QueryCache(int64_t ttl_ms = 30000);

    // Stable key for (text, filter, top_k)
    static std::string make_key(const std::string& text,
                                const MemoryFilter& filter,
                                size_t top_k);

    // Current generation; pass it back to put()
    uint64_t generation(const std::string& project_id) const;

    bool get(const std::string& project_id, const std::string& key,
             std::vector<MemoryHit>& out);
    void put(const std::string& project_id, const std::string& key,
             const std::vector<MemoryHit>& hits, uint64_t generation);

    void invalidate(const std::string& project_id);
    void clear();

    size_t size() const;
    int64_t ttl_ms() const { return ttl_ms_; }

private:
    struct CachedResult {
        std::vector<MemoryHit> hits;
        int64_t expires_at;
    };

    struct ProjectCache {
        uint64_t generation;
        std::map<std::string, CachedResult> results;

        ProjectCache() : generation(0) {}
    };

    int64_t ttl_ms_;
    std::map<std::string, ProjectCache> projects_;
    mutable std::mutex mutex_;
};

} // namespace novelforge

#endif // novelforge_MEMORY_QUERY_CACHE_HPP
