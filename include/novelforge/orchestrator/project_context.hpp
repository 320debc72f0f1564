/*
 * NovelForge C++ - Project Context
 *
 * Per-project working state for the orchestrator: the sliding context
 * window with its rolling summary, plus the locks that order commits and
 * summary folds for that project.
 *
 * Contexts live in a ProjectRegistry. The first acquire() of a project
 * rebuilds its window from storage (latest rolling summary and the most
 * recent committed segments); flush_idle() drops contexts nobody holds
 * that have not been used for a while. Nothing is lost by unloading since
 * every segment and summary is already persisted.
 *
 * Lock order: write_mutex, then window_mutex. summary_mutex is never
 * taken while write_mutex is held.
 */
#ifndef novelforge_ORCHESTRATOR_PROJECT_CONTEXT_HPP
#define novelforge_ORCHESTRATOR_PROJECT_CONTEXT_HPP

#include <novelforge/context/context_window.hpp>
#include <novelforge/memory/store.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace novelforge {

struct ProjectContext {
    std::string project_id;

    std::mutex write_mutex;         // Serializes commits
    std::mutex window_mutex;        // Guards window
    std::mutex summary_mutex;       // Serializes summary folds

    ContextWindow window;
    std::atomic<int64_t> last_used_ms;

    ProjectContext(const std::string& id, const ContextWindowConfig& config);

private:
    ProjectContext(const ProjectContext&);
    ProjectContext& operator=(const ProjectContext&);
};

typedef std::shared_ptr<ProjectContext> ProjectContextPtr;

class ProjectRegistry {
public:
    ProjectRegistry(MemoryStore& memory, const ContextWindowConfig& window_config);

    // Loaded context for the project, restoring it from storage on first use
    Status acquire(const std::string& project_id, ProjectContextPtr& out);

    // Unload contexts idle for at least idle_ms that no request holds.
    // Returns how many were unloaded.
    size_t flush_idle(int64_t idle_ms);

    // False if the project is not loaded or still in use
    bool unload(const std::string& project_id);

    bool is_loaded(const std::string& project_id) const;
    size_t size() const;

private:
    MemoryStore& memory_;
    ContextWindowConfig window_config_;

    mutable std::mutex mutex_;
    std::map<std::string, ProjectContextPtr> projects_;

    Status load(ProjectContext& context);
};

} // namespace novelforge

#endif // novelforge_ORCHESTRATOR_PROJECT_CONTEXT_HPP
