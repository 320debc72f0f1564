/*
 * NovelForge C++ - Generation Orchestrator
 *
 * Drives one generation request through
 *
 *   PENDING -> CONTEXT_BUILT -> GENERATED -> CHECKED
 *           -> ACCEPTED -> COMMITTED
 *           -> RETRYING -> GENERATED ...      (blocking findings, budget left)
 *           -> BLOCKED                        (blocking findings, budget spent)
 *   any unrecoverable failure or cancellation -> FAILED
 *
 * Retrieval and context assembly read a graph snapshot taken at request
 * start. The commit writes the memory entry, the staged graph changes and
 * the graph version bump in one storage transaction under the project's
 * write lock, so a request either lands completely or not at all.
 *
 * Provider calls run under a deadline and the caller's cancellation token;
 * transient failures are retried with backoff, separately from the
 * consistency retry budget.
 */
#ifndef novelforge_ORCHESTRATOR_ORCHESTRATOR_HPP
#define novelforge_ORCHESTRATOR_ORCHESTRATOR_HPP

#include <novelforge/orchestrator/project_context.hpp>
#include <novelforge/consistency/checker.hpp>
#include <novelforge/context/context_assembler.hpp>
#include <novelforge/context/summarizer.hpp>
#include <novelforge/graph/knowledge_graph.hpp>
#include <novelforge/memory/store.hpp>
#include <novelforge/core/thread_pool.hpp>
#include <novelforge/core/retry.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace novelforge {

enum class RequestState {
    PENDING,
    CONTEXT_BUILT,
    GENERATED,
    CHECKED,
    ACCEPTED,
    BLOCKED,
    RETRYING,
    COMMITTED,
    FAILED
};

std::string request_state_to_string(RequestState state);

struct OrchestratorConfig {
    int max_consistency_retries;        // Regenerations after blocking findings (default: 2)
    RetryPolicy retry;                  // Transient provider/storage failures
    int64_t generation_timeout_ms;
    int64_t extraction_timeout_ms;
    size_t top_k;                       // Retrieved memories per request
    int64_t token_budget;               // Prompt context budget
    int subgraph_depth;                 // Hops around the seed keys
    ContextWindowConfig window;
    size_t workers;                     // Threads for submit()
    int64_t project_idle_ms;            // Unload projects idle this long

    OrchestratorConfig()
        : max_consistency_retries(2)
        , generation_timeout_ms(120000)
        , extraction_timeout_ms(60000)
        , top_k(8)
        , token_budget(4000)
        , subgraph_depth(2)
        , workers(4)
        , project_idle_ms(600000) {}
};

struct GenerationRequest {
    std::string request_id;                 // Generated when empty
    std::string project_id;
    std::string instruction;
    std::string outline;
    std::vector<std::string> seed_keys;     // Graph seeds for pinned facts
    std::vector<std::string> pinned_facts;  // Always-included lines
    std::string query;                      // Retrieval text (default: instruction)
    int64_t seq;                            // Story sequence number, >= 1
    MemoryKind entry_kind;
    Json metadata;                          // Extra metadata for the committed entry
    int64_t token_budget;                   // 0 = configured default
    size_t top_k;                           // 0 = configured default
    MemoryFilter filter;

    GenerationRequest()
        : seq(1)
        , entry_kind(MemoryKind::EVENT)
        , metadata(Json::object())
        , token_budget(0)
        , top_k(0) {}
};

struct GenerationOutcome {
    std::string request_id;
    std::string project_id;
    RequestState state;
    Status status;
    std::string text;
    AssembledContext context;
    std::vector<ConsistencyFinding> findings;
    std::string memory_entry_id;            // Set once committed
    int consistency_retries;
    std::vector<RequestState> transitions;
    int64_t graph_version;                  // Version produced by the commit

    GenerationOutcome()
        : state(RequestState::PENDING)
        , consistency_retries(0)
        , graph_version(0) {}

    Json to_json() const;
};

// Handle to a submitted request
class RequestHandle {
public:
    RequestHandle();

    const std::string& request_id() const;

    // Ask the request to stop; an in-flight provider call is aborted
    void cancel();

    bool ready() const;
    void wait() const;
    // True if the request finished within timeout_ms
    bool wait_for(int64_t timeout_ms) const;

    // Blocks until the request finishes
    const GenerationOutcome& get() const;

private:
    friend class Orchestrator;

    struct State {
        std::string request_id;
        CancellationToken token;
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        bool done;
        GenerationOutcome outcome;

        State() : done(false) {}
    };

    std::shared_ptr<State> state_;

    void finish(const GenerationOutcome& outcome);
};

class Orchestrator {
public:
    Orchestrator(MemoryStore& memory,
                 KnowledgeGraph& graph,
                 GenerationProvider& generator,
                 ExtractionProvider& extractor,
                 RecursiveSummarizer& summarizer,
                 QueryCache* cache = nullptr,
                 const OrchestratorConfig& config = OrchestratorConfig());
    ~Orchestrator();

    // Run the request on the calling thread. out.status is returned.
    Status run(const GenerationRequest& request, GenerationOutcome& out,
               const CancellationToken* cancel = nullptr);

    // Run the request on the worker pool
    RequestHandle submit(const GenerationRequest& request);

    ProjectRegistry& projects() { return projects_; }
    const OrchestratorConfig& config() const { return config_; }

    // Unload idle project contexts
    size_t flush_idle();

    // Finish queued requests and stop the workers
    void shutdown();

private:
    MemoryStore& memory_;
    KnowledgeGraph& graph_;
    GenerationProvider& generator_;
    ExtractionProvider& extractor_;
    RecursiveSummarizer& summarizer_;
    QueryCache* cache_;
    OrchestratorConfig config_;

    ContextAssembler assembler_;
    ConsistencyChecker checker_;
    ProjectRegistry projects_;
    ThreadPool pool_;

    Status generate(const std::string& context, const std::string& instruction,
                    const CancellationToken* cancel, std::string& text);
    Status extract(const std::string& text, const CancellationToken* cancel,
                   std::vector<CandidateFact>& facts);
    Status commit(const GenerationRequest& request, ProjectContext& project,
                  const StagedChanges& staged, const CancellationToken* cancel,
                  GenerationOutcome& out);
    void fold_evicted(ProjectContext& project, const std::vector<std::string>& evicted,
                      int64_t seq);

    Status fail(GenerationOutcome& out, const Status& status);
    void transition(GenerationOutcome& out, RequestState state);
};

} // namespace novelforge

#endif // novelforge_ORCHESTRATOR_ORCHESTRATOR_HPP
