#include <novelforge/orchestrator/orchestrator.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>

#include <chrono>

namespace novelforge {

std::string request_state_to_string(RequestState state) {
    switch (state) {
        case RequestState::PENDING: return "PENDING";
        case RequestState::CONTEXT_BUILT: return "CONTEXT_BUILT";
        case RequestState::GENERATED: return "GENERATED";
        case RequestState::CHECKED: return "CHECKED";
        case RequestState::ACCEPTED: return "ACCEPTED";
        case RequestState::BLOCKED: return "BLOCKED";
        case RequestState::RETRYING: return "RETRYING";
        case RequestState::COMMITTED: return "COMMITTED";
        case RequestState::FAILED: return "FAILED";
    }
    return "FAILED";
}

Json GenerationOutcome::to_json() const {
    Json j = Json::object();
    j["request_id"] = request_id;
    j["project_id"] = project_id;
    j["state"] = request_state_to_string(state);
    j["ok"] = status.ok();
    if (!status.ok()) {
        j["error"] = status.error;
        j["error_code"] = error_code_name(status.code);
    }
    j["text"] = text;
    j["context"] = context.to_json();
    j["findings"] = Json::array();
    for (size_t i = 0; i < findings.size(); ++i) {
        j["findings"].push_back(findings[i].to_json());
    }
    if (!memory_entry_id.empty()) j["memory_entry_id"] = memory_entry_id;
    j["consistency_retries"] = consistency_retries;
    j["transitions"] = Json::array();
    for (size_t i = 0; i < transitions.size(); ++i) {
        j["transitions"].push_back(request_state_to_string(transitions[i]));
    }
    j["graph_version"] = graph_version;
    return j;
}

// ============================================================================
// RequestHandle
// ============================================================================

RequestHandle::RequestHandle()
    : state_(std::make_shared<State>())
{}

const std::string& RequestHandle::request_id() const {
    return state_->request_id;
}

void RequestHandle::cancel() {
    state_->token.cancel();
}

bool RequestHandle::ready() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->done;
}

void RequestHandle::wait() const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    State* state = state_.get();
    state_->cv.wait(lock, [state] { return state->done; });
}

bool RequestHandle::wait_for(int64_t timeout_ms) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    State* state = state_.get();
    return state_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                               [state] { return state->done; });
}

const GenerationOutcome& RequestHandle::get() const {
    wait();
    return state_->outcome;
}

void RequestHandle::finish(const GenerationOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->outcome = outcome;
        state_->done = true;
    }
    state_->cv.notify_all();
}

// ============================================================================
// Orchestrator
// ============================================================================

Orchestrator::Orchestrator(MemoryStore& memory,
                           KnowledgeGraph& graph,
                           GenerationProvider& generator,
                           ExtractionProvider& extractor,
                           RecursiveSummarizer& summarizer,
                           QueryCache* cache,
                           const OrchestratorConfig& config)
    : memory_(memory)
    , graph_(graph)
    , generator_(generator)
    , extractor_(extractor)
    , summarizer_(summarizer)
    , cache_(cache)
    , config_(config)
    , assembler_(memory)
    , projects_(memory, config.window)
    , pool_(config.workers > 0 ? config.workers : 1)
{
    LOG_INFO("[Orchestrator] Ready: generator=%s extractor=%s workers=%zu max_consistency_retries=%d",
             generator_.provider_id().c_str(), extractor_.provider_id().c_str(),
             pool_.size(), config_.max_consistency_retries);
}

Orchestrator::~Orchestrator() {
    shutdown();
}

void Orchestrator::shutdown() {
    pool_.shutdown();
}

size_t Orchestrator::flush_idle() {
    return projects_.flush_idle(config_.project_idle_ms);
}

void Orchestrator::transition(GenerationOutcome& out, RequestState state) {
    out.state = state;
    out.transitions.push_back(state);
    LOG_DEBUG("[Orchestrator] Request %s -> %s",
              out.request_id.c_str(), request_state_to_string(state).c_str());
}

Status Orchestrator::fail(GenerationOutcome& out, const Status& status) {
    out.status = status;
    transition(out, RequestState::FAILED);
    if (status.code == ErrorCode::CORRUPTION) {
        LOG_ERROR("[Orchestrator] Request %s hit storage corruption in project %s: %s",
                  out.request_id.c_str(), out.project_id.c_str(), status.error.c_str());
    } else {
        LOG_WARN("[Orchestrator] Request %s failed: %s",
                 out.request_id.c_str(), status.to_string().c_str());
    }
    return status;
}

Status Orchestrator::generate(const std::string& context, const std::string& instruction,
                              const CancellationToken* cancel, std::string& text)
{
    return retry_transient(config_.retry, cancel, "generation", [&]() {
        return call_with_timeout([&](const CancellationToken& token) {
            CompletionResult result = generator_.generate(context, instruction, token);
            if (result.ok()) text = result.content;
            return result.status;
        }, config_.generation_timeout_ms, cancel, "generation", ErrorCode::GENERATION_TIMEOUT);
    });
}

Status Orchestrator::extract(const std::string& text, const CancellationToken* cancel,
                             std::vector<CandidateFact>& facts)
{
    return retry_transient(config_.retry, cancel, "extraction", [&]() {
        return call_with_timeout([&](const CancellationToken& token) {
            ExtractionResult result = extractor_.extract(text, token);
            if (result.ok()) facts = result.facts;
            return result.status;
        }, config_.extraction_timeout_ms, cancel, "extraction", ErrorCode::GENERATION_TIMEOUT);
    });
}

Status Orchestrator::run(const GenerationRequest& input, GenerationOutcome& out,
                         const CancellationToken* cancel)
{
    GenerationRequest request = input;
    if (request.request_id.empty()) request.request_id = generate_uuid();

    out = GenerationOutcome();
    out.request_id = request.request_id;
    out.project_id = request.project_id;
    out.transitions.push_back(RequestState::PENDING);

    if (trim(request.project_id).empty()) {
        return fail(out, Status::fail(ErrorCode::VALIDATION, "request needs a project id"));
    }
    if (trim(request.instruction).empty()) {
        return fail(out, Status::fail(ErrorCode::VALIDATION, "request needs an instruction"));
    }
    if (request.seq < 1) {
        return fail(out, Status::fail(ErrorCode::VALIDATION, "request seq must be >= 1"));
    }
    if (!request.metadata.is_object()) {
        return fail(out, Status::fail(ErrorCode::VALIDATION, "request metadata must be an object"));
    }

    projects_.flush_idle(config_.project_idle_ms);

    ProjectContextPtr project;
    Status s = projects_.acquire(request.project_id, project);
    if (!s.ok()) return fail(out, s);

    LOG_INFO("[Orchestrator] Request %s started for project %s (seq %lld)",
             request.request_id.c_str(), request.project_id.c_str(),
             static_cast<long long>(request.seq));

    // ------------------------------------------------------------------------
    // Context
    // ------------------------------------------------------------------------

    GraphSnapshot snapshot;
    s = retry_transient(config_.retry, cancel, "graph snapshot", [&]() {
        return graph_.snapshot(request.project_id, snapshot, false);
    });
    if (!s.ok()) return fail(out, s);

    std::vector<MemoryHit> hits;
    size_t top_k = request.top_k > 0 ? request.top_k : config_.top_k;
    std::string query = trim(request.query).empty() ? request.instruction : request.query;
    s = assembler_.retrieve_relevant(query, request.project_id, top_k, request.filter, hits, cancel);
    if (!s.ok()) return fail(out, s);

    std::vector<std::string> pinned = request.pinned_facts;
    if (!request.seed_keys.empty()) {
        Subgraph around = snapshot.subgraph(request.seed_keys, config_.subgraph_depth);
        std::vector<std::string> lines = around.render_facts();
        pinned.insert(pinned.end(), lines.begin(), lines.end());
    }

    std::vector<std::string> segments;
    std::string summary;
    {
        std::lock_guard<std::mutex> lock(project->window_mutex);
        segments = project->window.segments();
        summary = project->window.summary();
    }

    int64_t budget = request.token_budget > 0 ? request.token_budget : config_.token_budget;
    out.context = assembler_.build_context(segments, hits, request.outline, budget, pinned, summary);
    transition(out, RequestState::CONTEXT_BUILT);

    // ------------------------------------------------------------------------
    // Generate and check
    // ------------------------------------------------------------------------

    std::string instruction = request.instruction;
    StagedChanges staged;
    for (;;) {
        std::string text;
        s = generate(out.context.text, instruction, cancel, text);
        if (!s.ok()) return fail(out, s);
        out.text = text;
        transition(out, RequestState::GENERATED);

        std::vector<CandidateFact> facts;
        s = extract(text, cancel, facts);
        if (!s.ok()) return fail(out, s);

        CheckResult check = checker_.check(request.request_id, facts, snapshot, request.seq);
        out.findings = check.findings;
        transition(out, RequestState::CHECKED);

        if (!check.has_blocking()) {
            staged = check.staged;
            transition(out, RequestState::ACCEPTED);
            break;
        }

        if (out.consistency_retries >= config_.max_consistency_retries) {
            transition(out, RequestState::BLOCKED);
            out.status = Status::fail(ErrorCode::CONSISTENCY_BLOCKING,
                                      std::to_string(check.count(Severity::BLOCKING)) +
                                      " blocking consistency finding(s) after " +
                                      std::to_string(out.consistency_retries) + " retries");
            LOG_WARN("[Orchestrator] Request %s blocked: %s",
                     request.request_id.c_str(), out.status.error.c_str());
            return out.status;
        }

        out.consistency_retries++;
        transition(out, RequestState::RETRYING);
        LOG_INFO("[Orchestrator] Request %s: %zu blocking finding(s), regenerating (%d/%d)",
                 request.request_id.c_str(), check.count(Severity::BLOCKING),
                 out.consistency_retries, config_.max_consistency_retries);
        instruction = request.instruction + "\n\n" + check.corrective_instruction();
    }

    // ------------------------------------------------------------------------
    // Commit
    // ------------------------------------------------------------------------

    s = commit(request, *project, staged, cancel, out);
    if (!s.ok()) return fail(out, s);

    out.status = Status::ok_status();
    transition(out, RequestState::COMMITTED);
    LOG_INFO("[Orchestrator] Request %s committed entry %s (graph version %lld, %zu finding(s))",
             request.request_id.c_str(), out.memory_entry_id.c_str(),
             static_cast<long long>(out.graph_version), out.findings.size());
    return out.status;
}

Status Orchestrator::commit(const GenerationRequest& request, ProjectContext& project,
                            const StagedChanges& staged, const CancellationToken* cancel,
                            GenerationOutcome& out)
{
    MemoryEntry entry;
    entry.project_id = request.project_id;
    entry.kind = request.entry_kind;
    entry.content = out.text;
    entry.metadata = request.metadata;
    entry.metadata["request_id"] = request.request_id;
    entry.metadata["seq"] = request.seq;
    entry.metadata["segment"] = true;

    // Embed before taking the lock so the commit makes no provider call
    Status s = memory_.prepare(entry, cancel);
    if (!s.ok()) return s;

    std::vector<std::string> evicted;
    {
        std::lock_guard<std::mutex> lock(project.write_mutex);
        if (cancel && cancel->is_cancelled()) {
            return Status::fail(ErrorCode::CANCELLED, "request cancelled before commit");
        }

        std::string entry_id;
        int64_t version = 0;
        s = retry_transient(config_.retry, nullptr, "commit", [&]() {
            TransactionGuard tx(memory_.backend());
            if (!tx.status().ok()) return tx.status();

            Status cs = graph_.apply_staged(request.project_id, staged, request.request_id);
            if (!cs.ok()) return cs;

            MemoryEntry attempt = entry;
            cs = memory_.add(attempt);
            if (!cs.ok()) return cs;

            cs = graph_.bump_version(request.project_id, version);
            if (!cs.ok()) return cs;

            cs = tx.commit();
            if (cs.ok()) entry_id = attempt.id;
            return cs;
        });
        if (!s.ok()) return s;

        out.memory_entry_id = entry_id;
        out.graph_version = version;
        if (cache_) cache_->invalidate(request.project_id);

        std::lock_guard<std::mutex> window_lock(project.window_mutex);
        evicted = project.window.push(out.text);
        project.last_used_ms = monotonic_ms();
    }

    if (!evicted.empty()) fold_evicted(project, evicted, request.seq);
    return Status::ok_status();
}

void Orchestrator::fold_evicted(ProjectContext& project, const std::vector<std::string>& evicted,
                                int64_t seq)
{
    std::lock_guard<std::mutex> lock(project.summary_mutex);

    std::string previous;
    {
        std::lock_guard<std::mutex> window_lock(project.window_mutex);
        previous = project.window.summary();
    }

    FoldResult fold;
    Status s = summarizer_.fold(project.project_id, evicted, previous, fold, seq);
    if (!s.ok()) {
        LOG_ERROR("[Orchestrator] Folding %zu evicted segment(s) for project %s failed: %s",
                  evicted.size(), project.project_id.c_str(), s.to_string().c_str());
        return;
    }

    std::lock_guard<std::mutex> window_lock(project.window_mutex);
    project.window.set_summary(fold.summary);
}

RequestHandle Orchestrator::submit(const GenerationRequest& input) {
    GenerationRequest request = input;
    if (request.request_id.empty()) request.request_id = generate_uuid();

    RequestHandle handle;
    handle.state_->request_id = request.request_id;

    std::shared_ptr<RequestHandle::State> state = handle.state_;
    bool queued = pool_.enqueue([this, request, state]() {
        RequestHandle task_handle;
        task_handle.state_ = state;

        GenerationOutcome outcome;
        Status s = run(request, outcome, &state->token);
        LOG_DEBUG("[Orchestrator] Submitted request %s finished in state %s (%s)",
                  request.request_id.c_str(), request_state_to_string(outcome.state).c_str(),
                  s.ok() ? "ok" : s.to_string().c_str());
        task_handle.finish(outcome);
    });

    if (!queued) {
        GenerationOutcome outcome;
        outcome.request_id = request.request_id;
        outcome.project_id = request.project_id;
        outcome.transitions.push_back(RequestState::PENDING);
        fail(outcome, Status::fail(ErrorCode::CANCELLED, "orchestrator is shut down"));
        handle.finish(outcome);
    }
    return handle;
}

} // namespace novelforge
