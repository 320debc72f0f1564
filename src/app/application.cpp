/*
 * NovelForge C++ - Application Implementation
 *
 * Owns the lifecycle of every component used by a command line run.
 */
#include <novelforge/app/application.hpp>
#include <novelforge/core/http_client.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>

#include <iostream>
#include <csignal>
#include <cstdlib>
#include <fstream>

namespace novelforge {

const char* AppInfo::NAME = "NovelForge";
const char* AppInfo::VERSION = "1.0.0";

namespace {

const int EXIT_FAILED = 1;
const int EXIT_USAGE = 2;
const int EXIT_BLOCKED = 3;

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int sig) {
    (void)sig;
    g_interrupted = 1;
}

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - long-form story generation with memory\n\n"
              << "Usage: " << prog << " [--config FILE] <command> [options]\n\n"
              << "Commands:\n"
              << "  generate --project P --instruction TEXT [--seq N] [--outline TEXT]\n"
              << "           [--seed KEY]... [--pin FACT]... [--query TEXT]\n"
              << "  query    --project P --text TEXT [--top-k K]\n"
              << "  snapshot --project P\n"
              << "  rollback --project P --snapshot ID\n"
              << "  subgraph --project P --seed KEY [--depth D]\n\n"
              << "Options:\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

bool parse_int(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') return false;
    out = static_cast<int64_t>(value);
    return true;
}

bool file_exists(const std::string& path) {
    std::ifstream f(path.c_str());
    return f.good();
}

Json entry_to_json(const MemoryEntry& entry) {
    Json j = Json::object();
    j["id"] = entry.id;
    j["kind"] = memory_kind_to_string(entry.kind);
    j["content"] = entry.content;
    j["metadata"] = entry.metadata;
    j["version"] = entry.version;
    j["root_id"] = entry.root_id;
    j["created_at"] = format_timestamp_ms(entry.created_at);
    return j;
}

} // namespace

// ============================================================================
// CommandLine
// ============================================================================

std::string CommandLine::option(const std::string& name, const std::string& default_val) const {
    std::multimap<std::string, std::string>::const_iterator it = options.find(name);
    return it == options.end() ? default_val : it->second;
}

std::vector<std::string> CommandLine::options_named(const std::string& name) const {
    std::vector<std::string> values;
    typedef std::multimap<std::string, std::string>::const_iterator Iter;
    std::pair<Iter, Iter> range = options.equal_range(name);
    for (Iter it = range.first; it != range.second; ++it) {
        values.push_back(it->second);
    }
    return values;
}

Status CommandLine::parse(int argc, char* argv[], CommandLine& out) {
    out = CommandLine();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            out.help = true;
            continue;
        }
        if (arg == "-v" || arg == "--version") {
            out.version = true;
            continue;
        }
        if (starts_with(arg, "--")) {
            std::string name = arg.substr(2);
            if (name.empty() || i + 1 >= argc) {
                return Status::fail(ErrorCode::VALIDATION, "option " + arg + " needs a value");
            }
            std::string value = argv[++i];
            if (name == "config") {
                out.config_file = value;
                out.config_given = true;
            } else {
                out.options.insert(std::make_pair(name, value));
            }
            continue;
        }
        if (!out.command.empty()) {
            return Status::fail(ErrorCode::VALIDATION,
                                "unexpected argument '" + arg + "' after command " + out.command);
        }
        out.command = arg;
    }
    return Status::ok_status();
}

// ============================================================================
// Config mapping
// ============================================================================

RetryPolicy retry_policy_from(const Config& cfg) {
    RetryPolicy policy;
    policy.max_attempts = static_cast<int>(cfg.get_int("retry.max_attempts", policy.max_attempts));
    policy.initial_backoff_ms = cfg.get_int("retry.initial_backoff_ms", policy.initial_backoff_ms);
    policy.max_backoff_ms = cfg.get_int("retry.max_backoff_ms", policy.max_backoff_ms);
    if (policy.max_attempts < 1) policy.max_attempts = 1;
    return policy;
}

MemoryStoreConfig memory_config_from(const Config& cfg) {
    MemoryStoreConfig config;
    std::string policy = cfg.get_string("memory.reference_policy", "reject");
    if (!reference_policy_from_string(policy, config.reference_policy)) {
        LOG_WARN("[App] Unknown memory.reference_policy '%s', using reject", policy.c_str());
        config.reference_policy = ReferencePolicy::REJECT;
    }
    config.tie_epsilon = cfg.get_double("memory.tie_epsilon", config.tie_epsilon);
    config.embedding_timeout_ms = cfg.get_int("timeouts.embedding_ms", config.embedding_timeout_ms);
    config.retry = retry_policy_from(cfg);
    return config;
}

SummarizerConfig summarizer_config_from(const Config& cfg) {
    SummarizerConfig config;
    config.timeout_ms = cfg.get_int("timeouts.summarization_ms", config.timeout_ms);
    config.retry = retry_policy_from(cfg);
    return config;
}

OrchestratorConfig orchestrator_config_from(const Config& cfg) {
    OrchestratorConfig config;
    config.max_consistency_retries = static_cast<int>(
        cfg.get_int("orchestrator.max_consistency_retries", config.max_consistency_retries));
    config.retry = retry_policy_from(cfg);
    config.generation_timeout_ms = cfg.get_int("timeouts.generation_ms", config.generation_timeout_ms);
    config.extraction_timeout_ms = cfg.get_int("timeouts.extraction_ms", config.extraction_timeout_ms);
    config.top_k = static_cast<size_t>(cfg.get_int("context.top_k", static_cast<int64_t>(config.top_k)));
    config.token_budget = cfg.get_int("context.token_budget", config.token_budget);
    config.subgraph_depth = static_cast<int>(cfg.get_int("graph.subgraph_depth", config.subgraph_depth));
    config.window.max_segments = static_cast<size_t>(
        cfg.get_int("context.window_segments", static_cast<int64_t>(config.window.max_segments)));
    config.window.token_budget = cfg.get_int("context.window_tokens", config.window.token_budget);
    config.window.summary_token_budget = cfg.get_int("context.summary_tokens",
                                                     config.window.summary_token_budget);
    config.workers = static_cast<size_t>(
        cfg.get_int("orchestrator.workers", static_cast<int64_t>(config.workers)));
    config.project_idle_ms = cfg.get_int("orchestrator.project_idle_ms", config.project_idle_ms);
    if (config.max_consistency_retries < 0) config.max_consistency_retries = 0;
    return config;
}

// ============================================================================
// Application
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : exit_code_(0)
    , curl_ready_(false)
{}

void Application::setup_logging() {
    std::string log_level = config_.get_string("log_level", "info");
    Logger::instance().set_level(log_level_from_string(log_level));
}

Status Application::setup_storage() {
    std::string path = config_.get_string("storage.path", "novelforge.db");
    backend_.reset(new SqliteBackend());
    Status s = backend_->open(path);
    if (!s.ok()) {
        LOG_ERROR("[App] Cannot open storage at %s: %s", path.c_str(), s.to_string().c_str());
        return s;
    }
    LOG_INFO("[App] Storage ready at %s", path.c_str());
    return Status::ok_status();
}

Status Application::setup_providers() {
    llama_.reset(new LlamaCppProvider());
    if (!llama_->init(config_)) {
        return Status::fail(ErrorCode::PROVIDER, "failed to initialize the llama.cpp provider");
    }

    std::string embedding = to_lower(config_.get_string("embedding.provider", "hash"));
    if (embedding == "hash") {
        int dimension = static_cast<int>(config_.get_int("embedding.dimension", 256));
        if (dimension <= 0) {
            return Status::fail(ErrorCode::VALIDATION, "embedding.dimension must be positive");
        }
        hash_embedder_.reset(new HashEmbeddingProvider(dimension));
        LOG_INFO("[App] Using hash embeddings (dimension %d)", dimension);
    } else if (embedding == "llamacpp") {
        LOG_INFO("[App] Using llama.cpp embeddings");
    } else {
        return Status::fail(ErrorCode::VALIDATION, "unknown embedding.provider '" + embedding + "'");
    }
    return Status::ok_status();
}

void Application::setup_components() {
    if (config_.get_bool("cache.enabled", true)) {
        cache_.reset(new QueryCache(config_.get_int("cache.ttl_ms", 30000)));
    }

    EmbeddingProvider* embedder = hash_embedder_ ? static_cast<EmbeddingProvider*>(hash_embedder_.get())
                                                 : static_cast<EmbeddingProvider*>(llama_.get());

    graph_.reset(new KnowledgeGraph(*backend_, cache_.get()));
    memory_.reset(new MemoryStore(*backend_, *embedder, graph_.get(), cache_.get(),
                                  memory_config_from(config_)));
    summarizer_.reset(new RecursiveSummarizer(*llama_, *memory_, summarizer_config_from(config_)));
    orchestrator_.reset(new Orchestrator(*memory_, *graph_, *llama_, *llama_, *summarizer_,
                                         cache_.get(), orchestrator_config_from(config_)));
}

bool Application::init(int argc, char* argv[]) {
    Status s = CommandLine::parse(argc, argv, cmdline_);
    if (!s.ok()) {
        std::cerr << s.error << "\n\n";
        print_usage(argv[0]);
        exit_code_ = EXIT_USAGE;
        return false;
    }
    if (cmdline_.help) {
        print_usage(argv[0]);
        exit_code_ = 0;
        return false;
    }
    if (cmdline_.version) {
        print_version();
        exit_code_ = 0;
        return false;
    }
    if (cmdline_.command.empty()) {
        print_usage(argv[0]);
        exit_code_ = EXIT_USAGE;
        return false;
    }

    // Initialize libcurl globally (before threads start)
    HttpClient::global_init();
    curl_ready_ = true;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    if (cmdline_.config_given || file_exists(cmdline_.config_file)) {
        if (!config_.load_file(cmdline_.config_file)) {
            LOG_ERROR("[App] Failed to load config from %s: %s",
                      cmdline_.config_file.c_str(), config_.last_error().c_str());
            exit_code_ = EXIT_USAGE;
            return false;
        }
    }
    setup_logging();

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);
    if (!config_.source_path().empty()) {
        LOG_INFO("[App] Loaded config from %s", config_.source_path().c_str());
    } else {
        LOG_INFO("[App] No config file, using defaults");
    }

    s = setup_storage();
    if (s.ok()) s = setup_providers();
    if (!s.ok()) {
        exit_code_ = report_failure(s);
        return false;
    }
    setup_components();
    return true;
}

int Application::run() {
    const std::string& command = cmdline_.command;
    if (command == "generate") exit_code_ = cmd_generate();
    else if (command == "query") exit_code_ = cmd_query();
    else if (command == "snapshot") exit_code_ = cmd_snapshot();
    else if (command == "rollback") exit_code_ = cmd_rollback();
    else if (command == "subgraph") exit_code_ = cmd_subgraph();
    else {
        exit_code_ = report_failure(Status::fail(ErrorCode::VALIDATION, "unknown command '" + command + "'"));
    }
    return exit_code_;
}

void Application::shutdown() {
    LOG_DEBUG("[App] Shutting down...");

    if (orchestrator_) {
        orchestrator_->shutdown();
    }
    orchestrator_.reset();
    summarizer_.reset();
    memory_.reset();
    graph_.reset();
    cache_.reset();
    hash_embedder_.reset();
    llama_.reset();
    if (backend_) {
        backend_->close();
        backend_.reset();
    }

    if (curl_ready_) {
        HttpClient::global_cleanup();
        curl_ready_ = false;
    }
}

void Application::print_json(const Json& j) {
    std::cout << j.dump(2) << std::endl;
}

int Application::report_failure(const Status& status) {
    Json j = Json::object();
    j["ok"] = false;
    j["error"] = status.error;
    j["error_code"] = error_code_name(status.code);
    print_json(j);

    if (status.code == ErrorCode::VALIDATION) return EXIT_USAGE;
    if (status.code == ErrorCode::CONSISTENCY_BLOCKING) return EXIT_BLOCKED;
    return EXIT_FAILED;
}

// ============================================================================
// Commands
// ============================================================================

int Application::cmd_generate() {
    GenerationRequest request;
    request.project_id = cmdline_.option("project");
    request.instruction = cmdline_.option("instruction");
    request.outline = cmdline_.option("outline");
    request.query = cmdline_.option("query");
    request.seed_keys = cmdline_.options_named("seed");
    request.pinned_facts = cmdline_.options_named("pin");

    if (cmdline_.has_option("seq") && !parse_int(cmdline_.option("seq"), request.seq)) {
        return report_failure(Status::fail(ErrorCode::VALIDATION, "--seq must be an integer"));
    }

    RequestHandle handle = orchestrator_->submit(request);
    while (!handle.wait_for(100)) {
        if (g_interrupted) {
            LOG_WARN("[App] Interrupted, cancelling request %s", handle.request_id().c_str());
            handle.cancel();
            g_interrupted = 0;
        }
    }

    const GenerationOutcome& outcome = handle.get();
    print_json(outcome.to_json());
    if (outcome.status.ok()) return 0;
    if (outcome.status.code == ErrorCode::CONSISTENCY_BLOCKING) return EXIT_BLOCKED;
    if (outcome.status.code == ErrorCode::VALIDATION) return EXIT_USAGE;
    return EXIT_FAILED;
}

int Application::cmd_query() {
    std::string project = cmdline_.option("project");
    std::string text = cmdline_.option("text");

    int64_t top_k = config_.get_int("context.top_k", 8);
    if (cmdline_.has_option("top-k") && !parse_int(cmdline_.option("top-k"), top_k)) {
        return report_failure(Status::fail(ErrorCode::VALIDATION, "--top-k must be an integer"));
    }
    if (top_k < 0) {
        return report_failure(Status::fail(ErrorCode::VALIDATION, "--top-k must not be negative"));
    }

    std::vector<MemoryHit> hits;
    Status s = memory_->query(project, text, MemoryFilter(), static_cast<size_t>(top_k), hits);
    if (!s.ok()) return report_failure(s);

    Json j = Json::object();
    j["ok"] = true;
    j["hits"] = Json::array();
    for (size_t i = 0; i < hits.size(); ++i) {
        Json hit = entry_to_json(hits[i].entry);
        hit["similarity"] = hits[i].similarity;
        j["hits"].push_back(hit);
    }
    print_json(j);
    return 0;
}

int Application::cmd_snapshot() {
    std::string project = cmdline_.option("project");
    if (project.empty()) {
        return report_failure(Status::fail(ErrorCode::VALIDATION, "--project is required"));
    }

    GraphSnapshot snapshot;
    Status s = graph_->snapshot(project, snapshot, true);
    if (!s.ok()) return report_failure(s);

    Json j = Json::object();
    j["ok"] = true;
    j["snapshot_id"] = snapshot.id;
    j["graph_version"] = snapshot.graph_version;
    j["nodes"] = static_cast<uint64_t>(snapshot.nodes.size());
    j["edges"] = static_cast<uint64_t>(snapshot.edges.size());
    print_json(j);
    return 0;
}

int Application::cmd_rollback() {
    std::string project = cmdline_.option("project");
    std::string snapshot_id = cmdline_.option("snapshot");
    if (project.empty() || snapshot_id.empty()) {
        return report_failure(Status::fail(ErrorCode::VALIDATION, "--project and --snapshot are required"));
    }

    int64_t version = 0;
    Status s = graph_->rollback(project, snapshot_id, version);
    if (!s.ok()) return report_failure(s);

    Json j = Json::object();
    j["ok"] = true;
    j["snapshot_id"] = snapshot_id;
    j["graph_version"] = version;
    print_json(j);
    return 0;
}

int Application::cmd_subgraph() {
    std::string project = cmdline_.option("project");
    std::vector<std::string> seeds = cmdline_.options_named("seed");
    if (project.empty() || seeds.empty()) {
        return report_failure(Status::fail(ErrorCode::VALIDATION, "--project and --seed are required"));
    }

    int64_t depth = config_.get_int("graph.subgraph_depth", 2);
    if (cmdline_.has_option("depth") && !parse_int(cmdline_.option("depth"), depth)) {
        return report_failure(Status::fail(ErrorCode::VALIDATION, "--depth must be an integer"));
    }

    Subgraph subgraph;
    Status s = graph_->query_subgraph(project, seeds, static_cast<int>(depth), subgraph);
    if (!s.ok()) return report_failure(s);

    Json j = subgraph.to_json();
    j["ok"] = true;
    j["facts"] = subgraph.render_facts();
    print_json(j);
    return 0;
}

} // namespace novelforge
