/*
 * NovelForge C++ - Application
 *
 * Command-line front end. Builds storage, providers, memory, graph and the
 * orchestrator from the JSON config, runs one command and prints its
 * result as JSON on stdout.
 *
 * Usage:
 *   novelforge [--config FILE] <command> [options]
 *
 *   generate --project P --instruction TEXT [--seq N] [--outline TEXT]
 *            [--seed KEY]... [--pin FACT]... [--query TEXT]
 *   query    --project P --text TEXT [--top-k K]
 *   snapshot --project P
 *   rollback --project P --snapshot ID
 *   subgraph --project P --seed KEY [--depth D]
 */
#ifndef novelforge_APP_APPLICATION_HPP
#define novelforge_APP_APPLICATION_HPP

#include <novelforge/core/config.hpp>
#include <novelforge/core/status.hpp>
#include <novelforge/storage/sqlite_backend.hpp>
#include <novelforge/ai/hash_embedding.hpp>
#include <novelforge/plugins/llamacpp/llamacpp.hpp>
#include <novelforge/memory/query_cache.hpp>
#include <novelforge/memory/store.hpp>
#include <novelforge/graph/knowledge_graph.hpp>
#include <novelforge/context/summarizer.hpp>
#include <novelforge/orchestrator/orchestrator.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace novelforge {

struct AppInfo {
    static const char* NAME;
    static const char* VERSION;
};

struct CommandLine {
    std::string config_file;
    bool config_given;                  // --config was passed explicitly
    std::string command;
    std::multimap<std::string, std::string> options;   // "--name value" pairs, name without dashes
    bool help;
    bool version;

    CommandLine() : config_file("novelforge.json"), config_given(false), help(false), version(false) {}

    std::string option(const std::string& name, const std::string& default_val = "") const;
    std::vector<std::string> options_named(const std::string& name) const;
    bool has_option(const std::string& name) const { return options.count(name) > 0; }

    // VALIDATION on a missing option value or a second command word
    static Status parse(int argc, char* argv[], CommandLine& out);
};

// Component settings read from the config keys
OrchestratorConfig orchestrator_config_from(const Config& cfg);
MemoryStoreConfig memory_config_from(const Config& cfg);
SummarizerConfig summarizer_config_from(const Config& cfg);
RetryPolicy retry_policy_from(const Config& cfg);

class Application {
public:
    static Application& instance();

    // False for --help/--version or fatal errors; exit_code() tells which
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    int exit_code() const { return exit_code_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    Config config_;
    CommandLine cmdline_;
    int exit_code_;
    bool curl_ready_;

    std::unique_ptr<SqliteBackend> backend_;
    std::unique_ptr<HashEmbeddingProvider> hash_embedder_;
    std::unique_ptr<LlamaCppProvider> llama_;
    std::unique_ptr<QueryCache> cache_;
    std::unique_ptr<KnowledgeGraph> graph_;
    std::unique_ptr<MemoryStore> memory_;
    std::unique_ptr<RecursiveSummarizer> summarizer_;
    std::unique_ptr<Orchestrator> orchestrator_;

    void setup_logging();
    Status setup_storage();
    Status setup_providers();
    void setup_components();

    int cmd_generate();
    int cmd_query();
    int cmd_snapshot();
    int cmd_rollback();
    int cmd_subgraph();

    // Prints {"ok": false, ...} and returns the exit code for the failure
    int report_failure(const Status& status);
    void print_json(const Json& j);
};

} // namespace novelforge

#endif // novelforge_APP_APPLICATION_HPP
