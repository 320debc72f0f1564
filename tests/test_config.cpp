#include <gtest/gtest.h>
#include <novelforge/app/application.hpp>
#include <novelforge/core/config.hpp>
#include <novelforge/core/retry.hpp>
#include <novelforge/core/thread_pool.hpp>
#include <novelforge/core/utils.hpp>
#include <novelforge/plugins/llamacpp/llamacpp.hpp>

#include <atomic>
#include <vector>

using namespace novelforge;

// ============================================================================
// Config
// ============================================================================

TEST(ConfigTest, NestedAndDottedKeys) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(
        "{\"context\": {\"token_budget\": 1200, \"top_k\": 4},"
        " \"timeouts.generation_ms\": 9000,"
        " \"storage\": {\"path\": \"data/story.db\"},"
        " \"cache\": {\"enabled\": false}}"));

    EXPECT_EQ(cfg.get_int("context.token_budget"), 1200);
    EXPECT_EQ(cfg.get_int("timeouts.generation_ms"), 9000);
    EXPECT_EQ(cfg.get_string("storage.path"), "data/story.db");
    EXPECT_FALSE(cfg.get_bool("cache.enabled", true));
    EXPECT_EQ(cfg.get_int("context.missing", 7), 7);
    EXPECT_EQ(cfg.get_string("context.token_budget", "none"), "none");
    EXPECT_TRUE(cfg.has("context.top_k"));
    EXPECT_FALSE(cfg.has("graph.subgraph_depth"));
}

TEST(ConfigTest, FailedLoadKeepsPreviousData) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string("{\"log\": {\"level\": \"debug\"}}"));

    EXPECT_FALSE(cfg.load_string("{not json"));
    EXPECT_FALSE(cfg.last_error().empty());
    EXPECT_EQ(cfg.get_string("log.level"), "debug");

    EXPECT_FALSE(cfg.load_string("[1, 2, 3]"));
    EXPECT_EQ(cfg.get_string("log.level"), "debug");
}

TEST(ConfigTest, SettersCreateNestedObjects) {
    Config cfg;
    cfg.set_int("retry.max_attempts", 5);
    cfg.set_string("llamacpp.url", "http://localhost:9090");
    cfg.set_bool("cache.enabled", true);

    EXPECT_EQ(cfg.get_int("retry.max_attempts"), 5);
    EXPECT_TRUE(cfg.data()["llamacpp"].is_object());
    EXPECT_EQ(cfg.get_string("llamacpp.url"), "http://localhost:9090");
    EXPECT_TRUE(cfg.get_bool("cache.enabled"));
}

TEST(ConfigTest, LoadFileReportsMissingFile) {
    Config cfg;
    EXPECT_FALSE(cfg.load_file("/tmp/novelforge_no_such_config_" + generate_uuid() + ".json"));
    EXPECT_FALSE(cfg.last_error().empty());
    EXPECT_TRUE(cfg.source_path().empty());
}

TEST(ConfigTest, OrchestratorSettingsFromConfig) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(
        "{\"orchestrator\": {\"max_consistency_retries\": 4, \"workers\": 2,"
        "                    \"project_idle_ms\": 1000},"
        " \"timeouts\": {\"generation_ms\": 5000, \"extraction_ms\": 2500},"
        " \"context\": {\"top_k\": 3, \"token_budget\": 900, \"window_segments\": 5,"
        "               \"window_tokens\": 800, \"summary_tokens\": 200},"
        " \"graph\": {\"subgraph_depth\": 1},"
        " \"retry\": {\"max_attempts\": 6, \"initial_backoff_ms\": 10},"
        " \"memory\": {\"reference_policy\": \"auto_create\"}}"));

    OrchestratorConfig config = orchestrator_config_from(cfg);
    EXPECT_EQ(config.max_consistency_retries, 4);
    EXPECT_EQ(config.workers, 2u);
    EXPECT_EQ(config.project_idle_ms, 1000);
    EXPECT_EQ(config.generation_timeout_ms, 5000);
    EXPECT_EQ(config.extraction_timeout_ms, 2500);
    EXPECT_EQ(config.top_k, 3u);
    EXPECT_EQ(config.token_budget, 900);
    EXPECT_EQ(config.subgraph_depth, 1);
    EXPECT_EQ(config.window.max_segments, 5u);
    EXPECT_EQ(config.window.token_budget, 800);
    EXPECT_EQ(config.window.summary_token_budget, 200);
    EXPECT_EQ(config.retry.max_attempts, 6);
    EXPECT_EQ(config.retry.initial_backoff_ms, 10);

    MemoryStoreConfig memory = memory_config_from(cfg);
    EXPECT_EQ(memory.reference_policy, ReferencePolicy::AUTO_CREATE);
}

TEST(ConfigTest, DefaultsWhenKeysAreAbsent) {
    Config cfg;
    OrchestratorConfig config = orchestrator_config_from(cfg);
    EXPECT_EQ(config.max_consistency_retries, 2);
    EXPECT_EQ(config.token_budget, 4000);
    EXPECT_EQ(config.window.max_segments, 8u);

    ASSERT_TRUE(cfg.load_string("{\"memory\": {\"reference_policy\": \"sometimes\"}}"));
    EXPECT_EQ(memory_config_from(cfg).reference_policy, ReferencePolicy::REJECT);
}

// ============================================================================
// CommandLine
// ============================================================================

TEST(CommandLineTest, ParsesCommandAndOptions) {
    const char* args[] = {"novelforge", "--config", "story.json", "generate",
                          "--project", "p1", "--instruction", "Write the duel",
                          "--seed", "lihang", "--seed", "character:wei"};
    CommandLine cmd;
    Status s = CommandLine::parse(12, const_cast<char**>(args), cmd);
    ASSERT_TRUE(s.ok()) << s.to_string();

    EXPECT_EQ(cmd.command, "generate");
    EXPECT_EQ(cmd.config_file, "story.json");
    EXPECT_TRUE(cmd.config_given);
    EXPECT_EQ(cmd.option("project"), "p1");
    EXPECT_EQ(cmd.option("instruction"), "Write the duel");
    EXPECT_EQ(cmd.option("outline", "none"), "none");

    std::vector<std::string> seeds = cmd.options_named("seed");
    ASSERT_EQ(seeds.size(), 2u);
    EXPECT_EQ(seeds[0], "lihang");
    EXPECT_EQ(seeds[1], "character:wei");
}

TEST(CommandLineTest, HelpAndVersionFlags) {
    const char* args[] = {"novelforge", "-h", "--version"};
    CommandLine cmd;
    ASSERT_TRUE(CommandLine::parse(3, const_cast<char**>(args), cmd).ok());
    EXPECT_TRUE(cmd.help);
    EXPECT_TRUE(cmd.version);
    EXPECT_FALSE(cmd.config_given);
    EXPECT_EQ(cmd.config_file, "novelforge.json");
}

TEST(CommandLineTest, OptionWithoutValueIsRejected) {
    const char* args[] = {"novelforge", "query", "--project"};
    CommandLine cmd;
    Status s = CommandLine::parse(3, const_cast<char**>(args), cmd);
    EXPECT_FALSE(s.ok());
    EXPECT_EQ(s.code, ErrorCode::VALIDATION);
}

TEST(CommandLineTest, SecondCommandWordIsRejected) {
    const char* args[] = {"novelforge", "snapshot", "rollback"};
    CommandLine cmd;
    Status s = CommandLine::parse(3, const_cast<char**>(args), cmd);
    EXPECT_FALSE(s.ok());
    EXPECT_EQ(s.code, ErrorCode::VALIDATION);
}

// ============================================================================
// Retry & timeouts
// ============================================================================

TEST(RetryTest, RetriesTransientFailuresOnly) {
    RetryPolicy policy;
    policy.max_attempts = 4;
    policy.initial_backoff_ms = 1;
    policy.max_backoff_ms = 2;

    int calls = 0;
    Status s = retry_transient(policy, nullptr, "flaky", [&]() {
        ++calls;
        if (calls < 3) return Status::transient_failure(ErrorCode::PROVIDER, "busy");
        return Status::ok_status();
    });
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(calls, 3);

    calls = 0;
    s = retry_transient(policy, nullptr, "broken", [&]() {
        ++calls;
        return Status::fail(ErrorCode::VALIDATION, "bad input");
    });
    EXPECT_EQ(s.code, ErrorCode::VALIDATION);
    EXPECT_EQ(calls, 1);

    calls = 0;
    s = retry_transient(policy, nullptr, "exhausted", [&]() {
        ++calls;
        return Status::transient_failure(ErrorCode::STORAGE, "locked");
    });
    EXPECT_EQ(s.code, ErrorCode::STORAGE);
    EXPECT_TRUE(s.transient);
    EXPECT_EQ(calls, 4);
}

TEST(RetryTest, CancelledTokenStopsBeforeFirstAttempt) {
    CancellationToken token;
    token.cancel();

    int calls = 0;
    Status s = retry_transient(RetryPolicy(), &token, "cancelled", [&]() {
        ++calls;
        return Status::ok_status();
    });
    EXPECT_EQ(s.code, ErrorCode::CANCELLED);
    EXPECT_EQ(calls, 0);
}

TEST(RetryTest, BackoffGrowsAndIsCapped) {
    RetryPolicy policy;
    policy.initial_backoff_ms = 100;
    policy.multiplier = 2.0;
    policy.max_backoff_ms = 300;
    EXPECT_EQ(policy.backoff_for(1), 100);
    EXPECT_EQ(policy.backoff_for(2), 200);
    EXPECT_EQ(policy.backoff_for(3), 300);
    EXPECT_EQ(policy.backoff_for(8), 300);
}

TEST(RetryTest, CallWithTimeoutAbortsSlowCall) {
    std::atomic<bool> saw_cancel(false);
    Status s = call_with_timeout([&](const CancellationToken& token) {
        if (token.wait_for(5000)) saw_cancel = true;
        return Status::ok_status();
    }, 50, nullptr, "slow call");

    EXPECT_EQ(s.code, ErrorCode::GENERATION_TIMEOUT);
    EXPECT_FALSE(s.transient);
    EXPECT_TRUE(saw_cancel);
}

TEST(RetryTest, CallWithTimeoutPassesResultThrough) {
    Status s = call_with_timeout([](const CancellationToken&) {
        return Status::fail(ErrorCode::PROVIDER, "HTTP 400");
    }, 1000, nullptr, "fast call");
    EXPECT_EQ(s.code, ErrorCode::PROVIDER);
    EXPECT_EQ(s.error, "HTTP 400");
}

TEST(RetryTest, CallerCancellationWins) {
    CancellationToken caller;
    caller.cancel();
    Status s = call_with_timeout([](const CancellationToken& token) {
        token.wait_for(5000);
        return Status::ok_status();
    }, 0, &caller, "cancelled call");
    EXPECT_EQ(s.code, ErrorCode::CANCELLED);
}

// ============================================================================
// ThreadPool
// ============================================================================

TEST(ThreadPoolTest, RunsQueuedTasksBeforeShutdown) {
    std::atomic<int> done(0);
    ThreadPool pool(3);
    EXPECT_EQ(pool.size(), 3u);

    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(pool.enqueue([&done]() { done++; }));
    }
    pool.shutdown();
    EXPECT_EQ(done.load(), 20);
    EXPECT_FALSE(pool.enqueue([&done]() { done++; }));
    pool.shutdown();
}

// ============================================================================
// Utilities
// ============================================================================

TEST(UtilsTest, StringHelpers) {
    EXPECT_EQ(trim("  chapter one \n"), "chapter one");
    EXPECT_EQ(to_lower("LiHang"), "lihang");
    EXPECT_TRUE(starts_with("character:lihang", "character:"));

    std::vector<std::string> parts = split("a.b.c", '.');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(join(parts, "/"), "a/b/c");

    // Never cuts a three-byte character in half
    EXPECT_EQ(truncate_safe("\xE6\x9D\x8E\xE8\x88\xAA", 4), "\xE6\x9D\x8E");
    EXPECT_EQ(utf8_code_points("\xE6\x9D\x8E" "a").size(), 2u);
}

TEST(UtilsTest, HashesAndIds) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    std::string a = generate_uuid();
    std::string b = generate_uuid();
    EXPECT_EQ(a.size(), 36u);
    EXPECT_NE(a, b);
    EXPECT_EQ(format_timestamp_ms(0), "1970-01-01T00:00:00Z");
}

// ============================================================================
// Extraction replies
// ============================================================================

TEST(LlamaCppTest, ParsesFactArrayInsideChatter) {
    std::string reply =
        "Here are the facts:\n"
        "[{\"kind\": \"event\", \"event_kind\": \"death\", \"participants\": [\"lihang\"], \"seq\": 5},"
        " {\"kind\": \"location_change\", \"character\": \"wei\", \"location\": \"harbor\"}]\n"
        "Let me know if you need more.";

    std::vector<CandidateFact> facts;
    Status s = LlamaCppProvider::parse_facts(reply, facts);
    ASSERT_TRUE(s.ok()) << s.to_string();
    ASSERT_EQ(facts.size(), 2u);
    EXPECT_EQ(facts[0].kind(), FactKind::EVENT);
    EXPECT_EQ(facts[0].seq, 5);
    EXPECT_EQ(facts[1].kind(), FactKind::LOCATION_CHANGE);
}

TEST(LlamaCppTest, ReplyWithoutArrayIsRejected) {
    std::vector<CandidateFact> facts;
    Status s = LlamaCppProvider::parse_facts("I could not find any facts.", facts);
    EXPECT_EQ(s.code, ErrorCode::VALIDATION);

    s = LlamaCppProvider::parse_facts("[{\"kind\": \"event\"}]", facts);
    EXPECT_EQ(s.code, ErrorCode::VALIDATION);
}

TEST(LlamaCppTest, InitReadsServerSettings) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(
        "{\"llamacpp\": {\"url\": \"http://127.0.0.1:8080/\", \"model\": \"qwen2.5-7b\"}}"));
    LlamaCppProvider provider;
    EXPECT_TRUE(provider.init(cfg));
    EXPECT_TRUE(provider.is_initialized());
    EXPECT_EQ(provider.provider_id(), "llamacpp");
    EXPECT_EQ(provider.default_model(), "qwen2.5-7b");
}
