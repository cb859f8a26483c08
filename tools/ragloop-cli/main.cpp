#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <stop_token>
#include <thread>

#include <CLI/CLI.hpp>

#include <ragloop/agent/retrieval_orchestrator.h>
#include <ragloop/config/pipeline_config.h>
#include <ragloop/core/text_utils.h>
#include <ragloop/search/embedding_cache.h>

namespace {

std::atomic<bool> g_interrupted{false};

void signalHandler(int) {
    g_interrupted = true;
}

constexpr int kExitInvalid = 2;
constexpr int kExitCancelled = 130;

bool setupLogging(const std::string& level, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!logFile.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 10 * 1024 * 1024, 3));
        }
        auto logger = std::make_shared<spdlog::logger>("ragloop", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::from_str(level));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return false;
    }
    return true;
}

ragloop::agent::OrchestratorCollaborators
buildCollaborators(const ragloop::config::PipelineConfig& cfg) {
    using namespace ragloop;
    auto transport = std::make_shared<net::CurlHttpTransport>();
    auto http = std::make_shared<net::JsonHttpClient>(transport, cfg.httpRetry);
    auto chat = std::make_shared<llm::OpenAiChatModel>(cfg.llm, http);

    agent::OrchestratorCollaborators c;
    c.embedder = std::make_shared<search::CachingEmbedder>(
        std::make_shared<llm::OpenAiEmbedder>(cfg.llm, http), cfg.embeddingCacheSize);
    c.dense = std::make_shared<search::QdrantDenseSearch>(cfg.dense, http);
    c.sparse = std::make_shared<search::ElasticSparseSearch>(cfg.sparse, http);
    c.planner = std::make_shared<agent::IntentPlanner>(chat);
    c.reranker = std::make_shared<search::RelevanceReranker>(chat);
    c.expander = std::make_shared<agent::QueryExpander>(chat);
    c.evaluator = std::make_shared<agent::QualityEvaluator>(chat);
    return c;
}

void printText(const std::string& query, const ragloop::agent::ExecutionResult& r) {
    using namespace ragloop;
    std::cout << "state: " << agent::stateToString(r.finalState) << " (" << r.attempts
              << " attempt" << (r.attempts == 1 ? "" : "s") << ")\n";
    std::cout << "plan: " << agent::actionTypeToString(r.plan.action)
              << (r.plan.needsRetrieval ? " (retrieval)" : " (no retrieval)") << "\n";
    if (r.plan.suggestedResponse) {
        std::cout << "suggested response: " << *r.plan.suggestedResponse << "\n";
    }
    if (r.finalQuery != query && !r.results.empty()) {
        std::cout << "answered with query: " << r.finalQuery << "\n";
    }
    std::cout << "\n";
    for (std::size_t i = 0; i < r.results.size(); ++i) {
        const auto& res = r.results[i];
        std::cout << "[" << i + 1 << "] " << res.source.sourcePath;
        if (res.source.page) {
            std::cout << " p." << *res.source.page;
        }
        std::cout << "  score=" << res.score << " (" << search::rankOriginToString(res.origin)
                  << ")\n    " << text::truncateUtf8(res.text, 200) << "\n";
    }
    std::cout << "\ntrace:\n";
    for (const auto& step : r.trace.steps()) {
        std::cout << "  " << agent::toJson(step).dump() << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"ragloop - hybrid retrieval with planning, reranking and self-correction"};

    std::string query;
    std::string config_path;
    std::string policy;
    std::string log_level;
    std::string log_file;
    std::size_t top_k = 0;
    int max_attempts = 0;
    bool no_rerank = false;
    bool no_quality_gate = false;
    bool json_output = false;

    app.add_option("query", query, "Question to retrieve passages for")->required();
    app.add_option("-c,--config", config_path, "Config file (default: ~/.config/ragloop/config.toml)");
    app.add_option("-p,--policy", policy, "Retry policy: reflective|expansion-only")
        ->check(CLI::IsMember({"reflective", "expansion-only"}));
    app.add_option("-k,--top-k", top_k, "Number of passages to return");
    app.add_option("--max-attempts", max_attempts, "Retrieval attempts before giving up");
    app.add_flag("--no-rerank", no_rerank, "Skip LLM reranking");
    app.add_flag("--no-quality-gate", no_quality_gate, "Skip quality evaluation");
    app.add_flag("--json", json_output, "Print the full result as JSON");
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.add_option("--log-file", log_file, "Log file path (optional)");
    CLI11_PARSE(app, argc, argv);

    // Command-line flags form the last configuration layer
    ragloop::config::ConfigValues overrides;
    if (!policy.empty()) {
        overrides["retrieval.policy"] = policy;
    }
    if (max_attempts > 0) {
        overrides["retrieval.max_attempts"] = std::to_string(max_attempts);
    }
    if (no_quality_gate) {
        overrides["retrieval.enable_quality_gate"] = "false";
    }
    if (no_rerank) {
        overrides["retrieval.rerank"] = "false";
    }
    if (!log_level.empty()) {
        overrides["logging.level"] = log_level;
    }

    auto loaded = ragloop::config::loadPipelineConfig(
        ragloop::config::get_config_path(config_path), overrides);
    if (!loaded) {
        std::cerr << "Configuration error: " << loaded.error().message << std::endl;
        return kExitInvalid;
    }
    auto cfg = std::move(loaded).value();

    if (!setupLogging(cfg.logLevel, log_file)) {
        return 1;
    }
    if (cfg.llm.apiKey.empty()) {
        spdlog::warn("No API key configured (set OPENAI_API_KEY or llm.api_key)");
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::stop_source cancel;
    std::jthread watcher([&cancel](std::stop_token done) {
        while (!done.stop_requested()) {
            if (g_interrupted) {
                spdlog::info("Interrupted, cancelling request");
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    int exitCode = 0;
    {
        ragloop::agent::RetrievalOrchestrator orchestrator(buildCollaborators(cfg),
                                                           cfg.orchestrator);
        auto outcome =
            orchestrator.execute(query, top_k > 0 ? top_k : cfg.finalTopK, cancel.get_token());
        if (!outcome) {
            const auto& err = outcome.error();
            std::cerr << err.message << std::endl;
            exitCode = err.code == ragloop::ErrorCode::OperationCancelled ? kExitCancelled
                                                                          : kExitInvalid;
        } else if (json_output) {
            std::cout << outcome.value().toJson().dump(2) << std::endl;
        } else {
            printText(query, outcome.value());
        }
    }
    watcher.request_stop();
    return exitCode;
}
