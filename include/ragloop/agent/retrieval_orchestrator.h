#pragma once

#include <ragloop/agent/execution_trace.h>
#include <ragloop/agent/intent_planner.h>
#include <ragloop/agent/plan.h>
#include <ragloop/agent/quality_evaluator.h>
#include <ragloop/agent/query.h>
#include <ragloop/agent/query_expander.h>
#include <ragloop/core/types.h>
#include <ragloop/search/ranked_result.h>
#include <ragloop/search/relevance_reranker.h>
#include <ragloop/search/retrieval_backends.h>

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace ragloop::agent {

/**
 * @brief Per-stage time limits; zero disables the limit for that stage
 */
struct StageTimeouts {
    std::chrono::milliseconds plan{8000};
    std::chrono::milliseconds dense{5000}; // embedding + dense search
    std::chrono::milliseconds sparse{5000};
    std::chrono::milliseconds rerank{15000};
    std::chrono::milliseconds expand{8000};
    std::chrono::milliseconds evaluate{10000};
};

/**
 * @brief How many retrieval attempts to make and whether to judge each one
 *
 * - reflective: two attempts; results are judged and a weak first attempt is reformulated.
 * - expansion-only: two attempts; the only retry is query expansion after an empty first
 *   attempt.
 */
struct RetrievalPolicy {
    std::string name = "reflective";
    int maxAttempts = 2;
    bool enableQualityGate = true;
    double qualityThreshold = 0.5;
    bool enableDecomposition = false;

    static RetrievalPolicy reflective();
    static RetrievalPolicy expansionOnly();
    static Result<RetrievalPolicy> fromName(std::string_view name);
};

struct OrchestratorConfig {
    RetrievalPolicy policy = RetrievalPolicy::reflective();
    std::size_t retrievalTopK = 20; // candidates requested from each retrieval path
    double rrfK = 60.0;
    bool enableReranking = true;
    std::size_t rerankCap = 10;
    QueryLimits limits;
    StageTimeouts timeouts;
    std::size_t workerThreads = 4; // used only when no executor is injected

    Result<void> validate() const;
};

enum class OrchestratorState { Planning, Retrieving, Evaluating, Expanding, Satisfied, Exhausted };

inline constexpr const char* stateToString(OrchestratorState state) noexcept {
    switch (state) {
        case OrchestratorState::Planning:
            return "planning";
        case OrchestratorState::Retrieving:
            return "retrieving";
        case OrchestratorState::Evaluating:
            return "evaluating";
        case OrchestratorState::Expanding:
            return "expanding";
        case OrchestratorState::Satisfied:
            return "satisfied";
        case OrchestratorState::Exhausted:
            return "exhausted";
    }
    return "unknown";
}

struct ExecutionResult {
    std::vector<search::RankedResult> results;
    ExecutionTrace trace;
    Plan plan;
    OrchestratorState finalState = OrchestratorState::Exhausted;
    int attempts = 0;       // retrieval attempts made
    std::string finalQuery; // query text that produced `results`

    nlohmann::json toJson() const;
};

/**
 * @brief Everything the orchestrator calls out to
 *
 * A missing retrieval collaborator degrades that path on every attempt; a missing planner,
 * expander or evaluator behaves like one that always fails. A missing reranker disables
 * reranking.
 */
struct OrchestratorCollaborators {
    std::shared_ptr<search::IEmbedder> embedder;
    std::shared_ptr<search::IDenseSearch> dense;
    std::shared_ptr<search::ISparseSearch> sparse;
    std::shared_ptr<IntentPlanner> planner;
    std::shared_ptr<search::RelevanceReranker> reranker;
    std::shared_ptr<QueryExpander> expander;
    std::shared_ptr<QualityEvaluator> evaluator;
};

/**
 * @brief Plan → retrieve → (evaluate) → satisfied | expand/reformulate → retrieve | exhausted
 *
 * Every collaborator failure degrades to a documented fallback; `execute` fails only for
 * invalid input (InvalidArgument) or caller cancellation (OperationCancelled). Safe to share
 * across concurrent requests.
 */
class RetrievalOrchestrator {
public:
    struct Statistics {
        std::atomic<uint64_t> requests{0};
        std::atomic<uint64_t> rejected{0};
        std::atomic<uint64_t> satisfied{0};
        std::atomic<uint64_t> exhausted{0};
        std::atomic<uint64_t> cancelled{0};
        std::atomic<uint64_t> degradedStages{0};
        std::atomic<uint64_t> retrievalAttempts{0};
    };

    RetrievalOrchestrator(OrchestratorCollaborators collaborators, OrchestratorConfig config = {},
                          std::optional<boost::asio::any_io_executor> executor = std::nullopt);
    ~RetrievalOrchestrator();

    RetrievalOrchestrator(const RetrievalOrchestrator&) = delete;
    RetrievalOrchestrator& operator=(const RetrievalOrchestrator&) = delete;

    Result<ExecutionResult> execute(const std::string& query, std::size_t topK,
                                    std::stop_token stop = {});

    const OrchestratorConfig& getConfig() const;
    const Statistics& getStatistics() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace ragloop::agent
