#include <ragloop/agent/retrieval_orchestrator.h>
#include <ragloop/agent/stage_runner.h>
#include <ragloop/core/text_utils.h>
#include <ragloop/search/rank_fusion.h>

#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace ragloop::agent {

using search::RankedResult;

namespace {

// Clamps to the last alternative; an empty list falls back to the original query
const std::string& pickAlternative(const std::vector<std::string>& alternatives, int index,
                                   const std::string& original) {
    if (alternatives.empty()) {
        return original;
    }
    const auto idx = std::min<std::size_t>(static_cast<std::size_t>(index), alternatives.size() - 1);
    return alternatives[idx];
}

} // namespace

RetrievalPolicy RetrievalPolicy::reflective() {
    return RetrievalPolicy{"reflective", 2, true, 0.5, false};
}

RetrievalPolicy RetrievalPolicy::expansionOnly() {
    return RetrievalPolicy{"expansion-only", 2, false, 0.5, false};
}

Result<RetrievalPolicy> RetrievalPolicy::fromName(std::string_view name) {
    if (name == "reflective") {
        return reflective();
    }
    if (name == "expansion-only" || name == "expansion_only") {
        return expansionOnly();
    }
    return Error{ErrorCode::InvalidArgument, "unknown retrieval policy '" + std::string(name) +
                                                 "' (expected reflective or expansion-only)"};
}

Result<void> OrchestratorConfig::validate() const {
    if (policy.maxAttempts < 1) {
        return Error{ErrorCode::InvalidArgument, "max_attempts must be at least 1"};
    }
    if (policy.qualityThreshold < 0.0 || policy.qualityThreshold > 1.0) {
        return Error{ErrorCode::InvalidArgument, "quality_threshold must be within [0, 1]"};
    }
    if (rrfK <= 0.0) {
        return Error{ErrorCode::InvalidArgument, "rrf_k must be positive"};
    }
    if (rerankCap < 1) {
        return Error{ErrorCode::InvalidArgument, "rerank_cap must be at least 1"};
    }
    if (retrievalTopK < 1) {
        return Error{ErrorCode::InvalidArgument, "retrieval_top_k must be at least 1"};
    }
    if (limits.maxQueryChars < 1 || limits.maxTopK < 1) {
        return Error{ErrorCode::InvalidArgument, "query limits must be at least 1"};
    }
    return {};
}

nlohmann::json ExecutionResult::toJson() const {
    nlohmann::json j;
    j["state"] = stateToString(finalState);
    j["attempts"] = attempts;
    j["final_query"] = text::sanitizeUtf8(finalQuery);
    j["plan"] = {{"needs_retrieval", plan.needsRetrieval},
                 {"action", actionTypeToString(plan.action)},
                 {"reasoning", text::sanitizeUtf8(plan.reasoning)}};
    if (plan.suggestedResponse) {
        j["plan"]["suggested_response"] = text::sanitizeUtf8(*plan.suggestedResponse);
    }
    j["results"] = search::toJson(results);
    j["trace"] = trace.toJson();
    return j;
}

class RetrievalOrchestrator::Impl {
public:
    Impl(OrchestratorCollaborators collaborators, OrchestratorConfig config,
         std::optional<boost::asio::any_io_executor> executor)
        : c_(std::move(collaborators)), config_(std::move(config)) {
        if (executor) {
            executor_ = *executor;
        } else {
            ownedPool_ = std::make_unique<boost::asio::thread_pool>(
                std::max<std::size_t>(config_.workerThreads, 2));
            executor_ = ownedPool_->get_executor();
        }
    }

    ~Impl() {
        if (ownedPool_) {
            ownedPool_->join();
        }
    }

    Result<ExecutionResult> execute(const std::string& queryText, std::size_t topK,
                                    std::stop_token stop);

    OrchestratorCollaborators c_;
    OrchestratorConfig config_;
    std::unique_ptr<boost::asio::thread_pool> ownedPool_;
    boost::asio::any_io_executor executor_;
    Statistics stats_;

private:
    struct Attempt {
        std::vector<RankedResult> results;
        std::string query;
        double score = 0.0;
    };

    void transition(OrchestratorState& state, OrchestratorState next) const {
        spdlog::debug("[Orchestrator] {} -> {}", stateToString(state), stateToString(next));
        state = next;
    }

    void noteDegraded(const char* stage, const Error& error) {
        stats_.degradedStages.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[Orchestrator] {} stage degraded: {}", stage, error.message);
    }

    Result<ExecutionResult> cancelled(ExecutionTrace& trace) {
        TraceStep step;
        step.kind = StepKind::Cancelled;
        trace.append(std::move(step));
        stats_.cancelled.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("[Orchestrator] request cancelled after {} trace steps", trace.size());
        return Error{ErrorCode::OperationCancelled, "request cancelled by caller"};
    }

    Plan runPlanner(const Query& query, std::stop_token stop);
    std::optional<std::vector<RankedResult>> runAttempt(const std::string& text, std::size_t topK,
                                                        int attempt, ExecutionTrace& trace,
                                                        std::stop_token stop);
    QualityEvaluation runEvaluator(const Query& query, const std::vector<RankedResult>& results,
                                   int attempt, std::stop_token stop);
    QueryExpansion runExpander(const Query& query, std::stop_token stop);
    QueryDecomposition runDecomposer(const Query& query, std::stop_token stop);
};

Plan RetrievalOrchestrator::Impl::runPlanner(const Query& query, std::stop_token stop) {
    auto stage = launchStage(executor_, "plan", config_.timeouts.plan,
                             [planner = c_.planner, text = query.text()](
                                 std::stop_token st) -> Result<Plan> {
                                 if (!planner) {
                                     return IntentPlanner::failOpen("no planner configured");
                                 }
                                 return planner->plan(text, st);
                             });
    auto planned = stage.await(stop);
    if (planned) {
        return planned.value();
    }
    if (!stop.stop_requested()) {
        noteDegraded("plan", planned.error());
    }
    return IntentPlanner::failOpen(planned.error().message);
}

std::optional<std::vector<RankedResult>>
RetrievalOrchestrator::Impl::runAttempt(const std::string& text, std::size_t topK, int attempt,
                                        ExecutionTrace& trace, std::stop_token stop) {
    using ResultList = std::vector<RankedResult>;
    stats_.retrievalAttempts.fetch_add(1, std::memory_order_relaxed);
    const auto started = std::chrono::steady_clock::now();
    const auto perPath = config_.retrievalTopK;

    // Dense (embed + search) and sparse paths run concurrently
    auto denseStage = launchStage(
        executor_, "dense", config_.timeouts.dense,
        [embedder = c_.embedder, dense = c_.dense, text, perPath](
            std::stop_token st) -> Result<ResultList> {
            if (!embedder || !dense) {
                return Error{ErrorCode::NotInitialized, "dense retrieval not configured"};
            }
            auto embedding = embedder->embedQuery(text, st);
            if (!embedding) {
                return embedding.error();
            }
            return dense->search(embedding.value(), perPath, st);
        });
    auto sparseStage = launchStage(executor_, "sparse", config_.timeouts.sparse,
                                   [sparse = c_.sparse, text, perPath](
                                       std::stop_token st) -> Result<ResultList> {
                                       if (!sparse) {
                                           return Error{ErrorCode::NotInitialized,
                                                        "sparse retrieval not configured"};
                                       }
                                       return sparse->search(text, perPath, st);
                                   });

    std::vector<std::string> degraded;
    auto collect = [&](PendingStage<ResultList>& stage) -> ResultList {
        auto res = stage.await(stop);
        if (!res) {
            if (!stop.stop_requested()) {
                noteDegraded(stage.name().c_str(), res.error());
                degraded.push_back(stage.name() + ": " + res.error().message);
            }
            return {};
        }
        ResultList list = std::move(res).value();
        if (list.size() > perPath) {
            list.resize(perPath);
        }
        return list;
    };
    ResultList denseResults = collect(denseStage);
    ResultList sparseResults = collect(sparseStage);
    if (stop.stop_requested()) {
        return std::nullopt;
    }

    auto fused = search::RankFusion(config_.rrfK).fuse(denseResults, sparseResults);
    ResultList ordered;
    if (!fused.empty() && config_.enableReranking && c_.reranker) {
        auto rerankStage = launchStage(
            executor_, "rerank", config_.timeouts.rerank,
            [reranker = c_.reranker, text, fused, cap = config_.rerankCap](
                std::stop_token st) -> Result<search::RerankOutcome> {
                return reranker->rerank(text, fused, cap, st);
            });
        auto reranked = rerankStage.await(stop);
        if (stop.stop_requested()) {
            return std::nullopt;
        }
        search::RerankOutcome outcome =
            reranked ? std::move(reranked).value()
                     : search::RelevanceReranker::fallback(fused, reranked.error().message);
        if (!reranked) {
            noteDegraded("rerank", reranked.error());
        } else if (outcome.degraded()) {
            stats_.degradedStages.fetch_add(1, std::memory_order_relaxed);
        }
        if (outcome.degraded()) {
            degraded.push_back("rerank: " + outcome.failureReason);
        }
        ordered = std::move(outcome.items);
    } else {
        ordered = std::move(fused.items);
    }
    if (ordered.size() > topK) {
        ordered.resize(topK);
    }

    TraceStep step;
    step.kind = StepKind::Retrieve;
    step.attempt = attempt;
    step.query = text;
    step.resultCount = ordered.size();
    step.degraded = std::move(degraded);
    step.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    trace.append(std::move(step));

    spdlog::debug("[Orchestrator] attempt {}: {} dense + {} sparse -> {} results", attempt,
                  denseResults.size(), sparseResults.size(), ordered.size());
    return ordered;
}

QualityEvaluation RetrievalOrchestrator::Impl::runEvaluator(const Query& query,
                                                            const std::vector<RankedResult>& results,
                                                            int attempt, std::stop_token stop) {
    std::vector<std::string> passages;
    passages.reserve(results.size());
    for (const auto& r : results) {
        passages.push_back(r.text);
    }
    auto stage = launchStage(executor_, "evaluate", config_.timeouts.evaluate,
                             [evaluator = c_.evaluator, text = query.text(),
                              passages = std::move(passages),
                              attempt](std::stop_token st) -> Result<QualityEvaluation> {
                                 if (!evaluator) {
                                     return QualityEvaluator::failOpen("no evaluator configured");
                                 }
                                 return evaluator->evaluate(text, passages, attempt, st);
                             });
    auto evaluated = stage.await(stop);
    if (evaluated) {
        return std::move(evaluated).value();
    }
    if (!stop.stop_requested()) {
        noteDegraded("evaluate", evaluated.error());
    }
    return QualityEvaluator::failOpen(evaluated.error().message);
}

QueryExpansion RetrievalOrchestrator::Impl::runExpander(const Query& query, std::stop_token stop) {
    auto stage = launchStage(executor_, "expand", config_.timeouts.expand,
                             [expander = c_.expander, text = query.text()](
                                 std::stop_token st) -> Result<QueryExpansion> {
                                 if (!expander) {
                                     return QueryExpander::fallbackExpansion(
                                         text, "no expander configured");
                                 }
                                 return expander->expand(text, st);
                             });
    auto expanded = stage.await(stop);
    if (expanded) {
        return std::move(expanded).value();
    }
    if (!stop.stop_requested()) {
        noteDegraded("expand", expanded.error());
    }
    return QueryExpander::fallbackExpansion(query.text(), expanded.error().message);
}

QueryDecomposition RetrievalOrchestrator::Impl::runDecomposer(const Query& query,
                                                              std::stop_token stop) {
    auto stage = launchStage(executor_, "decompose", config_.timeouts.expand,
                             [expander = c_.expander, text = query.text()](
                                 std::stop_token st) -> Result<QueryDecomposition> {
                                 if (!expander) {
                                     return QueryExpander::fallbackDecomposition(
                                         text, "no expander configured");
                                 }
                                 return expander->decompose(text, st);
                             });
    auto decomposed = stage.await(stop);
    if (decomposed) {
        return std::move(decomposed).value();
    }
    if (!stop.stop_requested()) {
        noteDegraded("decompose", decomposed.error());
    }
    return QueryExpander::fallbackDecomposition(query.text(), decomposed.error().message);
}

Result<ExecutionResult> RetrievalOrchestrator::Impl::execute(const std::string& queryText,
                                                             std::size_t topK,
                                                             std::stop_token stop) {
    stats_.requests.fetch_add(1, std::memory_order_relaxed);
    auto validated = Query::create(queryText, topK, config_.limits);
    if (!validated) {
        stats_.rejected.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("[Orchestrator] rejected query: {}", validated.error().message);
        return validated.error();
    }
    const Query& query = validated.value();
    const auto& policy = config_.policy;
    const auto requestStart = std::chrono::steady_clock::now();
    spdlog::info("[Orchestrator] request policy={} top_k={} query='{}'", policy.name,
                 query.topK(), text::truncateUtf8(query.text(), 80));

    ExecutionResult result;
    result.finalQuery = query.text();
    OrchestratorState state = OrchestratorState::Planning;

    auto finish = [&](OrchestratorState terminal) -> Result<ExecutionResult> {
        transition(state, terminal);
        result.finalState = terminal;
        (terminal == OrchestratorState::Satisfied ? stats_.satisfied : stats_.exhausted)
            .fetch_add(1, std::memory_order_relaxed);
        spdlog::info("[Orchestrator] {} with {} results after {} attempts in {} ms",
                     stateToString(terminal), result.results.size(), result.attempts,
                     std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - requestStart)
                         .count());
        return std::move(result);
    };

    // PLANNING
    {
        const auto started = std::chrono::steady_clock::now();
        result.plan = runPlanner(query, stop);
        if (stop.stop_requested()) {
            return cancelled(result.trace);
        }
        TraceStep step;
        step.kind = StepKind::Plan;
        step.flag = result.plan.needsRetrieval;
        step.action = actionTypeToString(result.plan.action);
        step.reasoning = result.plan.reasoning;
        step.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        result.trace.append(std::move(step));
    }
    if (!result.plan.needsRetrieval) {
        return finish(OrchestratorState::Satisfied);
    }

    std::string currentQuery = query.text();
    std::optional<Attempt> best;

    for (int attempt = 1; attempt <= policy.maxAttempts; ++attempt) {
        transition(state, OrchestratorState::Retrieving);
        auto retrieved = runAttempt(currentQuery, query.topK(), attempt, result.trace, stop);
        if (!retrieved) {
            return cancelled(result.trace);
        }
        result.attempts = attempt;
        const bool canRetry = attempt < policy.maxAttempts;

        if (retrieved->empty()) {
            if (best) {
                // A later attempt found nothing; keep what an earlier one found
                result.results = std::move(best->results);
                result.finalQuery = best->query;
                return finish(OrchestratorState::Satisfied);
            }
            if (attempt == 1 && canRetry) {
                transition(state, OrchestratorState::Expanding);
                auto expansion = runExpander(query, stop);
                if (stop.stop_requested()) {
                    return cancelled(result.trace);
                }
                TraceStep step;
                step.kind = StepKind::Expand;
                step.attempt = attempt;
                step.queries = expansion.alternatives;
                step.reasoning = expansion.reasoning;
                result.trace.append(std::move(step));
                currentQuery = pickAlternative(expansion.alternatives, 0, query.text());
                continue;
            }
            result.results.clear();
            return finish(OrchestratorState::Exhausted);
        }

        if (!policy.enableQualityGate) {
            result.results = std::move(*retrieved);
            result.finalQuery = currentQuery;
            return finish(OrchestratorState::Satisfied);
        }

        transition(state, OrchestratorState::Evaluating);
        auto evaluation = runEvaluator(query, *retrieved, attempt, stop);
        if (stop.stop_requested()) {
            return cancelled(result.trace);
        }
        {
            TraceStep step;
            step.kind = StepKind::Evaluate;
            step.attempt = attempt;
            step.score = evaluation.score;
            step.flag = evaluation.isAdequate;
            step.action = suggestedActionToString(evaluation.suggestedAction);
            step.reasoning = evaluation.reasoning;
            result.trace.append(std::move(step));
        }

        const bool passes = evaluation.isAdequate || evaluation.score >= policy.qualityThreshold;
        if (!best || evaluation.score > best->score) {
            best = Attempt{*retrieved, currentQuery, evaluation.score};
        }
        if (passes) {
            result.results = std::move(*retrieved);
            result.finalQuery = currentQuery;
            return finish(OrchestratorState::Satisfied);
        }
        if (!canRetry) {
            break;
        }

        const auto action = evaluation.suggestedAction;
        if (action == SuggestedAction::Reformulate || action == SuggestedAction::Expand) {
            transition(state, OrchestratorState::Expanding);
            auto expansion = runExpander(query, stop);
            if (stop.stop_requested()) {
                return cancelled(result.trace);
            }
            currentQuery = pickAlternative(expansion.alternatives, attempt - 1, query.text());
            TraceStep step;
            step.kind = StepKind::Reformulate;
            step.attempt = attempt;
            step.query = currentQuery;
            step.reasoning = evaluation.reasoning;
            result.trace.append(std::move(step));
        } else if (action == SuggestedAction::Decompose && policy.enableDecomposition &&
                   QueryExpander::looksComplex(query.text())) {
            transition(state, OrchestratorState::Expanding);
            auto decomposition = runDecomposer(query, stop);
            if (stop.stop_requested()) {
                return cancelled(result.trace);
            }
            currentQuery = pickAlternative(decomposition.subQueries, attempt - 1, query.text());
            TraceStep step;
            step.kind = StepKind::Decompose;
            step.attempt = attempt;
            step.query = currentQuery;
            step.queries = decomposition.subQueries;
            step.reasoning = decomposition.synthesisStrategy;
            result.trace.append(std::move(step));
        } else {
            break; // no better strategy
        }
    }

    if (best) {
        result.results = std::move(best->results);
        result.finalQuery = best->query;
        return finish(OrchestratorState::Satisfied);
    }
    return finish(OrchestratorState::Exhausted);
}

RetrievalOrchestrator::RetrievalOrchestrator(OrchestratorCollaborators collaborators,
                                             OrchestratorConfig config,
                                             std::optional<boost::asio::any_io_executor> executor)
    : pImpl_(std::make_unique<Impl>(std::move(collaborators), std::move(config),
                                    std::move(executor))) {}

RetrievalOrchestrator::~RetrievalOrchestrator() = default;

Result<ExecutionResult> RetrievalOrchestrator::execute(const std::string& query, std::size_t topK,
                                                       std::stop_token stop) {
    return pImpl_->execute(query, topK, std::move(stop));
}

const OrchestratorConfig& RetrievalOrchestrator::getConfig() const {
    return pImpl_->config_;
}

const RetrievalOrchestrator::Statistics& RetrievalOrchestrator::getStatistics() const {
    return pImpl_->stats_;
}

} // namespace ragloop::agent
