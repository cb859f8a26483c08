#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ragloop::agent {

enum class StepKind { Plan, Retrieve, Expand, Evaluate, Reformulate, Decompose, Cancelled };

inline constexpr const char* stepKindToString(StepKind kind) noexcept {
    switch (kind) {
        case StepKind::Plan:
            return "plan";
        case StepKind::Retrieve:
            return "retrieve";
        case StepKind::Expand:
            return "expand";
        case StepKind::Evaluate:
            return "evaluate";
        case StepKind::Reformulate:
            return "reformulate";
        case StepKind::Decompose:
            return "decompose";
        case StepKind::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

/**
 * @brief One recorded decision or stage of a request
 *
 * Fields that do not apply to a kind stay at their defaults and are omitted from JSON.
 */
struct TraceStep {
    StepKind kind = StepKind::Plan;
    int attempt = 0;
    std::string query;                     // retrieve: query used; reformulate/decompose: new query
    std::optional<std::size_t> resultCount; // retrieve
    std::optional<double> score;            // evaluate
    std::optional<bool> flag;               // plan: needs_retrieval; evaluate: is_adequate
    std::string action;                     // plan action or evaluator suggestion
    std::string reasoning;
    std::vector<std::string> queries;  // expand: alternatives; decompose: sub-queries
    std::vector<std::string> degraded; // retrieve: "stage: reason" for each degraded stage
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Append-only record of every transition taken while serving one request
 */
class ExecutionTrace {
public:
    void append(TraceStep step) { steps_.push_back(std::move(step)); }

    const std::vector<TraceStep>& steps() const noexcept { return steps_; }
    std::size_t size() const noexcept { return steps_.size(); }
    bool empty() const noexcept { return steps_.empty(); }
    std::size_t count(StepKind kind) const noexcept;

    nlohmann::json toJson() const;

private:
    std::vector<TraceStep> steps_;
};

nlohmann::json toJson(const TraceStep& step);

} // namespace ragloop::agent
