#include <ragloop/agent/execution_trace.h>
#include <ragloop/core/text_utils.h>

#include <algorithm>

namespace ragloop::agent {

std::size_t ExecutionTrace::count(StepKind kind) const noexcept {
    return static_cast<std::size_t>(std::count_if(
        steps_.begin(), steps_.end(), [kind](const TraceStep& s) { return s.kind == kind; }));
}

nlohmann::json toJson(const TraceStep& step) {
    nlohmann::json j;
    j["step"] = stepKindToString(step.kind);
    if (step.attempt > 0) {
        j["attempt"] = step.attempt;
    }
    switch (step.kind) {
        case StepKind::Plan:
            if (step.flag)
                j["needs_retrieval"] = *step.flag;
            j["action"] = step.action;
            break;
        case StepKind::Retrieve:
            j["query"] = text::sanitizeUtf8(step.query);
            j["num_chunks"] = step.resultCount.value_or(0);
            if (!step.degraded.empty()) {
                j["degraded"] = nlohmann::json::array();
                for (const auto& d : step.degraded)
                    j["degraded"].push_back(text::sanitizeUtf8(d));
            }
            break;
        case StepKind::Expand:
            j["expanded_queries"] = nlohmann::json::array();
            for (const auto& q : step.queries)
                j["expanded_queries"].push_back(text::sanitizeUtf8(q));
            break;
        case StepKind::Evaluate:
            if (step.score)
                j["score"] = *step.score;
            if (step.flag)
                j["is_adequate"] = *step.flag;
            j["suggested_action"] = step.action;
            break;
        case StepKind::Reformulate:
            j["new_query"] = text::sanitizeUtf8(step.query);
            break;
        case StepKind::Decompose:
            j["new_query"] = text::sanitizeUtf8(step.query);
            j["sub_queries"] = nlohmann::json::array();
            for (const auto& q : step.queries)
                j["sub_queries"].push_back(text::sanitizeUtf8(q));
            break;
        case StepKind::Cancelled:
            break;
    }
    if (!step.reasoning.empty()) {
        j[step.kind == StepKind::Reformulate ? "reason" : "reasoning"] =
            text::sanitizeUtf8(step.reasoning);
    }
    if (step.elapsed.count() > 0) {
        j["elapsed_ms"] = step.elapsed.count();
    }
    return j;
}

nlohmann::json ExecutionTrace::toJson() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : steps_) {
        arr.push_back(agent::toJson(s));
    }
    return arr;
}

} // namespace ragloop::agent
