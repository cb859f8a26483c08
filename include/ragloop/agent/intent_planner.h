#pragma once

#include <ragloop/agent/plan.h>
#include <ragloop/llm/chat_model.h>

#include <memory>
#include <stop_token>
#include <string>

namespace ragloop::agent {

struct IntentPlannerConfig {
    int maxTokens = 500;
    double temperature = 0.0;
};

/**
 * @brief Decides whether a query needs document retrieval
 *
 * Fails open: when the model is unavailable or its reply is unusable the plan asks for
 * retrieval.
 */
class IntentPlanner {
public:
    explicit IntentPlanner(std::shared_ptr<llm::IChatModel> chat, IntentPlannerConfig config = {});

    Plan plan(const std::string& query, std::stop_token stop) const;

    static Plan failOpen(const std::string& reason);

    static Result<Plan> parsePlan(const nlohmann::json& reply);

private:
    std::shared_ptr<llm::IChatModel> chat_;
    IntentPlannerConfig config_;
};

} // namespace ragloop::agent
