#include <ragloop/agent/intent_planner.h>
#include <ragloop/core/text_utils.h>

#include <spdlog/spdlog.h>

namespace ragloop::agent {

namespace {

const nlohmann::json& planSchema() {
    static const nlohmann::json schema = nlohmann::json::parse(R"({
        "type": "object",
        "properties": {
            "needs_retrieval": {"type": "boolean"},
            "action": {"type": "string", "enum": ["retrieve", "direct_response", "clarify"]},
            "reasoning": {"type": "string"},
            "suggested_response": {"type": ["string", "null"]}
        },
        "required": ["needs_retrieval", "action", "reasoning"]
    })");
    return schema;
}

constexpr const char* kSystemPrompt =
    "You route questions for a document question-answering assistant. Decide whether answering "
    "the query requires searching the user's documents.\n"
    "- Greetings, thanks, small talk and questions about the assistant itself: "
    "needs_retrieval=false, action=direct_response, and write a short suggested_response.\n"
    "- Queries too vague to search for: needs_retrieval=false, action=clarify, and suggest a "
    "clarifying question.\n"
    "- Anything that could be answered from documents: needs_retrieval=true, action=retrieve.\n"
    "When unsure, choose retrieval.";

} // namespace

IntentPlanner::IntentPlanner(std::shared_ptr<llm::IChatModel> chat, IntentPlannerConfig config)
    : chat_(std::move(chat)), config_(config) {}

Plan IntentPlanner::failOpen(const std::string& reason) {
    Plan p;
    p.needsRetrieval = true;
    p.action = ActionType::Retrieve;
    p.reasoning = "Planner unavailable, defaulting to retrieval: " + reason;
    return p;
}

Result<Plan> IntentPlanner::parsePlan(const nlohmann::json& reply) {
    auto needsRetrieval = llm::boolField(reply, "needs_retrieval");
    if (!needsRetrieval) {
        return Error{ErrorCode::InvalidData, "plan reply has no needs_retrieval flag"};
    }
    Plan p;
    p.needsRetrieval = *needsRetrieval;
    p.reasoning = llm::stringField(reply, "reasoning").value_or("");

    auto action = llm::stringField(reply, "action");
    auto parsed = action ? parseActionType(*action) : std::nullopt;
    if (p.needsRetrieval) {
        p.action = ActionType::Retrieve;
    } else {
        p.action = (parsed && *parsed != ActionType::Retrieve) ? *parsed : ActionType::DirectResponse;
        if (auto suggested = llm::stringField(reply, "suggested_response");
            suggested && !text::isBlank(*suggested)) {
            p.suggestedResponse = *suggested;
        }
    }
    return p;
}

Plan IntentPlanner::plan(const std::string& query, std::stop_token stop) const {
    if (!chat_) {
        return failOpen("no chat model configured");
    }

    llm::StructuredPrompt prompt;
    prompt.system = kSystemPrompt;
    prompt.user = "Query: " + query;
    prompt.schemaName = "intent_plan";
    prompt.schema = planSchema();
    prompt.temperature = config_.temperature;
    prompt.maxTokens = config_.maxTokens;

    auto reply = chat_->completeStructured(prompt, stop);
    if (!reply) {
        spdlog::warn("[Planner] planning failed, defaulting to retrieval: {}",
                     reply.error().message);
        return failOpen(reply.error().message);
    }
    auto parsed = parsePlan(reply.value());
    if (!parsed) {
        spdlog::warn("[Planner] unusable plan reply, defaulting to retrieval: {}",
                     parsed.error().message);
        return failOpen(parsed.error().message);
    }
    spdlog::debug("[Planner] needs_retrieval={} action={}", parsed.value().needsRetrieval,
                  actionTypeToString(parsed.value().action));
    return std::move(parsed).value();
}

} // namespace ragloop::agent
