#include <ragloop/agent/quality_evaluator.h>
#include <ragloop/core/text_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace ragloop::agent {

namespace {

const nlohmann::json& evaluationSchema() {
    static const nlohmann::json schema = nlohmann::json::parse(R"({
        "type": "object",
        "properties": {
            "score": {"type": "number"},
            "is_adequate": {"type": "boolean"},
            "suggested_action": {
                "type": "string",
                "enum": ["proceed", "reformulate", "expand", "decompose", "clarify"]
            },
            "reasoning": {"type": "string"}
        },
        "required": ["score", "is_adequate", "suggested_action", "reasoning"]
    })");
    return schema;
}

constexpr const char* kSystemPrompt =
    "You assess whether retrieved passages contain enough information to answer a query.\n"
    "Score from 0.0 (nothing useful) to 1.0 (fully answers the query). Set is_adequate when the "
    "passages are sufficient. If they are not, suggest one action: reformulate (the query "
    "wording missed the documents), expand (related terms may find more), decompose (the query "
    "asks several things), or clarify (the query is ambiguous). Otherwise suggest proceed.";

} // namespace

SuggestedAction parseSuggestedAction(std::string_view s) noexcept {
    if (s == "reformulate")
        return SuggestedAction::Reformulate;
    if (s == "expand")
        return SuggestedAction::Expand;
    if (s == "decompose")
        return SuggestedAction::Decompose;
    if (s == "clarify")
        return SuggestedAction::Clarify;
    return SuggestedAction::Proceed;
}

QualityEvaluator::QualityEvaluator(std::shared_ptr<llm::IChatModel> chat,
                                   QualityEvaluatorConfig config)
    : chat_(std::move(chat)), config_(config) {}

QualityEvaluation QualityEvaluator::failOpen(const std::string& reason) {
    QualityEvaluation e;
    e.score = 1.0;
    e.isAdequate = true;
    e.suggestedAction = SuggestedAction::Proceed;
    e.reasoning = "Evaluation unavailable: " + reason;
    e.degraded = true;
    return e;
}

Result<QualityEvaluation> QualityEvaluator::parseEvaluation(const nlohmann::json& reply) {
    auto score = llm::numberField(reply, "score");
    auto adequate = llm::boolField(reply, "is_adequate");
    if (!score || !adequate) {
        return Error{ErrorCode::InvalidData, "evaluation reply lacks score or is_adequate"};
    }
    QualityEvaluation e;
    e.score = std::clamp(*score, 0.0, 1.0);
    e.isAdequate = *adequate;
    e.suggestedAction =
        parseSuggestedAction(llm::stringField(reply, "suggested_action").value_or("proceed"));
    e.reasoning = llm::stringField(reply, "reasoning").value_or("");
    return e;
}

QualityEvaluation QualityEvaluator::evaluate(const std::string& query,
                                             const std::vector<std::string>& passages,
                                             int attempt, std::stop_token stop) const {
    if (!chat_) {
        return failOpen("no chat model configured");
    }

    std::ostringstream user;
    user << "Query: " << query << "\nRetrieval attempt: " << attempt << "\n\nPassages:\n";
    const auto shown = std::min(passages.size(), config_.maxPassages);
    for (std::size_t i = 0; i < shown; ++i) {
        user << "\n[" << i + 1 << "] " << text::truncateUtf8(passages[i], config_.passageChars)
             << "\n";
    }

    llm::StructuredPrompt prompt;
    prompt.system = kSystemPrompt;
    prompt.user = user.str();
    prompt.schemaName = "quality_evaluation";
    prompt.schema = evaluationSchema();
    prompt.temperature = config_.temperature;
    prompt.maxTokens = config_.maxTokens;

    auto reply = chat_->completeStructured(prompt, stop);
    if (!reply) {
        spdlog::warn("[Evaluator] evaluation failed, treating results as adequate: {}",
                     reply.error().message);
        return failOpen(reply.error().message);
    }
    auto parsed = parseEvaluation(reply.value());
    if (!parsed) {
        spdlog::warn("[Evaluator] unusable evaluation reply, treating results as adequate: {}",
                     parsed.error().message);
        return failOpen(parsed.error().message);
    }
    spdlog::debug("[Evaluator] attempt {} score={:.2f} adequate={} action={}", attempt,
                  parsed.value().score, parsed.value().isAdequate,
                  suggestedActionToString(parsed.value().suggestedAction));
    return std::move(parsed).value();
}

} // namespace ragloop::agent
