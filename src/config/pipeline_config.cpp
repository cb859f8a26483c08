#include <ragloop/config/pipeline_config.h>

#include <spdlog/spdlog.h>

#include <array>
#include <functional>
#include <limits>
#include <unordered_map>
#include <utility>

namespace ragloop::config {

namespace {

using Setter = std::function<Result<void>(const std::string&, PipelineConfig&)>;

Result<std::size_t> parseCount(const std::string& raw) {
    auto v = parse_integer(raw);
    if (!v) {
        return v.error();
    }
    if (v.value() < 0) {
        return Error{ErrorCode::InvalidArgument, "must not be negative: " + raw};
    }
    return static_cast<std::size_t>(v.value());
}

// Narrows to int; values beyond INT_MAX are rejected rather than wrapped
Result<int> parseIntCount(const std::string& raw) {
    auto v = parseCount(raw);
    if (!v) {
        return v.error();
    }
    if (v.value() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return Error{ErrorCode::InvalidArgument, "out of range: " + raw};
    }
    return static_cast<int>(v.value());
}

Setter countSetter(std::size_t PipelineConfig::*field) {
    return [field](const std::string& raw, PipelineConfig& c) -> Result<void> {
        auto v = parseCount(raw);
        if (!v)
            return v.error();
        c.*field = v.value();
        return {};
    };
}

template <typename Fn> Setter orchestratorCount(Fn access) {
    return [access](const std::string& raw, PipelineConfig& c) -> Result<void> {
        auto v = parseCount(raw);
        if (!v)
            return v.error();
        access(c) = v.value();
        return {};
    };
}

template <typename Fn> Setter timeoutSetter(Fn access) {
    return [access](const std::string& raw, PipelineConfig& c) -> Result<void> {
        auto v = parse_ms(raw);
        if (!v)
            return v.error();
        access(c) = v.value();
        return {};
    };
}

template <typename Fn> Setter stringSetter(Fn access) {
    return [access](const std::string& raw, PipelineConfig& c) -> Result<void> {
        access(c) = raw;
        return {};
    };
}

const std::unordered_map<std::string, Setter>& setters() {
    static const std::unordered_map<std::string, Setter> table = {
        {"retrieval.max_attempts",
         [](const std::string& raw, PipelineConfig& c) -> Result<void> {
             auto v = parseIntCount(raw);
             if (!v)
                 return v.error();
             c.orchestrator.policy.maxAttempts = v.value();
             return {};
         }},
        {"retrieval.enable_quality_gate",
         [](const std::string& raw, PipelineConfig& c) -> Result<void> {
             auto v = parse_bool(raw);
             if (!v)
                 return v.error();
             c.orchestrator.policy.enableQualityGate = v.value();
             return {};
         }},
        {"retrieval.quality_threshold",
         [](const std::string& raw, PipelineConfig& c) -> Result<void> {
             auto v = parse_double(raw);
             if (!v)
                 return v.error();
             c.orchestrator.policy.qualityThreshold = v.value();
             return {};
         }},
        {"retrieval.enable_decomposition",
         [](const std::string& raw, PipelineConfig& c) -> Result<void> {
             auto v = parse_bool(raw);
             if (!v)
                 return v.error();
             c.orchestrator.policy.enableDecomposition = v.value();
             return {};
         }},
        {"retrieval.rerank",
         [](const std::string& raw, PipelineConfig& c) -> Result<void> {
             auto v = parse_bool(raw);
             if (!v)
                 return v.error();
             c.orchestrator.enableReranking = v.value();
             return {};
         }},
        {"retrieval.rrf_k",
         [](const std::string& raw, PipelineConfig& c) -> Result<void> {
             auto v = parse_double(raw);
             if (!v)
                 return v.error();
             c.orchestrator.rrfK = v.value();
             return {};
         }},
        {"retrieval.retrieval_top_k",
         orchestratorCount([](PipelineConfig& c) -> std::size_t& {
             return c.orchestrator.retrievalTopK;
         })},
        {"retrieval.rerank_cap",
         orchestratorCount([](PipelineConfig& c) -> std::size_t& {
             return c.orchestrator.rerankCap;
         })},
        {"retrieval.max_top_k",
         orchestratorCount([](PipelineConfig& c) -> std::size_t& {
             return c.orchestrator.limits.maxTopK;
         })},
        {"retrieval.max_query_chars",
         orchestratorCount([](PipelineConfig& c) -> std::size_t& {
             return c.orchestrator.limits.maxQueryChars;
         })},
        {"retrieval.worker_threads",
         orchestratorCount([](PipelineConfig& c) -> std::size_t& {
             return c.orchestrator.workerThreads;
         })},
        {"retrieval.final_top_k", countSetter(&PipelineConfig::finalTopK)},

        {"timeouts.plan", timeoutSetter([](PipelineConfig& c) -> std::chrono::milliseconds& {
             return c.orchestrator.timeouts.plan;
         })},
        {"timeouts.dense", timeoutSetter([](PipelineConfig& c) -> std::chrono::milliseconds& {
             return c.orchestrator.timeouts.dense;
         })},
        {"timeouts.sparse", timeoutSetter([](PipelineConfig& c) -> std::chrono::milliseconds& {
             return c.orchestrator.timeouts.sparse;
         })},
        {"timeouts.rerank", timeoutSetter([](PipelineConfig& c) -> std::chrono::milliseconds& {
             return c.orchestrator.timeouts.rerank;
         })},
        {"timeouts.expand", timeoutSetter([](PipelineConfig& c) -> std::chrono::milliseconds& {
             return c.orchestrator.timeouts.expand;
         })},
        {"timeouts.evaluate", timeoutSetter([](PipelineConfig& c) -> std::chrono::milliseconds& {
             return c.orchestrator.timeouts.evaluate;
         })},

        {"llm.base_url",
         stringSetter([](PipelineConfig& c) -> std::string& { return c.llm.baseUrl; })},
        {"llm.api_key",
         stringSetter([](PipelineConfig& c) -> std::string& { return c.llm.apiKey; })},
        {"llm.chat_model",
         stringSetter([](PipelineConfig& c) -> std::string& { return c.llm.chatModel; })},
        {"llm.embedding_model",
         stringSetter([](PipelineConfig& c) -> std::string& { return c.llm.embeddingModel; })},
        {"llm.request_timeout_ms",
         timeoutSetter([](PipelineConfig& c) -> std::chrono::milliseconds& {
             return c.llm.requestTimeout;
         })},
        {"llm.max_retries",
         [](const std::string& raw, PipelineConfig& c) -> Result<void> {
             auto v = parseIntCount(raw);
             if (!v)
                 return v.error();
             c.httpRetry.maxRetries = v.value();
             return {};
         }},
        {"llm.embedding_cache_size", countSetter(&PipelineConfig::embeddingCacheSize)},

        {"dense.url", stringSetter([](PipelineConfig& c) -> std::string& { return c.dense.url; })},
        {"dense.collection",
         stringSetter([](PipelineConfig& c) -> std::string& { return c.dense.collection; })},
        {"dense.api_key",
         stringSetter([](PipelineConfig& c) -> std::string& { return c.dense.apiKey; })},
        {"dense.request_timeout_ms",
         timeoutSetter([](PipelineConfig& c) -> std::chrono::milliseconds& {
             return c.dense.requestTimeout;
         })},

        {"sparse.url",
         stringSetter([](PipelineConfig& c) -> std::string& { return c.sparse.url; })},
        {"sparse.index",
         stringSetter([](PipelineConfig& c) -> std::string& { return c.sparse.index; })},
        {"sparse.text_field",
         stringSetter([](PipelineConfig& c) -> std::string& { return c.sparse.textField; })},
        {"sparse.api_key",
         stringSetter([](PipelineConfig& c) -> std::string& { return c.sparse.apiKey; })},
        {"sparse.request_timeout_ms",
         timeoutSetter([](PipelineConfig& c) -> std::chrono::milliseconds& {
             return c.sparse.requestTimeout;
         })},

        {"logging.level",
         stringSetter([](PipelineConfig& c) -> std::string& { return c.logLevel; })},
    };
    return table;
}

// Environment variable → config key
constexpr std::array<std::pair<const char*, const char*>, 15> kEnvOverrides = {{
    {"RAGLOOP_POLICY", "retrieval.policy"},
    {"RETRIEVAL_TOP_K", "retrieval.retrieval_top_k"},
    {"RERANK_TOP_K", "retrieval.rerank_cap"},
    {"FINAL_TOP_K", "retrieval.final_top_k"},
    {"OPENAI_API_KEY", "llm.api_key"},
    {"RAGLOOP_LLM_API_KEY", "llm.api_key"},
    {"RAGLOOP_LLM_BASE_URL", "llm.base_url"},
    {"LLM_MODEL", "llm.chat_model"},
    {"RAGLOOP_CHAT_MODEL", "llm.chat_model"},
    {"EMBEDDING_MODEL", "llm.embedding_model"},
    {"RAGLOOP_EMBEDDING_MODEL", "llm.embedding_model"},
    {"RAGLOOP_QDRANT_URL", "dense.url"},
    {"RAGLOOP_ELASTIC_URL", "sparse.url"},
    {"RAGLOOP_LOG_LEVEL", "logging.level"},
    {"RAGLOOP_MAX_ATTEMPTS", "retrieval.max_attempts"},
}};

// Retrieval keys a policy preset provides defaults for
constexpr std::array<const char*, 4> kPolicyKeys = {
    "retrieval.max_attempts", "retrieval.enable_quality_gate", "retrieval.quality_threshold",
    "retrieval.enable_decomposition"};

// Applies one layer on top of `config`. A policy chosen by this layer keeps the individual
// policy keys that earlier layers set explicitly, unless this layer sets them too.
Result<void> applyLayer(const ConfigValues& layer, ConfigValues& earlier, PipelineConfig& config) {
    if (auto r = applyConfigValues(layer, config); !r) {
        return r;
    }
    if (layer.count("retrieval.policy")) {
        ConfigValues kept;
        for (const char* key : kPolicyKeys) {
            auto it = earlier.find(key);
            if (it != earlier.end() && !layer.count(key)) {
                kept.insert(*it);
            }
        }
        if (auto r = applyConfigValues(kept, config); !r) {
            return r;
        }
    }
    for (const auto& [key, raw] : layer) {
        earlier[key] = raw;
    }
    return {};
}

bool isKnownLogLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "error" || level == "critical" || level == "off";
}

} // namespace

Result<void> PipelineConfig::validate() const {
    if (auto r = orchestrator.validate(); !r) {
        return r;
    }
    if (finalTopK < 1 || finalTopK > orchestrator.limits.maxTopK) {
        return Error{ErrorCode::InvalidArgument,
                     "final_top_k must be between 1 and " +
                         std::to_string(orchestrator.limits.maxTopK)};
    }
    if (httpRetry.maxRetries < 0) {
        return Error{ErrorCode::InvalidArgument, "max_retries must not be negative"};
    }
    if (!isKnownLogLevel(logLevel)) {
        return Error{ErrorCode::InvalidArgument, "unknown log level '" + logLevel + "'"};
    }
    return {};
}

Result<void> applyConfigValues(const ConfigValues& values, PipelineConfig& config) {
    // The policy sets defaults for the individual retrieval keys, so it goes first
    if (auto it = values.find("retrieval.policy"); it != values.end()) {
        auto policy = agent::RetrievalPolicy::fromName(it->second);
        if (!policy) {
            return policy.error();
        }
        config.orchestrator.policy = policy.value();
    }

    const auto& table = setters();
    for (const auto& [key, raw] : values) {
        if (key == "retrieval.policy") {
            continue;
        }
        auto setter = table.find(key);
        if (setter == table.end()) {
            spdlog::debug("[Config] ignoring unknown key '{}'", key);
            continue;
        }
        if (auto r = setter->second(raw, config); !r) {
            return Error{r.error().code, key + ": " + r.error().message};
        }
    }
    return {};
}

ConfigValues environmentValues() {
    ConfigValues values;
    for (const auto& [env, key] : kEnvOverrides) {
        if (auto v = env_value(env)) {
            values[key] = *v;
        }
    }
    return values;
}

Result<void> applyEnvironment(PipelineConfig& config) {
    return applyConfigValues(environmentValues(), config);
}

Result<PipelineConfig> loadPipelineConfig(const std::filesystem::path& configPath,
                                          const ConfigValues& overrides) {
    PipelineConfig config;
    ConfigValues applied;

    auto fileValues = parse_config_file(configPath);
    if (!fileValues) {
        return fileValues.error();
    }
    if (!fileValues.value().empty()) {
        spdlog::debug("[Config] loaded {} keys from {}", fileValues.value().size(),
                      configPath.string());
    }
    if (auto r = applyLayer(fileValues.value(), applied, config); !r) {
        return Error{r.error().code, configPath.string() + ": " + r.error().message};
    }
    if (auto r = applyLayer(environmentValues(), applied, config); !r) {
        return Error{r.error().code, "environment: " + r.error().message};
    }
    if (auto r = applyLayer(overrides, applied, config); !r) {
        return Error{r.error().code, "command line: " + r.error().message};
    }
    if (auto r = config.validate(); !r) {
        return r.error();
    }
    return config;
}

} // namespace ragloop::config
