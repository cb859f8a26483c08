#pragma once

#include <ragloop/agent/retrieval_orchestrator.h>
#include <ragloop/config/config_helpers.h>
#include <ragloop/core/types.h>
#include <ragloop/llm/openai_client.h>
#include <ragloop/net/http_client.h>
#include <ragloop/search/elastic_sparse_search.h>
#include <ragloop/search/qdrant_dense_search.h>

#include <cstddef>
#include <filesystem>
#include <string>

namespace ragloop::config {

/**
 * @brief Complete runtime configuration: retrieval loop plus every external endpoint
 */
struct PipelineConfig {
    agent::OrchestratorConfig orchestrator;
    std::size_t finalTopK = 5;
    llm::OpenAiConfig llm;
    net::RetryPolicy httpRetry;
    std::size_t embeddingCacheSize = 1024;
    search::QdrantConfig dense;
    search::ElasticConfig sparse;
    std::string logLevel = "info";

    Result<void> validate() const;
};

// Apply "section.key" values on top of `config`; unknown keys are ignored
Result<void> applyConfigValues(const ConfigValues& values, PipelineConfig& config);

// Config keys set by environment variables (OPENAI_API_KEY, RAGLOOP_*, RETRIEVAL_TOP_K, ...)
ConfigValues environmentValues();

// Apply environment overrides
Result<void> applyEnvironment(PipelineConfig& config);

// Resolution order: defaults → config file → environment → `overrides` (command line).
// A policy named by a later layer keeps the max_attempts, quality gate, threshold and
// decomposition keys an earlier layer set. A missing file is not an error.
Result<PipelineConfig> loadPipelineConfig(const std::filesystem::path& configPath,
                                          const ConfigValues& overrides = {});

} // namespace ragloop::config
