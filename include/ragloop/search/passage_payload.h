#pragma once

#include <ragloop/search/ranked_result.h>

#include <nlohmann/json.hpp>

#include <string>

namespace ragloop::search {

// Fill text and provenance of `out` from a stored passage document. The identity is the
// document's `chunk_id` when present, otherwise `fallbackId`.
void readPassagePayload(const nlohmann::json& payload, const std::string& textField,
                        const std::string& fallbackId, RankedResult& out);

// Point/document ids may be strings or integers
std::string idToString(const nlohmann::json& id);

} // namespace ragloop::search
