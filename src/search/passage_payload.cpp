#include <ragloop/search/passage_payload.h>

namespace ragloop::search {

std::string idToString(const nlohmann::json& id) {
    if (id.is_string()) {
        return id.get<std::string>();
    }
    if (id.is_number_unsigned()) {
        return std::to_string(id.get<unsigned long long>());
    }
    if (id.is_number_integer()) {
        return std::to_string(id.get<long long>());
    }
    return id.is_null() ? std::string{} : id.dump();
}

void readPassagePayload(const nlohmann::json& payload, const std::string& textField,
                        const std::string& fallbackId, RankedResult& out) {
    out.id = fallbackId;
    if (!payload.is_object()) {
        return;
    }
    if (auto it = payload.find("chunk_id"); it != payload.end() && !it->is_null()) {
        if (auto chunkId = idToString(*it); !chunkId.empty()) {
            out.id = std::move(chunkId);
        }
    }
    if (auto it = payload.find(textField); it != payload.end() && it->is_string()) {
        out.text = it->get<std::string>();
    }
    if (auto it = payload.find("document_id"); it != payload.end()) {
        out.source.documentId = idToString(*it);
    }
    if (auto it = payload.find("source"); it != payload.end() && it->is_string()) {
        out.source.sourcePath = it->get<std::string>();
    }
    if (auto it = payload.find("page_number"); it != payload.end() && it->is_number_integer()) {
        out.source.page = it->get<int>();
    }
    if (auto it = payload.find("section_title"); it != payload.end() && it->is_string()) {
        out.source.section = it->get<std::string>();
    }
}

} // namespace ragloop::search
