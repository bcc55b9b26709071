#include <nlohmann/json.hpp>

#include <engram/retain/retain_codec.h>

namespace engram::retain {

using json = nlohmann::json;

std::string encodeRetainItems(const std::vector<RetainItem>& items) {
    json arr = json::array();
    for (const auto& item : items) {
        json j;
        j["content"] = item.content;
        if (item.documentId)
            j["document_id"] = *item.documentId;
        if (!item.context.empty())
            j["context"] = item.context;
        if (item.occurredHint) {
            j["occurred_start"] = toEpochMillis(item.occurredHint->start);
            j["occurred_end"] = toEpochMillis(item.occurredHint->end);
        }
        if (!item.metadata.empty())
            j["metadata"] = item.metadata;
        arr.push_back(std::move(j));
    }
    return json{{"items", std::move(arr)}}.dump();
}

Result<std::vector<RetainItem>> decodeRetainItems(const std::string& payload) {
    auto root = json::parse(payload, nullptr, false);
    if (root.is_discarded() || !root.is_object() || !root.contains("items") ||
        !root.at("items").is_array()) {
        return Error{ErrorCode::InvalidData, "retain payload must be {\"items\": [...]}"};
    }

    std::vector<RetainItem> items;
    for (const auto& j : root.at("items")) {
        if (!j.is_object() || !j.contains("content") || !j.at("content").is_string())
            return Error{ErrorCode::InvalidData, "retain item without string content"};
        RetainItem item;
        item.content = j.at("content").get<std::string>();
        if (j.contains("document_id") && j.at("document_id").is_string())
            item.documentId = j.at("document_id").get<std::string>();
        if (j.contains("context") && j.at("context").is_string())
            item.context = j.at("context").get<std::string>();
        if (j.contains("occurred_start") && j.at("occurred_start").is_number_integer()) {
            const auto start = fromEpochMillis(j.at("occurred_start").get<int64_t>());
            auto end = start;
            if (j.contains("occurred_end") && j.at("occurred_end").is_number_integer())
                end = fromEpochMillis(j.at("occurred_end").get<int64_t>());
            item.occurredHint = metadata::TimeRange{start, end};
        }
        if (j.contains("metadata") && j.at("metadata").is_object()) {
            for (auto it = j.at("metadata").begin(); it != j.at("metadata").end(); ++it) {
                item.metadata[it.key()] =
                    it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
            }
        }
        items.push_back(std::move(item));
    }
    return items;
}

std::string encodeBatchResult(const RetainBatchResult& result) {
    json items = json::array();
    for (const auto& o : result.items) {
        json j;
        j["index"] = o.index;
        j["success"] = o.success;
        j["created_unit_ids"] = o.createdUnitIds;
        j["merged_unit_ids"] = o.mergedUnitIds;
        if (o.documentId)
            j["document_id"] = *o.documentId;
        if (o.error) {
            j["error"] = {{"code", errorToString(o.error->code)}, {"message", o.error->message}};
        }
        items.push_back(std::move(j));
    }
    json root;
    root["succeeded"] = result.succeeded();
    root["failed"] = result.failed();
    root["items"] = std::move(items);
    return root.dump();
}

} // namespace engram::retain
