#include "roomsync/delta.hpp"
#include "roomsync/log.hpp"

namespace roomsync {

using json = nlohmann::json;

namespace {

void collect_records(const json& records, const char* group, std::vector<json>& out) {
    for (const auto& record : records) {
        if (record.is_object()) {
            out.push_back(record);
        } else {
            LOG_DEBUG("delta", "Dropping non-object record in '%s'", group);
        }
    }
}

void collect(const json& payload, const char* key, std::vector<json>& out) {
    if (!payload.is_object()) return;
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_array()) return;
    collect_records(*it, key, out);
}

} // namespace

delta_batch delta_batch::from_typed(const json& payload) {
    delta_batch batch;
    collect(payload, "list", batch.list);
    collect(payload, "update", batch.update);
    collect(payload, "remove", batch.remove);
    return batch;
}

delta_batch delta_batch::from_legacy_result(const json& result) {
    delta_batch batch;
    if (result.is_array()) {
        collect_records(result, "list", batch.list);
    } else {
        collect(result, "update", batch.update);
        collect(result, "remove", batch.remove);
    }
    return batch;
}

std::optional<std::string> record_string(const json& record, const char* key) {
    if (!record.is_object()) return std::nullopt;
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

} // namespace roomsync
