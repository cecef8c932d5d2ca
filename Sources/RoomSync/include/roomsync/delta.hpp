#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace roomsync {

// ============================================================================
// Delta batch
// ============================================================================
//
// One fetch response split into its three record groups. Records stay
// loosely typed until the merge engine maps them onto a subscription row.

struct delta_batch {
    std::vector<nlohmann::json> list;    // full/initial set
    std::vector<nlohmann::json> update;  // incremental changes
    std::vector<nlohmann::json> remove;  // membership removals

    bool empty() const { return list.empty() && update.empty() && remove.empty(); }
    size_t size() const { return list.size() + update.size() + remove.size(); }

    /// Typed API payload: {"list": [...], "update": [...], "remove": [...]}.
    /// Missing or non-array groups are empty; non-object records are dropped.
    static delta_batch from_typed(const nlohmann::json& payload);

    /// Legacy method result: either a bare array (initial list) or
    /// {"update": [...], "remove": [...]} (incremental).
    static delta_batch from_legacy_result(const nlohmann::json& result);
};

/// String member `key` of a record, if present and non-empty.
std::optional<std::string> record_string(const nlohmann::json& record, const char* key);

} // namespace roomsync

#endif // __cplusplus
