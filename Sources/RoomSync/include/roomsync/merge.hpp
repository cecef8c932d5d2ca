#pragma once

#ifdef __cplusplus

#include "delta.hpp"
#include "store.hpp"
#include <chrono>

namespace roomsync {

struct merge_report {
    bool has_session = false;  // false: no authenticated session, nothing applied
    size_t merged = 0;         // rows written
    size_t skipped = 0;        // records dropped (invalid, or rooms without a subscription)
};

// ============================================================================
// merge_engine - applies delta batches to the local store
// ============================================================================

class merge_engine {
public:
    /// How far a rooms fetch pulls the watermark back.
    static constexpr std::chrono::seconds watermark_backdate{1};

    explicit merge_engine(local_store& store) : store_(store) {}

    /// Subscriptions merge. list/update become upserts owned by the current
    /// session, remove clears the ownership link. All touched rows and the
    /// watermark (set to `now`) commit in one transaction.
    merge_report merge_subscriptions(const delta_batch& batch, timestamp_t now);

    /// Pulls the current session's watermark to now - 1s in its own
    /// transaction. Returns false when there is no session.
    bool backdate_watermark(timestamp_t now);

    /// Rooms merge. list/update records enrich the subscription with the same
    /// room id; rooms without a subscription are dropped. Never creates rows
    /// and never moves the watermark.
    merge_report merge_rooms(const delta_batch& batch);

private:
    local_store& store_;
};

} // namespace roomsync

#endif // __cplusplus
