#pragma once

#ifdef __cplusplus

#include "api.hpp"
#include "ddp.hpp"
#include "date.hpp"
#include "merge.hpp"
#include "scheduler.hpp"
#include "store.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace roomsync {

// ============================================================================
// Sync outcome
// ============================================================================

enum class sync_outcome {
    applied,   // a batch committed
    skipped,   // nothing changed
    failed
};

struct sync_result {
    sync_outcome outcome = sync_outcome::skipped;
    std::optional<api_error_kind> error;
    size_t merged = 0;            // rows written by the batch
    size_t dropped = 0;           // records the batch could not apply
    bool used_fallback = false;   // served by the legacy channel
    std::string message;

    bool is_applied() const { return outcome == sync_outcome::applied; }
    bool is_skipped() const { return outcome == sync_outcome::skipped; }
    bool is_failed() const { return outcome == sync_outcome::failed; }

    static sync_result applied(const merge_report& report, bool fallback) {
        sync_result r;
        r.outcome = sync_outcome::applied;
        r.merged = report.merged;
        r.dropped = report.skipped;
        r.used_fallback = fallback;
        return r;
    }

    static sync_result skipped(std::string reason, bool fallback,
                               std::optional<api_error_kind> error = std::nullopt) {
        sync_result r;
        r.outcome = sync_outcome::skipped;
        r.error = error;
        r.used_fallback = fallback;
        r.message = std::move(reason);
        return r;
    }

    static sync_result failed(api_error_kind kind, std::string reason, bool fallback) {
        sync_result r;
        r.outcome = sync_outcome::failed;
        r.error = kind;
        r.used_fallback = fallback;
        r.message = std::move(reason);
        return r;
    }
};

using sync_completion = std::function<void(const sync_result&)>;

// ============================================================================
// subscriptions_client - fetch, merge and fall back
// ============================================================================
//
// Every operation takes an optional store; nullptr means the store the client
// was built with. Completions always fire exactly once, on the scheduler.

class subscriptions_client {
public:
    /// Advances the read state of one room on a server without subscriptions.read.
    using legacy_read_handler = std::function<void(const std::string& rid, local_store& store)>;

    static constexpr int default_retry_count = 3;

    /// legacy may be nullptr; version errors are then reported as failed.
    subscriptions_client(local_store& store,
                         api_fetcher& api,
                         rpc_channel* legacy,
                         server_clock& clock,
                         SharedScheduler scheduler = nullptr,
                         int retry_count = default_retry_count);

    // Non-copyable (in-flight requests capture this)
    subscriptions_client(const subscriptions_client&) = delete;
    subscriptions_client& operator=(const subscriptions_client&) = delete;

    /// Fire-and-forget. Version errors go to the legacy read handler, anything
    /// else is dropped.
    void mark_as_read(const std::string& rid, local_store* store = nullptr);

    /// nullopt updated_since means a full sync.
    void fetch_subscriptions(std::optional<timestamp_t> updated_since,
                             sync_completion completion,
                             local_store* store = nullptr);

    void fetch_rooms(std::optional<timestamp_t> updated_since,
                     sync_completion completion,
                     local_store* store = nullptr);

    /// subscriptions/get over the legacy channel.
    void fetch_subscriptions_fallback(std::optional<timestamp_t> updated_since,
                                      sync_completion completion,
                                      local_store* store = nullptr);

    /// rooms/get over the legacy channel.
    void fetch_rooms_fallback(std::optional<timestamp_t> updated_since,
                              sync_completion completion,
                              local_store* store = nullptr);

    void set_legacy_read_handler(legacy_read_handler handler);

    /// readMessages over the legacy channel, then clears the local unread
    /// state of the room.
    void legacy_mark_as_read(const std::string& rid, local_store& store);

private:
    local_store& store_;
    api_fetcher& api_;
    rpc_channel* legacy_;
    server_clock& clock_;
    SharedScheduler scheduler_;
    int retry_count_;

    std::mutex handler_mutex_;
    legacy_read_handler legacy_read_handler_;

    local_store& resolve(local_store* store) { return store ? *store : store_; }

    void finish(const sync_completion& completion, sync_result result);

    sync_result apply_subscriptions(local_store& store, const delta_batch& batch, bool fallback);
    sync_result apply_rooms(local_store& store, const delta_batch& batch, bool fallback);

    void call_legacy(const std::string& method,
                     std::optional<timestamp_t> updated_since,
                     std::function<void(rpc_response)> handler);
};

} // namespace roomsync

#endif // __cplusplus
