#include "roomsync/subscriptions_client.hpp"
#include "roomsync/log.hpp"

namespace roomsync {

using json = nlohmann::json;

subscriptions_client::subscriptions_client(local_store& store,
                                           api_fetcher& api,
                                           rpc_channel* legacy,
                                           server_clock& clock,
                                           SharedScheduler scheduler,
                                           int retry_count)
    : store_(store)
    , api_(api)
    , legacy_(legacy)
    , clock_(clock)
    , scheduler_(scheduler ? scheduler : std::make_shared<immediate_scheduler>())
    , retry_count_(retry_count < 0 ? 0 : retry_count)
{
    legacy_read_handler_ = [this](const std::string& rid, local_store& target) {
        legacy_mark_as_read(rid, target);
    };
}

void subscriptions_client::set_legacy_read_handler(legacy_read_handler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    legacy_read_handler_ = std::move(handler);
}

void subscriptions_client::finish(const sync_completion& completion, sync_result result) {
    if (!completion) return;
    scheduler_->invoke([completion, result = std::move(result)] { completion(result); });
}

// ============================================================================
// Mark as read
// ============================================================================

void subscriptions_client::mark_as_read(const std::string& rid, local_store* store) {
    local_store& target = resolve(store);
    subscription_read_request request{rid};

    api_.fetch(request, fetch_options{},
        [this, rid, &target](api_result<status_resource> result) {
            if (result.is_resource()) return;

            const auto& error = result.error();
            if (!error.is_version()) {
                LOG_DEBUG("subscriptions", "subscriptions.read failed for %s: %s",
                          rid.c_str(), error.message.c_str());
                return;
            }

            legacy_read_handler handler;
            {
                std::lock_guard<std::mutex> lock(handler_mutex_);
                handler = legacy_read_handler_;
            }
            if (handler) handler(rid, target);
        });
}

void subscriptions_client::legacy_mark_as_read(const std::string& rid, local_store& store) {
    if (!legacy_) {
        LOG_DEBUG("subscriptions", "No legacy channel, cannot mark %s as read", rid.c_str());
        return;
    }

    legacy_->send(make_method_call("readMessages", json::array({rid})),
        [rid, &store](rpc_response response) {
            if (response.is_error()) {
                LOG_DEBUG("subscriptions", "readMessages failed for %s: %s",
                          rid.c_str(), response.error->c_str());
                return;
            }
            try {
                store.write([&](database& db) {
                    auto sub = find_subscription(db, rid);
                    if (!sub) return;
                    sub->alert = false;
                    sub->unread = 0;
                    sub->user_mentions = 0;
                    sub->group_mentions = 0;
                    save_subscription(db, *sub);
                });
            } catch (const db_error& e) {
                LOG_ERROR("subscriptions", "Failed to clear read state of %s: %s", rid.c_str(), e.what());
            }
        });
}

// ============================================================================
// Merging
// ============================================================================

sync_result subscriptions_client::apply_subscriptions(local_store& store, const delta_batch& batch, bool fallback) {
    try {
        auto report = merge_engine(store).merge_subscriptions(batch, clock_.now());
        if (!report.has_session) {
            return sync_result::skipped("No authenticated session", fallback);
        }
        return sync_result::applied(report, fallback);
    } catch (const db_error& e) {
        LOG_ERROR("subscriptions", "Subscriptions merge rolled back: %s", e.what());
        return sync_result::failed(api_error_kind::other, e.what(), fallback);
    }
}

sync_result subscriptions_client::apply_rooms(local_store& store, const delta_batch& batch, bool fallback) {
    try {
        merge_engine engine(store);
        if (!engine.backdate_watermark(clock_.now())) {
            LOG_DEBUG("subscriptions", "No session to backdate the watermark for");
        }
        auto report = engine.merge_rooms(batch);
        return sync_result::applied(report, fallback);
    } catch (const db_error& e) {
        LOG_ERROR("subscriptions", "Rooms merge rolled back: %s", e.what());
        return sync_result::failed(api_error_kind::other, e.what(), fallback);
    }
}

// ============================================================================
// Typed fetches
// ============================================================================

void subscriptions_client::fetch_subscriptions(std::optional<timestamp_t> updated_since,
                                               sync_completion completion,
                                               local_store* store) {
    local_store& target = resolve(store);
    subscriptions_request request{updated_since};

    api_.fetch(request, fetch_options::retrying(retry_count_),
        [this, updated_since, &target, completion = std::move(completion)](api_result<delta_resource> result) {
            if (!result.is_resource()) {
                const auto& error = result.error();
                if (error.is_version()) {
                    // servers < 0.60.0
                    LOG_INFO("subscriptions", "subscriptions.get unsupported, using subscriptions/get");
                    fetch_subscriptions_fallback(updated_since, completion, &target);
                    return;
                }
                LOG_DEBUG("subscriptions", "subscriptions.get failed: %s", error.message.c_str());
                finish(completion, sync_result::skipped(error.message, false, api_error_kind::other));
                return;
            }

            const auto& resource = result.resource();
            if (resource.success != true) {
                finish(completion, sync_result::skipped("Server did not report success", false));
                return;
            }
            finish(completion, apply_subscriptions(target, resource.batch, false));
        });
}

void subscriptions_client::fetch_rooms(std::optional<timestamp_t> updated_since,
                                       sync_completion completion,
                                       local_store* store) {
    local_store& target = resolve(store);
    rooms_request request{updated_since};

    api_.fetch(request, fetch_options::retrying(retry_count_),
        [this, updated_since, &target, completion = std::move(completion)](api_result<delta_resource> result) {
            if (!result.is_resource()) {
                const auto& error = result.error();
                if (error.is_version()) {
                    // servers < 0.62.0
                    LOG_INFO("subscriptions", "rooms.get unsupported, using rooms/get");
                    fetch_rooms_fallback(updated_since, completion, &target);
                    return;
                }
                LOG_DEBUG("subscriptions", "rooms.get failed: %s", error.message.c_str());
                finish(completion, sync_result::skipped(error.message, false, api_error_kind::other));
                return;
            }

            const auto& resource = result.resource();
            if (resource.success != true) {
                finish(completion, sync_result::skipped("Server did not report success", false));
                return;
            }
            finish(completion, apply_rooms(target, resource.batch, false));
        });
}

// ============================================================================
// Legacy fallbacks
// ============================================================================

void subscriptions_client::call_legacy(const std::string& method,
                                       std::optional<timestamp_t> updated_since,
                                       std::function<void(rpc_response)> handler) {
    json params = json::array();
    if (updated_since) {
        params.push_back(to_date_wrapper(*updated_since));
    }
    legacy_->send(make_method_call(method, std::move(params)), std::move(handler));
}

void subscriptions_client::fetch_subscriptions_fallback(std::optional<timestamp_t> updated_since,
                                                        sync_completion completion,
                                                        local_store* store) {
    if (!legacy_) {
        finish(completion, sync_result::failed(api_error_kind::version,
                                               "No legacy channel for subscriptions/get", true));
        return;
    }

    local_store& target = resolve(store);
    call_legacy("subscriptions/get", updated_since,
        [this, &target, completion = std::move(completion)](rpc_response response) {
            if (response.is_error()) {
                LOG_DEBUG("subscriptions", "subscriptions/get failed: %s", response.error->c_str());
                finish(completion, sync_result::skipped(*response.error, true, api_error_kind::other));
                return;
            }
            auto batch = delta_batch::from_legacy_result(response.result());
            finish(completion, apply_subscriptions(target, batch, true));
        });
}

void subscriptions_client::fetch_rooms_fallback(std::optional<timestamp_t> updated_since,
                                                sync_completion completion,
                                                local_store* store) {
    if (!legacy_) {
        finish(completion, sync_result::failed(api_error_kind::version,
                                               "No legacy channel for rooms/get", true));
        return;
    }

    local_store& target = resolve(store);
    call_legacy("rooms/get", updated_since,
        [this, &target, completion = std::move(completion)](rpc_response response) {
            if (response.is_error()) {
                LOG_DEBUG("subscriptions", "rooms/get failed: %s", response.error->c_str());
                finish(completion, sync_result::skipped(*response.error, true, api_error_kind::other));
                return;
            }
            auto batch = delta_batch::from_legacy_result(response.result());
            finish(completion, apply_rooms(target, batch, true));
        });
}

} // namespace roomsync
