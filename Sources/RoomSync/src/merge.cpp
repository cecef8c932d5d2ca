#include "roomsync/merge.hpp"
#include "roomsync/log.hpp"
#include <unordered_map>

namespace roomsync {

using json = nlohmann::json;

namespace {

// Rows touched by one batch, in first-touch order. A room id that appears
// again later in the batch resolves to the row already in the batch, so the
// last writer in batch order wins.
class pending_rows {
public:
    explicit pending_rows(database& db) : db_(db) {}

    subscription* find_or_load(const std::string& rid) {
        auto it = index_.find(rid);
        if (it != index_.end()) return &rows_[it->second];

        auto existing = find_subscription(db_, rid);
        if (!existing) return nullptr;
        return &append(std::move(*existing));
    }

    subscription& get_or_create(const std::string& rid) {
        if (auto* sub = find_or_load(rid)) return *sub;
        subscription created;
        created.rid = rid;
        return append(std::move(created));
    }

    std::optional<std::string> rid_for_subscription_id(const std::string& subscription_id) {
        for (const auto& row : rows_) {
            if (row.subscription_id == subscription_id) return row.rid;
        }
        if (auto existing = find_subscription_by_id(db_, subscription_id)) {
            return existing->rid;
        }
        return std::nullopt;
    }

    void save_all() {
        for (const auto& row : rows_) {
            save_subscription(db_, row);
        }
    }

    size_t size() const { return rows_.size(); }

private:
    database& db_;
    std::vector<subscription> rows_;
    std::unordered_map<std::string, size_t> index_;

    subscription& append(subscription sub) {
        index_[sub.rid] = rows_.size();
        rows_.push_back(std::move(sub));
        return rows_.back();
    }
};

// Subscription records are keyed by "rid". Removal records from the REST API
// only carry the subscription "_id", which maps back through the stored row.
std::optional<std::string> resolve_room_id(pending_rows& rows, const json& record) {
    if (auto rid = record_string(record, "rid")) return rid;
    if (auto subscription_id = record_string(record, "_id")) {
        return rows.rid_for_subscription_id(*subscription_id);
    }
    return std::nullopt;
}

} // namespace

merge_report merge_engine::merge_subscriptions(const delta_batch& batch, timestamp_t now) {
    merge_report report;

    store_.write([&](database& db) {
        auto auth = find_current_auth(db);
        if (!auth) {
            LOG_INFO("merge", "No authenticated session, dropping %zu subscription records", batch.size());
            return;
        }
        report.has_session = true;

        pending_rows rows(db);
        auto queue = [&](const json& record, bool owned) {
            auto rid = resolve_room_id(rows, record);
            if (!rid) {
                LOG_DEBUG("merge", "Skipping subscription record without a room id");
                ++report.skipped;
                return;
            }

            auto& sub = rows.get_or_create(*rid);
            map_subscription(sub, record);
            sub.rid = *rid;
            if (owned) {
                sub.auth_id = auth->id;
            } else {
                sub.auth_id.reset();
            }
        };

        for (const auto& record : batch.list) queue(record, true);
        for (const auto& record : batch.update) queue(record, true);
        for (const auto& record : batch.remove) queue(record, false);

        rows.save_all();
        set_last_subscription_fetch(db, auth->id, now);
        report.merged = rows.size();
    });

    LOG_DEBUG("merge", "Merged %zu subscriptions (%zu skipped)", report.merged, report.skipped);
    return report;
}

bool merge_engine::backdate_watermark(timestamp_t now) {
    bool found = false;
    store_.write([&](database& db) {
        auto auth = find_current_auth(db);
        if (!auth) return;
        set_last_subscription_fetch(db, auth->id, now - watermark_backdate);
        found = true;
    });
    return found;
}

merge_report merge_engine::merge_rooms(const delta_batch& batch) {
    merge_report report;

    store_.write([&](database& db) {
        report.has_session = find_current_auth(db).has_value();

        pending_rows rows(db);
        auto enrich = [&](const json& record) {
            auto rid = record_string(record, "_id");
            auto* sub = rid ? rows.find_or_load(*rid) : nullptr;
            if (!sub) {
                ++report.skipped;
                return;
            }
            map_room(*sub, record);
        };

        for (const auto& record : batch.list) enrich(record);
        for (const auto& record : batch.update) enrich(record);

        rows.save_all();
        report.merged = rows.size();
    });

    LOG_DEBUG("merge", "Enriched %zu subscriptions with room data (%zu dropped)", report.merged, report.skipped);
    return report;
}

} // namespace roomsync
