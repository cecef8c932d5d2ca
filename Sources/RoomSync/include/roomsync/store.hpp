#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "auth.hpp"
#include "subscription.hpp"
#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace roomsync {

// ============================================================================
// local_store - the persisted store shared by sync and the UI
// ============================================================================
//
// Owns the SQLite connection and the schema. Write blocks are serialized
// across threads and run inside one IMMEDIATE transaction, so a sync batch is
// either fully visible or not at all.

class local_store {
public:
    // In-memory store
    local_store() : local_store(":memory:") {}

    explicit local_store(const std::string& path)
        : path_(path)
        , db_(std::make_unique<database>(path)) {
        ensure_tables();
    }

    // Non-copyable
    local_store(const local_store&) = delete;
    local_store& operator=(const local_store&) = delete;

    /// Run block(database&) in a transaction; rolls back and rethrows on error.
    template<typename F>
    void write(F&& block) {
        std::lock_guard<std::recursive_mutex> lock(write_mutex_);
        if (db_->is_in_transaction()) {
            // Nested write on the same thread joins the outer transaction
            block(*db_);
            return;
        }
        transaction tx(*db_);
        block(*db_);
        tx.commit();
    }

    /// Run block(database&) against the store without opening a transaction.
    template<typename F>
    auto read(F&& block) {
        std::lock_guard<std::recursive_mutex> lock(write_mutex_);
        return block(*db_);
    }

    database& db() { return *db_; }
    const std::string& path() const { return path_; }

    // Convenience accessors (each a single read)
    std::optional<auth_session> current_auth() {
        return read([](database& db) { return find_current_auth(db); });
    }

    std::optional<subscription> find(const std::string& rid) {
        return read([&](database& db) { return find_subscription(db, rid); });
    }

    std::vector<subscription> subscriptions(const std::optional<std::string>& auth_id = std::nullopt) {
        return read([&](database& db) { return all_subscriptions(db, auth_id); });
    }

private:
    std::string path_;
    std::unique_ptr<database> db_;
    std::recursive_mutex write_mutex_;

    void ensure_tables() {
        LOG_DEBUG("store", "Ensuring tables for %s", path_.c_str());
        db_->ensure_table(auth_session_schema);
        db_->ensure_table(subscription_schema);
        db_->ensure_index("Subscription", "authId");
        db_->ensure_index("Subscription", "subscriptionId");
    }
};

} // namespace roomsync

#endif // __cplusplus
