#include "roomsync/auth.hpp"

namespace roomsync {

const table_schema auth_session_schema = {
    "AuthSession",
    {
        {"id", column_type::text, false, true},
        {"serverUrl", column_type::text},
        {"userId", column_type::text},
        {"token", column_type::text},
        {"serverVersion", column_type::text, true},
        {"lastSubscriptionFetch", column_type::real, true},
        {"lastAccess", column_type::real, true},
    }
};

namespace {

auth_session auth_from_row(const database::row_t& row) {
    auth_session auth;
    auth.id = column_as<std::string>(row, "id").value_or("");
    auth.server_url = column_as<std::string>(row, "serverUrl").value_or("");
    auth.user_id = column_as<std::string>(row, "userId").value_or("");
    auth.token = column_as<std::string>(row, "token").value_or("");
    auth.server_version = column_as<std::string>(row, "serverVersion");
    auth.last_subscription_fetch = column_as<timestamp_t>(row, "lastSubscriptionFetch");
    auth.last_access = column_as<timestamp_t>(row, "lastAccess");
    return auth;
}

} // namespace

std::optional<auth_session> find_current_auth(database& db) {
    auto rows = db.query(
        "SELECT * FROM AuthSession ORDER BY lastAccess IS NULL, lastAccess DESC LIMIT 1");
    if (rows.empty()) return std::nullopt;
    return auth_from_row(rows[0]);
}

std::optional<auth_session> find_auth(database& db, const std::string& id) {
    auto rows = db.query("SELECT * FROM AuthSession WHERE id = ?", {id});
    if (rows.empty()) return std::nullopt;
    return auth_from_row(rows[0]);
}

void save_auth(database& db, const auth_session& auth) {
    db.upsert("AuthSession", "id", {
        {"id", auth.id},
        {"serverUrl", auth.server_url},
        {"userId", auth.user_id},
        {"token", auth.token},
        {"serverVersion", to_column(auth.server_version)},
        {"lastSubscriptionFetch", to_column(auth.last_subscription_fetch)},
        {"lastAccess", to_column(auth.last_access)},
    });
}

void set_last_subscription_fetch(database& db, const std::string& auth_id, timestamp_t value) {
    db.update("AuthSession", "id", auth_id,
              {{"lastSubscriptionFetch", to_column(value)}});
}

} // namespace roomsync
