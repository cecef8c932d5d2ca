#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "db.hpp"
#include <optional>
#include <string>

namespace roomsync {

// ============================================================================
// Authenticated session
// ============================================================================
//
// One row per (server, user). The most recently accessed row is the
// "current" session; its lastSubscriptionFetch column is the sync watermark.

struct auth_session {
    std::string id;              // serverUrl + "|" + userId
    std::string server_url;
    std::string user_id;
    std::string token;
    std::optional<std::string> server_version;
    std::optional<timestamp_t> last_subscription_fetch;
    std::optional<timestamp_t> last_access;

    static std::string make_id(const std::string& server_url, const std::string& user_id) {
        return server_url + "|" + user_id;
    }
};

extern const table_schema auth_session_schema;

/// The current session, or nullopt when nobody is signed in.
std::optional<auth_session> find_current_auth(database& db);

std::optional<auth_session> find_auth(database& db, const std::string& id);

/// Insert or replace by id.
void save_auth(database& db, const auth_session& auth);

/// Set the sync watermark of one session.
void set_last_subscription_fetch(database& db, const std::string& auth_id, timestamp_t value);

} // namespace roomsync

#endif // __cplusplus
