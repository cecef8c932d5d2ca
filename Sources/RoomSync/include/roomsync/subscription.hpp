#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "db.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace roomsync {

// ============================================================================
// Subscription - the user's membership in one room, keyed by room id
// ============================================================================

struct subscription {
    std::string rid;
    std::optional<std::string> subscription_id;

    std::string name;
    std::optional<std::string> fname;
    std::string type;            // "c" channel, "p" private group, "d" direct
    bool open = false;
    bool alert = false;
    bool favorite = false;
    int64_t unread = 0;
    int64_t user_mentions = 0;
    int64_t group_mentions = 0;
    std::optional<timestamp_t> last_seen;
    std::optional<timestamp_t> updated_at;

    // Room metadata, filled by the rooms fetch
    std::optional<std::string> room_topic;
    std::optional<std::string> room_description;
    std::optional<std::string> room_announcement;
    bool room_read_only = false;
    std::optional<std::string> room_last_message;
    std::optional<timestamp_t> room_last_message_at;
    std::optional<timestamp_t> room_updated_at;

    // Ownership link to AuthSession.id; nullopt after a soft removal
    std::optional<std::string> auth_id;
};

extern const table_schema subscription_schema;

/// Apply the fields present in a subscription payload. Absent fields keep
/// their current value.
void map_subscription(subscription& sub, const nlohmann::json& values);

/// Apply the fields present in a room payload (never touches identity or
/// ownership).
void map_room(subscription& sub, const nlohmann::json& values);

std::optional<subscription> find_subscription(database& db, const std::string& rid);

std::optional<subscription> find_subscription_by_id(database& db, const std::string& subscription_id);

/// All subscriptions, ordered by rid. auth_id filters on the ownership link.
std::vector<subscription> all_subscriptions(database& db,
                                            const std::optional<std::string>& auth_id = std::nullopt);

size_t count_subscriptions(database& db);

/// Add or replace by rid.
void save_subscription(database& db, const subscription& sub);

} // namespace roomsync

#endif // __cplusplus
