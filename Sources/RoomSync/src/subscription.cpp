#include "roomsync/subscription.hpp"
#include "roomsync/date.hpp"

namespace roomsync {

using json = nlohmann::json;

const table_schema subscription_schema = {
    "Subscription",
    {
        {"rid", column_type::text, false, true},
        {"subscriptionId", column_type::text, true},
        {"name", column_type::text},
        {"fname", column_type::text, true},
        {"type", column_type::text},
        {"open", column_type::integer},
        {"alert", column_type::integer},
        {"favorite", column_type::integer},
        {"unread", column_type::integer},
        {"userMentions", column_type::integer},
        {"groupMentions", column_type::integer},
        {"lastSeen", column_type::real, true},
        {"updatedAt", column_type::real, true},
        {"roomTopic", column_type::text, true},
        {"roomDescription", column_type::text, true},
        {"roomAnnouncement", column_type::text, true},
        {"roomReadOnly", column_type::integer},
        {"roomLastMessage", column_type::text, true},
        {"roomLastMessageAt", column_type::real, true},
        {"roomUpdatedAt", column_type::real, true},
        {"authId", column_type::text, true},
    }
};

namespace {

void read_string(const json& values, const char* key, std::string& out) {
    auto it = values.find(key);
    if (it != values.end() && it->is_string()) out = it->get<std::string>();
}

void read_string(const json& values, const char* key, std::optional<std::string>& out) {
    auto it = values.find(key);
    if (it == values.end()) return;
    if (it->is_string()) {
        out = it->get<std::string>();
    } else if (it->is_null()) {
        out.reset();
    }
}

void read_bool(const json& values, const char* key, bool& out) {
    auto it = values.find(key);
    if (it != values.end() && it->is_boolean()) out = it->get<bool>();
}

void read_int(const json& values, const char* key, int64_t& out) {
    auto it = values.find(key);
    if (it != values.end() && it->is_number()) out = it->get<int64_t>();
}

void read_date(const json& values, const char* key, std::optional<timestamp_t>& out) {
    auto it = values.find(key);
    if (it == values.end()) return;
    if (auto date = parse_date(*it)) out = date;
}

subscription subscription_from_row(const database::row_t& row) {
    subscription sub;
    sub.rid = column_as<std::string>(row, "rid").value_or("");
    sub.subscription_id = column_as<std::string>(row, "subscriptionId");
    sub.name = column_as<std::string>(row, "name").value_or("");
    sub.fname = column_as<std::string>(row, "fname");
    sub.type = column_as<std::string>(row, "type").value_or("");
    sub.open = column_as<bool>(row, "open").value_or(false);
    sub.alert = column_as<bool>(row, "alert").value_or(false);
    sub.favorite = column_as<bool>(row, "favorite").value_or(false);
    sub.unread = column_as<int64_t>(row, "unread").value_or(0);
    sub.user_mentions = column_as<int64_t>(row, "userMentions").value_or(0);
    sub.group_mentions = column_as<int64_t>(row, "groupMentions").value_or(0);
    sub.last_seen = column_as<timestamp_t>(row, "lastSeen");
    sub.updated_at = column_as<timestamp_t>(row, "updatedAt");
    sub.room_topic = column_as<std::string>(row, "roomTopic");
    sub.room_description = column_as<std::string>(row, "roomDescription");
    sub.room_announcement = column_as<std::string>(row, "roomAnnouncement");
    sub.room_read_only = column_as<bool>(row, "roomReadOnly").value_or(false);
    sub.room_last_message = column_as<std::string>(row, "roomLastMessage");
    sub.room_last_message_at = column_as<timestamp_t>(row, "roomLastMessageAt");
    sub.room_updated_at = column_as<timestamp_t>(row, "roomUpdatedAt");
    sub.auth_id = column_as<std::string>(row, "authId");
    return sub;
}

} // namespace

void map_subscription(subscription& sub, const json& values) {
    if (!values.is_object()) return;

    read_string(values, "rid", sub.rid);
    read_string(values, "_id", sub.subscription_id);
    read_string(values, "name", sub.name);
    read_string(values, "fname", sub.fname);
    read_string(values, "t", sub.type);
    read_bool(values, "open", sub.open);
    read_bool(values, "alert", sub.alert);
    read_bool(values, "f", sub.favorite);
    read_int(values, "unread", sub.unread);
    read_int(values, "userMentions", sub.user_mentions);
    read_int(values, "groupMentions", sub.group_mentions);
    read_date(values, "ls", sub.last_seen);
    read_date(values, "_updatedAt", sub.updated_at);
}

void map_room(subscription& sub, const json& values) {
    if (!values.is_object()) return;

    read_string(values, "name", sub.name);
    read_string(values, "fname", sub.fname);
    read_string(values, "t", sub.type);
    read_string(values, "topic", sub.room_topic);
    read_string(values, "description", sub.room_description);
    read_string(values, "announcement", sub.room_announcement);
    read_bool(values, "ro", sub.room_read_only);
    read_date(values, "lm", sub.room_last_message_at);
    read_date(values, "_updatedAt", sub.room_updated_at);

    auto last_message = values.find("lastMessage");
    if (last_message != values.end() && last_message->is_object()) {
        read_string(*last_message, "msg", sub.room_last_message);
    }
}

std::optional<subscription> find_subscription(database& db, const std::string& rid) {
    auto rows = db.query("SELECT * FROM Subscription WHERE rid = ?", {rid});
    if (rows.empty()) return std::nullopt;
    return subscription_from_row(rows[0]);
}

std::optional<subscription> find_subscription_by_id(database& db, const std::string& subscription_id) {
    auto rows = db.query("SELECT * FROM Subscription WHERE subscriptionId = ? LIMIT 1", {subscription_id});
    if (rows.empty()) return std::nullopt;
    return subscription_from_row(rows[0]);
}

std::vector<subscription> all_subscriptions(database& db, const std::optional<std::string>& auth_id) {
    std::vector<database::row_t> rows;
    if (auth_id) {
        rows = db.query("SELECT * FROM Subscription WHERE authId = ? ORDER BY rid", {*auth_id});
    } else {
        rows = db.query("SELECT * FROM Subscription ORDER BY rid");
    }

    std::vector<subscription> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        result.push_back(subscription_from_row(row));
    }
    return result;
}

size_t count_subscriptions(database& db) {
    auto rows = db.query("SELECT COUNT(*) AS n FROM Subscription");
    return static_cast<size_t>(column_as<int64_t>(rows.at(0), "n").value_or(0));
}

void save_subscription(database& db, const subscription& sub) {
    db.upsert("Subscription", "rid", {
        {"rid", sub.rid},
        {"subscriptionId", to_column(sub.subscription_id)},
        {"name", sub.name},
        {"fname", to_column(sub.fname)},
        {"type", sub.type},
        {"open", to_column(sub.open)},
        {"alert", to_column(sub.alert)},
        {"favorite", to_column(sub.favorite)},
        {"unread", sub.unread},
        {"userMentions", sub.user_mentions},
        {"groupMentions", sub.group_mentions},
        {"lastSeen", to_column(sub.last_seen)},
        {"updatedAt", to_column(sub.updated_at)},
        {"roomTopic", to_column(sub.room_topic)},
        {"roomDescription", to_column(sub.room_description)},
        {"roomAnnouncement", to_column(sub.room_announcement)},
        {"roomReadOnly", to_column(sub.room_read_only)},
        {"roomLastMessage", to_column(sub.room_last_message)},
        {"roomLastMessageAt", to_column(sub.room_last_message_at)},
        {"roomUpdatedAt", to_column(sub.room_updated_at)},
        {"authId", to_column(sub.auth_id)},
    });
}

} // namespace roomsync
