#include "roomsync/sync_client.hpp"
#include "roomsync/log.hpp"

namespace roomsync {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

sync_client::sync_client(const sync_configuration& config)
    : sync_client(config,
                  get_network_factory()->create_http_client(),
                  config.websocket_url.empty() ? nullptr : get_network_factory()->create_sync_transport())
{
}

sync_client::sync_client(const sync_configuration& config,
                         std::unique_ptr<http_client> http,
                         std::unique_ptr<sync_transport> transport)
    : config_(config)
    , store_(std::make_unique<local_store>(config.path))
    , api_(std::make_unique<api_fetcher>(std::move(http),
                                         api_credentials{config.server_url, config.user_id, config.auth_token}))
{
    if (transport) {
        legacy_ = std::make_unique<ddp_channel>(std::move(transport));
    }
    if (config_.server_version) {
        set_server_version(*config_.server_version);
    }
    subscriptions_ = std::make_unique<subscriptions_client>(
        *store_, *api_, legacy_.get(), clock_, config_.sched, config_.retry_count);
}

sync_client::~sync_client() {
    // Outstanding legacy calls complete (as skipped) while the orchestrator
    // and store they report into are still alive.
    if (legacy_) legacy_->disconnect();
    legacy_.reset();
    subscriptions_.reset();
}

auth_session sync_client::sign_in() {
    auth_session auth;
    store_->write([&](database& db) {
        auto id = auth_session::make_id(config_.server_url, config_.user_id);
        if (auto existing = find_auth(db, id)) {
            auth = std::move(*existing);
        } else {
            auth.id = id;
            auth.server_url = config_.server_url;
            auth.user_id = config_.user_id;
        }
        auth.token = config_.auth_token;
        if (config_.server_version) auth.server_version = config_.server_version;
        auth.last_access = std::chrono::system_clock::now();
        save_auth(db, auth);
    });
    LOG_INFO("sync_client", "Signed in as %s on %s", config_.user_id.c_str(), config_.server_url.c_str());
    return auth;
}

void sync_client::set_server_version(const std::string& version) {
    auto parsed = server_version::parse(version);
    if (!parsed) {
        LOG_WARN("sync_client", "Ignoring unparseable server version '%s'", version.c_str());
        return;
    }
    api_->set_server_version(parsed);
}

void sync_client::connect_legacy() {
    if (!legacy_ || legacy_->current_state() != ddp_channel::state::disconnected) return;

    HeadersMap headers;
    if (!config_.auth_token.empty()) {
        headers["X-Auth-Token"] = config_.auth_token;
    }
    legacy_->connect(config_.websocket_url, headers);

    // Method calls run unauthenticated until the session is resumed. Sent
    // first, so it leads any call queued during the handshake.
    if (!config_.auth_token.empty()) {
        legacy_->send(make_method_call("login", nlohmann::json{{"resume", config_.auth_token}}),
            [](rpc_response response) {
                if (response.is_error()) {
                    LOG_WARN("sync_client", "Legacy resume login failed: %s", response.error->c_str());
                } else {
                    LOG_DEBUG("sync_client", "Legacy session resumed");
                }
            });
    }
}

void sync_client::disconnect_legacy() {
    if (legacy_) legacy_->disconnect();
}

void sync_client::sync(sync_handler handler) {
    std::optional<timestamp_t> since;
    if (auto auth = store_->current_auth()) {
        since = auth->last_subscription_fetch;
    }

    subscriptions_->fetch_subscriptions(since,
        [this, since, handler = std::move(handler)](const sync_result& subscriptions_result) {
            subscriptions_->fetch_rooms(since,
                [handler, subscriptions_result](const sync_result& rooms_result) {
                    if (handler) handler(subscriptions_result, rooms_result);
                });
        });
}

} // namespace roomsync
