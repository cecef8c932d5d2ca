#pragma once

#ifdef __cplusplus

#include "api.hpp"
#include "ddp.hpp"
#include "date.hpp"
#include "network.hpp"
#include "scheduler.hpp"
#include "store.hpp"
#include "subscriptions_client.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace roomsync {

// ============================================================================
// Configuration
// ============================================================================

struct sync_configuration {
    /// Database file path. Use ":memory:" for an in-memory store.
    std::string path = ":memory:";

    /// Scheduler for dispatching completions. nullptr = immediate_scheduler.
    std::shared_ptr<scheduler> sched = nullptr;

    /// REST base URL, e.g. "https://open.rocket.chat"
    std::string server_url;

    /// Realtime socket URL for the legacy channel. Empty string = no legacy
    /// fallback; version errors are then reported as failed.
    /// Example: "wss://open.rocket.chat/websocket"
    std::string websocket_url;

    std::string user_id;
    std::string auth_token;

    /// Server version if already known ("0.58.2"). Requests the server is too
    /// old for go straight to the legacy channel.
    std::optional<std::string> server_version;

    /// Retries after the first attempt for typed fetches.
    int retry_count = subscriptions_client::default_retry_count;

    sync_configuration() = default;

    explicit sync_configuration(const std::string& p) : path(p) {}

    sync_configuration(const std::string& p, std::shared_ptr<roomsync::scheduler> s)
        : path(p), sched(std::move(s)) {}
};

// ============================================================================
// sync_client - owns the store, transports and orchestrator
// ============================================================================

class sync_client {
public:
    using sync_handler = std::function<void(const sync_result& subscriptions, const sync_result& rooms)>;

    /// Transports come from the registered network_factory.
    explicit sync_client(const sync_configuration& config = {});

    sync_client(const sync_configuration& config,
                std::unique_ptr<http_client> http,
                std::unique_ptr<sync_transport> transport);

    ~sync_client();

    // Non-copyable, non-moveable
    sync_client(const sync_client&) = delete;
    sync_client& operator=(const sync_client&) = delete;
    sync_client(sync_client&&) = delete;
    sync_client& operator=(sync_client&&) = delete;

    /// Store the configured credentials as the current session.
    auth_session sign_in();

    void set_server_version(const std::string& version);

    /// Open the legacy channel and resume the session over it with the auth
    /// token. No-op without a websocket_url or when already open.
    void connect_legacy();
    void disconnect_legacy();

    /// Subscriptions since the current watermark, then rooms since the same
    /// point. handler fires once both have completed.
    void sync(sync_handler handler);

    local_store& store() { return *store_; }
    api_fetcher& api() { return *api_; }
    server_clock& clock() { return clock_; }
    subscriptions_client& subscriptions() { return *subscriptions_; }
    ddp_channel* legacy() { return legacy_.get(); }
    const sync_configuration& config() const { return config_; }

private:
    sync_configuration config_;
    std::unique_ptr<local_store> store_;
    std::unique_ptr<api_fetcher> api_;
    std::unique_ptr<ddp_channel> legacy_;
    server_clock clock_;
    std::unique_ptr<subscriptions_client> subscriptions_;
};

} // namespace roomsync

#endif // __cplusplus
