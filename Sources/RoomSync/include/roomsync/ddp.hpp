#pragma once

#ifdef __cplusplus

#include "network.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace roomsync {

// ============================================================================
// Legacy RPC channel
// ============================================================================
//
// Servers that predate the REST endpoints only answer method calls over the
// realtime socket. The orchestrator talks to them through rpc_channel so tests
// can script replies without a socket.

struct rpc_response {
    nlohmann::json message;              // the reply frame as received
    std::optional<std::string> error;    // set when the call failed

    bool is_error() const { return error.has_value(); }

    /// The "result" member of the reply, or null when there is none.
    const nlohmann::json& result() const;

    static rpc_response failure(std::string error) {
        rpc_response response;
        response.error = std::move(error);
        return response;
    }
};

class rpc_channel {
public:
    using response_handler = std::function<void(rpc_response)>;

    virtual ~rpc_channel() = default;

    /// Send a method call and deliver exactly one response to handler.
    virtual void send(nlohmann::json message, response_handler handler) = 0;
};

/// {"msg":"method","method":<method>,"params":<params>}
nlohmann::json make_method_call(const std::string& method, nlohmann::json params = nlohmann::json::array());

// ============================================================================
// ddp_channel - method calls framed as DDP over a sync_transport
// ============================================================================

class ddp_channel : public rpc_channel {
public:
    enum class state { disconnected, connecting, connected };

    explicit ddp_channel(std::unique_ptr<sync_transport> transport);
    ~ddp_channel() override;

    // Non-copyable, non-moveable (transport handlers capture this)
    ddp_channel(const ddp_channel&) = delete;
    ddp_channel& operator=(const ddp_channel&) = delete;

    /// Open the socket and perform the DDP handshake. Calls sent before the
    /// server answers "connected" are queued.
    void connect(const std::string& url, const HeadersMap& headers = {});
    void disconnect();

    state current_state() const { return state_; }
    bool is_connected() const { return state_ == state::connected; }

    /// Assigns the call id and sends it, or queues it during the handshake.
    /// Fails immediately when the channel is disconnected.
    void send(nlohmann::json message, response_handler handler) override;

    size_t pending_count() const;

private:
    std::unique_ptr<sync_transport> transport_;
    std::atomic<state> state_{state::disconnected};

    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::map<std::string, response_handler> pending_;
    std::vector<std::string> outbox_;

    void on_transport_open();
    void on_transport_message(const transport_message& msg);
    void on_transport_error(const std::string& error);
    void on_transport_close(int code, const std::string& reason);

    void send_frame(const nlohmann::json& frame);
    void fail_all(const std::string& error);
};

} // namespace roomsync

#endif // __cplusplus
