#include "roomsync/ddp.hpp"
#include "roomsync/log.hpp"

namespace roomsync {

using json = nlohmann::json;

const json& rpc_response::result() const {
    static const json null_result;
    if (!message.is_object()) return null_result;
    auto it = message.find("result");
    return it != message.end() ? *it : null_result;
}

json make_method_call(const std::string& method, json params) {
    if (!params.is_array()) {
        params = json::array({std::move(params)});
    }
    return json{
        {"msg", "method"},
        {"method", method},
        {"params", std::move(params)}
    };
}

namespace {

// DDP errors arrive as {"error": 404, "reason": "...", "message": "..."}
std::string describe_error(const json& error) {
    if (error.is_object()) {
        for (const char* key : {"message", "reason"}) {
            auto it = error.find(key);
            if (it != error.end() && it->is_string()) return it->get<std::string>();
        }
    }
    if (error.is_string()) return error.get<std::string>();
    return error.dump();
}

} // namespace

// ============================================================================
// ddp_channel implementation
// ============================================================================

ddp_channel::ddp_channel(std::unique_ptr<sync_transport> transport)
    : transport_(std::move(transport))
{
    transport_->set_on_open([this] { on_transport_open(); });
    transport_->set_on_message([this](const transport_message& msg) { on_transport_message(msg); });
    transport_->set_on_error([this](const std::string& err) { on_transport_error(err); });
    transport_->set_on_close([this](int code, const std::string& reason) { on_transport_close(code, reason); });
}

ddp_channel::~ddp_channel() {
    transport_->set_on_open(nullptr);
    transport_->set_on_message(nullptr);
    transport_->set_on_error(nullptr);
    transport_->set_on_close(nullptr);
    if (transport_->state() != transport_state::closed) {
        transport_->disconnect();
    }
    state_ = state::disconnected;
    fail_all("Channel destroyed");
}

void ddp_channel::connect(const std::string& url, const HeadersMap& headers) {
    if (state_ != state::disconnected) return;
    state_ = state::connecting;
    LOG_DEBUG("ddp", "Connecting to %s", url.c_str());
    transport_->connect(url, headers);
}

void ddp_channel::disconnect() {
    transport_->disconnect();
    state_ = state::disconnected;
    fail_all("Disconnected");
}

size_t ddp_channel::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void ddp_channel::send(json message, response_handler handler) {
    if (state_ == state::disconnected) {
        if (handler) handler(rpc_response::failure("Not connected"));
        return;
    }

    std::string frame;
    bool queue = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string id = std::to_string(next_id_++);
        message["id"] = id;
        pending_[id] = std::move(handler);
        frame = message.dump();
        if (state_ != state::connected) {
            outbox_.push_back(frame);
            queue = true;
        }
    }

    if (!queue) {
        transport_->send(transport_message::from_string(frame));
    }
}

void ddp_channel::send_frame(const json& frame) {
    transport_->send(transport_message::from_string(frame.dump()));
}

void ddp_channel::on_transport_open() {
    send_frame(json{
        {"msg", "connect"},
        {"version", "1"},
        {"support", json::array({"1"})}
    });
}

void ddp_channel::on_transport_message(const transport_message& msg) {
    json frame = json::parse(msg.as_string(), nullptr, false);
    if (frame.is_discarded() || !frame.is_object()) {
        LOG_DEBUG("ddp", "Ignoring undecodable frame");
        return;
    }

    auto kind_it = frame.find("msg");
    if (kind_it == frame.end() || !kind_it->is_string()) return;
    const std::string kind = kind_it->get<std::string>();

    if (kind == "connected") {
        std::vector<std::string> queued;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = state::connected;
            queued.swap(outbox_);
        }
        LOG_DEBUG("ddp", "Connected, flushing %zu queued calls", queued.size());
        for (const auto& text : queued) {
            transport_->send(transport_message::from_string(text));
        }
    } else if (kind == "failed") {
        // Server rejected the protocol version offered in "connect"
        LOG_WARN("ddp", "Handshake rejected by server");
        transport_->disconnect();
        state_ = state::disconnected;
        fail_all("DDP handshake failed");
    } else if (kind == "ping") {
        json pong{{"msg", "pong"}};
        if (frame.contains("id")) pong["id"] = frame["id"];
        send_frame(pong);
    } else if (kind == "result") {
        auto id_it = frame.find("id");
        if (id_it == frame.end() || !id_it->is_string()) return;

        response_handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id_it->get<std::string>());
            if (it == pending_.end()) return;
            handler = std::move(it->second);
            pending_.erase(it);
        }

        rpc_response response;
        auto error_it = frame.find("error");
        if (error_it != frame.end() && !error_it->is_null()) {
            response.error = describe_error(*error_it);
        }
        response.message = std::move(frame);
        if (handler) handler(std::move(response));
    }
}

void ddp_channel::on_transport_error(const std::string& error) {
    LOG_DEBUG("ddp", "Transport error: %s", error.c_str());
    state_ = state::disconnected;
    fail_all(error);
}

void ddp_channel::on_transport_close(int code, const std::string& reason) {
    LOG_DEBUG("ddp", "Transport closed (%d): %s", code, reason.c_str());
    state_ = state::disconnected;
    fail_all("Connection closed: " + reason);
}

void ddp_channel::fail_all(const std::string& error) {
    std::map<std::string, response_handler> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_);
        outbox_.clear();
    }
    for (auto& [id, handler] : pending) {
        if (handler) handler(rpc_response::failure(error));
    }
}

} // namespace roomsync
