#pragma once

#ifdef __cplusplus

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace roomsync {

using HeadersMap = std::map<std::string, std::string>;

// ============================================================================
// HTTP
// ============================================================================
//
// The embedder supplies the HTTP stack (URLSession, OkHttp, libcurl...)
// through network_factory.

struct http_response {
    /// 0 means no response was received (DNS, TLS, connection reset, timeout)
    int status_code = 0;
    HeadersMap headers;
    std::string body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    const std::string& body_string() const { return body; }

    static http_response with_body(int status, std::string body) {
        http_response r;
        r.status_code = status;
        r.body = std::move(body);
        return r;
    }
};

struct http_request {
    std::string method = "GET";
    std::string url;
    HeadersMap headers;
    std::string body;

    void set_json_body(std::string json) {
        body = std::move(json);
        headers["Content-Type"] = "application/json";
    }

    const std::string& body_string() const { return body; }
};

class http_client {
public:
    using completion_handler = std::function<void(http_response)>;

    virtual ~http_client() = default;

    /// Exactly one call to handler per request, on any thread.
    virtual void send_async(const http_request& request, completion_handler handler) = 0;
};

// ============================================================================
// Realtime socket
// ============================================================================
//
// Text-frame socket the legacy DDP channel runs over (a WebSocket in
// production).

enum class transport_state {
    connecting,
    open,
    closing,
    closed
};

struct transport_message {
    std::string data;

    const std::string& as_string() const { return data; }

    static transport_message from_string(std::string s) {
        return transport_message{std::move(s)};
    }
};

class sync_transport {
public:
    using on_open_handler = std::function<void()>;
    using on_message_handler = std::function<void(const transport_message&)>;
    using on_error_handler = std::function<void(const std::string& error)>;
    using on_close_handler = std::function<void(int code, const std::string& reason)>;

    virtual ~sync_transport() = default;

    virtual void connect(const std::string& url, const HeadersMap& headers = {}) = 0;
    virtual void disconnect() = 0;
    virtual transport_state state() const = 0;

    virtual void send(const transport_message& message) = 0;

    virtual void set_on_open(on_open_handler handler) = 0;
    virtual void set_on_message(on_message_handler handler) = 0;
    virtual void set_on_error(on_error_handler handler) = 0;
    virtual void set_on_close(on_close_handler handler) = 0;
};

// ============================================================================
// Factory
// ============================================================================

class network_factory {
public:
    virtual ~network_factory() = default;

    virtual std::unique_ptr<http_client> create_http_client() = 0;
    virtual std::unique_ptr<sync_transport> create_sync_transport() = 0;
};

// Process-wide factory, set by the platform layer. Defaults to
// mock_network_factory until one is registered.
void set_network_factory(std::shared_ptr<network_factory> factory);
std::shared_ptr<network_factory> get_network_factory();

// ============================================================================
// Test doubles
// ============================================================================

/// Answers from a queue of scripted responses (503 once it runs dry) and
/// records every request, completing synchronously.
class mock_http_client : public http_client {
public:
    void send_async(const http_request& request, completion_handler handler) override {
        http_response response;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            if (responses_.empty()) {
                response.status_code = 503;
            } else {
                response = std::move(responses_.front());
                responses_.pop_front();
            }
        }
        if (handler) handler(std::move(response));
    }

    void enqueue(http_response response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(std::move(response));
    }

    void enqueue_json(int status, std::string body) {
        enqueue(http_response::with_body(status, std::move(body)));
    }

    std::vector<http_request> get_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    void clear_requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::deque<http_response> responses_;
    std::vector<http_request> requests_;
};

/// Opens synchronously on connect and can answer each sent frame itself.
class mock_sync_transport : public sync_transport {
public:
    using reply_fn = std::function<std::optional<transport_message>(const transport_message&)>;

    void connect(const std::string& url, const HeadersMap& headers = {}) override {
        url_ = url;
        headers_ = headers;
        state_ = transport_state::open;
        if (on_open_) on_open_();
    }

    void disconnect() override {
        state_ = transport_state::closed;
        if (on_close_) on_close_(1000, "Normal closure");
    }

    transport_state state() const override { return state_; }

    void send(const transport_message& message) override {
        sent_messages_.push_back(message);
        if (!auto_reply_) return;
        if (auto reply = auto_reply_(message)) {
            simulate_message(*reply);
        }
    }

    void set_on_open(on_open_handler handler) override { on_open_ = std::move(handler); }
    void set_on_message(on_message_handler handler) override { on_message_ = std::move(handler); }
    void set_on_error(on_error_handler handler) override { on_error_ = std::move(handler); }
    void set_on_close(on_close_handler handler) override { on_close_ = std::move(handler); }

    void simulate_message(const transport_message& msg) {
        if (on_message_) on_message_(msg);
    }

    void simulate_error(const std::string& error) {
        if (on_error_) on_error_(error);
    }

    /// Reply synchronously to each sent frame (nullopt = no reply)
    void set_auto_reply(reply_fn fn) { auto_reply_ = std::move(fn); }

    const std::vector<transport_message>& get_sent_messages() const { return sent_messages_; }
    const std::string& url() const { return url_; }
    const HeadersMap& headers() const { return headers_; }

private:
    std::string url_;
    HeadersMap headers_;
    transport_state state_ = transport_state::closed;
    on_open_handler on_open_;
    on_message_handler on_message_;
    on_error_handler on_error_;
    on_close_handler on_close_;
    reply_fn auto_reply_;
    std::vector<transport_message> sent_messages_;
};

class mock_network_factory : public network_factory {
public:
    std::unique_ptr<http_client> create_http_client() override {
        auto client = std::make_unique<mock_http_client>();
        last_http_client_ = client.get();
        return client;
    }

    std::unique_ptr<sync_transport> create_sync_transport() override {
        auto transport = std::make_unique<mock_sync_transport>();
        last_transport_ = transport.get();
        return transport;
    }

    mock_http_client* last_http_client() { return last_http_client_; }
    mock_sync_transport* last_transport() { return last_transport_; }

private:
    mock_http_client* last_http_client_ = nullptr;
    mock_sync_transport* last_transport_ = nullptr;
};

} // namespace roomsync

#endif // __cplusplus
