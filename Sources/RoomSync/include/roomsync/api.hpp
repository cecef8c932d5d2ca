#pragma once

#ifdef __cplusplus

#include "network.hpp"
#include "delta.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace roomsync {

using QueryMap = std::map<std::string, std::string>;

// ============================================================================
// Server version
// ============================================================================

struct server_version {
    int major = 0;
    int minor = 0;
    int patch = 0;

    /// Parses "0.62.1", "0.62", "0.62.1-rc.0" (pre-release suffix ignored).
    static std::optional<server_version> parse(const std::string& s);

    std::string to_string() const;

    bool operator<(const server_version& other) const {
        if (major != other.major) return major < other.major;
        if (minor != other.minor) return minor < other.minor;
        return patch < other.patch;
    }
    bool operator==(const server_version& other) const {
        return major == other.major && minor == other.minor && patch == other.patch;
    }
};

// ============================================================================
// API errors and results
// ============================================================================

enum class api_error_kind {
    version,  // the server does not support this endpoint
    other
};

struct api_error {
    api_error_kind kind = api_error_kind::other;
    int status = 0;           // HTTP status, 0 when no response arrived
    bool transient = false;   // eligible for retry
    std::string message;

    bool is_version() const { return kind == api_error_kind::version; }

    static api_error version(std::string message, int status = 0) {
        return {api_error_kind::version, status, false, std::move(message)};
    }
    static api_error other(std::string message, int status, bool transient) {
        return {api_error_kind::other, status, transient, std::move(message)};
    }
};

template<typename Resource>
class api_result {
public:
    api_result(Resource resource) : value_(std::move(resource)) {}
    api_result(api_error error) : value_(std::move(error)) {}

    bool is_resource() const { return std::holds_alternative<Resource>(value_); }
    const Resource& resource() const { return std::get<Resource>(value_); }
    const api_error& error() const { return std::get<api_error>(value_); }

private:
    std::variant<Resource, api_error> value_;
};

struct fetch_options {
    /// Retries after the first attempt on transient failures. Never applied to
    /// version errors.
    int retry_on_error = 0;

    static fetch_options retrying(int count) {
        fetch_options options;
        options.retry_on_error = count;
        return options;
    }
};

// ============================================================================
// Resources
// ============================================================================

/// Delta-shaped payload returned by subscriptions.get and rooms.get.
struct delta_resource {
    std::optional<bool> success;
    delta_batch batch;

    static std::optional<delta_resource> decode(const nlohmann::json& payload);
};

struct status_resource {
    std::optional<bool> success;

    static std::optional<status_resource> decode(const nlohmann::json& payload);
};

// ============================================================================
// Requests
// ============================================================================
//
// A request names its endpoint, the first server version that serves it and
// the resource its response decodes to.

struct subscriptions_request {
    using resource_type = delta_resource;
    static constexpr const char* method = "GET";
    static constexpr const char* path = "/api/v1/subscriptions.get";
    static constexpr server_version required_version{0, 60, 0};

    std::optional<timestamp_t> updated_since;

    QueryMap query() const;
    std::optional<nlohmann::json> body() const { return std::nullopt; }
};

struct rooms_request {
    using resource_type = delta_resource;
    static constexpr const char* method = "GET";
    static constexpr const char* path = "/api/v1/rooms.get";
    static constexpr server_version required_version{0, 62, 0};

    std::optional<timestamp_t> updated_since;

    QueryMap query() const;
    std::optional<nlohmann::json> body() const { return std::nullopt; }
};

struct subscription_read_request {
    using resource_type = status_resource;
    static constexpr const char* method = "POST";
    static constexpr const char* path = "/api/v1/subscriptions.read";
    static constexpr server_version required_version{0, 61, 0};

    std::string rid;

    QueryMap query() const { return {}; }
    std::optional<nlohmann::json> body() const { return nlohmann::json{{"rid", rid}}; }
};

struct api_credentials {
    std::string base_url;   // "https://open.rocket.chat"
    std::string user_id;
    std::string auth_token;
};

std::string url_encode(const std::string& value);

// ============================================================================
// api_fetcher - typed request/response over an http_client
// ============================================================================

class api_fetcher {
public:
    using raw_handler = std::function<void(std::variant<nlohmann::json, api_error>)>;

    api_fetcher(std::unique_ptr<http_client> client, api_credentials credentials);

    // Non-copyable (in-flight requests capture this)
    api_fetcher(const api_fetcher&) = delete;
    api_fetcher& operator=(const api_fetcher&) = delete;

    void set_credentials(api_credentials credentials);
    api_credentials credentials() const;

    /// Known server version; requests newer than it fail fast with a version
    /// error instead of going to the network.
    void set_server_version(std::optional<server_version> version);
    std::optional<server_version> known_server_version() const;

    template<typename Request>
    void fetch(const Request& request,
               fetch_options options,
               std::function<void(api_result<typename Request::resource_type>)> completion) {
        using resource_type = typename Request::resource_type;

        auto version = known_server_version();
        if (version && *version < Request::required_version) {
            completion(api_error::version(
                std::string(Request::path) + " requires server " + Request::required_version.to_string()));
            return;
        }

        auto http = build_request(Request::method, Request::path, request.query(), request.body());
        send_with_retry(std::move(http), options.retry_on_error,
            [completion = std::move(completion)](std::variant<nlohmann::json, api_error> outcome) {
                if (auto* error = std::get_if<api_error>(&outcome)) {
                    completion(*error);
                    return;
                }
                auto decoded = resource_type::decode(std::get<nlohmann::json>(outcome));
                if (!decoded) {
                    completion(api_error::other("Unexpected response shape", 200, false));
                    return;
                }
                completion(std::move(*decoded));
            });
    }

    /// Classifies a raw HTTP response into a JSON payload or an api_error.
    static std::variant<nlohmann::json, api_error> classify(const http_response& response);

private:
    std::unique_ptr<http_client> client_;
    mutable std::mutex mutex_;
    api_credentials credentials_;
    std::optional<server_version> server_version_;

    http_request build_request(const std::string& method,
                               const std::string& path,
                               const QueryMap& query,
                               const std::optional<nlohmann::json>& body) const;

    void send_with_retry(http_request request, int retries_left, raw_handler handler);
};

} // namespace roomsync

#endif // __cplusplus
