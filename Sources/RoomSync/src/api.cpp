#include "roomsync/api.hpp"
#include "roomsync/date.hpp"
#include "roomsync/log.hpp"
#include <cctype>
#include <cstdio>
#include <sstream>
#include <iomanip>

namespace roomsync {

using json = nlohmann::json;
using raw_outcome = std::variant<json, api_error>;

// ============================================================================
// server_version
// ============================================================================

std::optional<server_version> server_version::parse(const std::string& s) {
    server_version v;
    int consumed = 0;
    int fields = std::sscanf(s.c_str(), "%d.%d%n", &v.major, &v.minor, &consumed);
    if (fields != 2 || v.major < 0 || v.minor < 0) return std::nullopt;

    size_t pos = static_cast<size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        int patch_consumed = 0;
        if (std::sscanf(s.c_str() + pos + 1, "%d%n", &v.patch, &patch_consumed) != 1 || v.patch < 0) {
            return std::nullopt;
        }
        pos += 1 + static_cast<size_t>(patch_consumed);
    }
    if (pos < s.size() && s[pos] != '-' && s[pos] != '+') return std::nullopt;
    return v;
}

std::string server_version::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

// ============================================================================
// Resources
// ============================================================================

namespace {

std::optional<bool> success_flag(const json& payload) {
    auto it = payload.find("success");
    if (it == payload.end() || !it->is_boolean()) return std::nullopt;
    return it->get<bool>();
}

} // namespace

std::optional<delta_resource> delta_resource::decode(const json& payload) {
    delta_resource resource;
    // A non-object payload decodes to "no success flag, nothing to merge"
    if (!payload.is_object()) return resource;
    resource.success = success_flag(payload);
    resource.batch = delta_batch::from_typed(payload);
    return resource;
}

std::optional<status_resource> status_resource::decode(const json& payload) {
    status_resource resource;
    if (payload.is_object()) {
        resource.success = success_flag(payload);
    }
    return resource;
}

QueryMap subscriptions_request::query() const {
    if (!updated_since) return {};
    return {{"updatedSince", to_iso8601(*updated_since)}};
}

QueryMap rooms_request::query() const {
    if (!updated_since) return {};
    return {{"updatedSince", to_iso8601(*updated_since)}};
}

std::string url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return out.str();
}

// ============================================================================
// api_fetcher
// ============================================================================

api_fetcher::api_fetcher(std::unique_ptr<http_client> client, api_credentials credentials)
    : client_(std::move(client))
    , credentials_(std::move(credentials)) {}

void api_fetcher::set_credentials(api_credentials credentials) {
    std::lock_guard<std::mutex> lock(mutex_);
    credentials_ = std::move(credentials);
}

api_credentials api_fetcher::credentials() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_;
}

void api_fetcher::set_server_version(std::optional<server_version> version) {
    std::lock_guard<std::mutex> lock(mutex_);
    server_version_ = version;
}

std::optional<server_version> api_fetcher::known_server_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_version_;
}

http_request api_fetcher::build_request(const std::string& method,
                                        const std::string& path,
                                        const QueryMap& query,
                                        const std::optional<json>& body) const {
    auto creds = credentials();

    http_request request;
    request.method = method;

    std::string base = creds.base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    request.url = base + path;

    char separator = '?';
    for (const auto& [key, value] : query) {
        request.url += separator;
        request.url += url_encode(key) + "=" + url_encode(value);
        separator = '&';
    }

    request.headers["Accept"] = "application/json";
    if (!creds.user_id.empty()) request.headers["X-User-Id"] = creds.user_id;
    if (!creds.auth_token.empty()) request.headers["X-Auth-Token"] = creds.auth_token;

    if (body) {
        request.set_json_body(body->dump());
    }
    return request;
}

raw_outcome api_fetcher::classify(const http_response& response) {
    const int status = response.status_code;

    if (status == 0) {
        return raw_outcome(std::in_place_type<api_error>,
                           api_error::other("No response from server", 0, true));
    }

    json payload = json::parse(response.body_string(), nullptr, false);

    if (response.is_success()) {
        if (payload.is_discarded()) {
            return raw_outcome(std::in_place_type<api_error>,
                               api_error::other("Malformed JSON response", status, true));
        }
        return raw_outcome(std::in_place_type<json>, std::move(payload));
    }

    std::string message = "HTTP " + std::to_string(status);
    if (!payload.is_discarded() && payload.is_object()) {
        for (const char* key : {"error", "message"}) {
            auto it = payload.find(key);
            if (it != payload.end() && it->is_string()) {
                message += ": " + it->get<std::string>();
                break;
            }
        }
    }

    // Servers that predate an endpoint answer 404 for it
    if (status == 404) {
        return raw_outcome(std::in_place_type<api_error>, api_error::version(message, status));
    }

    bool transient = status == 429 || status >= 500;
    return raw_outcome(std::in_place_type<api_error>, api_error::other(message, status, transient));
}

void api_fetcher::send_with_retry(http_request request, int retries_left, raw_handler handler) {
    LOG_DEBUG("api", "%s %s", request.method.c_str(), request.url.c_str());

    client_->send_async(request,
        [this, request, retries_left, handler = std::move(handler)](http_response response) mutable {
            auto outcome = classify(response);

            auto* error = std::get_if<api_error>(&outcome);
            if (error && error->transient && retries_left > 0) {
                LOG_INFO("api", "Retrying %s after '%s' (%d retries left)",
                         request.url.c_str(), error->message.c_str(), retries_left - 1);
                send_with_retry(std::move(request), retries_left - 1, std::move(handler));
                return;
            }
            if (error) {
                LOG_DEBUG("api", "%s failed: %s", request.url.c_str(), error->message.c_str());
            }
            handler(std::move(outcome));
        });
}

} // namespace roomsync
