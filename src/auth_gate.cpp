#include "../include/auth_gate.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"

#include <utility>

namespace pixserv {

AuthGate::AuthGate(const ServerSettings& settings)
    : AuthGate(settings.requireAuth, settings.authKey) {}

AuthGate::AuthGate(bool requireAuth, std::string authKey)
    : requireAuth_(requireAuth), authKey_(std::move(authKey)) {}

std::string AuthGate::extractCredential(const HttpRequest& request) {
    // An empty header falls through to the query parameter.
    auto header = request.headers.find("authorization");
    if (header != request.headers.end() && !header->second.empty()) {
        const std::string prefix = "Bearer ";
        const std::string& value = header->second;
        return value.compare(0, prefix.size(), prefix) == 0 ? value.substr(prefix.size()) : value;
    }

    auto query = request.queryParams.find("key");
    if (query != request.queryParams.end()) {
        return query->second;
    }

    return "";
}

bool AuthGate::isAuthorized(const HttpRequest& request) const {
    if (!requireAuth_) {
        return true;
    }

    std::string provided = extractCredential(request);
    return !provided.empty() && constantTimeEquals(provided, authKey_);
}

bool AuthGate::checkKey(const std::string& key) const {
    return !requireAuth_ || constantTimeEquals(key, authKey_);
}

RequestPipeline::Stage AuthGate::stage() const {
    return [this](HttpRequest& request, HttpResponse&) {
        if (!isAuthorized(request)) {
            LOG_WARNING("Unauthorized " + request.method + " " + request.path);
            throw Unauthorized();
        }
        return StageResult::Continue;
    };
}

bool AuthGate::usesPlaceholderKey() const {
    return authKey_ == kDefaultAuthKey;
}

bool AuthGate::constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }

    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

} // namespace pixserv
