#pragma once

#include <string>
#include "config.hpp"
#include "http_server.hpp"
#include "request_pipeline.hpp"

namespace pixserv {

/**
 * @class AuthGate
 * @brief Shared-secret check in front of mutating routes
 *
 * The credential comes from "Authorization: Bearer <key>" or, when that
 * header is absent, from the "key" query parameter.
 */
class AuthGate {
public:
    explicit AuthGate(const ServerSettings& settings);

    AuthGate(bool requireAuth, std::string authKey);

    bool isAuthorized(const HttpRequest& request) const;

    // Out-of-band key check used by /auth/check. No side effects.
    bool checkKey(const std::string& key) const;

    // Pipeline stage that throws Unauthorized for a missing or wrong key.
    RequestPipeline::Stage stage() const;

    bool requiresAuth() const { return requireAuth_; }

    bool usesPlaceholderKey() const;

    static std::string extractCredential(const HttpRequest& request);

private:
    static bool constantTimeEquals(const std::string& a, const std::string& b);

    bool requireAuth_;
    std::string authKey_;
};

} // namespace pixserv
