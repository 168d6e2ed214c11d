#pragma once

#include <string>
#include "http_server.hpp"
#include "storage_manager.hpp"

namespace pixserv {

/**
 * @class StaticResponder
 * @brief Serves stored files by name with an extension-derived Content-Type
 *
 * Misses are plain-text 404s, never JSON.
 */
class StaticResponder {
public:
    StaticResponder(const StorageManager& storage, std::string indexPage);

    // Fallback handler for GET/HEAD requests that matched no route.
    void serve(const HttpRequest& request, HttpResponse& response) const;

    // GET / : the upload page.
    void serveIndex(const HttpRequest& request, HttpResponse& response) const;

    static std::string contentTypeFor(const std::string& filename);

    static std::string httpDate(int64_t epochSeconds);

private:
    static bool readFile(const std::string& path, std::string& data);

    static void notFound(const HttpRequest& request, HttpResponse& response);

    const StorageManager& storage_;
    std::string indexPage_;
};

} // namespace pixserv
