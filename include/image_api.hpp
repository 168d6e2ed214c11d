#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "auth_gate.hpp"
#include "config.hpp"
#include "http_server.hpp"
#include "request_pipeline.hpp"
#include "static_responder.hpp"
#include "storage_manager.hpp"
#include "upload_validator.hpp"

namespace pixserv {

/**
 * @class ImageApi
 * @brief Upload, list, delete and health endpoints over the storage directory
 *
 * Mutating routes run behind the auth gate; in read-only mode they are not
 * registered at all.
 */
class ImageApi {
public:
    ImageApi(const ServerSettings& settings, StorageManager& storage, const AuthGate& auth);

    void registerRoutes(HttpServer& server, const StaticResponder& statics) const;

    /**
     * @brief Pipeline stage that parses the multipart body into request.files
     * @param fieldName Form field the files must be sent under
     * @param maxCount Maximum number of files accepted
     *
     * A body that is not multipart/form-data leaves request.files empty.
     */
    RequestPipeline::Stage uploadStage(const std::string& fieldName, size_t maxCount) const;

    void handleUpload(HttpRequest& request, HttpResponse& response) const;

    void handleUploadMultiple(HttpRequest& request, HttpResponse& response) const;

    void handleDelete(HttpRequest& request, HttpResponse& response) const;

    void handleList(HttpRequest& request, HttpResponse& response) const;

    void handleHealth(HttpRequest& request, HttpResponse& response) const;

    void handleAuthCheck(HttpRequest& request, HttpResponse& response) const;

    double uptimeSeconds() const;

    static nlohmann::json toJson(const StoredFile& file);

    static nlohmann::json toJson(const ListingEntry& entry);

private:
    static std::string extractKey(const HttpRequest& request);

    const ServerSettings& settings_;
    StorageManager& storage_;
    const AuthGate& auth_;
    UploadValidator validator_;
    std::chrono::steady_clock::time_point startedAt_;
};

} // namespace pixserv
