#include "../include/image_api.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include "../include/multipart_parser.hpp"

namespace pixserv {

using json = nlohmann::json;

ImageApi::ImageApi(const ServerSettings& settings, StorageManager& storage, const AuthGate& auth)
    : settings_(settings),
      storage_(storage),
      auth_(auth),
      startedAt_(std::chrono::steady_clock::now()) {}

void ImageApi::registerRoutes(HttpServer& server, const StaticResponder& statics) const {
    server.addRoute("GET", "/", [&statics](HttpRequest& req, HttpResponse& res) {
        statics.serveIndex(req, res);
    });

    server.addRoute("GET", "/health", [this](HttpRequest& req, HttpResponse& res) {
        handleHealth(req, res);
    });

    server.addRoute("GET", "/list", [this](HttpRequest& req, HttpResponse& res) {
        handleList(req, res);
    });

    if (!settings_.readOnly) {
        server.addRoute("POST", "/auth/check", [this](HttpRequest& req, HttpResponse& res) {
            handleAuthCheck(req, res);
        });

        server.addRoute("POST", "/upload", RequestPipeline()
            .use(auth_.stage())
            .use(uploadStage("image", 1))
            .handle([this](HttpRequest& req, HttpResponse& res) { handleUpload(req, res); })
            .build());

        server.addRoute("POST", "/upload-multiple", RequestPipeline()
            .use(auth_.stage())
            .use(uploadStage("images", UploadValidator::kMaxFiles))
            .handle([this](HttpRequest& req, HttpResponse& res) { handleUploadMultiple(req, res); })
            .build());

        server.addRoute("DELETE", "/delete/:filename", RequestPipeline()
            .use(auth_.stage())
            .handle([this](HttpRequest& req, HttpResponse& res) { handleDelete(req, res); })
            .build());
    }

    server.setFallbackHandler([&statics](HttpRequest& req, HttpResponse& res) {
        statics.serve(req, res);
    });
}

RequestPipeline::Stage ImageApi::uploadStage(const std::string& fieldName, size_t maxCount) const {
    return [this, fieldName, maxCount](HttpRequest& request, HttpResponse&) {
        std::string boundary = MultipartParser::extractBoundary(request.getHeader("Content-Type"));
        if (boundary.empty()) {
            return StageResult::Continue;
        }

        std::vector<MultipartPart> parts = MultipartParser::parse(request.body, boundary);
        request.files = validator_.collect(parts, fieldName, maxCount);
        return StageResult::Continue;
    };
}

void ImageApi::handleUpload(HttpRequest& request, HttpResponse& response) const {
    if (request.files.empty()) {
        throw NoFileProvided();
    }

    StoredFile stored = storage_.store(request.files.front());

    json body = toJson(stored);
    body["success"] = true;
    response.setJson(body);
}

void ImageApi::handleUploadMultiple(HttpRequest& request, HttpResponse& response) const {
    if (request.files.empty()) {
        throw NoFileProvided("No files uploaded");
    }

    std::vector<StoredFile> stored = storage_.storeAll(request.files);

    json files = json::array();
    for (const auto& file : stored) {
        files.push_back(toJson(file));
    }

    response.setJson({
        {"success", true},
        {"files", files}
    });
}

void ImageApi::handleDelete(HttpRequest& request, HttpResponse& response) const {
    auto it = request.pathParams.find("filename");
    if (it == request.pathParams.end()) {
        throw NotFound();
    }

    storage_.remove(it->second);

    response.setJson({
        {"success", true},
        {"message", "File deleted successfully"}
    });
}

void ImageApi::handleList(HttpRequest&, HttpResponse& response) const {
    json list = json::array();
    for (const auto& entry : storage_.listImages()) {
        list.push_back(toJson(entry));
    }
    response.setJson(list);
}

void ImageApi::handleHealth(HttpRequest&, HttpResponse& response) const {
    response.setJson({
        {"status", "healthy"},
        {"uptime", uptimeSeconds()}
    });
}

void ImageApi::handleAuthCheck(HttpRequest& request, HttpResponse& response) const {
    if (auth_.checkKey(extractKey(request))) {
        response.setJson({{"success", true}});
        return;
    }

    response.setStatus(401);
    response.setJson({
        {"success", false},
        {"error", "Invalid auth key"}
    });
}

double ImageApi::uptimeSeconds() const {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startedAt_;
    return elapsed.count();
}

json ImageApi::toJson(const StoredFile& file) {
    return {
        {"filename", file.filename},
        {"originalName", file.originalName},
        {"size", file.size},
        {"url", file.url}
    };
}

json ImageApi::toJson(const ListingEntry& entry) {
    return {
        {"name", entry.name},
        {"size", entry.size},
        {"isDirectory", entry.isDirectory},
        {"modified", entry.modified},
        {"url", entry.url}
    };
}

std::string ImageApi::extractKey(const HttpRequest& request) {
    std::string contentType = request.getHeader("Content-Type");

    if (contentType.find("application/x-www-form-urlencoded") != std::string::npos) {
        auto form = HttpServer::parseQueryParams(request.body);
        auto it = form.find("key");
        return it != form.end() ? it->second : "";
    }

    if (request.body.empty()) {
        return "";
    }

    json body = json::parse(request.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        LOG_DEBUG("Auth check body is not a JSON object");
        return "";
    }

    auto it = body.find("key");
    if (it == body.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // namespace pixserv
