#pragma once

#include <functional>
#include <vector>
#include "http_server.hpp"

namespace pixserv {

enum class StageResult {
    Continue,
    Respond
};

/**
 * @class RequestPipeline
 * @brief Ordered request-processing stages followed by a final handler
 *
 * Each stage either lets the request continue or completes the response
 * itself, in which case later stages and the handler never run. Stages may
 * also throw a ServiceError, which the server turns into an error response.
 */
class RequestPipeline {
public:
    using Stage = std::function<StageResult(HttpRequest&, HttpResponse&)>;

    RequestPipeline& use(Stage stage);

    RequestPipeline& handle(HttpServer::RequestHandler handler);

    void run(HttpRequest& request, HttpResponse& response) const;

    // Adapts the pipeline to a route handler; the pipeline is copied.
    HttpServer::RequestHandler build() const;

private:
    std::vector<Stage> stages_;
    HttpServer::RequestHandler handler_;
};

} // namespace pixserv
