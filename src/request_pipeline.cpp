#include "../include/request_pipeline.hpp"

#include <utility>

namespace pixserv {

RequestPipeline& RequestPipeline::use(Stage stage) {
    stages_.push_back(std::move(stage));
    return *this;
}

RequestPipeline& RequestPipeline::handle(HttpServer::RequestHandler handler) {
    handler_ = std::move(handler);
    return *this;
}

void RequestPipeline::run(HttpRequest& request, HttpResponse& response) const {
    for (const auto& stage : stages_) {
        if (stage(request, response) == StageResult::Respond) {
            return;
        }
    }

    if (handler_) {
        handler_(request, response);
    }
}

HttpServer::RequestHandler RequestPipeline::build() const {
    RequestPipeline pipeline = *this;
    return [pipeline](HttpRequest& request, HttpResponse& response) {
        pipeline.run(request, response);
    };
}

} // namespace pixserv
