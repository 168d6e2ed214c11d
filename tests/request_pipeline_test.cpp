#include <gtest/gtest.h>
#include "../include/errors.hpp"
#include "../include/request_pipeline.hpp"

#include <string>
#include <vector>

using namespace pixserv;

TEST(RequestPipeline, RunsStagesInOrderThenHandler) {
    std::vector<std::string> calls;

    RequestPipeline pipeline;
    pipeline
        .use([&calls](HttpRequest&, HttpResponse&) { calls.push_back("first"); return StageResult::Continue; })
        .use([&calls](HttpRequest&, HttpResponse&) { calls.push_back("second"); return StageResult::Continue; })
        .handle([&calls](HttpRequest&, HttpResponse& res) { calls.push_back("handler"); res.setText("done"); });

    HttpRequest request;
    HttpResponse response;
    pipeline.run(request, response);

    EXPECT_EQ(calls, (std::vector<std::string>{"first", "second", "handler"}));
    EXPECT_EQ(response.body, "done");
}

TEST(RequestPipeline, RespondingStageShortCircuits) {
    bool handlerRan = false;

    auto handler = RequestPipeline()
        .use([](HttpRequest&, HttpResponse& res) { res.setStatus(204); return StageResult::Respond; })
        .handle([&handlerRan](HttpRequest&, HttpResponse&) { handlerRan = true; })
        .build();

    HttpRequest request;
    HttpResponse response;
    handler(request, response);

    EXPECT_FALSE(handlerRan);
    EXPECT_EQ(response.statusCode, 204);
}

TEST(RequestPipeline, StagesCanAttachDataForTheHandler) {
    size_t seen = 0;

    RequestPipeline pipeline;
    pipeline
        .use([](HttpRequest& req, HttpResponse&) { req.files.resize(3); return StageResult::Continue; })
        .handle([&seen](HttpRequest& req, HttpResponse&) { seen = req.files.size(); });

    HttpRequest request;
    HttpResponse response;
    pipeline.run(request, response);
    EXPECT_EQ(seen, 3u);
}

TEST(RequestPipeline, StageErrorsPropagate) {
    bool handlerRan = false;

    RequestPipeline pipeline;
    pipeline
        .use([](HttpRequest&, HttpResponse&) -> StageResult { throw Unauthorized(); })
        .handle([&handlerRan](HttpRequest&, HttpResponse&) { handlerRan = true; });

    HttpRequest request;
    HttpResponse response;
    EXPECT_THROW(pipeline.run(request, response), Unauthorized);
    EXPECT_FALSE(handlerRan);
}
