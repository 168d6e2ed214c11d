#include <gtest/gtest.h>
#include "../include/errors.hpp"
#include "../include/http_server.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

using namespace pixserv;
using boost::asio::ip::tcp;

namespace {

HttpRequest makeRequest(const std::string& method, const std::string& path) {
    HttpRequest request;
    request.method = method;
    request.path = path;
    return request;
}

std::string roundTrip(unsigned short port, const std::string& raw) {
    boost::asio::io_service io;
    tcp::socket socket(io);
    socket.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port));
    boost::asio::write(socket, boost::asio::buffer(raw));

    boost::asio::streambuf buffer;
    boost::system::error_code ec;
    boost::asio::read(socket, buffer, boost::asio::transfer_all(), ec);

    return std::string(boost::asio::buffers_begin(buffer.data()), boost::asio::buffers_end(buffer.data()));
}

std::unique_ptr<tcp::socket> connectStalled(boost::asio::io_service& io, unsigned short port,
                                            const std::string& partial) {
    auto socket = std::make_unique<tcp::socket>(io);
    socket->connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port));
    if (!partial.empty()) {
        boost::asio::write(*socket, boost::asio::buffer(partial));
    }
    return socket;
}

} // namespace

TEST(HttpServerParsing, ParsesRequestLineQueryAndHeaders) {
    HttpRequest request;
    ASSERT_TRUE(HttpServer::parseRequestHead(
        "POST /upload?key=s%20k&flag HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Type: multipart/form-data; boundary=x \r\n"
        "AUTHORIZATION: Bearer abc\r\n"
        "\r\n", request));

    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.path, "/upload");
    EXPECT_EQ(request.version, "HTTP/1.1");
    EXPECT_EQ(request.queryParams["key"], "s k");
    EXPECT_EQ(request.queryParams.count("flag"), 1u);
    EXPECT_EQ(request.getHeader("content-type"), "multipart/form-data; boundary=x");
    EXPECT_EQ(request.getHeader("Authorization"), "Bearer abc");
}

TEST(HttpServerParsing, RejectsGarbage) {
    HttpRequest request;
    EXPECT_FALSE(HttpServer::parseRequestHead("\r\n\r\n", request));

    HttpRequest relative;
    EXPECT_FALSE(HttpServer::parseRequestHead("GET nothing HTTP/1.1\r\n\r\n", relative));
}

TEST(HttpServerParsing, UrlDecoding) {
    EXPECT_EQ(HttpServer::urlDecode("a%20b+c"), "a b+c");
    EXPECT_EQ(HttpServer::urlDecode("a%20b+c", true), "a b c");
    EXPECT_EQ(HttpServer::urlDecode("%2e%2E%2F"), "../");
    EXPECT_EQ(HttpServer::urlDecode("bad%zzend%4"), "bad%zzend%4");
}

TEST(HttpServerDispatch, RoutesExactPaths) {
    HttpServer server(0);
    server.addRoute("GET", "/health", [](HttpRequest&, HttpResponse& res) { res.setText("ok"); });

    HttpRequest request = makeRequest("GET", "/health");
    HttpResponse response = server.dispatch(request);
    EXPECT_EQ(response.statusCode, 200);
    EXPECT_EQ(response.body, "ok");
    EXPECT_EQ(response.headers["Access-Control-Allow-Origin"], "*");
}

TEST(HttpServerDispatch, CapturesDecodedPathParameters) {
    HttpServer server(0);
    std::string captured;
    server.addRoute("DELETE", "/delete/:filename", [&captured](HttpRequest& req, HttpResponse&) {
        captured = req.pathParams["filename"];
    });

    HttpRequest request = makeRequest("DELETE", "/delete/my%20cat.png");
    EXPECT_EQ(server.dispatch(request).statusCode, 200);
    EXPECT_EQ(captured, "my cat.png");

    HttpRequest tooDeep = makeRequest("DELETE", "/delete/a/b.png");
    EXPECT_EQ(server.dispatch(tooDeep).statusCode, 404);

    HttpRequest empty = makeRequest("DELETE", "/delete/");
    EXPECT_EQ(server.dispatch(empty).statusCode, 404);
}

TEST(HttpServerDispatch, UnknownRouteIsNotFound) {
    HttpServer server(0);
    HttpRequest request = makeRequest("POST", "/nowhere");
    EXPECT_EQ(server.dispatch(request).statusCode, 404);
}

TEST(HttpServerDispatch, OptionsAnswersPreflight) {
    HttpServer server(0);
    HttpRequest request = makeRequest("OPTIONS", "/upload");
    HttpResponse response = server.dispatch(request);
    EXPECT_EQ(response.statusCode, 204);
    EXPECT_EQ(response.headers["Access-Control-Allow-Methods"], "GET, POST, DELETE, OPTIONS");
    EXPECT_NE(response.headers["Access-Control-Allow-Headers"].find("Authorization"), std::string::npos);
}

TEST(HttpServerDispatch, HeadUsesGetHandler) {
    HttpServer server(0);
    server.addRoute("GET", "/list", [](HttpRequest&, HttpResponse& res) { res.setJson(nlohmann::json::array()); });

    HttpRequest request = makeRequest("HEAD", "/list");
    EXPECT_EQ(server.dispatch(request).statusCode, 200);
}

TEST(HttpServerDispatch, FallbackServesUnmatchedGetsOnly) {
    HttpServer server(0);
    server.setFallbackHandler([](HttpRequest&, HttpResponse& res) { res.setText("static"); });

    HttpRequest get = makeRequest("GET", "/cat.png");
    EXPECT_EQ(server.dispatch(get).body, "static");

    HttpRequest post = makeRequest("POST", "/cat.png");
    EXPECT_EQ(server.dispatch(post).statusCode, 404);
}

TEST(HttpServerDispatch, ServiceErrorsBecomeJson) {
    HttpServer server(0);
    server.addRoute("GET", "/denied", [](HttpRequest&, HttpResponse&) { throw Unauthorized(); });

    HttpRequest request = makeRequest("GET", "/denied");
    HttpResponse response = server.dispatch(request);
    EXPECT_EQ(response.statusCode, 401);
    EXPECT_EQ(response.statusText, "Unauthorized");
    auto body = nlohmann::json::parse(response.body);
    EXPECT_EQ(body["error"], "Unauthorized. Please provide a valid auth key.");
    EXPECT_EQ(response.headers["Access-Control-Allow-Origin"], "*");
}

TEST(HttpServerDispatch, UnexpectedErrorsBecome500) {
    HttpServer server(0);
    server.addRoute("GET", "/boom", [](HttpRequest&, HttpResponse&) { throw std::runtime_error("disk on fire"); });

    HttpRequest request = makeRequest("GET", "/boom");
    HttpResponse response = server.dispatch(request);
    EXPECT_EQ(response.statusCode, 500);
    EXPECT_EQ(nlohmann::json::parse(response.body)["error"], "Internal server error");
}

class HttpServerLoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<HttpServer>(0, 2);
        server_->addRoute("GET", "/health", [](HttpRequest&, HttpResponse& res) {
            res.setJson({{"status", "healthy"}});
        });
        server_->addRoute("POST", "/echo", [this](HttpRequest& req, HttpResponse& res) {
            echoCalls_++;
            res.setText(req.body);
        });
        ASSERT_TRUE(server_->start());
        ASSERT_NE(server_->port(), 0);
    }

    void TearDown() override {
        server_->stop();
    }

    std::unique_ptr<HttpServer> server_;
    std::atomic<int> echoCalls_{0};
};

TEST_F(HttpServerLoopbackTest, ServesRequestsOverTcp) {
    std::string response = roundTrip(server_->port(), "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
    EXPECT_NE(response.find("Access-Control-Allow-Origin: *"), std::string::npos);
    EXPECT_NE(response.find("{\"status\":\"healthy\"}"), std::string::npos);
}

TEST_F(HttpServerLoopbackTest, ReadsFullBodyByContentLength) {
    std::string body(100000, 'z');
    std::string response = roundTrip(server_->port(),
        "POST /echo HTTP/1.1\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_EQ(response.substr(response.size() - body.size()), body);
}

TEST(HttpServerLimits, RefusesOversizedBodyBeforeReadingIt) {
    std::atomic<int> calls{0};
    HttpServer server(0, 1);
    server.setMaxBodySize(16);
    server.addRoute("POST", "/echo", [&calls](HttpRequest&, HttpResponse&) { calls++; });
    ASSERT_TRUE(server.start());

    std::string response = roundTrip(server.port(), "POST /echo HTTP/1.1\r\nContent-Length: 1000\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 413 Payload Too Large\r\n", 0), 0u) << response;
    EXPECT_EQ(calls.load(), 0);

    server.stop();
}

TEST_F(HttpServerLoopbackTest, DropsRequestWhenClientDisconnectsMidBody) {
    {
        boost::asio::io_service io;
        tcp::socket socket(io);
        socket.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), server_->port()));
        boost::asio::write(socket, boost::asio::buffer(std::string(
            "POST /echo HTTP/1.1\r\nContent-Length: 100\r\n\r\nonly ten..")));
        socket.close();
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(echoCalls_.load(), 0);

    std::string response = roundTrip(server_->port(), "GET /health HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
}

TEST(HttpServerStartup, SecondBindOnSamePortFails) {
    HttpServer first(0, 1);
    ASSERT_TRUE(first.start());

    HttpServer second(first.port(), 1);
    EXPECT_FALSE(second.start());
    EXPECT_FALSE(second.isRunning());

    first.stop();
}

TEST_F(HttpServerLoopbackTest, StalledClientsDoNotBlockOtherRequests) {
    boost::asio::io_service io;
    std::vector<std::unique_ptr<tcp::socket>> stalled;
    // More stalled clients than worker threads.
    for (int i = 0; i < 5; ++i) {
        stalled.push_back(connectStalled(io, server_->port(), "GET /hea"));
    }

    unsigned short port = server_->port();
    auto health = std::async(std::launch::async, [port] {
        return roundTrip(port, "GET /health HTTP/1.1\r\n\r\n");
    });

    bool answered = health.wait_for(std::chrono::seconds(3)) == std::future_status::ready;
    if (!answered) {
        server_->stop();
    }
    ASSERT_TRUE(answered);
    EXPECT_EQ(health.get().rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
}

TEST_F(HttpServerLoopbackTest, OversizedHeadIsRejected) {
    std::string response = roundTrip(server_->port(), std::string(HttpServer::kMaxHeaderSize, 'a'));
    EXPECT_EQ(response.rfind("HTTP/1.1 431 Request Header Fields Too Large\r\n", 0), 0u) << response.substr(0, 80);
}

TEST(HttpServerTimeouts, ClosesIdleConnection) {
    HttpServer server(0, 1);
    server.setIdleTimeout(std::chrono::milliseconds(200));
    ASSERT_TRUE(server.start());

    unsigned short port = server.port();
    auto response = std::async(std::launch::async, [port] {
        return roundTrip(port, "GET /hea");
    });

    bool closed = response.wait_for(std::chrono::seconds(3)) == std::future_status::ready;
    if (!closed) {
        server.stop();
    }
    ASSERT_TRUE(closed);
    EXPECT_TRUE(response.get().empty());

    server.stop();
}

TEST(HttpServerShutdown, StopDoesNotWaitForIdleClient) {
    HttpServer server(0, 2);
    ASSERT_TRUE(server.start());

    boost::asio::io_service io;
    std::unique_ptr<tcp::socket> idle = connectStalled(io, server.port(), "");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto stopped = std::async(std::launch::async, [&server] { server.stop(); });

    bool returned = stopped.wait_for(std::chrono::seconds(3)) == std::future_status::ready;
    if (!returned) {
        idle->close();
    }
    EXPECT_TRUE(returned);
    EXPECT_FALSE(server.isRunning());

    // The server closed its end.
    char byte;
    boost::system::error_code ec;
    idle->read_some(boost::asio::buffer(&byte, 1), ec);
    EXPECT_TRUE(ec);
}
