#pragma once

#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>
#include <functional>
#include <unordered_map>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "multipart_parser.hpp"
#include "thread_pool.hpp"

namespace pixserv {

struct HttpRequest {
    std::string method;
    std::string path;
    std::string version;
    // Header names are stored lowercased.
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    std::unordered_map<std::string, std::string> queryParams;
    std::unordered_map<std::string, std::string> pathParams;

    // Filled by the upload stage of a request pipeline.
    std::vector<MultipartPart> files;

    std::string getHeader(const std::string& name) const;
};

struct HttpResponse {
    int statusCode = 200;
    std::string statusText = "OK";
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    void setStatus(int code);

    void setJson(const nlohmann::json& jsonObj) {
        body = jsonObj.dump();
        headers["Content-Type"] = "application/json; charset=utf-8";
    }

    void setText(const std::string& text) {
        body = text;
        headers["Content-Type"] = "text/plain; charset=utf-8";
    }

    void setError(int code, const std::string& message);
};

std::string statusTextFor(int statusCode);

class HttpServer {
public:
    using RequestHandler = std::function<void(HttpRequest&, HttpResponse&)>;

    // 10 files of 10 MiB plus multipart framing.
    static constexpr size_t kDefaultMaxBodySize = 10 * 10 * 1024 * 1024 + 1024 * 1024;

    // Request line plus headers.
    static constexpr size_t kMaxHeaderSize = 64 * 1024;

    explicit HttpServer(unsigned short port, size_t workerThreads = 4);

    ~HttpServer();

    // Binds and starts accepting. Returns false if the port cannot be bound.
    bool start();

    // Closes every open connection, then waits for running handlers.
    void stop();

    // Path may contain ":name" segments captured into pathParams.
    void addRoute(const std::string& method, const std::string& path, RequestHandler handler);

    // Receives GET/HEAD requests that matched no route.
    void setFallbackHandler(RequestHandler handler);

    void setMaxBodySize(size_t bytes);

    // A connection with no read or write progress for this long is closed.
    void setIdleTimeout(std::chrono::milliseconds timeout);

    bool isRunning() const;

    // Actual bound port once started (useful when constructed with port 0).
    unsigned short port() const;

    HttpResponse dispatch(HttpRequest& request);

    static bool parseRequestHead(const std::string& head, HttpRequest& request);

    static std::unordered_map<std::string, std::string> parseQueryParams(const std::string& queryString);

    static std::string urlDecode(const std::string& value, bool plusAsSpace = false);

private:
    class Connection;

    void acceptConnection();

    void trackConnection(const std::shared_ptr<Connection>& connection);

    void untrackConnection(Connection* connection);

    static std::string serializeResponse(const HttpResponse& response, bool headOnly);

    RequestHandler findHandler(const std::string& method, const std::string& path,
                               std::unordered_map<std::string, std::string>& params) const;

    static bool matchPattern(const std::string& pattern, const std::string& path,
                             std::unordered_map<std::string, std::string>& params);

    static void applyCorsHeaders(HttpResponse& response);

private:
    unsigned short port_;
    size_t workerThreads_;
    size_t maxBodySize_ = kDefaultMaxBodySize;
    std::chrono::milliseconds idleTimeout_{std::chrono::seconds(30)};

    // Declared before the io_service: connections still queued in it
    // unregister themselves when it is destroyed.
    std::mutex connectionsMutex_;
    std::unordered_map<Connection*, std::weak_ptr<Connection>> connections_;

    std::unique_ptr<boost::asio::io_service> ioService_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::unique_ptr<ThreadPool> workers_;

    std::unordered_map<std::string, std::unordered_map<std::string, RequestHandler>> routes_;
    std::unordered_map<std::string, std::vector<std::pair<std::string, RequestHandler>>> patternRoutes_;
    RequestHandler fallback_;

    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> serverThread_;
};

} // namespace pixserv
