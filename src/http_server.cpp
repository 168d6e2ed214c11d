#include "../include/http_server.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <thread>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

namespace pixserv {

using boost::asio::ip::tcp;

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> segments;
    std::string segment;
    std::istringstream stream(path);
    while (std::getline(stream, segment, '/')) {
        segments.push_back(segment);
    }
    if (!path.empty() && path.back() == '/') {
        segments.push_back("");
    }
    return segments;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string HttpRequest::getHeader(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : "";
}

void HttpResponse::setStatus(int code) {
    statusCode = code;
    statusText = statusTextFor(code);
}

void HttpResponse::setError(int code, const std::string& message) {
    setStatus(code);
    setJson({{"error", message}});
}

std::string statusTextFor(int statusCode) {
    switch (statusCode) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

HttpServer::HttpServer(unsigned short port, size_t workerThreads)
    : port_(port), workerThreads_(workerThreads) {
    ioService_ = std::make_unique<boost::asio::io_service>();
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running_) {
        LOG_WARNING("Server is already running");
        return false;
    }

    boost::system::error_code ec;
    acceptor_ = std::make_unique<tcp::acceptor>(*ioService_);

    tcp::endpoint endpoint(tcp::v4(), port_);
    acceptor_->open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_->bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
    }

    if (ec) {
        if (ec == boost::asio::error::address_in_use) {
            LOG_ERROR("Port " + std::to_string(port_) + " is already in use");
        } else {
            LOG_ERROR("Failed to start server on port " + std::to_string(port_) + ": " + ec.message());
        }
        acceptor_.reset();
        return false;
    }

    port_ = acceptor_->local_endpoint().port();
    workers_ = std::make_unique<ThreadPool>(workerThreads_);
    running_ = true;

    acceptConnection();

    serverThread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("Server listening on port " + std::to_string(port_));
        ioService_->run();
        LOG_INFO("Server thread stopped");
    });

    return true;
}

void HttpServer::addRoute(const std::string& method, const std::string& path, RequestHandler handler) {
    if (path.find("/:") != std::string::npos) {
        patternRoutes_[method].emplace_back(path, std::move(handler));
    } else {
        routes_[method][path] = std::move(handler);
    }
    LOG_DEBUG("Added route: " + method + " " + path);
}

void HttpServer::setFallbackHandler(RequestHandler handler) {
    fallback_ = std::move(handler);
}

void HttpServer::setMaxBodySize(size_t bytes) {
    maxBodySize_ = bytes;
}

void HttpServer::setIdleTimeout(std::chrono::milliseconds timeout) {
    idleTimeout_ = timeout;
}

bool HttpServer::isRunning() const {
    return running_;
}

unsigned short HttpServer::port() const {
    return port_;
}

/**
 * @class HttpServer::Connection
 * @brief One accepted client, from reading the request to writing the response
 *
 * All socket operations run on the io_service thread. Only dispatch() is
 * handed to the worker pool, so an idle or slow client never occupies a worker.
 */
class HttpServer::Connection : public std::enable_shared_from_this<HttpServer::Connection> {
public:
    explicit Connection(HttpServer& server)
        : server_(server),
          socket_(*server.ioService_),
          deadline_(*server.ioService_),
          buffer_(kMaxHeaderSize),
          chunk_(64 * 1024) {}

    ~Connection() {
        server_.untrackConnection(this);
    }

    tcp::socket& socket() { return socket_; }

    void start() {
        armDeadline();
        readHead();
    }

    void close() {
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

private:
    void armDeadline() {
        deadline_.expires_after(server_.idleTimeout_);

        auto self = shared_from_this();
        deadline_.async_wait([this, self](const boost::system::error_code& ec) {
            // A wait that completed just before being re-armed is stale.
            if (ec == boost::asio::error::operation_aborted ||
                deadline_.expiry() > boost::asio::steady_timer::clock_type::now()) {
                return;
            }
            LOG_DEBUG("Closing idle connection");
            close();
        });
    }

    void readHead() {
        auto self = shared_from_this();
        boost::asio::async_read_until(socket_, buffer_, "\r\n\r\n",
            [this, self](const boost::system::error_code& ec, size_t headerSize) {
                if (ec == boost::asio::error::not_found) {
                    LOG_WARNING("Request head exceeds " + std::to_string(kMaxHeaderSize) + " bytes");
                    respondWithError(431, "Request headers too large");
                    return;
                }
                if (ec) {
                    LOG_DEBUG("Error reading request: " + ec.message());
                    finish();
                    return;
                }
                onHead(headerSize);
            });
    }

    void onHead(size_t headerSize) {
        std::string received(
            boost::asio::buffers_begin(buffer_.data()),
            boost::asio::buffers_end(buffer_.data())
        );
        buffer_.consume(buffer_.size());

        if (!parseRequestHead(received.substr(0, headerSize), request_)) {
            respondWithError(400, "Malformed request");
            return;
        }

        if (!request_.getHeader("Transfer-Encoding").empty()) {
            respondWithError(411, "Content-Length required");
            return;
        }

        std::string contentLengthValue = request_.getHeader("Content-Length");
        if (!contentLengthValue.empty()) {
            try {
                contentLength_ = std::stoull(contentLengthValue);
            } catch (const std::exception&) {
                respondWithError(400, "Invalid Content-Length");
                return;
            }
        }

        if (contentLength_ > server_.maxBodySize_) {
            LOG_WARNING("Rejecting " + request_.method + " " + request_.path + ": body of " +
                        std::to_string(contentLength_) + " bytes exceeds limit");
            respondWithError(413, "File too large");
            return;
        }

        request_.body = received.substr(headerSize, contentLength_);
        request_.body.reserve(contentLength_);

        if (request_.body.size() < contentLength_) {
            readBody();
        } else {
            dispatchRequest();
        }
    }

    void readBody() {
        armDeadline();

        auto self = shared_from_this();
        socket_.async_read_some(boost::asio::buffer(chunk_),
            [this, self](const boost::system::error_code& ec, size_t bytesRead) {
                // A truncated body is never handed to a handler, so a partial
                // upload cannot reach storage.
                if (ec) {
                    LOG_WARNING("Client disconnected during " + request_.method + " " + request_.path +
                                " after " + std::to_string(request_.body.size()) + " of " +
                                std::to_string(contentLength_) + " bytes");
                    finish();
                    return;
                }

                size_t wanted = std::min(bytesRead, contentLength_ - request_.body.size());
                request_.body.append(chunk_.data(), wanted);

                if (request_.body.size() < contentLength_) {
                    readBody();
                } else {
                    dispatchRequest();
                }
            });
    }

    void dispatchRequest() {
        deadline_.cancel();

        auto self = shared_from_this();
        server_.workers_->post([this, self]() {
            HttpResponse response = server_.dispatch(request_);

            LOG_INFO(request_.method + " " + request_.path + " -> " + std::to_string(response.statusCode));

            output_ = serializeResponse(response, request_.method == "HEAD");
            boost::asio::post(*server_.ioService_, [this, self]() { writeResponse(); });
        });
    }

    void respondWithError(int statusCode, const std::string& message) {
        HttpResponse response;
        response.setError(statusCode, message);
        applyCorsHeaders(response);
        output_ = serializeResponse(response, false);
        writeResponse();
    }

    void writeResponse() {
        armDeadline();

        auto self = shared_from_this();
        boost::asio::async_write(socket_, boost::asio::buffer(output_),
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    LOG_DEBUG("Failed to send response: " + ec.message());
                }
                finish();
            });
    }

    void finish() {
        deadline_.cancel();
        close();
    }

    HttpServer& server_;
    tcp::socket socket_;
    boost::asio::steady_timer deadline_;
    boost::asio::streambuf buffer_;
    std::vector<char> chunk_;

    HttpRequest request_;
    size_t contentLength_ = 0;
    std::string output_;
};

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Stopping server");

    ioService_->stop();

    if (serverThread_ && serverThread_->joinable()) {
        serverThread_->join();
    }

    if (acceptor_ && acceptor_->is_open()) {
        boost::system::error_code ec;
        acceptor_->close(ec);
    }

    // The io_service thread is gone, so sockets can be closed from here.
    std::vector<std::shared_ptr<Connection>> live;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (const auto& entry : connections_) {
            if (auto connection = entry.second.lock()) {
                live.push_back(std::move(connection));
            }
        }
    }
    if (!live.empty()) {
        LOG_INFO("Closing " + std::to_string(live.size()) + " open connection(s)");
    }
    for (const auto& connection : live) {
        connection->close();
    }
    live.clear();

    // Lets in-flight handlers finish.
    if (workers_) {
        workers_->shutdown();
    }

    LOG_INFO("Server stopped");
}

void HttpServer::acceptConnection() {
    auto connection = std::make_shared<Connection>(*this);

    acceptor_->async_accept(connection->socket(), [this, connection](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !running_) {
            return;
        }

        if (ec) {
            LOG_WARNING("Accept failed: " + ec.message());
        } else {
            trackConnection(connection);
            connection->start();
        }

        acceptConnection();
    });
}

void HttpServer::trackConnection(const std::shared_ptr<Connection>& connection) {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    connections_[connection.get()] = connection;
}

void HttpServer::untrackConnection(Connection* connection) {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    connections_.erase(connection);
}

HttpResponse HttpServer::dispatch(HttpRequest& request) {
    HttpResponse response;

    if (request.method == "OPTIONS") {
        response.setStatus(204);
        applyCorsHeaders(response);
        return response;
    }

    std::string method = request.method == "HEAD" ? "GET" : request.method;
    RequestHandler handler = findHandler(method, request.path, request.pathParams);

    if (!handler && method == "GET") {
        handler = fallback_;
    }

    if (handler) {
        try {
            handler(request, response);
        } catch (const ServiceError& e) {
            response = HttpResponse();
            response.setError(e.statusCode(), e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("Exception in request handler for " + request.path + ": " + std::string(e.what()));
            response = HttpResponse();
            response.setError(500, "Internal server error");
        }
    } else {
        response.setStatus(404);
        response.setText("Resource not found: " + request.path);
    }

    applyCorsHeaders(response);
    return response;
}

bool HttpServer::parseRequestHead(const std::string& head, HttpRequest& request) {
    std::istringstream requestStream(head);

    std::string requestLine;
    std::getline(requestStream, requestLine);

    if (!requestLine.empty() && requestLine.back() == '\r') {
        requestLine.pop_back();
    }

    std::istringstream lineStream(requestLine);
    lineStream >> request.method >> request.path >> request.version;

    if (request.method.empty() || request.path.empty() || request.path.front() != '/') {
        return false;
    }

    size_t queryPos = request.path.find('?');
    if (queryPos != std::string::npos) {
        std::string queryString = request.path.substr(queryPos + 1);
        request.path = request.path.substr(0, queryPos);
        request.queryParams = parseQueryParams(queryString);
    }

    std::string headerLine;
    while (std::getline(requestStream, headerLine) && headerLine != "\r" && headerLine != "") {
        if (headerLine.back() == '\r') {
            headerLine.pop_back();
        }

        size_t colonPos = headerLine.find(':');
        if (colonPos != std::string::npos) {
            std::string name = toLower(headerLine.substr(0, colonPos));
            std::string value = headerLine.substr(colonPos + 1);

            value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) {
                return !std::isspace(ch);
            }));
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
                value.pop_back();
            }

            request.headers[name] = value;
        }
    }

    return true;
}

std::unordered_map<std::string, std::string> HttpServer::parseQueryParams(const std::string& queryString) {
    std::unordered_map<std::string, std::string> params;
    std::istringstream stream(queryString);
    std::string param;

    while (std::getline(stream, param, '&')) {
        if (param.empty()) {
            continue;
        }

        size_t equalsPos = param.find('=');
        if (equalsPos != std::string::npos) {
            std::string name = urlDecode(param.substr(0, equalsPos), true);
            std::string value = urlDecode(param.substr(equalsPos + 1), true);
            params[name] = value;
        } else {
            params[urlDecode(param, true)] = "";
        }
    }

    return params;
}

std::string HttpServer::urlDecode(const std::string& value, bool plusAsSpace) {
    std::string decoded;
    decoded.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '%' && i + 2 < value.size()) {
            int high = hexValue(value[i + 1]);
            int low = hexValue(value[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded += static_cast<char>(high * 16 + low);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plusAsSpace) {
            decoded += ' ';
        } else {
            decoded += c;
        }
    }

    return decoded;
}

std::string HttpServer::serializeResponse(const HttpResponse& response, bool headOnly) {
    std::stringstream ss;

    ss << "HTTP/1.1 " << response.statusCode << " " << response.statusText << "\r\n";

    if (response.headers.find("Content-Length") == response.headers.end()) {
        ss << "Content-Length: " << response.body.size() << "\r\n";
    }

    for (const auto& header : response.headers) {
        ss << header.first << ": " << header.second << "\r\n";
    }

    ss << "Connection: close\r\n";
    ss << "\r\n";

    if (!headOnly) {
        ss << response.body;
    }

    return ss.str();
}

HttpServer::RequestHandler HttpServer::findHandler(const std::string& method, const std::string& path,
                                                   std::unordered_map<std::string, std::string>& params) const {
    auto methodIt = routes_.find(method);
    if (methodIt != routes_.end()) {
        auto pathIt = methodIt->second.find(path);
        if (pathIt != methodIt->second.end()) {
            return pathIt->second;
        }
    }

    auto patternIt = patternRoutes_.find(method);
    if (patternIt != patternRoutes_.end()) {
        for (const auto& route : patternIt->second) {
            std::unordered_map<std::string, std::string> captured;
            if (matchPattern(route.first, path, captured)) {
                params = std::move(captured);
                return route.second;
            }
        }
    }

    return nullptr;
}

bool HttpServer::matchPattern(const std::string& pattern, const std::string& path,
                              std::unordered_map<std::string, std::string>& params) {
    std::vector<std::string> patternSegments = splitPath(pattern);
    std::vector<std::string> pathSegments = splitPath(path);

    if (patternSegments.size() != pathSegments.size()) {
        return false;
    }

    for (size_t i = 0; i < patternSegments.size(); ++i) {
        const std::string& expected = patternSegments[i];
        const std::string& actual = pathSegments[i];

        if (!expected.empty() && expected.front() == ':') {
            if (actual.empty()) {
                return false;
            }
            params[expected.substr(1)] = urlDecode(actual);
        } else if (expected != actual) {
            return false;
        }
    }

    return true;
}

void HttpServer::applyCorsHeaders(HttpResponse& response) {
    response.headers["Access-Control-Allow-Origin"] = "*";
    response.headers["Access-Control-Allow-Headers"] =
        "Origin, X-Requested-With, Content-Type, Accept, Authorization";
    response.headers["Access-Control-Allow-Methods"] = "GET, POST, DELETE, OPTIONS";
}

} // namespace pixserv
