#include "../include/static_responder.hpp"
#include "../include/filename_generator.hpp"
#include "../include/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>
#include <unordered_map>
#include <utility>
#include <sys/stat.h>

namespace pixserv {

namespace {

const std::unordered_map<std::string, std::string> kContentTypes = {
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},
    {".webp", "image/webp"},
};

const char* kDefaultContentType = "application/octet-stream";

} // namespace

StaticResponder::StaticResponder(const StorageManager& storage, std::string indexPage)
    : storage_(storage), indexPage_(std::move(indexPage)) {}

void StaticResponder::serve(const HttpRequest& request, HttpResponse& response) const {
    if (request.path.size() < 2 || request.path.front() != '/') {
        notFound(request, response);
        return;
    }

    std::string name = HttpServer::urlDecode(request.path.substr(1));
    auto path = storage_.resolve(name);
    if (!path) {
        notFound(request, response);
        return;
    }

    std::string data;
    if (!readFile(*path, data)) {
        notFound(request, response);
        return;
    }

    response.setStatus(200);
    response.body = std::move(data);
    response.headers["Content-Type"] = contentTypeFor(name);
    response.headers["Cache-Control"] = "public, max-age=0";

    struct stat st;
    if (::stat(path->c_str(), &st) == 0) {
        response.headers["Last-Modified"] = httpDate(st.st_mtim.tv_sec);
    }
}

void StaticResponder::serveIndex(const HttpRequest& request, HttpResponse& response) const {
    std::string page;
    if (!readFile(indexPage_, page)) {
        LOG_WARNING("Upload page not readable: " + indexPage_);
        notFound(request, response);
        return;
    }

    response.setStatus(200);
    response.body = std::move(page);
    response.headers["Content-Type"] = "text/html; charset=UTF-8";
}

std::string StaticResponder::contentTypeFor(const std::string& filename) {
    std::string ext = FilenameGenerator::extension(filename);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    auto it = kContentTypes.find(ext);
    return it != kContentTypes.end() ? it->second : kDefaultContentType;
}

std::string StaticResponder::httpDate(int64_t epochSeconds) {
    std::time_t time = static_cast<std::time_t>(epochSeconds);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::stringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::put_time(&tm_buf, "%a, %d %b %Y %H:%M:%S GMT");
    return ss.str();
}

bool StaticResponder::readFile(const std::string& path, std::string& data) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    file.seekg(0, std::ios::end);
    std::streamoff fileSize = file.tellg();
    if (fileSize < 0) {
        return false;
    }
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<size_t>(fileSize));
    file.read(&data[0], fileSize);

    if (!file) {
        LOG_ERROR("Short read on " + path + ": " + std::to_string(file.gcount()) + " of " +
                  std::to_string(fileSize) + " bytes");
        return false;
    }

    return true;
}

void StaticResponder::notFound(const HttpRequest& request, HttpResponse& response) {
    response.setStatus(404);
    response.setText("Cannot " + request.method + " " + request.path);
}

} // namespace pixserv
