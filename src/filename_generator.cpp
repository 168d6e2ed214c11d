#include "../include/filename_generator.hpp"
#include "../include/multipart_parser.hpp"

#include <chrono>
#include <random>

namespace pixserv {

std::string FilenameGenerator::generate(const std::string& originalName) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    return compose(originalName, static_cast<int64_t>(millis), randomComponent());
}

std::string FilenameGenerator::compose(const std::string& originalName, int64_t epochMillis, uint32_t random) {
    std::string name = MultipartParser::baseName(originalName);

    // Stored names are never hidden files.
    std::string base = stem(name);
    size_t firstVisible = base.find_first_not_of('.');
    base.erase(0, firstVisible == std::string::npos ? base.size() : firstVisible);

    return base + "-" + std::to_string(epochMillis) + "-" + std::to_string(random) + extension(name);
}

std::string FilenameGenerator::extension(const std::string& filename) {
    std::string name = MultipartParser::baseName(filename);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return name.substr(dot);
}

std::string FilenameGenerator::stem(const std::string& filename) {
    std::string name = MultipartParser::baseName(filename);
    return name.substr(0, name.size() - extension(name).size());
}

uint32_t FilenameGenerator::randomComponent() {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dis(0, 1000000000);
    return dis(gen);
}

} // namespace pixserv
