#include "../include/storage_manager.hpp"
#include "../include/errors.hpp"
#include "../include/filename_generator.hpp"
#include "../include/logger.hpp"
#include "../include/upload_validator.hpp"

#include <fstream>
#include <filesystem>
#include <random>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace pixserv {

StorageManager::StorageManager(const std::string& basePath) : basePath_(basePath) {}

void StorageManager::initialize() {
    std::error_code ec;

    if (fs::exists(basePath_, ec)) {
        if (!fs::is_directory(basePath_, ec)) {
            throw StartupError("Storage path exists but is not a directory: " + basePath_);
        }
        LOG_INFO("Using storage directory: " + fs::absolute(basePath_, ec).string());
        return;
    }

    LOG_INFO("Storage directory not found, creating: " + basePath_);
    fs::create_directories(basePath_, ec);

    // Another process may have created it in the meantime.
    if (ec && !fs::is_directory(basePath_)) {
        throw StartupError("Failed to create storage directory at " + basePath_ + ": " + ec.message());
    }
}

StoredFile StorageManager::store(const MultipartPart& file) {
    StoredFile stored;
    stored.originalName = file.filename;
    stored.filename = FilenameGenerator::generate(file.filename);
    stored.size = file.data.size();
    stored.url = "/" + stored.filename;

    std::string tempPath = temporaryPath();
    std::string finalPath = (fs::path(basePath_) / stored.filename).string();

    {
        std::ofstream outFile(tempPath, std::ios::binary | std::ios::trunc);
        if (!outFile.is_open()) {
            throw std::runtime_error("Failed to create temporary file in " + basePath_);
        }

        outFile.write(reinterpret_cast<const char*>(file.data.data()), file.data.size());
        outFile.flush();

        if (!outFile) {
            outFile.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw std::runtime_error("Failed to write " + std::to_string(file.data.size()) + " bytes for " + file.filename);
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw std::runtime_error("Failed to move upload into place as " + stored.filename + ": " + ec.message());
    }

    LOG_INFO("Stored " + stored.filename + " (original " + stored.originalName + ", " +
             std::to_string(stored.size) + " bytes)");
    return stored;
}

std::vector<StoredFile> StorageManager::storeAll(const std::vector<MultipartPart>& files) {
    std::vector<StoredFile> stored;
    stored.reserve(files.size());

    try {
        for (const auto& file : files) {
            stored.push_back(store(file));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Batch upload failed after " + std::to_string(stored.size()) + " files, rolling back: " + e.what());
        for (const auto& done : stored) {
            std::error_code ignored;
            fs::remove(fs::path(basePath_) / done.filename, ignored);
        }
        throw;
    }

    return stored;
}

std::vector<ListingEntry> StorageManager::listImages() const {
    std::error_code ec;
    fs::directory_iterator it(basePath_, ec);
    if (ec) {
        LOG_ERROR("Unable to scan " + basePath_ + ": " + ec.message());
        throw ScanError();
    }

    std::vector<ListingEntry> entries;

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LOG_ERROR("Directory scan of " + basePath_ + " interrupted: " + ec.message());
            throw ScanError();
        }

        std::string name = it->path().filename().string();
        if (name.front() == '.' || !UploadValidator::hasImageExtension(name)) {
            continue;
        }

        struct stat st;
        if (::stat(it->path().c_str(), &st) != 0) {
            // Removed between enumeration and stat.
            LOG_DEBUG("Skipping " + name + ": stat failed");
            continue;
        }

        ListingEntry entry;
        entry.name = name;
        entry.size = static_cast<uint64_t>(st.st_size);
        entry.isDirectory = S_ISDIR(st.st_mode);
        entry.modified = formatTimestamp(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
        entry.url = "/" + name;
        entries.push_back(std::move(entry));
    }

    return entries;
}

void StorageManager::remove(const std::string& filename) {
    if (!isSafeName(filename) || filename.front() == '.') {
        LOG_WARNING("Refusing to delete unsafe name: " + filename);
        throw NotFound();
    }

    fs::path target = fs::path(basePath_) / filename;

    std::error_code ec;
    if (fs::is_directory(fs::symlink_status(target, ec))) {
        throw NotFound();
    }

    if (!fs::remove(target, ec) || ec) {
        LOG_DEBUG("Delete of " + filename + " failed" + (ec ? ": " + ec.message() : std::string()));
        throw NotFound();
    }

    LOG_INFO("Deleted " + filename);
}

std::optional<std::string> StorageManager::resolve(const std::string& filename) const {
    if (!isSafeName(filename) || filename.front() == '.') {
        return std::nullopt;
    }

    fs::path target = fs::path(basePath_) / filename;
    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        return std::nullopt;
    }

    return target.string();
}

bool StorageManager::isSafeName(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == "..") {
        return false;
    }
    return filename.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

std::string StorageManager::formatTimestamp(int64_t seconds, int64_t nanoseconds) {
    std::time_t time = static_cast<std::time_t>(seconds);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << (nanoseconds / 1000000) << 'Z';
    return ss.str();
}

std::string StorageManager::temporaryPath() const {
    static const char* hex = "0123456789abcdef";
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::string name = ".upload-";
    for (int i = 0; i < 16; ++i) {
        name += hex[dis(gen)];
    }
    name += ".part";

    return (fs::path(basePath_) / name).string();
}

} // namespace pixserv
