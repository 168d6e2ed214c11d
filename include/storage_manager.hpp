#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include "multipart_parser.hpp"

namespace pixserv {

struct StoredFile {
    std::string filename;
    std::string originalName;
    size_t size = 0;
    std::string url;
};

struct ListingEntry {
    std::string name;
    uint64_t size = 0;
    bool isDirectory = false;
    std::string modified;   // ISO-8601 UTC, millisecond precision
    std::string url;
};

/**
 * @class StorageManager
 * @brief Owns the flat storage directory all images live in
 *
 * Holds no in-memory index; every call goes to the filesystem.
 */
class StorageManager {
public:
    explicit StorageManager(const std::string& basePath);

    // Creates the directory if needed. Throws StartupError.
    void initialize();

    const std::string& basePath() const { return basePath_; }

    /**
     * @brief Write an upload under a generated name
     *
     * Data goes to a hidden temporary file first and is renamed into place
     * once complete, so a partial file is never visible.
     * @throws std::runtime_error on I/O failure (nothing is left behind)
     */
    StoredFile store(const MultipartPart& file);

    // All-or-nothing: on failure the files already written are removed.
    std::vector<StoredFile> storeAll(const std::vector<MultipartPart>& files);

    // Non-recursive, image extensions only. Throws ScanError.
    std::vector<ListingEntry> listImages() const;

    // Throws NotFound for unknown, unsafe or unremovable names.
    void remove(const std::string& filename);

    // Full path of a servable file, or nothing if the name is unsafe, hidden
    // or not a regular file.
    std::optional<std::string> resolve(const std::string& filename) const;

    // A single path component: no separators, no "." or "..", no NUL.
    static bool isSafeName(const std::string& filename);

    static std::string formatTimestamp(int64_t seconds, int64_t nanoseconds);

private:
    std::string temporaryPath() const;

    std::string basePath_;
};

} // namespace pixserv
