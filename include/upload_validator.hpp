#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "multipart_parser.hpp"

namespace pixserv {

class UploadValidator {
public:
    static constexpr size_t kMaxFileSize = 10 * 1024 * 1024;
    static constexpr size_t kMaxFiles = 10;

    explicit UploadValidator(size_t maxFileSize = kMaxFileSize);

    // Both the lowercased extension and the lowercased media type must
    // mention one of jpeg, jpg, png, gif, svg or webp.
    static bool isAllowedType(const std::string& filename, const std::string& mediaType);

    // Exact match against .jpg .jpeg .png .gif .svg .webp, ignoring case.
    static bool hasImageExtension(const std::string& filename);

    // Throws ValidationError or PayloadTooLarge.
    void validate(const MultipartPart& part) const;

    /**
     * @brief Pick the file parts uploaded under fieldName and validate them
     *
     * Throws ValidationError if a file arrives under another field or more
     * than maxCount files are present, and the errors of validate() for the
     * first offending file. Form fields without a filename are ignored.
     */
    std::vector<MultipartPart> collect(std::vector<MultipartPart>& parts,
                                       const std::string& fieldName,
                                       size_t maxCount) const;

    size_t maxFileSize() const { return maxFileSize_; }

private:
    size_t maxFileSize_;
};

} // namespace pixserv
