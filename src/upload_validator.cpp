#include "../include/upload_validator.hpp"
#include "../include/errors.hpp"
#include "../include/filename_generator.hpp"
#include "../include/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace pixserv {

namespace {

const std::array<const char*, 6> kAllowedTokens = {"jpeg", "jpg", "png", "gif", "svg", "webp"};

const std::array<const char*, 6> kImageExtensions = {".jpg", ".jpeg", ".png", ".gif", ".svg", ".webp"};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool mentionsAllowedToken(const std::string& value) {
    return std::any_of(kAllowedTokens.begin(), kAllowedTokens.end(), [&value](const char* token) {
        return value.find(token) != std::string::npos;
    });
}

} // namespace

UploadValidator::UploadValidator(size_t maxFileSize) : maxFileSize_(maxFileSize) {}

bool UploadValidator::isAllowedType(const std::string& filename, const std::string& mediaType) {
    std::string ext = toLower(FilenameGenerator::extension(filename));
    return mentionsAllowedToken(ext) && mentionsAllowedToken(toLower(mediaType));
}

bool UploadValidator::hasImageExtension(const std::string& filename) {
    std::string ext = toLower(FilenameGenerator::extension(filename));
    return std::find(kImageExtensions.begin(), kImageExtensions.end(), ext) != kImageExtensions.end();
}

void UploadValidator::validate(const MultipartPart& part) const {
    if (!isAllowedType(part.filename, part.contentType)) {
        LOG_WARNING("Rejected upload " + part.filename + " (" + part.contentType + "): not an image");
        throw ValidationError();
    }

    if (part.data.size() > maxFileSize_) {
        LOG_WARNING("Rejected upload " + part.filename + ": " + std::to_string(part.data.size()) +
                    " bytes exceeds limit of " + std::to_string(maxFileSize_));
        throw PayloadTooLarge();
    }
}

std::vector<MultipartPart> UploadValidator::collect(std::vector<MultipartPart>& parts,
                                                    const std::string& fieldName,
                                                    size_t maxCount) const {
    std::vector<MultipartPart> files;

    for (auto& part : parts) {
        if (!part.isFile()) {
            continue;
        }

        if (part.name != fieldName) {
            throw ValidationError("Unexpected field: " + part.name);
        }

        if (files.size() == maxCount) {
            throw ValidationError(maxCount == 1 ? "Unexpected field: " + part.name : "Too many files");
        }

        validate(part);
        files.push_back(std::move(part));
    }

    return files;
}

} // namespace pixserv
