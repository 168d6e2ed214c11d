#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace pixserv {

/**
 * @struct MultipartPart
 * @brief A single part of a multipart/form-data body
 */
struct MultipartPart {
    std::string name;           // form field name
    std::string filename;       // client-supplied filename, last path component only
    std::string contentType;    // declared media type
    std::vector<uint8_t> data;

    bool isFile() const { return !filename.empty(); }

    std::string dataAsString() const {
        return std::string(data.begin(), data.end());
    }
};

/**
 * @class MultipartParser
 * @brief Parser for multipart/form-data request bodies
 */
class MultipartParser {
public:
    /**
     * @brief Parse a multipart body into its parts
     * @param body Raw HTTP body
     * @param boundary Boundary string without the leading "--"
     * @return Parts in the order they appear; empty if the body is not framed by the boundary
     */
    static std::vector<MultipartPart> parse(const std::string& body, const std::string& boundary);

    /**
     * @brief Extract the boundary parameter from a Content-Type header value
     * @return Boundary or an empty string if the header is not multipart/form-data
     */
    static std::string extractBoundary(const std::string& contentType);

    // "C:\\photos\\cat.png" and "../cat.png" both become "cat.png".
    static std::string baseName(const std::string& filename);

private:
    static void trim(std::string& s);
    static void toLower(std::string& s);
    static void parseContentDisposition(const std::string& value, std::string& name, std::string& filename);
};

} // namespace pixserv
