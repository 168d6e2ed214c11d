#include "../include/multipart_parser.hpp"

#include <cctype>
#include <algorithm>

namespace pixserv {

void MultipartParser::trim(std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                            s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
    s = s.substr(start, end - start);
}

void MultipartParser::toLower(std::string& s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

std::string MultipartParser::baseName(const std::string& filename) {
    size_t slash = filename.find_last_of("/\\");
    return slash == std::string::npos ? filename : filename.substr(slash + 1);
}

void MultipartParser::parseContentDisposition(const std::string& value,
                                              std::string& name,
                                              std::string& filename) {
    size_t pos = 0;
    while (pos < value.size()) {
        // Semicolons inside quoted values do not split parameters.
        size_t next = pos;
        bool quoted = false;
        while (next < value.size() && (quoted || value[next] != ';')) {
            if (value[next] == '"') quoted = !quoted;
            ++next;
        }

        std::string token = value.substr(pos, next - pos);
        pos = next + 1;

        trim(token);
        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }

        if (key == "name") {
            name = val;
        } else if (key == "filename") {
            filename = baseName(val);
        }
    }
}

std::string MultipartParser::extractBoundary(const std::string& contentType) {
    std::string boundary;

    auto semicolon = contentType.find(';');
    if (semicolon == std::string::npos) {
        return boundary;
    }

    std::string mediaType = contentType.substr(0, semicolon);
    trim(mediaType);
    toLower(mediaType);
    if (mediaType != "multipart/form-data") {
        return boundary;
    }

    std::string params = contentType.substr(semicolon + 1);

    while (!params.empty()) {
        auto nextSemi = params.find(';');
        std::string token = (nextSemi == std::string::npos) ? params : params.substr(0, nextSemi);
        params = (nextSemi == std::string::npos) ? "" : params.substr(nextSemi + 1);

        trim(token);
        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }

        if (key == "boundary") {
            boundary = val;
            break;
        }
    }

    return boundary;
}

std::vector<MultipartPart> MultipartParser::parse(const std::string& body,
                                                  const std::string& boundary) {
    std::vector<MultipartPart> parts;
    if (boundary.empty()) return parts;

    const std::string dash = "--" + boundary;
    const std::string marker = "\r\n" + dash;

    size_t bline;
    if (body.rfind(dash, 0) == 0) {
        bline = 0;
    } else {
        size_t m = body.find(marker, 0);
        if (m == std::string::npos) return parts;
        bline = m + 2;
    }

    while (true) {
        size_t lineEnd = body.find("\r\n", bline);
        if (lineEnd == std::string::npos) break;

        // Closing delimiter
        const size_t after = bline + dash.size();
        if (after + 2 <= body.size() && body.compare(after, 2, "--") == 0) break;

        size_t headersStart = lineEnd + 2;
        size_t headersEnd = body.find("\r\n\r\n", headersStart);
        if (headersEnd == std::string::npos) break;

        MultipartPart part;

        size_t hpos = headersStart;
        while (hpos < headersEnd + 2) {
            size_t eol = body.find("\r\n", hpos);
            if (eol == std::string::npos || eol > headersEnd) break;

            std::string hline = body.substr(hpos, eol - hpos);
            hpos = eol + 2;

            auto colon = hline.find(':');
            if (colon == std::string::npos) continue;

            std::string hname = hline.substr(0, colon);
            std::string hvalue = hline.substr(colon + 1);
            trim(hname);
            trim(hvalue);
            toLower(hname);

            if (hname == "content-disposition") {
                parseContentDisposition(hvalue, part.name, part.filename);
            } else if (hname == "content-type") {
                part.contentType = hvalue;
            }
        }

        // A part that is not followed by another delimiter is truncated; drop it.
        size_t contentStart = headersEnd + 4;
        size_t nextMarker = body.find(marker, contentStart);
        if (nextMarker == std::string::npos) break;

        const char* dataPtr = body.data() + contentStart;
        part.data = std::vector<uint8_t>(dataPtr, dataPtr + (nextMarker - contentStart));

        parts.push_back(std::move(part));

        bline = nextMarker + 2;
    }

    return parts;
}

} // namespace pixserv
