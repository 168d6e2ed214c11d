#pragma once

#include <stdexcept>
#include <string>

namespace pixserv {

/**
 * @class ServiceError
 * @brief Failure that is reported to the client as a JSON error body
 *
 * The HTTP layer turns any ServiceError escaping a handler into
 * {"error": what()} with statusCode().
 */
class ServiceError : public std::runtime_error {
public:
    ServiceError(int statusCode, const std::string& message)
        : std::runtime_error(message), statusCode_(statusCode) {}

    int statusCode() const { return statusCode_; }

private:
    int statusCode_;
};

class ValidationError : public ServiceError {
public:
    explicit ValidationError(const std::string& message = "Only image files are allowed")
        : ServiceError(400, message) {}
};

class PayloadTooLarge : public ServiceError {
public:
    explicit PayloadTooLarge(const std::string& message = "File too large")
        : ServiceError(413, message) {}
};

// Also used for the multi-file case with "No files uploaded".
class NoFileProvided : public ServiceError {
public:
    explicit NoFileProvided(const std::string& message = "No file uploaded")
        : ServiceError(400, message) {}
};

class Unauthorized : public ServiceError {
public:
    explicit Unauthorized(const std::string& message = "Unauthorized. Please provide a valid auth key.")
        : ServiceError(401, message) {}
};

class NotFound : public ServiceError {
public:
    explicit NotFound(const std::string& message = "File not found")
        : ServiceError(404, message) {}
};

class ScanError : public ServiceError {
public:
    explicit ScanError(const std::string& message = "Unable to scan directory")
        : ServiceError(500, message) {}
};

// Fatal: raised during startup only, never sent to a client.
class StartupError : public std::runtime_error {
public:
    explicit StartupError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace pixserv
