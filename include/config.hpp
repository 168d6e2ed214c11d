#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <mutex>
#include <nlohmann/json.hpp>

namespace pixserv {

// Placeholder secret shipped as the default; operators must override it.
constexpr const char* kDefaultAuthKey = "changeme123";

/**
 * @struct ServerSettings
 * @brief Resolved configuration, built once at startup and passed by reference
 */
struct ServerSettings {
    unsigned short port = 3001;
    std::string storagePath = "./public";
    std::string indexPage = "web/index.html";
    size_t workerThreads = 4;
    int idleTimeoutSeconds = 30;
    bool readOnly = false;

    bool requireAuth = true;
    std::string authKey = kDefaultAuthKey;

    std::string logFile = "logs/server.log";
    std::string logLevel = "info";
};

class Config {
public:
    Config() = default;

    bool loadFromFile(const std::string& configPath);

    bool loadFromString(const std::string& jsonText);

    // Applies PORT, SERVE_DIR, AUTH_KEY, REQUIRE_AUTH, READ_ONLY and LOG_LEVEL
    // from the given lookup on top of whatever was loaded.
    void applyEnvironment(const std::unordered_map<std::string, std::string>& env);

    void applyProcessEnvironment();

    // Keys are dotted paths into the JSON document, e.g. "server.port".
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    int getInt(const std::string& key, int defaultValue = 0) const;

    bool getBool(const std::string& key, bool defaultValue = false) const;

    template <typename T>
    void setValue(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[toPointer(key)] = value;
    }

    ServerSettings toSettings() const;

private:
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static nlohmann::json::json_pointer toPointer(const std::string& key);

    const nlohmann::json* find(const std::string& key) const;

    nlohmann::json config_ = nlohmann::json::object();
    mutable std::mutex configMutex_;
};

} // namespace pixserv
