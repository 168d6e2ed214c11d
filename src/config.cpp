#include "../include/config.hpp"
#include "../include/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace pixserv {

    bool Config::loadFromFile(const std::string& configPath) {
        std::ifstream configFile(configPath);
        if (!configFile.is_open()) {
            LOG_WARNING("Could not open config file: " + configPath);
            return false;
        }

        try {
            nlohmann::json parsed;
            configFile >> parsed;
            if (!parsed.is_object()) {
                LOG_ERROR("Config file is not a JSON object: " + configPath);
                return false;
            }

            std::lock_guard<std::mutex> lock(configMutex_);
            config_ = std::move(parsed);
            return true;
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR("Failed to parse config JSON: " + std::string(e.what()));
            return false;
        }
    }

    bool Config::loadFromString(const std::string& jsonText) {
        try {
            nlohmann::json parsed = nlohmann::json::parse(jsonText);
            if (!parsed.is_object()) {
                return false;
            }

            std::lock_guard<std::mutex> lock(configMutex_);
            config_ = std::move(parsed);
            return true;
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR("Failed to parse config JSON: " + std::string(e.what()));
            return false;
        }
    }

    void Config::applyEnvironment(const std::unordered_map<std::string, std::string>& env) {
        auto it = env.find("PORT");
        if (it != env.end() && !it->second.empty()) {
            try {
                setValue("server.port", std::stoi(it->second));
            } catch (const std::exception&) {
                LOG_WARNING("Ignoring invalid PORT value: " + it->second);
            }
        }

        it = env.find("SERVE_DIR");
        if (it != env.end() && !it->second.empty()) {
            setValue("server.storage_path", it->second);
        }

        it = env.find("AUTH_KEY");
        if (it != env.end() && !it->second.empty()) {
            setValue("auth.key", it->second);
        }

        // Only the literal "false" turns authentication off.
        it = env.find("REQUIRE_AUTH");
        if (it != env.end()) {
            setValue("auth.require_auth", it->second != "false");
        }

        it = env.find("READ_ONLY");
        if (it != env.end()) {
            setValue("server.read_only", it->second == "true" || it->second == "1");
        }

        it = env.find("LOG_LEVEL");
        if (it != env.end() && !it->second.empty()) {
            setValue("logging.level", it->second);
        }
    }

    void Config::applyProcessEnvironment() {
        std::unordered_map<std::string, std::string> env;
        for (const char* name : {"PORT", "SERVE_DIR", "AUTH_KEY", "REQUIRE_AUTH", "READ_ONLY", "LOG_LEVEL"}) {
            const char* value = std::getenv(name);
            if (value != nullptr) {
                env[name] = value;
            }
        }
        applyEnvironment(env);
    }

    std::string Config::getString(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        const nlohmann::json* value = find(key);
        if (value && value->is_string()) {
            return value->get<std::string>();
        }
        return defaultValue;
    }

    int Config::getInt(const std::string& key, int defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        const nlohmann::json* value = find(key);
        if (value && value->is_number_integer()) {
            return value->get<int>();
        }
        return defaultValue;
    }

    bool Config::getBool(const std::string& key, bool defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        const nlohmann::json* value = find(key);
        if (value && value->is_boolean()) {
            return value->get<bool>();
        }
        return defaultValue;
    }

    ServerSettings Config::toSettings() const {
        ServerSettings settings;

        int port = getInt("server.port", settings.port);
        if (port < 0 || port > 65535) {
            LOG_WARNING("Port out of range, using " + std::to_string(settings.port));
        } else {
            settings.port = static_cast<unsigned short>(port);
        }

        settings.storagePath = getString("server.storage_path", settings.storagePath);
        settings.indexPage = getString("server.index_page", settings.indexPage);

        int workers = getInt("server.worker_threads", static_cast<int>(settings.workerThreads));
        if (workers > 0) {
            settings.workerThreads = static_cast<size_t>(workers);
        }

        int idleTimeout = getInt("server.idle_timeout_seconds", settings.idleTimeoutSeconds);
        if (idleTimeout > 0) {
            settings.idleTimeoutSeconds = idleTimeout;
        } else {
            LOG_WARNING("Idle timeout must be positive, using " + std::to_string(settings.idleTimeoutSeconds));
        }

        settings.readOnly = getBool("server.read_only", settings.readOnly);
        settings.requireAuth = getBool("auth.require_auth", settings.requireAuth);
        settings.authKey = getString("auth.key", settings.authKey);
        settings.logFile = getString("logging.file", settings.logFile);
        settings.logLevel = getString("logging.level", settings.logLevel);

        return settings;
    }

    nlohmann::json::json_pointer Config::toPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else if (c == '~') {
                pointer += "~0";
            } else if (c == '/') {
                pointer += "~1";
            } else {
                pointer += c;
            }
        }
        return nlohmann::json::json_pointer(pointer);
    }

    const nlohmann::json* Config::find(const std::string& key) const {
        auto pointer = toPointer(key);
        if (!config_.contains(pointer)) {
            return nullptr;
        }
        return &config_.at(pointer);
    }

} // namespace pixserv
