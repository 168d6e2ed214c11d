#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include "include/auth_gate.hpp"
#include "include/config.hpp"
#include "include/errors.hpp"
#include "include/http_server.hpp"
#include "include/image_api.hpp"
#include "include/logger.hpp"
#include "include/static_responder.hpp"
#include "include/storage_manager.hpp"

namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int) {
    g_shutdownRequested = true;
}

// Anything that escapes request handling is fatal; a supervisor restarts us.
void terminateHandler() {
    std::string reason = "unknown";
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            reason = e.what();
        } catch (...) {
            reason = "non-standard exception";
        }
    }
    LOG_FATAL("Unhandled failure, terminating: " + reason);
    std::_Exit(EXIT_FAILURE);
}

void initializeLogging(const pixserv::ServerSettings& settings) {
    pixserv::LogLevel level = pixserv::Logger::levelFromString(settings.logLevel);
    pixserv::Logger::getInstance().setLogLevel(level);

    std::error_code ec;
    fs::path logPath(settings.logFile);
    if (logPath.has_parent_path()) {
        fs::create_directories(logPath.parent_path(), ec);
    }

    if (!pixserv::Logger::getInstance().initialize(settings.logFile, level)) {
        LOG_WARNING("Logging to console only");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::set_terminate(terminateHandler);

    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGPIPE, SIG_IGN);

        std::string configPath = argc > 1 ? argv[1] : "config/server_config.json";

        pixserv::Config config;
        bool configLoaded = fs::exists(configPath) && config.loadFromFile(configPath);
        config.applyProcessEnvironment();

        const pixserv::ServerSettings settings = config.toSettings();

        initializeLogging(settings);
        LOG_INFO("pixserv starting up");

        if (configLoaded) {
            LOG_INFO("Configuration loaded from " + configPath);
        } else {
            LOG_WARNING("Configuration file " + configPath + " not loaded, using defaults");
        }

        pixserv::StorageManager storage(settings.storagePath);
        try {
            storage.initialize();
        } catch (const pixserv::StartupError& e) {
            LOG_FATAL(e.what());
            return 1;
        }

        pixserv::AuthGate auth(settings);
        if (!settings.readOnly && auth.requiresAuth() && auth.usesPlaceholderKey()) {
            LOG_WARNING("Authentication uses the default placeholder key; set AUTH_KEY before deploying");
        }

        pixserv::StaticResponder statics(storage, settings.indexPage);
        pixserv::ImageApi api(settings, storage, auth);

        pixserv::HttpServer server(settings.port, settings.workerThreads);
        server.setIdleTimeout(std::chrono::seconds(settings.idleTimeoutSeconds));
        api.registerRoutes(server, statics);

        if (!server.start()) {
            LOG_FATAL("Failed to start server");
            return 1;
        }

        LOG_INFO("Server running on port " + std::to_string(server.port()));
        LOG_INFO("Serving files from: " + fs::absolute(settings.storagePath).string());
        LOG_INFO(std::string("Mode: ") + (settings.readOnly ? "read-only" : "read-write") +
                 (settings.readOnly ? "" : settings.requireAuth ? ", auth required" : ", auth disabled"));
        LOG_INFO("Process ID: " + std::to_string(::getpid()));

        while (server.isRunning() && !g_shutdownRequested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Shutting down server...");
        server.stop();

        LOG_INFO("Server stopped normally");
        return 0;
    } catch (const std::exception& e) {
        LOG_FATAL("Unhandled exception: " + std::string(e.what()));
        return 1;
    }
}
