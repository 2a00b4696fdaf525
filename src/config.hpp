#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace evs {

struct ServerConfig {
    uint16_t port = 8000;
    std::string bind_address = "0.0.0.0";
    std::string web_root = ".";
    std::string viewer_page = "embedding-viewer.html";
    std::vector<std::string> required_files = {
        "embedding-viewer.html",
        "embedding-engine.js",
        "embedding-data.json",
    };
    std::string data_file = "embedding-data.json";
    std::string data_hint = "Run: python extract_embeddings.py";
};

struct BrowserConfig {
    bool enabled = true;
    std::string command;  // empty = platform default
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    BrowserConfig browser;
    LoggingConfig logging;
};

// Optional config file looked up next to the executable
constexpr const char* kConfigFileName = "viewer-server.yaml";

// Load configuration from YAML file, with environment variable overrides
AppConfig load_config(const std::string& path);

// Load <dir>/viewer-server.yaml if present, otherwise defaults.
// Environment overrides apply in both cases.
AppConfig load_config_or_default(const std::filesystem::path& dir);

// VIEWER_PORT, VIEWER_WEB_ROOT, VIEWER_OPEN_BROWSER, LOG_LEVEL
void apply_env_overrides(AppConfig& cfg);

} // namespace evs
