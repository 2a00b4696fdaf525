#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace evs {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

static uint16_t parse_port(const std::string& text) {
    std::size_t pos = 0;
    long value = -1;
    try {
        value = std::stol(text, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos != text.size() || value < 0 || value > 65535) {
        throw std::runtime_error("Invalid port: '" + text + "'");
    }
    return static_cast<uint16_t>(value);
}

static bool parse_flag(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return !(text == "0" || text == "false" || text == "no" || text == "off");
}

static AppConfig from_yaml(const YAML::Node& root) {
    AppConfig cfg;

    // Server
    if (auto s = root["server"]) {
        cfg.server.port = s["port"].as<uint16_t>(cfg.server.port);
        cfg.server.bind_address = s["bind_address"].as<std::string>(cfg.server.bind_address);
        cfg.server.web_root = s["web_root"].as<std::string>(cfg.server.web_root);
        cfg.server.viewer_page = s["viewer_page"].as<std::string>(cfg.server.viewer_page);
        cfg.server.required_files =
            s["required_files"].as<std::vector<std::string>>(cfg.server.required_files);
        cfg.server.data_file = s["data_file"].as<std::string>(cfg.server.data_file);
        cfg.server.data_hint = s["data_hint"].as<std::string>(cfg.server.data_hint);
    }

    // Browser
    if (auto b = root["browser"]) {
        cfg.browser.enabled = b["enabled"].as<bool>(cfg.browser.enabled);
        cfg.browser.command = b["command"].as<std::string>("");
    }

    // Logging
    if (auto l = root["logging"]) {
        cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
        cfg.logging.file = l["file"].as<std::string>("");
        cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
        cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
    }

    return cfg;
}

void apply_env_overrides(AppConfig& cfg) {
    if (const char* port = std::getenv("VIEWER_PORT")) {
        cfg.server.port = parse_port(port);
    }
    cfg.server.web_root = env_or("VIEWER_WEB_ROOT", cfg.server.web_root);
    if (const char* open = std::getenv("VIEWER_OPEN_BROWSER")) {
        cfg.browser.enabled = parse_flag(open);
    }
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;

    try {
        cfg = from_yaml(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }

    apply_env_overrides(cfg);
    return cfg;
}

AppConfig load_config_or_default(const std::filesystem::path& dir) {
    auto path = dir / kConfigFileName;
    if (std::filesystem::exists(path)) {
        return load_config(path.string());
    }

    AppConfig cfg;
    apply_env_overrides(cfg);
    return cfg;
}

} // namespace evs
