#pragma once
// =============================================================================
// DroidMirror Config Loader
// =============================================================================
// Loads settings from config.json with nlohmann/json, then applies DROID_*
// environment overrides. Command-line options are applied on top by main().
// =============================================================================

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

#include "droid_log.hpp"
#include "result.hpp"
#include "subnet_enumerator.hpp"

namespace droid {
namespace config {

struct ScanConfig {
    std::string subnet;                           // CIDR; empty = detect local interface
    std::string interface_name;                   // restrict detection to one interface
    std::string fallback_subnet = "192.168.1.0/24";
    int port = 5555;
    int timeout_ms = 500;
    int workers = 100;
};

struct ToolsConfig {
    std::string adb_path = "adb";
    std::string scrcpy_path = "scrcpy";
    std::string xdotool_path = "xdotool";
    int command_timeout_ms = 8000;
};

struct ScreenConfig {
    std::string off_keys = "alt+o";
    std::string on_keys = "alt+shift+o";
    int focus_delay_ms = 300;
};

struct LogConfig {
    std::string log_path;           // empty = console only
    std::string level = "info";
};

struct AppConfig {
    ScanConfig scan;
    ToolsConfig tools;
    ScreenConfig screen;
    LogConfig log;
};

// Section/key accessor; a missing key or a value of the wrong type keeps
// the default (the latter with a warning)
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    if (!j.contains(section) || !j[section].is_object() || !j[section].contains(key)) {
        return def;
    }
    try {
        return j[section][key].get<T>();
    } catch (const nlohmann::json::type_error& e) {
        DLOG_WARN("config", "%s.%s has the wrong type, using default (%s)",
                  section.c_str(), key.c_str(), e.what());
        return def;
    }
}

inline AppConfig parseConfig(const nlohmann::json& j) {
    AppConfig config;
    const AppConfig def;

    config.scan.subnet          = jsonGet<std::string>(j, "scan", "subnet", def.scan.subnet);
    config.scan.interface_name  = jsonGet<std::string>(j, "scan", "interface", def.scan.interface_name);
    config.scan.fallback_subnet = jsonGet<std::string>(j, "scan", "fallback_subnet", def.scan.fallback_subnet);
    config.scan.port            = jsonGet<int>(j, "scan", "port", def.scan.port);
    config.scan.timeout_ms      = jsonGet<int>(j, "scan", "timeout_ms", def.scan.timeout_ms);
    config.scan.workers         = jsonGet<int>(j, "scan", "workers", def.scan.workers);

    config.tools.adb_path           = jsonGet<std::string>(j, "tools", "adb_path", def.tools.adb_path);
    config.tools.scrcpy_path        = jsonGet<std::string>(j, "tools", "scrcpy_path", def.tools.scrcpy_path);
    config.tools.xdotool_path       = jsonGet<std::string>(j, "tools", "xdotool_path", def.tools.xdotool_path);
    config.tools.command_timeout_ms = jsonGet<int>(j, "tools", "command_timeout_ms", def.tools.command_timeout_ms);

    config.screen.off_keys       = jsonGet<std::string>(j, "screen", "off_keys", def.screen.off_keys);
    config.screen.on_keys        = jsonGet<std::string>(j, "screen", "on_keys", def.screen.on_keys);
    config.screen.focus_delay_ms = jsonGet<int>(j, "screen", "focus_delay_ms", def.screen.focus_delay_ms);

    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", def.log.log_path);
    config.log.level    = jsonGet<std::string>(j, "log", "level", def.log.level);
    return config;
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "config.json",
                            bool strict = false) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("config.json");
        if (!file.is_open()) {
            file.open("../config.json");
        }
    }
    if (!file.is_open()) {
        DLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config = parseConfig(j);
    } catch (const nlohmann::json::exception& e) {
        DLOG_ERROR("config", "JSON parse error: %s", e.what());
        return AppConfig{};
    }

    DLOG_INFO("config", "Loaded: subnet=%s, port=%d, workers=%d, timeout=%dms",
              config.scan.subnet.empty() ? "(auto)" : config.scan.subnet.c_str(),
              config.scan.port, config.scan.workers, config.scan.timeout_ms);
    return config;
}

// Integer environment value; malformed values are ignored with a warning
inline bool envInt(const char* name, int& out) {
    const char* val = std::getenv(name);
    if (!val || !*val) return false;
    char* end = nullptr;
    long parsed = std::strtol(val, &end, 10);
    if (*end != '\0' || parsed < INT32_MIN || parsed > INT32_MAX) {
        DLOG_WARN("config", "Ignoring %s=%s (not an integer)", name, val);
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

inline void applyEnvironmentOverrides(AppConfig& config) {
    const char* val = nullptr;
    if ((val = std::getenv("DROID_SUBNET"))) config.scan.subnet = val;
    if ((val = std::getenv("DROID_INTERFACE"))) config.scan.interface_name = val;
    if ((val = std::getenv("DROID_ADB_PATH"))) config.tools.adb_path = val;
    if ((val = std::getenv("DROID_SCRCPY_PATH"))) config.tools.scrcpy_path = val;
    if ((val = std::getenv("DROID_XDOTOOL_PATH"))) config.tools.xdotool_path = val;
    if ((val = std::getenv("DROID_LOG_LEVEL"))) config.log.level = val;
    envInt("DROID_PORT", config.scan.port);
    envInt("DROID_WORKERS", config.scan.workers);
    envInt("DROID_TIMEOUT_MS", config.scan.timeout_ms);
}

inline VoidResult validateConfig(const AppConfig& config) {
    if (config.scan.port < 1 || config.scan.port > 65535) {
        return Err(ErrorCode::Configuration, "scan.port must be 1..65535, got " +
                                             std::to_string(config.scan.port));
    }
    if (config.scan.timeout_ms < 1) {
        return Err(ErrorCode::Configuration, "scan.timeout_ms must be positive");
    }
    if (config.scan.workers < 1) {
        return Err(ErrorCode::Configuration, "scan.workers must be at least 1");
    }
    if (!config.scan.subnet.empty()) {
        auto range = AddressRange::fromCidr(config.scan.subnet);
        if (range.is_err()) return range.error();
    }
    if (!config.scan.fallback_subnet.empty()) {
        auto range = AddressRange::fromCidr(config.scan.fallback_subnet);
        if (range.is_err()) return range.error();
    }
    if (config.tools.command_timeout_ms < 1) {
        return Err(ErrorCode::Configuration, "tools.command_timeout_ms must be positive");
    }
    if (config.screen.focus_delay_ms < 0) {
        return Err(ErrorCode::Configuration, "screen.focus_delay_ms must not be negative");
    }
    if (!log::parseLevel(config.log.level)) {
        return Err(ErrorCode::Configuration, "unknown log level '" + config.log.level + "'");
    }
    return Ok();
}

} // namespace config
} // namespace droid
