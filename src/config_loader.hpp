#pragma once
// =============================================================================
// Marionette Config Loader
// =============================================================================
// Loads settings from config.json with nlohmann/json, then applies
// MARIONETTE_* environment overrides.
// =============================================================================

#include <string>
#include <vector>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "marionette_log.hpp"

namespace marionette {
namespace config {

struct InputConfig {
    std::string operation_mode = "auto";        // standard_window / emulator_window / auto
    std::string execution_mode = "background";  // foreground* / background* / emulator_*
    int click_interval_ms = 100;
    int combination_hold_ms = 100;
};

struct MuMuConfig {
    std::string manager_path;                   // MuMuManager.exe, empty = emulator not installed
    int command_timeout_ms = 3000;
    int info_cache_ms = 5000;
};

struct LdPlayerConfig {
    std::string console_path;                   // ldconsole.exe
    int command_timeout_ms = 5000;
    int list_cache_ms = 5000;
};

struct AdbConfig {
    std::string adb_path = "adb";
    int command_timeout_ms = 15000;
};

struct TextInputConfig {
    std::string mode = "broadcast_all";         // broadcast_all / single_target
    int keyboard_cache_s = 300;
    int aggressive_cache_s = 10;
    bool aggressive = false;
    std::vector<uint64_t> bound_windows;        // sorted on load
};

struct LogConfig {
    std::string log_path;                       // empty = stderr only
    std::string level = "info";
};

struct AppConfig {
    InputConfig input;
    MuMuConfig mumu;
    LdPlayerConfig ldplayer;
    AdbConfig adb;
    TextInputConfig text_input;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    if (!j.is_object() || !j.contains(section)) return def;
    const auto& s = j[section];
    if (!s.is_object() || !s.contains(key)) return def;
    try {
        return s[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        MNLOG_WARN("config", "%s.%s has wrong type (%s), using default",
                   section.c_str(), key.c_str(), e.what());
        return def;
    }
}

inline AppConfig parseConfig(const nlohmann::json& j) {
    AppConfig config;

    config.input.operation_mode = jsonGet<std::string>(j, "input", "operation_mode", "auto");
    config.input.execution_mode = jsonGet<std::string>(j, "input", "execution_mode", "background");
    config.input.click_interval_ms = jsonGet<int>(j, "input", "click_interval_ms", 100);
    config.input.combination_hold_ms = jsonGet<int>(j, "input", "combination_hold_ms", 100);

    config.mumu.manager_path = jsonGet<std::string>(j, "mumu", "manager_path", "");
    config.mumu.command_timeout_ms = jsonGet<int>(j, "mumu", "command_timeout_ms", 3000);
    config.mumu.info_cache_ms = jsonGet<int>(j, "mumu", "info_cache_ms", 5000);

    config.ldplayer.console_path = jsonGet<std::string>(j, "ldplayer", "console_path", "");
    config.ldplayer.command_timeout_ms = jsonGet<int>(j, "ldplayer", "command_timeout_ms", 5000);
    config.ldplayer.list_cache_ms = jsonGet<int>(j, "ldplayer", "list_cache_ms", 5000);

    config.adb.adb_path = jsonGet<std::string>(j, "adb", "adb_path", "adb");
    config.adb.command_timeout_ms = jsonGet<int>(j, "adb", "command_timeout_ms", 15000);

    config.text_input.mode = jsonGet<std::string>(j, "text_input", "mode", "broadcast_all");
    config.text_input.keyboard_cache_s = jsonGet<int>(j, "text_input", "keyboard_cache_s", 300);
    config.text_input.aggressive_cache_s = jsonGet<int>(j, "text_input", "aggressive_cache_s", 10);
    config.text_input.aggressive = jsonGet<bool>(j, "text_input", "aggressive", false);
    config.text_input.bound_windows =
        jsonGet<std::vector<uint64_t>>(j, "text_input", "bound_windows", {});
    std::sort(config.text_input.bound_windows.begin(), config.text_input.bound_windows.end());

    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", "");
    config.log.level = jsonGet<std::string>(j, "log", "level", "info");

    return config;
}

// MARIONETTE_* environment variables win over the file
inline void applyEnvironmentOverrides(AppConfig& config) {
    const char* val = nullptr;
    if ((val = std::getenv("MARIONETTE_MUMU_MANAGER"))) config.mumu.manager_path = val;
    if ((val = std::getenv("MARIONETTE_LDCONSOLE"))) config.ldplayer.console_path = val;
    if ((val = std::getenv("MARIONETTE_ADB"))) config.adb.adb_path = val;
    if ((val = std::getenv("MARIONETTE_LOG_LEVEL"))) config.log.level = val;
    if ((val = std::getenv("MARIONETTE_TEXT_MODE"))) config.text_input.mode = val;
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
        MNLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        applyEnvironmentOverrides(config);
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config = parseConfig(j);
    } catch (const nlohmann::json::exception& e) {
        MNLOG_ERROR("config", "JSON parse error: %s", e.what());
        config = AppConfig{};
    }

    applyEnvironmentOverrides(config);

    MNLOG_INFO("config", "Loaded: operation_mode=%s, execution_mode=%s, text_mode=%s, mumu=%s",
               config.input.operation_mode.c_str(),
               config.input.execution_mode.c_str(),
               config.text_input.mode.c_str(),
               config.mumu.manager_path.empty() ? "(none)" : config.mumu.manager_path.c_str());

    return config;
}

} // namespace config
} // namespace marionette
