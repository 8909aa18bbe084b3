#include "bags/config.hpp"
#include "bags/domain.hpp"
#include "bags/logger.hpp"
#include "bags/theme.hpp"
#include "bags/validation.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace bags {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return value;
    }
    return fallback;
}

std::string homeDir() {
    return envOr("HOME", ".");
}

} // namespace

Config::Config() {
    resetToDefaults();
}

void Config::resetToDefaults() noexcept {
    app_config_ = AppConfig{};
    app_config_.log_file = defaultLogPath();
}

void Config::setAppConfig(const AppConfig& config) {
    app_config_ = config;
    normalize();
}

int Config::effectiveRefreshInterval() const noexcept {
    return std::max(app_config_.refresh_interval_secs, kMinRefreshIntervalSecs);
}

bool Config::load(const std::string& config_file_path) {
    config_file_path_ = config_file_path.empty() ? defaultConfigPath() : config_file_path;
    resetToDefaults();

    auto content = readConfigFile(config_file_path_);
    if (!content) {
        LOG_INFO("No configuration at " + config_file_path_ + ", writing defaults");
        if (!save()) {
            LOG_WARN("Could not write default configuration to " + config_file_path_);
        }
        return true;
    }

    if (!deserializeFromJson(*content)) {
        LOG_WARN("Configuration file " + config_file_path_ + " is invalid, using defaults");
        resetToDefaults();
        return false;
    }
    LOG_INFO("Configuration loaded from " + config_file_path_);
    return true;
}

bool Config::save() const {
    const std::string path = config_file_path_.empty() ? defaultConfigPath() : config_file_path_;
    if (!writeConfigFile(path, serializeToJson())) {
        LOG_ERROR("Failed to save configuration to " + path);
        return false;
    }
    return true;
}

std::string Config::serializeToJson() const {
    nlohmann::json j;
    j["currency"] = app_config_.currency;
    j["theme"] = app_config_.theme;
    j["refresh_interval_secs"] = app_config_.refresh_interval_secs;
    j["log_level"] = app_config_.log_level;
    j["log_file"] = app_config_.log_file;
    j["max_log_size_mb"] = app_config_.max_log_size_mb;
    return j.dump(2);
}

bool Config::deserializeFromJson(const std::string& json_content) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_content);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARN(std::string("Config parse error: ") + e.what());
        return false;
    }
    if (!j.is_object()) {
        return false;
    }

    try {
        app_config_.currency = j.value("currency", app_config_.currency);
        app_config_.theme = j.value("theme", app_config_.theme);
        app_config_.refresh_interval_secs = j.value("refresh_interval_secs", app_config_.refresh_interval_secs);
        app_config_.log_level = j.value("log_level", app_config_.log_level);
        app_config_.log_file = j.value("log_file", app_config_.log_file);
        app_config_.max_log_size_mb = j.value("max_log_size_mb", app_config_.max_log_size_mb);
    } catch (const nlohmann::json::type_error& e) {
        LOG_WARN(std::string("Config type error: ") + e.what());
        return false;
    }

    normalize();
    return true;
}

void Config::normalize() {
    AppConfig defaults;
    if (!isSupportedCurrency(app_config_.currency)) {
        LOG_WARN("Unknown currency '" + app_config_.currency + "', using " + defaults.currency);
        app_config_.currency = defaults.currency;
    }
    if (!isKnownTheme(app_config_.theme)) {
        LOG_WARN("Unknown theme '" + app_config_.theme + "', using " + defaults.theme);
        app_config_.theme = defaults.theme;
    }
    if (app_config_.refresh_interval_secs < kMinRefreshIntervalSecs) {
        app_config_.refresh_interval_secs = kMinRefreshIntervalSecs;
    }
    if (!Validator::isValidLogLevel(app_config_.log_level)) {
        app_config_.log_level = defaults.log_level;
    }
    if (app_config_.log_file.empty()) {
        app_config_.log_file = defaultLogPath();
    }
    if (app_config_.max_log_size_mb <= 0) {
        app_config_.max_log_size_mb = defaults.max_log_size_mb;
    }
}

std::optional<std::string> Config::readConfigFile(const std::string& file_path) const {
    std::ifstream in(file_path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool Config::writeConfigFile(const std::string& file_path, const std::string& content) const {
    std::error_code ec;
    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }
    std::ofstream out(file_path, std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out << content << '\n';
    return static_cast<bool>(out);
}

std::string Config::defaultConfigDir() {
    return envOr("XDG_CONFIG_HOME", homeDir() + "/.config") + "/bags";
}

std::string Config::defaultDataDir() {
    return envOr("XDG_DATA_HOME", homeDir() + "/.local/share") + "/bags";
}

std::string Config::defaultConfigPath() {
    return defaultConfigDir() + "/config.json";
}

std::string Config::defaultStorePath() {
    return defaultDataDir() + "/bags.db";
}

std::string Config::defaultLogPath() {
    return defaultConfigDir() + "/errors.log";
}

} // namespace bags
