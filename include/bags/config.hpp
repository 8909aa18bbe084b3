#pragma once
#include <optional>
#include <string>

namespace bags {

/**
 * Non-secret user configuration, stored as JSON under the XDG config directory.
 * Secrets (API keys, notification topic) live in the encrypted store instead.
 */
class Config {
public:
    static constexpr int kMinRefreshIntervalSecs = 30;
    static constexpr int kDefaultRefreshIntervalSecs = 60;

    struct AppConfig {
        std::string currency = "usd";
        std::string theme = "dark";
        int refresh_interval_secs = kDefaultRefreshIntervalSecs;
        std::string log_level = "INFO";
        std::string log_file;
        int max_log_size_mb = 5;
    };

    Config();

    // Load configuration from file (creates it with defaults if it does not exist).
    // Returns false when the file exists but could not be used; defaults stay in effect.
    bool load(const std::string& config_file_path = "");

    bool save() const;

    const AppConfig& getAppConfig() const noexcept { return app_config_; }
    void setAppConfig(const AppConfig& config);

    // Interval actually used by the scheduler, never below the floor
    int effectiveRefreshInterval() const noexcept;

    std::string getConfigFilePath() const noexcept { return config_file_path_; }
    void setConfigFilePath(const std::string& path) noexcept { config_file_path_ = path; }

    void resetToDefaults() noexcept;

    std::string serializeToJson() const;
    bool deserializeFromJson(const std::string& json_content);

    // XDG locations
    static std::string defaultConfigDir();
    static std::string defaultDataDir();
    static std::string defaultConfigPath();
    static std::string defaultStorePath();
    static std::string defaultLogPath();

private:
    AppConfig app_config_;
    std::string config_file_path_;

    // Replaces unknown or out-of-range values with defaults
    void normalize();

    std::optional<std::string> readConfigFile(const std::string& file_path) const;
    bool writeConfigFile(const std::string& file_path, const std::string& content) const;
};

} // namespace bags
