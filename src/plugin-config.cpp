#include "plugin-config.hpp"

#include <algorithm>
#include <obs-data.h>
#include <util/base.h>
#include <util/platform.h>

static constexpr int kMinScanTimeoutSeconds = 1;
static constexpr int kMaxScanTimeoutSeconds = 60;

SessionConfig PluginConfig::ToSessionConfig() const {
    SessionConfig config;
    config.scan_timeout = std::chrono::seconds(
        std::clamp(scan_timeout_seconds, kMinScanTimeoutSeconds, kMaxScanTimeoutSeconds));
    config.filter_heart_rate_service = filter_heart_rate_service;
    config.max_reconnect_attempts = std::max(0, max_reconnect_attempts);
    return config;
}

static void set_defaults(obs_data_t* data) {
    PluginConfig defaults;
    obs_data_set_default_bool(data, "auto_connect", defaults.auto_connect);
    obs_data_set_default_int(data, "scan_timeout_seconds", defaults.scan_timeout_seconds);
    obs_data_set_default_bool(data, "filter_heart_rate_service", defaults.filter_heart_rate_service);
    obs_data_set_default_int(data, "max_reconnect_attempts", defaults.max_reconnect_attempts);
}

PluginConfig LoadPluginConfig(const std::string& path) {
    PluginConfig config;
    if (path.empty()) return config;

    blog(LOG_INFO, "Loading config from: %s", path.c_str());

    obs_data_t* data = obs_data_create_from_json_file(path.c_str());
    if (!data) {
        blog(LOG_INFO, "Config file not found or invalid, creating new one.");
        SavePluginConfig(config, path);
        return config;
    }

    set_defaults(data);
    const char* device_id = obs_data_get_string(data, "last_device_id");
    if (device_id && *device_id) config.last_device_id = device_id;
    config.auto_connect = obs_data_get_bool(data, "auto_connect");
    config.scan_timeout_seconds = std::clamp((int)obs_data_get_int(data, "scan_timeout_seconds"),
                                             kMinScanTimeoutSeconds, kMaxScanTimeoutSeconds);
    config.filter_heart_rate_service = obs_data_get_bool(data, "filter_heart_rate_service");
    config.max_reconnect_attempts = std::max(0, (int)obs_data_get_int(data, "max_reconnect_attempts"));
    obs_data_release(data);

    blog(LOG_INFO, "Config loaded - Last Device: %s, Scan Window: %ds", config.last_device_id.c_str(),
         config.scan_timeout_seconds);
    return config;
}

bool SavePluginConfig(const PluginConfig& config, const std::string& path) {
    if (path.empty()) return false;

    // Ensure directory exists
    std::string dir_path = path;
    size_t last_slash = dir_path.find_last_of("/\\");
    if (last_slash != std::string::npos) {
        dir_path = dir_path.substr(0, last_slash);
        os_mkdirs(dir_path.c_str());
    }

    obs_data_t* data = obs_data_create();
    obs_data_set_string(data, "last_device_id", config.last_device_id.c_str());
    obs_data_set_bool(data, "auto_connect", config.auto_connect);
    obs_data_set_int(data, "scan_timeout_seconds", config.scan_timeout_seconds);
    obs_data_set_bool(data, "filter_heart_rate_service", config.filter_heart_rate_service);
    obs_data_set_int(data, "max_reconnect_attempts", config.max_reconnect_attempts);

    bool saved = obs_data_save_json_safe(data, path.c_str(), "tmp", "bak");
    if (!saved) {
        blog(LOG_WARNING, "Failed to save config to %s", path.c_str());
    } else {
        blog(LOG_INFO, "Config saved to %s", path.c_str());
    }

    obs_data_release(data);
    return saved;
}
