#pragma once
#include <string>

#include "session-model.hpp"

struct PluginConfig {
    std::string last_device_id;
    bool auto_connect = true;
    int scan_timeout_seconds = 10;
    bool filter_heart_rate_service = true;
    int max_reconnect_attempts = 5;

    SessionConfig ToSessionConfig() const;
};

// Missing or unreadable files yield defaults and are rewritten.
PluginConfig LoadPluginConfig(const std::string& path);
bool SavePluginConfig(const PluginConfig& config, const std::string& path);
