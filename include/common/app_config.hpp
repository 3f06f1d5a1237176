#pragma once

#include "backup/backup_config.hpp"
#include "common/logger.hpp"
#include <optional>
#include <string>
#include <vector>

struct AppConfig {
    std::string baseDir;  // profile paths are relative to this; defaults to $HOME
    RunConfiguration run;
    std::vector<BackupProfile> profiles;
    std::string logFile;
    LogLevel logLevel{LogLevel::INFO};
    std::string sudoersRule{"/etc/sudoers.d/vaultrelay-veracrypt"};

    // First profile when id is empty.
    std::optional<BackupProfile> findProfile(const std::string& id) const;
};

std::string homeDirectory();

// $XDG_CONFIG_HOME/vaultrelay, or ~/.config/vaultrelay.
std::string defaultConfigDir();
std::string defaultConfigPath();

// Parses and validates a JSON configuration file. On failure the returned
// config is empty and `error` holds the reason.
std::optional<AppConfig> loadConfig(const std::string& path, std::string& error);
bool saveConfig(const AppConfig& config, const std::string& path, std::string& error);
