#include "common/app_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <pwd.h>
#include <unistd.h>

using json = nlohmann::json;

std::optional<BackupProfile> AppConfig::findProfile(const std::string& id) const {
    if (profiles.empty()) {
        return std::nullopt;
    }
    if (id.empty()) {
        return profiles.front();
    }
    for (const auto& profile : profiles) {
        if (profile.id == id) {
            return profile;
        }
    }
    return std::nullopt;
}

std::string homeDirectory() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return home;
    }
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return "/";
}

std::string defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (std::filesystem::path(xdg) / "vaultrelay").string();
    }
    return (std::filesystem::path(homeDirectory()) / ".config" / "vaultrelay").string();
}

std::string defaultConfigPath() {
    return (std::filesystem::path(defaultConfigDir()) / "config.json").string();
}

namespace {

std::optional<NetworkQuality> readNetworkQuality(const json& value) {
    if (value.is_number_integer()) {
        return parseNetworkQuality(std::to_string(value.get<int>()));
    }
    if (value.is_string()) {
        return parseNetworkQuality(value.get<std::string>());
    }
    return std::nullopt;
}

} // namespace

std::optional<AppConfig> loadConfig(const std::string& path, std::string& error) {
    if (!std::filesystem::exists(path)) {
        error = "Configuration file not found at '" + path + "'";
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Could not read configuration file: " + path;
        return std::nullopt;
    }

    try {
        json root;
        file >> root;

        if (!root.is_object()) {
            error = "Configuration file does not contain an object as root: " + path;
            return std::nullopt;
        }

        for (const char* key : {"remote_path", "remote_backup_dir", "profiles"}) {
            if (!root.contains(key)) {
                error = std::string("Missing key '") + key + "' in configuration file.";
                return std::nullopt;
            }
        }

        const json& profiles = root.at("profiles");
        if (!profiles.is_array() || profiles.empty()) {
            error = "The 'profiles' key must be a non-empty list in the configuration file.";
            return std::nullopt;
        }
        for (const char* key : {"id", "name", "container", "sources"}) {
            if (!profiles.front().contains(key)) {
                error = std::string("The first profile is missing the required key: '") + key + "'";
                return std::nullopt;
            }
        }

        AppConfig config;
        config.baseDir = root.value("base_dir", homeDirectory());
        config.run.remotePath = root.at("remote_path").is_null() ? "" : root.at("remote_path").get<std::string>();
        config.run.remoteBackupDir = root.at("remote_backup_dir").get<std::string>();
        config.run.autoMountRemote = root.value("auto_mount_remote", true);
        config.logFile = root.value("log_file", (std::filesystem::path(defaultConfigDir()) / "vaultrelay.log").string());
        config.logLevel = parseLogLevel(root.value("log_level", std::string("info")));
        config.sudoersRule = root.value("sudoers_rule", config.sudoersRule);

        if (root.contains("network_quality")) {
            auto quality = readNetworkQuality(root.at("network_quality"));
            if (!quality) {
                error = "Invalid 'network_quality' value: " + root.at("network_quality").dump();
                return std::nullopt;
            }
            config.run.networkQuality = *quality;
        }

        for (const auto& entry : profiles) {
            BackupProfile profile;
            profile.id = entry.value("id", std::string());
            profile.name = entry.value("name", profile.id);
            profile.container = entry.value("container", std::string());
            profile.sources = entry.value("sources", std::vector<std::string>());
            config.profiles.push_back(profile);
        }

        return config;
    } catch (const json::exception& e) {
        error = "Could not parse configuration file: " + std::string(e.what());
        return std::nullopt;
    }
}

bool saveConfig(const AppConfig& config, const std::string& path, std::string& error) {
    try {
        json root;
        root["base_dir"] = config.baseDir;
        root["remote_path"] = config.run.remotePath;
        root["remote_backup_dir"] = config.run.remoteBackupDir;
        root["network_quality"] = networkQualityToString(config.run.networkQuality);
        root["auto_mount_remote"] = config.run.autoMountRemote;
        root["log_file"] = config.logFile;
        root["sudoers_rule"] = config.sudoersRule;
        switch (config.logLevel) {
            case LogLevel::DEBUG:   root["log_level"] = "debug"; break;
            case LogLevel::INFO:    root["log_level"] = "info"; break;
            case LogLevel::WARNING: root["log_level"] = "warning"; break;
            case LogLevel::ERROR:   root["log_level"] = "error"; break;
            case LogLevel::FATAL:   root["log_level"] = "fatal"; break;
        }

        root["profiles"] = json::array();
        for (const auto& profile : config.profiles) {
            root["profiles"].push_back({
                {"id", profile.id},
                {"name", profile.name},
                {"container", profile.container},
                {"sources", profile.sources}
            });
        }

        std::filesystem::path target(path);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            error = "Could not write to configuration file: " + path;
            return false;
        }
        file << root.dump(4);
        return true;
    } catch (const std::exception& e) {
        error = "Could not write to configuration file: " + std::string(e.what());
        return false;
    }
}
