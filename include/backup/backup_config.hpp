#pragma once

#include "backup/timeout_profile.hpp"
#include <string>
#include <vector>

// A vault profile as configured: paths are relative to the base directory.
struct BackupProfile {
    std::string id;
    std::string name;
    std::string container;             // relative container path, also the secret identity
    std::vector<std::string> sources;  // relative source directories, synced in order
};

// Profile with every path made absolute. Built once before a run starts.
struct ResolvedProfile {
    std::string id;
    std::string name;
    std::string secretIdentity;
    std::string containerPath;
    std::vector<std::string> sourceDirs;
};

// Snapshot of the run-relevant settings taken when a run starts.
struct RunConfiguration {
    std::string remotePath;       // empty = local-only run
    std::string remoteBackupDir;  // subdirectory below remotePath
    NetworkQuality networkQuality{NetworkQuality::Good};
    bool autoMountRemote{true};
};

ResolvedProfile resolveProfile(const BackupProfile& profile, const std::string& baseDir);
