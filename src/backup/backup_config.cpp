#include "backup/backup_config.hpp"
#include <filesystem>

namespace {

std::string absoluteUnder(const std::string& baseDir, const std::string& path) {
    std::filesystem::path p(path);
    if (p.is_relative()) {
        p = std::filesystem::path(baseDir) / p;
    }
    p = p.lexically_normal();
    // "dir/" would make the sync tool copy the contents instead of the directory
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p.string();
}

} // namespace

ResolvedProfile resolveProfile(const BackupProfile& profile, const std::string& baseDir) {
    ResolvedProfile resolved;
    resolved.id = profile.id;
    resolved.name = profile.name;
    resolved.secretIdentity = profile.container;
    if (!profile.container.empty()) {
        resolved.containerPath = absoluteUnder(baseDir, profile.container);
    }
    for (const auto& source : profile.sources) {
        resolved.sourceDirs.push_back(absoluteUnder(baseDir, source));
    }
    return resolved;
}
