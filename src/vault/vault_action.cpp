#include "vault/vault_action.hpp"
#include "common/logger.hpp"
#include "vault/veracrypt.hpp"
#include <filesystem>
#include <system_error>

VaultActionRunner::VaultActionRunner(std::shared_ptr<CommandRunner> runner,
                                     std::shared_ptr<SecretStore> secrets,
                                     const ResolvedProfile& profile,
                                     Elevation elevation,
                                     LogCallback log)
    : runner_(std::move(runner))
    , secrets_(std::move(secrets))
    , profile_(profile)
    , elevation_(std::move(elevation))
    , log_(std::move(log)) {
}

void VaultActionRunner::log(const std::string& message) const {
    Logger::info(message);
    if (log_) {
        log_(message);
    }
}

VaultActionResult VaultActionRunner::run(VaultAction action) {
    VaultActionResult result;

    const std::optional<std::string> password = secrets_->get(profile_.secretIdentity);
    if (profile_.containerPath.empty() || !password) {
        result.message = "ERROR: Container or password is not configured.";
        log(result.message);
        return result;
    }

    ContainerMountResolver resolver(runner_);
    const std::optional<std::string> mountPoint = resolver.resolve(profile_.containerPath, elevation_);

    switch (action) {
        case VaultAction::CheckStatus:
            result.ok = true;
            result.mounted = mountPoint.has_value();
            result.mountPoint = mountPoint;
            result.message = mountPoint ? "Mounted at " + *mountPoint : "Not mounted";
            return result;
        case VaultAction::ToggleMount:
            return toggleMount(mountPoint, *password);
        case VaultAction::Empty:
            return empty(mountPoint);
    }
    return result;
}

VaultActionResult VaultActionRunner::toggleMount(const std::optional<std::string>& mountPoint,
                                                 const std::string& password) {
    const LogCallback sink = [this](const std::string& line) { log(line); };

    if (mountPoint) {
        log("--- Unmounting container... ---");
        if (!runner_->run(veracrypt::dismountCommand(*mountPoint), elevation_, sink)) {
            log("Unmount command failed for " + *mountPoint);
        }
    } else {
        log("--- Mounting container... ---");
        if (!runner_->run(veracrypt::mountCommand(profile_.containerPath, password), elevation_, sink)) {
            log("Mount command failed for " + profile_.containerPath);
        }
    }

    ContainerMountResolver resolver(runner_);
    const std::optional<std::string> newMountPoint = resolver.resolve(profile_.containerPath, elevation_);

    VaultActionResult result;
    result.mounted = newMountPoint.has_value();
    result.mountPoint = newMountPoint;
    if (mountPoint && !newMountPoint) {
        result.ok = true;
        result.message = "Unmount successful.";
    } else if (!mountPoint && newMountPoint) {
        result.ok = true;
        result.message = "Mount successful. New mount point: " + *newMountPoint;
    } else {
        result.message = "Mount/Unmount state did not change as expected. Please check the log.";
    }
    log(result.message);
    return result;
}

VaultActionResult VaultActionRunner::empty(const std::optional<std::string>& mountPoint) {
    VaultActionResult result;
    result.mounted = mountPoint.has_value();
    result.mountPoint = mountPoint;

    if (!mountPoint) {
        result.message = "ERROR: Container must be mounted to be emptied.";
        log(result.message);
        return result;
    }

    log("--- Emptying container... ---");
    try {
        for (const auto& entry : std::filesystem::directory_iterator(*mountPoint)) {
            std::filesystem::remove_all(entry.path());
        }
        result.ok = true;
        result.message = "Container emptied successfully.";
    } catch (const std::filesystem::filesystem_error& e) {
        result.message = "ERROR: Failed to empty container: " + std::string(e.what());
    }
    log(result.message);
    return result;
}

std::optional<VaultAction> parseVaultAction(const std::string& text) {
    if (text == "status") {
        return VaultAction::CheckStatus;
    }
    if (text == "toggle") {
        return VaultAction::ToggleMount;
    }
    if (text == "empty") {
        return VaultAction::Empty;
    }
    return std::nullopt;
}
