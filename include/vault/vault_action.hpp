#pragma once

#include "common/command_runner.hpp"
#include "backup/backup_config.hpp"
#include "vault/secret_store.hpp"
#include <memory>
#include <optional>
#include <string>

enum class VaultAction {
    CheckStatus,
    ToggleMount,
    Empty
};

struct VaultActionResult {
    bool ok{false};
    bool mounted{false};
    std::optional<std::string> mountPoint;
    std::string message;
};

// One-shot mount/unmount/empty actions outside the backup pipeline.
class VaultActionRunner {
public:
    VaultActionRunner(std::shared_ptr<CommandRunner> runner,
                      std::shared_ptr<SecretStore> secrets,
                      const ResolvedProfile& profile,
                      Elevation elevation = std::nullopt,
                      LogCallback log = nullptr);

    VaultActionResult run(VaultAction action);

private:
    VaultActionResult toggleMount(const std::optional<std::string>& mountPoint, const std::string& password);
    VaultActionResult empty(const std::optional<std::string>& mountPoint);
    void log(const std::string& message) const;

    std::shared_ptr<CommandRunner> runner_;
    std::shared_ptr<SecretStore> secrets_;
    ResolvedProfile profile_;
    Elevation elevation_;
    LogCallback log_;
};

std::optional<VaultAction> parseVaultAction(const std::string& text);
