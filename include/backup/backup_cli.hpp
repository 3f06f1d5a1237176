#pragma once

#include "common/app_config.hpp"
#include "common/backup_status.hpp"
#include "common/command_runner.hpp"
#include "common/event_channel.hpp"
#include "vault/secret_store.hpp"
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

struct CliOptions {
    std::string configPath;
    std::string profileId;
    bool sudoPasswordFromStdin{false};
    std::string command;
};

class BackupCLI {
public:
    BackupCLI(std::shared_ptr<CommandRunner> runner, std::istream& in, std::ostream& out, std::ostream& err);

    int run(int argc, char* argv[]);
    void printUsage() const;

    static std::optional<CliOptions> parseArguments(int argc, char* argv[], std::string& error);
    static int exitCodeFor(StatusCode code);

    // SIGINT/SIGTERM request cancellation of a running backup.
    static void installSignalHandlers();
    static bool interruptRequested();
    static void resetInterrupt();

private:
    int handleRun(const AppConfig& config, const ResolvedProfile& profile);
    int handleVaultAction(const AppConfig& config, const ResolvedProfile& profile, const std::string& command);
    int handleSetPassword(const ResolvedProfile& profile);
    int handleTestPassword(const ResolvedProfile& profile);
    int handleSudoSetup(const AppConfig& config, bool install);

    Elevation resolveElevation(const AppConfig& config);
    void printEvent(const PipelineEvent& event, int& lastProgress) const;
    std::optional<std::string> readLine();

    std::shared_ptr<CommandRunner> runner_;
    std::shared_ptr<SecretStore> secrets_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    CliOptions options_;
    std::optional<std::string> sudoPassword_;
};
