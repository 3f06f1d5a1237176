#include "backup/backup_cli.hpp"
#include "backup/backup_job.hpp"
#include "common/elevation.hpp"
#include "common/logger.hpp"
#include "vault/vault_action.hpp"
#include "vault/veracrypt.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace {

const char* const kVersion = "1.0.0";
const char* const kToolPath = "/usr/bin/veracrypt";

std::atomic<bool> g_interrupted{false};

extern "C" void onTerminationSignal(int) {
    g_interrupted.store(true);
}

} // namespace

BackupCLI::BackupCLI(std::shared_ptr<CommandRunner> runner, std::istream& in, std::ostream& out, std::ostream& err)
    : runner_(std::move(runner))
    , in_(in)
    , out_(out)
    , err_(err) {
}

void BackupCLI::printUsage() const {
    out_ << "Usage: vaultrelay [options] <command>\n"
         << "Commands:\n"
         << "  run            - Mount, sync, unmount, copy to remote and verify\n"
         << "  status         - Show whether the container is mounted\n"
         << "  toggle         - Mount the container, or unmount it if mounted\n"
         << "  empty          - Delete everything inside the mounted container\n"
         << "  set-password   - Store the container password (read from stdin)\n"
         << "  test-password  - Check the stored password against the container\n"
         << "  sudo-setup     - Install the passwordless rule for veracrypt\n"
         << "  sudo-remove    - Remove the passwordless rule\n"
         << "  help           - Show this help message\n"
         << "  version        - Show version information\n"
         << "\n"
         << "Options:\n"
         << "  -c, --config FILE          Configuration file (default: " << defaultConfigPath() << ")\n"
         << "  -p, --profile ID           Profile to use (default: first profile)\n"
         << "  --sudo-password-stdin      Read the sudo password from the first line of stdin\n"
         << "  -h, --help                 Show this help message\n"
         << "  -v, --version              Show version information\n";
}

std::optional<CliOptions> BackupCLI::parseArguments(int argc, char* argv[], std::string& error) {
    CliOptions options;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return std::nullopt;
            }
            options.configPath = argv[++i];
        } else if (arg == "-p" || arg == "--profile") {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return std::nullopt;
            }
            options.profileId = argv[++i];
        } else if (arg == "--sudo-password-stdin") {
            options.sudoPasswordFromStdin = true;
        } else if (arg == "-h" || arg == "--help") {
            options.command = "help";
        } else if (arg == "-v" || arg == "--version") {
            options.command = "version";
        } else if (!arg.empty() && arg[0] == '-') {
            error = "Unknown option: " + arg;
            return std::nullopt;
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            error = "Unexpected argument: " + arg;
            return std::nullopt;
        }
    }

    if (options.command.empty()) {
        error = "No command specified";
        return std::nullopt;
    }
    if (options.configPath.empty()) {
        options.configPath = defaultConfigPath();
    }
    return options;
}

int BackupCLI::exitCodeFor(StatusCode code) {
    switch (code) {
        case StatusCode::Complete:
            return 0;
        case StatusCode::Stopped:
            return 130;
        default:
            return 1;
    }
}

void BackupCLI::installSignalHandlers() {
    std::signal(SIGINT, onTerminationSignal);
    std::signal(SIGTERM, onTerminationSignal);
}

bool BackupCLI::interruptRequested() {
    return g_interrupted.load();
}

void BackupCLI::resetInterrupt() {
    g_interrupted.store(false);
}

std::optional<std::string> BackupCLI::readLine() {
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

int BackupCLI::run(int argc, char* argv[]) {
    std::string error;
    auto parsed = parseArguments(argc, argv, error);
    if (!parsed) {
        err_ << "Error: " << error << std::endl;
        printUsage();
        return 1;
    }
    options_ = *parsed;

    if (options_.command == "help") {
        printUsage();
        return 0;
    }
    if (options_.command == "version") {
        out_ << "vaultrelay version " << kVersion << "\n";
        return 0;
    }

    auto config = loadConfig(options_.configPath, error);
    if (!config) {
        err_ << "Error: " << error << std::endl;
        return 1;
    }

    const std::string logFile = config->logFile.empty()
        ? (std::filesystem::path(defaultConfigDir()) / "vaultrelay.log").string()
        : config->logFile;
    if (!Logger::isInitialized() && !Logger::initialize(logFile, config->logLevel)) {
        err_ << "Failed to initialize logger at " << logFile << std::endl;
        return 1;
    }

    const std::string secretPath =
        (std::filesystem::path(options_.configPath).parent_path() / "secrets.json").string();
    secrets_ = std::make_shared<FileSecretStore>(secretPath);

    if (options_.sudoPasswordFromStdin) {
        sudoPassword_ = readLine();
        if (!sudoPassword_ || sudoPassword_->empty()) {
            err_ << "Error: --sudo-password-stdin given but no password was read" << std::endl;
            return 1;
        }
    }

    try {
        if (options_.command == "sudo-setup") {
            return handleSudoSetup(*config, true);
        }
        if (options_.command == "sudo-remove") {
            return handleSudoSetup(*config, false);
        }

        auto profile = config->findProfile(options_.profileId);
        if (!profile) {
            err_ << "Error: Unknown profile: " << options_.profileId << std::endl;
            return 1;
        }
        const ResolvedProfile resolved = resolveProfile(*profile, config->baseDir);

        if (options_.command == "run") {
            return handleRun(*config, resolved);
        } else if (parseVaultAction(options_.command)) {
            return handleVaultAction(*config, resolved, options_.command);
        } else if (options_.command == "set-password") {
            return handleSetPassword(resolved);
        } else if (options_.command == "test-password") {
            return handleTestPassword(resolved);
        }

        err_ << "Error: Unknown command: " << options_.command << std::endl;
        Logger::error("Unknown command: " + options_.command);
        printUsage();
        return 1;
    } catch (const std::exception& e) {
        err_ << "Error: " << e.what() << std::endl;
        Logger::error("Error in " + options_.command + ": " + std::string(e.what()));
        return 1;
    }
}

Elevation BackupCLI::resolveElevation(const AppConfig& config) {
    ElevationHelper helper(runner_, config.sudoersRule);
    if (!helper.isPasswordRequired()) {
        return std::string();
    }
    if (sudoPassword_) {
        if (!helper.verifyPassword(*sudoPassword_)) {
            throw std::runtime_error("The sudo password was rejected");
        }
        return *sudoPassword_;
    }
    Logger::warning("No passwordless rule at " + config.sudoersRule +
                    " and no sudo password given; running veracrypt unelevated");
    return std::nullopt;
}

void BackupCLI::printEvent(const PipelineEvent& event, int& lastProgress) const {
    switch (event.type) {
        case PipelineEvent::Type::Log:
            out_ << event.text << "\n";
            break;
        case PipelineEvent::Type::Status:
            out_ << "[" << event.text << "]\n";
            break;
        case PipelineEvent::Type::StepChanged:
            out_ << "== " << pipelineStepToString(event.step) << " ==\n";
            break;
        case PipelineEvent::Type::Progress:
            // Keep the console readable during long copies
            if (event.progress == 0 || event.progress == 100 || event.progress >= lastProgress + 10) {
                out_ << "Progress: " << event.progress << "%\n";
                lastProgress = event.progress;
            }
            break;
        case PipelineEvent::Type::StatusChanged:
            out_ << "Status: " << statusCodeToString(event.status);
            if (!event.text.empty()) {
                out_ << " (" << event.text << ")";
            }
            out_ << "\n";
            break;
        case PipelineEvent::Type::Finished:
            out_ << "Finished: " << statusCodeToString(event.status) << "\n";
            break;
    }
    out_.flush();
}

int BackupCLI::handleRun(const AppConfig& config, const ResolvedProfile& profile) {
    const Elevation elevation = resolveElevation(config);

    auto events = std::make_shared<EventChannel>();
    BackupJob job(runner_, secrets_, profile, config.run, elevation, nullptr, events);

    // Pipeline log lines reach the console through the event channel
    Logger::setConsoleOutput(false);
    Logger::info("Starting backup of profile " + profile.id + " (" +
                 networkQualityToString(config.run.networkQuality) + " network)");

    if (!job.start()) {
        Logger::setConsoleOutput(true);
        err_ << "Error: Failed to start backup: " << job.getError() << std::endl;
        return 1;
    }

    bool finished = false;
    bool stopRequested = false;
    int lastProgress = 0;
    while (!finished) {
        if (!stopRequested && interruptRequested()) {
            stopRequested = true;
            out_ << "Stop requested, finishing the current operation..." << std::endl;
            job.cancel();
        }
        auto event = events->waitPop(std::chrono::milliseconds(200));
        if (!event) {
            continue;
        }
        printEvent(*event, lastProgress);
        finished = event->type == PipelineEvent::Type::Finished;
    }

    const RunOutcome outcome = job.wait();
    while (auto event = events->tryPop()) {
        printEvent(*event, lastProgress);
    }
    Logger::setConsoleOutput(true);

    if (!outcome.succeeded() && !outcome.detail.empty()) {
        err_ << statusCodeToString(outcome.code) << ": " << outcome.detail << std::endl;
    }
    return exitCodeFor(outcome.code);
}

int BackupCLI::handleVaultAction(const AppConfig& config, const ResolvedProfile& profile,
                                 const std::string& command) {
    const VaultAction action = *parseVaultAction(command);
    const Elevation elevation = resolveElevation(config);

    VaultActionRunner actions(runner_, secrets_, profile, elevation);
    const VaultActionResult result = actions.run(action);
    if (action == VaultAction::CheckStatus && result.ok) {
        out_ << profile.name << ": " << result.message << "\n";
    }
    return result.ok ? 0 : 1;
}

int BackupCLI::handleSetPassword(const ResolvedProfile& profile) {
    auto password = readLine();
    if (!password || password->empty()) {
        err_ << "Error: No container password on stdin" << std::endl;
        return 1;
    }
    if (!secrets_->set(profile.secretIdentity, *password)) {
        err_ << "Error: " << secrets_->getLastError() << std::endl;
        return 1;
    }
    Logger::info("Stored password for " + profile.secretIdentity);
    return 0;
}

int BackupCLI::handleTestPassword(const ResolvedProfile& profile) {
    auto password = secrets_->get(profile.secretIdentity);
    if (!password) {
        err_ << "Error: No password stored for " << profile.secretIdentity << std::endl;
        return 1;
    }
    ContainerMountResolver resolver(runner_);
    const veracrypt::CredentialCheck check = resolver.testCredentials(profile.containerPath, *password);
    out_ << check.message << "\n";
    return check.ok ? 0 : 1;
}

int BackupCLI::handleSudoSetup(const AppConfig& config, bool install) {
    if (!sudoPassword_) {
        err_ << "Error: " << options_.command << " needs --sudo-password-stdin" << std::endl;
        return 1;
    }
    ElevationHelper helper(runner_, config.sudoersRule);
    if (!helper.verifyPassword(*sudoPassword_)) {
        err_ << "Error: The sudo password was rejected" << std::endl;
        return 1;
    }
    const bool ok = install ? helper.installNoPasswordRule(*sudoPassword_, kToolPath)
                            : helper.removeNoPasswordRule(*sudoPassword_);
    return ok ? 0 : 1;
}
