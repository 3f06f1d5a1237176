#include "backup/backup_job.hpp"
#include "backup/backup_verifier.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "remote/remote_mount.hpp"
#include "vault/veracrypt.hpp"
#include <filesystem>
#include <system_error>

namespace {

const char* const kSyncTool = "rsync";
const char* const kSyncOptions = "-azhi";  // itemized output instead of verbose

// Only lines describing transferred files are worth keeping
std::optional<std::string> itemizedChangesOnly(const std::string& line) {
    if (!line.empty() && line[0] == '>') {
        return line;
    }
    return std::nullopt;
}

} // namespace

BackupJob::BackupJob(std::shared_ptr<CommandRunner> runner,
                     std::shared_ptr<SecretStore> secrets,
                     const ResolvedProfile& profile,
                     const RunConfiguration& config,
                     Elevation elevation,
                     std::shared_ptr<CancellationToken> cancelToken,
                     std::shared_ptr<EventChannel> events)
    : Job(std::move(events))
    , runner_(std::move(runner))
    , secrets_(std::move(secrets))
    , profile_(profile)
    , config_(config)
    , timeouts_(TimeoutProfile::forQuality(config.networkQuality))
    , elevation_(std::move(elevation))
    , cancel_(cancelToken ? std::move(cancelToken) : std::make_shared<CancellationToken>())
    , chunkSize_(BackupVerifier::kDefaultChunkSize) {
}

BackupJob::~BackupJob() {
    if (worker_.joinable()) {
        cancel_->cancel();
        worker_.join();
    }
}

bool BackupJob::start() {
    if (getState() != State::PENDING || worker_.joinable()) {
        setError("Cannot start job in current state");
        return false;
    }

    setState(State::RUNNING);
    worker_ = std::thread([this]() { execute(); });
    return true;
}

bool BackupJob::cancel() {
    if (getState() != State::RUNNING) {
        return false;
    }
    cancel_->cancel();
    return true;
}

RunOutcome BackupJob::run() {
    if (getState() != State::PENDING) {
        setError("Cannot run job in current state");
        return getOutcome();
    }
    setState(State::RUNNING);
    return execute();
}

RunOutcome BackupJob::wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
    return getOutcome();
}

RunOutcome BackupJob::getOutcome() const {
    std::lock_guard<std::mutex> lock(outcomeMutex_);
    return outcome_;
}

RunOutcome BackupJob::execute() {
    {
        std::lock_guard<std::mutex> lock(outcomeMutex_);
        outcome_ = RunOutcome();
        outcome_.code = StatusCode::Running;
        outcome_.startTime = std::chrono::system_clock::now();
    }
    publishStatusCode(StatusCode::Running, profile_.name);

    RunContext ctx;
    try {
        runPipeline(ctx);
    } catch (const CancelledError& e) {
        logLine(std::string("--- ") + e.what() + " ---");
        ctx.cancelled = true;
    } catch (const std::exception& e) {
        fail(ctx, classifyFailure(e), e.what());
    }

    finalize(ctx);
    return getOutcome();
}

void BackupJob::runPipeline(RunContext& ctx) {
    enterStep(PipelineStep::Starting);
    if (!checkPrerequisites(ctx)) {
        return;
    }

    setStatus("Retrieving credentials...");
    const std::optional<std::string> password = secrets_->get(profile_.secretIdentity);
    if (!password) {
        fail(ctx, StatusCode::GeneralError,
             "Could not retrieve the container password from the secret store. Please save it first.");
        return;
    }

    enterStep(PipelineStep::CheckingMount);
    setStatus("Step 1: Checking container status...");
    ContainerMountResolver resolver(runner_);
    ctx.mountPoint = resolver.resolve(profile_.containerPath, elevation_, logSink());

    if (ctx.mountPoint) {
        setStatus("Container already mounted at " + *ctx.mountPoint + ". Skipping mount step.");
    } else if (!mountContainer(ctx, *password)) {
        return;
    }

    enterStep(PipelineStep::Rsyncing);
    setStatus("Container is ready at: " + *ctx.mountPoint);
    syncSources(ctx);

    if (ctx.didMountMyself) {
        enterStep(PipelineStep::Unmounting);
        unmountContainer(ctx);
    }

    enterStep(PipelineStep::PreparingRemote);
    setStatus("Step 4: Starting off-site backup...");
    if (config_.remotePath.empty()) {
        logLine("Remote path not configured. Skipping off-site copy.");
        enterStep(PipelineStep::Done);
        return;
    }

    std::string destDir;
    if (!prepareRemote(ctx, destDir)) {
        return;
    }

    copyAndVerify(ctx, destDir);
    if (!ctx.failure) {
        enterStep(PipelineStep::Done);
    }
}

bool BackupJob::checkPrerequisites(RunContext& ctx) {
    for (const char* tool : {veracrypt::kTool, kSyncTool}) {
        if (!runner_->toolExists(tool)) {
            fail(ctx, StatusCode::GeneralError, std::string("'") + tool + "' command not found.");
            return false;
        }
    }
    if (profile_.containerPath.empty()) {
        fail(ctx, StatusCode::GeneralError, "No container configured for profile '" + profile_.name + "'.");
        return false;
    }
    return true;
}

bool BackupJob::mountContainer(RunContext& ctx, const std::string& password) {
    enterStep(PipelineStep::Mounting);
    setStatus("Step 1: Mounting container...");

    std::error_code ec;
    if (!std::filesystem::exists(profile_.containerPath, ec)) {
        fail(ctx, StatusCode::GeneralError, "Container not found at '" + profile_.containerPath + "'.");
        return false;
    }

    throwIfCancelled();
    if (!runner_->run(veracrypt::mountCommand(profile_.containerPath, password), elevation_, logSink())) {
        fail(ctx, StatusCode::GeneralError, "Failed to mount the container.");
        return false;
    }

    ctx.didMountMyself = true;
    ContainerMountResolver resolver(runner_);
    ctx.mountPoint = resolver.resolve(profile_.containerPath, elevation_, logSink());
    if (!ctx.mountPoint) {
        // Mounted somewhere we cannot see: undo it, the result does not matter
        logWarning("Could not locate the mount point, dismounting the container as a precaution.");
        if (!runner_->run(veracrypt::dismountCommand(profile_.containerPath), elevation_, logSink())) {
            logWarning("Safety dismount of " + profile_.containerPath + " failed.");
        }
        fail(ctx, StatusCode::GeneralError, "Could not determine mount point after mounting.");
        return false;
    }
    return true;
}

void BackupJob::syncSources(const RunContext& ctx) {
    setStatus("Step 2: Backing up directories...");

    int failed = 0;
    for (const auto& source : profile_.sourceDirs) {
        std::error_code ec;
        if (!std::filesystem::exists(source, ec)) {
            logWarning("Warning: Source directory not found, skipping: " + source);
            continue;
        }

        throwIfCancelled();
        logLine("Backing up '" + std::filesystem::path(source).filename().string() + "'...");

        CommandRequest request;
        request.argv = {kSyncTool, kSyncOptions, source, *ctx.mountPoint};
        request.log = logSink();
        request.outputFilter = itemizedChangesOnly;
        if (!runner_->run(request)) {
            ++failed;
            logWarning("ERROR: Failed to back up " + source + ". Continuing...");
        }
    }

    if (failed > 0) {
        setStatus("Local backup to container finished with " + std::to_string(failed) + " failed director" +
                  (failed == 1 ? "y." : "ies."));
    } else {
        setStatus("Local backup to container complete.");
    }
}

void BackupJob::unmountContainer(RunContext& ctx) {
    setStatus("Step 3: Unmounting container...");
    if (runner_->run(veracrypt::dismountCommand(*ctx.mountPoint), elevation_, logSink())) {
        ctx.mountPoint.reset();
    } else {
        logWarning("Warning: could not unmount " + *ctx.mountPoint + ", will retry during cleanup.");
    }
}

bool BackupJob::prepareRemote(RunContext& ctx, std::string& destDir) {
    if (config_.remoteBackupDir.empty()) {
        fail(ctx, StatusCode::GeneralError, "Remote backup directory is not configured.");
        return false;
    }
    destDir = (std::filesystem::path(config_.remotePath) / config_.remoteBackupDir).string();

    setStatus("Verifying remote destination is mounted...");
    throwIfCancelled();

    bool accessible = probeRemote(config_.remotePath);
    if (!accessible && config_.autoMountRemote) {
        throwIfCancelled("Cancellation requested, skipping remote mount attempt.");
        setStatus("Attempting to mount remote destination...");
        RemoteMounter mounter(runner_, timeouts_.cmd);
        if (mounter.mount(config_.remotePath, logSink())) {
            logLine("Auto-mount successful, waiting for the filesystem to become responsive...");
            // A fresh FUSE mount may need a moment before it answers
            for (int attempt = 1; attempt <= kRemoteProbeAttempts; ++attempt) {
                if (probeRemote(config_.remotePath)) {
                    accessible = true;
                    logLine("Remote path now accessible after auto-mount.");
                    break;
                }
                if (attempt < kRemoteProbeAttempts) {
                    logLine("Path not ready yet, retrying... (" + std::to_string(attempt) + "/" +
                            std::to_string(kRemoteProbeAttempts - 1) + ")");
                    ThreadUtils::sleepFor(mountPollInterval_);
                    throwIfCancelled();
                }
            }
        }
    }

    if (!accessible) {
        fail(ctx, StatusCode::RemoteNotMounted,
             "Remote path is not accessible or not responding: " + config_.remotePath);
        return false;
    }

    logLine("Ensuring backup directory exists: " + destDir);
    bool created = false;
    try {
        auto runner = runner_;
        auto log = logSink();
        created = ThreadUtils::runWithTimeout("mkdir " + destDir, [runner, log, destDir]() {
            return runner->run({"mkdir", "-p", destDir}, std::nullopt, log).has_value();
        }, std::chrono::milliseconds(timeouts_.cmd));
    } catch (const TimeoutFailure& e) {
        logWarning(e.what());
    }

    if (!created) {
        fail(ctx, StatusCode::RemoteWriteFailed, "Could not create remote directory: " + destDir);
        return false;
    }
    return true;
}

bool BackupJob::probeRemote(const std::string& path) {
    logLine("Probing remote base path: " + path);
    try {
        // An external test keeps a dead mount from blocking this process
        auto runner = runner_;
        auto log = logSink();
        return ThreadUtils::runWithTimeout("probe " + path, [runner, log, path]() {
            return runner->run({"test", "-d", path}, std::nullopt, log).has_value();
        }, std::chrono::milliseconds(timeouts_.probe));
    } catch (const TimeoutFailure& e) {
        logWarning(e.what());
        return false;
    }
}

void BackupJob::copyAndVerify(RunContext& ctx, const std::string& destDir) {
    enterStep(PipelineStep::CopyingToRemote);
    const std::string destFile =
        (std::filesystem::path(destDir) / std::filesystem::path(profile_.containerPath).filename()).string();

    BackupVerifier verifier(cancel_, chunkSize_);
    verifier.setProgressCallback([this](int percent) { updateProgress(percent); });
    verifier.setLogCallback([this](const std::string& line) { logWarning(line); });

    const Timeout ioTimeout = std::chrono::milliseconds(timeouts_.io);

    setStatus("Copying container to remote destination... (this may take a while)");
    verifier.copyToRemote(profile_.containerPath, destFile, ioTimeout);

    enterStep(PipelineStep::VerifyingHash);
    setStatus("Verifying local file integrity...");
    const std::string sourceHash = verifier.digestLocal(profile_.containerPath);
    setStatus("Verifying remote file integrity...");
    const std::string destHash = verifier.digestRemote(destFile, ioTimeout);

    if (sourceHash.empty() || destHash.empty() || sourceHash != destHash) {
        fail(ctx, StatusCode::VerificationFailed,
             "The SHA256 hashes of the source and destination files do not match.");
        removeCorruptCopy(destFile);
        return;
    }
    logLine("SHA256 verified: " + sourceHash);
}

void BackupJob::removeCorruptCopy(const std::string& path) {
    try {
        const std::error_code ec = ThreadUtils::runWithTimeout("remove " + path, [path]() {
            std::error_code removeError;
            std::filesystem::remove(path, removeError);
            return removeError;
        }, std::chrono::milliseconds(timeouts_.io));

        if (ec) {
            logWarning("ERROR: Could not delete corrupt file: " + ec.message());
        } else {
            logLine("The corrupt destination file has been deleted.");
        }
    } catch (const TimeoutFailure& e) {
        logWarning(std::string("ERROR: Could not delete corrupt file: ") + e.what());
    }
}

void BackupJob::finalize(RunContext& ctx) {
    // A container found already mounted is left alone only when the run succeeded
    const bool endedBadly = ctx.failure || ctx.cancelled || cancel_->isCancelled();
    if (ctx.mountPoint && (ctx.didMountMyself || endedBadly)) {
        logLine("Ensuring container is unmounted after an issue...");
        if (!runner_->run(veracrypt::dismountCommand(*ctx.mountPoint), elevation_, logSink())) {
            logWarning("Safety dismount of " + *ctx.mountPoint + " failed.");
        }
        ctx.mountPoint.reset();
    }

    RunOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(outcomeMutex_);
        outcome = outcome_;
    }

    // A stop request outranks any error the run ran into
    if (ctx.cancelled || (ctx.failure && cancel_->isCancelled())) {
        outcome.code = StatusCode::Stopped;
        outcome.detail.clear();
        setState(State::CANCELLED);
    } else if (ctx.failure) {
        outcome.code = *ctx.failure;
        outcome.detail = ctx.detail;
        setError(ctx.detail);
        setState(State::FAILED);
    } else {
        outcome.code = StatusCode::Complete;
        outcome.detail.clear();
        setState(State::COMPLETED);
    }
    outcome.endTime = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(outcomeMutex_);
        outcome_ = outcome;
    }

    if (getProgress() != 0) {
        updateProgress(0);
    }
    publishStatusCode(outcome.code, outcome.detail);
    events_->publish(PipelineEvent::finished(outcome.code, outcome.detail));
}

void BackupJob::enterStep(PipelineStep step) {
    if (step != PipelineStep::Done) {
        throwIfCancelled();
    }
    setStep(step);
}

void BackupJob::throwIfCancelled(const std::string& where) const {
    cancel_->throwIfCancelled(where);
}

void BackupJob::fail(RunContext& ctx, StatusCode code, const std::string& detail) {
    if (ctx.failure) {
        logWarning("Additional failure after " + statusCodeToString(*ctx.failure) + ": " + detail);
        return;
    }
    ctx.failure = code;
    ctx.detail = detail;
    Logger::error(statusCodeToString(code) + ": " + detail);
    events_->publish(PipelineEvent::log("ERROR: " + detail));
}

LogCallback BackupJob::logSink() const {
    // Captures only shared state: bounded calls may outlive this job
    auto events = events_;
    return [events](const std::string& line) {
        Logger::info(line);
        events->publish(PipelineEvent::log(line));
    };
}
