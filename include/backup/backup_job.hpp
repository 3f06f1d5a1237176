#pragma once

#include "common/job.hpp"
#include "common/command_runner.hpp"
#include "common/thread_utils.hpp"
#include "backup/backup_config.hpp"
#include "backup/timeout_profile.hpp"
#include "vault/secret_store.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// The backup pipeline: mount the container, sync the sources into it,
// unmount it, copy it to the remote destination and verify the copy.
//
// Steps run strictly in order on a single thread. Each blocking call against
// the remote is individually bounded by the run's TimeoutProfile.
// Cancellation is cooperative: it is observed at step transitions, before
// each source directory and between chunks of the copy and hash loops.
// Whatever happens, exactly one RunOutcome is produced and a container this
// run mounted is unmounted again.
class BackupJob : public Job {
public:
    BackupJob(std::shared_ptr<CommandRunner> runner,
              std::shared_ptr<SecretStore> secrets,
              const ResolvedProfile& profile,
              const RunConfiguration& config,
              Elevation elevation = std::nullopt,
              std::shared_ptr<CancellationToken> cancelToken = nullptr,
              std::shared_ptr<EventChannel> events = nullptr);
    ~BackupJob() override;

    // Runs the pipeline on a dedicated worker thread.
    bool start() override;
    bool cancel() override;

    // Runs the pipeline on the calling thread.
    RunOutcome run();

    // Joins the worker started by start().
    RunOutcome wait();

    RunOutcome getOutcome() const;
    const TimeoutProfile& timeouts() const { return timeouts_; }
    std::shared_ptr<CancellationToken> cancellationToken() const { return cancel_; }

    void setMountPollInterval(std::chrono::milliseconds interval) { mountPollInterval_ = interval; }
    void setChunkSize(size_t chunkSize) { chunkSize_ = chunkSize; }

    static constexpr int kRemoteProbeAttempts = 5;

private:
    struct RunContext {
        std::optional<std::string> mountPoint;
        bool didMountMyself{false};
        bool cancelled{false};
        std::optional<StatusCode> failure;
        std::string detail;
    };

    RunOutcome execute();
    void runPipeline(RunContext& ctx);
    void finalize(RunContext& ctx);

    bool checkPrerequisites(RunContext& ctx);
    bool mountContainer(RunContext& ctx, const std::string& password);
    void syncSources(const RunContext& ctx);
    void unmountContainer(RunContext& ctx);
    bool prepareRemote(RunContext& ctx, std::string& destDir);
    bool probeRemote(const std::string& path);
    void copyAndVerify(RunContext& ctx, const std::string& destDir);
    void removeCorruptCopy(const std::string& path);

    void enterStep(PipelineStep step);
    void throwIfCancelled(const std::string& where = "Backup cancelled by user.") const;
    void fail(RunContext& ctx, StatusCode code, const std::string& detail);
    LogCallback logSink() const;

    std::shared_ptr<CommandRunner> runner_;
    std::shared_ptr<SecretStore> secrets_;
    const ResolvedProfile profile_;
    const RunConfiguration config_;
    const TimeoutProfile timeouts_;
    const Elevation elevation_;
    std::shared_ptr<CancellationToken> cancel_;

    std::chrono::milliseconds mountPollInterval_{std::chrono::seconds(1)};
    size_t chunkSize_;

    std::thread worker_;
    RunOutcome outcome_;
    mutable std::mutex outcomeMutex_;
};
