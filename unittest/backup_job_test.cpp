#include <gtest/gtest.h>
#include "backup/backup_job.hpp"
#include "fake_command_runner.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <unistd.h>

namespace fs = std::filesystem;

class BackupJobTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("vaultrelay_job_" + std::to_string(::getpid()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_ / "mnt");
        fs::create_directories(root_ / "remote");
        for (const char* dir : {"docs", "photos", "music"}) {
            fs::create_directories(root_ / dir);
        }

        container_ = (root_ / "vault.hc").string();
        std::ofstream out(container_, std::ios::binary);
        for (int i = 0; i < 10000; ++i) {
            out.put(static_cast<char>(i * 7 % 251));
        }
        out.close();

        runner_ = std::make_shared<FakeCommandRunner>();
        runner_->setMountTarget(mountPoint());
        secrets_ = std::make_shared<MemorySecretStore>();
        secrets_->set("vault.hc", "secret");
        token_ = std::make_shared<CancellationToken>();
        events_ = std::make_shared<EventChannel>();

        profile_.id = "main";
        profile_.name = "Main";
        profile_.secretIdentity = "vault.hc";
        profile_.containerPath = container_;
        profile_.sourceDirs = {(root_ / "docs").string(), (root_ / "photos").string()};

        config_.remotePath = (root_ / "remote").string();
        config_.remoteBackupDir = "Backups";
        config_.networkQuality = NetworkQuality::Good;
        config_.autoMountRemote = false;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::unique_ptr<BackupJob> makeJob() {
        auto job = std::make_unique<BackupJob>(runner_, secrets_, profile_, config_,
                                               Elevation(std::string()), token_, events_);
        job->setMountPollInterval(std::chrono::milliseconds(1));
        job->setChunkSize(1024);
        return job;
    }

    std::vector<PipelineEvent> drainEvents() {
        std::vector<PipelineEvent> events;
        while (auto event = events_->tryPop()) {
            events.push_back(*event);
        }
        return events;
    }

    static std::vector<PipelineStep> stepsOf(const std::vector<PipelineEvent>& events) {
        std::vector<PipelineStep> steps;
        for (const auto& event : events) {
            if (event.type == PipelineEvent::Type::StepChanged) {
                steps.push_back(event.step);
            }
        }
        return steps;
    }

    static std::vector<int> progressOf(const std::vector<PipelineEvent>& events) {
        std::vector<int> progress;
        for (const auto& event : events) {
            if (event.type == PipelineEvent::Type::Progress) {
                progress.push_back(event.progress);
            }
        }
        return progress;
    }

    static bool hasLogContaining(const std::vector<PipelineEvent>& events, const std::string& text) {
        return std::any_of(events.begin(), events.end(), [&](const PipelineEvent& event) {
            return event.type == PipelineEvent::Type::Log && event.text.find(text) != std::string::npos;
        });
    }

    static std::string readFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::string mountPoint() const { return (root_ / "mnt").string(); }
    std::string remoteCopy() const { return (root_ / "remote" / "Backups" / "vault.hc").string(); }

    fs::path root_;
    std::string container_;
    std::shared_ptr<FakeCommandRunner> runner_;
    std::shared_ptr<MemorySecretStore> secrets_;
    std::shared_ptr<CancellationToken> token_;
    std::shared_ptr<EventChannel> events_;
    ResolvedProfile profile_;
    RunConfiguration config_;
};

// Test the full pipeline against a reachable remote
TEST_F(BackupJobTest, EndToEndComplete) {
    auto job = makeJob();
    RunOutcome outcome = job->run();

    EXPECT_EQ(outcome.code, StatusCode::Complete);
    EXPECT_TRUE(outcome.detail.empty());
    EXPECT_TRUE(job->isCompleted());
    EXPECT_EQ(runner_->countCalls("veracrypt", "--mount"), 1);
    EXPECT_EQ(runner_->countCalls("veracrypt", "--dismount"), 1);
    EXPECT_EQ(runner_->countCalls("rsync"), 2);
    EXPECT_FALSE(runner_->isMounted(container_));

    ASSERT_TRUE(fs::exists(remoteCopy()));
    EXPECT_EQ(readFile(remoteCopy()), readFile(container_));

    auto events = drainEvents();
    std::vector<PipelineStep> expected = {
        PipelineStep::Starting, PipelineStep::CheckingMount, PipelineStep::Mounting,
        PipelineStep::Rsyncing, PipelineStep::Unmounting, PipelineStep::PreparingRemote,
        PipelineStep::CopyingToRemote, PipelineStep::VerifyingHash, PipelineStep::Done};
    EXPECT_EQ(stepsOf(events), expected);

    auto progress = progressOf(events);
    ASSERT_GE(progress.size(), 2u);
    EXPECT_EQ(progress[progress.size() - 2], 100);
    EXPECT_EQ(progress.back(), 0);

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, PipelineEvent::Type::Finished);
    EXPECT_EQ(events.back().status, StatusCode::Complete);
    EXPECT_EQ(std::count_if(events.begin(), events.end(), [](const PipelineEvent& e) {
                  return e.type == PipelineEvent::Type::Finished;
              }), 1);
}

TEST_F(BackupJobTest, ContainerIsUnmountedBeforeRemoteCopy) {
    auto job = makeJob();
    job->run();

    auto calls = runner_->calls();
    auto isDismount = [](const FakeCommandRunner::Call& c) {
        return !c.argv.empty() && c.argv[0] == "veracrypt" &&
               std::find(c.argv.begin(), c.argv.end(), "--dismount") != c.argv.end();
    };
    auto isMkdir = [](const FakeCommandRunner::Call& c) { return !c.argv.empty() && c.argv[0] == "mkdir"; };

    auto dismount = std::find_if(calls.begin(), calls.end(), isDismount);
    auto mkdir = std::find_if(calls.begin(), calls.end(), isMkdir);
    ASSERT_NE(dismount, calls.end());
    ASSERT_NE(mkdir, calls.end());
    EXPECT_LT(dismount - calls.begin(), mkdir - calls.begin());
}

// A container mounted before the run is used as is and left mounted
TEST_F(BackupJobTest, AlreadyMountedIsLeftMounted) {
    runner_->setMounted(container_, mountPoint());
    config_.remotePath.clear();

    auto job = makeJob();
    EXPECT_EQ(job->run().code, StatusCode::Complete);

    EXPECT_EQ(runner_->countCalls("veracrypt", "--mount"), 0);
    EXPECT_EQ(runner_->countCalls("veracrypt", "--dismount"), 0);
    EXPECT_TRUE(runner_->isMounted(container_));

    auto steps = stepsOf(drainEvents());
    EXPECT_EQ(std::count(steps.begin(), steps.end(), PipelineStep::Mounting), 0);
    EXPECT_EQ(std::count(steps.begin(), steps.end(), PipelineStep::Unmounting), 0);
    EXPECT_EQ(steps.back(), PipelineStep::Done);
}

TEST_F(BackupJobTest, AlreadyMountedIsUnmountedOnFailure) {
    runner_->setMounted(container_, mountPoint());
    config_.remotePath = (root_ / "absent").string();

    auto job = makeJob();
    EXPECT_EQ(job->run().code, StatusCode::RemoteNotMounted);

    EXPECT_EQ(runner_->countCalls("veracrypt", "--mount"), 0);
    EXPECT_EQ(runner_->countCalls("veracrypt", "--dismount"), 1);
    EXPECT_FALSE(runner_->isMounted(container_));
}

TEST_F(BackupJobTest, RemoteNotAccessibleWithoutAutoMount) {
    config_.remotePath = (root_ / "absent").string();

    auto job = makeJob();
    RunOutcome outcome = job->run();

    EXPECT_EQ(outcome.code, StatusCode::RemoteNotMounted);
    EXPECT_NE(outcome.detail.find(config_.remotePath), std::string::npos);
    EXPECT_TRUE(job->isFailed());
    EXPECT_EQ(runner_->countCalls("rsync"), 2);
    EXPECT_EQ(runner_->countCalls("veracrypt", "--dismount"), 1);
    EXPECT_EQ(runner_->countCalls("gio"), 0);
    EXPECT_EQ(runner_->countCalls("mkdir"), 0);
    EXPECT_FALSE(fs::exists(root_ / "absent"));
}

TEST_F(BackupJobTest, AutoMountRecoversRemote) {
    fs::path remote = root_ / "gvfs" / "google-drive:host=gmail.com,user=jane";
    config_.remotePath = remote.string();
    config_.autoMountRemote = true;
    runner_->setRemoteMountCreates(remote.string());

    auto job = makeJob();
    EXPECT_EQ(job->run().code, StatusCode::Complete);

    EXPECT_EQ(runner_->countCalls("gio", "google-drive://jane@gmail.com/"), 1);
    EXPECT_TRUE(fs::exists(remote / "Backups" / "vault.hc"));
}

TEST_F(BackupJobTest, AutoMountWithoutAccountInfoGivesUp) {
    config_.remotePath = (root_ / "absent").string();
    config_.autoMountRemote = true;

    auto job = makeJob();
    EXPECT_EQ(job->run().code, StatusCode::RemoteNotMounted);
    EXPECT_EQ(runner_->countCalls("gio"), 0);
}

// One failing directory does not stop the others
TEST_F(BackupJobTest, PartialSyncContinues) {
    profile_.sourceDirs.push_back((root_ / "music").string());
    runner_->failSource((root_ / "photos").string());
    config_.remotePath.clear();

    auto job = makeJob();
    EXPECT_EQ(job->run().code, StatusCode::Complete);

    auto calls = runner_->calls();
    std::vector<std::string> synced;
    for (const auto& call : calls) {
        if (!call.argv.empty() && call.argv[0] == "rsync") {
            synced.push_back(call.argv[2]);
        }
    }
    ASSERT_EQ(synced.size(), 3u);
    EXPECT_EQ(synced[2], (root_ / "music").string());
    EXPECT_TRUE(hasLogContaining(drainEvents(), "Continuing"));
}

TEST_F(BackupJobTest, MissingSourceDirectoryIsSkipped) {
    profile_.sourceDirs.insert(profile_.sourceDirs.begin(), (root_ / "nope").string());
    config_.remotePath.clear();

    auto job = makeJob();
    EXPECT_EQ(job->run().code, StatusCode::Complete);
    EXPECT_EQ(runner_->countCalls("rsync"), 2);
    EXPECT_TRUE(hasLogContaining(drainEvents(), "Source directory not found"));
}

TEST_F(BackupJobTest, CancellationDuringSyncStops) {
    auto token = token_;
    runner_->setHook([token](const std::vector<std::string>& argv) {
        if (!argv.empty() && argv[0] == "rsync") {
            token->cancel();
        }
    });

    auto job = makeJob();
    RunOutcome outcome = job->run();

    EXPECT_EQ(outcome.code, StatusCode::Stopped);
    EXPECT_TRUE(job->isCancelled());
    EXPECT_EQ(runner_->countCalls("rsync"), 1);
    EXPECT_EQ(runner_->countCalls("veracrypt", "--dismount"), 1);
    EXPECT_EQ(runner_->countCalls("test"), 0);
    EXPECT_FALSE(runner_->isMounted(container_));

    auto events = drainEvents();
    EXPECT_EQ(events.back().type, PipelineEvent::Type::Finished);
    EXPECT_EQ(events.back().status, StatusCode::Stopped);
}

// A stop request wins over an error raised while it was pending
TEST_F(BackupJobTest, StopOutranksFailure) {
    config_.remotePath = (root_ / "absent").string();
    auto token = token_;
    runner_->setHook([token](const std::vector<std::string>& argv) {
        if (!argv.empty() && argv[0] == "test") {
            token->cancel();
        }
    });

    auto job = makeJob();
    EXPECT_EQ(job->run().code, StatusCode::Stopped);
}

TEST_F(BackupJobTest, MissingToolFails) {
    runner_->removeTool("rsync");

    auto job = makeJob();
    RunOutcome outcome = job->run();

    EXPECT_EQ(outcome.code, StatusCode::GeneralError);
    EXPECT_NE(outcome.detail.find("rsync"), std::string::npos);
    EXPECT_TRUE(runner_->calls().empty());
}

TEST_F(BackupJobTest, MissingSecretFails) {
    secrets_->remove("vault.hc");

    auto job = makeJob();
    EXPECT_EQ(job->run().code, StatusCode::GeneralError);
    EXPECT_EQ(runner_->countCalls("veracrypt"), 0);
}

TEST_F(BackupJobTest, MissingContainerFails) {
    fs::remove(container_);

    auto job = makeJob();
    EXPECT_EQ(job->run().code, StatusCode::GeneralError);
    EXPECT_EQ(runner_->countCalls("veracrypt", "--mount"), 0);
}

TEST_F(BackupJobTest, MountFailureFails) {
    runner_->setMountFails(true);

    auto job = makeJob();
    EXPECT_EQ(job->run().code, StatusCode::GeneralError);
    EXPECT_EQ(runner_->countCalls("rsync"), 0);
    EXPECT_EQ(runner_->countCalls("veracrypt", "--dismount"), 0);
}

TEST_F(BackupJobTest, InvisibleMountIsUndone) {
    runner_->setMountInvisible(true);

    auto job = makeJob();
    RunOutcome outcome = job->run();

    EXPECT_EQ(outcome.code, StatusCode::GeneralError);
    EXPECT_EQ(outcome.detail, "Could not determine mount point after mounting.");
    EXPECT_EQ(runner_->countCalls("veracrypt", "--dismount"), 1);
    EXPECT_EQ(runner_->countCalls("veracrypt", container_), 2);
    EXPECT_EQ(runner_->countCalls("rsync"), 0);
}

TEST_F(BackupJobTest, RemoteDirectoryCreationFails) {
    runner_->failProgram("mkdir");

    auto job = makeJob();
    EXPECT_EQ(job->run().code, StatusCode::RemoteWriteFailed);
    EXPECT_FALSE(runner_->isMounted(container_));
}

TEST_F(BackupJobTest, UnwritableRemoteCopyFails) {
    // A directory where the copy should go cannot be opened for writing
    fs::create_directories(remoteCopy());

    auto job = makeJob();
    EXPECT_EQ(job->run().code, StatusCode::RemoteWriteFailed);
}

// Writes to /dev/null succeed but read back nothing, so the digests differ
TEST_F(BackupJobTest, DigestMismatchFailsVerification) {
    fs::create_directories(root_ / "remote" / "Backups");
    fs::create_symlink("/dev/null", remoteCopy());

    auto job = makeJob();
    RunOutcome outcome = job->run();

    EXPECT_EQ(outcome.code, StatusCode::VerificationFailed);
    EXPECT_FALSE(fs::exists(fs::symlink_status(remoteCopy())));
    EXPECT_TRUE(hasLogContaining(drainEvents(), "corrupt destination file has been deleted"));
}

TEST_F(BackupJobTest, FailedUnmountIsRetriedOnce) {
    runner_->setDismountFails(true);
    config_.remotePath.clear();

    auto job = makeJob();
    job->run();
    EXPECT_EQ(runner_->countCalls("veracrypt", "--dismount"), 2);
}

TEST_F(BackupJobTest, StartRunsOnWorker) {
    auto job = makeJob();
    ASSERT_TRUE(job->start());
    EXPECT_FALSE(job->start());

    RunOutcome outcome = job->wait();
    EXPECT_EQ(outcome.code, StatusCode::Complete);
    EXPECT_TRUE(job->isCompleted());
    EXPECT_GE(outcome.endTime, outcome.startTime);
}

TEST_F(BackupJobTest, ElevationOnlyForEncryptionTool) {
    auto job = makeJob();
    job->run();

    for (const auto& call : runner_->calls()) {
        if (call.argv[0] == "veracrypt") {
            ASSERT_TRUE(call.elevation.has_value());
            EXPECT_TRUE(call.elevation->empty());
        } else {
            EXPECT_FALSE(call.elevation.has_value()) << call.argv[0];
        }
    }
}

TEST_F(BackupJobTest, TimeoutsFollowNetworkQuality) {
    config_.networkQuality = NetworkQuality::Poor;
    auto job = makeJob();
    EXPECT_EQ(job->timeouts(), TimeoutProfile::forQuality(NetworkQuality::Poor));
}
