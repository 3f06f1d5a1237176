#pragma once

#include "common/command_runner.hpp"
#include "common/thread_utils.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

// Chunked SHA-256 digests and a chunked copy to the remote destination.
//
// The local variants read without a watchdog. The remote variants run every
// open, read, write and close under ThreadUtils::runWithTimeout so a hung
// network mount turns into an IOFailure instead of a stuck process. All
// variants poll the cancellation token between chunks and throw
// CancelledError once it is set.
class BackupVerifier {
public:
    using ProgressCallback = std::function<void(int)>;

    static constexpr size_t kDefaultChunkSize = 4 * 1024 * 1024;

    explicit BackupVerifier(std::shared_ptr<const CancellationToken> cancel,
                            size_t chunkSize = kDefaultChunkSize);
    ~BackupVerifier();

    void setProgressCallback(ProgressCallback callback);
    void setLogCallback(LogCallback callback);

    // Hex digest of a trusted local file.
    std::string digestLocal(const std::string& path) const;

    // Hex digest of a file on the remote destination, each I/O call bounded
    // by `ioTimeout` (empty = unbounded).
    std::string digestRemote(const std::string& path, Timeout ioTimeout) const;

    // Copies a local file to the remote destination. Progress is reset to 0
    // once the copy completes.
    void copyToRemote(const std::string& sourcePath, const std::string& destPath, Timeout ioTimeout) const;

private:
    void checkCancelled(const std::string& where) const;
    void reportProgress(long long done, long long total) const;
    void log(const std::string& message) const;

    std::shared_ptr<const CancellationToken> cancel_;
    size_t chunkSize_;
    ProgressCallback progressCallback_;
    LogCallback logCallback_;
};
