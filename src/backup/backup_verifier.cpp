#include "backup/backup_verifier.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <openssl/evp.h>

namespace {

class Sha256 {
public:
    Sha256()
        : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) {
            throw std::runtime_error("Failed to create OpenSSL context");
        }
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw std::runtime_error("Failed to initialize digest");
        }
    }

    ~Sha256() {
        EVP_MD_CTX_free(ctx_);
    }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const char* data, size_t size) {
        if (EVP_DigestUpdate(ctx_, data, size) != 1) {
            throw std::runtime_error("Failed to update digest");
        }
    }

    std::string hexDigest() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (EVP_DigestFinal_ex(ctx_, hash, &hashLen) != 1) {
            throw std::runtime_error("Failed to finalize digest");
        }

        std::stringstream ss;
        for (unsigned int i = 0; i < hashLen; i++) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return ss.str();
    }

private:
    EVP_MD_CTX* ctx_;
};

struct OpenedFile {
    int fd;
    long long size;
};

OpenedFile openRemote(const std::string& path, int flags, Timeout timeout) {
    return ThreadUtils::runWithTimeout("open " + path, [path, flags]() {
        int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw IOFailure::fromErrno(path, errno, true, "could not open");
        }
        struct stat st {};
        long long size = 0;
        if (::fstat(fd, &st) == 0) {
            size = static_cast<long long>(st.st_size);
        }
        return OpenedFile{fd, size};
    }, timeout);
}

// Descriptor private to one bounded call. A helper abandoned by the watchdog
// keeps writing to its own duplicate, never to a number the caller has
// closed and the process has since reused.
class HelperHandle {
public:
    HelperHandle(int fd, const std::string& path)
        : fd_(::dup(fd)) {
        if (fd_ < 0) {
            throw IOFailure::fromErrno(path, errno, true, "could not duplicate handle");
        }
    }

    ~HelperHandle() {
        ::close(fd_);
    }

    HelperHandle(const HelperHandle&) = delete;
    HelperHandle& operator=(const HelperHandle&) = delete;

    int fd() const { return fd_; }

private:
    int fd_;
};

size_t readRemote(int fd, const std::string& path, std::shared_ptr<std::vector<char>> buffer, Timeout timeout) {
    auto handle = std::make_shared<HelperHandle>(fd, path);
    return ThreadUtils::runWithTimeout("read " + path, [handle = std::move(handle), path, buffer]() {
        ssize_t n;
        do {
            n = ::read(handle->fd(), buffer->data(), buffer->size());
        } while (n < 0 && errno == EINTR);
        if (n < 0) {
            throw IOFailure::fromErrno(path, errno, true, "read failed");
        }
        return static_cast<size_t>(n);
    }, timeout);
}

void writeRemote(int fd, const std::string& path, std::shared_ptr<std::vector<char>> buffer,
                 size_t size, Timeout timeout) {
    auto handle = std::make_shared<HelperHandle>(fd, path);
    ThreadUtils::runWithTimeout("write " + path, [handle = std::move(handle), path, buffer, size]() {
        size_t written = 0;
        while (written < size) {
            ssize_t n = ::write(handle->fd(), buffer->data() + written, size - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw IOFailure::fromErrno(path, errno, true, "write failed");
            }
            written += static_cast<size_t>(n);
        }
    }, timeout);
}

} // namespace

BackupVerifier::BackupVerifier(std::shared_ptr<const CancellationToken> cancel, size_t chunkSize)
    : cancel_(std::move(cancel))
    , chunkSize_(chunkSize == 0 ? kDefaultChunkSize : chunkSize) {
}

BackupVerifier::~BackupVerifier() = default;

void BackupVerifier::setProgressCallback(ProgressCallback callback) {
    progressCallback_ = std::move(callback);
}

void BackupVerifier::setLogCallback(LogCallback callback) {
    logCallback_ = std::move(callback);
}

void BackupVerifier::checkCancelled(const std::string& where) const {
    if (cancel_ && cancel_->isCancelled()) {
        throw CancelledError("Backup cancelled by user " + where + ".");
    }
}

void BackupVerifier::reportProgress(long long done, long long total) const {
    if (progressCallback_ && total > 0) {
        progressCallback_(static_cast<int>((done * 100) / total));
    }
}

void BackupVerifier::log(const std::string& message) const {
    if (logCallback_) {
        logCallback_(message);
    } else {
        Logger::warning(message);
    }
}

std::string BackupVerifier::digestLocal(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOFailure::fromErrno(path, errno, false, "failed during local file hashing");
    }

    Sha256 sha;
    std::vector<char> buffer(chunkSize_);
    while (true) {
        checkCancelled("during local file hashing");
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize count = file.gcount();
        if (count > 0) {
            sha.update(buffer.data(), static_cast<size_t>(count));
        }
        if (file.bad()) {
            throw IOFailure(path, IOErrorKind::Other, false, "read error during local file hashing");
        }
        if (count <= 0 || file.eof()) {
            break;
        }
    }
    return sha.hexDigest();
}

std::string BackupVerifier::digestRemote(const std::string& path, Timeout ioTimeout) const {
    checkCancelled("before opening the remote file");

    OpenedFile remote{-1, 0};
    try {
        remote = openRemote(path, O_RDONLY, ioTimeout);
    } catch (const TimeoutFailure& e) {
        throw IOFailure::fromTimeout(path, e);
    }

    const auto closeRemote = [&]() {
        try {
            const int fd = remote.fd;
            ThreadUtils::runWithTimeout("close " + path, [fd, path]() {
                if (::close(fd) != 0) {
                    throw IOFailure::fromErrno(path, errno, true, "close failed");
                }
            }, ioTimeout);
        } catch (const TimeoutFailure& e) {
            log("Warning: failed to close remote file handle for hashing: " + std::string(e.what()));
        } catch (const IOFailure& e) {
            log("Warning: failed to close remote file handle for hashing: " + std::string(e.what()));
        }
    };

    std::string digest;
    try {
        checkCancelled("during hashing");

        Sha256 sha;
        auto buffer = std::make_shared<std::vector<char>>(chunkSize_);
        long long processed = 0;
        while (true) {
            const size_t count = readRemote(remote.fd, path, buffer, ioTimeout);
            checkCancelled("during hashing");
            if (count == 0) {
                break;
            }
            sha.update(buffer->data(), count);
            processed += static_cast<long long>(count);
            reportProgress(processed, remote.size);
        }
        digest = sha.hexDigest();
    } catch (const TimeoutFailure& e) {
        closeRemote();
        throw IOFailure::fromTimeout(path, e);
    } catch (...) {
        closeRemote();
        throw;
    }
    closeRemote();
    return digest;
}

void BackupVerifier::copyToRemote(const std::string& sourcePath, const std::string& destPath, Timeout ioTimeout) const {
    checkCancelled("before the file copy");

    // Any failure of the copy counts against the remote write, the source side included
    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(sourcePath, ec);
    if (ec) {
        throw IOFailure::fromErrno(sourcePath, ec.value(), true, "could not stat source for the remote copy");
    }
    const long long total = static_cast<long long>(fileSize);

    std::ifstream source(sourcePath, std::ios::binary);
    if (!source.is_open()) {
        throw IOFailure::fromErrno(sourcePath, errno, true, "could not open source for the remote copy");
    }

    OpenedFile dest{-1, 0};
    try {
        dest = openRemote(destPath, O_WRONLY | O_CREAT | O_TRUNC, ioTimeout);
    } catch (const TimeoutFailure& e) {
        throw IOFailure::fromTimeout(destPath, e);
    }

    const auto closeDest = [&]() {
        try {
            const int fd = dest.fd;
            const std::string path = destPath;
            ThreadUtils::runWithTimeout("close " + destPath, [fd, path]() {
                if (::close(fd) != 0) {
                    throw IOFailure::fromErrno(path, errno, true, "close failed");
                }
            }, ioTimeout);
        } catch (const TimeoutFailure& e) {
            log("Warning: failed to close destination file handle: " + std::string(e.what()));
        } catch (const IOFailure& e) {
            log("Warning: failed to close destination file handle: " + std::string(e.what()));
        }
    };

    try {
        auto buffer = std::make_shared<std::vector<char>>(chunkSize_);
        long long copied = 0;
        while (true) {
            // Local reads are trusted and stay unguarded
            source.read(buffer->data(), static_cast<std::streamsize>(buffer->size()));
            const std::streamsize count = source.gcount();
            if (source.bad()) {
                throw IOFailure(sourcePath, IOErrorKind::Other, true, "read error during the remote copy");
            }
            checkCancelled("during file copy");
            if (count <= 0) {
                break;
            }
            writeRemote(dest.fd, destPath, buffer, static_cast<size_t>(count), ioTimeout);
            copied += static_cast<long long>(count);
            reportProgress(copied, total);
        }
    } catch (const TimeoutFailure& e) {
        closeDest();
        throw IOFailure::fromTimeout(destPath, e);
    } catch (...) {
        closeDest();
        throw;
    }
    closeDest();

    if (progressCallback_) {
        progressCallback_(0);
    }
}
