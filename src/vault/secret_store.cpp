#include "vault/secret_store.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using json = nlohmann::json;

std::string SecretStore::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

void SecretStore::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
}

namespace {

bool readSecrets(const std::string& path, json& secrets, std::string& error) {
    if (!std::filesystem::exists(path)) {
        secrets = json::object();
        return true;
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Could not open secret store: " + path;
        return false;
    }
    try {
        file >> secrets;
    } catch (const json::exception& e) {
        error = "Secret store is corrupt: " + std::string(e.what());
        return false;
    }
    if (!secrets.is_object()) {
        error = "Secret store does not contain an object: " + path;
        return false;
    }
    return true;
}

bool writeSecrets(const std::string& path, const json& secrets, std::string& error) {
    std::filesystem::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
    }

    // Written to a private temporary first, then renamed over the old file
    const std::string temp = path + ".tmp";
    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        error = "Could not write secret store " + temp + ": " + std::strerror(errno);
        return false;
    }

    const std::string data = secrets.dump(4);
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = "Could not write secret store " + temp + ": " + std::strerror(errno);
            ::close(fd);
            ::unlink(temp.c_str());
            return false;
        }
        written += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0 || ::close(fd) != 0) {
        error = "Could not flush secret store " + temp + ": " + std::strerror(errno);
        ::unlink(temp.c_str());
        return false;
    }
    if (::rename(temp.c_str(), path.c_str()) != 0) {
        error = "Could not replace secret store " + path + ": " + std::strerror(errno);
        ::unlink(temp.c_str());
        return false;
    }
    return true;
}

} // namespace

FileSecretStore::FileSecretStore(const std::string& path)
    : path_(path) {
}

std::optional<std::string> FileSecretStore::get(const std::string& identity) {
    if (identity.empty()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    json secrets;
    std::string error;
    if (!readSecrets(path_, secrets, error)) {
        setLastError(error);
        Logger::error(error);
        return std::nullopt;
    }

    auto it = secrets.find(identity);
    if (it == secrets.end() || !it->is_string()) {
        setLastError("No secret stored for " + identity);
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool FileSecretStore::set(const std::string& identity, const std::string& secret) {
    if (identity.empty()) {
        setLastError("Container path cannot be empty when saving a password.");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    json secrets;
    std::string error;
    if (!readSecrets(path_, secrets, error)) {
        setLastError(error);
        return false;
    }
    secrets[identity] = secret;
    if (!writeSecrets(path_, secrets, error)) {
        setLastError(error);
        return false;
    }
    return true;
}

bool FileSecretStore::remove(const std::string& identity) {
    if (identity.empty()) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    json secrets;
    std::string error;
    if (!readSecrets(path_, secrets, error)) {
        setLastError(error);
        return false;
    }
    // Removing a secret that was never stored is not a failure
    if (secrets.erase(identity) == 0) {
        return true;
    }
    if (!writeSecrets(path_, secrets, error)) {
        setLastError(error);
        return false;
    }
    return true;
}
