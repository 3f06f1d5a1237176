#pragma once

#include <mutex>
#include <optional>
#include <string>

// Key/value secret storage keyed by container identity.
class SecretStore {
public:
    virtual ~SecretStore() = default;

    virtual std::optional<std::string> get(const std::string& identity) = 0;
    virtual bool set(const std::string& identity, const std::string& secret) = 0;
    virtual bool remove(const std::string& identity) = 0;

    std::string getLastError() const;

protected:
    void setLastError(const std::string& error);

private:
    mutable std::mutex errorMutex_;
    std::string lastError_;
};

// Secrets kept as a JSON object in a file readable only by its owner.
class FileSecretStore : public SecretStore {
public:
    explicit FileSecretStore(const std::string& path);

    std::optional<std::string> get(const std::string& identity) override;
    bool set(const std::string& identity, const std::string& secret) override;
    bool remove(const std::string& identity) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};
