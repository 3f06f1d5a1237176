#pragma once

#include "common/command_runner.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

// Account recovered from a virtual-filesystem path such as
// /run/user/1000/gvfs/google-drive:host=gmail.com,user=jane/Backups
struct RemoteAccount {
    std::string scheme;  // "google-drive"
    std::string user;
    std::string host;

    std::string email() const;
    std::string mountUri() const;  // "google-drive://jane@gmail.com/"
};

// Parses the `scheme:param=value,param=value` segment of `remotePath`.
// Fails when the segment is absent or `user`/`host` are missing; nothing is
// guessed.
std::optional<RemoteAccount> parseRemoteAccount(const std::string& remotePath);

// Asks the desktop's remote-mount helper to mount the account behind a path.
class RemoteMounter {
public:
    RemoteMounter(std::shared_ptr<CommandRunner> runner, std::chrono::milliseconds timeout);

    bool mount(const std::string& remotePath, const LogCallback& log) const;

private:
    std::shared_ptr<CommandRunner> runner_;
    std::chrono::milliseconds timeout_;
};
