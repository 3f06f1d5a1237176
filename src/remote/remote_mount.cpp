#include "remote/remote_mount.hpp"
#include <sstream>

namespace {

const char* const kGvfsMarker = "/gvfs/";
const char* const kMountHelper = "gio";

} // namespace

std::string RemoteAccount::email() const {
    if (user.find('@') != std::string::npos) {
        return user;
    }
    return user + "@" + host;
}

std::string RemoteAccount::mountUri() const {
    return scheme + "://" + email() + "/";
}

std::optional<RemoteAccount> parseRemoteAccount(const std::string& remotePath) {
    const auto marker = remotePath.find(kGvfsMarker);
    if (marker == std::string::npos) {
        return std::nullopt;
    }

    // "google-drive:host=gmail.com,user=jane" up to the next '/'
    const auto segmentStart = marker + std::string(kGvfsMarker).size();
    const auto segmentEnd = remotePath.find('/', segmentStart);
    const std::string segment = remotePath.substr(segmentStart, segmentEnd == std::string::npos
                                                                     ? std::string::npos
                                                                     : segmentEnd - segmentStart);

    const auto colon = segment.find(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }

    RemoteAccount account;
    account.scheme = segment.substr(0, colon);

    std::istringstream params(segment.substr(colon + 1));
    std::string param;
    while (std::getline(params, param, ',')) {
        const auto eq = param.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key = param.substr(0, eq);
        const std::string value = param.substr(eq + 1);
        if (key == "user") {
            account.user = value;
        } else if (key == "host") {
            account.host = value;
        }
    }

    if (account.user.empty() || account.host.empty()) {
        return std::nullopt;
    }
    return account;
}

RemoteMounter::RemoteMounter(std::shared_ptr<CommandRunner> runner, std::chrono::milliseconds timeout)
    : runner_(std::move(runner))
    , timeout_(timeout) {
}

bool RemoteMounter::mount(const std::string& remotePath, const LogCallback& log) const {
    auto account = parseRemoteAccount(remotePath);
    if (!account) {
        if (log) {
            log("Could not extract account info from remote path, skipping auto-mount: " + remotePath);
        }
        return false;
    }

    if (log) {
        log("Attempting to mount remote storage for " + account->email() + "...");
    }

    CommandRequest request;
    request.argv = {kMountHelper, "mount", account->mountUri()};
    request.log = log;
    request.timeout = timeout_;

    if (!runner_->run(request)) {
        if (log) {
            log("Remote mount failed for " + account->mountUri());
        }
        return false;
    }

    if (log) {
        log("Remote mount successful");
    }
    return true;
}
