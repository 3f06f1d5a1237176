#include "vault/veracrypt.hpp"
#include <filesystem>
#include <sstream>
#include <system_error>

namespace veracrypt {

const char* const kTool = "veracrypt";

std::vector<std::string> mountCommand(const std::string& container, const std::string& password) {
    return {kTool, "--text", "--non-interactive", "--mount", container, "--password", password};
}

std::vector<std::string> dismountCommand(const std::string& target) {
    return {kTool, "--text", "--non-interactive", "--dismount", target};
}

std::vector<std::string> listCommand() {
    return {kTool, "--text", "--list"};
}

std::vector<std::string> testCommand(const std::string& container, const std::string& password) {
    return {kTool, "--text", "--test", "--password", password, "--non-interactive", container};
}

std::optional<std::string> parseMountPoint(const std::string& listing, const std::string& container) {
    if (container.empty()) {
        return std::nullopt;
    }

    std::istringstream lines(listing);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.find(container) == std::string::npos) {
            continue;
        }

        std::istringstream tokens(line);
        std::vector<std::string> parts;
        std::string token;
        while (tokens >> token) {
            parts.push_back(token);
        }
        // "1: /path/container /dev/mapper/veracrypt1 /media/veracrypt1"
        if (parts.size() > 2) {
            std::error_code ec;
            if (std::filesystem::is_directory(parts.back(), ec)) {
                return parts.back();
            }
        }
    }
    return std::nullopt;
}

} // namespace veracrypt

ContainerMountResolver::ContainerMountResolver(std::shared_ptr<CommandRunner> runner)
    : runner_(std::move(runner)) {
}

std::optional<std::string> ContainerMountResolver::resolve(const std::string& containerPath,
                                                           const Elevation& elevation,
                                                           const LogCallback& log) const {
    auto result = runner_->run(veracrypt::listCommand(), elevation, log);
    if (!result) {
        return std::nullopt;
    }
    return veracrypt::parseMountPoint(result->stdoutText, containerPath);
}

veracrypt::CredentialCheck ContainerMountResolver::testCredentials(const std::string& containerPath,
                                                                   const std::string& password) const {
    std::error_code ec;
    if (!std::filesystem::exists(containerPath, ec)) {
        return {false, "The specified container was not found at:\n" + containerPath};
    }

    std::string failure;
    CommandRequest request;
    request.argv = veracrypt::testCommand(containerPath, password);
    request.log = [&failure](const std::string& line) { failure = line; };

    if (runner_->run(request)) {
        return {true, "The password is correct for the specified container."};
    }
    return {false, "Credential test failed.\n\n" + failure};
}
