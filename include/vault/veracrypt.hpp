#pragma once

#include "common/command_runner.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace veracrypt {

extern const char* const kTool;

std::vector<std::string> mountCommand(const std::string& container, const std::string& password);
std::vector<std::string> dismountCommand(const std::string& target);
std::vector<std::string> listCommand();
std::vector<std::string> testCommand(const std::string& container, const std::string& password);

// Last whitespace-separated token of the first `--list` line mentioning
// `container`, accepted only if that token is an existing directory.
std::optional<std::string> parseMountPoint(const std::string& listing, const std::string& container);

struct CredentialCheck {
    bool ok{false};
    std::string message;
};

} // namespace veracrypt

// Asks the encryption tool where a container is mounted. A failing list
// command and a listing without the container both yield std::nullopt.
class ContainerMountResolver {
public:
    explicit ContainerMountResolver(std::shared_ptr<CommandRunner> runner);

    std::optional<std::string> resolve(const std::string& containerPath,
                                       const Elevation& elevation,
                                       const LogCallback& log = nullptr) const;

    // Runs the tool's credential-test mode against `containerPath`.
    veracrypt::CredentialCheck testCredentials(const std::string& containerPath,
                                               const std::string& password) const;

private:
    std::shared_ptr<CommandRunner> runner_;
};
