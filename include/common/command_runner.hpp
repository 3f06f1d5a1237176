#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

using LogCallback = std::function<void(const std::string&)>;

// Returns the line to keep (possibly rewritten) or std::nullopt to drop it.
using OutputFilter = std::function<std::optional<std::string>(const std::string&)>;

// Elevation credential: empty optional = run as is, empty string = rely on a
// pre-authorized no-prompt rule, anything else is fed to the elevation tool.
using Elevation = std::optional<std::string>;

struct CommandRequest {
    std::vector<std::string> argv;
    Elevation elevation;
    LogCallback log;
    OutputFilter outputFilter;
    std::optional<std::chrono::milliseconds> timeout;
};

struct CommandResult {
    int exitCode{0};
    std::string stdoutText;
    std::string stderrText;
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // std::nullopt on non-zero exit, missing executable or timeout.
    virtual std::optional<CommandResult> run(const CommandRequest& request) = 0;

    // True when `tool` resolves to an executable on PATH.
    virtual bool toolExists(const std::string& tool) const = 0;

    std::optional<CommandResult> run(const std::vector<std::string>& argv,
                                     const Elevation& elevation = std::nullopt,
                                     const LogCallback& log = nullptr,
                                     const OutputFilter& filter = nullptr);
};

// Spawns real processes with fork/exec and captures their output.
class ProcessCommandRunner : public CommandRunner {
public:
    using CommandRunner::run;

    std::optional<CommandResult> run(const CommandRequest& request) override;
    bool toolExists(const std::string& tool) const override;
};

// Prefixes argv with the elevation tool when `elevation` asks for it.
std::vector<std::string> buildElevatedCommand(const std::vector<std::string>& argv,
                                              const Elevation& elevation);

// Joins argv with spaces, masking the token after every "--password".
std::string redactCommand(const std::vector<std::string>& argv);

// Applies `filter` to each non-empty line of `output` and joins the survivors.
std::string filterOutput(const std::string& output, const OutputFilter& filter);

std::string trim(const std::string& text);
