#pragma once

#include "common/command_runner.hpp"
#include "vault/secret_store.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Scripted stand-in for the external tools. The encryption tool keeps an
// in-memory table of mounted containers; `test`, `mkdir` and `rm` act on the
// real filesystem so remote paths can live in a temporary directory.
class FakeCommandRunner : public CommandRunner {
public:
    struct Call {
        std::vector<std::string> argv;
        Elevation elevation;
    };

    using CommandHook = std::function<void(const std::vector<std::string>&)>;

    using CommandRunner::run;

    std::optional<CommandResult> run(const CommandRequest& request) override;
    bool toolExists(const std::string& tool) const override;

    void removeTool(const std::string& tool);
    void setMounted(const std::string& container, const std::string& mountPoint);
    void setMountTarget(const std::string& mountPoint);
    void setMountFails(bool fails);
    void setMountInvisible(bool invisible);
    void setDismountFails(bool fails);
    void setCorrectPassword(const std::string& password);
    void failSource(const std::string& source);
    void failProgram(const std::string& program);
    void setRemoteMountCreates(const std::string& path);
    void setHook(CommandHook hook);

    std::vector<Call> calls() const;
    int countCalls(const std::string& program, const std::string& arg = "") const;
    bool isMounted(const std::string& container) const;

private:
    std::optional<CommandResult> runEncryptionTool(const std::vector<std::string>& argv);
    std::optional<CommandResult> runElevationCheck(const Elevation& elevation);

    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    std::set<std::string> missingTools_;
    std::map<std::string, std::string> mounted_;
    std::string mountTarget_;
    bool mountFails_{false};
    bool mountInvisible_{false};
    bool dismountFails_{false};
    std::string correctPassword_{"secret"};
    std::set<std::string> failingSources_;
    std::set<std::string> failingPrograms_;
    std::string remoteMountPath_;
    CommandHook hook_;
};

class MemorySecretStore : public SecretStore {
public:
    std::optional<std::string> get(const std::string& identity) override;
    bool set(const std::string& identity, const std::string& secret) override;
    bool remove(const std::string& identity) override;

private:
    std::mutex mutex_;
    std::map<std::string, std::string> secrets_;
};
