#include "fake_command_runner.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace {

bool hasArg(const std::vector<std::string>& argv, const std::string& arg) {
    return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

std::string argAfter(const std::vector<std::string>& argv, const std::string& flag) {
    auto it = std::find(argv.begin(), argv.end(), flag);
    if (it == argv.end() || ++it == argv.end()) {
        return "";
    }
    return *it;
}

CommandResult ok(const std::string& out = "") {
    CommandResult result;
    result.stdoutText = out;
    return result;
}

} // namespace

std::optional<CommandResult> FakeCommandRunner::run(const CommandRequest& request) {
    const std::vector<std::string>& argv = request.argv;
    CommandHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back({argv, request.elevation});
        hook = hook_;
    }
    if (request.log) {
        request.log("-> Running: " + redactCommand(argv));
    }
    if (hook) {
        hook(argv);
    }
    if (argv.empty()) {
        return std::nullopt;
    }

    const std::string& program = argv[0];
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failingPrograms_.count(program)) {
            return std::nullopt;
        }
    }

    if (program == "veracrypt") {
        return runEncryptionTool(argv);
    }

    if (program == "rsync") {
        const std::string source = argv.size() > 2 ? argv[2] : "";
        bool fails;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fails = failingSources_.count(source) > 0;
        }
        if (fails) {
            if (request.log) {
                request.log("ERROR executing command: " + redactCommand(argv));
            }
            return std::nullopt;
        }
        const std::string output = ">f+++++++++ notes.txt\ncd+++++++++ sub/\n";
        const std::string kept = filterOutput(output, request.outputFilter);
        if (request.log && !kept.empty()) {
            request.log(kept);
        }
        return ok(output);
    }

    if (program == "test" && argv.size() == 3 && argv[1] == "-d") {
        std::error_code ec;
        if (std::filesystem::is_directory(argv[2], ec)) {
            return ok();
        }
        return std::nullopt;
    }

    if (program == "mkdir" && argv.size() == 3) {
        std::error_code ec;
        std::filesystem::create_directories(argv[2], ec);
        if (ec || !std::filesystem::is_directory(argv[2], ec)) {
            return std::nullopt;
        }
        return ok();
    }

    if (program == "gio") {
        std::string path;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            path = remoteMountPath_;
        }
        if (path.empty()) {
            return std::nullopt;
        }
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        return ec ? std::nullopt : std::optional<CommandResult>(ok());
    }

    // Elevated helpers: the credential travels in request.elevation
    if (program == "-v") {
        return runElevationCheck(request.elevation);
    }
    if (program == "sh" || program == "rm") {
        if (!runElevationCheck(request.elevation)) {
            return std::nullopt;
        }
        return ok();
    }

    return std::nullopt;
}

std::optional<CommandResult> FakeCommandRunner::runEncryptionTool(const std::vector<std::string>& argv) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (hasArg(argv, "--list")) {
        std::string listing;
        int slot = 1;
        for (const auto& entry : mounted_) {
            listing += std::to_string(slot) + ": " + entry.first + " /dev/mapper/veracrypt" +
                       std::to_string(slot) + " " + entry.second + "\n";
            ++slot;
        }
        if (mounted_.empty()) {
            // The real tool fails when nothing is mounted
            return std::nullopt;
        }
        return ok(listing);
    }

    if (hasArg(argv, "--mount")) {
        if (mountFails_ || argAfter(argv, "--password") != correctPassword_) {
            return std::nullopt;
        }
        if (!mountInvisible_) {
            mounted_[argAfter(argv, "--mount")] = mountTarget_;
        }
        return ok();
    }

    if (hasArg(argv, "--dismount")) {
        if (dismountFails_) {
            return std::nullopt;
        }
        const std::string target = argAfter(argv, "--dismount");
        for (auto it = mounted_.begin(); it != mounted_.end();) {
            if (it->first == target || it->second == target) {
                it = mounted_.erase(it);
            } else {
                ++it;
            }
        }
        return ok();
    }

    if (hasArg(argv, "--test")) {
        if (argAfter(argv, "--password") == correctPassword_) {
            return ok();
        }
        return std::nullopt;
    }

    return std::nullopt;
}

std::optional<CommandResult> FakeCommandRunner::runElevationCheck(const Elevation& elevation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (elevation && *elevation == correctPassword_) {
        return ok();
    }
    return std::nullopt;
}

bool FakeCommandRunner::toolExists(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return missingTools_.count(tool) == 0;
}

void FakeCommandRunner::removeTool(const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex_);
    missingTools_.insert(tool);
}

void FakeCommandRunner::setMounted(const std::string& container, const std::string& mountPoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    mounted_[container] = mountPoint;
}

void FakeCommandRunner::setMountTarget(const std::string& mountPoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    mountTarget_ = mountPoint;
}

void FakeCommandRunner::setMountFails(bool fails) {
    std::lock_guard<std::mutex> lock(mutex_);
    mountFails_ = fails;
}

void FakeCommandRunner::setMountInvisible(bool invisible) {
    std::lock_guard<std::mutex> lock(mutex_);
    mountInvisible_ = invisible;
}

void FakeCommandRunner::setDismountFails(bool fails) {
    std::lock_guard<std::mutex> lock(mutex_);
    dismountFails_ = fails;
}

void FakeCommandRunner::setCorrectPassword(const std::string& password) {
    std::lock_guard<std::mutex> lock(mutex_);
    correctPassword_ = password;
}

void FakeCommandRunner::failSource(const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    failingSources_.insert(source);
}

void FakeCommandRunner::failProgram(const std::string& program) {
    std::lock_guard<std::mutex> lock(mutex_);
    failingPrograms_.insert(program);
}

void FakeCommandRunner::setRemoteMountCreates(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    remoteMountPath_ = path;
}

void FakeCommandRunner::setHook(CommandHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
}

std::vector<FakeCommandRunner::Call> FakeCommandRunner::calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

int FakeCommandRunner::countCalls(const std::string& program, const std::string& arg) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int count = 0;
    for (const auto& call : calls_) {
        if (!call.argv.empty() && call.argv[0] == program && (arg.empty() || hasArg(call.argv, arg))) {
            ++count;
        }
    }
    return count;
}

bool FakeCommandRunner::isMounted(const std::string& container) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mounted_.count(container) > 0;
}

std::optional<std::string> MemorySecretStore::get(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = secrets_.find(identity);
    if (it == secrets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemorySecretStore::set(const std::string& identity, const std::string& secret) {
    std::lock_guard<std::mutex> lock(mutex_);
    secrets_[identity] = secret;
    return true;
}

bool MemorySecretStore::remove(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    secrets_.erase(identity);
    return true;
}
