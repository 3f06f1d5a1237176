#include "common/command_runner.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

const char* const kPasswordFlag = "--password";
const char* const kMask = "'********'";
const char* const kElevationTool = "sudo";

class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) != 0) {
            fds_[0] = fds_[1] = -1;
        }
    }
    ~Pipe() {
        closeRead();
        closeWrite();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool valid() const { return fds_[0] >= 0 && fds_[1] >= 0; }
    int readEnd() const { return fds_[0]; }
    int writeEnd() const { return fds_[1]; }
    void closeRead() { closeFd(fds_[0]); }
    void closeWrite() { closeFd(fds_[1]); }

private:
    static void closeFd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    int fds_[2]{-1, -1};
};

void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

bool writeAll(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

int waitForChild(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

std::optional<CommandResult> CommandRunner::run(const std::vector<std::string>& argv,
                                                const Elevation& elevation,
                                                const LogCallback& log,
                                                const OutputFilter& filter) {
    CommandRequest request;
    request.argv = argv;
    request.elevation = elevation;
    request.log = log;
    request.outputFilter = filter;
    return run(request);
}

std::vector<std::string> buildElevatedCommand(const std::vector<std::string>& argv,
                                              const Elevation& elevation) {
    if (!elevation) {
        return argv;
    }

    std::vector<std::string> full;
    full.reserve(argv.size() + 3);
    full.push_back(kElevationTool);
    if (elevation->empty()) {
        // Pre-authorized rule: fail instead of prompting
        full.push_back("-n");
    } else {
        full.push_back("-S");
        full.push_back("-p");
        full.push_back("");
    }
    full.insert(full.end(), argv.begin(), argv.end());
    return full;
}

std::string redactCommand(const std::vector<std::string>& argv) {
    std::string out;
    bool maskNext = false;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        if (maskNext) {
            out += kMask;
            maskNext = false;
            continue;
        }
        out += arg.empty() ? "''" : arg;
        if (arg == kPasswordFlag) {
            maskNext = true;
        }
    }
    return out;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string filterOutput(const std::string& output, const OutputFilter& filter) {
    const std::string trimmed = trim(output);
    if (!filter) {
        return trimmed;
    }

    std::istringstream stream(trimmed);
    std::string line;
    std::string kept;
    while (std::getline(stream, line)) {
        if (line.empty()) {
            continue;
        }
        std::optional<std::string> processed = filter(line);
        if (processed && !processed->empty()) {
            if (!kept.empty()) {
                kept += '\n';
            }
            kept += *processed;
        }
    }
    return kept;
}

std::optional<CommandResult> ProcessCommandRunner::run(const CommandRequest& request) {
    const auto log = [&request](const std::string& message) {
        if (request.log) {
            request.log(message);
        }
    };

    if (request.argv.empty()) {
        log("ERROR: Refusing to run an empty command.");
        return std::nullopt;
    }

    ignoreSigpipe();

    const std::vector<std::string> command = buildElevatedCommand(request.argv, request.elevation);
    const std::string safeCommand = redactCommand(command);
    log("-> Running: " + safeCommand);

    Pipe in, out, err, execStatus;
    if (!in.valid() || !out.valid() || !err.valid() || !execStatus.valid()) {
        log("ERROR: Could not create pipes for: " + safeCommand + ": " + std::strerror(errno));
        return std::nullopt;
    }

    // Built before fork: the child may only make async-signal-safe calls
    std::vector<char*> cargv;
    cargv.reserve(command.size() + 1);
    for (const auto& arg : command) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        log("ERROR: Command not found or failed to execute: " + safeCommand + ": " + std::strerror(errno));
        return std::nullopt;
    }

    if (pid == 0) {
        dup2(in.readEnd(), STDIN_FILENO);
        dup2(out.writeEnd(), STDOUT_FILENO);
        dup2(err.writeEnd(), STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        int code = errno;
        ssize_t ignored = ::write(execStatus.writeEnd(), &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }

    in.closeRead();
    out.closeWrite();
    err.closeWrite();
    execStatus.closeWrite();

    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(execStatus.readEnd(), &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        waitForChild(pid);
        log("ERROR: Command not found or failed to execute: " + safeCommand + ": " + std::strerror(execErrno));
        return std::nullopt;
    }

    if (request.elevation && !request.elevation->empty()) {
        if (!writeAll(in.writeEnd(), *request.elevation + "\n")) {
            log("Warning: could not pass the credential to: " + safeCommand);
        }
    }
    in.closeWrite();

    CommandResult result;
    const auto deadline = request.timeout
        ? std::optional<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now() + *request.timeout)
        : std::nullopt;

    pollfd fds[2] = {{out.readEnd(), POLLIN, 0}, {err.readEnd(), POLLIN, 0}};
    std::string* sinks[2] = {&result.stdoutText, &result.stderrText};
    int openStreams = 2;
    bool timedOut = false;
    char buffer[8192];

    while (openStreams > 0) {
        int waitMs = -1;
        if (deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                timedOut = true;
                break;
            }
            waitMs = static_cast<int>(std::min<long long>(left.count(), 1000));
        }

        int ready = poll(fds, 2, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t got = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (got > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --openStreams;
            }
        }
    }

    if (timedOut) {
        kill(pid, SIGKILL);
        waitForChild(pid);
        log("ERROR: Command timed out after " + std::to_string(request.timeout->count()) + "ms: " + safeCommand);
        return std::nullopt;
    }

    result.exitCode = waitForChild(pid);

    if (result.exitCode != 0) {
        log("ERROR executing command: " + safeCommand + "\n"
            "Return code: " + std::to_string(result.exitCode) + "\n"
            "Output:\n" + trim(result.stdoutText) + "\n"
            "Error Output:\n" + trim(result.stderrText));
        return std::nullopt;
    }

    if (!result.stdoutText.empty()) {
        const std::string toLog = filterOutput(result.stdoutText, request.outputFilter);
        if (!toLog.empty()) {
            log(toLog);
        }
    }

    // Some tools print their summary on stderr even when they succeed
    if (!trim(result.stderrText).empty()) {
        log("Info (stderr):\n" + trim(result.stderrText));
    }

    return result;
}

bool ProcessCommandRunner::toolExists(const std::string& tool) const {
    if (tool.empty()) {
        return false;
    }
    if (tool.find('/') != std::string::npos) {
        return access(tool.c_str(), X_OK) == 0;
    }

    const char* path = std::getenv("PATH");
    if (!path) {
        return false;
    }

    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        const std::string candidate = dir + "/" + tool;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}
