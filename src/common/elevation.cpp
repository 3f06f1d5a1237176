#include "common/elevation.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <system_error>

ElevationHelper::ElevationHelper(std::shared_ptr<CommandRunner> runner, const std::string& rulePath)
    : runner_(std::move(runner))
    , rulePath_(rulePath) {
}

bool ElevationHelper::isPasswordRequired() const {
    std::error_code ec;
    return !std::filesystem::exists(rulePath_, ec);
}

bool ElevationHelper::verifyPassword(const std::string& password) const {
    if (password.empty()) {
        return false;
    }
    return runner_->run({"-v"}, password).has_value();
}

bool ElevationHelper::installNoPasswordRule(const std::string& password, const std::string& toolPath) const {
    if (password.empty()) {
        return false;
    }

    const std::string rule = "%sudo ALL=(root) NOPASSWD: " + toolPath;
    const std::string script = "printf '%s\\n' '" + rule + "' > '" + rulePath_ + "' && chmod 0440 '" + rulePath_ + "'";
    const LogCallback log = [](const std::string& line) { Logger::info(line); };

    if (!runner_->run({"sh", "-c", script}, password, log)) {
        Logger::error("Could not create " + rulePath_ + ". The password may have been rejected.");
        return false;
    }
    Logger::info("Passwordless rule for " + toolPath + " has been created.");
    return true;
}

bool ElevationHelper::removeNoPasswordRule(const std::string& password) const {
    if (password.empty()) {
        return false;
    }

    const LogCallback log = [](const std::string& line) { Logger::info(line); };
    if (!runner_->run({"rm", "-f", rulePath_}, password, log)) {
        Logger::error("Could not remove " + rulePath_ + ". The password may have been rejected.");
        return false;
    }
    Logger::info("Passwordless rule has been removed.");
    return true;
}

Elevation ElevationHelper::elevationFor(const std::string& password) const {
    if (!isPasswordRequired()) {
        return std::string();
    }
    return password;
}
