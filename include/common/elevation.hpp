#pragma once

#include "common/command_runner.hpp"
#include <memory>
#include <string>

// Helpers around the pre-authorized rule that lets the encryption tool run
// elevated without a password prompt.
class ElevationHelper {
public:
    ElevationHelper(std::shared_ptr<CommandRunner> runner, const std::string& rulePath);

    // True when no pre-authorized rule is installed.
    bool isPasswordRequired() const;

    // Validates `password` by refreshing the elevation tool's credential cache.
    bool verifyPassword(const std::string& password) const;

    bool installNoPasswordRule(const std::string& password, const std::string& toolPath) const;
    bool removeNoPasswordRule(const std::string& password) const;

    // Elevation to use for a run: none needed when a rule exists.
    Elevation elevationFor(const std::string& password) const;

    const std::string& rulePath() const { return rulePath_; }

private:
    std::shared_ptr<CommandRunner> runner_;
    std::string rulePath_;
};
