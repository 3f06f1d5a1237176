#include "backup/backup_cli.hpp"
#include "common/command_runner.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    BackupCLI::installSignalHandlers();

    try {
        BackupCLI cli(std::make_shared<ProcessCommandRunner>(), std::cin, std::cout, std::cerr);
        const int rc = cli.run(argc, argv);
        Logger::shutdown();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}
