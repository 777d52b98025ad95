#include "backup_api.hpp"
#include "utils.hpp"
#include <iostream>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] [--s3-only-file-transfer <file>] [--version]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile = "backup_config.json";
    std::string transferFile;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--s3-only-file-transfer" && i + 1 < argc) {
            transferFile = argv[++i];
        } else if (arg == "--version") {
            std::cout << "SiteVault " << kSiteVaultVersion << std::endl;
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!transferFile.empty()) {
        auto result = BackupAPI::uploadFile(configFile, transferFile);
        if (!result) {
            std::cerr << "Error: " << result.error() << std::endl;
            return 1;
        }
        std::cout << "File uploaded successfully." << std::endl;
        return 0;
    }

    auto result = BackupAPI::startBackup(configFile);
    if (!result) {
        std::cerr << "Error: " << result.error() << std::endl;
        return 1;
    }
    std::cout << "Backup completed successfully: " << *result << std::endl;
    return 0;
}
