#include "backup_config.hpp"
#include "logger.hpp"
#include "size_analyzer.hpp"
#include "utils.hpp"
#include <filesystem>
#include <format>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] [--output <report.json>]" << std::endl;
    std::cerr << "       " << program << " --summarize <report.json>" << std::endl;
}

int summarize(const std::string& reportFile) {
    auto report = loadSizeReport(reportFile);
    if (!report) {
        std::cerr << "Error: " << report.error() << std::endl;
        return 1;
    }
    std::cout << summarizeSizeReport(*report);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile = "backup_config.json";
    std::string outputFile;
    std::string summarizeFile;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            outputFile = argv[++i];
        } else if (arg == "--summarize" && i + 1 < argc) {
            summarizeFile = argv[++i];
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!summarizeFile.empty()) {
        return summarize(summarizeFile);
    }

    try {
        BackupConfig config(configFile);
        Logger logger(config.logSettings());

        if (outputFile.empty()) {
            outputFile = (fs::path(config.logDir) /
                          std::format("backup_size_analysis_{}.json", currentTimestamp("%Y%m%d_%H%M%S"))).string();
        }

        logger.info(std::format("Analyzing site size: {}", config.siteRoot));
        logger.info(std::format("Exclusion patterns: {}", config.excludePatterns.size()));

        SizeAnalyzer analyzer{ExclusionRules(config.excludePatterns)};
        auto report = analyzer.analyze(config.siteRoot);
        if (!report) {
            logger.error(report.error());
            return 1;
        }
        logger.info(std::format("Analysis completed in {:.2f} seconds", report->executionSeconds));
        logger.info(std::format("Total: {} files, {}", report->summary.totalFiles, formatHumanSize(report->summary.totalBytes)));
        logger.info(std::format("Included: {} files, {}", report->summary.includedFiles, formatHumanSize(report->summary.includedBytes)));
        logger.info(std::format("Excluded: {} files, {} ({:.2f}%)", report->summary.excludedFiles,
                                formatHumanSize(report->summary.excludedBytes), report->summary.exclusionRatioPercent));

        auto saved = SizeAnalyzer::save(*report, outputFile);
        if (!saved) {
            logger.error(saved.error());
            return 1;
        }
        logger.info(std::format("Report saved: {}", outputFile));

        std::cout << summarizeSizeReport(SizeAnalyzer::toJson(*report));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
