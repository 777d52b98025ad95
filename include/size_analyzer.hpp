/**
 * @file size_analyzer.hpp
 * @brief Offline size breakdown of the site tree under the backup exclusion rules.
 *
 * The analyzer answers "how big would the backup be, and where does the excluded space go"
 * without writing an archive. Its JSON report can later be condensed by the summarizer
 * functions declared here.
 *
 * @note Requires jsoncpp.
 */

#ifndef SIZE_ANALYZER_HPP
#define SIZE_ANALYZER_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <cstdint>
#include <json/json.h>
#include "pattern_matcher.hpp"

/**
 * @brief Size and classification of one regular file.
 */
struct FileReport {
    std::string name;                               ///< File name.
    std::string relativePath;                       ///< Path relative to the analyzed root.
    std::uint64_t sizeBytes = 0;                    ///< Size in bytes.
    bool included = true;                           ///< Whether the file would be backed up.
    std::optional<std::string> excludedByPattern;   ///< Pattern that excluded the file.
    std::optional<std::string> error;               ///< Error met while reading the size.
};

/**
 * @brief Aggregated sizes of a directory and everything below it.
 */
struct DirectoryReport {
    std::string name;                               ///< Directory name.
    std::string fullPath;                           ///< Absolute path.
    std::string relativePath;                       ///< Path relative to the analyzed root ("." for the root).
    std::uint64_t totalBytes = 0;
    std::uint64_t includedBytes = 0;
    std::uint64_t excludedBytes = 0;
    std::size_t filesCount = 0;
    std::size_t includedFilesCount = 0;
    std::size_t excludedFilesCount = 0;
    std::vector<DirectoryReport> subdirectories;    ///< Subdirectories in name order.
    std::vector<FileReport> files;                  ///< Files in name order.
    std::optional<std::string> error;               ///< Set when the directory could not be listed.
};

/**
 * @brief Run totals.
 */
struct SizeSummary {
    std::size_t totalFiles = 0;
    std::uint64_t totalBytes = 0;
    std::size_t includedFiles = 0;
    std::uint64_t includedBytes = 0;
    std::size_t excludedFiles = 0;
    std::uint64_t excludedBytes = 0;
    double exclusionRatioPercent = 0.0;             ///< Excluded share of the total size, rounded to 2 decimals.
};

/**
 * @brief Complete analysis result.
 */
struct SizeReport {
    std::string timestamp;                          ///< Start time, "YYYY-MM-DD HH:MM:SS".
    double executionSeconds = 0.0;                  ///< Wall time of the analysis.
    std::string siteRoot;                           ///< Analyzed root.
    std::vector<std::string> excludePatterns;       ///< Patterns in evaluation order.
    SizeSummary summary;
    DirectoryReport root;
};

/**
 * @brief Computes the size breakdown of a tree.
 *
 * Only regular files are classified. Directories are always descended, whatever the patterns
 * say, so excluded space is attributed file by file. Symlinks are not followed.
 */
class SizeAnalyzer {
public:
    /**
     * @brief Constructs an analyzer.
     *
     * @param rules Exclusion patterns in evaluation order.
     */
    explicit SizeAnalyzer(ExclusionRules rules);

    /**
     * @brief Analyzes a tree.
     *
     * @param root Directory to analyze.
     * @return std::expected<SizeReport, std::string> The report, or an error if root is not a directory.
     */
    std::expected<SizeReport, std::string> analyze(const std::string& root) const;

    /**
     * @brief Converts a report to its JSON form (analysis_info, summary, directory_structure).
     */
    static Json::Value toJson(const SizeReport& report);

    /**
     * @brief Writes a report as indented JSON.
     */
    static std::expected<void, std::string> save(const SizeReport& report, const std::string& outputFile);

private:
    DirectoryReport analyzeDirectory(const std::string& directory, const std::string& base, SizeSummary& summary) const;

    ExclusionRules rules; ///< Exclusion patterns.
};

/**
 * @brief Included and total size of one directory of a saved report.
 */
struct DirectorySize {
    std::string path;
    std::uint64_t includedBytes = 0;
    std::uint64_t totalBytes = 0;
};

/**
 * @brief One file of a saved report.
 */
struct LargeFile {
    std::string path;
    std::string name;
    std::uint64_t sizeBytes = 0;
    bool included = true;
};

/**
 * @brief Exclusions attributed to one pattern in a saved report.
 */
struct PatternSize {
    std::string pattern;
    std::size_t count = 0;
    std::uint64_t bytes = 0;
};

/**
 * @brief Loads a saved report.
 */
std::expected<Json::Value, std::string> loadSizeReport(const std::string& reportFile);

/**
 * @brief Directories below the root, largest included size first.
 *
 * @param structure The report's "directory_structure" object.
 * @param limit Maximum number of directories returned.
 */
std::vector<DirectorySize> largestDirectories(const Json::Value& structure, std::size_t limit);

/**
 * @brief Files of the whole tree, largest first.
 *
 * @param structure The report's "directory_structure" object.
 * @param limit Maximum number of files returned.
 */
std::vector<LargeFile> largestFiles(const Json::Value& structure, std::size_t limit);

/**
 * @brief Excluded files grouped by pattern, largest total size first.
 */
std::vector<PatternSize> exclusionsByPattern(const Json::Value& structure);

/**
 * @brief Renders the summary printed by "sitevault-analyze --summarize".
 *
 * Contains the overall statistics, the 20 largest directories by included size, the 15 largest
 * files and the per-pattern exclusion statistics.
 */
std::string summarizeSizeReport(const Json::Value& report);

#endif // SIZE_ANALYZER_HPP
