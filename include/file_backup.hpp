/**
 * @file file_backup.hpp
 * @brief Defines file backup strategies for SiteVault.
 *
 * Provides the interface and the tar.gz implementation for archiving the site tree. Membership is
 * decided by the tree classifier; the strategy only streams the entries it is handed.
 *
 * @note Requires libarchive for tar.gz compression (libarchive-dev on Debian/Ubuntu).
 */

#ifndef FILE_BACKUP_HPP
#define FILE_BACKUP_HPP

#include <vector>
#include <string>
#include <expected>
#include "catalog.hpp"
#include "logger.hpp"
#include "pattern_matcher.hpp"

/**
 * @brief Interface for file backup strategies.
 *
 * Defines the contract for archiving a directory tree while cataloguing it.
 */
class FileBackupStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~FileBackupStrategy() = default;

    /**
     * @brief Executes a file backup.
     *
     * @param sourceDir Root of the tree to back up.
     * @param outputFile Path for the output archive.
     * @return std::expected<Catalog, std::string> Catalog of the walk or an error message.
     */
    virtual std::expected<Catalog, std::string> execute(const std::string& sourceDir,
                                                        const std::string& outputFile) = 0;
};

/**
 * @brief Tar.gz file backup strategy with exclusion patterns.
 *
 * Walks the source tree once. Every included entry is written to the archive as
 * "<basename(sourceDir)>/<relative path>" at the moment it is classified, so the archive and
 * the returned catalog always agree.
 */
class TarGzFileBackupStrategy : public FileBackupStrategy {
public:
    /**
     * @brief Constructs a tar.gz backup strategy.
     *
     * @param rules Exclusion patterns in evaluation order.
     * @param logger Logger for skipped entries and progress.
     */
    TarGzFileBackupStrategy(ExclusionRules rules, const Logger& logger);

    /**
     * @brief Executes a tar.gz file backup.
     *
     * Entries that cannot be read are logged and left out of the archive; they stay in the
     * catalog with their classification.
     *
     * @param sourceDir Root of the tree to back up.
     * @param outputFile Path for the output .tar.gz file.
     * @return std::expected<Catalog, std::string> Catalog of the walk or an error message.
     */
    std::expected<Catalog, std::string> execute(const std::string& sourceDir,
                                                const std::string& outputFile) override;

private:
    ExclusionRules rules;   ///< Exclusion patterns.
    const Logger& logger;   ///< Run logger.
};

/**
 * @brief Archives a list of absolute paths, each stored under its own path.
 *
 * Missing paths are logged and skipped. Directories are archived recursively.
 *
 * @param paths Paths to archive.
 * @param outputFile Path for the output .tar.gz file.
 * @param logger Run logger.
 * @return std::expected<std::size_t, std::string> Number of paths archived, or an error message.
 */
std::expected<std::size_t, std::string> archivePaths(const std::vector<std::string>& paths,
                                                     const std::string& outputFile,
                                                     const Logger& logger);

/**
 * @brief Packs the top-level contents of a directory into one archive.
 *
 * Children are stored under their own names, without the directory prefix.
 *
 * @param directory Directory whose contents are packed.
 * @param outputFile Path for the output .tar.gz file.
 * @return std::expected<void, std::string> Success or an error message.
 */
std::expected<void, std::string> packDirectory(const std::string& directory, const std::string& outputFile);

#endif // FILE_BACKUP_HPP
