/**
 * @file database_backup.hpp
 * @brief Defines database backup strategies for SiteVault.
 *
 * Provides the interface for dumping the site database and the MySQL implementation.
 *
 * @note Requires the mysqldump client in the system PATH and zlib for compression.
 */

#ifndef DATABASE_BACKUP_HPP
#define DATABASE_BACKUP_HPP

#include <string>
#include <expected>

/**
 * @brief Interface for database backup strategies.
 */
class DatabaseBackupStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~DatabaseBackupStrategy() = default;

    /**
     * @brief Executes a database backup.
     *
     * Creates a compressed dump inside the given directory.
     *
     * @param outputDir Directory receiving the dump.
     * @return std::expected<std::string, std::string> Path to the backup file or an error message.
     */
    virtual std::expected<std::string, std::string> execute(const std::string& outputDir) = 0;
};

/**
 * @brief MySQL database backup strategy using mysqldump.
 *
 * Dumps one database with a consistent snapshot (--single-transaction) including routines and
 * triggers, and compresses the output to database_<name>.sql.gz.
 */
class MySQLBackupStrategy : public DatabaseBackupStrategy {
public:
    /**
     * @brief Constructs a MySQL backup strategy.
     *
     * @param dbName Database to dump.
     * @param defaultsFile mysqldump option file holding the credentials (e.g., /root/.my.cnf).
     * @param mysqldump mysqldump executable.
     */
    MySQLBackupStrategy(const std::string& dbName, const std::string& defaultsFile,
                        const std::string& mysqldump = "mysqldump");

    /**
     * @brief Executes a MySQL backup.
     *
     * @param outputDir Directory receiving database_<name>.sql.gz.
     * @return std::expected<std::string, std::string> Path to the backup file or an error message
     *         carrying mysqldump's stderr.
     */
    std::expected<std::string, std::string> execute(const std::string& outputDir) override;

    /**
     * @brief Builds the shell command that dumps into a file.
     *
     * @param sqlFile Uncompressed dump destination.
     * @param errFile File receiving mysqldump's stderr.
     */
    std::string dumpCommand(const std::string& sqlFile, const std::string& errFile) const;

private:
    std::string dbName;         ///< Database name.
    std::string defaultsFile;   ///< mysqldump defaults file.
    std::string mysqldump;      ///< mysqldump executable.
};

/**
 * @brief Compresses a file with gzip.
 *
 * @param inputFile Source file.
 * @param outputFile Destination .gz file.
 * @return std::expected<void, std::string> Success or an error message.
 */
std::expected<void, std::string> gzipFile(const std::string& inputFile, const std::string& outputFile);

#endif // DATABASE_BACKUP_HPP
