/**
 * @file archive_writer.hpp
 * @brief tar.gz archive writing and verification on top of libarchive.
 *
 * @note Requires libarchive. On Debian/Ubuntu install libarchive-dev.
 */

#ifndef ARCHIVE_WRITER_HPP
#define ARCHIVE_WRITER_HPP

#include <string>
#include <vector>
#include <memory>
#include <expected>
#include <filesystem>

namespace fs = std::filesystem;

struct archive;

/**
 * @brief Outcome of adding one filesystem entry.
 */
enum class EntryStatus {
    Added,      ///< Entry written to the archive.
    Skipped     ///< Source could not be read or has an unsupported type (socket, fifo, device).
};

/**
 * @brief Streaming writer for a gzip-compressed tar (pax restricted) archive.
 *
 * The archive is finalized by close() or, failing that, by the destructor.
 */
class TarGzArchiveWriter {
public:
    /**
     * @brief Opens a new archive for writing, creating parent directories.
     *
     * @param outputFile Path of the .tar.gz file.
     * @return std::expected<std::unique_ptr<TarGzArchiveWriter>, std::string> The writer or an error message.
     */
    static std::expected<std::unique_ptr<TarGzArchiveWriter>, std::string> open(const std::string& outputFile);

    ~TarGzArchiveWriter();

    TarGzArchiveWriter(const TarGzArchiveWriter&) = delete;
    TarGzArchiveWriter& operator=(const TarGzArchiveWriter&) = delete;

    /**
     * @brief Adds a single file, directory, or symlink (not its contents).
     *
     * @param source Filesystem path.
     * @param archiveName Name stored in the archive.
     * @return std::expected<EntryStatus, std::string> Whether the entry was written, or an archive write error.
     */
    std::expected<EntryStatus, std::string> addEntry(const fs::path& source, const std::string& archiveName);

    /**
     * @brief Adds a path and, for directories, everything below it.
     *
     * @param source Filesystem path.
     * @param archiveName Name stored in the archive for source.
     * @return std::expected<std::size_t, std::string> Number of entries skipped, or an archive write error.
     */
    std::expected<std::size_t, std::string> addTree(const fs::path& source, const std::string& archiveName);

    /**
     * @brief Flushes and closes the archive.
     */
    std::expected<void, std::string> close();

    std::size_t entryCount() const { return entries; }
    const std::string& path() const { return outputFile; }

private:
    TarGzArchiveWriter(struct archive* handle, std::string outputFile);

    struct archive* handle;     ///< libarchive write handle.
    std::string outputFile;     ///< Output path.
    std::size_t entries = 0;    ///< Entries written so far.
    bool closed = false;        ///< Whether close() already ran.
};

/**
 * @brief Lists the entry names of a tar.gz archive.
 *
 * Reads the whole archive, so it also detects truncated or corrupt files.
 *
 * @param archiveFile Archive path.
 * @return std::expected<std::vector<std::string>, std::string> Entry names in archive order, or an error message.
 */
std::expected<std::vector<std::string>, std::string> readArchiveEntryNames(const std::string& archiveFile);

/**
 * @brief Verifies that a tar.gz archive can be read to the end.
 *
 * @param archiveFile Archive path.
 * @return std::expected<std::size_t, std::string> Number of entries, or an error message.
 */
std::expected<std::size_t, std::string> verifyArchive(const std::string& archiveFile);

#endif // ARCHIVE_WRITER_HPP
