/**
 * @file catalog.hpp
 * @brief Classified inventory of one backup tree walk.
 *
 * Every entry visited under the site root lands in exactly one of the included or excluded
 * lists. Totals are accumulated as entries are added, so a summary is available without a
 * second pass.
 */

#ifndef CATALOG_HPP
#define CATALOG_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstdint>

/**
 * @brief Kind of a catalogued filesystem entry.
 */
enum class EntryType {
    File,
    Directory
};

/**
 * @brief Returns "file" or "directory".
 */
const char* entryTypeName(EntryType type);

/**
 * @brief One filesystem entry and its classification.
 */
struct CatalogEntry {
    std::string relativePath;                   ///< Path relative to the site root.
    std::uint64_t sizeBytes = 0;                ///< File size; 0 for directories.
    EntryType type = EntryType::File;           ///< File or directory.
    std::optional<std::chrono::system_clock::time_point> modificationTime; ///< Last write time, if readable.
    bool included = true;                       ///< Whether the entry goes into the backup.
    std::optional<std::string> matchedPattern;  ///< Pattern that excluded the entry.
    std::optional<std::string> error;           ///< Filesystem error met while reading the entry.

    /**
     * @brief Modification time as "YYYY-MM-DD HH:MM:SS", or "unknown".
     */
    std::string modificationTimeString() const;

    bool operator==(const CatalogEntry&) const = default;
};

/**
 * @brief Running totals of a catalog.
 *
 * Sizes only count regular files; entries carrying an error contribute no bytes.
 */
struct CatalogTotals {
    std::size_t includedFiles = 0;
    std::size_t includedDirectories = 0;
    std::uint64_t includedBytes = 0;
    std::size_t excludedFiles = 0;
    std::size_t excludedDirectories = 0;
    std::uint64_t excludedBytes = 0;
    std::size_t errors = 0;

    std::size_t includedCount() const { return includedFiles + includedDirectories; }
    std::size_t excludedCount() const { return excludedFiles + excludedDirectories; }
    std::size_t visitedCount() const { return includedCount() + excludedCount(); }

    bool operator==(const CatalogTotals&) const = default;
};

/**
 * @brief Exclusion count and size attributed to one pattern.
 */
struct PatternStatistics {
    std::size_t count = 0;
    std::uint64_t bytes = 0;

    bool operator==(const PatternStatistics&) const = default;
};

/**
 * @brief Included and excluded entries of one tree walk.
 */
class Catalog {
public:
    /**
     * @brief Records an entry in the list matching its classification and updates the totals.
     */
    void add(CatalogEntry entry);

    /**
     * @brief Included entries in insertion (traversal) order.
     */
    const std::vector<CatalogEntry>& included() const { return includedEntries; }

    /**
     * @brief Excluded entries in insertion (traversal) order.
     */
    const std::vector<CatalogEntry>& excluded() const { return excludedEntries; }

    /**
     * @brief Included entries sorted by relative path.
     */
    std::vector<CatalogEntry> sortedIncluded() const;

    /**
     * @brief Excluded entries sorted by relative path.
     */
    std::vector<CatalogEntry> sortedExcluded() const;

    const CatalogTotals& totals() const { return totals_; }

    /**
     * @brief Exclusion statistics keyed (and therefore sorted) by pattern.
     */
    std::map<std::string, PatternStatistics> exclusionsByPattern() const;

private:
    std::vector<CatalogEntry> includedEntries;
    std::vector<CatalogEntry> excludedEntries;
    CatalogTotals totals_;
};

#endif // CATALOG_HPP
