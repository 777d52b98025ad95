/**
 * @file catalog_builder.hpp
 * @brief Serializes a catalog into the backup manifests.
 *
 * Two manifests are produced from the same catalog: backup_manifest.json for tools and
 * backup_files_list.txt for people. Both list entries sorted by path.
 *
 * @note Requires jsoncpp.
 */

#ifndef CATALOG_BUILDER_HPP
#define CATALOG_BUILDER_HPP

#include <string>
#include <vector>
#include <expected>
#include <json/json.h>
#include "catalog.hpp"

/**
 * @brief Run information recorded in the manifest header.
 */
struct ManifestInfo {
    std::string timestamp;                      ///< Creation time, "YYYY-MM-DD HH:MM:SS".
    std::string siteRoot;                       ///< Root of the archived tree.
    std::vector<std::string> excludePatterns;   ///< Patterns in evaluation order.
    std::string version;                        ///< Backup format version.
};

/**
 * @brief Machine and human renditions of one catalog.
 */
struct Manifest {
    Json::Value machine;    ///< Content of backup_manifest.json.
    std::string human;      ///< Content of backup_files_list.txt.
};

/**
 * @brief Builds and writes backup manifests.
 */
class CatalogBuilder {
public:
    static constexpr const char* kJsonManifestName = "backup_manifest.json";
    static constexpr const char* kTextManifestName = "backup_files_list.txt";

    /**
     * @brief Builds both manifests.
     *
     * @param catalog Classified inventory.
     * @param info Header information.
     * @return Manifest The JSON document and the text report.
     */
    static Manifest build(const Catalog& catalog, const ManifestInfo& info);

    /**
     * @brief Converts one entry to its JSON manifest form.
     *
     * Included entries carry "mtime", excluded entries carry "excluded_by_pattern".
     */
    static Json::Value entryToJson(const CatalogEntry& entry);

    /**
     * @brief Writes both manifests into a directory.
     *
     * @param manifest Manifest to write.
     * @param directory Target directory.
     * @return std::expected<void, std::string> Success or an error message.
     */
    static std::expected<void, std::string> write(const Manifest& manifest, const std::string& directory);
};

#endif // CATALOG_BUILDER_HPP
