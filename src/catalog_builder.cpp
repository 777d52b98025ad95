#include "catalog_builder.hpp"
#include "utils.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <format>

namespace fs = std::filesystem;

namespace {

const std::string kRule(50, '=');
const std::string kSectionRule(50, '-');

std::string statisticsBlock(const char* title, std::size_t files, std::size_t directories, std::uint64_t bytes) {
    return std::format("{}:\n   Files: {}\n   Directories: {}\n   Total size: {}\n\n",
                       title, files, directories, formatHumanSize(bytes));
}

} // namespace

Json::Value CatalogBuilder::entryToJson(const CatalogEntry& entry) {
    Json::Value json;
    json["path"] = entry.relativePath;
    json["size"] = Json::UInt64(entry.sizeBytes);
    json["type"] = entryTypeName(entry.type);
    if (entry.included) {
        json["mtime"] = entry.modificationTimeString();
    } else {
        json["excluded_by_pattern"] = entry.matchedPattern.value_or("");
    }
    if (entry.error) {
        json["error"] = *entry.error;
    }
    return json;
}

Manifest CatalogBuilder::build(const Catalog& catalog, const ManifestInfo& info) {
    const auto& totals = catalog.totals();
    auto included = catalog.sortedIncluded();
    auto excluded = catalog.sortedExcluded();

    Manifest manifest;
    Json::Value& root = manifest.machine;

    Json::Value& backupInfo = root["backup_info"];
    backupInfo["timestamp"] = info.timestamp;
    backupInfo["backup_version"] = info.version;
    backupInfo["bitrix_root"] = info.siteRoot;
    backupInfo["exclude_patterns"] = Json::Value(Json::arrayValue);
    for (const auto& pattern : info.excludePatterns) {
        backupInfo["exclude_patterns"].append(pattern);
    }

    Json::Value& stats = root["statistics"];
    stats["included_files"] = Json::UInt64(totals.includedFiles);
    stats["included_directories"] = Json::UInt64(totals.includedDirectories);
    stats["included_total_size_bytes"] = Json::UInt64(totals.includedBytes);
    stats["included_total_size_human"] = formatHumanSize(totals.includedBytes);
    stats["excluded_files"] = Json::UInt64(totals.excludedFiles);
    stats["excluded_directories"] = Json::UInt64(totals.excludedDirectories);
    stats["excluded_total_size_bytes"] = Json::UInt64(totals.excludedBytes);
    stats["excluded_total_size_human"] = formatHumanSize(totals.excludedBytes);

    root["included_files"] = Json::Value(Json::arrayValue);
    for (const auto& entry : included) {
        root["included_files"].append(entryToJson(entry));
    }
    root["excluded_files"] = Json::Value(Json::arrayValue);
    for (const auto& entry : excluded) {
        root["excluded_files"].append(entryToJson(entry));
    }

    std::string& text = manifest.human;
    text += "SITEVAULT BACKUP FILE MANIFEST\n";
    text += kRule + "\n";
    text += std::format("Created: {}\n", info.timestamp);
    text += std::format("Site root: {}\n\n", info.siteRoot);

    text += "STATISTICS:\n";
    text += std::string(20, '-') + "\n";
    text += statisticsBlock("[+] Included in backup", totals.includedFiles, totals.includedDirectories, totals.includedBytes);
    text += statisticsBlock("[-] Excluded from backup", totals.excludedFiles, totals.excludedDirectories, totals.excludedBytes);

    text += "FILES IN BACKUP (sorted by path):\n";
    text += kSectionRule + "\n";
    for (const auto& entry : included) {
        if (entry.type == EntryType::File) {
            text += std::format("[F] {} ({}) [{}]\n", entry.relativePath,
                                formatHumanSize(entry.sizeBytes), entry.modificationTimeString());
        } else {
            text += std::format("[D] {}/\n", entry.relativePath);
        }
    }

    if (!excluded.empty()) {
        text += "\n\nEXCLUSIONS BY PATTERN (summary):\n";
        text += kSectionRule + "\n";
        for (const auto& [pattern, patternStats] : catalog.exclusionsByPattern()) {
            text += std::format("[x] {}: {} files/directories, {}\n", pattern, patternStats.count,
                                formatHumanSize(patternStats.bytes));
        }
    }
    return manifest;
}

std::expected<void, std::string> CatalogBuilder::write(const Manifest& manifest, const std::string& directory) {
    fs::path jsonPath = fs::path(directory) / kJsonManifestName;
    std::ofstream jsonFile(jsonPath);
    if (!jsonFile) {
        return std::unexpected(std::format("Failed to open manifest file: {}", jsonPath.string()));
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(manifest.machine, &jsonFile);
    jsonFile << '\n';
    if (!jsonFile) {
        return std::unexpected(std::format("Failed to write manifest file: {}", jsonPath.string()));
    }

    fs::path textPath = fs::path(directory) / kTextManifestName;
    std::ofstream textFile(textPath);
    if (!textFile) {
        return std::unexpected(std::format("Failed to open manifest file: {}", textPath.string()));
    }
    textFile << manifest.human;
    if (!textFile) {
        return std::unexpected(std::format("Failed to write manifest file: {}", textPath.string()));
    }
    return {};
}
