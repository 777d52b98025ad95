#include "catalog.hpp"
#include "utils.hpp"
#include <algorithm>

namespace {

std::vector<CatalogEntry> sortedByPath(std::vector<CatalogEntry> entries) {
    std::ranges::sort(entries, {}, &CatalogEntry::relativePath);
    return entries;
}

} // namespace

const char* entryTypeName(EntryType type) {
    return type == EntryType::Directory ? "directory" : "file";
}

std::string CatalogEntry::modificationTimeString() const {
    return modificationTime ? formatLocalTime(*modificationTime) : "unknown";
}

void Catalog::add(CatalogEntry entry) {
    bool isFile = entry.type == EntryType::File;
    std::uint64_t bytes = (isFile && !entry.error) ? entry.sizeBytes : 0;
    if (entry.error) {
        ++totals_.errors;
    }

    if (entry.included) {
        if (isFile) {
            ++totals_.includedFiles;
            totals_.includedBytes += bytes;
        } else {
            ++totals_.includedDirectories;
        }
        includedEntries.push_back(std::move(entry));
    } else {
        if (isFile) {
            ++totals_.excludedFiles;
            totals_.excludedBytes += bytes;
        } else {
            ++totals_.excludedDirectories;
        }
        excludedEntries.push_back(std::move(entry));
    }
}

std::vector<CatalogEntry> Catalog::sortedIncluded() const {
    return sortedByPath(includedEntries);
}

std::vector<CatalogEntry> Catalog::sortedExcluded() const {
    return sortedByPath(excludedEntries);
}

std::map<std::string, PatternStatistics> Catalog::exclusionsByPattern() const {
    std::map<std::string, PatternStatistics> stats;
    for (const auto& entry : excludedEntries) {
        auto& pattern = stats[entry.matchedPattern.value_or("")];
        ++pattern.count;
        if (!entry.error) {
            pattern.bytes += entry.sizeBytes;
        }
    }
    return stats;
}
