#include "size_analyzer.hpp"
#include "tree_classifier.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <format>
#include <map>
#include <memory>

namespace fs = std::filesystem;

namespace {

Json::Value fileToJson(const FileReport& file) {
    Json::Value json;
    json["type"] = "file";
    json["name"] = file.name;
    json["relative_path"] = file.relativePath;
    if (file.error) {
        json["error"] = *file.error;
        return json;
    }
    json["size_bytes"] = Json::UInt64(file.sizeBytes);
    json["size_human"] = formatHumanSize(file.sizeBytes);
    json["included"] = file.included;
    json["excluded_by_pattern"] = file.excludedByPattern ? Json::Value(*file.excludedByPattern) : Json::Value();
    return json;
}

Json::Value directoryToJson(const DirectoryReport& directory) {
    Json::Value json;
    json["type"] = "directory";
    json["name"] = directory.name;
    json["full_path"] = directory.fullPath;
    json["relative_path"] = directory.relativePath;
    json["total_size_bytes"] = Json::UInt64(directory.totalBytes);
    json["total_size_human"] = formatHumanSize(directory.totalBytes);
    json["included_size_bytes"] = Json::UInt64(directory.includedBytes);
    json["included_size_human"] = formatHumanSize(directory.includedBytes);
    json["excluded_size_bytes"] = Json::UInt64(directory.excludedBytes);
    json["excluded_size_human"] = formatHumanSize(directory.excludedBytes);
    json["files_count"] = Json::UInt64(directory.filesCount);
    json["included_files_count"] = Json::UInt64(directory.includedFilesCount);
    json["excluded_files_count"] = Json::UInt64(directory.excludedFilesCount);
    json["subdirectories"] = Json::Value(Json::objectValue);
    for (const auto& subdirectory : directory.subdirectories) {
        json["subdirectories"][subdirectory.name] = directoryToJson(subdirectory);
    }
    json["files"] = Json::Value(Json::arrayValue);
    for (const auto& file : directory.files) {
        json["files"].append(fileToJson(file));
    }
    if (directory.error) {
        json["error"] = *directory.error;
    }
    return json;
}

std::string joinPath(const std::string& path, const std::string& name) {
    return path.empty() ? name : std::format("{}/{}", path, name);
}

void collectDirectories(const Json::Value& directory, const std::string& path, std::vector<DirectorySize>& out) {
    if (!path.empty()) {
        out.push_back({path, directory["included_size_bytes"].asUInt64(), directory["total_size_bytes"].asUInt64()});
    }
    const Json::Value& subdirectories = directory["subdirectories"];
    for (const auto& name : subdirectories.getMemberNames()) {
        collectDirectories(subdirectories[name], joinPath(path, name), out);
    }
}

void collectFiles(const Json::Value& directory, const std::string& path, std::vector<LargeFile>& out) {
    for (const auto& file : directory["files"]) {
        if (file["type"].asString() == "file" && file.isMember("size_bytes")) {
            std::string name = file["name"].asString();
            out.push_back({joinPath(path, name), name, file["size_bytes"].asUInt64(), file.get("included", true).asBool()});
        }
    }
    const Json::Value& subdirectories = directory["subdirectories"];
    for (const auto& name : subdirectories.getMemberNames()) {
        collectFiles(subdirectories[name], joinPath(path, name), out);
    }
}

void collectExclusions(const Json::Value& directory, std::map<std::string, PatternSize>& out) {
    for (const auto& file : directory["files"]) {
        if (!file.get("included", true).asBool() && file["excluded_by_pattern"].isString()) {
            std::string pattern = file["excluded_by_pattern"].asString();
            auto& stats = out[pattern];
            stats.pattern = pattern;
            ++stats.count;
            stats.bytes += file.get("size_bytes", 0).asUInt64();
        }
    }
    const Json::Value& subdirectories = directory["subdirectories"];
    for (const auto& name : subdirectories.getMemberNames()) {
        collectExclusions(subdirectories[name], out);
    }
}

} // namespace

SizeAnalyzer::SizeAnalyzer(ExclusionRules rules) : rules(std::move(rules)) {}

std::expected<SizeReport, std::string> SizeAnalyzer::analyze(const std::string& root) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return std::unexpected(std::format("Not a directory: {}", root));
    }

    SizeReport report;
    report.timestamp = currentTimestamp();
    report.siteRoot = root;
    report.excludePatterns = rules.patterns();

    auto start = std::chrono::steady_clock::now();
    report.root = analyzeDirectory(root, root, report.summary);
    report.executionSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    auto& summary = report.summary;
    summary.includedFiles = summary.totalFiles - summary.excludedFiles;
    summary.includedBytes = summary.totalBytes - summary.excludedBytes;
    if (summary.totalBytes > 0) {
        double ratio = static_cast<double>(summary.excludedBytes) / static_cast<double>(summary.totalBytes) * 100.0;
        summary.exclusionRatioPercent = std::round(ratio * 100.0) / 100.0;
    }
    return report;
}

DirectoryReport SizeAnalyzer::analyzeDirectory(const std::string& directory, const std::string& base,
                                               SizeSummary& summary) const {
    DirectoryReport result;
    result.fullPath = directory;
    result.name = fs::path(directory).filename().string();
    result.relativePath = directory == base ? "." : TreeClassifier::relativePathOf(fs::path(directory).lexically_normal(),
                                                                                   fs::path(base).lexically_normal());

    auto children = listDirectory(directory);
    if (!children) {
        result.error = children.error();
        return result;
    }

    for (const auto& child : *children) {
        std::error_code ec;
        fs::file_status status = child.symlink_status(ec);
        if (ec) {
            continue;
        }
        std::string name = child.path().filename().string();
        std::string relativePath = TreeClassifier::relativePathOf(child.path().lexically_normal(),
                                                                  fs::path(base).lexically_normal());

        if (fs::is_regular_file(status)) {
            FileReport file;
            file.name = name;
            file.relativePath = relativePath;
            auto size = child.file_size(ec);
            if (ec) {
                file.error = ec.message();
                result.files.push_back(std::move(file));
                continue;
            }
            file.sizeBytes = size;
            ++summary.totalFiles;
            summary.totalBytes += size;
            ++result.filesCount;
            result.totalBytes += size;

            file.excludedByPattern = rules.firstMatch(relativePath);
            file.included = !file.excludedByPattern;
            if (file.included) {
                ++result.includedFilesCount;
                result.includedBytes += size;
            } else {
                ++summary.excludedFiles;
                summary.excludedBytes += size;
                ++result.excludedFilesCount;
                result.excludedBytes += size;
            }
            result.files.push_back(std::move(file));
        } else if (fs::is_directory(status)) {
            DirectoryReport subdirectory = analyzeDirectory(child.path().string(), base, summary);
            result.totalBytes += subdirectory.totalBytes;
            result.includedBytes += subdirectory.includedBytes;
            result.excludedBytes += subdirectory.excludedBytes;
            result.filesCount += subdirectory.filesCount;
            result.includedFilesCount += subdirectory.includedFilesCount;
            result.excludedFilesCount += subdirectory.excludedFilesCount;
            result.subdirectories.push_back(std::move(subdirectory));
        }
    }
    return result;
}

Json::Value SizeAnalyzer::toJson(const SizeReport& report) {
    Json::Value json;
    Json::Value& info = json["analysis_info"];
    info["timestamp"] = report.timestamp;
    info["execution_time_seconds"] = report.executionSeconds;
    info["bitrix_root"] = report.siteRoot;
    info["exclude_patterns_count"] = Json::UInt64(report.excludePatterns.size());
    info["exclude_patterns"] = Json::Value(Json::arrayValue);
    for (const auto& pattern : report.excludePatterns) {
        info["exclude_patterns"].append(pattern);
    }

    const auto& s = report.summary;
    Json::Value& summary = json["summary"];
    summary["total_files"] = Json::UInt64(s.totalFiles);
    summary["total_size_bytes"] = Json::UInt64(s.totalBytes);
    summary["total_size_human"] = formatHumanSize(s.totalBytes);
    summary["included_files"] = Json::UInt64(s.includedFiles);
    summary["included_size_bytes"] = Json::UInt64(s.includedBytes);
    summary["included_size_human"] = formatHumanSize(s.includedBytes);
    summary["excluded_files"] = Json::UInt64(s.excludedFiles);
    summary["excluded_size_bytes"] = Json::UInt64(s.excludedBytes);
    summary["excluded_size_human"] = formatHumanSize(s.excludedBytes);
    summary["exclusion_ratio_percent"] = s.exclusionRatioPercent;

    json["directory_structure"] = directoryToJson(report.root);
    return json;
}

std::expected<void, std::string> SizeAnalyzer::save(const SizeReport& report, const std::string& outputFile) {
    fs::path outputPath(outputFile);
    std::error_code ec;
    if (outputPath.has_parent_path()) {
        fs::create_directories(outputPath.parent_path(), ec);
        if (ec) {
            return std::unexpected(std::format("Failed to create directory {}: {}", outputPath.parent_path().string(), ec.message()));
        }
    }

    std::ofstream file(outputFile);
    if (!file) {
        return std::unexpected(std::format("Failed to open report file: {}", outputFile));
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(toJson(report), &file);
    file << '\n';
    if (!file) {
        return std::unexpected(std::format("Failed to write report file: {}", outputFile));
    }
    return {};
}

std::expected<Json::Value, std::string> loadSizeReport(const std::string& reportFile) {
    std::ifstream file(reportFile);
    if (!file) {
        return std::unexpected(std::format("Failed to open report file: {}", reportFile));
    }
    Json::Value report;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &report, &errors)) {
        return std::unexpected(std::format("Failed to parse report file {}: {}", reportFile, errors));
    }
    if (!report.isObject() || !report.isMember("directory_structure")) {
        return std::unexpected(std::format("Not a size report: {}", reportFile));
    }
    return report;
}

std::vector<DirectorySize> largestDirectories(const Json::Value& structure, std::size_t limit) {
    std::vector<DirectorySize> directories;
    collectDirectories(structure, "", directories);
    std::ranges::stable_sort(directories, std::greater<>{}, &DirectorySize::includedBytes);
    if (directories.size() > limit) {
        directories.resize(limit);
    }
    return directories;
}

std::vector<LargeFile> largestFiles(const Json::Value& structure, std::size_t limit) {
    std::vector<LargeFile> files;
    collectFiles(structure, "", files);
    std::ranges::stable_sort(files, std::greater<>{}, &LargeFile::sizeBytes);
    if (files.size() > limit) {
        files.resize(limit);
    }
    return files;
}

std::vector<PatternSize> exclusionsByPattern(const Json::Value& structure) {
    std::map<std::string, PatternSize> grouped;
    collectExclusions(structure, grouped);
    std::vector<PatternSize> patterns;
    for (auto& [pattern, stats] : grouped) {
        patterns.push_back(std::move(stats));
    }
    std::ranges::stable_sort(patterns, std::greater<>{}, &PatternSize::bytes);
    return patterns;
}

std::string summarizeSizeReport(const Json::Value& report) {
    const Json::Value& summary = report["summary"];
    const Json::Value& structure = report["directory_structure"];
    std::string text;

    text += "OVERALL STATISTICS:\n";
    text += std::format("   Total size: {}\n", summary.get("total_size_human", "N/A").asString());
    text += std::format("   Backup size: {}\n", summary.get("included_size_human", "N/A").asString());
    text += std::format("   Excluded: {} ({:.2f}%)\n", summary.get("excluded_size_human", "N/A").asString(),
                        summary.get("exclusion_ratio_percent", 0.0).asDouble());
    text += std::format("   Files in backup: {}\n", summary.get("included_files", 0).asUInt64());

    text += "\nTOP 20 DIRECTORIES BY SIZE (included in backup):\n";
    int rank = 1;
    for (const auto& directory : largestDirectories(structure, 20)) {
        text += std::format("{:2d}. {}\n", rank++, directory.path);
        text += std::format("    In backup: {}\n", formatHumanSize(directory.includedBytes));
        if (directory.totalBytes > directory.includedBytes) {
            text += std::format("    Excluded: {}\n", formatHumanSize(directory.totalBytes - directory.includedBytes));
        }
        text += "\n";
    }

    text += "\nTOP 15 LARGEST FILES:\n";
    rank = 1;
    for (const auto& file : largestFiles(structure, 15)) {
        text += std::format("{:2d}. {} ({}) - {}\n", rank++, file.name, formatHumanSize(file.sizeBytes),
                            file.included ? "in backup" : "excluded");
        text += std::format("    Path: {}\n\n", file.path);
    }

    text += "\nEXCLUSIONS BY PATTERN:\n";
    for (const auto& pattern : exclusionsByPattern(structure)) {
        text += std::format("   {}: {} files, {}\n", pattern.pattern, pattern.count, formatHumanSize(pattern.bytes));
    }
    return text;
}
