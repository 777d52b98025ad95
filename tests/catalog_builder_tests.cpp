#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <json/json.h>
#include "catalog_builder.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

CatalogEntry fileEntry(const std::string& path, std::uint64_t size) {
    CatalogEntry entry;
    entry.relativePath = path;
    entry.sizeBytes = size;
    entry.modificationTime = std::chrono::system_clock::from_time_t(1700000000);
    return entry;
}

CatalogEntry directoryEntry(const std::string& path) {
    CatalogEntry entry;
    entry.relativePath = path;
    entry.type = EntryType::Directory;
    return entry;
}

CatalogEntry excludedEntry(CatalogEntry entry, const std::string& pattern) {
    entry.included = false;
    entry.matchedPattern = pattern;
    return entry;
}

} // namespace

class CatalogBuilderTest : public ::testing::Test {
protected:
    Catalog catalog;
    ManifestInfo info{"2025-01-15 03:00:00", "/var/www/html", {"*.log", "bitrix/cache"}, "2.0"};
    fs::path testDir = fs::temp_directory_path() / "sitevault_manifest_test";

    void SetUp() override {
        catalog.add(fileEntry("upload/photo.jpg", 1536));
        catalog.add(directoryEntry("upload"));
        catalog.add(fileEntry("index.php", 100));
        catalog.add(excludedEntry(fileEntry("logs/error.log", 2048), "*.log"));
        catalog.add(excludedEntry(fileEntry("access.log", 1024), "*.log"));
        catalog.add(excludedEntry(directoryEntry("bitrix/cache/sub"), "bitrix/cache"));
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

TEST(HumanSizeTest, FormatsBase1024Units) {
    EXPECT_EQ("0B", formatHumanSize(0));
    EXPECT_EQ("512.0B", formatHumanSize(512));
    EXPECT_EQ("1.5KB", formatHumanSize(1536));
    EXPECT_EQ("1.0MB", formatHumanSize(1048576));
    EXPECT_EQ("1.0GB", formatHumanSize(1073741824));
    EXPECT_EQ("2.0TB", formatHumanSize(2ull << 40));
    EXPECT_EQ("4.0PB", formatHumanSize(4ull << 50));
}

TEST_F(CatalogBuilderTest, MachineManifestHasStatistics) {
    Manifest manifest = CatalogBuilder::build(catalog, info);
    const Json::Value& root = manifest.machine;

    EXPECT_EQ("2025-01-15 03:00:00", root["backup_info"]["timestamp"].asString());
    EXPECT_EQ("2.0", root["backup_info"]["backup_version"].asString());
    EXPECT_EQ("/var/www/html", root["backup_info"]["bitrix_root"].asString());
    ASSERT_EQ(2u, root["backup_info"]["exclude_patterns"].size());
    EXPECT_EQ("*.log", root["backup_info"]["exclude_patterns"][0].asString());

    const Json::Value& stats = root["statistics"];
    EXPECT_EQ(2u, stats["included_files"].asUInt64());
    EXPECT_EQ(1u, stats["included_directories"].asUInt64());
    EXPECT_EQ(1636u, stats["included_total_size_bytes"].asUInt64());
    EXPECT_EQ("1.6KB", stats["included_total_size_human"].asString());
    EXPECT_EQ(2u, stats["excluded_files"].asUInt64());
    EXPECT_EQ(1u, stats["excluded_directories"].asUInt64());
    EXPECT_EQ(3072u, stats["excluded_total_size_bytes"].asUInt64());
    EXPECT_EQ("3.0KB", stats["excluded_total_size_human"].asString());
}

TEST_F(CatalogBuilderTest, EntryListsAreSortedByPath) {
    Manifest manifest = CatalogBuilder::build(catalog, info);
    const Json::Value& included = manifest.machine["included_files"];
    ASSERT_EQ(3u, included.size());
    EXPECT_EQ("index.php", included[0]["path"].asString());
    EXPECT_EQ("upload", included[1]["path"].asString());
    EXPECT_EQ("upload/photo.jpg", included[2]["path"].asString());

    const Json::Value& excluded = manifest.machine["excluded_files"];
    ASSERT_EQ(3u, excluded.size());
    EXPECT_EQ("access.log", excluded[0]["path"].asString());
    EXPECT_EQ("bitrix/cache/sub", excluded[1]["path"].asString());
    EXPECT_EQ("logs/error.log", excluded[2]["path"].asString());
}

TEST_F(CatalogBuilderTest, EntryFieldsDependOnSide) {
    Json::Value included = CatalogBuilder::entryToJson(fileEntry("index.php", 100));
    EXPECT_EQ("index.php", included["path"].asString());
    EXPECT_EQ(100u, included["size"].asUInt64());
    EXPECT_EQ("file", included["type"].asString());
    EXPECT_TRUE(included.isMember("mtime"));
    EXPECT_FALSE(included.isMember("excluded_by_pattern"));
    EXPECT_FALSE(included.isMember("error"));

    Json::Value excluded = CatalogBuilder::entryToJson(excludedEntry(directoryEntry("bitrix/cache/sub"), "bitrix/cache"));
    EXPECT_EQ("directory", excluded["type"].asString());
    EXPECT_EQ("bitrix/cache", excluded["excluded_by_pattern"].asString());
    EXPECT_FALSE(excluded.isMember("mtime"));

    CatalogEntry broken = fileEntry("broken.bin", 0);
    broken.error = "Permission denied";
    broken.modificationTime.reset();
    Json::Value withError = CatalogBuilder::entryToJson(broken);
    EXPECT_EQ("Permission denied", withError["error"].asString());
    EXPECT_EQ("unknown", withError["mtime"].asString());
}

TEST_F(CatalogBuilderTest, HumanManifestListsFilesAndPatterns) {
    Manifest manifest = CatalogBuilder::build(catalog, info);
    const std::string& text = manifest.human;

    EXPECT_EQ(0u, text.find("SITEVAULT BACKUP FILE MANIFEST\n"));
    EXPECT_NE(std::string::npos, text.find("Site root: /var/www/html"));
    EXPECT_NE(std::string::npos, text.find("[+] Included in backup:\n   Files: 2\n   Directories: 1\n   Total size: 1.6KB"));
    EXPECT_NE(std::string::npos, text.find("[-] Excluded from backup:\n   Files: 2\n   Directories: 1\n   Total size: 3.0KB"));
    EXPECT_NE(std::string::npos, text.find("[D] upload/\n"));
    EXPECT_NE(std::string::npos, text.find("[F] upload/photo.jpg (1.5KB) ["));
    EXPECT_NE(std::string::npos, text.find("[x] *.log: 2 files/directories, 3.0KB\n"));
    EXPECT_NE(std::string::npos, text.find("[x] bitrix/cache: 1 files/directories, 0B\n"));
    EXPECT_LT(text.find("[F] index.php"), text.find("[D] upload/"));
    EXPECT_EQ(std::string::npos, text.find("access.log"));
}

TEST_F(CatalogBuilderTest, WritesBothManifestFiles) {
    Manifest manifest = CatalogBuilder::build(catalog, info);
    auto written = CatalogBuilder::write(manifest, testDir.string());
    ASSERT_TRUE(written.has_value()) << written.error();

    std::ifstream jsonFile(testDir / CatalogBuilder::kJsonManifestName);
    ASSERT_TRUE(jsonFile.is_open());
    Json::Value parsed;
    Json::CharReaderBuilder reader;
    std::string errors;
    ASSERT_TRUE(Json::parseFromStream(reader, jsonFile, &parsed, &errors)) << errors;
    EXPECT_EQ(2u, parsed["statistics"]["included_files"].asUInt64());
    EXPECT_EQ(manifest.machine["included_files"].size(), parsed["included_files"].size());
    EXPECT_EQ("upload/photo.jpg", parsed["included_files"][2]["path"].asString());

    std::ifstream textFile(testDir / CatalogBuilder::kTextManifestName);
    std::stringstream text;
    text << textFile.rdbuf();
    EXPECT_EQ(manifest.human, text.str());
}

TEST_F(CatalogBuilderTest, WriteFailsForMissingDirectory) {
    Manifest manifest = CatalogBuilder::build(catalog, info);
    auto written = CatalogBuilder::write(manifest, (testDir / "missing").string());
    EXPECT_FALSE(written.has_value());
}
