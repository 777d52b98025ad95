#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>
#include "tree_classifier.hpp"

namespace fs = std::filesystem;

class TreeClassifierTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "sitevault_classifier_test";
    fs::path siteRoot = testDir / "www";

    void SetUp() override {
        fs::remove_all(testDir);
        fs::create_directories(siteRoot / "bitrix" / "cache" / "sub");
        fs::create_directories(siteRoot / "node_modules" / "pkg");
        fs::create_directories(siteRoot / "local" / "temporary");
        fs::create_directories(siteRoot / "upload");

        writeFile(siteRoot / "index.php", 100);
        writeFile(siteRoot / "error.log", 40);
        writeFile(siteRoot / "bitrix" / "header.php", 10);
        writeFile(siteRoot / "bitrix" / "cache" / "page.html", 300);
        writeFile(siteRoot / "bitrix" / "cache" / "sub" / "deep.html", 500);
        writeFile(siteRoot / "node_modules" / "pkg" / "index.js", 7);
        writeFile(siteRoot / "local" / "temporary" / "keep.txt", 5);
        writeFile(siteRoot / "upload" / "photo.jpg", 2048);
    }

    fs::path lockedDir;

    void TearDown() override {
        if (!lockedDir.empty()) {
            std::error_code ec;
            fs::permissions(lockedDir, fs::perms::owner_all, ec);
        }
        fs::remove_all(testDir);
    }

    // Returns false when permissions are not enforced (running as root).
    bool lock(const fs::path& dir) {
        if (geteuid() == 0) {
            return false;
        }
        lockedDir = dir;
        fs::permissions(dir, fs::perms::none);
        return true;
    }

    static void writeFile(const fs::path& path, std::size_t size) {
        std::ofstream(path) << std::string(size, 'x');
    }

    static const CatalogEntry* find(const std::vector<CatalogEntry>& entries, const std::string& path) {
        auto it = std::ranges::find(entries, path, &CatalogEntry::relativePath);
        return it == entries.end() ? nullptr : &*it;
    }

    std::vector<std::string> defaultPatterns() const {
        return {"*.log", "bitrix/cache", "node_modules", "local/temp"};
    }
};

TEST_F(TreeClassifierTest, PartitionsEveryVisitedEntry) {
    TreeClassifier classifier{ExclusionRules(defaultPatterns())};
    auto catalog = classifier.classify(siteRoot);
    ASSERT_TRUE(catalog.has_value()) << catalog.error();

    const auto& totals = catalog->totals();
    EXPECT_EQ(catalog->included().size() + catalog->excluded().size(), totals.visitedCount());
    for (const auto& entry : catalog->included()) {
        EXPECT_EQ(nullptr, find(catalog->excluded(), entry.relativePath)) << entry.relativePath;
        EXPECT_TRUE(entry.included);
        EXPECT_FALSE(entry.matchedPattern.has_value());
    }
    for (const auto& entry : catalog->excluded()) {
        EXPECT_FALSE(entry.included);
        EXPECT_TRUE(entry.matchedPattern.has_value());
    }
    EXPECT_EQ(nullptr, find(catalog->included(), ""));
    EXPECT_EQ(nullptr, find(catalog->included(), "."));
}

TEST_F(TreeClassifierTest, RecordsWinningPatternAndTotals) {
    TreeClassifier classifier{ExclusionRules(defaultPatterns())};
    auto catalog = classifier.classify(siteRoot);
    ASSERT_TRUE(catalog.has_value()) << catalog.error();

    const CatalogEntry* log = find(catalog->excluded(), "error.log");
    ASSERT_NE(nullptr, log);
    EXPECT_EQ("*.log", log->matchedPattern.value());
    EXPECT_EQ(40u, log->sizeBytes);

    const CatalogEntry* page = find(catalog->excluded(), "bitrix/cache/page.html");
    ASSERT_NE(nullptr, page);
    EXPECT_EQ("bitrix/cache", page->matchedPattern.value());

    const CatalogEntry* photo = find(catalog->included(), "upload/photo.jpg");
    ASSERT_NE(nullptr, photo);
    EXPECT_EQ(2048u, photo->sizeBytes);
    EXPECT_EQ(EntryType::File, photo->type);
    EXPECT_TRUE(photo->modificationTime.has_value());

    const auto& totals = catalog->totals();
    EXPECT_EQ(100u + 10u + 7u + 5u + 2048u, totals.includedBytes);
    EXPECT_EQ(5u, totals.includedFiles);
    EXPECT_EQ(0u, totals.errors);
}

TEST_F(TreeClassifierTest, PrefixExcludedDirectoryIsNotDescended) {
    TreeClassifier classifier{ExclusionRules(defaultPatterns())};
    auto catalog = classifier.classify(siteRoot);
    ASSERT_TRUE(catalog.has_value()) << catalog.error();

    const CatalogEntry* sub = find(catalog->excluded(), "bitrix/cache/sub");
    ASSERT_NE(nullptr, sub);
    EXPECT_EQ(EntryType::Directory, sub->type);
    EXPECT_EQ(0u, sub->sizeBytes);
    EXPECT_EQ(nullptr, find(catalog->excluded(), "bitrix/cache/sub/deep.html"));
    EXPECT_EQ(nullptr, find(catalog->included(), "bitrix/cache/sub/deep.html"));

    // The prefix itself names the directory, which stays in the backup as an empty folder.
    EXPECT_NE(nullptr, find(catalog->included(), "bitrix/cache"));
}

TEST_F(TreeClassifierTest, ChildrenOfNameExcludedDirectoryAreClassified) {
    TreeClassifier classifier{ExclusionRules(defaultPatterns())};
    auto catalog = classifier.classify(siteRoot);
    ASSERT_TRUE(catalog.has_value()) << catalog.error();

    const CatalogEntry* modules = find(catalog->excluded(), "node_modules");
    ASSERT_NE(nullptr, modules);
    EXPECT_EQ("node_modules", modules->matchedPattern.value());
    EXPECT_NE(nullptr, find(catalog->included(), "node_modules/pkg"));
    EXPECT_NE(nullptr, find(catalog->included(), "node_modules/pkg/index.js"));
}

TEST_F(TreeClassifierTest, PrefixDoesNotMatchSimilarNames) {
    TreeClassifier classifier{ExclusionRules(defaultPatterns())};
    auto catalog = classifier.classify(siteRoot);
    ASSERT_TRUE(catalog.has_value()) << catalog.error();

    EXPECT_NE(nullptr, find(catalog->included(), "local/temporary"));
    EXPECT_NE(nullptr, find(catalog->included(), "local/temporary/keep.txt"));
}

TEST_F(TreeClassifierTest, VisitsIncludedEntriesInNameOrder) {
    std::vector<std::string> visited;
    TreeClassifier classifier(ExclusionRules({"*.log", "bitrix", "node_modules", "local"}));
    auto catalog = classifier.classify(siteRoot, [&](const CatalogEntry& entry, const fs::path& absolutePath) {
        EXPECT_EQ(siteRoot / entry.relativePath, absolutePath);
        visited.push_back(entry.relativePath);
        return std::expected<void, std::string>{};
    });
    ASSERT_TRUE(catalog.has_value()) << catalog.error();

    std::vector<std::string> expected{
        "bitrix/cache",
        "bitrix/cache/page.html",
        "bitrix/cache/sub",
        "bitrix/cache/sub/deep.html",
        "bitrix/header.php",
        "index.php",
        "local/temporary",
        "local/temporary/keep.txt",
        "node_modules/pkg",
        "node_modules/pkg/index.js",
        "upload",
        "upload/photo.jpg",
    };
    EXPECT_EQ(expected, visited);
}

TEST_F(TreeClassifierTest, VisitorErrorAbortsClassification) {
    TreeClassifier classifier{ExclusionRules(defaultPatterns())};
    int calls = 0;
    auto catalog = classifier.classify(siteRoot, [&](const CatalogEntry&, const fs::path&) -> std::expected<void, std::string> {
        if (++calls == 2) {
            return std::unexpected("archive write failed");
        }
        return {};
    });
    ASSERT_FALSE(catalog.has_value());
    EXPECT_EQ("archive write failed", catalog.error());
    EXPECT_EQ(2, calls);
}

TEST_F(TreeClassifierTest, SymlinksAreFilesOfSizeZero) {
    fs::create_directory_symlink(siteRoot / "upload", siteRoot / "upload_link");
    TreeClassifier classifier{ExclusionRules()};
    auto catalog = classifier.classify(siteRoot);
    ASSERT_TRUE(catalog.has_value()) << catalog.error();

    const CatalogEntry* link = find(catalog->included(), "upload_link");
    ASSERT_NE(nullptr, link);
    EXPECT_EQ(EntryType::File, link->type);
    EXPECT_EQ(0u, link->sizeBytes);
    EXPECT_EQ(nullptr, find(catalog->included(), "upload_link/photo.jpg"));
}

TEST_F(TreeClassifierTest, ClassificationIsRepeatable) {
    TreeClassifier classifier{ExclusionRules(defaultPatterns())};
    auto first = classifier.classify(siteRoot);
    auto second = classifier.classify(siteRoot);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->included(), second->included());
    EXPECT_EQ(first->excluded(), second->excluded());
    EXPECT_EQ(first->totals(), second->totals());
}

TEST_F(TreeClassifierTest, RootWithTrailingSeparatorGivesSamePaths) {
    TreeClassifier classifier{ExclusionRules(defaultPatterns())};
    auto plain = classifier.classify(siteRoot);
    auto slashed = classifier.classify(siteRoot.string() + "/");
    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(slashed.has_value());
    EXPECT_EQ(plain->sortedIncluded(), slashed->sortedIncluded());
}

TEST_F(TreeClassifierTest, MissingRootIsAnError) {
    TreeClassifier classifier{ExclusionRules()};
    auto catalog = classifier.classify(testDir / "missing");
    ASSERT_FALSE(catalog.has_value());
    EXPECT_NE(std::string::npos, catalog.error().find("Not a directory"));
}

TEST(TreeClassifierPathTest, RelativePathOutsideRootIsVerbatim) {
    EXPECT_EQ("a/b.txt", TreeClassifier::relativePathOf("/srv/www/a/b.txt", "/srv/www"));
    EXPECT_EQ("/etc/nginx/nginx.conf", TreeClassifier::relativePathOf("/etc/nginx/nginx.conf", "/srv/www"));
}

TEST_F(TreeClassifierTest, UnreadableDirectoryIsMarkedAndNotDescended) {
    if (!lock(siteRoot / "upload")) {
        GTEST_SKIP() << "permissions are not enforced for root";
    }
    TreeClassifier classifier{ExclusionRules(defaultPatterns())};
    auto catalog = classifier.classify(siteRoot);
    ASSERT_TRUE(catalog.has_value()) << catalog.error();

    const CatalogEntry* upload = find(catalog->included(), "upload");
    ASSERT_NE(nullptr, upload);
    EXPECT_EQ(EntryType::Directory, upload->type);
    ASSERT_TRUE(upload->error.has_value());
    EXPECT_FALSE(upload->error->empty());
    EXPECT_EQ(nullptr, find(catalog->included(), "upload/photo.jpg"));
    EXPECT_EQ(nullptr, find(catalog->excluded(), "upload/photo.jpg"));

    const CatalogTotals& totals = catalog->totals();
    EXPECT_EQ(1u, totals.errors);
    EXPECT_EQ(100u + 10u + 7u + 5u, totals.includedBytes);
}
