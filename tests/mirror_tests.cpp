#include <gtest/gtest.h>
#include <chrono>
#include <format>
#include <string>
#include "fake_object_storage.hpp"
#include "mirror.hpp"
#include "utils.hpp"

class MirrorCopierTest : public ::testing::Test {
protected:
    Logger logger;
    FakeObjectStorage work{"site-uploads", 50};
    FakeObjectStorage backups{"site-backups", 50};
    const std::string folder = "s3-work-file-storage/20250115_030000";

    void SetUp() override {
        for (int i = 0; i < 120; ++i) {
            work.put(std::format("upload/iblock/{:03}/image.jpg", i), 100 + i);
        }
        backups.copySource = &work;
        backups.put("backups/sitevault_backup_20250114_030000.tar.gz", 5000);
    }
};

TEST_F(MirrorCopierTest, CopiesWholeBucketAndVerifies) {
    MirrorCopier copier(work, backups, logger);
    auto report = copier.mirror(folder);
    ASSERT_TRUE(report.has_value()) << report.error();

    EXPECT_EQ(120u, report->copied);
    EXPECT_EQ(0u, report->failed);
    EXPECT_EQ(120u, report->source.objectCount);
    EXPECT_EQ(120u, report->destination.objectCount);
    EXPECT_EQ(report->source.totalBytes, report->destination.totalBytes);
    EXPECT_TRUE(report->verified());
    EXPECT_EQ(folder, report->destinationFolder);
    EXPECT_TRUE(backups.contains(folder + "/upload/iblock/007/image.jpg"));
    EXPECT_TRUE(backups.contains("backups/sitevault_backup_20250114_030000.tar.gz"));
}

TEST_F(MirrorCopierTest, CopyFailureLeavesUnverifiedSnapshot) {
    work.failingCopies.insert("upload/iblock/042/image.jpg");
    MirrorCopier copier(work, backups, logger);
    auto report = copier.mirror(folder);
    ASSERT_TRUE(report.has_value()) << report.error();

    EXPECT_EQ(119u, report->copied);
    EXPECT_EQ(1u, report->failed);
    EXPECT_EQ(120u, report->source.objectCount);
    EXPECT_EQ(119u, report->destination.objectCount);
    EXPECT_FALSE(report->verified());
    EXPECT_TRUE(backups.deletedKeys.empty());
    EXPECT_EQ(119u, backups.countWithPrefix(folder + "/"));
}

TEST_F(MirrorCopierTest, MissingBucketAbortsBeforeCopying) {
    backups.available = false;
    MirrorCopier copier(work, backups, logger);
    auto report = copier.mirror(folder);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(0u, backups.countWithPrefix(folder + "/"));
    EXPECT_EQ(0, work.listCalls);

    backups.available = true;
    work.available = false;
    EXPECT_FALSE(copier.mirror(folder).has_value());
    EXPECT_EQ(0u, backups.countWithPrefix(folder + "/"));
}

TEST_F(MirrorCopierTest, EmptySourceIsVerified) {
    FakeObjectStorage empty("empty-bucket");
    backups.copySource = &empty;
    MirrorCopier copier(empty, backups, logger);
    auto report = copier.mirror(folder);
    ASSERT_TRUE(report.has_value()) << report.error();
    EXPECT_EQ(0u, report->copied);
    EXPECT_TRUE(report->verified());
}

TEST_F(MirrorCopierTest, ListingFailureIsAnError) {
    work.failListing = true;
    MirrorCopier copier(work, backups, logger);
    auto report = copier.mirror(folder);
    ASSERT_FALSE(report.has_value());
    EXPECT_NE(std::string::npos, report.error().find("site-uploads"));
}

TEST(MirrorFolderNameTest, UsesLocalTimestamp) {
    auto now = std::chrono::system_clock::now();
    std::string name = MirrorCopier::snapshotFolderName("s3-work-file-storage", now);
    EXPECT_EQ("s3-work-file-storage/" + formatLocalTime(now, "%Y%m%d_%H%M%S"), name);
    EXPECT_EQ(std::string("s3-work-file-storage/").size() + 15, name.size());
}
