#include "mirror.hpp"
#include "utils.hpp"
#include <format>

MirrorCopier::MirrorCopier(ObjectStorage& source, ObjectStorage& destination, const Logger& logger)
    : source(source), destination(destination), logger(logger) {}

std::string MirrorCopier::snapshotFolderName(const std::string& backupFolder,
                                             std::chrono::system_clock::time_point now) {
    return std::format("{}/{}", backupFolder, formatLocalTime(now, "%Y%m%d_%H%M%S"));
}

std::expected<MirrorReport, std::string> MirrorCopier::mirror(const std::string& destinationFolder) {
    for (ObjectStorage* storage : {&destination, &source}) {
        auto probed = storage->probe();
        if (!probed) {
            return std::unexpected(probed.error());
        }
        logger.info(std::format("Bucket is available: {}", storage->bucket()));
    }

    MirrorReport report;
    report.destinationFolder = destinationFolder;
    logger.info(std::format("Copying s3://{} to s3://{}/{}/", source.bucket(), destination.bucket(), destinationFolder));

    std::optional<std::string> token;
    do {
        auto page = source.listObjectsPage("", "", token);
        if (!page) {
            return std::unexpected(std::format("Failed to list s3://{}: {}", source.bucket(), page.error()));
        }
        for (const auto& object : page->objects) {
            auto copied = destination.copyObject(source.bucket(), object.key,
                                                 std::format("{}/{}", destinationFolder, object.key));
            if (!copied) {
                ++report.failed;
                logger.error(std::format("Failed to copy object {}: {}", object.key, copied.error()));
                continue;
            }
            ++report.copied;
            if (report.copied % kProgressInterval == 0) {
                logger.info(std::format("Objects copied: {}", report.copied));
            }
        }
        token = page->nextContinuationToken;
    } while (token);
    logger.info(std::format("Total objects copied: {} ({} failed)", report.copied, report.failed));

    auto sourceStats = storageStats(source, "");
    if (!sourceStats) {
        return std::unexpected(std::format("Failed to count s3://{}: {}", source.bucket(), sourceStats.error()));
    }
    auto destinationStats = storageStats(destination, destinationFolder + "/");
    if (!destinationStats) {
        return std::unexpected(std::format("Failed to count s3://{}/{}: {}", destination.bucket(),
                                           destinationFolder, destinationStats.error()));
    }
    report.source = *sourceStats;
    report.destination = *destinationStats;

    logger.info(std::format("Source bucket: {} ({} objects)", formatHumanSize(report.source.totalBytes), report.source.objectCount));
    logger.info(std::format("Snapshot: {} ({} objects)", formatHumanSize(report.destination.totalBytes), report.destination.objectCount));
    return report;
}
