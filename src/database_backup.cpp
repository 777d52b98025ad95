#include "database_backup.hpp"
#include "utils.hpp"
#include <fstream>
#include <sstream>
#include <format>
#include <cstdlib>
#include <filesystem>
#include <zlib.h>

namespace fs = std::filesystem;

namespace {

std::string readTrimmed(const std::string& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string text = buffer.str();
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

} // namespace

MySQLBackupStrategy::MySQLBackupStrategy(const std::string& dbName, const std::string& defaultsFile,
                                         const std::string& mysqldump)
    : dbName(dbName), defaultsFile(defaultsFile), mysqldump(mysqldump) {}

std::string MySQLBackupStrategy::dumpCommand(const std::string& sqlFile, const std::string& errFile) const {
    return std::format("{} --defaults-file={} --single-transaction --routines --triggers --lock-tables=false {} > {} 2> {}",
                       shellQuote(mysqldump), shellQuote(defaultsFile), shellQuote(dbName),
                       shellQuote(sqlFile), shellQuote(errFile));
}

std::expected<std::string, std::string> MySQLBackupStrategy::execute(const std::string& outputDir) {
    if (dbName.empty()) {
        return std::unexpected("Invalid MySQL settings: database name missing");
    }

    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create directory {}: {}", outputDir, ec.message()));
    }

    std::string tempSql = (fs::path(outputDir) / std::format("database_{}.sql", dbName)).string();
    std::string tempErr = tempSql + ".err";
    int status = std::system(dumpCommand(tempSql, tempErr).c_str());
    std::string stderrText = readTrimmed(tempErr);
    fs::remove(tempErr, ec);
    if (status != 0) {
        fs::remove(tempSql, ec);
        return std::unexpected(stderrText.empty()
            ? std::format("Failed to execute mysqldump for database {}", dbName)
            : std::format("Failed to execute mysqldump for database {}: {}", dbName, stderrText));
    }

    std::string dbBackupFileGz = tempSql + ".gz";
    auto compressed = gzipFile(tempSql, dbBackupFileGz);
    fs::remove(tempSql, ec);
    if (!compressed) {
        return std::unexpected(compressed.error());
    }
    return dbBackupFileGz;
}

std::expected<void, std::string> gzipFile(const std::string& inputFile, const std::string& outputFile) {
    std::ifstream inFile(inputFile, std::ios::binary);
    if (!inFile) {
        return std::unexpected(std::format("Failed to open file for compression: {}", inputFile));
    }
    gzFile outFile = gzopen(outputFile.c_str(), "wb");
    if (!outFile) {
        return std::unexpected(std::format("Failed to open gzip file for writing: {}", outputFile));
    }

    char buf[8192];
    while (inFile) {
        inFile.read(buf, sizeof(buf));
        auto count = static_cast<unsigned>(inFile.gcount());
        if (count > 0 && gzwrite(outFile, buf, count) != static_cast<int>(count)) {
            gzclose(outFile);
            return std::unexpected(std::format("Failed to write gzip file: {}", outputFile));
        }
    }

    if (gzclose(outFile) != Z_OK) {
        return std::unexpected(std::format("Failed to finalize gzip file: {}", outputFile));
    }
    return {};
}
