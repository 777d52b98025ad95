/**
 * @file archive_writer.cpp
 * @brief libarchive-backed tar.gz writer and reader.
 */

#include "archive_writer.hpp"
#include "tree_classifier.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <sys/stat.h>
#include <fstream>
#include <format>
#include <cstring>
#include <cerrno>

TarGzArchiveWriter::TarGzArchiveWriter(struct archive* handle, std::string outputFile)
    : handle(handle), outputFile(std::move(outputFile)) {}

TarGzArchiveWriter::~TarGzArchiveWriter() {
    if (!closed) {
        archive_write_close(handle);
    }
    archive_write_free(handle);
}

std::expected<std::unique_ptr<TarGzArchiveWriter>, std::string> TarGzArchiveWriter::open(const std::string& outputFile) {
    fs::path outputPath(outputFile);
    if (outputPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(outputPath.parent_path(), ec);
        if (ec) {
            return std::unexpected(std::format("Failed to create directory {}: {}", outputPath.parent_path().string(), ec.message()));
        }
    }

    struct archive* a = archive_write_new();
    archive_write_add_filter_gzip(a);
    archive_write_set_format_pax_restricted(a);
    if (archive_write_open_filename(a, outputFile.c_str()) != ARCHIVE_OK) {
        std::string errorMsg = std::format("Failed to open archive file: {} (error: {})", outputFile, archive_error_string(a));
        archive_write_free(a);
        return std::unexpected(errorMsg);
    }
    return std::unique_ptr<TarGzArchiveWriter>(new TarGzArchiveWriter(a, outputFile));
}

std::expected<EntryStatus, std::string> TarGzArchiveWriter::addEntry(const fs::path& source, const std::string& archiveName) {
    struct stat st;
    if (::lstat(source.c_str(), &st) != 0) {
        return EntryStatus::Skipped;
    }

    std::ifstream file;
    std::string linkTarget;
    if (S_ISREG(st.st_mode)) {
        file.open(source, std::ios::binary);
        if (!file) {
            return EntryStatus::Skipped;
        }
    } else if (S_ISLNK(st.st_mode)) {
        std::error_code ec;
        linkTarget = fs::read_symlink(source, ec).string();
        if (ec) {
            return EntryStatus::Skipped;
        }
    } else if (!S_ISDIR(st.st_mode)) {
        return EntryStatus::Skipped;
    }

    struct archive_entry* ae = archive_entry_new();
    archive_entry_copy_stat(ae, &st);
    archive_entry_set_pathname(ae, archiveName.c_str());
    if (!linkTarget.empty()) {
        archive_entry_set_symlink(ae, linkTarget.c_str());
    }

    if (archive_write_header(handle, ae) != ARCHIVE_OK) {
        std::string errorMsg = std::format("Failed to write archive header for {}: {}", archiveName, archive_error_string(handle));
        archive_entry_free(ae);
        return std::unexpected(errorMsg);
    }
    archive_entry_free(ae);

    if (file.is_open()) {
        char buf[8192];
        while (file) {
            file.read(buf, sizeof(buf));
            if (file.gcount() > 0 && archive_write_data(handle, buf, file.gcount()) < 0) {
                return std::unexpected(std::format("Failed to write data for {}: {}", archiveName, archive_error_string(handle)));
            }
        }
    }

    ++entries;
    return EntryStatus::Added;
}

std::expected<std::size_t, std::string> TarGzArchiveWriter::addTree(const fs::path& source, const std::string& archiveName) {
    auto status = addEntry(source, archiveName);
    if (!status) {
        return std::unexpected(status.error());
    }
    std::size_t skipped = *status == EntryStatus::Skipped ? 1 : 0;

    std::error_code ec;
    if (*status == EntryStatus::Skipped || fs::is_symlink(source, ec) || !fs::is_directory(source, ec)) {
        return skipped;
    }

    auto children = listDirectory(source);
    if (!children) {
        return skipped;
    }
    for (const auto& child : *children) {
        auto added = addTree(child.path(), archiveName + "/" + child.path().filename().string());
        if (!added) {
            return std::unexpected(added.error());
        }
        skipped += *added;
    }
    return skipped;
}

std::expected<void, std::string> TarGzArchiveWriter::close() {
    if (closed) {
        return {};
    }
    closed = true;
    if (archive_write_close(handle) != ARCHIVE_OK) {
        return std::unexpected(std::format("Failed to finalize archive {}: {}", outputFile, archive_error_string(handle)));
    }
    return {};
}

std::expected<std::vector<std::string>, std::string> readArchiveEntryNames(const std::string& archiveFile) {
    struct archive* a = archive_read_new();
    archive_read_support_filter_all(a);
    archive_read_support_format_all(a);
    if (archive_read_open_filename(a, archiveFile.c_str(), 10240) != ARCHIVE_OK) {
        std::string errorMsg = std::format("Failed to open backup file: {} (error: {})", archiveFile, archive_error_string(a));
        archive_read_free(a);
        return std::unexpected(errorMsg);
    }

    std::vector<std::string> names;
    struct archive_entry* entry;
    int result;
    while ((result = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        names.emplace_back(archive_entry_pathname(entry));
        if (archive_read_data_skip(a) != ARCHIVE_OK) {
            result = ARCHIVE_FATAL;
            break;
        }
    }

    if (result != ARCHIVE_EOF) {
        std::string errorMsg = std::format("Archive {} is corrupt: {}", archiveFile,
                                           archive_error_string(a) ? archive_error_string(a) : "unexpected end of data");
        archive_read_free(a);
        return std::unexpected(errorMsg);
    }
    archive_read_free(a);
    return names;
}

std::expected<std::size_t, std::string> verifyArchive(const std::string& archiveFile) {
    auto names = readArchiveEntryNames(archiveFile);
    if (!names) {
        return std::unexpected(names.error());
    }
    if (names->empty()) {
        return std::unexpected(std::format("Archive {} contains no entries", archiveFile));
    }
    return names->size();
}
