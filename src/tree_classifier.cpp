#include "tree_classifier.hpp"
#include "utils.hpp"
#include <algorithm>
#include <format>
#include <system_error>

std::expected<std::vector<fs::directory_entry>, std::string> listDirectory(const fs::path& directory) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return std::unexpected(ec.message());
    }

    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        return std::unexpected(ec.message());
    }

    std::ranges::sort(entries, [](const auto& a, const auto& b) {
        return a.path().filename().string() < b.path().filename().string();
    });
    return entries;
}

TreeClassifier::TreeClassifier(ExclusionRules rules) : rules_(std::move(rules)) {}

std::string TreeClassifier::relativePathOf(const fs::path& entry, const fs::path& root) {
    fs::path relative = entry.lexically_relative(root);
    std::string text = relative.generic_string();
    if (relative.empty() || text.starts_with("..")) {
        return normalizeSeparators(entry.generic_string());
    }
    return text;
}

std::expected<Catalog, std::string> TreeClassifier::classify(const fs::path& root, const EntryVisitor& visitor) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return std::unexpected(std::format("Not a directory: {}", root.string()));
    }

    auto children = listDirectory(root);
    if (!children) {
        return std::unexpected(std::format("Failed to read directory {}: {}", root.string(), children.error()));
    }

    fs::path base = root.lexically_normal();
    if (!base.has_filename() && base != base.root_path()) {
        base = base.parent_path();
    }

    Catalog catalog;
    auto result = walk(base, *children, catalog, visitor);
    if (!result) {
        return std::unexpected(result.error());
    }
    return catalog;
}

std::expected<void, std::string> TreeClassifier::walk(const fs::path& root,
                                                      const std::vector<fs::directory_entry>& children,
                                                      Catalog& catalog,
                                                      const EntryVisitor& visitor) const {
    for (const auto& child : children) {
        const fs::path& path = child.path();
        CatalogEntry entry;
        entry.relativePath = relativePathOf(path.lexically_normal(), root);

        std::error_code ec;
        fs::file_status status = child.symlink_status(ec);
        if (ec) {
            entry.error = ec.message();
        }
        bool isDirectory = !ec && fs::is_directory(status);
        entry.type = isDirectory ? EntryType::Directory : EntryType::File;

        if (!ec && fs::is_regular_file(status)) {
            auto size = child.file_size(ec);
            if (ec) {
                entry.error = ec.message();
            } else {
                entry.sizeBytes = size;
            }
        }

        if (!entry.error && !fs::is_symlink(status)) {
            std::error_code timeEc;
            auto lastWrite = child.last_write_time(timeEc);
            if (!timeEc) {
                entry.modificationTime = toSystemTime(lastWrite);
            }
        }

        auto match = rules_.firstMatch(entry.relativePath);
        if (match) {
            entry.included = false;
            entry.matchedPattern = *match;
        }

        bool descend = isDirectory &&
            !(match && PatternMatcher::kindOf(*match) == PatternKind::DirectoryPrefix);
        std::vector<fs::directory_entry> grandchildren;
        if (descend) {
            auto listing = listDirectory(path);
            if (listing) {
                grandchildren = std::move(*listing);
            } else {
                entry.error = listing.error();
                descend = false;
            }
        }

        if (entry.included && visitor) {
            auto visited = visitor(entry, path);
            if (!visited) {
                return std::unexpected(visited.error());
            }
        }
        catalog.add(std::move(entry));

        if (descend) {
            auto result = walk(root, grandchildren, catalog, visitor);
            if (!result) {
                return result;
            }
        }
    }
    return {};
}
