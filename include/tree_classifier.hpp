/**
 * @file tree_classifier.hpp
 * @brief Single-pass classification of a directory tree against exclusion rules.
 *
 * The classifier walks the site root once, in name order, and decides for every entry whether it
 * belongs to the backup. Included entries are handed to an optional visitor as they are found,
 * which is how the archive writer streams exactly the entries the catalog records.
 */

#ifndef TREE_CLASSIFIER_HPP
#define TREE_CLASSIFIER_HPP

#include <string>
#include <vector>
#include <expected>
#include <filesystem>
#include <functional>
#include "catalog.hpp"
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

/**
 * @brief Callback invoked for each included entry, in traversal order.
 *
 * Receives the catalog entry and its absolute path. Returning an error aborts classification.
 */
using EntryVisitor = std::function<std::expected<void, std::string>(const CatalogEntry& entry, const fs::path& absolutePath)>;

/**
 * @brief Walks a tree and builds its catalog.
 *
 * Traversal rules:
 * - the root itself is not classified;
 * - symlinks are not followed and are catalogued as files of size 0;
 * - a directory excluded by a directory-prefix pattern is not descended into;
 * - a directory excluded by any other pattern is still descended into, and its children are classified on their own;
 * - an unreadable directory is recorded with an error annotation and its subtree is skipped.
 */
class TreeClassifier {
public:
    /**
     * @brief Constructs a classifier.
     *
     * @param rules Exclusion patterns in evaluation order.
     */
    explicit TreeClassifier(ExclusionRules rules);

    /**
     * @brief Classifies every entry below a root directory.
     *
     * @param root Directory to walk.
     * @param visitor Optional callback for included entries.
     * @return std::expected<Catalog, std::string> The catalog, or an error if the root cannot be read or the visitor fails.
     */
    std::expected<Catalog, std::string> classify(const fs::path& root, const EntryVisitor& visitor = {}) const;

    /**
     * @brief Computes the path of an entry relative to the root.
     *
     * Entries outside the root fall back to their own path verbatim.
     *
     * @param entry Entry path.
     * @param root Tree root.
     * @return std::string Relative path with '/' separators.
     */
    static std::string relativePathOf(const fs::path& entry, const fs::path& root);

    const ExclusionRules& rules() const { return rules_; }

private:
    std::expected<void, std::string> walk(const fs::path& root,
                                          const std::vector<fs::directory_entry>& children,
                                          Catalog& catalog,
                                          const EntryVisitor& visitor) const;

    ExclusionRules rules_; ///< Exclusion patterns.
};

/**
 * @brief Lists a directory sorted by file name.
 *
 * @param directory Directory to list.
 * @return std::expected<std::vector<fs::directory_entry>, std::string> Entries, or the filesystem error message.
 */
std::expected<std::vector<fs::directory_entry>, std::string> listDirectory(const fs::path& directory);

#endif // TREE_CLASSIFIER_HPP
