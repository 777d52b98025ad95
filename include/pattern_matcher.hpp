/**
 * @file pattern_matcher.hpp
 * @brief Exclusion pattern matching for SiteVault.
 *
 * An exclusion pattern has one of four shapes, decided in this order:
 * - contains '*' or '?' and a '/': glob against the full relative path ("upload/tmp/*.jpg");
 * - contains '*' or '?' only: glob against the basename ("*.log");
 * - contains '/': directory prefix, matching everything strictly below it ("bitrix/cache/");
 * - anything else: exact basename anywhere in the tree (".DS_Store").
 *
 * Matching is case-sensitive and '\\' is treated as '/' on both sides.
 */

#ifndef PATTERN_MATCHER_HPP
#define PATTERN_MATCHER_HPP

#include <string>
#include <vector>
#include <optional>

/**
 * @brief Shape of an exclusion pattern.
 */
enum class PatternKind {
    PathGlob,           ///< Wildcard with separator, matched against the relative path.
    NameGlob,           ///< Wildcard without separator, matched against the basename.
    DirectoryPrefix,    ///< Plain text with separator, matched as a directory prefix.
    ExactName           ///< Plain text without separator, matched against the basename.
};

/**
 * @brief Stateless matcher for a single pattern.
 */
class PatternMatcher {
public:
    /**
     * @brief Classifies a pattern by shape.
     *
     * @param pattern Exclusion pattern.
     * @return PatternKind The rule that governs the pattern.
     */
    static PatternKind kindOf(const std::string& pattern);

    /**
     * @brief Decides whether a pattern matches a relative path.
     *
     * @param relativePath Path relative to the tree root (e.g., "bitrix/cache/a.php").
     * @param pattern Exclusion pattern.
     * @return bool True if the pattern matches.
     */
    static bool matches(const std::string& relativePath, const std::string& pattern);
};

/**
 * @brief Ordered list of exclusion patterns.
 *
 * The first pattern in configured order that matches a path is the one recorded for it.
 */
class ExclusionRules {
public:
    ExclusionRules() = default;

    /**
     * @brief Constructs rules from patterns in evaluation order.
     */
    explicit ExclusionRules(std::vector<std::string> patterns);

    /**
     * @brief Finds the first pattern that matches a path.
     *
     * @param relativePath Path relative to the tree root.
     * @return std::optional<std::string> The matching pattern text, or std::nullopt if the path is included.
     */
    std::optional<std::string> firstMatch(const std::string& relativePath) const;

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    std::vector<std::string> patterns_; ///< Patterns in evaluation order.
};

#endif // PATTERN_MATCHER_HPP
