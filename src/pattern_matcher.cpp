#include "pattern_matcher.hpp"
#include "utils.hpp"
#include <fnmatch.h>

namespace {

bool hasWildcard(const std::string& pattern) {
    return pattern.find_first_of("*?") != std::string::npos;
}

bool hasSeparator(const std::string& pattern) {
    return pattern.find('/') != std::string::npos;
}

// '*' is allowed to cross '/' (no FNM_PATHNAME); backslashes were already turned into separators.
bool globMatch(const std::string& pattern, const std::string& text) {
    return fnmatch(pattern.c_str(), text.c_str(), FNM_NOESCAPE) == 0;
}

} // namespace

PatternKind PatternMatcher::kindOf(const std::string& pattern) {
    std::string normalized = normalizeSeparators(pattern);
    if (hasWildcard(normalized)) {
        return hasSeparator(normalized) ? PatternKind::PathGlob : PatternKind::NameGlob;
    }
    return hasSeparator(normalized) ? PatternKind::DirectoryPrefix : PatternKind::ExactName;
}

bool PatternMatcher::matches(const std::string& relativePath, const std::string& pattern) {
    std::string path = normalizeSeparators(relativePath);
    std::string normalized = normalizeSeparators(pattern);

    switch (kindOf(normalized)) {
        case PatternKind::PathGlob:
            return globMatch(normalized, path);
        case PatternKind::NameGlob:
            return globMatch(normalized, baseName(path));
        case PatternKind::DirectoryPrefix: {
            std::string prefix = normalized;
            while (!prefix.empty() && prefix.back() == '/') {
                prefix.pop_back();
            }
            prefix += '/';
            return path.starts_with(prefix);
        }
        case PatternKind::ExactName:
            return baseName(path) == normalized;
    }
    return false;
}

ExclusionRules::ExclusionRules(std::vector<std::string> patterns) : patterns_(std::move(patterns)) {}

std::optional<std::string> ExclusionRules::firstMatch(const std::string& relativePath) const {
    for (const auto& pattern : patterns_) {
        if (PatternMatcher::matches(relativePath, pattern)) {
            return pattern;
        }
    }
    return std::nullopt;
}
