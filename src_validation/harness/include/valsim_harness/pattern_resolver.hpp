#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace valsim::harness {

/**
 * \brief Expands test-name patterns into test case identifiers.
 *
 * Patterns are shell globs evaluated relative to the test root. Pattern files
 * list one pattern per line; whitespace is trimmed, blank lines and lines
 * starting with `#` are skipped.
 *
 * The resolved identifiers keep the order in which patterns are encountered
 * (all pattern-file lines first, then the inline patterns) and each identifier
 * appears once, at the position of its first match. A pattern without matches
 * contributes nothing.
 */
class PatternResolver {
public:
    PatternResolver() = default;

    /// \throws std::runtime_error when the file cannot be read.
    [[nodiscard]] std::vector<std::string> read_pattern_file(const std::filesystem::path& file) const;

    /// Matches of one pattern, relative to \p test_root, in glob order.
    [[nodiscard]] std::vector<std::string> expand(const std::filesystem::path& test_root,
                                                  const std::string& pattern) const;

    [[nodiscard]] std::vector<std::string> resolve(const std::filesystem::path& test_root,
                                                   const std::vector<std::filesystem::path>& pattern_files,
                                                   const std::vector<std::string>& inline_patterns) const;
};

}  // namespace valsim::harness
