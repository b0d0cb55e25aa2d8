#include "valsim_harness/pattern_resolver.hpp"
#include "string_utils.hpp"

#include <glob.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

namespace {

using valsim::harness::detail::trim_copy;

// The test root is literal; only the pattern part may contain wildcards.
std::string escape_glob(std::string_view literal) {
    std::string escaped;
    escaped.reserve(literal.size());
    for (char ch : literal) {
        if (ch == '*' || ch == '?' || ch == '[' || ch == ']' || ch == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

// Owns a glob_t for the duration of one expansion.
class GlobResult {
public:
    GlobResult() = default;
    ~GlobResult() { globfree(&buffer_); }
    GlobResult(const GlobResult&) = delete;
    GlobResult& operator=(const GlobResult&) = delete;

    glob_t* get() noexcept { return &buffer_; }
    [[nodiscard]] std::size_t size() const noexcept { return buffer_.gl_pathc; }
    [[nodiscard]] const char* operator[](std::size_t index) const noexcept { return buffer_.gl_pathv[index]; }

private:
    glob_t buffer_{};
};

}  // namespace

namespace valsim::harness {

std::vector<std::string> PatternResolver::read_pattern_file(const fs::path& file) const {
    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open pattern file: " + file.string());
    }

    std::vector<std::string> patterns;
    std::string raw_line;
    while (std::getline(input, raw_line)) {
        auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        patterns.emplace_back(std::move(trimmed));
    }
    if (input.bad()) {
        throw std::runtime_error("Read error in pattern file: " + file.string());
    }
    return patterns;
}

std::vector<std::string> PatternResolver::expand(const fs::path& test_root, const std::string& pattern) const {
    const fs::path root = test_root.empty() ? fs::path{"."} : test_root;
    std::string full = escape_glob(root.string());
    if (!full.empty() && full.back() != '/') {
        full.push_back('/');
    }
    full += pattern;

    GlobResult matches;
    const int rc = ::glob(full.c_str(), 0, nullptr, matches.get());
    if (rc == GLOB_NOMATCH) {
        return {};
    }
    if (rc == GLOB_NOSPACE) {
        throw std::runtime_error("Out of memory while expanding pattern '" + pattern + "'");
    }
    if (rc != 0) {
        throw std::runtime_error("Unable to expand pattern '" + pattern + "' under " + root.string());
    }

    std::vector<std::string> relative;
    relative.reserve(matches.size());
    for (std::size_t i = 0; i < matches.size(); ++i) {
        const auto rel = fs::path{matches[i]}.lexically_relative(root).lexically_normal();
        auto id = rel.generic_string();
        while (id.size() > 1 && id.back() == '/') {
            id.pop_back();
        }
        if (id.empty()) {
            continue;
        }
        relative.emplace_back(std::move(id));
    }
    return relative;
}

std::vector<std::string> PatternResolver::resolve(const fs::path& test_root,
                                                  const std::vector<fs::path>& pattern_files,
                                                  const std::vector<std::string>& inline_patterns) const {
    std::vector<std::string> patterns;
    for (const auto& file : pattern_files) {
        auto from_file = read_pattern_file(file);
        patterns.insert(patterns.end(), std::make_move_iterator(from_file.begin()),
                        std::make_move_iterator(from_file.end()));
    }
    patterns.insert(patterns.end(), inline_patterns.begin(), inline_patterns.end());

    std::vector<std::string> test_cases;
    std::unordered_set<std::string> seen;
    for (const auto& pattern : patterns) {
        for (auto& id : expand(test_root, pattern)) {
            if (seen.insert(id).second) {
                test_cases.emplace_back(std::move(id));
            }
        }
    }
    return test_cases;
}

}  // namespace valsim::harness
