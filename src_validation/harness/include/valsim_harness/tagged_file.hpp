#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <map>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace valsim::harness {

/**
 * \brief Raised for malformed tagged data.
 *
 * first_line / last_line delimit the offending block (1-based, inclusive); both
 * are 0 when the error is not tied to a location.
 */
class TaggedFileError : public std::runtime_error {
public:
    TaggedFileError(const std::string& msg, std::size_t first_line = 0, std::size_t last_line = 0);

    [[nodiscard]] std::size_t first_line() const noexcept { return first_line_; }
    [[nodiscard]] std::size_t last_line() const noexcept { return last_line_; }

private:
    std::size_t first_line_;
    std::size_t last_line_;
};

enum class TaggedType { Real, Complex, Integer, Logical };

/**
 * \brief One named array of the tagged format.
 *
 * The tag line reads `@<name>:<dtype>:<rank>:<shape>`, e.g.
 * `@eigenlevels_up:real:2:2,15`, and is followed by the values separated by
 * whitespace. Values are kept flat in reading order. Complex values occupy two
 * slots (real, imaginary); logical values are stored as 0 / 1.
 */
struct TaggedEntry {
    std::string tagline;  ///< Tag line without the leading '@'
    std::string name;
    TaggedType type{TaggedType::Real};
    std::size_t rank{0};
    std::vector<std::size_t> shape;
    std::vector<double> values;

    /// Number of logical elements (product of the shape, 1 for scalars).
    [[nodiscard]] std::size_t element_count() const noexcept;

    /// Same name, type, rank and shape.
    [[nodiscard]] bool comparable(const TaggedEntry& other) const noexcept;
};

/// Builds an entry from its tag line and the raw data text.
/// \throws TaggedFileError
[[nodiscard]] TaggedEntry make_tagged_entry(const std::string& tagline, const std::string& data);

/**
 * \brief Insertion-ordered collection of tagged entries with lookup by name.
 *
 * Adding an entry with an existing name replaces the earlier one in place.
 */
class TaggedCollection {
public:
    TaggedCollection() = default;

    void add(TaggedEntry entry);
    [[nodiscard]] const TaggedEntry* find(const std::string& name) const;
    void remove(const std::string& name);

    /// Entries whose tag line (without '@') starts with a match of \p pattern.
    [[nodiscard]] std::vector<const TaggedEntry*> matching(const std::regex& pattern) const;

    [[nodiscard]] const std::vector<TaggedEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    std::vector<TaggedEntry> entries_;
    std::map<std::string, std::size_t> index_;
};

/// Reads all entries; text before the first tag line is ignored.
/// \throws TaggedFileError
[[nodiscard]] TaggedCollection read_tagged(std::istream& input);

/// \throws TaggedFileError, std::runtime_error when the file cannot be opened.
[[nodiscard]] TaggedCollection read_tagged_file(const std::filesystem::path& file);

}  // namespace valsim::harness
