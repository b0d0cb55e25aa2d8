#include "valsim_harness/tagged_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>
#include <utility>

namespace {

using valsim::harness::TaggedEntry;
using valsim::harness::TaggedFileError;
using valsim::harness::TaggedType;

const std::regex kTagline{R"(^@([^: ]+)\s*:([^:]+):(\d):((?:\d+(?:,\d+)*)?)$)"};

std::string rtrim_copy(std::string_view input) {
    const auto end = input.find_last_not_of(" \t\r\n\f\v");
    if (end == std::string_view::npos) {
        return {};
    }
    return std::string{input.substr(0, end + 1)};
}

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(std::move(word));
    }
    return words;
}

TaggedType parse_type(const std::string& dtype) {
    if (dtype == "real") return TaggedType::Real;
    if (dtype == "complex") return TaggedType::Complex;
    if (dtype == "integer") return TaggedType::Integer;
    if (dtype == "logical") return TaggedType::Logical;
    throw TaggedFileError("Invalid data dtype '" + dtype + "'");
}

double to_real(const std::string& word) {
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(word.c_str(), &end);
    if (end == word.c_str() || *end != '\0' || errno == ERANGE) {
        throw TaggedFileError("Unable to convert '" + word + "' to float");
    }
    return value;
}

double to_integer(const std::string& word) {
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(word.c_str(), &end, 10);
    if (end == word.c_str() || *end != '\0' || errno == ERANGE) {
        throw TaggedFileError("Unable to convert '" + word + "' to integer");
    }
    return static_cast<double>(value);
}

double to_logical(const std::string& word) {
    if (word == "T" || word == "t") return 1.0;
    if (word == "F" || word == "f") return 0.0;
    throw TaggedFileError("Unable to convert '" + word + "' to logical");
}

std::vector<std::size_t> parse_shape(const std::string& text) {
    std::vector<std::size_t> shape;
    if (text.empty()) {
        return shape;
    }
    std::size_t begin = 0;
    while (begin <= text.size()) {
        const auto end = text.find(',', begin);
        const auto item = text.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
        errno = 0;
        char* item_end = nullptr;
        const unsigned long long extent = std::strtoull(item.c_str(), &item_end, 10);
        if (item_end == item.c_str() || *item_end != '\0' || errno == ERANGE ||
            extent > std::numeric_limits<std::size_t>::max()) {
            throw TaggedFileError("Invalid shape extent '" + item + "'");
        }
        shape.push_back(static_cast<std::size_t>(extent));
        if (end == std::string::npos) {
            break;
        }
        begin = end + 1;
    }
    return shape;
}

}  // namespace

namespace valsim::harness {

TaggedFileError::TaggedFileError(const std::string& msg, std::size_t first_line, std::size_t last_line)
    : std::runtime_error(first_line == 0 ? msg
                                         : msg + " (lines " + std::to_string(first_line) + "-" +
                                               std::to_string(last_line) + ")"),
      first_line_{first_line},
      last_line_{last_line} {}

std::size_t TaggedEntry::element_count() const noexcept {
    std::size_t count = 1;
    for (auto extent : shape) {
        count *= extent;
    }
    return count;
}

bool TaggedEntry::comparable(const TaggedEntry& other) const noexcept {
    return name == other.name && type == other.type && rank == other.rank && shape == other.shape;
}

TaggedEntry make_tagged_entry(const std::string& tagline, const std::string& data) {
    const auto line = rtrim_copy(tagline);
    std::smatch match;
    if (!std::regex_match(line, match, kTagline)) {
        throw TaggedFileError("Invalid tag format '" + line + "'");
    }

    TaggedEntry entry;
    entry.tagline = line.substr(1);
    entry.name = match[1].str();
    entry.type = parse_type(match[2].str());
    entry.rank = static_cast<std::size_t>(std::stoul(match[3].str()));
    entry.shape = parse_shape(match[4].str());
    if (entry.shape.size() != entry.rank) {
        throw TaggedFileError("Incompatible rank and shape");
    }
    const std::size_t per_element = entry.type == TaggedType::Complex ? 2 : 1;
    std::size_t slots = per_element;
    for (auto extent : entry.shape) {
        if (extent != 0 && slots > std::numeric_limits<std::size_t>::max() / extent) {
            throw TaggedFileError("Shape too large");
        }
        slots *= extent;
    }

    const auto words = split_words(data);
    entry.values.reserve(words.size());
    for (const auto& word : words) {
        switch (entry.type) {
            case TaggedType::Real:
            case TaggedType::Complex: entry.values.push_back(to_real(word)); break;
            case TaggedType::Integer: entry.values.push_back(to_integer(word)); break;
            case TaggedType::Logical: entry.values.push_back(to_logical(word)); break;
        }
    }

    if (entry.type == TaggedType::Complex && entry.values.size() % 2 != 0) {
        throw TaggedFileError("Complex converter needs even number of values");
    }
    if (entry.values.size() != slots) {
        throw TaggedFileError("Invalid nr. of values");
    }
    return entry;
}

void TaggedCollection::add(TaggedEntry entry) {
    auto it = index_.find(entry.name);
    if (it != index_.end()) {
        entries_[it->second] = std::move(entry);
        return;
    }
    index_.emplace(entry.name, entries_.size());
    entries_.push_back(std::move(entry));
}

const TaggedEntry* TaggedCollection::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &entries_[it->second];
}

void TaggedCollection::remove(const std::string& name) {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return;
    }
    const auto removed = it->second;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(removed));
    index_.erase(it);
    for (auto& [key, position] : index_) {
        if (position > removed) {
            --position;
        }
    }
}

std::vector<const TaggedEntry*> TaggedCollection::matching(const std::regex& pattern) const {
    std::vector<const TaggedEntry*> result;
    for (const auto& entry : entries_) {
        if (std::regex_search(entry.tagline, pattern, std::regex_constants::match_continuous)) {
            result.push_back(&entry);
        }
    }
    return result;
}

TaggedCollection read_tagged(std::istream& input) {
    TaggedCollection collection;
    std::string tagline;
    std::size_t tag_line_no = 0;
    std::string data;

    auto flush = [&](std::size_t last_line) {
        if (tagline.empty()) {
            return;
        }
        try {
            collection.add(make_tagged_entry(tagline, data));
        } catch (const TaggedFileError& ex) {
            throw TaggedFileError(ex.what(), tag_line_no, last_line);
        }
    };

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(input, line)) {
        ++line_no;
        if (!line.empty() && line.front() == '@') {
            flush(line_no - 1);
            tagline = line;
            tag_line_no = line_no;
            data.clear();
        } else if (!tagline.empty()) {
            data.append(line).push_back('\n');
        }
    }
    if (input.bad()) {
        throw TaggedFileError("Read error in tagged data");
    }
    flush(line_no);
    return collection;
}

TaggedCollection read_tagged_file(const std::filesystem::path& file) {
    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open tagged file: " + file.string());
    }
    return read_tagged(input);
}

}  // namespace valsim::harness
