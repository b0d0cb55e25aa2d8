#pragma once

#include <string>
#include <string_view>

namespace valsim::harness::detail {

inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

inline std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

}  // namespace valsim::harness::detail
