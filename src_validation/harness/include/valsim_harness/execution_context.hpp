#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "test_logger.hpp"

namespace valsim::harness {

/// Flat user-supplied key=value mapping, constant for the whole run.
using ExternalContext = std::map<std::string, std::string>;

/**
 * \brief Per-test-case paths plus the per-test-case log sink.
 *
 * Built fresh for every run by make_context(). The work directory is derived
 * deterministically from the work root and the test case identifier, so repeated
 * invocations reuse the same location. Never persisted itself.
 */
struct ExecutionContext {
    std::filesystem::path test_root;
    std::string test_case;
    std::filesystem::path test_dir;
    std::filesystem::path work_root;
    std::filesystem::path work_dir;
    std::filesystem::path status_file;
    TestLogger log;

    /// Drains the text logged for this test case since the last call.
    std::string take_log() { return log.take_buffer(); }
};

inline constexpr const char* kStatusFileName = ".valsim_status.json";

[[nodiscard]] ExecutionContext make_context(const std::filesystem::path& test_root,
                                            const std::filesystem::path& work_root,
                                            const std::string& test_case);

/**
 * Builds the external context from `key=value` entries (split at the first '=').
 * Later entries override earlier ones.
 *
 * \throws std::runtime_error for entries without '=' or with an empty key.
 */
[[nodiscard]] ExternalContext parse_external_context(const std::vector<std::string>& assignments);

}  // namespace valsim::harness
