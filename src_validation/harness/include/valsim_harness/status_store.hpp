#pragma once

#include <filesystem>
#include <string>

#include "test_record.hpp"

namespace valsim::harness {

/**
 * \brief Loads and saves per-test-case status files.
 *
 * The file is a single JSON document holding both the phase-status map and the
 * captured log text:
 * \code{.json}
 * {
 *   "format": "valsim-status",
 *   "version": 1,
 *   "status": {"prepare": "ok", "run": "error", "check": "not_run"},
 *   "log": "..."
 * }
 * \endcode
 *
 * Neither operation throws. A file that is missing, unreadable or malformed loads
 * as a fresh record (all phases NotRun, empty log). A failed save is reported
 * through the return value and the diagnostic string only, so that losing cached
 * status can never abort a run.
 */
class StatusStore {
public:
    StatusStore() = default;

    [[nodiscard]] TestRecord load(const std::filesystem::path& path) const noexcept;

    /// As load(), appending the reason for falling back to a fresh record to \p diag.
    [[nodiscard]] TestRecord load(const std::filesystem::path& path, std::string& diag) const noexcept;

    /**
     * Writes the record next to \p path and atomically renames it into place.
     * The parent directory is created when missing.
     *
     * Returns false and appends a diagnostic to \p diag on failure.
     */
    bool save(const std::filesystem::path& path, const TestRecord& record, std::string& diag) const noexcept;
};

}  // namespace valsim::harness
