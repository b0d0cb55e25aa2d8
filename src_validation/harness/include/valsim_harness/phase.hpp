#pragma once

#include <array>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace valsim::harness {

/**
 * \brief Named stages of a test case's lifecycle.
 *
 * Only Prepare, Run and Check are tracked in the persisted status record; Report
 * and Cleanup are re-executed on every invocation that requests them.
 */
enum class Phase { Prepare, Run, Check, Report, Cleanup };

/**
 * \brief Outcome classification of an attempted phase.
 *
 * NotRun is the only initial value. Only Ok satisfies gating, so every other
 * terminal value is re-attempted on the next invocation requesting the phase.
 */
enum class PhaseStatus { NotRun, Ok, Failed, Error, Interrupted };

/// Phases persisted in a TestRecord, in execution order.
[[nodiscard]] const std::array<Phase, 3>& tracked_phases() noexcept;

[[nodiscard]] std::string_view to_string(Phase phase) noexcept;

/// Human readable status as shown in logs and the summary table.
[[nodiscard]] std::string_view to_string(PhaseStatus status) noexcept;

/// Stable key used in the status file.
[[nodiscard]] std::string_view status_key(PhaseStatus status) noexcept;

[[nodiscard]] std::optional<PhaseStatus> parse_status_key(std::string_view key) noexcept;

/// Stable key used in the status file for a tracked phase.
[[nodiscard]] std::string_view phase_key(Phase phase) noexcept;

/**
 * \brief Set of phases requested for one invocation.
 *
 * The command line selects phases with a letter combination:
 * `p` prepare, `r` run, `t` test (Check), `s` summary report, `c` cleanup.
 */
class PhaseSelection {
public:
    PhaseSelection() = default;

    /// prepare + run + check + report
    [[nodiscard]] static PhaseSelection defaults();

    /// \throws std::runtime_error on an empty string or an unknown letter.
    [[nodiscard]] static PhaseSelection parse(std::string_view letters);

    PhaseSelection& add(Phase phase);

    [[nodiscard]] bool contains(Phase phase) const noexcept { return phases_.count(phase) != 0; }
    [[nodiscard]] bool empty() const noexcept { return phases_.empty(); }

private:
    std::set<Phase> phases_;
};

}  // namespace valsim::harness
