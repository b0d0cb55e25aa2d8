#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "execution_context.hpp"
#include "interrupt.hpp"
#include "phase.hpp"
#include "report_aggregator.hpp"
#include "test_logger.hpp"
#include "tester_loader.hpp"

namespace valsim::harness {

struct CaseOutcome {
    std::string test_case;
    std::map<Phase, PhaseStatus> status;  ///< Tracked phases after this invocation
};

struct RunSummary {
    std::vector<CaseOutcome> cases;
    std::vector<ReportEntry> report;  ///< Empty unless the report phase was selected

    /// True if any tracked status is Failed, Error or Interrupted.
    [[nodiscard]] bool has_problems() const noexcept;
};

/**
 * \brief Top-level driver of a validation run.
 *
 * For every test case in discovery order the selected tracked phases are
 * attempted in the fixed order Prepare, Run, Check. The report then covers all
 * test cases, and cleanup finally calls each tester's cleanup() and removes the
 * work directories (best effort).
 *
 * All contexts are built before any tester is resolved, so testers may keep
 * references into their context for the whole run.
 *
 * Interrupts arriving outside a tracked phase (between test cases, during the
 * report or a cleanup) follow the same grace-window rule as the phases: a second
 * interrupt stops the run before the next step starts.
 */
class Orchestrator {
public:
    struct Config {
        std::filesystem::path test_root{"."};
        std::filesystem::path work_root{"_work"};
        PhaseSelection phases{PhaseSelection::defaults()};
        std::optional<std::filesystem::path> report_file{};
        std::chrono::milliseconds interrupt_grace{1000};
    };

    Orchestrator(Config config,
                 const TesterLoader& loader,
                 ExternalContext external,
                 TestLogger& progress,
                 InterruptMonitor& interrupts);

    /// \throws RunAborted on a double interrupt; report and cleanup are skipped then.
    RunSummary run(const std::vector<std::string>& test_cases);

private:
    void cleanup(ExecutionContext& ctx, LazyTester& tester);

    /// Applies the grace-window rule to interrupts after \p seen; \throws RunAborted.
    void settle(unsigned& seen);

    Config config_;
    const TesterLoader& loader_;
    ExternalContext external_;
    TestLogger& progress_;
    InterruptMonitor& interrupts_;
};

}  // namespace valsim::harness
