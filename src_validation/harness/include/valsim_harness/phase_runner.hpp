#pragma once

#include <chrono>
#include <optional>

#include "execution_context.hpp"
#include "interrupt.hpp"
#include "phase.hpp"
#include "status_store.hpp"
#include "test_logger.hpp"
#include "test_record.hpp"
#include "tester_loader.hpp"

namespace valsim::harness {

/**
 * \brief Executes one tracked phase of one test case.
 *
 * Gating (a phase executes only if all hold):
 *
 * | Phase   | own status | upstream                                   |
 * |---------|------------|--------------------------------------------|
 * | Prepare | != Ok      | none                                       |
 * | Run     | != Ok      | Prepare == Ok                              |
 * | Check   | != Ok      | Run == Ok and the tester reports runfinished |
 *
 * Prepare deletes and recreates the work directory before calling the tester.
 * Every outcome is classified (Ok / Failed / Error / Interrupted), written to the
 * progress sink and the test-case log, drained into the record and persisted
 * before execute() returns.
 *
 * After an Interrupted outcome the runner waits for the grace window; a second
 * interrupt observed by then raises RunAborted.
 */
class PhaseRunner {
public:
    struct Config {
        std::chrono::milliseconds interrupt_grace{1000};
    };

    PhaseRunner(Config config, const StatusStore& store, InterruptMonitor& interrupts, TestLogger& progress);

    /**
     * Returns the new status of \p phase, or std::nullopt when the phase was gated
     * out (including Check waiting for an unfinished run).
     *
     * \throws std::invalid_argument for phases that are not tracked.
     * \throws RunAborted on a second interrupt within the grace window.
     */
    std::optional<PhaseStatus> execute(Phase phase, ExecutionContext& ctx, TestRecord& record, LazyTester& tester);

    /// Upstream requirement of the gating table (ignores runfinished()).
    [[nodiscard]] static bool upstream_ok(Phase phase, const TestRecord& record);

private:
    void persist(ExecutionContext& ctx, TestRecord& record);

    Config config_;
    const StatusStore& store_;
    InterruptMonitor& interrupts_;
    TestLogger& progress_;
};

}  // namespace valsim::harness
