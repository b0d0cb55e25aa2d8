#include "valsim_harness/orchestrator.hpp"

#include "valsim_harness/phase_runner.hpp"
#include "valsim_harness/status_store.hpp"
#include "valsim_harness/test_record.hpp"

#include <exception>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace valsim::harness {

bool RunSummary::has_problems() const noexcept {
    for (const auto& outcome : cases) {
        for (const auto& [phase, status] : outcome.status) {
            if (status == PhaseStatus::Failed || status == PhaseStatus::Error ||
                status == PhaseStatus::Interrupted) {
                return true;
            }
        }
    }
    return false;
}

Orchestrator::Orchestrator(Config config, const TesterLoader& loader, ExternalContext external,
                           TestLogger& progress, InterruptMonitor& interrupts)
    : config_{std::move(config)},
      loader_{loader},
      external_{std::move(external)},
      progress_{progress},
      interrupts_{interrupts} {}

RunSummary Orchestrator::run(const std::vector<std::string>& test_cases) {
    std::vector<ExecutionContext> contexts;
    contexts.reserve(test_cases.size());
    for (const auto& test_case : test_cases) {
        contexts.push_back(make_context(config_.test_root, config_.work_root, test_case));
    }
    std::vector<LazyTester> testers;
    testers.reserve(contexts.size());
    for (std::size_t i = 0; i < contexts.size(); ++i) {
        testers.emplace_back(loader_, external_);
    }

    const StatusStore store;
    PhaseRunner runner({.interrupt_grace = config_.interrupt_grace}, store, interrupts_, progress_);

    // Interrupts up to `seen` have been dealt with, either by the runner or by settle().
    unsigned seen = interrupts_.count();

    RunSummary summary;
    summary.cases.reserve(contexts.size());
    for (std::size_t i = 0; i < contexts.size(); ++i) {
        settle(seen);
        auto& ctx = contexts[i];
        auto record = store.load(ctx.status_file);
        for (const auto phase : tracked_phases()) {
            if (!config_.phases.contains(phase)) {
                continue;
            }
            if (runner.execute(phase, ctx, record, testers[i])) {
                seen = interrupts_.count();
            } else {
                settle(seen);
            }
        }
        summary.cases.push_back(CaseOutcome{.test_case = ctx.test_case, .status = record.status});
    }
    settle(seen);

    if (config_.phases.contains(Phase::Report)) {
        const ReportAggregator aggregator(store);
        summary.report = aggregator.render(contexts, progress_, config_.report_file);
        settle(seen);
    }

    if (config_.phases.contains(Phase::Cleanup)) {
        for (std::size_t i = 0; i < contexts.size(); ++i) {
            cleanup(contexts[i], testers[i]);
            settle(seen);
        }
    }
    return summary;
}

void Orchestrator::settle(unsigned& seen) {
    if (interrupts_.count() == seen) {
        return;
    }
    if (interrupts_.second_within(seen, config_.interrupt_grace)) {
        progress_.writeline("Second interrupt received, aborting run");
        throw RunAborted();
    }
    seen = interrupts_.count();
}

void Orchestrator::cleanup(ExecutionContext& ctx, LazyTester& tester) {
    const auto action = to_string(Phase::Cleanup);
    progress_.teststart(ctx.test_case, action);
    const unsigned mark = interrupts_.count();
    try {
        tester.get(ctx).cleanup();
        progress_.testresult(ctx.test_case, action,
                             interrupts_.count() != mark ? PhaseStatus::Interrupted : PhaseStatus::Ok);
    } catch (const Interrupted& ex) {
        progress_.testresult(ctx.test_case, action, PhaseStatus::Interrupted, ex.what());
    } catch (const std::exception& ex) {
        progress_.testresult(ctx.test_case, action, PhaseStatus::Error, ex.what());
    }

    std::error_code ec;
    fs::remove_all(ctx.work_dir, ec);
    if (ec) {
        progress_.writeline("WARNING: could not remove " + ctx.work_dir.string() + ": " + ec.message());
    }
}

}  // namespace valsim::harness
