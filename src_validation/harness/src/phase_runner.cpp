#include "valsim_harness/phase_runner.hpp"

#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

void recreate_directory(const fs::path& dir) {
    if (fs::exists(dir)) {
        fs::remove_all(dir);
    }
    fs::create_directories(dir);
}

}  // namespace

namespace valsim::harness {

PhaseRunner::PhaseRunner(Config config, const StatusStore& store, InterruptMonitor& interrupts,
                         TestLogger& progress)
    : config_{config}, store_{store}, interrupts_{interrupts}, progress_{progress} {}

bool PhaseRunner::upstream_ok(Phase phase, const TestRecord& record) {
    switch (phase) {
        case Phase::Prepare: return true;
        case Phase::Run:     return record.status_of(Phase::Prepare) == PhaseStatus::Ok;
        case Phase::Check:   return record.status_of(Phase::Run) == PhaseStatus::Ok;
        default:             return false;
    }
}

std::optional<PhaseStatus> PhaseRunner::execute(Phase phase, ExecutionContext& ctx, TestRecord& record,
                                                LazyTester& tester) {
    if (phase != Phase::Prepare && phase != Phase::Run && phase != Phase::Check) {
        throw std::invalid_argument("Phase '" + std::string{to_string(phase)} + "' is not tracked");
    }
    if (record.status_of(phase) == PhaseStatus::Ok || !upstream_ok(phase, record)) {
        return std::nullopt;
    }

    const auto action = to_string(phase);
    const unsigned mark = interrupts_.count();
    progress_.teststart(ctx.test_case, action);
    ctx.log.teststart(ctx.test_case, action);

    PhaseStatus status = PhaseStatus::Error;
    std::string message;
    bool tester_interrupted = false;
    bool not_finished = false;
    try {
        Tester& instance = tester.get(ctx);
        switch (phase) {
            case Phase::Prepare:
                recreate_directory(ctx.work_dir);
                instance.prepare();
                status = PhaseStatus::Ok;
                break;
            case Phase::Run:
                instance.run();
                status = PhaseStatus::Ok;
                break;
            default:
                if (!instance.runfinished()) {
                    not_finished = true;
                } else {
                    status = instance.test() ? PhaseStatus::Ok : PhaseStatus::Failed;
                }
                break;
        }
    } catch (const Interrupted& ex) {
        status = PhaseStatus::Interrupted;
        message = ex.what();
        tester_interrupted = true;
    } catch (const std::exception& ex) {
        status = PhaseStatus::Error;
        message = ex.what();
    } catch (...) {
        status = PhaseStatus::Error;
        message = "unknown exception";
    }

    const unsigned during_phase = interrupts_.count() - mark;
    if (during_phase != 0) {
        not_finished = false;
        if (status != PhaseStatus::Interrupted) {
            status = PhaseStatus::Interrupted;
            message = "interrupted by user";
        }
    }

    if (not_finished) {
        progress_.testresult(ctx.test_case, action, "Not finished");
        ctx.log.testresult(ctx.test_case, action, "Not finished");
        persist(ctx, record);
        return std::nullopt;
    }

    record.status[phase] = status;
    progress_.testresult(ctx.test_case, action, status);
    ctx.log.testresult(ctx.test_case, action, status, message);
    persist(ctx, record);

    if (status == PhaseStatus::Interrupted) {
        // An Interrupted thrown without a signal counts as the first interrupt.
        const unsigned cooperative = tester_interrupted && during_phase == 0 ? 1U : 0U;
        if (interrupts_.second_within(mark, config_.interrupt_grace, cooperative)) {
            progress_.writeline("Second interrupt received, aborting run");
            throw RunAborted();
        }
    }
    return status;
}

void PhaseRunner::persist(ExecutionContext& ctx, TestRecord& record) {
    record.log += ctx.take_log();
    std::string diag;
    if (!store_.save(ctx.status_file, record, diag)) {
        progress_.write("WARNING: " + diag);
    }
}

}  // namespace valsim::harness
