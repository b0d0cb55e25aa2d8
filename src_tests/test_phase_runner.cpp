/**
 * @file test_phase_runner.cpp
 * @brief Unit Tests for phase gating, outcome classification and interrupt handling
 *
 * © 2025 Uni-Libraries contributors — MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "valsim_harness/execution_context.hpp"
#include "valsim_harness/interrupt.hpp"
#include "valsim_harness/phase_runner.hpp"
#include "valsim_harness/status_store.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace valsim::harness;
using valsim_test::Action;
using valsim_test::ScriptedLoader;
using valsim_test::TempDir;
using valsim_test::write_text;

namespace {

struct Fixture
{
    TempDir tmp;
    StatusStore store;
    InterruptMonitor interrupts;
    std::ostringstream progress_text;
    TestLogger progress{progress_text};
    PhaseRunner runner{{.interrupt_grace = std::chrono::milliseconds{0}}, store, interrupts, progress};
    ScriptedLoader loader;
    ExternalContext external;

    ExecutionContext context(const std::string& id)
    {
        return make_context(tmp.path() / "suite", tmp.path() / "_work", id);
    }
};

}  // namespace

TEST_CASE("Prepare recreates the work directory and persists the outcome", "[phase_runner]")
{
    Fixture fx;
    auto ctx = fx.context("t1");
    auto& script = fx.loader.script("t1");
    write_text(ctx.work_dir / "stale.txt", "left over");

    TestRecord record;
    LazyTester tester(fx.loader, fx.external);
    const auto status = fx.runner.execute(Phase::Prepare, ctx, record, tester);

    REQUIRE(status == PhaseStatus::Ok);
    REQUIRE_FALSE(std::filesystem::exists(ctx.work_dir / "stale.txt"));
    REQUIRE(script.calls == std::vector<std::string>{"prepare"});

    const auto persisted = fx.store.load(ctx.status_file);
    REQUIRE(persisted.status_of(Phase::Prepare) == PhaseStatus::Ok);
    REQUIRE(persisted.log.find("t1:\tprepare:\tOK") != std::string::npos);
    REQUIRE(fx.progress_text.str() == "t1:\tprepare:\tstarted...\nt1:\tprepare:\tOK\n");
}

TEST_CASE("Failed upstream phases gate the downstream ones", "[phase_runner]")
{
    Fixture fx;
    auto ctx = fx.context("t1");
    auto& script = fx.loader.script("t1");
    script.prepare = Action::Throw;

    TestRecord record;
    LazyTester tester(fx.loader, fx.external);
    REQUIRE(fx.runner.execute(Phase::Prepare, ctx, record, tester) == PhaseStatus::Error);
    REQUIRE_FALSE(fx.runner.execute(Phase::Run, ctx, record, tester).has_value());
    REQUIRE_FALSE(fx.runner.execute(Phase::Check, ctx, record, tester).has_value());

    REQUIRE(script.calls == std::vector<std::string>{"prepare"});
    REQUIRE(record.status_of(Phase::Run) == PhaseStatus::NotRun);
    REQUIRE(record.status_of(Phase::Check) == PhaseStatus::NotRun);
    // The full error text goes to the test-case log only.
    REQUIRE(record.log.find("prepare exploded") != std::string::npos);
    REQUIRE(fx.progress_text.str().find("prepare exploded") == std::string::npos);
}

TEST_CASE("A false test result is recorded as FAILED", "[phase_runner]")
{
    Fixture fx;
    auto ctx = fx.context("t2");
    fx.loader.script("t2").check = Action::Fail;

    TestRecord record;
    LazyTester tester(fx.loader, fx.external);
    REQUIRE(fx.runner.execute(Phase::Prepare, ctx, record, tester) == PhaseStatus::Ok);
    REQUIRE(fx.runner.execute(Phase::Run, ctx, record, tester) == PhaseStatus::Ok);
    REQUIRE(fx.runner.execute(Phase::Check, ctx, record, tester) == PhaseStatus::Failed);
    REQUIRE(fx.store.load(ctx.status_file).status_of(Phase::Check) == PhaseStatus::Failed);
}

TEST_CASE("Phases that already succeeded are skipped", "[phase_runner]")
{
    Fixture fx;
    auto ctx = fx.context("t1");
    auto& script = fx.loader.script("t1");

    TestRecord record;
    record.status[Phase::Prepare] = PhaseStatus::Ok;
    record.status[Phase::Run] = PhaseStatus::Ok;
    record.status[Phase::Check] = PhaseStatus::Ok;

    LazyTester tester(fx.loader, fx.external);
    for (const auto phase : tracked_phases()) {
        REQUIRE_FALSE(fx.runner.execute(phase, ctx, record, tester).has_value());
    }
    REQUIRE(script.calls.empty());
    REQUIRE(fx.loader.loads == 0);
    REQUIRE(fx.progress_text.str().empty());
}

TEST_CASE("Check waits for an unfinished run", "[phase_runner]")
{
    Fixture fx;
    auto ctx = fx.context("batch");
    auto& script = fx.loader.script("batch");
    script.finished = false;

    TestRecord record;
    record.status[Phase::Prepare] = PhaseStatus::Ok;
    record.status[Phase::Run] = PhaseStatus::Ok;
    const auto before = record.status;

    LazyTester tester(fx.loader, fx.external);
    REQUIRE_FALSE(fx.runner.execute(Phase::Check, ctx, record, tester).has_value());
    REQUIRE(record.status == before);
    REQUIRE(script.calls.empty());
    REQUIRE(fx.progress_text.str().find("Not finished") != std::string::npos);

    const auto persisted = fx.store.load(ctx.status_file);
    REQUIRE(persisted.status_of(Phase::Check) == PhaseStatus::NotRun);
    REQUIRE(persisted.log.find("Not finished") != std::string::npos);

    script.finished = true;
    REQUIRE(fx.runner.execute(Phase::Check, ctx, record, tester) == PhaseStatus::Ok);
}

TEST_CASE("Interrupted phases are re-attempted on the next invocation", "[phase_runner]")
{
    Fixture fx;
    auto ctx = fx.context("t1");
    auto& script = fx.loader.script("t1");
    script.monitor = &fx.interrupts;

    TestRecord record;
    record.status[Phase::Prepare] = PhaseStatus::Ok;

    SECTION("cooperative interrupt raised by the tester")
    {
        script.run = Action::Interrupt;
        LazyTester first(fx.loader, fx.external);
        REQUIRE(fx.runner.execute(Phase::Run, ctx, record, first) == PhaseStatus::Interrupted);
    }

    SECTION("signal observed while the tester was running")
    {
        script.run = Action::Signal;
        LazyTester first(fx.loader, fx.external);
        REQUIRE(fx.runner.execute(Phase::Run, ctx, record, first) == PhaseStatus::Interrupted);
    }

    REQUIRE(fx.store.load(ctx.status_file).status_of(Phase::Run) == PhaseStatus::Interrupted);

    // Next invocation: a fresh tester and a record reloaded from disk.
    script.run = Action::Succeed;
    auto reloaded = fx.store.load(ctx.status_file);
    LazyTester second(fx.loader, fx.external);
    REQUIRE(fx.runner.execute(Phase::Run, ctx, reloaded, second) == PhaseStatus::Ok);
}

TEST_CASE("A second interrupt aborts the run after persisting", "[phase_runner]")
{
    Fixture fx;
    auto ctx = fx.context("t1");
    auto& script = fx.loader.script("t1");
    script.monitor = &fx.interrupts;
    script.prepare = Action::Signal;
    script.signals = 2;

    TestRecord record;
    LazyTester tester(fx.loader, fx.external);
    REQUIRE_THROWS_AS(fx.runner.execute(Phase::Prepare, ctx, record, tester), RunAborted);
    REQUIRE(record.status_of(Phase::Prepare) == PhaseStatus::Interrupted);
    REQUIRE(fx.store.load(ctx.status_file).status_of(Phase::Prepare) == PhaseStatus::Interrupted);
    REQUIRE(fx.progress_text.str().find("aborting") != std::string::npos);
}

TEST_CASE("An interrupt during the grace window follows a cooperative one", "[phase_runner]")
{
    Fixture fx;
    auto ctx = fx.context("t1");
    auto& script = fx.loader.script("t1");
    script.prepare = Action::Interrupt;

    TestRecord record;
    LazyTester tester(fx.loader, fx.external);

    SECTION("second interrupt inside the window aborts")
    {
        PhaseRunner runner({.interrupt_grace = std::chrono::milliseconds{400}}, fx.store, fx.interrupts,
                           fx.progress);
        std::thread user([&fx] {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
            fx.interrupts.raise();
        });
        CHECK_THROWS_AS(runner.execute(Phase::Prepare, ctx, record, tester), RunAborted);
        user.join();
        REQUIRE(fx.store.load(ctx.status_file).status_of(Phase::Prepare) == PhaseStatus::Interrupted);
    }

    SECTION("quiet window keeps the run going")
    {
        PhaseRunner runner({.interrupt_grace = std::chrono::milliseconds{50}}, fx.store, fx.interrupts,
                           fx.progress);
        REQUIRE(runner.execute(Phase::Prepare, ctx, record, tester) == PhaseStatus::Interrupted);
        REQUIRE(fx.progress_text.str().find("aborting") == std::string::npos);
    }
}

TEST_CASE("Tester resolution failures become Error for the attempted phase", "[phase_runner]")
{
    Fixture fx;
    auto ctx = fx.context("unknown");  // no script registered

    TestRecord record;
    LazyTester tester(fx.loader, fx.external);
    REQUIRE(fx.runner.execute(Phase::Prepare, ctx, record, tester) == PhaseStatus::Error);
    REQUIRE(record.log.find("no tester script") != std::string::npos);

    record.status[Phase::Prepare] = PhaseStatus::Ok;
    REQUIRE(fx.runner.execute(Phase::Run, ctx, record, tester) == PhaseStatus::Error);
    REQUIRE(fx.loader.loads == 1);
}

TEST_CASE("The tester is resolved once and shared across phases", "[phase_runner]")
{
    Fixture fx;
    auto ctx = fx.context("t1");
    auto& script = fx.loader.script("t1");

    TestRecord record;
    LazyTester tester(fx.loader, fx.external);
    for (const auto phase : tracked_phases()) {
        REQUIRE(fx.runner.execute(phase, ctx, record, tester) == PhaseStatus::Ok);
    }
    REQUIRE(fx.loader.loads == 1);
    REQUIRE(script.calls == std::vector<std::string>{"prepare", "run", "test"});
}

TEST_CASE("Only tracked phases can be executed", "[phase_runner]")
{
    Fixture fx;
    auto ctx = fx.context("t1");
    TestRecord record;
    LazyTester tester(fx.loader, fx.external);
    REQUIRE_THROWS_AS(fx.runner.execute(Phase::Report, ctx, record, tester), std::invalid_argument);
    REQUIRE_THROWS_AS(fx.runner.execute(Phase::Cleanup, ctx, record, tester), std::invalid_argument);
}

TEST_CASE("Upstream requirements", "[phase_runner]")
{
    TestRecord record;
    REQUIRE(PhaseRunner::upstream_ok(Phase::Prepare, record));
    REQUIRE_FALSE(PhaseRunner::upstream_ok(Phase::Run, record));
    record.status[Phase::Prepare] = PhaseStatus::Ok;
    REQUIRE(PhaseRunner::upstream_ok(Phase::Run, record));
    REQUIRE_FALSE(PhaseRunner::upstream_ok(Phase::Check, record));
    record.status[Phase::Run] = PhaseStatus::Failed;
    REQUIRE_FALSE(PhaseRunner::upstream_ok(Phase::Check, record));
}
