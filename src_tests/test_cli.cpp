/**
 * @file test_cli.cpp
 * @brief Unit Tests for the command-line front end: option parsing, list mode and exit codes
 *
 * © 2025 Uni-Libraries contributors — MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "valsim_harness/cli.hpp"
#include "valsim_harness/orchestrator.hpp"
#include "valsim_harness/phase.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace valsim::harness;
using valsim_test::TempDir;
using valsim_test::write_text;

namespace {

constexpr const char* kEnergy = "@total_energy:real:0:\n -4.0779379\n";

/// Test case whose Run executes \p command and whose result is copied in by Prepare.
void make_case(const std::filesystem::path& test_dir, const std::string& command, const std::string& result)
{
    write_text(test_dir / "testcase.scn", "command = " + command + "\nresult = results.tag\n");
    write_text(test_dir / "results.tag", kEnergy);
    write_text(test_dir / "input" / "results.tag", result);
}

}  // namespace

TEST_CASE("Command-line options are parsed", "[cli]")
{
    TempDir tmp;
    const auto root = tmp.path().string();

    SECTION("defaults select every entry")
    {
        const auto args = cli::parse_args({"valsim", "-t", root});
        REQUIRE(args.test_root == tmp.path());
        REQUIRE(args.work_root == std::filesystem::path("_work"));
        REQUIRE(args.patterns == std::vector<std::string>{"*"});
        REQUIRE(args.phases.contains(Phase::Prepare));
        REQUIRE_FALSE(args.phases.contains(Phase::Cleanup));
        REQUIRE(args.grace == std::chrono::milliseconds{1000});
        REQUIRE_FALSE(args.list);
    }

    SECTION("every option")
    {
        const auto args = cli::parse_args({"valsim", "--test-root", root, "-w", "/scratch", "-p", "rc", "-r",
                                           "report.txt", "-f", "selection.txt", "-c", "dftb=/opt/dftb",
                                           "--summary-json", "s.json", "--html", "r.html", "--grace-ms", "25",
                                           "-l", "h2o*"});
        REQUIRE(args.work_root == std::filesystem::path("/scratch"));
        REQUIRE(args.phases.contains(Phase::Run));
        REQUIRE(args.phases.contains(Phase::Cleanup));
        REQUIRE_FALSE(args.phases.contains(Phase::Prepare));
        REQUIRE(args.report_file == std::filesystem::path("report.txt"));
        REQUIRE(args.pattern_files == std::vector<std::filesystem::path>{"selection.txt"});
        REQUIRE(args.context == std::vector<std::string>{"dftb=/opt/dftb"});
        REQUIRE(args.summary_path == std::filesystem::path("s.json"));
        REQUIRE(args.html_path == std::filesystem::path("r.html"));
        REQUIRE(args.grace == std::chrono::milliseconds{25});
        REQUIRE(args.list);
        // A pattern file given: no implicit '*'.
        REQUIRE(args.patterns == std::vector<std::string>{"h2o*"});
    }

    SECTION("help stops parsing")
    {
        REQUIRE(cli::parse_args({"valsim", "-h", "--bogus"}).help);
    }

    SECTION("configuration errors")
    {
        REQUIRE_THROWS_AS(cli::parse_args({"valsim", "-t", root, "--bogus"}), std::runtime_error);
        REQUIRE_THROWS_AS(cli::parse_args({"valsim", "-t", root, "-p"}), std::runtime_error);
        REQUIRE_THROWS_AS(cli::parse_args({"valsim", "-t", root, "-p", "prx"}), std::runtime_error);
        REQUIRE_THROWS_AS(cli::parse_args({"valsim", "-t", root, "--grace-ms", "-5"}), std::runtime_error);
        REQUIRE_THROWS_AS(cli::parse_args({"valsim", "-t", root, "--grace-ms", "1s"}), std::runtime_error);
        REQUIRE_THROWS_AS(cli::parse_args({"valsim", "-t", (tmp.path() / "absent").string()}), std::runtime_error);
    }
}

TEST_CASE("List mode prints the selected test cases", "[cli]")
{
    TempDir tmp;
    std::filesystem::create_directories(tmp.path() / "suite" / "h2o");
    std::filesystem::create_directories(tmp.path() / "suite" / "ch4");
    std::filesystem::create_directories(tmp.path() / "suite" / "h2");
    const auto root = (tmp.path() / "suite").string();
    std::ostringstream out;
    std::ostringstream err;

    SECTION("all entries in sorted order")
    {
        REQUIRE(cli::run({"valsim", "-t", root, "-l"}, out, err) == cli::kExitOk);
        REQUIRE(out.str() == "ch4\nh2\nh2o\n");
    }

    SECTION("patterns keep their order")
    {
        REQUIRE(cli::run({"valsim", "-t", root, "--list", "h2o", "h*"}, out, err) == cli::kExitOk);
        REQUIRE(out.str() == "h2o\nh2\n");
    }

    REQUIRE(err.str().empty());
}

TEST_CASE("Configuration errors exit with code 2", "[cli]")
{
    TempDir tmp;
    std::ostringstream out;
    std::ostringstream err;

    SECTION("unknown phase letter")
    {
        REQUIRE(cli::run({"valsim", "-t", tmp.path().string(), "-p", "x"}, out, err) == cli::kExitConfig);
    }

    SECTION("malformed context entry")
    {
        REQUIRE(cli::run({"valsim", "-t", tmp.path().string(), "-c", "novalue"}, out, err) == cli::kExitConfig);
    }

    SECTION("missing pattern file")
    {
        REQUIRE(cli::run({"valsim", "-t", tmp.path().string(), "-f", (tmp.path() / "absent.txt").string()}, out,
                         err) == cli::kExitConfig);
    }

    REQUIRE(err.str().find("ERROR: ") == 0);
    REQUIRE(err.str().find("Usage:") != std::string::npos);
    REQUIRE(out.str().empty());
}

TEST_CASE("Help exits with code 0", "[cli]")
{
    std::ostringstream out;
    std::ostringstream err;
    REQUIRE(cli::run({"valsim", "--help"}, out, err) == cli::kExitOk);
    REQUIRE(err.str().find("--grace-ms") != std::string::npos);
}

TEST_CASE("Exit code follows the tracked statuses", "[cli]")
{
    RunSummary summary;
    REQUIRE(cli::exit_code_for(summary) == cli::kExitOk);

    summary.cases.push_back({.test_case = "t1",
                             .status = {{Phase::Prepare, PhaseStatus::Ok}, {Phase::Run, PhaseStatus::NotRun}}});
    REQUIRE(cli::exit_code_for(summary) == cli::kExitOk);

    for (const auto bad : {PhaseStatus::Failed, PhaseStatus::Error, PhaseStatus::Interrupted}) {
        auto problem = summary;
        problem.cases.push_back({.test_case = "t2", .status = {{Phase::Check, bad}}});
        REQUIRE(cli::exit_code_for(problem) == cli::kExitProblems);
    }
}

TEST_CASE("Complete runs map their outcome to the exit code", "[cli]")
{
    TempDir tmp;
    const auto suite = tmp.path() / "suite";
    const auto work = (tmp.path() / "_work").string();
    std::ostringstream out;
    std::ostringstream err;

    SECTION("agreeing results exit with code 0")
    {
        make_case(suite / "h2o", "/bin/true", kEnergy);
        REQUIRE(cli::run({"valsim", "-t", suite.string(), "-w", work, "-p", "prts"}, out, err) == cli::kExitOk);
        REQUIRE(out.str().find("h2o") != std::string::npos);
    }

    SECTION("a failed check exits with code 1")
    {
        make_case(suite / "h2o", "/bin/true", "@total_energy:real:0:\n -5.0\n");
        REQUIRE(cli::run({"valsim", "-t", suite.string(), "-w", work, "-p", "prt"}, out, err) ==
                cli::kExitProblems);
    }

    SECTION("a failing program exits with code 1")
    {
        make_case(suite / "h2o", "/bin/false", kEnergy);
        REQUIRE(cli::run({"valsim", "-t", suite.string(), "-w", work, "-p", "prt"}, out, err) ==
                cli::kExitProblems);
    }

    SECTION("a double interrupt exits with code 130")
    {
        // The program sends two SIGINTs to the harness while it waits for it.
        make_case(suite / "h2o", R"(/bin/sh -c "kill -INT $PPID; sleep 0.2; kill -INT $PPID; sleep 0.2")",
                  kEnergy);
        make_case(suite / "h2s", "/bin/true", kEnergy);
        REQUIRE(cli::run({"valsim", "-t", suite.string(), "-w", work, "-p", "prt", "--grace-ms", "0"}, out, err) ==
                cli::kExitAborted);
        REQUIRE(err.str().find("ABORTED") != std::string::npos);
        REQUIRE_FALSE(std::filesystem::exists(tmp.path() / "_work" / "h2s"));
    }
}
