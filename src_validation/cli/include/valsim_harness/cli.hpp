#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "valsim_harness/orchestrator.hpp"
#include "valsim_harness/phase.hpp"

namespace valsim::harness::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitProblems = 1;
inline constexpr int kExitConfig = 2;
inline constexpr int kExitInternal = 3;
inline constexpr int kExitAborted = 130;

struct Args {
    PhaseSelection phases{PhaseSelection::defaults()};
    std::filesystem::path test_root{"."};
    std::filesystem::path work_root{"_work"};
    std::optional<std::filesystem::path> report_file{};
    std::vector<std::filesystem::path> pattern_files;
    std::vector<std::string> context;
    std::vector<std::string> patterns;
    std::optional<std::filesystem::path> summary_path{};
    std::optional<std::filesystem::path> html_path{};
    std::chrono::milliseconds grace{1000};
    bool list{false};
    bool help{false};
};

void print_usage(std::ostream& out, std::string_view program);

/**
 * \brief Parses the command line; \p argv[0] is the program name.
 *
 * Without pattern files and patterns, `*` is selected.
 * \throws std::runtime_error on unknown options, missing values, bad phase
 *         letters or a test root that is not a directory.
 */
[[nodiscard]] Args parse_args(const std::vector<std::string>& argv);

/// kExitProblems if any tracked status is Failed, Error or Interrupted, else kExitOk.
[[nodiscard]] int exit_code_for(const RunSummary& summary) noexcept;

/**
 * \brief Runs the tool as `main` would and returns the process exit code.
 *
 * Progress, the list output and the report go to \p out; usage and errors go
 * to \p err. SIGINT is routed to the run's InterruptMonitor while testers run.
 */
int run(const std::vector<std::string>& argv, std::ostream& out, std::ostream& err);

}  // namespace valsim::harness::cli
