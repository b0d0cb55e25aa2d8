#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "valsim_harness/tester.hpp"

namespace valsim::harness::process_bridge
{

/// Marker created in the work directory once the program has completed.
inline constexpr const char* kFinishedMarker = ".runfinished";

/**
 * Runs an external program inside the work directory.
 *
 * The program is started with the work directory as current directory. If a
 * file named `STDIN` exists there it becomes the standard input; standard output
 * and error are redirected to `STDOUT` and `STDERR` in the work directory. The
 * program inherits the process group, so a terminal interrupt reaches it too.
 *
 * run() blocks until the program terminates:
 *  - exit status 0 creates the finished marker,
 *  - termination by SIGINT raises Interrupted,
 *  - any other outcome raises std::runtime_error.
 */
class ProcessCalculator final : public Calculator
{
public:
    ProcessCalculator(std::filesystem::path work_dir, std::vector<std::string> argv);

    void run() override;

    // True once a run has completed successfully, also across invocations.
    [[nodiscard]] bool runfinished() override;

    [[nodiscard]] const std::vector<std::string>& argv() const noexcept { return argv_; }

private:
    std::filesystem::path work_dir_;
    std::vector<std::string> argv_;
};

}  // namespace valsim::harness::process_bridge
