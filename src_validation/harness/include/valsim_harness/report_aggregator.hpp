#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "execution_context.hpp"
#include "phase.hpp"
#include "status_store.hpp"
#include "test_logger.hpp"

namespace valsim::harness {

/// Persisted outcome of one test case as seen by the report.
struct ReportEntry {
    std::string test_case;
    std::map<Phase, PhaseStatus> status;
    std::string log;
};

/**
 * \brief Renders the summary table and the detailed logs of a run.
 *
 * Records are always reloaded from disk, since the report may run in a separate
 * invocation from the execution. An unreadable status file shows as all Not run.
 * The detail stream (one banner plus the captured log per test case) goes to
 * \p detail_file when given, otherwise it is echoed to the summary sink once the
 * whole table has been written.
 */
class ReportAggregator {
public:
    explicit ReportAggregator(const StatusStore& store) : store_{store} {}

    std::vector<ReportEntry> render(const std::vector<ExecutionContext>& contexts,
                                    TestLogger& summary,
                                    const std::optional<std::filesystem::path>& detail_file) const;

private:
    const StatusStore& store_;
};

}  // namespace valsim::harness
