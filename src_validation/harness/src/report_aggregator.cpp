#include "valsim_harness/report_aggregator.hpp"

#include <fstream>
#include <string>

namespace {

const std::string kSeparator(79, '-');

void write_details(valsim::harness::TestLogger& out, const std::vector<valsim::harness::ReportEntry>& entries) {
    for (const auto& entry : entries) {
        out.testheader(entry.test_case);
        if (!entry.log.empty()) {
            out.write(entry.log);
        }
    }
}

}  // namespace

namespace valsim::harness {

std::vector<ReportEntry> ReportAggregator::render(const std::vector<ExecutionContext>& contexts,
                                                  TestLogger& summary,
                                                  const std::optional<std::filesystem::path>& detail_file) const {
    std::vector<ReportEntry> entries;
    entries.reserve(contexts.size());

    summary.writeline(kSeparator);
    summary.testsummary("testcase", "prepare", "run", "test");
    summary.writeline(kSeparator);
    for (const auto& ctx : contexts) {
        const auto record = store_.load(ctx.status_file);
        summary.testsummary(ctx.test_case, record.status_of(Phase::Prepare), record.status_of(Phase::Run),
                            record.status_of(Phase::Check));
        entries.push_back(ReportEntry{ctx.test_case, record.status, record.log});
    }
    summary.writeline(kSeparator);

    if (detail_file) {
        std::ofstream output(*detail_file);
        if (output.is_open()) {
            TestLogger detail(output);
            write_details(detail, entries);
            output.flush();
            if (output) {
                return entries;
            }
        }
        summary.writeline("WARNING: unable to write report file " + detail_file->string() +
                          ", writing details here");
    }
    write_details(summary, entries);
    return entries;
}

}  // namespace valsim::harness
