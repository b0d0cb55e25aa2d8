#pragma once

#include "report_aggregator.hpp"

#include <filesystem>
#include <vector>

namespace valsim::harness {

/**
 * \brief Emits machine-readable and human-friendly artifacts of a report.
 *
 * - write_summary(): JSON document with per-test-case statuses and logs plus
 *   aggregate counts per phase and status.
 * - write_detailed(): HTML report with a tabular view of the outcomes.
 *
 * Both throw std::runtime_error when the destination cannot be written.
 */
class MetricsWriter {
public:
    MetricsWriter() = default;

    void write_summary(const std::filesystem::path& destination,
                       const std::vector<ReportEntry>& entries) const;

    void write_detailed(const std::filesystem::path& destination,
                        const std::vector<ReportEntry>& entries) const;
};

}  // namespace valsim::harness
