#include "valsim_harness/metrics_writer.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using valsim::harness::Phase;
using valsim::harness::PhaseStatus;
using valsim::harness::ReportEntry;

PhaseStatus status_in(const ReportEntry& entry, Phase phase) {
    auto it = entry.status.find(phase);
    return it == entry.status.end() ? PhaseStatus::NotRun : it->second;
}

json entry_to_json(const ReportEntry& entry) {
    json status = json::object();
    for (const auto phase : valsim::harness::tracked_phases()) {
        status[std::string{valsim::harness::phase_key(phase)}] =
            std::string{valsim::harness::status_key(status_in(entry, phase))};
    }
    return json{
        {"testcase", entry.test_case},
        {"status", std::move(status)},
        {"log", entry.log},
    };
}

json build_summary(const std::vector<ReportEntry>& entries) {
    json summary = {
        {"total", entries.size()},
        {"by_phase", json::object()},
        {"testcases", json::array()},
    };

    auto& by_phase = summary["by_phase"];
    for (const auto& entry : entries) {
        summary["testcases"].push_back(entry_to_json(entry));
        for (const auto phase : valsim::harness::tracked_phases()) {
            auto& counter = by_phase[std::string{valsim::harness::phase_key(phase)}]
                                    [std::string{valsim::harness::status_key(status_in(entry, phase))}];
            if (!counter.is_number()) {
                counter = 0;
            }
            counter = counter.get<std::size_t>() + 1;
        }
    }

    return summary;
}

std::string escape_html(const std::string& input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

std::string status_cell(PhaseStatus status) {
    const std::string key{valsim::harness::status_key(status)};
    return "<td class=\"status-" + key + "\">" +
           escape_html(std::string{valsim::harness::to_string(status)}) + "</td>";
}

std::string render_html(const std::vector<ReportEntry>& entries) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>Validation Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << "pre{margin:0;white-space:pre-wrap;}"
        << ".status-ok{color:#0a7c2f;font-weight:bold;}"
        << ".status-failed{color:#c1121f;font-weight:bold;}"
        << ".status-not_run{color:#7a7a7a;}"
        << ".status-interrupted{color:#ff8800;font-weight:bold;}"
        << ".status-error{color:#b000b5;font-weight:bold;}"
        << "</style></head><body>";

    oss << "<h1>Validation Report</h1>";

    std::map<PhaseStatus, std::size_t> check_counts;
    for (const auto& entry : entries) {
        ++check_counts[status_in(entry, Phase::Check)];
    }

    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Total test cases: " << entries.size() << "</li>";
    for (const auto& [status, count] : check_counts) {
        oss << "<li>test " << escape_html(std::string{valsim::harness::to_string(status)}) << ": " << count
            << "</li>";
    }
    oss << "</ul></section>";

    oss << "<section><h2>Test cases</h2><table>";
    oss << "<thead><tr>"
        << "<th>#</th>"
        << "<th>Test case</th>"
        << "<th>Prepare</th>"
        << "<th>Run</th>"
        << "<th>Test</th>"
        << "<th>Log</th>"
        << "</tr></thead><tbody>";

    for (std::size_t index = 0; index < entries.size(); ++index) {
        const auto& entry = entries[index];
        oss << "<tr>";
        oss << "<td>" << (index + 1) << "</td>";
        oss << "<td>" << escape_html(entry.test_case) << "</td>";
        oss << status_cell(status_in(entry, Phase::Prepare));
        oss << status_cell(status_in(entry, Phase::Run));
        oss << status_cell(status_in(entry, Phase::Check));
        oss << "<td><pre>" << escape_html(entry.log) << "</pre></td>";
        oss << "</tr>";
    }

    oss << "</tbody></table></section>";
    oss << "</body></html>";
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace valsim::harness {

void MetricsWriter::write_summary(const std::filesystem::path& destination,
                                  const std::vector<ReportEntry>& entries) const {
    const json summary = build_summary(entries);
    write_file(destination, summary.dump(2, ' ', false, json::error_handler_t::replace));
}

void MetricsWriter::write_detailed(const std::filesystem::path& destination,
                                   const std::vector<ReportEntry>& entries) const {
    const auto html = render_html(entries);
    write_file(destination, html);
}

}  // namespace valsim::harness
