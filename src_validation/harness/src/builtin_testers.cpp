#include "valsim_harness/builtin_testers.hpp"

#include <algorithm>
#include <cmath>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace valsim::harness {

DirectoryPreparator::DirectoryPreparator(fs::path input_dir, fs::path work_dir, const InterruptMonitor* interrupts)
    : input_dir_{std::move(input_dir)}, work_dir_{std::move(work_dir)}, interrupts_{interrupts} {}

void DirectoryPreparator::prepare() {
    if (!fs::is_directory(input_dir_)) {
        throw std::runtime_error("Input directory does not exist: " + input_dir_.string());
    }
    const InterruptCheckpoint checkpoint(interrupts_);
    fs::create_directories(work_dir_);
    for (const auto& entry : fs::directory_iterator(input_dir_)) {
        checkpoint.check();
        const auto target = work_dir_ / entry.path().filename();
        if (entry.is_directory()) {
            fs::copy(entry.path(), target, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
        } else {
            fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing);
        }
    }
}

TaggedChecker::TaggedChecker(fs::path reference_file, fs::path result_file, double abstol,
                             std::optional<std::string> tag_filter, TestLogger& log,
                             const InterruptMonitor* interrupts)
    : reference_file_{std::move(reference_file)},
      result_file_{std::move(result_file)},
      abstol_{abstol},
      tag_filter_{std::move(tag_filter)},
      log_{log},
      interrupts_{interrupts} {}

double TaggedChecker::max_deviation(const TaggedEntry& reference, const TaggedEntry& result) {
    double deviation = 0.0;
    const auto count = std::min(reference.values.size(), result.values.size());
    for (std::size_t i = 0; i < count; ++i) {
        const double diff = std::fabs(reference.values[i] - result.values[i]);
        // NaN never agrees with anything.
        if (std::isnan(diff)) {
            return diff;
        }
        deviation = std::max(deviation, diff);
    }
    return deviation;
}

bool TaggedChecker::test() {
    const InterruptCheckpoint checkpoint(interrupts_);
    const auto reference = read_tagged_file(reference_file_);
    const auto result = read_tagged_file(result_file_);

    std::vector<const TaggedEntry*> selected;
    if (tag_filter_) {
        selected = reference.matching(std::regex(*tag_filter_));
    } else {
        for (const auto& entry : reference.entries()) {
            selected.push_back(&entry);
        }
    }

    if (selected.empty()) {
        log_.testfailure("No reference data selected");
        return false;
    }

    bool passed = true;
    log_.block_open("Comparing " + result_file_.filename().string() + " against " + reference_file_.string());
    for (const auto* expected : selected) {
        checkpoint.check();
        const auto* actual = result.find(expected->name);
        if (actual == nullptr) {
            log_.testfailure("'" + expected->name + "': missing in result");
            passed = false;
            continue;
        }
        if (!expected->comparable(*actual)) {
            log_.testfailure("'" + expected->name + "': incompatible entries (" + expected->tagline + " vs " +
                             actual->tagline + ")");
            passed = false;
            continue;
        }

        const double deviation = max_deviation(*expected, *actual);
        const bool exact = expected->type == TaggedType::Integer || expected->type == TaggedType::Logical;
        const bool agrees = exact ? deviation == 0.0 : deviation <= abstol_;
        std::ostringstream msg;
        msg << "'" << expected->name << "': max. deviation " << deviation;
        if (agrees) {
            log_.testsuccess(msg.str());
        } else {
            msg << " > " << (exact ? 0.0 : abstol_);
            log_.testfailure(msg.str());
            passed = false;
        }
    }
    log_.block_close();
    return passed;
}

}  // namespace valsim::harness
