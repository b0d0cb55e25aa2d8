#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "interrupt.hpp"
#include "tagged_file.hpp"
#include "test_logger.hpp"
#include "tester.hpp"

namespace valsim::harness {

/**
 * \brief Copies the content of an input directory into the work directory.
 *
 * Files and whole directory trees are copied; existing files are overwritten.
 * A missing input directory makes prepare() throw. cleanup() does nothing.
 * With a monitor, an interrupt between two entries raises Interrupted.
 */
class DirectoryPreparator final : public Preparator {
public:
    DirectoryPreparator(std::filesystem::path input_dir,
                        std::filesystem::path work_dir,
                        const InterruptMonitor* interrupts = nullptr);

    void prepare() override;
    void cleanup() override {}

private:
    std::filesystem::path input_dir_;
    std::filesystem::path work_dir_;
    const InterruptMonitor* interrupts_;
};

/**
 * \brief Compares a tagged result file against tagged reference data.
 *
 * Every reference entry (or every entry whose tag line matches the filter) must
 * exist in the result with the same name, type, rank and shape. Real and complex
 * components must agree within the absolute tolerance, integer and logical values
 * exactly. Each compared entry is reported on the test-case log. With a
 * monitor, an interrupt between two entries raises Interrupted.
 */
class TaggedChecker final : public Checker {
public:
    TaggedChecker(std::filesystem::path reference_file,
                  std::filesystem::path result_file,
                  double abstol,
                  std::optional<std::string> tag_filter,
                  TestLogger& log,
                  const InterruptMonitor* interrupts = nullptr);

    /// \throws std::runtime_error / TaggedFileError when a file cannot be read.
    [[nodiscard]] bool test() override;

    /// Maximal deviation of two comparable entries.
    [[nodiscard]] static double max_deviation(const TaggedEntry& reference, const TaggedEntry& result);

private:
    std::filesystem::path reference_file_;
    std::filesystem::path result_file_;
    double abstol_;
    std::optional<std::string> tag_filter_;
    TestLogger& log_;
    const InterruptMonitor* interrupts_;
};

}  // namespace valsim::harness
