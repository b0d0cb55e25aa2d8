#pragma once

#include <memory>

namespace valsim::harness {

/**
 * \brief Pluggable per-test-case behaviour supplied by the test-suite author.
 *
 * The engine only sequences these calls and records their outcome:
 *  - prepare(), run() and cleanup() signal failure by throwing;
 *  - test() returns false for a controlled negative result and throws only for
 *    infrastructure errors while checking;
 *  - runfinished() must be non-blocking and side-effect free. It is polled to
 *    decide whether Check is eligible, independently of Run's own status, since
 *    run() may return before the underlying work (e.g. a submitted job) is done.
 *
 * Long running implementations should throw valsim::harness::Interrupted when
 * they notice a user interrupt.
 */
class Tester {
public:
    virtual ~Tester() = default;

    virtual void prepare() = 0;
    virtual void run() = 0;
    [[nodiscard]] virtual bool runfinished() = 0;
    [[nodiscard]] virtual bool test() = 0;
    virtual void cleanup() = 0;
};

/// Sets up and tears down the work directory of a test case.
class Preparator {
public:
    virtual ~Preparator() = default;
    virtual void prepare() = 0;
    virtual void cleanup() = 0;
};

/// Runs (or starts) the calculation of a test case.
class Calculator {
public:
    virtual ~Calculator() = default;
    virtual void run() = 0;
    [[nodiscard]] virtual bool runfinished() = 0;
};

/// Compares the outcome of a calculation against reference data.
class Checker {
public:
    virtual ~Checker() = default;
    [[nodiscard]] virtual bool test() = 0;
};

/**
 * \brief Tester assembled from a preparator, a calculator and a checker.
 *
 * prepare()/cleanup() go to the preparator, run()/runfinished() to the
 * calculator and test() to the checker.
 */
class CompositeTester final : public Tester {
public:
    CompositeTester(std::unique_ptr<Preparator> preparator,
                    std::unique_ptr<Calculator> calculator,
                    std::unique_ptr<Checker> checker);

    void prepare() override { preparator_->prepare(); }
    void run() override { calculator_->run(); }
    [[nodiscard]] bool runfinished() override { return calculator_->runfinished(); }
    [[nodiscard]] bool test() override { return checker_->test(); }
    void cleanup() override { preparator_->cleanup(); }

private:
    std::unique_ptr<Preparator> preparator_;
    std::unique_ptr<Calculator> calculator_;
    std::unique_ptr<Checker> checker_;
};

}  // namespace valsim::harness
