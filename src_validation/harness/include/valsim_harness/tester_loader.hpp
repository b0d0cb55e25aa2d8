#pragma once

#include <exception>
#include <memory>

#include "execution_context.hpp"
#include "tester.hpp"

namespace valsim::harness {

/**
 * \brief Resolves the tester of a test case.
 *
 * How the tester is produced (definition file, registry, plugin) is up to the
 * implementation. The engine requires determinism (same inputs give a
 * functionally equivalent tester) and accepts that resolution throws; the phase
 * being attempted is then recorded as Error.
 */
class TesterLoader {
public:
    virtual ~TesterLoader() = default;

    [[nodiscard]] virtual std::unique_ptr<Tester> load(ExecutionContext& ctx,
                                                       const ExternalContext& external) const = 0;
};

/**
 * \brief Resolves a tester on first use and shares it for the rest of the process.
 *
 * One instance per test case per process invocation: Prepare, Run, Check and
 * Cleanup of the same test case all talk to the same tester. A failed resolution
 * is remembered and rethrown on every later access.
 */
class LazyTester {
public:
    LazyTester(const TesterLoader& loader, const ExternalContext& external)
        : loader_{&loader}, external_{&external} {}

    /// \throws whatever the loader throws.
    Tester& get(ExecutionContext& ctx);

    [[nodiscard]] bool resolved() const noexcept { return tester_ != nullptr; }

private:
    const TesterLoader* loader_;
    const ExternalContext* external_;
    std::unique_ptr<Tester> tester_;
    std::exception_ptr failure_;
};

}  // namespace valsim::harness
