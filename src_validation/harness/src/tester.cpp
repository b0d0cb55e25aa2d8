#include "valsim_harness/tester.hpp"
#include "valsim_harness/tester_loader.hpp"

#include <stdexcept>
#include <utility>

namespace valsim::harness {

CompositeTester::CompositeTester(std::unique_ptr<Preparator> preparator,
                                 std::unique_ptr<Calculator> calculator,
                                 std::unique_ptr<Checker> checker)
    : preparator_{std::move(preparator)},
      calculator_{std::move(calculator)},
      checker_{std::move(checker)} {
    if (!preparator_ || !calculator_ || !checker_) {
        throw std::invalid_argument("CompositeTester needs a preparator, a calculator and a checker");
    }
}

Tester& LazyTester::get(ExecutionContext& ctx) {
    if (tester_) {
        return *tester_;
    }
    if (failure_) {
        std::rethrow_exception(failure_);
    }
    try {
        tester_ = loader_->load(ctx, *external_);
    } catch (...) {
        failure_ = std::current_exception();
        throw;
    }
    if (!tester_) {
        failure_ = std::make_exception_ptr(
            std::runtime_error("No tester available for test case '" + ctx.test_case + "'"));
        std::rethrow_exception(failure_);
    }
    return *tester_;
}

}  // namespace valsim::harness
