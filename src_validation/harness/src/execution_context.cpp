#include "valsim_harness/execution_context.hpp"
#include "string_utils.hpp"

#include <stdexcept>
#include <string_view>

namespace {

using valsim::harness::detail::trim_copy;

}  // namespace

namespace valsim::harness {

ExecutionContext make_context(const std::filesystem::path& test_root,
                              const std::filesystem::path& work_root,
                              const std::string& test_case) {
    ExecutionContext ctx;
    ctx.test_root = test_root;
    ctx.test_case = test_case;
    ctx.test_dir = test_root / test_case;
    ctx.work_root = work_root;
    ctx.work_dir = work_root / test_case;
    ctx.status_file = ctx.work_dir / kStatusFileName;
    return ctx;
}

ExternalContext parse_external_context(const std::vector<std::string>& assignments) {
    ExternalContext context;
    for (const auto& entry : assignments) {
        const auto delimiter = entry.find('=');
        if (delimiter == std::string::npos) {
            throw std::runtime_error("Expected 'key=value' context entry, got '" + entry + "'");
        }
        auto key = trim_copy(std::string_view{entry}.substr(0, delimiter));
        if (key.empty()) {
            throw std::runtime_error("Empty key in context entry '" + entry + "'");
        }
        context[std::move(key)] = entry.substr(delimiter + 1);
    }
    return context;
}

}  // namespace valsim::harness
