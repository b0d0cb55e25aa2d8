#include "valsim_harness/cli.hpp"

#include <stdexcept>
#include <utility>

#include "valsim_harness/execution_context.hpp"
#include "valsim_harness/interrupt.hpp"
#include "valsim_harness/metrics_writer.hpp"
#include "valsim_harness/pattern_resolver.hpp"
#include "valsim_harness/test_definition.hpp"
#include "valsim_harness/test_logger.hpp"

namespace valsim::harness::cli {

namespace {

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

const std::string& expect_value(std::size_t& i, const std::vector<std::string>& argv, std::string_view option) {
    if (i + 1 >= argv.size()) {
        throw std::runtime_error(std::string{option} + " expects a value");
    }
    return argv[++i];
}

std::chrono::milliseconds parse_grace(const std::string& raw) {
    std::size_t used = 0;
    long long value = -1;
    try {
        value = std::stoll(raw, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != raw.size() || value < 0) {
        throw std::runtime_error("--grace-ms expects a non-negative integer, got '" + raw + "'");
    }
    return std::chrono::milliseconds{value};
}

}  // namespace

void print_usage(std::ostream& out, std::string_view program) {
    out << "Validation run orchestrator\n"
        << "Usage:\n"
        << "  " << program << " [options] [pattern ...]\n"
        << "\n"
        << "Options:\n"
        << "  -p, --phases <letters>   Phases to execute: p(repare) r(un) t(est) s(ummary) c(leanup)\n"
        << "                           (default: prts).\n"
        << "  -t, --test-root <dir>    Root of the test directories (default: .).\n"
        << "  -w, --work-root <dir>    Root of the work directories (default: _work).\n"
        << "  -r, --report-file <path> Write the detailed report to this file instead of stdout.\n"
        << "  -f, --pattern-file <f>   File with test name patterns, one per line (repeatable).\n"
        << "  -c, --context <k=v>      External context entry passed to the testers (repeatable).\n"
        << "  -l, --list               Print the selected test cases and exit.\n"
        << "  --summary-json <path>    Write a JSON summary of the report.\n"
        << "  --html <path>            Write an HTML report.\n"
        << "  --grace-ms <n>           Pause after an interrupt in milliseconds (default: 1000).\n"
        << "  -h, --help               Show this help message.\n"
        << "\n"
        << "Without pattern files and patterns, all entries of the test root are selected.\n"
        << "A second interrupt (Ctrl-C) within the pause aborts the whole run.\n"
        << std::endl;
}

Args parse_args(const std::vector<std::string>& argv) {
    Args args;
    for (std::size_t i = 1; i < argv.size(); ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            return args;
        } else if (arg_eq(tok, "-p") || arg_eq(tok, "--phases")) {
            args.phases = PhaseSelection::parse(expect_value(i, argv, tok));
        } else if (arg_eq(tok, "-t") || arg_eq(tok, "--test-root")) {
            args.test_root = std::filesystem::path(expect_value(i, argv, tok));
        } else if (arg_eq(tok, "-w") || arg_eq(tok, "--work-root")) {
            args.work_root = std::filesystem::path(expect_value(i, argv, tok));
        } else if (arg_eq(tok, "-r") || arg_eq(tok, "--report-file")) {
            args.report_file = std::filesystem::path(expect_value(i, argv, tok));
        } else if (arg_eq(tok, "-f") || arg_eq(tok, "--pattern-file")) {
            args.pattern_files.emplace_back(expect_value(i, argv, tok));
        } else if (arg_eq(tok, "-c") || arg_eq(tok, "--context")) {
            args.context.emplace_back(expect_value(i, argv, tok));
        } else if (arg_eq(tok, "-l") || arg_eq(tok, "--list")) {
            args.list = true;
        } else if (arg_eq(tok, "--summary-json")) {
            args.summary_path = std::filesystem::path(expect_value(i, argv, tok));
        } else if (arg_eq(tok, "--html")) {
            args.html_path = std::filesystem::path(expect_value(i, argv, tok));
        } else if (arg_eq(tok, "--grace-ms")) {
            args.grace = parse_grace(expect_value(i, argv, tok));
        } else if (tok.size() > 1 && tok.front() == '-') {
            throw std::runtime_error("Unknown option '" + std::string{tok} + "'");
        } else {
            args.patterns.emplace_back(tok);
        }
    }

    if (!std::filesystem::is_directory(args.test_root)) {
        throw std::runtime_error("Test root is not a directory: " + args.test_root.string());
    }
    if (args.pattern_files.empty() && args.patterns.empty()) {
        args.patterns.emplace_back("*");
    }
    return args;
}

int exit_code_for(const RunSummary& summary) noexcept {
    return summary.has_problems() ? kExitProblems : kExitOk;
}

int run(const std::vector<std::string>& argv, std::ostream& out, std::ostream& err) {
    const std::string_view program = argv.empty() ? std::string_view{"valsim"} : std::string_view{argv.front()};

    Args args;
    std::vector<std::string> test_cases;
    ExternalContext external;
    try {
        args = parse_args(argv);
        if (args.help) {
            print_usage(err, program);
            return kExitOk;
        }
        external = parse_external_context(args.context);
        test_cases = PatternResolver{}.resolve(args.test_root, args.pattern_files, args.patterns);
    } catch (const std::exception& ex) {
        err << "ERROR: " << ex.what() << "\n";
        print_usage(err, program);
        return kExitConfig;
    }

    if (args.list) {
        for (const auto& test_case : test_cases) {
            out << test_case << "\n";
        }
        return kExitOk;
    }

    try {
        InterruptMonitor interrupts;
        interrupts.install();

        TestLogger progress(out);
        const DefinitionTesterLoader loader(&interrupts);
        Orchestrator orchestrator({.test_root = args.test_root,
                                   .work_root = args.work_root,
                                   .phases = args.phases,
                                   .report_file = args.report_file,
                                   .interrupt_grace = args.grace},
                                  loader, std::move(external), progress, interrupts);
        const auto summary = orchestrator.run(test_cases);

        if (args.phases.contains(Phase::Report)) {
            MetricsWriter writer;
            if (args.summary_path) {
                writer.write_summary(*args.summary_path, summary.report);
            }
            if (args.html_path) {
                writer.write_detailed(*args.html_path, summary.report);
            }
        }

        return exit_code_for(summary);
    } catch (const RunAborted& ex) {
        err << "ABORTED: " << ex.what() << "\n";
        return kExitAborted;
    } catch (const std::exception& ex) {
        err << "ERROR: " << ex.what() << "\n";
        return kExitInternal;
    } catch (...) {
        err << "ERROR: Unknown exception\n";
        return kExitInternal;
    }
}

}  // namespace valsim::harness::cli
