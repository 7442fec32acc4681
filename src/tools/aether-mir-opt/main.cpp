//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the `aether-mir-opt` CLI. The executable builds one of the bundled
// demo programs, runs a named pipeline (or an explicit pass list) over it and
// prints the program before and after together with the pipeline report.
// Instrumentation requested on the command line (per-pass dumps, trace lines,
// verification failures) goes to stderr.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the MIR optimizer command-line tool.

#include "mir/core/Program.hpp"
#include "mir/io/Printer.hpp"
#include "mir/transform/PassManager.hpp"
#include "mir/verify/Validator.hpp"
#include "support/diag_expected.hpp"
#include "tools/aether-mir-opt/demos.hpp"

#include <charconv>
#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace aether::tools::mir_opt
{
namespace
{

void usage(std::ostream &err)
{
    err << "Usage: aether-mir-opt [options] <demo>\n"
           "  --pipeline <id>        default | advanced | whole-program | pgo\n"
           "  --passes <a,b,...>     run an explicit pass list instead\n"
           "  --profile <file>       profile data for the pgo pipeline\n"
           "  --max-iterations <n>   bound on rounds over the pipeline (default 10)\n"
           "  --print-before         dump the program before each pass\n"
           "  --print-after          dump the program after each pass\n"
           "  --trace                per-pass trace lines\n"
           "  --no-verify            skip validation after each pass\n"
           "  --list                 list the bundled demos\n";
}

std::vector<std::string> splitPasses(const std::string &text)
{
    std::vector<std::string> out;
    std::string item;
    std::istringstream in(text);
    while (std::getline(in, item, ','))
    {
        if (!item.empty())
            out.push_back(item);
    }
    return out;
}

bool parseUnsigned(const std::string &text, unsigned &value)
{
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    return !text.empty() && ec == std::errc() && ptr == last;
}

void printReport(const mir::transform::PipelineReport &report, std::ostream &out)
{
    out << "; status: " << mir::transform::toString(report.status()) << '\n';
    out << "; iterations: " << report.iterations << (report.converged ? " (converged)" : "")
        << '\n';
    for (const auto &[pass, rounds] : report.passChanges)
        out << ";   " << pass << ": changed in " << rounds << " round(s)\n";
    for (const auto &w : report.warnings)
        out << "; warning: " << w << '\n';
    for (const auto &n : report.notes)
        out << "; note: " << n << '\n';
}

} // namespace

/// @brief Execute the aether-mir-opt workflow with injectable streams.
/// @return Zero on success; one on argument errors or a failed pipeline.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    std::string pipelineId = "default";
    std::vector<std::string> passList;
    std::string demo;
    mir::transform::OptimizerOptions options;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto next = [&](std::string &dst)
        {
            if (i + 1 >= argc)
            {
                err << "missing value for " << arg << '\n';
                return false;
            }
            dst = argv[++i];
            return true;
        };

        if (arg == "--list")
        {
            for (const auto &name : demoNames())
                out << name << '\n';
            return 0;
        }
        if (arg == "--pipeline")
        {
            if (!next(pipelineId))
                return 1;
        }
        else if (arg == "--passes")
        {
            std::string text;
            if (!next(text))
                return 1;
            passList = splitPasses(text);
        }
        else if (arg == "--profile")
        {
            if (!next(options.profilePath))
                return 1;
        }
        else if (arg == "--max-iterations")
        {
            std::string text;
            if (!next(text))
                return 1;
            if (!parseUnsigned(text, options.maxIterations))
            {
                err << "invalid --max-iterations value '" << text << "'\n";
                return 1;
            }
        }
        else if (arg == "--print-before")
            options.printBefore = true;
        else if (arg == "--print-after")
            options.printAfter = true;
        else if (arg == "--trace")
            options.trace = true;
        else if (arg == "--no-verify")
            options.verify = false;
        else if (!arg.empty() && arg[0] == '-')
        {
            err << "unknown option " << arg << '\n';
            usage(err);
            return 1;
        }
        else if (demo.empty())
            demo = arg;
        else
        {
            usage(err);
            return 1;
        }
    }

    if (demo.empty())
    {
        usage(err);
        return 1;
    }
    auto program = makeDemo(demo);
    if (!program)
    {
        err << "unknown demo '" << demo << "' (try --list)\n";
        return 1;
    }
    if (auto valid = mir::verify::Validator::verify(*program); !valid)
    {
        mir::support::printDiag(valid.error(), err);
        return 1;
    }

    out << "; before\n";
    mir::io::Printer::write(*program, out);

    mir::transform::PassManager pm;
    pm.setInstrumentationStream(err);
    auto report = passList.empty() ? pm.runPipeline(*program, pipelineId, options)
                                   : pm.run(*program, passList, options);
    if (!report)
    {
        mir::support::printDiag(report.error(), err);
        return 1;
    }

    out << "; after\n";
    mir::io::Printer::write(*program, out);
    printReport(report.value(), out);
    return 0;
}

} // namespace aether::tools::mir_opt

int main(int argc, char **argv)
{
    return aether::tools::mir_opt::runCLI(argc, argv, std::cout, std::cerr);
}
