//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Check mode: run every `case` declared by the listings and compare the
// printed token with the recorded expectation.  Mismatches and faults are
// collected as diagnostics and printed after the per-case PASS/FAIL lines.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "jade/bc/IO.hpp"
#include "jade/vm/Runner.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "vm/Fault.hpp"

#include <iostream>

namespace jaderun
{

using jade::support::Diagnostic;
using jade::support::Severity;

int cmdCheck(const CliOptions &opts)
{
    std::vector<std::string> listings;
    std::vector<std::string> rest;
    splitPositionals(opts.positional, listings, rest);
    if (listings.empty() || !rest.empty())
    {
        std::cerr << "jade-run: --check expects only <suite.jbc> arguments\n";
        return kExitDiagnostics;
    }

    jade::support::SourceManager sm;
    jade::bc::InMemorySuite suite;
    for (const auto &path : listings)
    {
        if (auto r = jade::bc::io::SuiteParser::parseFile(path, suite, sm); !r)
        {
            jade::support::printDiag(r.error(), std::cerr, &sm);
            return kExitDiagnostics;
        }
    }

    jade::vm::RunConfig config;
    config.maxSteps = opts.maxSteps;
    config.trace = opts.trace;
    config.trace.sm = &sm;
    config.traceStream = &std::cerr;
    jade::vm::Runner runner(suite, config);

    jade::support::DiagnosticEngine diags;
    size_t passed = 0;
    for (const auto &c : suite.cases())
    {
        const std::string label =
            c.method.toString() + " " + jade::bc::io::formatInputs(c.inputs);
        std::string actual;
        try
        {
            actual = runner.run(c.method, c.inputs).token();
        }
        catch (const jade::vm::ExecutionFault &fault)
        {
            std::cout << "FAIL " << label << " -> fault\n";
            diags.report(Diagnostic{Severity::Error, label + ": " + fault.what(), c.loc});
            continue;
        }

        if (actual == c.expected)
        {
            ++passed;
            std::cout << "PASS " << label << " -> " << actual << '\n';
            continue;
        }
        std::cout << "FAIL " << label << " -> " << actual << '\n';
        diags.report(Diagnostic{
            Severity::Error, label + ": expected '" + c.expected + "', got '" + actual + "'", c.loc});
    }

    diags.printAll(std::cerr, &sm);
    std::cout << passed << '/' << suite.cases().size() << " cases passed\n";
    return diags.errorCount() == 0 ? kExitOk : kExitDiagnostics;
}

} // namespace jaderun
