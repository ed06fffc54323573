//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Run mode: load the listings, parse the method id and inputs, run once and
// print the outcome token (or "*") on stdout.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "jade/bc/IO.hpp"
#include "jade/vm/Runner.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"
#include "vm/Fault.hpp"

#include <iostream>

namespace jaderun
{

using jade::support::printDiag;

int cmdRun(const CliOptions &opts)
{
    std::vector<std::string> listings;
    std::vector<std::string> rest;
    splitPositionals(opts.positional, listings, rest);
    if (listings.empty() || rest.size() < 2)
    {
        std::cerr << "jade-run: expected <suite.jbc>... <method-id> <inputs>\n";
        return kExitDiagnostics;
    }

    jade::support::SourceManager sm;
    jade::bc::InMemorySuite suite;
    for (const auto &path : listings)
    {
        if (auto r = jade::bc::io::SuiteParser::parseFile(path, suite, sm); !r)
        {
            printDiag(r.error(), std::cerr, &sm);
            return kExitDiagnostics;
        }
    }

    auto method = jade::bc::parseMethodId(rest.front());
    if (!method)
    {
        printDiag(method.error(), std::cerr);
        return kExitDiagnostics;
    }

    std::string inputText;
    for (size_t i = 1; i < rest.size(); ++i)
    {
        if (i > 1)
            inputText += ' ';
        inputText += rest[i];
    }
    auto inputs = jade::bc::io::parseInputs(inputText, method.value());
    if (!inputs)
    {
        printDiag(inputs.error(), std::cerr);
        return kExitDiagnostics;
    }

    jade::vm::RunConfig config;
    config.maxSteps = opts.maxSteps;
    config.trace = opts.trace;
    config.trace.sm = &sm;
    config.traceStream = &std::cerr;

    try
    {
        jade::vm::Runner runner(suite, config);
        const jade::vm::RunResult result = runner.run(method.value(), inputs.value());
        std::cout << result.token() << '\n';
        if (opts.printReturn && result.returned)
            std::cout << "return " << result.returned->toString() << '\n';
    }
    catch (const jade::vm::ExecutionFault &fault)
    {
        std::cerr << "jade-run: fault: " << fault.what() << '\n';
        return kExitFault;
    }
    return kExitOk;
}

} // namespace jaderun
