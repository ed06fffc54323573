//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the jade-run command-line tool.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "jade/version.hpp"

#include <iostream>
#include <string_view>

namespace
{

void printUsage()
{
    std::cerr << "jade-run v" << JADE_VERSION_STR << " - bytecode method runner\n"
              << "\n"
              << "Usage: jade-run [options] <suite.jbc>... <method-id> <inputs>\n"
              << "       jade-run --check [options] <suite.jbc>...\n"
              << "\n"
              << "Options:\n"
              << "  --max-steps N        Step budget (default 100000, or JADE_MAX_STEPS)\n"
              << "  --trace[=step|full]  Trace executed instructions to stderr\n"
              << "  --print-return       Print the entry method's returned value\n"
              << "  --check              Run every case declared by the suites\n"
              << "  -h, --help           Show this help message\n"
              << "  --version            Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  jade-run simple.jbc 'jpamb/cases/Simple.divide:(II)I' '(10, 0)'\n"
              << "  jade-run --check simple.jbc arrays.jbc\n"
              << "\n"
              << "Prints one of: ok, divide by zero, assertion error, out of bounds,\n"
              << "null pointer, or * when the step budget runs out.\n";
}

void printVersion()
{
    std::cout << "jade-run v" << JADE_VERSION_STR << "\n";
    std::cout << "Listing format: jbc " << JADE_JBC_FORMAT_VERSION << "\n";
}

} // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        printUsage();
        return jaderun::kExitDiagnostics;
    }

    jaderun::CliOptions opts;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg(argv[i]);
        if (arg == "-h" || arg == "--help")
        {
            printUsage();
            return jaderun::kExitOk;
        }
        if (arg == "--version")
        {
            printVersion();
            return jaderun::kExitOk;
        }

        switch (jaderun::parseSharedOption(i, argc, argv, opts))
        {
            case jaderun::SharedOptionParseResult::Parsed:
                continue;
            case jaderun::SharedOptionParseResult::Error:
                std::cerr << "jade-run: invalid value for " << arg << "\n";
                return jaderun::kExitDiagnostics;
            case jaderun::SharedOptionParseResult::NotMatched:
                break;
        }

        // Negative integers are input literals, not options.
        if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-')
        {
            std::cerr << "jade-run: unknown option " << arg << "\n";
            printUsage();
            return jaderun::kExitDiagnostics;
        }
        opts.positional.emplace_back(arg);
    }

    return opts.check ? jaderun::cmdCheck(opts) : jaderun::cmdRun(opts);
}
