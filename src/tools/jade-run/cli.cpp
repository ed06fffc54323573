//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements option parsing shared by the jade-run modes.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include <charconv>
#include <string_view>
#include <system_error>

namespace jaderun
{

SharedOptionParseResult parseSharedOption(int &index, int argc, char **argv, CliOptions &opts)
{
    const std::string arg = argv[index];
    if (arg == "--trace" || arg == "--trace=step")
    {
        opts.trace.mode = jade::vm::TraceConfig::Step;
        return SharedOptionParseResult::Parsed;
    }
    if (arg == "--trace=full")
    {
        opts.trace.mode = jade::vm::TraceConfig::Full;
        return SharedOptionParseResult::Parsed;
    }
    if (arg.rfind("--trace=", 0) == 0)
        return SharedOptionParseResult::Error;
    if (arg == "--max-steps")
    {
        if (index + 1 >= argc)
            return SharedOptionParseResult::Error;
        std::string_view value(argv[index + 1]);
        std::uint64_t parsed = 0;
        const char *const begin = value.data();
        const char *const end = begin + value.size();
        const auto fc = std::from_chars(begin, end, parsed);
        if (fc.ec != std::errc() || fc.ptr != end || parsed == 0)
            return SharedOptionParseResult::Error;
        ++index;
        opts.maxSteps = parsed;
        return SharedOptionParseResult::Parsed;
    }
    if (arg == "--print-return")
    {
        opts.printReturn = true;
        return SharedOptionParseResult::Parsed;
    }
    if (arg == "--check")
    {
        opts.check = true;
        return SharedOptionParseResult::Parsed;
    }
    return SharedOptionParseResult::NotMatched;
}

void splitPositionals(const std::vector<std::string> &positional,
                      std::vector<std::string> &listings,
                      std::vector<std::string> &rest)
{
    constexpr std::string_view kExt = ".jbc";
    for (const auto &p : positional)
    {
        const bool isListing =
            p.size() > kExt.size() && p.compare(p.size() - kExt.size(), kExt.size(), kExt) == 0;
        if (isListing && rest.empty())
            listings.push_back(p);
        else
            rest.push_back(p);
    }
}

} // namespace jaderun
