//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the in-memory program suite.  Lookup failures are reported as
// diagnostics so the loader and the CLI print them uniformly; the VM turns
// them into execution faults.
//
//===----------------------------------------------------------------------===//

#include "bc/ProgramSuite.hpp"

namespace jade::bc
{

using support::Expected;
using support::makeError;

Expected<std::vector<Instr>> InMemorySuite::methodOpcodes(const MethodId &method) const
{
    auto it = methods_.find(method);
    if (it == methods_.end())
        return makeError({}, "unknown method " + method.toString());
    return it->second;
}

Expected<ClassInfo> InMemorySuite::findClass(std::string_view className) const
{
    auto it = classes_.find(className);
    if (it == classes_.end())
        return makeError({}, "unknown class " + std::string(className));
    return it->second;
}

std::optional<std::string> InMemorySuite::sourceFile(std::string_view className) const
{
    auto it = classes_.find(className);
    if (it == classes_.end())
        return std::nullopt;
    return it->second.sourceFile;
}

void InMemorySuite::addClass(ClassInfo info)
{
    std::string key = info.name;
    classes_.insert_or_assign(std::move(key), std::move(info));
}

Expected<void> InMemorySuite::addMethod(MethodId method,
                                        std::vector<Instr> body,
                                        support::SourceLoc loc)
{
    if (methods_.count(method) != 0)
        return makeError(loc, "duplicate method " + method.toString());
    methods_.emplace(std::move(method), std::move(body));
    return {};
}

void InMemorySuite::addCase(Case c)
{
    cases_.push_back(std::move(c));
}

bool InMemorySuite::hasClass(std::string_view className) const
{
    return classes_.find(className) != classes_.end();
}

} // namespace jade::bc
