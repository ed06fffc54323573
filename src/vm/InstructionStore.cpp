//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/InstructionStore.cpp
// Purpose: Lazy, memoizing lookups against the program suite.  Suite
//          diagnostics become execution faults here because a missing method
//          during a run is an implementation fault, not an outcome.
// Links: docs/vm.md#instruction-store
//
//===----------------------------------------------------------------------===//

#include "vm/InstructionStore.hpp"

#include "vm/Fault.hpp"

namespace jade::vm
{

InstructionStore::InstructionStore(const bc::ProgramSuite &suite) : suite_(suite) {}

const std::vector<bc::Instr> &InstructionStore::get(const bc::MethodId &method)
{
    if (auto it = methods_.find(method); it != methods_.end())
        return it->second;

    auto body = suite_.methodOpcodes(method);
    if (!body)
        throw ExecutionFault(FaultKind::UnknownMethod, body.error().message);
    return methods_.emplace(method, std::move(body.value())).first->second;
}

const bc::Instr &InstructionStore::at(const ProgramCounter &pc)
{
    if (!pc.method)
        throw ExecutionFault(FaultKind::PcOutOfRange, "program counter has no method");
    const auto &body = get(*pc.method);
    if (pc.offset >= body.size())
        throw ExecutionFault(FaultKind::PcOutOfRange,
                             "offset " + std::to_string(pc.offset) + " past end of " +
                                 pc.method->toString() + " (" + std::to_string(body.size()) +
                                 " instructions)",
                             pc.toString());
    return body[pc.offset];
}

const bc::ClassInfo &InstructionStore::classInfo(std::string_view className)
{
    if (auto it = classes_.find(className); it != classes_.end())
        return it->second;

    auto info = suite_.findClass(className);
    if (!info)
        throw ExecutionFault(FaultKind::UnknownClass, info.error().message);
    return classes_.emplace(std::string(className), std::move(info.value())).first->second;
}

std::shared_ptr<const bc::MethodId> InstructionStore::intern(const bc::MethodId &method)
{
    if (auto it = interned_.find(method); it != interned_.end())
        return it->second;
    auto shared = std::make_shared<const bc::MethodId>(method);
    interned_.emplace(method, shared);
    return shared;
}

} // namespace jade::vm
