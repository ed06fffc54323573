//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Fault.cpp
// Purpose: Fault naming and message formatting.
// Links: docs/vm.md#faults
//
//===----------------------------------------------------------------------===//

#include "vm/Fault.hpp"

namespace jade::vm
{
namespace
{
std::string formatFault(FaultKind kind, const std::string &detail, const std::string &pc)
{
    std::string msg(toString(kind));
    if (!pc.empty())
        msg += " at " + pc;
    msg += ": ";
    msg += detail;
    return msg;
}
} // namespace

std::string_view toString(FaultKind kind) noexcept
{
    switch (kind)
    {
        case FaultKind::UnsupportedInstruction:
            return "UnsupportedInstruction";
        case FaultKind::UnsetLocal:
            return "UnsetLocal";
        case FaultKind::TypeMismatch:
            return "TypeMismatch";
        case FaultKind::StackUnderflow:
            return "StackUnderflow";
        case FaultKind::DanglingReference:
            return "DanglingReference";
        case FaultKind::UnknownMethod:
            return "UnknownMethod";
        case FaultKind::UnknownClass:
            return "UnknownClass";
        case FaultKind::UnknownField:
            return "UnknownField";
        case FaultKind::PcOutOfRange:
            return "PcOutOfRange";
        case FaultKind::NegativeArraySize:
            return "NegativeArraySize";
        case FaultKind::ResourceExhausted:
            return "ResourceExhausted";
        case FaultKind::BadInput:
            return "BadInput";
    }
    return "Fault";
}

ExecutionFault::ExecutionFault(FaultKind kind, std::string detail, std::string pc)
    : std::runtime_error(formatFault(kind, detail, pc)), kind_(kind), detail_(std::move(detail)),
      pc_(std::move(pc))
{
}

} // namespace jade::vm
