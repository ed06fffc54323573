//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the conditional and unconditional branch handlers.  Comparisons
// pop the right operand first; a taken branch replaces the pc offset, a
// fall-through advances it by one.
//
//===----------------------------------------------------------------------===//

#include "vm/OpHandlers_Control.hpp"

#include "vm/Fault.hpp"

#include <string>

namespace jade::vm::detail::control
{
namespace
{
bool compareInts(bc::Condition c, std::int32_t lhs, std::int32_t rhs)
{
    switch (c)
    {
        case bc::Condition::Eq:
            return lhs == rhs;
        case bc::Condition::Ne:
            return lhs != rhs;
        case bc::Condition::Lt:
            return lhs < rhs;
        case bc::Condition::Ge:
            return lhs >= rhs;
        case bc::Condition::Gt:
            return lhs > rhs;
        case bc::Condition::Le:
            return lhs <= rhs;
        case bc::Condition::Is:
        case bc::Condition::IsNot:
            break;
    }
    throw ExecutionFault(FaultKind::TypeMismatch,
                         std::string("condition ") + bc::toString(c) + " needs references");
}

/// @brief Identity comparison of two references; eq/is and ne/isnot agree.
bool compareRefs(bc::Condition c, const Value &lhs, const Value &rhs)
{
    switch (c)
    {
        case bc::Condition::Eq:
        case bc::Condition::Is:
            return lhs.ref == rhs.ref;
        case bc::Condition::Ne:
        case bc::Condition::IsNot:
            return lhs.ref != rhs.ref;
        default:
            break;
    }
    throw ExecutionFault(FaultKind::TypeMismatch,
                         std::string("condition ") + bc::toString(c) +
                             " cannot compare references");
}

void branch(Frame &fr, bool taken, std::uint32_t target)
{
    fr.pc = taken ? fr.pc.jumpedTo(target) : fr.pc.advanced();
}
} // namespace

HandlerResult handleIf(ExecState &state, const bc::ins::If &in)
{
    Frame &fr = state.top();
    Value rhs = fr.stack.pop();
    Value lhs = fr.stack.pop();

    bool taken = false;
    if (lhs.isIntCategory() && rhs.isIntCategory())
        taken = compareInts(in.condition, lhs.scalar, rhs.scalar);
    else if (lhs.kind == Value::Kind::Reference && rhs.kind == Value::Kind::Reference)
        taken = compareRefs(in.condition, lhs, rhs);
    else
        throw ExecutionFault(FaultKind::TypeMismatch,
                             std::string("if compares ") + kindToString(lhs.kind) + " with " +
                                 kindToString(rhs.kind));
    branch(fr, taken, in.target);
    return std::nullopt;
}

/// @brief Compare against zero, or against null for references.
HandlerResult handleIfz(ExecState &state, const bc::ins::Ifz &in)
{
    Frame &fr = state.top();
    Value v = fr.stack.pop();

    bool taken = false;
    if (v.isIntCategory())
        taken = compareInts(in.condition, v.scalar, 0);
    else if (v.kind == Value::Kind::Reference)
        taken = compareRefs(in.condition, v, Value::makeNull());
    else
        throw ExecutionFault(FaultKind::TypeMismatch,
                             std::string("ifz on ") + kindToString(v.kind));
    branch(fr, taken, in.target);
    return std::nullopt;
}

HandlerResult handleGoto(ExecState &state, const bc::ins::Goto &in)
{
    Frame &fr = state.top();
    fr.pc = fr.pc.jumpedTo(in.target);
    return std::nullopt;
}

} // namespace jade::vm::detail::control
