//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Frame.cpp
// Purpose: Checked access to operand stacks and local slots.
// Links: docs/vm.md#frames
//
//===----------------------------------------------------------------------===//

#include "vm/Frame.hpp"

#include "vm/Fault.hpp"

namespace jade::vm
{

std::string ProgramCounter::toString() const
{
    return (method ? method->toString() : std::string("<none>")) + ":" + std::to_string(offset);
}

Value OperandStack::pop()
{
    if (values_.empty())
        throw ExecutionFault(FaultKind::StackUnderflow, "pop from empty operand stack");
    Value v = std::move(values_.back());
    values_.pop_back();
    return v;
}

const Value &OperandStack::peek() const
{
    if (values_.empty())
        throw ExecutionFault(FaultKind::StackUnderflow, "peek at empty operand stack");
    return values_.back();
}

const Value &Frame::local(std::uint32_t slot) const
{
    auto it = locals.find(slot);
    if (it == locals.end())
        throw ExecutionFault(FaultKind::UnsetLocal,
                             "local " + std::to_string(slot) + " read before write");
    return it->second;
}

Frame makeFrame(std::shared_ptr<const bc::MethodId> method)
{
    Frame fr;
    fr.pc = ProgramCounter{std::move(method), 0};
    return fr;
}

} // namespace jade::vm
