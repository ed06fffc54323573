//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Step.cpp
// Purpose: Dispatch one instruction to its family handler.
// Key invariants: The dispatcher has exactly one overload per instruction
//                 alternative, so adding an alternative without a handler does
//                 not compile.
// Links: docs/vm.md#step
//
//===----------------------------------------------------------------------===//

#include "vm/Step.hpp"

#include "vm/Fault.hpp"
#include "vm/OpHandlers_Control.hpp"
#include "vm/OpHandlers_Int.hpp"
#include "vm/OpHandlers_Memory.hpp"

namespace jade::vm
{
namespace
{
using detail::HandlerResult;
namespace ins = bc::ins;

struct Dispatcher
{
    ExecState &state;
    InstructionStore &store;

    HandlerResult operator()(const ins::Push &in) const
    {
        return detail::memory::handlePush(state, in);
    }

    HandlerResult operator()(const ins::Load &in) const
    {
        return detail::memory::handleLoad(state, in);
    }

    HandlerResult operator()(const ins::Store &in) const
    {
        return detail::memory::handleStore(state, in);
    }

    HandlerResult operator()(const ins::Binary &in) const
    {
        return detail::integer::handleBinary(state, in);
    }

    HandlerResult operator()(const ins::Negate &in) const
    {
        return detail::integer::handleNegate(state, in);
    }

    HandlerResult operator()(const ins::Incr &in) const
    {
        return detail::integer::handleIncr(state, in);
    }

    HandlerResult operator()(const ins::Dup &in) const
    {
        return detail::memory::handleDup(state, in);
    }

    HandlerResult operator()(const ins::Pop &in) const
    {
        return detail::memory::handlePop(state, in);
    }

    HandlerResult operator()(const ins::If &in) const
    {
        return detail::control::handleIf(state, in);
    }

    HandlerResult operator()(const ins::Ifz &in) const
    {
        return detail::control::handleIfz(state, in);
    }

    HandlerResult operator()(const ins::Goto &in) const
    {
        return detail::control::handleGoto(state, in);
    }

    HandlerResult operator()(const ins::Get &in) const
    {
        return detail::memory::handleGet(state, store, in);
    }

    HandlerResult operator()(const ins::Put &in) const
    {
        return detail::memory::handlePut(state, in);
    }

    HandlerResult operator()(const ins::New &in) const
    {
        return detail::memory::handleNew(state, store, in);
    }

    HandlerResult operator()(const ins::NewArray &in) const
    {
        return detail::memory::handleNewArray(state, in);
    }

    HandlerResult operator()(const ins::ArrayLoad &in) const
    {
        return detail::memory::handleArrayLoad(state, in);
    }

    HandlerResult operator()(const ins::ArrayStore &in) const
    {
        return detail::memory::handleArrayStore(state, in);
    }

    HandlerResult operator()(const ins::ArrayLength &in) const
    {
        return detail::memory::handleArrayLength(state, in);
    }

    HandlerResult operator()(const ins::Invoke &in) const
    {
        return detail::control::handleInvoke(state, store, in);
    }

    HandlerResult operator()(const ins::Return &in) const
    {
        return detail::control::handleReturn(state, in);
    }

    HandlerResult operator()(const ins::Cast &in) const
    {
        return detail::integer::handleCast(state, in);
    }
};
} // namespace

StepResult step(ExecState state, InstructionStore &store, TraceSink *trace)
{
    if (state.frames.empty())
        throw ExecutionFault(FaultKind::StackUnderflow, "step on an empty call stack");

    const ProgramCounter pc = state.top().pc;
    const bc::Instr &in = store.at(pc);
    if (trace)
        trace->onStep(in, state);

    HandlerResult result;
    try
    {
        result = std::visit(Dispatcher{state, store}, in.op);
    }
    catch (const ExecutionFault &fault)
    {
        if (!fault.pc().empty())
            throw;
        throw ExecutionFault(fault.kind(), fault.detail(), pc.toString());
    }

    if (result)
        return Halt{*result, std::move(state.returned)};
    return StepResult(std::move(state));
}

} // namespace jade::vm
