// File: src/vm/OpHandlers_Control.hpp
// Purpose: Declare branch, jump, call and return handlers.
// Key invariants: Branch targets replace the pc offset; calls push a frame
//                 without advancing the caller, returns advance the caller.
// Ownership/Lifetime: Handlers push and pop frames of the state's call stack.
// Links: docs/vm.md#control
#pragma once

#include "vm/OpHandlers.hpp"

namespace jade::vm::detail::control
{

HandlerResult handleIf(ExecState &state, const bc::ins::If &in);
HandlerResult handleIfz(ExecState &state, const bc::ins::Ifz &in);
HandlerResult handleGoto(ExecState &state, const bc::ins::Goto &in);
HandlerResult handleInvoke(ExecState &state, InstructionStore &store, const bc::ins::Invoke &in);
HandlerResult handleReturn(ExecState &state, const bc::ins::Return &in);

} // namespace jade::vm::detail::control
