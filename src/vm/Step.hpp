//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Step.hpp
// Purpose: The transition function: execute exactly one instruction.
// Key invariants: step consumes the instruction at the top frame's pc and
//                 either returns the next state or halts with an outcome.
//                 Implementation faults are thrown as ExecutionFault carrying
//                 the faulting pc.
// Ownership/Lifetime: The state is taken by value and handed back; no frame
//                     reference survives a call.
// Links: docs/vm.md#step
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/ExecState.hpp"
#include "vm/InstructionStore.hpp"
#include "vm/Outcome.hpp"
#include "vm/Trace.hpp"
#include "vm/Value.hpp"

#include <optional>
#include <variant>

namespace jade::vm
{

/// @brief Terminal result of a step.
/// @details @c returned carries the entry method's return value when the halt
///          came from its typed return.
struct Halt
{
    Outcome outcome;
    std::optional<Value> returned;
};

/// @brief Either the next state or a halt.
using StepResult = std::variant<ExecState, Halt>;

/// @brief Execute the instruction addressed by the top frame of @p state.
/// @param trace Optional sink notified before the instruction executes.
/// @throws ExecutionFault on implementation faults.
StepResult step(ExecState state, InstructionStore &store, TraceSink *trace = nullptr);

inline bool isHalt(const StepResult &r)
{
    return std::holds_alternative<Halt>(r);
}

} // namespace jade::vm
