//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/OpHandlers.hpp
// Purpose: Shared handler contract and operand helpers for the per-family
//          instruction handlers.
// Key invariants: A handler returns std::nullopt after updating the state
//                 (including the pc) or an Outcome to halt the run.
// Ownership/Lifetime: Handlers mutate the state passed by reference.
// Links: docs/vm.md#step
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bc/Instr.hpp"
#include "vm/ExecState.hpp"
#include "vm/InstructionStore.hpp"
#include "vm/Outcome.hpp"
#include "vm/Value.hpp"

#include <cstdint>
#include <optional>

namespace jade::vm::detail
{

/// @brief nullopt continues the run; a value halts it.
using HandlerResult = std::optional<Outcome>;

/// @brief Pop an int-category value and return its scalar.
/// @throws ExecutionFault TypeMismatch for non-integer values.
std::int32_t popInt(Frame &fr);

/// @brief Pop a reference value.
/// @throws ExecutionFault TypeMismatch for non-reference values.
Value popRef(Frame &fr);

/// @brief Runtime value for a listing constant.
Value fromConstant(const bc::Constant &c);

/// @brief Narrow @p v to the representation of int-category @p type.
/// @details Used when an int is stored into a char/short/byte/boolean array.
Value coerceScalar(const Value &v, const bc::Type &type);

inline void advance(Frame &fr)
{
    fr.pc = fr.pc.advanced();
}

} // namespace jade::vm::detail
