//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/OpHandlers_Int.hpp
// Purpose: Declare integer arithmetic, increment and narrowing-cast handlers.
// Key invariants: Handlers implement JVM int semantics: two's complement wrap,
//                 truncating division, INT_MIN / -1 == INT_MIN.
// Ownership/Lifetime: Handlers operate on the top frame of the state.
// Links: docs/vm.md#integers
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/OpHandlers.hpp"

#include <cstdint>
#include <optional>

namespace jade::vm::detail::integer
{

HandlerResult handleBinary(ExecState &state, const bc::ins::Binary &in);
HandlerResult handleNegate(ExecState &state, const bc::ins::Negate &in);
HandlerResult handleIncr(ExecState &state, const bc::ins::Incr &in);
HandlerResult handleCast(ExecState &state, const bc::ins::Cast &in);

/// @brief Evaluate @p op on two ints.
/// @return std::nullopt when the operator divides by zero.
std::optional<std::int32_t> evalBinary(bc::BinaryOp op, std::int32_t lhs, std::int32_t rhs);

} // namespace jade::vm::detail::integer
