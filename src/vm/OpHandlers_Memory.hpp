//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/OpHandlers_Memory.hpp
// Purpose: Declare handlers for operand stack, locals, fields, objects and
//          arrays.
// Key invariants: Null is checked before bounds; array updates replace the
//                 heap entry, field updates mutate the object in place.
// Ownership/Lifetime: Handlers mutate the state's heap and top frame.
// Links: docs/vm.md#memory
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/OpHandlers.hpp"

namespace jade::vm::detail::memory
{

HandlerResult handlePush(ExecState &state, const bc::ins::Push &in);
HandlerResult handleLoad(ExecState &state, const bc::ins::Load &in);
HandlerResult handleStore(ExecState &state, const bc::ins::Store &in);
HandlerResult handleDup(ExecState &state, const bc::ins::Dup &in);
HandlerResult handlePop(ExecState &state, const bc::ins::Pop &in);

HandlerResult handleGet(ExecState &state, InstructionStore &store, const bc::ins::Get &in);
HandlerResult handlePut(ExecState &state, const bc::ins::Put &in);
HandlerResult handleNew(ExecState &state, InstructionStore &store, const bc::ins::New &in);

HandlerResult handleNewArray(ExecState &state, const bc::ins::NewArray &in);
HandlerResult handleArrayLoad(ExecState &state, const bc::ins::ArrayLoad &in);
HandlerResult handleArrayStore(ExecState &state, const bc::ins::ArrayStore &in);
HandlerResult handleArrayLength(ExecState &state, const bc::ins::ArrayLength &in);

/// @brief Internal name of the class whose construction halts with an assertion error.
inline constexpr const char *kAssertionErrorClass = "java/lang/AssertionError";

/// @brief Root class; constructible without suite metadata.
inline constexpr const char *kObjectClass = "java/lang/Object";

/// @brief Longest array newarray will allocate (16M elements).
inline constexpr std::int32_t kMaxArrayLength = 1 << 24;

} // namespace jade::vm::detail::memory
