//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/ExecState.hpp
// Purpose: The unit threaded through vm::step: heap, call stack, static
//          overlay and the entry method's returned value.
// Key invariants: frames.back() is the executing frame; an empty call stack
//                 only occurs after the entry method returned.
// Ownership/Lifetime: Owned by exactly one run; moved into and out of step.
// Links: docs/vm.md#state
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Frame.hpp"
#include "vm/Heap.hpp"
#include "vm/Value.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jade::vm
{

struct ExecState
{
    Heap heap;

    /// @brief Call stack; back() is the innermost frame.
    std::vector<Frame> frames;

    /// @brief Static fields written during the run, keyed by "Cls.name".
    std::map<std::string, Value> statics;

    /// @brief Value returned by the entry method, when it returned one.
    std::optional<Value> returned;

    Frame &top()
    {
        return frames.back();
    }

    const Frame &top() const
    {
        return frames.back();
    }
};

} // namespace jade::vm
