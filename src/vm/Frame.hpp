//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Frame.hpp
// Purpose: Program counter, operand stack and activation record.
// Key invariants: A frame's pc addresses an instruction of its own method;
//                 locals are only readable after a write.
// Ownership/Lifetime: Frames are owned by the ExecState call stack.  The pc's
//                     method id is shared immutably between frames of the
//                     same method.
// Links: docs/vm.md#frames
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bc/MethodId.hpp"
#include "vm/Value.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace jade::vm
{

/// @brief (method, offset) addressing pair.
struct ProgramCounter
{
    std::shared_ptr<const bc::MethodId> method;
    std::uint32_t offset = 0;

    /// @brief Same method, offset + @p n.
    ProgramCounter advanced(std::uint32_t n = 1) const
    {
        return ProgramCounter{method, offset + n};
    }

    /// @brief Same method, offset @p target.
    ProgramCounter jumpedTo(std::uint32_t target) const
    {
        return ProgramCounter{method, target};
    }

    /// @brief Render "pkg/Cls.name:(I)V:3".
    std::string toString() const;
};

/// @brief LIFO stack of values for one frame.
class OperandStack
{
  public:
    void push(Value v)
    {
        values_.push_back(std::move(v));
    }

    /// @brief Remove and return the top value.
    /// @throws ExecutionFault StackUnderflow when empty.
    Value pop();

    /// @brief Top value without removing it.
    /// @throws ExecutionFault StackUnderflow when empty.
    const Value &peek() const;

    bool empty() const
    {
        return values_.empty();
    }

    size_t size() const
    {
        return values_.size();
    }

    /// @brief Bottom-to-top view.
    const std::vector<Value> &values() const
    {
        return values_;
    }

  private:
    std::vector<Value> values_;
};

/// @brief One method activation.
struct Frame
{
    std::map<std::uint32_t, Value> locals;
    OperandStack stack;
    ProgramCounter pc;

    /// @brief Value in slot @p slot.
    /// @throws ExecutionFault UnsetLocal when the slot was never written.
    const Value &local(std::uint32_t slot) const;

    void setLocal(std::uint32_t slot, Value v)
    {
        locals.insert_or_assign(slot, std::move(v));
    }
};

/// @brief Fresh frame for @p method at offset 0 with no locals.
Frame makeFrame(std::shared_ptr<const bc::MethodId> method);

} // namespace jade::vm
