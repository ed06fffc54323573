// File: src/vm/Fault.hpp
// Purpose: Implementation faults: failures outside the outcome taxonomy that
//          abort a run without producing an outcome token.
// Key invariants: Faults are thrown, outcomes are returned; the two never mix.
// Ownership/Lifetime: Exception objects own their message text.
// Links: docs/vm.md#faults
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace jade::vm
{

/// @brief Classifies implementation faults.
enum class FaultKind
{
    UnsupportedInstruction, ///< Supported family with an unsupported operand type.
    UnsetLocal,             ///< Local slot read before any write.
    TypeMismatch,           ///< Value kind does not match the instruction's type.
    StackUnderflow,         ///< Pop or peek on an empty operand stack.
    DanglingReference,      ///< Reference to a heap key that was never allocated.
    UnknownMethod,          ///< Method not present in the suite.
    UnknownClass,           ///< Class not present in the suite.
    UnknownField,           ///< Field not declared by its class or object.
    PcOutOfRange,           ///< Program counter past the end of its method.
    NegativeArraySize,      ///< newarray with a negative length.
    ResourceExhausted,      ///< Allocation larger than the interpreter supports.
    BadInput,               ///< Driver inputs do not match the entry method.
};

/// @brief Stable name of @p kind, e.g. "StackUnderflow".
std::string_view toString(FaultKind kind) noexcept;

/// @brief Exception thrown for implementation faults.
/// @details what() reads "<Kind> at <pc>: <detail>" (or "<Kind>: <detail>" when
///          no program counter is attached).
class ExecutionFault : public std::runtime_error
{
  public:
    ExecutionFault(FaultKind kind, std::string detail, std::string pc = {});

    FaultKind kind() const noexcept
    {
        return kind_;
    }

    /// @brief Program counter text ("Cls.m:(I)V:3"), empty when unknown.
    const std::string &pc() const noexcept
    {
        return pc_;
    }

    const std::string &detail() const noexcept
    {
        return detail_;
    }

  private:
    FaultKind kind_;
    std::string detail_;
    std::string pc_;
};

} // namespace jade::vm
