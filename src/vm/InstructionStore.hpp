//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/InstructionStore.hpp
// Purpose: Per-run memo of method bodies and class metadata fetched from a
//          ProgramSuite.
// Key invariants: Each method id and class name is requested from the suite at
//                 most once per store; cached entries are never invalidated.
// Ownership/Lifetime: Borrows the suite, which must outlive the store; owns the
//                     cached copies.
// Links: docs/vm.md#instruction-store
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bc/ClassInfo.hpp"
#include "bc/Instr.hpp"
#include "bc/MethodId.hpp"
#include "bc/ProgramSuite.hpp"
#include "vm/Frame.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jade::vm
{

class InstructionStore
{
  public:
    explicit InstructionStore(const bc::ProgramSuite &suite);

    /// @brief Ordered instructions of @p method, fetched on first use.
    /// @throws ExecutionFault UnknownMethod when the suite has no such method.
    const std::vector<bc::Instr> &get(const bc::MethodId &method);

    /// @brief Instruction addressed by @p pc.
    /// @throws ExecutionFault PcOutOfRange past the end of the method.
    const bc::Instr &at(const ProgramCounter &pc);

    /// @brief Metadata of @p className, fetched on first use.
    /// @throws ExecutionFault UnknownClass when the suite has no such class.
    const bc::ClassInfo &classInfo(std::string_view className);

    /// @brief Shared, interned copy of @p method for program counters.
    std::shared_ptr<const bc::MethodId> intern(const bc::MethodId &method);

    /// @brief Number of distinct methods fetched so far.
    size_t cachedMethodCount() const
    {
        return methods_.size();
    }

    const bc::ProgramSuite &suite() const
    {
        return suite_;
    }

  private:
    const bc::ProgramSuite &suite_;
    std::unordered_map<bc::MethodId, std::vector<bc::Instr>, bc::MethodIdHash> methods_;
    std::unordered_map<bc::MethodId, std::shared_ptr<const bc::MethodId>, bc::MethodIdHash>
        interned_;
    std::map<std::string, bc::ClassInfo, std::less<>> classes_;
};

} // namespace jade::vm
