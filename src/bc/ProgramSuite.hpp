//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bc/ProgramSuite.hpp
// Purpose: Abstract source of classes and method bodies, plus the in-memory
//          implementation the listing loader populates.
// Key invariants: Lookups are pure; a suite never changes while a run reads it.
// Ownership/Lifetime: InMemorySuite owns all stored metadata and bodies.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bc/Case.hpp"
#include "bc/ClassInfo.hpp"
#include "bc/Instr.hpp"
#include "bc/MethodId.hpp"
#include "support/diag_expected.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jade::bc
{

/// @brief Read-only view of a program: what the VM consumes.
class ProgramSuite
{
  public:
    virtual ~ProgramSuite() = default;

    /// @brief Ordered instructions of @p method.
    virtual support::Expected<std::vector<Instr>> methodOpcodes(const MethodId &method) const = 0;

    /// @brief Metadata of class @p className (internal '/' form).
    virtual support::Expected<ClassInfo> findClass(std::string_view className) const = 0;

    /// @brief Path of the source the class came from, when known.
    virtual std::optional<std::string> sourceFile(std::string_view className) const = 0;
};

/// @brief Suite held entirely in memory.
class InMemorySuite final : public ProgramSuite
{
  public:
    support::Expected<std::vector<Instr>> methodOpcodes(const MethodId &method) const override;
    support::Expected<ClassInfo> findClass(std::string_view className) const override;
    std::optional<std::string> sourceFile(std::string_view className) const override;

    /// @brief Add or replace class @p info.
    void addClass(ClassInfo info);

    /// @brief Register the body of @p method; fails when the method already exists.
    support::Expected<void> addMethod(MethodId method,
                                      std::vector<Instr> body,
                                      support::SourceLoc loc = {});

    void addCase(Case c);

    bool hasClass(std::string_view className) const;

    const std::vector<Case> &cases() const
    {
        return cases_;
    }

    size_t methodCount() const
    {
        return methods_.size();
    }

  private:
    std::map<std::string, ClassInfo, std::less<>> classes_;
    std::unordered_map<MethodId, std::vector<Instr>, MethodIdHash> methods_;
    std::vector<Case> cases_;
};

} // namespace jade::bc
