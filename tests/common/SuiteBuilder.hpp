// File: tests/common/SuiteBuilder.hpp
// Purpose: Assemble small in-memory program suites for VM and loader tests.
// Key invariants: Method bodies are written in listing syntax, one
//                 instruction per string, and parsed eagerly.
// Ownership/Lifetime: Owns the InMemorySuite it populates.
// Links: docs/codemap.md

#pragma once

#include "bc/ProgramSuite.hpp"
#include "jade/vm/Runner.hpp"
#include "vm/ExecState.hpp"
#include "vm/InstructionStore.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace jade::tests
{

/// @brief Helper that builds suites programmatically and runs their methods.
class SuiteBuilder
{
  public:
    /// @brief Declare class @p name with @p fields.
    SuiteBuilder &addClass(std::string name, std::vector<bc::FieldInfo> fields = {});

    /// @brief Add method @p id ("Cls.name:(I)I") whose body is @p lines.
    /// @throws std::invalid_argument when an id or instruction does not parse.
    bc::MethodId method(std::string_view id, std::initializer_list<std::string_view> lines);

    /// @brief Add method @p id with a prebuilt body.
    bc::MethodId method(std::string_view id, std::vector<bc::Instr> body);

    /// @brief Run @p id on @p inputs with budget @p maxSteps.
    vm::RunResult run(const bc::MethodId &id,
                      const std::vector<bc::Input> &inputs = {},
                      std::uint64_t maxSteps = 10000) const;

    /// @brief Printed token of run().
    std::string outcome(const bc::MethodId &id,
                        const std::vector<bc::Input> &inputs = {},
                        std::uint64_t maxSteps = 10000) const;

    bc::InMemorySuite &suite() noexcept
    {
        return suite_;
    }

    const bc::InMemorySuite &suite() const noexcept
    {
        return suite_;
    }

  private:
    bc::InMemorySuite suite_;
};

/// @brief Parse @p id or throw std::invalid_argument.
bc::MethodId methodId(std::string_view id);

/// @brief Parse one instruction line or throw std::invalid_argument.
bc::Instr instr(std::string_view text);

/// @brief Field declaration shorthand.
bc::FieldInfo field(std::string name, std::string_view descriptor, bool isStatic = false);

} // namespace jade::tests
