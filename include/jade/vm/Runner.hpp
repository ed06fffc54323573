//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/jade/vm/Runner.hpp
// Purpose: Declare the facade that runs one method of a program suite to a
//          terminal outcome under a step budget.
// Invariants: Every run builds a fresh execution state and instruction store;
//             runs never share mutable state.
// Ownership: The Runner borrows the suite, which must outlive it; trace
//            streams are borrowed from the caller.
// Links: docs/vm.md#driver
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bc/Case.hpp"
#include "bc/MethodId.hpp"
#include "bc/ProgramSuite.hpp"
#include "vm/ExecState.hpp"
#include "vm/InstructionStore.hpp"
#include "vm/Outcome.hpp"
#include "vm/Trace.hpp"
#include "vm/Value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace jade::vm
{

/// @brief Step budget used when neither the config nor JADE_MAX_STEPS sets one.
inline constexpr uint64_t kDefaultMaxSteps = 100000;

/// @brief Per-run configuration.
struct RunConfig
{
    /// @brief Step budget; zero defers to JADE_MAX_STEPS, then kDefaultMaxSteps.
    uint64_t maxSteps = 0;
    TraceConfig trace;                    ///< Tracing configuration.
    std::ostream *traceStream = nullptr;  ///< Trace destination; std::cerr when null.
};

/// @brief Result of one run.
struct RunResult
{
    /// @brief Terminal outcome; std::nullopt when the budget ran out.
    std::optional<Outcome> outcome;

    /// @brief Number of instructions executed.
    uint64_t steps = 0;

    /// @brief Value returned by the entry method, when it returned one.
    std::optional<Value> returned;

    /// @brief True when the run ended with an outcome rather than the budget.
    [[nodiscard]] bool terminated() const
    {
        return outcome.has_value();
    }

    /// @brief Printed form: an outcome token or "*".
    [[nodiscard]] std::string token() const;
};

/// @brief Bind @p inputs into a fresh entry frame for @p method.
/// @details Booleans widen to 0/1 ints, chars keep their kind; arrays and
///          objects are allocated on the heap and passed by reference.  An
///          object input sets its class's instance fields in declaration order.
/// @throws ExecutionFault BadInput on arity or type mismatch, UnknownClass for
///         an object input of a class the suite lacks.
ExecState buildInitialState(const bc::MethodId &method,
                            const std::vector<bc::Input> &inputs,
                            InstructionStore &store);

/// @brief Facade that drives vm::step until an outcome or the budget.
class Runner
{
  public:
    explicit Runner(const bc::ProgramSuite &suite, RunConfig config = {});

    ~Runner();

    Runner(const Runner &) = delete;
    Runner &operator=(const Runner &) = delete;
    Runner(Runner &&) noexcept;
    Runner &operator=(Runner &&) noexcept;

    /// @brief Run @p method on @p inputs.
    /// @throws ExecutionFault on implementation faults.
    [[nodiscard]] RunResult run(const bc::MethodId &method, const std::vector<bc::Input> &inputs);

    /// @brief Budget in effect after applying the environment override.
    [[nodiscard]] uint64_t maxSteps() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace jade::vm
