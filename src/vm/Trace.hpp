// File: src/vm/Trace.hpp
// Purpose: Declare tracing configuration and sink for VM instruction steps.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value and borrows its stream.
// Links: docs/vm.md#tracing
#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

#include "vm/Outcome.hpp"

namespace jade::bc
{
struct Instr;
} // namespace jade::bc

namespace jade::support
{
class SourceManager;
} // namespace jade::support

namespace jade::vm
{
struct ExecState;

/// @brief Selects how much each executed instruction logs.
struct TraceConfig
{
    enum Mode
    {
        Off,  ///< Tracing disabled
        Step, ///< One line per executed instruction
        Full  ///< Step line plus operand stack, locals and heap
    } mode{Off};

    /// @brief Optional source manager used to print listing locations.
    const jade::support::SourceManager *sm = nullptr;

    bool enabled() const;
};

/// @brief Writes trace lines for a run.
class TraceSink
{
  public:
    explicit TraceSink(TraceConfig cfg, std::ostream &os);

    /// @brief Record that @p in is about to execute in the top frame of @p state.
    void onStep(const jade::bc::Instr &in, const ExecState &state);

    /// @brief Record the run's terminal outcome after @p steps steps.
    void onOutcome(Outcome outcome, uint64_t steps);

    /// @brief Record that the step budget ran out.
    void onBudgetExhausted(uint64_t steps);

    bool enabled() const
    {
        return cfg.enabled();
    }

  private:
    void line(std::string_view text);

    TraceConfig cfg; ///< Active configuration
    std::ostream &os;
};

} // namespace jade::vm
