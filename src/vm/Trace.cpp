//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trace.cpp
// Purpose: Implement deterministic tracing for VM steps.
// Key invariants: Each event produces whole, flushed lines prefixed "[jade]";
//                 numbers always render in the classic locale.
// Ownership/Lifetime: The sink borrows the state it prints and the stream it
//                     writes to.
// Links: docs/vm.md#tracing
//
//===----------------------------------------------------------------------===//

#include "vm/Trace.hpp"

#include "bc/Instr.hpp"
#include "support/source_manager.hpp"
#include "vm/ExecState.hpp"
#include "vm/Outcome.hpp"

#include <clocale>
#include <filesystem>
#include <locale>
#include <sstream>
#include <string>

namespace jade::vm
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

namespace
{
/// @brief RAII helper that temporarily forces the C locale for numeric formatting.
class LocaleGuard
{
    std::ostream &os;
    std::locale oldLoc;
    std::string oldC;

  public:
    explicit LocaleGuard(std::ostream &s) : os(s), oldLoc(s.getloc())
    {
        if (const char *c = std::setlocale(LC_NUMERIC, nullptr))
            oldC = c;
        os.imbue(std::locale::classic());
        std::setlocale(LC_NUMERIC, "C");
    }

    ~LocaleGuard()
    {
        if (!oldC.empty())
            std::setlocale(LC_NUMERIC, oldC.c_str());
        os.imbue(oldLoc);
    }
};

std::string renderStack(const Frame &fr)
{
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << "stack: [";
    const auto &values = fr.stack.values();
    for (size_t i = 0; i < values.size(); ++i)
    {
        if (i)
            ss << ", ";
        ss << values[i].toString();
    }
    ss << ']';
    return ss.str();
}

std::string renderLocals(const Frame &fr)
{
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << "locals: {";
    bool first = true;
    for (const auto &[slot, v] : fr.locals)
    {
        if (!first)
            ss << ", ";
        first = false;
        ss << slot << '=' << v.toString();
    }
    ss << '}';
    return ss.str();
}
} // namespace

TraceSink::TraceSink(TraceConfig cfg, std::ostream &os) : cfg(cfg), os(os) {}

void TraceSink::line(std::string_view text)
{
    os << "[jade] " << text << '\n' << std::flush;
}

/// @brief Emit the trace lines for one instruction.
/// @details Step mode prints the program counter and the instruction in listing
///          syntax, suffixed with the listing location when a source manager is
///          configured.  Full mode adds the top frame's operand stack and locals
///          and one line per heap entry.
void TraceSink::onStep(const jade::bc::Instr &in, const ExecState &state)
{
    if (!cfg.enabled() || state.frames.empty())
        return;
    LocaleGuard lg(os);
    os << std::dec;

    const Frame &fr = state.top();
    std::string text = fr.pc.toString() + " " + jade::bc::toString(in);
    if (cfg.sm && in.loc.hasFile())
    {
        std::filesystem::path p{std::string(cfg.sm->getPath(in.loc.file_id))};
        text += "  (" + p.filename().string();
        if (in.loc.hasLine())
            text += ':' + std::to_string(in.loc.line);
        text += ')';
    }
    line(text);

    if (cfg.mode != TraceConfig::Full)
        return;
    line("  depth: " + std::to_string(state.frames.size()));
    line("  " + renderStack(fr));
    line("  " + renderLocals(fr));
    for (const auto &[ref, v] : state.heap.entries())
        line("  heap @" + std::to_string(ref) + " = " + v.toString());
}

void TraceSink::onOutcome(Outcome outcome, uint64_t steps)
{
    if (!cfg.enabled())
        return;
    LocaleGuard lg(os);
    line("outcome " + std::string(toToken(outcome)) + " after " + std::to_string(steps) +
         " steps");
}

void TraceSink::onBudgetExhausted(uint64_t steps)
{
    if (!cfg.enabled())
        return;
    LocaleGuard lg(os);
    line("budget exhausted after " + std::to_string(steps) + " steps");
}

} // namespace jade::vm
