// File: src/bc/io/InstrParser.hpp
// Purpose: Parse one instruction line of a method body.
// Key invariants: Unknown mnemonics, predicates and operand shapes produce
//                 diagnostics rather than instructions.
// Ownership/Lifetime: Stateless.
// Links: docs/jbc-format.md
#pragma once

#include "bc/Instr.hpp"
#include "support/diag_expected.hpp"

#include <string_view>

namespace jade::bc::io
{

/// @brief Parse @p text (without offset prefix) into an instruction at @p loc.
support::Expected<Instr> parseInstruction(std::string_view text, support::SourceLoc loc);

/// @brief Parse a literal of type @p type: int, true/false, 'c' or null.
support::Expected<Constant> parseConstant(const Type &type,
                                          std::string_view text,
                                          support::SourceLoc loc);

} // namespace jade::bc::io
