// File: src/bc/io/CaseParser.hpp
// Purpose: Parse concrete method inputs "(10, 'a', [I:1,2])" and case lines.
// Key invariants: Inputs are validated against the method's parameter types.
// Ownership/Lifetime: Stateless.
// Links: docs/jbc-format.md#inputs
#pragma once

#include "bc/Case.hpp"
#include "bc/MethodId.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jade::bc::io
{

/// @brief Parse one input literal without a type context.
support::Expected<Input> parseInput(std::string_view text, support::SourceLoc loc = {});

/// @brief Parse a parenthesised input list and check it against @p method.
support::Expected<std::vector<Input>> parseInputs(std::string_view text,
                                                  const MethodId &method,
                                                  support::SourceLoc loc = {});

/// @brief Render @p inputs back in literal syntax, e.g. "(10, [I:1,2])".
std::string formatInputs(const std::vector<Input> &inputs);

/// @brief Parse the body of a `case` line: `<method> (<inputs>) -> <token>`.
/// @param owner Class used when the method reference has no class part.
support::Expected<Case> parseCase(std::string_view text,
                                  std::string_view owner,
                                  support::SourceLoc loc = {});

} // namespace jade::bc::io
