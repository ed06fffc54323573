//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Outcome.hpp
// Purpose: Makes the outcome taxonomy available to the interpreter namespace.
// Key invariants: Same types and tokens as bc/Outcome.hpp.
// Ownership/Lifetime: Not applicable.
// Links: docs/vm.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bc/Outcome.hpp"

namespace jade::vm
{

using bc::kNonTerminationMarker;
using bc::Outcome;
using bc::outcomeFromToken;
using bc::toToken;

} // namespace jade::vm
