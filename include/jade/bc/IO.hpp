// File: include/jade/bc/IO.hpp
// Purpose: Stable facade for reading `.jbc` listings, method ids and inputs.
// Key invariants: Re-exports supported IO interfaces; parser internals stay internal.
// Ownership/Lifetime: Parsers are stateless; suites are owned by the caller.
// Links: docs/jbc-format.md
#pragma once

#include "bc/MethodId.hpp"
#include "bc/io/CaseParser.hpp"
#include "bc/io/SuiteParser.hpp"
