// File: src/bc/io/ParserState.hpp
// Purpose: Mutable state threaded through the line-oriented listing parser.
// Key invariants: At most one class and one method body are open at a time;
//                 body offsets equal the number of instructions parsed so far.
// Ownership/Lifetime: Borrows the destination suite.
// Links: docs/jbc-format.md
#pragma once

#include "bc/ClassInfo.hpp"
#include "bc/Instr.hpp"
#include "bc/MethodId.hpp"
#include "bc/ProgramSuite.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace jade::bc::io
{

struct ParserState
{
    explicit ParserState(InMemorySuite &s, uint32_t file) : suite(s), fileId(file) {}

    InMemorySuite &suite;
    uint32_t fileId = 0;
    unsigned lineNo = 0;
    bool sawHeader = false;

    /// @brief Class between `class` and `end`.
    std::optional<ClassInfo> cls;

    /// @brief Method between `method ... {` and `}`.
    std::optional<MethodId> method;
    std::vector<Instr> body;
    unsigned methodLine = 0;

    support::SourceLoc loc(uint32_t column = 1) const
    {
        return support::SourceLoc{fileId, lineNo, column};
    }
};

} // namespace jade::bc::io
