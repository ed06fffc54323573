//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the SuiteParser, which reads `.jbc` listings into an
// InMemorySuite.  A listing starts with a `jbc 1` header and declares classes
// with their fields, method bodies and expected-outcome cases.
//
// Error Handling:
// Parsing stops at the first malformed line and returns a diagnostic whose
// location carries the file id and line number.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bc/ProgramSuite.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <istream>
#include <string>

namespace jade::bc::io
{

class SuiteParser
{
  public:
    /// @brief Parse a listing from @p is into @p suite.
    /// @param fileId SourceManager id stamped on locations (0 when unknown).
    [[nodiscard]] static support::Expected<void> parse(std::istream &is,
                                                       InMemorySuite &suite,
                                                       uint32_t fileId = 0);

    /// @brief Open @p path, register it with @p sm and parse it into @p suite.
    [[nodiscard]] static support::Expected<void> parseFile(const std::string &path,
                                                           InMemorySuite &suite,
                                                           support::SourceManager &sm);
};

} // namespace jade::bc::io
