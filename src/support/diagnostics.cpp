//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic engine.  Records are kept in report order and
// printed through printDiag so every tool shares one output format.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace jade::support
{

/// @brief Append @p d and bump the matching severity counter.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        printDiag(d, os, sm);
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

} // namespace jade::support
