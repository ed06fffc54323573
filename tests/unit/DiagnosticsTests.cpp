// File: tests/unit/DiagnosticsTests.cpp
// Purpose: Verify diagnostic rendering and the severity counters of
//          DiagnosticEngine.
// Key invariants: Located diagnostics print as `path:line:col: severity: msg`.
// Ownership/Lifetime: Engines and managers are local to each test.
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <sstream>

using namespace jade::support;

TEST(Diagnostics, PrintIncludesPathLineAndColumn)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("listings/./demo.jbc");
    std::ostringstream os;
    printDiag(makeError({id, 12, 5}, "unknown instruction 'jump'"), os, &sm);
    EXPECT_EQ(os.str(), "listings/demo.jbc:12:5: error: unknown instruction 'jump'\n");
}

TEST(Diagnostics, PrintOmitsMissingComponents)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("demo.jbc");

    std::ostringstream lineOnly;
    printDiag(makeError({id, 3, 0}, "oops"), lineOnly, &sm);
    EXPECT_EQ(lineOnly.str(), "demo.jbc:3: error: oops\n");

    std::ostringstream unlocated;
    printDiag(makeError({}, "oops"), unlocated, &sm);
    EXPECT_EQ(unlocated.str(), "error: oops\n");
}

TEST(Diagnostics, SourceManagerDeduplicatesNormalizedPaths)
{
    SourceManager sm;
    const uint32_t a = sm.addFile("x/y.jbc");
    const uint32_t b = sm.addFile("x/./y.jbc");
    const uint32_t c = sm.addFile("z.jbc");
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(a, b);
    EXPECT_EQ(c, 2u);
    EXPECT_EQ(sm.getPath(0), "");
    EXPECT_EQ(sm.getPath(c), "z.jbc");
}

TEST(Diagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine de;
    de.report({Severity::Error, "first", {}});
    de.report({Severity::Warning, "careful", {}});
    de.report({Severity::Note, "fyi", {}});
    de.report({Severity::Error, "second", {}});
    EXPECT_EQ(de.errorCount(), 2u);
    EXPECT_EQ(de.warningCount(), 1u);
    EXPECT_EQ(de.diagnostics().size(), 4u);

    std::ostringstream os;
    de.printAll(os);
    EXPECT_EQ(os.str(), "error: first\nwarning: careful\nnote: fyi\nerror: second\n");
}

TEST(Diagnostics, ExpectedCarriesValueOrError)
{
    Expected<int> ok = 4;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 4);

    Expected<int> bad = makeError({}, "nope");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "nope");

    Expected<void> fine;
    EXPECT_TRUE(fine.hasValue());
}
