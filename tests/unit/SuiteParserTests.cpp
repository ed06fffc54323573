// File: tests/unit/SuiteParserTests.cpp
// Purpose: Verify the `.jbc` listing parser: directives, method bodies, case
//          lines and located diagnostics.
// Key invariants: Errors carry the 1-based line (and column for body lines)
//                 of the offending text; a failed parse stops at that line.
// Ownership/Lifetime: Each test parses into its own InMemorySuite.
// Links: docs/jbc-format.md

#include <gtest/gtest.h>

#include "bc/io/SuiteParser.hpp"
#include "common/SuiteBuilder.hpp"
#include "support/diag_expected.hpp"

#include <sstream>

using jade::bc::InMemorySuite;
using jade::bc::io::SuiteParser;
using jade::support::Expected;

namespace
{
Expected<void> parseText(const std::string &text, InMemorySuite &suite)
{
    std::istringstream in(text);
    return SuiteParser::parse(in, suite, 1);
}

/// @brief Parse @p text and return the first diagnostic's message and line.
std::pair<std::string, uint32_t> firstError(const std::string &text)
{
    InMemorySuite suite;
    auto r = parseText(text, suite);
    EXPECT_FALSE(r);
    if (r)
        return {"", 0};
    return {r.error().message, r.error().loc.line};
}

const char *kSimple = R"(jbc 1
# Integer division with an assertion guard.
class jpamb.cases.Simple source "Simple.java"
  field static $assertionsDisabled Z = false
  field count I

  method divide:(II)I {
    0: load I 0
    1: load I 1
    2: binary I div
    3: return I
  }

  method spin:()V {
    goto 0
  }

  case divide:(II)I (10, 0) -> divide by zero
  case divide:(II)I (10, 2) -> ok   # plain division
  case spin:()V () -> *
end
)";
} // namespace

TEST(SuiteParser, ParsesClassesMethodsAndCases)
{
    InMemorySuite suite;
    auto r = parseText(kSimple, suite);
    ASSERT_TRUE(r) << r.error().message;

    EXPECT_TRUE(suite.hasClass("jpamb/cases/Simple"));
    EXPECT_EQ(suite.methodCount(), 2u);
    EXPECT_EQ(suite.sourceFile("jpamb/cases/Simple"), std::optional<std::string>("Simple.java"));

    auto body = suite.methodOpcodes(jade::tests::methodId("jpamb/cases/Simple.divide:(II)I"));
    ASSERT_TRUE(body);
    ASSERT_EQ(body.value().size(), 4u);
    EXPECT_EQ(jade::bc::toString(body.value()[2]), "binary I div");
    EXPECT_EQ(body.value()[2].loc.line, 10u);
    EXPECT_EQ(body.value()[2].loc.column, 5u);

    ASSERT_EQ(suite.cases().size(), 3u);
    EXPECT_EQ(suite.cases()[0].expected, "divide by zero");
    EXPECT_EQ(suite.cases()[1].expected, "ok");
    EXPECT_EQ(suite.cases()[1].loc.line, 19u);
    EXPECT_EQ(suite.cases()[2].expected, "*");
}

TEST(SuiteParser, StaticInitializerAndInstanceField)
{
    InMemorySuite suite;
    ASSERT_TRUE(parseText(kSimple, suite));
    auto cls = suite.findClass("jpamb/cases/Simple");
    ASSERT_TRUE(cls);

    const auto *flag = cls.value().findField("$assertionsDisabled");
    ASSERT_NE(flag, nullptr);
    EXPECT_TRUE(flag->isStatic);
    ASSERT_TRUE(flag->value.has_value());
    EXPECT_EQ(flag->value->value, 0);

    const auto *count = cls.value().findField("count");
    ASSERT_NE(count, nullptr);
    EXPECT_FALSE(count->isStatic);
    EXPECT_FALSE(count->value.has_value());
}

TEST(SuiteParser, ParsedProgramRuns)
{
    InMemorySuite suite;
    ASSERT_TRUE(parseText(kSimple, suite));
    jade::vm::RunConfig config;
    config.maxSteps = 200;
    jade::vm::Runner runner(suite, config);
    for (const auto &c : suite.cases())
        EXPECT_EQ(runner.run(c.method, c.inputs).token(), c.expected) << c.method.toString();
}

TEST(SuiteParser, QuotedCharOperandMayHoldSpaces)
{
    InMemorySuite suite;
    auto r = parseText("jbc 1\nclass A\n"
                       "  field static sep C = ' '\n"
                       "  method f:()C {\n    push C ' '   # blank\n    return C\n  }\n"
                       "  method g:()C {\n    push C '\\''\n    return C\n  }\nend\n",
                       suite);
    ASSERT_TRUE(r) << r.error().message;

    auto body = suite.methodOpcodes(jade::tests::methodId("A.f:()C"));
    ASSERT_TRUE(body);
    ASSERT_EQ(body.value().size(), 2u);
    const auto &push = std::get<jade::bc::ins::Push>(body.value()[0].op);
    EXPECT_EQ(push.constant.value, ' ');

    auto quote = suite.methodOpcodes(jade::tests::methodId("A.g:()C"));
    ASSERT_TRUE(quote);
    EXPECT_EQ(std::get<jade::bc::ins::Push>(quote.value()[0].op).constant.value, '\'');

    auto cls = suite.findClass("A");
    ASSERT_TRUE(cls);
    const auto *sep = cls.value().findField("sep");
    ASSERT_NE(sep, nullptr);
    ASSERT_TRUE(sep->value.has_value());
    EXPECT_EQ(sep->value->value, ' ');
}

TEST(SuiteParser, UnknownInstructionReportsLineAndColumn)
{
    InMemorySuite suite;
    auto r = parseText("jbc 1\nclass A\n  method f:()V {\n      jump 3\n  }\nend\n", suite);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "unknown instruction 'jump'");
    EXPECT_EQ(r.error().loc.line, 4u);
    EXPECT_EQ(r.error().loc.column, 7u);
    EXPECT_EQ(r.error().loc.file_id, 1u);
}

TEST(SuiteParser, UnknownConditionIsRejected)
{
    auto [msg, line] = firstError("jbc 1\nclass A\nmethod f:()V {\npush I 0\nifz maybe 0\n}\nend\n");
    EXPECT_EQ(msg, "unknown condition 'maybe'");
    EXPECT_EQ(line, 5u);
}

TEST(SuiteParser, OffsetLabelMustMatchPosition)
{
    auto [msg, line] =
        firstError("jbc 1\nclass A\nmethod f:()V {\n0: push I 0\n2: pop\n}\nend\n");
    EXPECT_EQ(msg, "offset label 2 does not match position 1");
    EXPECT_EQ(line, 5u);
}

TEST(SuiteParser, BranchTargetPastEndIsRejected)
{
    auto [msg, line] = firstError("jbc 1\nclass A\nmethod f:()V {\ngoto 4\nreturn V\n}\nend\n");
    EXPECT_EQ(msg, "branch target 4 is past the end of A.f:()V");
    EXPECT_EQ(line, 4u);
}

TEST(SuiteParser, StructuralErrors)
{
    EXPECT_EQ(firstError("class A\nend\n").first, "listing must start with 'jbc 1'");
    EXPECT_EQ(firstError("jbc 2\n").first, "unsupported listing version '2'");
    EXPECT_EQ(firstError("").first, "empty listing: missing 'jbc 1'");
    EXPECT_EQ(firstError("jbc 1\nclass A\nmethod f:()V {\nreturn V\n").first,
              "method A.f:()V is missing its closing '}'");
    EXPECT_EQ(firstError("jbc 1\nclass A\n").first, "class A is missing 'end'");
    EXPECT_EQ(firstError("jbc 1\nmethod f:()V {\n").first, "method outside of a class");
    EXPECT_EQ(firstError("jbc 1\nclass A\nbogus 1\nend\n").first, "unknown directive 'bogus'");
}

TEST(SuiteParser, DuplicateMethodIsRejected)
{
    auto [msg, line] = firstError(
        "jbc 1\nclass A\nmethod f:()V {\nreturn V\n}\nmethod f:()V {\nreturn V\n}\nend\n");
    EXPECT_EQ(msg, "duplicate method A.f:()V");
    EXPECT_EQ(line, 8u);
}

TEST(SuiteParser, FieldErrors)
{
    EXPECT_EQ(firstError("jbc 1\nclass A\nfield x I = 3\nend\n").first,
              "only static fields take initializers");
    EXPECT_EQ(firstError("jbc 1\nclass A\nfield static x Q\nend\n").first,
              "bad field descriptor 'Q'");
    EXPECT_EQ(firstError("jbc 1\nclass A\nfield x I\nfield x I\nend\n").first,
              "duplicate field x");
}

TEST(SuiteParser, CaseErrorsAreLocated)
{
    auto [msg, line] =
        firstError("jbc 1\nclass A\nmethod f:(I)V {\nreturn V\n}\ncase f:(I)V () -> ok\nend\n");
    EXPECT_EQ(msg, "A.f:(I)V takes 1 arguments, got 0");
    EXPECT_EQ(line, 6u);
}

TEST(SuiteParser, PrintedDiagnosticNamesTheFile)
{
    jade::support::SourceManager sm;
    const uint32_t id = sm.addFile("cases/bad.jbc");
    std::istringstream in("jbc 1\nclass A\nmethod f:()V {\n  frob\n}\nend\n");
    InMemorySuite suite;
    auto r = SuiteParser::parse(in, suite, id);
    ASSERT_FALSE(r);
    std::ostringstream os;
    jade::support::printDiag(r.error(), os, &sm);
    EXPECT_EQ(os.str(), "cases/bad.jbc:4:3: error: unknown instruction 'frob'\n");
}
