//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the line-oriented `.jbc` parser.  Each directive is handled by a
// dedicated `parseX_E` helper that either updates the ParserState or returns a
// diagnostic; the driver loop strips comments, tracks line numbers and routes
// lines to the directive or instruction parser depending on whether a method
// body is open.
//
//===----------------------------------------------------------------------===//

#include "bc/io/SuiteParser.hpp"

#include "bc/io/CaseParser.hpp"
#include "bc/io/InstrParser.hpp"
#include "bc/io/Lexer.hpp"
#include "bc/io/ParserState.hpp"

#include <fstream>
#include <sstream>
#include <variant>

namespace jade::bc::io
{
namespace
{
using support::Expected;
using support::makeError;

uint32_t columnOf(const std::string &raw)
{
    size_t i = 0;
    while (i < raw.size() && (raw[i] == ' ' || raw[i] == '\t'))
        ++i;
    return static_cast<uint32_t>(i + 1);
}

std::string restAfter(const std::string &line, const std::string &keyword)
{
    return Lexer::trim(std::string_view(line).substr(keyword.size()));
}

Expected<void> parseHeader_E(const std::string &line, ParserState &st)
{
    std::istringstream ss(line);
    const std::string magic = Lexer::nextToken(ss);
    const std::string version = Lexer::nextToken(ss);
    if (magic != "jbc")
        return makeError(st.loc(), "listing must start with 'jbc 1'");
    if (version != "1" || !Lexer::nextToken(ss).empty())
        return makeError(st.loc(), "unsupported listing version '" + version + "'");
    st.sawHeader = true;
    return {};
}

/// @brief `class <name> [source "<path>"]`
Expected<void> parseClass_E(const std::string &line, ParserState &st)
{
    if (st.cls)
        return makeError(st.loc(), "class " + st.cls->name + " is still open");

    std::istringstream ss(restAfter(line, "class"));
    const std::string name = Lexer::nextToken(ss);
    if (name.empty())
        return makeError(st.loc(), "missing class name");

    ClassInfo info;
    info.name = internalClassName(name);

    const std::string kw = Lexer::nextToken(ss);
    if (!kw.empty())
    {
        if (kw != "source")
            return makeError(st.loc(), "unexpected '" + kw + "' after class name");
        std::string rest;
        std::getline(ss, rest);
        rest = Lexer::trim(rest);
        if (rest.size() < 2 || rest.front() != '"' || rest.back() != '"')
            return makeError(st.loc(), "source path must be quoted");
        info.sourceFile = rest.substr(1, rest.size() - 2);
    }
    st.cls = std::move(info);
    return {};
}

/// @brief `field [static] <name> <descriptor> [= <literal>]`
Expected<void> parseField_E(const std::string &line, ParserState &st)
{
    if (!st.cls)
        return makeError(st.loc(), "field outside of a class");

    std::string decl = restAfter(line, "field");
    std::string init;
    if (const size_t eq = decl.find('='); eq != std::string::npos)
    {
        init = Lexer::trim(std::string_view(decl).substr(eq + 1));
        decl = Lexer::trim(std::string_view(decl).substr(0, eq));
        if (init.empty())
            return makeError(st.loc(), "missing initializer after '='");
    }

    std::istringstream ss(decl);
    FieldInfo field;
    std::string tok = Lexer::nextToken(ss);
    if (tok == "static")
    {
        field.isStatic = true;
        tok = Lexer::nextToken(ss);
    }
    field.name = tok;
    const std::string desc = Lexer::nextToken(ss);
    if (field.name.empty() || desc.empty() || !Lexer::nextToken(ss).empty())
        return makeError(st.loc(), "field must read 'field [static] <name> <descriptor>'");

    auto ty = parseTypeDescriptor(desc);
    if (!ty || ty->kind == Type::Kind::Void)
        return makeError(st.loc(), "bad field descriptor '" + desc + "'");
    field.type = *ty;

    if (!init.empty())
    {
        if (!field.isStatic)
            return makeError(st.loc(), "only static fields take initializers");
        auto c = parseConstant(field.type, init, st.loc());
        if (!c)
            return c.error();
        field.value = c.value();
    }

    if (st.cls->findField(field.name))
        return makeError(st.loc(), "duplicate field " + field.name);
    st.cls->fields.push_back(std::move(field));
    return {};
}

/// @brief `method <name>:<descriptor> {`
Expected<void> parseMethod_E(const std::string &line, ParserState &st)
{
    if (!st.cls)
        return makeError(st.loc(), "method outside of a class");

    std::string decl = restAfter(line, "method");
    if (decl.empty() || decl.back() != '{')
        return makeError(st.loc(), "method header must end with '{'");
    decl = Lexer::trim(std::string_view(decl).substr(0, decl.size() - 1));

    auto id = parseMethodId(st.cls->name + "." + decl, st.loc());
    if (!id)
        return id.error();
    st.method = std::move(id.value());
    st.body.clear();
    st.methodLine = st.lineNo;
    return {};
}

/// @brief Check branch targets and hand the finished body to the suite.
Expected<void> closeMethod_E(ParserState &st)
{
    const auto size = static_cast<std::uint32_t>(st.body.size());
    for (const auto &in : st.body)
    {
        std::optional<std::uint32_t> target;
        if (const auto *i = std::get_if<ins::If>(&in.op))
            target = i->target;
        else if (const auto *z = std::get_if<ins::Ifz>(&in.op))
            target = z->target;
        else if (const auto *g = std::get_if<ins::Goto>(&in.op))
            target = g->target;
        if (target && *target >= size)
            return makeError(in.loc,
                             "branch target " + std::to_string(*target) + " is past the end of " +
                                 st.method->toString());
    }

    auto added = st.suite.addMethod(std::move(*st.method), std::move(st.body), st.loc());
    st.method.reset();
    st.body = {};
    return added;
}

/// @brief One body line: `[<n>:] <instruction>` or the closing `}`.
Expected<void> parseBodyLine_E(const std::string &raw, const std::string &line, ParserState &st)
{
    if (line == "}")
        return closeMethod_E(st);

    std::string text = line;
    const support::SourceLoc loc = st.loc(columnOf(raw));

    std::istringstream ss(text);
    const std::string first = Lexer::nextToken(ss);
    if (!first.empty() && first.back() == ':')
    {
        auto offset = Lexer::parseInt(std::string_view(first).substr(0, first.size() - 1));
        if (!offset)
            return makeError(loc, "bad offset label '" + first + "'");
        if (*offset < 0 || static_cast<size_t>(*offset) != st.body.size())
            return makeError(loc,
                             "offset label " + std::to_string(*offset) + " does not match position " +
                                 std::to_string(st.body.size()));
        text = Lexer::trim(std::string_view(text).substr(first.size()));
    }

    auto in = parseInstruction(text, loc);
    if (!in)
        return in.error();
    st.body.push_back(std::move(in.value()));
    return {};
}

Expected<void> parseCase_E(const std::string &line, ParserState &st)
{
    if (!st.cls)
        return makeError(st.loc(), "case outside of a class");
    auto c = parseCase(restAfter(line, "case"), st.cls->name, st.loc());
    if (!c)
        return c.error();
    st.suite.addCase(std::move(c.value()));
    return {};
}

Expected<void> parseEnd_E(ParserState &st)
{
    if (!st.cls)
        return makeError(st.loc(), "'end' without an open class");
    st.suite.addClass(std::move(*st.cls));
    st.cls.reset();
    return {};
}

bool startsWithKeyword(const std::string &line, std::string_view keyword)
{
    if (line.compare(0, keyword.size(), keyword) != 0)
        return false;
    return line.size() == keyword.size() || line[keyword.size()] == ' ' ||
           line[keyword.size()] == '\t';
}

Expected<void> parseLine_E(const std::string &raw, const std::string &line, ParserState &st)
{
    if (st.method)
        return parseBodyLine_E(raw, line, st);
    if (!st.sawHeader)
        return parseHeader_E(line, st);
    if (startsWithKeyword(line, "class"))
        return parseClass_E(line, st);
    if (startsWithKeyword(line, "field"))
        return parseField_E(line, st);
    if (startsWithKeyword(line, "method"))
        return parseMethod_E(line, st);
    if (startsWithKeyword(line, "case"))
        return parseCase_E(line, st);
    if (line == "end")
        return parseEnd_E(st);

    std::istringstream ss(line);
    return makeError(st.loc(columnOf(raw)), "unknown directive '" + Lexer::nextToken(ss) + "'");
}
} // namespace

Expected<void> SuiteParser::parse(std::istream &is, InMemorySuite &suite, uint32_t fileId)
{
    ParserState st(suite, fileId);
    std::string raw;
    while (std::getline(is, raw))
    {
        ++st.lineNo;
        const std::string line = Lexer::trim(Lexer::stripComment(raw));
        if (line.empty())
            continue;
        if (auto r = parseLine_E(raw, line, st); !r)
            return r;
    }

    if (st.method)
        return makeError(support::SourceLoc{fileId, st.methodLine, 1},
                         "method " + st.method->toString() + " is missing its closing '}'");
    if (st.cls)
        return makeError(st.loc(), "class " + st.cls->name + " is missing 'end'");
    if (!st.sawHeader)
        return makeError(support::SourceLoc{fileId, 0, 0}, "empty listing: missing 'jbc 1'");
    return {};
}

Expected<void> SuiteParser::parseFile(const std::string &path,
                                      InMemorySuite &suite,
                                      support::SourceManager &sm)
{
    std::ifstream in(path);
    if (!in)
        return makeError({}, "unable to open " + path);
    const uint32_t fileId = sm.addFile(path);
    return parse(in, suite, fileId);
}

} // namespace jade::bc::io
