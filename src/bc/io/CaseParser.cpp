//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Parses argument literals and case declarations.  Scalars are ints, booleans
// and quoted chars; arrays are written `[I:1,2]`, `[C:'a','b']` or
// `[Z:true]` with the element descriptor before the colon.  Objects are
// written `new pkg/Cls(v1, v2)` with one value per instance field.
//
//===----------------------------------------------------------------------===//

#include "bc/io/CaseParser.hpp"

#include "bc/Outcome.hpp"
#include "bc/io/Lexer.hpp"

#include <cctype>
#include <string>

namespace jade::bc::io
{
namespace
{
using support::Expected;
using support::makeError;
using support::SourceLoc;

Expected<std::int32_t> parseScalar(const Type &element, const std::string &text, SourceLoc loc)
{
    switch (element.kind)
    {
        case Type::Kind::Boolean:
            if (auto b = Lexer::parseBool(text))
                return *b ? 1 : 0;
            return makeError(loc, "bad boolean element '" + text + "'");
        case Type::Kind::Char:
            if (auto c = Lexer::parseChar(text))
                return static_cast<std::int32_t>(*c);
            return makeError(loc, "bad char element '" + text + "'");
        case Type::Kind::Int:
        case Type::Kind::Short:
        case Type::Kind::Byte:
            if (auto v = Lexer::parseInt(text))
                return *v;
            return makeError(loc, "bad integer element '" + text + "'");
        default:
            return makeError(loc, "unsupported array element type " + element.toString());
    }
}

Expected<Input> parseArray(const std::string &text, SourceLoc loc)
{
    if (text.size() < 2 || text.back() != ']')
        return makeError(loc, "unterminated array literal '" + text + "'");
    const std::string body = text.substr(1, text.size() - 2);
    const size_t colon = body.find(':');
    if (colon == std::string::npos)
        return makeError(loc, "array literal '" + text + "' needs an element type, e.g. [I:1,2]");

    auto element = parseTypeDescriptor(Lexer::trim(body.substr(0, colon)));
    if (!element || !element->isIntCategory())
        return makeError(loc, "bad array element type in '" + text + "'");

    std::vector<std::int32_t> values;
    for (const auto &piece : Lexer::splitCommaSeparated(body.substr(colon + 1)))
    {
        auto v = parseScalar(*element, piece, loc);
        if (!v)
            return v.error();
        values.push_back(v.value());
    }
    return Input::ofArray(*element, std::move(values));
}

Expected<Input> parseObject(const std::string &text, SourceLoc loc)
{
    const std::string rest = Lexer::trim(std::string_view(text).substr(3));
    const size_t open = rest.find('(');
    if (open == std::string::npos || open == 0 || rest.back() != ')')
        return makeError(loc, "object literal '" + text + "' must read 'new <class>(<values>)'");

    std::string className = Lexer::trim(std::string_view(rest).substr(0, open));
    for (char &c : className)
    {
        if (c == '.')
            c = '/';
    }
    if (className.find_first_of(" \t(),") != std::string::npos)
        return makeError(loc, "bad class name in '" + text + "'");

    std::vector<Input> fields;
    for (const auto &piece :
         Lexer::splitCommaSeparated(std::string_view(rest).substr(open + 1, rest.size() - open - 2)))
    {
        auto field = parseInput(piece, loc);
        if (!field)
            return field.error();
        fields.push_back(std::move(field.value()));
    }
    return Input::ofObject(std::move(className), std::move(fields));
}

bool accepts(const Type &param, const Input &input)
{
    if (input.type.kind == Type::Kind::Array || input.type.kind == Type::Kind::Object)
        return param == input.type;
    switch (input.type.kind)
    {
        case Type::Kind::Boolean:
            return param.kind == Type::Kind::Boolean;
        case Type::Kind::Char:
            return param.kind == Type::Kind::Char;
        default:
            return param.kind == Type::Kind::Int || param.kind == Type::Kind::Short ||
                   param.kind == Type::Kind::Byte;
    }
}

std::string scalarText(const Type &ty, std::int32_t v)
{
    if (ty.kind == Type::Kind::Boolean)
        return v ? "true" : "false";
    if (ty.kind == Type::Kind::Char && v >= 0x20 && v < 0x7f && v != '\\' && v != '\'')
        return std::string("'") + static_cast<char>(v) + "'";
    return std::to_string(v);
}

std::string formatInput(const Input &in)
{
    if (in.type.kind == Type::Kind::Array)
    {
        std::string out = "[" + in.type.element->descriptor() + ":";
        for (size_t j = 0; j < in.elements.size(); ++j)
        {
            if (j)
                out += ",";
            out += scalarText(*in.type.element, in.elements[j]);
        }
        return out + "]";
    }
    if (in.type.kind == Type::Kind::Object)
    {
        std::string out = "new " + in.type.className + "(";
        for (size_t j = 0; j < in.fields.size(); ++j)
        {
            if (j)
                out += ", ";
            out += formatInput(in.fields[j]);
        }
        return out + ")";
    }
    return scalarText(in.type, in.scalar);
}
} // namespace

Expected<Input> parseInput(std::string_view text, SourceLoc loc)
{
    const std::string literal = Lexer::trim(text);
    if (literal.empty())
        return makeError(loc, "empty input literal");
    if (literal.front() == '[')
        return parseArray(literal, loc);
    if (literal.rfind("new", 0) == 0 && literal.size() > 3 &&
        std::isspace(static_cast<unsigned char>(literal[3])))
        return parseObject(literal, loc);
    if (auto b = Lexer::parseBool(literal))
        return Input::ofBoolean(*b);
    if (literal.front() == '\'')
    {
        if (auto c = Lexer::parseChar(literal))
            return Input::ofChar(*c);
        return makeError(loc, "bad char literal " + literal);
    }
    if (auto v = Lexer::parseInt(literal))
        return Input::ofInt(*v);
    return makeError(loc, "bad input literal '" + literal + "'");
}

Expected<std::vector<Input>> parseInputs(std::string_view text, const MethodId &method, SourceLoc loc)
{
    const std::string list = Lexer::trim(text);
    if (list.size() < 2 || list.front() != '(' || list.back() != ')')
        return makeError(loc, "inputs must be written as (v1, v2, ...), got '" + list + "'");

    std::vector<Input> inputs;
    for (const auto &piece : Lexer::splitCommaSeparated(list.substr(1, list.size() - 2)))
    {
        auto in = parseInput(piece, loc);
        if (!in)
            return in.error();
        inputs.push_back(std::move(in.value()));
    }

    if (inputs.size() != method.params.size())
        return makeError(loc,
                         method.toString() + " takes " + std::to_string(method.params.size()) +
                             " arguments, got " + std::to_string(inputs.size()));
    for (size_t i = 0; i < inputs.size(); ++i)
    {
        if (!accepts(method.params[i], inputs[i]))
            return makeError(loc,
                             "input " + std::to_string(i) + " is " + inputs[i].type.toString() +
                                 ", parameter expects " + method.params[i].toString());
    }
    return inputs;
}

std::string formatInputs(const std::vector<Input> &inputs)
{
    std::string out = "(";
    for (size_t i = 0; i < inputs.size(); ++i)
    {
        if (i)
            out += ", ";
        out += formatInput(inputs[i]);
    }
    out += ")";
    return out;
}

Expected<Case> parseCase(std::string_view text, std::string_view owner, SourceLoc loc)
{
    const std::string line = Lexer::trim(text);
    const size_t open = line.find('(');
    const size_t arrow = line.rfind("->");
    if (open == std::string::npos || arrow == std::string::npos || arrow < open)
        return makeError(loc, "case must read '<method> (<inputs>) -> <outcome>'");

    // The descriptor also starts with '(', so the inputs begin at the first
    // '(' after the whitespace that ends the method reference.
    const size_t space = line.find_first_of(" \t");
    if (space == std::string::npos || space > arrow)
        return makeError(loc, "case must read '<method> (<inputs>) -> <outcome>'");

    std::string ref = line.substr(0, space);
    if (ref.find('.') == std::string::npos || ref.find('.') > ref.find(':'))
        ref = std::string(owner) + "." + ref;
    auto method = parseMethodId(ref, loc);
    if (!method)
        return method.error();

    auto inputs = parseInputs(line.substr(space, arrow - space), method.value(), loc);
    if (!inputs)
        return inputs.error();

    std::string expected = Lexer::trim(line.substr(arrow + 2));
    if (expected != kNonTerminationMarker && !outcomeFromToken(expected))
        return makeError(loc, "unknown outcome '" + expected + "'");

    return Case{std::move(method.value()), std::move(inputs.value()), std::move(expected), loc};
}

} // namespace jade::bc::io
