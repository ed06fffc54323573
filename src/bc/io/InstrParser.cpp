//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Parses instruction lines such as `binary I div` or
// `invoke static pkg/Cls.f:(I)I` into the closed instruction variant.  Each
// mnemonic has its own operand parser; the mnemonic table is the single place
// that decides which spellings the listing format accepts.
//
//===----------------------------------------------------------------------===//

#include "bc/io/InstrParser.hpp"

#include "bc/io/Lexer.hpp"

#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace jade::bc::io
{
namespace
{
using support::Expected;
using support::makeError;
using support::SourceLoc;

using Operands = std::vector<std::string>;
using OperandParser = std::function<Expected<Op>(const Operands &, SourceLoc)>;

Expected<void> expectCount(const Operands &ops,
                           size_t count,
                           std::string_view mnemonic,
                           SourceLoc loc)
{
    if (ops.size() == count)
        return {};
    std::ostringstream oss;
    oss << mnemonic << " expects " << count << " operand" << (count == 1 ? "" : "s") << ", got "
        << ops.size();
    return makeError(loc, oss.str());
}

Expected<Type> typeOperand(const std::string &text, SourceLoc loc)
{
    auto ty = parseTypeLetter(text);
    if (!ty)
        return makeError(loc, "unknown type '" + text + "'");
    return *ty;
}

Expected<std::uint32_t> indexOperand(const std::string &text, std::string_view what, SourceLoc loc)
{
    auto v = Lexer::parseInt(text);
    if (!v || *v < 0)
        return makeError(loc, "bad " + std::string(what) + " '" + text + "'");
    return static_cast<std::uint32_t>(*v);
}

/// @brief Parse `Cls.name` plus descriptor into a field id.
Expected<FieldId> fieldOperand(const std::string &qualified, const std::string &desc, SourceLoc loc)
{
    const size_t dot = qualified.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == qualified.size())
        return makeError(loc, "field reference '" + qualified + "' needs <class>.<name>");
    auto ty = parseTypeDescriptor(desc);
    if (!ty || ty->kind == Type::Kind::Void)
        return makeError(loc, "bad field descriptor '" + desc + "'");
    return FieldId{internalClassName(qualified.substr(0, dot)), qualified.substr(dot + 1), *ty};
}

Expected<bool> staticOperand(const std::string &text, SourceLoc loc)
{
    if (text == "static")
        return true;
    if (text == "field")
        return false;
    return makeError(loc, "expected 'static' or 'field', got '" + text + "'");
}

Expected<Op> parsePush(const Operands &ops, SourceLoc loc)
{
    if (auto r = expectCount(ops, 2, "push", loc); !r)
        return r.error();
    auto ty = typeOperand(ops[0], loc);
    if (!ty)
        return ty.error();
    auto c = parseConstant(ty.value(), ops[1], loc);
    if (!c)
        return c.error();
    return Op{ins::Push{c.value()}};
}

template <class T> Expected<Op> parseSlotOp(const Operands &ops, SourceLoc loc, const char *name)
{
    if (auto r = expectCount(ops, 2, name, loc); !r)
        return r.error();
    auto ty = typeOperand(ops[0], loc);
    if (!ty)
        return ty.error();
    if (ty.value().kind == Type::Kind::Void)
        return makeError(loc, std::string(name) + " cannot use type V");
    auto slot = indexOperand(ops[1], "local slot", loc);
    if (!slot)
        return slot.error();
    return Op{T{ty.value(), slot.value()}};
}

Expected<Op> parseBinary(const Operands &ops, SourceLoc loc)
{
    if (auto r = expectCount(ops, 2, "binary", loc); !r)
        return r.error();
    auto ty = typeOperand(ops[0], loc);
    if (!ty)
        return ty.error();
    auto op = parseBinaryOp(ops[1]);
    if (!op)
        return makeError(loc, "unknown binary operator '" + ops[1] + "'");
    return Op{ins::Binary{ty.value(), *op}};
}

Expected<Op> parseNegate(const Operands &ops, SourceLoc loc)
{
    if (auto r = expectCount(ops, 1, "negate", loc); !r)
        return r.error();
    auto ty = typeOperand(ops[0], loc);
    if (!ty)
        return ty.error();
    return Op{ins::Negate{ty.value()}};
}

Expected<Op> parseIncr(const Operands &ops, SourceLoc loc)
{
    if (auto r = expectCount(ops, 2, "incr", loc); !r)
        return r.error();
    auto slot = indexOperand(ops[0], "local slot", loc);
    if (!slot)
        return slot.error();
    auto amount = Lexer::parseInt(ops[1]);
    if (!amount)
        return makeError(loc, "bad increment '" + ops[1] + "'");
    return Op{ins::Incr{slot.value(), *amount}};
}

template <class T> Expected<Op> parseNullary(const Operands &ops, SourceLoc loc, const char *name)
{
    if (auto r = expectCount(ops, 0, name, loc); !r)
        return r.error();
    return Op{T{}};
}

template <class T> Expected<Op> parseBranch(const Operands &ops, SourceLoc loc, const char *name)
{
    if (auto r = expectCount(ops, 2, name, loc); !r)
        return r.error();
    auto cond = parseCondition(ops[0]);
    if (!cond)
        return makeError(loc, "unknown condition '" + ops[0] + "'");
    auto target = indexOperand(ops[1], "branch target", loc);
    if (!target)
        return target.error();
    return Op{T{*cond, target.value()}};
}

Expected<Op> parseGoto(const Operands &ops, SourceLoc loc)
{
    if (auto r = expectCount(ops, 1, "goto", loc); !r)
        return r.error();
    auto target = indexOperand(ops[0], "branch target", loc);
    if (!target)
        return target.error();
    return Op{ins::Goto{target.value()}};
}

template <class T> Expected<Op> parseFieldOp(const Operands &ops, SourceLoc loc, const char *name)
{
    if (auto r = expectCount(ops, 3, name, loc); !r)
        return r.error();
    auto isStatic = staticOperand(ops[0], loc);
    if (!isStatic)
        return isStatic.error();
    auto field = fieldOperand(ops[1], ops[2], loc);
    if (!field)
        return field.error();
    return Op{T{isStatic.value(), field.value()}};
}

Expected<Op> parseNew(const Operands &ops, SourceLoc loc)
{
    if (auto r = expectCount(ops, 1, "new", loc); !r)
        return r.error();
    return Op{ins::New{internalClassName(ops[0])}};
}

template <class T> Expected<Op> parseElementOp(const Operands &ops, SourceLoc loc, const char *name)
{
    if (auto r = expectCount(ops, 1, name, loc); !r)
        return r.error();
    auto ty = typeOperand(ops[0], loc);
    if (!ty)
        return ty.error();
    if (ty.value().kind == Type::Kind::Void)
        return makeError(loc, std::string(name) + " cannot use type V");
    return Op{T{ty.value()}};
}

Expected<Op> parseInvoke(const Operands &ops, SourceLoc loc)
{
    if (auto r = expectCount(ops, 2, "invoke", loc); !r)
        return r.error();
    auto kind = parseInvokeKind(ops[0]);
    if (!kind)
        return makeError(loc, "unknown invoke kind '" + ops[0] + "'");
    auto method = parseMethodId(ops[1], loc);
    if (!method)
        return method.error();
    return Op{ins::Invoke{*kind, method.value()}};
}

Expected<Op> parseReturn(const Operands &ops, SourceLoc loc)
{
    if (auto r = expectCount(ops, 1, "return", loc); !r)
        return r.error();
    auto ty = typeOperand(ops[0], loc);
    if (!ty)
        return ty.error();
    if (ty.value().kind == Type::Kind::Void)
        return Op{ins::Return{}};
    return Op{ins::Return{ty.value()}};
}

Expected<Op> parseCast(const Operands &ops, SourceLoc loc)
{
    if (auto r = expectCount(ops, 2, "cast", loc); !r)
        return r.error();
    auto from = typeOperand(ops[0], loc);
    if (!from)
        return from.error();
    auto to = typeOperand(ops[1], loc);
    if (!to)
        return to.error();
    return Op{ins::Cast{from.value(), to.value()}};
}

const std::unordered_map<std::string, OperandParser> &mnemonicTable()
{
    static const std::unordered_map<std::string, OperandParser> table = {
        {"push", parsePush},
        {"load", [](const Operands &o, SourceLoc l) { return parseSlotOp<ins::Load>(o, l, "load"); }},
        {"store",
         [](const Operands &o, SourceLoc l) { return parseSlotOp<ins::Store>(o, l, "store"); }},
        {"binary", parseBinary},
        {"negate", parseNegate},
        {"incr", parseIncr},
        {"dup", [](const Operands &o, SourceLoc l) { return parseNullary<ins::Dup>(o, l, "dup"); }},
        {"pop", [](const Operands &o, SourceLoc l) { return parseNullary<ins::Pop>(o, l, "pop"); }},
        {"if", [](const Operands &o, SourceLoc l) { return parseBranch<ins::If>(o, l, "if"); }},
        {"ifz", [](const Operands &o, SourceLoc l) { return parseBranch<ins::Ifz>(o, l, "ifz"); }},
        {"goto", parseGoto},
        {"get", [](const Operands &o, SourceLoc l) { return parseFieldOp<ins::Get>(o, l, "get"); }},
        {"put", [](const Operands &o, SourceLoc l) { return parseFieldOp<ins::Put>(o, l, "put"); }},
        {"new", parseNew},
        {"newarray",
         [](const Operands &o, SourceLoc l)
         { return parseElementOp<ins::NewArray>(o, l, "newarray"); }},
        {"arrayload",
         [](const Operands &o, SourceLoc l)
         { return parseElementOp<ins::ArrayLoad>(o, l, "arrayload"); }},
        {"arraystore",
         [](const Operands &o, SourceLoc l)
         { return parseElementOp<ins::ArrayStore>(o, l, "arraystore"); }},
        {"arraylength",
         [](const Operands &o, SourceLoc l)
         { return parseNullary<ins::ArrayLength>(o, l, "arraylength"); }},
        {"invoke", parseInvoke},
        {"return", parseReturn},
        {"cast", parseCast},
    };
    return table;
}
} // namespace

Expected<Constant> parseConstant(const Type &type, std::string_view text, SourceLoc loc)
{
    const std::string literal(text);
    if (type.isReference())
    {
        if (literal != "null")
            return makeError(loc, "reference constants must be null, got '" + literal + "'");
        return Constant{type, 0};
    }
    switch (type.kind)
    {
        case Type::Kind::Boolean:
        {
            if (auto b = Lexer::parseBool(literal))
                return Constant{type, *b ? 1 : 0};
            if (auto v = Lexer::parseInt(literal); v && (*v == 0 || *v == 1))
                return Constant{type, *v};
            return makeError(loc, "bad boolean literal '" + literal + "'");
        }
        case Type::Kind::Char:
        {
            if (auto c = Lexer::parseChar(literal))
                return Constant{type, static_cast<std::int32_t>(*c)};
            if (auto v = Lexer::parseInt(literal); v && *v >= 0 && *v <= 0xFFFF)
                return Constant{type, *v};
            return makeError(loc, "bad char literal '" + literal + "'");
        }
        case Type::Kind::Int:
        case Type::Kind::Short:
        case Type::Kind::Byte:
        {
            if (auto v = Lexer::parseInt(literal))
                return Constant{type, *v};
            return makeError(loc, "bad integer literal '" + literal + "'");
        }
        default:
            return makeError(loc, "no constants of type " + type.toString());
    }
}

Expected<Instr> parseInstruction(std::string_view text, SourceLoc loc)
{
    std::istringstream ss{std::string(text)};
    const std::string mnemonic = Lexer::nextToken(ss);
    if (mnemonic.empty())
        return makeError(loc, "missing instruction");

    Operands operands;
    for (std::string tok = Lexer::nextToken(ss); !tok.empty(); tok = Lexer::nextToken(ss))
        operands.push_back(std::move(tok));

    const auto &table = mnemonicTable();
    auto it = table.find(mnemonic);
    if (it == table.end())
        return makeError(loc, "unknown instruction '" + mnemonic + "'");

    auto op = it->second(operands, loc);
    if (!op)
        return op.error();
    return Instr{std::move(op.value()), loc};
}

} // namespace jade::bc::io
