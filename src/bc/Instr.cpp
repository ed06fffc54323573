//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements mnemonic tables and listing-syntax rendering for instructions.
// The rendering is what trace lines print, so it must round-trip through the
// listing parser.
//
//===----------------------------------------------------------------------===//

#include "bc/Instr.hpp"

#include <array>
#include <sstream>
#include <utility>

namespace jade::bc
{
namespace
{
constexpr std::array<std::pair<BinaryOp, const char *>, 11> kBinaryOps{{
    {BinaryOp::Add, "add"},
    {BinaryOp::Sub, "sub"},
    {BinaryOp::Mul, "mul"},
    {BinaryOp::Div, "div"},
    {BinaryOp::Rem, "rem"},
    {BinaryOp::And, "and"},
    {BinaryOp::Or, "or"},
    {BinaryOp::Xor, "xor"},
    {BinaryOp::Shl, "shl"},
    {BinaryOp::Shr, "shr"},
    {BinaryOp::Ushr, "ushr"},
}};

constexpr std::array<std::pair<Condition, const char *>, 8> kConditions{{
    {Condition::Eq, "eq"},
    {Condition::Ne, "ne"},
    {Condition::Lt, "lt"},
    {Condition::Ge, "ge"},
    {Condition::Gt, "gt"},
    {Condition::Le, "le"},
    {Condition::Is, "is"},
    {Condition::IsNot, "isnot"},
}};

constexpr std::array<std::pair<InvokeKind, const char *>, 3> kInvokeKinds{{
    {InvokeKind::Static, "static"},
    {InvokeKind::Special, "special"},
    {InvokeKind::Virtual, "virtual"},
}};

template <class Table, class Key> const char *lookupName(const Table &table, Key key)
{
    for (const auto &[k, name] : table)
    {
        if (k == key)
            return name;
    }
    return "?";
}

template <class Table>
auto lookupKey(const Table &table, std::string_view text)
    -> std::optional<typename Table::value_type::first_type>
{
    for (const auto &[k, name] : table)
    {
        if (text == name)
            return k;
    }
    return std::nullopt;
}

std::string constantText(const Constant &c)
{
    switch (c.type.kind)
    {
        case Type::Kind::Boolean:
            return c.value ? "true" : "false";
        case Type::Kind::Object:
        case Type::Kind::Array:
            return "null";
        default:
            return std::to_string(c.value);
    }
}

struct Printer
{
    std::ostringstream &os;

    void operator()(const ins::Push &i) const
    {
        os << "push " << i.constant.type.descriptor() << ' ' << constantText(i.constant);
    }

    void operator()(const ins::Load &i) const
    {
        os << "load " << i.type.descriptor() << ' ' << i.slot;
    }

    void operator()(const ins::Store &i) const
    {
        os << "store " << i.type.descriptor() << ' ' << i.slot;
    }

    void operator()(const ins::Binary &i) const
    {
        os << "binary " << i.type.descriptor() << ' ' << toString(i.op);
    }

    void operator()(const ins::Negate &i) const
    {
        os << "negate " << i.type.descriptor();
    }

    void operator()(const ins::Incr &i) const
    {
        os << "incr " << i.slot << ' ' << i.amount;
    }

    void operator()(const ins::Dup &) const
    {
        os << "dup";
    }

    void operator()(const ins::Pop &) const
    {
        os << "pop";
    }

    void operator()(const ins::If &i) const
    {
        os << "if " << toString(i.condition) << ' ' << i.target;
    }

    void operator()(const ins::Ifz &i) const
    {
        os << "ifz " << toString(i.condition) << ' ' << i.target;
    }

    void operator()(const ins::Goto &i) const
    {
        os << "goto " << i.target;
    }

    void operator()(const ins::Get &i) const
    {
        os << "get " << (i.isStatic ? "static " : "field ") << i.field.toString() << ' '
           << i.field.type.descriptor();
    }

    void operator()(const ins::Put &i) const
    {
        os << "put " << (i.isStatic ? "static " : "field ") << i.field.toString() << ' '
           << i.field.type.descriptor();
    }

    void operator()(const ins::New &i) const
    {
        os << "new " << i.className;
    }

    void operator()(const ins::NewArray &i) const
    {
        os << "newarray " << i.element.descriptor();
    }

    void operator()(const ins::ArrayLoad &i) const
    {
        os << "arrayload " << i.element.descriptor();
    }

    void operator()(const ins::ArrayStore &i) const
    {
        os << "arraystore " << i.element.descriptor();
    }

    void operator()(const ins::ArrayLength &) const
    {
        os << "arraylength";
    }

    void operator()(const ins::Invoke &i) const
    {
        os << "invoke " << toString(i.kind) << ' ' << i.method.toString();
    }

    void operator()(const ins::Return &i) const
    {
        os << "return " << (i.type ? i.type->descriptor() : std::string("V"));
    }

    void operator()(const ins::Cast &i) const
    {
        os << "cast " << i.from.descriptor() << ' ' << i.to.descriptor();
    }
};
} // namespace

const char *toString(BinaryOp op)
{
    return lookupName(kBinaryOps, op);
}

const char *toString(Condition c)
{
    return lookupName(kConditions, c);
}

const char *toString(InvokeKind k)
{
    return lookupName(kInvokeKinds, k);
}

std::optional<BinaryOp> parseBinaryOp(std::string_view text)
{
    return lookupKey(kBinaryOps, text);
}

std::optional<Condition> parseCondition(std::string_view text)
{
    return lookupKey(kConditions, text);
}

std::optional<InvokeKind> parseInvokeKind(std::string_view text)
{
    return lookupKey(kInvokeKinds, text);
}

std::string toString(const Instr &in)
{
    std::ostringstream os;
    std::visit(Printer{os}, in.op);
    return os.str();
}

} // namespace jade::bc
