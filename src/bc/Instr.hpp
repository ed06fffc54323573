//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bc/Instr.hpp
// Purpose: Closed instruction representation: one struct per instruction
//          family held in a std::variant.
// Key invariants: Branch targets are instruction offsets within the owning
//                 method; every alternative has a handler in vm::step.
// Ownership/Lifetime: Value types owned by the method's instruction list.
// Links: docs/jbc-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bc/MethodId.hpp"
#include "bc/Type.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace jade::bc
{

/// @brief Arithmetic and bitwise operators of the `binary` family.
enum class BinaryOp
{
    Add,
    Sub,
    Mul,
    Div,
    Rem,
    And,
    Or,
    Xor,
    Shl,
    Shr,
    Ushr
};

/// @brief Predicates shared by `if` and `ifz`.
/// @details Is/IsNot test reference identity (`ifz` compares against null).
enum class Condition
{
    Eq,
    Ne,
    Lt,
    Ge,
    Gt,
    Le,
    Is,
    IsNot
};

enum class InvokeKind
{
    Static,
    Special,
    Virtual
};

/// @brief Literal operand of `push` and of field initializers.
/// @details Reference constants are always null.
struct Constant
{
    Type type;
    std::int32_t value = 0;
};

namespace ins
{
struct Push
{
    Constant constant;
};

struct Load
{
    Type type;
    std::uint32_t slot = 0;
};

struct Store
{
    Type type;
    std::uint32_t slot = 0;
};

struct Binary
{
    Type type;
    BinaryOp op = BinaryOp::Add;
};

struct Negate
{
    Type type;
};

struct Incr
{
    std::uint32_t slot = 0;
    std::int32_t amount = 0;
};

struct Dup
{
};

struct Pop
{
};

/// @brief Two-operand compare-and-branch.
struct If
{
    Condition condition = Condition::Eq;
    std::uint32_t target = 0;
};

/// @brief Compare against zero (or null for Is/IsNot) and branch.
struct Ifz
{
    Condition condition = Condition::Eq;
    std::uint32_t target = 0;
};

struct Goto
{
    std::uint32_t target = 0;
};

struct Get
{
    bool isStatic = false;
    FieldId field;
};

struct Put
{
    bool isStatic = false;
    FieldId field;
};

struct New
{
    std::string className;
};

struct NewArray
{
    Type element;
};

struct ArrayLoad
{
    Type element;
};

struct ArrayStore
{
    Type element;
};

struct ArrayLength
{
};

struct Invoke
{
    InvokeKind kind = InvokeKind::Static;
    MethodId method;
};

/// @brief Return from the current frame; no type means `return V`.
struct Return
{
    std::optional<Type> type;
};

struct Cast
{
    Type from;
    Type to;
};
} // namespace ins

using Op = std::variant<ins::Push,
                        ins::Load,
                        ins::Store,
                        ins::Binary,
                        ins::Negate,
                        ins::Incr,
                        ins::Dup,
                        ins::Pop,
                        ins::If,
                        ins::Ifz,
                        ins::Goto,
                        ins::Get,
                        ins::Put,
                        ins::New,
                        ins::NewArray,
                        ins::ArrayLoad,
                        ins::ArrayStore,
                        ins::ArrayLength,
                        ins::Invoke,
                        ins::Return,
                        ins::Cast>;

/// @brief One decoded instruction with its listing location.
struct Instr
{
    Op op;
    support::SourceLoc loc;
};

const char *toString(BinaryOp op);
const char *toString(Condition c);
const char *toString(InvokeKind k);

std::optional<BinaryOp> parseBinaryOp(std::string_view text);
std::optional<Condition> parseCondition(std::string_view text);
std::optional<InvokeKind> parseInvokeKind(std::string_view text);

/// @brief Render @p in back in listing syntax, e.g. "binary I div".
std::string toString(const Instr &in);

} // namespace jade::bc
