//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the integer arithmetic, bitwise, increment and narrowing-cast
// handlers.  Arithmetic is carried out on uint32_t so overflow wraps without
// undefined behaviour; division and remainder special-case INT_MIN / -1 the
// way the JVM does.
//
//===----------------------------------------------------------------------===//

#include "vm/OpHandlers_Int.hpp"

#include "vm/Fault.hpp"

#include <limits>
#include <string>

namespace jade::vm::detail::integer
{
namespace
{
constexpr std::int32_t kIntMin = std::numeric_limits<std::int32_t>::min();

std::int32_t wrap(std::uint32_t bits)
{
    return static_cast<std::int32_t>(bits);
}

void requireIntType(const bc::Type &type, const char *what)
{
    if (type.kind != bc::Type::Kind::Int)
        throw ExecutionFault(FaultKind::UnsupportedInstruction,
                             std::string(what) + " on " + type.toString() + " is not supported");
}
} // namespace

std::optional<std::int32_t> evalBinary(bc::BinaryOp op, std::int32_t lhs, std::int32_t rhs)
{
    const auto ul = static_cast<std::uint32_t>(lhs);
    const auto ur = static_cast<std::uint32_t>(rhs);
    const std::uint32_t shift = ur & 31u;
    switch (op)
    {
        case bc::BinaryOp::Add:
            return wrap(ul + ur);
        case bc::BinaryOp::Sub:
            return wrap(ul - ur);
        case bc::BinaryOp::Mul:
            return wrap(ul * ur);
        case bc::BinaryOp::Div:
            if (rhs == 0)
                return std::nullopt;
            if (lhs == kIntMin && rhs == -1)
                return kIntMin;
            return lhs / rhs;
        case bc::BinaryOp::Rem:
            if (rhs == 0)
                return std::nullopt;
            if (lhs == kIntMin && rhs == -1)
                return 0;
            return lhs % rhs;
        case bc::BinaryOp::And:
            return lhs & rhs;
        case bc::BinaryOp::Or:
            return lhs | rhs;
        case bc::BinaryOp::Xor:
            return lhs ^ rhs;
        case bc::BinaryOp::Shl:
            return wrap(ul << shift);
        case bc::BinaryOp::Shr:
            return lhs >> shift;
        case bc::BinaryOp::Ushr:
            return wrap(ul >> shift);
    }
    return std::nullopt;
}

/// @brief Pop right then left operand and push `left op right`.
/// @details The divisor is checked before anything is pushed, so a division by
///          zero leaves the frame without a result.
HandlerResult handleBinary(ExecState &state, const bc::ins::Binary &in)
{
    requireIntType(in.type, "binary");
    Frame &fr = state.top();
    const std::int32_t rhs = popInt(fr);
    const std::int32_t lhs = popInt(fr);
    auto result = evalBinary(in.op, lhs, rhs);
    if (!result)
        return Outcome::DivideByZero;
    fr.stack.push(Value::makeInt(*result));
    advance(fr);
    return std::nullopt;
}

HandlerResult handleNegate(ExecState &state, const bc::ins::Negate &in)
{
    requireIntType(in.type, "negate");
    Frame &fr = state.top();
    const std::int32_t v = popInt(fr);
    fr.stack.push(Value::makeInt(wrap(0u - static_cast<std::uint32_t>(v))));
    advance(fr);
    return std::nullopt;
}

HandlerResult handleIncr(ExecState &state, const bc::ins::Incr &in)
{
    Frame &fr = state.top();
    const Value &current = fr.local(in.slot);
    if (!current.isIntCategory())
        throw ExecutionFault(FaultKind::TypeMismatch,
                             "incr on local " + std::to_string(in.slot) + " holding " +
                                 kindToString(current.kind));
    const auto sum = static_cast<std::uint32_t>(current.scalar) +
                     static_cast<std::uint32_t>(in.amount);
    fr.setLocal(in.slot, Value::makeInt(wrap(sum)));
    advance(fr);
    return std::nullopt;
}

/// @brief Narrowing conversions from int.
/// @details int->short and int->byte keep the low bits sign-extended, int->char
///          keeps the low 16 bits zero-extended.  int->int is the identity.
HandlerResult handleCast(ExecState &state, const bc::ins::Cast &in)
{
    if (in.from.kind != bc::Type::Kind::Int)
        throw ExecutionFault(FaultKind::UnsupportedInstruction,
                             "cast from " + in.from.toString() + " is not supported");

    Frame &fr = state.top();
    const std::int32_t v = popInt(fr);
    switch (in.to.kind)
    {
        case bc::Type::Kind::Int:
            fr.stack.push(Value::makeInt(v));
            break;
        case bc::Type::Kind::Short:
            fr.stack.push(Value::makeShort(static_cast<std::int16_t>(v)));
            break;
        case bc::Type::Kind::Char:
            fr.stack.push(Value::makeChar(static_cast<std::uint16_t>(v)));
            break;
        case bc::Type::Kind::Byte:
            fr.stack.push(Value::makeByte(static_cast<std::int8_t>(v)));
            break;
        default:
            throw ExecutionFault(FaultKind::UnsupportedInstruction,
                                 "cast from int to " + in.to.toString() + " is not supported");
    }
    advance(fr);
    return std::nullopt;
}

} // namespace jade::vm::detail::integer
