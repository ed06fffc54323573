// File: tests/unit/StepArithmeticTests.cpp
// Purpose: Verify 32-bit integer arithmetic, shifts, casts and the
//          divide-by-zero outcome of the interpreter.
// Key invariants: Results wrap modulo 2^32; division truncates toward zero;
//                 shift distances use the low five bits.
// Ownership/Lifetime: Each test builds its own suite.
// Links: docs/vm.md#arithmetic

#include <gtest/gtest.h>

#include "common/SuiteBuilder.hpp"
#include "vm/Fault.hpp"

#include <climits>
#include <string>

using jade::bc::Input;
using jade::tests::SuiteBuilder;
using jade::vm::ExecutionFault;
using jade::vm::FaultKind;
using jade::vm::Value;

namespace
{
/// @brief Evaluate `lhs op rhs` through a two-argument method.
jade::vm::RunResult evalBinary(const std::string &op, int lhs, int rhs)
{
    SuiteBuilder b;
    auto id = b.method("t/Arith.f:(II)I",
                       {"load I 0", "load I 1", "binary I " + op, "return I"});
    return b.run(id, {Input::ofInt(lhs), Input::ofInt(rhs)});
}

int evalOk(const std::string &op, int lhs, int rhs)
{
    auto r = evalBinary(op, lhs, rhs);
    EXPECT_EQ(r.token(), "ok") << op << ' ' << lhs << ' ' << rhs;
    if (!r.returned)
        return 0;
    return r.returned->scalar;
}
} // namespace

TEST(StepArithmetic, BasicOperators)
{
    EXPECT_EQ(evalOk("add", 2, 3), 5);
    EXPECT_EQ(evalOk("sub", 2, 3), -1);
    EXPECT_EQ(evalOk("mul", -4, 3), -12);
    EXPECT_EQ(evalOk("and", 0b1100, 0b1010), 0b1000);
    EXPECT_EQ(evalOk("or", 0b1100, 0b1010), 0b1110);
    EXPECT_EQ(evalOk("xor", 0b1100, 0b1010), 0b0110);
}

TEST(StepArithmetic, AdditionWraps)
{
    EXPECT_EQ(evalOk("add", INT_MAX, 1), INT_MIN);
    EXPECT_EQ(evalOk("sub", INT_MIN, 1), INT_MAX);
    EXPECT_EQ(evalOk("mul", 65536, 65536), 0);
}

TEST(StepArithmetic, DivisionTruncatesTowardZero)
{
    EXPECT_EQ(evalOk("div", 7, 2), 3);
    EXPECT_EQ(evalOk("div", -7, 2), -3);
    EXPECT_EQ(evalOk("rem", -7, 2), -1);
    EXPECT_EQ(evalOk("rem", 7, -2), 1);
}

TEST(StepArithmetic, MinIntDividedByMinusOne)
{
    EXPECT_EQ(evalOk("div", INT_MIN, -1), INT_MIN);
    EXPECT_EQ(evalOk("rem", INT_MIN, -1), 0);
}

TEST(StepArithmetic, ZeroDivisorHaltsWithDivideByZero)
{
    auto div = evalBinary("div", 10, 0);
    EXPECT_EQ(div.token(), "divide by zero");
    EXPECT_FALSE(div.returned.has_value());
    EXPECT_EQ(evalBinary("rem", 10, 0).token(), "divide by zero");
    EXPECT_EQ(evalBinary("div", 0, 0).token(), "divide by zero");
}

TEST(StepArithmetic, ShiftsMaskTheDistance)
{
    EXPECT_EQ(evalOk("shl", 1, 33), 2);
    EXPECT_EQ(evalOk("shr", -8, 1), -4);
    EXPECT_EQ(evalOk("ushr", -1, 28), 0xF);
    EXPECT_EQ(evalOk("shl", 1, 31), INT_MIN);
}

TEST(StepArithmetic, NegateWraps)
{
    SuiteBuilder b;
    auto id = b.method("t/Arith.neg:(I)I", {"load I 0", "negate I", "return I"});
    EXPECT_EQ(b.run(id, {Input::ofInt(5)}).returned, Value::makeInt(-5));
    EXPECT_EQ(b.run(id, {Input::ofInt(INT_MIN)}).returned, Value::makeInt(INT_MIN));
}

TEST(StepArithmetic, IncrementAddsToLocal)
{
    SuiteBuilder b;
    auto id = b.method("t/Arith.inc:(I)I", {"incr 0 -3", "load I 0", "return I"});
    EXPECT_EQ(b.run(id, {Input::ofInt(10)}).returned, Value::makeInt(7));
    EXPECT_EQ(b.run(id, {Input::ofInt(INT_MIN)}).returned, Value::makeInt(INT_MAX - 2));
}

TEST(StepArithmetic, NarrowingCasts)
{
    SuiteBuilder b;
    auto toByte = b.method("t/Arith.b:(I)B", {"load I 0", "cast I B", "return B"});
    auto toShort = b.method("t/Arith.s:(I)S", {"load I 0", "cast I S", "return S"});
    auto toChar = b.method("t/Arith.c:(I)C", {"load I 0", "cast I C", "return C"});

    EXPECT_EQ(b.run(toByte, {Input::ofInt(200)}).returned, Value::makeByte(-56));
    EXPECT_EQ(b.run(toShort, {Input::ofInt(40000)}).returned, Value::makeShort(-25536));
    EXPECT_EQ(b.run(toChar, {Input::ofInt(-1)}).returned, Value::makeChar(0xFFFF));
}

TEST(StepArithmetic, LongArithmeticIsUnsupported)
{
    SuiteBuilder b;
    auto id = b.method("t/Arith.l:()I", {"push I 1", "push I 2", "binary J add", "return I"});
    try
    {
        (void)b.run(id);
        FAIL() << "expected a fault";
    }
    catch (const ExecutionFault &fault)
    {
        EXPECT_EQ(fault.kind(), FaultKind::UnsupportedInstruction);
        EXPECT_EQ(fault.pc(), "t/Arith.l:()I:2");
    }
}

TEST(StepArithmetic, ReferenceOperandIsTypeMismatch)
{
    SuiteBuilder b;
    auto id = b.method("t/Arith.r:()I", {"push I 1", "push A null", "binary I add", "return I"});
    try
    {
        (void)b.run(id);
        FAIL() << "expected a fault";
    }
    catch (const ExecutionFault &fault)
    {
        EXPECT_EQ(fault.kind(), FaultKind::TypeMismatch);
    }
}
