// File: tests/unit/ValueTests.cpp
// Purpose: Verify runtime value factories, defaults, equality and rendering.
// Key invariants: Narrow scalars are stored sign- or zero-extended; equality
//                 is structural over kind and payload.
// Ownership/Lifetime: Values are local to each test.
// Links: docs/vm.md#values

#include <gtest/gtest.h>

#include "bc/Type.hpp"
#include "vm/Value.hpp"

using jade::bc::Type;
using jade::vm::Value;

TEST(Value, NarrowFactoriesExtendCorrectly)
{
    EXPECT_EQ(Value::makeShort(-2).scalar, -2);
    EXPECT_EQ(Value::makeByte(-128).scalar, -128);
    EXPECT_EQ(Value::makeChar(0xFFFF).scalar, 0xFFFF);
    EXPECT_EQ(Value::makeBoolean(true).scalar, 1);
    EXPECT_EQ(Value::makeBoolean(false).scalar, 0);
}

TEST(Value, EqualityComparesKindAndPayload)
{
    EXPECT_EQ(Value::makeInt(3), Value::makeInt(3));
    EXPECT_NE(Value::makeInt(1), Value::makeBoolean(true));
    EXPECT_NE(Value::makeInt(1), Value::makeInt(2));
    EXPECT_EQ(Value::makeNull(), Value::makeNull());
    EXPECT_NE(Value::makeNull(), Value::makeRef(0));
    EXPECT_EQ(Value::makeRef(4), Value::makeRef(4));
}

TEST(Value, ArraysCompareElementwise)
{
    const Type intTy(Type::Kind::Int);
    Value a = Value::makeArray(intTy, {Value::makeInt(1), Value::makeInt(2)});
    Value b = Value::makeArray(intTy, {Value::makeInt(1), Value::makeInt(2)});
    Value c = Value::makeArray(intTy, {Value::makeInt(1)});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, Value::makeArray(Type(Type::Kind::Char), {Value::makeInt(1), Value::makeInt(2)}));
}

TEST(Value, DefaultsFollowDeclaredType)
{
    EXPECT_EQ(jade::vm::defaultValue(Type(Type::Kind::Int)), Value::makeInt(0));
    EXPECT_EQ(jade::vm::defaultValue(Type(Type::Kind::Boolean)), Value::makeBoolean(false));
    EXPECT_EQ(jade::vm::defaultValue(Type(Type::Kind::Char)), Value::makeChar(0));
    EXPECT_TRUE(jade::vm::defaultValue(Type::object("java/lang/String")).isNull());
    EXPECT_TRUE(jade::vm::defaultValue(Type::array(Type(Type::Kind::Int))).isNull());
}

TEST(Value, IntCategoryTypesAcceptAnyIntCategoryValue)
{
    const Type intTy(Type::Kind::Int);
    EXPECT_TRUE(jade::vm::matchesType(Value::makeBoolean(true), intTy));
    EXPECT_TRUE(jade::vm::matchesType(Value::makeChar('a'), intTy));
    EXPECT_FALSE(jade::vm::matchesType(Value::makeNull(), intTy));
    EXPECT_TRUE(jade::vm::matchesType(Value::makeRef(1), Type(Type::Kind::Object)));
    EXPECT_FALSE(jade::vm::matchesType(Value::makeInt(0), Type(Type::Kind::Object)));
}

TEST(Value, RendersForTraces)
{
    EXPECT_EQ(Value::makeInt(-7).toString(), "-7");
    EXPECT_EQ(Value::makeBoolean(true).toString(), "true");
    EXPECT_EQ(Value::makeChar('a').toString(), "'a'");
    EXPECT_EQ(Value::makeNull().toString(), "null");
    EXPECT_EQ(Value::makeRef(3).toString(), "@3");
    EXPECT_EQ(Value::makeArray(Type(Type::Kind::Int), {Value::makeInt(1), Value::makeInt(2)})
                  .toString(),
              "I[1, 2]");
}
