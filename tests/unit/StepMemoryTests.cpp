// File: tests/unit/StepMemoryTests.cpp
// Purpose: Verify stack manipulation, locals, arrays, objects and static
//          fields.
// Key invariants: Null checks precede bounds checks; array writes replace the
//                 heap entry; object writes are visible through every alias.
// Ownership/Lifetime: Each test builds its own suite.
// Links: docs/vm.md#memory

#include <gtest/gtest.h>

#include "common/SuiteBuilder.hpp"
#include "vm/Fault.hpp"

using jade::bc::Input;
using jade::bc::Type;
using jade::tests::field;
using jade::tests::SuiteBuilder;
using jade::vm::ExecutionFault;
using jade::vm::FaultKind;
using jade::vm::Value;

namespace
{
const Type kInt(Type::Kind::Int);
} // namespace

TEST(StepMemory, DupAndPop)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.f:()I",
                       {"push I 3", "dup", "binary I mul", "push I 9", "pop", "return I"});
    EXPECT_EQ(b.run(id).returned, Value::makeInt(9));
}

TEST(StepMemory, StoreThenLoad)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.f:()I", {"push I 17", "store I 4", "load I 4", "return I"});
    EXPECT_EQ(b.run(id).returned, Value::makeInt(17));
}

TEST(StepMemory, CharConstantsKeepTheirKind)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.c:()C", {"push C 'x'", "return C"});
    EXPECT_EQ(b.run(id).returned, Value::makeChar('x'));
}

TEST(StepMemory, UnsetLocalFaultsWithProgramCounter)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.f:()I", {"push I 1", "pop", "load I 3", "return I"});
    try
    {
        (void)b.run(id);
        FAIL() << "expected a fault";
    }
    catch (const ExecutionFault &fault)
    {
        EXPECT_EQ(fault.kind(), FaultKind::UnsetLocal);
        EXPECT_EQ(fault.pc(), "t/Mem.f:()I:2");
    }
}

TEST(StepMemory, LoadWithWrongTypeFaults)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.f:()V", {"push A null", "store A 0", "load I 0", "return V"});
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

TEST(StepMemory, PopOnEmptyStackIsUnderflow)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.f:()V", {"pop", "return V"});
    try
    {
        (void)b.run(id);
        FAIL() << "expected a fault";
    }
    catch (const ExecutionFault &fault)
    {
        EXPECT_EQ(fault.kind(), FaultKind::StackUnderflow);
    }
}

TEST(StepMemory, ArrayLoadChecksBounds)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.at:([II)I", {"load A 0", "load I 1", "arrayload I", "return I"});
    const Input arr = Input::ofArray(kInt, {10, 20, 30});

    EXPECT_EQ(b.run(id, {arr, Input::ofInt(2)}).returned, Value::makeInt(30));
    EXPECT_EQ(b.outcome(id, {arr, Input::ofInt(3)}), "out of bounds");
    EXPECT_EQ(b.outcome(id, {arr, Input::ofInt(-1)}), "out of bounds");
}

TEST(StepMemory, NullArrayCheckedBeforeBounds)
{
    SuiteBuilder b;
    auto load = b.method("t/Mem.load:()I",
                         {"push A null", "push I 99", "arrayload I", "return I"});
    auto store = b.method("t/Mem.store:()V",
                          {"push A null", "push I -1", "push I 0", "arraystore I", "return V"});
    auto length = b.method("t/Mem.len:()I", {"push A null", "arraylength", "return I"});
    EXPECT_EQ(b.outcome(load), "null pointer");
    EXPECT_EQ(b.outcome(store), "null pointer");
    EXPECT_EQ(b.outcome(length), "null pointer");
}

TEST(StepMemory, NewArrayIsDefaultFilled)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.f:()I",
                       {"push I 4", "newarray I", "dup", "arraylength", "store I 1", "push I 3",
                        "arrayload I", "load I 1", "binary I add", "return I"});
    EXPECT_EQ(b.run(id).returned, Value::makeInt(4));
}

TEST(StepMemory, NegativeArraySizeFaults)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.f:()V", {"push I -1", "newarray I", "pop", "return V"});
    try
    {
        (void)b.run(id);
        FAIL() << "expected a fault";
    }
    catch (const ExecutionFault &fault)
    {
        EXPECT_EQ(fault.kind(), FaultKind::NegativeArraySize);
    }
}

TEST(StepMemory, OversizedArrayIsAResourceFault)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.huge:(I)I",
                       {"load I 0", "newarray I", "arraylength", "return I"});
    try
    {
        (void)b.run(id, {Input::ofInt(2000000000)});
        FAIL() << "expected a fault";
    }
    catch (const ExecutionFault &fault)
    {
        EXPECT_EQ(fault.kind(), FaultKind::ResourceExhausted);
        EXPECT_EQ(fault.pc(), "t/Mem.huge:(I)I:1");
    }
}

TEST(StepMemory, ArrayStoreIsVisibleThroughEveryReference)
{
    SuiteBuilder b;
    // a = new int[2]; b = a; b[1] = 7; return a[1];
    auto id = b.method("t/Mem.f:()I",
                       {"push I 2", "newarray I", "store A 0", "load A 0", "store A 1",
                        "load A 1", "push I 1", "push I 7", "arraystore I", "load A 0", "push I 1",
                        "arrayload I", "return I"});
    EXPECT_EQ(b.run(id).returned, Value::makeInt(7));
}

TEST(StepMemory, ArrayStoreOutOfBounds)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.f:([I)V",
                       {"load A 0", "push I 2", "push I 5", "arraystore I", "return V"});
    EXPECT_EQ(b.outcome(id, {Input::ofArray(kInt, {1, 2})}), "out of bounds");
}

TEST(StepMemory, CharArrayStoreNarrows)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.f:([C)C",
                       {"load A 0", "push I 0", "push I 65601", "arraystore C", "load A 0",
                        "push I 0", "arrayload C", "return C"});
    auto r = b.run(id, {Input::ofArray(Type(Type::Kind::Char), {'a'})});
    EXPECT_EQ(r.returned, Value::makeChar('A'));
}

TEST(StepMemory, NewObjectHasDefaultFields)
{
    SuiteBuilder b;
    b.addClass("t/Pt", {field("x", "I"), field("flag", "Z"), field("next", "Lt/Pt;")});
    auto id = b.method("t/Mem.f:()Z",
                       {"new t/Pt", "get field t/Pt.flag Z", "return Z"});
    EXPECT_EQ(b.run(id).returned, Value::makeBoolean(false));

    auto next = b.method("t/Mem.g:()I",
                         {"new t/Pt", "get field t/Pt.next Lt/Pt;", "ifz is 5", "push I 0",
                          "return I", "push I 1", "return I"});
    EXPECT_EQ(b.run(next).returned, Value::makeInt(1));
}

TEST(StepMemory, ObjectFieldsAreSharedBetweenAliases)
{
    SuiteBuilder b;
    b.addClass("t/Pt", {field("x", "I")});
    // p = new Pt; q = p; q.x = 5; return p.x;
    auto id = b.method("t/Mem.f:()I",
                       {"new t/Pt", "store A 0", "load A 0", "store A 1", "load A 1", "push I 5",
                        "put field t/Pt.x I", "load A 0", "get field t/Pt.x I", "return I"});
    EXPECT_EQ(b.run(id).returned, Value::makeInt(5));
}

TEST(StepMemory, InstanceFieldOnNullIsNullPointer)
{
    SuiteBuilder b;
    b.addClass("t/Pt", {field("x", "I")});
    auto get = b.method("t/Mem.get:()I", {"push A null", "get field t/Pt.x I", "return I"});
    auto put = b.method("t/Mem.put:()V",
                        {"push A null", "push I 1", "put field t/Pt.x I", "return V"});
    EXPECT_EQ(b.outcome(get), "null pointer");
    EXPECT_EQ(b.outcome(put), "null pointer");
}

TEST(StepMemory, NewAssertionErrorHalts)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.f:()V",
                       {"new java/lang/AssertionError", "dup",
                        "invoke special java/lang/AssertionError.<init>:()V", "return V"});
    auto r = b.run(id);
    EXPECT_EQ(r.token(), "assertion error");
    EXPECT_EQ(r.steps, 1u);
}

TEST(StepMemory, StaticFieldsUseInitializerThenOverlay)
{
    SuiteBuilder b;
    auto flag = field("$assertionsDisabled", "Z", true);
    flag.value = jade::bc::Constant{Type(Type::Kind::Boolean), 0};
    b.addClass("t/Mem", {flag, field("count", "I", true)});

    auto read = b.method("t/Mem.read:()Z", {"get static t/Mem.$assertionsDisabled Z", "return Z"});
    EXPECT_EQ(b.run(read).returned, Value::makeBoolean(false));

    auto bump = b.method("t/Mem.bump:()I",
                         {"get static t/Mem.count I", "push I 1", "binary I add",
                          "put static t/Mem.count I", "get static t/Mem.count I", "return I"});
    EXPECT_EQ(b.run(bump).returned, Value::makeInt(1));
    // Statics are per run.
    EXPECT_EQ(b.run(bump).returned, Value::makeInt(1));
}

TEST(StepMemory, UnknownStaticFieldFaults)
{
    SuiteBuilder b;
    b.addClass("t/Mem");
    auto id = b.method("t/Mem.f:()I", {"get static t/Mem.missing I", "return I"});
    try
    {
        (void)b.run(id);
        FAIL() << "expected a fault";
    }
    catch (const ExecutionFault &fault)
    {
        EXPECT_EQ(fault.kind(), FaultKind::UnknownField);
    }
}

TEST(StepMemory, NewOfUnknownClassFaults)
{
    SuiteBuilder b;
    auto id = b.method("t/Mem.f:()V", {"new t/Ghost", "pop", "return V"});
    try
    {
        (void)b.run(id);
        FAIL() << "expected a fault";
    }
    catch (const ExecutionFault &fault)
    {
        EXPECT_EQ(fault.kind(), FaultKind::UnknownClass);
    }
}
