// File: tests/unit/FrameTests.cpp
// Purpose: Verify program counter arithmetic, operand stack discipline and
//          checked local access.
// Key invariants: pop/peek on an empty stack and reads of unset locals fault.
// Ownership/Lifetime: Frames are local to each test.
// Links: docs/vm.md#frames

#include <gtest/gtest.h>

#include "common/SuiteBuilder.hpp"
#include "vm/Fault.hpp"
#include "vm/Frame.hpp"

#include <memory>

using jade::vm::ExecutionFault;
using jade::vm::FaultKind;
using jade::vm::Frame;
using jade::vm::OperandStack;
using jade::vm::ProgramCounter;
using jade::vm::Value;

TEST(ProgramCounter, AdvanceAndJumpKeepTheMethod)
{
    auto method = std::make_shared<const jade::bc::MethodId>(jade::tests::methodId("A.f:()V"));
    ProgramCounter pc{method, 3};
    EXPECT_EQ(pc.advanced().offset, 4u);
    EXPECT_EQ(pc.advanced(2).offset, 5u);
    EXPECT_EQ(pc.jumpedTo(0).offset, 0u);
    EXPECT_EQ(pc.jumpedTo(0).method, method);
    EXPECT_EQ(pc.toString(), "A.f:()V:3");
}

TEST(OperandStack, PushPopIsLifo)
{
    OperandStack stack;
    stack.push(Value::makeInt(1));
    stack.push(Value::makeInt(2));
    EXPECT_EQ(stack.peek(), Value::makeInt(2));
    EXPECT_EQ(stack.pop(), Value::makeInt(2));
    EXPECT_EQ(stack.pop(), Value::makeInt(1));
    EXPECT_TRUE(stack.empty());
}

TEST(OperandStack, EmptyPopIsStackUnderflow)
{
    OperandStack stack;
    try
    {
        (void)stack.pop();
        FAIL() << "expected a fault";
    }
    catch (const ExecutionFault &fault)
    {
        EXPECT_EQ(fault.kind(), FaultKind::StackUnderflow);
    }
    EXPECT_THROW((void)stack.peek(), ExecutionFault);
}

TEST(Frame, UnsetLocalFaults)
{
    Frame fr = jade::vm::makeFrame(
        std::make_shared<const jade::bc::MethodId>(jade::tests::methodId("A.f:()V")));
    fr.setLocal(1, Value::makeInt(5));
    EXPECT_EQ(fr.local(1), Value::makeInt(5));
    try
    {
        (void)fr.local(0);
        FAIL() << "expected a fault";
    }
    catch (const ExecutionFault &fault)
    {
        EXPECT_EQ(fault.kind(), FaultKind::UnsetLocal);
    }
}
