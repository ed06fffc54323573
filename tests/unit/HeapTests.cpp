// File: tests/unit/HeapTests.cpp
// Purpose: Verify heap key assignment, lookup faults and copy semantics.
// Key invariants: Keys start at 0 and increase by one per allocation; a heap
//                 copy never shares object fields with its source.
// Ownership/Lifetime: Heaps are local to each test.
// Links: docs/vm.md#heap

#include <gtest/gtest.h>

#include "vm/Fault.hpp"
#include "vm/Heap.hpp"

using jade::bc::Type;
using jade::vm::ExecutionFault;
using jade::vm::FaultKind;
using jade::vm::Heap;
using jade::vm::Value;

namespace
{
Value intArray(std::vector<int> xs)
{
    std::vector<Value> elems;
    for (int x : xs)
        elems.push_back(Value::makeInt(x));
    return Value::makeArray(Type(Type::Kind::Int), std::move(elems));
}
} // namespace

TEST(Heap, KeysAreMonotonicFromZero)
{
    Heap heap;
    EXPECT_EQ(heap.nextRef(), 0u);
    EXPECT_EQ(heap.allocate(intArray({1})), 0u);
    EXPECT_EQ(heap.allocate(intArray({2})), 1u);
    EXPECT_EQ(heap.allocate(Value::makeObject("A", {})), 2u);
    EXPECT_EQ(heap.size(), 3u);
    EXPECT_EQ(heap.nextRef(), 3u);
}

TEST(Heap, MissingKeyIsDanglingReference)
{
    Heap heap;
    try
    {
        (void)heap.at(5);
        FAIL() << "expected a fault";
    }
    catch (const ExecutionFault &fault)
    {
        EXPECT_EQ(fault.kind(), FaultKind::DanglingReference);
    }
    EXPECT_THROW(heap.replace(0, intArray({})), ExecutionFault);
}

TEST(Heap, ReplaceLeavesEarlierArrayCopiesUntouched)
{
    Heap heap;
    const auto ref = heap.allocate(intArray({1, 2}));
    Value before = heap.at(ref);
    heap.replace(ref, intArray({9, 2}));
    EXPECT_EQ(before, intArray({1, 2}));
    EXPECT_EQ(heap.at(ref), intArray({9, 2}));
}

TEST(Heap, ObjectAccessorRejectsArrays)
{
    Heap heap;
    const auto ref = heap.allocate(intArray({1}));
    try
    {
        (void)heap.object(ref);
        FAIL() << "expected a fault";
    }
    catch (const ExecutionFault &fault)
    {
        EXPECT_EQ(fault.kind(), FaultKind::TypeMismatch);
    }
}

TEST(Heap, CopiesDoNotShareObjectFields)
{
    Heap original;
    const auto ref = original.allocate(Value::makeObject("A", {{"x", Value::makeInt(1)}}));

    Heap copy = original;
    copy.object(ref).fields["x"] = Value::makeInt(42);

    EXPECT_EQ(original.object(ref).fields.at("x"), Value::makeInt(1));
    EXPECT_EQ(copy.object(ref).fields.at("x"), Value::makeInt(42));
    EXPECT_EQ(copy.nextRef(), original.nextRef());
}
