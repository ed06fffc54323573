//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Heap.cpp
// Purpose: Heap allocation, lookup and the deep copy that keeps object fields
//          private to one execution state.
// Links: docs/vm.md#heap
//
//===----------------------------------------------------------------------===//

#include "vm/Heap.hpp"

#include "vm/Fault.hpp"

namespace jade::vm
{
namespace
{
Value cloneEntry(const Value &v)
{
    if (v.kind == Value::Kind::Object && v.object)
        return Value::makeObject(v.object->className, v.object->fields);
    return v;
}
} // namespace

Heap::Heap(const Heap &other) : next_(other.next_)
{
    for (const auto &[ref, v] : other.entries_)
        entries_.emplace(ref, cloneEntry(v));
}

Heap &Heap::operator=(const Heap &other)
{
    if (this != &other)
    {
        Heap copy(other);
        *this = std::move(copy);
    }
    return *this;
}

HeapRef Heap::allocate(Value v)
{
    const HeapRef ref = next_++;
    entries_.emplace(ref, std::move(v));
    return ref;
}

const Value &Heap::at(HeapRef ref) const
{
    auto it = entries_.find(ref);
    if (it == entries_.end())
        throw ExecutionFault(FaultKind::DanglingReference,
                             "heap has no entry @" + std::to_string(ref));
    return it->second;
}

void Heap::replace(HeapRef ref, Value v)
{
    auto it = entries_.find(ref);
    if (it == entries_.end())
        throw ExecutionFault(FaultKind::DanglingReference,
                             "heap has no entry @" + std::to_string(ref));
    it->second = std::move(v);
}

ObjectData &Heap::object(HeapRef ref)
{
    auto it = entries_.find(ref);
    if (it == entries_.end())
        throw ExecutionFault(FaultKind::DanglingReference,
                             "heap has no entry @" + std::to_string(ref));
    if (it->second.kind != Value::Kind::Object || !it->second.object)
        throw ExecutionFault(FaultKind::TypeMismatch,
                             "heap entry @" + std::to_string(ref) + " is not an object");
    return *it->second.object;
}

} // namespace jade::vm
