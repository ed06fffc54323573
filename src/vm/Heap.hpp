//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Heap.hpp
// Purpose: Run-local heap mapping references to array and object values.
// Key invariants: Keys come from a counter starting at 0 and are never reused;
//                 entries are never removed.  Copying a heap deep-copies object
//                 payloads so two states never share mutable fields.
// Ownership/Lifetime: Owned by one ExecState.
// Links: docs/vm.md#heap
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Value.hpp"

#include <cstddef>
#include <map>

namespace jade::vm
{

class Heap
{
  public:
    Heap() = default;
    Heap(const Heap &other);
    Heap &operator=(const Heap &other);
    Heap(Heap &&) noexcept = default;
    Heap &operator=(Heap &&) noexcept = default;

    /// @brief Store @p v under the next key and return that key.
    HeapRef allocate(Value v);

    /// @brief Entry for @p ref; throws ExecutionFault(DanglingReference) when absent.
    const Value &at(HeapRef ref) const;

    /// @brief Replace the entry for @p ref (array copy-on-write update).
    void replace(HeapRef ref, Value v);

    /// @brief Mutable object payload behind @p ref.
    /// @throws ExecutionFault TypeMismatch when the entry is not an object.
    ObjectData &object(HeapRef ref);

    bool contains(HeapRef ref) const
    {
        return entries_.count(ref) != 0;
    }

    size_t size() const
    {
        return entries_.size();
    }

    /// @brief Key the next allocation will receive.
    HeapRef nextRef() const
    {
        return next_;
    }

    const std::map<HeapRef, Value> &entries() const
    {
        return entries_;
    }

  private:
    std::map<HeapRef, Value> entries_;
    HeapRef next_ = 0;
};

} // namespace jade::vm
