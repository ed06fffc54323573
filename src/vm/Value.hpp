//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Value.hpp
// Purpose: Tagged runtime value stored in locals, operand stacks and the heap.
// Key invariants: Scalars are 32-bit two's complement; Short/Byte are
//                 sign-extended, Char is zero-extended, Boolean is 0 or 1.
//                 Array payloads are immutable once built (copy-on-write);
//                 object payloads are mutated in place through the heap.
// Ownership/Lifetime: Values own their payload through shared pointers.
// Links: docs/vm.md#values
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bc/Type.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jade::vm
{

/// @brief Heap key; assigned from a counter starting at 0.
using HeapRef = std::uint64_t;

struct ArrayData;
struct ObjectData;

/// @brief Discriminated runtime datum.
struct Value
{
    enum class Kind
    {
        Int,
        Boolean,
        Char,
        Short,
        Byte,
        Reference,
        Array,
        Object
    };

    Kind kind = Kind::Int;

    /// @brief Payload of the scalar kinds.
    std::int32_t scalar = 0;

    /// @brief Payload of Reference; std::nullopt is null.
    std::optional<HeapRef> ref;

    /// @brief Payload of Array; never mutated after construction.
    std::shared_ptr<const ArrayData> array;

    /// @brief Payload of Object.
    std::shared_ptr<ObjectData> object;

    static Value makeInt(std::int32_t v);
    static Value makeBoolean(bool v);
    static Value makeChar(std::uint16_t v);
    static Value makeShort(std::int16_t v);
    static Value makeByte(std::int8_t v);
    static Value makeNull();
    static Value makeRef(HeapRef r);
    static Value makeArray(bc::Type element, std::vector<Value> elements);
    static Value makeObject(std::string className, std::map<std::string, Value> fields);

    /// @brief True for the kinds held as 32-bit integers.
    [[nodiscard]] bool isIntCategory() const;

    [[nodiscard]] bool isNull() const
    {
        return kind == Kind::Reference && !ref;
    }

    /// @brief Render for traces, e.g. "5", "true", "'a'", "@3", "null".
    std::string toString() const;

    friend bool operator==(const Value &a, const Value &b);
    friend bool operator!=(const Value &a, const Value &b)
    {
        return !(a == b);
    }
};

struct ArrayData
{
    bc::Type element;
    std::vector<Value> elements;
};

struct ObjectData
{
    std::string className;
    std::map<std::string, Value> fields;
};

const char *kindToString(Value::Kind k);

/// @brief Default value for a slot of declared type @p type (0, false, '\0', null).
Value defaultValue(const bc::Type &type);

/// @brief Whether @p v may be read through an instruction typed @p type.
/// @details Int-category types accept any int-category value; reference types
///          accept references.
bool matchesType(const Value &v, const bc::Type &type);

} // namespace jade::vm
