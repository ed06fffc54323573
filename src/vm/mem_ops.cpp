//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the operand-stack, local-slot, field, object and array handlers,
// together with the operand helpers shared by every handler family.
//
// Arrays are copy-on-write: a store builds a new element vector and replaces
// the heap entry, so earlier copies of the payload never change.  Object
// fields are updated in place on the heap entry so every reference to the same
// key observes the write.
//
//===----------------------------------------------------------------------===//

#include "vm/OpHandlers_Memory.hpp"

#include "vm/Fault.hpp"

#include <new>
#include <stdexcept>
#include <string>
#include <vector>

namespace jade::vm::detail
{

std::int32_t popInt(Frame &fr)
{
    Value v = fr.stack.pop();
    if (!v.isIntCategory())
        throw ExecutionFault(FaultKind::TypeMismatch,
                             std::string("expected int operand, found ") + kindToString(v.kind));
    return v.scalar;
}

Value popRef(Frame &fr)
{
    Value v = fr.stack.pop();
    if (v.kind != Value::Kind::Reference)
        throw ExecutionFault(FaultKind::TypeMismatch,
                             std::string("expected reference operand, found ") +
                                 kindToString(v.kind));
    return v;
}

Value fromConstant(const bc::Constant &c)
{
    if (c.type.isReference())
        return Value::makeNull();
    return coerceScalar(Value::makeInt(c.value), c.type);
}

Value coerceScalar(const Value &v, const bc::Type &type)
{
    switch (type.kind)
    {
        case bc::Type::Kind::Int:
            return Value::makeInt(v.scalar);
        case bc::Type::Kind::Boolean:
            return Value::makeBoolean((v.scalar & 1) != 0);
        case bc::Type::Kind::Char:
            return Value::makeChar(static_cast<std::uint16_t>(v.scalar));
        case bc::Type::Kind::Short:
            return Value::makeShort(static_cast<std::int16_t>(v.scalar));
        case bc::Type::Kind::Byte:
            return Value::makeByte(static_cast<std::int8_t>(v.scalar));
        default:
            return v;
    }
}

} // namespace jade::vm::detail

namespace jade::vm::detail::memory
{
namespace
{
void requireMatch(const Value &v, const bc::Type &type, const std::string &where)
{
    if (!matchesType(v, type))
        throw ExecutionFault(FaultKind::TypeMismatch,
                             where + " expects " + type.toString() + ", found " +
                                 kindToString(v.kind));
}

/// @brief Array payload behind @p ref.
const ArrayData &arrayAt(const Heap &heap, HeapRef ref)
{
    const Value &entry = heap.at(ref);
    if (entry.kind != Value::Kind::Array || !entry.array)
        throw ExecutionFault(FaultKind::TypeMismatch,
                             "heap entry @" + std::to_string(ref) + " is not an array");
    return *entry.array;
}

bool inBounds(const ArrayData &arr, std::int32_t index)
{
    return index >= 0 && static_cast<size_t>(index) < arr.elements.size();
}
} // namespace

HandlerResult handlePush(ExecState &state, const bc::ins::Push &in)
{
    Frame &fr = state.top();
    fr.stack.push(fromConstant(in.constant));
    advance(fr);
    return std::nullopt;
}

HandlerResult handleLoad(ExecState &state, const bc::ins::Load &in)
{
    Frame &fr = state.top();
    const Value &v = fr.local(in.slot);
    requireMatch(v, in.type, "load " + std::to_string(in.slot));
    fr.stack.push(v);
    advance(fr);
    return std::nullopt;
}

HandlerResult handleStore(ExecState &state, const bc::ins::Store &in)
{
    Frame &fr = state.top();
    Value v = fr.stack.pop();
    requireMatch(v, in.type, "store " + std::to_string(in.slot));
    fr.setLocal(in.slot, std::move(v));
    advance(fr);
    return std::nullopt;
}

HandlerResult handleDup(ExecState &state, const bc::ins::Dup &)
{
    Frame &fr = state.top();
    Value top = fr.stack.peek();
    fr.stack.push(std::move(top));
    advance(fr);
    return std::nullopt;
}

HandlerResult handlePop(ExecState &state, const bc::ins::Pop &)
{
    Frame &fr = state.top();
    fr.stack.pop();
    advance(fr);
    return std::nullopt;
}

/// @brief Read a static (overlay first, then the declared initializer) or an
///        instance field.
HandlerResult handleGet(ExecState &state, InstructionStore &store, const bc::ins::Get &in)
{
    Frame &fr = state.top();
    if (in.isStatic)
    {
        const std::string key = in.field.toString();
        if (auto it = state.statics.find(key); it != state.statics.end())
        {
            fr.stack.push(it->second);
            advance(fr);
            return std::nullopt;
        }
        const bc::ClassInfo &cls = store.classInfo(in.field.className);
        const bc::FieldInfo *field = cls.findField(in.field.name);
        if (!field || !field->isStatic)
            throw ExecutionFault(FaultKind::UnknownField, "no static field " + key);
        fr.stack.push(field->value ? fromConstant(*field->value) : defaultValue(field->type));
        advance(fr);
        return std::nullopt;
    }

    Value ref = popRef(fr);
    if (ref.isNull())
        return Outcome::NullPointer;
    ObjectData &obj = state.heap.object(*ref.ref);
    auto it = obj.fields.find(in.field.name);
    if (it == obj.fields.end())
        throw ExecutionFault(FaultKind::UnknownField,
                             "object of class " + obj.className + " has no field " +
                                 in.field.name);
    fr.stack.push(it->second);
    advance(fr);
    return std::nullopt;
}

HandlerResult handlePut(ExecState &state, const bc::ins::Put &in)
{
    Frame &fr = state.top();
    Value v = fr.stack.pop();
    if (in.isStatic)
    {
        state.statics.insert_or_assign(in.field.toString(), std::move(v));
        advance(fr);
        return std::nullopt;
    }

    Value ref = popRef(fr);
    if (ref.isNull())
        return Outcome::NullPointer;
    ObjectData &obj = state.heap.object(*ref.ref);
    auto it = obj.fields.find(in.field.name);
    if (it == obj.fields.end())
        throw ExecutionFault(FaultKind::UnknownField,
                             "object of class " + obj.className + " has no field " +
                                 in.field.name);
    it->second = std::move(v);
    advance(fr);
    return std::nullopt;
}

/// @brief Allocate an object with every instance field at its default.
/// @details Instantiating the assertion-error class halts immediately.
HandlerResult handleNew(ExecState &state, InstructionStore &store, const bc::ins::New &in)
{
    if (in.className == kAssertionErrorClass)
        return Outcome::AssertionError;

    std::map<std::string, Value> fields;
    if (in.className != kObjectClass)
    {
        const bc::ClassInfo &cls = store.classInfo(in.className);
        for (const auto &f : cls.fields)
        {
            if (!f.isStatic)
                fields.emplace(f.name, defaultValue(f.type));
        }
    }

    const HeapRef ref = state.heap.allocate(Value::makeObject(in.className, std::move(fields)));
    Frame &fr = state.top();
    fr.stack.push(Value::makeRef(ref));
    advance(fr);
    return std::nullopt;
}

HandlerResult handleNewArray(ExecState &state, const bc::ins::NewArray &in)
{
    Frame &fr = state.top();
    const std::int32_t size = popInt(fr);
    if (size < 0)
        throw ExecutionFault(FaultKind::NegativeArraySize,
                             "newarray with size " + std::to_string(size));
    if (size > kMaxArrayLength)
        throw ExecutionFault(FaultKind::ResourceExhausted,
                             "newarray with size " + std::to_string(size) + " exceeds the limit of " +
                                 std::to_string(kMaxArrayLength));
    std::vector<Value> elements;
    try
    {
        elements.assign(static_cast<size_t>(size), defaultValue(in.element));
    }
    catch (const std::bad_alloc &)
    {
        throw ExecutionFault(FaultKind::ResourceExhausted,
                             "out of memory allocating " + std::to_string(size) + " elements");
    }
    catch (const std::length_error &)
    {
        throw ExecutionFault(FaultKind::ResourceExhausted,
                             "out of memory allocating " + std::to_string(size) + " elements");
    }
    const HeapRef ref = state.heap.allocate(Value::makeArray(in.element, std::move(elements)));
    fr.stack.push(Value::makeRef(ref));
    advance(fr);
    return std::nullopt;
}

HandlerResult handleArrayLoad(ExecState &state, const bc::ins::ArrayLoad &)
{
    Frame &fr = state.top();
    const std::int32_t index = popInt(fr);
    Value ref = popRef(fr);
    if (ref.isNull())
        return Outcome::NullPointer;
    const ArrayData &arr = arrayAt(state.heap, *ref.ref);
    if (!inBounds(arr, index))
        return Outcome::OutOfBounds;
    fr.stack.push(arr.elements[static_cast<size_t>(index)]);
    advance(fr);
    return std::nullopt;
}

/// @brief Replace the heap array with a copy whose element @c index is updated.
HandlerResult handleArrayStore(ExecState &state, const bc::ins::ArrayStore &in)
{
    Frame &fr = state.top();
    Value v = fr.stack.pop();
    const std::int32_t index = popInt(fr);
    Value ref = popRef(fr);
    if (ref.isNull())
        return Outcome::NullPointer;
    const ArrayData &arr = arrayAt(state.heap, *ref.ref);
    if (!inBounds(arr, index))
        return Outcome::OutOfBounds;

    requireMatch(v, in.element, "arraystore");
    Value stored = in.element.isIntCategory() ? coerceScalar(v, arr.element) : std::move(v);
    std::vector<Value> elements = arr.elements;
    elements[static_cast<size_t>(index)] = std::move(stored);
    bc::Type element = arr.element;
    state.heap.replace(*ref.ref, Value::makeArray(std::move(element), std::move(elements)));
    advance(fr);
    return std::nullopt;
}

HandlerResult handleArrayLength(ExecState &state, const bc::ins::ArrayLength &)
{
    Frame &fr = state.top();
    Value ref = popRef(fr);
    if (ref.isNull())
        return Outcome::NullPointer;
    const ArrayData &arr = arrayAt(state.heap, *ref.ref);
    fr.stack.push(Value::makeInt(static_cast<std::int32_t>(arr.elements.size())));
    advance(fr);
    return std::nullopt;
}

} // namespace jade::vm::detail::memory
