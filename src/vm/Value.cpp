//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Value.cpp
// Purpose: Value factories, structural equality and rendering.
// Links: docs/vm.md#values
//
//===----------------------------------------------------------------------===//

#include "vm/Value.hpp"

#include <sstream>

namespace jade::vm
{

Value Value::makeInt(std::int32_t v)
{
    Value out;
    out.kind = Kind::Int;
    out.scalar = v;
    return out;
}

Value Value::makeBoolean(bool v)
{
    Value out;
    out.kind = Kind::Boolean;
    out.scalar = v ? 1 : 0;
    return out;
}

Value Value::makeChar(std::uint16_t v)
{
    Value out;
    out.kind = Kind::Char;
    out.scalar = static_cast<std::int32_t>(v);
    return out;
}

Value Value::makeShort(std::int16_t v)
{
    Value out;
    out.kind = Kind::Short;
    out.scalar = static_cast<std::int32_t>(v);
    return out;
}

Value Value::makeByte(std::int8_t v)
{
    Value out;
    out.kind = Kind::Byte;
    out.scalar = static_cast<std::int32_t>(v);
    return out;
}

Value Value::makeNull()
{
    Value out;
    out.kind = Kind::Reference;
    return out;
}

Value Value::makeRef(HeapRef r)
{
    Value out;
    out.kind = Kind::Reference;
    out.ref = r;
    return out;
}

Value Value::makeArray(bc::Type element, std::vector<Value> elements)
{
    Value out;
    out.kind = Kind::Array;
    out.array = std::make_shared<const ArrayData>(ArrayData{std::move(element), std::move(elements)});
    return out;
}

Value Value::makeObject(std::string className, std::map<std::string, Value> fields)
{
    Value out;
    out.kind = Kind::Object;
    out.object = std::make_shared<ObjectData>(ObjectData{std::move(className), std::move(fields)});
    return out;
}

bool Value::isIntCategory() const
{
    switch (kind)
    {
        case Kind::Int:
        case Kind::Boolean:
        case Kind::Char:
        case Kind::Short:
        case Kind::Byte:
            return true;
        default:
            return false;
    }
}

bool operator==(const Value &a, const Value &b)
{
    if (a.kind != b.kind)
        return false;
    switch (a.kind)
    {
        case Value::Kind::Reference:
            return a.ref == b.ref;
        case Value::Kind::Array:
            if (a.array == b.array)
                return true;
            if (!a.array || !b.array)
                return false;
            return a.array->element == b.array->element && a.array->elements == b.array->elements;
        case Value::Kind::Object:
            if (a.object == b.object)
                return true;
            if (!a.object || !b.object)
                return false;
            return a.object->className == b.object->className &&
                   a.object->fields == b.object->fields;
        default:
            return a.scalar == b.scalar;
    }
}

std::string Value::toString() const
{
    std::ostringstream os;
    switch (kind)
    {
        case Kind::Int:
        case Kind::Short:
        case Kind::Byte:
            os << scalar;
            break;
        case Kind::Boolean:
            os << (scalar ? "true" : "false");
            break;
        case Kind::Char:
            if (scalar >= 0x20 && scalar < 0x7f)
                os << '\'' << static_cast<char>(scalar) << '\'';
            else
                os << "'\\u" << std::hex << scalar << std::dec << '\'';
            break;
        case Kind::Reference:
            if (ref)
                os << '@' << *ref;
            else
                os << "null";
            break;
        case Kind::Array:
        {
            os << (array ? array->element.descriptor() : std::string("?")) << '[';
            if (array)
            {
                for (size_t i = 0; i < array->elements.size(); ++i)
                {
                    if (i)
                        os << ", ";
                    os << array->elements[i].toString();
                }
            }
            os << ']';
            break;
        }
        case Kind::Object:
        {
            os << (object ? object->className : std::string("?")) << '{';
            if (object)
            {
                bool first = true;
                for (const auto &[name, v] : object->fields)
                {
                    if (!first)
                        os << ", ";
                    first = false;
                    os << name << '=' << v.toString();
                }
            }
            os << '}';
            break;
        }
    }
    return os.str();
}

const char *kindToString(Value::Kind k)
{
    switch (k)
    {
        case Value::Kind::Int:
            return "int";
        case Value::Kind::Boolean:
            return "boolean";
        case Value::Kind::Char:
            return "char";
        case Value::Kind::Short:
            return "short";
        case Value::Kind::Byte:
            return "byte";
        case Value::Kind::Reference:
            return "reference";
        case Value::Kind::Array:
            return "array";
        case Value::Kind::Object:
            return "object";
    }
    return "?";
}

Value defaultValue(const bc::Type &type)
{
    switch (type.kind)
    {
        case bc::Type::Kind::Boolean:
            return Value::makeBoolean(false);
        case bc::Type::Kind::Char:
            return Value::makeChar(0);
        case bc::Type::Kind::Short:
            return Value::makeShort(0);
        case bc::Type::Kind::Byte:
            return Value::makeByte(0);
        case bc::Type::Kind::Int:
            return Value::makeInt(0);
        default:
            return Value::makeNull();
    }
}

bool matchesType(const Value &v, const bc::Type &type)
{
    if (type.isIntCategory())
        return v.isIntCategory();
    if (type.isReference())
        return v.kind == Value::Kind::Reference;
    return false;
}

} // namespace jade::vm
