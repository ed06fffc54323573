//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements descriptor rendering and parsing for bc::Type.  Descriptors follow
// the JVM letter scheme so listings and method ids read like javap output.
//
//===----------------------------------------------------------------------===//

#include "bc/Type.hpp"

namespace jade::bc
{

Type::Type(Kind k) : kind(k) {}

Type Type::object(std::string name)
{
    Type t(Kind::Object);
    t.className = std::move(name);
    return t;
}

Type Type::array(Type elem)
{
    Type t(Kind::Array);
    t.element = std::make_shared<const Type>(std::move(elem));
    return t;
}

bool Type::isIntCategory() const
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

bool Type::isReference() const
{
    return kind == Kind::Object || kind == Kind::Array;
}

std::string Type::descriptor() const
{
    switch (kind)
    {
        case Kind::Void:
            return "V";
        case Kind::Int:
            return "I";
        case Kind::Boolean:
            return "Z";
        case Kind::Char:
            return "C";
        case Kind::Short:
            return "S";
        case Kind::Byte:
            return "B";
        case Kind::Long:
            return "J";
        case Kind::Float:
            return "F";
        case Kind::Double:
            return "D";
        case Kind::Object:
            if (className.empty())
                return "A";
            return "L" + className + ";";
        case Kind::Array:
            return "[" + (element ? element->descriptor() : std::string("?"));
    }
    return "?";
}

std::string Type::toString() const
{
    if (kind == Kind::Object && !className.empty())
        return className;
    if (kind == Kind::Array)
        return (element ? element->toString() : std::string("?")) + "[]";
    return kindToString(kind);
}

bool operator==(const Type &a, const Type &b)
{
    if (a.kind != b.kind)
        return false;
    if (a.kind == Type::Kind::Object)
        return a.className == b.className;
    if (a.kind == Type::Kind::Array)
    {
        if (!a.element || !b.element)
            return a.element == b.element;
        return *a.element == *b.element;
    }
    return true;
}

std::string kindToString(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::Void:
            return "void";
        case Type::Kind::Int:
            return "int";
        case Type::Kind::Boolean:
            return "boolean";
        case Type::Kind::Char:
            return "char";
        case Type::Kind::Short:
            return "short";
        case Type::Kind::Byte:
            return "byte";
        case Type::Kind::Long:
            return "long";
        case Type::Kind::Float:
            return "float";
        case Type::Kind::Double:
            return "double";
        case Type::Kind::Object:
            return "ref";
        case Type::Kind::Array:
            return "array";
    }
    return "";
}

std::optional<Type> parseFieldDescriptor(std::string_view text, size_t &pos)
{
    if (pos >= text.size())
        return std::nullopt;

    const char c = text[pos];
    switch (c)
    {
        case 'I':
            ++pos;
            return Type(Type::Kind::Int);
        case 'Z':
            ++pos;
            return Type(Type::Kind::Boolean);
        case 'C':
            ++pos;
            return Type(Type::Kind::Char);
        case 'S':
            ++pos;
            return Type(Type::Kind::Short);
        case 'B':
            ++pos;
            return Type(Type::Kind::Byte);
        case 'J':
            ++pos;
            return Type(Type::Kind::Long);
        case 'F':
            ++pos;
            return Type(Type::Kind::Float);
        case 'D':
            ++pos;
            return Type(Type::Kind::Double);
        case 'L':
        {
            const size_t semi = text.find(';', pos);
            if (semi == std::string_view::npos || semi == pos + 1)
                return std::nullopt;
            std::string name(text.substr(pos + 1, semi - pos - 1));
            pos = semi + 1;
            return Type::object(std::move(name));
        }
        case '[':
        {
            size_t inner = pos + 1;
            auto elem = parseFieldDescriptor(text, inner);
            if (!elem)
                return std::nullopt;
            pos = inner;
            return Type::array(std::move(*elem));
        }
        default:
            return std::nullopt;
    }
}

std::optional<Type> parseTypeDescriptor(std::string_view text)
{
    if (text == "V")
        return Type(Type::Kind::Void);
    size_t pos = 0;
    auto ty = parseFieldDescriptor(text, pos);
    if (!ty || pos != text.size())
        return std::nullopt;
    return ty;
}

std::optional<Type> parseTypeLetter(std::string_view text)
{
    if (text == "A")
        return Type(Type::Kind::Object);
    return parseTypeDescriptor(text);
}

} // namespace jade::bc
