//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements rendering, hashing and parsing for method and field identifiers.
//
//===----------------------------------------------------------------------===//

#include "bc/MethodId.hpp"

#include <functional>

namespace jade::bc
{

using support::Expected;
using support::makeError;
using support::SourceLoc;

std::string MethodId::descriptor() const
{
    std::string out = "(";
    for (const auto &p : params)
        out += p.descriptor();
    out += ')';
    out += returnType.descriptor();
    return out;
}

std::string MethodId::toString() const
{
    return className + "." + name + ":" + descriptor();
}

bool operator==(const MethodId &a, const MethodId &b)
{
    return a.className == b.className && a.name == b.name && a.params == b.params &&
           a.returnType == b.returnType;
}

size_t MethodIdHash::operator()(const MethodId &id) const
{
    return std::hash<std::string>{}(id.toString());
}

std::string FieldId::toString() const
{
    return className + "." + name;
}

std::string internalClassName(std::string_view name)
{
    std::string out(name);
    for (char &c : out)
    {
        if (c == '.')
            c = '/';
    }
    return out;
}

Expected<void> parseMethodDescriptor(std::string_view text, MethodId &out, SourceLoc loc)
{
    if (text.empty() || text.front() != '(')
        return makeError(loc, "malformed method descriptor '" + std::string(text) + "'");

    const size_t close = text.find(')');
    if (close == std::string_view::npos)
        return makeError(loc, "malformed method descriptor '" + std::string(text) + "'");

    std::vector<Type> params;
    size_t pos = 1;
    while (pos < close)
    {
        auto ty = parseFieldDescriptor(text.substr(0, close), pos);
        if (!ty)
            return makeError(loc, "bad parameter type in '" + std::string(text) + "'");
        params.push_back(std::move(*ty));
    }

    auto ret = parseTypeDescriptor(text.substr(close + 1));
    if (!ret)
        return makeError(loc, "bad return type in '" + std::string(text) + "'");

    out.params = std::move(params);
    out.returnType = std::move(*ret);
    return {};
}

Expected<MethodId> parseMethodId(std::string_view text, SourceLoc loc)
{
    const size_t colon = text.find(':');
    if (colon == std::string_view::npos)
        return makeError(loc, "method id '" + std::string(text) + "' is missing ':<descriptor>'");

    const std::string_view qualified = text.substr(0, colon);
    const size_t dot = qualified.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == qualified.size())
        return makeError(loc, "method id '" + std::string(text) + "' needs <class>.<name>");

    MethodId id;
    id.className = internalClassName(qualified.substr(0, dot));
    id.name = std::string(qualified.substr(dot + 1));
    if (auto r = parseMethodDescriptor(text.substr(colon + 1), id, loc); !r)
        return r.error();
    return id;
}

} // namespace jade::bc
