//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bc/Case.hpp
// Purpose: Concrete method inputs and recorded expectations ("cases").
// Key invariants: Array inputs carry an Array type and their elements as
//                 32-bit scalars in the element type's representation;
//                 object inputs carry an Object type and nested field inputs.
// Ownership/Lifetime: Value types.
// Links: docs/jbc-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bc/MethodId.hpp"
#include "bc/Type.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace jade::bc
{

/// @brief One literal argument: a scalar, an array of scalars or an object.
/// @details Object inputs (`new Cls(5)`) carry one argument per declared
///          instance field of @c Cls, in declaration order.
struct Input
{
    Type type;
    std::int32_t scalar = 0;
    std::vector<std::int32_t> elements;
    std::vector<Input> fields;

    static Input ofInt(std::int32_t v)
    {
        return Input{Type(Type::Kind::Int), v, {}, {}};
    }

    static Input ofBoolean(bool v)
    {
        return Input{Type(Type::Kind::Boolean), v ? 1 : 0, {}, {}};
    }

    static Input ofChar(char16_t v)
    {
        return Input{Type(Type::Kind::Char), static_cast<std::int32_t>(v), {}, {}};
    }

    static Input ofArray(Type element, std::vector<std::int32_t> values)
    {
        return Input{Type::array(std::move(element)), 0, std::move(values), {}};
    }

    static Input ofObject(std::string className, std::vector<Input> fieldValues)
    {
        return Input{Type::object(std::move(className)), 0, {}, std::move(fieldValues)};
    }
};

/// @brief Expected outcome of running @c method on @c inputs.
/// @details @c expected holds an outcome token or "*".
struct Case
{
    MethodId method;
    std::vector<Input> inputs;
    std::string expected;
    support::SourceLoc loc;
};

} // namespace jade::bc
