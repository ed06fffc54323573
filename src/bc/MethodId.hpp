//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bc/MethodId.hpp
// Purpose: Method and field identifiers plus their textual parsers.
// Key invariants: Class names are stored in internal form with '/' separators.
// Ownership/Lifetime: Value types.
// Links: docs/jbc-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bc/Type.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace jade::bc
{

/// @brief Fully qualified method reference: class, name and descriptor.
struct MethodId
{
    std::string className;
    std::string name;
    std::vector<Type> params;
    Type returnType;

    /// @brief Render "(II)I".
    std::string descriptor() const;

    /// @brief Render "pkg/Cls.name:(II)I".
    std::string toString() const;

    friend bool operator==(const MethodId &a, const MethodId &b);
    friend bool operator!=(const MethodId &a, const MethodId &b)
    {
        return !(a == b);
    }
};

/// @brief Hash functor so MethodId can key unordered containers.
struct MethodIdHash
{
    size_t operator()(const MethodId &id) const;
};

/// @brief Field reference: owning class, name and declared type.
struct FieldId
{
    std::string className;
    std::string name;
    Type type;

    /// @brief Render "pkg/Cls.name".
    std::string toString() const;
};

/// @brief Parse "pkg/Cls.name:(II)I" or the dotted "pkg.Cls.name:(II)I".
/// @details The last '.' before the ':' splits class from method name; dots in
///          the class part are rewritten to '/'.
support::Expected<MethodId> parseMethodId(std::string_view text,
                                          support::SourceLoc loc = {});

/// @brief Parse a "(params)ret" method descriptor into @p out.
support::Expected<void> parseMethodDescriptor(std::string_view text,
                                              MethodId &out,
                                              support::SourceLoc loc = {});

/// @brief Rewrite dotted class names to internal '/' form.
std::string internalClassName(std::string_view name);

} // namespace jade::bc
