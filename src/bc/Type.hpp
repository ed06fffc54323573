//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bc/Type.hpp
// Purpose: Declares the descriptor-level type used by method ids, fields and
//          typed instructions.
// Key invariants: Object types carry a class name (empty for the generic
//                 reference letter 'A'); Array types carry an element type.
// Ownership/Lifetime: Value type; element types are shared immutably.
// Links: docs/jbc-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace jade::bc
{

/// @brief JVM-style field type as written in descriptors.
struct Type
{
    /// @brief Enumerates descriptor kinds.
    enum class Kind
    {
        Void,
        Int,
        Boolean,
        Char,
        Short,
        Byte,
        Long,
        Float,
        Double,
        Object,
        Array
    };
    Kind kind; ///< Discriminator specifying the active kind

    /// @brief Internal class name for Object types ("java/lang/String").
    std::string className;

    /// @brief Element type for Array types.
    std::shared_ptr<const Type> element;

    /// @brief Construct the void type.
    Type() : kind(Kind::Void) {}

    /// @brief Construct a type of kind @p k.
    explicit Type(Kind k);

    static Type object(std::string className);
    static Type array(Type element);

    /// @brief True for the kinds the VM stores as 32-bit integers.
    [[nodiscard]] bool isIntCategory() const;

    /// @brief True for Object and Array kinds.
    [[nodiscard]] bool isReference() const;

    /// @brief Render the JVM descriptor, e.g. "I", "[I", "Ljava/lang/Object;".
    /// @details The generic reference prints as "A".
    std::string descriptor() const;

    /// @brief Render a readable name, e.g. "int", "int[]".
    std::string toString() const;

    friend bool operator==(const Type &a, const Type &b);
    friend bool operator!=(const Type &a, const Type &b)
    {
        return !(a == b);
    }
};

/// @brief Convert kind @p k to its readable name.
std::string kindToString(Type::Kind k);

/// @brief Parse one field descriptor starting at @p pos.
/// @details Accepts `I Z C S B J F D`, `L<cls>;` and `[<elem>`.  Advances
///          @p pos past the consumed text.
/// @return Parsed type or std::nullopt when the text is not a descriptor.
std::optional<Type> parseFieldDescriptor(std::string_view text, size_t &pos);

/// @brief Parse the whole of @p text as one field descriptor or `V`.
std::optional<Type> parseTypeDescriptor(std::string_view text);

/// @brief Parse a listing type letter: a descriptor, `V`, or `A` for any reference.
std::optional<Type> parseTypeLetter(std::string_view text);

} // namespace jade::bc
