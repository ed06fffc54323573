//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bc/Outcome.hpp
// Purpose: Defines the terminal outcome taxonomy shared by case declarations
//          and the interpreter.
// Key invariants: Tokens are stable strings; the non-termination marker is not
//                 an Outcome value.
// Ownership/Lifetime: Not applicable.
// Links: docs/vm.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string_view>

namespace jade::bc
{

/// @brief Terminal result of the transition function.
enum class Outcome
{
    Ok,             ///< Entry method returned normally.
    DivideByZero,   ///< Integer division or remainder by zero.
    AssertionError, ///< The assertion-error class was instantiated.
    OutOfBounds,    ///< Array index outside [0, length).
    NullPointer,    ///< Field or array access through a null reference.
};

/// @brief Printed when the step budget runs out before any outcome.
inline constexpr std::string_view kNonTerminationMarker = "*";

/// @brief Convert outcome to its printed token.
constexpr std::string_view toToken(Outcome outcome) noexcept
{
    switch (outcome)
    {
        case Outcome::Ok:
            return "ok";
        case Outcome::DivideByZero:
            return "divide by zero";
        case Outcome::AssertionError:
            return "assertion error";
        case Outcome::OutOfBounds:
            return "out of bounds";
        case Outcome::NullPointer:
            return "null pointer";
    }
    return "ok";
}

/// @brief Parse a printed token back into an Outcome.
/// @return std::nullopt for "*" and for unknown text.
constexpr std::optional<Outcome> outcomeFromToken(std::string_view token) noexcept
{
    for (Outcome o : {Outcome::Ok,
                      Outcome::DivideByZero,
                      Outcome::AssertionError,
                      Outcome::OutOfBounds,
                      Outcome::NullPointer})
    {
        if (toToken(o) == token)
            return o;
    }
    return std::nullopt;
}

} // namespace jade::bc
