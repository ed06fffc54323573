//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Diagnostic helpers and a lightweight Expected container used by the
//          listing loader, the case parser and the CLI.
// Key invariants: An Expected holds exactly one of a value or a diagnostic.
// Ownership/Lifetime: Values and diagnostics are owned by the Expected.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace jade::support
{
using Diag = Diagnostic;

/// @brief Result of an operation that either yields a T or a diagnostic.
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag) : error_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

template <> class Expected<void>
{
  public:
    Expected() = default;

    Expected(Diag diag);

    [[nodiscard]] bool hasValue() const;

    explicit operator bool() const;

    const Diag &error() const &;

  private:
    std::optional<Diag> error_;
};

namespace detail
{
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Build an error-severity diagnostic at @p loc.
Diag makeError(SourceLoc loc, std::string msg);

/// @brief Print @p diag as "path:line:col: severity: message".
/// @details The location prefix is omitted when @p sm is null or the location
///          carries no file.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);

} // namespace jade::support
