// File: src/bc/io/Lexer.hpp
// Purpose: Declares lexical helper utilities for listing and input-literal text.
// Key invariants: Functions operate on ASCII-compatible strings.
// Ownership/Lifetime: Returns new strings; does not own provided streams.
// Links: docs/jbc-format.md
#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace jade::bc::io
{

/// @brief Lexical helpers shared by the suite and case parsers.
class Lexer
{
  public:
    /// @brief Remove leading and trailing whitespace.
    [[nodiscard]] static std::string trim(std::string_view text);

    /// @brief Drop a trailing `#` comment that is not inside quotes.
    [[nodiscard]] static std::string stripComment(std::string_view text);

    /// @brief Read the next whitespace-separated token, or "" at end of input.
    /// @details A token opening with a single quote runs to the matching quote,
    ///          so `' '` is one token.
    [[nodiscard]] static std::string nextToken(std::istringstream &stream);

    /// @brief Split on top-level commas, ignoring commas inside brackets or quotes.
    /// @details Each piece is trimmed; an all-blank input yields no pieces.
    [[nodiscard]] static std::vector<std::string> splitCommaSeparated(std::string_view text);

    /// @brief Parse a decimal 32-bit integer with optional sign.
    [[nodiscard]] static std::optional<std::int32_t> parseInt(std::string_view text);

    /// @brief Parse a quoted char literal: 'a', '\n', '\'' or 'A'.
    [[nodiscard]] static std::optional<char16_t> parseChar(std::string_view text);

    /// @brief Parse `true` / `false`.
    [[nodiscard]] static std::optional<bool> parseBool(std::string_view text);
};

} // namespace jade::bc::io
