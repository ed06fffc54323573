// File: src/bc/io/Lexer.cpp
// Purpose: Implements lexical helper utilities for listing text.
// Key invariants: Operates on ASCII compatible strings.
// Ownership/Lifetime: Functions allocate new std::string instances as needed.
// Links: docs/jbc-format.md

#include "bc/io/Lexer.hpp"

#include <cctype>
#include <charconv>

namespace jade::bc::io
{

std::string Lexer::trim(std::string_view text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    return std::string{text.substr(begin, end - begin)};
}

std::string Lexer::stripComment(std::string_view text)
{
    bool inQuote = false;
    char quote = '\0';
    for (size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        if (inQuote)
        {
            if (c == '\\')
                ++i;
            else if (c == quote)
                inQuote = false;
            continue;
        }
        if (c == '\'' || c == '"')
        {
            inQuote = true;
            quote = c;
        }
        else if (c == '#')
        {
            return std::string{text.substr(0, i)};
        }
    }
    return std::string{text};
}

std::string Lexer::nextToken(std::istringstream &stream)
{
    std::string token;
    stream >> std::ws;
    if (stream.peek() != '\'')
    {
        stream >> token;
        return token;
    }

    using Traits = std::istringstream::traits_type;
    token.push_back(static_cast<char>(stream.get()));
    for (int c = stream.get(); c != Traits::eof(); c = stream.get())
    {
        token.push_back(static_cast<char>(c));
        if (c == '\\')
        {
            const int escaped = stream.get();
            if (escaped == Traits::eof())
                break;
            token.push_back(static_cast<char>(escaped));
        }
        else if (c == '\'')
        {
            break;
        }
    }
    return token;
}

std::vector<std::string> Lexer::splitCommaSeparated(std::string_view text)
{
    std::vector<std::string> tokens;
    if (trim(text).empty())
        return tokens;

    int depth = 0;
    bool inQuote = false;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        if (inQuote)
        {
            if (c == '\\')
                ++i;
            else if (c == '\'')
                inQuote = false;
            continue;
        }
        if (c == '\'')
            inQuote = true;
        else if (c == '[' || c == '(')
            ++depth;
        else if (c == ']' || c == ')')
            --depth;
        else if (c == ',' && depth == 0)
        {
            tokens.push_back(trim(text.substr(start, i - start)));
            start = i + 1;
        }
    }
    tokens.push_back(trim(text.substr(start)));
    return tokens;
}

std::optional<std::int32_t> Lexer::parseInt(std::string_view text)
{
    if (!text.empty() && text.front() == '+')
        text.remove_prefix(1);
    if (text.empty())
        return std::nullopt;
    std::int32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

std::optional<char16_t> Lexer::parseChar(std::string_view text)
{
    if (text.size() < 3 || text.front() != '\'' || text.back() != '\'')
        return std::nullopt;
    const std::string_view body = text.substr(1, text.size() - 2);
    if (body.size() == 1 && body[0] != '\\')
        return static_cast<char16_t>(static_cast<unsigned char>(body[0]));
    if (body.size() < 2 || body[0] != '\\')
        return std::nullopt;
    if (body.size() == 2)
    {
        switch (body[1])
        {
            case 'n':
                return u'\n';
            case 't':
                return u'\t';
            case 'r':
                return u'\r';
            case '0':
                return u'\0';
            case '\\':
                return u'\\';
            case '\'':
                return u'\'';
            default:
                return std::nullopt;
        }
    }
    if (body[1] == 'u' && body.size() == 6)
    {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(body.data() + 2, body.data() + body.size(), value, 16);
        if (ec != std::errc{} || ptr != body.data() + body.size())
            return std::nullopt;
        return static_cast<char16_t>(value);
    }
    return std::nullopt;
}

std::optional<bool> Lexer::parseBool(std::string_view text)
{
    if (text == "true")
        return true;
    if (text == "false")
        return false;
    return std::nullopt;
}

} // namespace jade::bc::io
