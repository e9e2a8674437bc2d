#pragma once

#include "QueryResult.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace dbscope {

// Lexical helpers over statement text. Quoted literals ('...', "...", `...`)
// and comments are skipped; nothing here parses SQL.
class SqlText {
public:
    // Trim and collapse every whitespace run to a single space
    static std::string normalizeWhitespace(std::string_view sql);

    // First word, upper-cased; empty when the text has no leading word
    static std::string leadingKeyword(std::string_view sql);

    // Replace numeric literals (not digits inside identifiers) with `?`
    static std::string replaceNumericLiterals(std::string_view sql);

    // Number of `?` placeholders outside quoted text and comments
    static size_t countPlaceholders(std::string_view sql);

    // Rewrite `?` placeholders to `$1..$n` (PostgreSQL)
    static std::string numberPlaceholders(std::string_view sql);

    // Substitute `?` placeholders with literals produced by `quote`
    static std::string interpolate(std::string_view sql, const Params& params,
                                   const std::function<std::string(const std::string&)>& quote);

    // Standard SQL string literal escaping ('' for ')
    static std::string escapeLiteral(const std::string& value);

private:
    // Calls `onPlaceholder(index, position)` for each placeholder; returns the count
    static size_t scanPlaceholders(std::string_view sql,
                                   const std::function<void(size_t, size_t)>& onPlaceholder);
};

}  // namespace dbscope
