#include "SqlText.hpp"
#include "ErrorHandler.hpp"
#include <cctype>

namespace dbscope {

namespace {

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// Length of the quoted literal or comment starting at `pos`, or 0
size_t skippable(std::string_view sql, size_t pos) {
    char c = sql[pos];
    if (c == '\'' || c == '"' || c == '`') {
        size_t i = pos + 1;
        while (i < sql.size()) {
            if (sql[i] == c) {
                // Doubled quote is an escaped quote
                if (i + 1 < sql.size() && sql[i + 1] == c) {
                    i += 2;
                    continue;
                }
                return i + 1 - pos;
            }
            ++i;
        }
        return sql.size() - pos;
    }
    if (c == '-' && pos + 1 < sql.size() && sql[pos + 1] == '-') {
        auto end = sql.find('\n', pos);
        return (end == std::string_view::npos ? sql.size() : end) - pos;
    }
    if (c == '/' && pos + 1 < sql.size() && sql[pos + 1] == '*') {
        auto end = sql.find("*/", pos + 2);
        return (end == std::string_view::npos ? sql.size() : end + 2) - pos;
    }
    return 0;
}

}  // namespace

std::string SqlText::normalizeWhitespace(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());
    bool pendingSpace = false;

    for (char c : sql) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace) {
            result += ' ';
            pendingSpace = false;
        }
        result += c;
    }
    return result;
}

std::string SqlText::leadingKeyword(std::string_view sql) {
    size_t i = 0;
    while (i < sql.size() && std::isspace(static_cast<unsigned char>(sql[i]))) {
        ++i;
    }

    std::string word;
    while (i < sql.size() &&
           (std::isalnum(static_cast<unsigned char>(sql[i])) || sql[i] == '_')) {
        word += static_cast<char>(std::toupper(static_cast<unsigned char>(sql[i])));
        ++i;
    }
    return word;
}

std::string SqlText::replaceNumericLiterals(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());

    size_t i = 0;
    while (i < sql.size()) {
        if (size_t skip = skippable(sql, i)) {
            result.append(sql.substr(i, skip));
            i += skip;
            continue;
        }

        char c = sql[i];
        bool startsNumber = std::isdigit(static_cast<unsigned char>(c)) &&
                            (i == 0 || !isIdentChar(sql[i - 1]));
        if (!startsNumber) {
            result += c;
            ++i;
            continue;
        }

        // Digits, a fractional part and an exponent form one literal
        while (i < sql.size() &&
               (std::isdigit(static_cast<unsigned char>(sql[i])) || sql[i] == '.')) {
            ++i;
        }
        if (i < sql.size() && (sql[i] == 'e' || sql[i] == 'E')) {
            size_t j = i + 1;
            if (j < sql.size() && (sql[j] == '+' || sql[j] == '-')) ++j;
            if (j < sql.size() && std::isdigit(static_cast<unsigned char>(sql[j]))) {
                i = j;
                while (i < sql.size() && std::isdigit(static_cast<unsigned char>(sql[i]))) ++i;
            }
        }
        result += '?';
    }
    return result;
}

size_t SqlText::scanPlaceholders(std::string_view sql,
                                 const std::function<void(size_t, size_t)>& onPlaceholder) {
    size_t count = 0;
    size_t i = 0;
    while (i < sql.size()) {
        if (size_t skip = skippable(sql, i)) {
            i += skip;
            continue;
        }
        if (sql[i] == '?') {
            if (onPlaceholder) onPlaceholder(count, i);
            ++count;
        }
        ++i;
    }
    return count;
}

size_t SqlText::countPlaceholders(std::string_view sql) {
    return scanPlaceholders(sql, nullptr);
}

std::string SqlText::numberPlaceholders(std::string_view sql) {
    std::string result;
    size_t last = 0;
    scanPlaceholders(sql, [&](size_t index, size_t pos) {
        result.append(sql.substr(last, pos - last));
        result += '$' + std::to_string(index + 1);
        last = pos + 1;
    });
    result.append(sql.substr(last));
    return result;
}

std::string SqlText::interpolate(std::string_view sql, const Params& params,
                                 const std::function<std::string(const std::string&)>& quote) {
    size_t expected = countPlaceholders(sql);
    if (expected != params.size()) {
        throw StatementError("Statement expects " + std::to_string(expected) +
                             " parameters, got " + std::to_string(params.size()));
    }

    std::string result;
    size_t last = 0;
    scanPlaceholders(sql, [&](size_t index, size_t pos) {
        result.append(sql.substr(last, pos - last));
        const Value& value = params[index];
        if (std::holds_alternative<std::string>(value)) {
            result += quote(std::get<std::string>(value));
        } else {
            result += valueToString(value);
        }
        last = pos + 1;
    });
    result.append(sql.substr(last));
    return result;
}

std::string SqlText::escapeLiteral(const std::string& value) {
    std::string result = "'";
    for (char c : value) {
        if (c == '\'') {
            result += "''";  // Standard SQL escape
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

}  // namespace dbscope
