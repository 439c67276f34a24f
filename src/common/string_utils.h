#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace backstop {

constexpr char COMMA = ',';
constexpr char DELIMITER = COMMA;

inline std::vector<std::string> SplitString(const std::string& str, const char delimiter = DELIMITER) {
    std::vector<std::string> result;

    if (str.empty()) {
        result.emplace_back();
        return result;
    }

    std::stringstream string_stream(str);
    std::string item;
    while (std::getline(string_stream, item, delimiter)) {
        result.push_back(item);
    }
    return result;
}

inline std::string ToUpper(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char cha) { return std::toupper(cha); });
    return upper;
}

inline std::string TrimCopy(std::string_view str_view) {
    size_t b = 0;
    size_t e = str_view.size();
    while (b < e && (std::isspace(static_cast<unsigned char>(str_view[b])) != 0)) {
        ++b;
    }
    while (e > b && (std::isspace(static_cast<unsigned char>(str_view[e - 1])) != 0)) {
        --e;
    }
    return std::string(str_view.substr(b, e - b));
}

/**
 * @brief Splits on commas, dropping empty tokens.
 *
 * - tokens are trimmed of surrounding whitespace
 * - a backslash escapes the next character, so `a\,b` yields `a,b`
 */
inline std::vector<std::string> SplitByComma(std::string_view str) {
    std::vector<std::string> out;
    std::string cur;
    bool escape = false;

    auto flush = [&out, &cur]() {
        std::string tok = TrimCopy(cur);
        if (!tok.empty()) {
            out.emplace_back(std::move(tok));
        }
        cur.clear();
    };

    for (char cha : str) {
        if (escape) {
            cur.push_back(cha);
            escape = false;
            continue;
        }
        if (cha == '\\') {
            escape = true;
            continue;
        }
        if (cha == COMMA) {
            flush();
        } else {
            cur.push_back(cha);
        }
    }
    flush();

    return out;
}

} // namespace backstop
