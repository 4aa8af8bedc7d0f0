/*
 * naming_policy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Property naming policies (camelCase, snake_case, kebab-case)

**************************************************/

#include "naming_policy.hpp"

#include <cctype>

namespace yamlet {

namespace {

auto isUpper(char c) -> bool {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

auto isLower(char c) -> bool {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

auto isDigit(char c) -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto toLower(char c) -> char {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

auto toUpper(char c) -> char {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

auto isSeparator(char c) -> bool { return c == '_' || c == '-' || c == ' '; }

auto join(const std::vector<std::string>& words, char separator)
    -> std::string {
    std::string result;
    for (const auto& word : words) {
        if (!result.empty()) {
            result += separator;
        }
        result += word;
    }
    return result;
}

}  // namespace

auto toString(NamingPolicy policy) -> std::string_view {
    switch (policy) {
        case NamingPolicy::Identity:
            return "identity";
        case NamingPolicy::CamelCase:
            return "camelCase";
        case NamingPolicy::SnakeCase:
            return "snake_case";
        case NamingPolicy::KebabCase:
            return "kebab-case";
    }
    return "unknown";
}

namespace naming {

auto splitWords(std::string_view name) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    };
    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (isSeparator(c)) {
            flush();
            continue;
        }
        if (isUpper(c) && !current.empty()) {
            char prev = name[i - 1];
            bool nextLower = i + 1 < name.size() && isLower(name[i + 1]);
            if (isLower(prev) || isDigit(prev) || (isUpper(prev) && nextLower)) {
                flush();
            }
        }
        current += toLower(c);
    }
    flush();
    return words;
}

auto toCamelCase(std::string_view name) -> std::string {
    auto words = splitWords(name);
    std::string result;
    for (std::size_t i = 0; i < words.size(); ++i) {
        std::string word = words[i];
        if (i > 0) {
            word.front() = toUpper(word.front());
        }
        result += word;
    }
    return result;
}

auto toSnakeCase(std::string_view name) -> std::string {
    return join(splitWords(name), '_');
}

auto toKebabCase(std::string_view name) -> std::string {
    return join(splitWords(name), '-');
}

auto convert(std::string_view name, NamingPolicy policy) -> std::string {
    switch (policy) {
        case NamingPolicy::CamelCase:
            return toCamelCase(name);
        case NamingPolicy::SnakeCase:
            return toSnakeCase(name);
        case NamingPolicy::KebabCase:
            return toKebabCase(name);
        case NamingPolicy::Identity:
            break;
    }
    return std::string(name);
}

auto normalize(std::string_view key) -> std::string {
    std::string result;
    result.reserve(key.size());
    for (char c : key) {
        if (!isSeparator(c)) {
            result += toLower(c);
        }
    }
    return result;
}

auto keysMatch(std::string_view lhs, std::string_view rhs) -> bool {
    return lhs == rhs || normalize(lhs) == normalize(rhs);
}

}  // namespace naming

}  // namespace yamlet
