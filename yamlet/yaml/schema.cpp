/*
 * schema.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Scalar tag resolution (Core, JSON and Failsafe schemas)

**************************************************/

#include "schema.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <limits>

namespace yamlet {

namespace {

auto isDigit(char c) -> bool { return c >= '0' && c <= '9'; }

auto isHexDigit(char c) -> bool {
    return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

auto equalsIgnoreCase(std::string_view lhs, std::string_view rhs) -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        char a = lhs[i];
        char b = rhs[i];
        if (a >= 'A' && a <= 'Z') {
            a = static_cast<char>(a - 'A' + 'a');
        }
        if (b >= 'A' && b <= 'Z') {
            b = static_cast<char>(b - 'A' + 'a');
        }
        if (a != b) {
            return false;
        }
    }
    return true;
}

// One of: lower, Capitalized, UPPER.
auto matchesCaseForms(std::string_view text, std::string_view lower) -> bool {
    if (text.size() != lower.size() || text.empty()) {
        return false;
    }
    if (text == lower) {
        return true;
    }
    bool capitalized = text[0] == static_cast<char>(lower[0] - 'a' + 'A') &&
                       text.substr(1) == lower.substr(1);
    if (capitalized) {
        return true;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        char upper = lower[i];
        if (upper >= 'a' && upper <= 'z') {
            upper = static_cast<char>(upper - 'a' + 'A');
        }
        if (text[i] != upper) {
            return false;
        }
    }
    return true;
}

auto isCoreBool(std::string_view text) -> bool {
    return equalsIgnoreCase(text, "true") || equalsIgnoreCase(text, "false") ||
           equalsIgnoreCase(text, "yes") || equalsIgnoreCase(text, "no");
}

// [-+]?(0|[1-9][0-9]*)
auto isDecimalInt(std::string_view text) -> bool {
    std::size_t i = 0;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        ++i;
    }
    if (i >= text.size()) {
        return false;
    }
    if (text[i] == '0') {
        return i + 1 == text.size();
    }
    for (; i < text.size(); ++i) {
        if (!isDigit(text[i])) {
            return false;
        }
    }
    return true;
}

auto isPrefixedInt(std::string_view text) -> bool {
    if (text.size() < 3 || text[0] != '0') {
        return false;
    }
    if (text[1] == 'x') {
        for (std::size_t i = 2; i < text.size(); ++i) {
            if (!isHexDigit(text[i])) {
                return false;
            }
        }
        return true;
    }
    if (text[1] == 'o') {
        for (std::size_t i = 2; i < text.size(); ++i) {
            if (text[i] < '0' || text[i] > '7') {
                return false;
            }
        }
        return true;
    }
    return false;
}

// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
auto isDecimalFloat(std::string_view text) -> bool {
    std::size_t i = 0;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        ++i;
    }
    std::size_t integerDigits = 0;
    while (i < text.size() && isDigit(text[i])) {
        ++i;
        ++integerDigits;
    }
    std::size_t fractionDigits = 0;
    if (i < text.size() && text[i] == '.') {
        ++i;
        while (i < text.size() && isDigit(text[i])) {
            ++i;
            ++fractionDigits;
        }
    }
    if (integerDigits == 0 && fractionDigits == 0) {
        return false;
    }
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
            ++i;
        }
        std::size_t exponentDigits = 0;
        while (i < text.size() && isDigit(text[i])) {
            ++i;
            ++exponentDigits;
        }
        if (exponentDigits == 0) {
            return false;
        }
    }
    return i == text.size();
}

auto isInfinity(std::string_view text) -> bool {
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        text.remove_prefix(1);
    }
    return text == ".inf" || text == ".Inf" || text == ".INF";
}

auto isNan(std::string_view text) -> bool {
    return text == ".nan" || text == ".NaN" || text == ".NAN";
}

// -?(0|[1-9][0-9]*)
auto isJsonInt(std::string_view text) -> bool {
    if (!text.empty() && text[0] == '-') {
        text.remove_prefix(1);
    }
    return !text.empty() && text[0] != '+' && isDecimalInt(text);
}

// -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][-+]?[0-9]+)?
auto isJsonFloat(std::string_view text) -> bool {
    std::size_t i = 0;
    if (i < text.size() && text[i] == '-') {
        ++i;
    }
    if (i >= text.size() || !isDigit(text[i])) {
        return false;
    }
    if (text[i] == '0') {
        ++i;
    } else {
        while (i < text.size() && isDigit(text[i])) {
            ++i;
        }
    }
    if (i < text.size() && text[i] == '.') {
        ++i;
        std::size_t digits = 0;
        while (i < text.size() && isDigit(text[i])) {
            ++i;
            ++digits;
        }
        if (digits == 0) {
            return false;
        }
    }
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
            ++i;
        }
        std::size_t digits = 0;
        while (i < text.size() && isDigit(text[i])) {
            ++i;
            ++digits;
        }
        if (digits == 0) {
            return false;
        }
    }
    return i == text.size();
}

}  // namespace

auto Schema::nonPlainTagFor(std::string_view /*text*/,
                            ScalarStyle /*style*/) const -> ScalarTag {
    return ScalarTag::String;
}

// CoreSchema

auto CoreSchema::instance() -> const CoreSchema& {
    static const CoreSchema schema;
    return schema;
}

auto CoreSchema::name() const -> std::string_view { return "Core"; }

auto CoreSchema::tagFor(std::string_view text) const -> ScalarTag {
    if (schema::isNull(text)) {
        return ScalarTag::Null;
    }
    if (isCoreBool(text)) {
        return ScalarTag::Bool;
    }
    if (isDecimalInt(text) || isPrefixedInt(text)) {
        return ScalarTag::Int;
    }
    if (isDecimalFloat(text) || isInfinity(text) || isNan(text)) {
        return ScalarTag::Float;
    }
    return ScalarTag::String;
}

// JsonSchema

auto JsonSchema::instance() -> const JsonSchema& {
    static const JsonSchema schema;
    return schema;
}

auto JsonSchema::name() const -> std::string_view { return "JSON"; }

auto JsonSchema::tagFor(std::string_view text) const -> ScalarTag {
    if (text == "null") {
        return ScalarTag::Null;
    }
    if (text == "true" || text == "false") {
        return ScalarTag::Bool;
    }
    if (isJsonInt(text)) {
        return ScalarTag::Int;
    }
    if (isJsonFloat(text)) {
        return ScalarTag::Float;
    }
    return ScalarTag::String;
}

// FailsafeSchema

auto FailsafeSchema::instance() -> const FailsafeSchema& {
    static const FailsafeSchema schema;
    return schema;
}

auto FailsafeSchema::name() const -> std::string_view { return "Failsafe"; }

auto FailsafeSchema::tagFor(std::string_view /*text*/) const -> ScalarTag {
    return ScalarTag::String;
}

auto tagFor(std::string_view text) -> ScalarTag {
    return CoreSchema::instance().tagFor(text);
}

auto tagFromName(std::string_view tag) -> std::optional<ScalarTag> {
    constexpr std::string_view kLongPrefix = "tag:yaml.org,2002:";
    if (tag.starts_with("!!")) {
        tag.remove_prefix(2);
    } else if (tag.starts_with(kLongPrefix)) {
        tag.remove_prefix(kLongPrefix.size());
    } else {
        return std::nullopt;
    }
    if (tag == "null") {
        return ScalarTag::Null;
    }
    if (tag == "bool") {
        return ScalarTag::Bool;
    }
    if (tag == "int") {
        return ScalarTag::Int;
    }
    if (tag == "float") {
        return ScalarTag::Float;
    }
    if (tag == "str") {
        return ScalarTag::String;
    }
    return std::nullopt;
}

namespace schema {

auto isNull(std::string_view text) -> bool {
    return text.empty() || text == "~" || matchesCaseForms(text, "null");
}

auto parseBool(std::string_view text) -> std::optional<bool> {
    if (equalsIgnoreCase(text, "true") || equalsIgnoreCase(text, "yes")) {
        return true;
    }
    if (equalsIgnoreCase(text, "false") || equalsIgnoreCase(text, "no")) {
        return false;
    }
    return std::nullopt;
}

auto parseInt64(std::string_view text) -> std::optional<std::int64_t> {
    if (text.empty()) {
        return std::nullopt;
    }
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        text.remove_prefix(2);
    } else if (text.size() > 2 && text[0] == '0' &&
               (text[1] == 'o' || text[1] == 'O')) {
        base = 8;
        text.remove_prefix(2);
    } else if (text[0] == '+') {
        text.remove_prefix(1);
        if (text.empty() || text[0] == '-') {
            return std::nullopt;
        }
    }
    std::int64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value, base);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto parseUInt64(std::string_view text) -> std::optional<std::uint64_t> {
    if (text.empty() || text[0] == '-') {
        return std::nullopt;
    }
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        text.remove_prefix(2);
    } else if (text.size() > 2 && text[0] == '0' &&
               (text[1] == 'o' || text[1] == 'O')) {
        base = 8;
        text.remove_prefix(2);
    } else if (text[0] == '+') {
        text.remove_prefix(1);
    }
    std::uint64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value, base);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto parseDouble(std::string_view text) -> std::optional<double> {
    if (isNan(text)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (isInfinity(text)) {
        return text[0] == '-' ? -std::numeric_limits<double>::infinity()
                              : std::numeric_limits<double>::infinity();
    }
    if (text.empty()) {
        return std::nullopt;
    }
    if (text[0] == '+') {
        text.remove_prefix(1);
        if (text.empty() || text[0] == '-') {
            return std::nullopt;
        }
    }
    double value = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto formatDouble(double value) -> std::string {
    if (std::isnan(value)) {
        return ".nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-.inf" : ".inf";
    }
    std::array<char, 64> buffer{};
    auto [ptr, ec] =
        std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    std::string text(buffer.data(), ec == std::errc{} ? ptr : buffer.data());
    if (CoreSchema::instance().tagFor(text) != ScalarTag::Float) {
        auto exponent = text.find_first_of("eE");
        if (exponent == std::string::npos) {
            text += ".0";
        } else {
            text.insert(exponent, ".0");
        }
    }
    return text;
}

auto formatInt64(std::int64_t value) -> std::string {
    std::array<char, 32> buffer{};
    auto [ptr, ec] =
        std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    return {buffer.data(), ec == std::errc{} ? ptr : buffer.data()};
}

auto formatUInt64(std::uint64_t value) -> std::string {
    std::array<char, 32> buffer{};
    auto [ptr, ec] =
        std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    return {buffer.data(), ec == std::errc{} ? ptr : buffer.data()};
}

}  // namespace schema

}  // namespace yamlet
