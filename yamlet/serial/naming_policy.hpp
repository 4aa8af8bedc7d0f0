/*
 * naming_policy.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Property naming policies (camelCase, snake_case, kebab-case)

**************************************************/

#ifndef YAMLET_SERIAL_NAMING_POLICY_HPP
#define YAMLET_SERIAL_NAMING_POLICY_HPP

#include <string>
#include <string_view>
#include <vector>

namespace yamlet {

/**
 * @brief How declared property names are turned into mapping keys.
 */
enum class NamingPolicy {
    Identity,   ///< Keep the declared name
    CamelCase,  ///< `firstName`
    SnakeCase,  ///< `first_name`
    KebabCase   ///< `first-name`
};

[[nodiscard]] auto toString(NamingPolicy policy) -> std::string_view;

namespace naming {

/**
 * @brief Splits an identifier into lower-case words.
 *
 * Words are separated by `_`, `-`, spaces and case changes; a run of
 * capitals followed by a lower-case letter starts a new word before the
 * last capital (`HTTPServer` -> `http`, `server`).
 */
[[nodiscard]] auto splitWords(std::string_view name) -> std::vector<std::string>;

[[nodiscard]] auto toCamelCase(std::string_view name) -> std::string;
[[nodiscard]] auto toSnakeCase(std::string_view name) -> std::string;
[[nodiscard]] auto toKebabCase(std::string_view name) -> std::string;

/**
 * @brief Applies a policy to a declared name.
 */
[[nodiscard]] auto convert(std::string_view name, NamingPolicy policy)
    -> std::string;

/**
 * @brief Lower-cases a key and drops separators, so that `first-name`,
 * `first_name` and `firstName` compare equal.
 */
[[nodiscard]] auto normalize(std::string_view key) -> std::string;

[[nodiscard]] auto keysMatch(std::string_view lhs, std::string_view rhs)
    -> bool;

}  // namespace naming

}  // namespace yamlet

#endif  // YAMLET_SERIAL_NAMING_POLICY_HPP
