/*
 * schema.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Scalar tag resolution (Core, JSON and Failsafe schemas)

**************************************************/

#ifndef YAMLET_YAML_SCHEMA_HPP
#define YAMLET_YAML_SCHEMA_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "yamlet/yaml/token.hpp"

namespace yamlet {

/**
 * @brief Maps the literal text of a scalar to the tag it resolves to.
 *
 * The reader uses the active schema to tag untagged plain scalars and the
 * writer uses the same schema to decide when a string has to be quoted so
 * that it reads back as a string.
 */
class Schema {
public:
    virtual ~Schema() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Tag of an untagged plain scalar.
     */
    [[nodiscard]] virtual auto tagFor(std::string_view text) const
        -> ScalarTag = 0;

    /**
     * @brief Tag of a quoted or block scalar.
     */
    [[nodiscard]] virtual auto nonPlainTagFor(std::string_view text,
                                              ScalarStyle style) const
        -> ScalarTag;
};

/**
 * @brief YAML 1.2 core schema, extended with the yes/no boolean forms.
 *
 * - `null`, `Null`, `NULL`, `~` and the empty string are Null
 * - `true`, `false`, `yes`, `no` in any letter case are Bool
 * - decimal, `0x` hexadecimal and `0o` octal integers are Int
 * - decimal/exponent floats, `.inf`, `-.inf` and `.nan` are Float
 */
class CoreSchema final : public Schema {
public:
    static auto instance() -> const CoreSchema&;

    [[nodiscard]] auto name() const -> std::string_view override;
    [[nodiscard]] auto tagFor(std::string_view text) const
        -> ScalarTag override;

private:
    CoreSchema() = default;
};

/**
 * @brief JSON schema: only `null`, `true`, `false` and JSON numbers.
 */
class JsonSchema final : public Schema {
public:
    static auto instance() -> const JsonSchema&;

    [[nodiscard]] auto name() const -> std::string_view override;
    [[nodiscard]] auto tagFor(std::string_view text) const
        -> ScalarTag override;

private:
    JsonSchema() = default;
};

/**
 * @brief Failsafe schema: every scalar is a string.
 */
class FailsafeSchema final : public Schema {
public:
    static auto instance() -> const FailsafeSchema&;

    [[nodiscard]] auto name() const -> std::string_view override;
    [[nodiscard]] auto tagFor(std::string_view text) const
        -> ScalarTag override;

private:
    FailsafeSchema() = default;
};

/**
 * @brief Shorthand for CoreSchema::instance().tagFor(text).
 */
[[nodiscard]] auto tagFor(std::string_view text) -> ScalarTag;

/**
 * @brief Resolves `!!null`, `!!bool`, `!!int`, `!!float`, `!!str` (short or
 * `tag:yaml.org,2002:` form) to a scalar tag.
 */
[[nodiscard]] auto tagFromName(std::string_view tag) -> std::optional<ScalarTag>;

namespace schema {

[[nodiscard]] auto isNull(std::string_view text) -> bool;
[[nodiscard]] auto parseBool(std::string_view text) -> std::optional<bool>;
[[nodiscard]] auto parseInt64(std::string_view text)
    -> std::optional<std::int64_t>;
[[nodiscard]] auto parseUInt64(std::string_view text)
    -> std::optional<std::uint64_t>;
[[nodiscard]] auto parseDouble(std::string_view text) -> std::optional<double>;

/**
 * @brief Shortest text that parses back to the same double and that the core
 * schema resolves to Float (`1.0` rather than `1`).
 */
[[nodiscard]] auto formatDouble(double value) -> std::string;

[[nodiscard]] auto formatInt64(std::int64_t value) -> std::string;
[[nodiscard]] auto formatUInt64(std::uint64_t value) -> std::string;

}  // namespace schema

}  // namespace yamlet

#endif  // YAMLET_YAML_SCHEMA_HPP
