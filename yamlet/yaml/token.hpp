/*
 * token.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Token model shared by the YAML reader and writer

**************************************************/

#ifndef YAMLET_YAML_TOKEN_HPP
#define YAMLET_YAML_TOKEN_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace yamlet {

/**
 * @brief Kinds of structural tokens produced by the reader.
 */
enum class TokenType : std::uint8_t {
    None,
    StreamStart,
    StreamEnd,
    DocumentStart,
    DocumentEnd,
    MappingStart,
    MappingEnd,
    SequenceStart,
    SequenceEnd,
    Scalar,
    Alias,
    Comment
};

/**
 * @brief Textual form of a scalar.
 */
enum class ScalarStyle : std::uint8_t {
    Any,  ///< Let the writer choose
    Plain,
    SingleQuoted,
    DoubleQuoted,
    Literal,  ///< `|` block scalar
    Folded    ///< `>` block scalar
};

enum class CollectionStyle : std::uint8_t { Any, Block, Flow };

/**
 * @brief Trailing line break handling of block scalars.
 */
enum class Chomping : std::uint8_t {
    Clip,   ///< Keep a single trailing newline
    Strip,  ///< `-` remove all trailing newlines
    Keep    ///< `+` keep every trailing newline
};

/**
 * @brief Tag inferred for an untagged (or explicitly tagged) scalar.
 */
enum class ScalarTag : std::uint8_t { Null, Bool, Int, Float, String };

/**
 * @brief Position inside the input buffer. Line and column are 1-based.
 */
struct Mark {
    std::size_t offset{0};
    std::size_t line{1};
    std::size_t column{1};

    [[nodiscard]] std::string toString() const {
        return "line " + std::to_string(line) + ", column " +
               std::to_string(column) + " (offset " + std::to_string(offset) +
               ")";
    }
};

/**
 * @brief One structural token.
 *
 * `value` holds the scalar text, the alias target or the comment text.
 * `anchor` and `tag` are the node properties attached to scalars and
 * collection starts.
 */
struct Token {
    TokenType type{TokenType::None};
    std::string value;
    std::string anchor;
    std::string tag;
    ScalarStyle style{ScalarStyle::Any};
    ScalarTag scalarTag{ScalarTag::String};
    CollectionStyle collectionStyle{CollectionStyle::Any};
    Mark mark;
};

[[nodiscard]] auto toString(TokenType type) -> const char*;
[[nodiscard]] auto toString(ScalarTag tag) -> const char*;

}  // namespace yamlet

#endif  // YAMLET_YAML_TOKEN_HPP
