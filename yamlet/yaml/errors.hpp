/*
 * errors.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Error taxonomy of the YAML engine and the serializer

**************************************************/

#ifndef YAMLET_YAML_ERRORS_HPP
#define YAMLET_YAML_ERRORS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "yamlet/error/exception.hpp"
#include "yamlet/yaml/token.hpp"

namespace yamlet {

/**
 * @brief Common base of every error raised by the engine.
 */
class YamlException : public error::Exception {
public:
    using error::Exception::Exception;
};

#define THROW_YAML_EXCEPTION(...)                                         \
    throw yamlet::YamlException(YAMLET_FILE_NAME, YAMLET_FILE_LINE,       \
                                YAMLET_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Malformed YAML. Carries the position of the offending input.
 */
class ParseError : public YamlException {
public:
    template <typename... Args>
    ParseError(const char* file, int line, const char* func, const Mark& mark,
               Args&&... args)
        : YamlException(file, line, func, std::forward<Args>(args)..., " at ",
                        mark.toString()),
          mark_(mark) {}

    [[nodiscard]] auto mark() const -> const Mark& { return mark_; }

private:
    Mark mark_;
};

#define THROW_PARSE_ERROR(mark, ...)                                   \
    throw yamlet::ParseError(YAMLET_FILE_NAME, YAMLET_FILE_LINE,       \
                             YAMLET_FUNC_NAME, mark, __VA_ARGS__)

/**
 * @brief Nesting went past the configured maximum depth.
 */
class MaxDepthExceededError : public YamlException {
public:
    MaxDepthExceededError(const char* file, int line, const char* func,
                          int maxDepth, int currentDepth,
                          std::optional<Mark> mark = std::nullopt)
        : YamlException(file, line, func, "Maximum depth of ", maxDepth,
                        " exceeded (current depth: ", currentDepth, ")",
                        mark ? " at " + mark->toString() : std::string{}),
          max_depth_(maxDepth),
          current_depth_(currentDepth),
          mark_(mark) {}

    [[nodiscard]] auto maxDepth() const -> int { return max_depth_; }
    [[nodiscard]] auto currentDepth() const -> int { return current_depth_; }
    [[nodiscard]] auto mark() const -> const std::optional<Mark>& {
        return mark_;
    }

private:
    int max_depth_;
    int current_depth_;
    std::optional<Mark> mark_;
};

#define THROW_MAX_DEPTH_EXCEEDED(...)                                      \
    throw yamlet::MaxDepthExceededError(YAMLET_FILE_NAME, YAMLET_FILE_LINE, \
                                        YAMLET_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Aliases replayed more tokens than the configured limit.
 */
class AliasExpansionExceededError : public YamlException {
public:
    AliasExpansionExceededError(const char* file, int line, const char* func,
                                std::size_t limit, std::string alias,
                                const Mark& mark)
        : YamlException(file, line, func, "Alias *", alias,
                        " expands past the limit of ", limit, " tokens at ",
                        mark.toString()),
          limit_(limit),
          alias_(std::move(alias)),
          mark_(mark) {}

    [[nodiscard]] auto limit() const -> std::size_t { return limit_; }
    [[nodiscard]] auto alias() const -> const std::string& { return alias_; }
    [[nodiscard]] auto mark() const -> const Mark& { return mark_; }

private:
    std::size_t limit_;
    std::string alias_;
    Mark mark_;
};

#define THROW_ALIAS_EXPANSION_EXCEEDED(...)                       \
    throw yamlet::AliasExpansionExceededError(                    \
        YAMLET_FILE_NAME, YAMLET_FILE_LINE, YAMLET_FUNC_NAME, __VA_ARGS__)

class MissingRequiredPropertyError : public YamlException {
public:
    MissingRequiredPropertyError(const char* file, int line, const char* func,
                                 std::string typeName, std::string property)
        : YamlException(file, line, func, "Required property '", property,
                        "' of type '", typeName, "' was not found"),
          type_name_(std::move(typeName)),
          property_(std::move(property)) {}

    [[nodiscard]] auto typeName() const -> const std::string& {
        return type_name_;
    }
    [[nodiscard]] auto property() const -> const std::string& {
        return property_;
    }

private:
    std::string type_name_;
    std::string property_;
};

#define THROW_MISSING_REQUIRED_PROPERTY(typeName, property)             \
    throw yamlet::MissingRequiredPropertyError(                         \
        YAMLET_FILE_NAME, YAMLET_FILE_LINE, YAMLET_FUNC_NAME, typeName, \
        property)

class MissingTypeMetadataError : public YamlException {
public:
    template <typename... Args>
    MissingTypeMetadataError(const char* file, int line, const char* func,
                             std::string typeName, Args&&... args)
        : YamlException(file, line, func, "No type metadata for '", typeName,
                        "'", std::forward<Args>(args)...),
          type_name_(std::move(typeName)) {}

    [[nodiscard]] auto typeName() const -> const std::string& {
        return type_name_;
    }

private:
    std::string type_name_;
};

#define THROW_MISSING_TYPE_METADATA(...)                         \
    throw yamlet::MissingTypeMetadataError(                      \
        YAMLET_FILE_NAME, YAMLET_FILE_LINE, YAMLET_FUNC_NAME, __VA_ARGS__)

class ReferenceNotFoundError : public YamlException {
public:
    ReferenceNotFoundError(const char* file, int line, const char* func,
                           std::string id)
        : YamlException(file, line, func, "Reference '", id, "' not found"),
          id_(std::move(id)) {}

    [[nodiscard]] auto id() const -> const std::string& { return id_; }

private:
    std::string id_;
};

#define THROW_REFERENCE_NOT_FOUND(id)                                       \
    throw yamlet::ReferenceNotFoundError(YAMLET_FILE_NAME, YAMLET_FILE_LINE, \
                                         YAMLET_FUNC_NAME, id)

class ReadOnlyConfigurationError : public YamlException {
public:
    ReadOnlyConfigurationError(const char* file, int line, const char* func,
                               std::string option)
        : YamlException(file, line, func, "Cannot modify option '", option,
                        "': the options instance is read-only"),
          option_(std::move(option)) {}

    [[nodiscard]] auto option() const -> const std::string& { return option_; }

private:
    std::string option_;
};

#define THROW_READ_ONLY_CONFIGURATION(option)                           \
    throw yamlet::ReadOnlyConfigurationError(                           \
        YAMLET_FILE_NAME, YAMLET_FILE_LINE, YAMLET_FUNC_NAME, option)

class InvalidConfigurationError : public YamlException {
public:
    template <typename... Args>
    InvalidConfigurationError(const char* file, int line, const char* func,
                              std::string option, Args&&... args)
        : YamlException(file, line, func, "Invalid configuration for '",
                        option, "': ", std::forward<Args>(args)...),
          option_(std::move(option)) {}

    [[nodiscard]] auto option() const -> const std::string& { return option_; }

private:
    std::string option_;
};

#define THROW_INVALID_CONFIGURATION(...)                          \
    throw yamlet::InvalidConfigurationError(                      \
        YAMLET_FILE_NAME, YAMLET_FILE_LINE, YAMLET_FUNC_NAME, __VA_ARGS__)

}  // namespace yamlet

#endif  // YAMLET_YAML_ERRORS_HPP
