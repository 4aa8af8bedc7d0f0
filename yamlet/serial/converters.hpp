/*
 * converters.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Built-in converters for scalars, enums, sequences and maps

**************************************************/

#ifndef YAMLET_SERIAL_CONVERTERS_HPP
#define YAMLET_SERIAL_CONVERTERS_HPP

#include <algorithm>
#include <cctype>
#include <concepts>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "yamlet/serial/dispatch.hpp"
#include "yamlet/serial/type_info.hpp"
#include "yamlet/yaml/errors.hpp"
#include "yamlet/yaml/schema.hpp"

namespace yamlet {

template <typename T>
concept ScalarType =
    std::is_arithmetic_v<T> || std::is_same_v<T, std::string>;

template <typename C>
concept SequenceContainer =
    !std::is_same_v<C, std::string> && requires(C container) {
        typename C::value_type;
        container.begin();
        container.end();
        container.clear();
    } && !requires { typename C::mapped_type; };

template <typename M>
concept MapContainer = requires(M map) {
    typename M::key_type;
    typename M::mapped_type;
    map.insert_or_assign(std::declval<typename M::key_type>(),
                         std::declval<typename M::mapped_type>());
};

namespace detail {

inline auto equalsIgnoreCase(std::string_view lhs, std::string_view rhs)
    -> bool {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

}  // namespace detail

/**
 * @brief Converter for bool, integers, floating point numbers and strings.
 *
 * Integers are range checked against T; a value that does not fit is a
 * ParseError, never a silent truncation.
 */
template <ScalarType T>
class ScalarConverter final : public Converter {
public:
    void write(WriteContext& context, const void* value) const override {
        const T& v = *static_cast<const T*>(value);
        Writer& writer = context.writer();
        if constexpr (std::is_same_v<T, bool>) {
            writer.writeBool(v);
        } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
            writer.writeInt(static_cast<std::int64_t>(v));
        } else if constexpr (std::is_integral_v<T>) {
            writer.writeUInt(static_cast<std::uint64_t>(v));
        } else if constexpr (std::is_floating_point_v<T>) {
            writer.writeDouble(static_cast<double>(v));
        } else {
            writer.writeString(v);
        }
    }

    void read(ReadContext& context, void* value) const override {
        const std::string& text = context.expectScalar(demangle(typeid(T)));
        *static_cast<T*>(value) = parse(text, context.reader().mark());
    }

    [[nodiscard]] auto formatKey(const void* value) const
        -> std::string override {
        const T& v = *static_cast<const T*>(value);
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
            return schema::formatInt64(static_cast<std::int64_t>(v));
        } else if constexpr (std::is_integral_v<T>) {
            return schema::formatUInt64(static_cast<std::uint64_t>(v));
        } else if constexpr (std::is_floating_point_v<T>) {
            return schema::formatDouble(static_cast<double>(v));
        } else {
            return v;
        }
    }

    void parseKey(std::string_view text, void* value,
                  const Mark& mark) const override {
        *static_cast<T*>(value) = parse(text, mark);
    }

    [[nodiscard]] auto keyStyle() const -> ScalarStyle override {
        return std::is_same_v<T, std::string> ? ScalarStyle::Any
                                              : ScalarStyle::Plain;
    }

private:
    static auto parse(std::string_view text, const Mark& mark) -> T {
        if constexpr (std::is_same_v<T, std::string>) {
            return std::string(text);
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto parsed = schema::parseBool(text)) {
                return *parsed;
            }
        } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
            auto parsed = schema::parseInt64(text);
            if (parsed && *parsed >= std::numeric_limits<T>::min() &&
                *parsed <= std::numeric_limits<T>::max()) {
                return static_cast<T>(*parsed);
            }
        } else if constexpr (std::is_integral_v<T>) {
            auto parsed = schema::parseUInt64(text);
            if (parsed && *parsed <= std::numeric_limits<T>::max()) {
                return static_cast<T>(*parsed);
            }
        } else {
            if (auto parsed = schema::parseDouble(text)) {
                return static_cast<T>(*parsed);
            }
        }
        THROW_PARSE_ERROR(mark, "Cannot convert '", text, "' to ",
                          demangle(typeid(T)));
    }
};

/**
 * @brief Converter writing enumerators by name.
 *
 * Reading accepts the exact name, then a case-insensitive name, then the
 * numeric value of a registered enumerator. Only registered enumerators
 * can be written.
 */
template <typename E>
    requires std::is_enum_v<E>
class EnumConverter final : public Converter {
public:
    explicit EnumConverter(std::vector<std::pair<E, std::string>> names)
        : names_(std::move(names)) {}

    void write(WriteContext& context, const void* value) const override {
        context.writer().writeString(nameFor(*static_cast<const E*>(value)));
    }

    void read(ReadContext& context, void* value) const override {
        const std::string& text = context.expectScalar(demangle(typeid(E)));
        *static_cast<E*>(value) = parse(text, context.reader().mark());
    }

    [[nodiscard]] auto formatKey(const void* value) const
        -> std::string override {
        return nameFor(*static_cast<const E*>(value));
    }

    void parseKey(std::string_view text, void* value,
                  const Mark& mark) const override {
        *static_cast<E*>(value) = parse(text, mark);
    }

private:
    [[nodiscard]] auto nameFor(E value) const -> const std::string& {
        for (const auto& [enumerator, name] : names_) {
            if (enumerator == value) {
                return name;
            }
        }
        THROW_INVALID_ARGUMENT("Value ", static_cast<std::int64_t>(value),
                               " of enum ", demangle(typeid(E)),
                               " has no registered name");
    }

    [[nodiscard]] auto parse(std::string_view text, const Mark& mark) const
        -> E {
        for (const auto& [enumerator, name] : names_) {
            if (name == text) {
                return enumerator;
            }
        }
        for (const auto& [enumerator, name] : names_) {
            if (detail::equalsIgnoreCase(name, text)) {
                return enumerator;
            }
        }
        if (auto number = schema::parseInt64(text)) {
            for (const auto& [enumerator, name] : names_) {
                if (static_cast<std::int64_t>(enumerator) == *number) {
                    return enumerator;
                }
            }
        }
        THROW_PARSE_ERROR(mark, "Unknown value '", text, "' for enum ",
                          demangle(typeid(E)));
    }

    std::vector<std::pair<E, std::string>> names_;
};

/**
 * @brief Converter for sequence containers (vector, deque, list, set).
 */
template <SequenceContainer C>
class SequenceConverter final : public Converter {
    using Element = typename C::value_type;
    static_assert(!std::is_same_v<C, std::vector<bool>>,
                  "std::vector<bool> is not supported, use std::deque<bool>");

public:
    void write(WriteContext& context, const void* value) const override {
        const auto& container = *static_cast<const C*>(value);
        const SlotOps& ops = slotOpsFor<Element>();
        auto scope = context.enterScope();
        context.writer().writeSequenceStart();
        for (const auto& element : container) {
            context.writeSlot(ops, &element);
        }
        context.writer().writeSequenceEnd();
    }

    void read(ReadContext& context, void* value) const override {
        auto& container = *static_cast<C*>(value);
        Reader& reader = context.reader();
        if (reader.tokenType() != TokenType::SequenceStart) {
            THROW_PARSE_ERROR(reader.mark(), "Expected a sequence for '",
                              demangle(typeid(C)), "', found ",
                              toString(reader.tokenType()));
        }
        const SlotOps& ops = slotOpsFor<Element>();
        auto scope = context.enterScope();
        container.clear();
        while (true) {
            context.next();
            if (reader.tokenType() == TokenType::SequenceEnd) {
                break;
            }
            Element element{};
            context.readSlot(ops, &element);
            if constexpr (requires { container.push_back(std::move(element)); }) {
                container.push_back(std::move(element));
            } else {
                container.insert(std::move(element));
            }
        }
    }

    [[nodiscard]] auto isCollection() const -> bool override { return true; }
};

/**
 * @brief Converter for std::map and std::unordered_map.
 *
 * Keys go through the converter registered for the key type. Unordered maps
 * are written sorted by key text so that the output is stable.
 */
template <MapContainer M>
class MapConverter final : public Converter {
    using Key = typename M::key_type;
    using Mapped = typename M::mapped_type;

public:
    void write(WriteContext& context, const void* value) const override {
        const auto& map = *static_cast<const M*>(value);
        const Converter& keys = keyConverter(context.registry());
        const SlotOps& ops = slotOpsFor<Mapped>();
        Writer& writer = context.writer();
        auto scope = context.enterScope();

        std::vector<std::pair<std::string, const Mapped*>> entries;
        entries.reserve(map.size());
        for (const auto& [key, mapped] : map) {
            entries.emplace_back(keys.formatKey(&key), &mapped);
        }
        if constexpr (requires { typename M::hasher; }) {
            std::sort(entries.begin(), entries.end(),
                      [](const auto& lhs, const auto& rhs) {
                          return lhs.first < rhs.first;
                      });
        }

        writer.writeMappingStart();
        for (const auto& [key, mapped] : entries) {
            writer.writePropertyName(key, keys.keyStyle());
            context.writeSlot(ops, mapped);
        }
        writer.writeMappingEnd();
    }

    void read(ReadContext& context, void* value) const override {
        auto& map = *static_cast<M*>(value);
        Reader& reader = context.reader();
        if (reader.tokenType() != TokenType::MappingStart) {
            THROW_PARSE_ERROR(reader.mark(), "Expected a mapping for '",
                              demangle(typeid(M)), "', found ",
                              toString(reader.tokenType()));
        }
        const Converter& keys = keyConverter(context.registry());
        const SlotOps& ops = slotOpsFor<Mapped>();
        auto scope = context.enterScope();
        map.clear();
        while (true) {
            context.next();
            if (reader.tokenType() == TokenType::MappingEnd) {
                break;
            }
            const std::string text = context.expectScalar(demangle(typeid(Key)));
            Key key{};
            keys.parseKey(text, &key, reader.mark());
            context.next();
            Mapped mapped{};
            context.readSlot(ops, &mapped);
            auto [it, inserted] =
                map.insert_or_assign(std::move(key), std::move(mapped));
            if (!inserted) {
                spdlog::warn(
                    "serializer: duplicate key '{}' overwrites the previous "
                    "value",
                    text);
            }
        }
    }

    [[nodiscard]] auto isCollection() const -> bool override { return true; }

private:
    static auto keyConverter(const TypeRegistry& registry) -> const Converter& {
        const Converter* converter = registry.get<Key>().converter();
        if (converter == nullptr) {
            THROW_MISSING_TYPE_METADATA(demangle(typeid(Key)),
                                        ": objects cannot be mapping keys");
        }
        return *converter;
    }
};

}  // namespace yamlet

#endif  // YAMLET_SERIAL_CONVERTERS_HPP
