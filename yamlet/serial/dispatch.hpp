/*
 * dispatch.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Metadata driven traversal for serializing and deserializing
values through the YAML reader and writer

**************************************************/

#ifndef YAMLET_SERIAL_DISPATCH_HPP
#define YAMLET_SERIAL_DISPATCH_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "yamlet/serial/options.hpp"
#include "yamlet/serial/reference_resolver.hpp"
#include "yamlet/serial/type_info.hpp"
#include "yamlet/yaml/reader.hpp"
#include "yamlet/yaml/writer.hpp"

namespace yamlet {

/**
 * @brief Counts one level of nesting for as long as it lives.
 *
 * The constructor throws MaxDepthExceededError when the new depth is above
 * the limit; the counter is left unchanged in that case.
 */
class DepthScope {
public:
    DepthScope(int& depth, int maxDepth,
               std::optional<Mark> mark = std::nullopt);
    ~DepthScope();

    DepthScope(const DepthScope&) = delete;
    auto operator=(const DepthScope&) -> DepthScope& = delete;

private:
    int& depth_;
};

/**
 * @brief State of one serialize call.
 *
 * Walks a value through its type metadata and emits it on a Writer. The
 * context owns nothing: the writer, options, registry and reference
 * resolver belong to the caller and must outlive it. A context is used by
 * exactly one call on one thread.
 */
class WriteContext {
public:
    /**
     * @param references The pass's resolver, or nullptr when references are
     * not tracked.
     */
    WriteContext(Writer& writer, const SerializerOptions& options,
                 const TypeRegistry& registry, ReferenceResolver* references);

    [[nodiscard]] auto writer() -> Writer& { return writer_; }
    [[nodiscard]] auto options() const -> const SerializerOptions& {
        return options_;
    }
    [[nodiscard]] auto registry() const -> const TypeRegistry& {
        return registry_;
    }
    [[nodiscard]] auto depth() const -> int { return depth_; }

    /**
     * @brief Writes the content of a slot: null for an empty slot, an alias
     * or null for an object already written in this pass, else the value.
     */
    void writeSlot(const SlotOps& ops, const void* slot);

    /**
     * @brief Writes a value of exactly the given type (no holder, no
     * reference tracking).
     */
    void writeValue(std::type_index type, const void* value);

    template <typename T>
    void write(const T& value) {
        writeSlot(slotOpsFor<T>(), &value);
    }

    /**
     * @brief Enters one collection level; converters for containers call
     * this around their elements.
     */
    [[nodiscard]] auto enterScope() -> DepthScope;

private:
    void writeHeld(const SlotOps& ops, const void* value);
    void writeObject(const TypeInfo& info, const void* object,
                     const DiscriminatorMap* map, const DerivedType* derived);
    void writeDiscriminator(const DiscriminatorMap& map,
                            const DerivedType& derived);
    [[nodiscard]] auto shouldWrite(const PropertyInfo& property,
                                   const void* object) const -> bool;
    [[nodiscard]] auto isEmptyObject(const SlotOps& ops, const void* value,
                                     int depth) const -> bool;
    [[nodiscard]] auto siblingFor(std::type_index base) const
        -> const DiscriminatorMap*;

    Writer& writer_;
    const SerializerOptions& options_;
    const TypeRegistry& registry_;
    ReferenceResolver* references_;
    int depth_{0};
    const DiscriminatorMap* sibling_{nullptr};
};

/**
 * @brief State of one deserialize call.
 *
 * Every read starts with the reader on the first token of a node and ends
 * with the reader on the node's last token.
 */
class ReadContext {
public:
    ReadContext(Reader& reader, const SerializerOptions& options,
                const TypeRegistry& registry, ReferenceResolver& references);

    [[nodiscard]] auto reader() -> Reader& { return reader_; }
    [[nodiscard]] auto options() const -> const SerializerOptions& {
        return options_;
    }
    [[nodiscard]] auto registry() const -> const TypeRegistry& {
        return registry_;
    }
    [[nodiscard]] auto depth() const -> int { return depth_; }

    /**
     * @brief Moves to the next token that is not a comment.
     * @throws ParseError at the end of the stream.
     */
    void next();

    /**
     * @brief Reads the current node into a slot, resolving aliases and
     * polymorphic types.
     */
    void readSlot(const SlotOps& ops, void* slot);

    /**
     * @brief Reads the current node into a default-constructed value of
     * exactly the given type.
     */
    void readValue(std::type_index type, void* value,
                   std::string_view discriminatorKey = {});

    template <typename T>
    void read(T& value) {
        readSlot(slotOpsFor<T>(), &value);
    }

    [[nodiscard]] auto enterScope() -> DepthScope;

    /**
     * @brief Text of the current scalar.
     * @throws ParseError if the current token is not a scalar.
     */
    auto expectScalar(std::string_view typeName) -> const std::string&;

private:
    void readAlias(const SlotOps& ops, void* slot);
    void readShared(const SlotOps& ops, void* slot);
    void readObject(const TypeInfo& info, void* object,
                    std::string_view discriminatorKey);
    void rememberTokens(const std::string& anchor);
    auto lookAhead(const std::vector<std::string>& keys)
        -> std::vector<std::optional<std::string>>;

    Reader& reader_;
    const SerializerOptions& options_;
    const TypeRegistry& registry_;
    ReferenceResolver& references_;
    int depth_{0};
    const DerivedType* forced_{nullptr};

    // Tokens of anchored nodes that are not shared objects; an alias to
    // them is read again from the recorded tokens.
    std::unordered_map<std::string, std::vector<Token>> anchor_tokens_;
    std::size_t replayed_{0};
};

}  // namespace yamlet

#endif  // YAMLET_SERIAL_DISPATCH_HPP
