/*
 * node.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-03

Description: In-memory YAML representation (nodes and documents)

**************************************************/

#ifndef YAMLET_YAML_NODE_HPP
#define YAMLET_YAML_NODE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "yamlet/yaml/reader.hpp"
#include "yamlet/yaml/writer.hpp"

namespace yamlet {

/**
 * @brief A YAML value: null, scalar, sequence or mapping.
 *
 * Mappings keep their keys in insertion order. Equality is structural and
 * ignores presentation details (anchors, scalar and collection styles).
 */
class Node {
public:
    /**
     * @brief Enumeration of node types.
     */
    enum class Type { Null, Bool, Int, Float, String, Sequence, Mapping };

    using SequenceType = std::vector<Node>;
    using MappingType = std::vector<std::pair<std::string, Node>>;

    Node() = default;
    Node(std::nullptr_t) {}
    explicit Node(bool value);
    Node(int value);
    Node(std::int64_t value);
    Node(double value);
    Node(std::string value);
    Node(const char* value);
    Node(std::string_view value);
    explicit Node(SequenceType items);
    explicit Node(MappingType entries);

    static auto sequence() -> Node { return Node(SequenceType{}); }
    static auto mapping() -> Node { return Node(MappingType{}); }

    [[nodiscard]] auto type() const -> Type;
    [[nodiscard]] auto isNull() const -> bool { return type() == Type::Null; }
    [[nodiscard]] auto isScalar() const -> bool;
    [[nodiscard]] auto isSequence() const -> bool {
        return type() == Type::Sequence;
    }
    [[nodiscard]] auto isMapping() const -> bool {
        return type() == Type::Mapping;
    }

    [[nodiscard]] auto asBool() const -> bool;
    [[nodiscard]] auto asInt() const -> std::int64_t;

    /**
     * @brief Numeric value; Int nodes are converted.
     */
    [[nodiscard]] auto asDouble() const -> double;
    [[nodiscard]] auto asString() const -> const std::string&;
    [[nodiscard]] auto asSequence() const -> const SequenceType&;
    auto asSequence() -> SequenceType&;
    [[nodiscard]] auto asMapping() const -> const MappingType&;
    auto asMapping() -> MappingType&;

    /**
     * @brief Number of items or entries; 0 for scalars.
     */
    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto contains(std::string_view key) const -> bool;
    [[nodiscard]] auto find(std::string_view key) const -> const Node*;
    auto find(std::string_view key) -> Node*;

    /**
     * @brief Gets a value from a mapping.
     * @throws YamlException if this is not a mapping or the key is missing.
     */
    auto operator[](std::string_view key) const -> const Node&;

    /**
     * @brief Gets or inserts a value. A null node becomes a mapping.
     */
    auto operator[](std::string_view key) -> Node&;
    auto operator[](std::size_t index) const -> const Node&;
    auto operator[](std::size_t index) -> Node&;

    [[nodiscard]] auto get(std::string_view key, const Node& fallback) const
        -> Node;

    /**
     * @brief Inserts or replaces a mapping entry. A null node becomes a
     * mapping.
     * @return true if an existing entry was replaced.
     */
    auto set(std::string key, Node value) -> bool;
    auto remove(std::string_view key) -> bool;

    /**
     * @brief Appends an item. A null node becomes a sequence.
     */
    void push(Node value);

    [[nodiscard]] auto tag() const -> const std::string& { return tag_; }
    void setTag(std::string tag) { tag_ = std::move(tag); }
    [[nodiscard]] auto anchor() const -> const std::string& { return anchor_; }
    void setAnchor(std::string anchor) { anchor_ = std::move(anchor); }
    [[nodiscard]] auto style() const -> ScalarStyle { return style_; }
    void setStyle(ScalarStyle style) { style_ = style; }
    [[nodiscard]] auto collectionStyle() const -> CollectionStyle {
        return collection_style_;
    }
    void setCollectionStyle(CollectionStyle style) { collection_style_ = style; }

    /**
     * @brief Nesting depth: 0 for scalars, 1 for a flat collection.
     */
    [[nodiscard]] auto depth() const -> int;

    void writeTo(Writer& writer) const;
    [[nodiscard]] auto toYaml(const WriterOptions& options = {}) const
        -> std::string;

    friend auto operator==(const Node& lhs, const Node& rhs) -> bool;

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string,
                 SequenceType, MappingType>
        value_;
    std::string tag_;
    std::string anchor_;
    ScalarStyle style_{ScalarStyle::Any};
    CollectionStyle collection_style_{CollectionStyle::Any};
};

/**
 * @brief One document of a YAML stream.
 */
class Document {
public:
    Document() = default;
    explicit Document(Node root) : root_(std::move(root)) {}

    [[nodiscard]] auto root() const -> const Node& { return root_; }
    auto root() -> Node& { return root_; }

    [[nodiscard]] auto toYaml(const WriterOptions& options = {}) const
        -> std::string;

private:
    Node root_;
};

/**
 * @brief Builds Node trees from YAML text.
 *
 * Aliases are replaced by a copy of the anchored node. The copy counts
 * toward the reader's maximum depth.
 */
class NodeParser {
public:
    /**
     * @brief Parses the first document; empty input yields a null node.
     */
    static auto load(std::string_view text, const ReaderOptions& options = {})
        -> Node;

    static auto loadAll(std::string_view text,
                        const ReaderOptions& options = {})
        -> std::vector<Document>;

    /**
     * @brief Parses the first document of a file.
     * @throws error::FailToOpenFile if the file cannot be read.
     */
    static auto loadFile(const std::filesystem::path& path,
                         const ReaderOptions& options = {}) -> Node;

private:
    using AnchorTable = std::unordered_map<std::string, Node>;

    static auto parseDocument(Reader& reader) -> Node;
    static auto parseNode(Reader& reader, AnchorTable& anchors) -> Node;
    static auto parseScalar(const Reader& reader) -> Node;
    static void nextSignificant(Reader& reader);
};

}  // namespace yamlet

#endif  // YAMLET_YAML_NODE_HPP
