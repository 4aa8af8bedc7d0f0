/*
 * node.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-03

Description: In-memory YAML representation (nodes and documents)

**************************************************/

#include "node.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "yamlet/error/exception.hpp"
#include "yamlet/yaml/errors.hpp"

namespace yamlet {

Node::Node(bool value) : value_(value) {}
Node::Node(int value) : value_(static_cast<std::int64_t>(value)) {}
Node::Node(std::int64_t value) : value_(value) {}
Node::Node(double value) : value_(value) {}
Node::Node(std::string value) : value_(std::move(value)) {}
Node::Node(const char* value) : value_(std::string(value)) {}
Node::Node(std::string_view value) : value_(std::string(value)) {}
Node::Node(SequenceType items) : value_(std::move(items)) {}
Node::Node(MappingType entries) : value_(std::move(entries)) {}

auto Node::type() const -> Type {
    return static_cast<Type>(value_.index());
}

auto Node::isScalar() const -> bool {
    auto kind = type();
    return kind != Type::Sequence && kind != Type::Mapping;
}

auto Node::asBool() const -> bool {
    if (type() != Type::Bool) {
        THROW_YAML_EXCEPTION("Not a boolean");
    }
    return std::get<bool>(value_);
}

auto Node::asInt() const -> std::int64_t {
    if (type() != Type::Int) {
        THROW_YAML_EXCEPTION("Not an integer");
    }
    return std::get<std::int64_t>(value_);
}

auto Node::asDouble() const -> double {
    if (type() == Type::Int) {
        return static_cast<double>(std::get<std::int64_t>(value_));
    }
    if (type() != Type::Float) {
        THROW_YAML_EXCEPTION("Not a number");
    }
    return std::get<double>(value_);
}

auto Node::asString() const -> const std::string& {
    if (type() != Type::String) {
        THROW_YAML_EXCEPTION("Not a string");
    }
    return std::get<std::string>(value_);
}

auto Node::asSequence() const -> const SequenceType& {
    if (type() != Type::Sequence) {
        THROW_YAML_EXCEPTION("Not a sequence");
    }
    return std::get<SequenceType>(value_);
}

auto Node::asSequence() -> SequenceType& {
    if (type() != Type::Sequence) {
        THROW_YAML_EXCEPTION("Not a sequence");
    }
    return std::get<SequenceType>(value_);
}

auto Node::asMapping() const -> const MappingType& {
    if (type() != Type::Mapping) {
        THROW_YAML_EXCEPTION("Not a mapping");
    }
    return std::get<MappingType>(value_);
}

auto Node::asMapping() -> MappingType& {
    if (type() != Type::Mapping) {
        THROW_YAML_EXCEPTION("Not a mapping");
    }
    return std::get<MappingType>(value_);
}

auto Node::size() const -> std::size_t {
    if (type() == Type::Sequence) {
        return std::get<SequenceType>(value_).size();
    }
    if (type() == Type::Mapping) {
        return std::get<MappingType>(value_).size();
    }
    return 0;
}

auto Node::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

auto Node::find(std::string_view key) const -> const Node* {
    if (type() != Type::Mapping) {
        return nullptr;
    }
    for (const auto& [name, value] : std::get<MappingType>(value_)) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

auto Node::find(std::string_view key) -> Node* {
    return const_cast<Node*>(std::as_const(*this).find(key));
}

auto Node::operator[](std::string_view key) const -> const Node& {
    if (type() != Type::Mapping) {
        THROW_YAML_EXCEPTION("Not a mapping");
    }
    const Node* value = find(key);
    if (value == nullptr) {
        THROW_YAML_EXCEPTION("Key not found: ", key);
    }
    return *value;
}

auto Node::operator[](std::string_view key) -> Node& {
    if (isNull()) {
        value_ = MappingType{};
    }
    auto& entries = asMapping();
    for (auto& [name, value] : entries) {
        if (name == key) {
            return value;
        }
    }
    entries.emplace_back(std::string(key), Node());
    return entries.back().second;
}

auto Node::operator[](std::size_t index) const -> const Node& {
    const auto& items = asSequence();
    if (index >= items.size()) {
        THROW_YAML_EXCEPTION("Index out of range: ", index);
    }
    return items[index];
}

auto Node::operator[](std::size_t index) -> Node& {
    auto& items = asSequence();
    if (index >= items.size()) {
        THROW_YAML_EXCEPTION("Index out of range: ", index);
    }
    return items[index];
}

auto Node::get(std::string_view key, const Node& fallback) const -> Node {
    const Node* value = find(key);
    return value != nullptr ? *value : fallback;
}

auto Node::set(std::string key, Node value) -> bool {
    if (isNull()) {
        value_ = MappingType{};
    }
    auto& entries = asMapping();
    for (auto& entry : entries) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return true;
        }
    }
    entries.emplace_back(std::move(key), std::move(value));
    return false;
}

auto Node::remove(std::string_view key) -> bool {
    if (type() != Type::Mapping) {
        return false;
    }
    auto& entries = std::get<MappingType>(value_);
    auto it = std::find_if(entries.begin(), entries.end(),
                           [key](const auto& entry) { return entry.first == key; });
    if (it == entries.end()) {
        return false;
    }
    entries.erase(it);
    return true;
}

void Node::push(Node value) {
    if (isNull()) {
        value_ = SequenceType{};
    }
    asSequence().push_back(std::move(value));
}

auto Node::depth() const -> int {
    int deepest = 0;
    if (type() == Type::Sequence) {
        for (const auto& item : std::get<SequenceType>(value_)) {
            deepest = std::max(deepest, item.depth());
        }
        return deepest + 1;
    }
    if (type() == Type::Mapping) {
        for (const auto& [key, value] : std::get<MappingType>(value_)) {
            deepest = std::max(deepest, value.depth());
        }
        return deepest + 1;
    }
    return 0;
}

void Node::writeTo(Writer& writer) const {
    if (!anchor_.empty()) {
        writer.writeAnchor(anchor_);
    }
    if (!tag_.empty()) {
        writer.writeTag(tag_);
    }
    switch (type()) {
        case Type::Null:
            writer.writeNull();
            break;
        case Type::Bool:
            writer.writeBool(std::get<bool>(value_));
            break;
        case Type::Int:
            writer.writeInt(std::get<std::int64_t>(value_));
            break;
        case Type::Float:
            writer.writeDouble(std::get<double>(value_));
            break;
        case Type::String:
            // A plain source style is re-validated against the writer's schema.
            writer.writeString(std::get<std::string>(value_),
                               style_ == ScalarStyle::Plain ? ScalarStyle::Any
                                                            : style_);
            break;
        case Type::Sequence:
            writer.writeSequenceStart(collection_style_);
            for (const auto& item : std::get<SequenceType>(value_)) {
                item.writeTo(writer);
            }
            writer.writeSequenceEnd();
            break;
        case Type::Mapping:
            writer.writeMappingStart(collection_style_);
            for (const auto& [key, value] : std::get<MappingType>(value_)) {
                writer.writePropertyName(key);
                value.writeTo(writer);
            }
            writer.writeMappingEnd();
            break;
    }
}

auto Node::toYaml(const WriterOptions& options) const -> std::string {
    Writer writer(options);
    writer.writeDocumentStart();
    writeTo(writer);
    writer.writeDocumentEnd();
    writer.writeStreamEnd();
    return writer.take();
}

auto operator==(const Node& lhs, const Node& rhs) -> bool {
    return lhs.value_ == rhs.value_ && lhs.tag_ == rhs.tag_;
}

auto Document::toYaml(const WriterOptions& options) const -> std::string {
    return root_.toYaml(options);
}

// NodeParser

auto NodeParser::load(std::string_view text, const ReaderOptions& options)
    -> Node {
    Reader reader(text, options);
    nextSignificant(reader);
    nextSignificant(reader);
    if (reader.tokenType() == TokenType::StreamEnd) {
        return Node();
    }
    return parseDocument(reader);
}

auto NodeParser::loadAll(std::string_view text, const ReaderOptions& options)
    -> std::vector<Document> {
    Reader reader(text, options);
    std::vector<Document> documents;
    nextSignificant(reader);
    nextSignificant(reader);
    while (reader.tokenType() == TokenType::DocumentStart) {
        documents.emplace_back(parseDocument(reader));
        nextSignificant(reader);
    }
    spdlog::debug("yaml: loaded {} document(s)", documents.size());
    return documents;
}

auto NodeParser::loadFile(const std::filesystem::path& path,
                          const ReaderOptions& options) -> Node {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        THROW_FAIL_TO_OPEN_FILE("Failed to open file: ", path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return load(buffer.str(), options);
}

auto NodeParser::parseDocument(Reader& reader) -> Node {
    AnchorTable anchors;
    nextSignificant(reader);
    Node root = parseNode(reader, anchors);
    nextSignificant(reader);
    if (reader.tokenType() != TokenType::DocumentEnd) {
        THROW_PARSE_ERROR(reader.mark(), "Expected the end of the document");
    }
    return root;
}

auto NodeParser::parseNode(Reader& reader, AnchorTable& anchors) -> Node {
    std::string anchor = reader.anchor();
    Node node;
    switch (reader.tokenType()) {
        case TokenType::Alias: {
            auto it = anchors.find(reader.value());
            if (it == anchors.end()) {
                THROW_REFERENCE_NOT_FOUND(reader.value());
            }
            int depth = reader.depth() + it->second.depth();
            if (depth > reader.options().maxDepth) {
                THROW_MAX_DEPTH_EXCEEDED(reader.options().maxDepth, depth,
                                         reader.mark());
            }
            spdlog::trace("yaml: alias *{} resolved", reader.value());
            Node copy = it->second;
            copy.setAnchor({});
            return copy;
        }
        case TokenType::Scalar:
            node = parseScalar(reader);
            break;
        case TokenType::SequenceStart:
            node = Node::sequence();
            node.setTag(reader.tag());
            node.setCollectionStyle(reader.collectionStyle());
            nextSignificant(reader);
            while (reader.tokenType() != TokenType::SequenceEnd) {
                node.push(parseNode(reader, anchors));
                nextSignificant(reader);
            }
            break;
        case TokenType::MappingStart:
            node = Node::mapping();
            node.setTag(reader.tag());
            node.setCollectionStyle(reader.collectionStyle());
            nextSignificant(reader);
            while (reader.tokenType() != TokenType::MappingEnd) {
                if (reader.tokenType() != TokenType::Scalar) {
                    THROW_PARSE_ERROR(reader.mark(),
                                      "Mapping keys must be scalars");
                }
                std::string key = reader.value();
                Mark keyMark = reader.mark();
                nextSignificant(reader);
                if (node.set(key, parseNode(reader, anchors))) {
                    spdlog::warn("yaml: duplicate key '{}' at {} overwrites "
                                 "the previous value",
                                 key, keyMark.toString());
                }
                nextSignificant(reader);
            }
            break;
        default:
            THROW_PARSE_ERROR(reader.mark(), "Unexpected token ",
                              toString(reader.tokenType()));
    }
    if (!anchor.empty()) {
        node.setAnchor(anchor);
        anchors[anchor] = node;
        spdlog::trace("yaml: anchor &{} registered", anchor);
    }
    return node;
}

auto NodeParser::parseScalar(const Reader& reader) -> Node {
    const std::string& text = reader.value();
    Node node;
    switch (reader.scalarTag()) {
        case ScalarTag::Null:
            break;
        case ScalarTag::Bool: {
            auto value = schema::parseBool(text);
            if (!value) {
                THROW_PARSE_ERROR(reader.mark(), "Invalid boolean '", text, "'");
            }
            node = Node(*value);
            break;
        }
        case ScalarTag::Int: {
            if (auto value = schema::parseInt64(text)) {
                node = Node(*value);
            } else if (auto wide = schema::parseDouble(text)) {
                node = Node(*wide);
            } else {
                THROW_PARSE_ERROR(reader.mark(), "Invalid integer '", text, "'");
            }
            break;
        }
        case ScalarTag::Float: {
            auto value = schema::parseDouble(text);
            if (!value) {
                THROW_PARSE_ERROR(reader.mark(), "Invalid float '", text, "'");
            }
            node = Node(*value);
            break;
        }
        case ScalarTag::String:
            node = Node(text);
            node.setStyle(reader.scalarStyle());
            break;
    }
    node.setTag(reader.tag());
    return node;
}

void NodeParser::nextSignificant(Reader& reader) {
    do {
        if (!reader.advance()) {
            THROW_PARSE_ERROR(reader.mark(), "Unexpected end of stream");
        }
    } while (reader.tokenType() == TokenType::Comment);
}

}  // namespace yamlet
