/*
 * writer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: YAML emitter with scalar style selection

**************************************************/

#ifndef YAMLET_YAML_WRITER_HPP
#define YAMLET_YAML_WRITER_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "yamlet/yaml/schema.hpp"
#include "yamlet/yaml/token.hpp"

namespace yamlet {

/**
 * @brief Options for the YAML writer.
 */
struct WriterOptions {
    int indentSize{2};
    bool preferFlowStyle{false};
    bool indentSequenceItems{true};  ///< Indent `- ` entries below their key
    ScalarStyle defaultScalarStyle{ScalarStyle::Any};
    bool writeComments{false};
    bool emitDocumentMarkers{false};  ///< Write `---` and `...` markers
    bool emitYamlDirective{false};    ///< Write `%YAML 1.2` before the first document
    const Schema* schema{nullptr};    ///< Quoting decisions, CoreSchema if null
};

/**
 * @brief Forward-only YAML emitter.
 *
 * The caller describes the document with start/end and scalar calls; the
 * writer keeps a stack of open collections and takes care of indentation,
 * separators and quoting. Empty collections are always written in flow form
 * (`[]` / `{}`). A null value inside a block collection is written as an
 * empty value (`key:` or `-`).
 *
 * Calls made out of order (ending a mapping that was never started, a value
 * without a property name, ...) throw error::LogicError.
 *
 * @code
 * yamlet::Writer writer;
 * writer.writeMappingStart();
 * writer.writePropertyName("name");
 * writer.writeString("Rex");
 * writer.writeMappingEnd();
 * writer.writeDocumentEnd();
 * // writer.str() == "name: Rex\n"
 * @endcode
 */
class Writer {
public:
    explicit Writer(WriterOptions options = {});

    void writeStreamStart();
    void writeStreamEnd();
    void writeDocumentStart();
    void writeDocumentEnd();

    void writeMappingStart(CollectionStyle style = CollectionStyle::Any);
    void writeMappingEnd();
    void writeSequenceStart(CollectionStyle style = CollectionStyle::Any);
    void writeSequenceEnd();

    /**
     * @brief Writes a mapping key. An explicit Plain style writes the key
     * unquoted whenever that is syntactically safe, even if the schema would
     * resolve it to another tag (used for integer keys).
     */
    void writePropertyName(std::string_view name,
                           ScalarStyle style = ScalarStyle::Any);

    void writeNull();
    void writeBool(bool value);
    void writeInt(std::int64_t value);
    void writeUInt(std::uint64_t value);
    void writeDouble(double value);
    void writeString(std::string_view text, ScalarStyle style = ScalarStyle::Any);

    /**
     * @brief Attaches an anchor to the next node.
     */
    void writeAnchor(std::string_view name);

    /**
     * @brief Attaches a tag to the next node.
     */
    void writeTag(std::string_view tag);
    void writeAlias(std::string_view name);
    void writeComment(std::string_view text);

    [[nodiscard]] auto str() const -> const std::string& { return out_; }
    auto take() -> std::string;
    [[nodiscard]] auto depth() const -> int {
        return static_cast<int>(stack_.size());
    }
    [[nodiscard]] auto options() const -> const WriterOptions& {
        return options_;
    }
    void reset();

    /**
     * @brief Style the writer would use for text in the current context.
     */
    [[nodiscard]] auto chooseStyle(std::string_view text, ScalarStyle requested,
                                   bool isKey) const -> ScalarStyle;

private:
    enum class Kind { BlockMapping, BlockSequence, FlowMapping, FlowSequence };

    struct Context {
        Kind kind;
        int indent{0};
        std::size_t count{0};
        bool expectValue{false};
        bool inlineFirst{false};
    };

    [[nodiscard]] auto inFlow() const -> bool;
    [[nodiscard]] auto childIndent(bool mapping) const -> int;
    [[nodiscard]] auto blockScalarIndent() const -> int;
    auto takeProperties() -> std::string;
    auto beginNode(bool block) -> bool;
    void ensureDocument();
    void newline();
    void startCollection(bool mapping, CollectionStyle style);
    void endCollection(bool mapping);
    void writeScalar(std::string_view text, ScalarStyle style);
    void writeTypedScalar(std::string_view text, ScalarTag tag);
    void emitScalarText(std::string_view text, ScalarStyle style, int indent);

    WriterOptions options_;
    const Schema* schema_;
    std::string out_;
    std::vector<Context> stack_;
    std::string pendingAnchor_;
    std::string pendingTag_;
    bool streamStarted_{false};
    bool inDocument_{false};
    bool rootWritten_{false};
    int documents_{0};
};

}  // namespace yamlet

#endif  // YAMLET_YAML_WRITER_HPP
