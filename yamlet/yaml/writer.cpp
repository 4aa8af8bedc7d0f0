/*
 * writer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: YAML emitter with scalar style selection

**************************************************/

#include "writer.hpp"

#include <array>
#include <utility>

#include <spdlog/spdlog.h>

#include "yamlet/error/exception.hpp"
#include "yamlet/yaml/errors.hpp"

namespace yamlet {

namespace {

auto coreTagName(ScalarTag tag) -> const char* {
    switch (tag) {
        case ScalarTag::Null:
            return "!!null";
        case ScalarTag::Bool:
            return "!!bool";
        case ScalarTag::Int:
            return "!!int";
        case ScalarTag::Float:
            return "!!float";
        case ScalarTag::String:
            break;
    }
    return "!!str";
}

auto isControl(char c) -> bool {
    auto byte = static_cast<unsigned char>(c);
    return byte < 0x20 || byte == 0x7F;
}

auto isBlank(char c) -> bool { return c == ' ' || c == '\t'; }

auto isFlowIndicator(char c) -> bool {
    return c == ',' || c == '[' || c == ']' || c == '{' || c == '}';
}

auto isPlainSafe(std::string_view text, bool flow) -> bool {
    if (text.empty() || isBlank(text.front()) || isBlank(text.back())) {
        return false;
    }
    constexpr std::string_view kIndicators = ",[]{}#&*!|>'\"%@`";
    char first = text.front();
    if (kIndicators.find(first) != std::string_view::npos) {
        return false;
    }
    if ((first == '-' || first == '?' || first == ':') &&
        (text.size() == 1 || isBlank(text[1]))) {
        return false;
    }
    if (text.starts_with("---") || text.starts_with("...")) {
        return false;
    }
    if (text.back() == ':') {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (isControl(c)) {
            return false;
        }
        if (flow && isFlowIndicator(c)) {
            return false;
        }
        if (c == ':' && i + 1 < text.size() &&
            (isBlank(text[i + 1]) || (flow && isFlowIndicator(text[i + 1])))) {
            return false;
        }
        if (c == '#' && i > 0 && isBlank(text[i - 1])) {
            return false;
        }
    }
    return true;
}

auto fitsSingleQuoted(std::string_view text) -> bool {
    for (char c : text) {
        if (isControl(c) && c != '\t') {
            return false;
        }
    }
    return true;
}

auto fitsLiteral(std::string_view text) -> bool {
    if (text.empty() || isBlank(text.front()) || text.front() == '\n') {
        return false;
    }
    for (char c : text) {
        if (isControl(c) && c != '\n' && c != '\t') {
            return false;
        }
    }
    return true;
}

auto fitsFolded(std::string_view text) -> bool {
    if (!fitsLiteral(text)) {
        return false;
    }
    for (std::size_t i = 0; i + 1 < text.size(); ++i) {
        if (text[i] == '\n' && isBlank(text[i + 1])) {
            return false;
        }
    }
    return true;
}

auto splitLines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (true) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

void appendDoubleQuoted(std::string& out, std::string_view text) {
    constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5',
                                           '6', '7', '8', '9', 'A', 'B',
                                           'C', 'D', 'E', 'F'};
    out += '"';
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\0':
                out += "\\0";
                break;
            default:
                if (isControl(c)) {
                    auto byte = static_cast<unsigned char>(c);
                    out += "\\x";
                    out += kHex[byte >> 4];
                    out += kHex[byte & 0x0F];
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

}  // namespace

Writer::Writer(WriterOptions options)
    : options_(options),
      schema_(options.schema != nullptr ? options.schema
                                        : &CoreSchema::instance()) {
    if (options_.indentSize < 1 || options_.indentSize > 10) {
        THROW_INVALID_CONFIGURATION("indentSize", "must be within 1..10, got ",
                                    options_.indentSize);
    }
}

void Writer::writeStreamStart() {
    if (streamStarted_) {
        THROW_LOGIC_ERROR("The stream has already been started");
    }
    streamStarted_ = true;
    if (options_.emitYamlDirective) {
        out_ += "%YAML 1.2\n";
    }
}

void Writer::writeStreamEnd() {
    if (inDocument_) {
        writeDocumentEnd();
    }
}

void Writer::writeDocumentStart() {
    if (!streamStarted_) {
        writeStreamStart();
    }
    if (inDocument_) {
        THROW_LOGIC_ERROR("A document is already open");
    }
    if (options_.emitDocumentMarkers || options_.emitYamlDirective ||
        documents_ > 0) {
        newline();
        out_ += "---\n";
    }
    inDocument_ = true;
    rootWritten_ = false;
    ++documents_;
}

void Writer::writeDocumentEnd() {
    if (!inDocument_) {
        THROW_LOGIC_ERROR("No document is open");
    }
    if (!stack_.empty()) {
        THROW_LOGIC_ERROR("Cannot end a document with ", stack_.size(),
                          " open collection(s)");
    }
    newline();
    if (options_.emitDocumentMarkers) {
        out_ += "...\n";
    }
    inDocument_ = false;
}

void Writer::writeMappingStart(CollectionStyle style) {
    startCollection(true, style);
}

void Writer::writeMappingEnd() { endCollection(true); }

void Writer::writeSequenceStart(CollectionStyle style) {
    startCollection(false, style);
}

void Writer::writeSequenceEnd() { endCollection(false); }

void Writer::writePropertyName(std::string_view name, ScalarStyle style) {
    if (stack_.empty() || (stack_.back().kind != Kind::BlockMapping &&
                           stack_.back().kind != Kind::FlowMapping)) {
        THROW_LOGIC_ERROR("A property name can only be written inside a mapping");
    }
    if (stack_.back().expectValue) {
        THROW_LOGIC_ERROR("Property '", name,
                          "' written while the previous value is missing");
    }
    ScalarStyle resolved = chooseStyle(name, style, true);
    std::string props = takeProperties();
    Context& ctx = stack_.back();
    if (ctx.kind == Kind::BlockMapping) {
        if (ctx.count == 0 && ctx.inlineFirst) {
            out_ += ' ';
        } else {
            newline();
            out_.append(static_cast<std::size_t>(ctx.indent), ' ');
        }
    } else if (ctx.count > 0) {
        out_ += ", ";
    }
    if (!props.empty()) {
        out_ += props;
        out_ += ' ';
    }
    emitScalarText(name, resolved, 0);
    out_ += ctx.kind == Kind::BlockMapping ? ":" : ": ";
    ctx.expectValue = true;
    ++ctx.count;
}

void Writer::writeNull() {
    if (!stack_.empty() && !inFlow() &&
        schema_->tagFor("") == ScalarTag::Null) {
        beginNode(true);
        return;
    }
    writeTypedScalar("null", ScalarTag::Null);
}

void Writer::writeBool(bool value) {
    writeTypedScalar(value ? "true" : "false", ScalarTag::Bool);
}

void Writer::writeInt(std::int64_t value) {
    writeTypedScalar(schema::formatInt64(value), ScalarTag::Int);
}

void Writer::writeUInt(std::uint64_t value) {
    writeTypedScalar(schema::formatUInt64(value), ScalarTag::Int);
}

void Writer::writeDouble(double value) {
    writeTypedScalar(schema::formatDouble(value), ScalarTag::Float);
}

void Writer::writeString(std::string_view text, ScalarStyle style) {
    writeScalar(text, chooseStyle(text, style, false));
}

void Writer::writeAnchor(std::string_view name) {
    if (name.empty()) {
        THROW_INVALID_ARGUMENT("Anchor names cannot be empty");
    }
    pendingAnchor_ = name;
}

void Writer::writeTag(std::string_view tag) {
    if (tag.empty()) {
        THROW_INVALID_ARGUMENT("Tags cannot be empty");
    }
    pendingTag_ = tag;
}

void Writer::writeAlias(std::string_view name) {
    if (!pendingAnchor_.empty() || !pendingTag_.empty()) {
        THROW_LOGIC_ERROR("An alias cannot carry an anchor or a tag");
    }
    beginNode(false);
    out_ += '*';
    out_ += name;
}

void Writer::writeComment(std::string_view text) {
    if (!options_.writeComments) {
        spdlog::warn("yaml writer: comment dropped, comment output is disabled");
        return;
    }
    if (inFlow()) {
        THROW_LOGIC_ERROR("Comments cannot be written inside a flow collection");
    }
    if (!stack_.empty() && stack_.back().expectValue) {
        THROW_LOGIC_ERROR("A comment cannot separate a key from its value");
    }
    ensureDocument();
    int indent = stack_.empty() ? 0 : stack_.back().indent;
    for (auto line : splitLines(text)) {
        newline();
        out_.append(static_cast<std::size_t>(indent), ' ');
        out_ += '#';
        if (!line.empty()) {
            out_ += ' ';
            out_ += line;
        }
        out_ += '\n';
    }
    if (!stack_.empty()) {
        stack_.back().inlineFirst = false;
    }
}

auto Writer::take() -> std::string {
    std::string result = std::move(out_);
    reset();
    return result;
}

void Writer::reset() {
    out_.clear();
    stack_.clear();
    pendingAnchor_.clear();
    pendingTag_.clear();
    streamStarted_ = false;
    inDocument_ = false;
    rootWritten_ = false;
    documents_ = 0;
}

auto Writer::chooseStyle(std::string_view text, ScalarStyle requested,
                         bool isKey) const -> ScalarStyle {
    bool flow = inFlow();
    bool blockAllowed = !isKey && !flow;
    ScalarStyle style =
        requested == ScalarStyle::Any ? options_.defaultScalarStyle : requested;
    switch (style) {
        case ScalarStyle::Literal:
            if (blockAllowed && fitsLiteral(text)) {
                return ScalarStyle::Literal;
            }
            break;
        case ScalarStyle::Folded:
            if (blockAllowed && fitsFolded(text)) {
                return ScalarStyle::Folded;
            }
            if (blockAllowed && fitsLiteral(text)) {
                return ScalarStyle::Literal;
            }
            break;
        case ScalarStyle::SingleQuoted:
            return fitsSingleQuoted(text) ? ScalarStyle::SingleQuoted
                                          : ScalarStyle::DoubleQuoted;
        case ScalarStyle::DoubleQuoted:
            return ScalarStyle::DoubleQuoted;
        default:
            break;
    }
    if (isPlainSafe(text, flow) &&
        (requested == ScalarStyle::Plain ||
         schema_->tagFor(text) == ScalarTag::String)) {
        return ScalarStyle::Plain;
    }
    if (text.find('\n') == std::string_view::npos && fitsSingleQuoted(text)) {
        return ScalarStyle::SingleQuoted;
    }
    if (blockAllowed && fitsLiteral(text)) {
        return ScalarStyle::Literal;
    }
    return ScalarStyle::DoubleQuoted;
}

auto Writer::inFlow() const -> bool {
    return !stack_.empty() && (stack_.back().kind == Kind::FlowMapping ||
                               stack_.back().kind == Kind::FlowSequence);
}

auto Writer::childIndent(bool mapping) const -> int {
    if (stack_.empty()) {
        return 0;
    }
    const Context& parent = stack_.back();
    if (parent.kind == Kind::BlockSequence) {
        return parent.indent + 2;
    }
    if (!mapping && !options_.indentSequenceItems) {
        return parent.indent;
    }
    return parent.indent + options_.indentSize;
}

auto Writer::blockScalarIndent() const -> int {
    if (stack_.empty()) {
        return options_.indentSize;
    }
    const Context& parent = stack_.back();
    return parent.kind == Kind::BlockSequence
               ? parent.indent + 2
               : parent.indent + options_.indentSize;
}

auto Writer::takeProperties() -> std::string {
    std::string props;
    if (!pendingAnchor_.empty()) {
        props += '&';
        props += pendingAnchor_;
    }
    if (!pendingTag_.empty()) {
        if (!props.empty()) {
            props += ' ';
        }
        if (pendingTag_.front() == '!') {
            props += pendingTag_;
        } else {
            props += "!<" + pendingTag_ + ">";
        }
    }
    pendingAnchor_.clear();
    pendingTag_.clear();
    return props;
}

// Writes whatever has to precede a node in its parent context. A block node
// (block collection or empty value) gets no trailing space; anything else is
// followed directly by its text. Returns whether properties were written.
auto Writer::beginNode(bool block) -> bool {
    ensureDocument();
    std::string props = takeProperties();

    if (stack_.empty()) {
        if (rootWritten_) {
            THROW_LOGIC_ERROR("A document can only have one root node");
        }
        rootWritten_ = true;
        if (!props.empty()) {
            out_ += props;
            if (!block) {
                out_ += ' ';
            }
        }
        return !props.empty();
    }

    Context& parent = stack_.back();
    switch (parent.kind) {
        case Kind::BlockMapping:
            if (!parent.expectValue) {
                THROW_LOGIC_ERROR("A mapping value needs a property name first");
            }
            parent.expectValue = false;
            if (!props.empty()) {
                out_ += ' ';
                out_ += props;
            }
            if (!block) {
                out_ += ' ';
            }
            break;
        case Kind::BlockSequence:
            if (parent.count == 0 && parent.inlineFirst) {
                out_ += ' ';
            } else {
                newline();
                out_.append(static_cast<std::size_t>(parent.indent), ' ');
            }
            out_ += '-';
            if (!props.empty()) {
                out_ += ' ';
                out_ += props;
            }
            if (!block) {
                out_ += ' ';
            }
            ++parent.count;
            break;
        case Kind::FlowSequence:
            if (parent.count > 0) {
                out_ += ", ";
            }
            if (!props.empty()) {
                out_ += props;
                out_ += ' ';
            }
            ++parent.count;
            break;
        case Kind::FlowMapping:
            if (!parent.expectValue) {
                THROW_LOGIC_ERROR("A mapping value needs a property name first");
            }
            parent.expectValue = false;
            if (!props.empty()) {
                out_ += props;
                out_ += ' ';
            }
            break;
    }
    return !props.empty();
}

void Writer::ensureDocument() {
    if (!inDocument_) {
        writeDocumentStart();
    }
}

void Writer::newline() {
    if (!out_.empty() && out_.back() != '\n') {
        out_ += '\n';
    }
}

void Writer::startCollection(bool mapping, CollectionStyle style) {
    bool flow = inFlow() || style == CollectionStyle::Flow ||
                (style == CollectionStyle::Any && options_.preferFlowStyle);
    if (flow) {
        beginNode(false);
        out_ += mapping ? '{' : '[';
        stack_.push_back(
            Context{mapping ? Kind::FlowMapping : Kind::FlowSequence});
        return;
    }
    int indent = childIndent(mapping);
    bool hadProps = beginNode(true);
    bool inlineFirst = !hadProps && stack_.size() > 0 &&
                       stack_.back().kind == Kind::BlockSequence;
    stack_.push_back(Context{mapping ? Kind::BlockMapping : Kind::BlockSequence,
                             indent, 0, false, inlineFirst});
}

void Writer::endCollection(bool mapping) {
    if (stack_.empty()) {
        THROW_LOGIC_ERROR("No open ", mapping ? "mapping" : "sequence",
                          " to end");
    }
    Context ctx = stack_.back();
    bool isMapping =
        ctx.kind == Kind::BlockMapping || ctx.kind == Kind::FlowMapping;
    if (isMapping != mapping) {
        THROW_LOGIC_ERROR("Cannot end a ", mapping ? "mapping" : "sequence",
                          " while a ", isMapping ? "mapping" : "sequence",
                          " is open");
    }
    if (ctx.expectValue) {
        THROW_LOGIC_ERROR("Mapping ended while a property value was expected");
    }
    stack_.pop_back();
    switch (ctx.kind) {
        case Kind::FlowMapping:
            out_ += '}';
            break;
        case Kind::FlowSequence:
            out_ += ']';
            break;
        default:
            if (ctx.count == 0) {
                if (!out_.empty() && out_.back() != '\n') {
                    out_ += ' ';
                }
                out_ += mapping ? "{}" : "[]";
            }
            break;
    }
}

void Writer::writeScalar(std::string_view text, ScalarStyle style) {
    int indent = blockScalarIndent();
    beginNode(false);
    emitScalarText(text, style, indent);
}

// A value the active schema would resolve to another type carries its tag.
void Writer::writeTypedScalar(std::string_view text, ScalarTag tag) {
    if (pendingTag_.empty() && schema_->tagFor(text) != tag) {
        pendingTag_ = coreTagName(tag);
    }
    writeScalar(text, ScalarStyle::Plain);
}

void Writer::emitScalarText(std::string_view text, ScalarStyle style,
                            int indent) {
    switch (style) {
        case ScalarStyle::SingleQuoted:
            out_ += '\'';
            for (char c : text) {
                if (c == '\'') {
                    out_ += '\'';
                }
                out_ += c;
            }
            out_ += '\'';
            return;
        case ScalarStyle::DoubleQuoted:
            appendDoubleQuoted(out_, text);
            return;
        case ScalarStyle::Literal:
        case ScalarStyle::Folded: {
            std::size_t trailing = 0;
            while (trailing < text.size() &&
                   text[text.size() - 1 - trailing] == '\n') {
                ++trailing;
            }
            auto body = text.substr(0, text.size() - trailing);
            out_ += style == ScalarStyle::Literal ? '|' : '>';
            if (trailing == 0) {
                out_ += '-';
            } else if (trailing > 1) {
                out_ += '+';
            }
            out_ += '\n';
            auto writeLine = [this, indent](std::string_view line) {
                if (!line.empty()) {
                    out_.append(static_cast<std::size_t>(indent), ' ');
                    out_ += line;
                }
                out_ += '\n';
            };
            auto lines = splitLines(body);
            for (std::size_t i = 0; i < lines.size(); ++i) {
                // A single line break folds to a space, so folded output
                // separates source lines with an empty line.
                if (style == ScalarStyle::Folded && i > 0) {
                    writeLine({});
                    if (lines[i].empty()) {
                        continue;
                    }
                }
                writeLine(lines[i]);
            }
            for (std::size_t i = 1; i < trailing; ++i) {
                out_ += '\n';
            }
            return;
        }
        default:
            out_ += text;
            return;
    }
}

}  // namespace yamlet
