/*
 * reader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Pull-style YAML reader producing a lazy token stream

**************************************************/

#include "reader.hpp"

#include <cstdint>

#include <spdlog/spdlog.h>

#include "yamlet/yaml/errors.hpp"

namespace yamlet {

namespace {

auto isBlank(char c) -> bool { return c == ' ' || c == '\t'; }

auto isFlowIndicator(char c) -> bool {
    return c == ',' || c == '[' || c == ']' || c == '{' || c == '}';
}

auto hexValue(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

void appendUtf8(std::string& out, std::uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

// CRLF and lone CR become LF.
auto normalizeLineBreaks(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '\r') {
            out += '\n';
            if (i + 1 < input.size() && input[i + 1] == '\n') {
                ++i;
            }
        } else {
            out += input[i];
        }
    }
    return out;
}

auto foldLines(const std::vector<std::string>& lines, std::size_t last)
    -> std::string {
    std::string out;
    bool first = true;
    bool previousMoreIndented = false;
    std::size_t emptyRun = 0;
    for (std::size_t i = 0; i <= last; ++i) {
        const auto& line = lines[i];
        if (line.empty()) {
            ++emptyRun;
            continue;
        }
        bool moreIndented = isBlank(line.front());
        if (first) {
            out.append(emptyRun, '\n');
        } else if (!moreIndented && !previousMoreIndented) {
            if (emptyRun == 0) {
                out += ' ';
            } else {
                out.append(emptyRun, '\n');
            }
        } else {
            out.append(emptyRun + 1, '\n');
        }
        out += line;
        first = false;
        previousMoreIndented = moreIndented;
        emptyRun = 0;
    }
    return out;
}

}  // namespace

Reader::Reader(std::string_view input, ReaderOptions options)
    : options_(options),
      schema_(options.schema != nullptr ? options.schema
                                        : &CoreSchema::instance()) {
    if (options_.maxDepth <= 0) {
        THROW_INVALID_CONFIGURATION("maxDepth", "must be positive, got ",
                                    options_.maxDepth);
    }
    if (input.find('\r') != std::string_view::npos) {
        owned_ = normalizeLineBreaks(input);
        input_ = owned_;
    } else {
        input_ = input;
    }
    if (input_.starts_with("\xEF\xBB\xBF")) {
        pos_ = 3;
        lineStart_ = 3;
    }
}

auto Reader::advance() -> bool {
    while (pending_.empty()) {
        if (phase_ == Phase::Done) {
            current_ = Token{};
            return false;
        }
        fetch();
    }
    current_ = std::move(pending_.front());
    pending_.pop_front();
    if (current_.type == TokenType::MappingStart ||
        current_.type == TokenType::SequenceStart) {
        ++depth_;
    } else if (current_.type == TokenType::MappingEnd ||
               current_.type == TokenType::SequenceEnd) {
        --depth_;
    }
    return true;
}

auto Reader::isNull() const -> bool {
    return current_.type == TokenType::Scalar &&
           current_.scalarTag == ScalarTag::Null;
}

void Reader::skip() {
    if (current_.type != TokenType::MappingStart &&
        current_.type != TokenType::SequenceStart) {
        return;
    }
    int target = depth_ - 1;
    while (depth_ > target) {
        if (!advance()) {
            THROW_PARSE_ERROR(here(), "Unexpected end of stream");
        }
    }
}

auto Reader::captureNode() -> std::vector<Token> {
    std::vector<Token> tokens;
    tokens.push_back(current_);
    if (current_.type != TokenType::MappingStart &&
        current_.type != TokenType::SequenceStart) {
        return tokens;
    }
    int target = depth_ - 1;
    while (depth_ > target) {
        if (!advance()) {
            THROW_PARSE_ERROR(here(), "Unexpected end of stream");
        }
        tokens.push_back(current_);
    }
    return tokens;
}

void Reader::rewind(std::vector<Token> tokens) {
    for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
        pending_.push_front(std::move(*it));
    }
    current_ = Token{};
}

// Character level

auto Reader::peek(std::size_t ahead) const -> char {
    return pos_ + ahead < input_.size() ? input_[pos_ + ahead] : '\0';
}

auto Reader::column() const -> int { return static_cast<int>(pos_ - lineStart_); }

auto Reader::here() const -> Mark {
    return Mark{pos_, line_, pos_ - lineStart_ + 1};
}

auto Reader::isBlankOrEnd(std::size_t ahead) const -> bool {
    if (pos_ + ahead >= input_.size()) {
        return true;
    }
    char c = input_[pos_ + ahead];
    return isBlank(c) || c == '\n';
}

auto Reader::onlyBlanksBefore() const -> bool {
    for (std::size_t i = lineStart_; i < pos_; ++i) {
        if (!isBlank(input_[i])) {
            return false;
        }
    }
    return true;
}

auto Reader::atDocumentMarker() const -> bool {
    if (column() != 0 || input_.size() - pos_ < 3) {
        return false;
    }
    auto marker = input_.substr(pos_, 3);
    return (marker == "---" || marker == "...") && isBlankOrEnd(3);
}

auto Reader::atBlockEntry() const -> bool {
    return peek() == '-' && isBlankOrEnd(1);
}

void Reader::consume(std::size_t count) {
    for (std::size_t i = 0; i < count && pos_ < input_.size(); ++i) {
        if (input_[pos_] == '\n') {
            ++line_;
            lineStart_ = pos_ + 1;
        }
        ++pos_;
    }
}

void Reader::skipBlanks() {
    while (isBlank(peek())) {
        consume();
    }
}

// Lines and comments

void Reader::consumeComment() {
    Mark mark = here();
    consume();
    std::size_t start = pos_;
    while (!atEnd() && peek() != '\n') {
        consume();
    }
    if (!options_.readComments) {
        return;
    }
    auto text = input_.substr(start, pos_ - start);
    while (!text.empty() && isBlank(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && isBlank(text.back())) {
        text.remove_suffix(1);
    }
    pushToken(TokenType::Comment, mark, std::string(text));
}

void Reader::finishLine() {
    skipBlanks();
    if (peek() == '#') {
        consumeComment();
    }
    if (atEnd()) {
        return;
    }
    if (peek() == '\n') {
        consume();
        return;
    }
    THROW_PARSE_ERROR(here(), "Unexpected content '", peek(), "' after node");
}

auto Reader::locateNextContent() -> LineInfo {
    if (!onlyBlanksBefore()) {
        finishLine();
    }
    while (true) {
        while (peek() == ' ') {
            consume();
        }
        if (peek() == '\t') {
            skipBlanks();
            if (!atEnd() && peek() != '\n' && peek() != '#') {
                THROW_PARSE_ERROR(here(),
                                  "Tabs are not allowed as indentation");
            }
        }
        if (atEnd()) {
            return LineInfo{true, false, 0};
        }
        if (peek() == '\n') {
            consume();
            continue;
        }
        if (peek() == '#') {
            consumeComment();
            continue;
        }
        return LineInfo{false, atDocumentMarker(), column()};
    }
}

void Reader::skipFlowWhitespace(const Mark& openedAt) {
    while (true) {
        if (atEnd()) {
            THROW_PARSE_ERROR(openedAt, "Unterminated flow collection");
        }
        char c = peek();
        if (isBlank(c) || c == '\n') {
            consume();
            continue;
        }
        if (c == '#') {
            consumeComment();
            continue;
        }
        if (atDocumentMarker()) {
            THROW_PARSE_ERROR(here(),
                              "Document marker inside a flow collection");
        }
        return;
    }
}

// Token emission

void Reader::pushToken(TokenType type, const Mark& mark, std::string value) {
    Token token;
    token.type = type;
    token.value = std::move(value);
    token.mark = mark;
    pending_.push_back(std::move(token));
}

void Reader::pushScalar(std::string text, ScalarStyle style,
                        const Properties& props, const Mark& mark) {
    Token token;
    token.type = TokenType::Scalar;
    token.value = std::move(text);
    token.anchor = props.anchor;
    token.tag = props.tag;
    token.style = style;
    token.mark = mark;
    if (!props.tag.empty()) {
        token.scalarTag = tagFromName(props.tag).value_or(ScalarTag::String);
    } else if (style == ScalarStyle::Plain) {
        token.scalarTag = schema_->tagFor(token.value);
    } else {
        token.scalarTag = schema_->nonPlainTagFor(token.value, style);
    }
    pending_.push_back(std::move(token));
}

void Reader::pushEmptyScalar(const Properties& props, const Mark& mark) {
    Token token;
    token.type = TokenType::Scalar;
    token.anchor = props.anchor;
    token.tag = props.tag;
    token.style = ScalarStyle::Plain;
    token.mark = mark;
    token.scalarTag =
        props.tag.empty()
            ? ScalarTag::Null
            : tagFromName(props.tag).value_or(ScalarTag::String);
    pending_.push_back(std::move(token));
}

void Reader::pushCollectionStart(TokenType type, CollectionStyle style,
                                 const Properties& props, const Mark& mark) {
    int depth = static_cast<int>(frames_.size()) + 1;
    if (depth > options_.maxDepth) {
        THROW_MAX_DEPTH_EXCEEDED(options_.maxDepth, depth, mark);
    }
    Token token;
    token.type = type;
    token.anchor = props.anchor;
    token.tag = props.tag;
    token.collectionStyle = style;
    token.mark = mark;
    pending_.push_back(std::move(token));
}

// Grammar

void Reader::fetch() {
    switch (phase_) {
        case Phase::StreamStart:
            pushToken(TokenType::StreamStart, here());
            phase_ = Phase::DocumentStart;
            return;
        case Phase::DocumentStart:
            fetchDocumentStart();
            return;
        case Phase::DocumentContent:
            if (frames_.empty()) {
                if (!rootParsed_) {
                    rootParsed_ = true;
                    parseBlockNode(-1, NodeContext::Root);
                } else {
                    fetchDocumentEnd();
                }
                return;
            }
            switch (frames_.back().kind) {
                case FrameKind::BlockMapping:
                    stepBlockMapping();
                    break;
                case FrameKind::BlockSequence:
                    stepBlockSequence();
                    break;
                case FrameKind::FlowMapping:
                    stepFlowMapping();
                    break;
                case FrameKind::FlowSequence:
                    stepFlowSequence();
                    break;
            }
            return;
        case Phase::Done:
            return;
    }
}

void Reader::fetchDocumentStart() {
    tagHandles_.clear();
    bool sawDirective = false;
    bool sawVersion = false;
    while (true) {
        LineInfo next = locateNextContent();
        if (next.eof) {
            if (sawDirective) {
                THROW_PARSE_ERROR(here(), "Directives must be followed by '---'");
            }
            pushToken(TokenType::StreamEnd, here());
            phase_ = Phase::Done;
            return;
        }
        if (next.column == 0 && peek() == '%') {
            parseDirective(sawVersion);
            sawDirective = true;
            continue;
        }
        if (next.documentMarker && peek() == '.') {
            consume(3);
            continue;
        }
        break;
    }

    Mark mark = here();
    if (atDocumentMarker()) {
        consume(3);
        pushToken(TokenType::DocumentStart, mark, "---");
    } else {
        if (sawDirective) {
            THROW_PARSE_ERROR(mark, "Directives must be followed by '---'");
        }
        pushToken(TokenType::DocumentStart, mark);
    }
    spdlog::trace("yaml reader: document start at {}", mark.toString());
    phase_ = Phase::DocumentContent;
    rootParsed_ = false;
}

void Reader::fetchDocumentEnd() {
    LineInfo next = locateNextContent();
    Mark mark = here();
    if (next.eof) {
        pushToken(TokenType::DocumentEnd, mark);
    } else if (next.documentMarker) {
        if (peek() == '.') {
            consume(3);
            pushToken(TokenType::DocumentEnd, mark, "...");
        } else {
            pushToken(TokenType::DocumentEnd, mark);
        }
    } else {
        THROW_PARSE_ERROR(mark, "Expected the end of the document but found '",
                          peek(), "'");
    }
    spdlog::trace("yaml reader: document end at {}", mark.toString());
    phase_ = Phase::DocumentStart;
}

void Reader::parseDirective(bool& sawVersion) {
    Mark mark = here();
    consume();
    auto readWord = [this]() {
        std::string word;
        while (!isBlankOrEnd(0)) {
            word += peek();
            consume();
        }
        skipBlanks();
        return word;
    };
    std::string name = readWord();
    if (name == "YAML") {
        if (sawVersion) {
            THROW_PARSE_ERROR(mark, "Duplicate %YAML directive");
        }
        sawVersion = true;
        std::string version = readWord();
        if (!version.starts_with("1.")) {
            THROW_PARSE_ERROR(mark, "Unsupported YAML version '", version, "'");
        }
    } else if (name == "TAG") {
        std::string handle = readWord();
        std::string prefix = readWord();
        if (handle.empty() || handle.front() != '!' || handle.back() != '!' ||
            prefix.empty()) {
            THROW_PARSE_ERROR(mark, "Malformed %TAG directive");
        }
        tagHandles_[handle] = prefix;
    } else {
        THROW_PARSE_ERROR(mark, "Unknown directive '%", name, "'");
    }
    finishLine();
}

void Reader::stepBlockMapping() {
    Frame& frame = frames_.back();
    int indent = frame.indent;
    if (frame.phase == FramePhase::Value) {
        frame.phase = FramePhase::Key;
        parseBlockNode(indent, NodeContext::MappingValue);
        return;
    }
    LineInfo next = locateNextContent();
    if (next.eof || next.documentMarker || next.column < indent) {
        closeCollection(here());
        return;
    }
    if (next.column > indent) {
        THROW_PARSE_ERROR(here(), "Bad indentation of a mapping entry");
    }
    parseMappingKey();
}

void Reader::stepBlockSequence() {
    Frame& frame = frames_.back();
    int indent = frame.indent;
    if (frame.firstInline) {
        frame.firstInline = false;
    } else {
        LineInfo next = locateNextContent();
        if (next.eof || next.documentMarker || next.column < indent) {
            closeCollection(here());
            return;
        }
        if (next.column > indent) {
            THROW_PARSE_ERROR(here(), "Bad indentation of a sequence entry");
        }
        // A compact sequence ends where its parent mapping resumes.
        if (!atBlockEntry()) {
            closeCollection(here());
            return;
        }
    }
    consume();
    parseBlockNode(indent, NodeContext::SequenceEntry);
}

void Reader::stepFlowSequence() {
    Frame& frame = frames_.back();
    skipFlowWhitespace(frame.mark);
    Mark mark = here();
    char c = peek();
    switch (frame.phase) {
        case FramePhase::Entry:
        case FramePhase::AfterComma:
            if (c == ']') {
                if (frame.phase == FramePhase::AfterComma &&
                    !options_.allowTrailingCommas) {
                    THROW_PARSE_ERROR(mark, "Trailing comma in flow sequence");
                }
                consume();
                closeCollection(mark);
                return;
            }
            if (c == ',') {
                THROW_PARSE_ERROR(mark, "Expected a flow sequence entry but found ','");
            }
            frame.phase = FramePhase::AfterEntry;
            parseFlowNode(false);
            return;
        default:
            if (c == ',') {
                consume();
                frame.phase = FramePhase::AfterComma;
                return;
            }
            if (c == ']') {
                consume();
                closeCollection(mark);
                return;
            }
            THROW_PARSE_ERROR(mark, "Expected ',' or ']' in flow sequence but found '",
                              c, "'");
    }
}

void Reader::stepFlowMapping() {
    Frame& frame = frames_.back();
    skipFlowWhitespace(frame.mark);
    Mark mark = here();
    char c = peek();
    switch (frame.phase) {
        case FramePhase::Key:
        case FramePhase::AfterComma:
            if (c == '}') {
                if (frame.phase == FramePhase::AfterComma &&
                    !options_.allowTrailingCommas) {
                    THROW_PARSE_ERROR(mark, "Trailing comma in flow mapping");
                }
                consume();
                closeCollection(mark);
                return;
            }
            if (c == ',') {
                THROW_PARSE_ERROR(mark, "Expected a flow mapping key but found ','");
            }
            if (c == '[' || c == '{') {
                THROW_PARSE_ERROR(mark, "Complex mapping keys are not supported");
            }
            frame.phase = FramePhase::AfterKey;
            parseFlowNode(true);
            return;
        case FramePhase::AfterKey:
            if (c == ':') {
                consume();
                frame.phase = FramePhase::Value;
                return;
            }
            if (c == ',' || c == '}') {
                frame.phase = FramePhase::AfterValue;
                pushEmptyScalar({}, mark);
                return;
            }
            THROW_PARSE_ERROR(mark, "Expected ':' after flow mapping key");
        case FramePhase::Value:
            frame.phase = FramePhase::AfterValue;
            if (c == ',' || c == '}') {
                pushEmptyScalar({}, mark);
                return;
            }
            parseFlowNode(false);
            return;
        default:
            if (c == ',') {
                consume();
                frame.phase = FramePhase::AfterComma;
                return;
            }
            if (c == '}') {
                consume();
                closeCollection(mark);
                return;
            }
            THROW_PARSE_ERROR(mark, "Expected ',' or '}' in flow mapping but found '",
                              c, "'");
    }
}

void Reader::closeCollection(const Mark& mark) {
    FrameKind kind = frames_.back().kind;
    frames_.pop_back();
    bool mapping =
        kind == FrameKind::BlockMapping || kind == FrameKind::FlowMapping;
    pushToken(mapping ? TokenType::MappingEnd : TokenType::SequenceEnd, mark);
}

void Reader::parseBlockNode(int parentIndent, NodeContext context) {
    skipBlanks();
    Mark mark = here();
    if (!atEnd() && peek() != '\n' && peek() != '#') {
        parseBlockContent(parentIndent, context, {}, true);
        return;
    }
    LineInfo next = locateNextContent();
    if (next.eof || next.documentMarker || next.column <= parentIndent) {
        if (context == NodeContext::MappingValue && !next.eof &&
            !next.documentMarker && next.column == parentIndent &&
            atBlockEntry()) {
            startBlockSequence({}, here());
            return;
        }
        pushEmptyScalar({}, mark);
        return;
    }
    parseBlockContent(parentIndent, context, {}, false);
}

void Reader::parseBlockContent(int parentIndent, NodeContext context,
                               Properties nodeProps, bool sameLine) {
    Mark mark = here();
    int indent = column();
    Properties inlineProps = parseProperties();

    if (atEnd() || peek() == '\n' || peek() == '#') {
        // Properties alone on a line belong to the node below them.
        Properties props = mergeProperties(std::move(nodeProps), inlineProps);
        LineInfo next = locateNextContent();
        if (next.eof || next.documentMarker || next.column <= parentIndent) {
            if (context == NodeContext::MappingValue && !next.eof &&
                !next.documentMarker && next.column == parentIndent &&
                atBlockEntry()) {
                startBlockSequence(props, here());
                return;
            }
            pushEmptyScalar(props, mark);
            return;
        }
        parseBlockContent(parentIndent, context, std::move(props), false);
        return;
    }

    bool collectionAllowed = !(context == NodeContext::MappingValue && sameLine);
    char c = peek();
    if (c == '*') {
        if (!nodeProps.empty() || !inlineProps.empty()) {
            THROW_PARSE_ERROR(mark, "An alias cannot carry an anchor or a tag");
        }
        consume();
        std::string name = scanName();
        if (name.empty()) {
            THROW_PARSE_ERROR(mark, "Expected an alias name");
        }
        skipBlanks();
        if (peek() == ':' && isBlankOrEnd(1)) {
            THROW_PARSE_ERROR(mark, "Aliases cannot be used as mapping keys");
        }
        pushToken(TokenType::Alias, mark, std::move(name));
        return;
    }
    if (c == '-' && isBlankOrEnd(1)) {
        if (!collectionAllowed) {
            THROW_PARSE_ERROR(
                here(), "Block sequence entries are not allowed in this context");
        }
        startBlockSequence(mergeProperties(std::move(nodeProps), inlineProps),
                           here());
        return;
    }
    if (c == '[' || c == '{') {
        startFlowCollection(mergeProperties(std::move(nodeProps), inlineProps),
                            here());
        return;
    }
    if (c == '|' || c == '>') {
        Mark scalarMark = here();
        ScalarStyle style = ScalarStyle::Literal;
        std::string text = scanBlockScalar(parentIndent, style);
        pushScalar(std::move(text), style,
                   mergeProperties(std::move(nodeProps), inlineProps),
                   scalarMark);
        return;
    }
    if (c == '?' && isBlankOrEnd(1)) {
        THROW_PARSE_ERROR(here(), "Complex mapping keys are not supported");
    }

    Mark scalarMark = here();
    ScalarStyle style = ScalarStyle::Plain;
    bool multiline = false;
    std::string text;
    if (c == '\'' || c == '"') {
        style = c == '\'' ? ScalarStyle::SingleQuoted : ScalarStyle::DoubleQuoted;
        text = scanQuoted(multiline);
        skipBlanks();
    } else {
        text = scanPlain(parentIndent, false, true, multiline);
    }

    if (peek() == ':' && isBlankOrEnd(1)) {
        if (multiline) {
            THROW_PARSE_ERROR(scalarMark,
                              "Implicit keys must fit on a single line");
        }
        if (!collectionAllowed) {
            THROW_PARSE_ERROR(here(),
                              "Mapping values are not allowed in this context");
        }
        pushCollectionStart(TokenType::MappingStart, CollectionStyle::Block,
                            nodeProps, mark);
        frames_.push_back(
            Frame{FrameKind::BlockMapping, indent, FramePhase::Value, mark});
        pushScalar(std::move(text), style, inlineProps, scalarMark);
        consume();
        return;
    }
    pushScalar(std::move(text), style,
               mergeProperties(std::move(nodeProps), inlineProps), mark);
}

void Reader::parseMappingKey() {
    Mark mark = here();
    Properties props = parseProperties();
    char c = peek();
    if (atEnd() || c == '\n' || c == '#') {
        THROW_PARSE_ERROR(mark, "Expected a mapping key");
    }
    if (c == '*') {
        THROW_PARSE_ERROR(mark, "Aliases cannot be used as mapping keys");
    }
    if (c == '?' && isBlankOrEnd(1)) {
        THROW_PARSE_ERROR(mark, "Complex mapping keys are not supported");
    }
    if (c == '-' && isBlankOrEnd(1)) {
        THROW_PARSE_ERROR(mark,
                          "Block sequence entries are not allowed in a mapping");
    }
    if (c == '[' || c == '{' || c == '|' || c == '>') {
        THROW_PARSE_ERROR(mark, "Expected a scalar mapping key");
    }

    Mark keyMark = here();
    ScalarStyle style = ScalarStyle::Plain;
    bool multiline = false;
    std::string text;
    if (c == '\'' || c == '"') {
        style = c == '\'' ? ScalarStyle::SingleQuoted : ScalarStyle::DoubleQuoted;
        text = scanQuoted(multiline);
        skipBlanks();
    } else {
        text = scanPlain(-1, false, false, multiline);
    }
    if (multiline) {
        THROW_PARSE_ERROR(keyMark, "Implicit keys must fit on a single line");
    }
    if (peek() != ':' || !isBlankOrEnd(1)) {
        THROW_PARSE_ERROR(here(), "Could not find expected ':'");
    }
    pushScalar(std::move(text), style, props, keyMark);
    consume();
    frames_.back().phase = FramePhase::Value;
}

void Reader::parseFlowNode(bool asKey) {
    Mark mark = here();
    Properties props = parseProperties();
    if (!props.empty()) {
        skipFlowWhitespace(frames_.back().mark);
    }
    char c = peek();
    if (c == '*') {
        if (!props.empty()) {
            THROW_PARSE_ERROR(mark, "An alias cannot carry an anchor or a tag");
        }
        consume();
        std::string name = scanName();
        if (name.empty()) {
            THROW_PARSE_ERROR(mark, "Expected an alias name");
        }
        pushToken(TokenType::Alias, mark, std::move(name));
        return;
    }
    if (c == '[' || c == '{') {
        if (asKey) {
            THROW_PARSE_ERROR(mark, "Complex mapping keys are not supported");
        }
        startFlowCollection(props, here());
        return;
    }
    if (c == ',' || c == ']' || c == '}' ||
        (c == ':' && (isBlankOrEnd(1) || isFlowIndicator(peek(1))))) {
        pushEmptyScalar(props, mark);
        return;
    }
    if (c == '|' || c == '>') {
        THROW_PARSE_ERROR(here(), "Block scalars are not allowed in flow context");
    }
    if (c == '-' && isBlankOrEnd(1)) {
        THROW_PARSE_ERROR(
            here(), "Block sequence entries are not allowed in flow context");
    }
    ScalarStyle style = ScalarStyle::Plain;
    bool multiline = false;
    std::string text;
    if (c == '\'' || c == '"') {
        style = c == '\'' ? ScalarStyle::SingleQuoted : ScalarStyle::DoubleQuoted;
        text = scanQuoted(multiline);
    } else {
        text = scanPlain(-1, true, true, multiline);
    }
    pushScalar(std::move(text), style, props, mark);
}

void Reader::startFlowCollection(const Properties& props, const Mark& mark) {
    bool sequence = peek() == '[';
    consume();
    pushCollectionStart(sequence ? TokenType::SequenceStart
                                 : TokenType::MappingStart,
                        CollectionStyle::Flow, props, mark);
    frames_.push_back(Frame{
        sequence ? FrameKind::FlowSequence : FrameKind::FlowMapping, column(),
        sequence ? FramePhase::Entry : FramePhase::Key, mark});
}

void Reader::startBlockSequence(const Properties& props, const Mark& mark) {
    pushCollectionStart(TokenType::SequenceStart, CollectionStyle::Block, props,
                        mark);
    frames_.push_back(Frame{FrameKind::BlockSequence, column(),
                            FramePhase::Entry, mark, true});
}

// Scanners

auto Reader::parseProperties() -> Properties {
    Properties props;
    while (true) {
        Mark mark = here();
        char c = peek();
        if (c == '&') {
            if (!props.anchor.empty()) {
                THROW_PARSE_ERROR(mark, "A node can only have one anchor");
            }
            consume();
            props.anchor = scanName();
            if (props.anchor.empty()) {
                THROW_PARSE_ERROR(mark, "Expected an anchor name");
            }
        } else if (c == '!') {
            if (!props.tag.empty()) {
                THROW_PARSE_ERROR(mark, "A node can only have one tag");
            }
            props.tag = scanTag();
        } else {
            break;
        }
        skipBlanks();
    }
    return props;
}

auto Reader::mergeProperties(Properties outer, const Properties& inner) const
    -> Properties {
    if (!inner.anchor.empty()) {
        if (!outer.anchor.empty()) {
            THROW_PARSE_ERROR(here(), "A node can only have one anchor");
        }
        outer.anchor = inner.anchor;
    }
    if (!inner.tag.empty()) {
        if (!outer.tag.empty()) {
            THROW_PARSE_ERROR(here(), "A node can only have one tag");
        }
        outer.tag = inner.tag;
    }
    return outer;
}

auto Reader::scanName() -> std::string {
    std::string name;
    while (!isBlankOrEnd(0) && !isFlowIndicator(peek())) {
        name += peek();
        consume();
    }
    return name;
}

auto Reader::scanTag() -> std::string {
    Mark mark = here();
    consume();
    if (peek() == '<') {
        consume();
        std::string uri;
        while (!atEnd() && peek() != '>' && peek() != '\n') {
            uri += peek();
            consume();
        }
        if (peek() != '>') {
            THROW_PARSE_ERROR(mark, "Unterminated verbatim tag");
        }
        consume();
        return uri;
    }
    std::string raw = "!";
    while (!isBlankOrEnd(0) && !isFlowIndicator(peek())) {
        raw += peek();
        consume();
    }
    if (raw == "!") {
        return raw;
    }
    auto second = raw.find('!', 1);
    std::string handle = second == std::string::npos ? "!" : raw.substr(0, second + 1);
    std::string suffix =
        second == std::string::npos ? raw.substr(1) : raw.substr(second + 1);
    if (auto it = tagHandles_.find(handle); it != tagHandles_.end()) {
        return it->second + suffix;
    }
    if (handle == "!" || handle == "!!") {
        return raw;
    }
    THROW_PARSE_ERROR(mark, "Undefined tag handle '", handle, "'");
}

auto Reader::scanPlainSegment(bool flow) -> std::string {
    std::string out;
    std::string blanks;
    while (!atEnd()) {
        char c = peek();
        if (c == '\n') {
            break;
        }
        if (isBlank(c)) {
            blanks += c;
            consume();
            continue;
        }
        if (c == '#' && !blanks.empty()) {
            break;
        }
        if (c == ':' &&
            (isBlankOrEnd(1) || (flow && isFlowIndicator(peek(1))))) {
            break;
        }
        if (flow && isFlowIndicator(c)) {
            break;
        }
        out += blanks;
        blanks.clear();
        out += c;
        consume();
    }
    return out;
}

auto Reader::scanPlain(int parentIndent, bool flow, bool allowMultiline,
                       bool& multiline) -> std::string {
    Mark mark = here();
    char c = peek();
    if (c == '@' || c == '`' || c == '%' || c == '#' ||
        (!flow && isFlowIndicator(c))) {
        THROW_PARSE_ERROR(mark, "A plain scalar cannot start with '", c, "'");
    }
    multiline = false;
    std::string out = scanPlainSegment(flow);
    if (!allowMultiline) {
        return out;
    }

    while (peek() == '\n') {
        std::size_t savedPos = pos_;
        std::size_t savedLine = line_;
        std::size_t savedLineStart = lineStart_;
        std::size_t breaks = 0;
        bool continues = false;
        while (true) {
            consume();
            ++breaks;
            while (peek() == ' ') {
                consume();
            }
            int indent = column();
            bool marker = indent == 0 && atDocumentMarker();
            skipBlanks();
            if (peek() == '\n') {
                continue;
            }
            continues = !atEnd() && !marker && peek() != '#' &&
                        (flow || indent > parentIndent);
            if (continues && flow) {
                char next = peek();
                continues = !isFlowIndicator(next) &&
                            !(next == ':' && (isBlankOrEnd(1) ||
                                              isFlowIndicator(peek(1))));
            }
            break;
        }
        if (!continues) {
            pos_ = savedPos;
            line_ = savedLine;
            lineStart_ = savedLineStart;
            break;
        }
        std::string segment = scanPlainSegment(flow);
        if (breaks == 1) {
            out += ' ';
        } else {
            out.append(breaks - 1, '\n');
        }
        out += segment;
        multiline = true;
    }
    return out;
}

void Reader::foldQuotedBreak(std::string& out, const Mark& openedAt) {
    std::size_t breaks = 0;
    while (peek() == '\n') {
        consume();
        ++breaks;
        if (atDocumentMarker()) {
            THROW_PARSE_ERROR(openedAt, "Unterminated quoted scalar");
        }
        skipBlanks();
    }
    if (breaks == 1) {
        out += ' ';
    } else {
        out.append(breaks - 1, '\n');
    }
}

auto Reader::scanQuoted(bool& multiline) -> std::string {
    Mark opened = here();
    char quote = peek();
    consume();
    std::string out;
    std::string blanks;
    multiline = false;
    while (true) {
        if (atEnd()) {
            THROW_PARSE_ERROR(opened, "Unterminated quoted scalar");
        }
        char c = peek();
        if (quote == '\'' && c == '\'') {
            if (peek(1) == '\'') {
                out += blanks;
                blanks.clear();
                out += '\'';
                consume(2);
                continue;
            }
            out += blanks;
            consume();
            break;
        }
        if (quote == '"' && c == '"') {
            out += blanks;
            consume();
            break;
        }
        if (c == '\n') {
            blanks.clear();
            multiline = true;
            foldQuotedBreak(out, opened);
            continue;
        }
        if (isBlank(c)) {
            blanks += c;
            consume();
            continue;
        }
        out += blanks;
        blanks.clear();
        if (quote == '"' && c == '\\') {
            Mark escapeMark = here();
            char escape = peek(1);
            if (escape == '\n') {
                consume(2);
                multiline = true;
                skipBlanks();
                continue;
            }
            consume(2);
            auto readHex = [&](int digits) {
                std::uint32_t codepoint = 0;
                for (int i = 0; i < digits; ++i) {
                    int digit = hexValue(peek());
                    if (digit < 0) {
                        THROW_PARSE_ERROR(escapeMark,
                                          "Invalid hexadecimal escape sequence");
                    }
                    codepoint = codepoint * 16 + static_cast<std::uint32_t>(digit);
                    consume();
                }
                if (codepoint > 0x10FFFF ||
                    (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
                    THROW_PARSE_ERROR(escapeMark, "Invalid Unicode escape");
                }
                appendUtf8(out, codepoint);
            };
            switch (escape) {
                case '0':
                    out += '\0';
                    break;
                case 'a':
                    out += '\a';
                    break;
                case 'b':
                    out += '\b';
                    break;
                case 't':
                case '\t':
                    out += '\t';
                    break;
                case 'n':
                    out += '\n';
                    break;
                case 'v':
                    out += '\v';
                    break;
                case 'f':
                    out += '\f';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 'e':
                    out += '\x1b';
                    break;
                case ' ':
                case '"':
                case '/':
                case '\\':
                    out += escape;
                    break;
                case 'N':
                    appendUtf8(out, 0x85);
                    break;
                case '_':
                    appendUtf8(out, 0xA0);
                    break;
                case 'L':
                    appendUtf8(out, 0x2028);
                    break;
                case 'P':
                    appendUtf8(out, 0x2029);
                    break;
                case 'x':
                    readHex(2);
                    break;
                case 'u':
                    readHex(4);
                    break;
                case 'U':
                    readHex(8);
                    break;
                default:
                    THROW_PARSE_ERROR(escapeMark, "Unknown escape sequence '\\",
                                      escape, "'");
            }
            continue;
        }
        out += c;
        consume();
    }
    return out;
}

auto Reader::scanBlockScalar(int parentIndent, ScalarStyle& style)
    -> std::string {
    style = peek() == '|' ? ScalarStyle::Literal : ScalarStyle::Folded;
    consume();

    Chomping chomping = Chomping::Clip;
    bool chompingSet = false;
    int increment = 0;
    for (int i = 0; i < 2; ++i) {
        char c = peek();
        if ((c == '+' || c == '-') && !chompingSet) {
            chomping = c == '+' ? Chomping::Keep : Chomping::Strip;
            chompingSet = true;
            consume();
        } else if (c >= '1' && c <= '9' && increment == 0) {
            increment = c - '0';
            consume();
        } else if (c == '0') {
            THROW_PARSE_ERROR(here(),
                              "Block scalar indentation indicator cannot be 0");
        } else {
            break;
        }
    }
    skipBlanks();
    if (peek() == '#') {
        consumeComment();
    }
    if (!atEnd() && peek() != '\n') {
        THROW_PARSE_ERROR(here(),
                          "Expected a comment or a line break after a block "
                          "scalar header");
    }
    consume();

    int minIndent = parentIndent + 1;
    int indent = -1;
    if (increment > 0) {
        indent = (parentIndent >= 0 ? parentIndent : 0) + increment;
    }

    std::vector<std::string> lines;
    std::vector<bool> terminated;
    while (!atEnd()) {
        std::size_t lineBegin = pos_;
        int spaces = 0;
        while (peek() == ' ' && (indent < 0 || spaces < indent)) {
            consume();
            ++spaces;
        }
        if (atEnd() || peek() == '\n') {
            lines.emplace_back();
            terminated.push_back(!atEnd());
            consume();
            continue;
        }
        if (indent < 0) {
            if (spaces < minIndent) {
                pos_ = lineBegin;
                break;
            }
            indent = spaces;
        } else if (spaces < indent) {
            pos_ = lineBegin;
            break;
        }
        if (indent == 0 && atDocumentMarker()) {
            pos_ = lineBegin;
            break;
        }
        std::size_t start = pos_;
        while (!atEnd() && peek() != '\n') {
            consume();
        }
        lines.emplace_back(input_.substr(start, pos_ - start));
        terminated.push_back(!atEnd());
        consume();
    }

    std::size_t count = lines.size();
    std::size_t last = count;
    for (std::size_t i = 0; i < count; ++i) {
        if (!lines[i].empty()) {
            last = i;
        }
    }

    std::string text;
    if (last == count) {
        if (chomping == Chomping::Keep) {
            for (bool broken : terminated) {
                if (broken) {
                    text += '\n';
                }
            }
        }
        return text;
    }

    if (style == ScalarStyle::Literal) {
        for (std::size_t i = 0; i <= last; ++i) {
            if (i > 0) {
                text += '\n';
            }
            text += lines[i];
        }
    } else {
        text = foldLines(lines, last);
    }

    if (chomping != Chomping::Strip && terminated[last]) {
        text += '\n';
    }
    if (chomping == Chomping::Keep) {
        for (std::size_t i = last + 1; i < count; ++i) {
            if (terminated[i]) {
                text += '\n';
            }
        }
    }
    return text;
}

}  // namespace yamlet
