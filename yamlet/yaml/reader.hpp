/*
 * reader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Pull-style YAML reader producing a lazy token stream

**************************************************/

#ifndef YAMLET_YAML_READER_HPP
#define YAMLET_YAML_READER_HPP

#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "yamlet/yaml/schema.hpp"
#include "yamlet/yaml/token.hpp"

namespace yamlet {

/**
 * @brief Options for the YAML reader.
 */
struct ReaderOptions {
    int maxDepth{64};                ///< Maximum number of open collections
    bool readComments{false};        ///< Report comments as Comment tokens
    bool allowTrailingCommas{true};  ///< Accept `[a, b, ]` and `{a: 1, }`
    const Schema* schema{nullptr};   ///< Tag resolution, CoreSchema if null
};

/**
 * @brief Forward-only YAML reader.
 *
 * The reader walks the input with an explicit stack of open collections, so
 * the nesting depth is checked against ReaderOptions::maxDepth instead of
 * relying on the call stack. Tokens are produced on demand: each call to
 * advance() parses only as much input as needed for the next token.
 *
 * The input buffer must outlive the reader unless it contains carriage
 * returns, in which case the reader keeps a normalised copy.
 *
 * @code
 * yamlet::Reader reader("name: Rex\n");
 * while (reader.advance()) {
 *     if (reader.tokenType() == yamlet::TokenType::Scalar) {
 *         std::cout << reader.value() << '\n';
 *     }
 * }
 * @endcode
 */
class Reader {
public:
    explicit Reader(std::string_view input, ReaderOptions options = {});

    /**
     * @brief Moves to the next token.
     * @return false once the token after StreamEnd has been requested.
     */
    auto advance() -> bool;

    [[nodiscard]] auto token() const -> const Token& { return current_; }
    [[nodiscard]] auto tokenType() const -> TokenType { return current_.type; }
    [[nodiscard]] auto value() const -> const std::string& {
        return current_.value;
    }
    [[nodiscard]] auto scalarStyle() const -> ScalarStyle {
        return current_.style;
    }
    [[nodiscard]] auto scalarTag() const -> ScalarTag {
        return current_.scalarTag;
    }
    [[nodiscard]] auto tag() const -> const std::string& {
        return current_.tag;
    }
    [[nodiscard]] auto anchor() const -> const std::string& {
        return current_.anchor;
    }
    [[nodiscard]] auto collectionStyle() const -> CollectionStyle {
        return current_.collectionStyle;
    }
    [[nodiscard]] auto mark() const -> const Mark& { return current_.mark; }

    /**
     * @brief Number of collections open after the current token.
     */
    [[nodiscard]] auto depth() const -> int { return depth_; }

    /**
     * @brief True when the current token is a scalar resolving to null.
     */
    [[nodiscard]] auto isNull() const -> bool;

    [[nodiscard]] auto options() const -> const ReaderOptions& {
        return options_;
    }

    /**
     * @brief Skips the current node. For a collection start the reader is
     * left on the matching end token.
     */
    void skip();

    /**
     * @brief Consumes the current node and returns all of its tokens. The
     * reader is left on the last token of the node.
     */
    auto captureNode() -> std::vector<Token>;

    /**
     * @brief Queues tokens so that the next advance() returns tokens.front().
     */
    void rewind(std::vector<Token> tokens);

private:
    enum class Phase { StreamStart, DocumentStart, DocumentContent, Done };
    enum class FrameKind { BlockMapping, BlockSequence, FlowMapping, FlowSequence };
    enum class FramePhase { Key, Value, Entry, AfterEntry, AfterComma, AfterKey, AfterValue };
    enum class NodeContext { Root, MappingValue, SequenceEntry };

    struct Frame {
        FrameKind kind;
        int indent;
        FramePhase phase;
        Mark mark;
        bool firstInline{false};
    };

    struct Properties {
        std::string anchor;
        std::string tag;

        [[nodiscard]] auto empty() const -> bool {
            return anchor.empty() && tag.empty();
        }
    };

    struct LineInfo {
        bool eof{false};
        bool documentMarker{false};
        int column{0};
    };

    // Character level
    [[nodiscard]] auto peek(std::size_t ahead = 0) const -> char;
    [[nodiscard]] auto atEnd() const -> bool { return pos_ >= input_.size(); }
    [[nodiscard]] auto column() const -> int;
    [[nodiscard]] auto here() const -> Mark;
    [[nodiscard]] auto isBlankOrEnd(std::size_t ahead) const -> bool;
    [[nodiscard]] auto onlyBlanksBefore() const -> bool;
    [[nodiscard]] auto atDocumentMarker() const -> bool;
    [[nodiscard]] auto atBlockEntry() const -> bool;
    void consume(std::size_t count = 1);
    void skipBlanks();

    // Lines and comments
    void consumeComment();
    void finishLine();
    auto locateNextContent() -> LineInfo;
    void skipFlowWhitespace(const Mark& openedAt);

    // Token emission
    void pushToken(TokenType type, const Mark& mark, std::string value = {});
    void pushScalar(std::string text, ScalarStyle style, const Properties& props,
                    const Mark& mark);
    void pushEmptyScalar(const Properties& props, const Mark& mark);
    void pushCollectionStart(TokenType type, CollectionStyle style,
                             const Properties& props, const Mark& mark);

    // Grammar
    void fetch();
    void fetchDocumentStart();
    void fetchDocumentEnd();
    void parseDirective(bool& sawVersion);
    void stepBlockMapping();
    void stepBlockSequence();
    void stepFlowSequence();
    void stepFlowMapping();
    void closeCollection(const Mark& mark);
    void parseBlockNode(int parentIndent, NodeContext context);
    void parseBlockContent(int parentIndent, NodeContext context,
                           Properties nodeProps, bool sameLine);
    void parseMappingKey();
    void parseFlowNode(bool asKey);
    void startFlowCollection(const Properties& props, const Mark& mark);
    void startBlockSequence(const Properties& props, const Mark& mark);

    // Scanners
    auto parseProperties() -> Properties;
    auto mergeProperties(Properties outer, const Properties& inner) const
        -> Properties;
    auto scanName() -> std::string;
    auto scanTag() -> std::string;
    auto scanPlain(int parentIndent, bool flow, bool allowMultiline,
                   bool& multiline) -> std::string;
    auto scanPlainSegment(bool flow) -> std::string;
    auto scanQuoted(bool& multiline) -> std::string;
    auto scanBlockScalar(int parentIndent, ScalarStyle& style) -> std::string;
    void foldQuotedBreak(std::string& out, const Mark& openedAt);

    std::string owned_;
    std::string_view input_;
    ReaderOptions options_;
    const Schema* schema_;

    std::size_t pos_{0};
    std::size_t line_{1};
    std::size_t lineStart_{0};

    Phase phase_{Phase::StreamStart};
    bool rootParsed_{false};
    std::vector<Frame> frames_;
    std::unordered_map<std::string, std::string> tagHandles_;

    std::deque<Token> pending_;
    Token current_;
    int depth_{0};
};

}  // namespace yamlet

#endif  // YAMLET_YAML_READER_HPP
