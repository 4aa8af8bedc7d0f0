#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "yamlet/yaml/errors.hpp"
#include "yamlet/yaml/reader.hpp"

using namespace yamlet;
using ::testing::ElementsAre;

namespace {

auto tokenize(std::string_view text, ReaderOptions options = {})
    -> std::vector<Token> {
    Reader reader(text, options);
    std::vector<Token> tokens;
    while (reader.advance()) {
        tokens.push_back(reader.token());
    }
    return tokens;
}

auto types(const std::vector<Token>& tokens) -> std::vector<TokenType> {
    std::vector<TokenType> result;
    for (const auto& token : tokens) {
        result.push_back(token.type);
    }
    return result;
}

auto scalars(const std::vector<Token>& tokens) -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& token : tokens) {
        if (token.type == TokenType::Scalar) {
            result.push_back(token.value);
        }
    }
    return result;
}

}  // namespace

class ReaderTest : public ::testing::Test {
protected:
    // Scalar value of the single key of a one-entry mapping.
    static auto valueOf(std::string_view text) -> Token {
        auto tokens = tokenize(text);
        for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
            if (tokens[i].type == TokenType::Scalar) {
                return tokens[i + 1];
            }
        }
        return {};
    }
};

TEST_F(ReaderTest, BlockMapping) {
    auto tokens = tokenize("name: Rex\nage: 3\n");
    EXPECT_THAT(types(tokens),
                ElementsAre(TokenType::StreamStart, TokenType::DocumentStart,
                            TokenType::MappingStart, TokenType::Scalar,
                            TokenType::Scalar, TokenType::Scalar,
                            TokenType::Scalar, TokenType::MappingEnd,
                            TokenType::DocumentEnd, TokenType::StreamEnd));
    EXPECT_THAT(scalars(tokens), ElementsAre("name", "Rex", "age", "3"));
    EXPECT_EQ(tokens[2].collectionStyle, CollectionStyle::Block);
    EXPECT_EQ(tokens[6].scalarTag, ScalarTag::Int);
}

TEST_F(ReaderTest, NestedBlockCollections) {
    auto tokens = tokenize(
        "owner:\n"
        "  name: Bob\n"
        "pets:\n"
        "  - Rex\n"
        "  - Tom\n");
    EXPECT_THAT(scalars(tokens),
                ElementsAre("owner", "name", "Bob", "pets", "Rex", "Tom"));
    EXPECT_THAT(types(tokens),
                ElementsAre(TokenType::StreamStart, TokenType::DocumentStart,
                            TokenType::MappingStart, TokenType::Scalar,
                            TokenType::MappingStart, TokenType::Scalar,
                            TokenType::Scalar, TokenType::MappingEnd,
                            TokenType::Scalar, TokenType::SequenceStart,
                            TokenType::Scalar, TokenType::Scalar,
                            TokenType::SequenceEnd, TokenType::MappingEnd,
                            TokenType::DocumentEnd, TokenType::StreamEnd));
}

TEST_F(ReaderTest, SequenceAlignedWithParentKey) {
    auto tokens = tokenize("pets:\n- Rex\n- Tom\nsize: 2\n");
    EXPECT_THAT(scalars(tokens), ElementsAre("pets", "Rex", "Tom", "size", "2"));
}

TEST_F(ReaderTest, SequenceOfMappings) {
    auto tokens = tokenize("- name: Rex\n  age: 3\n- name: Tom\n");
    EXPECT_THAT(scalars(tokens),
                ElementsAre("name", "Rex", "age", "3", "name", "Tom"));
    EXPECT_EQ(tokens[2].type, TokenType::SequenceStart);
    EXPECT_EQ(tokens[3].type, TokenType::MappingStart);
}

TEST_F(ReaderTest, FlowCollections) {
    auto tokens = tokenize("{a: 1, b: [x, y], c: {}}");
    EXPECT_THAT(scalars(tokens), ElementsAre("a", "1", "b", "x", "y", "c"));
    EXPECT_EQ(tokens[2].collectionStyle, CollectionStyle::Flow);
}

TEST_F(ReaderTest, TrailingCommas) {
    EXPECT_THAT(scalars(tokenize("[1, 2, ]")), ElementsAre("1", "2"));

    ReaderOptions strict;
    strict.allowTrailingCommas = false;
    EXPECT_THROW(tokenize("[1, 2, ]", strict), ParseError);
    EXPECT_THROW(tokenize("{a: 1, }", strict), ParseError);
}

TEST_F(ReaderTest, EmptyValueIsNull) {
    auto token = valueOf("items:\n");
    EXPECT_EQ(token.type, TokenType::Scalar);
    EXPECT_EQ(token.value, "");
    EXPECT_EQ(token.scalarTag, ScalarTag::Null);
}

TEST_F(ReaderTest, QuotedScalars) {
    auto single = valueOf("a: 'it''s here'\n");
    EXPECT_EQ(single.value, "it's here");
    EXPECT_EQ(single.style, ScalarStyle::SingleQuoted);
    EXPECT_EQ(single.scalarTag, ScalarTag::String);

    auto number = valueOf("a: '123'\n");
    EXPECT_EQ(number.scalarTag, ScalarTag::String);

    auto escaped = valueOf("a: \"tab\\there\\n\\u00e9\"\n");
    EXPECT_EQ(escaped.value, "tab\there\n\xC3\xA9");
    EXPECT_EQ(escaped.style, ScalarStyle::DoubleQuoted);
}

TEST_F(ReaderTest, BlockScalars) {
    EXPECT_EQ(valueOf("a: |\n  one\n  two\n").value, "one\ntwo\n");
    EXPECT_EQ(valueOf("a: |-\n  one\n  two\n").value, "one\ntwo");
    EXPECT_EQ(valueOf("a: |+\n  one\n\n").value, "one\n\n");
    EXPECT_EQ(valueOf("a: >\n  one\n  two\n").value, "one two\n");
    EXPECT_EQ(valueOf("a: >\n  one\n\n  two\n").value, "one\ntwo\n");
}

TEST_F(ReaderTest, MultiLinePlainScalarFolds) {
    EXPECT_EQ(valueOf("a: one\n  two\n").value, "one two");
}

TEST_F(ReaderTest, AnchorsAndAliases) {
    auto tokens = tokenize("a: &x 1\nb: *x\n");
    ASSERT_THAT(types(tokens),
                ElementsAre(TokenType::StreamStart, TokenType::DocumentStart,
                            TokenType::MappingStart, TokenType::Scalar,
                            TokenType::Scalar, TokenType::Scalar,
                            TokenType::Alias, TokenType::MappingEnd,
                            TokenType::DocumentEnd, TokenType::StreamEnd));
    EXPECT_EQ(tokens[4].anchor, "x");
    EXPECT_EQ(tokens[6].type, TokenType::Alias);
    EXPECT_EQ(tokens[6].value, "x");
}

TEST_F(ReaderTest, AnchorOnCollection) {
    auto tokens = tokenize("base: &b\n  x: 1\ncopy: *b\n");
    EXPECT_EQ(tokens[4].type, TokenType::MappingStart);
    EXPECT_EQ(tokens[4].anchor, "b");
}

TEST_F(ReaderTest, DeclaredTagsOverrideInference) {
    EXPECT_EQ(valueOf("a: !!str 123\n").scalarTag, ScalarTag::String);
    EXPECT_EQ(valueOf("a: !!int '7'\n").scalarTag, ScalarTag::Int);
}

TEST_F(ReaderTest, CommentsAreSkippedByDefault) {
    auto tokens = tokenize("# header\na: 1 # trailing\n");
    for (const auto& token : tokens) {
        EXPECT_NE(token.type, TokenType::Comment);
    }
    EXPECT_THAT(scalars(tokens), ElementsAre("a", "1"));
}

TEST_F(ReaderTest, CommentsReportedWhenEnabled) {
    ReaderOptions options;
    options.readComments = true;
    std::vector<std::string> comments;
    for (const auto& token : tokenize("# header\na: 1 # trailing\n", options)) {
        if (token.type == TokenType::Comment) {
            comments.push_back(token.value);
        }
    }
    EXPECT_THAT(comments, ElementsAre("header", "trailing"));
}

TEST_F(ReaderTest, MultipleDocuments) {
    auto tokens = tokenize("a: 1\n---\nb: 2\n...\n");
    int documents = 0;
    for (const auto& token : tokens) {
        documents += token.type == TokenType::DocumentStart ? 1 : 0;
    }
    EXPECT_EQ(documents, 2);
    EXPECT_THAT(scalars(tokens), ElementsAre("a", "1", "b", "2"));
}

TEST_F(ReaderTest, DirectivesBeforeDocument) {
    auto tokens = tokenize("%YAML 1.2\n---\na: 1\n");
    EXPECT_THAT(scalars(tokens), ElementsAre("a", "1"));
    EXPECT_THROW(tokenize("%FOO bar\n---\na: 1\n"), ParseError);
}

TEST_F(ReaderTest, CarriageReturnsAreNormalized) {
    EXPECT_THAT(scalars(tokenize("a: 1\r\nb: two\r\n")),
                ElementsAre("a", "1", "b", "two"));
}

TEST_F(ReaderTest, MalformedInput) {
    EXPECT_THROW(tokenize("a: 'open\n"), ParseError);
    EXPECT_THROW(tokenize("a: \"open\n"), ParseError);
    EXPECT_THROW(tokenize("a: \"\\q\"\n"), ParseError);
    EXPECT_THROW(tokenize("[1, 2\n"), ParseError);
    EXPECT_THROW(tokenize("a: 1\nb: [1, *]\n"), ParseError);
}

TEST_F(ReaderTest, ParseErrorCarriesPosition) {
    try {
        tokenize("a: 1\nb: \"open\n");
        FAIL() << "expected a ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.mark().line, 2u);
        EXPECT_GT(e.mark().offset, 4u);
    }
}

TEST_F(ReaderTest, DepthLimit) {
    ReaderOptions options;
    options.maxDepth = 3;
    EXPECT_NO_THROW(tokenize("[[[1]]]", options));
    EXPECT_THROW(tokenize("[[[[1]]]]", options), MaxDepthExceededError);
    EXPECT_THROW(tokenize("a:\n  b:\n    c:\n      d: 1\n", options),
                 MaxDepthExceededError);
}

TEST_F(ReaderTest, DepthTracksOpenCollections) {
    Reader reader("a:\n  b: [1]\n");
    std::vector<int> depths;
    while (reader.advance()) {
        depths.push_back(reader.depth());
    }
    // StreamStart DocStart { a { b [ 1 ] } } DocEnd StreamEnd
    EXPECT_THAT(depths, ElementsAre(0, 0, 1, 1, 2, 2, 3, 3, 2, 1, 0, 0, 0));
}

TEST_F(ReaderTest, SkipConsumesWholeNode) {
    Reader reader("a: {x: [1, 2], y: 3}\nb: 4\n");
    while (reader.advance() && reader.tokenType() != TokenType::MappingStart) {
    }
    reader.advance();  // a
    reader.advance();  // {
    reader.skip();
    EXPECT_EQ(reader.tokenType(), TokenType::MappingEnd);
    reader.advance();
    EXPECT_EQ(reader.value(), "b");
}

TEST_F(ReaderTest, CaptureAndRewindReplayTokens) {
    Reader reader("a: {x: 1, y: [2]}\nb: 3\n");
    while (reader.advance() && reader.value() != "a") {
    }
    reader.advance();
    const int depthBefore = reader.depth();
    auto tokens = reader.captureNode();
    EXPECT_EQ(tokens.size(), 8u);
    EXPECT_EQ(reader.tokenType(), TokenType::MappingEnd);

    reader.rewind(tokens);
    reader.advance();
    EXPECT_EQ(reader.tokenType(), TokenType::MappingStart);
    EXPECT_EQ(reader.depth(), depthBefore);
    reader.skip();
    reader.advance();
    EXPECT_EQ(reader.value(), "b");
}
