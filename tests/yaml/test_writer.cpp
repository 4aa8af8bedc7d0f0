#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "yamlet/error/exception.hpp"
#include "yamlet/yaml/errors.hpp"
#include "yamlet/yaml/reader.hpp"
#include "yamlet/yaml/writer.hpp"

using namespace yamlet;

class WriterTest : public ::testing::Test {
protected:
    void SetUp() override { writer_ = Writer(); }

    auto finish() -> std::string {
        writer_.writeStreamEnd();
        return writer_.take();
    }

    Writer writer_;
};

TEST_F(WriterTest, BlockMapping) {
    writer_.writeMappingStart();
    writer_.writePropertyName("name");
    writer_.writeString("Rex");
    writer_.writePropertyName("age");
    writer_.writeInt(3);
    writer_.writeMappingEnd();
    EXPECT_EQ(finish(), "name: Rex\nage: 3\n");
}

TEST_F(WriterTest, NestedMapping) {
    writer_.writeMappingStart();
    writer_.writePropertyName("owner");
    writer_.writeMappingStart();
    writer_.writePropertyName("name");
    writer_.writeString("Bob");
    writer_.writeMappingEnd();
    writer_.writePropertyName("alive");
    writer_.writeBool(true);
    writer_.writeMappingEnd();
    EXPECT_EQ(finish(), "owner:\n  name: Bob\nalive: true\n");
}

TEST_F(WriterTest, SequenceUnderKey) {
    writer_.writeMappingStart();
    writer_.writePropertyName("items");
    writer_.writeSequenceStart();
    writer_.writeString("a");
    writer_.writeString("b");
    writer_.writeSequenceEnd();
    writer_.writeMappingEnd();
    EXPECT_EQ(finish(), "items:\n  - a\n  - b\n");
}

TEST_F(WriterTest, SequenceAlignedWithKey) {
    WriterOptions options;
    options.indentSequenceItems = false;
    Writer writer(options);
    writer.writeMappingStart();
    writer.writePropertyName("items");
    writer.writeSequenceStart();
    writer.writeString("a");
    writer.writeSequenceEnd();
    writer.writeMappingEnd();
    writer.writeStreamEnd();
    EXPECT_EQ(writer.take(), "items:\n- a\n");
}

TEST_F(WriterTest, MappingsInsideSequence) {
    writer_.writeSequenceStart();
    for (const char* name : {"x", "y"}) {
        writer_.writeMappingStart();
        writer_.writePropertyName("name");
        writer_.writeString(name);
        writer_.writePropertyName("age");
        writer_.writeInt(1);
        writer_.writeMappingEnd();
    }
    writer_.writeSequenceEnd();
    EXPECT_EQ(finish(), "- name: x\n  age: 1\n- name: y\n  age: 1\n");
}

TEST_F(WriterTest, FlowCollections) {
    writer_.writeMappingStart(CollectionStyle::Flow);
    writer_.writePropertyName("a");
    writer_.writeInt(1);
    writer_.writePropertyName("b");
    writer_.writeSequenceStart();
    writer_.writeString("x");
    writer_.writeNull();
    writer_.writeSequenceEnd();
    writer_.writeMappingEnd();
    EXPECT_EQ(finish(), "{a: 1, b: [x, null]}\n");
}

TEST_F(WriterTest, PreferFlowStyle) {
    WriterOptions options;
    options.preferFlowStyle = true;
    Writer writer(options);
    writer.writeSequenceStart();
    writer.writeInt(1);
    writer.writeInt(2);
    writer.writeSequenceEnd();
    writer.writeStreamEnd();
    EXPECT_EQ(writer.take(), "[1, 2]\n");
}

TEST_F(WriterTest, NullValues) {
    writer_.writeMappingStart();
    writer_.writePropertyName("key");
    writer_.writeNull();
    writer_.writePropertyName("next");
    writer_.writeInt(1);
    writer_.writeMappingEnd();
    EXPECT_EQ(finish(), "key:\nnext: 1\n");

    writer_.writeNull();
    EXPECT_EQ(finish(), "null\n");
}

TEST_F(WriterTest, EmptyCollections) {
    writer_.writeMappingStart();
    writer_.writePropertyName("items");
    writer_.writeSequenceStart();
    writer_.writeSequenceEnd();
    writer_.writeMappingEnd();
    EXPECT_EQ(finish(), "items: []\n");

    writer_.writeMappingStart();
    writer_.writeMappingEnd();
    EXPECT_EQ(finish(), "{}\n");
}

TEST_F(WriterTest, StringsThatLookLikeOtherTypesAreQuoted) {
    writer_.writeSequenceStart();
    writer_.writeString("123");
    writer_.writeString("");
    writer_.writeString("yes");
    writer_.writeString("null");
    writer_.writeString("a: b");
    writer_.writeString("it's");
    writer_.writeString("plain text");
    writer_.writeSequenceEnd();
    EXPECT_EQ(finish(),
              "- '123'\n"
              "- ''\n"
              "- 'yes'\n"
              "- 'null'\n"
              "- 'a: b'\n"
              "- it's\n"
              "- plain text\n");
}

TEST_F(WriterTest, ControlCharactersUseDoubleQuotes) {
    writer_.writeMappingStart(CollectionStyle::Flow);
    writer_.writePropertyName("a");
    writer_.writeString("x\ty\x01");
    writer_.writeMappingEnd();
    EXPECT_EQ(finish(), "{a: \"x\\ty\\x01\"}\n");
}

TEST_F(WriterTest, MultiLineTextUsesLiteralBlock) {
    writer_.writeMappingStart();
    writer_.writePropertyName("text");
    writer_.writeString("line1\nline2");
    writer_.writePropertyName("kept");
    writer_.writeString("one\n");
    writer_.writeMappingEnd();
    EXPECT_EQ(finish(), "text: |-\n  line1\n  line2\nkept: |\n  one\n");
}

TEST_F(WriterTest, RequestedStyles) {
    writer_.writeMappingStart();
    writer_.writePropertyName("a");
    writer_.writeString("text", ScalarStyle::DoubleQuoted);
    writer_.writePropertyName("b");
    writer_.writeString("text", ScalarStyle::SingleQuoted);
    writer_.writePropertyName("c");
    writer_.writeString("one\ntwo\n", ScalarStyle::Folded);
    writer_.writeMappingEnd();
    EXPECT_EQ(finish(), "a: \"text\"\nb: 'text'\nc: >\n  one\n\n  two\n");
}

TEST_F(WriterTest, Numbers) {
    writer_.writeSequenceStart(CollectionStyle::Flow);
    writer_.writeDouble(1.5);
    writer_.writeDouble(3.0);
    writer_.writeDouble(std::numeric_limits<double>::infinity());
    writer_.writeUInt(std::numeric_limits<std::uint64_t>::max());
    writer_.writeInt(-4);
    writer_.writeSequenceEnd();
    EXPECT_EQ(finish(), "[1.5, 3.0, .inf, 18446744073709551615, -4]\n");
}

TEST_F(WriterTest, AnchorsAliasesAndTags) {
    writer_.writeMappingStart();
    writer_.writePropertyName("child");
    writer_.writeAnchor("ref1");
    writer_.writeMappingStart();
    writer_.writePropertyName("name");
    writer_.writeString("x");
    writer_.writeMappingEnd();
    writer_.writePropertyName("again");
    writer_.writeAlias("ref1");
    writer_.writePropertyName("count");
    writer_.writeAnchor("n");
    writer_.writeInt(1);
    writer_.writePropertyName("tagged");
    writer_.writeTag("!!str");
    writer_.writeString("x");
    writer_.writeMappingEnd();
    EXPECT_EQ(finish(),
              "child: &ref1\n"
              "  name: x\n"
              "again: *ref1\n"
              "count: &n 1\n"
              "tagged: !!str x\n");
}

TEST_F(WriterTest, MultipleDocuments) {
    for (int i = 0; i < 2; ++i) {
        writer_.writeDocumentStart();
        writer_.writeMappingStart();
        writer_.writePropertyName("n");
        writer_.writeInt(i);
        writer_.writeMappingEnd();
        writer_.writeDocumentEnd();
    }
    EXPECT_EQ(finish(), "n: 0\n---\nn: 1\n");
}

TEST_F(WriterTest, DocumentMarkers) {
    WriterOptions options;
    options.emitDocumentMarkers = true;
    Writer writer(options);
    writer.writeDocumentStart();
    writer.writeString("a");
    writer.writeDocumentEnd();
    writer.writeStreamEnd();
    EXPECT_EQ(writer.take(), "---\na\n...\n");
}

TEST_F(WriterTest, Comments) {
    WriterOptions options;
    options.writeComments = true;
    Writer writer(options);
    writer.writeMappingStart();
    writer.writeComment("note");
    writer.writePropertyName("a");
    writer.writeInt(1);
    writer.writeMappingEnd();
    writer.writeStreamEnd();
    EXPECT_EQ(writer.take(), "# note\na: 1\n");
}

TEST_F(WriterTest, CommentsDroppedWhenDisabled) {
    writer_.writeMappingStart();
    writer_.writeComment("note");
    writer_.writePropertyName("a");
    writer_.writeInt(1);
    writer_.writeMappingEnd();
    EXPECT_EQ(finish(), "a: 1\n");
}

TEST_F(WriterTest, MisuseIsALogicError) {
    EXPECT_THROW(writer_.writePropertyName("a"), error::LogicError);

    Writer alias;
    alias.writeAnchor("x");
    EXPECT_THROW(alias.writeAlias("y"), error::LogicError);

    Writer open;
    open.writeMappingStart();
    EXPECT_THROW(open.writeDocumentEnd(), error::LogicError);
    EXPECT_THROW(open.writeSequenceEnd(), error::LogicError);

    Writer twice;
    twice.writeInt(1);
    EXPECT_THROW(twice.writeInt(2), error::LogicError);

    EXPECT_THROW(writer_.writeAnchor(""), error::InvalidArgument);
}

TEST_F(WriterTest, InvalidIndentation) {
    WriterOptions options;
    options.indentSize = 0;
    EXPECT_THROW(Writer{options}, InvalidConfigurationError);
}

// Every scalar the writer produces must resolve to its own type again when
// read with the same schema.

namespace {

using ScalarValue = std::variant<std::nullptr_t, bool, std::int64_t,
                                 std::uint64_t, double, std::string>;

auto expectedTag(const ScalarValue& value) -> ScalarTag {
    switch (value.index()) {
        case 0:
            return ScalarTag::Null;
        case 1:
            return ScalarTag::Bool;
        case 2:
        case 3:
            return ScalarTag::Int;
        case 4:
            return ScalarTag::Float;
        default:
            return ScalarTag::String;
    }
}

void writeValue(Writer& writer, const ScalarValue& value) {
    std::visit(
        [&writer](const auto& v) {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::nullptr_t>) {
                writer.writeNull();
            } else if constexpr (std::is_same_v<V, bool>) {
                writer.writeBool(v);
            } else if constexpr (std::is_same_v<V, std::int64_t>) {
                writer.writeInt(v);
            } else if constexpr (std::is_same_v<V, std::uint64_t>) {
                writer.writeUInt(v);
            } else if constexpr (std::is_same_v<V, double>) {
                writer.writeDouble(v);
            } else {
                writer.writeString(v);
            }
        },
        value);
}

void expectSameValue(const Token& token, const ScalarValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        EXPECT_EQ(schema::parseBool(token.value), *b) << token.value;
    } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
        EXPECT_EQ(schema::parseInt64(token.value), *i) << token.value;
    } else if (const auto* u = std::get_if<std::uint64_t>(&value)) {
        EXPECT_EQ(schema::parseUInt64(token.value), *u) << token.value;
    } else if (const auto* d = std::get_if<double>(&value)) {
        auto parsed = schema::parseDouble(token.value);
        ASSERT_TRUE(parsed.has_value()) << token.value;
        if (std::isnan(*d)) {
            EXPECT_TRUE(std::isnan(*parsed)) << token.value;
        } else {
            EXPECT_EQ(*parsed, *d) << token.value;
            EXPECT_EQ(std::signbit(*parsed), std::signbit(*d)) << token.value;
        }
    } else if (const auto* text = std::get_if<std::string>(&value)) {
        EXPECT_EQ(token.value, *text);
    }
}

auto samples() -> std::vector<ScalarValue> {
    constexpr double kInf = std::numeric_limits<double>::infinity();
    return {nullptr,
            true,
            false,
            std::int64_t{0},
            std::int64_t{-7},
            std::numeric_limits<std::int64_t>::min(),
            std::numeric_limits<std::int64_t>::max(),
            std::numeric_limits<std::uint64_t>::max(),
            0.0,
            -0.0,
            1.5,
            3.0,
            1e300,
            1e-9,
            kInf,
            -kInf,
            std::numeric_limits<double>::quiet_NaN(),
            std::string(),
            std::string("hello"),
            std::string("yes"),
            std::string("No"),
            std::string("null"),
            std::string("~"),
            std::string("true"),
            std::string("123"),
            std::string("0x1F"),
            std::string("1.5"),
            std::string(".inf"),
            std::string("a: b"),
            std::string("- x"),
            std::string("#c"),
            std::string("[1]"),
            std::string("  padded "),
            std::string("it's"),
            std::string("line1\nline2")};
}

}  // namespace

class SchemaRoundTripTest : public ::testing::TestWithParam<const Schema*> {
protected:
    void expectRoundTrip(CollectionStyle style) {
        WriterOptions writerOptions;
        writerOptions.schema = GetParam();
        Writer writer(writerOptions);
        const auto values = samples();
        writer.writeSequenceStart(style);
        for (const auto& value : values) {
            writeValue(writer, value);
        }
        writer.writeSequenceEnd();
        writer.writeStreamEnd();
        const std::string text = writer.take();

        ReaderOptions readerOptions;
        readerOptions.schema = GetParam();
        Reader reader(text, readerOptions);
        std::vector<Token> scalars;
        while (reader.advance()) {
            if (reader.tokenType() == TokenType::Scalar) {
                scalars.push_back(reader.token());
            }
        }
        ASSERT_EQ(scalars.size(), values.size()) << text;
        for (std::size_t i = 0; i < values.size(); ++i) {
            SCOPED_TRACE(::testing::Message() << "item " << i << " of\n"
                                              << text);
            EXPECT_EQ(scalars[i].scalarTag, expectedTag(values[i]));
            expectSameValue(scalars[i], values[i]);
        }
    }
};

TEST_P(SchemaRoundTripTest, BlockSequence) {
    expectRoundTrip(CollectionStyle::Block);
}

TEST_P(SchemaRoundTripTest, FlowSequence) {
    expectRoundTrip(CollectionStyle::Flow);
}

TEST_P(SchemaRoundTripTest, MappingValues) {
    WriterOptions writerOptions;
    writerOptions.schema = GetParam();
    Writer writer(writerOptions);
    writer.writeMappingStart();
    writer.writePropertyName("empty");
    writer.writeNull();
    writer.writePropertyName("flag");
    writer.writeBool(false);
    writer.writePropertyName("ratio");
    writer.writeDouble(-std::numeric_limits<double>::infinity());
    writer.writeMappingEnd();
    writer.writeStreamEnd();
    const std::string text = writer.take();

    ReaderOptions readerOptions;
    readerOptions.schema = GetParam();
    Reader reader(text, readerOptions);
    std::vector<ScalarTag> tags;
    while (reader.advance()) {
        if (reader.tokenType() == TokenType::Scalar) {
            tags.push_back(reader.scalarTag());
        }
    }
    EXPECT_THAT(tags, ::testing::ElementsAre(
                          ScalarTag::String, ScalarTag::Null, ScalarTag::String,
                          ScalarTag::Bool, ScalarTag::String, ScalarTag::Float))
        << text;
}

TEST(SchemaTagTest, CoreOutputCarriesNoTags) {
    Writer writer;
    writer.writeSequenceStart(CollectionStyle::Flow);
    writer.writeNull();
    writer.writeBool(true);
    writer.writeDouble(std::numeric_limits<double>::infinity());
    writer.writeSequenceEnd();
    writer.writeStreamEnd();
    EXPECT_EQ(writer.take(), "[null, true, .inf]\n");
}

TEST(SchemaTagTest, OtherSchemasTagAmbiguousValues) {
    WriterOptions json;
    json.schema = &JsonSchema::instance();
    Writer writer(json);
    writer.writeSequenceStart(CollectionStyle::Flow);
    writer.writeBool(true);
    writer.writeDouble(std::numeric_limits<double>::infinity());
    writer.writeSequenceEnd();
    writer.writeStreamEnd();
    EXPECT_EQ(writer.take(), "[true, !!float .inf]\n");

    WriterOptions failsafe;
    failsafe.schema = &FailsafeSchema::instance();
    Writer tagged(failsafe);
    tagged.writeMappingStart();
    tagged.writePropertyName("a");
    tagged.writeNull();
    tagged.writeMappingEnd();
    tagged.writeStreamEnd();
    EXPECT_EQ(tagged.take(), "a: !!null null\n");
}

INSTANTIATE_TEST_SUITE_P(
    Schemas, SchemaRoundTripTest,
    ::testing::Values(&CoreSchema::instance(), &JsonSchema::instance(),
                      &FailsafeSchema::instance()),
    [](const ::testing::TestParamInfo<const Schema*>& info) {
        return std::string(info.param->name());
    });
