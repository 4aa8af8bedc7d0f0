#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "yamlet/serial/options.hpp"
#include "yamlet/serial/type_builder.hpp"
#include "yamlet/yaml/errors.hpp"

using namespace yamlet;

class SerializerOptionsTest : public ::testing::Test {
protected:
    SerializerOptions options_;
};

TEST_F(SerializerOptionsTest, Defaults) {
    EXPECT_EQ(options_.maxDepth(), kDefaultMaxDepth);
    EXPECT_EQ(options_.maxAliasExpansion(), kDefaultMaxAliasExpansion);
    EXPECT_EQ(options_.indentSize(), 2);
    EXPECT_EQ(options_.namingPolicy(), NamingPolicy::KebabCase);
    EXPECT_EQ(options_.referenceHandling(), ReferenceHandling::None);
    EXPECT_EQ(options_.propertyOrdering(), PropertyOrdering::DeclarationOrder);
    EXPECT_EQ(options_.emptyCollectionHandling(),
              EmptyCollectionHandling::Default);
    EXPECT_FALSE(options_.ignoreNullValues());
    EXPECT_TRUE(options_.allowTrailingCommas());
    EXPECT_FALSE(options_.isReadOnly());
    EXPECT_EQ(options_.typeInfoSource(), nullptr);
}

TEST_F(SerializerOptionsTest, RangeChecks) {
    EXPECT_THROW(options_.setMaxDepth(0), InvalidConfigurationError);
    EXPECT_THROW(options_.setMaxDepth(kMaxAllowedDepth + 1),
                 InvalidConfigurationError);
    EXPECT_NO_THROW(options_.setMaxDepth(kMaxAllowedDepth));
    EXPECT_THROW(options_.setIndentSize(11), InvalidConfigurationError);
    EXPECT_THROW(options_.setMaxAliasExpansion(0), InvalidConfigurationError);
    EXPECT_NO_THROW(options_.setMaxAliasExpansion(1));

    try {
        options_.setIndentSize(0);
        FAIL() << "expected an InvalidConfigurationError";
    } catch (const InvalidConfigurationError& e) {
        EXPECT_EQ(e.option(), "indentSize");
    }
}

TEST_F(SerializerOptionsTest, FrozenOptionsRejectChanges) {
    options_.setIndentSize(4);
    options_.freeze();
    EXPECT_TRUE(options_.isReadOnly());
    EXPECT_EQ(options_.indentSize(), 4);
    try {
        options_.setIgnoreNullValues(true);
        FAIL() << "expected a ReadOnlyConfigurationError";
    } catch (const ReadOnlyConfigurationError& e) {
        EXPECT_EQ(e.option(), "ignoreNullValues");
    }
    EXPECT_THROW(options_.setTypeInfoSource(nullptr),
                 ReadOnlyConfigurationError);
}

TEST_F(SerializerOptionsTest, CopiesAreWritable) {
    options_.setMaxDepth(5);
    options_.freeze();
    SerializerOptions copy(options_);
    EXPECT_FALSE(copy.isReadOnly());
    EXPECT_EQ(copy.maxDepth(), 5);
    EXPECT_NO_THROW(copy.setMaxDepth(6));

    SerializerOptions fromDefault(SerializerOptions::defaultInstance());
    EXPECT_FALSE(fromDefault.isReadOnly());
}

TEST_F(SerializerOptionsTest, DefaultInstanceIsReadOnly) {
    auto& defaults = SerializerOptions::defaultInstance();
    EXPECT_TRUE(defaults.isReadOnly());
    EXPECT_THROW(defaults.setMaxDepth(3), ReadOnlyConfigurationError);
    EXPECT_EQ(&defaults, &SerializerOptions::defaultInstance());
}

TEST_F(SerializerOptionsTest, DerivedReaderAndWriterOptions) {
    options_.setMaxDepth(7);
    options_.setReadComments(true);
    options_.setAllowTrailingCommas(false);
    options_.setIndentSize(4);
    options_.setPreferFlowStyle(true);
    options_.setEmitDocumentMarkers(true);
    options_.setSchema(JsonSchema::instance());

    auto reader = options_.readerOptions();
    EXPECT_EQ(reader.maxDepth, 7);
    EXPECT_TRUE(reader.readComments);
    EXPECT_FALSE(reader.allowTrailingCommas);
    EXPECT_EQ(reader.schema, &JsonSchema::instance());

    auto writer = options_.writerOptions();
    EXPECT_EQ(writer.indentSize, 4);
    EXPECT_TRUE(writer.preferFlowStyle);
    EXPECT_TRUE(writer.emitDocumentMarkers);
}

TEST_F(SerializerOptionsTest, TypeInfoSource) {
    auto registry = TypeRegistryBuilder(options_).build();
    options_.setTypeInfoSource(registry);
    EXPECT_EQ(options_.typeInfoSource(), registry);
}
