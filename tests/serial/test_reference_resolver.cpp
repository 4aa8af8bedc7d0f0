#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <typeindex>

#include "yamlet/error/exception.hpp"
#include "yamlet/serial/reference_resolver.hpp"
#include "yamlet/yaml/errors.hpp"

using namespace yamlet;

TEST(ReferenceResolverTest, CreateFollowsHandling) {
    EXPECT_EQ(ReferenceResolver::create(ReferenceHandling::None), nullptr);
    EXPECT_NE(dynamic_cast<IgnoreCyclesResolver*>(
                  ReferenceResolver::create(ReferenceHandling::IgnoreCycles)
                      .get()),
              nullptr);
    EXPECT_NE(dynamic_cast<PreserveResolver*>(
                  ReferenceResolver::create(ReferenceHandling::Preserve).get()),
              nullptr);
}

class PreserveResolverTest : public ::testing::Test {
protected:
    PreserveResolver resolver_;
    int first_{1};
    int second_{2};
};

TEST_F(PreserveResolverTest, AssignsSequentialIds) {
    bool exists = true;
    EXPECT_EQ(resolver_.getReference(&first_, exists), "ref1");
    EXPECT_FALSE(exists);
    EXPECT_EQ(resolver_.getReference(&second_, exists), "ref2");
    EXPECT_FALSE(exists);
    EXPECT_EQ(resolver_.getReference(&first_, exists), "ref1");
    EXPECT_TRUE(exists);
    EXPECT_EQ(resolver_.size(), 2u);
}

TEST_F(PreserveResolverTest, ResolvesRegisteredAnchors) {
    auto object = std::make_shared<int>(7);
    resolver_.addReference("a1", ReferenceEntry{object, typeid(int)});
    const auto& entry = resolver_.resolveReference("a1");
    EXPECT_EQ(entry.object, object);
    EXPECT_EQ(entry.type, std::type_index(typeid(int)));

    bool exists = false;
    EXPECT_EQ(resolver_.getReference(object.get(), exists), "a1");
    EXPECT_TRUE(exists);
}

TEST_F(PreserveResolverTest, RedefinedAnchorWins) {
    auto first = std::make_shared<int>(1);
    auto second = std::make_shared<int>(2);
    resolver_.addReference("x", ReferenceEntry{first, typeid(int)});
    resolver_.addReference("x", ReferenceEntry{second, typeid(int)});
    EXPECT_EQ(resolver_.resolveReference("x").object, second);
}

TEST_F(PreserveResolverTest, UnknownIdThrows) {
    try {
        (void)resolver_.resolveReference("nope");
        FAIL() << "expected a ReferenceNotFoundError";
    } catch (const ReferenceNotFoundError& e) {
        EXPECT_EQ(e.id(), "nope");
    }
}

TEST(IgnoreCyclesResolverTest, ReportsRevisits) {
    IgnoreCyclesResolver resolver;
    int value = 0;
    bool exists = true;
    EXPECT_TRUE(resolver.getReference(&value, exists).empty());
    EXPECT_FALSE(exists);
    EXPECT_TRUE(resolver.getReference(&value, exists).empty());
    EXPECT_TRUE(exists);
    EXPECT_THROW((void)resolver.resolveReference("ref1"), error::LogicError);
}
