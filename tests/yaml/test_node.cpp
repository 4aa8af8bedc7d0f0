#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "yamlet/error/exception.hpp"
#include "yamlet/yaml/errors.hpp"
#include "yamlet/yaml/node.hpp"

using namespace yamlet;

class NodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        pet_ = NodeParser::load(
            "name: Rex\n"
            "age: 3\n"
            "weight: 12.5\n"
            "vaccinated: true\n"
            "owner:\n"
            "toys:\n"
            "  - ball\n"
            "  - '42'\n");
    }

    Node pet_;
};

TEST_F(NodeTest, ScalarsKeepTheirInferredType) {
    ASSERT_TRUE(pet_.isMapping());
    EXPECT_EQ(pet_.size(), 6u);
    EXPECT_EQ(pet_["name"].asString(), "Rex");
    EXPECT_EQ(pet_["age"].asInt(), 3);
    EXPECT_DOUBLE_EQ(pet_["weight"].asDouble(), 12.5);
    EXPECT_DOUBLE_EQ(pet_["age"].asDouble(), 3.0);
    EXPECT_TRUE(pet_["vaccinated"].asBool());
    EXPECT_TRUE(pet_["owner"].isNull());
    EXPECT_EQ(pet_["toys"][1].asString(), "42");
}

TEST_F(NodeTest, KeyOrderIsPreserved) {
    std::vector<std::string> keys;
    for (const auto& [key, value] : pet_.asMapping()) {
        keys.push_back(key);
    }
    EXPECT_THAT(keys, ::testing::ElementsAre("name", "age", "weight",
                                             "vaccinated", "owner", "toys"));
}

TEST_F(NodeTest, WrongAccessThrows) {
    const Node& pet = pet_;
    EXPECT_THROW((void)pet["missing"], YamlException);
    EXPECT_THROW((void)pet["name"].asInt(), YamlException);
    EXPECT_THROW((void)pet["toys"][5], YamlException);
    EXPECT_THROW((void)pet["age"].asString(), YamlException);
}

TEST_F(NodeTest, Lookup) {
    EXPECT_TRUE(pet_.contains("toys"));
    EXPECT_FALSE(pet_.contains("collar"));
    EXPECT_EQ(pet_.find("collar"), nullptr);
    EXPECT_EQ(pet_.get("collar", Node("none")).asString(), "none");
    EXPECT_EQ(pet_.get("name", Node("none")).asString(), "Rex");
}

TEST_F(NodeTest, Mutation) {
    EXPECT_TRUE(pet_.set("age", Node(4)));
    EXPECT_FALSE(pet_.set("collar", Node("red")));
    EXPECT_EQ(pet_["age"].asInt(), 4);
    EXPECT_TRUE(pet_.remove("collar"));
    EXPECT_FALSE(pet_.remove("collar"));

    Node built;
    built["list"].push(Node(1));
    built["list"].push(Node("two"));
    EXPECT_EQ(built.toYaml(), "list:\n  - 1\n  - two\n");
}

TEST_F(NodeTest, Depth) {
    EXPECT_EQ(Node(1).depth(), 0);
    EXPECT_EQ(pet_.depth(), 2);
    EXPECT_EQ(NodeParser::load("[[[]]]").depth(), 3);
}

TEST_F(NodeTest, EmitsBlockYaml) {
    EXPECT_EQ(pet_.toYaml(),
              "name: Rex\n"
              "age: 3\n"
              "weight: 12.5\n"
              "vaccinated: true\n"
              "owner:\n"
              "toys:\n"
              "  - ball\n"
              "  - '42'\n");
}

TEST_F(NodeTest, FlowStyleIsKept) {
    auto node = NodeParser::load("point: {x: 1, y: 2}\n");
    EXPECT_EQ(node.toYaml(), "point: {x: 1, y: 2}\n");
}

TEST_F(NodeTest, ReloadProducesEqualTree) {
    auto again = NodeParser::load(pet_.toYaml());
    EXPECT_EQ(again, pet_);
}

TEST_F(NodeTest, AliasesCopyTheAnchoredNode) {
    auto node = NodeParser::load(
        "base: &b\n"
        "  size: 1\n"
        "copy: *b\n");
    EXPECT_EQ(node["copy"]["size"].asInt(), 1);
    EXPECT_EQ(node["base"].anchor(), "b");
    EXPECT_TRUE(node["copy"].anchor().empty());
}

TEST_F(NodeTest, UnknownAliasThrows) {
    EXPECT_THROW(NodeParser::load("a: *missing\n"), ReferenceNotFoundError);
}

TEST_F(NodeTest, AliasExpansionRespectsDepth) {
    ReaderOptions options;
    options.maxDepth = 3;
    EXPECT_THROW(NodeParser::load("a: &x\n  b:\n    c: 1\nd:\n  e: *x\n",
                                  options),
                 MaxDepthExceededError);
}

TEST_F(NodeTest, DuplicateKeysKeepTheLastValue) {
    auto node = NodeParser::load("a: 1\na: 2\n");
    EXPECT_EQ(node.size(), 1u);
    EXPECT_EQ(node["a"].asInt(), 2);
}

TEST_F(NodeTest, EmptyInputIsNull) {
    EXPECT_TRUE(NodeParser::load("").isNull());
    EXPECT_TRUE(NodeParser::load("# only a comment\n").isNull());
}

TEST_F(NodeTest, LoadAllDocuments) {
    auto documents = NodeParser::loadAll("a: 1\n---\n- x\n---\nplain\n");
    ASSERT_EQ(documents.size(), 3u);
    EXPECT_EQ(documents[0].root()["a"].asInt(), 1);
    EXPECT_EQ(documents[1].root()[std::size_t{0}].asString(), "x");
    EXPECT_EQ(documents[2].root().asString(), "plain");
}

TEST_F(NodeTest, LoadFile) {
    auto path = std::filesystem::temp_directory_path() / "yamlet_node_test.yaml";
    {
        std::ofstream out(path);
        out << "answer: 42\n";
    }
    EXPECT_EQ(NodeParser::loadFile(path)["answer"].asInt(), 42);
    std::filesystem::remove(path);

    EXPECT_THROW(NodeParser::loadFile(path), error::FailToOpenFile);
}
