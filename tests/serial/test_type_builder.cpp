#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "yamlet/serial/dispatch.hpp"
#include "yamlet/serial/type_builder.hpp"
#include "yamlet/yaml/errors.hpp"

using namespace yamlet;
using ::testing::ElementsAre;

namespace {

struct Engine {
    int power{0};
};

struct Vehicle {
    virtual ~Vehicle() = default;
    std::string modelName;
    int wheelCount{4};
    std::vector<Engine> engines;
};

struct Truck : Vehicle {
    double payload{0.0};
};

struct Bike : Vehicle {};

struct Fleet {
    Truck lead;
};

// Writes a truck as its bare payload.
class PayloadConverter : public TypedConverter<Truck> {
public:
    void writeValue(WriteContext& context, const Truck& value) const override {
        context.writer().writeDouble(value.payload);
    }

    void readValue(ReadContext& context, Truck& value) const override {
        value.payload = std::stod(context.reader().value());
    }
};

auto wireNames(const TypeInfo& info) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& property : info.contract()->properties) {
        names.push_back(property.wireName);
    }
    return names;
}

}  // namespace

class TypeRegistryBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        builder_.object<Engine>("Engine").property<&Engine::power>("power");
    }

    TypeRegistryBuilder builder_;
};

TEST_F(TypeRegistryBuilderTest, BuiltinsAreRegistered) {
    auto registry = builder_.build();
    EXPECT_TRUE(registry->contains<bool>());
    EXPECT_TRUE(registry->contains<int>());
    EXPECT_TRUE(registry->contains<double>());
    EXPECT_TRUE(registry->contains<std::string>());
    EXPECT_EQ(registry->get<std::string>().name(), "string");
    EXPECT_NE(registry->get<int>().converter(), nullptr);
    EXPECT_EQ(registry->get<Engine>().converter(), nullptr);
    EXPECT_NE(registry->get<Engine>().contract(), nullptr);
}

TEST_F(TypeRegistryBuilderTest, ContainersAreRegisteredOnDemand) {
    builder_.object<Vehicle>("Vehicle")
        .property<&Vehicle::modelName>("modelName")
        .property<&Vehicle::engines>("engines");
    auto registry = builder_.build();
    EXPECT_TRUE(registry->contains<std::vector<Engine>>());
    EXPECT_TRUE(registry->get<std::vector<Engine>>().converter()->isCollection());
    using Counts = std::map<std::string, int>;
    EXPECT_FALSE(registry->contains<Counts>());
}

TEST_F(TypeRegistryBuilderTest, NamingPolicyProducesWireNames) {
    builder_.object<Vehicle>("Vehicle")
        .property<&Vehicle::modelName>("modelName")
        .property<&Vehicle::wheelCount>("wheelCount").wireName("WHEELS");
    auto registry = builder_.build();
    EXPECT_THAT(wireNames(registry->get<Vehicle>()),
                ElementsAre("model-name", "WHEELS"));

    SerializerOptions options;
    options.setNamingPolicy(NamingPolicy::CamelCase);
    TypeRegistryBuilder camel(options);
    camel.object<Vehicle>("Vehicle").property<&Vehicle::modelName>("ModelName");
    EXPECT_THAT(wireNames(camel.build()->get<Vehicle>()),
                ElementsAre("modelName"));
}

TEST_F(TypeRegistryBuilderTest, ExplicitOrderComesFirst) {
    builder_.object<Vehicle>("Vehicle")
        .property<&Vehicle::modelName>("modelName")
        .property<&Vehicle::wheelCount>("wheelCount").order(0)
        .property<&Vehicle::engines>("engines");
    EXPECT_THAT(wireNames(builder_.build()->get<Vehicle>()),
                ElementsAre("wheel-count", "model-name", "engines"));
}

TEST_F(TypeRegistryBuilderTest, OrderedThenAlphabetical) {
    SerializerOptions options;
    options.setPropertyOrdering(PropertyOrdering::OrderedThenAlphabetical);
    TypeRegistryBuilder builder(options);
    builder.object<Engine>("Engine").property<&Engine::power>("power");
    builder.object<Vehicle>("Vehicle")
        .property<&Vehicle::wheelCount>("wheelCount")
        .property<&Vehicle::modelName>("modelName").order(1)
        .property<&Vehicle::engines>("engines");
    EXPECT_THAT(wireNames(builder.build()->get<Vehicle>()),
                ElementsAre("model-name", "engines", "wheel-count"));
}

TEST_F(TypeRegistryBuilderTest, PropertyFlags) {
    builder_.object<Vehicle>("Vehicle")
        .property<&Vehicle::modelName>("modelName").required()
        .property<&Vehicle::wheelCount>("wheelCount").readOnly()
        .field<&Vehicle::engines>("engines")
            .ignore(IgnoreCondition::WhenDefault);
    auto registry = builder_.build();
    const auto& properties = registry->get<Vehicle>().contract()->properties;
    ASSERT_EQ(properties.size(), 3u);
    EXPECT_TRUE(properties[0].required);
    EXPECT_FALSE(properties[0].isReadOnly());
    EXPECT_TRUE(properties[1].isReadOnly());
    EXPECT_TRUE(properties[2].isField);
    EXPECT_EQ(properties[2].ignore, IgnoreCondition::WhenDefault);
}

TEST_F(TypeRegistryBuilderTest, Polymorphism) {
    builder_.object<Vehicle>("Vehicle")
        .property<&Vehicle::modelName>("modelName")
        .polymorphic("kind")
        .derived<Truck>("truck")
        .derived<Bike>("bike");
    builder_.object<Truck>("Truck").property<&Truck::payload>("payload");
    builder_.object<Bike>("Bike");
    auto registry = builder_.build();

    const auto* map = registry->get<Vehicle>().polymorphism();
    ASSERT_NE(map, nullptr);
    EXPECT_EQ(map->propertyName, "kind");
    ASSERT_NE(map->findByValue("truck"), nullptr);
    EXPECT_EQ(map->findByValue("truck")->type, std::type_index(typeid(Truck)));
    EXPECT_EQ(map->findByType(typeid(Bike))->discriminator, "bike");
    EXPECT_EQ(map->findByValue("boat"), nullptr);
}

TEST_F(TypeRegistryBuilderTest, UndeclaredSubtype) {
    builder_.object<Vehicle>("Vehicle")
        .polymorphic("kind")
        .derived<Truck>("truck");
    try {
        (void)builder_.build();
        FAIL() << "expected a MissingTypeMetadataError";
    } catch (const MissingTypeMetadataError& e) {
        EXPECT_THAT(e.typeName(), ::testing::HasSubstr("Truck"));
    }
}

TEST_F(TypeRegistryBuilderTest, UndeclaredPropertyType) {
    TypeRegistryBuilder builder;
    builder.object<Vehicle>("Vehicle").property<&Vehicle::engines>("engines");
    EXPECT_THROW((void)builder.build(), MissingTypeMetadataError);
}

TEST_F(TypeRegistryBuilderTest, DerivedNeedsPolymorphicBase) {
    auto vehicle = builder_.object<Vehicle>("Vehicle");
    EXPECT_THROW(vehicle.derived<Truck>("truck"), InvalidConfigurationError);
}

TEST_F(TypeRegistryBuilderTest, DuplicateRegistrations) {
    try {
        builder_.object<Engine>("Engine");
        FAIL() << "expected an InvalidConfigurationError";
    } catch (const InvalidConfigurationError& e) {
        EXPECT_EQ(e.option(), "type");
    }
}

TEST_F(TypeRegistryBuilderTest, DuplicateWireNames) {
    builder_.object<Vehicle>("Vehicle")
        .property<&Vehicle::modelName>("modelName")
        .property<&Vehicle::wheelCount>("wheelCount").wireName("model-name");
    try {
        (void)builder_.build();
        FAIL() << "expected an InvalidConfigurationError";
    } catch (const InvalidConfigurationError& e) {
        EXPECT_EQ(e.option(), "wireName");
    }
}

TEST_F(TypeRegistryBuilderTest, DuplicateDiscriminatorValues) {
    builder_.object<Vehicle>("Vehicle")
        .polymorphic("kind")
        .derived<Truck>("x")
        .derived<Bike>("x");
    builder_.object<Truck>("Truck");
    builder_.object<Bike>("Bike");
    EXPECT_THROW((void)builder_.build(), InvalidConfigurationError);
}

TEST_F(TypeRegistryBuilderTest, SubtypesNeedAnObjectContract) {
    builder_.object<Vehicle>("Vehicle")
        .polymorphic("kind")
        .derived<Truck>("truck")
        .derived<Bike>("bike");
    builder_.converter<Truck>("Truck", std::make_shared<PayloadConverter>());
    builder_.object<Bike>("Bike");
    try {
        (void)builder_.build();
        FAIL() << "expected an InvalidConfigurationError";
    } catch (const InvalidConfigurationError& e) {
        EXPECT_EQ(e.option(), "derived");
        EXPECT_THAT(e.what(), ::testing::HasSubstr("Truck"));
    }
}

TEST_F(TypeRegistryBuilderTest, ConvertedTypesStayUsableAsProperties) {
    builder_.converter<Truck>("Truck", std::make_shared<PayloadConverter>());
    builder_.object<Fleet>("Fleet").property<&Fleet::lead>("lead");
    auto registry = builder_.build();
    EXPECT_NE(registry->get<Truck>().converter(), nullptr);
}

TEST_F(TypeRegistryBuilderTest, NullConverter) {
    EXPECT_THROW(builder_.converter<Vehicle>("Vehicle", nullptr),
                 InvalidConfigurationError);
}

TEST_F(TypeRegistryBuilderTest, UnknownTypeLookup) {
    auto registry = builder_.build();
    EXPECT_EQ(registry->find(typeid(Vehicle)), nullptr);
    EXPECT_THROW((void)registry->get<Vehicle>(), MissingTypeMetadataError);
}
