#include "yamlet/serial/serializer.hpp"
#include "yamlet/serial/type_builder.hpp"
#include "yamlet/yaml/errors.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

using namespace yamlet;

struct Pet {
    virtual ~Pet() = default;
    std::string name;
    int age{0};
};

struct Dog : Pet {
    bool goodBoy{true};
};

struct Cat : Pet {
    int lives{9};
};

struct Owner {
    std::string firstName;
    std::vector<std::shared_ptr<Pet>> pets;
};

/**
 * Shows the basic round trip of a small object graph:
 * 1. Register the types once
 * 2. Write an owner with polymorphic pets
 * 3. Read it back, including keys in another naming convention
 * 4. Handle a missing required property
 */
int main() {
    spdlog::set_level(spdlog::level::debug);

    SerializerOptions options;
    options.setReferenceHandling(ReferenceHandling::Preserve);
    options.setTypeInfoSource(
        TypeRegistryBuilder(options)
            .object<Pet>("Pet")
                .property<&Pet::name>("name").required()
                .property<&Pet::age>("age")
                .polymorphic("type")
                .derived<Dog>("dog")
                .derived<Cat>("cat")
            .done()
            .object<Dog>("Dog")
                .property<&Dog::name>("name")
                .property<&Dog::age>("age")
                .property<&Dog::goodBoy>("goodBoy")
            .done()
            .object<Cat>("Cat")
                .property<&Cat::name>("name")
                .property<&Cat::age>("age")
                .property<&Cat::lives>("lives")
            .done()
            .object<Owner>("Owner")
                .property<&Owner::firstName>("firstName").required()
                .property<&Owner::pets>("pets")
            .done()
            .build());

    try {
        auto rex = std::make_shared<Dog>();
        rex->name = "Rex";
        rex->age = 3;
        auto tom = std::make_shared<Cat>();
        tom->name = "Tom";
        tom->lives = 7;

        Owner owner{"Alice", {rex, tom, rex}};
        std::string text = Serializer::serialize(owner, options);
        std::cout << "Serialized owner:\n" << text << "\n";

        auto copy = Serializer::deserialize<Owner>(text, options);
        std::cout << "Read back " << copy.pets.size() << " pets of "
                  << copy.firstName << ", first and last shared: "
                  << std::boolalpha << (copy.pets.front() == copy.pets.back())
                  << "\n";

        auto other = Serializer::deserialize<Owner>(
            "FIRST_NAME: Bob\npets:\n  - type: cat\n    Name: Kitty\n",
            options);
        std::cout << other.firstName << " owns " << other.pets.front()->name
                  << "\n";

        (void)Serializer::deserialize<Owner>("pets: []\n", options);
    } catch (const MissingRequiredPropertyError& e) {
        spdlog::error("missing property '{}' of {}", e.property(),
                      e.typeName());
    } catch (const YamlException& e) {
        spdlog::error("serialization failed: {}", e.what());
        return 1;
    }
    return 0;
}
