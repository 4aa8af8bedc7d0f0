/*
 * type_builder.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Fluent construction of the type metadata registry

**************************************************/

#ifndef YAMLET_SERIAL_TYPE_BUILDER_HPP
#define YAMLET_SERIAL_TYPE_BUILDER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "yamlet/serial/converters.hpp"
#include "yamlet/serial/options.hpp"
#include "yamlet/serial/type_info.hpp"
#include "yamlet/yaml/errors.hpp"

namespace yamlet {

template <typename T>
struct MemberPointerTraits;

template <typename C, typename M>
struct MemberPointerTraits<M C::*> {
    using Class = C;
    using Member = M;
};

namespace detail {

/// Type whose concrete subtype a sibling discriminator selects.
template <typename M>
struct SiblingTarget {
    using type = SlotValue<M>;
};

template <MapContainer M>
struct SiblingTarget<M> {
    using type = SlotValue<typename M::mapped_type>;
};

template <SequenceContainer M>
struct SiblingTarget<M> {
    using type = SlotValue<typename M::value_type>;
};

struct PropertyDraft {
    PropertyInfo info;
    bool explicitWireName{false};
};

struct TypeDraft {
    std::string name;
    std::type_index type;
    std::shared_ptr<const Converter> converter;  ///< nullptr for objects
    std::vector<PropertyDraft> properties;
    std::optional<DiscriminatorMap> polymorphism;
    bool automatic{false};  ///< Registered implicitly, may be replaced
};

template <typename U>
auto builtinName() -> std::string {
    if constexpr (std::is_same_v<U, std::string>) {
        return "string";
    } else {
        return demangle(typeid(U));
    }
}

}  // namespace detail

class TypeRegistryBuilder;

template <typename T>
class ObjectBuilder;

/**
 * @brief Configures one property of an object type.
 *
 * Returned by ObjectBuilder::property(); the chaining methods at the bottom
 * forward to the owning ObjectBuilder so that a whole type can be declared
 * in one expression.
 */
template <typename T, auto Member>
class PropertyBuilder {
    using Slot = std::remove_cv_t<typename MemberPointerTraits<
        decltype(Member)>::Member>;

public:
    PropertyBuilder(ObjectBuilder<T> object, std::size_t index)
        : object_(object), index_(index) {}

    auto required(bool value = true) -> PropertyBuilder& {
        info().required = value;
        return *this;
    }

    auto order(int value) -> PropertyBuilder& {
        info().order = value;
        return *this;
    }

    auto ignore(IgnoreCondition condition) -> PropertyBuilder& {
        info().ignore = condition;
        return *this;
    }

    /**
     * @brief Written, but never assigned when reading.
     */
    auto readOnly() -> PropertyBuilder& {
        info().setter = nullptr;
        return *this;
    }

    /**
     * @brief Fixed wire name, exempt from the naming policy.
     */
    auto wireName(std::string name) -> PropertyBuilder& {
        info().wireName = std::move(name);
        draft().explicitWireName = true;
        return *this;
    }

    /**
     * @brief Selects the concrete type of this property from the value of
     * another property of the same object.
     * @param declaredName Declared name of the property holding the
     * discriminator value.
     */
    auto siblingDiscriminator(std::string declaredName) -> PropertyBuilder& {
        info().sibling = DiscriminatorMap{std::move(declaredName), true, {}};
        return *this;
    }

    template <typename Derived>
    auto when(std::string value) -> PropertyBuilder& {
        using Base = typename detail::SiblingTarget<Slot>::type;
        static_assert(std::is_polymorphic_v<Base>,
                      "sibling discriminators need a polymorphic base");
        if (!info().sibling) {
            THROW_INVALID_CONFIGURATION(
                "siblingDiscriminator", "call siblingDiscriminator() before "
                "when() on '", info().declaredName, "'");
        }
        info().sibling->types.push_back(
            makeDerivedType<Base, Derived>(std::move(value)));
        object_.owner().template require<Derived>(object_.name());
        return *this;
    }

    template <auto Next>
    auto property(std::string declaredName) {
        return object_.template property<Next>(std::move(declaredName));
    }

    template <auto Next>
    auto field(std::string declaredName) {
        return object_.template field<Next>(std::move(declaredName));
    }

    auto polymorphic(std::string discriminator) -> ObjectBuilder<T> {
        return object_.polymorphic(std::move(discriminator));
    }

    template <typename Derived>
    auto derived(std::string value) -> ObjectBuilder<T> {
        return object_.template derived<Derived>(std::move(value));
    }

    auto done() -> TypeRegistryBuilder& { return object_.done(); }

private:
    auto draft() -> detail::PropertyDraft& {
        return object_.draft().properties[index_];
    }
    auto info() -> PropertyInfo& { return draft().info; }

    ObjectBuilder<T> object_;
    std::size_t index_;
};

/**
 * @brief Declares the properties and subtypes of an object type.
 */
template <typename T>
class ObjectBuilder {
public:
    ObjectBuilder(TypeRegistryBuilder& owner, detail::TypeDraft& draft)
        : owner_(&owner), draft_(&draft) {}

    /**
     * @brief Adds a data member as a property. A const member is read-only.
     */
    template <auto Member>
    auto property(std::string declaredName) -> PropertyBuilder<T, Member> {
        return add<Member>(std::move(declaredName), false);
    }

    /**
     * @brief Adds a data member that is only serialized when fields are
     * included by the options.
     */
    template <auto Member>
    auto field(std::string declaredName) -> PropertyBuilder<T, Member> {
        return add<Member>(std::move(declaredName), true);
    }

    /**
     * @brief Makes the type a polymorphic base whose concrete type is
     * written under the given key.
     */
    auto polymorphic(std::string discriminator) -> ObjectBuilder& {
        static_assert(std::is_polymorphic_v<T>,
                      "a polymorphic base needs a virtual member");
        draft_->polymorphism =
            DiscriminatorMap{std::move(discriminator), false, {}};
        return *this;
    }

    template <typename Derived>
    auto derived(std::string value) -> ObjectBuilder&;

    auto done() -> TypeRegistryBuilder& { return *owner_; }

    auto owner() -> TypeRegistryBuilder& { return *owner_; }
    auto draft() -> detail::TypeDraft& { return *draft_; }
    [[nodiscard]] auto name() const -> const std::string& {
        return draft_->name;
    }

private:
    template <auto Member>
    auto add(std::string declaredName, bool isField)
        -> PropertyBuilder<T, Member>;

    TypeRegistryBuilder* owner_;
    detail::TypeDraft* draft_;
};

/**
 * @brief Collects type metadata and produces an immutable TypeRegistry.
 *
 * Scalars, strings and standard containers are registered on demand when
 * a property refers to them; objects, enums and custom converters are
 * declared explicitly. build() resolves wire names, applies the property
 * ordering and checks that every referenced type is known.
 *
 * @code
 * auto registry = yamlet::TypeRegistryBuilder(options)
 *     .object<Pet>("Pet")
 *         .property<&Pet::name>("Name").required()
 *         .property<&Pet::age>("Age")
 *     .done()
 *     .build();
 * @endcode
 */
class TypeRegistryBuilder {
public:
    TypeRegistryBuilder();

    /**
     * @brief Takes the naming policy and property ordering from options.
     */
    explicit TypeRegistryBuilder(const SerializerOptions& options);

    template <typename T>
    auto object(std::string name) -> ObjectBuilder<T> {
        static_assert(std::is_class_v<T>, "objects must be class types");
        auto& draft = declare(std::type_index(typeid(T)), std::move(name),
                              nullptr);
        return ObjectBuilder<T>(*this, draft);
    }

    template <typename E>
    auto enumeration(std::string name,
                     std::vector<std::pair<E, std::string>> names)
        -> TypeRegistryBuilder& {
        declare(std::type_index(typeid(E)), std::move(name),
                std::make_shared<EnumConverter<E>>(std::move(names)));
        return *this;
    }

    /**
     * @brief Registers a custom converter for T.
     */
    template <typename T>
    auto converter(std::string name, std::shared_ptr<const Converter> converter)
        -> TypeRegistryBuilder& {
        if (!converter) {
            THROW_INVALID_CONFIGURATION("converter", "null converter for '",
                                        name, "'");
        }
        declare(std::type_index(typeid(T)), std::move(name),
                std::move(converter));
        return *this;
    }

    /**
     * @brief Registers a scalar or container type used directly as a root
     * value, e.g. `std::vector<Pet>`.
     */
    template <typename T>
    auto add() -> TypeRegistryBuilder& {
        require<T>("root");
        return *this;
    }

    /**
     * @brief Makes sure the value type of slot type S is known: built-in
     * types are registered now, others must be declared before build().
     */
    template <typename S>
    void require(std::string_view referencedBy) {
        ensureType<SlotValue<S>>(referencedBy);
    }

    [[nodiscard]] auto namingPolicy() const -> NamingPolicy { return naming_; }
    [[nodiscard]] auto propertyOrdering() const -> PropertyOrdering {
        return ordering_;
    }

    /**
     * @throws MissingTypeMetadataError for referenced but undeclared types.
     * @throws InvalidConfigurationError for duplicate wire names or
     * discriminator values.
     */
    [[nodiscard]] auto build() const -> std::shared_ptr<const TypeRegistry>;

private:
    template <typename U>
    void ensureType(std::string_view referencedBy) {
        std::type_index type(typeid(U));
        if (drafts_.contains(type)) {
            return;
        }
        if constexpr (ScalarType<U>) {
            declareAutomatic(type, detail::builtinName<U>(),
                             std::make_shared<ScalarConverter<U>>());
        } else if constexpr (MapContainer<U>) {
            declareAutomatic(type, detail::builtinName<U>(),
                             std::make_shared<MapConverter<U>>());
            ensureType<typename U::key_type>(referencedBy);
            require<typename U::mapped_type>(referencedBy);
        } else if constexpr (SequenceContainer<U>) {
            declareAutomatic(type, detail::builtinName<U>(),
                             std::make_shared<SequenceConverter<U>>());
            require<typename U::value_type>(referencedBy);
        } else {
            required_.emplace_back(type, std::string(referencedBy));
        }
    }

    auto declare(std::type_index type, std::string name,
                 std::shared_ptr<const Converter> converter)
        -> detail::TypeDraft&;
    void declareAutomatic(std::type_index type, std::string name,
                          std::shared_ptr<const Converter> converter);
    [[nodiscard]] auto finish(const detail::TypeDraft& draft) const
        -> std::shared_ptr<const TypeInfo>;
    void sortProperties(std::vector<PropertyInfo>& properties) const;

    // Drafts are referenced by ObjectBuilder; node based storage keeps those
    // references valid while more types are added.
    std::unordered_map<std::type_index, detail::TypeDraft> drafts_;
    std::vector<std::type_index> order_;
    std::vector<std::pair<std::type_index, std::string>> required_;
    NamingPolicy naming_{NamingPolicy::KebabCase};
    PropertyOrdering ordering_{PropertyOrdering::DeclarationOrder};
};

// ObjectBuilder members that call back into TypeRegistryBuilder.

template <typename T>
template <typename Derived>
auto ObjectBuilder<T>::derived(std::string value) -> ObjectBuilder& {
    if (!draft_->polymorphism) {
        THROW_INVALID_CONFIGURATION("derived", "call polymorphic() on '",
                                    draft_->name, "' before adding subtypes");
    }
    draft_->polymorphism->types.push_back(
        makeDerivedType<T, Derived>(std::move(value)));
    owner_->template require<Derived>(draft_->name);
    return *this;
}

template <typename T>
template <auto Member>
auto ObjectBuilder<T>::add(std::string declaredName, bool isField)
    -> PropertyBuilder<T, Member> {
    using Traits = MemberPointerTraits<decltype(Member)>;
    using M = typename Traits::Member;
    using S = std::remove_cv_t<M>;
    static_assert(std::is_base_of_v<typename Traits::Class, T>,
                  "the member does not belong to this type");

    PropertyInfo info{declaredName, declaredName, std::type_index(typeid(S)),
                      &slotOpsFor<S>()};
    info.isField = isField;
    info.getter = [](const void* object) -> const void* {
        return &(static_cast<const T*>(object)->*Member);
    };
    if constexpr (!std::is_const_v<M>) {
        info.setter = [](void* object) -> void* {
            return &(static_cast<T*>(object)->*Member);
        };
    }
    draft_->properties.push_back(detail::PropertyDraft{std::move(info)});
    owner_->template require<S>(draft_->name);
    return PropertyBuilder<T, Member>(*this, draft_->properties.size() - 1);
}

}  // namespace yamlet

#endif  // YAMLET_SERIAL_TYPE_BUILDER_HPP
