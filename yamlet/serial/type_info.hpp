/*
 * type_info.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Static type metadata graph driving the serializer

**************************************************/

#ifndef YAMLET_SERIAL_TYPE_INFO_HPP
#define YAMLET_SERIAL_TYPE_INFO_HPP

#include <concepts>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <variant>
#include <vector>

#include "yamlet/serial/naming_policy.hpp"
#include "yamlet/serial/options.hpp"

namespace yamlet {

class WriteContext;
class ReadContext;

/**
 * @brief Readable name of a C++ type (demangled where the ABI allows it).
 */
[[nodiscard]] auto demangle(const std::type_info& type) -> std::string;
[[nodiscard]] auto demangle(std::type_index type) -> std::string;

// Holders

template <typename T>
struct SlotTraits {
    using value_type = T;
    static constexpr bool kOptional = false;
    static constexpr bool kShared = false;
};

template <typename T>
struct SlotTraits<std::optional<T>> {
    using value_type = T;
    static constexpr bool kOptional = true;
    static constexpr bool kShared = false;
};

template <typename T>
struct SlotTraits<std::shared_ptr<T>> {
    using value_type = T;
    static constexpr bool kOptional = false;
    static constexpr bool kShared = true;
};

/**
 * @brief The value type stored by a slot: `U` for `U`, `std::optional<U>`
 * and `std::shared_ptr<U>`.
 */
template <typename S>
using SlotValue = typename SlotTraits<std::remove_cv_t<S>>::value_type;

enum class HolderKind { Value, Optional, Shared };

/**
 * @brief Type-erased access to a storage slot.
 *
 * A slot is the storage of one property or container element. It holds a
 * value directly, in a `std::optional` or behind a `std::shared_ptr`; the
 * function pointers hide which, so the dispatch engine walks every slot the
 * same way.
 */
struct SlotOps {
    HolderKind holder;
    std::type_index valueType;
    bool polymorphic;

    /// Pointer to the held value, nullptr when the slot is empty.
    const void* (*get)(const void* slot);

    /// Default-constructs a value in the slot and returns it; nullptr when the
    /// value type cannot be default-constructed (abstract bases).
    void* (*emplace)(void* slot);

    /// Empties the slot (a value holder is reset to a default value).
    void (*reset)(void* slot);

    /// Copies a value of the slot's value type into the slot.
    void (*assignValue)(void* slot, const void* value);

    /// Identity of the complete object behind a value pointer.
    const void* (*identity)(const void* value);

    /// Dynamic type of the value behind a value pointer.
    std::type_index (*dynamicType)(const void* value);

    /// True when the slot equals a default-constructed slot.
    bool (*isDefault)(const void* slot);

    /// Shared holders: the owning pointer, and assignment from one.
    std::shared_ptr<void> (*share)(void* slot);
    void (*assignShared)(void* slot, std::shared_ptr<void> value);
};

namespace detail {

template <typename S>
auto makeSlotOps() -> SlotOps {
    using Traits = SlotTraits<S>;
    using U = typename Traits::value_type;

    SlotOps ops{
        Traits::kShared     ? HolderKind::Shared
        : Traits::kOptional ? HolderKind::Optional
                            : HolderKind::Value,
        std::type_index(typeid(U)),
        std::is_polymorphic_v<U>,
        nullptr,
        nullptr,
        nullptr,
        nullptr,
        nullptr,
        nullptr,
        nullptr,
        nullptr,
        nullptr};

    ops.get = [](const void* slot) -> const void* {
        const auto& s = *static_cast<const S*>(slot);
        if constexpr (Traits::kShared) {
            return s.get();
        } else if constexpr (Traits::kOptional) {
            return s.has_value() ? &*s : nullptr;
        } else {
            return &s;
        }
    };
    ops.emplace = [](void* slot) -> void* {
        auto& s = *static_cast<S*>(slot);
        if constexpr (Traits::kShared) {
            if constexpr (!std::is_abstract_v<U> &&
                          std::is_default_constructible_v<U>) {
                s = std::make_shared<U>();
                return s.get();
            } else {
                return nullptr;
            }
        } else if constexpr (Traits::kOptional) {
            return &s.emplace();
        } else {
            // Types with const members keep their freshly constructed state.
            if constexpr (std::is_move_assignable_v<S>) {
                s = S{};
            }
            return &s;
        }
    };
    ops.reset = [](void* slot) {
        auto& s = *static_cast<S*>(slot);
        if constexpr (Traits::kShared || Traits::kOptional) {
            s.reset();
        } else if constexpr (std::is_move_assignable_v<S>) {
            s = S{};
        }
    };
    if constexpr (Traits::kShared) {
        if constexpr (std::is_copy_constructible_v<U> &&
                      !std::is_abstract_v<U>) {
            ops.assignValue = [](void* slot, const void* value) {
                *static_cast<S*>(slot) =
                    std::make_shared<U>(*static_cast<const U*>(value));
            };
        }
    } else if constexpr (std::is_copy_assignable_v<U>) {
        ops.assignValue = [](void* slot, const void* value) {
            *static_cast<S*>(slot) = *static_cast<const U*>(value);
        };
    }
    ops.identity = [](const void* value) -> const void* {
        if constexpr (std::is_polymorphic_v<U>) {
            return dynamic_cast<const void*>(static_cast<const U*>(value));
        } else {
            return value;
        }
    };
    ops.dynamicType = [](const void* value) -> std::type_index {
        if constexpr (std::is_polymorphic_v<U>) {
            return std::type_index(typeid(*static_cast<const U*>(value)));
        } else {
            return std::type_index(typeid(U));
        }
    };
    ops.isDefault = [](const void* slot) -> bool {
        const auto& s = *static_cast<const S*>(slot);
        if constexpr (Traits::kShared || Traits::kOptional) {
            return !s;
        } else if constexpr (std::is_arithmetic_v<S> || std::is_enum_v<S> ||
                             std::is_same_v<S, std::string>) {
            return s == S{};
        } else if constexpr (requires { s.empty(); }) {
            return s.empty();
        } else if constexpr (std::equality_comparable<S> &&
                             std::is_default_constructible_v<S>) {
            return s == S{};
        } else {
            return false;
        }
    };
    if constexpr (Traits::kShared) {
        ops.share = [](void* slot) -> std::shared_ptr<void> {
            return *static_cast<S*>(slot);
        };
        ops.assignShared = [](void* slot, std::shared_ptr<void> value) {
            *static_cast<S*>(slot) = std::static_pointer_cast<U>(value);
        };
    }
    return ops;
}

}  // namespace detail

/**
 * @brief Slot accessors of a slot type, created once per type.
 */
template <typename S>
auto slotOpsFor() -> const SlotOps& {
    static const SlotOps ops = detail::makeSlotOps<std::remove_cv_t<S>>();
    return ops;
}

// Converters

/**
 * @brief Opaque read/write pair for a type.
 *
 * Built-in scalar, enum and container types use converters; user code can
 * supply its own for types that should not be written as a property map.
 * A converter may call back into the context to write or read nested values
 * with the engine's own logic.
 */
class Converter {
public:
    virtual ~Converter() = default;

    virtual void write(WriteContext& context, const void* value) const = 0;

    /**
     * @brief Reads the node at the reader's current token into value, which
     * holds a default-constructed object.
     */
    virtual void read(ReadContext& context, void* value) const = 0;

    /**
     * @brief Sequences and maps; they honour EmptyCollectionHandling.
     */
    [[nodiscard]] virtual auto isCollection() const -> bool { return false; }

    /**
     * @brief Text of a value used as a mapping key.
     * @throws error::LogicError for types that cannot be keys.
     */
    [[nodiscard]] virtual auto formatKey(const void* value) const
        -> std::string;
    virtual void parseKey(std::string_view text, void* value,
                          const Mark& mark) const;

    /**
     * @brief Style requested for keys produced by formatKey().
     */
    [[nodiscard]] virtual auto keyStyle() const -> ScalarStyle {
        return ScalarStyle::Any;
    }
};

/**
 * @brief Typed convenience base for user converters.
 */
template <typename T>
class TypedConverter : public Converter {
public:
    virtual void writeValue(WriteContext& context, const T& value) const = 0;
    virtual void readValue(ReadContext& context, T& value) const = 0;

    void write(WriteContext& context, const void* value) const final {
        writeValue(context, *static_cast<const T*>(value));
    }

    void read(ReadContext& context, void* value) const final {
        readValue(context, *static_cast<T*>(value));
    }
};

// Metadata

enum class IgnoreCondition {
    Never,       ///< Always written
    Always,      ///< Never written nor read
    WhenNull,    ///< Skipped when the slot is empty
    WhenDefault  ///< Skipped when the slot equals its default value
};

inline constexpr int kUnordered = std::numeric_limits<int>::max();

/**
 * @brief One concrete type a polymorphic base can resolve to.
 */
struct DerivedType {
    std::string discriminator;
    std::type_index type;
    std::type_index base;

    /// Base pointer to derived pointer.
    const void* (*fromBase)(const void* base);
    void* (*fromBaseMutable)(void* base);

    /// New derived object, returned as a pointer to its base subobject.
    std::shared_ptr<void> (*create)();
};

template <typename Base, typename Derived>
auto makeDerivedType(std::string discriminator) -> DerivedType {
    static_assert(std::is_base_of_v<Base, Derived>,
                  "Derived must derive from Base");
    return DerivedType{
        std::move(discriminator), std::type_index(typeid(Derived)),
        std::type_index(typeid(Base)),
        [](const void* base) -> const void* {
            return static_cast<const Derived*>(static_cast<const Base*>(base));
        },
        [](void* base) -> void* {
            return static_cast<Derived*>(static_cast<Base*>(base));
        },
        []() -> std::shared_ptr<void> {
            std::shared_ptr<Base> object = std::make_shared<Derived>();
            return object;
        }};
}

/**
 * @brief Discriminator value to concrete type table.
 *
 * For a polymorphic base the discriminator is a key of the object itself;
 * for a sibling discriminator it is another property of the owning object.
 */
struct DiscriminatorMap {
    std::string propertyName;  ///< Wire name of the discriminator key
    bool sibling{false};
    std::vector<DerivedType> types;

    [[nodiscard]] auto findByValue(std::string_view value) const
        -> const DerivedType*;
    [[nodiscard]] auto findByType(std::type_index type) const
        -> const DerivedType*;
};

/**
 * @brief Metadata of one property of an object type.
 */
struct PropertyInfo {
    std::string declaredName;
    std::string wireName;
    std::type_index declaredType;
    const SlotOps* slot{nullptr};
    bool required{false};
    bool isField{false};
    int order{kUnordered};
    std::size_t index{0};  ///< Declaration index
    IgnoreCondition ignore{IgnoreCondition::Never};

    /// Pointer to the property's slot inside an object.
    const void* (*getter)(const void* object){nullptr};

    /// Mutable slot pointer; nullptr for read-only properties.
    void* (*setter)(void* object){nullptr};

    std::optional<DiscriminatorMap> sibling;

    [[nodiscard]] auto isReadOnly() const -> bool { return setter == nullptr; }
};

/**
 * @brief Property list of an object type, in serialization order.
 */
struct ObjectContract {
    std::vector<PropertyInfo> properties;

    [[nodiscard]] auto find(std::string_view wireName) const
        -> const PropertyInfo*;

    /**
     * @brief Exact wire name first, then a separator and case insensitive
     * match.
     */
    [[nodiscard]] auto match(std::string_view key) const -> const PropertyInfo*;
    [[nodiscard]] auto hasSiblingDiscriminators() const -> bool;
};

/**
 * @brief Metadata node of one type: either a converter or a property list,
 * plus an optional polymorphic discriminator map.
 */
class TypeInfo {
public:
    using Kind = std::variant<std::shared_ptr<const Converter>, ObjectContract>;

    TypeInfo(std::string name, std::type_index type, Kind kind);

    [[nodiscard]] auto name() const -> const std::string& { return name_; }
    [[nodiscard]] auto type() const -> std::type_index { return type_; }

    /**
     * @brief The converter, nullptr for object types.
     */
    [[nodiscard]] auto converter() const -> const Converter*;

    /**
     * @brief The property list, nullptr for converter types.
     */
    [[nodiscard]] auto contract() const -> const ObjectContract*;
    auto contract() -> ObjectContract*;

    [[nodiscard]] auto polymorphism() const -> const DiscriminatorMap* {
        return polymorphism_ ? &*polymorphism_ : nullptr;
    }
    void setPolymorphism(DiscriminatorMap map) {
        polymorphism_ = std::move(map);
    }
    auto polymorphism() -> DiscriminatorMap* {
        return polymorphism_ ? &*polymorphism_ : nullptr;
    }

private:
    std::string name_;
    std::type_index type_;
    Kind kind_;
    std::optional<DiscriminatorMap> polymorphism_;
};

/**
 * @brief Immutable table of type metadata, built by TypeRegistryBuilder and
 * shared read-only by every serializer call.
 */
class TypeRegistry {
public:
    [[nodiscard]] auto find(std::type_index type) const -> const TypeInfo*;

    /**
     * @throws MissingTypeMetadataError if the type was not registered.
     */
    [[nodiscard]] auto get(std::type_index type) const -> const TypeInfo&;

    template <typename T>
    [[nodiscard]] auto get() const -> const TypeInfo& {
        return get(std::type_index(typeid(T)));
    }

    template <typename T>
    [[nodiscard]] auto contains() const -> bool {
        return find(std::type_index(typeid(T))) != nullptr;
    }

    [[nodiscard]] auto size() const -> std::size_t { return types_.size(); }
    [[nodiscard]] auto namingPolicy() const -> NamingPolicy {
        return naming_policy_;
    }
    [[nodiscard]] auto propertyOrdering() const -> PropertyOrdering {
        return property_ordering_;
    }

private:
    friend class TypeRegistryBuilder;

    std::unordered_map<std::type_index, std::shared_ptr<const TypeInfo>> types_;
    NamingPolicy naming_policy_{NamingPolicy::KebabCase};
    PropertyOrdering property_ordering_{PropertyOrdering::DeclarationOrder};
};

}  // namespace yamlet

#endif  // YAMLET_SERIAL_TYPE_INFO_HPP
