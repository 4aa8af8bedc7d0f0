/*
 * type_builder.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Fluent construction of the type metadata registry

**************************************************/

#include "type_builder.hpp"

#include <algorithm>
#include <tuple>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace yamlet {

TypeRegistryBuilder::TypeRegistryBuilder() {
    add<bool>();
    add<int>();
    add<std::int64_t>();
    add<std::uint64_t>();
    add<double>();
    add<std::string>();
}

TypeRegistryBuilder::TypeRegistryBuilder(const SerializerOptions& options)
    : TypeRegistryBuilder() {
    naming_ = options.namingPolicy();
    ordering_ = options.propertyOrdering();
}

auto TypeRegistryBuilder::declare(std::type_index type, std::string name,
                                  std::shared_ptr<const Converter> converter)
    -> detail::TypeDraft& {
    auto it = drafts_.find(type);
    if (it != drafts_.end()) {
        if (!it->second.automatic) {
            THROW_INVALID_CONFIGURATION("type", "'", name,
                                        "' is registered twice");
        }
        it->second = detail::TypeDraft{std::move(name), type,
                                       std::move(converter)};
        return it->second;
    }
    order_.push_back(type);
    return drafts_
        .emplace(type,
                 detail::TypeDraft{std::move(name), type, std::move(converter)})
        .first->second;
}

void TypeRegistryBuilder::declareAutomatic(
    std::type_index type, std::string name,
    std::shared_ptr<const Converter> converter) {
    order_.push_back(type);
    detail::TypeDraft draft{std::move(name), type, std::move(converter)};
    draft.automatic = true;
    drafts_.emplace(type, std::move(draft));
}

void TypeRegistryBuilder::sortProperties(
    std::vector<PropertyInfo>& properties) const {
    switch (ordering_) {
        case PropertyOrdering::DeclarationOrder:
            std::stable_sort(properties.begin(), properties.end(),
                             [](const PropertyInfo& a, const PropertyInfo& b) {
                                 return std::tie(a.order, a.index) <
                                        std::tie(b.order, b.index);
                             });
            break;
        case PropertyOrdering::Alphabetical:
            std::stable_sort(properties.begin(), properties.end(),
                             [](const PropertyInfo& a, const PropertyInfo& b) {
                                 return std::tie(a.wireName, a.index) <
                                        std::tie(b.wireName, b.index);
                             });
            break;
        case PropertyOrdering::OrderedThenAlphabetical:
            // Equal explicit orders fall back to the wire name.
            std::stable_sort(properties.begin(), properties.end(),
                             [](const PropertyInfo& a, const PropertyInfo& b) {
                                 return std::tie(a.order, a.wireName, a.index) <
                                        std::tie(b.order, b.wireName, b.index);
                             });
            break;
    }
}

auto TypeRegistryBuilder::finish(const detail::TypeDraft& draft) const
    -> std::shared_ptr<const TypeInfo> {
    if (draft.converter) {
        return std::make_shared<TypeInfo>(draft.name, draft.type,
                                          draft.converter);
    }

    ObjectContract contract;
    contract.properties.reserve(draft.properties.size());
    std::unordered_set<std::string> wireNames;
    for (std::size_t i = 0; i < draft.properties.size(); ++i) {
        PropertyInfo property = draft.properties[i].info;
        if (!draft.properties[i].explicitWireName) {
            property.wireName = naming::convert(property.declaredName, naming_);
        }
        property.index = i;
        if (!wireNames.insert(property.wireName).second) {
            THROW_INVALID_CONFIGURATION("wireName", "'", property.wireName,
                                        "' is used twice in '", draft.name,
                                        "'");
        }
        contract.properties.push_back(std::move(property));
    }

    // A subtype is written as a mapping that carries its discriminator, so
    // it needs an object contract.
    auto checkValues = [this, &draft](const DiscriminatorMap& map) {
        std::unordered_set<std::string> values;
        for (const auto& derived : map.types) {
            if (!values.insert(derived.discriminator).second) {
                THROW_INVALID_CONFIGURATION(
                    "discriminator", "value '", derived.discriminator,
                    "' is used twice in '", draft.name, "'");
            }
            auto subtype = drafts_.find(derived.type);
            if (subtype != drafts_.end() && subtype->second.converter) {
                THROW_INVALID_CONFIGURATION(
                    "derived", "'", subtype->second.name,
                    "' uses a converter and cannot be a subtype of '",
                    draft.name, "'");
            }
        }
    };

    // Sibling discriminators are declared by property name; on the wire
    // they are looked up by the sibling's wire name.
    for (auto& property : contract.properties) {
        if (!property.sibling) {
            continue;
        }
        auto source = std::find_if(
            draft.properties.begin(), draft.properties.end(),
            [&property](const detail::PropertyDraft& candidate) {
                return candidate.info.declaredName ==
                       property.sibling->propertyName;
            });
        if (source == draft.properties.end()) {
            THROW_INVALID_CONFIGURATION(
                "siblingDiscriminator", "'", property.sibling->propertyName,
                "' is not a property of '", draft.name, "'");
        }
        const auto& resolved = contract.properties[static_cast<std::size_t>(
            source - draft.properties.begin())];
        property.sibling->propertyName = resolved.wireName;
        checkValues(*property.sibling);
    }

    sortProperties(contract.properties);

    auto info = std::make_shared<TypeInfo>(draft.name, draft.type,
                                           std::move(contract));
    if (draft.polymorphism) {
        checkValues(*draft.polymorphism);
        info->setPolymorphism(*draft.polymorphism);
    }
    return info;
}

auto TypeRegistryBuilder::build() const -> std::shared_ptr<const TypeRegistry> {
    auto registry = std::make_shared<TypeRegistry>();
    registry->naming_policy_ = naming_;
    registry->property_ordering_ = ordering_;
    for (const auto& type : order_) {
        registry->types_.insert_or_assign(type, finish(drafts_.at(type)));
    }

    for (const auto& [type, referencedBy] : required_) {
        if (registry->find(type) == nullptr) {
            THROW_MISSING_TYPE_METADATA(demangle(type), ": referenced by '",
                                        referencedBy, "' but never declared");
        }
    }

    spdlog::debug("serializer: type registry built with {} type(s)",
                  registry->size());
    return registry;
}

}  // namespace yamlet
