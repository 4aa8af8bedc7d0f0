/*
 * type_info.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Static type metadata graph driving the serializer

**************************************************/

#include "type_info.hpp"

#include <algorithm>
#include <cstdlib>

#ifndef _MSC_VER
#include <cxxabi.h>
#endif

#include "yamlet/error/exception.hpp"
#include "yamlet/yaml/errors.hpp"

namespace yamlet {

namespace {

auto demangleName(const char* mangled) -> std::string {
#ifdef _MSC_VER
    return mangled;
#else
    int status = -1;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
    return mangled;
#endif
}

}  // namespace

auto demangle(const std::type_info& type) -> std::string {
    return demangleName(type.name());
}

auto demangle(std::type_index type) -> std::string {
    return demangleName(type.name());
}

auto Converter::formatKey(const void* /*value*/) const -> std::string {
    THROW_LOGIC_ERROR("This type cannot be used as a mapping key");
}

void Converter::parseKey(std::string_view text, void* /*value*/,
                         const Mark& mark) const {
    THROW_PARSE_ERROR(mark, "Key '", text,
                      "' cannot be read: this type cannot be a mapping key");
}

auto DiscriminatorMap::findByValue(std::string_view value) const
    -> const DerivedType* {
    for (const auto& derived : types) {
        if (derived.discriminator == value) {
            return &derived;
        }
    }
    return nullptr;
}

auto DiscriminatorMap::findByType(std::type_index type) const
    -> const DerivedType* {
    for (const auto& derived : types) {
        if (derived.type == type) {
            return &derived;
        }
    }
    return nullptr;
}

auto ObjectContract::find(std::string_view wireName) const
    -> const PropertyInfo* {
    for (const auto& property : properties) {
        if (property.wireName == wireName) {
            return &property;
        }
    }
    return nullptr;
}

auto ObjectContract::match(std::string_view key) const -> const PropertyInfo* {
    if (const auto* exact = find(key)) {
        return exact;
    }
    std::string normalized = naming::normalize(key);
    for (const auto& property : properties) {
        if (naming::normalize(property.wireName) == normalized) {
            return &property;
        }
    }
    return nullptr;
}

auto ObjectContract::hasSiblingDiscriminators() const -> bool {
    return std::any_of(
        properties.begin(), properties.end(),
        [](const PropertyInfo& property) { return property.sibling.has_value(); });
}

TypeInfo::TypeInfo(std::string name, std::type_index type, Kind kind)
    : name_(std::move(name)), type_(type), kind_(std::move(kind)) {}

auto TypeInfo::converter() const -> const Converter* {
    if (const auto* converter =
            std::get_if<std::shared_ptr<const Converter>>(&kind_)) {
        return converter->get();
    }
    return nullptr;
}

auto TypeInfo::contract() const -> const ObjectContract* {
    return std::get_if<ObjectContract>(&kind_);
}

auto TypeInfo::contract() -> ObjectContract* {
    return std::get_if<ObjectContract>(&kind_);
}

auto TypeRegistry::find(std::type_index type) const -> const TypeInfo* {
    auto it = types_.find(type);
    return it != types_.end() ? it->second.get() : nullptr;
}

auto TypeRegistry::get(std::type_index type) const -> const TypeInfo& {
    const auto* info = find(type);
    if (info == nullptr) {
        THROW_MISSING_TYPE_METADATA(demangle(type));
    }
    return *info;
}

}  // namespace yamlet
