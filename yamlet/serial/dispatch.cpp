/*
 * dispatch.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Metadata driven traversal for serializing and deserializing
values through the YAML reader and writer

**************************************************/

#include "dispatch.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "yamlet/error/exception.hpp"
#include "yamlet/serial/naming_policy.hpp"
#include "yamlet/yaml/errors.hpp"

namespace yamlet {

DepthScope::DepthScope(int& depth, int maxDepth, std::optional<Mark> mark)
    : depth_(depth) {
    if (++depth_ > maxDepth) {
        int current = depth_;
        --depth_;
        THROW_MAX_DEPTH_EXCEEDED(maxDepth, current, mark);
    }
}

DepthScope::~DepthScope() { --depth_; }

// Writing

WriteContext::WriteContext(Writer& writer, const SerializerOptions& options,
                           const TypeRegistry& registry,
                           ReferenceResolver* references)
    : writer_(writer),
      options_(options),
      registry_(registry),
      references_(references) {}

auto WriteContext::enterScope() -> DepthScope {
    return DepthScope(depth_, options_.maxDepth());
}

void WriteContext::writeSlot(const SlotOps& ops, const void* slot) {
    const void* value = ops.get(slot);
    if (value == nullptr) {
        writer_.writeNull();
        return;
    }
    if (ops.holder == HolderKind::Shared && references_ != nullptr) {
        bool alreadyExists = false;
        std::string id =
            references_->getReference(ops.identity(value), alreadyExists);
        if (alreadyExists) {
            if (options_.referenceHandling() == ReferenceHandling::Preserve) {
                writer_.writeAlias(id);
            } else {
                spdlog::trace("serializer: revisited {} written as null",
                              demangle(ops.dynamicType(value)));
                writer_.writeNull();
            }
            return;
        }
        if (!id.empty()) {
            writer_.writeAnchor(id);
        }
    }
    writeHeld(ops, value);
}

void WriteContext::writeValue(std::type_index type, const void* value) {
    const TypeInfo& info = registry_.get(type);
    if (const auto* converter = info.converter()) {
        converter->write(*this, value);
        return;
    }
    writeObject(info, value, nullptr, nullptr);
}

auto WriteContext::siblingFor(std::type_index base) const
    -> const DiscriminatorMap* {
    if (sibling_ != nullptr && !sibling_->types.empty() &&
        sibling_->types.front().base == base) {
        return sibling_;
    }
    return nullptr;
}

void WriteContext::writeHeld(const SlotOps& ops, const void* value) {
    if (!ops.polymorphic) {
        writeValue(ops.valueType, value);
        return;
    }
    const std::type_index dynamicType = ops.dynamicType(value);
    const TypeInfo& base = registry_.get(ops.valueType);
    const DiscriminatorMap* map = siblingFor(ops.valueType);
    if (map == nullptr) {
        map = base.polymorphism();
    }
    const DerivedType* derived =
        map != nullptr ? map->findByType(dynamicType) : nullptr;
    if (derived == nullptr) {
        if (dynamicType != ops.valueType) {
            THROW_MISSING_TYPE_METADATA(demangle(dynamicType),
                                        ": not a registered subtype of '",
                                        base.name(), "'");
        }
        writeValue(ops.valueType, value);
        return;
    }

    const TypeInfo& info = registry_.get(derived->type);
    const void* object = derived->fromBase(value);
    writeObject(info, object, map->sibling ? nullptr : map, derived);
}

void WriteContext::writeDiscriminator(const DiscriminatorMap& map,
                                      const DerivedType& derived) {
    writer_.writePropertyName(map.propertyName);
    writer_.writeString(derived.discriminator);
}

void WriteContext::writeObject(const TypeInfo& info, const void* object,
                               const DiscriminatorMap* map,
                               const DerivedType* derived) {
    const ObjectContract& contract = *info.contract();
    auto scope = enterScope();
    const DiscriminatorMap* outerSibling = std::exchange(sibling_, nullptr);

    // The discriminator takes the place of a property with the same wire
    // name; without one it goes first.
    const PropertyInfo* discriminatorAt = nullptr;
    if (map != nullptr &&
        options_.discriminatorPosition() == DiscriminatorPosition::Ordered) {
        discriminatorAt = contract.find(map->propertyName);
    }

    writer_.writeMappingStart();
    if (map != nullptr && discriminatorAt == nullptr) {
        writeDiscriminator(*map, *derived);
    }
    for (const auto& property : contract.properties) {
        if (&property == discriminatorAt) {
            writeDiscriminator(*map, *derived);
            continue;
        }
        if (map != nullptr && property.wireName == map->propertyName) {
            continue;
        }
        if (!shouldWrite(property, object)) {
            continue;
        }
        writer_.writePropertyName(property.wireName);
        sibling_ = property.sibling ? &*property.sibling : nullptr;
        writeSlot(*property.slot, property.getter(object));
        sibling_ = nullptr;
    }
    writer_.writeMappingEnd();
    sibling_ = outerSibling;
}

auto WriteContext::shouldWrite(const PropertyInfo& property,
                               const void* object) const -> bool {
    if (property.ignore == IgnoreCondition::Always) {
        return false;
    }
    if (property.isField && !options_.includeFields()) {
        return false;
    }
    if (property.isReadOnly() && options_.ignoreReadOnlyProperties()) {
        return false;
    }
    const void* slot = property.getter(object);
    const void* value = property.slot->get(slot);
    if (value == nullptr) {
        return !options_.ignoreNullValues() &&
               property.ignore != IgnoreCondition::WhenNull;
    }
    if (property.ignore == IgnoreCondition::WhenDefault &&
        property.slot->isDefault(slot)) {
        return false;
    }
    if (options_.ignoreEmptyObjects() &&
        isEmptyObject(*property.slot, value, depth_)) {
        return false;
    }
    return true;
}

auto WriteContext::isEmptyObject(const SlotOps& ops, const void* value,
                                 int depth) const -> bool {
    if (ops.polymorphic || depth >= options_.maxDepth()) {
        return false;
    }
    const TypeInfo* info = registry_.find(ops.valueType);
    if (info == nullptr || info->contract() == nullptr ||
        info->polymorphism() != nullptr) {
        return false;
    }
    for (const auto& property : info->contract()->properties) {
        if (property.ignore == IgnoreCondition::Always ||
            (property.isField && !options_.includeFields()) ||
            (property.isReadOnly() && options_.ignoreReadOnlyProperties())) {
            continue;
        }
        const void* nested = property.slot->get(property.getter(value));
        if (nested == nullptr) {
            continue;
        }
        if (!isEmptyObject(*property.slot, nested, depth + 1)) {
            return false;
        }
    }
    return true;
}

// Reading

ReadContext::ReadContext(Reader& reader, const SerializerOptions& options,
                         const TypeRegistry& registry,
                         ReferenceResolver& references)
    : reader_(reader),
      options_(options),
      registry_(registry),
      references_(references) {}

auto ReadContext::enterScope() -> DepthScope {
    return DepthScope(depth_, options_.maxDepth(), reader_.mark());
}

void ReadContext::next() {
    do {
        Mark last = reader_.mark();
        if (!reader_.advance()) {
            THROW_PARSE_ERROR(last, "Unexpected end of stream");
        }
    } while (reader_.tokenType() == TokenType::Comment);
}

auto ReadContext::expectScalar(std::string_view typeName)
    -> const std::string& {
    if (reader_.tokenType() != TokenType::Scalar) {
        THROW_PARSE_ERROR(reader_.mark(), "Expected a scalar for '", typeName,
                          "', found ", toString(reader_.tokenType()));
    }
    return reader_.value();
}

void ReadContext::readSlot(const SlotOps& ops, void* slot) {
    if (reader_.tokenType() == TokenType::Alias) {
        readAlias(ops, slot);
        return;
    }
    if (reader_.isNull()) {
        const TypeInfo* info = registry_.find(ops.valueType);
        const Converter* converter =
            info != nullptr ? info->converter() : nullptr;
        if (converter != nullptr && converter->isCollection() &&
            options_.emptyCollectionHandling() ==
                EmptyCollectionHandling::PreferEmptyCollection) {
            ops.emplace(slot);
        } else {
            ops.reset(slot);
        }
        return;
    }
    if (ops.holder == HolderKind::Shared) {
        readShared(ops, slot);
        return;
    }
    if (!reader_.anchor().empty()) {
        rememberTokens(reader_.anchor());
    }
    void* value = ops.emplace(slot);
    readValue(ops.valueType, value);
}

void ReadContext::rememberTokens(const std::string& anchor) {
    std::string name = anchor;
    std::vector<Token> tokens = reader_.captureNode();
    tokens.front().anchor.clear();
    anchor_tokens_.insert_or_assign(name, tokens);
    reader_.rewind(std::move(tokens));
    next();
    spdlog::trace("serializer: anchor &{} recorded", name);
}

void ReadContext::readAlias(const SlotOps& ops, void* slot) {
    const std::string name = reader_.value();
    const Mark mark = reader_.mark();
    if (auto it = anchor_tokens_.find(name); it != anchor_tokens_.end()) {
        replayed_ += it->second.size();
        if (replayed_ > options_.maxAliasExpansion()) {
            THROW_ALIAS_EXPANSION_EXCEEDED(options_.maxAliasExpansion(), name,
                                           mark);
        }
        spdlog::trace("serializer: alias *{} read from recorded tokens", name);
        reader_.rewind(it->second);
        next();
        readSlot(ops, slot);
        return;
    }

    const ReferenceEntry& entry = references_.resolveReference(name);
    if (entry.type != ops.valueType) {
        THROW_PARSE_ERROR(mark, "Alias *", name, " refers to a ",
                          demangle(entry.type), ", expected a ",
                          demangle(ops.valueType));
    }
    if (ops.holder == HolderKind::Shared) {
        ops.assignShared(slot, entry.object);
    } else if (ops.assignValue != nullptr) {
        ops.assignValue(slot, entry.object.get());
    } else {
        THROW_PARSE_ERROR(mark, "Alias *", name, " cannot be copied into a ",
                          demangle(ops.valueType));
    }
    spdlog::trace("serializer: alias *{} resolved", name);
}

void ReadContext::readShared(const SlotOps& ops, void* slot) {
    const std::string anchor = reader_.anchor();
    const TypeInfo& info = registry_.get(ops.valueType);
    const DiscriminatorMap* map = info.polymorphism();

    const DerivedType* derived = nullptr;
    if (forced_ != nullptr && forced_->base == ops.valueType) {
        derived = forced_;
    } else if (map != nullptr &&
               reader_.tokenType() == TokenType::MappingStart) {
        auto found = lookAhead({map->propertyName});
        if (found.front()) {
            derived = map->findByValue(*found.front());
            if (derived == nullptr) {
                THROW_MISSING_TYPE_METADATA(info.name(),
                                            ": unknown discriminator value '",
                                            *found.front(), "'");
            }
            spdlog::trace("serializer: discriminator '{}' selects {}",
                          *found.front(), demangle(derived->type));
        }
    }

    void* object = nullptr;
    if (derived != nullptr) {
        auto created = derived->create();
        object = created.get();
        ops.assignShared(slot, std::move(created));
    } else {
        object = ops.emplace(slot);
        if (object == nullptr) {
            THROW_MISSING_TYPE_METADATA(
                info.name(),
                ": cannot create an instance without a discriminator");
        }
    }

    // Registered before the content is read so that aliases inside the
    // object resolve to the object itself.
    if (!anchor.empty()) {
        references_.addReference(anchor,
                                 ReferenceEntry{ops.share(slot), ops.valueType});
    }

    std::string_view discriminatorKey =
        map != nullptr ? std::string_view(map->propertyName) : std::string_view{};
    if (derived != nullptr) {
        readValue(derived->type, derived->fromBaseMutable(object),
                  discriminatorKey);
    } else {
        readValue(ops.valueType, object, discriminatorKey);
    }
}

void ReadContext::readValue(std::type_index type, void* value,
                            std::string_view discriminatorKey) {
    const TypeInfo& info = registry_.get(type);
    if (const auto* converter = info.converter()) {
        converter->read(*this, value);
        return;
    }
    if (discriminatorKey.empty() && info.polymorphism() != nullptr) {
        discriminatorKey = info.polymorphism()->propertyName;
    }
    readObject(info, value, discriminatorKey);
}

auto ReadContext::lookAhead(const std::vector<std::string>& keys)
    -> std::vector<std::optional<std::string>> {
    std::vector<std::optional<std::string>> found(keys.size());
    std::vector<Token> tokens = reader_.captureNode();

    auto skipComments = [&tokens](std::size_t at) {
        while (at < tokens.size() && tokens[at].type == TokenType::Comment) {
            ++at;
        }
        return at;
    };
    // Index just past the node starting at `at`.
    auto skipNode = [&tokens](std::size_t at) {
        int level = 0;
        do {
            switch (tokens[at].type) {
                case TokenType::MappingStart:
                case TokenType::SequenceStart:
                    ++level;
                    break;
                case TokenType::MappingEnd:
                case TokenType::SequenceEnd:
                    --level;
                    break;
                default:
                    break;
            }
            ++at;
        } while (level > 0 && at < tokens.size());
        return at;
    };

    std::size_t at = skipComments(1);
    while (at + 1 < tokens.size() && tokens[at].type != TokenType::MappingEnd) {
        const Token& key = tokens[at];
        at = skipComments(skipNode(at));
        if (at >= tokens.size()) {
            break;
        }
        const Token& value = tokens[at];
        if (key.type == TokenType::Scalar && value.type == TokenType::Scalar) {
            for (std::size_t i = 0; i < keys.size(); ++i) {
                if (!found[i] && naming::keysMatch(key.value, keys[i])) {
                    found[i] = value.value;
                }
            }
        }
        at = skipComments(skipNode(at));
    }

    reader_.rewind(std::move(tokens));
    next();
    return found;
}

void ReadContext::readObject(const TypeInfo& info, void* object,
                             std::string_view discriminatorKey) {
    if (reader_.tokenType() != TokenType::MappingStart) {
        THROW_PARSE_ERROR(reader_.mark(), "Expected a mapping for '",
                          info.name(), "', found ",
                          toString(reader_.tokenType()));
    }
    const ObjectContract& contract = *info.contract();
    auto scope = enterScope();
    const DerivedType* outerForced = std::exchange(forced_, nullptr);

    // Sibling discriminators may follow the property they describe, so
    // their values are collected before the mapping is read.
    std::vector<std::string> siblingKeys;
    std::vector<std::optional<std::string>> siblingValues;
    if (contract.hasSiblingDiscriminators()) {
        for (const auto& property : contract.properties) {
            if (property.sibling) {
                siblingKeys.push_back(property.sibling->propertyName);
            }
        }
        siblingValues = lookAhead(siblingKeys);
    }

    std::vector<bool> seen(contract.properties.size(), false);
    while (true) {
        next();
        if (reader_.tokenType() == TokenType::MappingEnd) {
            break;
        }
        if (reader_.tokenType() != TokenType::Scalar) {
            THROW_PARSE_ERROR(reader_.mark(), "Keys of '", info.name(),
                              "' must be scalars");
        }
        const std::string key = reader_.value();
        next();

        const PropertyInfo* property = contract.match(key);
        if (property == nullptr) {
            if (discriminatorKey.empty() ||
                !naming::keysMatch(key, discriminatorKey)) {
                spdlog::warn("serializer: unknown key '{}' of '{}' skipped",
                             key, info.name());
            }
            reader_.skip();
            continue;
        }
        seen[static_cast<std::size_t>(property - contract.properties.data())] =
            true;
        if (property->ignore == IgnoreCondition::Always ||
            property->isReadOnly() ||
            (property->isField && !options_.includeFields())) {
            reader_.skip();
            continue;
        }

        const DerivedType* forced = nullptr;
        if (property->sibling) {
            for (std::size_t i = 0; i < siblingKeys.size(); ++i) {
                if (siblingKeys[i] != property->sibling->propertyName ||
                    !siblingValues[i]) {
                    continue;
                }
                forced = property->sibling->findByValue(*siblingValues[i]);
                if (forced == nullptr) {
                    THROW_MISSING_TYPE_METADATA(
                        demangle(property->slot->valueType),
                        ": unknown discriminator value '", *siblingValues[i],
                        "' in '", property->sibling->propertyName, "'");
                }
                break;
            }
        }

        forced_ = forced;
        readSlot(*property->slot, property->setter(object));
        forced_ = nullptr;
    }
    forced_ = outerForced;

    for (std::size_t i = 0; i < contract.properties.size(); ++i) {
        const auto& property = contract.properties[i];
        if (property.required && !seen[i]) {
            THROW_MISSING_REQUIRED_PROPERTY(info.name(), property.wireName);
        }
    }
}

}  // namespace yamlet
