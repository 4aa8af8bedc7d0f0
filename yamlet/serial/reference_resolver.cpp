/*
 * reference_resolver.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Object identity tracking for one serializer pass

**************************************************/

#include "reference_resolver.hpp"

#include <spdlog/spdlog.h>

#include "yamlet/yaml/errors.hpp"

namespace yamlet {

auto ReferenceResolver::create(ReferenceHandling handling)
    -> std::unique_ptr<ReferenceResolver> {
    switch (handling) {
        case ReferenceHandling::IgnoreCycles:
            return std::make_unique<IgnoreCyclesResolver>();
        case ReferenceHandling::Preserve:
            return std::make_unique<PreserveResolver>();
        case ReferenceHandling::None:
            break;
    }
    return nullptr;
}

auto IgnoreCyclesResolver::getReference(const void* object,
                                        bool& alreadyExists) -> std::string {
    alreadyExists = !visited_.insert(object).second;
    return {};
}

void IgnoreCyclesResolver::addReference(const std::string& /*id*/,
                                        ReferenceEntry /*entry*/) {}

auto IgnoreCyclesResolver::resolveReference(const std::string& id) const
    -> const ReferenceEntry& {
    THROW_LOGIC_ERROR("Reference '", id,
                      "' cannot be resolved when cycles are ignored");
}

auto PreserveResolver::getReference(const void* object, bool& alreadyExists)
    -> std::string {
    if (auto it = ids_.find(object); it != ids_.end()) {
        alreadyExists = true;
        return it->second;
    }
    alreadyExists = false;
    std::string id = "ref" + std::to_string(next_id_++);
    ids_.emplace(object, id);
    return id;
}

void PreserveResolver::addReference(const std::string& id,
                                    ReferenceEntry entry) {
    ids_[entry.object.get()] = id;
    objects_.insert_or_assign(id, std::move(entry));
    spdlog::trace("serializer: anchor &{} registered", id);
}

auto PreserveResolver::resolveReference(const std::string& id) const
    -> const ReferenceEntry& {
    auto it = objects_.find(id);
    if (it == objects_.end()) {
        THROW_REFERENCE_NOT_FOUND(id);
    }
    return it->second;
}

}  // namespace yamlet
